#include "storage_model.h"

#include <algorithm>
#include <string>

StorageModel::StorageModel(const SimulationConfig::Storage& config)
    : m_config(&config) {
}

StorageCapacity StorageModel::calculateCapacity(const std::vector<Structure>& structures) const {
    const double shared = sumModifier(structures, modifier_names::kStorageCapacity);
    StorageCapacity capacity;
    for (Resource::Type type : Resource::kAllTypes) {
        const std::string perResource = std::string(Resource::name(type)) + "_" + modifier_names::kStorageCapacity;
        const double total = m_config->baseCapacity + shared + sumModifier(structures, perResource);
        capacity.set(type, std::max(0.0, total));
    }
    return capacity;
}

NearCapacityFlags StorageModel::nearCapacity(const ResourceAmounts& amounts, const StorageCapacity& capacity) const {
    return isNearCapacity(amounts, capacity, m_config->nearCapacityThreshold);
}

ResourceAmounts StorageModel::clampToCapacity(const ResourceAmounts& amounts, const StorageCapacity& capacity) {
    ResourceAmounts out;
    for (Resource::Type type : Resource::kAllTypes) {
        const double cap = std::max(0.0, capacity.get(type));
        out.set(type, std::clamp(amounts.get(type), 0.0, cap));
    }
    return out;
}

ResourceAmounts StorageModel::calculateWaste(const ResourceAmounts& current,
                                             const ResourceAmounts& net,
                                             const StorageCapacity& capacity) {
    ResourceAmounts waste;
    for (Resource::Type type : Resource::kAllTypes) {
        const double gain = std::max(0.0, net.get(type));
        const double overflow = current.get(type) + net.get(type) - capacity.get(type);
        waste.set(type, std::max(0.0, std::min(gain, overflow)));
    }
    return waste;
}

NearCapacityFlags StorageModel::isNearCapacity(const ResourceAmounts& amounts,
                                               const StorageCapacity& capacity,
                                               double threshold) {
    NearCapacityFlags flags;
    for (Resource::Type type : Resource::kAllTypes) {
        const double cap = capacity.get(type);
        flags.set(type, cap > 0.0 && amounts.get(type) >= threshold * cap);
    }
    return flags;
}
