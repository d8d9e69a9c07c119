#pragma once

#include "resource.h"
#include "simulation_context.h"
#include "structure.h"

#include <vector>

class StorageModel {
public:
    explicit StorageModel(const SimulationConfig::Storage& config);

    // baseCapacity + storage_capacity (all resources) + <resource>_storage_capacity (one resource).
    StorageCapacity calculateCapacity(const std::vector<Structure>& structures) const;

    // Uses the configured threshold.
    NearCapacityFlags nearCapacity(const ResourceAmounts& amounts, const StorageCapacity& capacity) const;

    // Element-wise min with capacity, floor 0.
    static ResourceAmounts clampToCapacity(const ResourceAmounts& amounts, const StorageCapacity& capacity);

    // Production lost to missing headroom this cycle: max(0, min(max(net, 0), current + net - capacity)).
    // Stock already above capacity is not counted again; only this cycle's gain can be wasted.
    static ResourceAmounts calculateWaste(const ResourceAmounts& current,
                                          const ResourceAmounts& net,
                                          const StorageCapacity& capacity);

    // A resource is near capacity at amount >= threshold * capacity; never for capacity <= 0.
    static NearCapacityFlags isNearCapacity(const ResourceAmounts& amounts,
                                            const StorageCapacity& capacity,
                                            double threshold = 0.9);

private:
    const SimulationConfig::Storage* m_config = nullptr;
};
