#include "production_model.h"

#include <algorithm>
#include <cctype>
#include <cmath>

namespace {

bool sameNameIgnoringCase(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::toupper(static_cast<unsigned char>(a[i])) != std::toupper(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

} // namespace

ProductionModel::ProductionModel(const SimulationConfig::Production& config, double ticksPerHour)
    : m_config(&config),
      m_ticksPerHour(ticksPerHour > 0.0 ? ticksPerHour : 216000.0) {
}

double ProductionModel::baseRate(ExtractorType extractor, Resource::Type resource) const {
    double rate = 0.0;
    for (const auto& entry : m_config->rates) {
        if (entry.extractor == extractor && entry.resource == resource) {
            rate += entry.baseRate;
        }
    }
    return rate;
}

double ProductionModel::levelMultiplier(int level) const {
    return 1.0 + m_config->levelBonusPerLevel * static_cast<double>(std::max(1, level) - 1);
}

double ProductionModel::biomeEfficiency(const std::optional<std::string>& biomeName, Resource::Type resource) const {
    if (!biomeName || biomeName->empty()) return 1.0;
    for (const auto& biome : m_config->biomes) {
        if (sameNameIgnoringCase(biome.name, *biomeName)) {
            return biome.efficiency.get(resource);
        }
    }
    return 1.0;
}

double ProductionModel::extractorHourlyRate(ExtractorType extractor,
                                            Resource::Type resource,
                                            int level,
                                            const std::optional<std::string>& biomeName) const {
    const double base = baseRate(extractor, resource);
    if (base <= 0.0) return 0.0;
    return base * levelMultiplier(level) * biomeEfficiency(biomeName, resource);
}

bool ProductionModel::producesResource(ExtractorType extractor, Resource::Type resource) const {
    return baseRate(extractor, resource) > 0.0;
}

std::vector<Structure> ProductionModel::extractorsForResource(const std::vector<Structure>& structures,
                                                              Resource::Type resource) const {
    std::vector<Structure> out;
    for (const Structure& s : structures) {
        if (isExtractor(s) && producesResource(*s.extractorType, resource)) {
            out.push_back(s);
        }
    }
    return out;
}

ResourceAmounts ProductionModel::calculateProduction(const Plot& plot,
                                                     const std::vector<Structure>& structures,
                                                     long long elapsedTicks,
                                                     const std::optional<std::string>& biomeName) const {
    ResourceAmounts produced;
    if (elapsedTicks <= 0) return produced;

    for (const Structure& s : structures) {
        if (!isExtractor(s)) continue;
        if (!s.plotId.empty() && s.plotId != plot.id) continue;
        for (Resource::Type type : Resource::kAllTypes) {
            produced.add(type, extractorHourlyRate(*s.extractorType, type, s.level, biomeName));
        }
    }

    for (Resource::Type type : Resource::kAllTypes) {
        produced.set(type, produced.get(type) * std::max(0.0, plot.potential.get(type)));
    }

    const double quality = std::max(0.0, plot.qualityMultiplier);
    const double hours = static_cast<double>(elapsedTicks) / m_ticksPerHour;
    return scaleResources(produced, quality * hours);
}
