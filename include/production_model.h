#pragma once

#include "resource.h"
#include "settlement_records.h"
#include "simulation_context.h"
#include "structure.h"

#include <optional>
#include <string>
#include <vector>

// Raw output of extractor structures on a plot over a tick window.
// Per extractor: baseRate(extractor, resource) * levelMultiplier(level) * biomeEfficiency(biome, resource),
// summed over extractors, then scaled by the plot's per-resource potential, its quality
// and elapsedTicks / ticksPerHour.
// No clamping happens here; storage overflow is handled downstream.
class ProductionModel {
public:
    ProductionModel(const SimulationConfig::Production& config, double ticksPerHour);

    ResourceAmounts calculateProduction(const Plot& plot,
                                        const std::vector<Structure>& structures,
                                        long long elapsedTicks,
                                        const std::optional<std::string>& biomeName) const;

    // Units per hour a single extractor yields before time scaling. Zero for unknown pairs.
    double extractorHourlyRate(ExtractorType extractor,
                               Resource::Type resource,
                               int level,
                               const std::optional<std::string>& biomeName) const;

    double baseRate(ExtractorType extractor, Resource::Type resource) const;
    // 1 + levelBonusPerLevel * (level - 1); levels below 1 count as 1.
    double levelMultiplier(int level) const;
    // Biome names match case-insensitively; unknown or absent biomes yield 1.0.
    double biomeEfficiency(const std::optional<std::string>& biomeName, Resource::Type resource) const;

    bool producesResource(ExtractorType extractor, Resource::Type resource) const;
    std::vector<Structure> extractorsForResource(const std::vector<Structure>& structures,
                                                 Resource::Type resource) const;

    double ticksPerHour() const { return m_ticksPerHour; }

private:
    const SimulationConfig::Production* m_config = nullptr;
    double m_ticksPerHour = 216000.0;
};
