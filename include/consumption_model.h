#pragma once

#include "resource.h"
#include "simulation_context.h"
#include "structure.h"

#include <vector>

struct ConsumptionSummary {
    int population = 0;
    int structureCount = 0;
    ResourceAmounts perSecond;
    ResourceAmounts perHour;
};

// Upkeep of a settlement: food and water per capita, wood/stone/ore per structure.
// Everything scales linearly with elapsed ticks and with the world multiplier.
class ConsumptionModel {
public:
    ConsumptionModel(const SimulationConfig::Consumption& config, double ticksPerHour);

    ResourceAmounts calculateConsumption(int population,
                                         int structureCount,
                                         long long elapsedTicks,
                                         double worldMultiplier = 1.0) const;

    ResourceAmounts hourlyConsumption(int population, int structureCount, double worldMultiplier = 1.0) const;

    // True when stock covers bufferHours of projected consumption.
    bool hasResourcesForPopulation(int population,
                                   int structureCount,
                                   const ResourceAmounts& currentResources,
                                   double worldMultiplier = 1.0) const;

    // Housing: basePopulationCapacity plus every population capacity modifier, never below 0.
    int populationCapacity(const std::vector<Structure>& structures) const;

    ConsumptionSummary summarize(int population, int structureCount, double worldMultiplier = 1.0) const;

    double ticksPerHour() const { return m_ticksPerHour; }

private:
    const SimulationConfig::Consumption* m_config = nullptr;
    double m_ticksPerHour = 216000.0;
};

// 50 plus morale boosts, clamped to [0, 100].
double settlementMorale(const std::vector<Structure>& structures);
