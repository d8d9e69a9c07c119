#include "consumption_model.h"

#include <algorithm>
#include <cmath>

ConsumptionModel::ConsumptionModel(const SimulationConfig::Consumption& config, double ticksPerHour)
    : m_config(&config),
      m_ticksPerHour(ticksPerHour > 0.0 ? ticksPerHour : 216000.0) {
}

ResourceAmounts ConsumptionModel::hourlyConsumption(int population, int structureCount, double worldMultiplier) const {
    const double pop = static_cast<double>(std::max(0, population));
    const double structures = static_cast<double>(std::max(0, structureCount));
    const double mult = std::max(0.0, worldMultiplier * m_config->worldMultiplier);

    ResourceAmounts hourly;
    hourly.food = pop * m_config->foodPerCapitaPerHour * mult;
    hourly.water = pop * m_config->waterPerCapitaPerHour * mult;
    hourly.wood = structures * m_config->woodPerStructurePerHour * mult;
    hourly.stone = structures * m_config->stonePerStructurePerHour * mult;
    hourly.ore = structures * m_config->orePerStructurePerHour * mult;
    return hourly;
}

ResourceAmounts ConsumptionModel::calculateConsumption(int population,
                                                       int structureCount,
                                                       long long elapsedTicks,
                                                       double worldMultiplier) const {
    if (elapsedTicks <= 0) return ResourceAmounts{};
    const double hours = static_cast<double>(elapsedTicks) / m_ticksPerHour;
    return scaleResources(hourlyConsumption(population, structureCount, worldMultiplier), hours);
}

bool ConsumptionModel::hasResourcesForPopulation(int population,
                                                 int structureCount,
                                                 const ResourceAmounts& currentResources,
                                                 double worldMultiplier) const {
    const ResourceAmounts required =
        scaleResources(hourlyConsumption(population, structureCount, worldMultiplier),
                       std::max(0.0, m_config->bufferHours));
    return hasEnoughResources(currentResources, required);
}

int ConsumptionModel::populationCapacity(const std::vector<Structure>& structures) const {
    const double housing = sumModifier(structures, modifier_names::kPopulationCapacity) +
                           sumModifier(structures, modifier_names::kPopulationCapacityLegacy);
    const double total = static_cast<double>(m_config->basePopulationCapacity) + housing;
    return std::max(0, static_cast<int>(std::floor(total)));
}

ConsumptionSummary ConsumptionModel::summarize(int population, int structureCount, double worldMultiplier) const {
    ConsumptionSummary summary;
    summary.population = population;
    summary.structureCount = structureCount;
    summary.perHour = hourlyConsumption(population, structureCount, worldMultiplier);
    summary.perSecond = scaleResources(summary.perHour, 1.0 / 3600.0);
    return summary;
}

double settlementMorale(const std::vector<Structure>& structures) {
    const double boost = sumModifier(structures, modifier_names::kMoraleBoost) +
                         sumModifier(structures, modifier_names::kMoraleBoostLegacy);
    return std::clamp(50.0 + boost, 0.0, 100.0);
}
