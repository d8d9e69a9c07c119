#include "population_model.h"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace {

// Rounds up with probability equal to the fractional part.
int stochasticRound(double value, std::mt19937_64& rng) {
    if (!(value > 0.0)) return 0;
    const double whole = std::floor(value);
    const double frac = value - whole;
    std::uniform_real_distribution<double> u01(0.0, 1.0);
    const bool up = u01(rng) < frac;
    return static_cast<int>(whole) + (up ? 1 : 0);
}

bool bernoulli(double p, std::mt19937_64& rng) {
    std::uniform_real_distribution<double> u01(0.0, 1.0);
    const double roll = u01(rng);
    return roll < std::clamp(p, 0.0, 1.0);
}

} // namespace

PopulationModel::PopulationModel(const SimulationConfig::Population& config)
    : m_config(&config) {
}

double PopulationModel::targetHappiness(double morale, bool resourcesSufficient, bool atCapacity) const {
    double target = morale + (resourcesSufficient ? 15.0 : -25.0);
    if (atCapacity) {
        target -= 10.0;
    }
    return std::clamp(target, 0.0, 100.0);
}

double PopulationModel::stepHappiness(double current, double target) const {
    const double step = std::max(0.0, m_config->happinessStep);
    const double delta = std::clamp(target - current, -step, step);
    return std::clamp(current + delta, 0.0, 100.0);
}

double PopulationModel::growthRate(double happiness, int capacity, bool resourcesSufficient) const {
    if (capacity <= 0) return 0.0;
    if (!resourcesSufficient) return -m_config->starvationRate;
    const double pivot = m_config->lowHappinessThreshold;
    const double span = std::max(1.0, 100.0 - pivot);
    return m_config->baseGrowthRate * (happiness - pivot) / span;
}

double PopulationModel::immigrationChance(double happiness, int current, int capacity) const {
    if (capacity <= 0 || current >= capacity) return 0.0;
    return m_config->maxImmigrationChance * std::max(0.0, (happiness - 50.0) / 50.0);
}

double PopulationModel::emigrationChance(double happiness) const {
    return m_config->maxEmigrationChance * std::max(0.0, (50.0 - happiness) / 50.0);
}

PopulationEvaluation PopulationModel::evaluate(const PopulationInputs& in, std::mt19937_64& rng) const {
    PopulationEvaluation out;
    out.previous = in.current;
    out.current = in.current;
    out.capacity = std::max(0, in.capacity);
    out.previousHappiness = in.happiness;
    out.happiness = in.happiness;
    if (in.current <= 0) {
        return out;
    }
    out.evaluated = true;

    const int capacity = out.capacity;
    const bool atCapacity = capacity > 0 && in.current >= capacity;
    out.happiness = stepHappiness(in.happiness, targetHappiness(in.morale, in.resourcesSufficient, atCapacity));
    out.growthRate = growthRate(out.happiness, capacity, in.resourcesSufficient);
    out.immigrationChance = immigrationChance(out.happiness, in.current, capacity);
    out.emigrationChance = emigrationChance(out.happiness);

    // 1. Natural growth over the elapsed time units.
    const double units = std::max(0.0, in.elapsedSeconds) / std::max(1.0, m_config->timeUnitSeconds);
    // Capped at max(current, capacity) in double; rounding happens only after the cap.
    const double factor = std::pow(std::max(0.0, 1.0 + out.growthRate), units);
    const double ceiling = static_cast<double>(std::max(in.current, capacity));
    double projected = static_cast<double>(in.current) * factor;
    if (!std::isfinite(projected) || projected > ceiling) {
        projected = out.growthRate > 0.0 ? ceiling : static_cast<double>(in.current);
    }
    const int grown = stochasticRound(std::max(0.0, projected), rng);
    out.grown = grown;

    // 2. Immigration.
    out.immigrationTriggered = bernoulli(out.immigrationChance, rng);
    if (out.immigrationTriggered) {
        std::uniform_int_distribution<int> batch(1, std::max(1, m_config->maxImmigrantBatch));
        const int arriving = batch(rng);
        const int room = std::max(0, capacity - grown);
        out.immigrants = std::min(arriving, room);
        if (room == 0) {
            out.warnings.push_back({PopulationWarningKind::NoHousing,
                                    "Settlers wanted to join but there is no free housing"});
        }
    }

    // 3. Emigration.
    out.emigrationTriggered = bernoulli(out.emigrationChance, rng);
    if (out.emigrationTriggered) {
        const double base = static_cast<double>(grown + out.immigrants);
        out.emigrants = std::max(1, static_cast<int>(std::lround(base * m_config->emigrationFraction)));
        std::ostringstream msg;
        msg << out.emigrants << " settlers are leaving due to low happiness";
        out.warnings.push_back({PopulationWarningKind::EmigrationRisk, msg.str()});
    }

    // 4. Clamp to [1, capacity].
    const int upper = std::max(1, capacity);
    out.current = std::clamp(grown + out.immigrants - out.emigrants, 1, upper);

    if (out.happiness < m_config->lowHappinessThreshold && out.emigrationChance > 0.0) {
        std::ostringstream msg;
        msg << "Happiness is low (" << static_cast<int>(std::round(out.happiness)) << "); settlers may leave";
        out.warnings.push_back({PopulationWarningKind::LowHappiness, msg.str()});
    }
    if (capacity == 0) {
        out.warnings.push_back({PopulationWarningKind::NoHousing, "No housing available; build houses to grow"});
    }

    if (out.current > out.previous) {
        out.status = PopulationStatus::Growing;
    } else if (out.current < out.previous) {
        out.status = PopulationStatus::Declining;
    } else {
        out.status = PopulationStatus::Stable;
    }
    return out;
}

const char* happinessDescription(double happiness) {
    if (happiness >= 80.0) return "Ecstatic";
    if (happiness >= 60.0) return "Content";
    if (happiness >= 40.0) return "Neutral";
    if (happiness >= 20.0) return "Unhappy";
    return "Miserable";
}

const char* populationStatusName(PopulationStatus status) {
    switch (status) {
        case PopulationStatus::Growing: return "Growing";
        case PopulationStatus::Stable: return "Stable";
        case PopulationStatus::Declining: return "Declining";
    }
    return "Stable";
}

const char* populationWarningKindName(PopulationWarningKind kind) {
    switch (kind) {
        case PopulationWarningKind::LowHappiness: return "low_happiness";
        case PopulationWarningKind::EmigrationRisk: return "emigration_risk";
        case PopulationWarningKind::NoHousing: return "no_housing";
    }
    return "low_happiness";
}
