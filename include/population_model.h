#pragma once

#include "simulation_context.h"

#include <random>
#include <string>
#include <vector>

enum class PopulationStatus {
    Growing,
    Stable,
    Declining
};

enum class PopulationWarningKind {
    LowHappiness,
    EmigrationRisk,
    NoHousing
};

struct PopulationWarning {
    PopulationWarningKind kind = PopulationWarningKind::LowHappiness;
    std::string message;
};

struct PopulationInputs {
    int current = 0;
    int capacity = 0;
    double happiness = 50.0;    // persisted value from the last evaluation
    double morale = 50.0;
    bool resourcesSufficient = true;
    double elapsedSeconds = 0.0;
};

struct PopulationEvaluation {
    bool evaluated = false;     // false when the population was never initialised
    int previous = 0;
    int grown = 0;
    int immigrants = 0;
    int emigrants = 0;
    int current = 0;
    int capacity = 0;
    double previousHappiness = 50.0;
    double happiness = 50.0;
    double growthRate = 0.0;
    double immigrationChance = 0.0;
    double emigrationChance = 0.0;
    bool immigrationTriggered = false;
    bool emigrationTriggered = false;
    PopulationStatus status = PopulationStatus::Stable;
    std::vector<PopulationWarning> warnings;

    bool changed() const { return current != previous || happiness != previousHappiness; }
    bool settlersArrived() const { return immigrants > 0; }
};

// Periodic stochastic population step. Pure apart from the generator it draws from;
// the same inputs and generator state always give the same evaluation.
class PopulationModel {
public:
    explicit PopulationModel(const SimulationConfig::Population& config);

    PopulationEvaluation evaluate(const PopulationInputs& in, std::mt19937_64& rng) const;

    double targetHappiness(double morale, bool resourcesSufficient, bool atCapacity) const;
    double stepHappiness(double current, double target) const;
    double growthRate(double happiness, int capacity, bool resourcesSufficient) const;
    double immigrationChance(double happiness, int current, int capacity) const;
    double emigrationChance(double happiness) const;

private:
    const SimulationConfig::Population* m_config = nullptr;
};

const char* happinessDescription(double happiness);
const char* populationStatusName(PopulationStatus status);
const char* populationWarningKindName(PopulationWarningKind kind);
