#pragma once

#include "population_model.h"
#include "resource.h"

#include <cstdint>
#include <string>

class ConsumptionModel;
class EventSink;
class PopulationModel;
class ProductionModel;
class SettlementStore;
class StorageModel;
struct SettlementSimState;
struct SimulationContext;

struct SimulationStepContext {
    const SimulationContext& sim;
    SettlementStore& store;
    EventSink& events;
    const ProductionModel& production;
    const ConsumptionModel& consumption;
    const StorageModel& storage;
    const PopulationModel& population;
    std::int64_t nowMs;
};

enum class CycleOutcome {
    Advanced,    // state persisted; lastUpdateTick may move to the cycle tick
    Deregister,  // settlement, storage or plot missing
    Failed       // exception; window retried next cycle
};

struct SettlementCycleResult {
    CycleOutcome outcome = CycleOutcome::Failed;
    std::string settlementId;
    std::int64_t tick = 0;
    long long elapsedTicks = 0;
    int population = 0;
    int structureCount = 0;

    ResourceAmounts previous;
    ResourceAmounts production;
    ResourceAmounts consumption;
    ResourceAmounts net;
    ResourceAmounts proposed;
    StorageCapacity capacity;
    ResourceAmounts waste;
    ResourceAmounts resources;
    NearCapacityFlags nearCapacity;
    bool shortage = false;

    bool populationEvaluated = false;
    double populationWindowSeconds = 0.0;   // never longer than one population period
    PopulationEvaluation populationResult;

    std::string error;

    // Empty string when the persisted amounts respect [0, capacity].
    std::string validateInvariants() const;
};

// One coarse cycle for one settlement: production, consumption, storage, optional
// population dynamics, persistence and event emission, in that order.
// Never throws; failures come back as CycleOutcome::Failed with the message in error.
SettlementCycleResult runSettlementCycle(const SettlementSimState& state,
                                         std::int64_t tick,
                                         bool populationDue,
                                         SimulationStepContext& ctx);
