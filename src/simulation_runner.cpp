#include "simulation_runner.h"

#include "consumption_model.h"
#include "production_model.h"
#include "settlement_registry.h"
#include "settlement_store.h"
#include "sim_events.h"
#include "sim_log.h"
#include "simulation_context.h"
#include "storage_model.h"
#include "structure.h"

#include <algorithm>
#include <cmath>
#include <exception>
#include <optional>
#include <random>
#include <sstream>
#include <utility>
#include <vector>

namespace {

SimEvent makeEvent(SimEventKind kind, const SettlementSimState& state, std::int64_t nowMs, SimEventPayload payload) {
    SimEvent e;
    e.kind = kind;
    e.worldId = state.worldId;
    e.settlementId = state.settlementId;
    e.timestampMs = nowMs;
    e.payload = std::move(payload);
    return e;
}

void runPopulationStep(const SettlementSimState& state,
                       const std::vector<Structure>& structures,
                       SettlementCycleResult& r,
                       SimulationStepContext& ctx) {
    const std::optional<PopulationRecord> record = ctx.store.fetchPopulation(state.settlementId);
    if (!record || record->current <= 0) {
        logDebug("Population", "skip settlement=" + state.settlementId + " (not initialised)");
        return;
    }

    const SimulationConfig& cfg = ctx.sim.config;
    PopulationInputs in;
    in.current = record->current;
    in.capacity = ctx.consumption.populationCapacity(structures);
    in.happiness = std::clamp(record->happiness, 0.0, 100.0);
    in.morale = settlementMorale(structures);
    in.resourcesSufficient = !r.shortage;
    const double periodSeconds = static_cast<double>(cfg.scheduler.populationPeriodTicks) /
                                 static_cast<double>(std::max(1, cfg.scheduler.tickRate));
    in.elapsedSeconds = periodSeconds;
    if (record->lastGrowthTimestampMs > 0 && ctx.nowMs > record->lastGrowthTimestampMs) {
        // The timestamp only moves on writes, so an unchanged settlement can look idle for days.
        const double sinceLast = static_cast<double>(ctx.nowMs - record->lastGrowthTimestampMs) / 1000.0;
        in.elapsedSeconds = std::min(sinceLast, periodSeconds);
    }
    r.populationWindowSeconds = in.elapsedSeconds;

    const std::uint64_t salt = SimulationContext::mix64(SimulationContext::hashString(state.settlementId) ^
                                                        static_cast<std::uint64_t>(r.tick));
    std::mt19937_64 rng = ctx.sim.makeRng(salt);
    const PopulationEvaluation eval = ctx.population.evaluate(in, rng);
    r.populationEvaluated = eval.evaluated;
    r.populationResult = eval;
    if (!eval.evaluated) return;

    if (eval.changed()) {
        PopulationRecord updated = *record;
        updated.current = eval.current;
        updated.happiness = eval.happiness;
        updated.lastGrowthTimestampMs = ctx.nowMs;
        ctx.store.updatePopulation(updated);
    }

    if (eval.current != eval.previous) {
        PopulationGrowthPayload p;
        p.oldPopulation = eval.previous;
        p.newPopulation = eval.current;
        p.happiness = eval.happiness;
        p.growthRate = eval.growthRate;
        ctx.events.publish(makeEvent(SimEventKind::PopulationGrowth, state, ctx.nowMs, p));
    }
    if (eval.settlersArrived()) {
        SettlerArrivedPayload p;
        p.population = eval.current;
        p.immigrantCount = eval.immigrants;
        p.happiness = eval.happiness;
        ctx.events.publish(makeEvent(SimEventKind::SettlerArrived, state, ctx.nowMs, p));
    }
    for (const PopulationWarning& w : eval.warnings) {
        PopulationWarningPayload p;
        p.population = eval.current;
        p.happiness = eval.happiness;
        p.kind = w.kind;
        p.message = w.message;
        ctx.events.publish(makeEvent(SimEventKind::PopulationWarning, state, ctx.nowMs, p));
    }

    PopulationStatePayload s;
    s.current = eval.current;
    s.capacity = eval.capacity;
    s.happiness = eval.happiness;
    s.description = happinessDescription(eval.happiness);
    s.growthRate = eval.growthRate;
    s.status = eval.status;
    ctx.events.publish(makeEvent(SimEventKind::PopulationState, state, ctx.nowMs, s));

    if (logEnabled(LogLevel::Debug)) {
        std::ostringstream msg;
        msg << "settlement=" << state.settlementId << " " << eval.previous << "->" << eval.current << "/"
            << eval.capacity << " happiness=" << eval.happiness << " status=" << populationStatusName(eval.status);
        logDebug("Population", msg.str());
    }
}

void runResourceStep(const SettlementSimState& state,
                     const SettlementDetail& detail,
                     const std::vector<Structure>& structures,
                     SettlementCycleResult& r,
                     SimulationStepContext& ctx) {
    const Plot& plot = *detail.plot;
    const SettlementStorage& storage = *detail.storage;
    const std::optional<std::string> biomeName =
        detail.biome ? std::optional<std::string>(detail.biome->name) : std::nullopt;

    r.elapsedTicks = std::max<long long>(0, r.tick - state.lastUpdateTick);
    r.production = ctx.production.calculateProduction(plot, structures, r.elapsedTicks, biomeName);

    const std::optional<PopulationRecord> record = ctx.store.fetchPopulation(state.settlementId);
    r.population = record ? std::max(0, record->current) : ctx.consumption.populationCapacity(structures);
    r.structureCount = static_cast<int>(structures.size());
    r.consumption = ctx.consumption.calculateConsumption(r.population, r.structureCount, r.elapsedTicks,
                                                         detail.consumptionMultiplier);
    r.net = subtractResources(r.production, r.consumption);

    r.previous = storage.amounts;
    r.proposed = addResources(r.previous, r.net);
    r.capacity = ctx.storage.calculateCapacity(structures);
    r.waste = StorageModel::calculateWaste(r.previous, r.net, r.capacity);
    r.resources = StorageModel::clampToCapacity(r.proposed, r.capacity);

    ctx.store.updateStorage(storage.id, r.resources);

    r.nearCapacity = ctx.storage.nearCapacity(r.resources, r.capacity);
    r.shortage = r.population > 0 &&
                 !ctx.consumption.hasResourcesForPopulation(r.population, r.structureCount, r.resources,
                                                            detail.consumptionMultiplier);

    ResourceUpdatePayload update;
    update.resources = r.resources;
    update.production = r.production;
    update.consumption = r.consumption;
    update.netProduction = r.net;
    update.population = r.population;
    ctx.events.publish(makeEvent(SimEventKind::ResourceUpdate, state, ctx.nowMs, update));

    if (r.waste.anyPositive()) {
        ResourceWastePayload p;
        p.waste = r.waste;
        p.capacity = r.capacity;
        ctx.events.publish(makeEvent(SimEventKind::ResourceWaste, state, ctx.nowMs, p));
        logInfo("Cycle", "settlement=" + state.settlementId + " wasted " + formatResources(r.waste));
    }
    if (r.nearCapacity.any()) {
        StorageWarningPayload p;
        p.nearCapacity = r.nearCapacity;
        p.resources = r.resources;
        p.capacity = r.capacity;
        ctx.events.publish(makeEvent(SimEventKind::StorageWarning, state, ctx.nowMs, p));
    }
    if (r.shortage) {
        ResourceShortagePayload p;
        p.population = r.population;
        p.resources = r.resources;
        ctx.events.publish(makeEvent(SimEventKind::ResourceShortage, state, ctx.nowMs, p));
        logWarn("Cycle", "settlement=" + state.settlementId + " shortage population=" + std::to_string(r.population) +
                            " " + formatResources(r.resources));
    }

    if (logEnabled(LogLevel::Debug)) {
        logDebug("Cycle", "settlement=" + state.settlementId + " tick=" + std::to_string(r.tick) +
                              " elapsed=" + std::to_string(r.elapsedTicks) +
                              " pop=" + std::to_string(r.population) +
                              " structures=" + std::to_string(r.structureCount) +
                              " stock=" + formatResources(r.resources));
    }
}

} // namespace

std::string SettlementCycleResult::validateInvariants() const {
    if (outcome != CycleOutcome::Advanced) {
        return {};
    }
    std::ostringstream oss;
    for (Resource::Type type : Resource::kAllTypes) {
        const double v = resources.get(type);
        const double cap = capacity.get(type);
        if (!std::isfinite(v) || v < 0.0) {
            oss << Resource::name(type) << " below zero (" << v << "); ";
        } else if (v > cap) {
            oss << Resource::name(type) << " above capacity (" << v << " > " << cap << "); ";
        }
        if (waste.get(type) < 0.0) {
            oss << Resource::name(type) << " negative waste; ";
        }
    }
    if (populationEvaluated) {
        const int upper = std::max(1, populationResult.capacity);
        if (populationResult.current < 1 || populationResult.current > upper) {
            oss << "population " << populationResult.current << " outside [1, " << upper << "]; ";
        }
    }
    return oss.str();
}

SettlementCycleResult runSettlementCycle(const SettlementSimState& state,
                                         std::int64_t tick,
                                         bool populationDue,
                                         SimulationStepContext& ctx) {
    SettlementCycleResult r;
    r.settlementId = state.settlementId;
    r.tick = tick;

    std::vector<Structure> structures;
    try {
        const std::optional<SettlementDetail> detail = ctx.store.fetchSettlementDetail(state.settlementId);
        if (!detail || !detail->complete()) {
            r.outcome = CycleOutcome::Deregister;
            return r;
        }
        structures = foldStructureRows(ctx.store.fetchStructures(state.settlementId));
        runResourceStep(state, *detail, structures, r, ctx);
        r.outcome = CycleOutcome::Advanced;
    } catch (const std::exception& e) {
        r.outcome = CycleOutcome::Failed;
        r.error = e.what();
        logError("Cycle", "settlement=" + state.settlementId + " tick=" + std::to_string(tick) + " failed: " + e.what());
        return r;
    } catch (...) {
        r.outcome = CycleOutcome::Failed;
        r.error = "unknown failure";
        logError("Cycle", "settlement=" + state.settlementId + " tick=" + std::to_string(tick) + " failed: unknown");
        return r;
    }

    // Storage is already written; a population failure must not roll the window back.
    if (populationDue) {
        try {
            runPopulationStep(state, structures, r, ctx);
        } catch (const std::exception& e) {
            logError("Population", "settlement=" + state.settlementId + " tick=" + std::to_string(tick) +
                                      " failed: " + e.what());
        } catch (...) {
            logError("Population", "settlement=" + state.settlementId + " tick=" + std::to_string(tick) +
                                      " failed: unknown");
        }
    }
    return r;
}
