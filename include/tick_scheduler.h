#pragma once

#include "consumption_model.h"
#include "population_model.h"
#include "production_model.h"
#include "settlement_registry.h"
#include "simulation_runner.h"
#include "storage_model.h"

#include <atomic>
#include <cstdint>
#include <functional>
#include <future>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

class EventSink;
class SettlementStore;
struct SimulationContext;

struct SchedulerStatus {
    bool running = false;
    std::int64_t currentTick = 0;
    size_t activeSettlements = 0;
    int tickRate = 60;
    std::uint64_t wavesRun = 0;
    std::uint64_t skippedWaves = 0;
};

// Fixed-rate driver. Every coarse-period tick it snapshots the registry, splits the
// snapshot into batches, runs batches in order and the members of a batch concurrently.
//
// Two ways to drive it:
//  - start()/stop(): a loop thread paced by sf::Clock; waves run off the loop thread,
//    at most one at a time.
//  - step()/runTicks(): deterministic stepping on the caller's thread, each due wave
//    finishing before the call returns.
class TickScheduler {
public:
    using WallClock = std::function<std::int64_t()>; // milliseconds since the Unix epoch

    TickScheduler(const SimulationContext& ctx, SettlementStore& store, EventSink& events, WallClock clock = {});
    ~TickScheduler();

    TickScheduler(const TickScheduler&) = delete;
    TickScheduler& operator=(const TickScheduler&) = delete;

    // Misuse (start while running, stop while stopped) logs a warning and returns false.
    bool start();
    bool stop();

    // Idempotent. lastUpdateTick starts at the current tick.
    bool registerSettlement(const std::string& settlementId, const std::string& ownerId, const std::string& worldId);
    bool unregisterSettlement(const std::string& settlementId);
    // Number of settlements newly registered; store failures are logged, never thrown.
    int registerPlayerSettlements(const std::string& playerId, const std::string& worldId);
    int unregisterPlayerSettlements(const std::string& playerId);

    SchedulerStatus status() const;

    void step();
    void runTicks(long long count);

    bool waveInFlight() const;
    // Blocks until the wave launched by the loop thread (if any) has finished.
    void waitForWave();

    const SettlementRegistry& registry() const { return m_registry; }
    std::vector<SettlementCycleResult> lastWaveResults() const;
    const ConsumptionModel& consumptionModel() const { return m_consumption; }

private:
    void loop();
    void tick(bool paced);
    void runWave(std::int64_t tick, const std::vector<SettlementSimState>& snapshot);
    void applyOutcome(const SettlementCycleResult& result);
    void logStatus() const;

    const SimulationContext& m_ctx;
    SettlementStore& m_store;
    EventSink& m_events;
    WallClock m_clock;

    ProductionModel m_production;
    ConsumptionModel m_consumption;
    StorageModel m_storage;
    PopulationModel m_population;

    SettlementRegistry m_registry;

    std::atomic<bool> m_running{false};
    std::atomic<std::int64_t> m_tick{0};
    std::atomic<std::uint64_t> m_wavesRun{0};
    std::atomic<std::uint64_t> m_skippedWaves{0};

    std::mutex m_controlMutex;
    std::thread m_thread;

    mutable std::mutex m_waveMutex;
    std::future<void> m_wave;

    mutable std::mutex m_resultsMutex;
    std::vector<SettlementCycleResult> m_lastResults;
};
