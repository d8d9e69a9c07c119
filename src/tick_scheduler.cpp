#include "tick_scheduler.h"

#include "settlement_store.h"
#include "sim_events.h"
#include "sim_log.h"
#include "simulation_context.h"

#include <SFML/System.hpp>

#include <algorithm>
#include <chrono>
#include <exception>
#include <iomanip>
#include <sstream>
#include <string>
#include <utility>

namespace {

std::int64_t systemClockMillis() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

} // namespace

TickScheduler::TickScheduler(const SimulationContext& ctx, SettlementStore& store, EventSink& events, WallClock clock)
    : m_ctx(ctx),
      m_store(store),
      m_events(events),
      m_clock(clock ? std::move(clock) : WallClock(systemClockMillis)),
      m_production(ctx.config.production, ctx.config.scheduler.ticksPerHour()),
      m_consumption(ctx.config.consumption, ctx.config.scheduler.ticksPerHour()),
      m_storage(ctx.config.storage),
      m_population(ctx.config.population) {
}

TickScheduler::~TickScheduler() {
    {
        std::lock_guard<std::mutex> lock(m_controlMutex);
        m_running = false;
        if (m_thread.joinable()) {
            m_thread.join();
        }
    }
    waitForWave();
}

bool TickScheduler::start() {
    std::lock_guard<std::mutex> lock(m_controlMutex);
    if (m_running) {
        logWarn("Scheduler", "start ignored: already running");
        return false;
    }
    if (m_thread.joinable()) {
        m_thread.join();
    }
    m_running = true;
    m_thread = std::thread(&TickScheduler::loop, this);

    const int rate = std::max(1, m_ctx.config.scheduler.tickRate);
    std::ostringstream msg;
    msg << "started tickRate=" << rate << " interval=" << std::fixed << std::setprecision(3)
        << (1000.0 / static_cast<double>(rate)) << "ms";
    logInfo("Scheduler", msg.str());
    return true;
}

bool TickScheduler::stop() {
    std::lock_guard<std::mutex> lock(m_controlMutex);
    if (!m_running) {
        logWarn("Scheduler", "stop ignored: not running");
        return false;
    }
    m_running = false;
    if (m_thread.joinable()) {
        m_thread.join();
    }
    // An in-flight wave keeps running; its registry updates land on an empty registry.
    m_registry.clear();
    logInfo("Scheduler", "stopped at tick=" + std::to_string(m_tick.load()));
    return true;
}

bool TickScheduler::registerSettlement(const std::string& settlementId,
                                       const std::string& ownerId,
                                       const std::string& worldId) {
    const bool added = m_registry.add(settlementId, ownerId, worldId, m_tick.load());
    if (added) {
        logInfo("Scheduler", "registered settlement=" + settlementId + " owner=" + ownerId + " world=" + worldId);
    }
    return added;
}

bool TickScheduler::unregisterSettlement(const std::string& settlementId) {
    const bool removed = m_registry.remove(settlementId);
    if (removed) {
        logInfo("Scheduler", "unregistered settlement=" + settlementId);
    }
    return removed;
}

int TickScheduler::registerPlayerSettlements(const std::string& playerId, const std::string& worldId) {
    std::vector<std::string> ids;
    try {
        ids = m_store.listPlayerSettlements(playerId, worldId);
    } catch (const std::exception& e) {
        logError("Scheduler", "could not list settlements for player=" + playerId + ": " + e.what());
        return 0;
    }
    int added = 0;
    for (const std::string& id : ids) {
        if (registerSettlement(id, playerId, worldId)) {
            ++added;
        }
    }
    return added;
}

int TickScheduler::unregisterPlayerSettlements(const std::string& playerId) {
    const std::vector<std::string> removed = m_registry.removeOwnedBy(playerId);
    for (const std::string& id : removed) {
        logInfo("Scheduler", "unregistered settlement=" + id + " (player " + playerId + " left)");
    }
    return static_cast<int>(removed.size());
}

SchedulerStatus TickScheduler::status() const {
    SchedulerStatus s;
    s.running = m_running.load();
    s.currentTick = m_tick.load();
    s.activeSettlements = m_registry.size();
    s.tickRate = m_ctx.config.scheduler.tickRate;
    s.wavesRun = m_wavesRun.load();
    s.skippedWaves = m_skippedWaves.load();
    return s;
}

void TickScheduler::step() {
    if (m_running) {
        logWarn("Scheduler", "step ignored: paced loop is running");
        return;
    }
    tick(false);
}

void TickScheduler::runTicks(long long count) {
    for (long long i = 0; i < count; ++i) {
        step();
    }
}

bool TickScheduler::waveInFlight() const {
    std::lock_guard<std::mutex> lock(m_waveMutex);
    return m_wave.valid() && m_wave.wait_for(std::chrono::seconds(0)) != std::future_status::ready;
}

void TickScheduler::waitForWave() {
    std::future<void> pending;
    {
        std::lock_guard<std::mutex> lock(m_waveMutex);
        pending = std::move(m_wave);
    }
    if (!pending.valid()) return;
    try {
        pending.get();
    } catch (const std::exception& e) {
        logError("Scheduler", std::string("wave ended with error: ") + e.what());
    }
}

std::vector<SettlementCycleResult> TickScheduler::lastWaveResults() const {
    std::lock_guard<std::mutex> lock(m_resultsMutex);
    return m_lastResults;
}

void TickScheduler::loop() {
    const int rate = std::max(1, m_ctx.config.scheduler.tickRate);
    const sf::Time interval = sf::seconds(1.0f / static_cast<float>(rate));
    sf::Clock clock;
    sf::Time nextTick = interval;

    while (m_running) {
        const sf::Time now = clock.getElapsedTime();
        if (now < nextTick) {
            sf::sleep(nextTick - now);
            continue;
        }
        nextTick += interval;
        tick(true);
    }
}

void TickScheduler::tick(bool paced) {
    const SimulationConfig::Scheduler& cfg = m_ctx.config.scheduler;
    const std::int64_t current = ++m_tick;

    if (current % cfg.effectiveStatusLogInterval() == 0) {
        logStatus();
    }
    if (current % cfg.effectiveCoarsePeriod() != 0) {
        return;
    }

    std::vector<SettlementSimState> snapshot = m_registry.snapshot();
    if (!paced) {
        runWave(current, snapshot);
        return;
    }

    if (cfg.skipWaveWhileInFlight && waveInFlight()) {
        ++m_skippedWaves;
        logWarn("Scheduler", "skipping wave at tick=" + std::to_string(current) + ": previous wave still running");
        return;
    }
    waitForWave(); // blocks only when skipping is disabled

    std::lock_guard<std::mutex> lock(m_waveMutex);
    m_wave = std::async(std::launch::async, [this, current, snapshot = std::move(snapshot)]() {
        runWave(current, snapshot);
    });
}

void TickScheduler::runWave(std::int64_t tick, const std::vector<SettlementSimState>& snapshot) {
    const SimulationConfig::Scheduler& cfg = m_ctx.config.scheduler;
    const bool populationDue = cfg.populationPeriodTicks > 0 && tick % cfg.populationPeriodTicks == 0;
    const size_t batchSize = static_cast<size_t>(std::max(1, cfg.batchSize));

    SimulationStepContext stepCtx{m_ctx, m_store, m_events, m_production, m_consumption,
                                  m_storage, m_population, m_clock()};

    std::vector<SettlementCycleResult> results(snapshot.size());
    for (size_t begin = 0; begin < snapshot.size(); begin += batchSize) {
        const int count = static_cast<int>(std::min(batchSize, snapshot.size() - begin));

        // runSettlementCycle never throws, so nothing escapes the parallel region.
        #pragma omp parallel for schedule(dynamic)
        for (int i = 0; i < count; ++i) {
            const size_t idx = begin + static_cast<size_t>(i);
            results[idx] = runSettlementCycle(snapshot[idx], tick, populationDue, stepCtx);
        }

        for (int i = 0; i < count; ++i) {
            applyOutcome(results[begin + static_cast<size_t>(i)]);
        }
    }

    ++m_wavesRun;
    {
        std::lock_guard<std::mutex> lock(m_resultsMutex);
        m_lastResults = std::move(results);
    }
}

void TickScheduler::applyOutcome(const SettlementCycleResult& result) {
    switch (result.outcome) {
        case CycleOutcome::Advanced: {
            m_registry.advance(result.settlementId, result.tick);
            const std::string invariantError = result.validateInvariants();
            if (!invariantError.empty()) {
                logError("Scheduler", "settlement=" + result.settlementId + " tick=" + std::to_string(result.tick) +
                                          " invariant violation: " + invariantError);
            }
            break;
        }
        case CycleOutcome::Deregister:
            logWarn("Scheduler", "settlement=" + result.settlementId + " has incomplete data; deregistering");
            m_registry.remove(result.settlementId);
            break;
        case CycleOutcome::Failed:
            break;
    }
}

void TickScheduler::logStatus() const {
    const SchedulerStatus s = status();
    logInfo("Scheduler", "status tick=" + std::to_string(s.currentTick) +
                             " active=" + std::to_string(s.activeSettlements) +
                             " waves=" + std::to_string(s.wavesRun) +
                             " skipped=" + std::to_string(s.skippedWaves) +
                             " running=" + (s.running ? "1" : "0"));
}
