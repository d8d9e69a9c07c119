#include <SFML/System.hpp>

#include <algorithm>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <limits>
#include <optional>
#include <set>
#include <sstream>
#include <string>
#include <vector>

#ifdef _OPENMP
#include <omp.h>
#endif

#include "consumption_model.h"
#include "settlement_store.h"
#include "sim_events.h"
#include "sim_log.h"
#include "simulation_context.h"
#include "structure.h"
#include "tick_scheduler.h"

namespace {

constexpr long long kDefaultTicks = 3600; // one minute at 60 Hz
constexpr size_t kReportedEvents = 10;

struct RunOptions {
    std::uint64_t seed = 1;
    std::string configPath = "data/sim_config.toml";
    std::string worldPath = "data/demo_world.toml";
    long long ticks = kDefaultTicks;
    double realtimeSeconds = 0.0; // > 0 runs the paced loop instead of stepping
    std::string eventsOut;
    int threads = 0;              // 0 = OpenMP default
    bool quiet = false;
    bool debug = false;
};

bool parseUInt64(const std::string& s, std::uint64_t& out) {
    try {
        size_t pos = 0;
        const auto v = std::stoull(s, &pos);
        if (pos != s.size()) return false;
        out = static_cast<std::uint64_t>(v);
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

bool parseInt64(const std::string& s, long long& out) {
    try {
        size_t pos = 0;
        const auto v = std::stoll(s, &pos);
        if (pos != s.size() || v < 0) return false;
        out = v;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

bool parseInt(const std::string& s, int& out) {
    long long v = 0;
    if (!parseInt64(s, v) || v > std::numeric_limits<int>::max()) return false;
    out = static_cast<int>(v);
    return true;
}

bool parseSeconds(const std::string& s, double& out) {
    try {
        size_t pos = 0;
        const double v = std::stod(s, &pos);
        if (pos != s.size() || !(v >= 0.0)) return false;
        out = v;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

void printUsage(const char* argv0) {
    std::cout << "Usage: " << (argv0 ? argv0 : "settlesim_cli")
              << " [--seed N] [--config path] [--world path]\n"
              << "       [--ticks N] [--realtime SECONDS] [--events-out path]\n"
              << "       [--threads N] [--quiet] [--debug]\n"
              << "Notes: --ticks steps the scheduler deterministically; --realtime runs the paced loop.\n";
}

enum class ParseResult { Run, Help, Invalid };

ParseResult parseArgs(int argc, char** argv, RunOptions& opt) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i] ? std::string(argv[i]) : std::string();
        auto requireValue = [&](std::string& out) -> bool {
            if (i + 1 >= argc) return false;
            out = argv[++i] ? std::string(argv[i]) : std::string();
            return true;
        };

        if (arg == "--help" || arg == "-h") {
            return ParseResult::Help;
        } else if (arg == "--seed") {
            std::string v;
            if (!requireValue(v) || !parseUInt64(v, opt.seed)) return ParseResult::Invalid;
        } else if (arg.rfind("--seed=", 0) == 0) {
            if (!parseUInt64(arg.substr(7), opt.seed)) return ParseResult::Invalid;
        } else if (arg == "--config") {
            if (!requireValue(opt.configPath)) return ParseResult::Invalid;
        } else if (arg.rfind("--config=", 0) == 0) {
            opt.configPath = arg.substr(9);
        } else if (arg == "--world") {
            if (!requireValue(opt.worldPath)) return ParseResult::Invalid;
        } else if (arg.rfind("--world=", 0) == 0) {
            opt.worldPath = arg.substr(8);
        } else if (arg == "--ticks") {
            std::string v;
            if (!requireValue(v) || !parseInt64(v, opt.ticks)) return ParseResult::Invalid;
        } else if (arg.rfind("--ticks=", 0) == 0) {
            if (!parseInt64(arg.substr(8), opt.ticks)) return ParseResult::Invalid;
        } else if (arg == "--realtime") {
            std::string v;
            if (!requireValue(v) || !parseSeconds(v, opt.realtimeSeconds)) return ParseResult::Invalid;
        } else if (arg.rfind("--realtime=", 0) == 0) {
            if (!parseSeconds(arg.substr(11), opt.realtimeSeconds)) return ParseResult::Invalid;
        } else if (arg == "--events-out") {
            if (!requireValue(opt.eventsOut)) return ParseResult::Invalid;
        } else if (arg.rfind("--events-out=", 0) == 0) {
            opt.eventsOut = arg.substr(13);
        } else if (arg == "--threads") {
            std::string v;
            if (!requireValue(v) || !parseInt(v, opt.threads)) return ParseResult::Invalid;
        } else if (arg.rfind("--threads=", 0) == 0) {
            if (!parseInt(arg.substr(10), opt.threads)) return ParseResult::Invalid;
        } else if (arg == "--quiet") {
            opt.quiet = true;
        } else if (arg == "--debug") {
            opt.debug = true;
        } else {
            std::cerr << "Unknown flag: " << arg << "\n";
            return ParseResult::Invalid;
        }
    }
    return ParseResult::Run;
}

// Every distinct owner in the store joins the world, which registers their settlements.
int joinAllPlayers(InMemorySettlementStore& store, TickScheduler& scheduler, const std::string& worldId) {
    std::set<std::string> owners;
    for (const std::string& id : store.settlementIds()) {
        const std::optional<SettlementDetail> detail = store.fetchSettlementDetail(id);
        if (detail && detail->settlement && !detail->settlement->ownerId.empty()) {
            owners.insert(detail->settlement->ownerId);
        }
    }
    int registered = 0;
    for (const std::string& owner : owners) {
        registered += scheduler.registerPlayerSettlements(owner, worldId);
    }
    return registered;
}

void printReport(InMemorySettlementStore& store,
                 const TickScheduler& scheduler,
                 const SchedulerStatus& status,
                 const EventFeed& feed) {
    std::cout << std::fixed << std::setprecision(2);
    std::cout << "status running=" << (status.running ? 1 : 0)
              << " tick=" << status.currentTick
              << " active=" << status.activeSettlements
              << " tickRate=" << status.tickRate
              << " waves=" << status.wavesRun
              << " skipped=" << status.skippedWaves << "\n";

    for (const std::string& id : store.settlementIds()) {
        const std::optional<SettlementDetail> detail = store.fetchSettlementDetail(id);
        if (!detail || !detail->settlement) continue;
        std::cout << "settlement " << id << " (" << detail->settlement->name << ")\n";
        if (detail->storage) {
            std::cout << "  stock       " << formatResources(detail->storage->amounts) << "\n";
        } else {
            std::cout << "  stock       <missing>\n";
        }
        const std::optional<PopulationRecord> pop = store.population(id);
        if (pop) {
            std::cout << "  population  " << pop->current << " happiness=" << pop->happiness
                      << " (" << happinessDescription(pop->happiness) << ")\n";
            const int structures = static_cast<int>(foldStructureRows(store.fetchStructures(id)).size());
            const ConsumptionSummary summary =
                scheduler.consumptionModel().summarize(pop->current, structures, detail->consumptionMultiplier);
            std::cout << "  upkeep/hour " << formatResources(summary.perHour) << "\n";
        }
    }

    const std::vector<SimEvent> events = feed.getEvents();
    const size_t first = events.size() > kReportedEvents ? events.size() - kReportedEvents : 0;
    std::cout << "recent events (" << feed.totalPublished() << " published):\n";
    for (size_t i = first; i < events.size(); ++i) {
        std::cout << "  " << simEventName(events[i].kind) << " " << events[i].settlementId << "\n";
    }
}

} // namespace

int main(int argc, char** argv) {
    RunOptions opt;
    const ParseResult parsed = parseArgs(argc, argv, opt);
    if (parsed != ParseResult::Run) {
        printUsage((argc > 0) ? argv[0] : nullptr);
        return parsed == ParseResult::Help ? 0 : 2;
    }

    if (opt.debug) {
        setLogLevel(LogLevel::Debug);
    } else if (opt.quiet) {
        setLogLevel(LogLevel::Warn);
    }

#ifdef _OPENMP
    if (opt.threads > 0) {
        omp_set_num_threads(opt.threads);
    }
#endif

    SimulationContext ctx(opt.seed, opt.configPath);
    const std::string configError = ctx.config.validate();
    if (!configError.empty()) {
        std::cerr << "Error: invalid config: " << configError << "\n";
        return 1;
    }

    InMemorySettlementStore store;
    std::string worldId;
    std::string loadError;
    if (!loadWorldFixture(opt.worldPath, store, &worldId, &loadError)) {
        std::cerr << "Error: " << loadError << "\n";
        return 1;
    }

    EventFeed feed(static_cast<size_t>(ctx.config.events.feedCapacity));
    EventJournal journal;
    EventFanout fanout;
    fanout.attach(&feed);
    const std::string journalPath = !opt.eventsOut.empty() ? opt.eventsOut : ctx.config.events.journalPath;
    if (!journalPath.empty()) {
        std::string journalError;
        if (!journal.open(journalPath, &journalError)) {
            std::cerr << "Error: " << journalError << "\n";
            return 1;
        }
        fanout.attach(&journal);
    }

    TickScheduler scheduler(ctx, store, fanout);

    std::cout << "settlesim_cli seed=" << opt.seed
              << " config=" << ctx.configPath
              << " hash=" << ctx.configHash
              << " world=" << worldId
              << " mode=" << (opt.realtimeSeconds > 0.0 ? "realtime" : "step")
              << "\n";

    const int registered = joinAllPlayers(store, scheduler, worldId);
    logInfo("Cli", "registered " + std::to_string(registered) + " settlements");

    SchedulerStatus finalStatus;
    if (opt.realtimeSeconds > 0.0) {
        scheduler.start();
        sf::sleep(sf::seconds(static_cast<float>(opt.realtimeSeconds)));
        finalStatus = scheduler.status();
        scheduler.stop();
        scheduler.waitForWave();
    } else {
        scheduler.runTicks(opt.ticks);
        finalStatus = scheduler.status();
    }

    const std::string invariantError = scheduler.registry().validateInvariants();
    printReport(store, scheduler, finalStatus, feed);
    if (journal.isOpen()) {
        journal.close();
        logInfo("Cli", "wrote " + std::to_string(journal.linesWritten()) + " events to " + journalPath);
    }
    if (!invariantError.empty()) {
        std::cerr << "Invariant violation: " << invariantError << "\n";
        return 1;
    }
    return 0;
}
