#define BOOST_TEST_MODULE SimulationConfigTests
#include <boost/test/unit_test.hpp>

#include "sim_log.h"
#include "simulation_context.h"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <set>
#include <sstream>
#include <string>

namespace {

std::string writeTempFile(const std::string& name, const std::string& contents) {
    const std::filesystem::path path = std::filesystem::temp_directory_path() / name;
    std::ofstream out(path, std::ios::trunc);
    out << contents;
    return path.string();
}

} // namespace

class ConfigFixture {
public:
    ConfigFixture() : ctx(7, "") {
        setLogLevel(LogLevel::Off);
    }

protected:
    SimulationContext ctx;
};

// ============================================================================
// DEFAULTS
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(DefaultTests, ConfigFixture)

BOOST_AUTO_TEST_CASE(TestBuiltInDefaults) {
    const SimulationConfig& c = ctx.config;
    BOOST_CHECK_EQUAL(ctx.configHash, "defaults");
    BOOST_CHECK_EQUAL(c.scheduler.tickRate, 60);
    BOOST_CHECK_EQUAL(c.scheduler.effectiveCoarsePeriod(), 60);
    BOOST_CHECK_EQUAL(c.scheduler.populationPeriodTicks, 36000);
    BOOST_CHECK_EQUAL(c.scheduler.batchSize, 10);
    BOOST_CHECK_EQUAL(c.scheduler.effectiveStatusLogInterval(), 18000);
    BOOST_CHECK_CLOSE(c.scheduler.ticksPerHour(), 216000.0, 1e-9);
    BOOST_CHECK_EQUAL(c.production.rates.size(), 7u);
    BOOST_CHECK_CLOSE(c.production.levelBonusPerLevel, 0.2, 1e-9);
    BOOST_CHECK_CLOSE(c.consumption.foodPerCapitaPerHour, 1080.0, 1e-9);
    BOOST_CHECK_CLOSE(c.storage.baseCapacity, 1000.0, 1e-9);
    BOOST_CHECK(c.validate().empty());
}

BOOST_AUTO_TEST_CASE(TestValidateReportsFirstProblem) {
    ctx.config.scheduler.batchSize = 0;
    BOOST_CHECK_NE(ctx.config.validate().find("batchSize"), std::string::npos);

    ctx.config.scheduler.batchSize = 10;
    ctx.config.storage.nearCapacityThreshold = 1.5;
    BOOST_CHECK_NE(ctx.config.validate().find("nearCapacityThreshold"), std::string::npos);
}

BOOST_AUTO_TEST_CASE(TestSeedsAreStableAndDistinct) {
    const SimulationContext same(7, "");
    const SimulationContext other(8, "");
    BOOST_CHECK_EQUAL(ctx.seedForSettlement("riverbend"), same.seedForSettlement("riverbend"));
    BOOST_CHECK_NE(ctx.seedForSettlement("riverbend"), other.seedForSettlement("riverbend"));
    BOOST_CHECK_NE(ctx.seedForSettlement("riverbend"), ctx.seedForSettlement("highpass"));

    std::mt19937_64 a = ctx.makeRng(42);
    std::mt19937_64 b = same.makeRng(42);
    BOOST_CHECK_EQUAL(a(), b());

    std::set<std::uint64_t> seen;
    for (std::uint64_t i = 0; i < 1000; ++i) {
        seen.insert(SimulationContext::mix64(i));
        const double u = SimulationContext::u01FromU64(SimulationContext::mix64(i));
        BOOST_CHECK_GE(u, 0.0);
        BOOST_CHECK_LT(u, 1.0);
    }
    BOOST_CHECK_EQUAL(seen.size(), 1000u);
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// LOADING
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(LoadTests, ConfigFixture)

BOOST_AUTO_TEST_CASE(TestOverridesFromFile) {
    const std::string path = writeTempFile("settlesim_config_override.toml", R"(
[scheduler]
tickRate = 30
coarsePeriodTicks = 15
populationPeriodTicks = 900
batchSize = 4

[consumption]
foodPerCapitaPerHour = 2
bufferHours = 0.5

[storage]
baseCapacity = 250.0

[production]
levelBonusPerLevel = 0.5

[[production.rates]]
extractor = "FARM"
resource = "food"
baseRate = 20

[[production.rates]]
extractor = "CATAPULT"
resource = "food"
baseRate = 99

[[production.biomes]]
name = "Swamp"
food = 0.7
water = 2
)");

    std::string err;
    BOOST_REQUIRE(ctx.loadConfig(path, &err));
    BOOST_CHECK(err.empty());
    const SimulationConfig& c = ctx.config;
    BOOST_CHECK_EQUAL(c.scheduler.tickRate, 30);
    BOOST_CHECK_EQUAL(c.scheduler.effectiveCoarsePeriod(), 15);
    BOOST_CHECK_EQUAL(c.scheduler.populationPeriodTicks, 900);
    BOOST_CHECK_EQUAL(c.scheduler.batchSize, 4);
    BOOST_CHECK_CLOSE(c.consumption.foodPerCapitaPerHour, 2.0, 1e-9);
    BOOST_CHECK_CLOSE(c.consumption.bufferHours, 0.5, 1e-9);
    BOOST_CHECK_CLOSE(c.consumption.waterPerCapitaPerHour, 2160.0, 1e-9);
    BOOST_CHECK_CLOSE(c.storage.baseCapacity, 250.0, 1e-9);

    BOOST_REQUIRE_EQUAL(c.production.rates.size(), 1u);
    BOOST_CHECK_CLOSE(c.production.rates[0].baseRate, 20.0, 1e-9);
    BOOST_CHECK_CLOSE(c.production.levelBonusPerLevel, 0.5, 1e-9);
    BOOST_REQUIRE_EQUAL(c.production.biomes.size(), 1u);
    BOOST_CHECK_EQUAL(c.production.biomes[0].name, "Swamp");
    BOOST_CHECK_CLOSE(c.production.biomes[0].efficiency.food, 0.7, 1e-9);
    BOOST_CHECK_CLOSE(c.production.biomes[0].efficiency.ore, 1.0, 1e-9);

    BOOST_CHECK_NE(ctx.configHash, "defaults");
    BOOST_CHECK(c.validate().empty());
}

BOOST_AUTO_TEST_CASE(TestOutOfRangeValuesAreSanitized) {
    const std::string path = writeTempFile("settlesim_config_sanitize.toml", R"(
[scheduler]
tickRate = -5
batchSize = 0

[storage]
nearCapacityThreshold = 3.0
baseCapacity = -10

[population]
maxImmigrantBatch = 0
maxEmigrationChance = 7
)");

    BOOST_REQUIRE(ctx.loadConfig(path));
    const SimulationConfig& c = ctx.config;
    BOOST_CHECK_EQUAL(c.scheduler.tickRate, 60);
    BOOST_CHECK_EQUAL(c.scheduler.batchSize, 10);
    BOOST_CHECK_CLOSE(c.storage.nearCapacityThreshold, 1.0, 1e-9);
    BOOST_CHECK_EQUAL(c.storage.baseCapacity, 0.0);
    BOOST_CHECK_EQUAL(c.population.maxImmigrantBatch, 1);
    BOOST_CHECK_CLOSE(c.population.maxEmigrationChance, 1.0, 1e-9);
    BOOST_CHECK(c.validate().empty());
}

BOOST_AUTO_TEST_CASE(TestParseErrorFallsBackToDefaults) {
    const std::string path = writeTempFile("settlesim_config_broken.toml", "[scheduler\ntickRate = = 3\n");

    std::string err;
    BOOST_CHECK(!ctx.loadConfig(path, &err));
    BOOST_CHECK_NE(err.find("Failed to parse config"), std::string::npos);
    BOOST_CHECK_EQUAL(ctx.configHash, "defaults");
    BOOST_CHECK_EQUAL(ctx.config.scheduler.tickRate, 60);
}

BOOST_AUTO_TEST_CASE(TestMissingFileFallsBackToDefaults) {
    std::string err;
    BOOST_CHECK(!ctx.loadConfig("does/not/exist.toml", &err));
    BOOST_CHECK(!err.empty());
    BOOST_CHECK_EQUAL(ctx.config.production.rates.size(), 7u);
}

BOOST_AUTO_TEST_CASE(TestShippedConfigLoads) {
    std::string err;
    BOOST_REQUIRE_MESSAGE(ctx.loadConfig("data/sim_config.toml", &err), err);
    BOOST_CHECK(ctx.config.validate().empty());
    BOOST_CHECK_EQUAL(ctx.config.scheduler.effectiveCoarsePeriod(), 60);
    BOOST_CHECK(!ctx.config.production.rates.empty());
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// LOGGING
// ============================================================================

BOOST_AUTO_TEST_CASE(TestLogLevelParsing) {
    LogLevel level = LogLevel::Info;
    BOOST_CHECK(parseLogLevel("debug", level));
    BOOST_CHECK(level == LogLevel::Debug);
    BOOST_CHECK(parseLogLevel("ERROR", level));
    BOOST_CHECK(level == LogLevel::Error);
    BOOST_CHECK(!parseLogLevel("loud", level));
    BOOST_CHECK(level == LogLevel::Error);

    setLogLevel(LogLevel::Warn);
    BOOST_CHECK(!logEnabled(LogLevel::Info));
    BOOST_CHECK(logEnabled(LogLevel::Error));
    BOOST_CHECK_EQUAL(std::string(logLevelName(LogLevel::Warn)), "WARN");
}

BOOST_AUTO_TEST_CASE(TestLogHelpersRouteByLevel) {
    std::ostringstream out;
    std::ostringstream err;
    std::streambuf* oldOut = std::cout.rdbuf(out.rdbuf());
    std::streambuf* oldErr = std::cerr.rdbuf(err.rdbuf());

    setLogLevel(LogLevel::Info);
    logDebug("Test", "hidden");
    logInfo("Test", "settlement=" + std::string("riverbend") + " tick=" + std::to_string(42));
    logWarn("Test", "careful");
    logError("Test", "broken");
    setLogLevel(LogLevel::Off);
    logError("Test", "silenced");

    std::cout.rdbuf(oldOut);
    std::cerr.rdbuf(oldErr);

    BOOST_CHECK_EQUAL(out.str(), "INFO [Test] settlement=riverbend tick=42\n");
    BOOST_CHECK_EQUAL(err.str(), "WARN [Test] careful\nERROR [Test] broken\n");
}
