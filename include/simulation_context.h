#pragma once

#include "resource.h"
#include "structure.h"

#include <cstdint>
#include <random>
#include <string>
#include <vector>

struct SimulationConfig {
    struct ProductionRateConfig {
        ExtractorType extractor = ExtractorType::FARM;
        Resource::Type resource = Resource::Type::FOOD;
        double baseRate = 0.0; // units per hour at level 1
    };

    struct BiomeEfficiencyConfig {
        std::string name;
        ResourceAmounts efficiency = ResourceAmounts::uniform(1.0);
    };

    struct Scheduler {
        int tickRate = 60;                   // ticks per second
        int coarsePeriodTicks = 0;           // 0 = tickRate (once per second)
        int populationPeriodTicks = 36000;   // every 10 minutes at 60 Hz
        int batchSize = 10;
        int statusLogIntervalTicks = 0;      // 0 = 300 * tickRate
        bool skipWaveWhileInFlight = true;

        int effectiveCoarsePeriod() const { return coarsePeriodTicks > 0 ? coarsePeriodTicks : tickRate; }
        int effectiveStatusLogInterval() const { return statusLogIntervalTicks > 0 ? statusLogIntervalTicks : 300 * tickRate; }
        double ticksPerHour() const { return static_cast<double>(tickRate) * 3600.0; }
    } scheduler{};

    struct Production {
        std::vector<ProductionRateConfig> rates;
        double levelBonusPerLevel = 0.2;   // multiplier = 1 + bonus * (level - 1)
        std::vector<BiomeEfficiencyConfig> biomes;
    } production{};

    struct Consumption {
        double foodPerCapitaPerHour = 1080.0;
        double waterPerCapitaPerHour = 2160.0;
        double woodPerStructurePerHour = 3.6;
        double stonePerStructurePerHour = 1.8;
        double orePerStructurePerHour = 0.9;
        double bufferHours = 1.0;
        double worldMultiplier = 1.0;
        int basePopulationCapacity = 10;
    } consumption{};

    struct Storage {
        double baseCapacity = 1000.0;
        double nearCapacityThreshold = 0.9;
    } storage{};

    struct Population {
        double baseGrowthRate = 0.02;
        double starvationRate = 0.05;
        double timeUnitSeconds = 3600.0;
        double maxImmigrationChance = 0.25;
        double maxEmigrationChance = 0.25;
        int maxImmigrantBatch = 3;
        double emigrationFraction = 0.10;
        double lowHappinessThreshold = 35.0;
        double happinessStep = 10.0;
    } population{};

    struct Events {
        std::string journalPath;
        int feedCapacity = 64;
    } events{};

    SimulationConfig();

    static std::vector<ProductionRateConfig> defaultProductionRates();
    static std::vector<BiomeEfficiencyConfig> defaultBiomeEfficiencies();

    // Empty string when every value is usable.
    std::string validate() const;
};

struct SimulationContext {
    std::uint64_t worldSeed = 0;
    SimulationConfig config;
    std::string configPath;
    std::string configHash;

    explicit SimulationContext(std::uint64_t seed, const std::string& runtimeConfigPath = "data/sim_config.toml");

    bool loadConfig(const std::string& path, std::string* errorMessage = nullptr);
    static std::string hashFileFNV1a(const std::string& path);

    std::uint64_t seedForSettlement(const std::string& settlementId) const;
    std::mt19937_64 makeRng(std::uint64_t salt) const;

    static std::uint64_t hashString(const std::string& text);
    static std::uint64_t mix64(std::uint64_t x);
    static double u01FromU64(std::uint64_t x);
};
