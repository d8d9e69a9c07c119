#include "simulation_context.h"

#include "sim_log.h"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <optional>
#include <sstream>
#include <string_view>
#include <type_traits>

#include <toml++/toml.hpp>

namespace {

template <typename T>
void readTomlValue(const toml::table& root,
                   std::string_view section,
                   std::string_view key,
                   T& target) {
    const toml::node_view<const toml::node> view = root[section][key];
    if constexpr (std::is_same_v<T, int>) {
        if (const auto v = view.value<std::int64_t>()) {
            target = static_cast<int>(*v);
        }
    } else if constexpr (std::is_same_v<T, double>) {
        if (const auto v = view.value<double>()) {
            target = *v;
        } else if (const auto vi = view.value<std::int64_t>()) {
            target = static_cast<double>(*vi);
        }
    } else if constexpr (std::is_same_v<T, bool>) {
        if (const auto v = view.value<bool>()) {
            target = *v;
        }
    } else if constexpr (std::is_same_v<T, std::string>) {
        if (const auto v = view.value<std::string>()) {
            target = *v;
        }
    }
}

std::optional<double> readNumber(const toml::table& t, std::string_view key) {
    if (const auto v = t[key].value<double>()) {
        return *v;
    }
    if (const auto vi = t[key].value<std::int64_t>()) {
        return static_cast<double>(*vi);
    }
    return std::nullopt;
}

double clamp01(double v) {
    if (!std::isfinite(v)) return 0.0;
    return std::clamp(v, 0.0, 1.0);
}

void sanitizeConfig(SimulationConfig& config) {
    SimulationConfig::Scheduler& s = config.scheduler;
    if (s.tickRate <= 0) s.tickRate = 60;
    if (s.coarsePeriodTicks < 0) s.coarsePeriodTicks = 0;
    if (s.populationPeriodTicks <= 0) s.populationPeriodTicks = 36000;
    if (s.batchSize <= 0) s.batchSize = 10;
    if (s.statusLogIntervalTicks < 0) s.statusLogIntervalTicks = 0;

    if (!std::isfinite(config.production.levelBonusPerLevel) || config.production.levelBonusPerLevel < 0.0) {
        config.production.levelBonusPerLevel = 0.2;
    }
    for (auto& r : config.production.rates) {
        if (!std::isfinite(r.baseRate) || r.baseRate < 0.0) r.baseRate = 0.0;
    }

    SimulationConfig::Consumption& c = config.consumption;
    c.foodPerCapitaPerHour = std::max(0.0, c.foodPerCapitaPerHour);
    c.waterPerCapitaPerHour = std::max(0.0, c.waterPerCapitaPerHour);
    c.woodPerStructurePerHour = std::max(0.0, c.woodPerStructurePerHour);
    c.stonePerStructurePerHour = std::max(0.0, c.stonePerStructurePerHour);
    c.orePerStructurePerHour = std::max(0.0, c.orePerStructurePerHour);
    c.bufferHours = std::max(0.0, c.bufferHours);
    c.worldMultiplier = std::max(0.0, c.worldMultiplier);
    c.basePopulationCapacity = std::max(0, c.basePopulationCapacity);

    config.storage.baseCapacity = std::max(0.0, config.storage.baseCapacity);
    config.storage.nearCapacityThreshold = clamp01(config.storage.nearCapacityThreshold);

    SimulationConfig::Population& p = config.population;
    p.starvationRate = std::max(0.0, p.starvationRate);
    if (p.timeUnitSeconds <= 0.0) p.timeUnitSeconds = 3600.0;
    p.maxImmigrationChance = clamp01(p.maxImmigrationChance);
    p.maxEmigrationChance = clamp01(p.maxEmigrationChance);
    p.maxImmigrantBatch = std::max(1, p.maxImmigrantBatch);
    p.emigrationFraction = clamp01(p.emigrationFraction);
    p.lowHappinessThreshold = std::clamp(p.lowHappinessThreshold, 0.0, 99.0);
    p.happinessStep = std::max(0.0, p.happinessStep);

    if (config.events.feedCapacity <= 0) config.events.feedCapacity = 64;
}

} // namespace

SimulationConfig::SimulationConfig()
    : production{defaultProductionRates(), 0.2, defaultBiomeEfficiencies()} {}

std::vector<SimulationConfig::ProductionRateConfig> SimulationConfig::defaultProductionRates() {
    return {
        {ExtractorType::FARM, Resource::Type::FOOD, 10.0},
        {ExtractorType::WELL, Resource::Type::WATER, 15.0},
        {ExtractorType::LUMBER_MILL, Resource::Type::WOOD, 8.0},
        {ExtractorType::QUARRY, Resource::Type::STONE, 6.0},
        {ExtractorType::MINE, Resource::Type::ORE, 4.0},
        {ExtractorType::FISHING_DOCK, Resource::Type::FOOD, 8.0},
        {ExtractorType::HUNTERS_LODGE, Resource::Type::FOOD, 4.0},
    };
}

std::vector<SimulationConfig::BiomeEfficiencyConfig> SimulationConfig::defaultBiomeEfficiencies() {
    //        name                    food  water wood  stone ore
    return {
        {"Grassland",           {1.0, 1.0, 1.0, 1.0, 1.0}},
        {"Forest",              {0.8, 1.0, 2.0, 0.8, 0.8}},
        {"Desert",              {0.5, 0.4, 0.8, 2.0, 1.2}},
        {"Tropical Rainforest", {1.5, 1.2, 2.0, 0.5, 0.5}},
        {"Mountains",           {0.6, 0.9, 0.8, 1.6, 2.0}},
        {"Tundra",              {0.5, 0.8, 0.7, 1.1, 1.1}},
    };
}

std::string SimulationConfig::validate() const {
    std::ostringstream oss;
    if (scheduler.tickRate <= 0) {
        oss << "scheduler.tickRate must be positive";
    } else if (scheduler.batchSize <= 0) {
        oss << "scheduler.batchSize must be positive";
    } else if (scheduler.populationPeriodTicks <= 0) {
        oss << "scheduler.populationPeriodTicks must be positive";
    } else if (!(production.levelBonusPerLevel >= 0.0)) {
        oss << "production.levelBonusPerLevel must be non-negative";
    } else if (storage.nearCapacityThreshold < 0.0 || storage.nearCapacityThreshold > 1.0) {
        oss << "storage.nearCapacityThreshold outside [0,1]";
    }
    return oss.str();
}

SimulationContext::SimulationContext(std::uint64_t seed, const std::string& runtimeConfigPath)
    : worldSeed(seed), config(), configPath(runtimeConfigPath), configHash("defaults") {
    if (!runtimeConfigPath.empty()) {
        std::string err;
        if (!loadConfig(runtimeConfigPath, &err)) {
            logError("Config", err + " Using built-in defaults.");
        }
    }
}

bool SimulationContext::loadConfig(const std::string& path, std::string* errorMessage) {
    config = SimulationConfig{};
    configPath = path;
    configHash = "defaults";

    if (path.empty()) {
        return true;
    }

    try {
        toml::table root = toml::parse_file(path);

        readTomlValue(root, "scheduler", "tickRate", config.scheduler.tickRate);
        readTomlValue(root, "scheduler", "coarsePeriodTicks", config.scheduler.coarsePeriodTicks);
        readTomlValue(root, "scheduler", "populationPeriodTicks", config.scheduler.populationPeriodTicks);
        readTomlValue(root, "scheduler", "batchSize", config.scheduler.batchSize);
        readTomlValue(root, "scheduler", "statusLogIntervalTicks", config.scheduler.statusLogIntervalTicks);
        readTomlValue(root, "scheduler", "skipWaveWhileInFlight", config.scheduler.skipWaveWhileInFlight);

        readTomlValue(root, "consumption", "foodPerCapitaPerHour", config.consumption.foodPerCapitaPerHour);
        readTomlValue(root, "consumption", "waterPerCapitaPerHour", config.consumption.waterPerCapitaPerHour);
        readTomlValue(root, "consumption", "woodPerStructurePerHour", config.consumption.woodPerStructurePerHour);
        readTomlValue(root, "consumption", "stonePerStructurePerHour", config.consumption.stonePerStructurePerHour);
        readTomlValue(root, "consumption", "orePerStructurePerHour", config.consumption.orePerStructurePerHour);
        readTomlValue(root, "consumption", "bufferHours", config.consumption.bufferHours);
        readTomlValue(root, "consumption", "worldMultiplier", config.consumption.worldMultiplier);
        readTomlValue(root, "consumption", "basePopulationCapacity", config.consumption.basePopulationCapacity);

        readTomlValue(root, "storage", "baseCapacity", config.storage.baseCapacity);
        readTomlValue(root, "storage", "nearCapacityThreshold", config.storage.nearCapacityThreshold);

        readTomlValue(root, "population", "baseGrowthRate", config.population.baseGrowthRate);
        readTomlValue(root, "population", "starvationRate", config.population.starvationRate);
        readTomlValue(root, "population", "timeUnitSeconds", config.population.timeUnitSeconds);
        readTomlValue(root, "population", "maxImmigrationChance", config.population.maxImmigrationChance);
        readTomlValue(root, "population", "maxEmigrationChance", config.population.maxEmigrationChance);
        readTomlValue(root, "population", "maxImmigrantBatch", config.population.maxImmigrantBatch);
        readTomlValue(root, "population", "emigrationFraction", config.population.emigrationFraction);
        readTomlValue(root, "population", "lowHappinessThreshold", config.population.lowHappinessThreshold);
        readTomlValue(root, "population", "happinessStep", config.population.happinessStep);

        readTomlValue(root, "events", "journalPath", config.events.journalPath);
        readTomlValue(root, "events", "feedCapacity", config.events.feedCapacity);

        if (const toml::array* rates = root["production"]["rates"].as_array()) {
            std::vector<SimulationConfig::ProductionRateConfig> parsed;
            parsed.reserve(rates->size());
            for (const auto& node : *rates) {
                const toml::table* t = node.as_table();
                if (!t) continue;
                const auto extractorName = (*t)["extractor"].value<std::string>();
                const auto resourceName = (*t)["resource"].value<std::string>();
                const auto baseRate = readNumber(*t, "baseRate");
                if (!extractorName || !resourceName || !baseRate) continue;
                const auto extractor = parseExtractorType(*extractorName);
                const auto resource = Resource::fromName(*resourceName);
                if (!extractor || !resource) {
                    logWarn("Config", "ignoring production rate extractor=" + *extractorName + " resource=" + *resourceName);
                    continue;
                }
                parsed.push_back({*extractor, *resource, *baseRate});
            }
            config.production.rates = std::move(parsed);
        }

        readTomlValue(root, "production", "levelBonusPerLevel", config.production.levelBonusPerLevel);

        if (const toml::array* biomes = root["production"]["biomes"].as_array()) {
            std::vector<SimulationConfig::BiomeEfficiencyConfig> parsed;
            parsed.reserve(biomes->size());
            for (const auto& node : *biomes) {
                const toml::table* t = node.as_table();
                if (!t) continue;
                SimulationConfig::BiomeEfficiencyConfig b{};
                if (const auto v = (*t)["name"].value<std::string>()) b.name = *v;
                if (b.name.empty()) continue;
                for (Resource::Type type : Resource::kAllTypes) {
                    if (const auto v = readNumber(*t, Resource::name(type))) {
                        b.efficiency.set(type, std::max(0.0, *v));
                    }
                }
                parsed.push_back(std::move(b));
            }
            if (!parsed.empty()) {
                config.production.biomes = std::move(parsed);
            }
        }

        sanitizeConfig(config);
        configHash = hashFileFNV1a(path);
        return true;
    } catch (const toml::parse_error& err) {
        if (errorMessage) {
            std::ostringstream oss;
            oss << "Failed to parse config '" << path << "': " << err.description();
            *errorMessage = oss.str();
        }
    } catch (const std::exception& err) {
        if (errorMessage) {
            std::ostringstream oss;
            oss << "Failed to load config '" << path << "': " << err.what();
            *errorMessage = oss.str();
        }
    }

    config = SimulationConfig{};
    configHash = "defaults";
    return false;
}

std::string SimulationContext::hashFileFNV1a(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return "missing";
    }
    std::uint64_t h = 1469598103934665603ull;
    constexpr std::uint64_t prime = 1099511628211ull;
    char buffer[4096];
    while (in.good()) {
        in.read(buffer, static_cast<std::streamsize>(sizeof(buffer)));
        const std::streamsize n = in.gcount();
        for (std::streamsize i = 0; i < n; ++i) {
            h ^= static_cast<std::uint8_t>(buffer[i]);
            h *= prime;
        }
    }
    std::ostringstream oss;
    oss << std::hex << h;
    return oss.str();
}

std::uint64_t SimulationContext::seedForSettlement(const std::string& settlementId) const {
    return mix64(worldSeed ^ (hashString(settlementId) * 0x9E3779B97F4A7C15ull) ^ 0xC0C0C0C0C0C0C0C0ull);
}

std::mt19937_64 SimulationContext::makeRng(std::uint64_t salt) const {
    return std::mt19937_64(mix64(worldSeed ^ salt));
}

std::uint64_t SimulationContext::hashString(const std::string& text) {
    std::uint64_t h = 1469598103934665603ull;
    for (unsigned char ch : text) {
        h ^= ch;
        h *= 1099511628211ull;
    }
    return h;
}

std::uint64_t SimulationContext::mix64(std::uint64_t x) {
    // SplitMix64 finalizer.
    x += 0x9E3779B97F4A7C15ull;
    x = (x ^ (x >> 30)) * 0xBF58476D1CE4E5B9ull;
    x = (x ^ (x >> 27)) * 0x94D049BB133111EBull;
    return x ^ (x >> 31);
}

double SimulationContext::u01FromU64(std::uint64_t x) {
    // 53 random bits to [0,1).
    const std::uint64_t mantissa = (x >> 11);
    return static_cast<double>(mantissa) * (1.0 / 9007199254740992.0);
}
