#pragma once

#include "resource.h"

#include <cstdint>
#include <optional>
#include <string>

struct Settlement {
    std::string id;
    std::string ownerId;
    std::string worldId;
    std::string plotId;
    std::string storageId;
    std::string name = "Home Settlement";
};

struct SettlementStorage {
    std::string id;
    std::string settlementId;
    ResourceAmounts amounts;
};

struct Plot {
    std::string id;
    std::string biomeId;
    int area = 30;
    ResourceAmounts potential = ResourceAmounts::uniform(1.0); // base yield potential per resource
    double qualityMultiplier = 1.0;
};

struct Biome {
    std::string id;
    std::string name;
};

// Everything one coarse cycle needs about a settlement besides its structures.
// Any of the sub-records may be missing when the store is inconsistent.
struct SettlementDetail {
    std::optional<Settlement> settlement;
    std::optional<SettlementStorage> storage;
    std::optional<Plot> plot;
    std::optional<Biome> biome;
    double consumptionMultiplier = 1.0; // world template modifier

    bool complete() const { return settlement && storage && plot; }
};

// Externally persisted; only the population dynamics step writes it.
struct PopulationRecord {
    std::string settlementId;
    int current = 10;
    double happiness = 50.0;
    std::int64_t lastGrowthTimestampMs = 0;
};
