#pragma once

#include "resource.h"
#include "settlement_records.h"
#include "structure.h"

#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

class StoreError : public std::runtime_error {
public:
    explicit StoreError(const std::string& message) : std::runtime_error(message) {}
};

// Narrow query/update surface of the persistence layer.
// Implementations may throw std::runtime_error (or StoreError) on backend failure.
// Calls can arrive concurrently from members of the same batch.
class SettlementStore {
public:
    virtual ~SettlementStore() = default;

    // Settlement ids owned by the player; an empty worldId matches every world.
    virtual std::vector<std::string> listPlayerSettlements(const std::string& playerId,
                                                           const std::string& worldId) = 0;
    virtual std::optional<SettlementDetail> fetchSettlementDetail(const std::string& settlementId) = 0;
    // One row per (structure, modifier); structures without modifiers appear once.
    virtual std::vector<StructureRow> fetchStructures(const std::string& settlementId) = 0;
    virtual std::optional<PopulationRecord> fetchPopulation(const std::string& settlementId) = 0;
    virtual void updatePopulation(const PopulationRecord& record) = 0;
    virtual void updateStorage(const std::string& storageId, const ResourceAmounts& amounts) = 0;
};

class InMemorySettlementStore : public SettlementStore {
public:
    InMemorySettlementStore() = default;

    void putSettlement(const Settlement& settlement);
    void putStorage(const SettlementStorage& storage);
    void putPlot(const Plot& plot);
    void putBiome(const Biome& biome);
    void putStructure(const std::string& settlementId, const Structure& structure);
    void putPopulation(const PopulationRecord& record);
    void setWorldConsumptionMultiplier(const std::string& worldId, double multiplier);

    void removeStorage(const std::string& storageId);
    void removePlot(const std::string& plotId);

    // Subsequent fetches for this settlement throw StoreError until cleared.
    void setFetchFailure(const std::string& settlementId, bool failing);

    std::optional<SettlementStorage> storage(const std::string& storageId) const;
    std::optional<PopulationRecord> population(const std::string& settlementId) const;
    std::vector<std::string> settlementIds() const;
    int storageWriteCount() const;
    int populationWriteCount() const;

    std::vector<std::string> listPlayerSettlements(const std::string& playerId,
                                                   const std::string& worldId) override;
    std::optional<SettlementDetail> fetchSettlementDetail(const std::string& settlementId) override;
    std::vector<StructureRow> fetchStructures(const std::string& settlementId) override;
    std::optional<PopulationRecord> fetchPopulation(const std::string& settlementId) override;
    void updatePopulation(const PopulationRecord& record) override;
    void updateStorage(const std::string& storageId, const ResourceAmounts& amounts) override;

private:
    void throwIfFailing(const std::string& settlementId) const;

    mutable std::mutex m_mutex;
    std::vector<std::string> m_settlementOrder;
    std::unordered_map<std::string, Settlement> m_settlements;
    std::unordered_map<std::string, SettlementStorage> m_storages;
    std::unordered_map<std::string, Plot> m_plots;
    std::unordered_map<std::string, Biome> m_biomes;
    std::unordered_map<std::string, std::vector<Structure>> m_structures;
    std::unordered_map<std::string, PopulationRecord> m_populations;
    std::unordered_map<std::string, double> m_worldConsumption;
    std::unordered_set<std::string> m_failing;
    int m_storageWrites = 0;
    int m_populationWrites = 0;
};

// Fills the store from a TOML world fixture (biomes, plots, settlements with
// resources, population and structures). Returns false with a message on failure.
bool loadWorldFixture(const std::string& path,
                      InMemorySettlementStore& store,
                      std::string* worldIdOut = nullptr,
                      std::string* errorMessage = nullptr);
