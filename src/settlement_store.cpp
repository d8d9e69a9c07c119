#include "settlement_store.h"

#include "sim_log.h"

#include <algorithm>
#include <optional>
#include <sstream>
#include <string_view>

#include <toml++/toml.hpp>

void InMemorySettlementStore::putSettlement(const Settlement& settlement) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_settlements.count(settlement.id) == 0) {
        m_settlementOrder.push_back(settlement.id);
    }
    m_settlements[settlement.id] = settlement;
}

void InMemorySettlementStore::putStorage(const SettlementStorage& storage) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_storages[storage.id] = storage;
}

void InMemorySettlementStore::putPlot(const Plot& plot) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_plots[plot.id] = plot;
}

void InMemorySettlementStore::putBiome(const Biome& biome) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_biomes[biome.id] = biome;
}

void InMemorySettlementStore::putStructure(const std::string& settlementId, const Structure& structure) {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<Structure>& list = m_structures[settlementId];
    auto it = std::find_if(list.begin(), list.end(), [&](const Structure& s) { return s.id == structure.id; });
    if (it != list.end()) {
        *it = structure;
    } else {
        list.push_back(structure);
    }
}

void InMemorySettlementStore::putPopulation(const PopulationRecord& record) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_populations[record.settlementId] = record;
}

void InMemorySettlementStore::setWorldConsumptionMultiplier(const std::string& worldId, double multiplier) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_worldConsumption[worldId] = multiplier;
}

void InMemorySettlementStore::removeStorage(const std::string& storageId) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_storages.erase(storageId);
}

void InMemorySettlementStore::removePlot(const std::string& plotId) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_plots.erase(plotId);
}

void InMemorySettlementStore::setFetchFailure(const std::string& settlementId, bool failing) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (failing) {
        m_failing.insert(settlementId);
    } else {
        m_failing.erase(settlementId);
    }
}

std::optional<SettlementStorage> InMemorySettlementStore::storage(const std::string& storageId) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_storages.find(storageId);
    if (it == m_storages.end()) return std::nullopt;
    return it->second;
}

std::optional<PopulationRecord> InMemorySettlementStore::population(const std::string& settlementId) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_populations.find(settlementId);
    if (it == m_populations.end()) return std::nullopt;
    return it->second;
}

std::vector<std::string> InMemorySettlementStore::settlementIds() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_settlementOrder;
}

int InMemorySettlementStore::storageWriteCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_storageWrites;
}

int InMemorySettlementStore::populationWriteCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_populationWrites;
}

void InMemorySettlementStore::throwIfFailing(const std::string& settlementId) const {
    if (m_failing.count(settlementId) != 0) {
        throw StoreError("store unavailable for settlement " + settlementId);
    }
}

std::vector<std::string> InMemorySettlementStore::listPlayerSettlements(const std::string& playerId,
                                                                        const std::string& worldId) {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<std::string> out;
    for (const std::string& id : m_settlementOrder) {
        const Settlement& s = m_settlements.at(id);
        if (s.ownerId != playerId) continue;
        if (!worldId.empty() && s.worldId != worldId) continue;
        out.push_back(id);
    }
    return out;
}

std::optional<SettlementDetail> InMemorySettlementStore::fetchSettlementDetail(const std::string& settlementId) {
    std::lock_guard<std::mutex> lock(m_mutex);
    throwIfFailing(settlementId);
    auto sit = m_settlements.find(settlementId);
    if (sit == m_settlements.end()) return std::nullopt;

    SettlementDetail detail;
    detail.settlement = sit->second;
    auto stIt = m_storages.find(sit->second.storageId);
    if (stIt != m_storages.end()) {
        detail.storage = stIt->second;
    }
    auto pIt = m_plots.find(sit->second.plotId);
    if (pIt != m_plots.end()) {
        detail.plot = pIt->second;
        auto bIt = m_biomes.find(pIt->second.biomeId);
        if (bIt != m_biomes.end()) {
            detail.biome = bIt->second;
        }
    }
    auto wIt = m_worldConsumption.find(sit->second.worldId);
    if (wIt != m_worldConsumption.end()) {
        detail.consumptionMultiplier = wIt->second;
    }
    return detail;
}

std::vector<StructureRow> InMemorySettlementStore::fetchStructures(const std::string& settlementId) {
    std::lock_guard<std::mutex> lock(m_mutex);
    throwIfFailing(settlementId);
    std::vector<StructureRow> rows;
    auto it = m_structures.find(settlementId);
    if (it == m_structures.end()) return rows;

    for (const Structure& s : it->second) {
        StructureRow row;
        row.structureId = s.id;
        row.name = s.name;
        row.category = s.category;
        row.extractorType = s.extractorType;
        row.buildingType = s.buildingType;
        row.level = s.level;
        row.plotId = s.plotId;
        if (s.modifiers.empty()) {
            rows.push_back(row);
            continue;
        }
        for (const StructureModifier& m : s.modifiers) {
            row.modifier = m;
            rows.push_back(row);
        }
    }
    return rows;
}

std::optional<PopulationRecord> InMemorySettlementStore::fetchPopulation(const std::string& settlementId) {
    std::lock_guard<std::mutex> lock(m_mutex);
    throwIfFailing(settlementId);
    auto it = m_populations.find(settlementId);
    if (it == m_populations.end()) return std::nullopt;
    return it->second;
}

void InMemorySettlementStore::updatePopulation(const PopulationRecord& record) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_populations[record.settlementId] = record;
    ++m_populationWrites;
}

void InMemorySettlementStore::updateStorage(const std::string& storageId, const ResourceAmounts& amounts) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_storages.find(storageId);
    if (it == m_storages.end()) {
        throw StoreError("unknown storage " + storageId);
    }
    it->second.amounts = amounts;
    ++m_storageWrites;
}

namespace {

double numberOr(const toml::table& t, std::string_view key, double fallback) {
    if (const auto v = t[key].value<double>()) return *v;
    if (const auto vi = t[key].value<std::int64_t>()) return static_cast<double>(*vi);
    return fallback;
}

ResourceAmounts readAmounts(const toml::table* t, double fallback) {
    ResourceAmounts out = ResourceAmounts::uniform(fallback);
    if (!t) return out;
    for (Resource::Type type : Resource::kAllTypes) {
        out.set(type, numberOr(*t, Resource::name(type), fallback));
    }
    return out;
}

bool readStructure(const toml::table& t, const std::string& defaultPlot, Structure& out, std::string& error) {
    out.id = t["id"].value_or(std::string{});
    if (out.id.empty()) {
        error = "structure without id";
        return false;
    }
    out.name = t["name"].value_or(out.id);
    const auto category = parseStructureCategory(t["category"].value_or(std::string("BUILDING")));
    if (!category) {
        error = "structure " + out.id + " has unknown category";
        return false;
    }
    out.category = *category;
    if (out.category == StructureCategory::Extractor) {
        out.extractorType = parseExtractorType(t["extractor"].value_or(std::string{}));
        if (!out.extractorType) {
            error = "structure " + out.id + " has unknown extractor type";
            return false;
        }
        out.plotId = t["plot"].value_or(defaultPlot);
    } else if (const auto building = t["building"].value<std::string>()) {
        out.buildingType = parseBuildingType(*building);
        if (!out.buildingType) {
            error = "structure " + out.id + " has unknown building type";
            return false;
        }
    }
    out.level = std::max(1, static_cast<int>(t["level"].value_or(std::int64_t{1})));
    if (const toml::array* mods = t["modifiers"].as_array()) {
        for (const toml::node& node : *mods) {
            const toml::table* m = node.as_table();
            if (!m) continue;
            StructureModifier modifier;
            modifier.name = (*m)["name"].value_or(std::string{});
            modifier.value = numberOr(*m, "value", 0.0);
            if (!modifier.name.empty()) {
                out.modifiers.push_back(std::move(modifier));
            }
        }
    }
    return true;
}

} // namespace

bool loadWorldFixture(const std::string& path,
                      InMemorySettlementStore& store,
                      std::string* worldIdOut,
                      std::string* errorMessage) {
    auto fail = [&](const std::string& message) {
        if (errorMessage) *errorMessage = message;
        logError("World", message);
        return false;
    };

    try {
        const toml::table root = toml::parse_file(path);
        const std::string worldId = root["world"]["id"].value_or(std::string("world-1"));
        if (const auto mult = root["world"]["consumptionMultiplier"].value<double>()) {
            store.setWorldConsumptionMultiplier(worldId, *mult);
        }

        if (const toml::array* biomes = root["biomes"].as_array()) {
            for (const toml::node& node : *biomes) {
                const toml::table* t = node.as_table();
                if (!t) continue;
                Biome biome;
                biome.id = (*t)["id"].value_or(std::string{});
                biome.name = (*t)["name"].value_or(biome.id);
                if (biome.id.empty()) return fail("Biome without id in '" + path + "'");
                store.putBiome(biome);
            }
        }

        if (const toml::array* plots = root["plots"].as_array()) {
            for (const toml::node& node : *plots) {
                const toml::table* t = node.as_table();
                if (!t) continue;
                Plot plot;
                plot.id = (*t)["id"].value_or(std::string{});
                if (plot.id.empty()) return fail("Plot without id in '" + path + "'");
                plot.biomeId = (*t)["biome"].value_or(std::string{});
                plot.area = static_cast<int>((*t)["area"].value_or(std::int64_t{30}));
                plot.qualityMultiplier = numberOr(*t, "qualityMultiplier", 1.0);
                plot.potential = readAmounts((*t)["potential"].as_table(), 1.0);
                store.putPlot(plot);
            }
        }

        int settlementCount = 0;
        if (const toml::array* settlements = root["settlements"].as_array()) {
            for (const toml::node& node : *settlements) {
                const toml::table* t = node.as_table();
                if (!t) continue;
                Settlement s;
                s.id = (*t)["id"].value_or(std::string{});
                if (s.id.empty()) return fail("Settlement without id in '" + path + "'");
                s.ownerId = (*t)["owner"].value_or(std::string{});
                s.worldId = worldId;
                s.plotId = (*t)["plot"].value_or(std::string{});
                s.storageId = (*t)["storage"].value_or("storage-" + s.id);
                s.name = (*t)["name"].value_or(s.name);
                store.putSettlement(s);

                SettlementStorage storage;
                storage.id = s.storageId;
                storage.settlementId = s.id;
                storage.amounts = readAmounts((*t)["resources"].as_table(), 0.0);
                store.putStorage(storage);

                if (const auto pop = (*t)["population"].value<std::int64_t>()) {
                    PopulationRecord record;
                    record.settlementId = s.id;
                    record.current = static_cast<int>(*pop);
                    record.happiness = numberOr(*t, "happiness", 50.0);
                    store.putPopulation(record);
                }

                if (const toml::array* structures = (*t)["structures"].as_array()) {
                    for (const toml::node& sNode : *structures) {
                        const toml::table* st = sNode.as_table();
                        if (!st) continue;
                        Structure structure;
                        std::string error;
                        if (!readStructure(*st, s.plotId, structure, error)) {
                            return fail("Invalid structure in '" + path + "': " + error);
                        }
                        store.putStructure(s.id, structure);
                    }
                }
                ++settlementCount;
            }
        }

        if (worldIdOut) *worldIdOut = worldId;
        logInfo("World", "loaded " + std::to_string(settlementCount) + " settlements from " + path + " world=" + worldId);
        return true;
    } catch (const toml::parse_error& err) {
        std::ostringstream oss;
        oss << "Failed to parse world '" << path << "': " << err.description();
        return fail(oss.str());
    } catch (const std::exception& e) {
        return fail("Failed to load world '" + path + "': " + e.what());
    }
}
