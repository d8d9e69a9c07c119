#include "structure.h"

#include <algorithm>
#include <cctype>
#include <unordered_map>

namespace {

std::string toUpperAscii(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char ch) {
        return static_cast<char>(std::toupper(ch));
    });
    std::replace(value.begin(), value.end(), ' ', '_');
    return value;
}

} // namespace

std::vector<Structure> foldStructureRows(const std::vector<StructureRow>& rows) {
    std::vector<Structure> out;
    std::unordered_map<std::string, size_t> indexById;
    out.reserve(rows.size());
    for (const StructureRow& row : rows) {
        auto it = indexById.find(row.structureId);
        if (it == indexById.end()) {
            Structure s;
            s.id = row.structureId;
            s.name = row.name;
            s.category = row.category;
            s.extractorType = row.extractorType;
            s.buildingType = row.buildingType;
            s.level = std::max(1, row.level);
            s.plotId = row.plotId;
            it = indexById.emplace(row.structureId, out.size()).first;
            out.push_back(std::move(s));
        }
        if (row.modifier) {
            out[it->second].modifiers.push_back(*row.modifier);
        }
    }
    return out;
}

bool isExtractor(const Structure& s) {
    return s.category == StructureCategory::Extractor && s.extractorType.has_value();
}

double averageExtractorLevel(const std::vector<Structure>& structures) {
    int count = 0;
    double total = 0.0;
    for (const Structure& s : structures) {
        if (!isExtractor(s)) continue;
        total += static_cast<double>(s.level);
        ++count;
    }
    return (count > 0) ? total / static_cast<double>(count) : 0.0;
}

int maxExtractorLevel(const std::vector<Structure>& structures) {
    int best = 0;
    for (const Structure& s : structures) {
        if (isExtractor(s)) best = std::max(best, s.level);
    }
    return best;
}

double sumModifier(const std::vector<Structure>& structures, const std::string& modifierName) {
    double total = 0.0;
    for (const Structure& s : structures) {
        for (const StructureModifier& m : s.modifiers) {
            if (m.name == modifierName) {
                total += m.value;
            }
        }
    }
    return total;
}

const char* extractorTypeName(ExtractorType type) {
    switch (type) {
        case ExtractorType::FARM: return "FARM";
        case ExtractorType::WELL: return "WELL";
        case ExtractorType::LUMBER_MILL: return "LUMBER_MILL";
        case ExtractorType::QUARRY: return "QUARRY";
        case ExtractorType::MINE: return "MINE";
        case ExtractorType::FISHING_DOCK: return "FISHING_DOCK";
        case ExtractorType::HUNTERS_LODGE: return "HUNTERS_LODGE";
        case ExtractorType::HERB_GARDEN: return "HERB_GARDEN";
    }
    return "FARM";
}

const char* buildingTypeName(BuildingType type) {
    switch (type) {
        case BuildingType::HOUSE: return "HOUSE";
        case BuildingType::STORAGE: return "STORAGE";
        case BuildingType::BARRACKS: return "BARRACKS";
        case BuildingType::WORKSHOP: return "WORKSHOP";
        case BuildingType::MARKETPLACE: return "MARKETPLACE";
        case BuildingType::TOWN_HALL: return "TOWN_HALL";
        case BuildingType::WALL: return "WALL";
    }
    return "HOUSE";
}

const char* structureCategoryName(StructureCategory category) {
    return (category == StructureCategory::Extractor) ? "EXTRACTOR" : "BUILDING";
}

std::optional<ExtractorType> parseExtractorType(const std::string& text) {
    const std::string key = toUpperAscii(text);
    static const std::unordered_map<std::string, ExtractorType> kByName = {
        {"FARM", ExtractorType::FARM},
        {"WELL", ExtractorType::WELL},
        {"LUMBER_MILL", ExtractorType::LUMBER_MILL},
        {"QUARRY", ExtractorType::QUARRY},
        {"MINE", ExtractorType::MINE},
        {"FISHING_DOCK", ExtractorType::FISHING_DOCK},
        {"HUNTERS_LODGE", ExtractorType::HUNTERS_LODGE},
        {"HERB_GARDEN", ExtractorType::HERB_GARDEN},
    };
    auto it = kByName.find(key);
    if (it == kByName.end()) return std::nullopt;
    return it->second;
}

std::optional<BuildingType> parseBuildingType(const std::string& text) {
    const std::string key = toUpperAscii(text);
    static const std::unordered_map<std::string, BuildingType> kByName = {
        {"HOUSE", BuildingType::HOUSE},
        {"STORAGE", BuildingType::STORAGE},
        {"BARRACKS", BuildingType::BARRACKS},
        {"WORKSHOP", BuildingType::WORKSHOP},
        {"MARKETPLACE", BuildingType::MARKETPLACE},
        {"TOWN_HALL", BuildingType::TOWN_HALL},
        {"WALL", BuildingType::WALL},
    };
    auto it = kByName.find(key);
    if (it == kByName.end()) return std::nullopt;
    return it->second;
}

std::optional<StructureCategory> parseStructureCategory(const std::string& text) {
    const std::string key = toUpperAscii(text);
    if (key == "EXTRACTOR") return StructureCategory::Extractor;
    if (key == "BUILDING") return StructureCategory::Building;
    return std::nullopt;
}
