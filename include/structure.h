#pragma once

#include "resource.h"

#include <optional>
#include <string>
#include <vector>

enum class StructureCategory {
    Building,
    Extractor
};

enum class ExtractorType {
    FARM,
    WELL,
    LUMBER_MILL,
    QUARRY,
    MINE,
    FISHING_DOCK,
    HUNTERS_LODGE,
    HERB_GARDEN
};

enum class BuildingType {
    HOUSE,
    STORAGE,
    BARRACKS,
    WORKSHOP,
    MARKETPLACE,
    TOWN_HALL,
    WALL
};

struct StructureModifier {
    std::string name;
    double value = 0.0;
};

// Read-only snapshot of one built structure, taken once per wave.
struct Structure {
    std::string id;
    std::string name;
    StructureCategory category = StructureCategory::Building;
    std::optional<ExtractorType> extractorType;
    std::optional<BuildingType> buildingType;
    int level = 1;
    std::string plotId; // extractors only; empty when unlinked
    std::vector<StructureModifier> modifiers;
};

// One row of the structure/modifier join as the store returns it.
// A structure with N modifiers appears N times; one without modifiers appears once.
struct StructureRow {
    std::string structureId;
    std::string name;
    StructureCategory category = StructureCategory::Building;
    std::optional<ExtractorType> extractorType;
    std::optional<BuildingType> buildingType;
    int level = 1;
    std::string plotId;
    std::optional<StructureModifier> modifier;
};

namespace modifier_names {
constexpr const char* kPopulationCapacity = "population_capacity";
constexpr const char* kPopulationCapacityLegacy = "Population Capacity";
constexpr const char* kStorageCapacity = "storage_capacity";
constexpr const char* kMoraleBoost = "morale_boost";
constexpr const char* kMoraleBoostLegacy = "Morale Boost";
} // namespace modifier_names

// Folds joined rows into one Structure per instance, keeping first-seen order.
std::vector<Structure> foldStructureRows(const std::vector<StructureRow>& rows);

bool isExtractor(const Structure& s);
double averageExtractorLevel(const std::vector<Structure>& structures);
int maxExtractorLevel(const std::vector<Structure>& structures);

// Sum of all modifier values whose name matches exactly.
double sumModifier(const std::vector<Structure>& structures, const std::string& modifierName);

const char* extractorTypeName(ExtractorType type);
const char* buildingTypeName(BuildingType type);
const char* structureCategoryName(StructureCategory category);
std::optional<ExtractorType> parseExtractorType(const std::string& text);
std::optional<BuildingType> parseBuildingType(const std::string& text);
std::optional<StructureCategory> parseStructureCategory(const std::string& text);
