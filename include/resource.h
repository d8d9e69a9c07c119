// resource.h
#pragma once

#include <array>
#include <optional>
#include <string>

class Resource {
public:
    enum class Type {
        FOOD = 0,
        WATER = 1,
        WOOD = 2,
        STONE = 3,
        ORE = 4
    };

    static constexpr int kTypeCount = 5;
    static constexpr std::array<Type, kTypeCount> kAllTypes = {
        Type::FOOD,
        Type::WATER,
        Type::WOOD,
        Type::STONE,
        Type::ORE
    };

    // Lowercase wire name ("food", "water", ...).
    static const char* name(Type type);
    static std::optional<Type> fromName(const std::string& name);
};

// Amount per resource type. Used for stock, production, consumption, net and waste.
struct ResourceAmounts {
    double food = 0.0;
    double water = 0.0;
    double wood = 0.0;
    double stone = 0.0;
    double ore = 0.0;

    double get(Resource::Type type) const;
    void set(Resource::Type type, double amount);
    void add(Resource::Type type, double amount);

    bool anyPositive() const;
    bool allZero() const;

    static ResourceAmounts uniform(double amount);
};

// Per-resource ceiling derived from built structures.
using StorageCapacity = ResourceAmounts;

struct NearCapacityFlags {
    bool food = false;
    bool water = false;
    bool wood = false;
    bool stone = false;
    bool ore = false;

    bool get(Resource::Type type) const;
    void set(Resource::Type type, bool value);
    bool any() const;
};

ResourceAmounts addResources(const ResourceAmounts& a, const ResourceAmounts& b);
// Signed difference. Callers that need a floor clamp afterwards.
ResourceAmounts subtractResources(const ResourceAmounts& a, const ResourceAmounts& b);
ResourceAmounts scaleResources(const ResourceAmounts& a, double factor);
bool hasEnoughResources(const ResourceAmounts& stock, const ResourceAmounts& required);

std::string formatResources(const ResourceAmounts& amounts);
