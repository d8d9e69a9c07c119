// resource.cpp
#include "resource.h"

#include <cmath>
#include <sstream>

const char* Resource::name(Type type) {
    switch (type) {
        case Type::FOOD: return "food";
        case Type::WATER: return "water";
        case Type::WOOD: return "wood";
        case Type::STONE: return "stone";
        case Type::ORE: return "ore";
    }
    return "food";
}

std::optional<Resource::Type> Resource::fromName(const std::string& name) {
    for (Type type : kAllTypes) {
        if (name == Resource::name(type)) {
            return type;
        }
    }
    return std::nullopt;
}

double ResourceAmounts::get(Resource::Type type) const {
    switch (type) {
        case Resource::Type::FOOD: return food;
        case Resource::Type::WATER: return water;
        case Resource::Type::WOOD: return wood;
        case Resource::Type::STONE: return stone;
        case Resource::Type::ORE: return ore;
    }
    return 0.0;
}

void ResourceAmounts::set(Resource::Type type, double amount) {
    switch (type) {
        case Resource::Type::FOOD: food = amount; break;
        case Resource::Type::WATER: water = amount; break;
        case Resource::Type::WOOD: wood = amount; break;
        case Resource::Type::STONE: stone = amount; break;
        case Resource::Type::ORE: ore = amount; break;
    }
}

void ResourceAmounts::add(Resource::Type type, double amount) {
    set(type, get(type) + amount);
}

bool ResourceAmounts::anyPositive() const {
    for (Resource::Type type : Resource::kAllTypes) {
        if (get(type) > 0.0) return true;
    }
    return false;
}

bool ResourceAmounts::allZero() const {
    for (Resource::Type type : Resource::kAllTypes) {
        if (get(type) != 0.0) return false;
    }
    return true;
}

ResourceAmounts ResourceAmounts::uniform(double amount) {
    ResourceAmounts out;
    for (Resource::Type type : Resource::kAllTypes) {
        out.set(type, amount);
    }
    return out;
}

bool NearCapacityFlags::get(Resource::Type type) const {
    switch (type) {
        case Resource::Type::FOOD: return food;
        case Resource::Type::WATER: return water;
        case Resource::Type::WOOD: return wood;
        case Resource::Type::STONE: return stone;
        case Resource::Type::ORE: return ore;
    }
    return false;
}

void NearCapacityFlags::set(Resource::Type type, bool value) {
    switch (type) {
        case Resource::Type::FOOD: food = value; break;
        case Resource::Type::WATER: water = value; break;
        case Resource::Type::WOOD: wood = value; break;
        case Resource::Type::STONE: stone = value; break;
        case Resource::Type::ORE: ore = value; break;
    }
}

bool NearCapacityFlags::any() const {
    return food || water || wood || stone || ore;
}

ResourceAmounts addResources(const ResourceAmounts& a, const ResourceAmounts& b) {
    ResourceAmounts out;
    for (Resource::Type type : Resource::kAllTypes) {
        out.set(type, a.get(type) + b.get(type));
    }
    return out;
}

ResourceAmounts subtractResources(const ResourceAmounts& a, const ResourceAmounts& b) {
    ResourceAmounts out;
    for (Resource::Type type : Resource::kAllTypes) {
        out.set(type, a.get(type) - b.get(type));
    }
    return out;
}

ResourceAmounts scaleResources(const ResourceAmounts& a, double factor) {
    ResourceAmounts out;
    for (Resource::Type type : Resource::kAllTypes) {
        out.set(type, a.get(type) * factor);
    }
    return out;
}

bool hasEnoughResources(const ResourceAmounts& stock, const ResourceAmounts& required) {
    for (Resource::Type type : Resource::kAllTypes) {
        if (stock.get(type) < required.get(type)) {
            return false;
        }
    }
    return true;
}

std::string formatResources(const ResourceAmounts& amounts) {
    std::ostringstream oss;
    oss << "Food: " << std::floor(amounts.food)
        << ", Water: " << std::floor(amounts.water)
        << ", Wood: " << std::floor(amounts.wood)
        << ", Stone: " << std::floor(amounts.stone)
        << ", Ore: " << std::floor(amounts.ore);
    return oss.str();
}
