#pragma once

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

// In-memory bookkeeping for one settlement under active simulation.
// Rebuilt from the store on (re)registration; never persisted.
struct SettlementSimState {
    std::string settlementId;
    std::string ownerId;
    std::string worldId;
    std::int64_t lastUpdateTick = 0;
};

// Membership set owned by one scheduler instance.
class SettlementRegistry {
public:
    // Returns false when the id was already registered (state left untouched).
    bool add(const std::string& settlementId,
             const std::string& ownerId,
             const std::string& worldId,
             std::int64_t currentTick);
    // Returns false when the id was not registered.
    bool remove(const std::string& settlementId);
    std::vector<std::string> removeOwnedBy(const std::string& ownerId);
    void clear();

    bool contains(const std::string& settlementId) const;
    std::optional<SettlementSimState> find(const std::string& settlementId) const;
    size_t size() const;

    // Copy of all entries in registration order.
    std::vector<SettlementSimState> snapshot() const;

    // Moves lastUpdateTick forward; never backwards. False when the id is gone.
    bool advance(const std::string& settlementId, std::int64_t tick);

    // Empty string when every entry is consistent.
    std::string validateInvariants() const;

private:
    mutable std::mutex m_mutex;
    std::vector<std::string> m_order;
    std::unordered_map<std::string, SettlementSimState> m_entries;
};
