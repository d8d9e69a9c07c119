#include "settlement_registry.h"

#include <algorithm>
#include <sstream>
#include <unordered_set>

bool SettlementRegistry::add(const std::string& settlementId,
                             const std::string& ownerId,
                             const std::string& worldId,
                             std::int64_t currentTick) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_entries.count(settlementId) != 0) {
        return false;
    }
    SettlementSimState state;
    state.settlementId = settlementId;
    state.ownerId = ownerId;
    state.worldId = worldId;
    state.lastUpdateTick = currentTick;
    m_entries.emplace(settlementId, std::move(state));
    m_order.push_back(settlementId);
    return true;
}

bool SettlementRegistry::remove(const std::string& settlementId) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_entries.erase(settlementId) == 0) {
        return false;
    }
    m_order.erase(std::remove(m_order.begin(), m_order.end(), settlementId), m_order.end());
    return true;
}

std::vector<std::string> SettlementRegistry::removeOwnedBy(const std::string& ownerId) {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<std::string> removed;
    for (const std::string& id : m_order) {
        auto it = m_entries.find(id);
        if (it != m_entries.end() && it->second.ownerId == ownerId) {
            removed.push_back(id);
        }
    }
    for (const std::string& id : removed) {
        m_entries.erase(id);
    }
    m_order.erase(std::remove_if(m_order.begin(), m_order.end(), [&](const std::string& id) {
                      return m_entries.count(id) == 0;
                  }),
                  m_order.end());
    return removed;
}

void SettlementRegistry::clear() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_entries.clear();
    m_order.clear();
}

bool SettlementRegistry::contains(const std::string& settlementId) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_entries.count(settlementId) != 0;
}

std::optional<SettlementSimState> SettlementRegistry::find(const std::string& settlementId) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_entries.find(settlementId);
    if (it == m_entries.end()) return std::nullopt;
    return it->second;
}

size_t SettlementRegistry::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_entries.size();
}

std::vector<SettlementSimState> SettlementRegistry::snapshot() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<SettlementSimState> out;
    out.reserve(m_order.size());
    for (const std::string& id : m_order) {
        auto it = m_entries.find(id);
        if (it != m_entries.end()) {
            out.push_back(it->second);
        }
    }
    return out;
}

bool SettlementRegistry::advance(const std::string& settlementId, std::int64_t tick) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_entries.find(settlementId);
    if (it == m_entries.end()) return false;
    it->second.lastUpdateTick = std::max(it->second.lastUpdateTick, tick);
    return true;
}

std::string SettlementRegistry::validateInvariants() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::ostringstream oss;
    if (m_order.size() != m_entries.size()) {
        oss << "order/entry size mismatch " << m_order.size() << " vs " << m_entries.size() << "; ";
    }
    std::unordered_set<std::string> seen;
    for (const std::string& id : m_order) {
        if (!seen.insert(id).second) {
            oss << "duplicate id " << id << "; ";
        }
        auto it = m_entries.find(id);
        if (it == m_entries.end()) {
            oss << "ordered id without entry " << id << "; ";
            continue;
        }
        if (it->second.settlementId != id) {
            oss << "entry key mismatch " << id << "; ";
        }
        if (it->second.lastUpdateTick < 0) {
            oss << "negative lastUpdateTick for " << id << "; ";
        }
    }
    return oss.str();
}
