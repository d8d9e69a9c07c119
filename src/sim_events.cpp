#include "sim_events.h"

#include "sim_log.h"

#include <iomanip>
#include <sstream>
#include <type_traits>

namespace {

std::string jsonEscape(const std::string& input) {
    std::string out;
    out.reserve(input.size() + 16);
    for (char c : input) {
        switch (c) {
            case '\\': out += "\\\\"; break;
            case '"': out += "\\\""; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default: out.push_back(c); break;
        }
    }
    return out;
}

void writeAmounts(std::ostream& os, const char* key, const ResourceAmounts& a) {
    os << ",\"" << key << "\":{";
    bool first = true;
    for (Resource::Type type : Resource::kAllTypes) {
        os << (first ? "" : ",") << "\"" << Resource::name(type) << "\":" << a.get(type);
        first = false;
    }
    os << "}";
}

void writeFlags(std::ostream& os, const char* key, const NearCapacityFlags& f) {
    os << ",\"" << key << "\":{";
    bool first = true;
    for (Resource::Type type : Resource::kAllTypes) {
        os << (first ? "" : ",") << "\"" << Resource::name(type) << "\":" << (f.get(type) ? "true" : "false");
        first = false;
    }
    os << "}";
}

} // namespace

const char* simEventName(SimEventKind kind) {
    switch (kind) {
        case SimEventKind::ResourceUpdate: return "resource-update";
        case SimEventKind::ResourceWaste: return "resource-waste";
        case SimEventKind::StorageWarning: return "storage-warning";
        case SimEventKind::ResourceShortage: return "resource-shortage";
        case SimEventKind::PopulationGrowth: return "population-growth";
        case SimEventKind::PopulationWarning: return "population-warning";
        case SimEventKind::SettlerArrived: return "settler-arrived";
        case SimEventKind::PopulationState: return "population-state";
    }
    return "resource-update";
}

std::string eventToJson(const SimEvent& event) {
    std::ostringstream os;
    os << std::setprecision(10);
    os << "{\"world\":\"" << jsonEscape(event.worldId) << "\""
       << ",\"event\":\"" << simEventName(event.kind) << "\""
       << ",\"settlementId\":\"" << jsonEscape(event.settlementId) << "\""
       << ",\"timestamp\":" << event.timestampMs;

    std::visit([&os](const auto& p) {
        using T = std::decay_t<decltype(p)>;
        if constexpr (std::is_same_v<T, ResourceUpdatePayload>) {
            os << ",\"type\":\"" << jsonEscape(p.type) << "\"";
            writeAmounts(os, "resources", p.resources);
            writeAmounts(os, "production", p.production);
            writeAmounts(os, "consumption", p.consumption);
            writeAmounts(os, "netProduction", p.netProduction);
            os << ",\"population\":" << p.population;
        } else if constexpr (std::is_same_v<T, ResourceWastePayload>) {
            writeAmounts(os, "waste", p.waste);
            writeAmounts(os, "capacity", p.capacity);
        } else if constexpr (std::is_same_v<T, StorageWarningPayload>) {
            writeFlags(os, "nearCapacity", p.nearCapacity);
            writeAmounts(os, "resources", p.resources);
            writeAmounts(os, "capacity", p.capacity);
        } else if constexpr (std::is_same_v<T, ResourceShortagePayload>) {
            os << ",\"population\":" << p.population;
            writeAmounts(os, "resources", p.resources);
        } else if constexpr (std::is_same_v<T, PopulationGrowthPayload>) {
            os << ",\"oldPopulation\":" << p.oldPopulation
               << ",\"newPopulation\":" << p.newPopulation
               << ",\"happiness\":" << p.happiness
               << ",\"growthRate\":" << p.growthRate;
        } else if constexpr (std::is_same_v<T, PopulationWarningPayload>) {
            os << ",\"population\":" << p.population
               << ",\"happiness\":" << p.happiness
               << ",\"warningType\":\"" << populationWarningKindName(p.kind) << "\""
               << ",\"message\":\"" << jsonEscape(p.message) << "\"";
        } else if constexpr (std::is_same_v<T, SettlerArrivedPayload>) {
            os << ",\"population\":" << p.population
               << ",\"immigrantCount\":" << p.immigrantCount
               << ",\"happiness\":" << p.happiness;
        } else if constexpr (std::is_same_v<T, PopulationStatePayload>) {
            os << ",\"current\":" << p.current
               << ",\"capacity\":" << p.capacity
               << ",\"happiness\":" << p.happiness
               << ",\"happinessDescription\":\"" << jsonEscape(p.description) << "\""
               << ",\"growthRate\":" << p.growthRate
               << ",\"status\":\"" << populationStatusName(p.status) << "\"";
        }
    }, event.payload);

    os << "}";
    return os.str();
}

EventFeed::EventFeed(size_t capacity)
    : m_capacity(capacity > 0 ? capacity : 1) {
}

void EventFeed::publish(const SimEvent& event) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_events.push_back(event);
    ++m_totalPublished;
    while (m_events.size() > m_capacity) {
        m_events.pop_front();
    }
}

void EventFeed::clearEvents() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_events.clear();
}

std::vector<SimEvent> EventFeed::getEvents() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return std::vector<SimEvent>(m_events.begin(), m_events.end());
}

std::vector<SimEvent> EventFeed::eventsOfKind(SimEventKind kind) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<SimEvent> out;
    for (const SimEvent& e : m_events) {
        if (e.kind == kind) out.push_back(e);
    }
    return out;
}

std::vector<SimEvent> EventFeed::eventsFor(const std::string& settlementId) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<SimEvent> out;
    for (const SimEvent& e : m_events) {
        if (e.settlementId == settlementId) out.push_back(e);
    }
    return out;
}

size_t EventFeed::countOf(SimEventKind kind) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    size_t n = 0;
    for (const SimEvent& e : m_events) {
        if (e.kind == kind) ++n;
    }
    return n;
}

size_t EventFeed::totalPublished() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_totalPublished;
}

bool EventJournal::open(const std::string& path, std::string* errorMessage) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_out.open(path, std::ios::out | std::ios::trunc);
    if (!m_out) {
        if (errorMessage) *errorMessage = "Could not open event journal: " + path;
        return false;
    }
    m_lines = 0;
    return true;
}

bool EventJournal::isOpen() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_out.is_open();
}

void EventJournal::publish(const SimEvent& event) {
    const std::string line = eventToJson(event);
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_out.is_open()) return;
    m_out << line << '\n';
    if (!m_out) {
        logError("Events", "journal write failed after " + std::to_string(m_lines) + " lines");
        m_out.close();
        return;
    }
    ++m_lines;
}

void EventJournal::close() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_out.is_open()) {
        m_out.flush();
        m_out.close();
    }
}

size_t EventJournal::linesWritten() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_lines;
}

void EventFanout::attach(EventSink* sink) {
    if (sink) {
        m_sinks.push_back(sink);
    }
}

void EventFanout::publish(const SimEvent& event) {
    for (EventSink* sink : m_sinks) {
        sink->publish(event);
    }
}
