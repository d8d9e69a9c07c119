#pragma once

#include "population_model.h"
#include "resource.h"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <fstream>
#include <mutex>
#include <string>
#include <variant>
#include <vector>

enum class SimEventKind {
    ResourceUpdate,
    ResourceWaste,
    StorageWarning,
    ResourceShortage,
    PopulationGrowth,
    PopulationWarning,
    SettlerArrived,
    PopulationState
};

struct ResourceUpdatePayload {
    std::string type = "auto-production";
    ResourceAmounts resources;
    ResourceAmounts production;
    ResourceAmounts consumption;
    ResourceAmounts netProduction;
    int population = 0;
};

struct ResourceWastePayload {
    ResourceAmounts waste;
    StorageCapacity capacity;
};

struct StorageWarningPayload {
    NearCapacityFlags nearCapacity;
    ResourceAmounts resources;
    StorageCapacity capacity;
};

struct ResourceShortagePayload {
    int population = 0;
    ResourceAmounts resources;
};

struct PopulationGrowthPayload {
    int oldPopulation = 0;
    int newPopulation = 0;
    double happiness = 0.0;
    double growthRate = 0.0;
};

struct PopulationWarningPayload {
    int population = 0;
    double happiness = 0.0;
    PopulationWarningKind kind = PopulationWarningKind::LowHappiness;
    std::string message;
};

struct SettlerArrivedPayload {
    int population = 0;
    int immigrantCount = 0;
    double happiness = 0.0;
};

struct PopulationStatePayload {
    int current = 0;
    int capacity = 0;
    double happiness = 0.0;
    std::string description;
    double growthRate = 0.0;
    PopulationStatus status = PopulationStatus::Stable;
};

using SimEventPayload = std::variant<ResourceUpdatePayload,
                                     ResourceWastePayload,
                                     StorageWarningPayload,
                                     ResourceShortagePayload,
                                     PopulationGrowthPayload,
                                     PopulationWarningPayload,
                                     SettlerArrivedPayload,
                                     PopulationStatePayload>;

struct SimEvent {
    SimEventKind kind = SimEventKind::ResourceUpdate;
    std::string worldId;        // broadcast room
    std::string settlementId;
    std::int64_t timestampMs = 0;
    SimEventPayload payload;
};

// Wire name, e.g. "resource-update".
const char* simEventName(SimEventKind kind);
std::string eventToJson(const SimEvent& event);

// Broadcast surface. publish() may be called from several batch members at once.
class EventSink {
public:
    virtual ~EventSink() = default;
    virtual void publish(const SimEvent& event) = 0;
};

// Keeps the most recent events in memory.
class EventFeed : public EventSink {
public:
    explicit EventFeed(size_t capacity = 64);

    void publish(const SimEvent& event) override;
    void clearEvents();

    std::vector<SimEvent> getEvents() const;
    std::vector<SimEvent> eventsOfKind(SimEventKind kind) const;
    std::vector<SimEvent> eventsFor(const std::string& settlementId) const;
    size_t countOf(SimEventKind kind) const;
    size_t totalPublished() const;
    size_t capacity() const { return m_capacity; }

private:
    mutable std::mutex m_mutex;
    size_t m_capacity;
    size_t m_totalPublished = 0;
    std::deque<SimEvent> m_events;
};

// One JSON object per line.
class EventJournal : public EventSink {
public:
    EventJournal() = default;

    bool open(const std::string& path, std::string* errorMessage = nullptr);
    bool isOpen() const;
    // Flushes and closes; later events are dropped.
    void close();
    void publish(const SimEvent& event) override;
    size_t linesWritten() const;

private:
    mutable std::mutex m_mutex;
    std::ofstream m_out;
    size_t m_lines = 0;
};

// Forwards every event to each attached sink in attach order.
class EventFanout : public EventSink {
public:
    void attach(EventSink* sink);
    void publish(const SimEvent& event) override;

private:
    std::vector<EventSink*> m_sinks;
};
