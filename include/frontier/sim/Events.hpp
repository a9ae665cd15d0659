#pragma once
// include/frontier/sim/Events.hpp
//
// Events the core returns for publishing. Engines append to an EventList; the
// caller hands the list to NotificationPublisher after the state change has
// been committed. Nothing in the core talks to a transport directly.

#include "frontier/core/Ids.hpp"
#include "frontier/core/Time.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace frontier {

enum class EventKind : std::uint8_t {
    ConstructionStarted = 0,
    ConstructionQueued,
    ConstructionCancelled,
    StructureBuilt,
    StructureUpgraded,
    StructureDemolished,
    StructureRepaired,
    ResourcesCollected,
    PopulationChanged,
    StaffingChanged,
    DisasterWarning,
    DisasterImminent,
    DisasterImpactStart,
    DisasterStructureDamaged,
    DisasterStructureDestroyed,
    DisasterAftermath,
    DisasterResolved,
    TransferInitiated,
    TransferCompleted,
    SettlementFounded,
};

enum class ScopeKind : std::uint8_t {
    Settlement = 0,
    World,
};

[[nodiscard]] const char* EventKindName(EventKind k) noexcept;  // "construction.started"
[[nodiscard]] const char* ScopeKindName(ScopeKind k) noexcept;  // "SETTLEMENT"

struct Event {
    EventKind kind = EventKind::ConstructionStarted;
    ScopeKind scope = ScopeKind::Settlement;
    std::uint64_t scopeId = 0;
    TimestampMs at = 0;
    nlohmann::json payload = nlohmann::json::object();

    [[nodiscard]] const char* name() const noexcept { return EventKindName(kind); }
};

using EventList = std::vector<Event>;

[[nodiscard]] inline Event SettlementEvent(EventKind kind, SettlementId id, TimestampMs at,
                                           nlohmann::json payload = nlohmann::json::object()) {
    return Event{kind, ScopeKind::Settlement, id, at, std::move(payload)};
}

[[nodiscard]] inline Event WorldEvent(EventKind kind, WorldId id, TimestampMs at,
                                      nlohmann::json payload = nlohmann::json::object()) {
    return Event{kind, ScopeKind::World, id, at, std::move(payload)};
}

[[nodiscard]] std::size_t CountEvents(const EventList& events, EventKind kind) noexcept;

// {"name": ..., "scope": {"kind": ..., "id": ...}, "at": ..., "payload": {...}}
void to_json(nlohmann::json& j, const Event& e);

} // namespace frontier
