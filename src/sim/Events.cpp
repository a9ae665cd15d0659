#include "frontier/sim/Events.hpp"

#include <algorithm>

namespace frontier {

const char* EventKindName(EventKind k) noexcept
{
    switch (k)
    {
    case EventKind::ConstructionStarted:        return "construction.started";
    case EventKind::ConstructionQueued:         return "construction.queued";
    case EventKind::ConstructionCancelled:      return "construction.cancelled";
    case EventKind::StructureBuilt:             return "structure.built";
    case EventKind::StructureUpgraded:          return "structure.upgraded";
    case EventKind::StructureDemolished:        return "structure.demolished";
    case EventKind::StructureRepaired:          return "structure.repaired";
    case EventKind::ResourcesCollected:         return "resources.collected";
    case EventKind::PopulationChanged:          return "population.changed";
    case EventKind::StaffingChanged:            return "staffing.changed";
    case EventKind::DisasterWarning:            return "disaster.warning";
    case EventKind::DisasterImminent:           return "disaster.imminent";
    case EventKind::DisasterImpactStart:        return "disaster.impact_start";
    case EventKind::DisasterStructureDamaged:   return "disaster.structure_damaged";
    case EventKind::DisasterStructureDestroyed: return "disaster.structure_destroyed";
    case EventKind::DisasterAftermath:          return "disaster.aftermath";
    case EventKind::DisasterResolved:           return "disaster.resolved";
    case EventKind::TransferInitiated:          return "transfer.initiated";
    case EventKind::TransferCompleted:          return "transfer.completed";
    case EventKind::SettlementFounded:          return "settlement.founded";
    }
    return "unknown";
}

const char* ScopeKindName(ScopeKind k) noexcept
{
    return k == ScopeKind::World ? "WORLD" : "SETTLEMENT";
}

std::size_t CountEvents(const EventList& events, EventKind kind) noexcept
{
    return static_cast<std::size_t>(
        std::count_if(events.begin(), events.end(), [kind](const Event& e) { return e.kind == kind; }));
}

void to_json(nlohmann::json& j, const Event& e)
{
    j = nlohmann::json{
        {"name", e.name()},
        {"scope", {{"kind", ScopeKindName(e.scope)}, {"id", e.scopeId}}},
        {"at", e.at},
        {"payload", e.payload},
    };
}

} // namespace frontier
