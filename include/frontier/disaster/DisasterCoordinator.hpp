#pragma once
// include/frontier/disaster/DisasterCoordinator.hpp
//
// Drives one DisasterEvent through its phases:
//
//   SCHEDULED -> WARNING     at scheduledAt - warningDuration
//   WARNING   -> IMPACT      at scheduledAt       ("imminent" fires once inside the threshold)
//   IMPACT    -> AFTERMATH   at impactStartedAt + impactDuration
//   AFTERMATH -> RESOLVED    at aftermathStartedAt + aftermathDuration
//
// advance() performs every transition that is due, in order, so a long gap
// between calls never skips a phase. During IMPACT, damage ticks hit a seeded
// subset of structures in affected settlements; health only goes down.
// Casualties accumulate on the event and reach PopulationRecord in one
// decrement on entry to AFTERMATH.

#include "frontier/catalog/Catalog.hpp"
#include "frontier/core/Config.hpp"
#include "frontier/core/Error.hpp"
#include "frontier/disaster/Disaster.hpp"
#include "frontier/population/PopulationEngine.hpp"
#include "frontier/settlement/Settlement.hpp"
#include "frontier/sim/Events.hpp"

#include <functional>
#include <vector>

namespace frontier {

// Gives the coordinator exclusive access to each settlement of a world in turn
// (the implementation holds that settlement's lock for the callback).
class ISettlementDirectory {
public:
    virtual ~ISettlementDirectory() = default;
    virtual void forEachSettlement(WorldId world, const std::function<void(Settlement&)>& fn) = 0;
};

struct DamageOrder {
    StructureId structure = 0;
    double amount = 0.0;
};

struct DamageApplied {
    int damaged = 0;
    int destroyed = 0;
    int skipped = 0;        // target gone or already destroyed
    double total = 0.0;
};

class DisasterCoordinator {
public:
    DisasterCoordinator(const SimConfig& cfg, const ICatalog& catalog, const PopulationEngine& population) noexcept
        : cfg_(cfg), catalog_(catalog), population_(population) {}

    // Returns the number of phase transitions performed.
    int advance(DisasterEvent& e, TimestampMs now, ISettlementDirectory& dir, EventList& events) const;

    // Operator/test hook: enter the next phase now, with the same side effects.
    Status forceAdvance(DisasterEvent& e, TimestampMs now, ISettlementDirectory& dir, EventList& events) const;

    // Which structures one damage tick hits in `s`, and how hard.
    [[nodiscard]] std::vector<DamageOrder> planDamage(const DisasterEvent& e, const Settlement& s, int damageTick) const;

    // Best-effort: orders for missing/destroyed structures are skipped silently.
    // Records the damage on the event's exposure for `s`.
    DamageApplied applyDamage(DisasterEvent& e, Settlement& s, const std::vector<DamageOrder>& orders,
                              TimestampMs now, EventList& events) const;

    [[nodiscard]] double casualtiesPerTick(const DisasterEvent& e, const Settlement& s) const;

private:
    void enterWarning(DisasterEvent& e, TimestampMs now, EventList& events) const;
    void maybeImminent(DisasterEvent& e, TimestampMs now, EventList& events) const;
    void enterImpact(DisasterEvent& e, TimestampMs now, ISettlementDirectory& dir, EventList& events) const;
    void applyDueDamage(DisasterEvent& e, int targetTicks, TimestampMs now, ISettlementDirectory& dir,
                        EventList& events) const;
    void enterAftermath(DisasterEvent& e, TimestampMs now, ISettlementDirectory& dir, EventList& events) const;
    void enterResolved(DisasterEvent& e, TimestampMs now, ISettlementDirectory& dir, EventList& events) const;

    [[nodiscard]] bool affects(const DisasterEvent& e, const Settlement& s) const;

    const SimConfig& cfg_;
    const ICatalog& catalog_;
    const PopulationEngine& population_;
};

} // namespace frontier
