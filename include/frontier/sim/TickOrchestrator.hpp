#pragma once
// include/frontier/sim/TickOrchestrator.hpp
//
// The only time-driven entry point. tick(now):
//
//   1. step every unresolved disaster (damage needs each settlement's lock,
//      taken one at a time)
//   2. in parallel, for each settlement under its own lock:
//        construction queue -> staffing (if the structure set changed)
//        -> production/consumption -> population growth -> passive repair
//        -> arrived transfers
//      then commit; a failed commit restores that settlement's snapshot
//   3. hand all events to the publisher (non-blocking)

#include "frontier/jobs/JobSystem.hpp"
#include "frontier/sim/Boundary.hpp"
#include "frontier/sim/NotificationPublisher.hpp"
#include "frontier/sim/Rulebook.hpp"
#include "frontier/sim/World.hpp"

#include <cstddef>
#include <vector>

namespace frontier {

struct TickReport {
    TimestampMs now = 0;
    std::size_t settlements = 0;
    int constructionsCompleted = 0;
    int constructionsStarted = 0;
    int growthSteps = 0;
    int transfersDelivered = 0;
    int disasterTransitions = 0;
    int persistenceFailures = 0;
    ResourceAmounts netDelta{};     // summed over settlements
    EventList events;
};

class TickOrchestrator {
public:
    // `publisher` may be null.
    TickOrchestrator(World& world, const Rulebook& rules, jobs::JobSystem& jobs,
                     IPersistence& persistence, NotificationPublisher* publisher) noexcept
        : world_(world), rules_(rules), jobs_(jobs), persistence_(persistence), publisher_(publisher) {}

    TickReport tick(TimestampMs now);

    // Ticks at the configured interval from `from` (exclusive) through `to`.
    std::vector<TickReport> runUntil(TimestampMs from, TimestampMs to);

    // Operator hook: moves one disaster to its next phase immediately, with the
    // same side effects as a timed transition. DISASTER_NOT_FOUND / CONFLICT_STATE.
    Status forceAdvanceDisaster(DisasterId id, TimestampMs now);

private:
    struct SettlementOutcome {
        int completed = 0;
        int started = 0;
        int growth = 0;
        int delivered = 0;
        bool failed = false;
        ResourceAmounts net{};
        EventList events;
        std::vector<Transfer> undelivered;
    };

    int stepDisasters(TimestampMs now, EventList& events);
    SettlementOutcome tickSettlement(SettlementContext& ctx, TimestampMs now, std::vector<Transfer> arrivals);

    World& world_;
    const Rulebook& rules_;
    jobs::JobSystem& jobs_;
    IPersistence& persistence_;
    NotificationPublisher* publisher_;
};

} // namespace frontier
