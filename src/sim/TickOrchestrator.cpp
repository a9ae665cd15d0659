#include "frontier/sim/TickOrchestrator.hpp"

#include "frontier/core/Log.hpp"
#include "frontier/core/Profiling.hpp"
#include "frontier/disaster/Repair.hpp"
#include "frontier/economy/Collection.hpp"
#include "frontier/population/Staffing.hpp"

#include <mutex>
#include <string>
#include <utility>

namespace frontier {

namespace {

struct SettlementJob {
    SettlementContext* ctx = nullptr;
    std::vector<Transfer> arrivals;
};

nlohmann::json StaffingPayload(const StaffingResult& r)
{
    int assigned = 0;
    for (const StaffingAssignment& a : r.assignments)
        assigned += a.assigned;
    return nlohmann::json{
        {"assigned", assigned},
        {"idle", r.idle},
        {"understaffed", r.understaffed},
    };
}

} // namespace

TickReport TickOrchestrator::tick(TimestampMs now)
{
    FRONTIER_TRACY_ZONE("TickOrchestrator::tick");

    TickReport report;
    report.now = now;
    report.disasterTransitions = stepDisasters(now, report.events);

    auto arrivals = world_.takeArrivedTransfers(now);

    std::vector<SettlementJob> jobs;
    for (SettlementContext* ctx : world_.contexts())
    {
        SettlementJob job;
        job.ctx = ctx;
        const auto it = arrivals.find(ctx->id);
        if (it != arrivals.end())
        {
            job.arrivals = std::move(it->second);
            arrivals.erase(it);
        }
        jobs.push_back(std::move(job));
    }

    // Destinations that are not (yet) in this world keep their caravans in flight.
    for (auto& [dest, pending] : arrivals)
        world_.restoreTransfers(pending);

    std::vector<SettlementOutcome> outcomes(jobs.size());
    jobs_.ParallelFor(jobs.begin(), jobs.end(), [&](SettlementJob& job) {
        const std::size_t index = static_cast<std::size_t>(&job - jobs.data());
        outcomes[index] = tickSettlement(*job.ctx, now, std::move(job.arrivals));
    });

    report.settlements = jobs.size();
    for (SettlementOutcome& o : outcomes)
    {
        if (o.failed)
        {
            ++report.persistenceFailures;
            if (!o.undelivered.empty())
                world_.restoreTransfers(o.undelivered);
            continue;
        }
        report.constructionsCompleted += o.completed;
        report.constructionsStarted += o.started;
        report.growthSteps += o.growth;
        report.transfersDelivered += o.delivered;
        report.netDelta += o.net;
        report.events.insert(report.events.end(), std::make_move_iterator(o.events.begin()),
                             std::make_move_iterator(o.events.end()));
    }

    if (publisher_ && !report.events.empty())
        publisher_->publish(report.events);

    logsys::get()->debug("Tick {}: {} settlements, {} built, {} events, {} commit failures", now,
                         report.settlements, report.constructionsCompleted, report.events.size(),
                         report.persistenceFailures);
    return report;
}

std::vector<TickReport> TickOrchestrator::runUntil(TimestampMs from, TimestampMs to)
{
    std::vector<TickReport> reports;
    const DurationMs interval = rules_.config.orchestratorInterval > 0 ? rules_.config.orchestratorInterval : 1000;
    for (TimestampMs t = from + interval; t <= to; t += interval)
        reports.push_back(tick(t));
    return reports;
}

Status TickOrchestrator::forceAdvanceDisaster(DisasterId id, TimestampMs now)
{
    EventList events;
    {
        std::lock_guard lock(world_.disasterMutex());
        DisasterEvent* e = world_.findDisaster(id);
        if (!e)
            return MakeError(ErrorCode::DisasterNotFound, "no disaster " + std::to_string(id));

        if (Status st = rules_.disasters.forceAdvance(*e, now, world_, events); !st)
            return st;

        UnitOfWork work;
        work.disasters.push_back(e);
        std::string error;
        if (!persistence_.commit(work, &error))
            logsys::get()->error("Disaster {} commit failed after forced advance: {}", id, error);

        logsys::get()->info("Disaster {} forced to {}", id, DisasterStatusName(e->status));
    }

    if (publisher_ && !events.empty())
        publisher_->publish(std::move(events));
    return Ok();
}

int TickOrchestrator::stepDisasters(TimestampMs now, EventList& events)
{
    FRONTIER_TRACY_ZONE("TickOrchestrator::stepDisasters");

    std::lock_guard lock(world_.disasterMutex());
    int transitions = 0;
    UnitOfWork work;

    for (DisasterEvent& e : world_.disasters())
    {
        if (e.status == DisasterStatus::Resolved)
            continue;

        const DisasterStatus before = e.status;
        const int ticksBefore = e.damageTicksApplied;
        transitions += rules_.disasters.advance(e, now, world_, events);
        if (e.status != before || e.damageTicksApplied != ticksBefore)
            work.disasters.push_back(&e);
    }

    if (!work.empty())
    {
        std::string error;
        if (!persistence_.commit(work, &error))
            logsys::get()->error("Disaster state commit failed at {}: {}", now, error);
    }
    return transitions;
}

TickOrchestrator::SettlementOutcome TickOrchestrator::tickSettlement(SettlementContext& ctx, TimestampMs now,
                                                                     std::vector<Transfer> arrivals)
{
    FRONTIER_TRACY_ZONE("TickOrchestrator::tickSettlement");

    SettlementOutcome out;
    std::lock_guard lock(ctx.mutex);
    Settlement& s = ctx.settlement;
    const Settlement snapshot = s;

    // Construction first so a building finished this tick produces this tick.
    const AdvanceResult advanced = rules_.queue.advance(s, now, world_.ids(), out.events);
    out.completed = static_cast<int>(advanced.completed.size());
    out.started = static_cast<int>(advanced.started.size());

    if (s.staffingDirty)
    {
        rules_.population.clampToCapacity(s);
        const StaffingResult staffing = ApplyStaffing(s, rules_.catalog);
        out.events.push_back(SettlementEvent(EventKind::StaffingChanged, s.id, now, StaffingPayload(staffing)));
    }

    const CollectionReport collected = CollectResources(s, rules_.catalog, rules_.config, now);
    out.net = collected.breakdown.net;

    if (rules_.population.maybeGrow(s, now, out.events))
        out.growth = 1;
    rules_.population.clampToCapacity(s);

    ApplyPassiveRepair(s, rules_.catalog, rules_.config, now);

    UnitOfWork work;
    for (const Transfer& t : arrivals)
    {
        ResourceAmounts cargo{};
        cargo[t.resource] = t.received;
        const CreditResult credited = s.storage.credit(cargo);
        out.events.push_back(SettlementEvent(EventKind::TransferCompleted, s.id, t.arrivesAt, {
            {"transfer", t},
            {"credited", credited.applied[t.resource]},
            {"wasted", credited.wasted[t.resource]},
        }));
        work.transfersClosed.push_back(t.id);
        ++out.delivered;
    }

    work.settlements.push_back(&s);
    std::string error;
    if (!persistence_.commit(work, &error))
    {
        s = snapshot;
        logsys::get()->error("Settlement {}: tick {} rolled back, commit failed: {}", s.id, now, error);
        SettlementOutcome failed;
        failed.failed = true;
        failed.undelivered = std::move(arrivals);
        return failed;
    }
    return out;
}

} // namespace frontier
