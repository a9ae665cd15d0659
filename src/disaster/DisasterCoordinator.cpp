#include "frontier/disaster/DisasterCoordinator.hpp"

#include "frontier/core/Log.hpp"
#include "frontier/core/Rng.hpp"
#include "frontier/disaster/Repair.hpp"

#include <algorithm>
#include <cmath>

namespace frontier {

namespace {

nlohmann::json Header(const DisasterEvent& e)
{
    return nlohmann::json{
        {"disasterId", e.id},
        {"type", DisasterTypeName(e.type)},
        {"severity", e.severity},
        {"tier", SeverityTierName(e.tier())},
    };
}

void LogTransition(const DisasterEvent& e, TimestampMs at)
{
    logsys::get()->info("Disaster {} ({}, severity {:.0f}) -> {} at {}", e.id, DisasterTypeName(e.type), e.severity,
                        DisasterStatusName(e.status), at);
}

} // namespace

// ---------------------------------------------------------------------------
// Phase driver
// ---------------------------------------------------------------------------

int DisasterCoordinator::advance(DisasterEvent& e, TimestampMs now, ISettlementDirectory& dir, EventList& events) const
{
    int transitions = 0;
    for (;;)
    {
        switch (e.status)
        {
        case DisasterStatus::Scheduled:
        {
            const TimestampMs due = e.scheduledAt - e.warningDuration;
            if (now < due)
                return transitions;
            enterWarning(e, due, events);
            break;
        }
        case DisasterStatus::Warning:
            maybeImminent(e, now, events);
            if (now < e.scheduledAt)
                return transitions;
            enterImpact(e, e.scheduledAt, dir, events);
            break;
        case DisasterStatus::Impact:
        {
            const TimestampMs end = e.impactStartedAt + e.impactDuration;
            if (now < end)
            {
                const DurationMs interval = std::max<DurationMs>(1, cfg_.damageInterval);
                const int due = static_cast<int>(std::min<DurationMs>(e.totalDamageTicks(cfg_),
                                                                      (now - e.impactStartedAt) / interval));
                applyDueDamage(e, due, now, dir, events);
                return transitions;
            }
            applyDueDamage(e, e.totalDamageTicks(cfg_), end, dir, events);
            enterAftermath(e, end, dir, events);
            break;
        }
        case DisasterStatus::Aftermath:
        {
            const TimestampMs due = e.aftermathStartedAt + cfg_.aftermathDuration;
            if (now < due)
                return transitions;
            enterResolved(e, due, dir, events);
            break;
        }
        case DisasterStatus::Resolved:
            return transitions;
        }
        ++transitions;
    }
}

Status DisasterCoordinator::forceAdvance(DisasterEvent& e, TimestampMs now, ISettlementDirectory& dir,
                                         EventList& events) const
{
    switch (e.status)
    {
    case DisasterStatus::Scheduled:
        enterWarning(e, now, events);
        break;
    case DisasterStatus::Warning:
        if (!e.imminentSent)
        {
            e.imminentSent = true;
            nlohmann::json payload = Header(e);
            payload["timeToImpactMs"] = 0;
            events.push_back(WorldEvent(EventKind::DisasterImminent, e.worldId, now, std::move(payload)));
        }
        enterImpact(e, now, dir, events);
        break;
    case DisasterStatus::Impact:
        applyDueDamage(e, e.totalDamageTicks(cfg_), now, dir, events);
        enterAftermath(e, now, dir, events);
        break;
    case DisasterStatus::Aftermath:
        enterResolved(e, now, dir, events);
        break;
    case DisasterStatus::Resolved:
        return MakeError(ErrorCode::ConflictState, "disaster is already resolved");
    }
    return Ok();
}

// ---------------------------------------------------------------------------
// Phase entry
// ---------------------------------------------------------------------------

void DisasterCoordinator::enterWarning(DisasterEvent& e, TimestampMs at, EventList& events) const
{
    e.status = DisasterStatus::Warning;
    e.warningStartedAt = at;
    LogTransition(e, at);

    nlohmann::json payload = Header(e);
    payload["scheduledAt"] = e.scheduledAt;
    payload["timeToImpactMs"] = std::max<TimestampMs>(0, e.scheduledAt - at);
    payload["affectedBiomes"] = e.affectedBiomes;
    payload["affectedRegions"] = e.affectedRegions;
    events.push_back(WorldEvent(EventKind::DisasterWarning, e.worldId, at, std::move(payload)));
}

void DisasterCoordinator::maybeImminent(DisasterEvent& e, TimestampMs now, EventList& events) const
{
    if (e.imminentSent || e.scheduledAt - now > cfg_.imminentThreshold)
        return;

    e.imminentSent = true;
    const TimestampMs at = std::max(e.warningStartedAt, e.scheduledAt - cfg_.imminentThreshold);
    nlohmann::json payload = Header(e);
    payload["timeToImpactMs"] = e.scheduledAt - at;
    events.push_back(WorldEvent(EventKind::DisasterImminent, e.worldId, at, std::move(payload)));
}

void DisasterCoordinator::enterImpact(DisasterEvent& e, TimestampMs at, ISettlementDirectory& dir,
                                      EventList& events) const
{
    e.status = DisasterStatus::Impact;
    e.impactStartedAt = at;
    e.damageTicksApplied = 0;

    const DisasterTraits& traits = TraitsOf(e.type);
    dir.forEachSettlement(e.worldId, [&](Settlement& s) {
        if (!affects(e, s))
            return;
        s.activeDisaster = e.id;
        s.impacts[e.id] = traits.productionPenalty;
        e.exposure[s.id];
    });

    LogTransition(e, at);
    nlohmann::json payload = Header(e);
    payload["impactDuration"] = e.impactDuration;
    payload["settlementsAffected"] = e.exposure.size();
    events.push_back(WorldEvent(EventKind::DisasterImpactStart, e.worldId, at, std::move(payload)));
}

void DisasterCoordinator::enterAftermath(DisasterEvent& e, TimestampMs at, ISettlementDirectory& dir,
                                         EventList& events) const
{
    e.status = DisasterStatus::Aftermath;
    e.aftermathStartedAt = at;

    const double multiplier = TraitsOf(e.type).repairMultiplier;
    DisasterSummary summary;

    dir.forEachSettlement(e.worldId, [&](Settlement& s) {
        const auto it = e.exposure.find(s.id);
        if (it == e.exposure.end())
            return;
        const SettlementExposure& x = it->second;

        const int lost = population_.applyCasualties(s, static_cast<int>(std::floor(x.casualties)), at);
        s.impacts.erase(e.id);
        s.lastRepairMultiplier = multiplier;
        s.repairWindow = RepairWindow{e.id, at + cfg_.repairWindow, cfg_.repairDiscount, multiplier};

        summary.totalDamage += x.damageDealt;
        summary.structuresDamaged += static_cast<int>(x.damaged.size());
        summary.structuresDestroyed += static_cast<int>(x.destroyed.size());
        summary.casualties += lost;
        summary.estimatedRepairCost += EstimateRepairCost(s, catalog_, multiplier);
        summary.settlementsAffected += 1;
    });

    e.summary = summary;
    LogTransition(e, at);
    logsys::get()->info("Disaster {} summary: damage {:.1f}, {} damaged, {} destroyed, {} casualties", e.id,
                        summary.totalDamage, summary.structuresDamaged, summary.structuresDestroyed,
                        summary.casualties);

    nlohmann::json payload = Header(e);
    payload["summary"] = summary;
    payload["repairWindowClosesAt"] = at + cfg_.repairWindow;
    payload["repairDiscount"] = cfg_.repairDiscount;
    events.push_back(WorldEvent(EventKind::DisasterAftermath, e.worldId, at, std::move(payload)));
}

void DisasterCoordinator::enterResolved(DisasterEvent& e, TimestampMs at, ISettlementDirectory& dir,
                                        EventList& events) const
{
    e.status = DisasterStatus::Resolved;
    e.resolvedAt = at;

    const double gain = ResilienceGain(e.tier());
    dir.forEachSettlement(e.worldId, [&](Settlement& s) {
        if (!e.exposure.contains(s.id))
            return;
        s.resilience = std::min(100.0, s.resilience + gain);
        if (s.activeDisaster == e.id)
        {
            // Hand over to an overlapping event that is still hitting the settlement.
            if (s.impacts.empty())
                s.activeDisaster.reset();
            else
                s.activeDisaster = s.impacts.rbegin()->first;
        }
    });
    e.exposure.clear();

    LogTransition(e, at);
    nlohmann::json payload = Header(e);
    payload["resilienceGain"] = gain;
    events.push_back(WorldEvent(EventKind::DisasterResolved, e.worldId, at, std::move(payload)));
}

// ---------------------------------------------------------------------------
// Damage
// ---------------------------------------------------------------------------

bool DisasterCoordinator::affects(const DisasterEvent& e, const Settlement& s) const
{
    if (s.tiles.empty())
        return e.affects({}, {});
    return std::any_of(s.tiles.begin(), s.tiles.end(),
                       [&e](const Tile& t) { return e.affects(t.biome, t.region); });
}

std::vector<DamageOrder> DisasterCoordinator::planDamage(const DisasterEvent& e, const Settlement& s,
                                                         int damageTick) const
{
    std::vector<DamageOrder> orders;
    const double preparedness = DisasterPreparedness(s, catalog_, cfg_);
    const double base = e.severity - preparedness;
    const double ticks = static_cast<double>(e.totalDamageTicks(cfg_));

    rng::Pcg32 rng = rng::make_rng(rng::derive(cfg_.seed, e.id), s.id, static_cast<std::uint64_t>(damageTick));
    for (const Structure& st : s.structures)
    {
        if (st.destroyed)
            continue;
        // Both rolls are drawn for every structure so the stream stays aligned.
        const bool hit = rng.chance(cfg_.damageTargetChance);
        const double spread = 1.0 + (rng.next_double01() * 2.0 - 1.0) * cfg_.damageVariance;
        if (!hit)
            continue;
        const double amount = std::clamp(base * spread, 0.0, 100.0) / ticks;
        if (amount > 0.0)
            orders.push_back(DamageOrder{st.id, amount});
    }
    return orders;
}

DamageApplied DisasterCoordinator::applyDamage(DisasterEvent& e, Settlement& s, const std::vector<DamageOrder>& orders,
                                               TimestampMs now, EventList& events) const
{
    DamageApplied out;
    SettlementExposure& x = e.exposure[s.id];

    for (const DamageOrder& order : orders)
    {
        Structure* st = s.findStructure(order.structure);
        if (!st || st->destroyed || order.amount <= 0.0)
        {
            ++out.skipped;
            continue;
        }

        const double before = st->health;
        st->health = std::max(0.0, before - order.amount);
        const double dealt = before - st->health;
        out.total += dealt;
        x.damageDealt += dealt;
        x.damaged.insert(st->id);

        nlohmann::json payload{
            {"disasterId", e.id},
            {"structureId", st->id},
            {"structureKey", st->key},
            {"damage", dealt},
            {"health", st->health},
        };

        if (st->health <= 0.0)
        {
            st->health = 0.0;
            st->destroyed = true;
            x.destroyed.insert(st->id);
            ++out.destroyed;
            events.push_back(SettlementEvent(EventKind::DisasterStructureDestroyed, s.id, now, std::move(payload)));
        }
        else
        {
            ++out.damaged;
            events.push_back(SettlementEvent(EventKind::DisasterStructureDamaged, s.id, now, std::move(payload)));
        }
    }

    if (out.destroyed > 0)
    {
        s.staffingDirty = true;
        RefreshStorageCapacity(s, catalog_, cfg_.baseStorageCapacity);
        logsys::get()->info("Disaster {}: {} structure(s) destroyed in settlement {}", e.id, out.destroyed, s.id);
    }
    return out;
}

double DisasterCoordinator::casualtiesPerTick(const DisasterEvent& e, const Settlement& s) const
{
    const int pop = s.population.count;
    const int sheltered = std::min(pop, ShelterCapacity(s, catalog_, cfg_.shelterCapacityPerLevel));
    const double unsheltered = static_cast<double>(pop - sheltered);
    return unsheltered * (e.severity / 100.0) * TraitsOf(e.type).casualtyMultiplier /
           static_cast<double>(e.totalDamageTicks(cfg_));
}

void DisasterCoordinator::applyDueDamage(DisasterEvent& e, int targetTicks, TimestampMs now, ISettlementDirectory& dir,
                                         EventList& events) const
{
    const int from = e.damageTicksApplied;
    if (targetTicks <= from)
        return;

    const TimestampMs end = e.impactStartedAt + e.impactDuration;
    dir.forEachSettlement(e.worldId, [&](Settlement& s) {
        if (!e.exposure.contains(s.id))
            return;
        for (int tick = from + 1; tick <= targetTicks; ++tick)
        {
            const TimestampMs at = std::min({e.impactStartedAt + tick * cfg_.damageInterval, end, now});
            applyDamage(e, s, planDamage(e, s, tick), at, events);
            e.exposure[s.id].casualties += casualtiesPerTick(e, s);
        }
    });
    e.damageTicksApplied = targetTicks;
}

} // namespace frontier
