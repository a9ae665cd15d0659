#include "frontier/sim/CommandService.hpp"

#include "frontier/core/Log.hpp"
#include "frontier/disaster/Repair.hpp"

#include <algorithm>
#include <optional>
#include <utility>

namespace frontier {

namespace {
    const ResourceAmounts kStartingResources = ResourceAmounts::Of(50.0, 100.0, 50.0, 30.0, 10.0);
    constexpr int kStartingPopulation = 10;
    constexpr double kStartingHappiness = 50.0;
}

// ---------------------------------------------------------------------------
// Unit-of-work plumbing
// ---------------------------------------------------------------------------

template <class T>
Result<T> CommandService::mutate(const PlayerId& actor, SettlementId settlement, const Mutation<T>& fn)
{
    SettlementContext* ctx = world_.find(settlement);
    if (!ctx)
        return MakeError(ErrorCode::SettlementNotFound, "settlement " + std::to_string(settlement) + " not found");

    std::lock_guard lock(ctx->mutex);
    if (ctx->settlement.owner != actor)
        return MakeError(ErrorCode::NotSettlementOwner, "settlement " + std::to_string(settlement) + " is not yours");
    return mutateLocked<T>(*ctx, fn);
}

template <class T>
Result<T> CommandService::mutateLocked(SettlementContext& ctx, const Mutation<T>& fn)
{
    Settlement snapshot = ctx.settlement;
    EventList events;
    UnitOfWork work;

    Result<T> result = fn(ctx.settlement, events, work);
    if (!result)
    {
        ctx.settlement = std::move(snapshot);
        return result;
    }

    work.settlements.push_back(&ctx.settlement);
    std::string error;
    if (!persistence_.commit(work, &error))
    {
        ctx.settlement = std::move(snapshot);
        logsys::get()->error("Settlement {}: commit failed, command rolled back: {}", ctx.id, error);
        return MakeError(ErrorCode::PersistenceFailed, "could not persist change: " + error);
    }

    publish(std::move(events));
    return result;
}

void CommandService::publish(EventList events)
{
    if (publisher_ && !events.empty())
        publisher_->publish(std::move(events));
}

// ---------------------------------------------------------------------------
// Commands
// ---------------------------------------------------------------------------

Result<SettlementId> CommandService::foundSettlement(const FoundSettlementRequest& req, TimestampMs now)
{
    if (req.owner.empty())
        return MakeError(ErrorCode::InvalidArgument, "owner is required");
    if (req.name.empty())
        return MakeError(ErrorCode::InvalidArgument, "settlement name is required");
    if (req.homeTile.slotCount < 1)
        return MakeError(ErrorCode::InvalidSlot, "home tile needs at least one slot");

    IdAllocator& ids = world_.ids();
    Settlement s;
    s.id = ids.next();
    s.worldId = world_.id();
    s.owner = req.owner;
    s.name = req.name;
    s.x = req.x;
    s.y = req.y;

    s.tiles.push_back(req.homeTile);
    s.tiles.insert(s.tiles.end(), req.extraTiles.begin(), req.extraTiles.end());
    for (Tile& t : s.tiles)
    {
        if (t.id == 0)
            t.id = ids.next();
    }

    s.storage = ResourceLedger(kStartingResources);
    RefreshStorageCapacity(s, rules_.catalog, rules_.config.baseStorageCapacity);
    s.population.count = kStartingPopulation;
    s.population.happiness = kStartingHappiness;
    s.population.lastGrowthAt = now;
    s.foundedAt = now;
    s.lastCollectedAt = now;
    s.lastPassiveRepairAt = now;

    UnitOfWork work;
    work.settlements.push_back(&s);
    std::string error;
    if (!persistence_.commit(work, &error))
    {
        logsys::get()->error("Founding '{}' for {} failed: {}", req.name, req.owner, error);
        return MakeError(ErrorCode::PersistenceFailed, "could not persist settlement: " + error);
    }

    const SettlementId sid = s.id;
    EventList events;
    events.push_back(SettlementEvent(EventKind::SettlementFounded, sid, now, {
        {"owner", s.owner},
        {"name", s.name},
        {"x", s.x},
        {"y", s.y},
        {"biome", s.tiles.front().biome},
    }));
    world_.addSettlement(std::move(s));
    logsys::get()->info("Settlement {} '{}' founded by {}", sid, req.name, req.owner);

    publish(std::move(events));
    return sid;
}

Result<ConstructionQueueItem> CommandService::submitConstruction(const PlayerId& actor, SettlementId settlement,
                                                                 const BuildRequest& req, TimestampMs now)
{
    return mutate<ConstructionQueueItem>(actor, settlement, [&](Settlement& s, EventList& events, UnitOfWork&) {
        return rules_.queue.submit(s, req, now, world_.ids(), events);
    });
}

Result<ConstructionQueueItem> CommandService::submitUpgrade(const PlayerId& actor, SettlementId settlement,
                                                            StructureId structure, bool emergency, TimestampMs now)
{
    return mutate<ConstructionQueueItem>(actor, settlement, [&](Settlement& s, EventList& events, UnitOfWork&) {
        return rules_.queue.submitUpgrade(s, structure, emergency, now, world_.ids(), events);
    });
}

Status CommandService::cancelConstruction(const PlayerId& actor, QueueItemId item, TimestampMs now)
{
    std::optional<Status> result;
    const bool found = world_.withQueueItemOwner(item, [&](SettlementContext& ctx) {
        if (ctx.settlement.owner != actor)
        {
            result = MakeError(ErrorCode::NotSettlementOwner, "queue item belongs to another player");
            return;
        }
        result = mutateLocked<std::monostate>(ctx, [&](Settlement& s, EventList& events, UnitOfWork&) {
            return rules_.queue.cancel(s, item, now, events);
        });
    });

    if (!found || !result)
        return MakeError(ErrorCode::QueueItemNotFound, "queue item " + std::to_string(item) + " not found");
    return std::move(*result);
}

Result<ResourceAmounts> CommandService::demolishStructure(const PlayerId& actor, SettlementId settlement,
                                                          StructureId structure, TimestampMs now)
{
    return mutate<ResourceAmounts>(actor, settlement,
                                   [&](Settlement& s, EventList& events, UnitOfWork&) -> Result<ResourceAmounts> {
        const auto it = std::find_if(s.structures.begin(), s.structures.end(),
                                     [structure](const Structure& st) { return st.id == structure; });
        if (it == s.structures.end())
            return MakeError(ErrorCode::StructureNotFound, "structure " + std::to_string(structure) + " not found");

        const bool upgrading = std::any_of(s.queue.begin(), s.queue.end(), [structure](const ConstructionQueueItem& q) {
            return q.upgradeOf == structure && !q.isTerminal();
        });
        if (upgrading)
            return MakeError(ErrorCode::ConflictState, "structure has an upgrade in the queue");

        ResourceAmounts refund{};
        if (const StructureDefinition* def = rules_.catalog.findStructure(it->key))
            refund = Floor(def->cost * rules_.config.demolishRefundFactor);
        const CreditResult credited = s.storage.credit(refund);

        nlohmann::json payload{
            {"structureId", it->id},
            {"structureKey", it->key},
            {"level", it->level},
            {"refund", credited.applied},
            {"wasted", credited.wasted},
        };
        const std::string key = it->key;
        s.structures.erase(it);
        s.staffingDirty = true;
        RefreshStorageCapacity(s, rules_.catalog, rules_.config.baseStorageCapacity);

        events.push_back(SettlementEvent(EventKind::StructureDemolished, s.id, now, std::move(payload)));
        logsys::get()->info("Settlement {}: {} #{} demolished", s.id, key, structure);
        return credited.applied;
    });
}

Result<RepairReceipt> CommandService::repairStructure(const PlayerId& actor, SettlementId settlement,
                                                      StructureId structure, TimestampMs now)
{
    return mutate<RepairReceipt>(actor, settlement,
                                 [&](Settlement& s, EventList& events, UnitOfWork&) -> Result<RepairReceipt> {
        Structure* st = s.findStructure(structure);
        if (!st)
            return MakeError(ErrorCode::StructureNotFound, "structure " + std::to_string(structure) + " not found");
        if (st->health >= 100.0)
            return MakeError(ErrorCode::NothingToRepair, "structure is at full health");

        const StructureDefinition* def = rules_.catalog.findStructure(st->key);
        if (!def)
            return MakeError(ErrorCode::UnknownStructureType, "no definition for " + st->key);

        RepairReceipt receipt;
        receipt.structure = st->id;
        receipt.healthBefore = st->health;
        receipt.discount = ActiveRepairDiscount(s, now);
        receipt.cost = RepairCost(*def, st->health, RepairMultiplierFor(s, now), receipt.discount);

        Status paid = s.storage.debit(receipt.cost);
        if (!paid)
            return paid.error();

        const bool revived = st->destroyed;
        st->health = 100.0;
        st->destroyed = false;
        if (revived)
        {
            s.staffingDirty = true;
            RefreshStorageCapacity(s, rules_.catalog, rules_.config.baseStorageCapacity);
        }

        events.push_back(SettlementEvent(EventKind::StructureRepaired, s.id, now, {
            {"structureId", st->id},
            {"structureKey", st->key},
            {"healthBefore", receipt.healthBefore},
            {"cost", receipt.cost},
            {"discount", receipt.discount},
            {"revived", revived},
        }));
        return receipt;
    });
}

Result<CollectionReport> CommandService::collectResources(const PlayerId& actor, SettlementId settlement,
                                                          TimestampMs now)
{
    return mutate<CollectionReport>(actor, settlement,
                                    [&](Settlement& s, EventList& events, UnitOfWork&) -> Result<CollectionReport> {
        CollectionReport report = CollectResources(s, rules_.catalog, rules_.config, now);
        if (report.ticks > 0)
        {
            events.push_back(SettlementEvent(EventKind::ResourcesCollected, s.id, now, {
                {"ticks", report.ticks},
                {"production", report.breakdown.production},
                {"consumption", report.breakdown.consumption},
                {"net", report.breakdown.net},
                {"wasted", report.applied.wasted},
                {"unmet", report.applied.unmet},
                {"collectedThrough", report.collectedThrough},
            }));
        }
        return report;
    });
}

Result<Transfer> CommandService::initiateTransfer(const PlayerId& actor, SettlementId from, SettlementId to,
                                                  ResourceType resource, double amount, TimestampMs now)
{
    if (!(amount > 0.0))
        return MakeError(ErrorCode::InvalidAmount, "transfer amount must be positive");
    if (from == to)
        return MakeError(ErrorCode::SameSettlement, "cannot transfer to the same settlement");

    SettlementContext* dest = world_.find(to);
    if (!dest)
        return MakeError(ErrorCode::SettlementNotFound, "settlement " + std::to_string(to) + " not found");

    // Read what the quote needs, then release: only one settlement lock at a time.
    double toX = 0.0;
    double toY = 0.0;
    bool destUnderImpact = false;
    {
        std::lock_guard lock(dest->mutex);
        toX = dest->settlement.x;
        toY = dest->settlement.y;
        destUnderImpact = dest->settlement.underImpact();
    }

    Result<Transfer> result = mutate<Transfer>(actor, from,
                                               [&](Settlement& s, EventList& events, UnitOfWork& work) -> Result<Transfer> {
        const TransferQuote quote = QuoteTransfer(s.x, s.y, toX, toY, amount, destUnderImpact, rules_.config);

        ResourceAmounts cost{};
        cost[resource] = amount;
        Status paid = s.storage.debit(cost);
        if (!paid)
            return paid.error();

        Transfer t;
        t.id = world_.ids().next();
        t.from = from;
        t.to = to;
        t.resource = resource;
        t.amount = amount;
        t.received = quote.received;
        t.lossPercent = quote.lossPercent;
        t.sentAt = now;
        t.arrivesAt = now + quote.travelTime;
        work.transfersOpened.push_back(t);

        events.push_back(SettlementEvent(EventKind::TransferInitiated, s.id, now, {
            {"transfer", t},
            {"distance", quote.distance},
        }));
        return t;
    });

    if (result)
    {
        world_.addTransfer(result.value());
        logsys::get()->info("Transfer {}: {} {} from {} to {}, arrives at {}", result.value().id, amount,
                            ResourceTypeName(resource), from, to, result.value().arrivesAt);
    }
    return result;
}

} // namespace frontier
