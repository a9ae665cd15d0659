#include "frontier/construction/ConstructionQueue.hpp"

#include "frontier/core/Log.hpp"

#include <algorithm>
#include <cmath>
#include <string>

namespace frontier {

namespace {

nlohmann::json ItemPayload(const ConstructionQueueItem& q)
{
    nlohmann::json j{
        {"itemId", q.id},
        {"structureKey", q.structureKey},
        {"status", QueueStatusName(q.status)},
        {"position", q.position},
        {"targetLevel", q.targetLevel},
        {"emergency", q.emergency},
        {"deducted", q.deducted},
    };
    if (q.status == QueueStatus::InProgress)
    {
        j["startedAt"] = q.startedAt;
        j["completesAt"] = q.completesAt;
    }
    if (q.upgradeOf)
        j["upgradeOf"] = *q.upgradeOf;
    if (q.tileId && q.slot)
    {
        j["tileId"] = *q.tileId;
        j["slot"] = *q.slot;
    }
    return j;
}

} // namespace

int ConstructionQueue::ActiveCount(const Settlement& s) noexcept
{
    return static_cast<int>(std::count_if(s.queue.begin(), s.queue.end(), [](const ConstructionQueueItem& q) {
        return q.status == QueueStatus::InProgress;
    }));
}

int ConstructionQueue::PendingCount(const Settlement& s) noexcept
{
    return static_cast<int>(std::count_if(s.queue.begin(), s.queue.end(),
                                          [](const ConstructionQueueItem& q) { return !q.isTerminal(); }));
}

bool ConstructionQueue::PositionsDense(const Settlement& s)
{
    std::vector<int> positions;
    for (const ConstructionQueueItem& q : s.queue)
    {
        if (!q.isTerminal())
            positions.push_back(q.position);
    }
    std::sort(positions.begin(), positions.end());
    for (std::size_t i = 0; i < positions.size(); ++i)
    {
        if (positions[i] != static_cast<int>(i))
            return false;
    }
    return true;
}

ResourceAmounts ConstructionQueue::costFor(const StructureDefinition& def, int targetLevel, bool emergency) const noexcept
{
    ResourceAmounts cost = def.cost * static_cast<double>(std::max(1, targetLevel));
    if (emergency)
    {
        cost *= cfg_.emergencyCostFactor;
        for (double& x : cost.v)
            x = std::ceil(x);
    }
    return cost;
}

DurationMs ConstructionQueue::durationFor(const StructureDefinition& def, int targetLevel, bool emergency) const noexcept
{
    double ms = static_cast<double>(def.buildTime) * std::max(1, targetLevel);
    if (emergency)
        ms *= cfg_.emergencyTimeFactor;
    return static_cast<DurationMs>(std::llround(ms));
}

Status ConstructionQueue::checkPrerequisites(const Settlement& s, const StructureDefinition& def) const
{
    std::vector<MissingPrerequisite> missing;
    for (const Prerequisite& p : def.prerequisites)
    {
        if (!p.researchKey.empty())
        {
            if (!s.research.contains(p.researchKey))
                missing.push_back({{}, 0, 0, p.researchKey});
            continue;
        }
        const int have = s.structureLevel(p.structureKey);
        if (have < p.level)
            missing.push_back({p.structureKey, p.level, have, {}});
    }

    if (missing.empty())
        return Ok();

    CommandError e = MakeError(ErrorCode::PrerequisitesNotMet, def.name + " prerequisites not met");
    e.missing = std::move(missing);
    return e;
}

Status ConstructionQueue::checkSlot(const Settlement& s, const BuildRequest& req) const
{
    if (!req.tileId)
        return MakeError(ErrorCode::MissingTile, "Extractors need a tile");
    if (!req.slot)
        return MakeError(ErrorCode::MissingSlot, "Extractors need a slot position");

    const Tile* tile = s.findTile(*req.tileId);
    if (!tile)
        return MakeError(ErrorCode::TileNotOwned, "Tile " + std::to_string(*req.tileId) + " is not part of this settlement");
    if (*req.slot < 0 || *req.slot >= tile->slotCount)
    {
        return MakeError(ErrorCode::InvalidSlot,
                         "Slot " + std::to_string(*req.slot) + " out of range 0.." + std::to_string(tile->slotCount - 1));
    }

    // Destroyed extractors keep their slot until demolished.
    for (const Structure& st : s.structures)
    {
        if (st.tileId == req.tileId && st.slot == req.slot)
            return MakeError(ErrorCode::SlotOccupied, "Slot " + std::to_string(*req.slot) + " is occupied");
    }
    for (const ConstructionQueueItem& q : s.queue)
    {
        if (!q.isTerminal() && q.tileId == req.tileId && q.slot == req.slot)
            return MakeError(ErrorCode::SlotReserved, "Slot " + std::to_string(*req.slot) + " is reserved by queue item " + std::to_string(q.id));
    }
    return Ok();
}

Status ConstructionQueue::checkCapacity(const Settlement& s) const
{
    if (PendingCount(s) >= cfg_.queueMaxItems)
        return MakeError(ErrorCode::QueueFull, "Construction queue is full (" + std::to_string(cfg_.queueMaxItems) + " items)");
    return Ok();
}

Result<ConstructionQueueItem> ConstructionQueue::submit(Settlement& s, const BuildRequest& req, TimestampMs now,
                                                        IdAllocator& ids, EventList& events) const
{
    const StructureDefinition* def = catalog_.findStructure(req.structureKey);
    if (!def)
        return MakeError(ErrorCode::UnknownStructureType, "Unknown structure type " + req.structureKey);

    if (def->populationRequirement > s.population.count)
    {
        return MakeError(ErrorCode::PopulationTooLow,
                         def->name + " needs a population of " + std::to_string(def->populationRequirement));
    }

    if (Status st = checkPrerequisites(s, *def); !st)
        return st.error();

    if (def->isExtractor())
    {
        if (Status st = checkSlot(s, req); !st)
            return st.error();
    }
    else if (Status st = area_.validate(s, *def); !st)
    {
        return st.error();
    }

    if (Status st = checkCapacity(s); !st)
        return st.error();

    const ResourceAmounts cost = costFor(*def, 1, req.emergency);
    if (Status st = s.storage.debit(cost); !st)
        return st.error();

    ConstructionQueueItem item;
    item.id = ids.next();
    item.settlementId = s.id;
    item.structureKey = def->key;
    item.targetLevel = 1;
    item.deducted = cost;
    item.emergency = req.emergency;
    item.queuedAt = now;
    item.duration = durationFor(*def, 1, req.emergency);
    if (def->isExtractor())
    {
        item.tileId = req.tileId;
        item.slot = req.slot;
    }
    return enqueue(s, std::move(item), now, events);
}

Result<ConstructionQueueItem> ConstructionQueue::submitUpgrade(Settlement& s, StructureId target, bool emergency,
                                                               TimestampMs now, IdAllocator& ids, EventList& events) const
{
    const Structure* st = s.findStructure(target);
    if (!st)
        return MakeError(ErrorCode::StructureNotFound, "Structure " + std::to_string(target) + " not found");
    if (st->destroyed)
        return MakeError(ErrorCode::ConflictState, "Destroyed structures must be repaired before upgrading");

    const StructureDefinition* def = catalog_.findStructure(st->key);
    if (!def)
        return MakeError(ErrorCode::UnknownStructureType, "Unknown structure type " + st->key);

    for (const ConstructionQueueItem& q : s.queue)
    {
        if (!q.isTerminal() && q.upgradeOf == target)
            return MakeError(ErrorCode::UpgradeInProgress, def->name + " already has an upgrade queued");
    }

    const int targetLevel = st->level + 1;
    if (def->maxLevel > 0 && targetLevel > def->maxLevel)
        return MakeError(ErrorCode::MaxLevelReached, def->name + " is at its maximum level " + std::to_string(def->maxLevel));

    if (Status chk = checkCapacity(s); !chk)
        return chk.error();

    const ResourceAmounts cost = costFor(*def, targetLevel, emergency);
    if (Status debit = s.storage.debit(cost); !debit)
        return debit.error();

    ConstructionQueueItem item;
    item.id = ids.next();
    item.settlementId = s.id;
    item.structureKey = def->key;
    item.upgradeOf = target;
    item.targetLevel = targetLevel;
    item.deducted = cost;
    item.emergency = emergency;
    item.queuedAt = now;
    item.duration = durationFor(*def, targetLevel, emergency);
    return enqueue(s, std::move(item), now, events);
}

Result<ConstructionQueueItem> ConstructionQueue::enqueue(Settlement& s, ConstructionQueueItem item, TimestampMs now,
                                                         EventList& events) const
{
    item.position = PendingCount(s);
    if (ActiveCount(s) < cfg_.queueConcurrency)
    {
        start(item, now);
        events.push_back(SettlementEvent(EventKind::ConstructionStarted, s.id, now, ItemPayload(item)));
    }
    else
    {
        item.status = QueueStatus::Queued;
        events.push_back(SettlementEvent(EventKind::ConstructionQueued, s.id, now, ItemPayload(item)));
    }
    s.queue.push_back(item);
    return item;
}

void ConstructionQueue::start(ConstructionQueueItem& item, TimestampMs now) const
{
    item.status = QueueStatus::InProgress;
    item.startedAt = now;
    item.completesAt = now + item.duration;
}

Status ConstructionQueue::cancel(Settlement& s, QueueItemId itemId, TimestampMs now, EventList& events) const
{
    const auto it = std::find_if(s.queue.begin(), s.queue.end(),
                                 [itemId](const ConstructionQueueItem& q) { return q.id == itemId; });
    if (it == s.queue.end())
        return MakeError(ErrorCode::QueueItemNotFound, "Queue item " + std::to_string(itemId) + " not found");
    if (it->status != QueueStatus::Queued)
        return MakeError(ErrorCode::NotCancellable, "Only queued items can be cancelled");

    ConstructionQueueItem item = *it;
    s.queue.erase(it);

    const CreditResult refund = s.storage.credit(item.deducted);
    renumber(s);

    item.status = QueueStatus::Cancelled;
    nlohmann::json payload = ItemPayload(item);
    payload["refunded"] = refund.applied;
    if (!refund.wasted.isZero())
        payload["refundWasted"] = refund.wasted;
    events.push_back(SettlementEvent(EventKind::ConstructionCancelled, s.id, now, std::move(payload)));
    return Ok();
}

CompletedConstruction ConstructionQueue::materialize(Settlement& s, const ConstructionQueueItem& item,
                                                     IdAllocator& ids, EventList& events) const
{
    CompletedConstruction done;
    done.item = item.id;
    done.structureKey = item.structureKey;
    done.level = item.targetLevel;
    done.upgrade = item.upgradeOf.has_value();

    nlohmann::json payload{{"itemId", item.id}, {"structureKey", item.structureKey}, {"level", item.targetLevel}};

    if (item.upgradeOf)
    {
        done.structure = *item.upgradeOf;
        if (Structure* st = s.findStructure(*item.upgradeOf))
        {
            st->level = item.targetLevel;
            payload["structureId"] = st->id;
            events.push_back(SettlementEvent(EventKind::StructureUpgraded, s.id, item.completesAt, std::move(payload)));
            logsys::get()->info("Settlement {}: {} #{} upgraded to level {}", s.id, item.structureKey, st->id,
                                item.targetLevel);
        }
        else
        {
            logsys::get()->warn("Settlement {}: upgrade item {} targets missing structure {}", s.id, item.id,
                                *item.upgradeOf);
        }
    }
    else
    {
        const StructureDefinition* def = catalog_.findStructure(item.structureKey);

        Structure st;
        st.id = ids.next();
        st.key = item.structureKey;
        st.category = def ? def->category : StructureCategory::Building;
        st.level = 1;
        st.health = 100.0;
        st.tileId = item.tileId;
        st.slot = item.slot;
        st.createdAt = item.completesAt;
        s.structures.push_back(st);

        done.structure = st.id;
        payload["structureId"] = st.id;
        if (st.tileId && st.slot)
        {
            payload["tileId"] = *st.tileId;
            payload["slot"] = *st.slot;
        }
        events.push_back(SettlementEvent(EventKind::StructureBuilt, s.id, item.completesAt, std::move(payload)));
        logsys::get()->info("Settlement {}: {} #{} built", s.id, item.structureKey, st.id);
    }

    s.staffingDirty = true;
    RefreshStorageCapacity(s, catalog_, cfg_.baseStorageCapacity);
    return done;
}

AdvanceResult ConstructionQueue::advance(Settlement& s, TimestampMs now, IdAllocator& ids, EventList& events) const
{
    AdvanceResult result;

    // Items promoted behind a completed one start at its completion time.
    const auto promote = [&](TimestampMs startAt) {
        while (ActiveCount(s) < cfg_.queueConcurrency)
        {
            ConstructionQueueItem* next = nullptr;
            for (ConstructionQueueItem& q : s.queue)
            {
                if (q.status == QueueStatus::Queued && (!next || q.position < next->position))
                    next = &q;
            }
            if (!next)
                return;
            start(*next, startAt);
            result.started.push_back(next->id);
            events.push_back(SettlementEvent(EventKind::ConstructionStarted, s.id, startAt, ItemPayload(*next)));
        }
    };

    promote(now);

    for (;;)
    {
        auto due = s.queue.end();
        for (auto it = s.queue.begin(); it != s.queue.end(); ++it)
        {
            if (it->status != QueueStatus::InProgress || it->completesAt > now)
                continue;
            if (due == s.queue.end() || it->completesAt < due->completesAt ||
                (it->completesAt == due->completesAt && it->position < due->position))
                due = it;
        }
        if (due == s.queue.end())
            break;

        ConstructionQueueItem item = *due;
        s.queue.erase(due);
        item.status = QueueStatus::Complete;
        result.completed.push_back(materialize(s, item, ids, events));

        renumber(s);
        promote(item.completesAt);
    }

    return result;
}

void ConstructionQueue::renumber(Settlement& s)
{
    std::stable_sort(s.queue.begin(), s.queue.end(),
                     [](const ConstructionQueueItem& a, const ConstructionQueueItem& b) { return a.position < b.position; });
    int pos = 0;
    for (ConstructionQueueItem& q : s.queue)
        q.position = pos++;
}

} // namespace frontier
