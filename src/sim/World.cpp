#include "frontier/sim/World.hpp"

#include <algorithm>

namespace frontier {

SettlementContext& World::addSettlement(Settlement s)
{
    ids_.observe(s.id);
    for (const Structure& st : s.structures)
        ids_.observe(st.id);
    for (const ConstructionQueueItem& q : s.queue)
        ids_.observe(q.id);
    for (const Tile& t : s.tiles)
        ids_.observe(t.id);

    s.worldId = id_;
    const SettlementId sid = s.id;
    auto ctx = std::make_unique<SettlementContext>(std::move(s));

    std::lock_guard lock(registryMutex_);
    auto& slot = settlements_[sid];
    slot = std::move(ctx);
    return *slot;
}

SettlementContext* World::find(SettlementId sid)
{
    std::lock_guard lock(registryMutex_);
    const auto it = settlements_.find(sid);
    return it != settlements_.end() ? it->second.get() : nullptr;
}

std::vector<SettlementContext*> World::contexts()
{
    std::lock_guard lock(registryMutex_);
    std::vector<SettlementContext*> out;
    out.reserve(settlements_.size());
    for (auto& [sid, ctx] : settlements_)
        out.push_back(ctx.get());
    return out;
}

std::size_t World::settlementCount() const
{
    std::lock_guard lock(registryMutex_);
    return settlements_.size();
}

bool World::withQueueItemOwner(QueueItemId item, const std::function<void(SettlementContext&)>& fn)
{
    for (SettlementContext* ctx : contexts())
    {
        std::unique_lock lock(ctx->mutex);
        if (ctx->settlement.findQueueItem(item))
        {
            fn(*ctx);
            return true;
        }
    }
    return false;
}

void World::forEachSettlement(WorldId world, const std::function<void(Settlement&)>& fn)
{
    if (world != id_)
        return;
    for (SettlementContext* ctx : contexts())
    {
        std::lock_guard lock(ctx->mutex);
        fn(ctx->settlement);
    }
}

// ---------------------------------------------------------------------------
// Disasters
// ---------------------------------------------------------------------------

DisasterId World::scheduleDisaster(DisasterEvent e)
{
    if (e.id == 0)
        e.id = ids_.next();
    else
        ids_.observe(e.id);
    e.worldId = id_;

    std::lock_guard lock(disasterMutex_);
    disasters_.push_back(std::move(e));
    return disasters_.back().id;
}

DisasterEvent* World::findDisaster(DisasterId did)
{
    const auto it = std::find_if(disasters_.begin(), disasters_.end(),
                                 [did](const DisasterEvent& e) { return e.id == did; });
    return it != disasters_.end() ? &*it : nullptr;
}

std::optional<DisasterId> World::activeDisaster()
{
    const DisasterEvent* best = nullptr;
    for (const DisasterEvent& e : disasters_)
    {
        if (e.status == DisasterStatus::Scheduled || e.status == DisasterStatus::Resolved)
            continue;
        if (!best || e.scheduledAt < best->scheduledAt)
            best = &e;
    }
    return best ? std::optional<DisasterId>(best->id) : std::nullopt;
}

// ---------------------------------------------------------------------------
// Transfers
// ---------------------------------------------------------------------------

void World::addTransfer(const Transfer& t)
{
    std::lock_guard lock(transferMutex_);
    transfers_.push_back(t);
}

std::map<SettlementId, std::vector<Transfer>> World::takeArrivedTransfers(TimestampMs now)
{
    std::map<SettlementId, std::vector<Transfer>> due;

    std::lock_guard lock(transferMutex_);
    const auto split = std::stable_partition(transfers_.begin(), transfers_.end(),
                                             [now](const Transfer& t) { return t.arrivesAt > now; });
    for (auto it = split; it != transfers_.end(); ++it)
        due[it->to].push_back(*it);
    transfers_.erase(split, transfers_.end());
    return due;
}

void World::restoreTransfers(const std::vector<Transfer>& transfers)
{
    std::lock_guard lock(transferMutex_);
    transfers_.insert(transfers_.end(), transfers.begin(), transfers.end());
}

std::vector<Transfer> World::pendingTransfers() const
{
    std::lock_guard lock(transferMutex_);
    return transfers_;
}

} // namespace frontier
