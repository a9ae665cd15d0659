#include "frontier/settlement/Settlement.hpp"

#include <algorithm>

namespace frontier {

const char* QueueStatusName(QueueStatus s) noexcept
{
    switch (s)
    {
    case QueueStatus::Queued:     return "QUEUED";
    case QueueStatus::InProgress: return "IN_PROGRESS";
    case QueueStatus::Complete:   return "COMPLETE";
    case QueueStatus::Cancelled:  return "CANCELLED";
    }
    return "QUEUED";
}

const Tile* Settlement::findTile(TileId tileId) const noexcept
{
    const auto it = std::find_if(tiles.begin(), tiles.end(), [tileId](const Tile& t) { return t.id == tileId; });
    return it != tiles.end() ? &*it : nullptr;
}

Structure* Settlement::findStructure(StructureId sid) noexcept
{
    const auto it = std::find_if(structures.begin(), structures.end(),
                                 [sid](const Structure& st) { return st.id == sid; });
    return it != structures.end() ? &*it : nullptr;
}

const Structure* Settlement::findStructure(StructureId sid) const noexcept
{
    return const_cast<Settlement*>(this)->findStructure(sid);
}

ConstructionQueueItem* Settlement::findQueueItem(QueueItemId itemId) noexcept
{
    const auto it = std::find_if(queue.begin(), queue.end(),
                                 [itemId](const ConstructionQueueItem& q) { return q.id == itemId; });
    return it != queue.end() ? &*it : nullptr;
}

int Settlement::structureLevel(const std::string& key) const noexcept
{
    int level = 0;
    for (const Structure& st : structures)
    {
        if (!st.destroyed && st.key == key)
            level = std::max(level, st.level);
    }
    return level;
}

int Settlement::activeStructureCount() const noexcept
{
    return static_cast<int>(std::count_if(structures.begin(), structures.end(),
                                          [](const Structure& st) { return !st.destroyed; }));
}

ResourceAmounts Settlement::productionPenalty() const noexcept
{
    ResourceAmounts penalty = ResourceAmounts::Uniform(1.0);
    for (const auto& [disaster, p] : impacts)
        for (ResourceType r : kAllResources)
            penalty[r] = std::min(penalty[r], p[r]);
    return penalty;
}

int HighestRoleLevel(const Settlement& s, const ICatalog& catalog, StructureRole role)
{
    int level = 0;
    for (const Structure& st : s.structures)
    {
        if (st.destroyed)
            continue;
        const StructureDefinition* def = catalog.findStructure(st.key);
        if (def && def->role == role)
            level = std::max(level, st.level);
    }
    return level;
}

int TownHallLevel(const Settlement& s, const ICatalog& catalog)
{
    return HighestRoleLevel(s, catalog, StructureRole::TownHall);
}

int SettlementTier(const Settlement& s, const ICatalog& catalog)
{
    return std::max(1, TownHallLevel(s, catalog));
}

ResourceAmounts StorageCapacity(const Settlement& s, const ICatalog& catalog, double baseCapacity)
{
    double bonus = 0.0;
    for (const Structure& st : s.structures)
    {
        if (st.destroyed)
            continue;
        const StructureDefinition* def = catalog.findStructure(st.key);
        if (def && def->role == StructureRole::Storage)
            bonus += def->storageBonus * st.level;
    }
    return ResourceAmounts::Uniform(baseCapacity + bonus);
}

int ShelterCapacity(const Settlement& s, const ICatalog& catalog, int perLevel)
{
    int total = 0;
    for (const Structure& st : s.structures)
    {
        if (st.destroyed)
            continue;
        const StructureDefinition* def = catalog.findStructure(st.key);
        if (def && def->role == StructureRole::Shelter)
            total += perLevel * st.level;
    }
    return total;
}

void RefreshStorageCapacity(Settlement& s, const ICatalog& catalog, double baseCapacity)
{
    s.storage.setCapacity(StorageCapacity(s, catalog, baseCapacity));
}

} // namespace frontier
