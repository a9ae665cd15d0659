#include "frontier/settlement/AreaAccounting.hpp"

#include <string>

namespace frontier {

AreaUsage AreaAccounting::usage(const Settlement& s) const
{
    AreaUsage u;
    u.capacity = capacityFor(TownHallLevel(s, catalog_));

    // Destroyed buildings still stand on their plot until demolished.
    for (const Structure& st : s.structures)
    {
        if (st.category != StructureCategory::Building)
            continue;
        if (const StructureDefinition* def = catalog_.findStructure(st.key))
            u.used += def->areaCost;
    }

    for (const ConstructionQueueItem& q : s.queue)
    {
        if (q.upgradeOf)
            continue;
        const StructureDefinition* def = catalog_.findStructure(q.structureKey);
        if (def && !def->isExtractor())
            u.reserved += def->areaCost;
    }
    return u;
}

Status AreaAccounting::validate(const Settlement& s, const StructureDefinition& def) const
{
    if (def.isExtractor())
        return Ok();

    const int townHall = TownHallLevel(s, catalog_);
    if (def.minTownHallLevel > townHall)
    {
        return MakeError(ErrorCode::TownHallLevelTooLow,
                         def.name + " requires town hall level " + std::to_string(def.minTownHallLevel) +
                             " (current " + std::to_string(townHall) + ")");
    }

    if (def.unique)
    {
        bool exists = false;
        for (const Structure& st : s.structures)
            exists = exists || st.key == def.key;
        for (const ConstructionQueueItem& q : s.queue)
            exists = exists || (!q.upgradeOf && q.structureKey == def.key);
        if (exists)
            return MakeError(ErrorCode::UniqueConstraintViolated, "Only one " + def.name + " per settlement");
    }

    const AreaUsage u = usage(s);
    if (def.areaCost > u.available())
    {
        return MakeError(ErrorCode::InsufficientArea,
                         def.name + " needs " + std::to_string(def.areaCost) + " area, " +
                             std::to_string(u.available()) + " available");
    }
    return Ok();
}

} // namespace frontier
