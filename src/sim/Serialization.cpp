#include "frontier/sim/Serialization.hpp"

namespace frontier {

namespace {

template <class T>
void ReadOptional(const nlohmann::json& j, const char* key, std::optional<T>& out)
{
    const auto it = j.find(key);
    if (it == j.end() || it->is_null())
        out.reset();
    else
        out = it->template get<T>();
}

template <class T>
void WriteOptional(nlohmann::json& j, const char* key, const std::optional<T>& v)
{
    if (v)
        j[key] = *v;
    else
        j[key] = nullptr;
}

ResourceAmounts ReadAmounts(const nlohmann::json& j, const char* key, const ResourceAmounts& fallback)
{
    const auto it = j.find(key);
    return (it != j.end() && it->is_object()) ? it->get<ResourceAmounts>() : fallback;
}

} // namespace

void to_json(nlohmann::json& j, const Tile& t)
{
    j = nlohmann::json{
        {"id", t.id},
        {"biome", t.biome},
        {"region", t.region},
        {"quality", t.quality},
        {"baseProductionModifier", t.baseProductionModifier},
        {"slotCount", t.slotCount},
    };
}

void from_json(const nlohmann::json& j, Tile& t)
{
    t = Tile{};
    t.id = j.value("id", TileId{0});
    t.biome = j.value("biome", t.biome);
    t.region = j.value("region", std::string{});
    t.quality = ReadAmounts(j, "quality", t.quality);
    t.baseProductionModifier = j.value("baseProductionModifier", 1.0);
    t.slotCount = j.value("slotCount", t.slotCount);
}

void to_json(nlohmann::json& j, const Structure& s)
{
    j = nlohmann::json{
        {"id", s.id},
        {"key", s.key},
        {"category", StructureCategoryName(s.category)},
        {"level", s.level},
        {"health", s.health},
        {"destroyed", s.destroyed},
        {"assignedWorkers", s.assignedWorkers},
        {"staffingBonus", s.staffingBonus},
        {"createdAt", s.createdAt},
    };
    WriteOptional(j, "tileId", s.tileId);
    WriteOptional(j, "slot", s.slot);
}

void from_json(const nlohmann::json& j, Structure& s)
{
    s = Structure{};
    s.id = j.value("id", StructureId{0});
    s.key = j.value("key", std::string{});
    s.category = j.value("category", std::string{"BUILDING"}) == "EXTRACTOR" ? StructureCategory::Extractor
                                                                             : StructureCategory::Building;
    s.level = j.value("level", 1);
    s.health = j.value("health", 100.0);
    s.destroyed = j.value("destroyed", false);
    s.assignedWorkers = j.value("assignedWorkers", 0);
    s.staffingBonus = j.value("staffingBonus", 1.0);
    s.createdAt = j.value("createdAt", TimestampMs{0});
    ReadOptional(j, "tileId", s.tileId);
    ReadOptional(j, "slot", s.slot);
}

void to_json(nlohmann::json& j, const ConstructionQueueItem& q)
{
    j = nlohmann::json{
        {"id", q.id},
        {"settlementId", q.settlementId},
        {"structureKey", q.structureKey},
        {"targetLevel", q.targetLevel},
        {"deducted", q.deducted},
        {"status", QueueStatusName(q.status)},
        {"position", q.position},
        {"emergency", q.emergency},
        {"queuedAt", q.queuedAt},
        {"startedAt", q.startedAt},
        {"completesAt", q.completesAt},
        {"duration", q.duration},
    };
    WriteOptional(j, "upgradeOf", q.upgradeOf);
    WriteOptional(j, "tileId", q.tileId);
    WriteOptional(j, "slot", q.slot);
}

void from_json(const nlohmann::json& j, ConstructionQueueItem& q)
{
    q = ConstructionQueueItem{};
    q.id = j.value("id", QueueItemId{0});
    q.settlementId = j.value("settlementId", SettlementId{0});
    q.structureKey = j.value("structureKey", std::string{});
    q.targetLevel = j.value("targetLevel", 1);
    q.deducted = ReadAmounts(j, "deducted", {});

    const std::string status = j.value("status", std::string{"QUEUED"});
    if (status == "IN_PROGRESS")    q.status = QueueStatus::InProgress;
    else if (status == "COMPLETE")  q.status = QueueStatus::Complete;
    else if (status == "CANCELLED") q.status = QueueStatus::Cancelled;
    else                            q.status = QueueStatus::Queued;

    q.position = j.value("position", 0);
    q.emergency = j.value("emergency", false);
    q.queuedAt = j.value("queuedAt", TimestampMs{0});
    q.startedAt = j.value("startedAt", TimestampMs{0});
    q.completesAt = j.value("completesAt", TimestampMs{0});
    q.duration = j.value("duration", DurationMs{0});
    ReadOptional(j, "upgradeOf", q.upgradeOf);
    ReadOptional(j, "tileId", q.tileId);
    ReadOptional(j, "slot", q.slot);
}

void to_json(nlohmann::json& j, const PopulationRecord& p)
{
    j = nlohmann::json{
        {"count", p.count},
        {"happiness", p.happiness},
        {"lastGrowthAt", p.lastGrowthAt},
        {"growthSteps", p.growthSteps},
        {"growthRemainder", p.growthRemainder},
        {"morale", p.morale},
        {"externalRelations", p.externalRelations},
        {"recentCasualties", p.recentCasualties},
        {"lastCasualtyAt", p.lastCasualtyAt},
    };
}

void from_json(const nlohmann::json& j, PopulationRecord& p)
{
    p = PopulationRecord{};
    p.count = j.value("count", 0);
    p.happiness = j.value("happiness", 50.0);
    p.lastGrowthAt = j.value("lastGrowthAt", TimestampMs{0});
    p.growthSteps = j.value("growthSteps", std::uint64_t{0});
    p.growthRemainder = j.value("growthRemainder", 0.0);
    p.morale = j.value("morale", 50.0);
    p.externalRelations = j.value("externalRelations", 50.0);
    p.recentCasualties = j.value("recentCasualties", 0);
    p.lastCasualtyAt = j.value("lastCasualtyAt", TimestampMs{0});
}

void to_json(nlohmann::json& j, const Settlement& s)
{
    j = nlohmann::json{
        {"id", s.id},
        {"worldId", s.worldId},
        {"owner", s.owner},
        {"name", s.name},
        {"x", s.x},
        {"y", s.y},
        {"tiles", s.tiles},
        {"resources", s.storage.balances()},
        {"population", s.population},
        {"structures", s.structures},
        {"queue", s.queue},
        {"research", s.research},
        {"foundedAt", s.foundedAt},
        {"lastCollectedAt", s.lastCollectedAt},
        {"ticksPastCollected", s.ticksPastCollected},
        {"lastPassiveRepairAt", s.lastPassiveRepairAt},
        {"lastRepairMultiplier", s.lastRepairMultiplier},
        {"resilience", s.resilience},
    };
    WriteOptional(j, "capacity", s.storage.capacity());
    WriteOptional(j, "activeDisaster", s.activeDisaster);

    nlohmann::json impacts = nlohmann::json::array();
    for (const auto& [disaster, penalty] : s.impacts)
        impacts.push_back({{"disaster", disaster}, {"penalty", penalty}});
    j["impacts"] = std::move(impacts);
    if (s.repairWindow)
    {
        j["repairWindow"] = {
            {"disaster", s.repairWindow->disaster},
            {"closesAt", s.repairWindow->closesAt},
            {"discount", s.repairWindow->discount},
            {"repairMultiplier", s.repairWindow->repairMultiplier},
        };
    }
    else
    {
        j["repairWindow"] = nullptr;
    }
}

void from_json(const nlohmann::json& j, Settlement& s)
{
    s = Settlement{};
    s.id = j.value("id", SettlementId{0});
    s.worldId = j.value("worldId", WorldId{0});
    s.owner = j.value("owner", PlayerId{});
    s.name = j.value("name", std::string{});
    s.x = j.value("x", 0.0);
    s.y = j.value("y", 0.0);
    s.tiles = j.value("tiles", std::vector<Tile>{});

    std::optional<ResourceAmounts> capacity;
    ReadOptional(j, "capacity", capacity);
    s.storage = ResourceLedger(ReadAmounts(j, "resources", {}), capacity);

    s.population = j.value("population", PopulationRecord{});
    s.structures = j.value("structures", std::vector<Structure>{});
    s.queue = j.value("queue", std::vector<ConstructionQueueItem>{});
    s.research = j.value("research", std::set<std::string>{});
    s.foundedAt = j.value("foundedAt", TimestampMs{0});
    s.lastCollectedAt = j.value("lastCollectedAt", TimestampMs{0});
    s.ticksPastCollected = j.value("ticksPastCollected", std::uint64_t{0});
    s.lastPassiveRepairAt = j.value("lastPassiveRepairAt", TimestampMs{0});
    if (const auto it = j.find("impacts"); it != j.end() && it->is_array())
    {
        for (const nlohmann::json& entry : *it)
            s.impacts[entry.value("disaster", DisasterId{0})] =
                ReadAmounts(entry, "penalty", ResourceAmounts::Uniform(1.0));
    }
    s.lastRepairMultiplier = j.value("lastRepairMultiplier", 0.2);
    s.resilience = j.value("resilience", 0.0);
    ReadOptional(j, "activeDisaster", s.activeDisaster);

    const auto rw = j.find("repairWindow");
    if (rw != j.end() && rw->is_object())
    {
        RepairWindow w;
        w.disaster = rw->value("disaster", DisasterId{0});
        w.closesAt = rw->value("closesAt", TimestampMs{0});
        w.discount = rw->value("discount", 0.0);
        w.repairMultiplier = rw->value("repairMultiplier", 0.2);
        s.repairWindow = w;
    }

    // Derived on the next tick.
    s.staffingDirty = true;
}

} // namespace frontier
