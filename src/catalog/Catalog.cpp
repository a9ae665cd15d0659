#include "frontier/catalog/Catalog.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace frontier {

using json = nlohmann::json;

const char* StructureCategoryName(StructureCategory c) noexcept
{
    return c == StructureCategory::Extractor ? "EXTRACTOR" : "BUILDING";
}

const char* StructureRoleName(StructureRole r) noexcept
{
    switch (r)
    {
    case StructureRole::None:        return "NONE";
    case StructureRole::Housing:     return "HOUSING";
    case StructureRole::Storage:     return "STORAGE";
    case StructureRole::TownHall:    return "TOWN_HALL";
    case StructureRole::Workshop:    return "WORKSHOP";
    case StructureRole::Marketplace: return "MARKETPLACE";
    case StructureRole::Hospital:    return "HOSPITAL";
    case StructureRole::Shelter:     return "SHELTER";
    case StructureRole::Watchtower:  return "WATCHTOWER";
    case StructureRole::Defense:     return "DEFENSE";
    }
    return "NONE";
}

namespace {

std::optional<StructureRole> ParseRole(const std::string& s)
{
    for (int i = 0; i <= static_cast<int>(StructureRole::Defense); ++i)
    {
        const auto r = static_cast<StructureRole>(i);
        if (s == StructureRoleName(r))
            return r;
    }
    return std::nullopt;
}

StructureDefinition Extractor(std::string key, std::string name, ResourceType r, ResourceAmounts cost,
                              DurationMs buildTime, StaffingRequirement staffing)
{
    StructureDefinition d;
    d.key = std::move(key);
    d.name = std::move(name);
    d.category = StructureCategory::Extractor;
    d.extracts = r;
    d.cost = cost;
    d.buildTime = buildTime;
    d.staffing = staffing;
    return d;
}

StructureDefinition Building(std::string key, std::string name, StructureRole role, ResourceAmounts cost,
                             DurationMs buildTime, int areaCost)
{
    StructureDefinition d;
    d.key = std::move(key);
    d.name = std::move(name);
    d.category = StructureCategory::Building;
    d.role = role;
    d.cost = cost;
    d.buildTime = buildTime;
    d.areaCost = areaCost;
    return d;
}

// Reads optional fields of one "structures" entry over `d`.
bool ApplyStructureJson(const json& e, StructureDefinition& d, std::string& err)
{
    if (const auto it = e.find("name"); it != e.end() && it->is_string())
        d.name = it->get<std::string>();

    if (const auto it = e.find("category"); it != e.end() && it->is_string())
    {
        const auto c = it->get<std::string>();
        if (c == "EXTRACTOR")     d.category = StructureCategory::Extractor;
        else if (c == "BUILDING") d.category = StructureCategory::Building;
        else { err = d.key + ": unknown category " + c; return false; }
    }

    if (const auto it = e.find("role"); it != e.end() && it->is_string())
    {
        const auto r = ParseRole(it->get<std::string>());
        if (!r) { err = d.key + ": unknown role " + it->get<std::string>(); return false; }
        d.role = *r;
    }

    if (const auto it = e.find("extracts"); it != e.end() && it->is_string())
    {
        const auto r = ParseResourceType(it->get<std::string>());
        if (!r) { err = d.key + ": unknown resource " + it->get<std::string>(); return false; }
        d.extracts = *r;
    }

    if (const auto it = e.find("cost"); it != e.end() && it->is_object())
    {
        d.cost = it->get<ResourceAmounts>();
        if (d.cost.anyNegative()) { err = d.key + ": negative cost"; return false; }
    }

    if (const auto it = e.find("buildSeconds"); it != e.end() && it->is_number())
        d.buildTime = static_cast<DurationMs>(it->get<double>() * 1000.0);

    const auto readInt = [&e](const char* key, int& out) {
        if (const auto it = e.find(key); it != e.end() && it->is_number_integer())
            out = it->get<int>();
    };
    const auto readDouble = [&e](const char* key, double& out) {
        if (const auto it = e.find(key); it != e.end() && it->is_number())
            out = it->get<double>();
    };

    readInt("tier", d.tier);
    readInt("maxLevel", d.maxLevel);
    readInt("areaCost", d.areaCost);
    readInt("minTownHallLevel", d.minTownHallLevel);
    readInt("populationRequirement", d.populationRequirement);
    readInt("housingCapacity", d.housingCapacity);
    readDouble("housingQuality", d.housingQuality);
    readDouble("storageBonus", d.storageBonus);
    readDouble("defenseBonus", d.defenseBonus);

    if (const auto it = e.find("unique"); it != e.end() && it->is_boolean())
        d.unique = it->get<bool>();

    if (const auto it = e.find("prerequisites"); it != e.end() && it->is_array())
    {
        d.prerequisites.clear();
        for (const json& p : *it)
        {
            Prerequisite pre;
            if (const auto s = p.find("structure"); s != p.end() && s->is_string())
                pre.structureKey = s->get<std::string>();
            if (const auto r = p.find("research"); r != p.end() && r->is_string())
                pre.researchKey = r->get<std::string>();
            if (const auto l = p.find("level"); l != p.end() && l->is_number_integer())
                pre.level = l->get<int>();
            if (pre.structureKey.empty() == pre.researchKey.empty())
            {
                err = d.key + ": prerequisite needs exactly one of structure/research";
                return false;
            }
            d.prerequisites.push_back(std::move(pre));
        }
    }

    if (const auto it = e.find("staffing"); it != e.end() && it->is_object())
    {
        StaffingRequirement s = d.staffing;
        if (const auto v = it->find("required"); v != it->end() && v->is_number_integer())
            s.required = v->get<int>();
        if (const auto v = it->find("optional"); v != it->end() && v->is_number_integer())
            s.optional = v->get<int>();
        if (const auto v = it->find("bonusPerWorker"); v != it->end() && v->is_number())
            s.bonusPerWorker = v->get<double>();
        if (const auto v = it->find("priority"); v != it->end() && v->is_number_integer())
            s.priority = v->get<int>();
        if (s.required < 0 || s.optional < 0)
        {
            err = d.key + ": negative staffing";
            return false;
        }
        d.staffing = s;
    }

    if (d.isExtractor() && !d.extracts)
    {
        err = d.key + ": extractor without \"extracts\"";
        return false;
    }
    if (d.buildTime < 0 || d.maxLevel < 0 || d.areaCost < 0)
    {
        err = d.key + ": negative buildSeconds/maxLevel/areaCost";
        return false;
    }
    return true;
}

} // namespace

const StructureDefinition* StaticCatalog::findStructure(std::string_view key) const
{
    const auto it = structures_.find(key);
    return it != structures_.end() ? &it->second : nullptr;
}

double StaticCatalog::biomeEfficiency(std::string_view biome, ResourceType r) const
{
    const auto it = biomes_.find(std::string(biome));
    return it != biomes_.end() ? it->second[r] : 1.0;
}

void StaticCatalog::upsert(StructureDefinition def)
{
    std::string key = def.key;
    structures_.insert_or_assign(std::move(key), std::move(def));
}

void StaticCatalog::setBiome(const std::string& biome, const ResourceAmounts& efficiency)
{
    biomes_[biome] = efficiency;
}

std::vector<const StructureDefinition*> StaticCatalog::all() const
{
    std::vector<const StructureDefinition*> out;
    out.reserve(structures_.size());
    for (const auto& [key, def] : structures_)
        out.push_back(&def);
    return out;
}

StaticCatalog DefaultCatalog()
{
    using R = ResourceAmounts;
    StaticCatalog c;

    // --- extractors (staffing: required / optional / bonus per worker / priority) ---
    c.upsert(Extractor("FARM", "Farm", ResourceType::Food, R::Of(0, 0, 20, 10, 0), 3 * kMinuteMs, {2, 3, 0.10, 10}));
    c.upsert(Extractor("WELL", "Well", ResourceType::Water, R::Of(0, 0, 15, 20, 0), 3 * kMinuteMs, {1, 1, 0.10, 10}));
    c.upsert(Extractor("LUMBER_MILL", "Lumber Mill", ResourceType::Wood, R::Of(0, 0, 20, 10, 0), 3 * kMinuteMs, {2, 4, 0.10, 8}));
    c.upsert(Extractor("QUARRY", "Quarry", ResourceType::Stone, R::Of(0, 0, 30, 20, 0), 3 * kMinuteMs, {2, 4, 0.08, 7}));
    c.upsert(Extractor("MINE", "Mine", ResourceType::Ore, R::Of(0, 0, 40, 30, 0), 4 * kMinuteMs, {3, 5, 0.08, 7}));
    c.upsert(Extractor("FISHING_DOCK", "Fishing Dock", ResourceType::Food, R::Of(0, 0, 30, 15, 0), 3 * kMinuteMs, {2, 3, 0.10, 9}));
    c.upsert(Extractor("HUNTING_LODGE", "Hunting Lodge", ResourceType::Food, R::Of(0, 0, 25, 10, 0), 3 * kMinuteMs, {2, 3, 0.10, 8}));
    c.upsert(Extractor("HERB_GARDEN", "Herb Garden", ResourceType::Food, R::Of(0, 0, 15, 5, 0), 3 * kMinuteMs, {1, 2, 0.12, 6}));

    // --- housing ---
    {
        auto d = Building("TENT", "Tent", StructureRole::Housing, R::Of(5, 2, 10, 0, 0), 0, 10);
        d.maxLevel = 3;
        d.housingCapacity = 5;
        d.housingQuality = 10.0;
        c.upsert(std::move(d));
    }
    {
        auto d = Building("HOUSE", "House", StructureRole::Housing, R::Of(0, 0, 50, 20, 0), 10 * kMinuteMs, 25);
        d.housingCapacity = 10;
        d.housingQuality = 20.0;
        c.upsert(std::move(d));
    }

    // --- economy ---
    {
        auto d = Building("STORAGE", "Warehouse", StructureRole::Storage, R::Of(0, 0, 40, 20, 0), 5 * kMinuteMs, 30);
        d.storageBonus = 500.0;
        d.staffing = {1, 2, 0.05, 5};
        c.upsert(std::move(d));
    }
    {
        auto d = Building("TOWN_HALL", "Town Hall", StructureRole::TownHall, R::Of(0, 0, 200, 150, 50), kHourMs, 50);
        d.unique = true;
        d.maxLevel = 5;
        d.tier = 2;
        d.staffing = {2, 0, 0.0, 9};
        c.upsert(std::move(d));
    }
    {
        auto d = Building("WORKSHOP", "Workshop", StructureRole::Workshop, R::Of(0, 0, 60, 60, 30), 15 * kMinuteMs, 40);
        d.prerequisites.push_back({"TOWN_HALL", 1, {}});
        d.tier = 2;
        d.staffing = {2, 2, 0.05, 6};
        c.upsert(std::move(d));
    }
    {
        auto d = Building("MARKETPLACE", "Marketplace", StructureRole::Marketplace, R::Of(0, 0, 120, 80, 0), 30 * kMinuteMs, 60);
        d.prerequisites.push_back({"TOWN_HALL", 1, {}});
        d.unique = true;
        d.tier = 2;
        d.staffing = {2, 2, 0.05, 5};
        c.upsert(std::move(d));
    }

    // --- disaster preparedness ---
    {
        auto d = Building("HOSPITAL", "Hospital", StructureRole::Hospital, R::Of(0, 0, 100, 120, 40), 2 * kHourMs, 60);
        d.unique = true;
        d.minTownHallLevel = 1;
        d.tier = 3;
        d.populationRequirement = 20;
        d.staffing = {3, 2, 0.05, 9};
        c.upsert(std::move(d));
    }
    c.upsert(Building("EMERGENCY_SHELTER", "Emergency Shelter", StructureRole::Shelter, R::Of(0, 0, 80, 100, 0), 2 * kHourMs, 40));
    c.upsert(Building("WATCHTOWER", "Watchtower", StructureRole::Watchtower, R::Of(0, 0, 60, 40, 0), 3 * kHourMs, 15));
    {
        auto d = Building("WALL", "Wall", StructureRole::Defense, R::Of(0, 0, 20, 80, 0), 10 * kMinuteMs, 10);
        d.defenseBonus = 5.0;
        c.upsert(std::move(d));
    }

    // --- biome efficiency (food, water, wood, stone, ore) ---
    c.setBiome("GRASSLAND", R::Of(1.2, 1.0, 0.8, 0.6, 0.5));
    c.setBiome("FOREST",    R::Of(0.8, 1.0, 1.5, 0.7, 0.6));
    c.setBiome("DESERT",    R::Of(0.3, 0.2, 0.2, 1.2, 1.0));
    c.setBiome("MOUNTAIN",  R::Of(0.4, 0.8, 0.6, 1.5, 1.4));
    c.setBiome("TUNDRA",    R::Of(0.3, 0.7, 0.5, 1.0, 1.1));
    c.setBiome("SWAMP",     R::Of(0.7, 1.3, 1.0, 0.4, 0.3));
    c.setBiome("COASTAL",   R::Of(1.3, 1.1, 0.7, 0.6, 0.4));

    c.setVersion(1);
    return c;
}

bool ParseCatalog(const std::string& text, StaticCatalog& catalog, std::string* error)
{
    const json j = json::parse(text, nullptr, false, /*ignore_comments*/ true);
    if (j.is_discarded() || !j.is_object())
    {
        if (error) *error = "catalog is not a JSON object";
        return false;
    }

    StaticCatalog tmp = catalog;
    std::string err;

    if (const auto it = j.find("structures"); it != j.end())
    {
        if (!it->is_array())
        {
            if (error) *error = "\"structures\" must be an array";
            return false;
        }
        for (const json& e : *it)
        {
            const auto key = e.find("key");
            if (!e.is_object() || key == e.end() || !key->is_string() || key->get<std::string>().empty())
            {
                if (error) *error = "structure entry without \"key\"";
                return false;
            }

            StructureDefinition def;
            if (const StructureDefinition* existing = tmp.findStructure(key->get<std::string>()))
                def = *existing;
            else
                def.key = key->get<std::string>();

            if (!ApplyStructureJson(e, def, err))
            {
                if (error) *error = err;
                return false;
            }
            tmp.upsert(std::move(def));
        }
    }

    if (const auto it = j.find("biomes"); it != j.end() && it->is_object())
    {
        for (const auto& [biome, eff] : it->items())
        {
            ResourceAmounts e = ResourceAmounts::Uniform(1.0);
            if (eff.is_object())
            {
                for (ResourceType r : kAllResources)
                {
                    if (const auto v = eff.find(ResourceTypeName(r)); v != eff.end() && v->is_number())
                        e[r] = v->get<double>();
                }
            }
            tmp.setBiome(biome, e);
        }
    }

    if (const auto it = j.find("version"); it != j.end() && it->is_number_integer())
        tmp.setVersion(it->get<int>());

    catalog = std::move(tmp);
    return true;
}

bool LoadCatalogFile(const std::filesystem::path& file, StaticCatalog& catalog, std::string* error)
{
    std::ifstream in(file, std::ios::binary);
    if (!in)
        throw std::runtime_error("Could not open catalog file: " + file.string());

    std::ostringstream ss;
    ss << in.rdbuf();
    return ParseCatalog(ss.str(), catalog, error);
}

} // namespace frontier
