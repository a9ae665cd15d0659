#include "frontier/disaster/Disaster.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <array>
#include <set>
#include <string>

namespace frontier {

namespace {

struct TypeRow {
    DisasterType type;
    const char* name;
    DisasterTraits traits;
};

// Penalty columns: food, water, wood, stone, ore (1.0 = unaffected).
const std::array<TypeRow, 14> kTypes{{
    {DisasterType::Earthquake,  "EARTHQUAKE",   {1.0, 0.25, ResourceAmounts::Of(1.0, 1.0, 0.8, 0.6, 0.6)}},
    {DisasterType::Hurricane,   "HURRICANE",    {1.2, 0.35, ResourceAmounts::Of(0.6, 0.7, 0.6, 1.0, 1.0)}},
    {DisasterType::Tornado,     "TORNADO",      {1.3, 0.35, ResourceAmounts::Of(0.7, 0.8, 0.6, 0.8, 1.0)}},
    {DisasterType::Flood,       "FLOOD",        {0.8, 0.30, ResourceAmounts::Of(0.5, 1.0, 0.7, 1.0, 1.0)}},
    {DisasterType::Wildfire,    "WILDFIRE",     {0.9, 0.15, ResourceAmounts::Of(0.7, 1.0, 0.4, 1.0, 1.0)}},
    {DisasterType::Drought,     "DROUGHT",      {0.6, 0.20, ResourceAmounts::Of(0.5, 0.7, 1.0, 1.0, 1.0)}},
    {DisasterType::Blizzard,    "BLIZZARD",     {0.7, 0.20, ResourceAmounts::Of(0.6, 0.7, 0.7, 0.8, 0.8)}},
    {DisasterType::Heatwave,    "HEATWAVE",     {0.8, 0.20, ResourceAmounts::Of(0.7, 0.6, 1.0, 1.0, 1.0)}},
    {DisasterType::Landslide,   "LANDSLIDE",    {1.1, 0.35, ResourceAmounts::Of(0.8, 1.0, 0.7, 0.6, 1.0)}},
    {DisasterType::Sandstorm,   "SANDSTORM",    {0.5, 0.25, ResourceAmounts::Of(0.8, 1.0, 1.0, 0.7, 0.7)}},
    {DisasterType::LocustSwarm, "LOCUST_SWARM", {0.3, 0.25, ResourceAmounts::Of(0.4, 1.0, 1.0, 1.0, 1.0)}},
    {DisasterType::Blight,      "BLIGHT",       {0.4, 0.25, ResourceAmounts::Of(0.5, 1.0, 1.0, 1.0, 1.0)}},
    {DisasterType::Avalanche,   "AVALANCHE",    {1.2, 0.35, ResourceAmounts::Of(1.0, 1.0, 0.7, 0.6, 0.6)}},
    {DisasterType::Volcano,     "VOLCANO",      {1.4, 0.40, ResourceAmounts::Of(0.5, 0.6, 0.5, 0.6, 0.7)}},
}};

const TypeRow& RowOf(DisasterType t) noexcept
{
    const auto idx = static_cast<std::size_t>(t);
    return idx < kTypes.size() ? kTypes[idx] : kTypes[0];
}

DisasterStatus ParseStatus(std::string_view name) noexcept
{
    for (DisasterStatus st : {DisasterStatus::Scheduled, DisasterStatus::Warning, DisasterStatus::Impact,
                              DisasterStatus::Aftermath, DisasterStatus::Resolved})
    {
        if (name == DisasterStatusName(st))
            return st;
    }
    return DisasterStatus::Scheduled;
}

bool Contains(const std::vector<std::string>& set, std::string_view value)
{
    return std::find(set.begin(), set.end(), value) != set.end();
}

} // namespace

const char* DisasterTypeName(DisasterType t) noexcept { return RowOf(t).name; }

std::optional<DisasterType> ParseDisasterType(std::string_view name) noexcept
{
    for (const TypeRow& row : kTypes)
    {
        if (name == row.name)
            return row.type;
    }
    return std::nullopt;
}

const char* DisasterStatusName(DisasterStatus s) noexcept
{
    switch (s)
    {
    case DisasterStatus::Scheduled: return "SCHEDULED";
    case DisasterStatus::Warning:   return "WARNING";
    case DisasterStatus::Impact:    return "IMPACT";
    case DisasterStatus::Aftermath: return "AFTERMATH";
    case DisasterStatus::Resolved:  return "RESOLVED";
    }
    return "SCHEDULED";
}

const char* SeverityTierName(SeverityTier t) noexcept
{
    switch (t)
    {
    case SeverityTier::Mild:         return "MILD";
    case SeverityTier::Moderate:     return "MODERATE";
    case SeverityTier::Major:        return "MAJOR";
    case SeverityTier::Catastrophic: return "CATASTROPHIC";
    }
    return "MILD";
}

SeverityTier SeverityTierFor(double severity) noexcept
{
    if (severity < 30.0) return SeverityTier::Mild;
    if (severity < 60.0) return SeverityTier::Moderate;
    if (severity < 85.0) return SeverityTier::Major;
    return SeverityTier::Catastrophic;
}

double ResilienceGain(SeverityTier tier) noexcept
{
    switch (tier)
    {
    case SeverityTier::Mild:         return 2.0;
    case SeverityTier::Moderate:     return 5.0;
    case SeverityTier::Major:        return 10.0;
    case SeverityTier::Catastrophic: return 15.0;
    }
    return 0.0;
}

const DisasterTraits& TraitsOf(DisasterType t) noexcept { return RowOf(t).traits; }

int DisasterEvent::totalDamageTicks(const SimConfig& cfg) const noexcept
{
    if (cfg.damageInterval <= 0)
        return 1;
    return static_cast<int>(std::max<DurationMs>(1, impactDuration / cfg.damageInterval));
}

bool DisasterEvent::affects(std::string_view biome, std::string_view region) const
{
    if (affectedBiomes.empty() && affectedRegions.empty())
        return true;
    return Contains(affectedBiomes, biome) || (!region.empty() && Contains(affectedRegions, region));
}

void to_json(nlohmann::json& j, const DisasterSummary& s)
{
    j = nlohmann::json{
        {"totalDamage", s.totalDamage},
        {"structuresDamaged", s.structuresDamaged},
        {"structuresDestroyed", s.structuresDestroyed},
        {"casualties", s.casualties},
        {"estimatedRepairCost", s.estimatedRepairCost},
        {"settlementsAffected", s.settlementsAffected},
    };
}

void from_json(const nlohmann::json& j, DisasterSummary& s)
{
    s = DisasterSummary{};
    s.totalDamage = j.value("totalDamage", 0.0);
    s.structuresDamaged = j.value("structuresDamaged", 0);
    s.structuresDestroyed = j.value("structuresDestroyed", 0);
    s.casualties = j.value("casualties", 0);
    s.estimatedRepairCost = j.value("estimatedRepairCost", ResourceAmounts{});
    s.settlementsAffected = j.value("settlementsAffected", 0);
}

void to_json(nlohmann::json& j, const SettlementExposure& x)
{
    j = nlohmann::json{
        {"casualties", x.casualties},
        {"damageDealt", x.damageDealt},
        {"damaged", x.damaged},
        {"destroyed", x.destroyed},
    };
}

void from_json(const nlohmann::json& j, SettlementExposure& x)
{
    x = SettlementExposure{};
    x.casualties = j.value("casualties", 0.0);
    x.damageDealt = j.value("damageDealt", 0.0);
    x.damaged = j.value("damaged", std::set<StructureId>{});
    x.destroyed = j.value("destroyed", std::set<StructureId>{});
}

void to_json(nlohmann::json& j, const DisasterEvent& e)
{
    j = nlohmann::json{
        {"id", e.id},
        {"worldId", e.worldId},
        {"type", DisasterTypeName(e.type)},
        {"severity", e.severity},
        {"tier", SeverityTierName(e.tier())},
        {"affectedBiomes", e.affectedBiomes},
        {"affectedRegions", e.affectedRegions},
        {"scheduledAt", e.scheduledAt},
        {"warningDuration", e.warningDuration},
        {"impactDuration", e.impactDuration},
        {"status", DisasterStatusName(e.status)},
        {"warningStartedAt", e.warningStartedAt},
        {"impactStartedAt", e.impactStartedAt},
        {"aftermathStartedAt", e.aftermathStartedAt},
        {"resolvedAt", e.resolvedAt},
        {"imminentSent", e.imminentSent},
        {"damageTicksApplied", e.damageTicksApplied},
    };

    nlohmann::json exposure = nlohmann::json::array();
    for (const auto& [settlement, x] : e.exposure)
    {
        nlohmann::json entry = x;
        entry["settlement"] = settlement;
        exposure.push_back(std::move(entry));
    }
    j["exposure"] = std::move(exposure);

    if (e.summary)
        j["summary"] = *e.summary;
    else
        j["summary"] = nullptr;
}

void from_json(const nlohmann::json& j, DisasterEvent& e)
{
    e = DisasterEvent{};
    e.id = j.value("id", DisasterId{0});
    e.worldId = j.value("worldId", WorldId{0});
    e.type = ParseDisasterType(j.value("type", std::string{})).value_or(DisasterType::Earthquake);
    e.severity = j.value("severity", 50.0);
    e.affectedBiomes = j.value("affectedBiomes", std::vector<std::string>{});
    e.affectedRegions = j.value("affectedRegions", std::vector<std::string>{});
    e.scheduledAt = j.value("scheduledAt", TimestampMs{0});
    e.warningDuration = j.value("warningDuration", e.warningDuration);
    e.impactDuration = j.value("impactDuration", e.impactDuration);
    e.status = ParseStatus(j.value("status", std::string{}));
    e.warningStartedAt = j.value("warningStartedAt", TimestampMs{0});
    e.impactStartedAt = j.value("impactStartedAt", TimestampMs{0});
    e.aftermathStartedAt = j.value("aftermathStartedAt", TimestampMs{0});
    e.resolvedAt = j.value("resolvedAt", TimestampMs{0});
    e.imminentSent = j.value("imminentSent", false);
    e.damageTicksApplied = j.value("damageTicksApplied", 0);

    if (const auto it = j.find("exposure"); it != j.end() && it->is_array())
    {
        for (const nlohmann::json& entry : *it)
            e.exposure[entry.value("settlement", SettlementId{0})] = entry.get<SettlementExposure>();
    }

    if (const auto it = j.find("summary"); it != j.end() && it->is_object())
        e.summary = it->get<DisasterSummary>();
}

} // namespace frontier
