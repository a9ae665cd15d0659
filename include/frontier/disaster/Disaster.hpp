#pragma once
// include/frontier/disaster/Disaster.hpp
//
// Disaster records and per-type tables.

#include "frontier/core/Config.hpp"
#include "frontier/core/Ids.hpp"
#include "frontier/core/Time.hpp"
#include "frontier/economy/Resources.hpp"

#include <nlohmann/json_fwd.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace frontier {

enum class DisasterType : std::uint8_t {
    Earthquake = 0,
    Hurricane,
    Tornado,
    Flood,
    Wildfire,
    Drought,
    Blizzard,
    Heatwave,
    Landslide,
    Sandstorm,
    LocustSwarm,
    Blight,
    Avalanche,
    Volcano,
};

enum class DisasterStatus : std::uint8_t {
    Scheduled = 0,
    Warning,
    Impact,
    Aftermath,
    Resolved,
};

enum class SeverityTier : std::uint8_t {
    Mild = 0,
    Moderate,
    Major,
    Catastrophic,
};

[[nodiscard]] const char* DisasterTypeName(DisasterType t) noexcept;
[[nodiscard]] std::optional<DisasterType> ParseDisasterType(std::string_view name) noexcept;
[[nodiscard]] const char* DisasterStatusName(DisasterStatus s) noexcept;
[[nodiscard]] const char* SeverityTierName(SeverityTier t) noexcept;

// MILD < 30 <= MODERATE < 60 <= MAJOR < 85 <= CATASTROPHIC
[[nodiscard]] SeverityTier SeverityTierFor(double severity) noexcept;
[[nodiscard]] double ResilienceGain(SeverityTier tier) noexcept;

struct DisasterTraits {
    double casualtyMultiplier = 1.0;
    double repairMultiplier = 0.2;
    ResourceAmounts productionPenalty = ResourceAmounts::Uniform(1.0);
};

[[nodiscard]] const DisasterTraits& TraitsOf(DisasterType t) noexcept;

// Per-settlement accumulation while an event is in IMPACT.
struct SettlementExposure {
    double casualties = 0.0;            // fractional, floored when applied
    double damageDealt = 0.0;
    std::set<StructureId> damaged;
    std::set<StructureId> destroyed;
};

struct DisasterSummary {
    double totalDamage = 0.0;
    int structuresDamaged = 0;
    int structuresDestroyed = 0;
    int casualties = 0;
    ResourceAmounts estimatedRepairCost{};
    int settlementsAffected = 0;
};

struct DisasterEvent {
    DisasterId id = 0;
    WorldId worldId = 0;
    DisasterType type = DisasterType::Earthquake;
    double severity = 50.0;                     // 0..100

    // Empty sets mean "whole world".
    std::vector<std::string> affectedBiomes;
    std::vector<std::string> affectedRegions;

    TimestampMs scheduledAt = 0;                // impact time
    DurationMs warningDuration = 6 * kHourMs;
    DurationMs impactDuration = kHourMs;

    DisasterStatus status = DisasterStatus::Scheduled;
    TimestampMs warningStartedAt = 0;
    TimestampMs impactStartedAt = 0;
    TimestampMs aftermathStartedAt = 0;
    TimestampMs resolvedAt = 0;

    bool imminentSent = false;
    int damageTicksApplied = 0;

    std::map<SettlementId, SettlementExposure> exposure;   // cleared on RESOLVED
    std::optional<DisasterSummary> summary;

    [[nodiscard]] SeverityTier tier() const noexcept { return SeverityTierFor(severity); }
    [[nodiscard]] int totalDamageTicks(const SimConfig& cfg) const noexcept;
    [[nodiscard]] bool affects(std::string_view biome, std::string_view region) const;
};

void to_json(nlohmann::json& j, const DisasterSummary& s);
void from_json(const nlohmann::json& j, DisasterSummary& s);
void to_json(nlohmann::json& j, const SettlementExposure& x);
void from_json(const nlohmann::json& j, SettlementExposure& x);
void to_json(nlohmann::json& j, const DisasterEvent& e);
void from_json(const nlohmann::json& j, DisasterEvent& e);

} // namespace frontier
