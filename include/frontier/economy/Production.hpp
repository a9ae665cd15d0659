#pragma once
// include/frontier/economy/Production.hpp
//
// Production / consumption calculator. Pure: no ledger access, no logging.
//
//   base       = (quality/100) * biomeEfficiency * tileModifier * baseRate
//   production = base * tierMultiplier * healthModifier * staffingBonus
//                     * penalty * ticks * worldMultiplier
//   consumption: population (food, water) + per-structure upkeep (wood, stone, ore)
//   net        = production - consumption, unclamped
//
// Only the highest-level extractor per resource counts; ties go to the earliest
// created (then the lowest id). No extractor means tierMultiplier = 1.

#include "frontier/core/Config.hpp"
#include "frontier/core/Ids.hpp"
#include "frontier/core/Time.hpp"
#include "frontier/economy/Resources.hpp"

#include <array>
#include <cstdint>
#include <optional>
#include <vector>

namespace frontier {

struct Settlement;
class ICatalog;

struct ExtractorView {
    StructureId id = 0;
    int level = 1;
    double health = 100.0;
    double staffingBonus = 1.0;
    TimestampMs createdAt = 0;
};

// Three bands: L1-5 0.5 +0.05/level, L6-10 1.0 +0.08/level, L11+ 1.6 +0.10/level.
[[nodiscard]] double ExtractorTierMultiplier(int level) noexcept;

// Linear: health/100 clamped to [0,1].
[[nodiscard]] double HealthModifier(double health) noexcept;

[[nodiscard]] double BaseProduction(double tileQuality, double biomeEfficiency,
                                    double tileModifier, double baseRate) noexcept;

// Whole ticks in `elapsed` (floor). Negative elapsed yields 0.
[[nodiscard]] std::uint64_t ElapsedTicks(DurationMs elapsed, double tickRateHz) noexcept;

// Milliseconds that `ticks` whole ticks cover, when that span is a whole number of ms.
[[nodiscard]] std::optional<DurationMs> WholeTickSpanMs(std::uint64_t ticks, double tickRateHz) noexcept;

[[nodiscard]] std::optional<ExtractorView> SelectExtractor(const std::vector<ExtractorView>& candidates);

struct ProductionInputs {
    ResourceAmounts tileQuality{};
    ResourceAmounts biomeEfficiency = ResourceAmounts::Uniform(1.0);
    double tileModifier = 1.0;
    std::array<std::optional<ExtractorView>, kResourceCount> extractors{};
    ResourceAmounts penalty = ResourceAmounts::Uniform(1.0);

    int population = 0;
    int structureCount = 0;
    double worldMultiplier = 1.0;
    std::uint64_t ticks = 0;
};

struct ProductionBreakdown {
    ResourceAmounts production{};
    ResourceAmounts consumption{};
    ResourceAmounts net{};
    ResourceAmounts tierMultiplier = ResourceAmounts::Uniform(1.0);
    std::array<bool, kResourceCount> present{};   // false: quality 0, resource skipped
};

[[nodiscard]] ProductionBreakdown ComputeProduction(const ProductionInputs& in, const SimConfig& cfg) noexcept;

// Gathers inputs from a settlement's home tile and non-destroyed extractors.
[[nodiscard]] ProductionInputs BuildProductionInputs(const Settlement& s, const ICatalog& catalog,
                                                     const SimConfig& cfg, std::uint64_t ticks);

} // namespace frontier
