#pragma once
// include/frontier/population/PopulationEngine.hpp
//
// Headcount, capacity and happiness.
//
// Growth runs once per SimConfig::growthInterval (never per tick). Each step:
//   - happiness = weighted blend of six 0..100 factors, capped at the
//     starvation ceiling while food or water is empty
//   - natural growth: baseRate * factor(happiness) * (1 - pop/cap) * pop,
//     fractional people carried in PopulationRecord::growthRemainder
//   - immigration above the high threshold, emigration below the low one
//     (random rolls from a Pcg32 keyed by seed, settlement, step)
// An empty larder never kills anyone directly; it only drags happiness down.

#include "frontier/catalog/Catalog.hpp"
#include "frontier/core/Config.hpp"
#include "frontier/settlement/Settlement.hpp"
#include "frontier/sim/Events.hpp"

#include <cstdint>
#include <optional>

namespace frontier {

struct HappinessFactors {
    double resourceSufficiency = 0.0;
    double housing = 0.0;
    double preparedness = 0.0;
    double trauma = 100.0;
    double morale = 50.0;
    double externalRelations = 50.0;
};

[[nodiscard]] double ResourceSufficiency(double food, double water, int population, const SimConfig& cfg) noexcept;
[[nodiscard]] double HousingQuality(int population, int capacity, double bestHousingQuality) noexcept;
[[nodiscard]] double TraumaScore(const PopulationRecord& p, TimestampMs now, const SimConfig& cfg) noexcept;
[[nodiscard]] double BlendHappiness(const HappinessFactors& f, const HappinessWeights& w) noexcept;

// Piecewise: <30 negative, 30..50 0..1, 50..75 1..2, >=75 2+.
[[nodiscard]] double HappinessGrowthFactor(double happiness) noexcept;

[[nodiscard]] double ImmigrationChance(double happiness, int population, int capacity, const SimConfig& cfg) noexcept;
[[nodiscard]] double EmigrationChance(double happiness, int population, const SimConfig& cfg) noexcept;

[[nodiscard]] int PopulationCapacity(const Settlement& s, const ICatalog& catalog, const SimConfig& cfg);
[[nodiscard]] double DisasterPreparedness(const Settlement& s, const ICatalog& catalog, const SimConfig& cfg);

struct GrowthOutcome {
    int before = 0;
    int after = 0;
    int naturalChange = 0;
    int immigrated = 0;
    int emigrated = 0;
    int capacity = 0;
    double happiness = 0.0;
    bool starving = false;
    HappinessFactors factors{};
};

class PopulationEngine {
public:
    PopulationEngine(const SimConfig& cfg, const ICatalog& catalog) noexcept : cfg_(cfg), catalog_(catalog) {}

    [[nodiscard]] HappinessFactors evaluateFactors(const Settlement& s, TimestampMs now) const;
    [[nodiscard]] double evaluateHappiness(const Settlement& s, TimestampMs now, bool* starving = nullptr) const;

    // Runs one growth step if a full interval has passed since the last one.
    std::optional<GrowthOutcome> maybeGrow(Settlement& s, TimestampMs now, EventList& events) const;

    // Unconditional single step (also used by maybeGrow).
    GrowthOutcome growthStep(Settlement& s, TimestampMs now) const;

    // Disaster casualties, applied once at aftermath. Returns people actually lost.
    int applyCasualties(Settlement& s, int casualties, TimestampMs now) const;

    // Drops headcount above capacity (housing lost). Returns people removed.
    int clampToCapacity(Settlement& s) const;

private:
    const SimConfig& cfg_;
    const ICatalog& catalog_;
};

} // namespace frontier
