#include "frontier/economy/Production.hpp"

#include "frontier/catalog/Catalog.hpp"
#include "frontier/settlement/Settlement.hpp"

#include <algorithm>
#include <cmath>

namespace frontier {

double ExtractorTierMultiplier(int level) noexcept
{
    const int l = std::max(1, level);
    if (l <= 5)  return 0.5 + (l - 1) * 0.05;
    if (l <= 10) return 1.0 + (l - 6) * 0.08;
    return 1.6 + (l - 11) * 0.10;
}

double HealthModifier(double health) noexcept
{
    return std::clamp(health, 0.0, 100.0) / 100.0;
}

double BaseProduction(double tileQuality, double biomeEfficiency, double tileModifier, double baseRate) noexcept
{
    return (tileQuality / 100.0) * biomeEfficiency * tileModifier * baseRate;
}

std::uint64_t ElapsedTicks(DurationMs elapsed, double tickRateHz) noexcept
{
    if (elapsed <= 0 || tickRateHz <= 0.0)
        return 0;
    // The epsilon keeps exact multiples (1000 ms at 60 Hz) from flooring to 59.
    return static_cast<std::uint64_t>(std::floor(static_cast<double>(elapsed) * tickRateHz / 1000.0 + 1e-9));
}

std::optional<DurationMs> WholeTickSpanMs(std::uint64_t ticks, double tickRateHz) noexcept
{
    if (tickRateHz <= 0.0)
        return std::nullopt;
    const double ms = static_cast<double>(ticks) * 1000.0 / tickRateHz;
    const double whole = std::round(ms);
    if (std::abs(ms - whole) > 1e-6)
        return std::nullopt;
    return static_cast<DurationMs>(whole);
}

std::optional<ExtractorView> SelectExtractor(const std::vector<ExtractorView>& candidates)
{
    std::optional<ExtractorView> best;
    for (const ExtractorView& c : candidates)
    {
        if (!best)
        {
            best = c;
            continue;
        }
        // Highest level wins; ties: earliest created, then lowest id.
        if (c.level != best->level)
        {
            if (c.level > best->level) best = c;
        }
        else if (c.createdAt != best->createdAt)
        {
            if (c.createdAt < best->createdAt) best = c;
        }
        else if (c.id < best->id)
        {
            best = c;
        }
    }
    return best;
}

ProductionBreakdown ComputeProduction(const ProductionInputs& in, const SimConfig& cfg) noexcept
{
    ProductionBreakdown out;
    const double ticks = static_cast<double>(in.ticks);
    const double scale = ticks * in.worldMultiplier;

    for (ResourceType r : kAllResources)
    {
        const auto i = static_cast<std::size_t>(r);
        if (in.tileQuality[r] <= 0.0)
            continue;   // resource absent on this tile

        out.present[i] = true;
        const double base = BaseProduction(in.tileQuality[r], in.biomeEfficiency[r], in.tileModifier,
                                           cfg.baseProductionRate);

        double tier = 1.0;
        double health = 1.0;
        double staffing = 1.0;
        if (const auto& ex = in.extractors[i])
        {
            tier = ExtractorTierMultiplier(ex->level);
            health = HealthModifier(ex->health);
            staffing = ex->staffingBonus;
        }
        out.tierMultiplier[r] = tier;
        out.production[r] = base * tier * health * staffing * in.penalty[r] * scale;
    }

    const double pop = static_cast<double>(std::max(0, in.population));
    out.consumption[ResourceType::Food] = pop * cfg.foodPerPersonPerTick * scale;
    out.consumption[ResourceType::Water] = pop * cfg.waterPerPersonPerTick * scale;

    const double structures = static_cast<double>(std::max(0, in.structureCount));
    for (ResourceType r : {ResourceType::Wood, ResourceType::Stone, ResourceType::Ore})
        out.consumption[r] = structures * cfg.maintenancePerStructurePerTick[r] * scale;

    out.net = out.production - out.consumption;
    return out;
}

ProductionInputs BuildProductionInputs(const Settlement& s, const ICatalog& catalog,
                                       const SimConfig& cfg, std::uint64_t ticks)
{
    ProductionInputs in;
    in.ticks = ticks;
    in.worldMultiplier = cfg.worldMultiplier;
    in.population = s.population.count;
    in.structureCount = s.activeStructureCount();
    in.penalty = s.productionPenalty();

    if (const Tile* tile = s.homeTile())
    {
        in.tileQuality = tile->quality;
        in.tileModifier = tile->baseProductionModifier;
        for (ResourceType r : kAllResources)
            in.biomeEfficiency[r] = catalog.biomeEfficiency(tile->biome, r);
    }

    std::array<std::vector<ExtractorView>, kResourceCount> candidates;
    for (const Structure& st : s.structures)
    {
        if (st.destroyed || st.category != StructureCategory::Extractor)
            continue;
        const StructureDefinition* def = catalog.findStructure(st.key);
        if (!def || !def->extracts)
            continue;
        candidates[static_cast<std::size_t>(*def->extracts)].push_back(
            {st.id, st.level, st.health, st.staffingBonus, st.createdAt});
    }
    for (std::size_t i = 0; i < kResourceCount; ++i)
        in.extractors[i] = SelectExtractor(candidates[i]);

    return in;
}

} // namespace frontier
