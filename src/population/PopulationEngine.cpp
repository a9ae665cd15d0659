#include "frontier/population/PopulationEngine.hpp"

#include "frontier/core/Log.hpp"
#include "frontier/core/Rng.hpp"

#include <algorithm>
#include <cmath>

namespace frontier {

namespace {
    // Resilience earned from past disasters counts a fifth toward preparedness.
    constexpr double kResilienceWeight = 0.2;
    constexpr double kTraumaPerCasualty = 5.0;
    constexpr int kMaxCatchUpSteps = 48;
}

double ResourceSufficiency(double food, double water, int population, const SimConfig& cfg) noexcept
{
    if (population <= 0)
        return 100.0;

    const double pop = static_cast<double>(population);
    const double foodHours = food / (pop * cfg.foodPerPersonPerHour);
    const double waterHours = water / (pop * cfg.waterPerPersonPerHour);

    const auto normalize = [&cfg](double hours) {
        return std::clamp(hours / cfg.sufficiencyTargetHours * 100.0, 0.0, 100.0);
    };
    return (normalize(foodHours) + normalize(waterHours)) / 2.0;
}

double HousingQuality(int population, int capacity, double bestHousingQuality) noexcept
{
    double score = 100.0;
    const double ratio = capacity > 0 ? static_cast<double>(population) / capacity : 1.0;
    if (ratio > 0.9)       score -= 30.0;
    else if (ratio > 0.75) score -= 15.0;
    else if (ratio < 0.5)  score += 10.0;
    score += bestHousingQuality;
    return std::clamp(score, 0.0, 100.0);
}

double TraumaScore(const PopulationRecord& p, TimestampMs now, const SimConfig& cfg) noexcept
{
    if (p.recentCasualties <= 0 || cfg.traumaWindow <= 0)
        return 100.0;
    const double age = static_cast<double>(now - p.lastCasualtyAt);
    const double decay = std::max(0.0, 1.0 - age / static_cast<double>(cfg.traumaWindow));
    const double penalty = std::min(100.0, p.recentCasualties * kTraumaPerCasualty * decay);
    return 100.0 - penalty;
}

double BlendHappiness(const HappinessFactors& f, const HappinessWeights& w) noexcept
{
    const double total = w.sum();
    if (total <= 0.0)
        return 50.0;
    const double h = f.resourceSufficiency * w.resourceSufficiency + f.housing * w.housing +
                     f.preparedness * w.preparedness + f.trauma * w.trauma + f.morale * w.morale +
                     f.externalRelations * w.externalRelations;
    return std::clamp(h / total, 0.0, 100.0);
}

double HappinessGrowthFactor(double h) noexcept
{
    if (h < 30.0) return -1.0 + h / 30.0;
    if (h < 50.0) return (h - 30.0) / 20.0;
    if (h < 75.0) return 1.0 + (h - 50.0) / 25.0;
    return 2.0 + (h - 75.0) / 12.5;
}

double ImmigrationChance(double happiness, int population, int capacity, const SimConfig& cfg) noexcept
{
    if (happiness <= cfg.immigrationThreshold || population >= capacity || capacity <= 0)
        return 0.0;
    const double span = std::max(1.0, 100.0 - cfg.immigrationThreshold);
    const double room = 1.0 - static_cast<double>(population) / capacity;
    return 0.1 * (happiness - cfg.immigrationThreshold) / span * room;
}

double EmigrationChance(double happiness, int population, const SimConfig& cfg) noexcept
{
    if (happiness >= cfg.emigrationThreshold || population <= 1 || cfg.emigrationThreshold <= 0.0)
        return 0.0;
    return 0.15 * (cfg.emigrationThreshold - happiness) / cfg.emigrationThreshold;
}

int PopulationCapacity(const Settlement& s, const ICatalog& catalog, const SimConfig& cfg)
{
    int cap = cfg.basePopulationCapacity;
    for (const Structure& st : s.structures)
    {
        if (st.destroyed)
            continue;
        if (const StructureDefinition* def = catalog.findStructure(st.key))
            cap += def->housingCapacity * st.level;
    }
    return cap;
}

double DisasterPreparedness(const Settlement& s, const ICatalog& catalog, const SimConfig& cfg)
{
    const int pop = s.population.count;
    const int shelter = ShelterCapacity(s, catalog, cfg.shelterCapacityPerLevel);

    double coverage = 0.0;
    if (pop > 0)
        coverage = std::min(1.0, static_cast<double>(shelter) / pop);
    else if (shelter > 0)
        coverage = 1.0;

    double score = coverage * 50.0;
    if (HighestRoleLevel(s, catalog, StructureRole::Watchtower) > 0) score += 15.0;
    if (HighestRoleLevel(s, catalog, StructureRole::Hospital) > 0)   score += 15.0;

    double defense = 0.0;
    for (const Structure& st : s.structures)
    {
        if (st.destroyed)
            continue;
        const StructureDefinition* def = catalog.findStructure(st.key);
        if (def && def->role == StructureRole::Defense)
            defense += def->defenseBonus * st.level;
    }
    score += std::min(20.0, defense);
    score += s.resilience * kResilienceWeight;
    return std::min(100.0, score);
}

HappinessFactors PopulationEngine::evaluateFactors(const Settlement& s, TimestampMs now) const
{
    HappinessFactors f;
    const int pop = s.population.count;

    f.resourceSufficiency = ResourceSufficiency(s.storage.balance(ResourceType::Food),
                                                s.storage.balance(ResourceType::Water), pop, cfg_);

    double bestHousing = 0.0;
    for (const Structure& st : s.structures)
    {
        if (st.destroyed)
            continue;
        const StructureDefinition* def = catalog_.findStructure(st.key);
        if (def && def->role == StructureRole::Housing)
            bestHousing = std::max(bestHousing, def->housingQuality);
    }
    f.housing = HousingQuality(pop, PopulationCapacity(s, catalog_, cfg_), bestHousing);
    f.preparedness = DisasterPreparedness(s, catalog_, cfg_);
    f.trauma = TraumaScore(s.population, now, cfg_);
    f.morale = s.population.morale;
    f.externalRelations = s.population.externalRelations;
    return f;
}

double PopulationEngine::evaluateHappiness(const Settlement& s, TimestampMs now, bool* starving) const
{
    double h = BlendHappiness(evaluateFactors(s, now), cfg_.weights);

    const bool empty = s.storage.balance(ResourceType::Food) <= 0.0 || s.storage.balance(ResourceType::Water) <= 0.0;
    if (empty)
        h = std::min(h, cfg_.starvationCeiling);
    if (starving)
        *starving = empty;
    return h;
}

GrowthOutcome PopulationEngine::growthStep(Settlement& s, TimestampMs now) const
{
    PopulationRecord& p = s.population;

    GrowthOutcome out;
    out.before = p.count;
    out.capacity = PopulationCapacity(s, catalog_, cfg_);
    out.factors = evaluateFactors(s, now);
    out.happiness = evaluateHappiness(s, now, &out.starving);
    p.happiness = out.happiness;

    int count = std::min(p.count, out.capacity);

    // Natural change, fractional people carried over.
    if (out.capacity > 0)
    {
        const double room = 1.0 - static_cast<double>(count) / out.capacity;
        const double rate = cfg_.baseGrowthRate * HappinessGrowthFactor(out.happiness) * room;
        const double delta = count * rate + p.growthRemainder;
        const double whole = std::trunc(delta);
        p.growthRemainder = delta - whole;
        const int next = std::clamp(count + static_cast<int>(whole), 0, out.capacity);
        out.naturalChange = next - count;
        count = next;
    }

    rng::Pcg32 rng = rng::make_rng(cfg_.seed, s.id, p.growthSteps);

    if (rng.chance(ImmigrationChance(out.happiness, count, out.capacity, cfg_)))
    {
        out.immigrated = std::min(rng.next_int(2, 5), out.capacity - count);
        count += out.immigrated;
    }

    if (rng.chance(EmigrationChance(out.happiness, count, cfg_)))
    {
        const int cap = static_cast<int>(std::floor(count * 0.2));
        out.emigrated = std::clamp(std::min(rng.next_int(1, 3), cap), 0, std::max(0, count - 1));
        count -= out.emigrated;
    }

    p.count = count;
    p.growthSteps += 1;
    out.after = count;

    if (out.after != out.before)
        s.staffingDirty = true;
    return out;
}

std::optional<GrowthOutcome> PopulationEngine::maybeGrow(Settlement& s, TimestampMs now, EventList& events) const
{
    if (cfg_.growthInterval <= 0 || now - s.population.lastGrowthAt < cfg_.growthInterval)
        return std::nullopt;

    std::optional<GrowthOutcome> total;
    int steps = 0;
    while (now - s.population.lastGrowthAt >= cfg_.growthInterval && steps < kMaxCatchUpSteps)
    {
        s.population.lastGrowthAt += cfg_.growthInterval;
        const GrowthOutcome step = growthStep(s, s.population.lastGrowthAt);
        if (!total)
        {
            total = step;
        }
        else
        {
            total->after = step.after;
            total->naturalChange += step.naturalChange;
            total->immigrated += step.immigrated;
            total->emigrated += step.emigrated;
            total->capacity = step.capacity;
            total->happiness = step.happiness;
            total->starving = step.starving;
            total->factors = step.factors;
        }
        ++steps;
    }

    // Far behind (long outage): resume the cadence from now.
    if (now - s.population.lastGrowthAt >= cfg_.growthInterval)
    {
        logsys::get()->warn("Settlement {}: skipped population catch-up beyond {} steps", s.id, kMaxCatchUpSteps);
        s.population.lastGrowthAt = now;
    }

    events.push_back(SettlementEvent(EventKind::PopulationChanged, s.id, now, {
        {"before", total->before},
        {"after", total->after},
        {"capacity", total->capacity},
        {"happiness", total->happiness},
        {"immigrated", total->immigrated},
        {"emigrated", total->emigrated},
        {"starving", total->starving},
    }));
    return total;
}

int PopulationEngine::applyCasualties(Settlement& s, int casualties, TimestampMs now) const
{
    PopulationRecord& p = s.population;
    const int lost = std::clamp(casualties, 0, p.count);
    if (lost == 0)
        return 0;

    p.count -= lost;
    const bool recent = p.recentCasualties > 0 && now - p.lastCasualtyAt < cfg_.traumaWindow;
    p.recentCasualties = recent ? p.recentCasualties + lost : lost;
    p.lastCasualtyAt = now;
    s.staffingDirty = true;
    return lost;
}

int PopulationEngine::clampToCapacity(Settlement& s) const
{
    const int cap = PopulationCapacity(s, catalog_, cfg_);
    if (s.population.count <= cap)
        return 0;
    const int removed = s.population.count - cap;
    s.population.count = cap;
    s.staffingDirty = true;
    return removed;
}

} // namespace frontier
