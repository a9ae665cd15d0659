#include "frontier/disaster/Repair.hpp"

#include <algorithm>
#include <cmath>

namespace frontier {

namespace {
    constexpr double kPassiveRepairMinHealth = 21.0;
    constexpr double kFullHealth = 100.0;
}

ResourceAmounts RepairCost(const StructureDefinition& def, double currentHealth,
                           double repairMultiplier, double discount) noexcept
{
    const double restored = std::clamp(kFullHealth - currentHealth, 0.0, kFullHealth);
    const double factor = repairMultiplier * (restored / 10.0) * (1.0 - std::clamp(discount, 0.0, 1.0));

    ResourceAmounts cost = def.cost * factor;
    for (double& x : cost.v)
        x = std::ceil(x - 1e-9);
    return cost;
}

double ActiveRepairDiscount(const Settlement& s, TimestampMs now) noexcept
{
    if (s.repairWindow && now < s.repairWindow->closesAt)
        return s.repairWindow->discount;
    return 0.0;
}

double RepairMultiplierFor(const Settlement& s, TimestampMs now) noexcept
{
    if (s.repairWindow && now < s.repairWindow->closesAt)
        return s.repairWindow->repairMultiplier;
    return s.lastRepairMultiplier;
}

ResourceAmounts EstimateRepairCost(const Settlement& s, const ICatalog& catalog, double repairMultiplier)
{
    ResourceAmounts total{};
    for (const Structure& st : s.structures)
    {
        if (st.health >= kFullHealth)
            continue;
        if (const StructureDefinition* def = catalog.findStructure(st.key))
            total += RepairCost(*def, st.health, repairMultiplier, 0.0);
    }
    return total;
}

int ApplyPassiveRepair(Settlement& s, const ICatalog& catalog, const SimConfig& cfg, TimestampMs now)
{
    if (cfg.passiveRepairInterval <= 0 || now - s.lastPassiveRepairAt < cfg.passiveRepairInterval)
        return 0;

    const DurationMs intervals = (now - s.lastPassiveRepairAt) / cfg.passiveRepairInterval;
    s.lastPassiveRepairAt += intervals * cfg.passiveRepairInterval;

    if (s.underImpact() || HighestRoleLevel(s, catalog, StructureRole::Workshop) == 0)
        return 0;

    int healed = 0;
    for (Structure& st : s.structures)
    {
        if (st.destroyed || st.health < kPassiveRepairMinHealth || st.health >= kFullHealth)
            continue;
        st.health = std::min(kFullHealth, st.health + static_cast<double>(intervals));
        ++healed;
    }
    return healed;
}

} // namespace frontier
