#include "frontier/economy/ResourceLedger.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace frontier {

namespace {
    // Tolerance for floating-point sums of fractional production.
    constexpr double kEpsilon = 1e-9;
}

ResourceLedger::ResourceLedger(const ResourceAmounts& initial, std::optional<ResourceAmounts> capacity)
    : capacity_(capacity)
{
    requireNonNegative(initial, "initial balance");
    balances_ = initial;
}

void ResourceLedger::requireNonNegative(const ResourceAmounts& amounts, const char* op)
{
    if (amounts.anyNegative())
        throw std::invalid_argument(std::string("ResourceLedger: negative amount passed to ") + op);
}

CreditResult ResourceLedger::credit(const ResourceAmounts& amounts)
{
    requireNonNegative(amounts, "credit");

    CreditResult r;
    for (ResourceType t : kAllResources)
    {
        double add = amounts[t];
        if (capacity_)
        {
            const double room = std::max(0.0, (*capacity_)[t] - balances_[t]);
            if (add > room)
            {
                r.wasted[t] = add - room;
                add = room;
            }
        }
        balances_[t] += add;
        r.applied[t] = add;
    }
    return r;
}

Status ResourceLedger::debit(const ResourceAmounts& amounts)
{
    requireNonNegative(amounts, "debit");

    std::vector<ResourceShortage> missing = shortages(amounts);
    if (!missing.empty())
    {
        CommandError e = MakeError(ErrorCode::InsufficientResources, "Insufficient resources");
        e.shortages = std::move(missing);
        return e;
    }

    for (ResourceType t : kAllResources)
        balances_[t] = std::max(0.0, balances_[t] - amounts[t]);
    return Ok();
}

bool ResourceLedger::sufficiency(const ResourceAmounts& amounts) const
{
    for (ResourceType t : kAllResources)
    {
        if (balances_[t] + kEpsilon < amounts[t])
            return false;
    }
    return true;
}

std::vector<ResourceShortage> ResourceLedger::shortages(const ResourceAmounts& amounts) const
{
    std::vector<ResourceShortage> out;
    for (ResourceType t : kAllResources)
    {
        if (balances_[t] + kEpsilon < amounts[t])
            out.push_back({t, amounts[t], balances_[t]});
    }
    return out;
}

ResourceAmounts ResourceLedger::drain(const ResourceAmounts& amounts)
{
    requireNonNegative(amounts, "drain");

    ResourceAmounts unmet;
    for (ResourceType t : kAllResources)
    {
        const double take = std::min(balances_[t], amounts[t]);
        balances_[t] -= take;
        unmet[t] = amounts[t] - take;
    }
    return unmet;
}

NetApplication ResourceLedger::applyNet(const ResourceAmounts& net)
{
    ResourceAmounts gains;
    ResourceAmounts losses;
    for (ResourceType t : kAllResources)
    {
        if (net[t] > 0.0) gains[t] = net[t];
        else              losses[t] = -net[t];
    }

    NetApplication r;
    const CreditResult c = credit(gains);
    r.credited = c.applied;
    r.wasted = c.wasted;
    r.unmet = drain(losses);
    r.drained = losses - r.unmet;
    return r;
}

} // namespace frontier
