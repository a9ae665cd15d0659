#pragma once
// include/frontier/economy/ResourceLedger.hpp
//
// Per-settlement resource stock. The only thing allowed to change balances.
//
//   credit()  adds, clamped to the capacity ceiling (excess reported as waste)
//   debit()   all-or-nothing; fails with INSUFFICIENT_RESOURCES + shortages
//   drain()   saturating subtraction for upkeep; reports what could not be paid
//
// Balances are never negative. Negative inputs are programming errors and
// throw std::invalid_argument.

#include "frontier/core/Error.hpp"
#include "frontier/economy/Resources.hpp"

#include <optional>
#include <vector>

namespace frontier {

struct CreditResult {
    ResourceAmounts applied{};
    ResourceAmounts wasted{};
};

struct NetApplication {
    ResourceAmounts credited{};
    ResourceAmounts wasted{};
    ResourceAmounts drained{};
    ResourceAmounts unmet{};
};

class ResourceLedger {
public:
    ResourceLedger() = default;
    explicit ResourceLedger(const ResourceAmounts& initial,
                            std::optional<ResourceAmounts> capacity = std::nullopt);

    [[nodiscard]] const ResourceAmounts& balances() const noexcept { return balances_; }
    [[nodiscard]] double balance(ResourceType t) const noexcept { return balances_[t]; }

    [[nodiscard]] const std::optional<ResourceAmounts>& capacity() const noexcept { return capacity_; }
    // Lowering the ceiling does not discard stock already held.
    void setCapacity(std::optional<ResourceAmounts> capacity) noexcept { capacity_ = capacity; }

    CreditResult credit(const ResourceAmounts& amounts);
    Status debit(const ResourceAmounts& amounts);
    [[nodiscard]] bool sufficiency(const ResourceAmounts& amounts) const;
    [[nodiscard]] std::vector<ResourceShortage> shortages(const ResourceAmounts& amounts) const;

    // Returns the unpaid remainder per resource.
    ResourceAmounts drain(const ResourceAmounts& amounts);

    // Positive components are credited, negative ones drained.
    NetApplication applyNet(const ResourceAmounts& net);

private:
    static void requireNonNegative(const ResourceAmounts& amounts, const char* op);

    ResourceAmounts balances_{};
    std::optional<ResourceAmounts> capacity_;
};

} // namespace frontier
