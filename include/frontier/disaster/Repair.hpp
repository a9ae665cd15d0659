#pragma once
// include/frontier/disaster/Repair.hpp
//
// Repair pricing and the hourly passive repair a workshop provides.
//
//   cost = definitionCost * repairMultiplier * (healthRestored / 10) * (1 - discount)
//
// rounded up to whole units. The discount applies while the settlement's
// post-disaster repair window is open.

#include "frontier/catalog/Catalog.hpp"
#include "frontier/core/Config.hpp"
#include "frontier/settlement/Settlement.hpp"

namespace frontier {

[[nodiscard]] ResourceAmounts RepairCost(const StructureDefinition& def, double currentHealth,
                                         double repairMultiplier, double discount) noexcept;

// Discount in effect at `now` (0 when the window is closed or absent).
[[nodiscard]] double ActiveRepairDiscount(const Settlement& s, TimestampMs now) noexcept;

// Repair multiplier to use for `s` (window's disaster first, then the last one seen).
[[nodiscard]] double RepairMultiplierFor(const Settlement& s, TimestampMs now) noexcept;

// Full-price estimate for every damaged structure in `s`.
[[nodiscard]] ResourceAmounts EstimateRepairCost(const Settlement& s, const ICatalog& catalog,
                                                 double repairMultiplier);

// +1 health per elapsed interval for structures in 21..99 when a workshop
// stands. Skipped while the settlement is under impact. Returns structures healed.
int ApplyPassiveRepair(Settlement& s, const ICatalog& catalog, const SimConfig& cfg, TimestampMs now);

} // namespace frontier
