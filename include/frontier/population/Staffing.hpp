#pragma once
// include/frontier/population/Staffing.hpp
//
// Assigns settlers to structures that need workers.
//
//   1. structures with required > 0, by priority (desc): give min(required, left);
//      anything short of required is recorded as understaffed
//   2. remaining settlers go to optional slots, by bonusPerWorker (desc),
//      up to required + optional
//
// bonus = 1                                       if assigned < required
//       = 1 + (assigned - required) * perWorker   otherwise

#include "frontier/catalog/Catalog.hpp"
#include "frontier/core/Ids.hpp"

#include <vector>

namespace frontier {

struct Settlement;

struct StaffingCandidate {
    StructureId id = 0;
    StaffingRequirement requirement{};
};

struct StaffingAssignment {
    StructureId id = 0;
    int assigned = 0;
    int required = 0;
    double bonus = 1.0;
};

struct StaffingResult {
    std::vector<StaffingAssignment> assignments;    // input order
    std::vector<StructureId> understaffed;
    int idle = 0;                                   // settlers left without a post
};

[[nodiscard]] double StaffingBonus(int assigned, const StaffingRequirement& req) noexcept;

// Equal priorities (and equal bonuses) keep the candidates' input order.
[[nodiscard]] StaffingResult AssignStaffing(int population, const std::vector<StaffingCandidate>& candidates);

// Recomputes assignments for every non-destroyed structure and writes
// assignedWorkers / staffingBonus back. Clears Settlement::staffingDirty.
StaffingResult ApplyStaffing(Settlement& s, const ICatalog& catalog);

} // namespace frontier
