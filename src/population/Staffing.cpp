#include "frontier/population/Staffing.hpp"

#include "frontier/settlement/Settlement.hpp"

#include <algorithm>
#include <unordered_map>

namespace frontier {

double StaffingBonus(int assigned, const StaffingRequirement& req) noexcept
{
    if (assigned < req.required)
        return 1.0;
    return 1.0 + (assigned - req.required) * req.bonusPerWorker;
}

StaffingResult AssignStaffing(int population, const std::vector<StaffingCandidate>& candidates)
{
    StaffingResult r;
    r.assignments.reserve(candidates.size());
    for (const StaffingCandidate& c : candidates)
        r.assignments.push_back({c.id, 0, c.requirement.required, 1.0});

    std::vector<std::size_t> order;
    for (std::size_t i = 0; i < candidates.size(); ++i)
    {
        if (candidates[i].requirement.required > 0)
            order.push_back(i);
    }

    int remaining = std::max(0, population);

    // Phase 1: required posts, most important first.
    std::stable_sort(order.begin(), order.end(), [&](std::size_t a, std::size_t b) {
        return candidates[a].requirement.priority > candidates[b].requirement.priority;
    });
    for (std::size_t i : order)
    {
        const int want = candidates[i].requirement.required;
        const int give = std::min(want, remaining);
        r.assignments[i].assigned = give;
        remaining -= give;
        if (give < want)
            r.understaffed.push_back(candidates[i].id);
    }

    // Phase 2: optional posts, best return per worker first.
    std::stable_sort(order.begin(), order.end(), [&](std::size_t a, std::size_t b) {
        return candidates[a].requirement.bonusPerWorker > candidates[b].requirement.bonusPerWorker;
    });
    for (std::size_t i : order)
    {
        if (remaining == 0)
            break;
        const StaffingRequirement& req = candidates[i].requirement;
        StaffingAssignment& a = r.assignments[i];
        if (a.assigned < req.required)
            continue;
        const int give = std::min(req.required + req.optional - a.assigned, remaining);
        if (give > 0)
        {
            a.assigned += give;
            remaining -= give;
        }
    }

    for (std::size_t i = 0; i < candidates.size(); ++i)
        r.assignments[i].bonus = StaffingBonus(r.assignments[i].assigned, candidates[i].requirement);

    r.idle = remaining;
    return r;
}

StaffingResult ApplyStaffing(Settlement& s, const ICatalog& catalog)
{
    std::vector<StaffingCandidate> candidates;
    for (Structure& st : s.structures)
    {
        st.assignedWorkers = 0;
        st.staffingBonus = 1.0;
        if (st.destroyed)
            continue;
        if (const StaffingRequirement* req = catalog.staffingFor(st.key); req && req->required > 0)
            candidates.push_back({st.id, *req});
    }

    StaffingResult r = AssignStaffing(s.population.count, candidates);

    std::unordered_map<StructureId, const StaffingAssignment*> byId;
    for (const StaffingAssignment& a : r.assignments)
        byId.emplace(a.id, &a);
    for (Structure& st : s.structures)
    {
        if (const auto it = byId.find(st.id); it != byId.end())
        {
            st.assignedWorkers = it->second->assigned;
            st.staffingBonus = it->second->bonus;
        }
    }

    s.staffingDirty = false;
    return r;
}

} // namespace frontier
