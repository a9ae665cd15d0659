#include "frontier/economy/Resources.hpp"

#include <nlohmann/json.hpp>

#include <cmath>

namespace frontier {

const char* ResourceTypeName(ResourceType t) noexcept
{
    switch (t)
    {
    case ResourceType::Food:  return "food";
    case ResourceType::Water: return "water";
    case ResourceType::Wood:  return "wood";
    case ResourceType::Stone: return "stone";
    case ResourceType::Ore:   return "ore";
    }
    return "unknown";
}

std::optional<ResourceType> ParseResourceType(std::string_view name) noexcept
{
    for (ResourceType t : kAllResources)
    {
        if (name == ResourceTypeName(t))
            return t;
    }
    return std::nullopt;
}

ResourceAmounts Floor(const ResourceAmounts& a) noexcept
{
    ResourceAmounts r;
    for (std::size_t i = 0; i < kResourceCount; ++i)
        r.v[i] = std::floor(a.v[i]);
    return r;
}

void to_json(nlohmann::json& j, const ResourceAmounts& r)
{
    j = nlohmann::json::object();
    for (ResourceType t : kAllResources)
        j[ResourceTypeName(t)] = r[t];
}

void from_json(const nlohmann::json& j, ResourceAmounts& r)
{
    r = ResourceAmounts{};
    if (!j.is_object())
        return;
    for (ResourceType t : kAllResources)
    {
        const auto it = j.find(ResourceTypeName(t));
        if (it != j.end() && it->is_number())
            r[t] = it->get<double>();
    }
}

} // namespace frontier
