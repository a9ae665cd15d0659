#pragma once

#include <nlohmann/json_fwd.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace frontier {

enum class ResourceType : std::uint8_t {
    Food = 0,
    Water,
    Wood,
    Stone,
    Ore,
};

inline constexpr std::size_t kResourceCount = 5;

inline constexpr std::array<ResourceType, kResourceCount> kAllResources{
    ResourceType::Food, ResourceType::Water, ResourceType::Wood,
    ResourceType::Stone, ResourceType::Ore,
};

[[nodiscard]] const char* ResourceTypeName(ResourceType t) noexcept;
[[nodiscard]] std::optional<ResourceType> ParseResourceType(std::string_view name) noexcept;

// Fixed-size bundle of the five resources. Used for balances, costs, deltas.
struct ResourceAmounts {
    std::array<double, kResourceCount> v{};

    [[nodiscard]] static ResourceAmounts Of(double food, double water, double wood,
                                            double stone, double ore) noexcept {
        ResourceAmounts r;
        r.v = {food, water, wood, stone, ore};
        return r;
    }

    [[nodiscard]] static ResourceAmounts Uniform(double x) noexcept {
        return Of(x, x, x, x, x);
    }

    double& operator[](ResourceType t) noexcept { return v[static_cast<std::size_t>(t)]; }
    double operator[](ResourceType t) const noexcept { return v[static_cast<std::size_t>(t)]; }

    ResourceAmounts& operator+=(const ResourceAmounts& o) noexcept {
        for (std::size_t i = 0; i < kResourceCount; ++i) v[i] += o.v[i];
        return *this;
    }
    ResourceAmounts& operator-=(const ResourceAmounts& o) noexcept {
        for (std::size_t i = 0; i < kResourceCount; ++i) v[i] -= o.v[i];
        return *this;
    }
    ResourceAmounts& operator*=(double k) noexcept {
        for (double& x : v) x *= k;
        return *this;
    }

    [[nodiscard]] bool isZero() const noexcept {
        for (double x : v) if (x != 0.0) return false;
        return true;
    }
    [[nodiscard]] bool anyNegative() const noexcept {
        for (double x : v) if (x < 0.0) return true;
        return false;
    }
    [[nodiscard]] double total() const noexcept {
        double s = 0.0;
        for (double x : v) s += x;
        return s;
    }

    friend bool operator==(const ResourceAmounts&, const ResourceAmounts&) = default;
};

inline ResourceAmounts operator+(ResourceAmounts a, const ResourceAmounts& b) noexcept { return a += b; }
inline ResourceAmounts operator-(ResourceAmounts a, const ResourceAmounts& b) noexcept { return a -= b; }
inline ResourceAmounts operator*(ResourceAmounts a, double k) noexcept { return a *= k; }

// Component-wise floor; used when quantities must land on whole units.
[[nodiscard]] ResourceAmounts Floor(const ResourceAmounts& a) noexcept;

// {"food": 1, "water": 2, ...}. Missing keys read as 0.
void to_json(nlohmann::json& j, const ResourceAmounts& r);
void from_json(const nlohmann::json& j, ResourceAmounts& r);

} // namespace frontier
