#pragma once
// include/frontier/settlement/AreaAccounting.hpp
//
// Building placement rules: area capacity from the town hall, minimum town hall
// level, and one-per-settlement structures. Queued buildings reserve area the
// same way built ones consume it. Extractors use tile slots, not area.

#include "frontier/catalog/Catalog.hpp"
#include "frontier/core/Config.hpp"
#include "frontier/core/Error.hpp"
#include "frontier/settlement/Settlement.hpp"

namespace frontier {

class IAreaValidator {
public:
    virtual ~IAreaValidator() = default;

    // Validates placing one new instance of `def`. Upgrades do not come here.
    [[nodiscard]] virtual Status validate(const Settlement& s, const StructureDefinition& def) const = 0;
};

struct AreaUsage {
    int used = 0;
    int reserved = 0;       // queued, not yet built
    int capacity = 0;

    [[nodiscard]] int available() const noexcept { return capacity - used - reserved; }
};

class AreaAccounting final : public IAreaValidator {
public:
    AreaAccounting(const SimConfig& cfg, const ICatalog& catalog) noexcept
        : cfg_(cfg), catalog_(catalog) {}

    [[nodiscard]] Status validate(const Settlement& s, const StructureDefinition& def) const override;
    [[nodiscard]] AreaUsage usage(const Settlement& s) const;
    [[nodiscard]] int capacityFor(int townHallLevel) const noexcept {
        return cfg_.baseAreaCapacity + cfg_.areaPerTownHallLevel * townHallLevel;
    }

private:
    const SimConfig& cfg_;
    const ICatalog& catalog_;
};

} // namespace frontier
