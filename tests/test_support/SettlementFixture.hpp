#pragma once
// Shared builders for engine-level tests.

#include "frontier/catalog/Catalog.hpp"
#include "frontier/core/Config.hpp"
#include "frontier/core/Ids.hpp"
#include "frontier/settlement/Settlement.hpp"

#include <string>

namespace frontier::testing {

inline constexpr TileId kHomeTile = 900;

// A grassland settlement with one 6-slot home tile and roomy storage.
inline Settlement MakeSettlement(SettlementId id = 1, ResourceAmounts resources = ResourceAmounts::Uniform(500.0),
                                 int population = 10)
{
    Settlement s;
    s.id = id;
    s.owner = "owner-" + std::to_string(id);
    s.name = "Test " + std::to_string(id);

    Tile home;
    home.id = kHomeTile + id;
    home.biome = "GRASSLAND";
    home.region = "heartland";
    home.quality = ResourceAmounts::Of(50, 50, 50, 50, 50);
    home.slotCount = 6;
    s.tiles.push_back(home);

    s.storage = ResourceLedger(resources, ResourceAmounts::Uniform(10'000.0));
    s.population.count = population;
    return s;
}

inline Structure& AddStructure(Settlement& s, IdAllocator& ids, const ICatalog& catalog, const std::string& key,
                               int level = 1, std::optional<int> slot = std::nullopt)
{
    Structure st;
    st.id = ids.next();
    st.key = key;
    const StructureDefinition* def = catalog.findStructure(key);
    st.category = def ? def->category : StructureCategory::Building;
    st.level = level;
    if (slot)
    {
        st.tileId = s.tiles.front().id;
        st.slot = slot;
    }
    s.structures.push_back(st);
    return s.structures.back();
}

} // namespace frontier::testing
