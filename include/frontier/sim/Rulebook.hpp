#pragma once
#include "frontier/catalog/Catalog.hpp"
#include "frontier/construction/ConstructionQueue.hpp"
#include "frontier/core/Config.hpp"
#include "frontier/disaster/DisasterCoordinator.hpp"
#include "frontier/population/PopulationEngine.hpp"
#include "frontier/settlement/AreaAccounting.hpp"

namespace frontier {

// The stateless engines wired to one config + catalog. Shared by the tick
// orchestrator and the command service; all state lives in World.
class Rulebook {
public:
    Rulebook(const SimConfig& cfg, const ICatalog& catalog)
        : config(cfg), catalog(catalog), area(cfg, catalog), queue(cfg, catalog, area),
          population(cfg, catalog), disasters(cfg, catalog, population) {}

    Rulebook(const Rulebook&) = delete;
    Rulebook& operator=(const Rulebook&) = delete;

    const SimConfig& config;
    const ICatalog& catalog;
    AreaAccounting area;
    ConstructionQueue queue;
    PopulationEngine population;
    DisasterCoordinator disasters;
};

} // namespace frontier
