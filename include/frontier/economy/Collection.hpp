#pragma once
#include "frontier/core/Config.hpp"
#include "frontier/economy/Production.hpp"
#include "frontier/economy/ResourceLedger.hpp"

#include <cstdint>

namespace frontier {

struct CollectionReport {
    std::uint64_t ticks = 0;
    ProductionBreakdown breakdown{};
    NetApplication applied{};
    TimestampMs collectedThrough = 0;   // new lastCollectedAt
};

// Applies whole elapsed ticks since lastCollectedAt through the ledger.
// The partial tick left over stays pending for the next collection.
CollectionReport CollectResources(Settlement& s, const ICatalog& catalog,
                                  const SimConfig& cfg, TimestampMs now);

} // namespace frontier
