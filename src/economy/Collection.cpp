#include "frontier/economy/Collection.hpp"

#include "frontier/catalog/Catalog.hpp"
#include "frontier/settlement/Settlement.hpp"

namespace frontier {

CollectionReport CollectResources(Settlement& s, const ICatalog& catalog, const SimConfig& cfg, TimestampMs now)
{
    CollectionReport report;
    report.collectedThrough = s.lastCollectedAt;

    // Ticks are counted from lastCollectedAt so a tick shorter than a whole
    // number of ms never loses its fraction between collections.
    const std::uint64_t total = ElapsedTicks(now - s.lastCollectedAt, cfg.tickRateHz);
    if (total <= s.ticksPastCollected)
        return report;
    report.ticks = total - s.ticksPastCollected;

    report.breakdown = ComputeProduction(BuildProductionInputs(s, catalog, cfg, report.ticks), cfg);
    report.applied = s.storage.applyNet(report.breakdown.net);

    if (const auto span = WholeTickSpanMs(total, cfg.tickRateHz))
    {
        s.lastCollectedAt += *span;
        s.ticksPastCollected = 0;
    }
    else
    {
        s.ticksPastCollected = total;
    }
    report.collectedThrough = s.lastCollectedAt;
    return report;
}

} // namespace frontier
