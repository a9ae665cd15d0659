#pragma once
// include/frontier/construction/ConstructionQueue.hpp
//
// Per-settlement build/upgrade queue.
//
// Item lifecycle:  QUEUED -> IN_PROGRESS -> COMPLETE
//                  QUEUED -> CANCELLED     (IN_PROGRESS items cannot be cancelled)
//
// Submission checks run in this order and nothing is mutated until all pass:
//   definition, population requirement, prerequisites, tile/slot (extractors),
//   area/tier/uniqueness (buildings), queue capacity, then the ledger debit.
// The debit is the last step, so a rejected submission never touches resources.
//
// Settlement::queue holds only non-terminal items. Positions stay dense and
// 0-based after every removal; at most SimConfig::queueConcurrency items are
// IN_PROGRESS.

#include "frontier/catalog/Catalog.hpp"
#include "frontier/core/Config.hpp"
#include "frontier/core/Error.hpp"
#include "frontier/core/Ids.hpp"
#include "frontier/settlement/AreaAccounting.hpp"
#include "frontier/settlement/Settlement.hpp"
#include "frontier/sim/Events.hpp"

#include <optional>
#include <string>
#include <vector>

namespace frontier {

struct BuildRequest {
    std::string structureKey;
    std::optional<TileId> tileId;
    std::optional<int> slot;
    bool emergency = false;     // half the time, 2.5x the cost
};

struct CompletedConstruction {
    QueueItemId item = 0;
    StructureId structure = 0;
    std::string structureKey;
    int level = 1;
    bool upgrade = false;
};

struct AdvanceResult {
    std::vector<CompletedConstruction> completed;
    std::vector<QueueItemId> started;

    [[nodiscard]] bool changed() const noexcept { return !completed.empty() || !started.empty(); }
};

class ConstructionQueue {
public:
    ConstructionQueue(const SimConfig& cfg, const ICatalog& catalog, const IAreaValidator& area) noexcept
        : cfg_(cfg), catalog_(catalog), area_(area) {}

    Result<ConstructionQueueItem> submit(Settlement& s, const BuildRequest& req, TimestampMs now,
                                         IdAllocator& ids, EventList& events) const;

    Result<ConstructionQueueItem> submitUpgrade(Settlement& s, StructureId target, bool emergency,
                                                TimestampMs now, IdAllocator& ids, EventList& events) const;

    // Refunds the deducted resources in full.
    Status cancel(Settlement& s, QueueItemId item, TimestampMs now, EventList& events) const;

    // Completes due IN_PROGRESS items and promotes QUEUED ones.
    AdvanceResult advance(Settlement& s, TimestampMs now, IdAllocator& ids, EventList& events) const;

    // Cost/time of building `def` at `targetLevel` (upgrades scale with level).
    [[nodiscard]] ResourceAmounts costFor(const StructureDefinition& def, int targetLevel, bool emergency) const noexcept;
    [[nodiscard]] DurationMs durationFor(const StructureDefinition& def, int targetLevel, bool emergency) const noexcept;

    [[nodiscard]] static int ActiveCount(const Settlement& s) noexcept;
    [[nodiscard]] static int PendingCount(const Settlement& s) noexcept;   // QUEUED + IN_PROGRESS
    [[nodiscard]] static bool PositionsDense(const Settlement& s);

private:
    [[nodiscard]] Status checkPrerequisites(const Settlement& s, const StructureDefinition& def) const;
    [[nodiscard]] Status checkSlot(const Settlement& s, const BuildRequest& req) const;
    [[nodiscard]] Status checkCapacity(const Settlement& s) const;

    Result<ConstructionQueueItem> enqueue(Settlement& s, ConstructionQueueItem item, TimestampMs now,
                                          EventList& events) const;
    void start(ConstructionQueueItem& item, TimestampMs now) const;
    CompletedConstruction materialize(Settlement& s, const ConstructionQueueItem& item,
                                      IdAllocator& ids, EventList& events) const;
    static void renumber(Settlement& s);

    const SimConfig& cfg_;
    const ICatalog& catalog_;
    const IAreaValidator& area_;
};

} // namespace frontier
