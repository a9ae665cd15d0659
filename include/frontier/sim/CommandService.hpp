#pragma once
// include/frontier/sim/CommandService.hpp
//
// Player-facing command surface. Each command:
//   1. finds the settlement (NOT_FOUND) and checks ownership (CONFLICT)
//   2. locks that settlement and snapshots it
//   3. runs the engine operation (VALIDATION / PRECONDITION errors leave the
//      settlement untouched)
//   4. commits through IPersistence; on failure restores the snapshot and
//      returns INTERNAL / PERSISTENCE_FAILED
//   5. hands the resulting events to the publisher (failures are only logged)

#include "frontier/construction/ConstructionQueue.hpp"
#include "frontier/core/Error.hpp"
#include "frontier/economy/Collection.hpp"
#include "frontier/economy/Transfers.hpp"
#include "frontier/sim/Boundary.hpp"
#include "frontier/sim/NotificationPublisher.hpp"
#include "frontier/sim/Rulebook.hpp"
#include "frontier/sim/World.hpp"

#include <functional>
#include <string>

namespace frontier {

struct FoundSettlementRequest {
    PlayerId owner;
    std::string name;
    double x = 0.0;
    double y = 0.0;
    Tile homeTile{};
    std::vector<Tile> extraTiles;
};

struct RepairReceipt {
    StructureId structure = 0;
    double healthBefore = 0.0;
    ResourceAmounts cost{};
    double discount = 0.0;
};

class CommandService {
public:
    // `publisher` may be null (events are then dropped).
    CommandService(World& world, const Rulebook& rules, IPersistence& persistence,
                   NotificationPublisher* publisher) noexcept
        : world_(world), rules_(rules), persistence_(persistence), publisher_(publisher) {}

    Result<SettlementId> foundSettlement(const FoundSettlementRequest& req, TimestampMs now);

    Result<ConstructionQueueItem> submitConstruction(const PlayerId& actor, SettlementId settlement,
                                                     const BuildRequest& req, TimestampMs now);
    Result<ConstructionQueueItem> submitUpgrade(const PlayerId& actor, SettlementId settlement,
                                                StructureId structure, bool emergency, TimestampMs now);
    Status cancelConstruction(const PlayerId& actor, QueueItemId item, TimestampMs now);

    // Refunds part of the base cost. Returns the amount credited.
    Result<ResourceAmounts> demolishStructure(const PlayerId& actor, SettlementId settlement,
                                              StructureId structure, TimestampMs now);
    Result<RepairReceipt> repairStructure(const PlayerId& actor, SettlementId settlement,
                                          StructureId structure, TimestampMs now);

    Result<CollectionReport> collectResources(const PlayerId& actor, SettlementId settlement, TimestampMs now);

    Result<Transfer> initiateTransfer(const PlayerId& actor, SettlementId from, SettlementId to,
                                      ResourceType resource, double amount, TimestampMs now);

private:
    template <class T>
    using Mutation = std::function<Result<T>(Settlement&, EventList&, UnitOfWork&)>;

    // Steps 1-5 above for one settlement.
    template <class T>
    Result<T> mutate(const PlayerId& actor, SettlementId settlement, const Mutation<T>& fn);

    template <class T>
    Result<T> mutateLocked(SettlementContext& ctx, const Mutation<T>& fn);

    void publish(EventList events);

    World& world_;
    const Rulebook& rules_;
    IPersistence& persistence_;
    NotificationPublisher* publisher_;
};

} // namespace frontier
