#pragma once
// include/frontier/sim/World.hpp
//
// Explicit per-world context: settlements (each behind its own mutex),
// disaster events and caravans in flight. Ticks and commands lock one
// settlement at a time; no code path holds two settlement locks at once.

#include "frontier/core/Ids.hpp"
#include "frontier/disaster/Disaster.hpp"
#include "frontier/disaster/DisasterCoordinator.hpp"
#include "frontier/economy/Transfers.hpp"
#include "frontier/settlement/Settlement.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace frontier {

struct SettlementContext {
    explicit SettlementContext(Settlement s) : id(s.id), settlement(std::move(s)) {}

    const SettlementId id;  // readable without the lock
    std::mutex mutex;
    Settlement settlement;
};

class World final : public ISettlementDirectory {
public:
    World(WorldId id, std::uint64_t seed) noexcept : id_(id), seed_(seed) {}

    World(const World&) = delete;
    World& operator=(const World&) = delete;

    [[nodiscard]] WorldId id() const noexcept { return id_; }
    [[nodiscard]] std::uint64_t seed() const noexcept { return seed_; }
    [[nodiscard]] IdAllocator& ids() noexcept { return ids_; }

    // --- settlements ---
    SettlementContext& addSettlement(Settlement s);
    [[nodiscard]] SettlementContext* find(SettlementId id);
    [[nodiscard]] std::vector<SettlementContext*> contexts();
    [[nodiscard]] std::size_t settlementCount() const;

    // Locks the settlement owning `item` and runs `fn`. Returns false if no
    // settlement currently holds the item.
    bool withQueueItemOwner(QueueItemId item, const std::function<void(SettlementContext&)>& fn);

    void forEachSettlement(WorldId world, const std::function<void(Settlement&)>& fn) override;

    // --- disasters (caller holds disasterMutex() while touching events) ---
    DisasterId scheduleDisaster(DisasterEvent e);
    [[nodiscard]] std::mutex& disasterMutex() noexcept { return disasterMutex_; }
    [[nodiscard]] std::vector<DisasterEvent>& disasters() noexcept { return disasters_; }
    [[nodiscard]] DisasterEvent* findDisaster(DisasterId id);
    // Earliest non-resolved event that has reached WARNING or later.
    [[nodiscard]] std::optional<DisasterId> activeDisaster();

    // --- transfers ---
    void addTransfer(const Transfer& t);
    // Removes and returns transfers due at `now`, grouped by destination.
    [[nodiscard]] std::map<SettlementId, std::vector<Transfer>> takeArrivedTransfers(TimestampMs now);
    // Puts transfers back (their delivery could not be committed).
    void restoreTransfers(const std::vector<Transfer>& transfers);
    [[nodiscard]] std::vector<Transfer> pendingTransfers() const;

private:
    WorldId id_;
    std::uint64_t seed_;
    IdAllocator ids_;

    mutable std::mutex registryMutex_;
    std::map<SettlementId, std::unique_ptr<SettlementContext>> settlements_;

    std::mutex disasterMutex_;
    std::vector<DisasterEvent> disasters_;

    mutable std::mutex transferMutex_;
    std::vector<Transfer> transfers_;
};

} // namespace frontier
