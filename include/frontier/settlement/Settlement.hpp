#pragma once
// include/frontier/settlement/Settlement.hpp
//
// Settlement aggregate: everything one SettlementContext mutex protects.
// Copyable on purpose: commands and ticks snapshot it and restore the copy
// when the persistence commit fails.

#include "frontier/catalog/Catalog.hpp"
#include "frontier/core/Ids.hpp"
#include "frontier/core/Time.hpp"
#include "frontier/economy/ResourceLedger.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace frontier {

struct Tile {
    TileId id = 0;
    std::string biome = "GRASSLAND";
    std::string region;
    ResourceAmounts quality{};              // 0..100 per resource, 0 = resource absent
    double baseProductionModifier = 1.0;
    int slotCount = 4;                      // extractor slots, 4..9
};

struct Structure {
    StructureId id = 0;
    std::string key;                        // catalog key
    StructureCategory category = StructureCategory::Building;
    int level = 1;
    double health = 100.0;                  // 0..100
    bool destroyed = false;                 // health hit 0 during a disaster

    std::optional<TileId> tileId;           // extractors only
    std::optional<int> slot;

    int assignedWorkers = 0;
    double staffingBonus = 1.0;

    TimestampMs createdAt = 0;
};

enum class QueueStatus : std::uint8_t {
    Queued = 0,
    InProgress,
    Complete,
    Cancelled,
};

[[nodiscard]] const char* QueueStatusName(QueueStatus s) noexcept;

struct ConstructionQueueItem {
    QueueItemId id = 0;
    SettlementId settlementId = 0;
    std::string structureKey;

    std::optional<StructureId> upgradeOf;   // set for upgrades
    int targetLevel = 1;

    ResourceAmounts deducted{};
    QueueStatus status = QueueStatus::Queued;
    int position = 0;                       // dense, 0-based among non-terminal items
    bool emergency = false;

    TimestampMs queuedAt    = 0;
    TimestampMs startedAt   = 0;
    TimestampMs completesAt = 0;
    DurationMs  duration    = 0;

    std::optional<TileId> tileId;           // reservation for new extractors
    std::optional<int> slot;

    [[nodiscard]] bool isTerminal() const noexcept {
        return status == QueueStatus::Complete || status == QueueStatus::Cancelled;
    }
};

struct PopulationRecord {
    int count = 0;
    double happiness = 50.0;
    TimestampMs lastGrowthAt = 0;
    std::uint64_t growthSteps = 0;

    double growthRemainder = 0.0;           // fractional people carried between steps
    double morale = 50.0;
    double externalRelations = 50.0;

    // Trauma from the last disaster's casualties, decays over the trauma window.
    int recentCasualties = 0;
    TimestampMs lastCasualtyAt = 0;
};

struct RepairWindow {
    DisasterId disaster = 0;
    TimestampMs closesAt = 0;
    double discount = 0.0;                  // 0.5 = half price
    double repairMultiplier = 0.2;
};

struct Settlement {
    SettlementId id = 0;
    WorldId worldId = 0;
    PlayerId owner;
    std::string name;
    double x = 0.0;                         // world coordinates (transfers)
    double y = 0.0;

    std::vector<Tile> tiles;                // tiles[0] is the home tile
    ResourceLedger storage;
    PopulationRecord population;
    std::vector<Structure> structures;
    std::vector<ConstructionQueueItem> queue;   // non-terminal items only
    std::set<std::string> research;

    TimestampMs foundedAt = 0;
    TimestampMs lastCollectedAt = 0;       // always on a tick boundary
    std::uint64_t ticksPastCollected = 0;  // ticks applied after lastCollectedAt
    TimestampMs lastPassiveRepairAt = 0;

    // Disaster state.
    std::optional<DisasterId> activeDisaster;
    std::map<DisasterId, ResourceAmounts> impacts;  // events in IMPACT here -> their production penalty
    std::optional<RepairWindow> repairWindow;
    double lastRepairMultiplier = 0.2;
    double resilience = 0.0;

    bool staffingDirty = true;

    [[nodiscard]] const Tile* homeTile() const noexcept { return tiles.empty() ? nullptr : &tiles.front(); }
    [[nodiscard]] const Tile* findTile(TileId id) const noexcept;
    [[nodiscard]] Structure* findStructure(StructureId id) noexcept;
    [[nodiscard]] const Structure* findStructure(StructureId id) const noexcept;
    [[nodiscard]] ConstructionQueueItem* findQueueItem(QueueItemId id) noexcept;

    // Highest level among non-destroyed structures with `key` (0 if none).
    [[nodiscard]] int structureLevel(const std::string& key) const noexcept;
    [[nodiscard]] int activeStructureCount() const noexcept;

    [[nodiscard]] bool underImpact() const noexcept { return !impacts.empty(); }
    // Per-resource minimum over every event currently in IMPACT (1.0 when none).
    [[nodiscard]] ResourceAmounts productionPenalty() const noexcept;
};

// Derived quantities shared by several engines.
[[nodiscard]] int HighestRoleLevel(const Settlement& s, const ICatalog& catalog, StructureRole role);
[[nodiscard]] int TownHallLevel(const Settlement& s, const ICatalog& catalog);
[[nodiscard]] int SettlementTier(const Settlement& s, const ICatalog& catalog);
[[nodiscard]] ResourceAmounts StorageCapacity(const Settlement& s, const ICatalog& catalog, double baseCapacity);
[[nodiscard]] int ShelterCapacity(const Settlement& s, const ICatalog& catalog, int perLevel);

// Re-derive the ledger ceiling after the structure set changed.
void RefreshStorageCapacity(Settlement& s, const ICatalog& catalog, double baseCapacity);

} // namespace frontier
