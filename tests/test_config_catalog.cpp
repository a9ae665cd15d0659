#include <doctest/doctest.h>

#include "frontier/catalog/Catalog.hpp"
#include "frontier/core/Config.hpp"
#include "frontier/core/Error.hpp"
#include "frontier/disaster/Disaster.hpp"
#include "frontier/sim/InMemoryPersistence.hpp"
#include "frontier/sim/Serialization.hpp"
#include "test_support/SettlementFixture.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

using namespace frontier;

TEST_CASE("SimConfig: sections override defaults, comments allowed")
{
    SimConfig cfg;
    std::string err;
    const bool ok = ParseSimConfig(R"({
        // tuned for a slow server
        "clock": { "tickRateHz": 20 },
        "construction": { "maxItems": 5, "concurrency": 2 },
        "population": { "growthIntervalMinutes": 15 },
        "disasters": { "repairWindowHours": 24 },
        "unknownSection": { "x": 1 }
    })", cfg, &err);

    REQUIRE_MESSAGE(ok, err);
    CHECK(cfg.tickRateHz == 20.0);
    CHECK(cfg.queueMaxItems == 5);
    CHECK(cfg.queueConcurrency == 2);
    CHECK(cfg.growthInterval == 15 * kMinuteMs);
    CHECK(cfg.repairWindow == 24 * kHourMs);
    CHECK(cfg.baseProductionRate == doctest::Approx(0.2));
}

TEST_CASE("SimConfig: out-of-range values are clamped")
{
    SimConfig cfg;
    REQUIRE(ParseSimConfig(R"({"construction": {"maxItems": 100000, "concurrency": 0}})", cfg));
    CHECK(cfg.queueMaxItems == 256);
    CHECK(cfg.queueConcurrency == 1);
}

TEST_CASE("SimConfig: invalid documents leave the config untouched")
{
    SimConfig cfg;
    cfg.queueMaxItems = 7;
    std::string err;

    CHECK_FALSE(ParseSimConfig("not json", cfg, &err));
    CHECK_FALSE(err.empty());

    CHECK_FALSE(ParseSimConfig(R"({"construction": {"maxItems": 3},
                                   "population": {"weights": {"housing": 90}}})", cfg, &err));
    CHECK(err.find("sum to 100") != std::string::npos);
    CHECK(cfg.queueMaxItems == 7);

    CHECK_FALSE(ParseSimConfig(R"({"production": {"maintenance": {"wood": -1}}})", cfg, &err));
    CHECK_FALSE(LoadSimConfig("/definitely/not/here.json", cfg, &err));
}

TEST_CASE("Catalog: overrides merge over the built-in definitions")
{
    StaticCatalog catalog = DefaultCatalog();
    const std::size_t before = catalog.size();
    std::string err;

    REQUIRE_MESSAGE(ParseCatalog(R"({
        "version": 2,
        "structures": [
            { "key": "GRANARY", "name": "Granary", "category": "BUILDING", "role": "STORAGE",
              "cost": {"wood": 60, "stone": 20}, "areaCost": 25, "storageBonus": 300,
              "prerequisites": [ {"structure": "STORAGE", "level": 1} ] },
            { "key": "FARM", "staffing": {"optional": 4} }
        ],
        "biomes": { "STEPPE": {"food": 1.0, "water": 0.7} }
    })", catalog, &err), err);

    CHECK(catalog.version() == 2);
    CHECK(catalog.size() == before + 1);

    const StructureDefinition* granary = catalog.findStructure("GRANARY");
    REQUIRE(granary);
    CHECK(granary->role == StructureRole::Storage);
    REQUIRE(granary->prerequisites.size() == 1);
    CHECK(granary->prerequisites[0].structureKey == "STORAGE");

    // Partial entries keep the fields they do not mention.
    const StructureDefinition* farm = catalog.findStructure("FARM");
    REQUIRE(farm);
    CHECK(farm->staffing.optional == 4);
    CHECK(farm->staffing.required == 2);
    CHECK(farm->cost == ResourceAmounts::Of(0, 0, 20, 10, 0));

    CHECK(catalog.biomeEfficiency("STEPPE", ResourceType::Water) == doctest::Approx(0.7));
    CHECK(catalog.biomeEfficiency("STEPPE", ResourceType::Ore) == doctest::Approx(1.0));
    CHECK(catalog.biomeEfficiency("NOWHERE", ResourceType::Food) == 1.0);
}

TEST_CASE("Catalog: malformed entries are rejected atomically")
{
    StaticCatalog catalog = DefaultCatalog();
    const std::size_t before = catalog.size();
    std::string err;

    CHECK_FALSE(ParseCatalog(R"({"structures": [
        {"key": "OK_ONE", "category": "BUILDING"},
        {"key": "BAD_MINE", "category": "EXTRACTOR"}
    ]})", catalog, &err));
    CHECK(err.find("BAD_MINE") != std::string::npos);
    CHECK(catalog.size() == before);
    CHECK(catalog.findStructure("OK_ONE") == nullptr);

    CHECK_FALSE(ParseCatalog(R"({"structures": [{"name": "no key"}]})", catalog, &err));
    CHECK_THROWS_AS((void)LoadCatalogFile("/definitely/not/here.json", catalog, &err), std::runtime_error);
}

TEST_CASE("Shipped data files load cleanly")
{
    const std::filesystem::path dataDir{FRONTIER_TEST_DATA_DIR};
    std::string err;

    SimConfig cfg;
    REQUIRE_MESSAGE(LoadSimConfig(dataDir / "sim_config.json", cfg, &err), err);
    CHECK(cfg.seed == 1592061965u);
    CHECK(cfg.queueMaxItems == 11);
    CHECK(cfg.weights.sum() == doctest::Approx(100.0));

    StaticCatalog catalog = DefaultCatalog();
    REQUIRE_MESSAGE(LoadCatalogFile(dataDir / "catalog_overrides.json", catalog, &err), err);
    CHECK(catalog.findStructure("GRANARY") != nullptr);
    CHECK(catalog.staffingFor("FARM")->optional == 4);
}

TEST_CASE("Errors: every code maps to its category")
{
    CHECK(ErrorCategoryOf(ErrorCode::InvalidSlot) == ErrorCategory::Validation);
    CHECK(ErrorCategoryOf(ErrorCode::QueueFull) == ErrorCategory::Precondition);
    CHECK(ErrorCategoryOf(ErrorCode::QueueItemNotFound) == ErrorCategory::NotFound);
    CHECK(ErrorCategoryOf(ErrorCode::NotSettlementOwner) == ErrorCategory::Conflict);
    CHECK(ErrorCategoryOf(ErrorCode::PersistenceFailed) == ErrorCategory::Internal);
    CHECK(std::string(ErrorCodeName(ErrorCode::QueueFull)) == "QUEUE_FULL");

    CommandError e = MakeError(ErrorCode::InsufficientResources, "short");
    e.shortages.push_back({ResourceType::Stone, 10.0, 4.0});
    const nlohmann::json j = e;
    CHECK(j["category"] == "PRECONDITION");
    CHECK(j["shortages"][0]["resource"] == "stone");
    CHECK(j["shortages"][0]["shortBy"].get<double>() == doctest::Approx(6.0));
}

TEST_CASE("Serialization: a settlement survives a JSON round trip")
{
    const StaticCatalog catalog = DefaultCatalog();
    IdAllocator ids;
    Settlement s = testing::MakeSettlement(3, ResourceAmounts::Of(1, 2, 3, 4, 5), 12);
    Structure& farm = testing::AddStructure(s, ids, catalog, "FARM", 2, 4);
    farm.health = 61.5;
    s.research.insert("irrigation");
    s.repairWindow = RepairWindow{8, 5000, 0.5, 0.3};
    s.impacts[9] = ResourceAmounts::Of(0.5, 0.7, 1.0, 1.0, 1.0);
    s.lastCollectedAt = 950;
    s.ticksPastCollected = 1;

    ConstructionQueueItem q;
    q.id = ids.next();
    q.settlementId = s.id;
    q.structureKey = "WELL";
    q.status = QueueStatus::InProgress;
    q.tileId = s.tiles.front().id;
    q.slot = 1;
    q.completesAt = 9000;
    s.queue.push_back(q);

    const nlohmann::json j = s;
    const Settlement back = j.get<Settlement>();

    CHECK(back.id == 3);
    CHECK(back.owner == s.owner);
    CHECK(back.storage.balances() == s.storage.balances());
    CHECK(back.population.count == 12);
    REQUIRE(back.structures.size() == 1);
    CHECK(back.structures[0].health == doctest::Approx(61.5));
    CHECK(back.structures[0].slot == 4);
    CHECK(back.structures[0].category == StructureCategory::Extractor);
    REQUIRE(back.queue.size() == 1);
    CHECK(back.queue[0].status == QueueStatus::InProgress);
    CHECK(back.queue[0].slot == 1);
    CHECK(back.research.count("irrigation") == 1);
    REQUIRE(back.repairWindow);
    CHECK(back.repairWindow->closesAt == 5000);
    CHECK(back.impacts == s.impacts);
    CHECK(back.underImpact());
    CHECK(back.lastCollectedAt == 950);
    CHECK(back.ticksPastCollected == 1);
    CHECK(back.staffingDirty);
}

TEST_CASE("Serialization: a disaster caught mid-impact reloads with its progress")
{
    DisasterEvent e;
    e.id = 41;
    e.worldId = 2;
    e.type = DisasterType::Blizzard;
    e.severity = 72.5;
    e.affectedBiomes = {"TUNDRA"};
    e.scheduledAt = 10 * kHourMs;
    e.impactDuration = 2 * kHourMs;
    e.status = DisasterStatus::Impact;
    e.warningStartedAt = 4 * kHourMs;
    e.impactStartedAt = 10 * kHourMs;
    e.imminentSent = true;
    e.damageTicksApplied = 5;
    SettlementExposure& x = e.exposure[7];
    x.casualties = 3.75;
    x.damageDealt = 18.0;
    x.damaged = {100, 101};
    x.destroyed = {101};

    InMemoryPersistence store;
    UnitOfWork work;
    work.disasters.push_back(&e);
    std::string err;
    REQUIRE(store.commit(work, &err));
    CHECK(store.disasterIds() == std::vector<DisasterId>{41});
    CHECK_FALSE(store.loadDisaster(42).has_value());

    const std::optional<DisasterEvent> back = store.loadDisaster(41);
    REQUIRE(back);
    CHECK(back->type == DisasterType::Blizzard);
    CHECK(back->severity == doctest::Approx(72.5));
    CHECK(back->affectedBiomes == e.affectedBiomes);
    CHECK(back->status == DisasterStatus::Impact);
    CHECK(back->impactDuration == 2 * kHourMs);
    CHECK(back->imminentSent);
    CHECK(back->damageTicksApplied == 5);
    CHECK_FALSE(back->summary.has_value());

    REQUIRE(back->exposure.count(7) == 1);
    const SettlementExposure& bx = back->exposure.at(7);
    CHECK(bx.casualties == doctest::Approx(3.75));
    CHECK(bx.damageDealt == doctest::Approx(18.0));
    CHECK(bx.damaged == std::set<StructureId>{100, 101});
    CHECK(bx.destroyed == std::set<StructureId>{101});
}
