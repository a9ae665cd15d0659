#include <doctest/doctest.h>

#include "frontier/catalog/Catalog.hpp"
#include "frontier/core/Config.hpp"
#include "frontier/economy/Collection.hpp"
#include "frontier/economy/Production.hpp"
#include "test_support/SettlementFixture.hpp"

using namespace frontier;

namespace {

ProductionInputs GrasslandFoodInputs()
{
    ProductionInputs in;
    in.tileQuality = ResourceAmounts::Of(50, 0, 0, 0, 0);
    in.biomeEfficiency = ResourceAmounts::Of(1.2, 1.0, 0.8, 0.6, 0.5);
    in.ticks = 1;
    return in;
}

} // namespace

TEST_CASE("Production: no extractor runs at tier multiplier 1")
{
    const SimConfig cfg;
    const ProductionBreakdown b = ComputeProduction(GrasslandFoodInputs(), cfg);

    CHECK(b.production[ResourceType::Food] == doctest::Approx(0.12));
    CHECK(b.tierMultiplier[ResourceType::Food] == 1.0);
}

TEST_CASE("Production: level 1 extractor at full health halves the base rate")
{
    const SimConfig cfg;
    ProductionInputs in = GrasslandFoodInputs();
    in.extractors[static_cast<std::size_t>(ResourceType::Food)] = ExtractorView{1, 1, 100.0, 1.0, 0};

    const ProductionBreakdown b = ComputeProduction(in, cfg);
    CHECK(b.production[ResourceType::Food] == doctest::Approx(0.06));
    CHECK(b.tierMultiplier[ResourceType::Food] == doctest::Approx(0.5));
}

TEST_CASE("Production: a destroyed-health extractor produces nothing")
{
    const SimConfig cfg;
    ProductionInputs in = GrasslandFoodInputs();
    in.extractors[static_cast<std::size_t>(ResourceType::Food)] = ExtractorView{1, 3, 0.0, 1.0, 0};

    CHECK(ComputeProduction(in, cfg).production[ResourceType::Food] == 0.0);
    CHECK(HealthModifier(50.0) == doctest::Approx(0.5));
    CHECK(HealthModifier(140.0) == 1.0);
}

TEST_CASE("Production: quality 0 skips the resource entirely")
{
    const SimConfig cfg;
    const ProductionBreakdown b = ComputeProduction(GrasslandFoodInputs(), cfg);

    CHECK(b.present[static_cast<std::size_t>(ResourceType::Food)]);
    CHECK_FALSE(b.present[static_cast<std::size_t>(ResourceType::Stone)]);
    CHECK(b.production[ResourceType::Stone] == 0.0);
}

TEST_CASE("Production: tier multiplier bands")
{
    CHECK(ExtractorTierMultiplier(1) == doctest::Approx(0.5));
    CHECK(ExtractorTierMultiplier(5) == doctest::Approx(0.7));
    CHECK(ExtractorTierMultiplier(6) == doctest::Approx(1.0));
    CHECK(ExtractorTierMultiplier(10) == doctest::Approx(1.32));
    CHECK(ExtractorTierMultiplier(11) == doctest::Approx(1.6));
    CHECK(ExtractorTierMultiplier(13) == doctest::Approx(1.8));
}

TEST_CASE("Production: consumption scales with population and ticks, net is unclamped")
{
    SimConfig cfg;
    ProductionInputs in;
    in.population = 100;
    in.ticks = 60;

    const ProductionBreakdown b = ComputeProduction(in, cfg);
    CHECK(b.consumption[ResourceType::Food] == doctest::Approx(100 * cfg.foodPerPersonPerTick * 60));
    CHECK(b.consumption[ResourceType::Water] == doctest::Approx(100 * cfg.waterPerPersonPerTick * 60));
    CHECK(b.net[ResourceType::Food] < 0.0);
}

TEST_CASE("Production: elapsed time converts to whole ticks")
{
    CHECK(ElapsedTicks(1000, 60.0) == 60);
    CHECK(ElapsedTicks(16, 60.0) == 0);
    CHECK(ElapsedTicks(17, 60.0) == 1);
    CHECK(ElapsedTicks(-5, 60.0) == 0);
    CHECK(ElapsedTicks(0, 60.0) == 0);

    CHECK(WholeTickSpanMs(60, 60.0) == DurationMs{1000});
    CHECK(WholeTickSpanMs(3, 60.0) == DurationMs{50});
    CHECK_FALSE(WholeTickSpanMs(1, 60.0).has_value());
    CHECK(WholeTickSpanMs(0, 60.0) == DurationMs{0});
}

TEST_CASE("SelectExtractor: highest level, then earliest created, then lowest id")
{
    CHECK_FALSE(SelectExtractor({}).has_value());

    const auto byLevel = SelectExtractor({{1, 2, 100, 1, 0}, {2, 4, 100, 1, 50}, {3, 3, 100, 1, 0}});
    REQUIRE(byLevel);
    CHECK(byLevel->id == 2);

    const auto byAge = SelectExtractor({{5, 2, 100, 1, 30}, {6, 2, 100, 1, 10}});
    REQUIRE(byAge);
    CHECK(byAge->id == 6);

    const auto byId = SelectExtractor({{9, 2, 100, 1, 10}, {7, 2, 100, 1, 10}});
    REQUIRE(byId);
    CHECK(byId->id == 7);
}

TEST_CASE("BuildProductionInputs: ignores destroyed extractors")
{
    const StaticCatalog catalog = DefaultCatalog();
    const SimConfig cfg;
    IdAllocator ids;
    Settlement s = testing::MakeSettlement();

    testing::AddStructure(s, ids, catalog, "FARM", 4, 0).destroyed = true;
    testing::AddStructure(s, ids, catalog, "FARM", 2, 1);

    const ProductionInputs in = BuildProductionInputs(s, catalog, cfg, 1);
    const auto& farm = in.extractors[static_cast<std::size_t>(ResourceType::Food)];
    REQUIRE(farm);
    CHECK(farm->level == 2);
    CHECK(in.biomeEfficiency[ResourceType::Food] == doctest::Approx(1.2));
    CHECK(in.structureCount == 1);
}

TEST_CASE("CollectResources: partial ticks stay pending")
{
    const StaticCatalog catalog = DefaultCatalog();
    const SimConfig cfg;
    Settlement s = testing::MakeSettlement(1, ResourceAmounts::Uniform(100.0), 0);
    s.lastCollectedAt = 0;

    const CollectionReport none = CollectResources(s, catalog, cfg, 10);
    CHECK(none.ticks == 0);
    CHECK(s.lastCollectedAt == 0);
    CHECK(s.storage.balances() == ResourceAmounts::Uniform(100.0));

    const CollectionReport second = CollectResources(s, catalog, cfg, 1010);
    CHECK(second.ticks == 60);
    CHECK(s.lastCollectedAt == 1000);
    CHECK(s.storage.balance(ResourceType::Food) == doctest::Approx(100.0 + 0.12 * 60));
}

TEST_CASE("CollectResources: frequent collections keep the tick fraction")
{
    const StaticCatalog catalog = DefaultCatalog();
    const SimConfig cfg;
    Settlement s = testing::MakeSettlement(1, ResourceAmounts::Uniform(100.0), 0);
    s.lastCollectedAt = 0;

    // 17 ms is a little over one 60 Hz tick; rounding each span up to whole
    // ms would drift a tick behind every few dozen collections.
    std::uint64_t ticks = 0;
    TimestampMs now = 0;
    for (int i = 0; i < 120; ++i)
    {
        now += 17;
        ticks += CollectResources(s, catalog, cfg, now).ticks;
        CHECK(ticks == ElapsedTicks(now, cfg.tickRateHz));
    }

    CHECK(now == 2040);
    CHECK(ticks == 122);
    CHECK(s.lastCollectedAt == 2000);
    CHECK(s.ticksPastCollected == 2);
    CHECK(s.storage.balance(ResourceType::Food) == doctest::Approx(100.0 + 0.12 * 122));

    // A collection at the same instant applies nothing more.
    CHECK(CollectResources(s, catalog, cfg, now).ticks == 0);
}
