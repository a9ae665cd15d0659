#include <doctest/doctest.h>

#include "frontier/catalog/Catalog.hpp"
#include "frontier/core/Config.hpp"
#include "frontier/disaster/Disaster.hpp"
#include "frontier/disaster/DisasterCoordinator.hpp"
#include "frontier/disaster/Repair.hpp"
#include "frontier/population/PopulationEngine.hpp"
#include "frontier/sim/World.hpp"
#include "test_support/SettlementFixture.hpp"

#include <algorithm>
#include <map>
#include <vector>

using namespace frontier;

namespace {

constexpr WorldId kWorld = 1;

struct DisasterFixture {
    SimConfig cfg;
    StaticCatalog catalog = DefaultCatalog();
    PopulationEngine population{cfg, catalog};
    DisasterCoordinator coordinator{cfg, catalog, population};
    World world{kWorld, 7};
    EventList events;

    Settlement& add(Settlement s) { return world.addSettlement(std::move(s)).settlement; }

    DisasterEvent& schedule(double severity, TimestampMs impactAt, std::vector<std::string> regions = {"heartland"})
    {
        DisasterEvent e;
        e.type = DisasterType::Earthquake;
        e.severity = severity;
        e.affectedRegions = std::move(regions);
        e.scheduledAt = impactAt;
        e.warningDuration = 6 * kHourMs;
        e.impactDuration = kHourMs;
        return *world.findDisaster(world.scheduleDisaster(std::move(e)));
    }

    std::vector<EventKind> worldEventKinds() const
    {
        std::vector<EventKind> kinds;
        for (const Event& ev : events)
        {
            if (ev.scope == ScopeKind::World)
                kinds.push_back(ev.kind);
        }
        return kinds;
    }
};

} // namespace

TEST_CASE("Disaster: severity tiers and resilience")
{
    CHECK(SeverityTierFor(10) == SeverityTier::Mild);
    CHECK(SeverityTierFor(30) == SeverityTier::Moderate);
    CHECK(SeverityTierFor(60) == SeverityTier::Major);
    CHECK(SeverityTierFor(85) == SeverityTier::Catastrophic);
    CHECK(ResilienceGain(SeverityTier::Mild) < ResilienceGain(SeverityTier::Catastrophic));
    CHECK(ParseDisasterType("LOCUST_SWARM") == DisasterType::LocustSwarm);
    CHECK_FALSE(ParseDisasterType("METEOR").has_value());
}

TEST_CASE("Disaster: affected areas")
{
    DisasterEvent everywhere;
    CHECK(everywhere.affects("DESERT", "anywhere"));

    DisasterEvent e;
    e.affectedBiomes = {"FOREST"};
    e.affectedRegions = {"heartland"};
    CHECK(e.affects("FOREST", "north"));
    CHECK(e.affects("GRASSLAND", "heartland"));
    CHECK_FALSE(e.affects("GRASSLAND", "north"));
    CHECK_FALSE(e.affects("GRASSLAND", ""));
}

TEST_CASE_FIXTURE(DisasterFixture, "DisasterCoordinator: one long gap walks every phase in order")
{
    add(testing::MakeSettlement(1));
    DisasterEvent& e = schedule(50, 10 * kHourMs);

    CHECK(coordinator.advance(e, 3 * kHourMs, world, events) == 0);
    CHECK(e.status == DisasterStatus::Scheduled);

    CHECK(coordinator.advance(e, 60 * kDayMs, world, events) == 4);
    CHECK(e.status == DisasterStatus::Resolved);
    CHECK(e.warningStartedAt == 4 * kHourMs);
    CHECK(e.impactStartedAt == 10 * kHourMs);
    CHECK(e.aftermathStartedAt == 11 * kHourMs);
    CHECK(e.resolvedAt == 11 * kHourMs + cfg.aftermathDuration);
    CHECK(e.damageTicksApplied == 6);

    const std::vector<EventKind> expected{
        EventKind::DisasterWarning, EventKind::DisasterImminent, EventKind::DisasterImpactStart,
        EventKind::DisasterAftermath, EventKind::DisasterResolved,
    };
    CHECK(worldEventKinds() == expected);

    TimestampMs last = 0;
    for (const Event& ev : events)
    {
        CHECK(ev.at >= last);
        last = ev.at;
    }
}

TEST_CASE_FIXTURE(DisasterFixture, "DisasterCoordinator: imminent fires once inside the threshold")
{
    DisasterEvent& e = schedule(40, 10 * kHourMs);
    coordinator.advance(e, 5 * kHourMs, world, events);
    CHECK(CountEvents(events, EventKind::DisasterImminent) == 0);

    coordinator.advance(e, 10 * kHourMs - 10 * kMinuteMs, world, events);
    coordinator.advance(e, 10 * kHourMs - 5 * kMinuteMs, world, events);
    CHECK(CountEvents(events, EventKind::DisasterImminent) == 1);
    CHECK(e.status == DisasterStatus::Warning);
}

TEST_CASE_FIXTURE(DisasterFixture, "DisasterCoordinator: impact marks only affected settlements")
{
    Settlement& home = add(testing::MakeSettlement(1));
    Settlement other = testing::MakeSettlement(2);
    other.tiles.front().biome = "TUNDRA";
    other.tiles.front().region = "far-north";
    Settlement& far = add(std::move(other));

    DisasterEvent& e = schedule(50, 10 * kHourMs);
    coordinator.advance(e, 10 * kHourMs, world, events);

    CHECK(e.status == DisasterStatus::Impact);
    CHECK(home.underImpact());
    CHECK(home.activeDisaster == e.id);
    CHECK(home.productionPenalty() == TraitsOf(DisasterType::Earthquake).productionPenalty);
    CHECK_FALSE(far.underImpact());
    CHECK_FALSE(far.activeDisaster.has_value());
    CHECK(world.activeDisaster() == e.id);
}

TEST_CASE_FIXTURE(DisasterFixture, "DisasterCoordinator: overlapping events keep their own impact")
{
    IdAllocator& ids = world.ids();
    Settlement& s = add(testing::MakeSettlement(1));
    testing::AddStructure(s, ids, catalog, "WORKSHOP");
    const StructureId house = testing::AddStructure(s, ids, catalog, "HOUSE").id;
    s.findStructure(house)->health = 90.0;

    const DisasterId quake = schedule(20, 10 * kHourMs).id;
    DisasterEvent drought;
    drought.type = DisasterType::Drought;
    drought.severity = 20;
    drought.affectedRegions = {"heartland"};
    drought.scheduledAt = 10 * kHourMs + 30 * kMinuteMs;
    drought.impactDuration = 4 * kHourMs;
    const DisasterId dry = world.scheduleDisaster(drought);

    DisasterEvent& a = *world.findDisaster(quake);
    DisasterEvent& b = *world.findDisaster(dry);

    coordinator.advance(a, 10 * kHourMs + 30 * kMinuteMs, world, events);
    coordinator.advance(b, 10 * kHourMs + 30 * kMinuteMs, world, events);
    REQUIRE(a.status == DisasterStatus::Impact);
    REQUIRE(b.status == DisasterStatus::Impact);
    CHECK(s.productionPenalty() == ResourceAmounts::Of(0.5, 0.7, 0.8, 0.6, 0.6));

    coordinator.advance(a, 11 * kHourMs, world, events);
    coordinator.advance(b, 11 * kHourMs, world, events);
    CHECK(a.status == DisasterStatus::Aftermath);
    CHECK(b.status == DisasterStatus::Impact);
    CHECK(s.underImpact());
    CHECK(s.activeDisaster == dry);
    CHECK(s.productionPenalty() == TraitsOf(DisasterType::Drought).productionPenalty);

    // No workshop repairs while the second event is still hitting.
    const double during = s.findStructure(house)->health;
    CHECK(ApplyPassiveRepair(s, catalog, cfg, 13 * kHourMs) == 0);
    CHECK(s.findStructure(house)->health == during);

    coordinator.advance(b, 14 * kHourMs + 30 * kMinuteMs, world, events);
    CHECK(b.status == DisasterStatus::Aftermath);
    CHECK_FALSE(s.underImpact());
    CHECK(s.productionPenalty() == ResourceAmounts::Uniform(1.0));

    const double after = s.findStructure(house)->health;
    REQUIRE(after >= 21.0);
    CHECK(ApplyPassiveRepair(s, catalog, cfg, 16 * kHourMs) > 0);
    CHECK(s.findStructure(house)->health == doctest::Approx(std::min(100.0, after + 3.0)));

    // Resolving the first event leaves the second as the settlement's active one.
    coordinator.advance(a, 11 * kHourMs + cfg.aftermathDuration, world, events);
    CHECK(a.status == DisasterStatus::Resolved);
    CHECK(s.activeDisaster == dry);
}

TEST_CASE_FIXTURE(DisasterFixture, "DisasterCoordinator: health only goes down during impact")
{
    IdAllocator& ids = world.ids();
    Settlement s = testing::MakeSettlement(1);
    for (int i = 0; i < 8; ++i)
        testing::AddStructure(s, ids, catalog, "HOUSE");
    Settlement& live = add(std::move(s));

    DisasterEvent& e = schedule(90, 10 * kHourMs);
    std::map<StructureId, double> health;
    for (const Structure& st : live.structures)
        health[st.id] = st.health;

    for (TimestampMs t = 10 * kHourMs; t <= 11 * kHourMs; t += 5 * kMinuteMs)
    {
        coordinator.advance(e, t, world, events);
        for (const Structure& st : live.structures)
        {
            CHECK(st.health <= health[st.id]);
            CHECK(st.health >= 0.0);
            health[st.id] = st.health;
        }
    }

    CHECK(e.status == DisasterStatus::Aftermath);
    CHECK(e.damageTicksApplied == 6);
    REQUIRE(e.summary);
    CHECK(e.summary->structuresDamaged > 0);
    CHECK(CountEvents(events, EventKind::DisasterStructureDamaged) +
              CountEvents(events, EventKind::DisasterStructureDestroyed) > 0);
}

TEST_CASE_FIXTURE(DisasterFixture, "DisasterCoordinator: casualties land once, at aftermath")
{
    Settlement& s = add(testing::MakeSettlement(1, ResourceAmounts::Uniform(500.0), 120));
    DisasterEvent& e = schedule(50, 10 * kHourMs);

    coordinator.advance(e, 10 * kHourMs + 45 * kMinuteMs, world, events);
    CHECK(e.status == DisasterStatus::Impact);
    CHECK(s.population.count == 120);
    CHECK(e.exposure.at(s.id).casualties == doctest::Approx(40.0));

    coordinator.advance(e, 11 * kHourMs, world, events);
    CHECK(e.status == DisasterStatus::Aftermath);
    CHECK(s.population.count == 60);
    REQUIRE(e.summary);
    CHECK(e.summary->casualties == 60);
    CHECK(e.summary->settlementsAffected == 1);

    CHECK_FALSE(s.underImpact());
    CHECK(s.productionPenalty() == ResourceAmounts::Uniform(1.0));
    REQUIRE(s.repairWindow);
    CHECK(s.repairWindow->closesAt == 11 * kHourMs + cfg.repairWindow);
    CHECK(s.repairWindow->discount == doctest::Approx(0.5));
}

TEST_CASE_FIXTURE(DisasterFixture, "DisasterCoordinator: shelters protect their occupants")
{
    Settlement s = testing::MakeSettlement(1, ResourceAmounts::Uniform(500.0), 120);
    testing::AddStructure(s, world.ids(), catalog, "EMERGENCY_SHELTER");
    Settlement& live = add(std::move(s));

    DisasterEvent e;
    e.severity = 50;
    e.impactDuration = kHourMs;
    // 70 unsheltered * 0.5 severity over 6 ticks.
    CHECK(coordinator.casualtiesPerTick(e, live) == doctest::Approx(70.0 * 0.5 / 6.0));
}

TEST_CASE_FIXTURE(DisasterFixture, "DisasterCoordinator: resolving clears the active disaster")
{
    Settlement& s = add(testing::MakeSettlement(1));
    DisasterEvent& e = schedule(50, 10 * kHourMs);

    coordinator.advance(e, 11 * kHourMs, world, events);
    CHECK(s.activeDisaster == e.id);
    CHECK(world.activeDisaster() == e.id);

    coordinator.advance(e, 11 * kHourMs + cfg.aftermathDuration, world, events);
    CHECK(e.status == DisasterStatus::Resolved);
    CHECK_FALSE(s.activeDisaster.has_value());
    CHECK_FALSE(world.activeDisaster().has_value());
    CHECK(s.resilience == doctest::Approx(ResilienceGain(SeverityTier::Moderate)));
    CHECK(e.exposure.empty());
}

TEST_CASE_FIXTURE(DisasterFixture, "DisasterCoordinator: forceAdvance steps one phase and refuses past resolved")
{
    add(testing::MakeSettlement(1));
    DisasterEvent& e = schedule(50, 10 * kHourMs);

    REQUIRE(coordinator.forceAdvance(e, 1000, world, events).ok());
    CHECK(e.status == DisasterStatus::Warning);
    REQUIRE(coordinator.forceAdvance(e, 2000, world, events).ok());
    CHECK(e.status == DisasterStatus::Impact);
    CHECK(CountEvents(events, EventKind::DisasterImminent) == 1);
    REQUIRE(coordinator.forceAdvance(e, 3000, world, events).ok());
    CHECK(e.status == DisasterStatus::Aftermath);
    CHECK(e.damageTicksApplied == 6);
    REQUIRE(coordinator.forceAdvance(e, 4000, world, events).ok());
    CHECK(e.status == DisasterStatus::Resolved);

    const Status again = coordinator.forceAdvance(e, 5000, world, events);
    CHECK(again.code() == ErrorCode::ConflictState);
}

TEST_CASE_FIXTURE(DisasterFixture, "DisasterCoordinator: damage plans are reproducible")
{
    Settlement s = testing::MakeSettlement(1);
    for (int i = 0; i < 10; ++i)
        testing::AddStructure(s, world.ids(), catalog, "HOUSE");

    DisasterEvent e;
    e.id = 77;
    e.severity = 70;

    const std::vector<DamageOrder> a = coordinator.planDamage(e, s, 3);
    const std::vector<DamageOrder> b = coordinator.planDamage(e, s, 3);
    REQUIRE(a.size() == b.size());
    for (std::size_t i = 0; i < a.size(); ++i)
    {
        CHECK(a[i].structure == b[i].structure);
        CHECK(a[i].amount == b[i].amount);
        CHECK(a[i].amount > 0.0);
        CHECK(a[i].amount <= 100.0 / 6.0);
    }
}

TEST_CASE_FIXTURE(DisasterFixture, "DisasterCoordinator: damage skips missing and destroyed targets")
{
    Settlement s = testing::MakeSettlement(1);
    const StructureId sturdy = testing::AddStructure(s, world.ids(), catalog, "HOUSE").id;
    Structure& weak = testing::AddStructure(s, world.ids(), catalog, "WALL");
    weak.health = 5.0;
    const StructureId weakId = weak.id;
    Structure& ruin = testing::AddStructure(s, world.ids(), catalog, "TENT");
    ruin.destroyed = true;
    ruin.health = 0.0;
    const StructureId ruinId = ruin.id;

    DisasterEvent e;
    e.id = 5;
    const DamageApplied r = coordinator.applyDamage(
        e, s, {{sturdy, 12.5}, {weakId, 20.0}, {ruinId, 10.0}, {123456, 10.0}}, 1000, events);

    CHECK(r.damaged == 1);
    CHECK(r.destroyed == 1);
    CHECK(r.skipped == 2);
    CHECK(r.total == doctest::Approx(17.5));
    CHECK(s.findStructure(sturdy)->health == doctest::Approx(87.5));
    CHECK(s.findStructure(weakId)->destroyed);
    CHECK(s.findStructure(weakId)->health == 0.0);
    CHECK(s.staffingDirty);
    CHECK(e.exposure.at(s.id).destroyed.count(weakId) == 1);
    CHECK(CountEvents(events, EventKind::DisasterStructureDestroyed) == 1);
}

TEST_CASE("Repair: cost scales with health restored and the discount")
{
    const StaticCatalog catalog = DefaultCatalog();
    const StructureDefinition& farm = *catalog.findStructure("FARM");

    CHECK(RepairCost(farm, 100.0, 0.25, 0.0).isZero());
    CHECK(RepairCost(farm, 50.0, 0.25, 0.0) == ResourceAmounts::Of(0, 0, 25, 13, 0));
    CHECK(RepairCost(farm, 50.0, 0.25, 0.5) == ResourceAmounts::Of(0, 0, 13, 7, 0));
}

TEST_CASE("Repair: the discount window closes")
{
    Settlement s = testing::MakeSettlement(1);
    s.lastRepairMultiplier = 0.3;
    s.repairWindow = RepairWindow{9, 1000, 0.5, 0.4};

    CHECK(ActiveRepairDiscount(s, 999) == 0.5);
    CHECK(RepairMultiplierFor(s, 999) == 0.4);
    CHECK(ActiveRepairDiscount(s, 1000) == 0.0);
    CHECK(RepairMultiplierFor(s, 1000) == 0.3);
}

TEST_CASE("Repair: a workshop heals lightly damaged structures every hour")
{
    const StaticCatalog catalog = DefaultCatalog();
    const SimConfig cfg;
    IdAllocator ids;
    Settlement s = testing::MakeSettlement(1);

    const StructureId dented = testing::AddStructure(s, ids, catalog, "HOUSE").id;
    const StructureId wrecked = testing::AddStructure(s, ids, catalog, "WALL").id;
    s.findStructure(dented)->health = 50.0;
    s.findStructure(wrecked)->health = 10.0;

    CHECK(ApplyPassiveRepair(s, catalog, cfg, 3 * kHourMs) == 0);
    CHECK(s.lastPassiveRepairAt == 3 * kHourMs);

    testing::AddStructure(s, ids, catalog, "WORKSHOP");
    CHECK(ApplyPassiveRepair(s, catalog, cfg, 5 * kHourMs + 10) == 1);
    CHECK(s.findStructure(dented)->health == doctest::Approx(52.0));
    CHECK(s.findStructure(wrecked)->health == doctest::Approx(10.0));

    s.impacts[99] = ResourceAmounts::Uniform(1.0);
    CHECK(ApplyPassiveRepair(s, catalog, cfg, 7 * kHourMs) == 0);
    CHECK(s.findStructure(dented)->health == doctest::Approx(52.0));
}
