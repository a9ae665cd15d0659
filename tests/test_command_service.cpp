#include <doctest/doctest.h>

#include "test_support/SettlementFixture.hpp"
#include "test_support/SimFixture.hpp"

using namespace frontier;

TEST_CASE_FIXTURE(testing::SimFixture, "CommandService: founding validates and persists")
{
    FoundSettlementRequest bad;
    bad.name = "Nowhere";
    CHECK(commands.foundSettlement(bad, 0).code() == ErrorCode::InvalidArgument);

    bad.owner = "ada";
    bad.homeTile.slotCount = 0;
    const auto noSlots = commands.foundSettlement(bad, 0);
    CHECK(noSlots.code() == ErrorCode::InvalidSlot);
    CHECK(noSlots.error().category() == ErrorCategory::Validation);
    CHECK(world.settlementCount() == 0);

    const SettlementId id = found("ada");
    const Settlement& s = settlement(id);
    CHECK(s.owner == "ada");
    CHECK(s.population.count == 10);
    CHECK(s.storage.balances() == ResourceAmounts::Of(50, 100, 50, 30, 10));
    CHECK(s.tiles.front().id != 0);
    REQUIRE(persistence.loadSettlement(id));

    publisher.flush();
    CHECK(CountEvents(sink->events(), EventKind::SettlementFounded) == 1);
}

TEST_CASE_FIXTURE(testing::SimFixture, "CommandService: only the owner may act on a settlement")
{
    const SettlementId id = found("ada");
    const ResourceAmounts before = settlement(id).storage.balances();

    const auto r = commands.submitConstruction("mallory", id, extractor(id, "FARM", 0), 0);
    REQUIRE_FALSE(r);
    CHECK(r.code() == ErrorCode::NotSettlementOwner);
    CHECK(r.error().category() == ErrorCategory::Conflict);
    CHECK(settlement(id).storage.balances() == before);
    CHECK(settlement(id).queue.empty());

    const auto missing = commands.submitConstruction("ada", 999999, extractor(id, "FARM", 0), 0);
    CHECK(missing.code() == ErrorCode::SettlementNotFound);
    CHECK(missing.error().category() == ErrorCategory::NotFound);
}

TEST_CASE_FIXTURE(testing::SimFixture, "CommandService: cancel checks ownership and refunds")
{
    const SettlementId id = found("ada");
    const ResourceAmounts start = settlement(id).storage.balances();

    REQUIRE(commands.submitConstruction("ada", id, extractor(id, "FARM", 0), 0));
    const auto queued = commands.submitConstruction("ada", id, extractor(id, "WELL", 1), 0);
    REQUIRE(queued);
    CHECK(queued.value().status == QueueStatus::Queued);

    CHECK(commands.cancelConstruction("mallory", queued.value().id, 10).code() == ErrorCode::NotSettlementOwner);
    CHECK(commands.cancelConstruction("ada", 555555, 10).code() == ErrorCode::QueueItemNotFound);

    REQUIRE(commands.cancelConstruction("ada", queued.value().id, 10).ok());
    CHECK(settlement(id).queue.size() == 1);
    CHECK(settlement(id).storage.balances() == start - settlement(id).queue.front().deducted);
}

TEST_CASE_FIXTURE(testing::SimFixture, "CommandService: a failed commit leaves the settlement as it was")
{
    const SettlementId id = found("ada");
    const ResourceAmounts before = settlement(id).storage.balances();

    persistence.failNextCommits(1);
    const auto r = commands.submitConstruction("ada", id, extractor(id, "FARM", 0), 0);
    REQUIRE_FALSE(r);
    CHECK(r.code() == ErrorCode::PersistenceFailed);
    CHECK(r.error().category() == ErrorCategory::Internal);
    CHECK(settlement(id).storage.balances() == before);
    CHECK(settlement(id).queue.empty());

    CHECK(commands.submitConstruction("ada", id, extractor(id, "FARM", 0), 0));
}

TEST_CASE_FIXTURE(testing::SimFixture, "CommandService: demolishing refunds half the base cost")
{
    const SettlementId id = found("ada");
    const StructureId tent = testing::AddStructure(settlement(id), world.ids(), catalog, "TENT").id;
    const StructureId hall = testing::AddStructure(settlement(id), world.ids(), catalog, "TOWN_HALL").id;
    const ResourceAmounts before = settlement(id).storage.balances();

    const auto refund = commands.demolishStructure("ada", id, tent, 0);
    REQUIRE(refund);
    CHECK(refund.value() == ResourceAmounts::Of(2, 1, 5, 0, 0));
    CHECK(settlement(id).storage.balances() == before + refund.value());
    CHECK(settlement(id).findStructure(tent) == nullptr);
    CHECK(commands.demolishStructure("ada", id, tent, 0).code() == ErrorCode::StructureNotFound);

    settlement(id).storage.credit(ResourceAmounts::Uniform(500.0));
    REQUIRE(commands.submitUpgrade("ada", id, hall, false, 0));
    CHECK(commands.demolishStructure("ada", id, hall, 0).code() == ErrorCode::ConflictState);
}

TEST_CASE_FIXTURE(testing::SimFixture, "CommandService: repairs restore full health at the current price")
{
    const SettlementId id = found("ada");
    Structure& farm = testing::AddStructure(settlement(id), world.ids(), catalog, "FARM", 1, 0);
    farm.health = 50.0;
    const StructureId farmId = farm.id;
    const StructureId fine = testing::AddStructure(settlement(id), world.ids(), catalog, "WELL", 1, 1).id;

    CHECK(commands.repairStructure("ada", id, fine, 0).code() == ErrorCode::NothingToRepair);

    // Open discount window from a recent disaster.
    settlement(id).repairWindow = RepairWindow{1, kHourMs, 0.5, 0.25};

    const auto receipt = commands.repairStructure("ada", id, farmId, 0);
    REQUIRE(receipt);
    CHECK(receipt.value().discount == doctest::Approx(0.5));
    CHECK(receipt.value().cost == ResourceAmounts::Of(0, 0, 13, 7, 0));
    CHECK(settlement(id).findStructure(farmId)->health == 100.0);
    CHECK(settlement(id).storage.balance(ResourceType::Wood) == doctest::Approx(50.0 - 13.0));
}

TEST_CASE_FIXTURE(testing::SimFixture, "CommandService: repairing a destroyed structure brings it back")
{
    const SettlementId id = found("ada");
    Structure& well = testing::AddStructure(settlement(id), world.ids(), catalog, "WELL", 1, 1);
    well.health = 0.0;
    well.destroyed = true;
    const StructureId wellId = well.id;
    settlement(id).staffingDirty = false;

    const auto broke = commands.repairStructure("ada", id, wellId, 0);
    REQUIRE_FALSE(broke);
    CHECK(broke.code() == ErrorCode::InsufficientResources);
    CHECK(settlement(id).findStructure(wellId)->destroyed);

    settlement(id).storage.credit(ResourceAmounts::Uniform(500.0));
    REQUIRE(commands.repairStructure("ada", id, wellId, 0));
    CHECK_FALSE(settlement(id).findStructure(wellId)->destroyed);
    CHECK(settlement(id).staffingDirty);
}

TEST_CASE_FIXTURE(testing::SimFixture, "CommandService: collecting applies whole ticks only")
{
    const SettlementId id = found("ada", 0, 0, ResourceAmounts::Uniform(0.0));

    const auto none = commands.collectResources("ada", id, 10);
    REQUIRE(none);
    CHECK(none.value().ticks == 0);

    const auto some = commands.collectResources("ada", id, kSecondMs);
    REQUIRE(some);
    CHECK(some.value().ticks == 60);
    CHECK(settlement(id).lastCollectedAt == kSecondMs);
    CHECK(settlement(id).storage.balance(ResourceType::Food) ==
          doctest::Approx(50.0 - 10 * cfg.foodPerPersonPerTick * 60));
}

TEST_CASE_FIXTURE(testing::SimFixture, "CommandService: transfer validation")
{
    const SettlementId a = found("ada", 0, 0);
    const SettlementId b = found("bo", 100, 0);

    CHECK(commands.initiateTransfer("ada", a, b, ResourceType::Food, 0.0, 0).code() == ErrorCode::InvalidAmount);
    CHECK(commands.initiateTransfer("ada", a, b, ResourceType::Food, -3.0, 0).code() == ErrorCode::InvalidAmount);
    CHECK(commands.initiateTransfer("ada", a, a, ResourceType::Food, 5.0, 0).code() == ErrorCode::SameSettlement);
    CHECK(commands.initiateTransfer("ada", a, 777777, ResourceType::Food, 5.0, 0).code() ==
          ErrorCode::SettlementNotFound);
    CHECK(commands.initiateTransfer("bo", a, b, ResourceType::Food, 5.0, 0).code() == ErrorCode::NotSettlementOwner);

    const auto tooMuch = commands.initiateTransfer("ada", a, b, ResourceType::Ore, 11.0, 0);
    REQUIRE_FALSE(tooMuch);
    CHECK(tooMuch.code() == ErrorCode::InsufficientResources);
    CHECK(world.pendingTransfers().empty());

    const auto ok = commands.initiateTransfer("ada", a, b, ResourceType::Ore, 10.0, 0);
    REQUIRE(ok);
    CHECK(ok.value().lossPercent == 5);
    CHECK(ok.value().received == 9.0);
    CHECK(settlement(a).storage.balance(ResourceType::Ore) == 0.0);
    CHECK(world.pendingTransfers().size() == 1);
}
