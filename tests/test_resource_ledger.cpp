#include <doctest/doctest.h>

#include "frontier/economy/ResourceLedger.hpp"

#include <stdexcept>

using namespace frontier;

TEST_CASE("ResourceLedger: debit is all-or-nothing and reports every shortage")
{
    ResourceLedger ledger(ResourceAmounts::Of(10, 5, 20, 0, 0));

    const Status st = ledger.debit(ResourceAmounts::Of(4, 8, 0, 1, 0));
    REQUIRE_FALSE(st.ok());
    CHECK(st.code() == ErrorCode::InsufficientResources);
    CHECK(st.error().category() == ErrorCategory::Precondition);
    REQUIRE(st.error().shortages.size() == 2);
    CHECK(st.error().shortages[0].type == ResourceType::Water);
    CHECK(st.error().shortages[0].shortBy() == doctest::Approx(3.0));
    CHECK(st.error().shortages[1].type == ResourceType::Stone);

    // Nothing moved.
    CHECK(ledger.balances() == ResourceAmounts::Of(10, 5, 20, 0, 0));

    CHECK(ledger.debit(ResourceAmounts::Of(10, 5, 0, 0, 0)).ok());
    CHECK(ledger.balance(ResourceType::Food) == 0.0);
    CHECK(ledger.balance(ResourceType::Wood) == 20.0);
}

TEST_CASE("ResourceLedger: credit clamps to capacity and reports waste")
{
    ResourceLedger ledger(ResourceAmounts::Uniform(90.0), ResourceAmounts::Uniform(100.0));

    const CreditResult r = ledger.credit(ResourceAmounts::Of(25, 5, 0, 0, 0));
    CHECK(r.applied[ResourceType::Food] == doctest::Approx(10.0));
    CHECK(r.wasted[ResourceType::Food] == doctest::Approx(15.0));
    CHECK(r.applied[ResourceType::Water] == doctest::Approx(5.0));
    CHECK(r.wasted[ResourceType::Water] == 0.0);
    CHECK(ledger.balance(ResourceType::Food) == doctest::Approx(100.0));
}

TEST_CASE("ResourceLedger: applyNet drains to zero and reports the unmet remainder")
{
    ResourceLedger ledger(ResourceAmounts::Of(3, 10, 0, 0, 0));

    const NetApplication r = ledger.applyNet(ResourceAmounts::Of(-5, 2, -1, 0, 0));
    CHECK(ledger.balance(ResourceType::Food) == 0.0);
    CHECK(ledger.balance(ResourceType::Water) == doctest::Approx(12.0));
    CHECK(r.drained[ResourceType::Food] == doctest::Approx(3.0));
    CHECK(r.unmet[ResourceType::Food] == doctest::Approx(2.0));
    CHECK(r.unmet[ResourceType::Wood] == doctest::Approx(1.0));
    CHECK(r.credited[ResourceType::Water] == doctest::Approx(2.0));
    CHECK_FALSE(ledger.balances().anyNegative());
}

TEST_CASE("ResourceLedger: negative inputs are rejected")
{
    ResourceLedger ledger(ResourceAmounts::Uniform(10.0));
    CHECK_THROWS_AS(ledger.credit(ResourceAmounts::Of(-1, 0, 0, 0, 0)), std::invalid_argument);
    CHECK_THROWS_AS((void)ledger.debit(ResourceAmounts::Of(0, -1, 0, 0, 0)), std::invalid_argument);
    CHECK(ledger.balances() == ResourceAmounts::Uniform(10.0));
}

TEST_CASE("ResourceLedger: sufficiency tolerates float dust")
{
    ResourceLedger ledger(ResourceAmounts::Of(0.1 + 0.2, 0, 0, 0, 0));
    CHECK(ledger.sufficiency(ResourceAmounts::Of(0.3, 0, 0, 0, 0)));
    CHECK_FALSE(ledger.sufficiency(ResourceAmounts::Of(0.31, 0, 0, 0, 0)));
}
