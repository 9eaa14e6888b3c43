// flashx - Profit Guard Tests

#include <catch2/catch_test_macros.hpp>

#include "fixtures.hpp"

using namespace flashx;
using namespace flashx::test;

TEST_CASE("ProfitGuard accepts exactly when end >= start + owed + min_profit", "[profit]") {
    Amount owed = x18::from_double(100.05);

    SECTION("Profitable") {
        auto r = ProfitGuard::validate(0, x18::from_int(101), owed, 0);
        REQUIRE(r.profit == x18::from_double(0.95));
    }

    SECTION("Break-even boundary") {
        auto r = ProfitGuard::validate(0, owed + 1, owed, 1);
        REQUIRE(r.profit == 1);
    }

    SECTION("Minimum profit not met") {
        auto e = capture_revert([&]() {
            ProfitGuard::validate(0, x18::from_int(101), owed, x18::from_int(2));
        });
        REQUIRE(e.code() == errors::INSUFFICIENT_PROFIT);
        REQUIRE(e.shortfall() == x18::from_double(1.05));
    }

    SECTION("Cannot repay") {
        auto e = capture_revert([&]() {
            ProfitGuard::validate(0, x18::from_int(99), owed, 0);
        });
        REQUIRE(e.code() == errors::INSUFFICIENT_PROFIT);
        REQUIRE(e.shortfall() == x18::from_double(1.05));
    }

    SECTION("Prior holding does not cover a losing trade") {
        // 50 held before the loan, 100 -> 95 after swaps: 145 left against 150.05
        auto e = capture_revert([&]() {
            ProfitGuard::validate(x18::from_int(50), x18::from_int(145), owed, x18::from_int(1));
        });
        REQUIRE(e.code() == errors::INSUFFICIENT_PROFIT);
        REQUIRE(e.shortfall() == x18::from_double(6.05));
    }

    SECTION("Prior holding is excluded from the profit") {
        auto r = ProfitGuard::validate(x18::from_int(50), x18::from_int(151), owed, 0);
        REQUIRE(r.profit == x18::from_double(0.95));
    }

    SECTION("owed + min_profit overflow") {
        Amount max = ~static_cast<Amount>(0);
        auto e = capture_revert([&]() { ProfitGuard::validate(1, max, max, 0); });
        REQUIRE(e.code() == errors::ARITHMETIC_OVERFLOW);
    }
}
