// flashx - Router Allowlist Tests

#include <catch2/catch_test_macros.hpp>

#include "fixtures.hpp"

using namespace flashx;
using namespace flashx::test;

TEST_CASE("RouterAllowlist", "[allowlist]") {
    Runtime rt(START_TIME);
    RouterAllowlist allowlist(rt, OWNER, ENGINE, {VENUE_1});

    SECTION("Seeded venues are approved") {
        REQUIRE(allowlist.is_approved(VENUE_1));
        REQUIRE_FALSE(allowlist.is_approved(VENUE_2));
        REQUIRE(allowlist.approved_venues() == std::vector<Address>{VENUE_1});
    }

    SECTION("Owner toggles approvals and events record each change") {
        allowlist.set_approval(OWNER, VENUE_2, true);
        allowlist.set_approval(OWNER, VENUE_1, false);

        REQUIRE(allowlist.is_approved(VENUE_2));
        REQUIRE_FALSE(allowlist.is_approved(VENUE_1));

        auto events = rt.events();
        REQUIRE(events.size() == 2);
        REQUIRE(events[0] == EventRecord{ENGINE, RouterApprovalChanged{VENUE_2, true}});
        REQUIRE(events[1] == EventRecord{ENGINE, RouterApprovalChanged{VENUE_1, false}});
    }

    SECTION("Setting the current value is a silent no-op") {
        allowlist.set_approval(OWNER, VENUE_1, true);
        allowlist.set_approval(OWNER, VENUE_3, false);
        REQUIRE(rt.events().empty());
    }

    SECTION("Non-owner is rejected") {
        auto e = capture_revert([&]() { allowlist.set_approval(ATTACKER, VENUE_2, true); });
        REQUIRE(e.code() == errors::NOT_OWNER);
        REQUIRE_FALSE(allowlist.is_approved(VENUE_2));
    }

    SECTION("Changes roll back with the enclosing transaction") {
        REQUIRE_THROWS(rt.atomic([&]() {
            allowlist.set_approval(OWNER, VENUE_2, true);
            allowlist.set_approval(OWNER, VENUE_1, false);
            throw RevertError(errors::SWAP_FAILED, "later failure");
        }));
        REQUIRE(allowlist.is_approved(VENUE_1));
        REQUIRE_FALSE(allowlist.is_approved(VENUE_2));
        REQUIRE(rt.events().empty());
    }

    SECTION("Edits are refused while an operation is in flight") {
        bool busy = true;
        allowlist.set_busy_check([&]() { return busy; });

        auto e = capture_revert([&]() { allowlist.set_approval(OWNER, VENUE_2, true); });
        REQUIRE(e.code() == errors::REENTRANT_CALL);
        REQUIRE_FALSE(allowlist.is_approved(VENUE_2));

        busy = false;
        allowlist.set_approval(OWNER, VENUE_2, true);
        REQUIRE(allowlist.is_approved(VENUE_2));
    }
}
