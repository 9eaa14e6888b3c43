// flashx - Swap Pipeline Tests

#include <catch2/catch_test_macros.hpp>

#include "fixtures.hpp"

using namespace flashx;
using namespace flashx::test;

namespace {

struct PipelineFixture {
    Runtime rt{START_TIME};
    RouterAllowlist allowlist{rt, OWNER, ENGINE, {VENUE_1, VENUE_2}};
    SwapPipeline pipeline{rt, allowlist, ENGINE};
    FixedRateVenue venue1{rt, VENUE_1};
    FixedRateVenue venue2{rt, VENUE_2};

    PipelineFixture() {
        venue1.set_rate(TOKEN_A, TOKEN_B, 98, 100).fund(TOKEN_B, 1000);
        venue2.set_rate(TOKEN_B, TOKEN_A, 101, 98).fund(TOKEN_A, 1000);
        pipeline.register_venue(venue1);
        pipeline.register_venue(venue2);
        rt.mint(TOKEN_A, ENGINE, 100);
    }

    SwapStep step(const Address& venue, std::vector<Address> path, Amount in, Amount min_out,
                  Timestamp deadline = START_TIME + 120) const {
        return SwapStep{venue, std::move(path), in, min_out, deadline};
    }
};

} // namespace

TEST_CASE("SwapPipeline executes a single step", "[pipeline]") {
    PipelineFixture f;

    Amount out = f.pipeline.execute(f.step(VENUE_1, {TOKEN_A, TOKEN_B}, 100, 98));

    REQUIRE(out == 98);
    REQUIRE(f.rt.balance_of(TOKEN_A, ENGINE) == 0);
    REQUIRE(f.rt.balance_of(TOKEN_B, ENGINE) == 98);

    SECTION("Approval is scoped to the call") {
        REQUIRE(f.rt.allowance(TOKEN_A, ENGINE, VENUE_1) == 0);
    }

    SECTION("SwapExecuted carries the realized amounts") {
        auto events = f.rt.events();
        REQUIRE(events.size() == 1);
        REQUIRE(events[0] == EventRecord{ENGINE, SwapExecuted{VENUE_1, TOKEN_A, TOKEN_B, 100, 98}});
    }
}

TEST_CASE("SwapPipeline runs steps strictly in order", "[pipeline]") {
    PipelineFixture f;

    // The second step spends what the first one produced
    std::vector<Amount> outs = f.pipeline.execute_all({
        f.step(VENUE_1, {TOKEN_A, TOKEN_B}, 100, 98),
        f.step(VENUE_2, {TOKEN_B, TOKEN_A}, 98, 101),
    });

    REQUIRE(outs == std::vector<Amount>{98, 101});
    REQUIRE(f.rt.balance_of(TOKEN_A, ENGINE) == 101);

    auto events = f.rt.events();
    REQUIRE(events.size() == 2);
    REQUIRE(std::get<SwapExecuted>(events[0].event).venue == VENUE_1);
    REQUIRE(std::get<SwapExecuted>(events[1].event).venue == VENUE_2);

    SECTION("Reversed order cannot be funded") {
        PipelineFixture g;
        auto e = capture_revert([&]() {
            g.pipeline.execute_all({
                g.step(VENUE_2, {TOKEN_B, TOKEN_A}, 98, 101),
                g.step(VENUE_1, {TOKEN_A, TOKEN_B}, 100, 98),
            });
        });
        REQUIRE(e.code() == errors::SWAP_FAILED);
        REQUIRE(e.cause() == errors::INSUFFICIENT_BALANCE);
        REQUIRE(e.step_index() == std::optional<size_t>(0));
    }
}

TEST_CASE("SwapPipeline validation", "[pipeline]") {
    PipelineFixture f;
    Runtime::State before = f.rt.snapshot();

    SECTION("Venue not on the allowlist") {
        FixedRateVenue rogue(f.rt, VENUE_3);
        f.pipeline.register_venue(rogue);
        auto e = capture_revert([&]() { f.pipeline.execute(f.step(VENUE_3, {TOKEN_A, TOKEN_B}, 1, 0)); });
        REQUIRE(e.code() == errors::VENUE_NOT_APPROVED);
    }

    SECTION("Path too short") {
        auto e = capture_revert([&]() { f.pipeline.execute(f.step(VENUE_1, {TOKEN_A}, 1, 0)); });
        REQUIRE(e.code() == errors::INVALID_PATH);
    }

    SECTION("Deadline is inclusive") {
        REQUIRE_NOTHROW(f.pipeline.execute(f.step(VENUE_1, {TOKEN_A, TOKEN_B}, 100, 0, START_TIME)));
        before = f.rt.snapshot();
        f.rt.advance_time(1);
        auto e = capture_revert([&]() {
            f.pipeline.execute(f.step(VENUE_2, {TOKEN_B, TOKEN_A}, 98, 0, START_TIME));
        });
        REQUIRE(e.code() == errors::DEADLINE_EXPIRED);
    }

    SECTION("Approved but unregistered venue") {
        f.allowlist.set_approval(OWNER, VENUE_3, true);
        before = f.rt.snapshot();
        auto e = capture_revert([&]() { f.pipeline.execute(f.step(VENUE_3, {TOKEN_A, TOKEN_B}, 1, 0)); });
        REQUIRE(e.code() == errors::UNKNOWN_VENUE);
    }

    SECTION("Failures carry the step index") {
        auto e = capture_revert([&]() {
            f.pipeline.execute_all({
                f.step(VENUE_1, {TOKEN_A, TOKEN_B}, 100, 98),
                f.step(VENUE_2, {TOKEN_B}, 98, 0),
            });
        });
        REQUIRE(e.code() == errors::INVALID_PATH);
        REQUIRE(e.step_index() == std::optional<size_t>(1));
    }

    REQUIRE(f.rt.snapshot() == before);
}

TEST_CASE("SwapPipeline wraps venue failures", "[pipeline]") {
    PipelineFixture f;
    Runtime::State before = f.rt.snapshot();

    SECTION("Slippage") {
        auto e = capture_revert([&]() { f.pipeline.execute(f.step(VENUE_1, {TOKEN_A, TOKEN_B}, 100, 99)); });
        REQUIRE(e.code() == errors::SWAP_FAILED);
        REQUIRE(e.cause() == errors::INSUFFICIENT_OUTPUT_AMOUNT);
        REQUIRE(e.reason() == "slippage");
    }

    SECTION("Venue tries to draw more than the step allows") {
        f.venue1.set_overdraw(1);
        f.rt.mint(TOKEN_A, ENGINE, 1);
        before = f.rt.snapshot();
        auto e = capture_revert([&]() { f.pipeline.execute(f.step(VENUE_1, {TOKEN_A, TOKEN_B}, 100, 0)); });
        REQUIRE(e.code() == errors::SWAP_FAILED);
        REQUIRE(e.cause() == errors::INSUFFICIENT_ALLOWANCE);
    }

    REQUIRE(f.rt.snapshot() == before);
    REQUIRE(f.rt.allowance(TOKEN_A, ENGINE, VENUE_1) == 0);
}

TEST_CASE("SwapPipeline measures output by balance delta", "[pipeline]") {
    PipelineFixture f;
    MisreportingVenue liar(f.rt, VENUE_3, 8);
    liar.set_rate(TOKEN_A, TOKEN_B, 1, 1).fund(TOKEN_B, 1000);
    f.allowlist.set_approval(OWNER, VENUE_3, true);
    f.pipeline.register_venue(liar);

    Amount out = f.pipeline.execute(f.step(VENUE_3, {TOKEN_A, TOKEN_B}, 100, 0));

    REQUIRE(out == 92);
    auto events = f.rt.events();
    REQUIRE(std::get<SwapExecuted>(events.back().event).amount_out == 92);
}
