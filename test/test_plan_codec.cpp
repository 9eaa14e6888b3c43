// flashx - Plan Codec Tests

#include <catch2/catch_test_macros.hpp>

#include "fixtures.hpp"

using namespace flashx;
using namespace flashx::test;

namespace {

ArbitragePlan sample_plan() {
    return PlanBuilder(START_TIME)
        .swap(VENUE_1, {TOKEN_A, TOKEN_B}, x18::from_int(100), x18::from_int(98))
        .swap(VENUE_2, {TOKEN_B, TOKEN_C, TOKEN_A}, x18::from_int(98), x18::from_int(101), 5000)
        .min_profit(x18::from_int(2))
        .profit_token(TOKEN_A)
        .build();
}

Amount read_word(const std::vector<uint8_t>& data, size_t index) {
    Amount v = 0;
    for (size_t i = 16; i < codec::WORD; ++i) v = (v << 8) | data[index * codec::WORD + i];
    return v;
}

int32_t decode_error(const std::vector<uint8_t>& payload) {
    return capture_revert([&]() { codec::decode_plan(payload); }).code();
}

} // namespace

TEST_CASE("PlanBuilder", "[plan]") {
    ArbitragePlan plan = sample_plan();

    REQUIRE(plan.swaps.size() == 2);
    REQUIRE(plan.swaps[0].deadline == START_TIME + 120);
    REQUIRE(plan.swaps[1].deadline == 5000);
    REQUIRE(plan.swaps[0].token_in() == TOKEN_A);
    REQUIRE(plan.swaps[1].token_out() == TOKEN_A);
    REQUIRE(plan.min_profit == x18::from_int(2));
    REQUIRE(plan.profit_token == TOKEN_A);
}

TEST_CASE("Plan encoding follows the ABI layout", "[plan][codec]") {
    std::vector<uint8_t> data = codec::encode_plan(sample_plan());

    REQUIRE(data.size() % codec::WORD == 0);
    REQUIRE(read_word(data, 0) == 0x20);                 // tuple offset
    REQUIRE(read_word(data, 1) == 0x60);                 // swaps offset within tuple
    REQUIRE(read_word(data, 2) == x18::from_int(2));     // min_profit
    REQUIRE(read_word(data, 3) == 0xA);                  // profit_token
    REQUIRE(read_word(data, 4) == 2);                    // swaps length
    REQUIRE(read_word(data, 5) == 0x40);                 // first element offset
    // first element: 5 head words + length + 2 path entries
    REQUIRE(read_word(data, 6) == 0x40 + 8 * codec::WORD);
    REQUIRE(read_word(data, 7) == 0xA1);                 // venue
    REQUIRE(read_word(data, 8) == 0xA0);                 // path offset within element
    REQUIRE(read_word(data, 12) == 2);                   // path length

    // 1 tuple offset + 3 tuple head + 1 len + 2 offsets + (6 + 2) + (6 + 3)
    REQUIRE(data.size() == 24 * codec::WORD);
}

TEST_CASE("Plan decoding recovers the encoded plan", "[plan][codec]") {
    ArbitragePlan plan = sample_plan();
    REQUIRE(codec::decode_plan(codec::encode_plan(plan)) == plan);

    ArbitragePlan empty{{}, 0, {}};
    REQUIRE(codec::decode_plan(codec::encode_plan(empty)) == empty);
}

TEST_CASE("Plan decoding rejects malformed payloads", "[plan][codec]") {
    std::vector<uint8_t> good = codec::encode_plan(sample_plan());

    SECTION("Empty payload") {
        REQUIRE(decode_error({}) == errors::MALFORMED_PLAN);
    }

    SECTION("Not word aligned") {
        std::vector<uint8_t> bad = good;
        bad.push_back(0);
        REQUIRE(decode_error(bad) == errors::MALFORMED_PLAN);
    }

    SECTION("Truncated") {
        std::vector<uint8_t> bad(good.begin(), good.end() - codec::WORD);
        REQUIRE(decode_error(bad) == errors::MALFORMED_PLAN);
    }

    SECTION("Offset past the end") {
        std::vector<uint8_t> bad = good;
        bad[codec::WORD - 2] = 0xFF;
        REQUIRE(decode_error(bad) == errors::MALFORMED_PLAN);
    }

    SECTION("Misaligned offset") {
        std::vector<uint8_t> bad = good;
        bad[codec::WORD - 1] = 0x21;
        REQUIRE(decode_error(bad) == errors::MALFORMED_PLAN);
    }

    SECTION("Dirty address padding") {
        std::vector<uint8_t> bad = good;
        bad[3 * codec::WORD] = 0x01;   // profit_token word
        REQUIRE(decode_error(bad) == errors::MALFORMED_PLAN);
    }

    SECTION("Amount wider than 128 bits") {
        std::vector<uint8_t> bad = good;
        bad[2 * codec::WORD + 15] = 0x01;   // min_profit word, bit 128
        REQUIRE(decode_error(bad) == errors::MALFORMED_PLAN);
    }

    SECTION("Too many swaps") {
        std::vector<uint8_t> bad = good;
        bad[5 * codec::WORD - 1] = static_cast<uint8_t>(codec::MAX_SWAPS + 1);
        REQUIRE(decode_error(bad) == errors::MALFORMED_PLAN);
    }

    SECTION("Path longer than the limit") {
        PlanBuilder builder(START_TIME);
        std::vector<Address> path(codec::MAX_PATH_LENGTH + 1, TOKEN_A);
        builder.swap(VENUE_1, path, 1, 0);
        REQUIRE(decode_error(builder.encode()) == errors::MALFORMED_PLAN);
    }

    SECTION("Garbage") {
        std::vector<uint8_t> bad(4 * codec::WORD, 0xAB);
        REQUIRE(decode_error(bad) == errors::MALFORMED_PLAN);
    }
}

TEST_CASE("Payload hex conversion", "[plan][codec]") {
    std::vector<uint8_t> data{0x00, 0xAB, 0xFF};
    REQUIRE(codec::to_hex(data) == "0x00abff");
    REQUIRE(codec::from_hex("0x00ABff") == data);
    REQUIRE(codec::from_hex("00abff") == data);
    REQUIRE_THROWS_AS(codec::from_hex("0xabc"), std::invalid_argument);
    REQUIRE_THROWS_AS(codec::from_hex("0xzz"), std::invalid_argument);
}
