#ifndef FLASHX_TYPES_HPP
#define FLASHX_TYPES_HPP

#include <cstdint>
#include <array>
#include <string>
#include <cstring>
#include <vector>
#include <functional>

namespace flashx {

// =============================================================================
// Addresses (EVM 20-byte addresses)
// =============================================================================

using Address = std::array<uint8_t, 20>;

struct AddressHash {
    size_t operator()(const Address& addr) const noexcept {
        uint64_t h = 0;
        for (auto b : addr) h = h * 31 + b;
        return static_cast<size_t>(h);
    }
};

namespace addresses {

constexpr Address ZERO = {};

// Helper to create an address from a small integer (tests, fixtures, tooling)
constexpr Address from_u64(uint64_t n) {
    Address addr = {};
    for (size_t i = 0; i < 8; ++i) {
        addr[19 - i] = static_cast<uint8_t>((n >> (8 * i)) & 0xFF);
    }
    return addr;
}

constexpr bool is_zero(const Address& addr) {
    for (auto b : addr) {
        if (b != 0) return false;
    }
    return true;
}

// 0x-prefixed lowercase hex
std::string to_hex(const Address& addr);

// Accepts 40 hex digits with or without 0x prefix; throws std::invalid_argument
Address from_hex(const std::string& hex);

} // namespace addresses

// =============================================================================
// Amounts (unsigned token base units, X18 by convention)
// =============================================================================

using Amount = unsigned __int128;
using I128 = __int128;

constexpr Amount X18_ONE = 1000000000000000000ULL;  // 1e18
constexpr uint32_t BPS_DENOMINATOR = 10000;

namespace x18 {

inline Amount from_int(uint64_t v) {
    return static_cast<Amount>(v) * X18_ONE;
}

// Exact for values with at most 4 fractional digits, which covers fixtures
inline Amount from_double(double v) {
    auto ten_thousandths = static_cast<uint64_t>(v * 10000.0 + 0.5);
    return static_cast<Amount>(ten_thousandths) * (X18_ONE / 10000);
}

inline double to_double(Amount v) {
    return static_cast<double>(v) / static_cast<double>(X18_ONE);
}

} // namespace x18

// Decimal rendering of 128-bit values (no iostream support for __int128)
std::string to_string(Amount v);
std::string to_string_signed(I128 v);

// Parses a base-10 unsigned integer into an Amount; throws std::invalid_argument
Amount parse_amount(const std::string& s);

// =============================================================================
// Checked arithmetic (reverts instead of wrapping)
// =============================================================================

Amount checked_add(Amount a, Amount b);
Amount checked_sub(Amount a, Amount b);
Amount checked_mul(Amount a, Amount b);

// a - b as a signed value, clamped to the I128 range
I128 signed_diff(Amount a, Amount b);

// amount * bps / 10000, rounded down
Amount apply_bps(Amount amount, uint32_t bps);

// floor(a * b / denominator) with a 256-bit intermediate product
Amount mul_div(Amount a, Amount b, Amount denominator);

// =============================================================================
// Time
// =============================================================================

using Timestamp = uint64_t;  // seconds since epoch

} // namespace flashx

#endif // FLASHX_TYPES_HPP
