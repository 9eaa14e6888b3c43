// =============================================================================
// types.cpp - Address, Amount and Checked Arithmetic Helpers
// =============================================================================

#include "flashx/types.hpp"
#include "flashx/errors.hpp"

#include <algorithm>
#include <stdexcept>

namespace flashx {

namespace {

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

constexpr Amount AMOUNT_MAX = ~static_cast<Amount>(0);

} // namespace

// =============================================================================
// Addresses
// =============================================================================

namespace addresses {

std::string to_hex(const Address& addr) {
    static const char* digits = "0123456789abcdef";
    std::string out = "0x";
    out.reserve(42);
    for (auto b : addr) {
        out += digits[b >> 4];
        out += digits[b & 0x0F];
    }
    return out;
}

Address from_hex(const std::string& hex) {
    size_t start = (hex.rfind("0x", 0) == 0 || hex.rfind("0X", 0) == 0) ? 2 : 0;
    if (hex.size() - start != 40) {
        throw std::invalid_argument("address must be 20 bytes: " + hex);
    }
    Address addr = {};
    for (size_t i = 0; i < 20; ++i) {
        int hi = hex_value(hex[start + 2 * i]);
        int lo = hex_value(hex[start + 2 * i + 1]);
        if (hi < 0 || lo < 0) {
            throw std::invalid_argument("invalid hex digit in address: " + hex);
        }
        addr[i] = static_cast<uint8_t>((hi << 4) | lo);
    }
    return addr;
}

} // namespace addresses

// =============================================================================
// Decimal Conversion
// =============================================================================

std::string to_string(Amount v) {
    if (v == 0) return "0";
    std::string out;
    while (v > 0) {
        out += static_cast<char>('0' + static_cast<int>(v % 10));
        v /= 10;
    }
    std::reverse(out.begin(), out.end());
    return out;
}

std::string to_string_signed(I128 v) {
    if (v < 0) {
        // -(v + 1) + 1 avoids overflow on the minimum value
        Amount magnitude = static_cast<Amount>(-(v + 1)) + 1;
        return "-" + to_string(magnitude);
    }
    return to_string(static_cast<Amount>(v));
}

Amount parse_amount(const std::string& s) {
    if (s.empty()) {
        throw std::invalid_argument("empty amount");
    }
    Amount v = 0;
    for (char c : s) {
        if (c < '0' || c > '9') {
            throw std::invalid_argument("invalid amount: " + s);
        }
        Amount digit = static_cast<Amount>(c - '0');
        if (v > (AMOUNT_MAX - digit) / 10) {
            throw std::invalid_argument("amount exceeds 128 bits: " + s);
        }
        v = v * 10 + digit;
    }
    return v;
}

// =============================================================================
// Checked Arithmetic
// =============================================================================

Amount checked_add(Amount a, Amount b) {
    Amount r;
    if (__builtin_add_overflow(a, b, &r)) {
        throw RevertError(errors::ARITHMETIC_OVERFLOW,
                          "addition overflow: " + to_string(a) + " + " + to_string(b));
    }
    return r;
}

Amount checked_sub(Amount a, Amount b) {
    if (b > a) {
        throw RevertError(errors::ARITHMETIC_UNDERFLOW,
                          "subtraction underflow: " + to_string(a) + " - " + to_string(b));
    }
    return a - b;
}

Amount checked_mul(Amount a, Amount b) {
    Amount r;
    if (__builtin_mul_overflow(a, b, &r)) {
        throw RevertError(errors::ARITHMETIC_OVERFLOW,
                          "multiplication overflow: " + to_string(a) + " * " + to_string(b));
    }
    return r;
}

I128 signed_diff(Amount a, Amount b) {
    constexpr Amount max_positive = ~static_cast<Amount>(0) >> 1;
    if (a >= b) {
        Amount d = a - b;
        return d > max_positive ? static_cast<I128>(max_positive) : static_cast<I128>(d);
    }
    Amount d = b - a;
    if (d > max_positive) return -static_cast<I128>(max_positive) - 1;
    return -static_cast<I128>(d);
}

Amount apply_bps(Amount amount, uint32_t bps) {
    return mul_div(amount, bps, BPS_DENOMINATOR);
}

Amount mul_div(Amount a, Amount b, Amount denominator) {
    if (denominator == 0) {
        throw RevertError(errors::ARITHMETIC_OVERFLOW, "division by zero");
    }

    // 256-bit product as (hi, lo) from 64-bit limbs
    const Amount mask = 0xFFFFFFFFFFFFFFFFULL;
    Amount a_lo = a & mask, a_hi = a >> 64;
    Amount b_lo = b & mask, b_hi = b >> 64;

    Amount ll = a_lo * b_lo;
    Amount lh = a_lo * b_hi;
    Amount hl = a_hi * b_lo;
    Amount hh = a_hi * b_hi;

    Amount mid = (ll >> 64) + (lh & mask) + (hl & mask);
    Amount lo = (ll & mask) | (mid << 64);
    Amount hi = hh + (lh >> 64) + (hl >> 64) + (mid >> 64);

    if (hi >= denominator) {
        throw RevertError(errors::ARITHMETIC_OVERFLOW,
                          "mul_div result exceeds 128 bits");
    }
    if (hi == 0) return lo / denominator;

    // Restoring long division of (hi, lo) by denominator, one bit at a time
    Amount quotient = 0;
    Amount remainder = hi;
    for (int i = 127; i >= 0; --i) {
        bool carry = (remainder >> 127) != 0;
        remainder = (remainder << 1) | ((lo >> i) & 1);
        quotient <<= 1;
        if (carry || remainder >= denominator) {
            remainder -= denominator;
            quotient |= 1;
        }
    }
    return quotient;
}

} // namespace flashx
