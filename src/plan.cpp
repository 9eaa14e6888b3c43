// =============================================================================
// plan.cpp - ABI Codec for ArbitragePlan
// =============================================================================

#include "flashx/plan.hpp"
#include "flashx/errors.hpp"

#include <algorithm>
#include <stdexcept>

namespace flashx {
namespace codec {

namespace {

using Bytes = std::vector<uint8_t>;

void append(Bytes& buf, const Bytes& more) {
    buf.insert(buf.end(), more.begin(), more.end());
}

Bytes encode_uint(Amount v) {
    Bytes out(WORD, 0);
    for (size_t i = 0; i < 16; ++i) {
        out[WORD - 1 - i] = static_cast<uint8_t>(v & 0xFF);
        v >>= 8;
    }
    return out;
}

Bytes encode_address(const Address& addr) {
    Bytes out(WORD, 0);
    std::copy(addr.begin(), addr.end(), out.begin() + (WORD - addr.size()));
    return out;
}

Bytes encode_step(const SwapStep& step) {
    Bytes out;
    append(out, encode_address(step.venue));
    append(out, encode_uint(5 * WORD));  // path follows the five head slots
    append(out, encode_uint(step.amount_in));
    append(out, encode_uint(step.min_amount_out));
    append(out, encode_uint(step.deadline));
    append(out, encode_uint(step.path.size()));
    for (const auto& token : step.path) append(out, encode_address(token));
    return out;
}

[[noreturn]] void malformed(const std::string& what) {
    throw RevertError(errors::MALFORMED_PLAN, what);
}

// Bounds-checked word reader over an ABI payload
class Reader {
public:
    explicit Reader(const Bytes& data) : data_(data) {}

    const uint8_t* word(size_t pos, const char* field) const {
        if (data_.size() < WORD || pos > data_.size() - WORD) {
            malformed(std::string(field) + ": read past end of payload at " + std::to_string(pos));
        }
        return data_.data() + pos;
    }

    // Value must fit in `bits` (64 or 128)
    Amount number(size_t pos, size_t bits, const char* field) const {
        const uint8_t* w = word(pos, field);
        size_t high_bytes = WORD - bits / 8;
        for (size_t i = 0; i < high_bytes; ++i) {
            if (w[i] != 0) malformed(std::string(field) + ": value exceeds " +
                                     std::to_string(bits) + " bits");
        }
        Amount v = 0;
        for (size_t i = high_bytes; i < WORD; ++i) v = (v << 8) | w[i];
        return v;
    }

    Address address(size_t pos, const char* field) const {
        const uint8_t* w = word(pos, field);
        for (size_t i = 0; i < 12; ++i) {
            if (w[i] != 0) malformed(std::string(field) + ": dirty address padding");
        }
        Address addr;
        std::copy(w + 12, w + WORD, addr.begin());
        return addr;
    }

    // Offset stored at pos, relative to base
    size_t offset(size_t pos, size_t base, const char* field) const {
        Amount rel = number(pos, 64, field);
        if (rel % WORD != 0) malformed(std::string(field) + ": misaligned offset");
        if (rel >= data_.size() || base > data_.size() - static_cast<size_t>(rel)) {
            malformed(std::string(field) + ": offset out of range");
        }
        return base + static_cast<size_t>(rel);
    }

    size_t count(size_t pos, size_t max, const char* field) const {
        Amount n = number(pos, 64, field);
        if (n > max) {
            malformed(std::string(field) + ": " + to_string(n) + " entries exceeds limit " +
                      std::to_string(max));
        }
        size_t needed = (static_cast<size_t>(n) + 1) * WORD;
        if (pos > data_.size() || data_.size() - pos < needed) {
            malformed(std::string(field) + ": declared length runs past end of payload");
        }
        return static_cast<size_t>(n);
    }

private:
    const Bytes& data_;
};

int hex_digit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

// =============================================================================
// Encoding
// =============================================================================

std::vector<uint8_t> encode_plan(const ArbitragePlan& plan) {
    // Swap[] tail: length, element offsets, elements
    Bytes elements;
    Bytes offsets;
    size_t next = plan.swaps.size() * WORD;
    for (const auto& step : plan.swaps) {
        Bytes enc = encode_step(step);
        append(offsets, encode_uint(next));
        next += enc.size();
        append(elements, enc);
    }

    Bytes out;
    append(out, encode_uint(WORD));          // offset of the plan tuple
    append(out, encode_uint(3 * WORD));      // swaps follow the three head slots
    append(out, encode_uint(plan.min_profit));
    append(out, encode_address(plan.profit_token));
    append(out, encode_uint(plan.swaps.size()));
    append(out, offsets);
    append(out, elements);
    return out;
}

// =============================================================================
// Decoding
// =============================================================================

ArbitragePlan decode_plan(const std::vector<uint8_t>& payload) {
    if (payload.empty()) malformed("empty payload");
    if (payload.size() % WORD != 0) malformed("payload is not word aligned");

    Reader r(payload);
    ArbitragePlan plan{{}, 0, {}};

    size_t tuple = r.offset(0, 0, "plan");
    size_t swaps_at = r.offset(tuple, tuple, "swaps");
    plan.min_profit = r.number(tuple + WORD, 128, "min_profit");
    plan.profit_token = r.address(tuple + 2 * WORD, "profit_token");

    size_t n = r.count(swaps_at, MAX_SWAPS, "swaps");
    size_t elements = swaps_at + WORD;
    plan.swaps.reserve(n);

    for (size_t i = 0; i < n; ++i) {
        size_t at = r.offset(elements + i * WORD, elements, "swap");

        SwapStep step;
        step.venue = r.address(at, "venue");
        size_t path_at = r.offset(at + WORD, at, "path");
        step.amount_in = r.number(at + 2 * WORD, 128, "amount_in");
        step.min_amount_out = r.number(at + 3 * WORD, 128, "min_amount_out");
        step.deadline = static_cast<Timestamp>(r.number(at + 4 * WORD, 64, "deadline"));

        size_t len = r.count(path_at, MAX_PATH_LENGTH, "path");
        step.path.reserve(len);
        for (size_t j = 0; j < len; ++j) {
            step.path.push_back(r.address(path_at + (j + 1) * WORD, "path token"));
        }
        plan.swaps.push_back(std::move(step));
    }
    return plan;
}

// =============================================================================
// Hex
// =============================================================================

std::string to_hex(const std::vector<uint8_t>& data) {
    static const char* digits = "0123456789abcdef";
    std::string out;
    out.reserve(2 * data.size() + 2);
    out += "0x";
    for (uint8_t b : data) {
        out += digits[b >> 4];
        out += digits[b & 0xF];
    }
    return out;
}

std::vector<uint8_t> from_hex(const std::string& hex) {
    size_t start = (hex.rfind("0x", 0) == 0 || hex.rfind("0X", 0) == 0) ? 2 : 0;
    if ((hex.size() - start) % 2 != 0) {
        throw std::invalid_argument("odd number of hex digits");
    }
    std::vector<uint8_t> out;
    out.reserve((hex.size() - start) / 2);
    for (size_t i = start; i < hex.size(); i += 2) {
        int hi = hex_digit(hex[i]);
        int lo = hex_digit(hex[i + 1]);
        if (hi < 0 || lo < 0) {
            throw std::invalid_argument("invalid hex digit at position " + std::to_string(i));
        }
        out.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }
    return out;
}

} // namespace codec
} // namespace flashx
