#ifndef FLASHX_CONFIG_HPP
#define FLASHX_CONFIG_HPP

#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "types.hpp"

namespace flashx {

// =============================================================================
// Configuration Sections
// =============================================================================

struct GeneralConfig {
    std::string log_level = "info";
    std::string log_file;           // empty logs to stderr
};

struct EngineConfig {
    Address address = addresses::from_u64(0xF1A5);
    Address owner;
    Address operator_address;
    uint16_t referral_code = 0;
    Timestamp deadline_secs = 120;  // default step deadline offset for plans
};

struct LenderConfig {
    Address address = addresses::from_u64(0x1E4D);
    uint32_t premium_bps = 5;
};

struct VenueConfig {
    Address address;
    uint32_t fee_bps = 30;
    bool approved = true;
};

// =============================================================================
// Config - TOML subset loader with builder methods
//
//   [general]          log_level, log_file
//   [engine]           address, owner, operator, referral_code, deadline_secs
//   [lender]           address, premium_bps
//   [venues.<name>]    address, fee_bps, approved
// =============================================================================

class Config {
public:
    GeneralConfig general;
    EngineConfig engine;
    LenderConfig lender;
    std::map<std::string, VenueConfig> venues;

    Config() = default;

    // Throws ConfigError on unreadable files, malformed lines, unknown keys
    // and invalid values
    static Config from_file(std::string_view path);
    static Config from_toml(std::string_view content);

    // Throws ConfigError when a required principal is missing
    void validate() const;

    // Allowlist seed: every venue marked approved
    std::vector<Address> approved_venues() const;

    // Builder methods
    Config& with_log_level(std::string_view level) {
        general.log_level = std::string(level);
        return *this;
    }

    Config& with_log_file(std::string_view path) {
        general.log_file = std::string(path);
        return *this;
    }

    Config& with_engine(const Address& address, const Address& owner, const Address& op) {
        engine.address = address;
        engine.owner = owner;
        engine.operator_address = op;
        return *this;
    }

    Config& with_referral_code(uint16_t code) {
        engine.referral_code = code;
        return *this;
    }

    Config& with_deadline_secs(Timestamp secs) {
        engine.deadline_secs = secs;
        return *this;
    }

    Config& with_lender(const Address& address, uint32_t premium_bps = 5) {
        lender.address = address;
        lender.premium_bps = premium_bps;
        return *this;
    }

    Config& with_venue(std::string_view name, VenueConfig cfg) {
        venues[std::string(name)] = cfg;
        return *this;
    }
};

} // namespace flashx

#endif // FLASHX_CONFIG_HPP
