// =============================================================================
// config.cpp - TOML Configuration
// =============================================================================

#include "flashx/config.hpp"
#include "flashx/errors.hpp"

#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace flashx {

namespace {

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

// Drops a trailing "# comment" outside of quotes
std::string strip_comment(const std::string& s) {
    bool quoted = false;
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '"') quoted = !quoted;
        else if (s[i] == '#' && !quoted) return s.substr(0, i);
    }
    return s;
}

std::string unquote(const std::string& s) {
    if (s.size() >= 2 && s[0] == '"' && s.back() == '"') {
        return s.substr(1, s.size() - 2);
    }
    return s;
}

class LineError {
public:
    explicit LineError(size_t line) : line_(line) {}

    [[noreturn]] void fail(const std::string& msg) const {
        throw ConfigError("line " + std::to_string(line_) + ": " + msg);
    }

    uint64_t unsigned_value(const std::string& key, const std::string& value,
                            uint64_t max) const {
        if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
            fail(key + " must be a non-negative integer, got '" + value + "'");
        }
        uint64_t parsed = 0;
        try {
            parsed = std::stoull(value);
        } catch (const std::out_of_range&) {
            fail(key + " is out of range");
        }
        if (parsed > max) fail(key + " is out of range");
        return parsed;
    }

    bool bool_value(const std::string& key, const std::string& value) const {
        if (value == "true") return true;
        if (value == "false") return false;
        fail(key + " must be true or false, got '" + value + "'");
    }

    Address address_value(const std::string& key, const std::string& value) const {
        try {
            return addresses::from_hex(value);
        } catch (const std::invalid_argument& e) {
            fail(key + ": " + e.what());
        }
    }

private:
    size_t line_;
};

} // namespace

Config Config::from_file(std::string_view path) {
    std::string path_str{path};
    std::ifstream file{path_str};
    if (!file.is_open()) {
        throw ConfigError("cannot open config file: " + path_str);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return from_toml(buffer.str());
}

Config Config::from_toml(std::string_view content) {
    Config config;
    std::string current_section;
    std::string current_subsection;

    std::string content_str{content};
    std::istringstream stream{content_str};
    std::string line;
    size_t line_no = 0;

    while (std::getline(stream, line)) {
        ++line_no;
        LineError at(line_no);
        line = trim(strip_comment(line));

        if (line.empty()) continue;

        // Section header
        if (line[0] == '[') {
            size_t end = line.find(']');
            if (end == std::string::npos) at.fail("unterminated section header");

            std::string section = trim(line.substr(1, end - 1));
            auto dot = section.find('.');
            if (dot != std::string::npos) {
                current_section = section.substr(0, dot);
                current_subsection = section.substr(dot + 1);
            } else {
                current_section = section;
                current_subsection.clear();
            }

            if (current_section == "venues") {
                if (current_subsection.empty()) at.fail("venue section needs a name");
                config.venues[current_subsection];
            } else if (current_section != "general" && current_section != "engine" &&
                       current_section != "lender") {
                at.fail("unknown section [" + section + "]");
            }
            continue;
        }

        auto eq = line.find('=');
        if (eq == std::string::npos) at.fail("expected key = value");

        std::string key = trim(line.substr(0, eq));
        std::string value = unquote(trim(line.substr(eq + 1)));

        if (current_section == "general") {
            if (key == "log_level") config.general.log_level = value;
            else if (key == "log_file") config.general.log_file = value;
            else at.fail("unknown key general." + key);
        }
        else if (current_section == "engine") {
            auto& e = config.engine;
            if (key == "address") e.address = at.address_value(key, value);
            else if (key == "owner") e.owner = at.address_value(key, value);
            else if (key == "operator") e.operator_address = at.address_value(key, value);
            else if (key == "referral_code")
                e.referral_code = static_cast<uint16_t>(
                    at.unsigned_value(key, value, std::numeric_limits<uint16_t>::max()));
            else if (key == "deadline_secs")
                e.deadline_secs = at.unsigned_value(key, value, std::numeric_limits<uint32_t>::max());
            else at.fail("unknown key engine." + key);
        }
        else if (current_section == "lender") {
            if (key == "address") config.lender.address = at.address_value(key, value);
            else if (key == "premium_bps")
                config.lender.premium_bps =
                    static_cast<uint32_t>(at.unsigned_value(key, value, BPS_DENOMINATOR - 1));
            else at.fail("unknown key lender." + key);
        }
        else if (current_section == "venues") {
            auto& v = config.venues[current_subsection];
            if (key == "address") v.address = at.address_value(key, value);
            else if (key == "fee_bps")
                v.fee_bps = static_cast<uint32_t>(at.unsigned_value(key, value, BPS_DENOMINATOR - 1));
            else if (key == "approved") v.approved = at.bool_value(key, value);
            else at.fail("unknown key venues." + current_subsection + "." + key);
        }
        else {
            at.fail("key '" + key + "' outside of any section");
        }
    }

    return config;
}

void Config::validate() const {
    if (addresses::is_zero(engine.address)) throw ConfigError("engine.address is required");
    if (addresses::is_zero(engine.owner)) throw ConfigError("engine.owner is required");
    if (addresses::is_zero(engine.operator_address)) throw ConfigError("engine.operator is required");
    if (addresses::is_zero(lender.address)) throw ConfigError("lender.address is required");
    if (lender.premium_bps >= BPS_DENOMINATOR) {
        throw ConfigError("lender.premium_bps must be below " + std::to_string(BPS_DENOMINATOR));
    }

    for (const auto& [name, venue] : venues) {
        if (addresses::is_zero(venue.address)) {
            throw ConfigError("venues." + name + ".address is required");
        }
    }
}

std::vector<Address> Config::approved_venues() const {
    std::vector<Address> result;
    for (const auto& [name, venue] : venues) {
        if (venue.approved) result.push_back(venue.address);
    }
    return result;
}

} // namespace flashx
