// =============================================================================
// scenario.cpp - JSON conversion and scenario replay for flashx-cli
// =============================================================================

#include "scenario.hpp"

#include <map>
#include <memory>
#include <stdexcept>
#include <type_traits>
#include <variant>
#include <vector>

namespace flashx::cli {

namespace {

const json& require(const json& j, const std::string& key) {
    if (!j.is_object() || !j.contains(key)) {
        throw ConfigError("missing field '" + key + "'");
    }
    return j.at(key);
}

} // namespace

//------------------------------------------------------------------------------
// JSON Conversion
//------------------------------------------------------------------------------

Amount amount_from_json(const json& j, const std::string& field) {
    if (j.is_string()) {
        try {
            return parse_amount(j.get<std::string>());
        } catch (const std::invalid_argument& e) {
            throw ConfigError(field + ": " + e.what());
        }
    }
    if (j.is_number_unsigned()) return j.get<uint64_t>();
    throw ConfigError(field + " must be a decimal string or unsigned integer");
}

Address address_from_json(const json& j, const std::string& field) {
    if (!j.is_string()) throw ConfigError(field + " must be a hex string");
    try {
        return addresses::from_hex(j.get<std::string>());
    } catch (const std::invalid_argument& e) {
        throw ConfigError(field + ": " + e.what());
    }
}

ArbitragePlan plan_from_json(const json& j) {
    ArbitragePlan plan{{}, 0, {}};

    const json& swaps = require(j, "swaps");
    if (!swaps.is_array()) throw ConfigError("swaps must be an array");
    for (size_t i = 0; i < swaps.size(); ++i) {
        const json& s = swaps[i];
        std::string at = "swaps[" + std::to_string(i) + "].";

        SwapStep step{};
        step.venue = address_from_json(require(s, "venue"), at + "venue");
        const json& path = require(s, "path");
        if (!path.is_array()) throw ConfigError(at + "path must be an array");
        for (const auto& token : path) {
            step.path.push_back(address_from_json(token, at + "path"));
        }
        step.amount_in = amount_from_json(require(s, "amount_in"), at + "amount_in");
        step.min_amount_out = amount_from_json(require(s, "min_amount_out"), at + "min_amount_out");
        const json& deadline = require(s, "deadline");
        if (!deadline.is_number_unsigned()) throw ConfigError(at + "deadline must be unsigned");
        step.deadline = deadline.get<Timestamp>();
        plan.swaps.push_back(std::move(step));
    }

    if (j.contains("min_profit")) plan.min_profit = amount_from_json(j.at("min_profit"), "min_profit");
    if (j.contains("profit_token")) plan.profit_token = address_from_json(j.at("profit_token"), "profit_token");
    return plan;
}

json plan_to_json(const ArbitragePlan& plan) {
    json swaps = json::array();
    for (const auto& step : plan.swaps) {
        json path = json::array();
        for (const auto& token : step.path) path.push_back(addresses::to_hex(token));
        swaps.push_back({
            {"venue", addresses::to_hex(step.venue)},
            {"path", path},
            {"amount_in", to_string(step.amount_in)},
            {"min_amount_out", to_string(step.min_amount_out)},
            {"deadline", step.deadline}
        });
    }
    return {
        {"swaps", swaps},
        {"min_profit", to_string(plan.min_profit)},
        {"profit_token", addresses::to_hex(plan.profit_token)}
    };
}

json event_to_json(const EventRecord& record) {
    json j = std::visit([](const auto& e) -> json {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, SwapExecuted>) {
            return {{"type", "SwapExecuted"}, {"venue", addresses::to_hex(e.venue)},
                    {"token_in", addresses::to_hex(e.token_in)},
                    {"token_out", addresses::to_hex(e.token_out)},
                    {"amount_in", to_string(e.amount_in)}, {"amount_out", to_string(e.amount_out)}};
        } else if constexpr (std::is_same_v<T, ArbitrageExecuted>) {
            return {{"type", "ArbitrageExecuted"}, {"asset", addresses::to_hex(e.asset)},
                    {"borrowed", to_string(e.borrowed)}, {"fee", to_string(e.fee)},
                    {"profit", to_string(e.profit)}, {"operation", e.operation}};
        } else if constexpr (std::is_same_v<T, FlashLoan>) {
            return {{"type", "FlashLoan"}, {"receiver", addresses::to_hex(e.receiver)},
                    {"initiator", addresses::to_hex(e.initiator)},
                    {"asset", addresses::to_hex(e.asset)}, {"amount", to_string(e.amount)},
                    {"fee", to_string(e.fee)}, {"referral_code", e.referral_code}};
        } else if constexpr (std::is_same_v<T, RouterApprovalChanged>) {
            return {{"type", "RouterApprovalChanged"}, {"venue", addresses::to_hex(e.venue)},
                    {"approved", e.approved}};
        } else if constexpr (std::is_same_v<T, OperatorChanged>) {
            return {{"type", "OperatorChanged"}, {"previous", addresses::to_hex(e.previous)},
                    {"current", addresses::to_hex(e.current)}};
        } else {
            return {{"type", "Swept"}, {"token", addresses::to_hex(e.token)},
                    {"to", addresses::to_hex(e.to)}, {"amount", to_string(e.amount)},
                    {"native", e.native}};
        }
    }, record.event);
    j["emitter"] = addresses::to_hex(record.emitter);
    return j;
}

json revert_to_json(const RevertError& e) {
    json j = {
        {"status", "reverted"},
        {"error", error_name(e.code())},
        {"code", e.code()},
        {"reason", e.reason()}
    };
    if (e.step_index()) j["step"] = *e.step_index();
    if (e.cause() != errors::OK) j["cause"] = error_name(e.cause());
    if (e.shortfall() > 0) j["shortfall"] = to_string(e.shortfall());
    return j;
}

//------------------------------------------------------------------------------
// Scenario Replay
//------------------------------------------------------------------------------

ScenarioReport run_scenario(const Config& config, const json& scenario) {
    Timestamp start = 0;
    if (scenario.contains("time")) start = scenario.at("time").get<Timestamp>();
    Runtime runtime(start);

    Address asset = address_from_json(require(scenario, "asset"), "asset");
    Amount amount = amount_from_json(require(scenario, "amount"), "amount");

    FlashLender lender(runtime, config.lender.address, config.lender.premium_bps);
    Amount liquidity = scenario.contains("lender_liquidity")
        ? amount_from_json(scenario.at("lender_liquidity"), "lender_liquidity")
        : amount;
    lender.list_asset(asset, liquidity);

    std::map<std::string, std::unique_ptr<ConstantProductVenue>> venues;
    for (const auto& [name, cfg] : config.venues) {
        venues[name] = std::make_unique<ConstantProductVenue>(runtime, cfg.address, cfg.fee_bps);
    }

    FlashX engine(runtime, lender, config.engine, config.approved_venues());
    for (auto& [name, venue] : venues) engine.register_venue(*venue);

    if (scenario.contains("balances")) {
        for (const auto& b : scenario.at("balances")) {
            runtime.mint(address_from_json(require(b, "token"), "balances.token"),
                         address_from_json(require(b, "holder"), "balances.holder"),
                         amount_from_json(require(b, "amount"), "balances.amount"));
        }
    }

    if (scenario.contains("pools")) {
        for (const auto& p : scenario.at("pools")) {
            std::string name = require(p, "venue").get<std::string>();
            auto it = venues.find(name);
            if (it == venues.end()) throw ConfigError("pool references unknown venue " + name);

            Address token_a = address_from_json(require(p, "token_a"), "pools.token_a");
            Address token_b = address_from_json(require(p, "token_b"), "pools.token_b");
            it->second->create_pair(token_a, token_b,
                                    address_from_json(require(p, "pair"), "pools.pair"));
            it->second->add_liquidity(token_a, amount_from_json(require(p, "amount_a"), "pools.amount_a"),
                                      token_b, amount_from_json(require(p, "amount_b"), "pools.amount_b"));
        }
    }

    std::vector<uint8_t> payload = codec::encode_plan(plan_from_json(require(scenario, "plan")));
    size_t events_before = runtime.events().size();

    SimulationResult sim = engine.simulate(asset, amount, payload);
    ScenarioReport result{json::object(), false};
    json& out = result.report;
    out["simulation"] = {
        {"feasible", sim.feasible},
        {"expected_end", to_string(sim.expected_end)},
        {"owed", to_string(sim.owed)},
        {"expected_profit", to_string_signed(sim.expected_profit)},
        {"meets_min_profit", sim.meets_min_profit},
        {"reason", sim.reason}
    };

    try {
        engine.initiate(config.engine.operator_address, asset, amount, payload);
        out["outcome"] = {{"status", "settled"}};
    } catch (const RevertError& e) {
        out["outcome"] = revert_to_json(e);
        result.reverted = true;
    }

    Ledger::Stats stats = engine.stats();
    out["stats"] = {
        {"operations", stats.operations},
        {"total_profit", to_string(stats.total_profit)},
        {"owner_balance", to_string(runtime.balance_of(asset, config.engine.owner))}
    };

    json events = json::array();
    std::vector<EventRecord> all = runtime.events();
    for (size_t i = events_before; i < all.size(); ++i) events.push_back(event_to_json(all[i]));
    out["events"] = events;

    return result;
}

} // namespace flashx::cli
