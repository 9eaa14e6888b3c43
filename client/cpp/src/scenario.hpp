#ifndef FLASHX_CLI_SCENARIO_HPP
#define FLASHX_CLI_SCENARIO_HPP

#include <string>

#include <flashx/flashx.hpp>
#include <nlohmann/json.hpp>

namespace flashx::cli {

using json = nlohmann::json;

// =============================================================================
// JSON Conversion
//
// Amounts travel as decimal strings since they exceed 64 bits; small unsigned
// numbers are accepted on input. Malformed input throws ConfigError naming
// the offending field.
// =============================================================================

Amount amount_from_json(const json& j, const std::string& field);
Address address_from_json(const json& j, const std::string& field);

// {swaps: [{venue, path, amount_in, min_amount_out, deadline}], min_profit, profit_token}
ArbitragePlan plan_from_json(const json& j);
json plan_to_json(const ArbitragePlan& plan);

json event_to_json(const EventRecord& record);
json revert_to_json(const RevertError& e);

// =============================================================================
// Scenario Replay
//
// Scenario layout:
//   time, asset, amount, lender_liquidity,
//   balances: [{token, holder, amount}],
//   pools:    [{venue, pair, token_a, amount_a, token_b, amount_b}],
//   plan:     {swaps, min_profit, profit_token}
//
// Builds a fresh runtime from `config` and the scenario, simulates the plan,
// then initiates it as the configured operator.
// =============================================================================

struct ScenarioReport {
    json report;     // simulation, outcome, stats and the events emitted
    bool reverted;
};

ScenarioReport run_scenario(const Config& config, const json& scenario);

} // namespace flashx::cli

#endif // FLASHX_CLI_SCENARIO_HPP
