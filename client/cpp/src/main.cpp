// flashx command-line tool
//
// Encodes and decodes operation payloads and replays arbitrage scenarios
// against an in-process runtime.

#include "scenario.hpp"

#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using json = nlohmann::json;
using namespace flashx;

namespace {

constexpr int EXIT_REVERTED = 2;

// Keeps the process-wide logger open for the lifetime of a command
class LogSession {
public:
    explicit LogSession(const GeneralConfig& general) {
        Logger::Initialize(general.log_file, Logger::ParseLevel(general.log_level));
    }
    ~LogSession() { Logger::Shutdown(); }

    LogSession(const LogSession&) = delete;
    LogSession& operator=(const LogSession&) = delete;
};

std::string read_file(const std::string& path) {
    std::ifstream file{path};
    if (!file.is_open()) throw ConfigError("cannot open " + path);
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

json read_json(const std::string& path) {
    try {
        return json::parse(read_file(path));
    } catch (const json::parse_error& e) {
        throw ConfigError(path + ": " + e.what());
    }
}

//------------------------------------------------------------------------------
// Commands
//------------------------------------------------------------------------------

int cmd_encode(const std::string& plan_path) {
    ArbitragePlan plan = cli::plan_from_json(read_json(plan_path));
    std::cout << codec::to_hex(codec::encode_plan(plan)) << "\n";
    return 0;
}

int cmd_decode(const std::string& hex) {
    std::vector<uint8_t> payload;
    try {
        payload = codec::from_hex(hex);
    } catch (const std::invalid_argument& e) {
        throw ConfigError(std::string("payload: ") + e.what());
    }
    std::cout << cli::plan_to_json(codec::decode_plan(payload)).dump(2) << "\n";
    return 0;
}

int cmd_run(const std::string& config_path, const std::string& scenario_path) {
    Config config = Config::from_file(config_path);
    config.validate();
    LogSession log(config.general);

    cli::ScenarioReport result = cli::run_scenario(config, read_json(scenario_path));
    std::cout << result.report.dump(2) << "\n";
    return result.reverted ? EXIT_REVERTED : 0;
}

void print_usage(const char* prog) {
    std::cout << "flashx command-line tool\n\n"
              << "Usage: " << prog << " <command> [args...]\n\n"
              << "Commands:\n"
              << "  encode <plan.json>                 Print the ABI payload for a plan\n"
              << "  decode <hex>                       Print the plan carried by a payload\n"
              << "  run <config.toml> <scenario.json>  Simulate and execute a scenario\n\n"
              << "Exit status: 0 on success, 1 on invalid input, 2 if the operation reverted\n";
}

} // namespace

int main(int argc, char* argv[]) {
    std::vector<std::string> args(argv + 1, argv + argc);
    if (args.empty() || args[0] == "-h" || args[0] == "--help") {
        print_usage(argv[0]);
        return args.empty() ? 1 : 0;
    }

    const std::string& cmd = args[0];
    try {
        if (cmd == "encode" && args.size() == 2) return cmd_encode(args[1]);
        if (cmd == "decode" && args.size() == 2) return cmd_decode(args[1]);
        if (cmd == "run" && args.size() == 3) return cmd_run(args[1], args[2]);
    } catch (const ConfigError& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 1;
    } catch (const RevertError& e) {
        std::cerr << "reverted: " << e.what() << "\n";
        return EXIT_REVERTED;
    } catch (const json::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 1;
    }

    std::cerr << "Unknown command or wrong arguments: " << cmd << "\n";
    print_usage(argv[0]);
    return 1;
}
