// Tests for configuration resolution: defaults, environment, command line.

#include "config/server_config.hpp"
#include "test_support.hpp"

#include <map>
#include <string>
#include <vector>

using server_config::ParseOutcome;
using server_config::ParseResult;
using test_support::check;

namespace test_server_config {

// Lookup backed by a fixed map instead of the process environment.
static server_config::EnvironmentLookup fake_environment(const std::map<std::string, std::string> &variables) {
    return [variables](const char *name) -> const char * {
        auto found = variables.find(name);
        return found == variables.end() ? nullptr : found->second.c_str();
    };
}

// Test: defaults are rooted at the home directory.
static bool test_defaults() {
    ParseResult result = server_config::load_config({"mcpdispatch"}, "/home/tester", fake_environment({}));
    const auto &config = result.config;
    bool success = result.outcome == ParseOutcome::run &&
                   config.registry_path == "/home/tester/.mcp-global/global-registry.json" &&
                   config.servers_directory == "/home/tester/.mcp-global/servers/binaries" &&
                   config.refresh_interval_milliseconds == 300000 && config.max_concurrent_processes == 100 &&
                   config.default_timeout_milliseconds == 30000 && config.provider_launcher == "node" &&
                   config.detail_cache_ttl_milliseconds == 30000;
    return check(success, "defaults match the documented values");
}

// Test: flags override the environment, which overrides defaults.
static bool test_precedence() {
    auto environment = fake_environment({{"MCP_REGISTRY_PATH", "/etc/registry.json"},
                                         {"MCP_SERVERS_DIR", "/srv/providers"},
                                         {"MCPDISPATCH_MAX_PROCESSES", "8"},
                                         {"MCPDISPATCH_LAUNCHER", ""}});
    ParseResult result = server_config::load_config(
        {"mcpdispatch", "--registry", "/tmp/override.json", "--timeout-ms", "1500"}, "/home/tester", environment);
    const auto &config = result.config;
    bool success = result.outcome == ParseOutcome::run && config.registry_path == "/tmp/override.json" &&
                   config.servers_directory == "/srv/providers" && config.max_concurrent_processes == 8 &&
                   config.default_timeout_milliseconds == 1500 && config.provider_launcher.empty();
    return check(success, "command line beats environment beats defaults");
}

// Test: invalid numbers and unknown options exit with status 2.
static bool test_invalid_values() {
    ParseResult bad_flag = server_config::load_config({"mcpdispatch", "--max-processes", "0"}, "/h", fake_environment({}));
    ParseResult bad_env = server_config::load_config({"mcpdispatch"}, "/h",
                                                     fake_environment({{"MCPDISPATCH_TIMEOUT_MS", "soon"}}));
    ParseResult unknown = server_config::load_config({"mcpdispatch", "--frobnicate"}, "/h", fake_environment({}));
    ParseResult missing = server_config::load_config({"mcpdispatch", "--launcher"}, "/h", fake_environment({}));
    bool success = bad_flag.outcome == ParseOutcome::exit_failure && bad_flag.exit_code == 2 &&
                   bad_flag.message.find("--max-processes") != std::string::npos &&
                   bad_env.outcome == ParseOutcome::exit_failure &&
                   bad_env.message.find("MCPDISPATCH_TIMEOUT_MS") != std::string::npos &&
                   unknown.exit_code == 2 && missing.exit_code == 2;
    return check(success, "bad values and options are rejected with exit status 2");
}

// Test: help and version stop before running.
static bool test_help_and_version() {
    ParseResult help = server_config::load_config({"mcpdispatch", "-h"}, "/h", fake_environment({}));
    ParseResult version = server_config::load_config({"mcpdispatch", "--version"}, "/h", fake_environment({}));
    bool success = help.outcome == ParseOutcome::exit_success && help.message.find("--servers-dir") != std::string::npos &&
                   version.outcome == ParseOutcome::exit_success &&
                   version.message == std::string("mcpdispatch ") + server_config::VERSION + "\n";
    return check(success, "--help and --version print and exit successfully");
}

// Test: the numeric parser is strict.
static bool test_numeric_parser() {
    int value = -1;
    bool success = server_config::parse_non_negative("0", value) && value == 0 &&
                   server_config::parse_non_negative("2147483647", value) && value == 2147483647 &&
                   !server_config::parse_non_negative("2147483648", value) &&
                   !server_config::parse_non_negative("-1", value) &&
                   !server_config::parse_non_negative("12ms", value) &&
                   !server_config::parse_non_negative("", value);
    return check(success, "numeric parser rejects signs, suffixes and overflow");
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_defaults();
    all_passed &= test_precedence();
    all_passed &= test_invalid_values();
    all_passed &= test_help_and_version();
    all_passed &= test_numeric_parser();
    return all_passed;
}

} // namespace test_server_config
