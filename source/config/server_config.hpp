#ifndef MCPDISPATCH_SERVER_CONFIG_HPP
#define MCPDISPATCH_SERVER_CONFIG_HPP

// Runtime configuration: built-in defaults, then environment variables, then
// command-line flags (highest precedence).

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace server_config {

constexpr const char *VERSION = "1.0.0";

struct ServerConfig {
    std::string registry_path;
    std::string servers_directory;
    int refresh_interval_milliseconds = 300000;  // 0 disables the periodic refresh
    size_t max_concurrent_processes = 100;
    int default_timeout_milliseconds = 30000;
    std::string provider_launcher = "node";      // empty runs entry points directly
    int detail_cache_ttl_milliseconds = 30000;
};

// Returns the value of an environment variable, or nullptr when unset.
using EnvironmentLookup = std::function<const char *(const char *name)>;

// Defaults rooted at the given home directory.
ServerConfig default_config(const std::string &home_directory);

enum class ParseOutcome {
    run,          // start the server with the config
    exit_success, // --help or --version was printed
    exit_failure  // bad option or value; message says which
};

struct ParseResult {
    ParseOutcome outcome = ParseOutcome::run;
    ServerConfig config;
    std::string message;   // usage/version text, or the error
    int exit_code = 0;
};

// Apply MCP_REGISTRY_PATH, MCP_SERVERS_DIR and the MCPDISPATCH_* variables.
// Returns false with error_message set for an invalid numeric value.
bool apply_environment(ServerConfig &config, const EnvironmentLookup &lookup, std::string &error_message);

// Full resolution: defaults from home_directory, environment, then arguments
// (argv[0] is skipped).
ParseResult load_config(const std::vector<std::string> &arguments, const std::string &home_directory,
                        const EnvironmentLookup &lookup);

std::string usage_text();

// Strict decimal parse of a non-negative integer that fits in int.
bool parse_non_negative(const std::string &text, int &value);

} // namespace server_config

#endif // MCPDISPATCH_SERVER_CONFIG_HPP
