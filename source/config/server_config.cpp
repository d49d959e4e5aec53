#include "config/server_config.hpp"

#include <cctype>
#include <climits>

namespace server_config {

ServerConfig default_config(const std::string &home_directory) {
    ServerConfig config;
    config.registry_path = home_directory + "/.mcp-global/global-registry.json";
    config.servers_directory = home_directory + "/.mcp-global/servers/binaries";
    return config;
}

bool parse_non_negative(const std::string &text, int &value) {
    if (text.empty() || text.size() > 10) {
        return false;
    }
    long long parsed = 0;
    for (char character : text) {
        if (!std::isdigit(static_cast<unsigned char>(character))) {
            return false;
        }
        parsed = parsed * 10 + (character - '0');
    }
    if (parsed > INT_MAX) {
        return false;
    }
    value = static_cast<int>(parsed);
    return true;
}

// Parses a numeric option. minimum is inclusive.
static bool parse_numeric_option(const std::string &option_name, const std::string &text, int minimum,
                                 int &value, std::string &error_message) {
    int parsed = 0;
    if (!parse_non_negative(text, parsed) || parsed < minimum) {
        error_message = "Invalid value for " + option_name + ": '" + text + "' (expected an integer >= " +
                        std::to_string(minimum) + ")";
        return false;
    }
    value = parsed;
    return true;
}

bool apply_environment(ServerConfig &config, const EnvironmentLookup &lookup, std::string &error_message) {
    const char *value = lookup("MCP_REGISTRY_PATH");
    if (value != nullptr && *value != '\0') {
        config.registry_path = value;
    }
    value = lookup("MCP_SERVERS_DIR");
    if (value != nullptr && *value != '\0') {
        config.servers_directory = value;
    }
    value = lookup("MCPDISPATCH_LAUNCHER");
    if (value != nullptr) {
        config.provider_launcher = value;
    }

    value = lookup("MCPDISPATCH_REFRESH_INTERVAL_MS");
    if (value != nullptr && *value != '\0' &&
        !parse_numeric_option("MCPDISPATCH_REFRESH_INTERVAL_MS", value, 0,
                              config.refresh_interval_milliseconds, error_message)) {
        return false;
    }
    value = lookup("MCPDISPATCH_MAX_PROCESSES");
    if (value != nullptr && *value != '\0') {
        int max_processes = 0;
        if (!parse_numeric_option("MCPDISPATCH_MAX_PROCESSES", value, 1, max_processes, error_message)) {
            return false;
        }
        config.max_concurrent_processes = static_cast<size_t>(max_processes);
    }
    value = lookup("MCPDISPATCH_TIMEOUT_MS");
    if (value != nullptr && *value != '\0' &&
        !parse_numeric_option("MCPDISPATCH_TIMEOUT_MS", value, 1, config.default_timeout_milliseconds,
                              error_message)) {
        return false;
    }
    return true;
}

std::string usage_text() {
    return "Usage: mcpdispatch [options]\n"
           "\n"
           "MCP stdio server that discovers tool providers and runs one provider\n"
           "process per call.\n"
           "\n"
           "Options:\n"
           "  --registry <path>      Registry file (env MCP_REGISTRY_PATH)\n"
           "  --servers-dir <dir>    Provider packages directory (env MCP_SERVERS_DIR)\n"
           "  --launcher <command>   Interpreter for provider entry points, \"\" for none\n"
           "                         (env MCPDISPATCH_LAUNCHER, default node)\n"
           "  --max-processes <n>    Concurrent provider processes (default 100)\n"
           "  --timeout-ms <n>       Per-call timeout in milliseconds (default 30000)\n"
           "  -h, --help             Show this help\n"
           "  -v, --version          Show the version\n";
}

static ParseResult failure(const std::string &message) {
    ParseResult result;
    result.outcome = ParseOutcome::exit_failure;
    result.message = message;
    result.exit_code = 2;
    return result;
}

ParseResult load_config(const std::vector<std::string> &arguments, const std::string &home_directory,
                        const EnvironmentLookup &lookup) {
    ParseResult result;
    result.config = default_config(home_directory);

    std::string error_message;
    if (!apply_environment(result.config, lookup, error_message)) {
        return failure(error_message);
    }

    for (size_t index = 1; index < arguments.size(); ++index) {
        const std::string &argument = arguments[index];

        if (argument == "-h" || argument == "--help") {
            result.outcome = ParseOutcome::exit_success;
            result.message = usage_text();
            return result;
        }
        if (argument == "-v" || argument == "--version") {
            result.outcome = ParseOutcome::exit_success;
            result.message = std::string("mcpdispatch ") + VERSION + "\n";
            return result;
        }

        bool takes_value = argument == "--registry" || argument == "--servers-dir" ||
                           argument == "--launcher" || argument == "--max-processes" ||
                           argument == "--timeout-ms";
        if (!takes_value) {
            return failure("Unknown option: " + argument + "\n\n" + usage_text());
        }
        if (index + 1 >= arguments.size()) {
            return failure("Missing value for " + argument);
        }
        const std::string &value = arguments[++index];

        if (argument == "--registry") {
            result.config.registry_path = value;
        } else if (argument == "--servers-dir") {
            result.config.servers_directory = value;
        } else if (argument == "--launcher") {
            result.config.provider_launcher = value;
        } else if (argument == "--max-processes") {
            int max_processes = 0;
            if (!parse_numeric_option(argument, value, 1, max_processes, error_message)) {
                return failure(error_message);
            }
            result.config.max_concurrent_processes = static_cast<size_t>(max_processes);
        } else if (!parse_numeric_option(argument, value, 1, result.config.default_timeout_milliseconds,
                                         error_message)) {
            return failure(error_message);
        }
    }
    return result;
}

} // namespace server_config
