// mcpdispatch: MCP tool provider dispatcher.
// Entry point: stdio MCP server loop.
//
// Reads JSON-RPC 2.0 messages from stdin, dispatches them, writes responses to stdout.
// Logs go to stderr (allowed by the MCP stdio transport).

#include <nlohmann/json.hpp>
#include <csignal>
#include <signal.h>
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

#include "config/server_config.hpp"
#include "dispatch/dispatch_facade.hpp"
#include "executor/executor.hpp"
#include "mcp/mcp_dispatch.hpp"
#include "mcp/mcp_stdio.hpp"
#include "platform/platform_abi.hpp"
#include "registry/provider_registry.hpp"
#include "search/search_index.hpp"
#include "telemetry/telemetry.hpp"
#include "tool_handlers/tool_handlers.hpp"
#include "utils/debug_log.hpp"

using json = nlohmann::json;

// Global flag for graceful shutdown.
static volatile std::sig_atomic_t shutdown_requested = 0;

static void signal_handler(int signal_number) {
    (void)signal_number;
    shutdown_requested = 1;
}

int main(int argc, char *argv[]) {
    std::vector<std::string> arguments(argv, argv + argc);
    server_config::ParseResult parsed = server_config::load_config(
        arguments, platform::home_directory(), [](const char *name) { return std::getenv(name); });

    if (parsed.outcome == server_config::ParseOutcome::exit_success) {
        std::cout << parsed.message;
        return 0;
    }
    if (parsed.outcome == server_config::ParseOutcome::exit_failure) {
        std::cerr << parsed.message << std::endl;
        return parsed.exit_code;
    }
    const server_config::ServerConfig &config = parsed.config;

    // No SA_RESTART: a signal interrupts the blocking stdin read.
    struct sigaction action;
    action.sa_handler = signal_handler;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);

    mcp_stdio::log_message(std::string("mcpdispatch ") + server_config::VERSION + ", registry " +
                           config.registry_path + ", providers " + config.servers_directory);

    executor::ExecutorOptions executor_options;
    executor_options.max_concurrent_processes = config.max_concurrent_processes;
    executor_options.launcher = config.provider_launcher;

    telemetry::Telemetry telemetry;
    search_index::SearchIndex search;
    executor::Executor executor(executor_options);
    provider_registry::Registry registry(config.registry_path, config.servers_directory,
                                         config.refresh_interval_milliseconds);
    registry.set_refresh_listener([&search](const std::vector<provider_registry::ProviderDescriptor> &providers) {
        search.index(providers);
        debug_log::log("Indexed " + std::to_string(providers.size()) + " providers");
    });

    provider_registry::LoadResult load_result = registry.load();
    if (load_result.success) {
        mcp_stdio::log_message("Loaded " + std::to_string(load_result.providers.size()) + " providers (" +
                               std::to_string(load_result.configured_count) + " configured, " +
                               std::to_string(load_result.discovered_count) + " discovered)");
    } else {
        telemetry.record_error(provider_registry::error_kind_name(load_result.error_kind),
                               load_result.error_message);
        mcp_stdio::log_message("Registry load failed (" + load_result.error_message +
                               "); starting with no providers.");
    }

    dispatch_facade::DispatchFacade facade(registry, search, executor, config.detail_cache_ttl_milliseconds,
                                           config.default_timeout_milliseconds);
    tool_handlers::register_all_tools(facade, telemetry);

    mcp_stdio::log_message("Server started. Waiting for MCP messages on stdin.");

    mcp_dispatch::RequestScheduler scheduler([](const json &response) {
        mcp_stdio::write_message(response.dump(-1, ' ', false, json::error_handler_t::replace));
    });

    while (!shutdown_requested) {
        std::string raw_message = mcp_stdio::read_message();

        if (raw_message.empty()) {
            if (shutdown_requested) {
                break;
            }
            // EOF on stdin means the client disconnected.
            mcp_stdio::log_message("EOF on stdin. Shutting down.");
            break;
        }

        scheduler.submit(raw_message);
    }

    registry.destroy();
    // Running tools/call tasks fail with the shutdown kind and are answered.
    executor.destroy();
    scheduler.wait_idle();
    debug_log::log("Telemetry at exit: " + telemetry.snapshot().dump());
    mcp_stdio::log_message("Server shut down.");

    return 0;
}
