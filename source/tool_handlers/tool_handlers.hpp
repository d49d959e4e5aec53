#ifndef MCPDISPATCH_TOOL_HANDLERS_HPP
#define MCPDISPATCH_TOOL_HANDLERS_HPP

// Tool handler registration.
// Each tool_*.cpp file provides a register function that is called during startup.

#include <nlohmann/json.hpp>
#include <string>

#include "dispatch/dispatch_facade.hpp"
#include "telemetry/telemetry.hpp"

namespace tool_handlers {

using json = nlohmann::json;

// Register all available tool handlers with the MCP tool registry. Both
// references must outlive the registered tools.
void register_all_tools(dispatch_facade::DispatchFacade &facade, telemetry::Telemetry &telemetry);

// Helpers shared by the tool_*.cpp files.

// Fresh correlation id for one tool call, made current on telemetry.
std::string begin_call(telemetry::Telemetry &telemetry);

// Records a tool_execution_error and returns the "Error: <message>" result.
json fail_call(telemetry::Telemetry &telemetry, const std::string &tool_name, const std::string &message);

// String member or fallback when absent or not a string.
std::string string_argument(const json &arguments, const char *key, const std::string &fallback = std::string());

// Boolean member or fallback when absent or not a boolean.
bool bool_argument(const json &arguments, const char *key, bool fallback = false);

} // namespace tool_handlers

#endif // MCPDISPATCH_TOOL_HANDLERS_HPP
