#include "tool_handlers/tool_handlers.hpp"
#include "mcp/mcp_tools.hpp"

// Forward declarations of individual tool registration functions.
// Each tool_*.cpp defines its own namespace with a register_tool() function.

namespace tool_search_tools { void register_tool(dispatch_facade::DispatchFacade &, telemetry::Telemetry &); }
namespace tool_execute_tool { void register_tool(dispatch_facade::DispatchFacade &, telemetry::Telemetry &); }
namespace tool_list_categories { void register_tool(dispatch_facade::DispatchFacade &, telemetry::Telemetry &); }
namespace tool_list_mcps { void register_tool(dispatch_facade::DispatchFacade &, telemetry::Telemetry &); }
namespace tool_get_mcp_details { void register_tool(dispatch_facade::DispatchFacade &, telemetry::Telemetry &); }

namespace tool_handlers {

void register_all_tools(dispatch_facade::DispatchFacade &facade, telemetry::Telemetry &telemetry) {
    tool_search_tools::register_tool(facade, telemetry);
    tool_execute_tool::register_tool(facade, telemetry);
    tool_list_categories::register_tool(facade, telemetry);
    tool_list_mcps::register_tool(facade, telemetry);
    tool_get_mcp_details::register_tool(facade, telemetry);
}

std::string begin_call(telemetry::Telemetry &telemetry) {
    std::string correlation_id = telemetry.generate_correlation_id();
    telemetry.set_correlation_id(correlation_id);
    return correlation_id;
}

json fail_call(telemetry::Telemetry &telemetry, const std::string &tool_name, const std::string &message) {
    json attributes;
    attributes["tool"] = tool_name;
    attributes["correlationId"] = telemetry.correlation_id();
    telemetry.record_error("tool_execution_error", message, attributes);
    return mcp_tools::build_error_result(message);
}

std::string string_argument(const json &arguments, const char *key, const std::string &fallback) {
    if (arguments.contains(key) && arguments[key].is_string()) {
        return arguments[key].get<std::string>();
    }
    return fallback;
}

bool bool_argument(const json &arguments, const char *key, bool fallback) {
    if (arguments.contains(key) && arguments[key].is_boolean()) {
        return arguments[key].get<bool>();
    }
    return fallback;
}

} // namespace tool_handlers
