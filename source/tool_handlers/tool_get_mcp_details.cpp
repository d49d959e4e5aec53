#include "tool_handlers/tool_handlers.hpp"
#include "mcp/mcp_tools.hpp"

#include <optional>

using json = nlohmann::json;

// Tool handler for "get_mcp_details".

static json handle_get_mcp_details(dispatch_facade::DispatchFacade &facade, telemetry::Telemetry &telemetry,
                                   const json &arguments) {
    tool_handlers::begin_call(telemetry);

    std::string name = tool_handlers::string_argument(arguments, "mcpName");
    if (name.empty()) {
        return tool_handlers::fail_call(telemetry, "get_mcp_details", "Missing required parameter 'mcpName' (string).");
    }
    bool include_tools = tool_handlers::bool_argument(arguments, "includeTools");

    // measure_search needs a sized result; the optional is unwrapped below.
    std::optional<json> detail;
    telemetry.measure_search([&] {
        detail = facade.get_mcp_details(name, include_tools);
        return detail ? json::array({*detail}) : json::array();
    });
    if (!detail) {
        return tool_handlers::fail_call(telemetry, "get_mcp_details", "MCP server not found: " + name);
    }
    return mcp_tools::build_json_result(*detail);
}

namespace tool_get_mcp_details {

void register_tool(dispatch_facade::DispatchFacade &facade, telemetry::Telemetry &telemetry) {
    json input_schema;
    input_schema["type"] = "object";
    input_schema["properties"] = json::object();
    input_schema["properties"]["mcpName"] = {
        {"type", "string"},
        {"description", "Name of the MCP server"}
    };
    input_schema["properties"]["includeTools"] = {
        {"type", "boolean"},
        {"description", "Include tools information"}
    };
    input_schema["required"] = json::array({"mcpName"});

    mcp_tools::register_tool({
        "get_mcp_details",
        "Get detailed information about a specific MCP server",
        input_schema,
        [&facade, &telemetry](const json &arguments) { return handle_get_mcp_details(facade, telemetry, arguments); }
    });
}

} // namespace tool_get_mcp_details
