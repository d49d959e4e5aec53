#include "tool_handlers/tool_handlers.hpp"
#include "mcp/mcp_tools.hpp"

using json = nlohmann::json;

// Tool handler for "list_categories".

static json handle_list_categories(dispatch_facade::DispatchFacade &facade, telemetry::Telemetry &telemetry,
                                   const json &arguments) {
    (void)arguments;
    tool_handlers::begin_call(telemetry);
    auto categories = telemetry.measure_search([&] { return facade.list_categories(); });
    return mcp_tools::build_json_result(categories);
}

namespace tool_list_categories {

void register_tool(dispatch_facade::DispatchFacade &facade, telemetry::Telemetry &telemetry) {
    json input_schema;
    input_schema["type"] = "object";
    input_schema["properties"] = json::object();

    mcp_tools::register_tool({
        "list_categories",
        "List all available MCP categories",
        input_schema,
        [&facade, &telemetry](const json &arguments) { return handle_list_categories(facade, telemetry, arguments); }
    });
}

} // namespace tool_list_categories
