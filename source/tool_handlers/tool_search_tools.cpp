#include "tool_handlers/tool_handlers.hpp"
#include "mcp/mcp_tools.hpp"

using json = nlohmann::json;

// Tool handler for "search_tools".
// Keyword search over the indexed providers, optionally limited to one category.

static json handle_search_tools(dispatch_facade::DispatchFacade &facade, telemetry::Telemetry &telemetry,
                                const json &arguments) {
    tool_handlers::begin_call(telemetry);
    std::string query = tool_handlers::string_argument(arguments, "query");
    std::string category = tool_handlers::string_argument(arguments, "category");

    auto results = telemetry.measure_search([&] { return facade.search_tools(query, category); });

    json payload = json::array();
    for (const auto &descriptor : results) {
        payload.push_back(provider_registry::descriptor_to_json(descriptor));
    }
    return mcp_tools::build_json_result(payload);
}

namespace tool_search_tools {

void register_tool(dispatch_facade::DispatchFacade &facade, telemetry::Telemetry &telemetry) {
    json input_schema;
    input_schema["type"] = "object";
    input_schema["properties"] = json::object();
    input_schema["properties"]["query"] = {
        {"type", "string"},
        {"description", "Search query"}
    };
    input_schema["properties"]["category"] = {
        {"type", "string"},
        {"description", "Category filter"}
    };
    input_schema["required"] = json::array({"query"});

    mcp_tools::register_tool({
        "search_tools",
        "Search for available MCP tools by keyword and category",
        input_schema,
        [&facade, &telemetry](const json &arguments) { return handle_search_tools(facade, telemetry, arguments); }
    });
}

} // namespace tool_search_tools
