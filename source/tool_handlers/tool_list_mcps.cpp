#include "tool_handlers/tool_handlers.hpp"
#include "mcp/mcp_tools.hpp"

using json = nlohmann::json;

// Tool handler for "list_mcps".
// Summary rows come straight from the registry snapshot; the full view goes
// through the detail cache and may query providers for their tools.

static json handle_list_mcps(dispatch_facade::DispatchFacade &facade, telemetry::Telemetry &telemetry,
                             const json &arguments) {
    tool_handlers::begin_call(telemetry);

    std::string detail_text = tool_handlers::string_argument(arguments, "detail", "summary");
    dispatch_facade::ListDetail detail;
    if (detail_text == "summary") {
        detail = dispatch_facade::ListDetail::summary;
    } else if (detail_text == "full") {
        detail = dispatch_facade::ListDetail::full;
    } else {
        return tool_handlers::fail_call(telemetry, "list_mcps",
                                        "Invalid detail level: " + detail_text + " (expected summary or full)");
    }
    std::string category = tool_handlers::string_argument(arguments, "category");
    bool include_tools = tool_handlers::bool_argument(arguments, "includeTools");

    auto entries = telemetry.measure_search([&] { return facade.list_mcps(detail, category, include_tools); });
    return mcp_tools::build_json_result(entries);
}

namespace tool_list_mcps {

void register_tool(dispatch_facade::DispatchFacade &facade, telemetry::Telemetry &telemetry) {
    json input_schema;
    input_schema["type"] = "object";
    input_schema["properties"] = json::object();
    input_schema["properties"]["detail"] = {
        {"type", "string"},
        {"enum", json::array({"summary", "full"})},
        {"description", "Level of detail to return (summary for fast response, full for complete info)"}
    };
    input_schema["properties"]["category"] = {
        {"type", "string"},
        {"description", "Filter by category"}
    };
    input_schema["properties"]["includeTools"] = {
        {"type", "boolean"},
        {"description", "Include tools information in full detail mode"}
    };

    mcp_tools::register_tool({
        "list_mcps",
        "List all MCP servers with fast response and hierarchical detail levels",
        input_schema,
        [&facade, &telemetry](const json &arguments) { return handle_list_mcps(facade, telemetry, arguments); }
    });
}

} // namespace tool_list_mcps
