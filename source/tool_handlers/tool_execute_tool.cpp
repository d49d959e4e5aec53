#include "tool_handlers/tool_handlers.hpp"
#include "mcp/mcp_tools.hpp"

#include <chrono>

using json = nlohmann::json;

// Tool handler for "execute_tool".
// Runs one tool on one provider; the provider's whole response is returned.

static json handle_execute_tool(dispatch_facade::DispatchFacade &facade, telemetry::Telemetry &telemetry,
                                const json &arguments) {
    tool_handlers::begin_call(telemetry);

    dispatch_facade::ExecuteToolRequest request;
    request.server = tool_handlers::string_argument(arguments, "server");
    request.tool = tool_handlers::string_argument(arguments, "tool");
    if (arguments.contains("params") && arguments["params"].is_object()) {
        request.params = arguments["params"];
    }

    auto start_time = std::chrono::steady_clock::now();
    executor::ExecuteResult result = facade.execute_tool(request);
    std::chrono::duration<double, std::milli> elapsed = std::chrono::steady_clock::now() - start_time;
    telemetry.record_execution(request.server, request.tool, elapsed.count(), result.success);

    if (!result.success) {
        return tool_handlers::fail_call(telemetry, "execute_tool", result.error_message);
    }
    return mcp_tools::build_json_result(result.response);
}

namespace tool_execute_tool {

void register_tool(dispatch_facade::DispatchFacade &facade, telemetry::Telemetry &telemetry) {
    json input_schema;
    input_schema["type"] = "object";
    input_schema["properties"] = json::object();
    input_schema["properties"]["server"] = {
        {"type", "string"},
        {"description", "MCP server name"}
    };
    input_schema["properties"]["tool"] = {
        {"type", "string"},
        {"description", "Tool name to execute"}
    };
    input_schema["properties"]["params"] = {
        {"type", "object"},
        {"description", "Tool parameters"}
    };
    input_schema["required"] = json::array({"server", "tool", "params"});

    mcp_tools::register_tool({
        "execute_tool",
        "Execute a specific MCP tool",
        input_schema,
        [&facade, &telemetry](const json &arguments) { return handle_execute_tool(facade, telemetry, arguments); }
    });
}

} // namespace tool_execute_tool
