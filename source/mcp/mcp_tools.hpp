#ifndef MCPDISPATCH_MCP_TOOLS_HPP
#define MCPDISPATCH_MCP_TOOLS_HPP

// MCP tool registry: registration, listing, and dispatch of tool calls.

#include <nlohmann/json.hpp>
#include <string>
#include <functional>
#include <vector>

namespace mcp_tools {

using json = nlohmann::json;

// A tool handler function: receives the arguments JSON, returns the result JSON
// (content array + isError flag, as MCP defines it).
using ToolHandler = std::function<json(const json &arguments)>;

// Description of a registered tool, matching the MCP tool schema.
struct ToolDefinition {
    std::string name;
    std::string description;
    json input_schema; // JSON Schema object
    ToolHandler handler;
};

// Register a tool. Registering a name twice replaces the earlier definition.
void register_tool(const ToolDefinition &definition);

// Drop every registered tool (tests re-register against fresh components).
void clear_registered_tools();

// Build the response payload for tools/list.
json build_tools_list_response();

// Dispatch a tools/call request. Returns the result payload (content + isError).
json dispatch_tool_call(const std::string &tool_name, const json &arguments);

// {"content": [{"type": "text", "text": text}], "isError": is_error}
json build_text_result(const std::string &text, bool is_error = false);

// Text result carrying payload pretty-printed with a 2-space indent.
json build_json_result(const json &payload);

// Error result with "Error: <message>" text.
json build_error_result(const std::string &message);

} // namespace mcp_tools

#endif // MCPDISPATCH_MCP_TOOLS_HPP
