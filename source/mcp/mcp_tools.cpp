#include "mcp/mcp_tools.hpp"

#include <algorithm>
#include <mutex>

namespace mcp_tools {

// Global tool registry (module-level, not class-based).
static std::vector<ToolDefinition> registered_tools;
// tools/call runs on worker threads; handlers are called outside the lock.
static std::mutex registry_mutex;

void register_tool(const ToolDefinition &definition) {
    std::lock_guard<std::mutex> lock(registry_mutex);
    auto existing = std::find_if(registered_tools.begin(), registered_tools.end(),
                                 [&](const ToolDefinition &tool) { return tool.name == definition.name; });
    if (existing != registered_tools.end()) {
        *existing = definition;
        return;
    }
    registered_tools.push_back(definition);
}

void clear_registered_tools() {
    std::lock_guard<std::mutex> lock(registry_mutex);
    registered_tools.clear();
}

json build_tools_list_response() {
    json tools_array = json::array();
    std::lock_guard<std::mutex> lock(registry_mutex);
    for (const auto &tool : registered_tools) {
        json tool_entry;
        tool_entry["name"] = tool.name;
        tool_entry["description"] = tool.description;
        tool_entry["inputSchema"] = tool.input_schema;
        tools_array.push_back(tool_entry);
    }

    json result;
    result["tools"] = tools_array;
    return result;
}

json dispatch_tool_call(const std::string &tool_name, const json &arguments) {
    ToolHandler handler;
    {
        std::lock_guard<std::mutex> lock(registry_mutex);
        auto found = std::find_if(registered_tools.begin(), registered_tools.end(),
                                  [&](const ToolDefinition &tool) { return tool.name == tool_name; });
        if (found != registered_tools.end()) {
            handler = found->handler;
        }
    }
    if (!handler) {
        return build_error_result("Unknown tool: " + tool_name);
    }
    return handler(arguments);
}

json build_text_result(const std::string &text, bool is_error) {
    json text_content;
    text_content["type"] = "text";
    text_content["text"] = text;

    json result;
    result["content"] = json::array({text_content});
    result["isError"] = is_error;
    return result;
}

json build_json_result(const json &payload) {
    // Provider output may carry invalid UTF-8; replace rather than throw.
    return build_text_result(payload.dump(2, ' ', false, json::error_handler_t::replace));
}

json build_error_result(const std::string &message) {
    return build_text_result("Error: " + message, true);
}

} // namespace mcp_tools
