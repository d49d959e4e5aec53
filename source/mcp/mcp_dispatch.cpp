#include "mcp/mcp_dispatch.hpp"
#include "mcp/mcp_tools.hpp"
#include "protocol/json_rpc.hpp"
#include "utils/debug_log.hpp"

#include <chrono>
#include <exception>

namespace mcp_dispatch {

// Description so that MCP clients can tell when to route work through this server.
static const std::string SERVER_DESCRIPTION =
    "Tool provider dispatcher: finds MCP tool providers installed on this machine "
    "and runs their tools on demand. Use search_tools or list_mcps to find a "
    "provider, get_mcp_details to see its tools, and execute_tool to call one.";

static json handle_initialize(const json &request_id, const json &params) {
    (void)params; // Any client capabilities are accepted.

    json capabilities;
    capabilities["tools"] = json::object();

    json server_info;
    server_info["name"] = SERVER_NAME;
    server_info["version"] = SERVER_VERSION;
    server_info["description"] = SERVER_DESCRIPTION;

    json result;
    result["protocolVersion"] = PROTOCOL_VERSION;
    result["capabilities"] = capabilities;
    result["serverInfo"] = server_info;

    return json_rpc::build_response(request_id, result);
}

static json handle_tools_list(const json &request_id, const json &params) {
    (void)params;
    json result = mcp_tools::build_tools_list_response();
    return json_rpc::build_response(request_id, result);
}

static json handle_tools_call(const json &request_id, const json &params) {
    std::string tool_name;
    if (params.contains("name") && params["name"].is_string()) {
        tool_name = params["name"].get<std::string>();
    } else {
        return json_rpc::build_error_response(request_id, json_rpc::INVALID_PARAMS,
                                              "Missing or invalid 'name' in tools/call");
    }

    json arguments = json::object();
    if (params.contains("arguments") && params["arguments"].is_object()) {
        arguments = params["arguments"];
    }

    try {
        json tool_result = mcp_tools::dispatch_tool_call(tool_name, arguments);
        return json_rpc::build_response(request_id, tool_result);
    } catch (const std::exception &error) {
        debug_log::notice("Tool " + tool_name + " failed: " + error.what());
        return json_rpc::build_error_response(request_id, json_rpc::INTERNAL_ERROR,
                                              std::string("Internal error in ") + tool_name + ": " + error.what());
    }
}

json dispatch_message(const json &message) {
    if (!message.is_object()) {
        return json_rpc::build_error_response(nullptr, json_rpc::INVALID_REQUEST, "Invalid Request");
    }

    std::string method = json_rpc::get_method(message);
    json request_id = json_rpc::get_id(message);
    json params = json_rpc::get_params(message);

    // notifications/initialized and friends need no answer.
    if (json_rpc::is_notification(message)) {
        return nullptr;
    }

    if (method == "initialize") {
        return handle_initialize(request_id, params);
    }
    if (method == "tools/list") {
        return handle_tools_list(request_id, params);
    }
    if (method == "tools/call") {
        return handle_tools_call(request_id, params);
    }
    if (method == "ping") {
        return json_rpc::build_response(request_id, json::object());
    }

    return json_rpc::build_error_response(request_id, json_rpc::METHOD_NOT_FOUND,
                                          "Unknown method: " + method);
}

json dispatch_raw_message(const std::string &raw_message) {
    json parsed_message;
    try {
        parsed_message = json::parse(raw_message);
    } catch (const json::parse_error &error) {
        debug_log::notice("Failed to parse incoming JSON: " + std::string(error.what()));
        return json_rpc::build_error_response(nullptr, json_rpc::PARSE_ERROR, "Parse error");
    }
    return dispatch_message(parsed_message);
}

RequestScheduler::RequestScheduler(ResponseWriter writer)
    : writer_(std::move(writer)) {}

RequestScheduler::~RequestScheduler() {
    wait_idle();
}

void RequestScheduler::submit(const std::string &raw_message) {
    json message;
    if (!json_rpc::try_parse(raw_message, message) || !message.is_object() ||
        json_rpc::is_notification(message) || json_rpc::get_method(message) != "tools/call") {
        json response = dispatch_raw_message(raw_message);
        if (!response.is_null()) {
            write(response);
        }
        return;
    }

    reap_finished();
    std::future<void> call = std::async(std::launch::async, [this, message] {
        write(dispatch_message(message));
    });
    std::lock_guard<std::mutex> lock(calls_mutex_);
    calls_.push_back(std::move(call));
}

void RequestScheduler::wait_idle() {
    std::list<std::future<void>> pending;
    {
        std::lock_guard<std::mutex> lock(calls_mutex_);
        pending.swap(calls_);
    }
    for (auto &call : pending) {
        call.get();
    }
}

size_t RequestScheduler::in_flight() const {
    std::lock_guard<std::mutex> lock(calls_mutex_);
    size_t running = 0;
    for (const auto &call : calls_) {
        if (call.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
            ++running;
        }
    }
    return running;
}

void RequestScheduler::write(const json &response) {
    std::lock_guard<std::mutex> lock(writer_mutex_);
    try {
        writer_(response);
    } catch (const std::exception &error) {
        debug_log::notice(std::string("Failed to write response: ") + error.what());
    }
}

void RequestScheduler::reap_finished() {
    std::lock_guard<std::mutex> lock(calls_mutex_);
    for (auto call = calls_.begin(); call != calls_.end();) {
        if (call->wait_for(std::chrono::seconds(0)) == std::future_status::ready) {
            call->get();
            call = calls_.erase(call);
        } else {
            ++call;
        }
    }
}

} // namespace mcp_dispatch
