#include "protocol/json_rpc.hpp"

namespace json_rpc {

static const char JSONRPC_VERSION[] = "2.0";

json build_response(const json &request_id, const json &result_payload) {
    json response;
    response["jsonrpc"] = JSONRPC_VERSION;
    response["id"] = request_id;
    response["result"] = result_payload;
    return response;
}

json build_error_response(const json &request_id, int error_code, const std::string &error_message) {
    json response;
    response["jsonrpc"] = JSONRPC_VERSION;
    response["id"] = request_id;
    response["error"]["code"] = error_code;
    response["error"]["message"] = error_message;
    return response;
}

json build_error_response(const json &request_id, int error_code, const std::string &error_message, const json &error_data) {
    json response = build_error_response(request_id, error_code, error_message);
    response["error"]["data"] = error_data;
    return response;
}

json build_provider_request(const std::string &request_id, const std::string &method,
                            const std::string &tool_name, const json &arguments) {
    json request;
    request["jsonrpc"] = JSONRPC_VERSION;
    request["id"] = request_id;
    request["method"] = method;
    if (method == "tools/call") {
        request["params"]["name"] = tool_name;
        request["params"]["arguments"] = arguments.is_null() ? json::object() : arguments;
    } else {
        request["params"] = arguments.is_object() ? arguments : json::object();
    }
    return request;
}

std::string get_method(const json &message) {
    if (message.contains("method") && message["method"].is_string()) {
        return message["method"].get<std::string>();
    }
    return "";
}

json get_id(const json &message) {
    if (message.contains("id")) {
        return message["id"];
    }
    return nullptr;
}

json get_params(const json &message) {
    if (message.contains("params") && message["params"].is_object()) {
        return message["params"];
    }
    return json::object();
}

bool is_notification(const json &message) {
    return !message.contains("id");
}

bool try_parse(const std::string &text, json &output) {
    try {
        output = json::parse(text);
        return true;
    } catch (const json::parse_error &) {
        return false;
    }
}

} // namespace json_rpc
