#ifndef MCPDISPATCH_JSON_RPC_HPP
#define MCPDISPATCH_JSON_RPC_HPP

// JSON-RPC 2.0 helpers, used on both sides of the dispatcher: towards the
// calling agent on our own stdio, and towards each spawned provider.
// Uses nlohmann/json for parsing and serialization.

#include <nlohmann/json.hpp>
#include <string>

namespace json_rpc {

using json = nlohmann::json;

// Build a JSON-RPC 2.0 success response.
json build_response(const json &request_id, const json &result_payload);

// Build a JSON-RPC 2.0 error response.
json build_error_response(const json &request_id, int error_code, const std::string &error_message);

// Build a JSON-RPC 2.0 error response with additional data.
json build_error_response(const json &request_id, int error_code, const std::string &error_message, const json &error_data);

// Build the single request line sent to a provider process.
// For "tools/call", params is {name: tool_name, arguments: arguments};
// any other method gets arguments as its params object.
json build_provider_request(const std::string &request_id, const std::string &method,
                            const std::string &tool_name, const json &arguments);

// Standard JSON-RPC error codes.
constexpr int PARSE_ERROR = -32700;
constexpr int INVALID_REQUEST = -32600;
constexpr int METHOD_NOT_FOUND = -32601;
constexpr int INVALID_PARAMS = -32602;
constexpr int INTERNAL_ERROR = -32603;

// Extract method name from a JSON-RPC request/notification. Returns empty if missing.
std::string get_method(const json &message);

// Extract the id from a JSON-RPC message. Returns nullptr json if missing (notification).
json get_id(const json &message);

// Extract params from a JSON-RPC message. Returns empty object if missing.
json get_params(const json &message);

// Check if a message is a notification (no id field).
bool is_notification(const json &message);

// Parse text as one JSON document. Returns false (and leaves output untouched)
// when the text is not exactly one complete document.
bool try_parse(const std::string &text, json &output);

} // namespace json_rpc

#endif // MCPDISPATCH_JSON_RPC_HPP
