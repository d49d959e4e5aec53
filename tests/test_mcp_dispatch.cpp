// Tests for the MCP surface: stdio framing, JSON-RPC routing and the five tools.

#include "dispatch/dispatch_facade.hpp"
#include "mcp/mcp_dispatch.hpp"
#include "mcp/mcp_stdio.hpp"
#include "mcp/mcp_tools.hpp"
#include "telemetry/telemetry.hpp"
#include "test_support.hpp"
#include "tool_handlers/tool_handlers.hpp"

#include <nlohmann/json.hpp>
#include <mutex>
#include <set>
#include <sstream>
#include <string>
#include <vector>

using json = nlohmann::json;
using test_support::TemporaryDirectory;
using test_support::check;

namespace test_mcp_dispatch {

// The five tools registered against a one-provider registry.
struct Server {
    explicit Server(const TemporaryDirectory &directory)
        : registry(write_registry(directory), directory.file("servers"), 0),
          executor(executor_options()),
          facade(registry, search, executor) {
        registry.load();
        search.index(registry.get_servers());
        mcp_tools::clear_registered_tools();
        tool_handlers::register_all_tools(facade, telemetry);
    }

    ~Server() {
        mcp_tools::clear_registered_tools();
    }

    static std::string write_registry(const TemporaryDirectory &directory) {
        test_support::write_script(directory.file("answer.sh"), "read line\nprintf '{\"result\":{\"answer\":42}}\\n'\n");
        json document;
        document["servers"]["answer"] = {{"name", "answer"},
                                         {"category", "utilities"},
                                         {"description", "Answers everything"},
                                         {"path", directory.file("answer.sh")}};
        test_support::write_file(directory.file("registry.json"), document.dump());
        return directory.file("registry.json");
    }

    static executor::ExecutorOptions executor_options() {
        executor::ExecutorOptions options;
        options.launcher = "";
        return options;
    }

    json call_tool(const std::string &name, const json &arguments) {
        json request = {{"jsonrpc", "2.0"}, {"id", 7}, {"method", "tools/call"},
                        {"params", {{"name", name}, {"arguments", arguments}}}};
        return mcp_dispatch::dispatch_message(request)["result"];
    }

    telemetry::Telemetry telemetry;
    provider_registry::Registry registry;
    search_index::SearchIndex search;
    executor::Executor executor;
    dispatch_facade::DispatchFacade facade;
};

static std::string result_text(const json &tool_result) {
    return tool_result["content"][0]["text"].get<std::string>();
}

// Test: brace-counting reader frames objects with braces inside strings.
static bool test_stdio_framing() {
    std::istringstream input("  {\"a\":\"}{\\\"\"}\n{\"b\":{\"c\":1}}garbage");
    std::string first = mcp_stdio::read_message(input);
    std::string second = mcp_stdio::read_message(input);
    std::string third = mcp_stdio::read_message(input);
    std::ostringstream output;
    mcp_stdio::write_message("{\"x\":1}", output);
    bool success = first == "{\"a\":\"}{\\\"\"}" && second == "{\"b\":{\"c\":1}}" && third.empty() &&
                   output.str() == "{\"x\":1}\n";
    return check(success, "stdio reader frames objects and ignores braces inside strings");
}

// Test: initialize, ping, notifications and protocol errors.
static bool test_protocol_methods() {
    json initialize = mcp_dispatch::dispatch_raw_message(
        "{\"jsonrpc\":\"2.0\",\"id\":1,\"method\":\"initialize\",\"params\":{}}");
    json ping = mcp_dispatch::dispatch_raw_message("{\"jsonrpc\":\"2.0\",\"id\":2,\"method\":\"ping\"}");
    json notification = mcp_dispatch::dispatch_raw_message(
        "{\"jsonrpc\":\"2.0\",\"method\":\"notifications/initialized\"}");
    json unknown = mcp_dispatch::dispatch_raw_message("{\"jsonrpc\":\"2.0\",\"id\":3,\"method\":\"bogus\"}");
    json broken = mcp_dispatch::dispatch_raw_message("{\"jsonrpc\":");

    bool success = initialize["result"]["serverInfo"]["name"] == "mcpdispatch" &&
                   initialize["result"]["protocolVersion"] == "2024-11-05" &&
                   initialize["result"]["capabilities"].contains("tools") &&
                   ping["id"] == 2 && ping["result"].is_object() && notification.is_null() &&
                   unknown["error"]["code"] == -32601 && broken["error"]["code"] == -32700;
    return check(success, "initialize, ping, notifications and error codes");
}

// Test: tools/list advertises the five tools with their schemas.
static bool test_tools_list() {
    TemporaryDirectory directory("mcpdispatch-mcp");
    Server server(directory);
    json response = mcp_dispatch::dispatch_raw_message("{\"jsonrpc\":\"2.0\",\"id\":1,\"method\":\"tools/list\"}");

    std::set<std::string> names;
    json execute_schema;
    for (const auto &tool : response["result"]["tools"]) {
        names.insert(tool["name"].get<std::string>());
        if (tool["name"] == "execute_tool") {
            execute_schema = tool["inputSchema"];
        }
    }
    bool success = names == std::set<std::string>({"search_tools", "execute_tool", "list_categories",
                                                   "list_mcps", "get_mcp_details"}) &&
                   execute_schema["required"] == json::array({"server", "tool", "params"});
    return check(success, "tools/list returns the five dispatcher tools");
}

// Test: successful tool calls return pretty-printed JSON text.
static bool test_tool_results() {
    TemporaryDirectory directory("mcpdispatch-mcp");
    Server server(directory);

    json search = server.call_tool("search_tools", {{"query", "answers"}});
    json categories = server.call_tool("list_categories", json::object());
    json listing = server.call_tool("list_mcps", {{"detail", "summary"}});
    json detail = server.call_tool("get_mcp_details", {{"mcpName", "answer"}});
    json executed = server.call_tool("execute_tool", {{"server", "answer"}, {"tool", "ask"}, {"params", json::object()}});

    json search_payload = json::parse(result_text(search));
    bool success = search["isError"] == false && search_payload.size() == 1 && search_payload[0]["name"] == "answer" &&
                   result_text(search).find("\n  ") != std::string::npos &&
                   json::parse(result_text(categories)) == json::array({"utilities"}) &&
                   json::parse(result_text(listing))[0]["status"] == "available" &&
                   json::parse(result_text(detail))["path"] == directory.file("answer.sh") &&
                   executed["isError"] == false && json::parse(result_text(executed))["result"]["answer"] == 42;

    json counters = server.telemetry.snapshot();
    success = success && counters["execute"]["count"] == 1 && counters["search"]["count"] == 4;
    return check(success, "each tool answers with pretty-printed JSON and telemetry counts the calls");
}

// Test: failures become isError results with an "Error: " message.
static bool test_tool_errors() {
    TemporaryDirectory directory("mcpdispatch-mcp");
    Server server(directory);

    json missing = server.call_tool("get_mcp_details", {{"mcpName", "nope"}});
    json invalid = server.call_tool("execute_tool", {{"server", ""}, {"tool", "ask"}, {"params", json::object()}});
    json bad_detail = server.call_tool("list_mcps", {{"detail", "everything"}});
    json unknown = server.call_tool("no_such_tool", json::object());

    bool success = missing["isError"] == true && result_text(missing) == "Error: MCP server not found: nope" &&
                   invalid["isError"] == true && result_text(invalid) == "Error: Invalid request: server is required" &&
                   bad_detail["isError"] == true && unknown["isError"] == true &&
                   result_text(unknown) == "Error: Unknown tool: no_such_tool" &&
                   server.telemetry.snapshot()["errors"]["tool_execution_error"] == 3 &&
                   server.executor.spawned_count() == 0;
    return check(success, "errors surface as isError results and are counted");
}

// Test: a tools/call waiting on a slow provider does not hold up a later ping.
static bool test_scheduler_answers_concurrently() {
    TemporaryDirectory directory("mcpdispatch-mcp");
    Server server(directory);
    std::string release = directory.file("release");
    test_support::write_script(directory.file("slow.sh"),
                               "read line\n"
                               "while [ ! -f '" + release + "' ]; do sleep 0.02; done\n"
                               "printf '{\"result\":\"slow done\"}\\n'\n");

    std::mutex responses_mutex;
    std::vector<json> responses;
    mcp_dispatch::RequestScheduler scheduler([&](const json &response) {
        std::lock_guard<std::mutex> lock(responses_mutex);
        responses.push_back(response);
    });
    auto response_count = [&] {
        std::lock_guard<std::mutex> lock(responses_mutex);
        return responses.size();
    };

    json slow_call = {{"jsonrpc", "2.0"}, {"id", 5}, {"method", "tools/call"},
                      {"params", {{"name", "execute_tool"},
                                  {"arguments", {{"server", directory.file("slow.sh")},
                                                 {"tool", "wait"},
                                                 {"params", json::object()}}}}}};
    scheduler.submit(slow_call.dump());
    bool spawned = test_support::wait_until([&] { return server.executor.active_count() == 1; }, 3000);
    scheduler.submit("{\"jsonrpc\":\"2.0\",\"id\":6,\"method\":\"ping\"}");
    scheduler.submit("{\"jsonrpc\":\"2.0\",\"method\":\"notifications/initialized\"}");

    bool ping_first = false;
    {
        std::lock_guard<std::mutex> lock(responses_mutex);
        ping_first = responses.size() == 1 && responses[0]["id"] == 6;
    }
    bool still_running = scheduler.in_flight() == 1;

    test_support::write_file(release, "go");
    scheduler.wait_idle();

    bool slow_answered = false;
    if (response_count() == 2) {
        const json &answer = responses[1];
        slow_answered = answer["id"] == 5 && answer["result"]["isError"] == false &&
                        json::parse(result_text(answer["result"]))["result"] == "slow done";
    }
    bool success = spawned && ping_first && still_running && slow_answered && scheduler.in_flight() == 0;
    return check(success, "ping is answered while a tools/call is still waiting on its provider");
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_stdio_framing();
    all_passed &= test_protocol_methods();
    all_passed &= test_tools_list();
    all_passed &= test_tool_results();
    all_passed &= test_tool_errors();
    all_passed &= test_scheduler_answers_concurrently();
    return all_passed;
}

} // namespace test_mcp_dispatch
