// Tests for the dispatch façade: request validation, name resolution, listing
// views and the provider detail cache.

#include "dispatch/dispatch_facade.hpp"
#include "test_support.hpp"

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

using json = nlohmann::json;
using dispatch_facade::DispatchFacade;
using dispatch_facade::ExecuteToolRequest;
using dispatch_facade::ListDetail;
using test_support::TemporaryDirectory;
using test_support::check;

namespace test_dispatch_facade {

static const char TOOLS_PROVIDER[] =
    "read line\n"
    "printf '{\"jsonrpc\":\"2.0\",\"result\":{\"tools\":[{\"name\":\"ping\",\"description\":\"Ping\","
    "\"inputSchema\":{\"type\":\"object\"}}]}}\\n'\n";

static const char GREETING_PROVIDER[] =
    "read line\n"
    "printf '{\"result\":{\"greeting\":\"%s\"}}\\n' \"$GREETING\"\n";

static const char CRASHING_PROVIDER[] = "echo 'cannot list tools' >&2\nexit 1\n";

// Registry, index, executor and façade over one temporary registry file.
struct Components {
    Components(const std::string &registry_path, const std::string &servers_directory,
               int cache_ttl_milliseconds = 60000)
        : registry(registry_path, servers_directory, 0),
          executor(executor_options()),
          facade(registry, search, executor, cache_ttl_milliseconds) {
        registry.load();
        search.index(registry.get_servers());
    }

    static executor::ExecutorOptions executor_options() {
        executor::ExecutorOptions options;
        options.launcher = "";
        return options;
    }

    provider_registry::Registry registry;
    search_index::SearchIndex search;
    executor::Executor executor;
    DispatchFacade facade;
};

static json server_entry(const std::string &name, const std::string &category, const std::string &path) {
    return {{"name", name}, {"category", category}, {"description", name + " provider"}, {"path", path}};
}

// Writes three providers (tools, greeter, crasher) and the registry file naming them.
static std::string write_fixture(const TemporaryDirectory &directory) {
    test_support::write_script(directory.file("tools.sh"), TOOLS_PROVIDER);
    test_support::write_script(directory.file("greeter.sh"), GREETING_PROVIDER);
    test_support::write_script(directory.file("crasher.sh"), CRASHING_PROVIDER);

    json document;
    document["servers"]["tools"] = server_entry("tools", "productivity", directory.file("tools.sh"));
    document["servers"]["greeter"] = server_entry("greeter", "media", directory.file("greeter.sh"));
    document["servers"]["greeter"]["env"] = {{"GREETING", "hello from env"}};
    document["servers"]["crasher"] = server_entry("crasher", "database", directory.file("crasher.sh"));
    test_support::write_file(directory.file("registry.json"), document.dump());
    return directory.file("registry.json");
}

// Test: empty or blank server/tool fail validation without touching the executor.
static bool test_validation() {
    TemporaryDirectory directory("mcpdispatch-facade");
    Components components(write_fixture(directory), directory.file("servers"));

    ExecuteToolRequest no_server;
    no_server.tool = "x";
    ExecuteToolRequest blank_tool;
    blank_tool.server = "greeter";
    blank_tool.tool = "   ";

    executor::ExecuteResult first = components.facade.execute_tool(no_server);
    executor::ExecuteResult second = components.facade.execute_tool(blank_tool);
    bool success = first.error_kind == executor::ExecuteErrorKind::validation &&
                   first.error_message == "Invalid request: server is required" &&
                   second.error_kind == executor::ExecuteErrorKind::validation &&
                   second.error_message == "Invalid request: tool is required" &&
                   components.executor.spawned_count() == 0;
    return check(success, "empty server and blank tool are rejected before any spawn");
}

// Test: a registered name resolves to its path and declared env.
static bool test_execute_by_name_uses_env() {
    TemporaryDirectory directory("mcpdispatch-facade");
    Components components(write_fixture(directory), directory.file("servers"));

    ExecuteToolRequest request;
    request.server = "greeter";
    request.tool = "greet";
    executor::ExecuteResult by_name = components.facade.execute_tool(request);

    request.server = directory.file("greeter.sh");
    executor::ExecuteResult by_path = components.facade.execute_tool(request);

    bool success = by_name.success && by_name.response["result"]["greeting"] == "hello from env" &&
                   by_path.success && by_path.response["result"]["greeting"] == "";
    return check(success, "name lookup injects the provider env; an unregistered path runs without it");
}

// Test: search and categories come from the index.
static bool test_search_and_categories() {
    TemporaryDirectory directory("mcpdispatch-facade");
    Components components(write_fixture(directory), directory.file("servers"));

    auto categories = components.facade.list_categories();
    auto greeter = components.facade.search_tools("GREETER");
    auto in_database = components.facade.search_tools("", "database");
    bool success = categories == std::vector<std::string>({"database", "media", "productivity"}) &&
                   greeter.size() == 1 && greeter[0].name == "greeter" &&
                   in_database.size() == 1 && in_database[0].name == "crasher";
    return check(success, "categories are distinct and sorted; search honours the category filter");
}

// Test: summary rows carry the four summary fields only.
static bool test_summary_listing() {
    TemporaryDirectory directory("mcpdispatch-facade");
    Components components(write_fixture(directory), directory.file("servers"));

    json all = components.facade.list_mcps(ListDetail::summary);
    json media = components.facade.list_mcps(ListDetail::summary, "media");
    bool success = all.size() == 3 && media.size() == 1 && media[0]["name"] == "greeter" &&
                   media[0]["status"] == "available" && media[0]["description"] == "greeter provider" &&
                   !media[0].contains("path") && components.facade.detail_cache_size() == 0;
    return check(success, "summary view is built from the snapshot without the detail cache");
}

// Test: full detail without tools spawns nothing and is served from the cache.
static bool test_full_detail_cached() {
    TemporaryDirectory directory("mcpdispatch-facade");
    Components components(write_fixture(directory), directory.file("servers"));

    json first = components.facade.list_mcps(ListDetail::full);
    json again = components.facade.list_mcps(ListDetail::full);
    bool success = first.size() == 3 && first[1]["path"] == directory.file("greeter.sh") &&
                   first[1]["env"]["GREETING"] == "hello from env" && !first[1].contains("tools") &&
                   first[1]["lastChecked"].get<std::string>().back() == 'Z' &&
                   again[1]["lastChecked"] == first[1]["lastChecked"] &&
                   components.facade.detail_cache_size() == 3 && components.executor.spawned_count() == 0;
    return check(success, "full view has path, env and lastChecked, and is reused within the TTL");
}

// Test: tool metadata is fetched once, then reused; a failed lookup degrades the status.
static bool test_include_tools() {
    TemporaryDirectory directory("mcpdispatch-facade");
    Components components(write_fixture(directory), directory.file("servers"));

    std::optional<json> tools = components.facade.get_mcp_details("tools", true);
    std::optional<json> tools_again = components.facade.get_mcp_details("tools", true);
    std::optional<json> without_tools = components.facade.get_mcp_details("tools", false);
    std::optional<json> crasher = components.facade.get_mcp_details("crasher", true);

    bool success = tools && (*tools)["status"] == "available" && (*tools)["toolCount"] == 1 &&
                   (*tools)["tools"][0]["name"] == "ping" &&
                   (*tools)["tools"][0]["inputSchema"]["type"] == "object" &&
                   tools_again && (*tools_again)["toolCount"] == 1 &&
                   without_tools && !without_tools->contains("tools") &&
                   crasher && (*crasher)["status"] == "unknown" && (*crasher)["toolCount"] == 0 &&
                   (*crasher)["tools"].empty() && components.executor.spawned_count() == 2;
    return check(success, "tools are fetched once per TTL and a failed fetch reports status unknown");
}

// Test: an expired entry is rebuilt.
static bool test_cache_expiry() {
    TemporaryDirectory directory("mcpdispatch-facade");
    Components components(write_fixture(directory), directory.file("servers"), 0);

    components.facade.get_mcp_details("tools", true);
    components.facade.get_mcp_details("tools", true);
    return check(components.executor.spawned_count() == 2, "a zero TTL rebuilds the entry on every read");
}

// Test: unknown names give no detail.
static bool test_unknown_name() {
    TemporaryDirectory directory("mcpdispatch-facade");
    Components components(write_fixture(directory), directory.file("servers"));
    return check(!components.facade.get_mcp_details("nope").has_value(), "unknown provider name returns nothing");
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_validation();
    all_passed &= test_execute_by_name_uses_env();
    all_passed &= test_search_and_categories();
    all_passed &= test_summary_listing();
    all_passed &= test_full_detail_cached();
    all_passed &= test_include_tools();
    all_passed &= test_cache_expiry();
    all_passed &= test_unknown_name();
    return all_passed;
}

} // namespace test_dispatch_facade
