#include "dispatch/dispatch_facade.hpp"
#include "utils/debug_log.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <ctime>
#include <set>

namespace dispatch_facade {

static bool is_blank(const std::string &text) {
    return std::all_of(text.begin(), text.end(),
                       [](unsigned char character) { return std::isspace(character) != 0; });
}

static executor::ExecuteResult validation_failure(const std::string &message) {
    executor::ExecuteResult result;
    result.error_kind = executor::ExecuteErrorKind::validation;
    result.error_message = message;
    return result;
}

json summary_to_json(const ProviderDescriptor &descriptor) {
    json entry;
    entry["name"] = descriptor.name;
    entry["category"] = descriptor.category;
    entry["description"] = descriptor.description;
    entry["status"] = STATUS_AVAILABLE;
    return entry;
}

json detail_to_json(const ProviderDetail &detail, bool include_tools) {
    json entry;
    entry["name"] = detail.descriptor.name;
    entry["category"] = detail.descriptor.category;
    entry["description"] = detail.descriptor.description;
    entry["status"] = detail.status;
    entry["path"] = detail.descriptor.path;
    entry["env"] = detail.descriptor.env;
    entry["lastChecked"] = detail.last_checked;

    if (include_tools) {
        json tools = json::array();
        for (const auto &tool : detail.tools) {
            json tool_entry;
            tool_entry["name"] = tool.name;
            tool_entry["description"] = tool.description;
            tool_entry["inputSchema"] = tool.input_schema;
            tools.push_back(tool_entry);
        }
        entry["toolCount"] = tools.size();
        entry["tools"] = tools;
    }
    return entry;
}

bool parse_tool_list(const json &response, std::vector<ToolInfo> &tools) {
    if (!response.is_object() || response.contains("error")) {
        return false;
    }
    auto result = response.find("result");
    if (result == response.end() || !result->is_object()) {
        return false;
    }
    auto listed = result->find("tools");
    if (listed == result->end() || !listed->is_array()) {
        return false;
    }

    tools.clear();
    for (const auto &item : *listed) {
        if (!item.is_object() || !item.contains("name") || !item["name"].is_string()) {
            continue;
        }
        ToolInfo tool;
        tool.name = item["name"].get<std::string>();
        if (item.contains("description") && item["description"].is_string()) {
            tool.description = item["description"].get<std::string>();
        }
        if (item.contains("inputSchema") && item["inputSchema"].is_object()) {
            tool.input_schema = item["inputSchema"];
        }
        tools.push_back(tool);
    }
    return true;
}

std::string current_timestamp() {
    auto now = std::chrono::system_clock::now();
    std::time_t seconds = std::chrono::system_clock::to_time_t(now);
    long milliseconds = static_cast<long>(
        std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000);

    std::tm utc_time;
    gmtime_r(&seconds, &utc_time);
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%S", &utc_time);

    char fraction[8];
    std::snprintf(fraction, sizeof(fraction), ".%03ldZ", milliseconds);
    return std::string(buffer) + fraction;
}

DispatchFacade::DispatchFacade(provider_registry::Registry &registry, search_index::SearchIndex &search,
                               executor::Executor &executor, int detail_cache_ttl_milliseconds,
                               int default_timeout_milliseconds)
    : registry_(registry),
      search_(search),
      executor_(executor),
      detail_cache_ttl_milliseconds_(detail_cache_ttl_milliseconds),
      default_timeout_milliseconds_(default_timeout_milliseconds > 0 ? default_timeout_milliseconds
                                                                      : executor::kDefaultTimeoutMilliseconds) {}

std::vector<ProviderDescriptor> DispatchFacade::search_tools(const std::string &query,
                                                             const std::string &category) const {
    search_index::SearchOptions options;
    options.category = category;
    return search_.find(query, options);
}

executor::ExecuteResult DispatchFacade::execute_tool(const ExecuteToolRequest &request, int timeout_milliseconds) {
    if (is_blank(request.server)) {
        return validation_failure("Invalid request: server is required");
    }
    if (is_blank(request.tool)) {
        return validation_failure("Invalid request: tool is required");
    }

    executor::ExecuteRequest call;
    call.server = request.server;
    call.tool = request.tool;
    call.params = request.params.is_null() ? json::object() : request.params;

    executor::EnvironmentMap environment;
    std::optional<ProviderDescriptor> descriptor = registry_.find_server(request.server);
    if (descriptor) {
        call.server = descriptor->path;
        environment = descriptor->env;
    } else {
        debug_log::log("execute_tool: " + request.server + " is not registered, using it as a path");
    }

    int timeout = timeout_milliseconds > 0 ? timeout_milliseconds : default_timeout_milliseconds_;
    return executor_.execute(call, environment, timeout);
}

std::vector<std::string> DispatchFacade::list_categories() const {
    std::set<std::string> categories;
    for (const auto &descriptor : search_.get_all()) {
        categories.insert(descriptor.category);
    }
    return std::vector<std::string>(categories.begin(), categories.end());
}

json DispatchFacade::list_mcps(ListDetail detail, const std::string &category, bool include_tools) {
    provider_registry::Snapshot snapshot = registry_.snapshot();
    json entries = json::array();
    if (!snapshot) {
        return entries;
    }

    for (const auto &descriptor : *snapshot) {
        if (!category.empty() && descriptor.category != category) {
            continue;
        }
        if (detail == ListDetail::summary) {
            entries.push_back(summary_to_json(descriptor));
        } else {
            entries.push_back(detail_to_json(cached_detail(descriptor, include_tools), include_tools));
        }
    }
    return entries;
}

std::optional<json> DispatchFacade::get_mcp_details(const std::string &name, bool include_tools) {
    std::optional<ProviderDescriptor> descriptor = registry_.find_server(name);
    if (!descriptor) {
        return std::nullopt;
    }
    return detail_to_json(cached_detail(*descriptor, include_tools), include_tools);
}

void DispatchFacade::clear_detail_cache() {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    detail_cache_.clear();
}

size_t DispatchFacade::detail_cache_size() const {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    return detail_cache_.size();
}

ProviderDetail DispatchFacade::cached_detail(const ProviderDescriptor &descriptor, bool include_tools) {
    auto now = std::chrono::steady_clock::now();
    {
        std::lock_guard<std::mutex> lock(cache_mutex_);
        auto found = detail_cache_.find(descriptor.name);
        if (found != detail_cache_.end()) {
            bool fresh = now - found->second.built_at < std::chrono::milliseconds(detail_cache_ttl_milliseconds_);
            bool has_needed_tools = !include_tools || found->second.detail.tools_fetched;
            if (fresh && has_needed_tools) {
                return found->second.detail;
            }
        }
    }

    // Built outside the lock: fetching tools runs a provider process.
    ProviderDetail detail = build_detail(descriptor, include_tools);
    std::lock_guard<std::mutex> lock(cache_mutex_);
    CacheEntry &entry = detail_cache_[descriptor.name];
    entry.detail = detail;
    entry.built_at = std::chrono::steady_clock::now();
    return detail;
}

ProviderDetail DispatchFacade::build_detail(const ProviderDescriptor &descriptor, bool include_tools) {
    ProviderDetail detail;
    detail.descriptor = descriptor;
    detail.last_checked = current_timestamp();
    if (!include_tools) {
        return detail;
    }

    executor::ExecuteRequest call;
    call.server = descriptor.path;
    call.method = "tools/list";
    call.params = json::object();
    executor::ExecuteResult result = executor_.execute(call, descriptor.env, kToolListTimeoutMilliseconds);

    detail.tools_fetched = true;
    if (!result.success || !parse_tool_list(result.response, detail.tools)) {
        debug_log::log("tools/list failed for " + descriptor.name + ": " +
                       (result.success ? std::string("no tools in response") : result.error_message));
        detail.status = STATUS_UNKNOWN;
        detail.tools.clear();
    }
    return detail;
}

} // namespace dispatch_facade
