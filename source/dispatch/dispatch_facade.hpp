#ifndef MCPDISPATCH_DISPATCH_FACADE_HPP
#define MCPDISPATCH_DISPATCH_FACADE_HPP

// The operations a caller actually invokes: search, execute by name, list
// categories, list providers and provider detail. Composes the registry, the
// search index and the executor; owns the per-provider detail cache.

#include <nlohmann/json.hpp>
#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "executor/executor.hpp"
#include "registry/provider_registry.hpp"
#include "search/search_index.hpp"

namespace dispatch_facade {

using json = nlohmann::json;
using provider_registry::ProviderDescriptor;

constexpr int kDefaultDetailCacheTtlMilliseconds = 30000;
constexpr int kToolListTimeoutMilliseconds = 5000;

const char STATUS_AVAILABLE[] = "available";
const char STATUS_UNKNOWN[] = "unknown";

// One tool reported by a provider's tools/list.
struct ToolInfo {
    std::string name;
    std::string description;
    json input_schema = json::object();
};

struct ProviderDetail {
    ProviderDescriptor descriptor;
    std::string status = STATUS_AVAILABLE;
    std::string last_checked;        // ISO-8601 UTC
    bool tools_fetched = false;
    std::vector<ToolInfo> tools;
};

enum class ListDetail {
    summary,
    full
};

struct ExecuteToolRequest {
    std::string server;   // provider name, or an entry-point path
    std::string tool;
    json params = json::object();
};

// {name, category, description, status}
json summary_to_json(const ProviderDescriptor &descriptor);

// Summary fields plus path, env, lastChecked; tools and toolCount when
// include_tools is set.
json detail_to_json(const ProviderDetail &detail, bool include_tools);

// Parse a tools/list response ({"result": {"tools": [...]}}). Returns false
// when the response carries an error or no tools array.
bool parse_tool_list(const json &response, std::vector<ToolInfo> &tools);

// Current time as 2024-01-31T12:00:00.000Z.
std::string current_timestamp();

class DispatchFacade {
public:
    DispatchFacade(provider_registry::Registry &registry, search_index::SearchIndex &search,
                   executor::Executor &executor,
                   int detail_cache_ttl_milliseconds = kDefaultDetailCacheTtlMilliseconds,
                   int default_timeout_milliseconds = executor::kDefaultTimeoutMilliseconds);

    std::vector<ProviderDescriptor> search_tools(const std::string &query,
                                                 const std::string &category = std::string()) const;

    // Validates server and tool, resolves the provider's path and env from
    // the registry, and runs the call. timeout_milliseconds <= 0 uses the
    // configured default.
    executor::ExecuteResult execute_tool(const ExecuteToolRequest &request, int timeout_milliseconds = 0);

    // Distinct categories of the indexed set, sorted.
    std::vector<std::string> list_categories() const;

    json list_mcps(ListDetail detail, const std::string &category = std::string(), bool include_tools = false);

    // nullopt when no provider has that name.
    std::optional<json> get_mcp_details(const std::string &name, bool include_tools = false);

    void clear_detail_cache();
    size_t detail_cache_size() const;

private:
    struct CacheEntry {
        ProviderDetail detail;
        std::chrono::steady_clock::time_point built_at;
    };

    ProviderDetail cached_detail(const ProviderDescriptor &descriptor, bool include_tools);
    ProviderDetail build_detail(const ProviderDescriptor &descriptor, bool include_tools);

    provider_registry::Registry &registry_;
    search_index::SearchIndex &search_;
    executor::Executor &executor_;
    int detail_cache_ttl_milliseconds_;
    int default_timeout_milliseconds_;

    mutable std::mutex cache_mutex_;
    std::map<std::string, CacheEntry> detail_cache_;
};

} // namespace dispatch_facade

#endif // MCPDISPATCH_DISPATCH_FACADE_HPP
