#ifndef MCPDISPATCH_PROVIDER_REGISTRY_HPP
#define MCPDISPATCH_PROVIDER_REGISTRY_HPP

// Provider registry: builds the descriptor list from the registry file and
// from the providers directory, merges them, and refreshes periodically on a
// background thread. Readers always see one complete snapshot.

#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "registry/provider_descriptor.hpp"
#include "registry/provider_discovery.hpp"

namespace provider_registry {

// 5 minutes.
constexpr int kDefaultRefreshIntervalMilliseconds = 300000;

// Result of one load.
struct LoadResult {
    bool success = false;
    std::vector<ProviderDescriptor> providers;
    RegistryErrorKind error_kind = RegistryErrorKind::none;
    std::string error_message;
    size_t configured_count = 0; // entries read from the registry file
    size_t discovered_count = 0; // entries found in the providers directory
};

using Snapshot = std::shared_ptr<const std::vector<ProviderDescriptor>>;

// Called after every successful load, on the thread that performed it.
using RefreshListener = std::function<void(const std::vector<ProviderDescriptor> &providers)>;

class Registry {
public:
    Registry(std::string registry_path, std::string servers_directory,
             int refresh_interval_milliseconds = kDefaultRefreshIntervalMilliseconds);
    ~Registry();

    Registry(const Registry &) = delete;
    Registry &operator=(const Registry &) = delete;

    // Rebuild the descriptor set. Fails only when the registry file is
    // unusable and discovery found nothing. The first load starts the periodic
    // refresh, whatever its outcome.
    LoadResult load();

    // Last successfully loaded set (empty before the first load).
    std::vector<ProviderDescriptor> get_servers() const;
    Snapshot snapshot() const;

    // Lookup by name in the current snapshot.
    std::optional<ProviderDescriptor> find_server(const std::string &name) const;

    void set_refresh_listener(RefreshListener listener);

    // Stop the periodic refresh. The last snapshot stays readable.
    void destroy();

    bool is_refresh_running() const;
    const std::string &registry_path() const { return registry_path_; }
    const std::string &servers_directory() const { return servers_directory_; }

private:
    void start_refresh_thread();
    void refresh_loop();

    std::string registry_path_;
    std::string servers_directory_;
    int refresh_interval_milliseconds_;

    mutable std::mutex snapshot_mutex_;
    Snapshot snapshot_;
    RefreshListener refresh_listener_;

    // Serializes load() between the caller and the refresh thread.
    std::mutex load_mutex_;

    mutable std::mutex refresh_mutex_;
    std::condition_variable refresh_condition_;
    std::thread refresh_thread_;
    bool refresh_started_ = false;
    bool stopping_ = false;
};

// Merge by name: registry-file entries first, discovered entries override
// (keeping the position of the entry they replace).
std::vector<ProviderDescriptor> merge_providers(const std::vector<ProviderDescriptor> &configured,
                                                const std::vector<ProviderDescriptor> &discovered);

} // namespace provider_registry

#endif // MCPDISPATCH_PROVIDER_REGISTRY_HPP
