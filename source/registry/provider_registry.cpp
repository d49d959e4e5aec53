#include "registry/provider_registry.hpp"
#include "utils/debug_log.hpp"

#include <chrono>
#include <map>

namespace provider_registry {

std::vector<ProviderDescriptor> merge_providers(const std::vector<ProviderDescriptor> &configured,
                                                const std::vector<ProviderDescriptor> &discovered) {
    std::vector<ProviderDescriptor> merged;
    std::map<std::string, size_t> position_by_name;

    auto insert_or_replace = [&](const ProviderDescriptor &descriptor) {
        auto existing = position_by_name.find(descriptor.name);
        if (existing != position_by_name.end()) {
            merged[existing->second] = descriptor;
            return;
        }
        position_by_name[descriptor.name] = merged.size();
        merged.push_back(descriptor);
    };

    for (const auto &descriptor : configured) {
        insert_or_replace(descriptor);
    }
    for (const auto &descriptor : discovered) {
        insert_or_replace(descriptor);
    }
    return merged;
}

Registry::Registry(std::string registry_path, std::string servers_directory,
                   int refresh_interval_milliseconds)
    : registry_path_(std::move(registry_path)),
      servers_directory_(std::move(servers_directory)),
      refresh_interval_milliseconds_(refresh_interval_milliseconds),
      snapshot_(std::make_shared<const std::vector<ProviderDescriptor>>()) {}

Registry::~Registry() {
    destroy();
}

LoadResult Registry::load() {
    std::lock_guard<std::mutex> load_lock(load_mutex_);
    LoadResult result;

    std::vector<ProviderDescriptor> discovered = discover_providers(servers_directory_);
    RegistryFileResult file_result = read_registry_file(registry_path_);

    result.discovered_count = discovered.size();
    result.configured_count = file_result.providers.size();

    if (!file_result.success) {
        if (discovered.empty()) {
            result.error_kind = file_result.error_kind;
            result.error_message = file_result.error_message;
            debug_log::log("Registry load failed (" + std::string(error_kind_name(result.error_kind)) +
                           "): " + result.error_message);
            // The next scheduled refresh retries.
            start_refresh_thread();
            return result;
        }
        debug_log::log("Registry file unusable (" + file_result.error_message + "), using " +
                       std::to_string(discovered.size()) + " discovered provider(s).");
    }

    result.providers = merge_providers(file_result.providers, discovered);
    result.success = true;

    RefreshListener listener;
    {
        std::lock_guard<std::mutex> lock(snapshot_mutex_);
        snapshot_ = std::make_shared<const std::vector<ProviderDescriptor>>(result.providers);
        listener = refresh_listener_;
    }

    debug_log::log("Registry loaded " + std::to_string(result.providers.size()) + " provider(s) (" +
                   std::to_string(result.configured_count) + " configured, " +
                   std::to_string(result.discovered_count) + " discovered).");

    if (listener) {
        listener(result.providers);
    }

    start_refresh_thread();
    return result;
}

std::vector<ProviderDescriptor> Registry::get_servers() const {
    return *snapshot();
}

Snapshot Registry::snapshot() const {
    std::lock_guard<std::mutex> lock(snapshot_mutex_);
    return snapshot_;
}

std::optional<ProviderDescriptor> Registry::find_server(const std::string &name) const {
    Snapshot current = snapshot();
    for (const auto &descriptor : *current) {
        if (descriptor.name == name) {
            return descriptor;
        }
    }
    return std::nullopt;
}

void Registry::set_refresh_listener(RefreshListener listener) {
    std::lock_guard<std::mutex> lock(snapshot_mutex_);
    refresh_listener_ = std::move(listener);
}

void Registry::start_refresh_thread() {
    std::lock_guard<std::mutex> lock(refresh_mutex_);
    if (refresh_started_ || stopping_ || refresh_interval_milliseconds_ <= 0) {
        return;
    }
    refresh_started_ = true;
    refresh_thread_ = std::thread(&Registry::refresh_loop, this);
}

void Registry::refresh_loop() {
    std::unique_lock<std::mutex> lock(refresh_mutex_);
    while (!stopping_) {
        bool stop_signalled = refresh_condition_.wait_for(
            lock, std::chrono::milliseconds(refresh_interval_milliseconds_), [this] { return stopping_; });
        if (stop_signalled) {
            break;
        }

        lock.unlock();
        // A registry that worked once keeps serving its last good snapshot.
        LoadResult reload = load();
        if (!reload.success) {
            debug_log::log("Scheduled registry refresh failed, keeping previous snapshot: " +
                           reload.error_message);
        }
        lock.lock();
    }
}

void Registry::destroy() {
    {
        std::lock_guard<std::mutex> lock(refresh_mutex_);
        stopping_ = true;
    }
    refresh_condition_.notify_all();
    if (refresh_thread_.joinable() && refresh_thread_.get_id() != std::this_thread::get_id()) {
        refresh_thread_.join();
    }
}

bool Registry::is_refresh_running() const {
    std::lock_guard<std::mutex> lock(refresh_mutex_);
    return refresh_started_ && !stopping_;
}

} // namespace provider_registry
