#ifndef MCPDISPATCH_TELEMETRY_HPP
#define MCPDISPATCH_TELEMETRY_HPP

// Operational counters for the dispatcher: correlation ids, durations of
// searches and provider calls, and error counts by type. Owned by main and
// passed by reference; recording never changes a result.

#include <nlohmann/json.hpp>
#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>

namespace telemetry {

using json = nlohmann::json;

struct DurationStats {
    uint64_t count = 0;
    double total_milliseconds = 0.0;
    double max_milliseconds = 0.0;
};

class Telemetry {
public:
    // New UUID v4; does not change the current id.
    std::string generate_correlation_id() const;

    void set_correlation_id(const std::string &correlation_id);
    std::string correlation_id() const;

    void record_search_duration(double milliseconds, size_t result_count);
    void record_execution(const std::string &server, const std::string &tool, double milliseconds, bool success);
    void record_error(const std::string &error_type, const std::string &message,
                      const json &attributes = json::object());

    // Time a search call and record its duration. The callable must return
    // a container with size().
    template <typename SearchFunction>
    auto measure_search(SearchFunction &&search) -> decltype(search()) {
        auto start_time = std::chrono::steady_clock::now();
        auto results = search();
        std::chrono::duration<double, std::milli> elapsed = std::chrono::steady_clock::now() - start_time;
        record_search_duration(elapsed.count(), results.size());
        return results;
    }

    // {"correlationId", "search": {...}, "execute": {...}, "errors": {type: count}}
    json snapshot() const;
    void reset();

private:
    mutable std::mutex mutex_;
    std::string correlation_id_;
    DurationStats search_stats_;
    DurationStats execute_stats_;
    uint64_t execute_failures_ = 0;
    std::map<std::string, uint64_t> error_counts_;
};

} // namespace telemetry

#endif // MCPDISPATCH_TELEMETRY_HPP
