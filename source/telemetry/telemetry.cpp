#include "telemetry/telemetry.hpp"
#include "utils/debug_log.hpp"
#include "utils/uuid.hpp"

#include <algorithm>

namespace telemetry {

static void add_sample(DurationStats &stats, double milliseconds) {
    stats.count++;
    stats.total_milliseconds += milliseconds;
    stats.max_milliseconds = std::max(stats.max_milliseconds, milliseconds);
}

static json stats_to_json(const DurationStats &stats) {
    json entry;
    entry["count"] = stats.count;
    entry["totalMs"] = stats.total_milliseconds;
    entry["maxMs"] = stats.max_milliseconds;
    entry["averageMs"] = stats.count == 0 ? 0.0 : stats.total_milliseconds / static_cast<double>(stats.count);
    return entry;
}

std::string Telemetry::generate_correlation_id() const {
    return uuid::generate();
}

void Telemetry::set_correlation_id(const std::string &correlation_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    correlation_id_ = correlation_id;
}

std::string Telemetry::correlation_id() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return correlation_id_;
}

void Telemetry::record_search_duration(double milliseconds, size_t result_count) {
    std::string correlation;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        add_sample(search_stats_, milliseconds);
        correlation = correlation_id_;
    }
    debug_log::log("search took " + std::to_string(milliseconds) + "ms, " + std::to_string(result_count) +
                   " results [" + correlation + "]");
}

void Telemetry::record_execution(const std::string &server, const std::string &tool, double milliseconds,
                                 bool success) {
    std::string correlation;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        add_sample(execute_stats_, milliseconds);
        if (!success) {
            execute_failures_++;
        }
        correlation = correlation_id_;
    }
    debug_log::log("execute " + server + "/" + tool + " took " + std::to_string(milliseconds) + "ms, " +
                   (success ? "ok" : "failed") + " [" + correlation + "]");
}

void Telemetry::record_error(const std::string &error_type, const std::string &message, const json &attributes) {
    std::string correlation;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        error_counts_[error_type]++;
        correlation = correlation_id_;
    }
    std::string line = "error " + error_type + ": " + message;
    if (attributes.is_object() && !attributes.empty()) {
        line += " " + attributes.dump(-1, ' ', false, json::error_handler_t::replace);
    }
    debug_log::log(line + " [" + correlation + "]");
}

json Telemetry::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    json result;
    result["correlationId"] = correlation_id_;
    result["search"] = stats_to_json(search_stats_);
    result["execute"] = stats_to_json(execute_stats_);
    result["execute"]["failures"] = execute_failures_;
    result["errors"] = json::object();
    for (const auto &entry : error_counts_) {
        result["errors"][entry.first] = entry.second;
    }
    return result;
}

void Telemetry::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    correlation_id_.clear();
    search_stats_ = DurationStats();
    execute_stats_ = DurationStats();
    execute_failures_ = 0;
    error_counts_.clear();
}

} // namespace telemetry
