#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <nlohmann/json.hpp>
#include "grocery/tasks.pb.h"

namespace grocery {

/**
 * Build an event with a fresh random id and the current time.
 */
AnalyticsEvent make_analytics_event(const std::string& source, const std::string& event_type,
                                    double latency_ms, bool success);

std::string encode_analytics_event(const AnalyticsEvent& event);

/**
 * @throws DecodeError if the payload is not an AnalyticsEvent
 */
AnalyticsEvent decode_analytics_event(const std::string& payload);

/// Running latency/success counters.
struct LatencyStats {
    int64_t count = 0;
    int64_t succeeded = 0;
    int64_t failed = 0;
    double total_latency_ms = 0.0;
    double min_latency_ms = 0.0;
    double max_latency_ms = 0.0;

    void record(double latency_ms, bool success);

    double average_latency_ms() const {
        return count == 0 ? 0.0 : total_latency_ms / static_cast<double>(count);
    }
};

/**
 * Aggregates analytics events into overall and per-event-type statistics.
 */
class AnalyticsCollector {
public:
    void record(const AnalyticsEvent& event);

    LatencyStats totals() const;

    std::map<std::string, LatencyStats> by_event_type() const;

    /**
     * Summary suitable for a log line.
     */
    nlohmann::json summary() const;

private:
    mutable std::mutex mutex_;
    LatencyStats totals_;
    std::map<std::string, LatencyStats> by_type_;
};

} // namespace grocery
