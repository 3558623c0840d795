#include "grocery/analytics.hpp"

#include <iomanip>
#include <random>
#include <sstream>
#include "grocery/errors.hpp"
#include "grocery/helpers.hpp"

namespace grocery {

namespace {

std::string random_event_id() {
    thread_local std::mt19937_64 rng{std::random_device{}()};
    std::ostringstream ss;
    ss << std::hex << std::setfill('0') << std::setw(16) << rng() << std::setw(16) << rng();
    return ss.str();
}

nlohmann::json to_json(const LatencyStats& stats) {
    return {
        {"count", stats.count},
        {"ok", stats.succeeded},
        {"fail", stats.failed},
        {"avg_latency_ms", stats.average_latency_ms()},
        {"min_latency_ms", stats.min_latency_ms},
        {"max_latency_ms", stats.max_latency_ms}
    };
}

} // anonymous namespace

AnalyticsEvent make_analytics_event(const std::string& source, const std::string& event_type,
                                    double latency_ms, bool success) {
    AnalyticsEvent event;
    event.set_event_id(random_event_id());
    event.set_source(source);
    event.set_event_type(event_type);
    event.set_timestamp_ms(helpers::now_ms());
    event.set_latency_ms(latency_ms);
    event.set_success(success);
    return event;
}

std::string encode_analytics_event(const AnalyticsEvent& event) {
    std::string payload;
    if (!event.SerializeToString(&payload)) {
        throw DecodeError("Failed to serialize analytics event " + event.event_id());
    }
    return payload;
}

AnalyticsEvent decode_analytics_event(const std::string& payload) {
    AnalyticsEvent event;
    if (!event.ParseFromString(payload)) {
        throw DecodeError("Malformed analytics event");
    }
    return event;
}

void LatencyStats::record(double latency_ms, bool success) {
    if (count == 0 || latency_ms < min_latency_ms) min_latency_ms = latency_ms;
    if (count == 0 || latency_ms > max_latency_ms) max_latency_ms = latency_ms;
    ++count;
    total_latency_ms += latency_ms;
    if (success) {
        ++succeeded;
    } else {
        ++failed;
    }
}

void AnalyticsCollector::record(const AnalyticsEvent& event) {
    std::lock_guard<std::mutex> lock(mutex_);
    totals_.record(event.latency_ms(), event.success());
    by_type_[event.event_type()].record(event.latency_ms(), event.success());
}

LatencyStats AnalyticsCollector::totals() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return totals_;
}

std::map<std::string, LatencyStats> AnalyticsCollector::by_event_type() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return by_type_;
}

nlohmann::json AnalyticsCollector::summary() const {
    std::lock_guard<std::mutex> lock(mutex_);
    nlohmann::json types = nlohmann::json::object();
    for (const auto& [event_type, stats] : by_type_) {
        types[event_type] = to_json(stats);
    }
    return {{"totals", to_json(totals_)}, {"by_event_type", types}};
}

} // namespace grocery
