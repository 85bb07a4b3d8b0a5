#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>

namespace tcs::common::metrics {

// Process-wide counters and gauges. Safe to use from any thread.
class Registry {
public:
    static Registry& instance();

    void incrementCounter(const std::string& counterKey,
                          std::uint64_t value = 1U);
    void setGauge(const std::string& gaugeKey, double value);

    std::uint64_t counterValue(const std::string& counterKey) const;
    double gaugeValue(const std::string& gaugeKey) const;

    // "uptime_s=12 key=value ..." with keys in lexical order.
    std::string summary() const;

private:
    Registry();

    const std::chrono::steady_clock::time_point startTime_;
    mutable std::mutex mutex_;
    std::map<std::string, std::uint64_t> counters_;
    std::map<std::string, double> gauges_;
};

namespace names {
inline constexpr const char* kRelayFallbackTotal = "relay_fallback_total";
inline constexpr const char* kFetchUnavailableTotal = "fetch_unavailable_total";
inline constexpr const char* kStreamMessagesTotal = "stream_messages_total";
inline constexpr const char* kStreamErrorsTotal = "stream_errors_total";
inline constexpr const char* kStaleResultsDroppedTotal = "stale_results_dropped_total";
inline constexpr const char* kWsState = "ws_state";
}  // namespace names

}  // namespace tcs::common::metrics
