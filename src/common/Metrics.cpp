#include "common/Metrics.hpp"

#include <sstream>

namespace tcs::common::metrics {

Registry::Registry()
    : startTime_(std::chrono::steady_clock::now()) {}

Registry& Registry::instance() {
    static Registry instance;
    return instance;
}

void Registry::incrementCounter(const std::string& counterKey, std::uint64_t value) {
    if (value == 0U) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    counters_[counterKey] += value;
}

void Registry::setGauge(const std::string& gaugeKey, double value) {
    std::lock_guard<std::mutex> lock(mutex_);
    gauges_[gaugeKey] = value;
}

std::uint64_t Registry::counterValue(const std::string& counterKey) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = counters_.find(counterKey);
    return it == counters_.end() ? 0U : it->second;
}

double Registry::gaugeValue(const std::string& gaugeKey) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = gauges_.find(gaugeKey);
    return it == gauges_.end() ? 0.0 : it->second;
}

std::string Registry::summary() const {
    const auto uptime =
        std::chrono::duration_cast<std::chrono::seconds>(std::chrono::steady_clock::now() - startTime_);

    std::ostringstream out;
    out << "uptime_s=" << uptime.count();

    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [key, value] : counters_) {
        out << ' ' << key << '=' << value;
    }
    for (const auto& [key, value] : gauges_) {
        out << ' ' << key << '=' << value;
    }
    return out.str();
}

}  // namespace tcs::common::metrics
