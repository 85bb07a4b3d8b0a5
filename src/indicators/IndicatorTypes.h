#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace indicators {

using Value = std::optional<double>;

struct EmaParams {
    int period = 20;

    std::string name() const { return "EMA(" + std::to_string(period) + ")"; }
};

struct RsiParams {
    int period = 14;

    std::string name() const { return "RSI(" + std::to_string(period) + ")"; }
};

struct KdjParams {
    int period = 9;

    std::string name() const { return "KDJ(" + std::to_string(period) + ")"; }
};

struct SarParams {
    double startAf = 0.02;
    double maxAf = 0.2;
};

struct IndicatorSeries {
    std::string id;
    std::vector<Value> values;
};

struct KdjSeries {
    std::vector<Value> k;
    std::vector<Value> d;
    std::vector<Value> j;
};

// Per-index trend and acceleration factor are only set where values[i] is.
struct SarSeries {
    std::vector<Value> values;
    std::vector<std::optional<bool>> uptrend;
    std::vector<Value> af;
};

enum class Trend { Up, Down };

inline const char* to_string(Trend trend) {
    return trend == Trend::Up ? "up" : "down";
}

struct CandleStats {
    double changePercent = 0.0;
    double amplitudePercent = 0.0;
};

// Identity of the candle series an indicator set was computed from.
struct SeriesVersion {
    std::uint64_t sessionId = 0;
    std::uint64_t revision = 0;

    bool operator==(const SeriesVersion& o) const {
        return sessionId == o.sessionId && revision == o.revision;
    }
    bool operator!=(const SeriesVersion& o) const { return !(*this == o); }
};

// Standard chart overlays.
struct IndicatorSet {
    IndicatorSeries ema7;
    IndicatorSeries ema25;
    IndicatorSeries ema99;
    IndicatorSeries rsi14;
    KdjSeries kdj9;
    SarSeries sar;
    std::optional<Trend> trend;
};

}  // namespace indicators
