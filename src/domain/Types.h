#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace domain {

using TimestampMs = long long;
using Symbol = std::string;

struct Interval {
    TimestampMs ms{0};
    constexpr bool valid() const noexcept { return ms > 0; }
};

constexpr bool operator==(Interval a, Interval b) noexcept { return a.ms == b.ms; }
constexpr bool operator!=(Interval a, Interval b) noexcept { return a.ms != b.ms; }

namespace intervals {
inline constexpr Interval k1s{1'000};
inline constexpr Interval k1m{60'000};
inline constexpr Interval k3m{180'000};
inline constexpr Interval k5m{300'000};
inline constexpr Interval k15m{900'000};
inline constexpr Interval k30m{1'800'000};
inline constexpr Interval k1h{3'600'000};
inline constexpr Interval k2h{7'200'000};
inline constexpr Interval k4h{14'400'000};
inline constexpr Interval k6h{21'600'000};
inline constexpr Interval k12h{43'200'000};
inline constexpr Interval k1d{86'400'000};
inline constexpr Interval k1w{604'800'000};
// A month is carried as 30 days; exchanges align it to calendar months themselves.
inline constexpr Interval k1M{2'592'000'000};
}  // namespace intervals

struct IntervalLabel {
    Interval interval;
    std::string_view label;
};

inline constexpr std::array<IntervalLabel, 14> kIntervalLabels{{
    {intervals::k1s, "1s"},
    {intervals::k1m, "1m"},
    {intervals::k3m, "3m"},
    {intervals::k5m, "5m"},
    {intervals::k15m, "15m"},
    {intervals::k30m, "30m"},
    {intervals::k1h, "1h"},
    {intervals::k2h, "2h"},
    {intervals::k4h, "4h"},
    {intervals::k6h, "6h"},
    {intervals::k12h, "12h"},
    {intervals::k1d, "1d"},
    {intervals::k1w, "1w"},
    {intervals::k1M, "1M"},
}};

inline constexpr Interval kDefaultInterval = intervals::k15m;

// Empty for intervals outside the canonical set.
inline std::string interval_label(const Interval& interval) {
    for (const auto& entry : kIntervalLabels) {
        if (entry.interval == interval) {
            return std::string(entry.label);
        }
    }
    return "";
}

// Case-sensitive: "1M" is a month, "1m" a minute. Unknown labels give an invalid Interval.
inline Interval interval_from_label(std::string_view label) {
    for (const auto& entry : kIntervalLabels) {
        if (entry.label == label) {
            return entry.interval;
        }
    }
    return Interval{};
}

std::string to_string(Interval i);
Interval interval_from_string(const std::string& value);

enum class ExchangeId { Binance, Bybit, MEXC, Gate, OKX };

inline constexpr std::array<ExchangeId, 5> kAllExchanges{
    ExchangeId::Binance, ExchangeId::Bybit, ExchangeId::MEXC, ExchangeId::Gate, ExchangeId::OKX};

const char* to_string(ExchangeId id);
std::optional<ExchangeId> exchange_from_string(std::string_view value);

struct Candle {
    TimestampMs time{0};
    double open{0};
    double high{0};
    double low{0};
    double close{0};
    double volume{0};
};

inline bool operator==(const Candle& a, const Candle& b) noexcept {
    return a.time == b.time && a.open == b.open && a.high == b.high && a.low == b.low && a.close == b.close
        && a.volume == b.volume;
}

// Decimal fields are kept as the exchange's text so no precision is lost.
struct TickerSnapshot {
    Symbol symbol;
    std::string priceChange;
    std::string priceChangePercent;
    std::string lastPrice;
    std::string highPrice;
    std::string lowPrice;
    std::string volume;
    ExchangeId exchange{ExchangeId::Binance};
};

enum class SnapshotKind { Ticker24h, Candles };

}  // namespace domain
