#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

#include "domain/Types.h"

namespace adapters {

// Canonical label, used as-is by Binance, MEXC and Gate REST endpoints.
std::string canonical_interval(domain::Interval interval);
std::string bybit_interval(domain::Interval interval);
std::string okx_interval(domain::Interval interval);
// MEXC's push channel has its own vocabulary, distinct from its REST labels.
std::string mexc_stream_interval(domain::Interval interval);

namespace detail {

constexpr std::string_view canonical_interval_literal(domain::Interval interval) {
    switch (interval.ms) {
    case 1'000:
        return "1s";
    case 60'000:
        return "1m";
    case 3 * 60'000:
        return "3m";
    case 5 * 60'000:
        return "5m";
    case 15 * 60'000:
        return "15m";
    case 30 * 60'000:
        return "30m";
    case 3'600'000:
        return "1h";
    case 2 * 3'600'000:
        return "2h";
    case 4 * 3'600'000:
        return "4h";
    case 6 * 3'600'000:
        return "6h";
    case 12 * 3'600'000:
        return "12h";
    case 86'400'000:
        return "1d";
    case 7 * 86'400'000LL:
        return "1w";
    case 30 * 86'400'000LL:
        return "1M";
    }
    throw std::invalid_argument("Unsupported domain interval");
}

constexpr std::string_view bybit_interval_literal(domain::Interval interval) {
    switch (interval.ms) {
    case 60'000:
        return "1";
    case 3 * 60'000:
        return "3";
    case 5 * 60'000:
        return "5";
    case 15 * 60'000:
        return "15";
    case 30 * 60'000:
        return "30";
    case 3'600'000:
        return "60";
    case 2 * 3'600'000:
        return "120";
    case 4 * 3'600'000:
        return "240";
    case 6 * 3'600'000:
        return "360";
    case 12 * 3'600'000:
        return "720";
    case 86'400'000:
        return "D";
    case 7 * 86'400'000LL:
        return "W";
    case 30 * 86'400'000LL:
        return "M";
    }
    throw std::invalid_argument("Unsupported Bybit interval");
}

constexpr std::string_view okx_interval_literal(domain::Interval interval) {
    switch (interval.ms) {
    case 3'600'000:
        return "1H";
    case 2 * 3'600'000:
        return "2H";
    case 4 * 3'600'000:
        return "4H";
    case 6 * 3'600'000:
        return "6H";
    case 12 * 3'600'000:
        return "12H";
    case 86'400'000:
        return "1D";
    case 7 * 86'400'000LL:
        return "1W";
    }
    return canonical_interval_literal(interval);
}

constexpr std::string_view mexc_stream_interval_literal(domain::Interval interval) {
    switch (interval.ms) {
    case 60'000:
        return "Min1";
    case 5 * 60'000:
        return "Min5";
    case 15 * 60'000:
        return "Min15";
    case 30 * 60'000:
        return "Min30";
    case 3'600'000:
        return "Min60";
    case 4 * 3'600'000:
        return "Hour4";
    case 86'400'000:
        return "Day1";
    case 7 * 86'400'000LL:
        return "Week1";
    case 30 * 86'400'000LL:
        return "Month1";
    }
    throw std::invalid_argument("Unsupported MEXC stream interval");
}

} // namespace detail

static_assert(detail::canonical_interval_literal(domain::intervals::k15m) == std::string_view{"15m"});
static_assert(detail::canonical_interval_literal(domain::intervals::k1M) == std::string_view{"1M"});
static_assert(detail::bybit_interval_literal(domain::intervals::k4h) == std::string_view{"240"});
static_assert(detail::bybit_interval_literal(domain::intervals::k1d) == std::string_view{"D"});
static_assert(detail::okx_interval_literal(domain::intervals::k1h) == std::string_view{"1H"});
static_assert(detail::okx_interval_literal(domain::intervals::k5m) == std::string_view{"5m"});
static_assert(detail::mexc_stream_interval_literal(domain::intervals::k1h) == std::string_view{"Min60"});
static_assert(detail::mexc_stream_interval_literal(domain::intervals::k4h) == std::string_view{"Hour4"});

} // namespace adapters
