#include "adapters/binance/BinanceAdapter.hpp"

#include <sstream>

#include <boost/json.hpp>

#include "adapters/IntervalMap.hpp"
#include "adapters/common/JsonFields.hpp"
#include "adapters/common/SymbolFormat.hpp"
#include "domain/Errors.hpp"

namespace adapters::binance {

namespace {
constexpr const char* kRestBase = "https://api.binance.com/api/v3";
constexpr const char* kStreamBase = "wss://stream.binance.com:9443/ws/";
}

std::string BinanceAdapter::format_symbol(const std::string& base) const {
    return settlement_pair(base, "");
}

std::string BinanceAdapter::map_interval(domain::Interval interval) const {
    return canonical_interval(interval);
}

std::string BinanceAdapter::build_snapshot_request(domain::SnapshotKind kind,
                                                   const std::string& base,
                                                   domain::Interval interval,
                                                   std::size_t limit) const {
    std::ostringstream url;
    url << kRestBase;
    if (kind == domain::SnapshotKind::Ticker24h) {
        url << "/ticker/24hr?symbol=" << format_symbol(base);
    }
    else {
        url << "/klines?symbol=" << format_symbol(base) << "&interval=" << map_interval(interval)
            << "&limit=" << limit;
    }
    return url.str();
}

domain::TickerSnapshot BinanceAdapter::parse_snapshot_ticker(const boost::json::value& payload) const {
    const auto& obj = json::require_object(payload, "Binance ticker");

    domain::TickerSnapshot ticker;
    ticker.symbol = json::json_to_text(json::require_field(obj, "symbol"));
    ticker.priceChange = json::json_to_text(json::require_field(obj, "priceChange"));
    ticker.priceChangePercent = json::json_to_text(json::require_field(obj, "priceChangePercent"));
    ticker.lastPrice = json::json_to_text(json::require_field(obj, "lastPrice"));
    ticker.highPrice = json::json_to_text(json::require_field(obj, "highPrice"));
    ticker.lowPrice = json::json_to_text(json::require_field(obj, "lowPrice"));
    ticker.volume = json::json_to_text(json::require_field(obj, "quoteVolume"));
    ticker.exchange = id();
    return ticker;
}

std::vector<domain::Candle> BinanceAdapter::parse_snapshot_candles(const boost::json::value& payload) const {
    const auto& rows = json::require_array(payload, "Binance klines");

    std::vector<domain::Candle> candles;
    candles.reserve(rows.size());
    for (const auto& row : rows) {
        json::append_if_increasing(candles, json::candle_from_row(json::require_array(row, "Binance kline row"), 5));
    }
    return candles;
}

std::string BinanceAdapter::stream_endpoint(const std::string& base, domain::Interval interval) const {
    return std::string(kStreamBase) + lower_ascii(format_symbol(base)) + "@kline_" + map_interval(interval);
}

// The stream name in the URL selects the channel.
std::optional<std::string> BinanceAdapter::build_subscribe_message(const std::string&, domain::Interval) const {
    return std::nullopt;
}

std::optional<std::string> BinanceAdapter::build_keep_alive_message() const {
    return std::nullopt;
}

std::chrono::milliseconds BinanceAdapter::keep_alive_interval() const {
    return std::chrono::milliseconds{0};
}

std::optional<domain::Candle> BinanceAdapter::parse_stream_message(std::string_view raw) const noexcept {
    auto frame = json::parse_frame(raw);
    if (!frame || !frame->is_object()) {
        return std::nullopt;
    }

    try {
        const auto& root = frame->get_object();
        const auto* event = root.if_contains("e");
        if (event == nullptr || !event->is_string() || event->get_string() != "kline") {
            return std::nullopt;
        }
        const auto* k = root.if_contains("k");
        if (k == nullptr || !k->is_object()) {
            return std::nullopt;
        }

        const auto& kObj = k->get_object();
        domain::Candle candle;
        candle.time = json::json_to_int64(json::require_field(kObj, "t"));
        candle.open = json::json_to_double(json::require_field(kObj, "o"));
        candle.high = json::json_to_double(json::require_field(kObj, "h"));
        candle.low = json::json_to_double(json::require_field(kObj, "l"));
        candle.close = json::json_to_double(json::require_field(kObj, "c"));
        candle.volume = json::json_to_double(json::require_field(kObj, "v"));
        return candle;
    }
    catch (const std::exception&) {
        return std::nullopt;
    }
}

}  // namespace adapters::binance
