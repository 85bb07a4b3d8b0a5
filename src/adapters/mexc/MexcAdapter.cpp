#include "adapters/mexc/MexcAdapter.hpp"

#include <sstream>

#include <boost/json.hpp>

#include "adapters/IntervalMap.hpp"
#include "adapters/common/JsonFields.hpp"
#include "adapters/common/SymbolFormat.hpp"
#include "domain/Errors.hpp"

namespace adapters::mexc {

namespace {
constexpr const char* kRestBase = "https://api.mexc.com/api/v3";
constexpr const char* kStreamUrl = "wss://wbs.mexc.com/ws";
constexpr const char* kKlineChannelPrefix = "spot@public.kline";
constexpr std::chrono::milliseconds kPingInterval{30'000};
}  // namespace

std::string MexcAdapter::format_symbol(const std::string& base) const {
    return settlement_pair(base, "");
}

std::string MexcAdapter::map_interval(domain::Interval interval) const {
    return canonical_interval(interval);
}

std::string MexcAdapter::build_snapshot_request(domain::SnapshotKind kind,
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

domain::TickerSnapshot MexcAdapter::parse_snapshot_ticker(const boost::json::value& payload) const {
    const auto& obj = json::require_object(payload, "MEXC ticker");
    const auto* symbol = json::find_field(obj, "symbol");
    if (symbol == nullptr || (symbol->is_string() && symbol->get_string().empty())) {
        throw domain::MalformedResponse("MEXC ticker without symbol");
    }

    domain::TickerSnapshot ticker;
    ticker.symbol = json::json_to_text(*symbol);
    ticker.priceChange = json::json_to_text(json::require_field(obj, "priceChange"));
    ticker.priceChangePercent = json::json_to_text(json::require_field(obj, "priceChangePercent"));
    ticker.lastPrice = json::json_to_text(json::require_field(obj, "lastPrice"));
    ticker.highPrice = json::json_to_text(json::require_field(obj, "highPrice"));
    ticker.lowPrice = json::json_to_text(json::require_field(obj, "lowPrice"));
    ticker.volume = json::json_to_text(json::require_field(obj, "quoteVolume"));
    ticker.exchange = id();
    return ticker;
}

std::vector<domain::Candle> MexcAdapter::parse_snapshot_candles(const boost::json::value& payload) const {
    const auto& rows = json::require_array(payload, "MEXC klines");

    std::vector<domain::Candle> candles;
    candles.reserve(rows.size());
    for (const auto& row : rows) {
        json::append_if_increasing(candles, json::candle_from_row(json::require_array(row, "MEXC kline row"), 5));
    }
    return candles;
}

std::string MexcAdapter::stream_endpoint(const std::string&, domain::Interval) const {
    return kStreamUrl;
}

std::optional<std::string> MexcAdapter::build_subscribe_message(const std::string& base,
                                                                domain::Interval interval) const {
    boost::json::object msg;
    msg["method"] = "SUBSCRIPTION";
    msg["params"] = boost::json::array{boost::json::value(
        "spot@public.kline.v3.api@" + format_symbol(base) + "@" + mexc_stream_interval(interval))};
    return boost::json::serialize(msg);
}

std::optional<std::string> MexcAdapter::build_keep_alive_message() const {
    return std::string(R"({"method":"PING"})");
}

std::chrono::milliseconds MexcAdapter::keep_alive_interval() const {
    return kPingInterval;
}

std::optional<domain::Candle> MexcAdapter::parse_stream_message(std::string_view raw) const noexcept {
    auto frame = json::parse_frame(raw);
    if (!frame || !frame->is_object()) {
        return std::nullopt;
    }

    try {
        const auto& root = frame->get_object();
        const auto* channel = root.if_contains("c");
        if (channel == nullptr || !channel->is_string()) {
            return std::nullopt;
        }
        const std::string_view channelText(channel->get_string().data(), channel->get_string().size());
        if (channelText.rfind(kKlineChannelPrefix, 0) != 0) {
            return std::nullopt;
        }
        const auto* d = root.if_contains("d");
        if (d == nullptr || !d->is_object()) {
            return std::nullopt;
        }
        const auto* k = d->get_object().if_contains("k");
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

}  // namespace adapters::mexc
