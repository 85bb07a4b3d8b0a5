#include "adapters/bybit/BybitAdapter.hpp"

#include <sstream>

#include <boost/json.hpp>

#include "adapters/IntervalMap.hpp"
#include "adapters/common/JsonFields.hpp"
#include "adapters/common/SymbolFormat.hpp"
#include "domain/Errors.hpp"

namespace adapters::bybit {

namespace {
constexpr const char* kRestBase = "https://api.bybit.com/v5/market";
constexpr const char* kStreamUrl = "wss://stream.bybit.com/v5/public/spot";
constexpr std::chrono::milliseconds kPingInterval{20'000};

const boost::json::array& result_list(const boost::json::value& payload) {
    const auto& root = json::require_object(payload, "Bybit response");
    const auto& result = json::require_object(json::require_field(root, "result"), "Bybit result");
    return json::require_array(json::require_field(result, "list"), "Bybit result.list");
}
}  // namespace

std::string BybitAdapter::format_symbol(const std::string& base) const {
    return settlement_pair(base, "");
}

std::string BybitAdapter::map_interval(domain::Interval interval) const {
    return bybit_interval(interval);
}

std::string BybitAdapter::build_snapshot_request(domain::SnapshotKind kind,
                                                 const std::string& base,
                                                 domain::Interval interval,
                                                 std::size_t limit) const {
    std::ostringstream url;
    url << kRestBase;
    if (kind == domain::SnapshotKind::Ticker24h) {
        url << "/tickers?category=spot&symbol=" << format_symbol(base);
    }
    else {
        url << "/kline?category=spot&symbol=" << format_symbol(base) << "&interval=" << map_interval(interval)
            << "&limit=" << limit;
    }
    return url.str();
}

domain::TickerSnapshot BybitAdapter::parse_snapshot_ticker(const boost::json::value& payload) const {
    const auto& root = json::require_object(payload, "Bybit ticker");
    if (json::json_to_int64(json::require_field(root, "retCode")) != 0) {
        throw domain::MalformedResponse("Bybit ticker retCode is not 0");
    }
    const auto& list = result_list(payload);
    if (list.empty()) {
        throw domain::MalformedResponse("Bybit ticker list is empty");
    }
    const auto& t = json::require_object(list.front(), "Bybit ticker entry");

    const double lastPrice = json::json_to_double(json::require_field(t, "lastPrice"));
    const double pct = json::json_to_double(json::require_field(t, "price24hPcnt"));

    domain::TickerSnapshot ticker;
    ticker.symbol = json::json_to_text(json::require_field(t, "symbol"));
    if (const auto* prev = json::find_field(t, "prevPrice24h")) {
        ticker.priceChange = json::format_number(lastPrice - json::json_to_double(*prev));
    }
    else {
        ticker.priceChange = "0";
    }
    ticker.priceChangePercent = json::format_fixed(pct * 100.0, 2);
    ticker.lastPrice = json::json_to_text(json::require_field(t, "lastPrice"));
    ticker.highPrice = json::json_to_text(json::require_field(t, "highPrice24h"));
    ticker.lowPrice = json::json_to_text(json::require_field(t, "lowPrice24h"));
    ticker.volume = json::json_to_text(json::require_field(t, "turnover24h"));
    ticker.exchange = id();
    return ticker;
}

// Bybit lists newest first.
std::vector<domain::Candle> BybitAdapter::parse_snapshot_candles(const boost::json::value& payload) const {
    const auto& list = result_list(payload);

    std::vector<domain::Candle> candles;
    candles.reserve(list.size());
    for (auto it = list.rbegin(); it != list.rend(); ++it) {
        json::append_if_increasing(candles, json::candle_from_row(json::require_array(*it, "Bybit kline row"), 5));
    }
    return candles;
}

std::string BybitAdapter::stream_endpoint(const std::string&, domain::Interval) const {
    return kStreamUrl;
}

std::optional<std::string> BybitAdapter::build_subscribe_message(const std::string& base,
                                                                 domain::Interval interval) const {
    boost::json::object msg;
    msg["op"] = "subscribe";
    msg["args"] = boost::json::array{boost::json::value("kline." + map_interval(interval) + "." + format_symbol(base))};
    return boost::json::serialize(msg);
}

std::optional<std::string> BybitAdapter::build_keep_alive_message() const {
    return std::string(R"({"op":"ping"})");
}

std::chrono::milliseconds BybitAdapter::keep_alive_interval() const {
    return kPingInterval;
}

std::optional<domain::Candle> BybitAdapter::parse_stream_message(std::string_view raw) const noexcept {
    auto frame = json::parse_frame(raw);
    if (!frame || !frame->is_object()) {
        return std::nullopt;
    }

    try {
        const auto& root = frame->get_object();
        const auto* topic = root.if_contains("topic");
        if (topic == nullptr || !topic->is_string()) {
            return std::nullopt;
        }
        const std::string_view topicText(topic->get_string().data(), topic->get_string().size());
        if (topicText.rfind("kline", 0) != 0) {
            return std::nullopt;
        }
        const auto* data = root.if_contains("data");
        if (data == nullptr || !data->is_array() || data->get_array().empty()
            || !data->get_array().front().is_object()) {
            return std::nullopt;
        }

        const auto& k = data->get_array().front().get_object();
        domain::Candle candle;
        candle.time = json::json_to_int64(json::require_field(k, "start"));
        candle.open = json::json_to_double(json::require_field(k, "open"));
        candle.high = json::json_to_double(json::require_field(k, "high"));
        candle.low = json::json_to_double(json::require_field(k, "low"));
        candle.close = json::json_to_double(json::require_field(k, "close"));
        candle.volume = json::json_to_double(json::require_field(k, "volume"));
        return candle;
    }
    catch (const std::exception&) {
        return std::nullopt;
    }
}

}  // namespace adapters::bybit
