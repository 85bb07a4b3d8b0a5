#include "adapters/okx/OkxAdapter.hpp"

#include <sstream>
#include <string>

#include <boost/json.hpp>

#include "adapters/IntervalMap.hpp"
#include "adapters/common/JsonFields.hpp"
#include "adapters/common/SymbolFormat.hpp"
#include "domain/Errors.hpp"

namespace adapters::okx {

namespace {
constexpr const char* kRestBase = "https://www.okx.com/api/v5/market";
constexpr const char* kStreamUrl = "wss://ws.okx.com:8443/ws/v5/public";
constexpr std::chrono::milliseconds kPingInterval{20'000};
// Candle rows are [ts, o, h, l, c, vol, volCcy, ...]; volCcy is the quote volume.
constexpr std::size_t kQuoteVolumeIndex = 6;

const boost::json::array& data_array(const boost::json::value& payload) {
    const auto& root = json::require_object(payload, "OKX response");
    return json::require_array(json::require_field(root, "data"), "OKX data");
}
}  // namespace

std::string OkxAdapter::format_symbol(const std::string& base) const {
    return settlement_pair(base, "-");
}

std::string OkxAdapter::map_interval(domain::Interval interval) const {
    return okx_interval(interval);
}

std::string OkxAdapter::build_snapshot_request(domain::SnapshotKind kind,
                                               const std::string& base,
                                               domain::Interval interval,
                                               std::size_t limit) const {
    std::ostringstream url;
    url << kRestBase;
    if (kind == domain::SnapshotKind::Ticker24h) {
        url << "/ticker?instId=" << format_symbol(base);
    }
    else {
        url << "/candles?instId=" << format_symbol(base) << "&bar=" << map_interval(interval)
            << "&limit=" << limit;
    }
    return url.str();
}

domain::TickerSnapshot OkxAdapter::parse_snapshot_ticker(const boost::json::value& payload) const {
    const auto& root = json::require_object(payload, "OKX ticker");
    if (json::json_to_text(json::require_field(root, "code")) != "0") {
        throw domain::MalformedResponse("OKX ticker code is not \"0\"");
    }
    const auto& data = data_array(payload);
    if (data.empty()) {
        throw domain::MalformedResponse("OKX ticker data is empty");
    }
    const auto& t = json::require_object(data.front(), "OKX ticker entry");

    const double last = json::json_to_double(json::require_field(t, "last"));
    const double open24h = json::json_to_double(json::require_field(t, "open24h"));
    const double change = last - open24h;

    domain::TickerSnapshot ticker;
    ticker.symbol = strip_separator(json::json_to_text(json::require_field(t, "instId")), '-');
    ticker.priceChange = json::format_number(change);
    ticker.priceChangePercent = open24h != 0.0 ? json::format_fixed(change / open24h * 100.0, 2) : std::string("0");
    ticker.lastPrice = json::json_to_text(json::require_field(t, "last"));
    ticker.highPrice = json::json_to_text(json::require_field(t, "high24h"));
    ticker.lowPrice = json::json_to_text(json::require_field(t, "low24h"));
    ticker.volume = json::json_to_text(json::require_field(t, "volCcy24h"));
    ticker.exchange = id();
    return ticker;
}

// OKX lists newest first.
std::vector<domain::Candle> OkxAdapter::parse_snapshot_candles(const boost::json::value& payload) const {
    const auto& data = data_array(payload);

    std::vector<domain::Candle> candles;
    candles.reserve(data.size());
    for (auto it = data.rbegin(); it != data.rend(); ++it) {
        json::append_if_increasing(
            candles, json::candle_from_row(json::require_array(*it, "OKX candle row"), kQuoteVolumeIndex));
    }
    return candles;
}

std::string OkxAdapter::stream_endpoint(const std::string&, domain::Interval) const {
    return kStreamUrl;
}

std::optional<std::string> OkxAdapter::build_subscribe_message(const std::string& base,
                                                               domain::Interval interval) const {
    boost::json::object arg;
    arg["channel"] = "candle" + map_interval(interval);
    arg["instId"] = format_symbol(base);

    boost::json::object msg;
    msg["op"] = "subscribe";
    msg["args"] = boost::json::array{boost::json::value(std::move(arg))};
    return boost::json::serialize(msg);
}

// OKX expects the bare text "ping", not a JSON document.
std::optional<std::string> OkxAdapter::build_keep_alive_message() const {
    return std::string("ping");
}

std::chrono::milliseconds OkxAdapter::keep_alive_interval() const {
    return kPingInterval;
}

std::optional<domain::Candle> OkxAdapter::parse_stream_message(std::string_view raw) const noexcept {
    if (raw == "pong") {
        return std::nullopt;
    }
    auto frame = json::parse_frame(raw);
    if (!frame || !frame->is_object()) {
        return std::nullopt;
    }

    try {
        const auto* data = frame->get_object().if_contains("data");
        if (data == nullptr || !data->is_array() || data->get_array().empty()) {
            return std::nullopt;
        }

        const auto& first = data->get_array().front();
        if (first.is_array()) {
            return json::candle_from_row(first.get_array(), kQuoteVolumeIndex);
        }
        if (!first.is_object()) {
            return std::nullopt;
        }

        const auto& k = first.get_object();
        domain::Candle candle;
        candle.time = json::json_to_int64(json::require_field(k, "ts"));
        candle.open = json::json_to_double(json::require_field(k, "o"));
        candle.high = json::json_to_double(json::require_field(k, "h"));
        candle.low = json::json_to_double(json::require_field(k, "l"));
        candle.close = json::json_to_double(json::require_field(k, "c"));
        candle.volume = json::json_to_double(json::require_field(k, "volCcy"));
        return candle;
    }
    catch (const std::exception&) {
        return std::nullopt;
    }
}

}  // namespace adapters::okx
