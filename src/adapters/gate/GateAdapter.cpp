#include "adapters/gate/GateAdapter.hpp"

#include <chrono>
#include <sstream>
#include <string>
#include <utility>

#include <boost/json.hpp>

#include "adapters/IntervalMap.hpp"
#include "adapters/common/JsonFields.hpp"
#include "adapters/common/SymbolFormat.hpp"
#include "domain/Errors.hpp"

namespace adapters::gate {

namespace {
constexpr const char* kRestBase = "https://api.gateio.ws/api/v4";
constexpr const char* kStreamUrl = "wss://api.gateio.ws/ws/v4/";
constexpr const char* kCandleChannel = "spot.candlesticks";
constexpr std::chrono::milliseconds kPingInterval{30'000};
constexpr domain::TimestampMs kMsPerSecond = 1000;

std::int64_t system_seconds() {
    using namespace std::chrono;
    return duration_cast<seconds>(system_clock::now().time_since_epoch()).count();
}
}  // namespace

GateAdapter::GateAdapter()
    : nowSeconds_(&system_seconds) {}

GateAdapter::GateAdapter(Clock nowSeconds)
    : nowSeconds_(nowSeconds ? std::move(nowSeconds) : Clock(&system_seconds)) {}

std::string GateAdapter::format_symbol(const std::string& base) const {
    return settlement_pair(base, "_");
}

std::string GateAdapter::map_interval(domain::Interval interval) const {
    return canonical_interval(interval);
}

std::string GateAdapter::build_snapshot_request(domain::SnapshotKind kind,
                                                const std::string& base,
                                                domain::Interval interval,
                                                std::size_t limit) const {
    std::ostringstream url;
    url << kRestBase;
    if (kind == domain::SnapshotKind::Ticker24h) {
        url << "/spot/tickers?currency_pair=" << format_symbol(base);
    }
    else {
        url << "/spot/candlesticks?currency_pair=" << format_symbol(base) << "&interval=" << map_interval(interval)
            << "&limit=" << limit;
    }
    return url.str();
}

domain::TickerSnapshot GateAdapter::parse_snapshot_ticker(const boost::json::value& payload) const {
    const auto& entries = json::require_array(payload, "Gate tickers");
    if (entries.empty()) {
        throw domain::MalformedResponse("Gate ticker list is empty");
    }
    const auto& t = json::require_object(entries.front(), "Gate ticker entry");

    const double last = json::json_to_double(json::require_field(t, "last"));
    const double pct = json::json_to_double(json::require_field(t, "change_percentage"));

    domain::TickerSnapshot ticker;
    ticker.symbol = strip_separator(json::json_to_text(json::require_field(t, "currency_pair")), '_');
    const double base = 1.0 + pct / 100.0;
    ticker.priceChange = base > 0.0 ? json::format_fixed(last - last / base, 2) : std::string("0");
    ticker.priceChangePercent = json::json_to_text(json::require_field(t, "change_percentage"));
    ticker.lastPrice = json::json_to_text(json::require_field(t, "last"));
    ticker.highPrice = json::json_to_text(json::require_field(t, "high_24h"));
    ticker.lowPrice = json::json_to_text(json::require_field(t, "low_24h"));
    ticker.volume = json::json_to_text(json::require_field(t, "quote_volume"));
    ticker.exchange = id();
    return ticker;
}

// Rows are [t_seconds, volume, close, high, low, open, ...].
std::vector<domain::Candle> GateAdapter::parse_snapshot_candles(const boost::json::value& payload) const {
    const auto& rows = json::require_array(payload, "Gate candlesticks");

    std::vector<domain::Candle> candles;
    candles.reserve(rows.size());
    for (const auto& rowValue : rows) {
        const auto& row = json::require_array(rowValue, "Gate candlestick row");
        if (row.size() < 6) {
            throw domain::MalformedResponse("Gate candlestick row too short");
        }
        domain::Candle candle;
        candle.time = json::json_to_int64(row[0]) * kMsPerSecond;
        candle.volume = json::json_to_double(row[1]);
        candle.close = json::json_to_double(row[2]);
        candle.high = json::json_to_double(row[3]);
        candle.low = json::json_to_double(row[4]);
        candle.open = json::json_to_double(row[5]);
        json::append_if_increasing(candles, candle);
    }
    return candles;
}

std::string GateAdapter::stream_endpoint(const std::string&, domain::Interval) const {
    return kStreamUrl;
}

std::optional<std::string> GateAdapter::build_subscribe_message(const std::string& base,
                                                                domain::Interval interval) const {
    boost::json::object msg;
    msg["time"] = nowSeconds_();
    msg["channel"] = kCandleChannel;
    msg["event"] = "subscribe";
    msg["payload"] = boost::json::array{boost::json::value(map_interval(interval)),
                                        boost::json::value(format_symbol(base))};
    return boost::json::serialize(msg);
}

std::optional<std::string> GateAdapter::build_keep_alive_message() const {
    boost::json::object msg;
    msg["time"] = nowSeconds_();
    msg["channel"] = "spot.pong";
    return boost::json::serialize(msg);
}

std::chrono::milliseconds GateAdapter::keep_alive_interval() const {
    return kPingInterval;
}

std::optional<domain::Candle> GateAdapter::parse_stream_message(std::string_view raw) const noexcept {
    auto frame = json::parse_frame(raw);
    if (!frame || !frame->is_object()) {
        return std::nullopt;
    }

    try {
        const auto& root = frame->get_object();
        const auto* event = root.if_contains("event");
        if (event == nullptr || !event->is_string() || event->get_string() != "update") {
            return std::nullopt;
        }
        const auto* result = root.if_contains("result");
        if (result == nullptr || !result->is_object()) {
            return std::nullopt;
        }

        const auto& k = result->get_object();
        domain::Candle candle;
        candle.time = json::json_to_int64(json::require_field(k, "t")) * kMsPerSecond;
        candle.open = json::json_to_double(json::require_field(k, "o"));
        candle.high = json::json_to_double(json::require_field(k, "h"));
        candle.low = json::json_to_double(json::require_field(k, "l"));
        candle.close = json::json_to_double(json::require_field(k, "c"));
        candle.volume = json::json_to_double(json::require_field(k, "v"));
        return candle;
    }
    catch (const std::exception&) {
        return std::nullopt;
    }
}

}  // namespace adapters::gate
