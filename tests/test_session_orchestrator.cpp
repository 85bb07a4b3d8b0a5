#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <boost/asio/io_context.hpp>

#include "adapters/AdapterFactory.hpp"
#include "app/SessionOrchestrator.h"
#include "app/StreamManager.h"
#include "common/Metrics.hpp"
#include "domain/Errors.hpp"
#include "infra/exchange/ExchangeGateway.h"
#include "infra/http/SnapshotFetcher.hpp"
#include "support/FakeHttpClient.hpp"
#include "support/FakeWsConnection.hpp"

namespace metrics = tcs::common::metrics;
namespace iv = domain::intervals;
using domain::ExchangeId;

namespace {

constexpr const char* kBinanceTicker =
    R"({"symbol":"BTCUSDT","priceChange":"-12.5","priceChangePercent":"-0.42","lastPrice":"29500.1",)"
    R"("highPrice":"30000","lowPrice":"29000","volume":"10","quoteVolume":"295000000"})";
constexpr const char* kBinanceCandles =
    R"([[1000,"1","2","0.5","1.5","10",1999,"15"],[2000,"1.5","2.5","1","2","20",2999,"40"]])";
constexpr const char* kBybitTicker =
    R"({"retCode":0,"result":{"list":[{"symbol":"BTCUSDT","lastPrice":"100","prevPrice24h":"98.5",)"
    R"("price24hPcnt":"0.015","highPrice24h":"110","lowPrice24h":"90","turnover24h":"5000"}]}})";
constexpr const char* kBybitCandles15m =
    R"({"retCode":0,"result":{"list":[["3000","3","4","2","3.5","30","100"],["2000","2","3","1","2.5","20","50"]]}})";
constexpr const char* kBybitCandles1h =
    R"({"retCode":0,"result":{"list":[["7200000","5","6","4","5.5","10","1"],["3600000","4","5","3","4.5","10","1"]]}})";
constexpr const char* kOkxTicker =
    R"({"code":"0","data":[{"instId":"BTC-USDT","last":"100","open24h":"80","high24h":"110",)"
    R"("low24h":"70","volCcy24h":"999"}]})";
constexpr const char* kOkxCandles =
    R"({"code":"0","data":[["2000","2","3","1","2.5","20","55","0","1"],["1000","1","2","0.5","1.5","10","15","0","1"]]})";

std::string bybitFrame(long long start, const char* close) {
    return std::string(R"({"topic":"kline.60.BTCUSDT","data":[{"start":)") + std::to_string(start) +
           R"(,"open":"5","high":"9","low":"4","close":")" + close + R"(","volume":"1"}]})";
}

// One session wired to fakes; unrouted URLs fail both directly and through the relay.
struct Harness {
    boost::asio::io_context ioc;
    std::shared_ptr<test_support::FakeHttpClient> http = std::make_shared<test_support::FakeHttpClient>(ioc);
    std::shared_ptr<test_support::FakeWsFactory> ws = std::make_shared<test_support::FakeWsFactory>();
    std::shared_ptr<infra::exchange::ExchangeGateway> gateway;
    std::shared_ptr<app::StreamManager> stream;
    std::unique_ptr<app::SessionOrchestrator> session;

    std::vector<app::SessionStatus> statuses;
    std::vector<std::vector<ExchangeId>> availability;
    std::vector<app::SeriesUpdate> series;

    Harness() {
        const auto fetcher = std::make_shared<infra::http::SnapshotFetcher>(http);
        gateway = std::make_shared<infra::exchange::ExchangeGateway>(
            ioc, fetcher, adapters::make_adapters(adapters::resolve_priority({})));
        stream = std::make_shared<app::StreamManager>(ioc, ws);
        session = std::make_unique<app::SessionOrchestrator>(gateway, stream, 500, iv::k15m);

        app::SessionCallbacks callbacks;
        callbacks.onStatus = [this](app::SessionStatus status, const std::string&) { statuses.push_back(status); };
        callbacks.onAvailability = [this](const std::vector<ExchangeId>& ids) { availability.push_back(ids); };
        callbacks.onSeries = [this](const app::SeriesUpdate& update) { series.push_back(update); };
        session->set_callbacks(std::move(callbacks));
    }

    std::string tickerUrl(ExchangeId id) const {
        return gateway->adapter(id)->build_snapshot_request(domain::SnapshotKind::Ticker24h, "BTC", domain::Interval{}, 0);
    }

    std::string candlesUrl(ExchangeId id, domain::Interval interval) const {
        return gateway->adapter(id)->build_snapshot_request(domain::SnapshotKind::Candles, "BTC", interval, 500);
    }

    void drain() { test_support::drain(ioc); }
};

bool sameExchanges(const std::vector<ExchangeId>& actual, const std::vector<ExchangeId>& expected) {
    return actual == expected;
}

}  // namespace

int main() {
    // Fast path fails without a forced exchange: probe everything, first hit by priority wins.
    {
        Harness h;
        h.http->respond(h.tickerUrl(ExchangeId::Bybit), 200, kBybitTicker);
        h.http->respond(h.tickerUrl(ExchangeId::OKX), 200, kOkxTicker);
        h.http->respond(h.candlesUrl(ExchangeId::Bybit, iv::k15m), 200, kBybitCandles15m);

        h.session->search("  btc ");
        if (h.session->status() != app::SessionStatus::Loading || h.session->symbol() != "BTC") {
            std::cerr << "search must normalize the symbol and start loading\n";
            return 1;
        }
        h.drain();

        if (h.session->exchange() != ExchangeId::Bybit
            || !sameExchanges(h.session->availability(), {ExchangeId::Bybit, ExchangeId::OKX})) {
            std::cerr << "Fallback must adopt the first available exchange by priority\n";
            return 1;
        }
        if (h.session->status() != app::SessionStatus::Ready || h.session->series().size() != 2) {
            std::cerr << "Fallback must load candles from the adopted exchange\n";
            return 1;
        }
        if (h.http->count(h.tickerUrl(ExchangeId::Binance)) != 2) {
            std::cerr << "Binance ticker is fetched by the fast path and again by the probe\n";
            return 1;
        }
        const auto socket = h.ws->last();
        if (!socket || socket->url().find("bybit") == std::string::npos) {
            std::cerr << "Live stream must be opened on the adopted exchange\n";
            return 1;
        }
    }

    // A forced exchange surfaces its own failure and never probes.
    {
        Harness h;
        h.http->respond(h.tickerUrl(ExchangeId::OKX), 200, kOkxTicker);

        h.session->search("BTC", ExchangeId::Binance);
        h.drain();

        if (h.session->status() != app::SessionStatus::Error || h.session->exchange().has_value()) {
            std::cerr << "Forced exchange failure must end in the error state\n";
            return 1;
        }
        if (h.http->count(h.tickerUrl(ExchangeId::OKX)) != 0) {
            std::cerr << "A forced exchange must not fall back to other exchanges\n";
            return 1;
        }
        try {
            std::rethrow_exception(h.session->last_error());
        }
        catch (const domain::FetchUnavailable&) {
        }
        catch (const std::exception& ex) {
            std::cerr << "Unexpected error type: " << ex.what() << "\n";
            return 1;
        }
    }

    // Nothing lists the symbol.
    {
        Harness h;
        h.session->search("NOPE");
        h.drain();

        if (h.session->status() != app::SessionStatus::Error || !h.session->availability().empty()) {
            std::cerr << "An unknown symbol must end in the error state with no availability\n";
            return 1;
        }
        try {
            std::rethrow_exception(h.session->last_error());
        }
        catch (const domain::SymbolNotFound& ex) {
            if (ex.symbol() != "NOPE") {
                std::cerr << "SymbolNotFound must carry the symbol\n";
                return 1;
            }
        }
        catch (const std::exception& ex) {
            std::cerr << "Expected SymbolNotFound, got: " << ex.what() << "\n";
            return 1;
        }
        if (!h.ws->connections().empty()) {
            std::cerr << "No stream may be opened for an unknown symbol\n";
            return 1;
        }
    }

    // Empty symbol.
    {
        Harness h;
        h.session->search("   ");
        if (h.session->status() != app::SessionStatus::Error || !h.http->requests().empty()) {
            std::cerr << "An empty symbol must fail without any request\n";
            return 1;
        }
    }

    // Fast path: ready from the preferred exchange, availability widened in the background.
    {
        Harness h;
        h.http->respond(h.tickerUrl(ExchangeId::Binance), 200, kBinanceTicker);
        h.http->respond(h.tickerUrl(ExchangeId::Bybit), 200, kBybitTicker);
        h.http->respond(h.candlesUrl(ExchangeId::Binance, iv::k15m), 200, kBinanceCandles);

        h.session->search("BTC");
        h.drain();

        if (h.session->exchange() != ExchangeId::Binance || h.session->status() != app::SessionStatus::Ready) {
            std::cerr << "Fast path must settle on the preferred exchange\n";
            return 1;
        }
        if (h.availability.size() != 3 || !sameExchanges(h.availability[1], {ExchangeId::Binance})
            || !sameExchanges(h.availability[2], {ExchangeId::Binance, ExchangeId::Bybit})) {
            std::cerr << "Availability must start with the preferred exchange then widen\n";
            return 1;
        }
        if (h.series.empty() || h.series.back().live || !h.series.back().indicators
            || h.series.back().candles->size() != 2) {
            std::cerr << "History load must publish candles with overlays\n";
            return 1;
        }
        if (!h.session->ticker() || h.session->ticker()->lastPrice != "29500.1") {
            std::cerr << "Adopted ticker must be kept on the session\n";
            return 1;
        }
    }

    // A slow 15m load finishing after a switch to 1h is dropped.
    {
        Harness h;
        h.http->respond(h.tickerUrl(ExchangeId::Bybit), 200, kBybitTicker);
        h.http->respond(h.candlesUrl(ExchangeId::Bybit, iv::k15m), 200, kBybitCandles15m);
        h.http->respond(h.candlesUrl(ExchangeId::Bybit, iv::k1h), 200, kBybitCandles1h);
        h.http->hold(h.candlesUrl(ExchangeId::Bybit, iv::k15m));

        h.session->search("BTC", ExchangeId::Bybit);
        h.drain();
        if (h.session->status() != app::SessionStatus::Loading || !h.series.empty()) {
            std::cerr << "Held candles must keep the session loading\n";
            return 1;
        }

        h.session->change_interval(iv::k1h);
        h.drain();
        const auto staleBefore = metrics::Registry::instance().counterValue(metrics::names::kStaleResultsDroppedTotal);
        h.http->release(h.candlesUrl(ExchangeId::Bybit, iv::k15m));
        h.drain();

        if (metrics::Registry::instance().counterValue(metrics::names::kStaleResultsDroppedTotal) != staleBefore + 1) {
            std::cerr << "Late 15m candles must be counted as a stale result\n";
            return 1;
        }
        const auto snapshot = h.session->series().snapshot();
        if (h.session->interval() != iv::k1h || snapshot->size() != 2 || snapshot->front().time != 3600000
            || snapshot->back().time != 7200000) {
            std::cerr << "Series must hold the 1h candles only\n";
            return 1;
        }
        if (h.series.size() != 1 || h.series.back().interval != iv::k1h) {
            std::cerr << "Only the 1h load may be published\n";
            return 1;
        }

        // Live updates replace or append; older candles are ignored.
        const auto socket = h.ws->last();
        if (!socket || h.ws->connections().size() != 1) {
            std::cerr << "Exactly one stream expected after the interval change\n";
            return 1;
        }
        socket->simulate_open();
        socket->simulate_message(bybitFrame(7200000, "9"));
        socket->simulate_message(bybitFrame(10800000, "6"));
        socket->simulate_message(bybitFrame(3600000, "1"));
        if (h.series.size() != 3 || !h.series.back().live) {
            std::cerr << "Replace and append must republish; stale candles must not\n";
            return 1;
        }
        const auto live = h.session->series().snapshot();
        if (live->size() != 3 || (*live)[1].close != 9.0 || live->back().time != 10800000) {
            std::cerr << "Streamed candles must merge into the series\n";
            return 1;
        }

        // Switching exchange keeps the symbol and reloads from the new venue.
        h.http->respond(h.tickerUrl(ExchangeId::OKX), 200, kOkxTicker);
        h.http->respond(h.candlesUrl(ExchangeId::OKX, iv::k1h), 200, kOkxCandles);
        h.session->switch_exchange(ExchangeId::OKX);
        if (socket->close_calls() != 1) {
            std::cerr << "Switching exchange must tear down the old stream\n";
            return 1;
        }
        h.drain();
        if (h.session->exchange() != ExchangeId::OKX || h.session->status() != app::SessionStatus::Ready
            || h.session->series().size() != 2) {
            std::cerr << "Exchange switch must load the new exchange's candles\n";
            return 1;
        }

        h.session->switch_exchange(ExchangeId::Gate);
        h.drain();
        if (h.session->status() != app::SessionStatus::Error || !h.session->last_error()) {
            std::cerr << "A failing exchange switch must surface the error\n";
            return 1;
        }

        h.session->reset();
        if (h.session->status() != app::SessionStatus::Idle || !h.session->symbol().empty()
            || !h.session->series().empty() || h.stream->has_subscription()) {
            std::cerr << "reset must return to an idle session without a stream\n";
            return 1;
        }
    }

    // A consumer resetting the session from inside onSeries wins over the load that published.
    {
        Harness h;
        h.http->respond(h.tickerUrl(ExchangeId::Bybit), 200, kBybitTicker);
        h.http->respond(h.candlesUrl(ExchangeId::Bybit, iv::k15m), 200, kBybitCandles15m);

        std::vector<app::SessionStatus> statuses;
        app::SessionCallbacks callbacks;
        callbacks.onStatus = [&statuses](app::SessionStatus status, const std::string&) { statuses.push_back(status); };
        callbacks.onSeries = [&h](const app::SeriesUpdate&) { h.session->reset(); };
        h.session->set_callbacks(std::move(callbacks));

        h.session->search("BTC", ExchangeId::Bybit);
        h.drain();

        if (h.session->status() != app::SessionStatus::Idle || statuses.empty()
            || statuses.back() != app::SessionStatus::Idle) {
            std::cerr << "A reset from onSeries must leave the session idle\n";
            return 1;
        }
        if (!h.ws->connections().empty() || h.stream->has_subscription()) {
            std::cerr << "A reset from onSeries must prevent the live subscription\n";
            return 1;
        }
    }

    // Same from onTicker on the fast path: availability stays cleared, no candles are requested.
    {
        Harness h;
        h.http->respond(h.tickerUrl(ExchangeId::Binance), 200, kBinanceTicker);
        h.http->respond(h.candlesUrl(ExchangeId::Binance, iv::k15m), 200, kBinanceCandles);

        std::vector<std::vector<ExchangeId>> published;
        app::SessionCallbacks callbacks;
        callbacks.onAvailability = [&published](const std::vector<ExchangeId>& ids) { published.push_back(ids); };
        callbacks.onTicker = [&h](const domain::TickerSnapshot&) { h.session->reset(); };
        h.session->set_callbacks(std::move(callbacks));

        h.session->search("BTC");
        h.drain();

        if (h.session->status() != app::SessionStatus::Idle || !h.session->availability().empty()
            || published.empty() || !published.back().empty()) {
            std::cerr << "A reset from onTicker must keep availability empty\n";
            return 1;
        }
        if (h.http->count(h.candlesUrl(ExchangeId::Binance, iv::k15m)) != 0) {
            std::cerr << "A reset from onTicker must stop the candle load\n";
            return 1;
        }
    }

    // Every search starts over at the session's configured interval.
    {
        Harness h;
        h.http->respond(h.tickerUrl(ExchangeId::Bybit), 200, kBybitTicker);
        h.http->respond(h.candlesUrl(ExchangeId::Bybit, iv::k15m), 200, kBybitCandles15m);
        h.http->respond(h.candlesUrl(ExchangeId::Bybit, iv::k1h), 200, kBybitCandles1h);

        h.session->search("BTC", ExchangeId::Bybit);
        h.drain();
        h.session->change_interval(iv::k1h);
        h.drain();
        h.session->search("BTC", ExchangeId::Bybit);
        h.drain();

        if (h.session->interval() != iv::k15m || h.series.empty() || h.series.back().interval != iv::k15m) {
            std::cerr << "A new search must reload at the configured interval\n";
            return 1;
        }
    }

    // Without a symbol, exchange switches are ignored and interval changes only record.
    {
        Harness h;
        h.session->switch_exchange(ExchangeId::OKX);
        h.session->change_interval(iv::k4h);
        if (!h.http->requests().empty() || h.session->interval() != iv::k4h
            || h.session->status() != app::SessionStatus::Idle) {
            std::cerr << "An idle session must not fetch on switch or interval change\n";
            return 1;
        }
    }

    std::cout << "session orchestrator tests passed\n";
    return 0;
}
