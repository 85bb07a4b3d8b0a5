#include "adapters/AdapterFactory.hpp"
#include "app/SessionOrchestrator.h"
#include "app/StreamManager.h"
#include "common/Metrics.hpp"
#include "config/ConfigProvider.h"
#include "domain/Errors.hpp"
#include "domain/Types.h"
#include "indicators/IndicatorEngine.h"
#include "infra/exchange/ExchangeGateway.h"
#include "infra/http/SnapshotFetcher.hpp"
#include "infra/http/TlsHttpClient.hpp"
#include "infra/net/WebSocketClient.h"
#include "logging/Log.h"

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/steady_timer.hpp>

#include <chrono>
#include <csignal>
#include <cstdio>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

namespace bootstrap {
namespace {

void printVersion() {
#ifdef PROJECT_NAME
    std::printf("%s\n", PROJECT_NAME);
#else
    std::printf("candlescope\n");
#endif
}

std::string formatValue(const indicators::Value& value) {
    if (!value) {
        return "-";
    }
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%.4f", *value);
    return buffer;
}

template <typename Series>
indicators::Value lastOf(const Series& values) {
    return values.empty() ? indicators::Value{} : values.back();
}

void logSeries(const app::SeriesUpdate& update) {
    if (!update.candles || update.candles->empty()) {
        LOG_INFO(logging::LogCategory::DATA,
                 "%s %s on %s: no candles yet",
                 update.symbol.c_str(),
                 domain::to_string(update.interval).c_str(),
                 domain::to_string(update.exchange));
        return;
    }

    const auto& candles = *update.candles;
    const auto& last = candles.back();
    const auto stats = indicators::IndicatorEngine::candleStats(candles, candles.size() - 1);
    const config::LogLevel level = update.live ? config::LogLevel::Debug : config::LogLevel::Info;

    logging::Log::log(level,
                      logging::LogCategory::DATA,
                      "%s %s on %s: %zu candles, last t=%lld o=%.8g h=%.8g l=%.8g c=%.8g v=%.8g chg=%.2f%% amp=%.2f%%",
                      update.symbol.c_str(),
                      domain::to_string(update.interval).c_str(),
                      domain::to_string(update.exchange),
                      candles.size(),
                      last.time,
                      last.open,
                      last.high,
                      last.low,
                      last.close,
                      last.volume,
                      stats ? stats->changePercent : 0.0,
                      stats ? stats->amplitudePercent : 0.0);

    if (!update.indicators) {
        return;
    }
    const auto& ind = *update.indicators;
    logging::Log::log(level,
                      logging::LogCategory::INDICATOR,
                      "EMA7=%s EMA25=%s EMA99=%s RSI14=%s K=%s D=%s J=%s SAR=%s trend=%s",
                      formatValue(lastOf(ind.ema7.values)).c_str(),
                      formatValue(lastOf(ind.ema25.values)).c_str(),
                      formatValue(lastOf(ind.ema99.values)).c_str(),
                      formatValue(lastOf(ind.rsi14.values)).c_str(),
                      formatValue(lastOf(ind.kdj9.k)).c_str(),
                      formatValue(lastOf(ind.kdj9.d)).c_str(),
                      formatValue(lastOf(ind.kdj9.j)).c_str(),
                      formatValue(lastOf(ind.sar.values)).c_str(),
                      ind.trend ? indicators::to_string(*ind.trend) : "-");
}

}  // namespace

int run(int argc, char** argv) {
    config::ConfigProvider provider(argc, argv);
    const config::Config& config = provider.get();

    if (config.showHelp) {
        config::ConfigProvider::printUsage(argc > 0 ? argv[0] : nullptr);
        return 0;
    }

    if (config.showVersion) {
        printVersion();
        return 0;
    }

    logging::Log::set_log_level(config.logLevel);

    domain::Interval interval;
    try {
        interval = domain::interval_from_string(config.interval);
    }
    catch (const std::invalid_argument& ex) {
        LOG_ERROR(logging::LogCategory::CONFIG, "Invalid interval '%s': %s", config.interval.c_str(), ex.what());
        return 2;
    }

    std::optional<domain::ExchangeId> forced;
    if (!config.exchange.empty()) {
        forced = domain::exchange_from_string(config.exchange);
        if (!forced) {
            LOG_ERROR(logging::LogCategory::CONFIG, "Unknown exchange '%s'", config.exchange.c_str());
            return 2;
        }
    }

    const auto priority = adapters::resolve_priority(config::ConfigProvider::splitList(config.exchangePriority));

    LOG_INFO(logging::LogCategory::CONFIG,
             "Startup symbol=%s interval=%s exchange=%s candles=%zu level=%s",
             config.symbol.c_str(),
             domain::to_string(interval).c_str(),
             forced ? domain::to_string(*forced) : "auto",
             config.candleLimit,
             config::ConfigProvider::logLevelToString(config.logLevel).c_str());

    boost::asio::io_context ioc;

    auto httpClient = std::make_shared<infra::http::TlsHttpClient>(ioc, config.httpTimeoutSec);
    auto fetcher = std::make_shared<infra::http::SnapshotFetcher>(httpClient, config.relayUrl);
    LOG_DEBUG(logging::LogCategory::CONFIG, "Relay prefix %s", fetcher->relay_prefix().c_str());
    auto gateway = std::make_shared<infra::exchange::ExchangeGateway>(ioc, fetcher, adapters::make_adapters(priority));
    auto stream = std::make_shared<app::StreamManager>(ioc, std::make_shared<infra::net::WebSocketClientFactory>(ioc));
    auto session = std::make_shared<app::SessionOrchestrator>(gateway, stream, config.candleLimit, interval);

    int exitCode = 0;

    app::SessionCallbacks callbacks;
    callbacks.onTicker = [](const domain::TickerSnapshot& ticker) {
        LOG_INFO(logging::LogCategory::DATA,
                 "Ticker %s [%s] last=%s change=%s (%s%%) high=%s low=%s vol=%s",
                 ticker.symbol.c_str(),
                 domain::to_string(ticker.exchange),
                 ticker.lastPrice.c_str(),
                 ticker.priceChange.c_str(),
                 ticker.priceChangePercent.c_str(),
                 ticker.highPrice.c_str(),
                 ticker.lowPrice.c_str(),
                 ticker.volume.c_str());
    };
    callbacks.onAvailability = [](const std::vector<domain::ExchangeId>& exchanges) {
        if (exchanges.empty()) {
            return;
        }
        std::string names;
        for (const auto id : exchanges) {
            if (!names.empty()) {
                names += ", ";
            }
            names += domain::to_string(id);
        }
        LOG_INFO(logging::LogCategory::SESSION, "Available on: %s", names.c_str());
    };
    callbacks.onSeries = [](const app::SeriesUpdate& update) { logSeries(update); };
    callbacks.onStatus = [&exitCode, &ioc](app::SessionStatus status, const std::string& message) {
        LOG_DEBUG(logging::LogCategory::SESSION, "Status %s %s", app::to_string(status), message.c_str());
        if (status == app::SessionStatus::Error) {
            LOG_ERROR(logging::LogCategory::SESSION, "%s", message.c_str());
            exitCode = 1;
            ioc.stop();
        }
    };
    session->set_callbacks(std::move(callbacks));

    boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code& ec, int signo) {
        if (ec) {
            return;
        }
        LOG_INFO(logging::LogCategory::SESSION, "Signal %d received, shutting down", signo);
        session->reset();
        ioc.stop();
    });

    boost::asio::steady_timer deadline(ioc);
    if (config.runSeconds > 0) {
        deadline.expires_after(std::chrono::seconds(config.runSeconds));
        deadline.async_wait([&](const boost::system::error_code& ec) {
            if (ec) {
                return;
            }
            LOG_INFO(logging::LogCategory::SESSION, "Run time of %d s elapsed", config.runSeconds);
            session->reset();
            ioc.stop();
        });
    }

    session->search(config.symbol, forced);
    ioc.run();

    stream->teardown();
    LOG_INFO(logging::LogCategory::SESSION, "Metrics: %s",
             tcs::common::metrics::Registry::instance().summary().c_str());
    return exitCode;
}

}  // namespace bootstrap

int main(int argc, char** argv) {
    return bootstrap::run(argc, argv);
}
