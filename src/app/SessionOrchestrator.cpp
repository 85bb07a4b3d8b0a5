#include "app/SessionOrchestrator.h"

#include <stdexcept>
#include <utility>

#include "adapters/common/SymbolFormat.hpp"
#include "common/Metrics.hpp"
#include "domain/Errors.hpp"
#include "logging/Log.h"

namespace app {

namespace {

namespace metrics = tcs::common::metrics;

std::string normalizeSymbol(const std::string& raw) {
    const auto first = raw.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = raw.find_last_not_of(" \t\r\n");
    return adapters::upper_ascii(raw.substr(first, last - first + 1));
}

std::vector<domain::ExchangeId> exchangesOf(const std::vector<domain::TickerSnapshot>& tickers) {
    std::vector<domain::ExchangeId> ids;
    ids.reserve(tickers.size());
    for (const auto& ticker : tickers) {
        ids.push_back(ticker.exchange);
    }
    return ids;
}

}  // namespace

const char* to_string(SessionStatus status) {
    switch (status) {
    case SessionStatus::Idle:
        return "idle";
    case SessionStatus::Loading:
        return "loading";
    case SessionStatus::Ready:
        return "ready";
    case SessionStatus::Error:
        return "error";
    }
    return "unknown";
}

SessionOrchestrator::SessionOrchestrator(std::shared_ptr<infra::exchange::ExchangeGateway> gateway,
                                         std::shared_ptr<StreamManager> stream,
                                         std::size_t candleLimit,
                                         domain::Interval interval)
    : gateway_(std::move(gateway)),
      stream_(std::move(stream)),
      candleLimit_(candleLimit),
      defaultInterval_(interval),
      interval_(interval),
      series_(candleLimit) {
    if (!gateway_ || !stream_) {
        throw std::invalid_argument("SessionOrchestrator requires a gateway and a stream manager");
    }
    if (gateway_->adapters().empty()) {
        throw std::invalid_argument("SessionOrchestrator requires at least one exchange");
    }
    if (!interval_.valid()) {
        throw std::invalid_argument("SessionOrchestrator requires a valid interval");
    }
}

void SessionOrchestrator::set_callbacks(SessionCallbacks callbacks) {
    callbacks_ = std::move(callbacks);
}

CancellationToken SessionOrchestrator::begin_() {
    const auto token = tokens_.mint();
    stream_->teardown();
    return token;
}

bool SessionOrchestrator::isCurrent_(CancellationToken token, const char* stage) {
    if (tokens_.is_current(token)) {
        return true;
    }
    metrics::Registry::instance().incrementCounter(metrics::names::kStaleResultsDroppedTotal);
    const domain::CancellationObsolete obsolete(std::string(stage) + " result for token " + std::to_string(token) +
                                                " superseded by " + std::to_string(tokens_.current()));
    LOG_DEBUG(logging::LogCategory::SESSION, "Dropped: %s", obsolete.what());
    return false;
}

void SessionOrchestrator::search(const std::string& symbol, std::optional<domain::ExchangeId> forced) {
    const auto token = begin_();

    symbol_ = normalizeSymbol(symbol);
    interval_ = defaultInterval_;
    exchange_.reset();
    ticker_.reset();
    lastError_ = nullptr;
    series_.clear();
    indicators_.invalidateAll();
    publishAvailability_({});
    if (!tokens_.is_current(token)) {
        return;
    }

    if (symbol_.empty()) {
        fail_(std::make_exception_ptr(std::invalid_argument("Empty symbol")));
        return;
    }

    setStatus_(SessionStatus::Loading, symbol_);
    if (!tokens_.is_current(token)) {
        return;
    }

    const auto preferred = forced ? *forced : gateway_->priority().front();
    LOG_INFO(logging::LogCategory::SESSION,
             "Search %s on %s%s",
             symbol_.c_str(),
             domain::to_string(preferred),
             forced ? " (forced)" : "");

    const std::string sym = symbol_;
    gateway_->fetch_ticker(preferred, sym, [this, token, forced, sym](std::exception_ptr error,
                                                                      domain::TickerSnapshot ticker) {
        if (!isCurrent_(token, "ticker")) {
            return;
        }
        if (!error) {
            adoptTicker_(ticker);
            if (!tokens_.is_current(token)) {
                return;
            }
            publishAvailability_({ticker.exchange});
            if (!tokens_.is_current(token)) {
                return;
            }
            probeInBackground_(token, sym);
            loadCandles_(token);
            return;
        }
        if (forced) {
            fail_(error);
            return;
        }
        LOG_INFO(logging::LogCategory::SESSION,
                 "Fast path failed for %s (%s); probing all exchanges",
                 sym.c_str(),
                 domain::describe(error).c_str());
        probeFallback_(token, sym);
    });
}

void SessionOrchestrator::probeInBackground_(CancellationToken token, const std::string& symbol) {
    gateway_->fetch_available_tickers(symbol, [this, token](std::vector<domain::TickerSnapshot> tickers) {
        if (!isCurrent_(token, "availability")) {
            return;
        }
        if (tickers.empty()) {
            return;
        }
        publishAvailability_(exchangesOf(tickers));
    });
}

void SessionOrchestrator::probeFallback_(CancellationToken token, const std::string& symbol) {
    gateway_->fetch_available_tickers(symbol, [this, token, symbol](std::vector<domain::TickerSnapshot> tickers) {
        if (!isCurrent_(token, "fallback probe")) {
            return;
        }
        if (tickers.empty()) {
            fail_(std::make_exception_ptr(domain::SymbolNotFound(symbol)));
            return;
        }
        adoptTicker_(tickers.front());
        if (!tokens_.is_current(token)) {
            return;
        }
        publishAvailability_(exchangesOf(tickers));
        if (!tokens_.is_current(token)) {
            return;
        }
        loadCandles_(token);
    });
}

void SessionOrchestrator::change_interval(domain::Interval interval) {
    if (!interval.valid()) {
        throw std::invalid_argument("change_interval requires a valid interval");
    }
    if (!exchange_) {
        interval_ = interval;
        LOG_DEBUG(logging::LogCategory::SESSION, "Interval set to %s", domain::to_string(interval).c_str());
        return;
    }

    const auto token = begin_();
    lastError_ = nullptr;
    indicators_.invalidate(seriesId_());
    interval_ = interval;
    series_.clear();
    LOG_INFO(logging::LogCategory::SESSION,
             "Interval change to %s for %s",
             domain::to_string(interval).c_str(),
             symbol_.c_str());
    setStatus_(SessionStatus::Loading, symbol_);
    loadCandles_(token);
}

void SessionOrchestrator::switch_exchange(domain::ExchangeId exchange) {
    if (symbol_.empty()) {
        LOG_WARN(logging::LogCategory::SESSION,
                 "Exchange switch to %s ignored: no symbol loaded",
                 domain::to_string(exchange));
        return;
    }

    const auto token = begin_();
    lastError_ = nullptr;
    if (exchange_) {
        indicators_.invalidate(seriesId_());
    }
    series_.clear();
    LOG_INFO(logging::LogCategory::SESSION,
             "Exchange switch to %s for %s",
             domain::to_string(exchange),
             symbol_.c_str());
    setStatus_(SessionStatus::Loading, symbol_);

    gateway_->fetch_ticker(exchange, symbol_, [this, token](std::exception_ptr error, domain::TickerSnapshot ticker) {
        if (!isCurrent_(token, "ticker")) {
            return;
        }
        if (error) {
            fail_(error);
            return;
        }
        adoptTicker_(ticker);
        if (!tokens_.is_current(token)) {
            return;
        }
        loadCandles_(token);
    });
}

void SessionOrchestrator::reset() {
    begin_();
    symbol_.clear();
    exchange_.reset();
    ticker_.reset();
    lastError_ = nullptr;
    series_.clear();
    indicators_.invalidateAll();
    publishAvailability_({});
    setStatus_(SessionStatus::Idle);
}

void SessionOrchestrator::adoptTicker_(const domain::TickerSnapshot& ticker) {
    exchange_ = ticker.exchange;
    ticker_ = ticker;
    LOG_INFO(logging::LogCategory::SESSION,
             "%s on %s: last=%s change=%s%%",
             ticker.symbol.c_str(),
             domain::to_string(ticker.exchange),
             ticker.lastPrice.c_str(),
             ticker.priceChangePercent.c_str());
    if (callbacks_.onTicker) {
        callbacks_.onTicker(ticker);
    }
}

void SessionOrchestrator::publishAvailability_(std::vector<domain::ExchangeId> exchanges) {
    availability_ = std::move(exchanges);
    if (callbacks_.onAvailability) {
        callbacks_.onAvailability(availability_);
    }
}

void SessionOrchestrator::loadCandles_(CancellationToken token) {
    if (!exchange_) {
        return;
    }
    gateway_->fetch_candles(*exchange_, symbol_, interval_, candleLimit_,
                            [this, token](std::vector<domain::Candle> candles) {
                                if (!isCurrent_(token, "candles")) {
                                    return;
                                }
                                onCandles_(token, std::move(candles));
                            });
}

void SessionOrchestrator::onCandles_(CancellationToken token, std::vector<domain::Candle> candles) {
    series_.replace_all(candles);
    if (series_.empty()) {
        LOG_WARN(logging::LogCategory::DATA,
                 "No candles for %s %s on %s",
                 symbol_.c_str(),
                 domain::to_string(interval_).c_str(),
                 domain::to_string(*exchange_));
    }
    // Consumer callbacks may start a new operation; nothing is written for a superseded token.
    publishSeries_(token, false);
    if (!tokens_.is_current(token)) {
        return;
    }
    setStatus_(SessionStatus::Ready, symbol_);
    if (!tokens_.is_current(token)) {
        return;
    }

    try {
        stream_->subscribe(gateway_->adapter(*exchange_), symbol_, interval_,
                           [this, token](const domain::Candle& candle) { onStreamCandle_(token, candle); });
    }
    catch (const std::exception& ex) {
        LOG_WARN(logging::LogCategory::STREAM,
                 "Live updates unavailable for %s on %s: %s",
                 symbol_.c_str(),
                 domain::to_string(*exchange_),
                 ex.what());
    }
}

void SessionOrchestrator::onStreamCandle_(CancellationToken token, const domain::Candle& candle) {
    if (!isCurrent_(token, "stream")) {
        return;
    }
    if (series_.empty()) {
        return;
    }
    const auto outcome = series_.merge_one(candle);
    if (outcome == core::MergeOutcome::Stale) {
        LOG_TRACE(logging::LogCategory::STREAM, "Stale candle %lld ignored", candle.time);
        return;
    }
    publishSeries_(token, true);
}

void SessionOrchestrator::publishSeries_(CancellationToken token, bool live) {
    if (!exchange_) {
        return;
    }

    SeriesUpdate update;
    update.exchange = *exchange_;
    update.symbol = symbol_;
    update.interval = interval_;
    update.candles = series_.snapshot();
    update.live = live;

    update.indicators = indicators_.getOverlays(seriesId_(), *update.candles,
                                                indicators::SeriesVersion{token, series_.version()});

    if (callbacks_.onSeries) {
        callbacks_.onSeries(update);
    }
}

std::string SessionOrchestrator::seriesId_() const {
    const char* exchange = exchange_ ? domain::to_string(*exchange_) : "-";
    return std::string(exchange) + ":" + symbol_ + ":" + domain::to_string(interval_);
}

void SessionOrchestrator::fail_(std::exception_ptr error) {
    lastError_ = error;
    const std::string message = domain::describe(error);
    LOG_WARN(logging::LogCategory::SESSION, "Session failed for %s: %s", symbol_.c_str(), message.c_str());
    setStatus_(SessionStatus::Error, message);
}

void SessionOrchestrator::setStatus_(SessionStatus status, const std::string& message) {
    status_ = status;
    if (callbacks_.onStatus) {
        callbacks_.onStatus(status, message);
    }
}

}  // namespace app
