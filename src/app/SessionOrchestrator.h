#pragma once

#include <cstddef>
#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "app/CancellationToken.h"
#include "app/StreamManager.h"
#include "core/CandleSeries.h"
#include "domain/Types.h"
#include "indicators/IndicatorCoordinator.h"
#include "infra/exchange/ExchangeGateway.h"

namespace app {

enum class SessionStatus { Idle, Loading, Ready, Error };

const char* to_string(SessionStatus status);

struct SeriesUpdate {
    domain::ExchangeId exchange = domain::ExchangeId::Binance;
    std::string symbol;
    domain::Interval interval;
    std::shared_ptr<const std::vector<domain::Candle>> candles;
    std::shared_ptr<const indicators::IndicatorSet> indicators;
    // True when produced by a streamed candle rather than a history load.
    bool live = false;
};

struct SessionCallbacks {
    std::function<void(const domain::TickerSnapshot&)> onTicker;
    std::function<void(const std::vector<domain::ExchangeId>&)> onAvailability;
    std::function<void(const SeriesUpdate&)> onSeries;
    std::function<void(SessionStatus, const std::string&)> onStatus;
};

// Drives one viewing session (symbol, interval, exchange). Must be used from
// the thread running the io_context the gateway and stream manager share.
class SessionOrchestrator {
public:
    SessionOrchestrator(std::shared_ptr<infra::exchange::ExchangeGateway> gateway,
                        std::shared_ptr<StreamManager> stream,
                        std::size_t candleLimit = core::CandleSeries::kDefaultCap,
                        domain::Interval interval = domain::kDefaultInterval);

    void set_callbacks(SessionCallbacks callbacks);

    // Starts over at the construction-time interval. A forced exchange
    // disables fallback; its failure is surfaced as is.
    void search(const std::string& symbol, std::optional<domain::ExchangeId> forced = std::nullopt);
    void change_interval(domain::Interval interval);
    void switch_exchange(domain::ExchangeId exchange);
    void reset();

    const std::string& symbol() const { return symbol_; }
    domain::Interval interval() const { return interval_; }
    std::optional<domain::ExchangeId> exchange() const { return exchange_; }
    const std::optional<domain::TickerSnapshot>& ticker() const { return ticker_; }
    const std::vector<domain::ExchangeId>& availability() const { return availability_; }
    SessionStatus status() const { return status_; }
    const core::CandleSeries& series() const { return series_; }
    std::exception_ptr last_error() const { return lastError_; }

private:
    CancellationToken begin_();
    bool isCurrent_(CancellationToken token, const char* stage);

    void adoptTicker_(const domain::TickerSnapshot& ticker);
    void publishAvailability_(std::vector<domain::ExchangeId> exchanges);
    void probeInBackground_(CancellationToken token, const std::string& symbol);
    void probeFallback_(CancellationToken token, const std::string& symbol);
    void loadCandles_(CancellationToken token);
    void onCandles_(CancellationToken token, std::vector<domain::Candle> candles);
    void onStreamCandle_(CancellationToken token, const domain::Candle& candle);
    void publishSeries_(CancellationToken token, bool live);
    // "Exchange:SYMBOL:interval", the overlay cache key.
    std::string seriesId_() const;
    void fail_(std::exception_ptr error);
    void setStatus_(SessionStatus status, const std::string& message = {});

    std::shared_ptr<infra::exchange::ExchangeGateway> gateway_;
    std::shared_ptr<StreamManager> stream_;
    std::size_t candleLimit_;
    domain::Interval defaultInterval_;
    SessionCallbacks callbacks_;

    CancellationSource tokens_;
    std::string symbol_;
    domain::Interval interval_;
    std::optional<domain::ExchangeId> exchange_;
    std::optional<domain::TickerSnapshot> ticker_;
    std::vector<domain::ExchangeId> availability_;
    SessionStatus status_ = SessionStatus::Idle;
    std::exception_ptr lastError_;

    core::CandleSeries series_;
    indicators::IndicatorCoordinator indicators_;
};

}  // namespace app
