#pragma once

#include <cstddef>
#include <exception>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include <boost/asio/io_context.hpp>

#include "domain/Types.h"
#include "domain/exchange/IExchangeAdapter.hpp"
#include "infra/http/SnapshotFetcher.hpp"

namespace infra::exchange {

using AdapterPtr = std::shared_ptr<const domain::IExchangeAdapter>;

using TickerHandler = std::function<void(std::exception_ptr, domain::TickerSnapshot)>;
using TickersHandler = std::function<void(std::vector<domain::TickerSnapshot>)>;
using CandlesHandler = std::function<void(std::vector<domain::Candle>)>;

// Snapshot access across all configured exchanges. Adapters are held in
// priority order; that order is also the order of probe results.
class ExchangeGateway {
public:
    ExchangeGateway(boost::asio::io_context& ioc,
                    std::shared_ptr<http::SnapshotFetcher> fetcher,
                    std::vector<AdapterPtr> adaptersByPriority);

    const std::vector<AdapterPtr>& adapters() const { return adapters_; }
    std::vector<domain::ExchangeId> priority() const;

    // Throws std::invalid_argument when the exchange is not configured.
    AdapterPtr adapter(domain::ExchangeId id) const;

    // Transport and parse failures reach the handler.
    void fetch_ticker(domain::ExchangeId id, const std::string& symbol, TickerHandler handler);

    // Probes every adapter concurrently and reports once all have settled.
    void fetch_available_tickers(const std::string& symbol, TickersHandler handler);

    // Failures are logged and reported as an empty batch.
    void fetch_candles(domain::ExchangeId id,
                       const std::string& symbol,
                       domain::Interval interval,
                       std::size_t limit,
                       CandlesHandler handler);

private:
    boost::asio::io_context& ioc_;
    std::shared_ptr<http::SnapshotFetcher> fetcher_;
    std::vector<AdapterPtr> adapters_;
};

}  // namespace infra::exchange
