#include "infra/exchange/ExchangeGateway.h"

#include <optional>
#include <stdexcept>
#include <utility>

#include <boost/asio/post.hpp>

#include "domain/Errors.hpp"
#include "logging/Log.h"

namespace infra::exchange {

namespace {

struct ProbeState {
    std::vector<std::optional<domain::TickerSnapshot>> results;
    std::size_t remaining = 0;
    TickersHandler handler;
};

}  // namespace

ExchangeGateway::ExchangeGateway(boost::asio::io_context& ioc,
                                 std::shared_ptr<http::SnapshotFetcher> fetcher,
                                 std::vector<AdapterPtr> adaptersByPriority)
    : ioc_(ioc), fetcher_(std::move(fetcher)), adapters_(std::move(adaptersByPriority)) {
    if (!fetcher_) {
        throw std::invalid_argument("ExchangeGateway requires a snapshot fetcher");
    }
    for (const auto& adapter : adapters_) {
        if (!adapter) {
            throw std::invalid_argument("ExchangeGateway given a null adapter");
        }
    }
}

std::vector<domain::ExchangeId> ExchangeGateway::priority() const {
    std::vector<domain::ExchangeId> ids;
    ids.reserve(adapters_.size());
    for (const auto& adapter : adapters_) {
        ids.push_back(adapter->id());
    }
    return ids;
}

AdapterPtr ExchangeGateway::adapter(domain::ExchangeId id) const {
    for (const auto& adapter : adapters_) {
        if (adapter->id() == id) {
            return adapter;
        }
    }
    throw std::invalid_argument(std::string("Exchange not configured: ") + domain::to_string(id));
}

void ExchangeGateway::fetch_ticker(domain::ExchangeId id, const std::string& symbol, TickerHandler handler) {
    AdapterPtr selected;
    try {
        selected = adapter(id);
    }
    catch (const std::invalid_argument&) {
        boost::asio::post(ioc_, [handler = std::move(handler), error = std::current_exception()]() {
            handler(error, domain::TickerSnapshot{});
        });
        return;
    }

    const std::string url = selected->build_snapshot_request(domain::SnapshotKind::Ticker24h, symbol, domain::Interval{}, 0);
    fetcher_->fetch_with_fallback(url, [selected, handler = std::move(handler)](std::exception_ptr error,
                                                                                 boost::json::value payload) {
        if (error) {
            handler(error, domain::TickerSnapshot{});
            return;
        }

        std::optional<domain::TickerSnapshot> ticker;
        try {
            ticker = selected->parse_snapshot_ticker(payload);
        }
        catch (const std::exception&) {
            error = std::current_exception();
        }
        if (!ticker) {
            handler(error, domain::TickerSnapshot{});
            return;
        }
        handler(nullptr, std::move(*ticker));
    });
}

void ExchangeGateway::fetch_available_tickers(const std::string& symbol, TickersHandler handler) {
    if (adapters_.empty()) {
        boost::asio::post(ioc_, [handler = std::move(handler)]() { handler({}); });
        return;
    }

    auto state = std::make_shared<ProbeState>();
    state->results.resize(adapters_.size());
    state->remaining = adapters_.size();
    state->handler = std::move(handler);

    for (std::size_t i = 0; i < adapters_.size(); ++i) {
        const auto id = adapters_[i]->id();
        fetch_ticker(id, symbol, [state, i, id, symbol](std::exception_ptr error, domain::TickerSnapshot ticker) {
            if (error) {
                LOG_DEBUG(logging::LogCategory::DATA, "Probe %s for %s failed: %s", domain::to_string(id),
                          symbol.c_str(), domain::describe(error).c_str());
            }
            else {
                state->results[i] = std::move(ticker);
            }

            if (--state->remaining > 0) {
                return;
            }
            std::vector<domain::TickerSnapshot> found;
            for (auto& result : state->results) {
                if (result) {
                    found.push_back(std::move(*result));
                }
            }
            LOG_DEBUG(logging::LogCategory::DATA, "Probe for %s settled: %zu exchange(s) list it", symbol.c_str(),
                      found.size());
            state->handler(std::move(found));
        });
    }
}

void ExchangeGateway::fetch_candles(domain::ExchangeId id,
                                    const std::string& symbol,
                                    domain::Interval interval,
                                    std::size_t limit,
                                    CandlesHandler handler) {
    std::string url;
    AdapterPtr selected;
    try {
        selected = adapter(id);
        url = selected->build_snapshot_request(domain::SnapshotKind::Candles, symbol, interval, limit);
    }
    catch (const std::invalid_argument& ex) {
        LOG_WARN(logging::LogCategory::DATA, "Cannot request %s candles on %s: %s", symbol.c_str(),
                 domain::to_string(id), ex.what());
        boost::asio::post(ioc_, [handler = std::move(handler)]() { handler({}); });
        return;
    }

    fetcher_->fetch_with_fallback(url, [selected, symbol, handler = std::move(handler)](std::exception_ptr error,
                                                                                         boost::json::value payload) {
        std::vector<domain::Candle> candles;
        if (!error) {
            try {
                candles = selected->parse_snapshot_candles(payload);
            }
            catch (const std::exception&) {
                error = std::current_exception();
            }
        }
        if (error) {
            LOG_WARN(logging::LogCategory::DATA, "Candle fetch for %s on %s failed: %s", symbol.c_str(),
                     domain::to_string(selected->id()), domain::describe(error).c_str());
            candles.clear();
        }
        else {
            LOG_DEBUG(logging::LogCategory::DATA, "Fetched %zu candles for %s on %s", candles.size(), symbol.c_str(),
                      domain::to_string(selected->id()));
        }
        handler(std::move(candles));
    });
}

}  // namespace infra::exchange
