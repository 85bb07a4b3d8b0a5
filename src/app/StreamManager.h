#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include "domain/Types.h"
#include "domain/exchange/IExchangeAdapter.hpp"
#include "infra/net/IWsConnection.hpp"

namespace app {

// Owns the single live candle subscription of a session.
class StreamManager {
public:
    enum class State { Idle, Connecting, Subscribed, Streaming, Closed };

    using AdapterPtr = std::shared_ptr<const domain::IExchangeAdapter>;
    using CandleCallback = std::function<void(const domain::Candle&)>;

    StreamManager(boost::asio::io_context& ioc, std::shared_ptr<infra::net::IWsConnectionFactory> factory);
    ~StreamManager();

    StreamManager(const StreamManager&) = delete;
    StreamManager& operator=(const StreamManager&) = delete;

    // Replaces any existing subscription. Throws domain::StreamError when the
    // exchange has no stream for the interval; no socket is opened then.
    // Socket errors are logged and counted; the subscription stays in place
    // until teardown() or the next subscribe().
    void subscribe(AdapterPtr adapter,
                   const std::string& symbol,
                   domain::Interval interval,
                   CandleCallback callback);

    // Idempotent. No handler of the released socket or timer runs afterwards.
    void teardown() noexcept;

    State state() const noexcept { return state_; }
    bool has_subscription() const noexcept { return subscription_.has_value(); }

    static const char* to_string(State state);

private:
    struct Subscription {
        std::uint64_t generation = 0;
        AdapterPtr adapter;
        std::string symbol;
        domain::Interval interval;
        std::optional<std::string> subscribeMessage;
        std::shared_ptr<infra::net::IWsConnection> socket;
        std::shared_ptr<boost::asio::steady_timer> keepAlive;
        CandleCallback callback;
    };

    Subscription* current_(std::uint64_t generation);
    void onOpen_(std::uint64_t generation);
    void onMessage_(std::uint64_t generation, const std::string& payload);
    void onError_(std::uint64_t generation, std::exception_ptr error);
    void onClose_(std::uint64_t generation);
    void scheduleKeepAlive_(std::uint64_t generation);
    void setState_(State state);

    boost::asio::io_context& ioc_;
    std::shared_ptr<infra::net::IWsConnectionFactory> factory_;
    std::optional<Subscription> subscription_;
    std::uint64_t generation_ = 0;
    State state_ = State::Idle;
};

}  // namespace app
