#include "app/StreamManager.h"

#include <stdexcept>
#include <utility>

#include <boost/asio/error.hpp>
#include <boost/system/system_error.hpp>

#include "common/Metrics.hpp"
#include "domain/Errors.hpp"
#include "logging/Log.h"

namespace app {

namespace {

namespace metrics = tcs::common::metrics;

}  // namespace

StreamManager::StreamManager(boost::asio::io_context& ioc, std::shared_ptr<infra::net::IWsConnectionFactory> factory)
    : ioc_(ioc),
      factory_(std::move(factory)) {
    if (!factory_) {
        throw std::invalid_argument("StreamManager requires a connection factory");
    }
}

StreamManager::~StreamManager() {
    teardown();
}

const char* StreamManager::to_string(State state) {
    switch (state) {
    case State::Idle:
        return "idle";
    case State::Connecting:
        return "connecting";
    case State::Subscribed:
        return "subscribed";
    case State::Streaming:
        return "streaming";
    case State::Closed:
        return "closed";
    }
    return "unknown";
}

void StreamManager::subscribe(AdapterPtr adapter,
                              const std::string& symbol,
                              domain::Interval interval,
                              CandleCallback callback) {
    if (!adapter) {
        throw std::invalid_argument("StreamManager::subscribe requires an adapter");
    }
    if (!callback) {
        throw std::invalid_argument("StreamManager::subscribe requires a callback");
    }

    teardown();

    std::string url;
    std::optional<std::string> subscribeMessage;
    try {
        url = adapter->stream_endpoint(symbol, interval);
        subscribeMessage = adapter->build_subscribe_message(symbol, interval);
    }
    catch (const std::invalid_argument& ex) {
        throw domain::StreamError(std::string("No ") + domain::to_string(adapter->id()) + " stream for " + symbol +
                                  " " + domain::to_string(interval) + ": " + ex.what());
    }

    Subscription sub;
    sub.generation = ++generation_;
    sub.adapter = std::move(adapter);
    sub.symbol = symbol;
    sub.interval = interval;
    sub.subscribeMessage = std::move(subscribeMessage);
    sub.socket = factory_->create();
    sub.callback = std::move(callback);
    if (!sub.socket) {
        throw domain::StreamError("Connection factory returned no socket");
    }

    const std::uint64_t generation = sub.generation;
    const auto socket = sub.socket;
    subscription_ = std::move(sub);
    setState_(State::Connecting);

    LOG_INFO(logging::LogCategory::STREAM,
             "Subscribing %s %s %s via %s",
             domain::to_string(subscription_->adapter->id()),
             symbol.c_str(),
             domain::to_string(interval).c_str(),
             url.c_str());

    infra::net::WsHandlers handlers;
    handlers.onOpen = [this, generation]() { onOpen_(generation); };
    handlers.onMessage = [this, generation](const std::string& payload) { onMessage_(generation, payload); };
    handlers.onError = [this, generation](std::exception_ptr error) { onError_(generation, error); };
    handlers.onClose = [this, generation]() { onClose_(generation); };
    socket->open(url, std::move(handlers));
}

void StreamManager::teardown() noexcept {
    if (!subscription_) {
        return;
    }

    Subscription sub = std::move(*subscription_);
    subscription_.reset();

    if (sub.keepAlive) {
        try {
            sub.keepAlive->cancel();
        }
        catch (const boost::system::system_error& ex) {
            LOG_WARN(logging::LogCategory::STREAM, "Keep-alive cancel failed: %s", ex.what());
        }
    }
    if (sub.socket) {
        try {
            sub.socket->close();
        }
        catch (const std::exception& ex) {
            LOG_WARN(logging::LogCategory::STREAM, "Socket close failed: %s", ex.what());
        }
    }

    LOG_DEBUG(logging::LogCategory::STREAM,
              "Subscription %llu torn down (%s %s)",
              static_cast<unsigned long long>(sub.generation),
              sub.symbol.c_str(),
              domain::to_string(sub.interval).c_str());
    setState_(State::Closed);
}

StreamManager::Subscription* StreamManager::current_(std::uint64_t generation) {
    if (!subscription_ || subscription_->generation != generation) {
        return nullptr;
    }
    return &*subscription_;
}

void StreamManager::onOpen_(std::uint64_t generation) {
    auto* sub = current_(generation);
    if (sub == nullptr) {
        return;
    }

    // Runs on the socket's completion path: nothing may escape into the io_context.
    try {
        if (sub->subscribeMessage) {
            sub->socket->send(*sub->subscribeMessage);
        }
        setState_(State::Subscribed);

        const auto interval = sub->adapter->keep_alive_interval();
        if (interval.count() > 0 && sub->adapter->build_keep_alive_message()) {
            sub->keepAlive = std::make_shared<boost::asio::steady_timer>(ioc_);
            scheduleKeepAlive_(generation);
        }
    }
    catch (const std::exception& ex) {
        metrics::Registry::instance().incrementCounter(metrics::names::kStreamErrorsTotal);
        const domain::StreamError error(std::string("Subscribe failed: ") + ex.what());
        LOG_WARN(logging::LogCategory::STREAM, "%s", error.what());
        teardown();
    }
}

void StreamManager::scheduleKeepAlive_(std::uint64_t generation) {
    auto* sub = current_(generation);
    if (sub == nullptr || !sub->keepAlive) {
        return;
    }

    auto timer = sub->keepAlive;
    timer->expires_after(sub->adapter->keep_alive_interval());
    timer->async_wait([this, timer, generation](const boost::system::error_code& ec) {
        if (ec == boost::asio::error::operation_aborted) {
            return;
        }
        auto* current = current_(generation);
        if (current == nullptr) {
            return;
        }
        if (current->socket->is_open()) {
            if (auto ping = current->adapter->build_keep_alive_message()) {
                current->socket->send(std::move(*ping));
            }
        }
        else {
            LOG_TRACE(logging::LogCategory::STREAM, "Keep-alive skipped: socket not open");
        }
        scheduleKeepAlive_(generation);
    });
}

void StreamManager::onMessage_(std::uint64_t generation, const std::string& payload) {
    auto* sub = current_(generation);
    if (sub == nullptr) {
        return;
    }

    auto candle = sub->adapter->parse_stream_message(payload);
    if (!candle) {
        return;
    }

    metrics::Registry::instance().incrementCounter(metrics::names::kStreamMessagesTotal);
    if (state_ != State::Streaming) {
        setState_(State::Streaming);
    }
    // The callback may re-enter subscribe() or teardown(); keep it alive for the call.
    auto callback = sub->callback;
    callback(*candle);
}

void StreamManager::onError_(std::uint64_t generation, std::exception_ptr error) {
    if (current_(generation) == nullptr) {
        return;
    }
    metrics::Registry::instance().incrementCounter(metrics::names::kStreamErrorsTotal);
    LOG_WARN(logging::LogCategory::STREAM, "Stream error: %s", domain::describe(error).c_str());
}

void StreamManager::onClose_(std::uint64_t generation) {
    if (current_(generation) == nullptr) {
        return;
    }
    LOG_INFO(logging::LogCategory::STREAM, "Stream closed by peer; no reconnect");
    setState_(State::Closed);
}

void StreamManager::setState_(State state) {
    state_ = state;
    metrics::Registry::instance().setGauge(metrics::names::kWsState, static_cast<double>(static_cast<int>(state)));
}

}  // namespace app
