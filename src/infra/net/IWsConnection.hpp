#pragma once

#include <exception>
#include <functional>
#include <memory>
#include <string>

namespace infra::net {

struct WsHandlers {
    std::function<void()> onOpen;
    std::function<void(const std::string&)> onMessage;
    std::function<void(std::exception_ptr)> onError;
    std::function<void()> onClose;
};

// One client WebSocket. Handlers run on the connection's executor and never after close().
class IWsConnection {
public:
    virtual ~IWsConnection() = default;

    virtual void open(const std::string& url, WsHandlers handlers) = 0;
    // Text frame; dropped when the socket is not open.
    virtual void send(std::string payload) = 0;
    virtual bool is_open() const = 0;
    // Idempotent.
    virtual void close() = 0;
};

class IWsConnectionFactory {
public:
    virtual ~IWsConnectionFactory() = default;
    virtual std::shared_ptr<IWsConnection> create() = 0;
};

}  // namespace infra::net
