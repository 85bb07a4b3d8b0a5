#pragma once

#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "infra/net/IWsConnection.hpp"

namespace test_support {

// Socket driven by the test: simulate_* calls the registered handlers inline.
class FakeWsConnection : public infra::net::IWsConnection {
public:
    void open(const std::string& url, infra::net::WsHandlers handlers) override {
        url_ = url;
        handlers_ = std::move(handlers);
    }

    void send(std::string payload) override {
        if (is_open()) {
            sent_.push_back(std::move(payload));
        }
    }

    bool is_open() const override { return open_ && !closed_; }

    void close() override {
        ++closeCalls_;
        closed_ = true;
        open_ = false;
    }

    void simulate_open() {
        if (closed_) {
            return;
        }
        open_ = true;
        if (handlers_.onOpen) {
            handlers_.onOpen();
        }
    }

    void simulate_message(const std::string& payload) {
        if (!closed_ && handlers_.onMessage) {
            handlers_.onMessage(payload);
        }
    }

    void simulate_error(const std::string& message) {
        if (!closed_ && handlers_.onError) {
            handlers_.onError(std::make_exception_ptr(std::runtime_error(message)));
        }
    }

    // Peer went away without close() being called locally.
    void simulate_drop() {
        open_ = false;
        if (!closed_ && handlers_.onClose) {
            handlers_.onClose();
        }
    }

    const std::string& url() const { return url_; }
    const std::vector<std::string>& sent() const { return sent_; }
    int close_calls() const { return closeCalls_; }
    bool closed() const { return closed_; }

private:
    std::string url_;
    infra::net::WsHandlers handlers_;
    std::vector<std::string> sent_;
    bool open_ = false;
    bool closed_ = false;
    int closeCalls_ = 0;
};

class FakeWsFactory : public infra::net::IWsConnectionFactory {
public:
    std::shared_ptr<infra::net::IWsConnection> create() override {
        auto connection = std::make_shared<FakeWsConnection>();
        connections_.push_back(connection);
        return connection;
    }

    const std::vector<std::shared_ptr<FakeWsConnection>>& connections() const { return connections_; }

    std::shared_ptr<FakeWsConnection> last() const {
        return connections_.empty() ? nullptr : connections_.back();
    }

private:
    std::vector<std::shared_ptr<FakeWsConnection>> connections_;
};

}  // namespace test_support
