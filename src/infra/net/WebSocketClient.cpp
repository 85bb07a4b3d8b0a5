#include "infra/net/WebSocketClient.h"

#include <stdexcept>
#include <utility>

#include <boost/asio/post.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/beast/http/field.hpp>
#include <boost/beast/version.hpp>
#include <openssl/err.h>

#include "logging/Log.h"

namespace beast = boost::beast;
namespace bhttp = beast::http;
namespace websocket = beast::websocket;
namespace asio = boost::asio;
namespace ssl = asio::ssl;
using tcp = asio::ip::tcp;

namespace {
constexpr std::chrono::seconds kConnectTimeout{30};
}

namespace infra::net {

WebSocketClient::WebSocketClient(asio::io_context& iocParam, std::shared_ptr<ssl::context> sslContext)
    : ioc(iocParam), ctx(std::move(sslContext)), resolver(iocParam) {
    if (!ctx) {
        throw std::invalid_argument("WebSocketClient requires an SSL context");
    }
}

WebSocketClient::~WebSocketClient() = default;

bool WebSocketClient::is_open() const {
    return wsOpen_ && !closed_;
}

void WebSocketClient::open(const std::string& url, WsHandlers handlersParam) {
    if (ws) {
        throw std::logic_error("WebSocketClient::open called twice");
    }
    endpoint = http::parse_url(url);
    if (endpoint.scheme != "wss") {
        throw std::invalid_argument("WebSocket URL must use wss://: " + url);
    }
    handlers = std::move(handlersParam);
    ws = std::make_unique<WebSocketStream>(ioc, *ctx);

    LOG_DEBUG(logging::LogCategory::STREAM, "Connecting to %s", url.c_str());
    resolver.async_resolve(endpoint.host, endpoint.port,
        beast::bind_front_handler(&WebSocketClient::onResolve, shared_from_this()));
}

void WebSocketClient::close() {
    if (closed_) {
        return;
    }
    closed_ = true;
    resolver.cancel();
    if (!ws) {
        return;
    }

    if (wsOpen_) {
        wsOpen_ = false;
        ws->async_close(websocket::close_code::normal,
            [self = shared_from_this()](beast::error_code ec) {
                if (ec) {
                    LOG_TRACE(logging::LogCategory::STREAM, "WebSocket close: %s", ec.message().c_str());
                }
                beast::error_code ignored;
                beast::get_lowest_layer(*self->ws).socket().close(ignored);
            });
        return;
    }

    // Still connecting: closing the socket aborts the pending operation.
    beast::get_lowest_layer(*ws).cancel();
    beast::error_code ignored;
    beast::get_lowest_layer(*ws).socket().close(ignored);
}

void WebSocketClient::send(std::string payload) {
    if (!is_open()) {
        LOG_DEBUG(logging::LogCategory::STREAM, "Dropping frame for closed socket to %s", endpoint.host.c_str());
        return;
    }
    writeQueue.push_back(std::move(payload));
    if (writeQueue.size() == 1) {
        doWrite();
    }
}

void WebSocketClient::handleFailure(const char* stage, beast::error_code ec) {
    if (closed_) {
        return;
    }
    wsOpen_ = false;
    LOG_WARN(logging::LogCategory::STREAM, "WebSocket error during %s on %s: %s", stage, endpoint.host.c_str(),
             ec.message().c_str());
    if (handlers.onError) {
        handlers.onError(std::make_exception_ptr(
            std::runtime_error(std::string("WebSocket ") + stage + " failed: " + ec.message())));
    }
}

void WebSocketClient::onResolve(beast::error_code ec, tcp::resolver::results_type results) {
    if (closed_) {
        return;
    }
    if (ec) {
        handleFailure("resolve", ec);
        return;
    }

    beast::get_lowest_layer(*ws).expires_after(kConnectTimeout);
    beast::get_lowest_layer(*ws).async_connect(
        results,
        beast::bind_front_handler(&WebSocketClient::onConnect, shared_from_this()));
}

void WebSocketClient::onConnect(beast::error_code ec, tcp::resolver::results_type::endpoint_type) {
    if (closed_) {
        return;
    }
    if (ec) {
        handleFailure("connect", ec);
        return;
    }

    if (!SSL_set_tlsext_host_name(ws->next_layer().native_handle(), endpoint.host.c_str())) {
        beast::error_code sniEc{ static_cast<int>(::ERR_get_error()), asio::error::get_ssl_category() };
        handleFailure("sni", sniEc);
        return;
    }
    ws->next_layer().set_verify_callback(ssl::host_name_verification(endpoint.host));

    beast::get_lowest_layer(*ws).expires_after(kConnectTimeout);
    ws->next_layer().async_handshake(
        ssl::stream_base::client,
        beast::bind_front_handler(&WebSocketClient::onSslHandshake, shared_from_this()));
}

void WebSocketClient::onSslHandshake(beast::error_code ec) {
    if (closed_) {
        return;
    }
    if (ec) {
        handleFailure("ssl_handshake", ec);
        return;
    }

    beast::get_lowest_layer(*ws).expires_never();

    ws->set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));
    ws->set_option(websocket::stream_base::decorator([](websocket::request_type& req) {
        req.set(bhttp::field::user_agent, std::string(BOOST_BEAST_VERSION_STRING) + " candlescope");
    }));

    // Non-default ports belong in the Host header.
    const std::string hostHeader = endpoint.port == "443" ? endpoint.host : endpoint.host + ":" + endpoint.port;
    ws->async_handshake(hostHeader, endpoint.target,
        beast::bind_front_handler(&WebSocketClient::onHandshake, shared_from_this()));
}

void WebSocketClient::onHandshake(beast::error_code ec) {
    if (closed_) {
        return;
    }
    if (ec) {
        handleFailure("handshake", ec);
        return;
    }

    ws->text(true);
    wsOpen_ = true;
    LOG_INFO(logging::LogCategory::STREAM, "WebSocket open %s%s", endpoint.host.c_str(), endpoint.target.c_str());
    if (handlers.onOpen) {
        handlers.onOpen();
    }
    if (closed_) {
        return;
    }
    doRead();
}

void WebSocketClient::doRead() {
    ws->async_read(buffer,
        beast::bind_front_handler(&WebSocketClient::onRead, shared_from_this()));
}

void WebSocketClient::onRead(beast::error_code ec, std::size_t bytes_transferred) {
    boost::ignore_unused(bytes_transferred);

    if (closed_) {
        return;
    }
    if (ec) {
        if (ec == websocket::error::closed) {
            wsOpen_ = false;
            LOG_INFO(logging::LogCategory::STREAM, "WebSocket closed by %s", endpoint.host.c_str());
            if (handlers.onClose) {
                handlers.onClose();
            }
            return;
        }
        handleFailure("read", ec);
        return;
    }

    std::string message = beast::buffers_to_string(buffer.data());
    buffer.consume(buffer.size());

    if (handlers.onMessage) {
        handlers.onMessage(message);
    }
    if (closed_) {
        return;
    }
    doRead();
}

void WebSocketClient::doWrite() {
    ws->async_write(asio::buffer(writeQueue.front()),
        beast::bind_front_handler(&WebSocketClient::onWrite, shared_from_this()));
}

void WebSocketClient::onWrite(beast::error_code ec, std::size_t) {
    if (closed_) {
        return;
    }
    if (ec) {
        writeQueue.clear();
        handleFailure("write", ec);
        return;
    }
    writeQueue.pop_front();
    if (!writeQueue.empty()) {
        doWrite();
    }
}

WebSocketClientFactory::WebSocketClientFactory(asio::io_context& ioc)
    : ioc_(ioc), sslContext_(std::make_shared<ssl::context>(ssl::context::tlsv12_client)) {
    sslContext_->set_default_verify_paths();
    sslContext_->set_verify_mode(ssl::verify_peer);
}

std::shared_ptr<IWsConnection> WebSocketClientFactory::create() {
    return std::make_shared<WebSocketClient>(ioc_, sslContext_);
}

}  // namespace infra::net
