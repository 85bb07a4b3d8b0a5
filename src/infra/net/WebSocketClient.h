#pragma once

#include <deque>
#include <memory>
#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>

#include "infra/http/Url.hpp"
#include "infra/net/IWsConnection.hpp"

namespace infra::net {

class WebSocketClient : public IWsConnection, public std::enable_shared_from_this<WebSocketClient> {
public:
    WebSocketClient(boost::asio::io_context& ioc, std::shared_ptr<boost::asio::ssl::context> sslContext);
    ~WebSocketClient() override;

    void open(const std::string& url, WsHandlers handlers) override;
    void send(std::string payload) override;
    bool is_open() const override;
    void close() override;

private:
    void onResolve(boost::beast::error_code ec, boost::asio::ip::tcp::resolver::results_type results);
    void onConnect(boost::beast::error_code ec, boost::asio::ip::tcp::resolver::results_type::endpoint_type);
    void onSslHandshake(boost::beast::error_code ec);
    void onHandshake(boost::beast::error_code ec);
    void doRead();
    void onRead(boost::beast::error_code ec, std::size_t bytes_transferred);
    void doWrite();
    void onWrite(boost::beast::error_code ec, std::size_t bytes_transferred);
    void handleFailure(const char* stage, boost::beast::error_code ec);

    using WebSocketStream = boost::beast::websocket::stream<boost::beast::ssl_stream<boost::beast::tcp_stream>>;

    boost::asio::io_context& ioc;
    std::shared_ptr<boost::asio::ssl::context> ctx;
    boost::asio::ip::tcp::resolver resolver;
    std::unique_ptr<WebSocketStream> ws;
    boost::beast::flat_buffer buffer;
    std::deque<std::string> writeQueue;

    http::ParsedUrl endpoint;
    WsHandlers handlers;
    bool wsOpen_ = false;
    bool closed_ = false;
};

class WebSocketClientFactory : public IWsConnectionFactory {
public:
    explicit WebSocketClientFactory(boost::asio::io_context& ioc);

    std::shared_ptr<IWsConnection> create() override;

private:
    boost::asio::io_context& ioc_;
    std::shared_ptr<boost::asio::ssl::context> sslContext_;
};

}  // namespace infra::net
