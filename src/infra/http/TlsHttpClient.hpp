#pragma once

#include <chrono>
#include <memory>
#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ssl/context.hpp>

#include "infra/http/IHttpClient.hpp"

namespace infra::http {

// Asynchronous HTTPS GET over Beast. Follows redirects and applies the
// timeout to each stage (connect, handshake, write, read) separately.
class TlsHttpClient : public IHttpClient {
public:
    explicit TlsHttpClient(boost::asio::io_context& ioc, int timeoutSec = 20);
    ~TlsHttpClient() override = default;

    void async_get(const std::string& url, HttpHandler handler) override;

private:
    class Session;

    void start_(const std::string& url, int redirectsLeft, HttpHandler handler);

    boost::asio::io_context& ioc_;
    std::shared_ptr<boost::asio::ssl::context> sslContext_;
    std::chrono::seconds timeout_;
};

}  // namespace infra::http
