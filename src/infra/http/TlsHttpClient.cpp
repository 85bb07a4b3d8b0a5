#include "infra/http/TlsHttpClient.hpp"

#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>

#include <openssl/err.h>

#include "infra/http/Url.hpp"
#include "logging/Log.h"

namespace infra::http {
namespace {

namespace beast = boost::beast;
namespace bhttp = beast::http;
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
using tcp = net::ip::tcp;

constexpr int kMaxRedirects = 5;
constexpr const char* kUserAgent = "CandleScope/0.1";

std::runtime_error makeError(const ParsedUrl& url, const std::string& message) {
    std::ostringstream oss;
    oss << "HTTPS GET request to https://" << url.host << url.target << " failed: " << message;
    return std::runtime_error(oss.str());
}

bool isRedirect(unsigned status) {
    return status == 301U || status == 302U || status == 303U || status == 307U || status == 308U;
}

std::string resolveRedirectLocation(const std::string& location, const ParsedUrl& current) {
    if (location.empty()) {
        throw std::runtime_error("Redirect response missing Location header");
    }
    if (location.rfind("https://", 0) == 0) {
        return location;
    }
    if (location.rfind("http://", 0) == 0) {
        throw std::runtime_error("Insecure redirect to HTTP is not supported");
    }

    std::string target = location.front() == '/' ? location : "/" + location;
    std::string authority = current.host;
    if (current.port != "443") {
        authority += ":" + current.port;
    }
    return "https://" + authority + target;
}

}  // namespace

class TlsHttpClient::Session : public std::enable_shared_from_this<TlsHttpClient::Session> {
public:
    using Response = bhttp::response<bhttp::string_body>;
    using Completion = std::function<void(std::exception_ptr, Response)>;

    Session(net::io_context& ioc,
            std::shared_ptr<ssl::context> sslContext,
            ParsedUrl url,
            std::chrono::seconds timeout,
            Completion done)
        : resolver_(ioc),
          sslContext_(std::move(sslContext)),
          stream_(ioc, *sslContext_),
          url_(std::move(url)),
          timeout_(timeout),
          done_(std::move(done)) {}

    void run() {
        if (!SSL_set_tlsext_host_name(stream_.native_handle(), url_.host.c_str())) {
            beast::error_code ec{static_cast<int>(::ERR_get_error()), net::error::get_ssl_category()};
            net::post(resolver_.get_executor(), [self = shared_from_this(), ec]() { self->fail_("sni", ec); });
            return;
        }
        stream_.set_verify_callback(ssl::host_name_verification(url_.host));

        req_.version(11);
        req_.method(bhttp::verb::get);
        req_.target(url_.target);
        req_.set(bhttp::field::host, url_.host);
        req_.set(bhttp::field::user_agent, kUserAgent);
        req_.set(bhttp::field::accept, "application/json");
        req_.set(bhttp::field::connection, "close");

        resolver_.async_resolve(url_.host, url_.port,
            beast::bind_front_handler(&Session::onResolve_, shared_from_this()));
    }

private:
    void onResolve_(beast::error_code ec, tcp::resolver::results_type results) {
        if (ec) {
            fail_("DNS resolution", ec);
            return;
        }
        beast::get_lowest_layer(stream_).expires_after(timeout_);
        beast::get_lowest_layer(stream_).async_connect(results,
            beast::bind_front_handler(&Session::onConnect_, shared_from_this()));
    }

    void onConnect_(beast::error_code ec, tcp::resolver::results_type::endpoint_type) {
        if (ec) {
            fail_("connect", ec);
            return;
        }
        beast::get_lowest_layer(stream_).expires_after(timeout_);
        stream_.async_handshake(ssl::stream_base::client,
            beast::bind_front_handler(&Session::onHandshake_, shared_from_this()));
    }

    void onHandshake_(beast::error_code ec) {
        if (ec) {
            fail_("TLS handshake", ec);
            return;
        }
        beast::get_lowest_layer(stream_).expires_after(timeout_);
        bhttp::async_write(stream_, req_,
            beast::bind_front_handler(&Session::onWrite_, shared_from_this()));
    }

    void onWrite_(beast::error_code ec, std::size_t) {
        if (ec) {
            fail_("write", ec);
            return;
        }
        beast::get_lowest_layer(stream_).expires_after(timeout_);
        bhttp::async_read(stream_, buffer_, res_,
            beast::bind_front_handler(&Session::onRead_, shared_from_this()));
    }

    void onRead_(beast::error_code ec, std::size_t) {
        if (ec) {
            fail_("read", ec);
            return;
        }

        // The response is complete; the TLS close runs after delivery.
        complete_(nullptr, std::move(res_));

        beast::get_lowest_layer(stream_).expires_after(timeout_);
        stream_.async_shutdown(beast::bind_front_handler(&Session::onShutdown_, shared_from_this()));
    }

    void onShutdown_(beast::error_code ec) {
        if (ec == net::error::eof || ec == ssl::error::stream_truncated) {
            // Servers commonly drop the connection without a close_notify.
            ec = {};
        }
        if (ec) {
            LOG_TRACE(logging::LogCategory::NET, "TLS shutdown for %s: %s", url_.host.c_str(), ec.message().c_str());
        }
    }

    void fail_(const char* stage, beast::error_code ec) {
        complete_(std::make_exception_ptr(makeError(url_, std::string(stage) + " error: " + ec.message())), Response{});
    }

    void complete_(std::exception_ptr error, Response response) {
        if (!done_) {
            return;
        }
        auto done = std::move(done_);
        done_ = nullptr;
        done(std::move(error), std::move(response));
    }

    tcp::resolver resolver_;
    std::shared_ptr<ssl::context> sslContext_;
    ssl::stream<beast::tcp_stream> stream_;
    ParsedUrl url_;
    std::chrono::seconds timeout_;
    beast::flat_buffer buffer_;
    bhttp::request<bhttp::empty_body> req_;
    Response res_;
    Completion done_;
};

TlsHttpClient::TlsHttpClient(boost::asio::io_context& ioc, int timeoutSec)
    : ioc_(ioc),
      sslContext_(std::make_shared<ssl::context>(ssl::context::tls_client)),
      timeout_(std::chrono::seconds(timeoutSec > 0 ? timeoutSec : 20)) {
    sslContext_->set_default_verify_paths();
    sslContext_->set_verify_mode(ssl::verify_peer);
}

void TlsHttpClient::async_get(const std::string& url, HttpHandler handler) {
    start_(url, kMaxRedirects, std::move(handler));
}

void TlsHttpClient::start_(const std::string& url, int redirectsLeft, HttpHandler handler) {
    ParsedUrl parsed;
    try {
        parsed = parse_url(url);
    }
    catch (const std::exception&) {
        net::post(ioc_, [handler = std::move(handler), error = std::current_exception()]() {
            handler(error, HttpResponse{});
        });
        return;
    }

    LOG_DEBUG(logging::LogCategory::NET, "GET %s", url.c_str());

    auto onDone = [this, parsed, redirectsLeft, handler = std::move(handler)](std::exception_ptr error,
                                                                             Session::Response response) mutable {
        if (error) {
            handler(error, HttpResponse{});
            return;
        }

        const auto status = static_cast<unsigned>(response.result_int());
        if (isRedirect(status)) {
            if (redirectsLeft <= 0) {
                handler(std::make_exception_ptr(makeError(parsed, "Too many redirects")), HttpResponse{});
                return;
            }
            std::string next;
            try {
                next = resolveRedirectLocation(std::string(response.base()[bhttp::field::location]), parsed);
            }
            catch (const std::exception& redirectError) {
                handler(std::make_exception_ptr(makeError(parsed, redirectError.what())), HttpResponse{});
                return;
            }
            LOG_DEBUG(logging::LogCategory::NET, "Redirect %u to %s", status, next.c_str());
            start_(next, redirectsLeft - 1, std::move(handler));
            return;
        }

        HttpResponse result;
        result.status = status;
        result.body = std::move(response.body());
        handler(nullptr, std::move(result));
    };

    std::make_shared<Session>(ioc_, sslContext_, std::move(parsed), timeout_, std::move(onDone))->run();
}

}  // namespace infra::http
