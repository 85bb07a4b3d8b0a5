#pragma once

#include <functional>
#include <map>
#include <set>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>

#include "infra/http/IHttpClient.hpp"

namespace test_support {

// Canned responses keyed by exact URL. Unknown URLs fail with a transport error.
// Replies are posted on the io_context, like a real client completes.
class FakeHttpClient : public infra::http::IHttpClient {
public:
    explicit FakeHttpClient(boost::asio::io_context& ioc) : ioc_(ioc) {}

    void respond(const std::string& url, unsigned status, std::string body) {
        routes_[url] = Route{false, status, std::move(body)};
    }

    void fail(const std::string& url) { routes_[url] = Route{true, 0U, {}}; }

    // Requests for url wait until release(url); the reply is the route at release time.
    void hold(const std::string& url) { held_.insert(url); }

    void release(const std::string& url) {
        held_.erase(url);
        auto it = pending_.find(url);
        if (it == pending_.end()) {
            return;
        }
        auto handlers = std::move(it->second);
        pending_.erase(it);
        for (auto& handler : handlers) {
            deliver_(url, std::move(handler));
        }
    }

    void async_get(const std::string& url, infra::http::HttpHandler handler) override {
        requests_.push_back(url);
        if (held_.count(url) != 0U) {
            pending_[url].push_back(std::move(handler));
            return;
        }
        deliver_(url, std::move(handler));
    }

    const std::vector<std::string>& requests() const { return requests_; }

    std::size_t count(const std::string& url) const {
        std::size_t n = 0;
        for (const auto& requested : requests_) {
            if (requested == url) {
                ++n;
            }
        }
        return n;
    }

private:
    struct Route {
        bool transportError = true;
        unsigned status = 0U;
        std::string body;
    };

    void deliver_(const std::string& url, infra::http::HttpHandler handler) {
        Route route;
        auto it = routes_.find(url);
        if (it != routes_.end()) {
            route = it->second;
        }
        boost::asio::post(ioc_, [url, route, handler = std::move(handler)]() {
            if (route.transportError) {
                handler(std::make_exception_ptr(std::runtime_error("connection refused: " + url)),
                        infra::http::HttpResponse{});
                return;
            }
            handler(nullptr, infra::http::HttpResponse{route.status, route.body});
        });
    }

    boost::asio::io_context& ioc_;
    std::map<std::string, Route> routes_;
    std::set<std::string> held_;
    std::map<std::string, std::vector<infra::http::HttpHandler>> pending_;
    std::vector<std::string> requests_;
};

// Runs every ready handler, without waiting on timers.
inline void drain(boost::asio::io_context& ioc) {
    ioc.restart();
    while (ioc.poll() > 0) {
    }
}

}  // namespace test_support
