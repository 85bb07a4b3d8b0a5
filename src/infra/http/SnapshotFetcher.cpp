#include "infra/http/SnapshotFetcher.hpp"

#include <optional>
#include <stdexcept>
#include <utility>

#include <boost/json.hpp>

#include "common/Metrics.hpp"
#include "domain/Errors.hpp"
#include "infra/http/Url.hpp"
#include "logging/Log.h"

namespace infra::http {

namespace {

namespace metrics = tcs::common::metrics;

bool isSuccess(unsigned status) {
    return status >= 200U && status < 300U;
}

// Throws MalformedResponse when the body is not a JSON document.
boost::json::value parseBody(const std::string& body) {
    boost::json::error_code ec;
    boost::json::value parsed = boost::json::parse(body, ec);
    if (ec) {
        throw domain::MalformedResponse("Body is not JSON: " + ec.message());
    }
    return parsed;
}

boost::json::value unwrapEnvelope(const std::string& body) {
    const auto envelope = parseBody(body);
    if (!envelope.is_object()) {
        throw domain::MalformedResponse("Relay envelope is not an object");
    }
    const auto* contents = envelope.get_object().if_contains("contents");
    if (contents == nullptr || !contents->is_string() || contents->get_string().empty()) {
        throw domain::MalformedResponse("Relay response missing contents");
    }

    const std::string raw(contents->get_string().data(), contents->get_string().size());
    boost::json::error_code ec;
    boost::json::value inner = boost::json::parse(raw, ec);
    if (ec) {
        // Non-JSON upstream bodies are handed back verbatim.
        return boost::json::value(boost::json::string(raw));
    }
    return inner;
}

}  // namespace

SnapshotFetcher::SnapshotFetcher(std::shared_ptr<IHttpClient> client, std::string relayPrefix)
    : client_(std::move(client)),
      relayPrefix_(relayPrefix.empty() ? std::string(kDefaultRelayPrefix) : std::move(relayPrefix)) {
    if (!client_) {
        throw std::invalid_argument("SnapshotFetcher requires an HTTP client");
    }
}

void SnapshotFetcher::fetch_with_fallback(const std::string& url, JsonHandler handler) {
    client_->async_get(url, [this, url, handler = std::move(handler)](std::exception_ptr error,
                                                                       HttpResponse response) mutable {
        if (!error) {
            if (isSuccess(response.status)) {
                std::optional<boost::json::value> parsed;
                try {
                    parsed = parseBody(response.body);
                }
                catch (const domain::MalformedResponse&) {
                    error = std::current_exception();
                }
                if (parsed) {
                    handler(nullptr, std::move(*parsed));
                    return;
                }
            }
            else {
                error = std::make_exception_ptr(
                    std::runtime_error("HTTP status " + std::to_string(response.status) + " from " + url));
            }
        }

        LOG_DEBUG(logging::LogCategory::NET, "Direct fetch failed for %s (%s), trying relay", url.c_str(),
                  domain::describe(error).c_str());
        fetchViaRelay_(url, error, std::move(handler));
    });
}

void SnapshotFetcher::fetchViaRelay_(const std::string& url, std::exception_ptr directError, JsonHandler handler) {
    metrics::Registry::instance().incrementCounter(metrics::names::kRelayFallbackTotal);
    const std::string relayUrl = relayPrefix_ + url_encode(url);

    client_->async_get(relayUrl, [url, directError, handler = std::move(handler)](std::exception_ptr error,
                                                                                   HttpResponse response) {
        boost::json::value result;
        if (!error) {
            if (!isSuccess(response.status)) {
                error = std::make_exception_ptr(
                    std::runtime_error("Relay fetch failed with HTTP status " + std::to_string(response.status)));
            }
            else {
                try {
                    result = unwrapEnvelope(response.body);
                }
                catch (const domain::MalformedResponse&) {
                    error = std::current_exception();
                }
            }
        }

        if (error) {
            metrics::Registry::instance().incrementCounter(metrics::names::kFetchUnavailableTotal);
            LOG_WARN(logging::LogCategory::NET, "Fetch unavailable for %s: direct=%s relay=%s", url.c_str(),
                     domain::describe(directError).c_str(), domain::describe(error).c_str());
            handler(std::make_exception_ptr(domain::FetchUnavailable(url, error)), boost::json::value{});
            return;
        }
        handler(nullptr, std::move(result));
    });
}

}  // namespace infra::http
