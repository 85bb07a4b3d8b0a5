#include <iostream>
#include <memory>
#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/json.hpp>

#include "common/Metrics.hpp"
#include "domain/Errors.hpp"
#include "infra/http/SnapshotFetcher.hpp"
#include "infra/http/Url.hpp"
#include "support/FakeHttpClient.hpp"

namespace metrics = tcs::common::metrics;

namespace {

const std::string kDirect = "https://api.example.com/v1/ticker?symbol=BTCUSDT&x=a b";
const std::string kRelayPrefix = "https://relay.example.com/get?url=";

struct Outcome {
    bool called = false;
    std::exception_ptr error;
    boost::json::value value;
};

Outcome fetch(boost::asio::io_context& ioc, infra::http::SnapshotFetcher& fetcher, const std::string& url) {
    Outcome outcome;
    fetcher.fetch_with_fallback(url, [&outcome](std::exception_ptr error, boost::json::value value) {
        outcome.called = true;
        outcome.error = error;
        outcome.value = std::move(value);
    });
    test_support::drain(ioc);
    return outcome;
}

}  // namespace

int main() {
    const std::string relayUrl = kRelayPrefix + infra::http::url_encode(kDirect);

    if (infra::http::url_encode("a b&c=d/é") != "a%20b%26c%3Dd%2F%C3%A9") {
        std::cerr << "url_encode mismatch: " << infra::http::url_encode("a b&c=d/é") << "\n";
        return 1;
    }

    {
        boost::asio::io_context ioc;
        auto http = std::make_shared<test_support::FakeHttpClient>(ioc);
        infra::http::SnapshotFetcher fetcher(http, kRelayPrefix);
        http->respond(kDirect, 200, R"({"lastPrice":"1"})");

        const auto fallbacksBefore = metrics::Registry::instance().counterValue(metrics::names::kRelayFallbackTotal);
        const auto outcome = fetch(ioc, fetcher, kDirect);
        if (!outcome.called || outcome.error || !outcome.value.is_object()) {
            std::cerr << "Direct success must return the parsed body\n";
            return 1;
        }
        if (http->count(relayUrl) != 0 ||
            metrics::Registry::instance().counterValue(metrics::names::kRelayFallbackTotal) != fallbacksBefore) {
            std::cerr << "Relay must not be tried when the direct request succeeds\n";
            return 1;
        }
    }

    {
        boost::asio::io_context ioc;
        auto http = std::make_shared<test_support::FakeHttpClient>(ioc);
        infra::http::SnapshotFetcher fetcher(http, kRelayPrefix);
        http->fail(kDirect);
        http->respond(relayUrl, 200, R"({"contents":"{\"lastPrice\":\"2\"}","status":{"http_code":200}})");

        const auto outcome = fetch(ioc, fetcher, kDirect);
        if (outcome.error || !outcome.value.is_object()
            || outcome.value.as_object().at("lastPrice").as_string() != "2") {
            std::cerr << "Relay envelope contents must be parsed as JSON\n";
            return 1;
        }
        if (http->count(relayUrl) != 1 || http->requests().front() != kDirect) {
            std::cerr << "Relay must be invoked exactly once, after the direct attempt\n";
            return 1;
        }
    }

    {
        boost::asio::io_context ioc;
        auto http = std::make_shared<test_support::FakeHttpClient>(ioc);
        infra::http::SnapshotFetcher fetcher(http, kRelayPrefix);
        http->respond(kDirect, 451, "blocked");
        http->respond(relayUrl, 200, R"({"contents":"plain text body"})");

        const auto outcome = fetch(ioc, fetcher, kDirect);
        if (outcome.error || !outcome.value.is_string() || outcome.value.as_string() != "plain text body") {
            std::cerr << "Non-JSON relay contents must be returned verbatim\n";
            return 1;
        }
    }

    {
        boost::asio::io_context ioc;
        auto http = std::make_shared<test_support::FakeHttpClient>(ioc);
        infra::http::SnapshotFetcher fetcher(http, kRelayPrefix);
        http->respond(kDirect, 200, "<html>not json</html>");
        http->respond(relayUrl, 200, R"({"contents":"[1,2]"})");

        const auto outcome = fetch(ioc, fetcher, kDirect);
        if (outcome.error || !outcome.value.is_array()) {
            std::cerr << "A direct body that is not JSON must fall back to the relay\n";
            return 1;
        }
    }

    {
        boost::asio::io_context ioc;
        auto http = std::make_shared<test_support::FakeHttpClient>(ioc);
        infra::http::SnapshotFetcher fetcher(http, kRelayPrefix);
        http->fail(kDirect);
        http->respond(relayUrl, 502, "bad gateway");

        const auto unavailableBefore =
            metrics::Registry::instance().counterValue(metrics::names::kFetchUnavailableTotal);
        const auto outcome = fetch(ioc, fetcher, kDirect);
        if (!outcome.error) {
            std::cerr << "Both attempts failing must report an error\n";
            return 1;
        }
        try {
            std::rethrow_exception(outcome.error);
        }
        catch (const domain::FetchUnavailable& ex) {
            if (ex.url() != kDirect || !ex.cause()) {
                std::cerr << "FetchUnavailable must carry the URL and the relay failure\n";
                return 1;
            }
        }
        catch (const std::exception& ex) {
            std::cerr << "Expected FetchUnavailable, got: " << ex.what() << "\n";
            return 1;
        }
        if (http->count(relayUrl) != 1) {
            std::cerr << "Relay must be tried exactly once\n";
            return 1;
        }
        if (metrics::Registry::instance().counterValue(metrics::names::kFetchUnavailableTotal)
            != unavailableBefore + 1) {
            std::cerr << "fetch_unavailable_total must count the failure\n";
            return 1;
        }
    }

    {
        boost::asio::io_context ioc;
        auto http = std::make_shared<test_support::FakeHttpClient>(ioc);
        infra::http::SnapshotFetcher fetcher(http, kRelayPrefix);
        http->fail(kDirect);
        http->respond(relayUrl, 200, R"({"status":{"http_code":404}})");

        const auto outcome = fetch(ioc, fetcher, kDirect);
        if (!outcome.error) {
            std::cerr << "An envelope without contents must be a failure\n";
            return 1;
        }
    }

    std::cout << "snapshot fetcher tests passed\n";
    return 0;
}
