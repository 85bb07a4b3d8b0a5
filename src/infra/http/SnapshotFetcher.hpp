#pragma once

#include <exception>
#include <functional>
#include <memory>
#include <string>

#include <boost/json/value.hpp>

#include "infra/http/IHttpClient.hpp"

namespace infra::http {

inline constexpr const char* kDefaultRelayPrefix = "https://api.allorigins.win/get?url=";

using JsonHandler = std::function<void(std::exception_ptr, boost::json::value)>;

// Direct GET first; on any failure one retry through a relay that wraps the
// upstream body in {"contents": "<body>"}. The relay is never tried first.
class SnapshotFetcher {
public:
    explicit SnapshotFetcher(std::shared_ptr<IHttpClient> client,
                             std::string relayPrefix = kDefaultRelayPrefix);

    // Failure of both attempts is reported as domain::FetchUnavailable with the relay error as cause.
    void fetch_with_fallback(const std::string& url, JsonHandler handler);

    const std::string& relay_prefix() const noexcept { return relayPrefix_; }

private:
    void fetchViaRelay_(const std::string& url, std::exception_ptr directError, JsonHandler handler);

    std::shared_ptr<IHttpClient> client_;
    std::string relayPrefix_;
};

}  // namespace infra::http
