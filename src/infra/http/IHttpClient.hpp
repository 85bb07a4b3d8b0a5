#pragma once

#include <exception>
#include <functional>
#include <string>

namespace infra::http {

struct HttpResponse {
    unsigned status = 0U;
    std::string body;
};

// Transport failures arrive as a non-null exception_ptr; any HTTP status is a success here.
using HttpHandler = std::function<void(std::exception_ptr, HttpResponse)>;

class IHttpClient {
public:
    virtual ~IHttpClient() = default;

    // The handler runs exactly once, on the client's executor.
    virtual void async_get(const std::string& url, HttpHandler handler) = 0;
};

}  // namespace infra::http
