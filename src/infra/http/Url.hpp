#pragma once

#include <string>

namespace infra::http {

struct ParsedUrl {
    std::string scheme;
    std::string host;
    std::string port;
    std::string target;
};

// Accepts https:// and wss:// URLs; throws std::invalid_argument otherwise.
ParsedUrl parse_url(const std::string& url);

// Percent-encodes everything outside A-Z a-z 0-9 - _ . ! ~ * ' ( ).
std::string url_encode(const std::string& value);

}  // namespace infra::http
