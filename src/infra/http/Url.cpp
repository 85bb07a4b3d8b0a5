#include "infra/http/Url.hpp"

#include <cctype>
#include <stdexcept>

namespace infra::http {

namespace {

bool isUnreserved(unsigned char c) {
    if (std::isalnum(c) != 0) {
        return true;
    }
    switch (c) {
    case '-':
    case '_':
    case '.':
    case '!':
    case '~':
    case '*':
    case '\'':
    case '(':
    case ')':
        return true;
    default:
        return false;
    }
}

}  // namespace

ParsedUrl parse_url(const std::string& url) {
    ParsedUrl result;
    std::string rest;
    if (url.rfind("https://", 0) == 0) {
        result.scheme = "https";
        rest = url.substr(8);
    }
    else if (url.rfind("wss://", 0) == 0) {
        result.scheme = "wss";
        rest = url.substr(6);
    }
    else {
        throw std::invalid_argument("Unsupported URL scheme: " + url);
    }

    const auto slashPos = rest.find('/');
    std::string authority = slashPos == std::string::npos ? rest : rest.substr(0, slashPos);
    result.target = slashPos == std::string::npos ? std::string{"/"} : rest.substr(slashPos);

    const auto colonPos = authority.find(':');
    if (colonPos != std::string::npos) {
        result.port = authority.substr(colonPos + 1);
        authority = authority.substr(0, colonPos);
    }
    else {
        result.port = "443";
    }
    if (authority.empty()) {
        throw std::invalid_argument("URL missing host: " + url);
    }
    if (result.port.empty()) {
        throw std::invalid_argument("URL has an empty port: " + url);
    }
    result.host = authority;
    return result;
}

std::string url_encode(const std::string& value) {
    static constexpr char kHex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(value.size() * 3);
    for (unsigned char c : value) {
        if (isUnreserved(c)) {
            out.push_back(static_cast<char>(c));
        }
        else {
            out.push_back('%');
            out.push_back(kHex[c >> 4]);
            out.push_back(kHex[c & 0x0F]);
        }
    }
    return out;
}

}  // namespace infra::http
