#include "domain/Types.h"

#include <cctype>

namespace domain {

namespace {

bool equalsIgnoreCase(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) {
        return false;
    }
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

}  // namespace

const char* to_string(ExchangeId id) {
    switch (id) {
    case ExchangeId::Binance:
        return "Binance";
    case ExchangeId::Bybit:
        return "Bybit";
    case ExchangeId::MEXC:
        return "MEXC";
    case ExchangeId::Gate:
        return "Gate";
    case ExchangeId::OKX:
        return "OKX";
    }
    return "Unknown";
}

std::optional<ExchangeId> exchange_from_string(std::string_view value) {
    for (ExchangeId id : kAllExchanges) {
        if (equalsIgnoreCase(value, to_string(id))) {
            return id;
        }
    }
    return std::nullopt;
}

}  // namespace domain
