#include "domain/Errors.hpp"

#include <utility>

namespace domain {

FetchUnavailable::FetchUnavailable(std::string url, std::exception_ptr cause)
    : MarketDataError("fetch unavailable for " + url + ": " + describe(cause)),
      url_(std::move(url)),
      cause_(std::move(cause)) {}

SymbolNotFound::SymbolNotFound(std::string symbol)
    : MarketDataError("symbol not found on any exchange: " + symbol),
      symbol_(std::move(symbol)) {}

std::string describe(std::exception_ptr error) {
    if (!error) {
        return "none";
    }
    try {
        std::rethrow_exception(error);
    }
    catch (const std::exception& ex) {
        return ex.what();
    }
    catch (...) {
        return "non-standard exception";
    }
}

}  // namespace domain
