#pragma once

#include <exception>
#include <stdexcept>
#include <string>

namespace domain {

// Root of every failure the market-data pipeline reports.
class MarketDataError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Direct and relay attempts both failed. cause() holds the relay failure.
class FetchUnavailable : public MarketDataError {
public:
    FetchUnavailable(std::string url, std::exception_ptr cause);

    const std::string& url() const noexcept { return url_; }
    std::exception_ptr cause() const noexcept { return cause_; }

private:
    std::string url_;
    std::exception_ptr cause_;
};

class MalformedResponse : public MarketDataError {
public:
    using MarketDataError::MarketDataError;
};

class SymbolNotFound : public MarketDataError {
public:
    explicit SymbolNotFound(std::string symbol);

    const std::string& symbol() const noexcept { return symbol_; }

private:
    std::string symbol_;
};

class StreamError : public MarketDataError {
public:
    using MarketDataError::MarketDataError;
};

class CancellationObsolete : public MarketDataError {
public:
    using MarketDataError::MarketDataError;
};

// Message of a captured exception, "none" for a null pointer.
std::string describe(std::exception_ptr error);

}  // namespace domain
