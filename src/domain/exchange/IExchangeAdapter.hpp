#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <boost/json/value.hpp>

#include "domain/Types.h"

namespace domain {

// Per-exchange policy: symbol and interval vocabulary, endpoints, wire parsing.
// Implementations are stateless apart from injected clocks and may be shared.
class IExchangeAdapter {
 public:
  virtual ~IExchangeAdapter() = default;

  virtual ExchangeId id() const = 0;

  virtual std::string format_symbol(const std::string& base) const = 0;

  // Throws std::invalid_argument for intervals the exchange cannot serve.
  virtual std::string map_interval(Interval interval) const = 0;

  virtual std::string build_snapshot_request(SnapshotKind kind,
                                             const std::string& base,
                                             Interval interval,
                                             std::size_t limit) const = 0;

  // Both throw MalformedResponse when the payload is not shaped as expected.
  virtual TickerSnapshot parse_snapshot_ticker(const boost::json::value& payload) const = 0;
  virtual std::vector<Candle> parse_snapshot_candles(const boost::json::value& payload) const = 0;

  virtual std::string stream_endpoint(const std::string& base, Interval interval) const = 0;
  virtual std::optional<std::string> build_subscribe_message(const std::string& base,
                                                             Interval interval) const = 0;
  virtual std::optional<std::string> build_keep_alive_message() const = 0;

  // Zero means the exchange relies on protocol-level pings only.
  virtual std::chrono::milliseconds keep_alive_interval() const = 0;

  // Empty for acks, pongs, heartbeats and anything that is not a candle update.
  virtual std::optional<Candle> parse_stream_message(std::string_view raw) const noexcept = 0;
};

}  // namespace domain
