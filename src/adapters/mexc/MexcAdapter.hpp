#pragma once

#include "domain/exchange/IExchangeAdapter.hpp"

namespace adapters::mexc {

class MexcAdapter final : public domain::IExchangeAdapter {
public:
    MexcAdapter() = default;
    ~MexcAdapter() override = default;

    domain::ExchangeId id() const override { return domain::ExchangeId::MEXC; }

    std::string format_symbol(const std::string& base) const override;
    std::string map_interval(domain::Interval interval) const override;
    std::string build_snapshot_request(domain::SnapshotKind kind,
                                       const std::string& base,
                                       domain::Interval interval,
                                       std::size_t limit) const override;

    domain::TickerSnapshot parse_snapshot_ticker(const boost::json::value& payload) const override;
    std::vector<domain::Candle> parse_snapshot_candles(const boost::json::value& payload) const override;

    std::string stream_endpoint(const std::string& base, domain::Interval interval) const override;
    std::optional<std::string> build_subscribe_message(const std::string& base,
                                                       domain::Interval interval) const override;
    std::optional<std::string> build_keep_alive_message() const override;
    std::chrono::milliseconds keep_alive_interval() const override;
    std::optional<domain::Candle> parse_stream_message(std::string_view raw) const noexcept override;
};

}  // namespace adapters::mexc
