#include "adapters/AdapterFactory.hpp"

#include <algorithm>
#include <stdexcept>

#include "adapters/binance/BinanceAdapter.hpp"
#include "adapters/bybit/BybitAdapter.hpp"
#include "adapters/gate/GateAdapter.hpp"
#include "adapters/mexc/MexcAdapter.hpp"
#include "adapters/okx/OkxAdapter.hpp"
#include "logging/Log.h"

namespace adapters {

AdapterPtr make_adapter(domain::ExchangeId id) {
    switch (id) {
    case domain::ExchangeId::Binance:
        return std::make_shared<binance::BinanceAdapter>();
    case domain::ExchangeId::Bybit:
        return std::make_shared<bybit::BybitAdapter>();
    case domain::ExchangeId::MEXC:
        return std::make_shared<mexc::MexcAdapter>();
    case domain::ExchangeId::Gate:
        return std::make_shared<gate::GateAdapter>();
    case domain::ExchangeId::OKX:
        return std::make_shared<okx::OkxAdapter>();
    }
    throw std::invalid_argument("Unknown exchange id");
}

std::vector<domain::ExchangeId> resolve_priority(const std::vector<std::string>& names) {
    std::vector<domain::ExchangeId> order;
    order.reserve(domain::kAllExchanges.size());
    for (const auto& name : names) {
        auto id = domain::exchange_from_string(name);
        if (!id) {
            LOG_WARN(logging::LogCategory::CONFIG, "Ignoring unknown exchange '%s' in priority list", name.c_str());
            continue;
        }
        if (std::find(order.begin(), order.end(), *id) == order.end()) {
            order.push_back(*id);
        }
    }
    for (auto id : domain::kAllExchanges) {
        if (std::find(order.begin(), order.end(), id) == order.end()) {
            order.push_back(id);
        }
    }
    return order;
}

std::vector<AdapterPtr> make_adapters(const std::vector<domain::ExchangeId>& priority) {
    std::vector<AdapterPtr> out;
    out.reserve(priority.size());
    for (auto id : priority) {
        out.push_back(make_adapter(id));
    }
    return out;
}

}  // namespace adapters
