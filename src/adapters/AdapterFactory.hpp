#pragma once

#include <memory>
#include <string>
#include <vector>

#include "domain/exchange/IExchangeAdapter.hpp"

namespace adapters {

using AdapterPtr = std::shared_ptr<const domain::IExchangeAdapter>;

AdapterPtr make_adapter(domain::ExchangeId id);

// Names are matched case-insensitively; unknown names are logged and skipped,
// exchanges left unnamed follow in their default order.
std::vector<domain::ExchangeId> resolve_priority(const std::vector<std::string>& names);

std::vector<AdapterPtr> make_adapters(const std::vector<domain::ExchangeId>& priority);

}  // namespace adapters
