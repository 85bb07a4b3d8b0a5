#include "adapters/IntervalMap.hpp"

namespace adapters {

std::string canonical_interval(domain::Interval interval) {
    return std::string(detail::canonical_interval_literal(interval));
}

std::string bybit_interval(domain::Interval interval) {
    return std::string(detail::bybit_interval_literal(interval));
}

std::string okx_interval(domain::Interval interval) {
    return std::string(detail::okx_interval_literal(interval));
}

std::string mexc_stream_interval(domain::Interval interval) {
    return std::string(detail::mexc_stream_interval_literal(interval));
}

} // namespace adapters
