#pragma once

#include <algorithm>
#include <cctype>
#include <string>

namespace adapters {

inline constexpr const char* kSettlementAsset = "USDT";

inline std::string upper_ascii(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });
    return value;
}

inline std::string lower_ascii(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

// BTC -> BTC<separator>USDT
inline std::string settlement_pair(const std::string& base, const std::string& separator) {
    return upper_ascii(base) + separator + kSettlementAsset;
}

// Removes the first occurrence of the pair separator, e.g. BTC_USDT -> BTCUSDT.
inline std::string strip_separator(std::string pair, char separator) {
    const auto pos = pair.find(separator);
    if (pos != std::string::npos) {
        pair.erase(pos, 1);
    }
    return pair;
}

} // namespace adapters
