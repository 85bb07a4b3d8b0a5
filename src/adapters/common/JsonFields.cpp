#include "adapters/common/JsonFields.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstdlib>

#include "domain/Errors.hpp"

namespace adapters::json {

namespace {

boost::json::string_view to_json_view(std::string_view value) {
    return boost::json::string_view(value.data(), value.size());
}

}  // namespace

std::int64_t json_to_int64(const boost::json::value& value) {
    if (value.is_int64()) {
        return value.as_int64();
    }
    if (value.is_uint64()) {
        return static_cast<std::int64_t>(value.as_uint64());
    }
    if (value.is_double()) {
        return static_cast<std::int64_t>(std::llround(value.as_double()));
    }
    if (value.is_string()) {
        const std::string str{value.as_string().c_str()};
        try {
            std::size_t consumed = 0;
            const long long parsed = std::stoll(str, &consumed);
            if (consumed != str.size()) {
                throw domain::MalformedResponse("Trailing characters in integer value: " + str);
            }
            return parsed;
        } catch (const std::logic_error& ex) {
            throw domain::MalformedResponse("Failed to parse integer value: " + str + ", error: " + ex.what());
        }
    }
    throw domain::MalformedResponse("Unsupported JSON type for integer conversion");
}

double json_to_double(const boost::json::value& value) {
    if (value.is_double()) {
        return value.as_double();
    }
    if (value.is_int64()) {
        return static_cast<double>(value.as_int64());
    }
    if (value.is_uint64()) {
        return static_cast<double>(value.as_uint64());
    }
    if (value.is_string()) {
        const std::string str{value.as_string().c_str()};
        try {
            return std::stod(str);
        } catch (const std::logic_error& ex) {
            throw domain::MalformedResponse("Failed to parse floating value: " + str + ", error: " + ex.what());
        }
    }
    throw domain::MalformedResponse("Unsupported JSON type for floating conversion");
}

std::string json_to_text(const boost::json::value& value) {
    if (value.is_string()) {
        return std::string(value.as_string().c_str());
    }
    if (value.is_int64()) {
        return std::to_string(value.as_int64());
    }
    if (value.is_uint64()) {
        return std::to_string(value.as_uint64());
    }
    if (value.is_double()) {
        return format_number(value.as_double());
    }
    throw domain::MalformedResponse("Unsupported JSON type for text conversion");
}

const boost::json::object& require_object(const boost::json::value& value, std::string_view what) {
    if (!value.is_object()) {
        throw domain::MalformedResponse("Expected object for " + std::string(what));
    }
    return value.get_object();
}

const boost::json::array& require_array(const boost::json::value& value, std::string_view what) {
    if (!value.is_array()) {
        throw domain::MalformedResponse("Expected array for " + std::string(what));
    }
    return value.get_array();
}

const boost::json::value* find_field(const boost::json::object& object, std::string_view key) {
    auto it = object.find(to_json_view(key));
    if (it == object.end() || it->value().is_null()) {
        return nullptr;
    }
    return &it->value();
}

const boost::json::value& require_field(const boost::json::object& object, std::string_view key) {
    const auto* field = find_field(object, key);
    if (field == nullptr) {
        throw domain::MalformedResponse("Missing field '" + std::string(key) + "'");
    }
    return *field;
}

std::optional<boost::json::value> parse_frame(std::string_view raw) noexcept {
    try {
        boost::json::error_code ec;
        boost::json::value parsed = boost::json::parse(to_json_view(raw), ec);
        if (ec) {
            return std::nullopt;
        }
        return parsed;
    } catch (const std::bad_alloc&) {
        return std::nullopt;
    }
}

std::string format_fixed(double value, int decimals) {
    char buffer[64];
    std::snprintf(buffer, sizeof(buffer), "%.*f", decimals, value);
    return std::string(buffer);
}

std::string format_number(double value) {
    if (!std::isfinite(value)) {
        return "NaN";
    }
    char buffer[64];
    int precision = 1;
    for (; precision <= 17; ++precision) {
        std::snprintf(buffer, sizeof(buffer), "%.*g", precision, value);
        if (std::strtod(buffer, nullptr) == value) {
            break;
        }
    }
    const double magnitude = std::fabs(value);
    if (magnitude >= 1e-6 && magnitude < 1e21 && std::string_view(buffer).find('e') != std::string_view::npos) {
        // Plain decimal notation for the same significant digits.
        const int exponent = static_cast<int>(std::floor(std::log10(magnitude)));
        const int decimals = std::max(0, std::min(precision, 17) - 1 - exponent);
        std::snprintf(buffer, sizeof(buffer), "%.*f", decimals, value);
    }
    return std::string(buffer);
}

domain::Candle candle_from_row(const boost::json::array& row, std::size_t volumeIndex) {
    if (row.size() <= std::max<std::size_t>(4, volumeIndex)) {
        throw domain::MalformedResponse("Candle row too short: " + std::to_string(row.size()) + " fields");
    }
    domain::Candle candle;
    candle.time = json_to_int64(row[0]);
    candle.open = json_to_double(row[1]);
    candle.high = json_to_double(row[2]);
    candle.low = json_to_double(row[3]);
    candle.close = json_to_double(row[4]);
    candle.volume = json_to_double(row[volumeIndex]);
    return candle;
}

bool append_if_increasing(std::vector<domain::Candle>& out, const domain::Candle& candle) {
    if (!out.empty() && candle.time <= out.back().time) {
        return false;
    }
    out.push_back(candle);
    return true;
}

} // namespace adapters::json
