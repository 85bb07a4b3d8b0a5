#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <boost/json.hpp>

#include "domain/Types.h"

namespace adapters::json {

// Numeric conversions accept numbers and numeric strings; anything else throws MalformedResponse.
std::int64_t json_to_int64(const boost::json::value& value);
double json_to_double(const boost::json::value& value);

// String fields are copied verbatim, numeric fields are rendered in shortest form.
std::string json_to_text(const boost::json::value& value);

const boost::json::object& require_object(const boost::json::value& value, std::string_view what);
const boost::json::array& require_array(const boost::json::value& value, std::string_view what);
const boost::json::value& require_field(const boost::json::object& object, std::string_view key);
const boost::json::value* find_field(const boost::json::object& object, std::string_view key);

// Parses a stream frame without throwing; empty on invalid JSON.
std::optional<boost::json::value> parse_frame(std::string_view raw) noexcept;

std::string format_fixed(double value, int decimals);
std::string format_number(double value);

// Rows shaped [time, open, high, low, close, ...] with the volume at volumeIndex.
domain::Candle candle_from_row(const boost::json::array& row, std::size_t volumeIndex);

// Appends only when the candle is strictly newer than the last one kept.
bool append_if_increasing(std::vector<domain::Candle>& out, const domain::Candle& candle);

} // namespace adapters::json
