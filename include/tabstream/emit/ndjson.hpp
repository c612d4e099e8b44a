#pragma once

#include <tabstream/core/value.hpp>

#include <string>
#include <string_view>

namespace tabstream::emit {

inline constexpr std::string_view kNdjsonContentType = "application/x-ndjson";

/// Append `text` as a quoted JSON string.
void append_json_string(std::string& out, std::string_view text);

/// Append one cell: null, integer, shortest round-trip double, or string.
/// NaN and infinities have no JSON spelling and are written as null.
void append_json_value(std::string& out, const Value& value);

/// One JSON object (keys in schema order) terminated by '\n'.
[[nodiscard]] auto to_ndjson(const Record& record) -> std::string;

}  // namespace tabstream::emit
