// Copyright (c) 2025 The SignalHub developers
// Distributed under the MIT software license

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace signalhub {
namespace util {

// Parse a base-10 integer in [min_value, max_value]. The whole string must be
// consumed (surrounding whitespace is trimmed). Returns nullopt otherwise.
std::optional<int64_t> SafeParseInt(std::string_view str, int64_t min_value, int64_t max_value);

// Parse "1/0", "true/false", "yes/no", "on/off" (case-insensitive).
std::optional<bool> SafeParseBool(std::string_view str);

// Decode %XX escapes and '+' (as space) in a URL query component.
// Returns nullopt on a truncated or non-hex escape.
std::optional<std::string> UrlDecode(std::string_view str);

// Build {"error": message} as a JSON string.
std::string JsonError(std::string_view message);

}  // namespace util
}  // namespace signalhub
