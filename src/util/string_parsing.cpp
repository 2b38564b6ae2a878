// Copyright (c) 2025 The SignalHub developers
// Distributed under the MIT software license

#include "util/string_parsing.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>

#include <nlohmann/json.hpp>

namespace signalhub {
namespace util {

namespace {

std::string_view Trim(std::string_view s) {
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
    s.remove_prefix(1);
  }
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
    s.remove_suffix(1);
  }
  return s;
}

int HexValue(char c) {
  if (c >= '0' && c <= '9')
    return c - '0';
  if (c >= 'a' && c <= 'f')
    return c - 'a' + 10;
  if (c >= 'A' && c <= 'F')
    return c - 'A' + 10;
  return -1;
}

}  // namespace

std::optional<int64_t> SafeParseInt(std::string_view str, int64_t min_value, int64_t max_value) {
  auto s = Trim(str);
  if (s.empty()) {
    return std::nullopt;
  }

  int64_t value = 0;
  auto res = std::from_chars(s.data(), s.data() + s.size(), value, 10);
  if (res.ec != std::errc{} || res.ptr != s.data() + s.size()) {
    return std::nullopt;
  }
  if (value < min_value || value > max_value) {
    return std::nullopt;
  }
  return value;
}

std::optional<bool> SafeParseBool(std::string_view str) {
  std::string s(Trim(str));
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
  if (s == "1" || s == "true" || s == "yes" || s == "on")
    return true;
  if (s == "0" || s == "false" || s == "no" || s == "off")
    return false;
  return std::nullopt;
}

std::optional<std::string> UrlDecode(std::string_view str) {
  std::string out;
  out.reserve(str.size());
  for (size_t i = 0; i < str.size(); ++i) {
    char c = str[i];
    if (c == '+') {
      out.push_back(' ');
    } else if (c == '%') {
      if (i + 2 >= str.size()) {
        return std::nullopt;
      }
      int hi = HexValue(str[i + 1]);
      int lo = HexValue(str[i + 2]);
      if (hi < 0 || lo < 0) {
        return std::nullopt;
      }
      out.push_back(static_cast<char>((hi << 4) | lo));
      i += 2;
    } else {
      out.push_back(c);
    }
  }
  return out;
}

std::string JsonError(std::string_view message) {
  nlohmann::json j;
  j["error"] = std::string(message);
  return j.dump();
}

}  // namespace util
}  // namespace signalhub
