// Copyright (c) 2025 The SignalHub developers
// Distributed under the MIT software license

#pragma once

#include <string>

namespace signalhub {

inline constexpr int CLIENT_VERSION_MAJOR = 0;
inline constexpr int CLIENT_VERSION_MINOR = 3;
inline constexpr int CLIENT_VERSION_PATCH = 0;

inline std::string GetVersionString() {
  return std::to_string(CLIENT_VERSION_MAJOR) + "." + std::to_string(CLIENT_VERSION_MINOR) + "." +
         std::to_string(CLIENT_VERSION_PATCH);
}

inline std::string GetFullVersionString() {
  return "SignalHub relay v" + GetVersionString();
}

inline std::string GetCopyrightString() {
  return "Copyright (c) 2025 The SignalHub developers\nDistributed under the MIT software license";
}

}  // namespace signalhub
