/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "logger/logger.hpp"

#include <algorithm>
#include <array>
#include <utility>

namespace {
  using katjing::logger::LogLevel;

  const std::array<std::pair<const char *, LogLevel>, 6> kLogLevelNames{{
      {"trace", LogLevel::kTrace},
      {"debug", LogLevel::kDebug},
      {"info", LogLevel::kInfo},
      {"warning", LogLevel::kWarn},
      {"error", LogLevel::kError},
      {"critical", LogLevel::kCritical},
  }};
}  // namespace

namespace katjing {
  namespace logger {

    const LogLevel kDefaultLogLevel = LogLevel::kInfo;

    std::string boolRepr(bool value) {
      return value ? "true" : "false";
    }

    boost::optional<LogLevel> logLevelFromString(const std::string &name) {
      auto it = std::find_if(
          kLogLevelNames.begin(),
          kLogLevelNames.end(),
          [&name](const auto &entry) { return name == entry.first; });
      if (it == kLogLevelNames.end()) {
        return boost::none;
      }
      return it->second;
    }

    std::string logLevelToString(LogLevel level) {
      auto it = std::find_if(
          kLogLevelNames.begin(),
          kLogLevelNames.end(),
          [level](const auto &entry) { return level == entry.second; });
      return it->first;
    }

  }  // namespace logger
}  // namespace katjing
