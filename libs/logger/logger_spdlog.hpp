/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef KATJING_LOGGER_SPDLOG_HPP
#define KATJING_LOGGER_SPDLOG_HPP

#include "logger/logger.hpp"

#include <map>
#include <memory>
#include <string>

namespace spdlog {
  class logger;
}

namespace katjing {
  namespace logger {

    /// Patterns for logging depending on the log level.
    class LogPatterns {
     public:
      /// Set a logging pattern for the given level.
      void setPattern(LogLevel level, std::string pattern);

      /**
       * Get the logging pattern for the given level. If not set, get the
       * next present more verbose level pattern, if any, or the default
       * pattern.
       */
      std::string getPattern(LogLevel level) const;

     private:
      std::map<LogLevel, std::string> patterns_;
    };

    /// Default patterns, e.g. "[%Y-%m-%d %H:%M:%S.%F][%L][%n]: %v".
    LogPatterns getDefaultLogPatterns();

    struct LoggerConfig {
      LogLevel log_level{kDefaultLogLevel};
      LogPatterns patterns{getDefaultLogPatterns()};
    };
    using ConstLoggerConfigPtr = std::shared_ptr<const LoggerConfig>;

    /// Logger writing through spdlog to the shared console sink.
    class LoggerSpdlog : public Logger {
     public:
      /**
       * @param tag - the tag for logging (aka logger name)
       * @param config - logging configuration
       */
      LoggerSpdlog(std::string tag, ConstLoggerConfigPtr config);

     private:
      void logInternal(Level level, const std::string &s) const override;

      bool shouldLog(Level level) const override;

      const std::string tag_;
      const ConstLoggerConfigPtr config_;
      const std::shared_ptr<spdlog::logger> logger_;
    };

  }  // namespace logger
}  // namespace katjing

#endif  // KATJING_LOGGER_SPDLOG_HPP
