/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "logger/logger_spdlog.hpp"

#include <mutex>

#include <spdlog/logger.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace {

  const std::string kDefaultPattern = "[%Y-%m-%d %H:%M:%S.%F][%L][%n]: %v";

  spdlog::level::level_enum getSpdlogLogLevel(katjing::logger::LogLevel level) {
    switch (level) {
      case katjing::logger::LogLevel::kTrace:
        return spdlog::level::trace;
      case katjing::logger::LogLevel::kDebug:
        return spdlog::level::debug;
      case katjing::logger::LogLevel::kInfo:
        return spdlog::level::info;
      case katjing::logger::LogLevel::kWarn:
        return spdlog::level::warn;
      case katjing::logger::LogLevel::kError:
        return spdlog::level::err;
      case katjing::logger::LogLevel::kCritical:
        return spdlog::level::critical;
    }
    return spdlog::level::off;
  }

  /// All loggers share one console sink so that lines do not interleave.
  std::shared_ptr<spdlog::sinks::sink> getConsoleSink() {
    static std::once_flag flag;
    static std::shared_ptr<spdlog::sinks::sink> sink;
    std::call_once(flag, [] {
      sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    });
    return sink;
  }

  std::shared_ptr<spdlog::logger> makeSpdlogLogger(
      const std::string &tag,
      const katjing::logger::LoggerConfig &config) {
    auto logger = std::make_shared<spdlog::logger>(tag, getConsoleSink());
    logger->set_level(getSpdlogLogLevel(config.log_level));
    logger->set_pattern(config.patterns.getPattern(config.log_level));
    return logger;
  }

}  // namespace

namespace katjing {
  namespace logger {

    void LogPatterns::setPattern(LogLevel level, std::string pattern) {
      patterns_[level] = std::move(pattern);
    }

    std::string LogPatterns::getPattern(LogLevel level) const {
      for (auto it = patterns_.rbegin(); it != patterns_.rend(); ++it) {
        if (it->first <= level) {
          return it->second;
        }
      }
      return kDefaultPattern;
    }

    LogPatterns getDefaultLogPatterns() {
      LogPatterns patterns;
      patterns.setPattern(LogLevel::kTrace,
                          "[%Y-%m-%d %H:%M:%S.%F][th:%t][%=8l][%n]: %v");
      patterns.setPattern(LogLevel::kInfo, kDefaultPattern);
      return patterns;
    }

    LoggerSpdlog::LoggerSpdlog(std::string tag, ConstLoggerConfigPtr config)
        : tag_(std::move(tag)),
          config_(std::move(config)),
          logger_(makeSpdlogLogger(tag_, *config_)) {}

    void LoggerSpdlog::logInternal(Level level, const std::string &s) const {
      logger_->log(getSpdlogLogLevel(level), s);
    }

    bool LoggerSpdlog::shouldLog(Level level) const {
      return config_->log_level <= level;
    }

  }  // namespace logger
}  // namespace katjing
