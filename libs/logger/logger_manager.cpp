/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "logger/logger_manager.hpp"

namespace {
  const std::string kRootTag = "Katjing";
  const std::string kTagSeparator = "/";
}  // namespace

namespace katjing {
  namespace logger {

    LoggerManagerTree::LoggerManagerTree(ConstLoggerConfigPtr config)
        : LoggerManagerTree(ChildKey{}, kRootTag, std::move(config)) {}

    LoggerManagerTree::LoggerManagerTree(LoggerConfig config)
        : LoggerManagerTree(
              std::make_shared<const LoggerConfig>(std::move(config))) {}

    LoggerManagerTree::LoggerManagerTree(ChildKey,
                                         std::string full_tag,
                                         ConstLoggerConfigPtr config)
        : full_tag_(std::move(full_tag)), config_(std::move(config)) {}

    LoggerPtr LoggerManagerTree::getLogger() {
      std::lock_guard<std::mutex> lock(mutex_);
      if (not logger_) {
        logger_ = std::make_shared<LoggerSpdlog>(full_tag_, config_);
      }
      return logger_;
    }

    LoggerManagerTreePtr LoggerManagerTree::getChild(
        const std::string &tag, boost::optional<LoggerConfig> config) {
      std::lock_guard<std::mutex> lock(mutex_);
      auto it = children_.find(tag);
      if (it != children_.end()) {
        return it->second;
      }
      auto child_config = config
          ? std::make_shared<const LoggerConfig>(std::move(*config))
          : config_;
      auto child = std::make_shared<LoggerManagerTree>(
          ChildKey{}, full_tag_ + kTagSeparator + tag, std::move(child_config));
      children_.emplace(tag, child);
      return child;
    }

    const std::string &LoggerManagerTree::getTag() const {
      return full_tag_;
    }

  }  // namespace logger
}  // namespace katjing
