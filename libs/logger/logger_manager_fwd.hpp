/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef KATJING_LOGGER_MANAGER_FWD_HPP
#define KATJING_LOGGER_MANAGER_FWD_HPP

#include <memory>

namespace katjing {
  namespace logger {

    class LoggerManagerTree;

    using LoggerManagerTreePtr = std::shared_ptr<LoggerManagerTree>;

  }  // namespace logger
}  // namespace katjing

#endif  // KATJING_LOGGER_MANAGER_FWD_HPP
