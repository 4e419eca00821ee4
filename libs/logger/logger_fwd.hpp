/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef KATJING_LOGGER_LOGGER_FWD_HPP
#define KATJING_LOGGER_LOGGER_FWD_HPP

#include <memory>

namespace katjing {
  namespace logger {

    enum class LogLevel;

    class Logger;

    using LoggerPtr = std::shared_ptr<const Logger>;

  }  // namespace logger
}  // namespace katjing

#endif  // KATJING_LOGGER_LOGGER_FWD_HPP
