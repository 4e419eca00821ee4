/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef KATJING_LOGGER_MANAGER_HPP
#define KATJING_LOGGER_MANAGER_HPP

#include "logger/logger_manager_fwd.hpp"

#include <map>
#include <mutex>
#include <string>

#include <boost/optional.hpp>
#include "logger/logger_fwd.hpp"
#include "logger/logger_spdlog.hpp"

namespace katjing {
  namespace logger {

    /**
     * A node of the logger hierarchy. Each node owns a logger tagged with the
     * path from the root, e.g. "Katjing/Cashier", and creates children on
     * demand. Children share the parent's configuration unless another one is
     * provided.
     */
    class LoggerManagerTree {
      /// Only the tree can name this type, so the tagged constructor stays
      /// internal while std::make_shared can still reach it
      struct ChildKey {
        explicit ChildKey() = default;
      };

     public:
      explicit LoggerManagerTree(ConstLoggerConfigPtr config);

      explicit LoggerManagerTree(LoggerConfig config);

      LoggerManagerTree(ChildKey,
                        std::string full_tag,
                        ConstLoggerConfigPtr config);

      /// Get this node's logger.
      LoggerPtr getLogger();

      /**
       * Get or create a child node.
       * @param tag - the child's tag, appended to this node's full tag
       * @param config - overrides the inherited configuration when a new
       * child is created
       */
      LoggerManagerTreePtr getChild(
          const std::string &tag,
          boost::optional<LoggerConfig> config = boost::none);

      /// @return the full tag of this node
      const std::string &getTag() const;

     private:
      const std::string full_tag_;
      const ConstLoggerConfigPtr config_;
      LoggerPtr logger_;
      std::map<std::string, LoggerManagerTreePtr> children_;
      std::mutex mutex_;
    };

  }  // namespace logger
}  // namespace katjing

#endif  // KATJING_LOGGER_MANAGER_HPP
