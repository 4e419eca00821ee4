/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef KATJING_STRING_BUILDER_HPP
#define KATJING_STRING_BUILDER_HPP

#include <string>

#include "common/to_string.hpp"

namespace katjing {
  namespace detail {
    /**
     * A simple string builder class for building pretty looking strings
     * shaped like "Name: [field, key=value]"
     */
    class PrettyStringBuilder {
     public:
      /**
       * Initializes new string with a provided name
       * @param name - name to initialize
       */
      PrettyStringBuilder &init(const std::string &name);

      /**
       * Inserts new level marker
       */
      PrettyStringBuilder &insertLevel();

      /**
       * Closes new level marker
       */
      PrettyStringBuilder &removeLevel();

      PrettyStringBuilder &append(const std::string &o);

      template <typename T>
      PrettyStringBuilder &append(const T &o) {
        return append(::katjing::to_string::toString(o));
      }

      /**
       * Appends new field to string as a "name=value" pair
       * @param name - field name to append
       * @param value - field value
       */
      template <typename Value>
      PrettyStringBuilder &appendNamed(const std::string &name,
                                       const Value &value) {
        appendPartial(name);
        appendPartial(kKeyValueSeparator);
        return append(::katjing::to_string::toString(value));
      }

      /**
       * Finalizes appending and returns constructed string.
       * @return resulted string
       */
      std::string finalize();

     private:
      void appendPartial(const std::string &value);

      std::string result_;
      bool need_field_separator_ = false;

      static const std::string kBeginBlockMarker;
      static const std::string kEndBlockMarker;
      static const std::string kKeyValueSeparator;
      static const std::string kSingleFieldsSeparator;
      static const std::string kInitSeparator;
    };
  }  // namespace detail
}  // namespace katjing

#endif  // KATJING_STRING_BUILDER_HPP
