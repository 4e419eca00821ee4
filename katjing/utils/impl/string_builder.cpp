/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "katjing/utils/string_builder.hpp"

namespace katjing {
  namespace detail {

    const std::string PrettyStringBuilder::kBeginBlockMarker = "[";
    const std::string PrettyStringBuilder::kEndBlockMarker = "]";
    const std::string PrettyStringBuilder::kKeyValueSeparator = "=";
    const std::string PrettyStringBuilder::kSingleFieldsSeparator = ", ";
    const std::string PrettyStringBuilder::kInitSeparator = ": ";

    PrettyStringBuilder &PrettyStringBuilder::init(const std::string &name) {
      result_.append(name);
      result_.append(kInitSeparator);
      insertLevel();
      return *this;
    }

    PrettyStringBuilder &PrettyStringBuilder::insertLevel() {
      need_field_separator_ = false;
      result_.append(kBeginBlockMarker);
      return *this;
    }

    PrettyStringBuilder &PrettyStringBuilder::removeLevel() {
      result_.append(kEndBlockMarker);
      need_field_separator_ = true;
      return *this;
    }

    PrettyStringBuilder &PrettyStringBuilder::append(const std::string &value) {
      appendPartial(value);
      need_field_separator_ = true;
      return *this;
    }

    void PrettyStringBuilder::appendPartial(const std::string &value) {
      if (need_field_separator_) {
        result_.append(kSingleFieldsSeparator);
        need_field_separator_ = false;
      }
      result_.append(value);
    }

    std::string PrettyStringBuilder::finalize() {
      removeLevel();
      return std::move(result_);
    }

  }  // namespace detail
}  // namespace katjing
