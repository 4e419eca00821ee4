/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef KATJING_RESULT_FWD_HPP
#define KATJING_RESULT_FWD_HPP

namespace katjing {
  namespace expected {

    struct ValueBase;

    template <typename T>
    struct Value;

    struct ErrorBase;

    template <typename E>
    struct Error;

    class ResultException;

    struct ResultBase;

    template <typename V, typename E>
    class Result;

  }  // namespace expected
}  // namespace katjing

#endif  // KATJING_RESULT_FWD_HPP
