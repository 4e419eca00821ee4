/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef KATJING_VISITOR_HPP
#define KATJING_VISITOR_HPP

#include <type_traits>
#include <utility>

#include <boost/variant/apply_visitor.hpp>

namespace katjing {

  /// Overload set assembled from several callables
  template <typename... Lambdas>
  struct lambda_visitor : Lambdas... {
    using Lambdas::operator()...;
  };

  template <typename... Lambdas>
  lambda_visitor(Lambdas...)->lambda_visitor<Lambdas...>;

  /**
   * Create a visitor from the given callables
   * @param lambdas - callables, one for each alternative (or generic ones)
   * @return visitor object
   */
  template <typename... Lambdas>
  constexpr auto make_visitor(Lambdas &&... lambdas) {
    return lambda_visitor<std::decay_t<Lambdas>...>{
        std::forward<Lambdas>(lambdas)...};
  }

  /**
   * Apply lambdas to a boost::variant in place. Example:
   * @code
   * visit_in_place(v,
   *                [](int i) { return i; },
   *                [](const std::string &s) { return s.size(); });
   * @nocode
   */
  template <typename TVariant, typename... TVisitors>
  constexpr decltype(auto) visit_in_place(TVariant &&variant,
                                          TVisitors &&... visitors) {
    return boost::apply_visitor(
        make_visitor(std::forward<TVisitors>(visitors)...),
        std::forward<TVariant>(variant));
  }

}  // namespace katjing

#endif  // KATJING_VISITOR_HPP
