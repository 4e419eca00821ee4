/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef KATJING_RESULT_HPP
#define KATJING_RESULT_HPP

#include "common/result_fwd.hpp"

#include <ciso646>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>

#include <boost/variant.hpp>

#include "common/visitor.hpp"

/*
 * Result is a type which represents value or an error, and values and errors
 * are template parametrized. Working with value wrapped in result is done using
 * match() function, which accepts 2 functions: for value and error cases.
 *
 * Both the value and the error may be move-only types. In that case the result
 * itself is move-only and has to be consumed with the rvalue overloads.
 */

namespace katjing {
  namespace expected {

    struct ValueBase {};

    template <typename T>
    struct Value : ValueBase {
      using type = T;
      template <
          typename... Args,
          typename = std::enable_if_t<std::is_constructible<T, Args...>::value>>
      Value(Args &&... args) : value(std::forward<Args>(args)...) {}
      T value;
    };

    struct ErrorBase {};

    template <typename E>
    struct Error : ErrorBase {
      using type = E;
      template <
          typename... Args,
          typename = std::enable_if_t<std::is_constructible<E, Args...>::value>>
      Error(Args &&... args) : error(std::forward<Args>(args)...) {}
      E error;
    };

    class ResultException : public std::runtime_error {
      using std::runtime_error::runtime_error;
    };

    struct ResultBase {};

    /**
     * Result is a specialization of a variant type with value or error
     * semantics.
     * @tparam V type of value
     * @tparam E error type
     */
    template <typename V, typename E = std::string>
    class Result : ResultBase, public boost::variant<Value<V>, Error<E>> {
      using variant_type = boost::variant<Value<V>, Error<E>>;
      using variant_type::variant_type;  // inherit constructors

     public:
      using ValueType = Value<V>;
      using ErrorType = Error<E>;

      using ValueInnerType = V;
      using ErrorInnerType = E;

      /**
       * match is a function which allows working with result's underlying
       * types, you must provide 2 functions to cover success and failure cases.
       * Return type of both functions must be the same. Example usage:
       * @code
       * result.match([](Value<int> v) { std::cout << v.value; },
       *              [](Error<std::string> e) { std::cout << e.error; });
       * @nocode
       */
      template <typename ValueMatch, typename ErrorMatch>
      constexpr auto match(ValueMatch &&value_func, ErrorMatch &&error_func) & {
        return visit_in_place(*this,
                              [&value_func](ValueType &v) {
                                return value_func(v);
                              },
                              [&error_func](ErrorType &e) {
                                return error_func(e);
                              });
      }

      /**
       * Move alternative for match function
       */
      template <typename ValueMatch, typename ErrorMatch>
      constexpr auto match(ValueMatch &&value_func,
                           ErrorMatch &&error_func) && {
        return visit_in_place(*this,
                              [&value_func](ValueType &v) {
                                return value_func(std::move(v));
                              },
                              [&error_func](ErrorType &e) {
                                return error_func(std::move(e));
                              });
      }

      /**
       * Const alternative for match function
       */
      template <typename ValueMatch, typename ErrorMatch>
      constexpr auto match(ValueMatch &&value_func,
                           ErrorMatch &&error_func) const & {
        return visit_in_place(*this,
                              [&value_func](const ValueType &v) {
                                return value_func(v);
                              },
                              [&error_func](const ErrorType &e) {
                                return error_func(e);
                              });
      }

      /// @return value if present, otherwise throw ResultException
      const V &assumeValue() const & {
        if (const auto *val = boost::get<ValueType>(this)) {
          return val->value;
        }
        throw ResultException("Value expected, but got an Error.");
      }

      /// @return value if present, otherwise throw ResultException
      V &&assumeValue() && {
        if (auto *val = boost::get<ValueType>(this)) {
          return std::move(val->value);
        }
        throw ResultException("Value expected, but got an Error.");
      }

      /// @return error if present, otherwise throw ResultException
      const E &assumeError() const & {
        if (const auto *err = boost::get<ErrorType>(this)) {
          return err->error;
        }
        throw ResultException("Error expected, but got a Value.");
      }

      /// @return error if present, otherwise throw ResultException
      E &&assumeError() && {
        if (auto *err = boost::get<ErrorType>(this)) {
          return std::move(err->error);
        }
        throw ResultException("Error expected, but got a Value.");
      }
    };

    template <typename ResultType>
    using ValueOf = typename std::decay_t<ResultType>::ValueType;
    template <typename ResultType>
    using ErrorOf = typename std::decay_t<ResultType>::ErrorType;

    template <typename T>
    Value<std::decay_t<T>> makeValue(T &&value) {
      return Value<std::decay_t<T>>{std::forward<T>(value)};
    }

    template <typename E>
    Error<std::decay_t<E>> makeError(E &&error) {
      return Error<std::decay_t<E>>{std::forward<E>(error)};
    }

    template <typename T>
    constexpr bool isResult =
        std::is_base_of<ResultBase, std::decay_t<T>>::value;

    /**
     * Checkers of the Result type.
     */

    template <typename ResultType,
              typename = std::enable_if_t<isResult<ResultType>>>
    bool hasValue(const ResultType &result) {
      return boost::get<ValueOf<ResultType>>(&result);
    }

    template <typename ResultType,
              typename = std::enable_if_t<isResult<ResultType>>>
    bool hasError(const ResultType &result) {
      return boost::get<ErrorOf<ResultType>>(&result);
    }

  }  // namespace expected
}  // namespace katjing
#endif  // KATJING_RESULT_HPP
