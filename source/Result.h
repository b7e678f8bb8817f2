/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

#include <fmt/format.h>

namespace taintflow {

/**
 * Raised when a result is read as the wrong variant: `get()` on a failure or
 * `error()` on a success. There is no valid value to return in that case.
 */
class ResultMisuseError : public std::logic_error {
 public:
  explicit ResultMisuseError(const std::string& message)
      : std::logic_error(message) {}
};

/* The success variant of a `Result`, holding the computed value. */
template <typename T>
class Success final {
 public:
  using value_type = T;

  explicit Success(T value) : value_(std::move(value)) {}

  const T& get() const& {
    return value_;
  }

  T&& get() && {
    return std::move(value_);
  }

  bool operator==(const Success& other) const {
    return value_ == other.value_;
  }

 private:
  T value_;
};

/* The failure variant of a `Result`. It holds an error payload, no value. */
template <typename E>
class Failure final {
 public:
  using error_type = E;

  explicit Failure(E message) : message_(std::move(message)) {}

  const E& message() const& {
    return message_;
  }

  E&& message() && {
    return std::move(message_);
  }

  bool operator==(const Failure& other) const {
    return message_ == other.message_;
  }

 private:
  E message_;
};

template <typename T>
Success(T) -> Success<T>;

template <typename E>
Failure(E) -> Failure<E>;

/**
 * Outcome of a computation: exactly one of `Success<T>` or `Failure<E>`.
 *
 * Both parameters are covariant: a `Result<U, F>` converts to a
 * `Result<T, E>` when `U` converts to `T` and `F` converts to `E`.
 */
template <typename T, typename E = std::string>
class Result final {
 public:
  using value_type = T;
  using error_type = E;

  /* implicit */ Result(Success<T> success) : variant_(std::move(success)) {}

  /* implicit */ Result(Failure<E> failure) : variant_(std::move(failure)) {}

  template <
      typename U,
      typename = std::enable_if_t<
          !std::is_same_v<U, T> && std::is_convertible_v<U, T>>>
  /* implicit */ Result(Success<U> success)
      : variant_(Success<T>(T(std::move(success).get()))) {}

  template <
      typename F,
      typename = std::enable_if_t<
          !std::is_same_v<F, E> && std::is_convertible_v<F, E>>>
  /* implicit */ Result(Failure<F> failure)
      : variant_(Failure<E>(E(std::move(failure).message()))) {}

  template <
      typename U,
      typename F,
      typename = std::enable_if_t<
          !(std::is_same_v<U, T> && std::is_same_v<F, E>) &&
          std::is_convertible_v<U, T> && std::is_convertible_v<F, E>>>
  /* implicit */ Result(Result<U, F> other)
      : variant_(std::move(other).match(
            [](U value) -> Variant { return Success<T>(T(std::move(value))); },
            [](F message) -> Variant {
              return Failure<E>(E(std::move(message)));
            })) {}

  Result(const Result&) = default;
  Result(Result&&) = default;
  Result& operator=(const Result&) = default;
  Result& operator=(Result&&) = default;
  ~Result() = default;

  bool is_success() const {
    return std::holds_alternative<Success<T>>(variant_);
  }

  bool is_failure() const {
    return std::holds_alternative<Failure<E>>(variant_);
  }

  /* Returns the success value. Throws `ResultMisuseError` on a failure. */
  const T& get() const {
    if (const auto* success = std::get_if<Success<T>>(&variant_)) {
      return success->get();
    }
    throw ResultMisuseError(misuse_message("get", "failure"));
  }

  /* Returns the failure payload. Throws `ResultMisuseError` on a success. */
  const E& error() const {
    if (const auto* failure = std::get_if<Failure<E>>(&variant_)) {
      return failure->message();
    }
    throw ResultMisuseError(misuse_message("error", "success"));
  }

  /**
   * Exhaustive match: calls `on_success` with the value or `on_failure` with
   * the error payload, and returns what it returns. Both handlers must return
   * the same type.
   */
  template <typename OnSuccess, typename OnFailure>
  std::invoke_result_t<OnSuccess, const T&> match(
      OnSuccess&& on_success,
      OnFailure&& on_failure) const& {
    if (const auto* success = std::get_if<Success<T>>(&variant_)) {
      return std::forward<OnSuccess>(on_success)(success->get());
    }
    return std::forward<OnFailure>(on_failure)(
        std::get<Failure<E>>(variant_).message());
  }

  template <typename OnSuccess, typename OnFailure>
  std::invoke_result_t<OnSuccess, T&&> match(
      OnSuccess&& on_success,
      OnFailure&& on_failure) && {
    if (auto* success = std::get_if<Success<T>>(&variant_)) {
      return std::forward<OnSuccess>(on_success)(std::move(*success).get());
    }
    return std::forward<OnFailure>(on_failure)(
        std::get<Failure<E>>(std::move(variant_)).message());
  }

  bool operator==(const Result& other) const {
    return variant_ == other.variant_;
  }

  bool operator!=(const Result& other) const {
    return !(*this == other);
  }

 private:
  using Variant = std::variant<Success<T>, Failure<E>>;

  std::string misuse_message(
      std::string_view accessor,
      std::string_view variant) const {
    if constexpr (std::is_same_v<E, std::string>) {
      if (const auto* failure = std::get_if<Failure<E>>(&variant_)) {
        return fmt::format(
            "Called `{}()` on a {} result: {}",
            accessor,
            variant,
            failure->message());
      }
    }
    return fmt::format("Called `{}()` on a {} result.", accessor, variant);
  }

  Variant variant_;
};

} // namespace taintflow
