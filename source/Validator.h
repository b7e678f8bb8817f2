/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <optional>
#include <stdexcept>
#include <string>

#include <taintflow/DeclarationSite.h>
#include <taintflow/KindFactory.h>
#include <taintflow/SourceDeclaration.h>

namespace taintflow {

/* Raised when the input of a validator is read before it was set. */
class UninitializedInputError : public std::logic_error {
 public:
  explicit UninitializedInputError(const std::string& message)
      : std::logic_error(message) {}
};

/* Raised when the input of a validator is set a second time. */
class InputAlreadySetError : public std::logic_error {
 public:
  explicit InputAlreadySetError(const std::string& message)
      : std::logic_error(message) {}
};

namespace validator {

/* Site of `Validator<T>::get_input`, identical for every `T`. */
DeclarationSite input_site();

/* `get_input` returns values tainted with `UriRequestHeader`. */
SourceDeclaration input_source(const KindFactory& kind_factory);

} // namespace validator

/**
 * Holds exactly one untrusted input of type `T`.
 *
 * The input is set once by the owner, then read any number of times through
 * `get_input`, which is a taint source of kind `UriRequestHeader`.
 * Subclass once per untrusted-input shape.
 */
template <typename T>
class Validator {
 protected:
  Validator() = default;

  explicit Validator(T input) : input_(std::move(input)) {}

 public:
  Validator(const Validator&) = delete;
  Validator(Validator&&) = delete;
  Validator& operator=(const Validator&) = delete;
  Validator& operator=(Validator&&) = delete;
  virtual ~Validator() = default;

  /* Throws `InputAlreadySetError` if the input was already set. */
  void set_input(T input) {
    if (input_.has_value()) {
      throw InputAlreadySetError(
          "The input of a validator can only be set once.");
    }
    input_.emplace(std::move(input));
  }

  bool has_input() const {
    return input_.has_value();
  }

  /**
   * Returns the input, unchanged.
   *
   * Throws `UninitializedInputError` if the input was never set.
   */
  const T& get_input() const {
    if (!input_.has_value()) {
      throw UninitializedInputError(
          "The input of a validator was read before being set.");
    }
    return *input_;
  }

 private:
  std::optional<T> input_;
};

} // namespace taintflow
