/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <stdexcept>
#include <string>

#include <fmt/format.h>

namespace taintflow {

/* Raised when an internal invariant of taintflow does not hold. */
class InvariantViolation : public std::logic_error {
 public:
  explicit InvariantViolation(const std::string& message)
      : std::logic_error(message) {}
};

} // namespace taintflow

#define tf_unreachable_log(message, ...)                               \
  do {                                                                 \
    throw taintflow::InvariantViolation(                               \
        fmt::format(message, ##__VA_ARGS__));                          \
  } while (true)
