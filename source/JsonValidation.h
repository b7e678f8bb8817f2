/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>

#include <json/json.h>

namespace taintflow {

/**
 * Raised when configuration or declaration JSON does not have the expected
 * shape. The message shows the offending value on one line.
 */
class JsonValidationError : public std::invalid_argument {
 public:
  /* `requirement` completes "expected ...", e.g "a string". */
  JsonValidationError(const Json::Value& value, const std::string& requirement);

  JsonValidationError(
      const Json::Value& value,
      const std::string& field,
      const std::string& requirement);
};

/**
 * Typed accessors over `Json::Value`. Each one throws `JsonValidationError`
 * when the value does not match.
 */
class JsonValidation final {
 public:
  JsonValidation() = delete;

  static const Json::Value& object(const Json::Value& value);

  static std::string string(const Json::Value& value);
  static std::string string(const Json::Value& value, const std::string& field);

  /* A missing or null field gives `std::nullopt`. */
  static std::optional<std::string> optional_string(
      const Json::Value& value,
      const std::string& field);
  static std::optional<int> optional_integer(
      const Json::Value& value,
      const std::string& field);

  static std::uint32_t unsigned_integer(
      const Json::Value& value,
      const std::string& field);

  static bool boolean(const Json::Value& value, const std::string& field);

  /* Accepts an array or null; a missing field reads as null. */
  static const Json::Value& optional_array(const Json::Value& value);
  static const Json::Value& optional_array(
      const Json::Value& value,
      const std::string& field);

  static const Json::Value& nonempty_array(
      const Json::Value& value,
      const std::string& field);

  /* True if `value` is an object with a non-null `field`. */
  static bool has_field(const Json::Value& value, const std::string& field);

  /* Rejects objects with a field outside of `allowed`. */
  static void only_fields(
      const Json::Value& value,
      const std::set<std::string>& allowed);
};

} // namespace taintflow
