/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <filesystem>
#include <string>

#include <json/json.h>

namespace taintflow {

class JsonReader final {
 public:
  /* Throws `std::invalid_argument` on malformed JSON. */
  static Json::Value parse_json(const std::string& text);

  /**
   * Throws `std::ios_base::failure` if the file cannot be opened and
   * `std::invalid_argument` if it does not hold valid JSON.
   */
  static Json::Value parse_json_file(const std::filesystem::path& path);
};

class JsonWriter final {
 public:
  /* Single line, used in error messages. */
  static std::string to_compact_string(const Json::Value& value);

  static std::string to_styled_string(const Json::Value& value);

  static void write_json_file(
      const std::filesystem::path& path,
      const Json::Value& value);
};

} // namespace taintflow
