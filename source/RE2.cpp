/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <stdexcept>
#include <string_view>

#include <fmt/format.h>
#include <re2/re2.h>

#include <taintflow/RE2.h>

namespace taintflow {

namespace {

bool is_alphanumeric(char byte) {
  return (byte >= 'a' && byte <= 'z') || (byte >= 'A' && byte <= 'Z') ||
      (byte >= '0' && byte <= '9');
}

/* Bytes without a special meaning in a regular expression. */
bool is_literal(char byte) {
  const std::string_view safe_bytes = "!\"#%&',-/:;<=>@_`~";
  return is_alphanumeric(byte) || safe_bytes.find(byte) != std::string::npos;
}

bool is_escapable(char byte) {
  const std::string_view escapable_bytes = "!\"#$%&'()*+,-./:;<=>?@[\\]^_`{|}~";
  return escapable_bytes.find(byte) != std::string::npos;
}

} // namespace

std::optional<std::string> as_string_literal(
    const re2::RE2& regular_expression) {
  if (!regular_expression.ok()) {
    return std::nullopt;
  }

  const auto& pattern = regular_expression.pattern();
  std::string result;
  result.reserve(pattern.size());

  for (std::size_t index = 0; index < pattern.size(); index++) {
    char byte = pattern[index];
    if (is_literal(byte)) {
      result.push_back(byte);
    } else if (
        byte == '\\' && index + 1 < pattern.size() &&
        is_escapable(pattern[index + 1])) {
      result.push_back(pattern[++index]);
    } else {
      return std::nullopt;
    }
  }
  return result;
}

std::unique_ptr<re2::RE2> compile_pattern(const std::string& pattern) {
  auto regular_expression = std::make_unique<re2::RE2>(pattern, re2::RE2::Quiet);
  if (!regular_expression->ok()) {
    throw std::invalid_argument(fmt::format(
        "Invalid site pattern `{}`: {}", pattern, regular_expression->error()));
  }
  return regular_expression;
}

} // namespace taintflow
