/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <memory>
#include <optional>
#include <string>

#include <re2/re2.h>

namespace taintflow {

/**
 * If the regular expression is equivalent to an equality check, return the
 * string literal, otherwise return std::nullopt.
 *
 * For instance:
 * ```
 * >>> as_string_literal(re2::RE2("Foo::bar:1"))
 * <<< std::optional<std::string>("Foo::bar:1")
 * >>> as_string_literal(re2::RE2("Foo::.*"))
 * <<< std::nullopt
 * ```
 */
std::optional<std::string> as_string_literal(const re2::RE2& pattern);

/**
 * Compile a site pattern, throwing `std::invalid_argument` with the RE2 error
 * when it is not a valid regular expression.
 */
std::unique_ptr<re2::RE2> compile_pattern(const std::string& pattern);

} // namespace taintflow
