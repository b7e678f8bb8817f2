/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include <json/json.h>

#include <taintflow/IncludeMacros.h>

namespace taintflow {

class Options final {
 public:
  explicit Options(
      const std::vector<std::string>& declarations_paths,
      const std::optional<std::string>& output_path = std::nullopt,
      const std::optional<int>& verbosity = std::nullopt,
      const std::optional<std::string>& request_header = std::nullopt);

  /**
   * Read the json configuration. Paths in `declarations-paths` may be files
   * or directories of `.json` files.
   */
  explicit Options(const Json::Value& json);

  DELETE_COPY_CONSTRUCTORS_AND_ASSIGNMENTS(Options)

  const std::vector<std::string>& declarations_paths() const;
  const std::optional<std::string>& output_path() const;
  const std::optional<int>& verbosity() const;
  const std::optional<std::string>& request_header() const;

  void set_verbosity(int verbosity);

 private:
  std::vector<std::string> declarations_paths_;
  std::optional<std::string> output_path_;
  std::optional<int> verbosity_;
  std::optional<std::string> request_header_;
};

} // namespace taintflow
