/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <algorithm>
#include <filesystem>
#include <stdexcept>

#include <fmt/format.h>

#include <taintflow/JsonReaderWriter.h>
#include <taintflow/JsonValidation.h>
#include <taintflow/Log.h>
#include <taintflow/Options.h>

namespace taintflow {

namespace {

/* Expand directories into the sorted list of json files they contain. */
std::vector<std::string> parse_paths_list(
    const Json::Value& value,
    const std::string& extension) {
  std::vector<std::string> paths;
  for (const auto& path_value : JsonValidation::optional_array(value)) {
    auto path = JsonValidation::string(path_value);
    if (std::filesystem::is_directory(path)) {
      std::vector<std::string> directory_paths;
      for (const auto& entry : std::filesystem::directory_iterator(path)) {
        if (entry.is_regular_file() && entry.path().extension() == extension) {
          directory_paths.push_back(entry.path().native());
        }
      }
      std::sort(directory_paths.begin(), directory_paths.end());
      paths.insert(paths.end(), directory_paths.begin(), directory_paths.end());
    } else if (std::filesystem::exists(path)) {
      paths.push_back(path);
    } else {
      throw std::invalid_argument(
          fmt::format("File `{}` does not exist.", path));
    }
  }
  return paths;
}

} // namespace

Options::Options(
    const std::vector<std::string>& declarations_paths,
    const std::optional<std::string>& output_path,
    const std::optional<int>& verbosity,
    const std::optional<std::string>& request_header)
    : declarations_paths_(declarations_paths),
      output_path_(output_path),
      verbosity_(verbosity),
      request_header_(request_header) {}

Options::Options(const Json::Value& json) {
  LOG(2, "Arguments: {}", JsonWriter::to_styled_string(json));

  JsonValidation::only_fields(
      json,
      {"declarations-paths", "output-path", "verbosity", "request-header"});

  declarations_paths_ = parse_paths_list(
      JsonValidation::optional_array(json, "declarations-paths"),
      /* extension */ ".json");
  output_path_ = JsonValidation::optional_string(json, "output-path");
  verbosity_ = JsonValidation::optional_integer(json, "verbosity");
  request_header_ = JsonValidation::optional_string(json, "request-header");
}

const std::vector<std::string>& Options::declarations_paths() const {
  return declarations_paths_;
}

const std::optional<std::string>& Options::output_path() const {
  return output_path_;
}

const std::optional<int>& Options::verbosity() const {
  return verbosity_;
}

const std::optional<std::string>& Options::request_header() const {
  return request_header_;
}

void Options::set_verbosity(int verbosity) {
  verbosity_ = verbosity;
}

} // namespace taintflow
