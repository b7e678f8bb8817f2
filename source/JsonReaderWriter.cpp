/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <fstream>
#include <ios>
#include <memory>
#include <sstream>
#include <stdexcept>

#include <fmt/format.h>

#include <taintflow/JsonReaderWriter.h>
#include <taintflow/Log.h>

namespace taintflow {

namespace {

Json::Value parse(std::istream& input, const std::string& origin) {
  Json::CharReaderBuilder builder;
  builder["collectComments"] = false;

  Json::Value value;
  std::string errors;
  if (!Json::parseFromStream(builder, input, &value, &errors)) {
    throw std::invalid_argument(
        fmt::format("Malformed JSON in {}: {}", origin, errors));
  }
  return value;
}

void write(
    const Json::Value& value,
    const char* indentation,
    std::ostream& output) {
  Json::StreamWriterBuilder builder;
  builder["indentation"] = indentation;
  builder["emitUTF8"] = true;
  std::unique_ptr<Json::StreamWriter> writer(builder.newStreamWriter());
  writer->write(value, &output);
}

} // namespace

Json::Value JsonReader::parse_json(const std::string& text) {
  std::istringstream input(text);
  return parse(input, "input string");
}

Json::Value JsonReader::parse_json_file(const std::filesystem::path& path) {
  std::ifstream input(path, std::ios_base::binary);
  if (!input.is_open()) {
    ERROR(1, "Unable to open `{}`.", path.string());
    throw std::ios_base::failure(
        fmt::format("Unable to open `{}`", path.string()));
  }
  return parse(input, fmt::format("`{}`", path.string()));
}

std::string JsonWriter::to_compact_string(const Json::Value& value) {
  std::ostringstream output;
  write(value, /* indentation */ "", output);
  return output.str();
}

std::string JsonWriter::to_styled_string(const Json::Value& value) {
  std::ostringstream output;
  write(value, /* indentation */ "  ", output);
  return output.str();
}

void JsonWriter::write_json_file(
    const std::filesystem::path& path,
    const Json::Value& value) {
  std::ofstream output;
  output.exceptions(std::ofstream::failbit | std::ofstream::badbit);
  output.open(path, std::ios_base::binary | std::ios_base::trunc);
  write(value, /* indentation */ "  ", output);
  output << '\n';
}

} // namespace taintflow
