/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <taintflow/JsonReaderWriter.h>
#include <taintflow/JsonValidation.h>

namespace taintflow {

namespace {

/* Returns the field, or null when it is absent. */
const Json::Value& field_of(
    const Json::Value& value,
    const std::string& field) {
  JsonValidation::object(value);
  const auto* member = value.find(field.data(), field.data() + field.size());
  return member != nullptr ? *member : Json::Value::nullSingleton();
}

} // namespace

JsonValidationError::JsonValidationError(
    const Json::Value& value,
    const std::string& requirement)
    : std::invalid_argument(fmt::format(
          "Invalid JSON `{}`: expected {}.",
          JsonWriter::to_compact_string(value),
          requirement)) {}

JsonValidationError::JsonValidationError(
    const Json::Value& value,
    const std::string& field,
    const std::string& requirement)
    : std::invalid_argument(fmt::format(
          "Invalid field `{}` in `{}`: expected {}.",
          field,
          JsonWriter::to_compact_string(value),
          requirement)) {}

const Json::Value& JsonValidation::object(const Json::Value& value) {
  if (!value.isObject()) {
    throw JsonValidationError(value, "an object");
  }
  return value;
}

std::string JsonValidation::string(const Json::Value& value) {
  if (!value.isString()) {
    throw JsonValidationError(value, "a string");
  }
  return value.asString();
}

std::string JsonValidation::string(
    const Json::Value& value,
    const std::string& field) {
  const auto& member = field_of(value, field);
  if (!member.isString()) {
    throw JsonValidationError(value, field, "a string");
  }
  return member.asString();
}

std::optional<std::string> JsonValidation::optional_string(
    const Json::Value& value,
    const std::string& field) {
  const auto& member = field_of(value, field);
  if (member.isNull()) {
    return std::nullopt;
  }
  if (!member.isString()) {
    throw JsonValidationError(value, field, "a string or null");
  }
  return member.asString();
}

std::optional<int> JsonValidation::optional_integer(
    const Json::Value& value,
    const std::string& field) {
  const auto& member = field_of(value, field);
  if (member.isNull()) {
    return std::nullopt;
  }
  if (!member.isInt()) {
    throw JsonValidationError(value, field, "an integer or null");
  }
  return member.asInt();
}

std::uint32_t JsonValidation::unsigned_integer(
    const Json::Value& value,
    const std::string& field) {
  const auto& member = field_of(value, field);
  if (!member.isUInt()) {
    throw JsonValidationError(value, field, "a non-negative integer");
  }
  return member.asUInt();
}

bool JsonValidation::boolean(
    const Json::Value& value,
    const std::string& field) {
  const auto& member = field_of(value, field);
  if (!member.isBool()) {
    throw JsonValidationError(value, field, "a boolean");
  }
  return member.asBool();
}

const Json::Value& JsonValidation::optional_array(const Json::Value& value) {
  if (!value.isNull() && !value.isArray()) {
    throw JsonValidationError(value, "an array or null");
  }
  return value;
}

const Json::Value& JsonValidation::optional_array(
    const Json::Value& value,
    const std::string& field) {
  const auto& member = field_of(value, field);
  if (!member.isNull() && !member.isArray()) {
    throw JsonValidationError(value, field, "an array or null");
  }
  return member;
}

const Json::Value& JsonValidation::nonempty_array(
    const Json::Value& value,
    const std::string& field) {
  const auto& member = field_of(value, field);
  if (!member.isArray() || member.empty()) {
    throw JsonValidationError(value, field, "a non-empty array");
  }
  return member;
}

bool JsonValidation::has_field(
    const Json::Value& value,
    const std::string& field) {
  return value.isObject() && !value[field].isNull();
}

void JsonValidation::only_fields(
    const Json::Value& value,
    const std::set<std::string>& allowed) {
  object(value);
  for (const auto& name : value.getMemberNames()) {
    if (allowed.count(name) == 0) {
      throw JsonValidationError(
          value,
          name,
          fmt::format("one of `{}`", fmt::join(allowed, "`, `")));
    }
  }
}

} // namespace taintflow
