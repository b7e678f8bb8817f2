/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <string_view>
#include <tuple>

#include <boost/container_hash/hash.hpp>
#include <fmt/format.h>

#include <taintflow/Assert.h>
#include <taintflow/DeclarationSite.h>
#include <taintflow/JsonValidation.h>

namespace taintflow {

DeclarationError::DeclarationError(const std::string& message)
    : std::invalid_argument(message) {}

namespace {

void check_name(const std::string& name, std::string_view what) {
  if (name.empty()) {
    throw DeclarationError(
        fmt::format("Declaration site has an empty {} name.", what));
  }
}

} // namespace

DeclarationSite::DeclarationSite(
    Type type,
    std::string owner,
    std::optional<std::string> field,
    std::optional<ParameterPosition> position)
    : type_(type),
      owner_(std::move(owner)),
      field_(std::move(field)),
      position_(position) {}

DeclarationSite DeclarationSite::parameter(
    std::string method,
    ParameterPosition position) {
  check_name(method, "method");
  return DeclarationSite(
      Type::Parameter,
      std::move(method),
      /* field */ std::nullopt,
      position);
}

DeclarationSite DeclarationSite::property(
    std::string class_name,
    std::string field) {
  check_name(class_name, "class");
  check_name(field, "field");
  return DeclarationSite(
      Type::Property,
      std::move(class_name),
      std::move(field),
      /* position */ std::nullopt);
}

DeclarationSite DeclarationSite::return_value(std::string method) {
  check_name(method, "method");
  return DeclarationSite(
      Type::Return,
      std::move(method),
      /* field */ std::nullopt,
      /* position */ std::nullopt);
}

bool DeclarationSite::operator==(const DeclarationSite& other) const {
  return type_ == other.type_ && owner_ == other.owner_ &&
      field_ == other.field_ && position_ == other.position_;
}

bool DeclarationSite::operator!=(const DeclarationSite& other) const {
  return !(*this == other);
}

bool DeclarationSite::operator<(const DeclarationSite& other) const {
  return std::tie(owner_, type_, field_, position_) <
      std::tie(other.owner_, other.type_, other.field_, other.position_);
}

std::string DeclarationSite::to_string() const {
  switch (type_) {
    case Type::Parameter:
      return fmt::format("{}:{}", owner_, *position_);
    case Type::Property:
      return fmt::format("{}.{}", owner_, *field_);
    case Type::Return:
      return fmt::format("{}:return", owner_);
  }
  tf_unreachable_log("Unknown declaration site type.");
}

Json::Value DeclarationSite::to_json() const {
  auto value = Json::Value(Json::objectValue);
  switch (type_) {
    case Type::Parameter:
      value["method"] = owner_;
      value["parameter"] = Json::Value(static_cast<Json::Int64>(*position_));
      break;
    case Type::Property:
      value["class"] = owner_;
      value["field"] = *field_;
      break;
    case Type::Return:
      value["method"] = owner_;
      value["return"] = true;
      break;
  }
  return value;
}

DeclarationSite DeclarationSite::from_json(const Json::Value& value) {
  JsonValidation::object(value);

  if (JsonValidation::has_field(value, "class")) {
    JsonValidation::only_fields(value, {"class", "field"});
    return DeclarationSite::property(
        JsonValidation::string(value, "class"),
        JsonValidation::string(value, "field"));
  }

  if (JsonValidation::has_field(value, "parameter")) {
    JsonValidation::only_fields(value, {"method", "parameter"});
    return DeclarationSite::parameter(
        JsonValidation::string(value, "method"),
        JsonValidation::unsigned_integer(value, "parameter"));
  }

  JsonValidation::only_fields(value, {"method", "return"});
  if (!JsonValidation::boolean(value, "return")) {
    throw JsonValidationError(value, "return", "`true` for a return value");
  }
  return DeclarationSite::return_value(JsonValidation::string(value, "method"));
}

std::ostream& operator<<(std::ostream& out, const DeclarationSite& site) {
  return out << site.to_string();
}

std::string show_site_type(DeclarationSite::Type type) {
  switch (type) {
    case DeclarationSite::Type::Parameter:
      return "parameter";
    case DeclarationSite::Type::Property:
      return "property";
    case DeclarationSite::Type::Return:
      return "return value";
  }
  tf_unreachable_log("Unknown declaration site type.");
}

} // namespace taintflow

namespace std {

std::size_t hash<taintflow::DeclarationSite>::operator()(
    const taintflow::DeclarationSite& site) const {
  std::size_t seed = 0;
  boost::hash_combine(seed, static_cast<int>(site.type()));
  boost::hash_combine(seed, site.owner());
  if (const auto& field = site.field()) {
    boost::hash_combine(seed, *field);
  }
  if (const auto& position = site.parameter_position()) {
    boost::hash_combine(seed, *position);
  }
  return seed;
}

} // namespace std
