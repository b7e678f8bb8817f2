/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>

#include <json/json.h>

#include <taintflow/IncludeMacros.h>

namespace taintflow {

using ParameterPosition = std::uint32_t;

/**
 * Raised on a malformed taint declaration: an empty sink, a marker placed on
 * a site that cannot carry it, or a site declared twice.
 */
class DeclarationError : public std::invalid_argument {
 public:
  explicit DeclarationError(const std::string& message);
};

/**
 * Identifies the program location a taint marker is attached to.
 *
 * - `Parameter`: a parameter of a method, by position. For instance methods,
 *   position 0 is the receiver.
 * - `Property`: an instance property of a class.
 * - `Return`: the value returned by a method.
 */
class DeclarationSite final {
 public:
  enum class Type {
    Parameter,
    Property,
    Return,
  };

 private:
  DeclarationSite(
      Type type,
      std::string owner,
      std::optional<std::string> field,
      std::optional<ParameterPosition> position);

 public:
  INCLUDE_DEFAULT_COPY_CONSTRUCTORS_AND_ASSIGNMENTS(DeclarationSite)

  static DeclarationSite parameter(
      std::string method,
      ParameterPosition position);
  static DeclarationSite property(std::string class_name, std::string field);
  static DeclarationSite return_value(std::string method);

  Type type() const {
    return type_;
  }

  /* The method for parameter and return sites, the class for properties. */
  const std::string& owner() const {
    return owner_;
  }

  const std::optional<std::string>& field() const {
    return field_;
  }

  const std::optional<ParameterPosition>& parameter_position() const {
    return position_;
  }

  /* Whether a sink marker may be attached here. */
  bool accepts_sink() const {
    return type_ == Type::Parameter || type_ == Type::Property;
  }

  /* Whether a source marker may be attached here. */
  bool accepts_source() const {
    return type_ == Type::Return;
  }

  bool operator==(const DeclarationSite& other) const;
  bool operator!=(const DeclarationSite& other) const;
  bool operator<(const DeclarationSite& other) const;

  /**
   * Printed form used for lookups: `Method:1`, `Class.field` or
   * `Method:return`.
   */
  std::string to_string() const;

  Json::Value to_json() const;
  static DeclarationSite from_json(const Json::Value& value);

 private:
  friend std::ostream& operator<<(
      std::ostream& out,
      const DeclarationSite& site);

  Type type_;
  std::string owner_;
  std::optional<std::string> field_;
  std::optional<ParameterPosition> position_;
};

std::string show_site_type(DeclarationSite::Type type);

} // namespace taintflow

namespace std {

template <>
struct hash<taintflow::DeclarationSite> {
  std::size_t operator()(const taintflow::DeclarationSite& site) const;
};

} // namespace std
