/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <ostream>
#include <string>

#include <json/json.h>

#include <taintflow/IncludeMacros.h>

namespace taintflow {

class KindFactory;

/**
 * The kind of a source or a sink (e.g, UriRequestHeader, xss).
 *
 * Kinds are interned by the `KindFactory`, pointer equality is kind equality.
 */
class Kind final {
 public:
  explicit Kind(std::string name) : name_(std::move(name)) {}

  DELETE_COPY_CONSTRUCTORS_AND_ASSIGNMENTS(Kind)

  const std::string& name() const {
    return name_;
  }

  void show(std::ostream&) const;

  Json::Value to_json() const;
  static const Kind* from_json(
      const Json::Value& value,
      const KindFactory& kind_factory);

 private:
  friend std::ostream& operator<<(std::ostream& out, const Kind& kind);

  std::string name_;
};

} // namespace taintflow
