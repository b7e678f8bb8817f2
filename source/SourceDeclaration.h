/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <ostream>

#include <json/json.h>

#include <taintflow/DeclarationSite.h>
#include <taintflow/IncludeMacros.h>
#include <taintflow/Kind.h>
#include <taintflow/KindFactory.h>

namespace taintflow {

/**
 * Marks the value returned by a method as a taint source of a single kind.
 */
class SourceDeclaration final {
 public:
  /* Throws `DeclarationError` on a null kind or a non return value site. */
  SourceDeclaration(DeclarationSite site, const Kind* kind);

  INCLUDE_DEFAULT_COPY_CONSTRUCTORS_AND_ASSIGNMENTS(SourceDeclaration)

  const DeclarationSite& site() const {
    return site_;
  }

  const Kind* kind() const {
    return kind_;
  }

  bool operator==(const SourceDeclaration& other) const;

  Json::Value to_json() const;
  static SourceDeclaration from_json(
      const Json::Value& value,
      const KindFactory& kind_factory);

 private:
  friend std::ostream& operator<<(
      std::ostream& out,
      const SourceDeclaration& declaration);

  DeclarationSite site_;
  const Kind* kind_;
};

} // namespace taintflow
