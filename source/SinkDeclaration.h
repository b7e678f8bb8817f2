/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <ostream>
#include <vector>

#include <json/json.h>

#include <taintflow/DeclarationSite.h>
#include <taintflow/IncludeMacros.h>
#include <taintflow/Kind.h>
#include <taintflow/KindFactory.h>

namespace taintflow {

/**
 * Marks a parameter or an instance property as a taint sink: a value reaching
 * that site is considered dangerous for each of the given kinds.
 *
 * Kinds keep their declaration order and may repeat.
 */
class SinkDeclaration final {
 public:
  /* Throws `DeclarationError` on an empty kind list or a return value site. */
  SinkDeclaration(DeclarationSite site, std::vector<const Kind*> kinds);

  INCLUDE_DEFAULT_COPY_CONSTRUCTORS_AND_ASSIGNMENTS(SinkDeclaration)

  const DeclarationSite& site() const {
    return site_;
  }

  const std::vector<const Kind*>& kinds() const {
    return kinds_;
  }

  bool has_kind(const Kind* kind) const;

  bool operator==(const SinkDeclaration& other) const;

  Json::Value to_json() const;
  static SinkDeclaration from_json(
      const Json::Value& value,
      const KindFactory& kind_factory);

 private:
  friend std::ostream& operator<<(
      std::ostream& out,
      const SinkDeclaration& declaration);

  DeclarationSite site_;
  std::vector<const Kind*> kinds_;
};

} // namespace taintflow
