/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <taintflow/JsonValidation.h>
#include <taintflow/Kind.h>
#include <taintflow/KindFactory.h>

namespace taintflow {

void Kind::show(std::ostream& out) const {
  out << name_;
}

Json::Value Kind::to_json() const {
  return Json::Value(name_);
}

const Kind* Kind::from_json(
    const Json::Value& value,
    const KindFactory& kind_factory) {
  auto name = JsonValidation::string(value);
  if (name.empty()) {
    throw JsonValidationError(value, "a non-empty kind name");
  }
  return kind_factory.get(name);
}

std::ostream& operator<<(std::ostream& out, const Kind& kind) {
  kind.show(out);
  return out;
}

} // namespace taintflow
