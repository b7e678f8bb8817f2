/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <fmt/format.h>

#include <taintflow/JsonValidation.h>
#include <taintflow/SourceDeclaration.h>

namespace taintflow {

SourceDeclaration::SourceDeclaration(DeclarationSite site, const Kind* kind)
    : site_(std::move(site)), kind_(kind) {
  if (!site_.accepts_source()) {
    throw DeclarationError(fmt::format(
        "Source declared on `{}`: only return values can be sources, not a {}.",
        site_.to_string(),
        show_site_type(site_.type())));
  }
  if (kind_ == nullptr) {
    throw DeclarationError(fmt::format(
        "Source declared on `{}` without a taint kind.", site_.to_string()));
  }
}

bool SourceDeclaration::operator==(const SourceDeclaration& other) const {
  return site_ == other.site_ && kind_ == other.kind_;
}

Json::Value SourceDeclaration::to_json() const {
  auto value = Json::Value(Json::objectValue);
  value["site"] = site_.to_json();
  value["source"] = kind_->to_json();
  return value;
}

SourceDeclaration SourceDeclaration::from_json(
    const Json::Value& value,
    const KindFactory& kind_factory) {
  JsonValidation::only_fields(value, {"site", "source"});
  return SourceDeclaration(
      DeclarationSite::from_json(value["site"]),
      Kind::from_json(value["source"], kind_factory));
}

std::ostream& operator<<(
    std::ostream& out,
    const SourceDeclaration& declaration) {
  return out << "SourceDeclaration(site=`" << declaration.site_
             << "`, kind=" << *declaration.kind_ << ")";
}

} // namespace taintflow
