/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <algorithm>

#include <fmt/format.h>

#include <taintflow/JsonValidation.h>
#include <taintflow/SinkDeclaration.h>

namespace taintflow {

SinkDeclaration::SinkDeclaration(
    DeclarationSite site,
    std::vector<const Kind*> kinds)
    : site_(std::move(site)), kinds_(std::move(kinds)) {
  if (!site_.accepts_sink()) {
    throw DeclarationError(fmt::format(
        "Sink declared on `{}`: a {} cannot be a sink.",
        site_.to_string(),
        show_site_type(site_.type())));
  }
  if (kinds_.empty()) {
    throw DeclarationError(fmt::format(
        "Sink declared on `{}` without any taint kind.", site_.to_string()));
  }
  if (std::find(kinds_.begin(), kinds_.end(), nullptr) != kinds_.end()) {
    throw DeclarationError(fmt::format(
        "Sink declared on `{}` with a null taint kind.", site_.to_string()));
  }
}

bool SinkDeclaration::has_kind(const Kind* kind) const {
  return std::find(kinds_.begin(), kinds_.end(), kind) != kinds_.end();
}

bool SinkDeclaration::operator==(const SinkDeclaration& other) const {
  return site_ == other.site_ && kinds_ == other.kinds_;
}

Json::Value SinkDeclaration::to_json() const {
  auto value = Json::Value(Json::objectValue);
  value["site"] = site_.to_json();
  auto kinds = Json::Value(Json::arrayValue);
  for (const auto* kind : kinds_) {
    kinds.append(kind->to_json());
  }
  value["sink"] = kinds;
  return value;
}

SinkDeclaration SinkDeclaration::from_json(
    const Json::Value& value,
    const KindFactory& kind_factory) {
  JsonValidation::only_fields(value, {"site", "sink"});

  std::vector<const Kind*> kinds;
  for (const auto& kind : JsonValidation::nonempty_array(value, "sink")) {
    kinds.push_back(Kind::from_json(kind, kind_factory));
  }
  return SinkDeclaration(DeclarationSite::from_json(value["site"]), kinds);
}

std::ostream& operator<<(
    std::ostream& out,
    const SinkDeclaration& declaration) {
  out << "SinkDeclaration(site=`" << declaration.site_ << "`, kinds=[";
  for (auto iterator = declaration.kinds_.begin(),
            end = declaration.kinds_.end();
       iterator != end;) {
    out << **iterator;
    ++iterator;
    if (iterator != end) {
      out << ", ";
    }
  }
  return out << "])";
}

} // namespace taintflow
