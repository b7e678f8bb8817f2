/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <algorithm>
#include <set>

#include <fmt/format.h>

#include <taintflow/JsonReaderWriter.h>
#include <taintflow/JsonValidation.h>
#include <taintflow/Log.h>
#include <taintflow/RE2.h>
#include <taintflow/TaintDeclarations.h>

namespace taintflow {

void TaintDeclarations::add(SinkDeclaration declaration) {
  const auto& site = declaration.site();
  if (sink_indices_.count(site) != 0) {
    throw DeclarationError(
        fmt::format("Site `{}` already carries a sink.", site.to_string()));
  }
  LOG(4, "Declaring {}", fmt::streamed(declaration));
  index_site(site);
  sink_indices_.emplace(site, sinks_.size());
  sinks_.push_back(std::move(declaration));
}

void TaintDeclarations::add(SourceDeclaration declaration) {
  const auto& site = declaration.site();
  if (source_indices_.count(site) != 0) {
    throw DeclarationError(
        fmt::format("Site `{}` already carries a source.", site.to_string()));
  }
  LOG(4, "Declaring {}", fmt::streamed(declaration));
  index_site(site);
  source_indices_.emplace(site, sources_.size());
  sources_.push_back(std::move(declaration));
}

const SinkDeclaration* TF_NULLABLE
TaintDeclarations::sink(const DeclarationSite& site) const {
  auto found = sink_indices_.find(site);
  return found == sink_indices_.end() ? nullptr : &sinks_[found->second];
}

const SourceDeclaration* TF_NULLABLE
TaintDeclarations::source(const DeclarationSite& site) const {
  auto found = source_indices_.find(site);
  return found == source_indices_.end() ? nullptr : &sources_[found->second];
}

std::vector<const SinkDeclaration*> TaintDeclarations::sinks_of_kind(
    const Kind* kind) const {
  std::vector<const SinkDeclaration*> result;
  for (const auto& declaration : sinks_) {
    if (declaration.has_kind(kind)) {
      result.push_back(&declaration);
    }
  }
  return result;
}

std::vector<const SourceDeclaration*> TaintDeclarations::sources_of_kind(
    const Kind* kind) const {
  std::vector<const SourceDeclaration*> result;
  for (const auto& declaration : sources_) {
    if (declaration.kind() == kind) {
      result.push_back(&declaration);
    }
  }
  return result;
}

std::vector<DeclarationSite> TaintDeclarations::find(
    const re2::RE2& pattern) const {
  std::vector<DeclarationSite> result;

  if (auto literal = as_string_literal(pattern)) {
    auto found = sites_by_name_.find(*literal);
    if (found != sites_by_name_.end()) {
      result = found->second;
    }
  } else {
    for (const auto& [name, sites] : sites_by_name_) {
      if (re2::RE2::FullMatch(name, pattern)) {
        result.insert(result.end(), sites.begin(), sites.end());
      }
    }
  }

  std::sort(result.begin(), result.end());
  return result;
}

std::vector<const Kind*> TaintDeclarations::used_kinds() const {
  auto by_name = [](const Kind* left, const Kind* right) {
    return left->name() < right->name();
  };
  std::set<const Kind*, decltype(by_name)> kinds(by_name);
  for (const auto& declaration : sinks_) {
    kinds.insert(declaration.kinds().begin(), declaration.kinds().end());
  }
  for (const auto& declaration : sources_) {
    kinds.insert(declaration.kind());
  }
  return std::vector<const Kind*>(kinds.begin(), kinds.end());
}

void TaintDeclarations::join_with(const TaintDeclarations& other) {
  for (const auto& declaration : other.sinks_) {
    add(declaration);
  }
  for (const auto& declaration : other.sources_) {
    add(declaration);
  }
}

Json::Value TaintDeclarations::to_json() const {
  auto sinks = Json::Value(Json::arrayValue);
  for (const auto& declaration : sinks_) {
    sinks.append(declaration.to_json());
  }

  auto sources = Json::Value(Json::arrayValue);
  for (const auto& declaration : sources_) {
    sources.append(declaration.to_json());
  }

  auto kinds = Json::Value(Json::arrayValue);
  for (const auto* kind : used_kinds()) {
    kinds.append(kind->to_json());
  }

  auto value = Json::Value(Json::objectValue);
  value["sinks"] = sinks;
  value["sources"] = sources;
  value["kinds"] = kinds;
  return value;
}

TaintDeclarations TaintDeclarations::from_json(
    const Json::Value& value,
    const KindFactory& kind_factory) {
  TaintDeclarations declarations;

  for (const auto& declaration : JsonValidation::optional_array(value)) {
    JsonValidation::object(declaration);
    bool is_sink = declaration.isMember("sink");
    bool is_source = declaration.isMember("source");
    if (is_sink == is_source) {
      throw JsonValidationError(
          declaration, "an object with exactly one of `sink` or `source`");
    }

    if (is_sink) {
      declarations.add(SinkDeclaration::from_json(declaration, kind_factory));
    } else {
      declarations.add(
          SourceDeclaration::from_json(declaration, kind_factory));
    }
  }

  return declarations;
}

TaintDeclarations TaintDeclarations::load(
    const std::vector<std::string>& paths,
    const KindFactory& kind_factory) {
  TaintDeclarations declarations;
  for (const auto& path : paths) {
    auto file_declarations = TaintDeclarations::from_json(
        JsonReader::parse_json_file(path), kind_factory);
    LOG(1,
        "Loaded {} sinks and {} sources from `{}`.",
        file_declarations.sinks().size(),
        file_declarations.sources().size(),
        path);
    declarations.join_with(file_declarations);
  }
  return declarations;
}

void TaintDeclarations::index_site(const DeclarationSite& site) {
  // A site carries either sinks or sources, so it is indexed once.
  sites_by_name_[site.to_string()].push_back(site);
}

} // namespace taintflow
