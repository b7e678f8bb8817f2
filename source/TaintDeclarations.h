/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <string>
#include <unordered_map>
#include <vector>

#include <json/json.h>
#include <re2/re2.h>

#include <taintflow/Compiler.h>
#include <taintflow/DeclarationSite.h>
#include <taintflow/IncludeMacros.h>
#include <taintflow/KindFactory.h>
#include <taintflow/SinkDeclaration.h>
#include <taintflow/SourceDeclaration.h>

namespace taintflow {

/**
 * Registry of taint declarations, keyed by declaration site.
 *
 * This is the metadata surface read by an external analyzer: any value
 * returned from a source site, or flowing into a sink site, is a taint-flow
 * edge. A site carries at most one sink and at most one source declaration.
 *
 * The registry is populated before it is read and is not thread-safe.
 */
class TaintDeclarations final {
 public:
  TaintDeclarations() = default;

  MOVE_CONSTRUCTOR_ONLY(TaintDeclarations)

  /* Throws `DeclarationError` if the site already carries a sink. */
  void add(SinkDeclaration declaration);

  /* Throws `DeclarationError` if the site already carries a source. */
  void add(SourceDeclaration declaration);

  const SinkDeclaration* TF_NULLABLE sink(const DeclarationSite& site) const;
  const SourceDeclaration* TF_NULLABLE source(
      const DeclarationSite& site) const;

  /* All declarations, in insertion order. */
  const std::vector<SinkDeclaration>& sinks() const {
    return sinks_;
  }
  const std::vector<SourceDeclaration>& sources() const {
    return sources_;
  }

  std::vector<const SinkDeclaration*> sinks_of_kind(const Kind* kind) const;
  std::vector<const SourceDeclaration*> sources_of_kind(
      const Kind* kind) const;

  /**
   * Sites whose printed form (see `DeclarationSite::to_string`) fully matches
   * the given pattern, sorted.
   */
  std::vector<DeclarationSite> find(const re2::RE2& pattern) const;

  /* Every kind used by a declaration, sorted by name. */
  std::vector<const Kind*> used_kinds() const;

  /* Throws `DeclarationError` on a site declared in both registries. */
  void join_with(const TaintDeclarations& other);

  std::size_t size() const {
    return sinks_.size() + sources_.size();
  }

  bool empty() const {
    return size() == 0;
  }

  Json::Value to_json() const;

  /**
   * Parse a json array of declarations. Each element has a `site` and exactly
   * one of `sink` (list of kinds) or `source` (a kind).
   */
  static TaintDeclarations from_json(
      const Json::Value& value,
      const KindFactory& kind_factory);

  /* Load and join all declarations from the given json files. */
  static TaintDeclarations load(
      const std::vector<std::string>& paths,
      const KindFactory& kind_factory);

 private:
  void index_site(const DeclarationSite& site);

 private:
  std::vector<SinkDeclaration> sinks_;
  std::vector<SourceDeclaration> sources_;
  std::unordered_map<DeclarationSite, std::size_t> sink_indices_;
  std::unordered_map<DeclarationSite, std::size_t> source_indices_;
  // Distinct sites may share a printed form, e.g `A.b:1` is both a parameter
  // of `A.b` and the field `b:1` of `A`.
  std::unordered_map<std::string, std::vector<DeclarationSite>> sites_by_name_;
};

} // namespace taintflow
