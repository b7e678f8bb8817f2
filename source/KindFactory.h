/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <string>
#include <vector>

#include <taintflow/IncludeMacros.h>
#include <taintflow/Kind.h>
#include <taintflow/UniquePointerFactory.h>

namespace taintflow {

namespace kinds {

/* Kind of values read from request headers. */
constexpr const char* k_uri_request_header = "UriRequestHeader";

/* Kind of values written to the program output. */
constexpr const char* k_output = "Output";

} // namespace kinds

/**
 * The kind factory.
 */
class KindFactory final {
 public:
  KindFactory() = default;

  DELETE_COPY_CONSTRUCTORS_AND_ASSIGNMENTS(KindFactory)

  /**
   * Returns the unique kind with the given name, creating it if needed.
   *
   * Throws `std::invalid_argument` on an empty name.
   */
  const Kind* get(const std::string& name) const;

  /* Returns the kind if it was already created, `nullptr` otherwise. */
  const Kind* TF_NULLABLE find(const std::string& name) const;

  /* All kinds created so far, sorted by name. */
  std::vector<const Kind*> kinds() const;

 private:
  UniquePointerFactory<std::string, Kind> named_;
};

} // namespace taintflow
