/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <taintflow/Validator.h>

namespace taintflow {
namespace validator {

DeclarationSite input_site() {
  return DeclarationSite::return_value("taintflow::Validator::get_input");
}

SourceDeclaration input_source(const KindFactory& kind_factory) {
  return SourceDeclaration(
      input_site(), kind_factory.get(kinds::k_uri_request_header));
}

} // namespace validator
} // namespace taintflow
