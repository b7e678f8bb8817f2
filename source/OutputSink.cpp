/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <taintflow/OutputSink.h>

namespace taintflow {

DeclarationSite OutputSink::write_site() {
  return DeclarationSite::parameter(
      "taintflow::OutputSink::write", /* position */ 1);
}

SinkDeclaration OutputSink::write_sink(const KindFactory& kind_factory) {
  return SinkDeclaration(write_site(), {kind_factory.get(kinds::k_output)});
}

void StreamOutputSink::write(std::string_view value) {
  std::lock_guard<std::mutex> lock(mutex_);
  stream_ << value << "\n";
  stream_.flush();
}

} // namespace taintflow
