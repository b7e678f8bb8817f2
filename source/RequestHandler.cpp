/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <taintflow/OutputSink.h>
#include <taintflow/RequestHandler.h>

namespace taintflow {

std::future<RequestHandler::ResultType> RequestHandler::get_result(
    RequestArgs args) {
  return ready(Success(std::move(args.a)));
}

void declare_pipeline(
    TaintDeclarations& declarations,
    const KindFactory& kind_factory) {
  declarations.add(validator::input_source(kind_factory));
  declarations.add(OutputSink::write_sink(kind_factory));
}

} // namespace taintflow
