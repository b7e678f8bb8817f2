/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <future>
#include <string>

#include <taintflow/InputHandler.h>
#include <taintflow/KindFactory.h>
#include <taintflow/TaintDeclarations.h>
#include <taintflow/Validator.h>

namespace taintflow {

/* Arguments of a request, read from a request header. */
struct RequestArgs {
  std::string a;

  bool operator==(const RequestArgs& other) const {
    return a == other.a;
  }
};

class RequestValidator final : public Validator<RequestArgs> {
 public:
  RequestValidator() = default;
  explicit RequestValidator(RequestArgs args)
      : Validator<RequestArgs>(std::move(args)) {}
};

/**
 * The shortest path from a source to a sink: the `a` field of the request
 * becomes the success value, which the base class writes to the sink.
 */
class RequestHandler final : public InputHandler<RequestArgs> {
 public:
  using InputHandler<RequestArgs>::InputHandler;

 protected:
  std::future<ResultType> get_result(RequestArgs args) override;
};

/**
 * Register the markers of the pipeline itself: `Validator::get_input` is a
 * source and the value written by `OutputSink::write` is a sink.
 */
void declare_pipeline(
    TaintDeclarations& declarations,
    const KindFactory& kind_factory);

} // namespace taintflow
