/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <mutex>
#include <ostream>
#include <string_view>

#include <taintflow/DeclarationSite.h>
#include <taintflow/IncludeMacros.h>
#include <taintflow/KindFactory.h>
#include <taintflow/SinkDeclaration.h>

namespace taintflow {

/**
 * Where handled values leave the program.
 *
 * The `value` parameter of `write` is a taint sink of kind `Output`.
 */
class OutputSink {
 public:
  OutputSink() = default;
  OutputSink(const OutputSink&) = delete;
  OutputSink(OutputSink&&) = delete;
  OutputSink& operator=(const OutputSink&) = delete;
  OutputSink& operator=(OutputSink&&) = delete;
  virtual ~OutputSink() = default;

  virtual void write(std::string_view value) = 0;

  /* Position 0 is the receiver, `value` is at position 1. */
  static DeclarationSite write_site();
  static SinkDeclaration write_sink(const KindFactory& kind_factory);
};

/* Writes each value on its own line to the given stream. */
class StreamOutputSink final : public OutputSink {
 public:
  explicit StreamOutputSink(std::ostream& stream) : stream_(stream) {}

  void write(std::string_view value) override;

 private:
  std::mutex mutex_;
  std::ostream& stream_;
};

} // namespace taintflow
