/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <memory>

namespace taintflow {

class Options;
class KindFactory;
class TaintDeclarations;

/**
 * taintflow global context.
 */
class Context final {
 public:
  Context();

  Context(const Context&) = delete;
  Context(Context&&) noexcept;
  Context& operator=(const Context&) = delete;
  Context& operator=(Context&&) = delete;
  ~Context();

  std::unique_ptr<Options> options;
  std::unique_ptr<KindFactory> kind_factory;
  std::unique_ptr<TaintDeclarations> declarations;
};

} // namespace taintflow
