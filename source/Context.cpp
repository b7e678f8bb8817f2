/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <taintflow/Context.h>
#include <taintflow/KindFactory.h>
#include <taintflow/Options.h>
#include <taintflow/TaintDeclarations.h>

namespace taintflow {

Context::Context()
    : kind_factory(std::make_unique<KindFactory>()),
      declarations(std::make_unique<TaintDeclarations>()) {}

Context::Context(Context&&) noexcept = default;

Context::~Context() = default;

} // namespace taintflow
