/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <algorithm>
#include <stdexcept>

#include <taintflow/KindFactory.h>

namespace taintflow {

const Kind* KindFactory::get(const std::string& name) const {
  if (name.empty()) {
    throw std::invalid_argument("Taint kind names must be non-empty.");
  }
  return named_.create(name);
}

const Kind* TF_NULLABLE KindFactory::find(const std::string& name) const {
  return named_.get(name);
}

std::vector<const Kind*> KindFactory::kinds() const {
  std::vector<const Kind*> result;
  result.reserve(named_.size());
  for (const auto& [_name, kind] : named_) {
    result.push_back(kind);
  }
  std::sort(result.begin(), result.end(), [](const Kind* left, const Kind* right) {
    return left->name() < right->name();
  });
  return result;
}

} // namespace taintflow
