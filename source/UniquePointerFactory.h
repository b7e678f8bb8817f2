/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <ConcurrentContainers.h>

#include <taintflow/Compiler.h>

namespace taintflow {

/**
 * Thread-safe interning: one immutable `Value`, built from its key, per key.
 */
template <typename Key, typename Value>
class UniquePointerFactory final {
 private:
  using Map = ConcurrentMap<Key, const Value*>;

 public:
  using const_iterator = typename Map::const_iterator;

  UniquePointerFactory() = default;

  UniquePointerFactory(const UniquePointerFactory&) = delete;
  UniquePointerFactory(UniquePointerFactory&&) = delete;
  UniquePointerFactory& operator=(const UniquePointerFactory&) = delete;
  UniquePointerFactory& operator=(UniquePointerFactory&&) = delete;

  ~UniquePointerFactory() {
    // `ConcurrentMap` hands out values by copy, so it holds raw pointers.
    for (const auto& [_key, value] : map_) {
      delete value;
    }
  }

  const Value* create(const Key& key) const {
    const Value* interned = nullptr;
    map_.update(
        key, [&](const Key& /* key */, const Value*& value, bool exists) {
          if (!exists) {
            value = new Value(key);
          }
          interned = value;
        });
    return interned;
  }

  /* Returns `nullptr` if nothing was created for `key`. */
  const Value* TF_NULLABLE get(const Key& key) const {
    return map_.get(key, nullptr);
  }

  std::size_t size() const {
    return map_.size();
  }

  /* Not safe to iterate while `create` runs concurrently. */
  const_iterator begin() const {
    return map_.cbegin();
  }

  const_iterator end() const {
    return map_.cend();
  }

 private:
  mutable Map map_;
};

} // namespace taintflow
