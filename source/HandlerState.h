/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <ostream>
#include <stdexcept>
#include <string>

namespace taintflow {

/**
 * Progress of the request served by an `InputHandler`:
 * `Created -> InputExtracted -> Dispatched -> Completed`.
 */
enum class HandlerState {
  Created,
  InputExtracted,
  Dispatched,
  Completed,
};

/* A request is either not started or finished. */
bool is_idle(HandlerState state);

std::string show(HandlerState state);

std::ostream& operator<<(std::ostream& out, HandlerState state);

/* Raised when a handler is asked to serve a request while one is in flight. */
class HandlerStateError : public std::logic_error {
 public:
  explicit HandlerStateError(HandlerState state);

  HandlerState state() const {
    return state_;
  }

 private:
  HandlerState state_;
};

} // namespace taintflow
