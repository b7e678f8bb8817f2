/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <fmt/format.h>

#include <taintflow/Assert.h>
#include <taintflow/HandlerState.h>

namespace taintflow {

bool is_idle(HandlerState state) {
  return state == HandlerState::Created || state == HandlerState::Completed;
}

std::string show(HandlerState state) {
  switch (state) {
    case HandlerState::Created:
      return "Created";
    case HandlerState::InputExtracted:
      return "InputExtracted";
    case HandlerState::Dispatched:
      return "Dispatched";
    case HandlerState::Completed:
      return "Completed";
  }
  tf_unreachable_log("Unknown handler state `{}`.", static_cast<int>(state));
}

std::ostream& operator<<(std::ostream& out, HandlerState state) {
  return out << show(state);
}

HandlerStateError::HandlerStateError(HandlerState state)
    : std::logic_error(fmt::format(
          "Cannot handle a request while another one is in state `{}`.",
          show(state))),
      state_(state) {}

} // namespace taintflow
