/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <atomic>
#include <exception>
#include <future>
#include <memory>
#include <optional>
#include <string>

#include <fmt/format.h>

#include <taintflow/HandlerState.h>
#include <taintflow/Log.h>
#include <taintflow/OutputSink.h>
#include <taintflow/Result.h>
#include <taintflow/Validator.h>

namespace taintflow {

/**
 * Moves an untrusted value from a validator, through an asynchronous
 * computation supplied by the subclass, into an output sink.
 *
 * The orchestration is fixed here:
 * 1. `get_validated_input` extracts the input from the validator and forwards
 *    it, unexamined, to `handle_result`. No validation happens.
 * 2. `handle_result` starts `get_result`. Waiting on the future it returns is
 *    the only suspension point.
 * 3. Once the computation completes, a success value is written to the sink.
 *    A failure is never written. The result is returned either way.
 *
 * Step 3 runs on its own thread, whether or not the caller waits on the
 * returned future. Like any `std::async` future, dropping it blocks until
 * step 3 is done. The future may outlive the handler, but not the sink.
 *
 * A handler serves one request at a time.
 */
template <typename Args, typename Value = std::string, typename Error = std::string>
class InputHandler {
 public:
  using ResultType = Result<Value, Error>;

  InputHandler(const Validator<Args>& validator, OutputSink& sink)
      : validator_(validator),
        request_(std::make_shared<Request>(sink)) {}

  InputHandler(const InputHandler&) = delete;
  InputHandler(InputHandler&&) = delete;
  InputHandler& operator=(const InputHandler&) = delete;
  InputHandler& operator=(InputHandler&&) = delete;
  virtual ~InputHandler() = default;

  /**
   * Throws `HandlerStateError` if a request is in flight, and lets
   * `UninitializedInputError` through if the validator has no input.
   */
  std::future<ResultType> get_validated_input() {
    auto idle = request_->claim();
    try {
      Args args = validator_.get_input();
      return handle_result(std::move(args));
    } catch (const UninitializedInputError&) {
      request_->transition(idle);
      throw;
    }
  }

  HandlerState state() const {
    return request_->state.load();
  }

 protected:
  std::future<ResultType> handle_result(Args args) {
    request_->transition(HandlerState::Dispatched);

    std::future<ResultType> pending;
    try {
      pending = get_result(std::move(args));
    } catch (const std::exception& exception) {
      WARNING(3, "Computation failed to start: {}", exception.what());
      request_->transition(HandlerState::Completed);
      throw;
    }

    return std::async(
        std::launch::async,
        [request = request_, pending = std::move(pending)]() mutable {
          return request->complete(pending);
        });
  }

  /* The computation, possibly asynchronous. */
  virtual std::future<ResultType> get_result(Args args) = 0;

  /* A future already holding the given result. */
  static std::future<ResultType> ready(ResultType result) {
    std::promise<ResultType> promise;
    promise.set_value(std::move(result));
    return promise.get_future();
  }

 private:
  /* State shared with the continuation of the request in flight. */
  struct Request {
    explicit Request(OutputSink& sink)
        : sink(sink), state(HandlerState::Created) {}

    /* Atomically moves an idle handler to `InputExtracted`. */
    HandlerState claim() {
      auto current = state.load();
      do {
        if (!is_idle(current)) {
          throw HandlerStateError(current);
        }
      } while (!state.compare_exchange_weak(
          current, HandlerState::InputExtracted));
      LOG(4,
          "Input handler: {} -> {}",
          show(current),
          show(HandlerState::InputExtracted));
      return current;
    }

    void transition(HandlerState next) {
      LOG(4, "Input handler: {} -> {}", show(state.load()), show(next));
      state.store(next);
    }

    ResultType complete(std::future<ResultType>& pending) {
      std::optional<ResultType> result;
      try {
        result.emplace(pending.get());
      } catch (const std::exception& exception) {
        WARNING(3, "Computation failed: {}", exception.what());
        transition(HandlerState::Completed);
        throw;
      }
      transition(HandlerState::Completed);

      result->match(
          [this](const Value& value) {
            auto payload = fmt::format("{}", value);
            LOG(3, "Writing `{}` to the output sink.", payload);
            sink.write(payload);
          },
          [](const Error& error) {
            LOG(3, "Not writing failed result: {}", error);
          });
      return std::move(*result);
    }

    OutputSink& sink;
    std::atomic<HandlerState> state;
  };

  const Validator<Args>& validator_;
  std::shared_ptr<Request> request_;
};

} // namespace taintflow
