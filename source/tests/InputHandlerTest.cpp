/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <chrono>
#include <future>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <gmock/gmock.h>

#include <taintflow/InputHandler.h>
#include <taintflow/RequestHandler.h>
#include <taintflow/tests/Test.h>

using testing::_;
using testing::InSequence;
using testing::MockFunction;
using testing::StrictMock;

namespace taintflow {

namespace {

class FailingHandler final : public InputHandler<RequestArgs> {
 public:
  using InputHandler<RequestArgs>::InputHandler;

 protected:
  std::future<ResultType> get_result(RequestArgs /* args */) override {
    return ready(Failure(std::string("bad")));
  }
};

/* Completes only when the test fulfills the promise. */
class PendingHandler final : public InputHandler<RequestArgs> {
 public:
  using InputHandler<RequestArgs>::InputHandler;

  std::promise<ResultType> promise;
  std::optional<RequestArgs> received;

 protected:
  std::future<ResultType> get_result(RequestArgs args) override {
    received = std::move(args);
    return promise.get_future();
  }
};

/* Runs on another thread, like a real asynchronous computation. */
class ThreadedHandler final : public InputHandler<RequestArgs, int> {
 public:
  using InputHandler<RequestArgs, int>::InputHandler;

 protected:
  std::future<ResultType> get_result(RequestArgs args) override {
    return std::async(std::launch::async, [args = std::move(args)]() {
      return ResultType(Success(static_cast<int>(args.a.size())));
    });
  }
};

/* The computation waits for `gate`, independently of the handler. */
class GatedHandler final : public InputHandler<RequestArgs> {
 public:
  GatedHandler(
      const Validator<RequestArgs>& validator,
      OutputSink& sink,
      std::shared_future<void> gate)
      : InputHandler<RequestArgs>(validator, sink), gate_(std::move(gate)) {}

 protected:
  std::future<ResultType> get_result(RequestArgs args) override {
    return std::async(
        std::launch::async, [gate = gate_, args = std::move(args)]() {
          gate.wait();
          return ResultType(Success(args.a));
        });
  }

 private:
  std::shared_future<void> gate_;
};

class ThrowingHandler final : public InputHandler<RequestArgs> {
 public:
  using InputHandler<RequestArgs>::InputHandler;

 protected:
  std::future<ResultType> get_result(RequestArgs /* args */) override {
    throw std::runtime_error("unavailable");
  }
};

} // namespace

class InputHandlerTest : public test::Test {};

TEST_F(InputHandlerTest, SuccessIsWrittenToSink) {
  RequestValidator validator(RequestArgs{"payload"});
  test::RecordingOutputSink sink;
  RequestHandler handler(validator, sink);
  EXPECT_EQ(handler.state(), HandlerState::Created);

  auto result = handler.get_validated_input().get();
  EXPECT_TRUE(result.is_success());
  EXPECT_EQ(result.get(), "payload");
  EXPECT_EQ(sink.values(), std::vector<std::string>{"payload"});
  EXPECT_EQ(handler.state(), HandlerState::Completed);
}

TEST_F(InputHandlerTest, FailureIsNotWrittenToSink) {
  RequestValidator validator(RequestArgs{"payload"});
  StrictMock<test::MockOutputSink> sink;
  EXPECT_CALL(sink, write(_)).Times(0);
  FailingHandler handler(validator, sink);

  auto result = handler.get_validated_input().get();
  EXPECT_TRUE(result.is_failure());
  EXPECT_EQ(result.error(), "bad");
  EXPECT_EQ(result, FailingHandler::ResultType(Failure(std::string("bad"))));
  EXPECT_EQ(handler.state(), HandlerState::Completed);
}

TEST_F(InputHandlerTest, SinkIsWrittenOnlyOnSuccess) {
  for (const std::string& input : {"", "a", "payload", "<script>"}) {
    RequestValidator validator(RequestArgs{input});

    StrictMock<test::MockOutputSink> success_sink;
    EXPECT_CALL(success_sink, write(input)).Times(1);
    RequestHandler success_handler(validator, success_sink);
    EXPECT_TRUE(success_handler.get_validated_input().get().is_success());

    StrictMock<test::MockOutputSink> failure_sink;
    EXPECT_CALL(failure_sink, write(_)).Times(0);
    FailingHandler failure_handler(validator, failure_sink);
    EXPECT_TRUE(failure_handler.get_validated_input().get().is_failure());
  }
}

TEST_F(InputHandlerTest, ComputationCompletesBeforeSinkWrite) {
  RequestValidator validator(RequestArgs{"payload"});
  StrictMock<test::MockOutputSink> sink;
  PendingHandler handler(validator, sink);

  MockFunction<void(std::string)> checkpoint;
  {
    InSequence sequence;
    EXPECT_CALL(checkpoint, Call("fulfilled"));
    EXPECT_CALL(sink, write("done"));
  }

  auto pending = handler.get_validated_input();
  // Extraction completed before the computation started.
  ASSERT_TRUE(handler.received.has_value());
  EXPECT_EQ(handler.received->a, "payload");
  EXPECT_EQ(handler.state(), HandlerState::Dispatched);
  EXPECT_EQ(
      pending.wait_for(std::chrono::milliseconds(50)),
      std::future_status::timeout);
  EXPECT_EQ(handler.state(), HandlerState::Dispatched);

  checkpoint.Call("fulfilled");
  handler.promise.set_value(Success(std::string("done")));

  auto result = pending.get();
  EXPECT_EQ(result.get(), "done");
  EXPECT_EQ(handler.state(), HandlerState::Completed);
}

TEST_F(InputHandlerTest, NonStringPayload) {
  RequestValidator validator(RequestArgs{"four"});
  test::RecordingOutputSink sink;
  ThreadedHandler handler(validator, sink);

  auto result = handler.get_validated_input().get();
  EXPECT_EQ(result.get(), 4);
  EXPECT_EQ(sink.values(), std::vector<std::string>{"4"});
}

TEST_F(InputHandlerTest, UninitializedInput) {
  RequestValidator validator;
  StrictMock<test::MockOutputSink> sink;
  RequestHandler handler(validator, sink);

  EXPECT_THROW(handler.get_validated_input(), UninitializedInputError);
  EXPECT_EQ(handler.state(), HandlerState::Created);

  validator.set_input(RequestArgs{"late"});
  EXPECT_CALL(sink, write("late"));
  EXPECT_EQ(handler.get_validated_input().get().get(), "late");
}

TEST_F(InputHandlerTest, OneRequestAtATime) {
  RequestValidator validator(RequestArgs{"payload"});
  test::RecordingOutputSink sink;
  PendingHandler handler(validator, sink);

  auto pending = handler.get_validated_input();
  try {
    handler.get_validated_input();
    FAIL() << "Expected HandlerStateError";
  } catch (const HandlerStateError& error) {
    EXPECT_EQ(error.state(), HandlerState::Dispatched);
  }

  handler.promise.set_value(Success(std::string("done")));
  EXPECT_EQ(pending.get().get(), "done");
  EXPECT_EQ(sink.values(), std::vector<std::string>{"done"});
}

TEST_F(InputHandlerTest, HandlerServesSuccessiveRequests) {
  RequestValidator validator(RequestArgs{"payload"});
  test::RecordingOutputSink sink;
  RequestHandler handler(validator, sink);

  EXPECT_EQ(handler.get_validated_input().get().get(), "payload");
  EXPECT_EQ(handler.get_validated_input().get().get(), "payload");
  EXPECT_EQ(sink.values(), (std::vector<std::string>{"payload", "payload"}));
}

TEST_F(InputHandlerTest, ComputationErrors) {
  RequestValidator validator(RequestArgs{"payload"});
  StrictMock<test::MockOutputSink> sink;
  EXPECT_CALL(sink, write(_)).Times(0);

  ThrowingHandler throwing_handler(validator, sink);
  EXPECT_THROW(throwing_handler.get_validated_input(), std::runtime_error);
  EXPECT_EQ(throwing_handler.state(), HandlerState::Completed);

  PendingHandler pending_handler(validator, sink);
  auto pending = pending_handler.get_validated_input();
  pending_handler.promise.set_exception(
      std::make_exception_ptr(std::runtime_error("unavailable")));
  EXPECT_THROW(pending.get(), std::runtime_error);
  EXPECT_EQ(pending_handler.state(), HandlerState::Completed);
}

TEST_F(InputHandlerTest, DroppedResultStillCompletes) {
  RequestValidator validator(RequestArgs{"payload"});
  test::RecordingOutputSink sink;
  RequestHandler handler(validator, sink);

  handler.get_validated_input();
  EXPECT_EQ(handler.state(), HandlerState::Completed);
  EXPECT_EQ(sink.values(), std::vector<std::string>{"payload"});

  EXPECT_EQ(handler.get_validated_input().get().get(), "payload");
  EXPECT_EQ(sink.values(), (std::vector<std::string>{"payload", "payload"}));
}

TEST_F(InputHandlerTest, DroppedPendingResultStillCompletes) {
  RequestValidator validator(RequestArgs{"payload"});
  test::RecordingOutputSink sink;
  PendingHandler handler(validator, sink);

  {
    auto pending = handler.get_validated_input();
    handler.promise.set_value(Success(std::string("done")));
  }
  EXPECT_EQ(handler.state(), HandlerState::Completed);
  EXPECT_EQ(sink.values(), std::vector<std::string>{"done"});
}

TEST_F(InputHandlerTest, ResultOutlivesHandler) {
  RequestValidator validator(RequestArgs{"payload"});
  test::RecordingOutputSink sink;
  std::promise<void> gate;

  std::future<RequestHandler::ResultType> pending;
  {
    GatedHandler handler(validator, sink, gate.get_future().share());
    pending = handler.get_validated_input();
  }
  EXPECT_TRUE(sink.values().empty());

  gate.set_value();
  EXPECT_EQ(pending.get().get(), "payload");
  EXPECT_EQ(sink.values(), std::vector<std::string>{"payload"});
}

TEST_F(InputHandlerTest, ConcurrentRequestsOnOneHandler) {
  RequestValidator validator(RequestArgs{"payload"});
  test::RecordingOutputSink sink;
  PendingHandler handler(validator, sink);

  for (int attempt = 0; attempt < 20; attempt++) {
    std::promise<void> start;
    auto started = start.get_future().share();
    auto request = [&handler, started]() {
      started.wait();
      try {
        return std::optional<std::future<PendingHandler::ResultType>>(
            handler.get_validated_input());
      } catch (const HandlerStateError&) {
        return std::optional<std::future<PendingHandler::ResultType>>();
      }
    };
    auto first = std::async(std::launch::async, request);
    auto second = std::async(std::launch::async, request);
    start.set_value();

    std::vector<std::future<PendingHandler::ResultType>> accepted;
    for (auto* outcome : {&first, &second}) {
      if (auto result = outcome->get()) {
        accepted.push_back(std::move(*result));
      }
    }
    ASSERT_EQ(accepted.size(), 1);

    handler.promise.set_value(Success(std::string("done")));
    EXPECT_EQ(accepted.front().get().get(), "done");
    EXPECT_EQ(handler.state(), HandlerState::Completed);
    handler.promise = std::promise<PendingHandler::ResultType>();
  }
  EXPECT_EQ(sink.values().size(), 20);
}

TEST_F(InputHandlerTest, StreamOutputSink) {
  std::ostringstream output;
  StreamOutputSink sink(output);
  RequestValidator validator(RequestArgs{"payload"});
  RequestHandler handler(validator, sink);

  handler.get_validated_input().get();
  EXPECT_EQ(output.str(), "payload\n");
}

} // namespace taintflow
