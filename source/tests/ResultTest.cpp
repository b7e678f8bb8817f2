/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <memory>
#include <string>
#include <vector>

#include <gmock/gmock.h>

#include <taintflow/Result.h>
#include <taintflow/tests/Test.h>

namespace taintflow {

class ResultTest : public test::Test {};

TEST_F(ResultTest, SuccessGetReturnsValue) {
  EXPECT_EQ(Success(1).get(), 1);
  EXPECT_EQ(Success(std::string("payload")).get(), "payload");

  Result<std::string> result = Success(std::string("payload"));
  EXPECT_TRUE(result.is_success());
  EXPECT_FALSE(result.is_failure());
  EXPECT_EQ(result.get(), "payload");
  // Reads are idempotent.
  EXPECT_EQ(result.get(), "payload");

  Result<std::vector<int>> vector = Success(std::vector<int>{3, 1, 2});
  EXPECT_EQ(vector.get(), (std::vector<int>{3, 1, 2}));
}

TEST_F(ResultTest, SuccessPreservesIdentity) {
  auto pointer = std::make_shared<int>(42);
  Result<std::shared_ptr<int>> result = Success(pointer);
  EXPECT_EQ(result.get().get(), pointer.get());
}

TEST_F(ResultTest, FailureGetThrows) {
  Result<std::string> result = Failure(std::string("bad"));
  EXPECT_TRUE(result.is_failure());
  EXPECT_FALSE(result.is_success());
  EXPECT_THROW(result.get(), ResultMisuseError);
  // Every call fails, not only the first one.
  EXPECT_THROW(result.get(), ResultMisuseError);
  EXPECT_EQ(result.error(), "bad");

  Result<int, int> code = Failure(404);
  EXPECT_THROW(code.get(), ResultMisuseError);
  EXPECT_EQ(code.error(), 404);

  try {
    result.get();
    FAIL() << "Expected ResultMisuseError";
  } catch (const ResultMisuseError& error) {
    EXPECT_THAT(error.what(), testing::HasSubstr("bad"));
  }
}

TEST_F(ResultTest, SuccessErrorThrows) {
  Result<int> result = Success(1);
  EXPECT_THROW(result.error(), ResultMisuseError);
}

TEST_F(ResultTest, Match) {
  Result<int> success = Success(2);
  Result<int> failure = Failure(std::string("bad"));

  auto describe = [](const Result<int>& result) {
    return result.match(
        [](int value) { return fmt::format("success {}", value); },
        [](const std::string& error) { return fmt::format("failure {}", error); });
  };
  EXPECT_EQ(describe(success), "success 2");
  EXPECT_EQ(describe(failure), "failure bad");

  int successes = 0;
  int failures = 0;
  for (const auto& result : {success, failure, success}) {
    result.match([&](int) { successes++; }, [&](const std::string&) {
      failures++;
    });
  }
  EXPECT_EQ(successes, 2);
  EXPECT_EQ(failures, 1);

  auto moved = std::move(success).match(
      [](int&& value) { return value * 10; },
      [](std::string&&) { return -1; });
  EXPECT_EQ(moved, 20);
}

TEST_F(ResultTest, Covariance) {
  Result<std::string> from_literal = Success("payload");
  EXPECT_EQ(from_literal.get(), "payload");

  Result<std::string> from_literal_failure = Failure("bad");
  EXPECT_EQ(from_literal_failure.error(), "bad");

  Result<const char*, const char*> narrow = Success("narrow");
  Result<std::string, std::string> wide = narrow;
  EXPECT_EQ(wide.get(), "narrow");

  Result<int, const char*> narrow_failure = Failure("oops");
  Result<long, std::string> wide_failure = narrow_failure;
  EXPECT_EQ(wide_failure.error(), "oops");
}

TEST_F(ResultTest, Equality) {
  EXPECT_TRUE(
      Result<std::string>(Success(std::string("a"))) ==
      Result<std::string>(Success(std::string("a"))));
  EXPECT_TRUE(
      Result<std::string>(Success(std::string("a"))) !=
      Result<std::string>(Failure(std::string("a"))));
  EXPECT_TRUE(
      Result<std::string>(Failure(std::string("bad"))) ==
      Result<std::string>(Failure(std::string("bad"))));
}

} // namespace taintflow
