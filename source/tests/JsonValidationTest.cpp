/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <ios>
#include <string>

#include <gmock/gmock.h>

#include <taintflow/JsonReaderWriter.h>
#include <taintflow/JsonValidation.h>
#include <taintflow/Kind.h>
#include <taintflow/KindFactory.h>
#include <taintflow/tests/Test.h>

namespace taintflow {

class JsonValidationTest : public test::Test {};

TEST_F(JsonValidationTest, Strings) {
  auto value = test::parse_json(R"({"method": "Foo::bar", "parameter": 1})");
  EXPECT_EQ(JsonValidation::string(value, "method"), "Foo::bar");
  EXPECT_THROW(JsonValidation::string(value, "parameter"), JsonValidationError);
  EXPECT_THROW(JsonValidation::string(value, "class"), JsonValidationError);
  EXPECT_EQ(JsonValidation::optional_string(value, "class"), std::nullopt);
  EXPECT_THROW(
      JsonValidation::optional_string(value, "parameter"), JsonValidationError);
  EXPECT_EQ(JsonValidation::string(test::parse_json(R"("xss")")), "xss");
  EXPECT_THROW(
      JsonValidation::string(test::parse_json("1")), JsonValidationError);
}

TEST_F(JsonValidationTest, Integers) {
  auto value = test::parse_json(R"({"verbosity": 2, "parameter": -1, "level": "high"})");
  EXPECT_EQ(JsonValidation::optional_integer(value, "verbosity"), 2);
  EXPECT_EQ(JsonValidation::optional_integer(value, "missing"), std::nullopt);
  EXPECT_EQ(JsonValidation::optional_integer(value, "parameter"), -1);
  EXPECT_THROW(
      JsonValidation::optional_integer(value, "level"), JsonValidationError);
  EXPECT_THROW(
      JsonValidation::unsigned_integer(value, "parameter"),
      JsonValidationError);
  EXPECT_EQ(JsonValidation::unsigned_integer(value, "verbosity"), 2u);
}

TEST_F(JsonValidationTest, Arrays) {
  auto value = test::parse_json(R"({"sink": ["xss"], "empty": [], "null": null})");
  EXPECT_EQ(JsonValidation::nonempty_array(value, "sink").size(), 1);
  EXPECT_THROW(
      JsonValidation::nonempty_array(value, "empty"), JsonValidationError);
  EXPECT_THROW(
      JsonValidation::nonempty_array(value, "missing"), JsonValidationError);
  EXPECT_TRUE(JsonValidation::optional_array(value, "null").isNull());
  EXPECT_TRUE(JsonValidation::optional_array(value, "missing").isNull());
  EXPECT_TRUE(JsonValidation::optional_array(value, "empty").empty());
  EXPECT_THROW(
      JsonValidation::optional_array(test::parse_json("{}")),
      JsonValidationError);
}

TEST_F(JsonValidationTest, Members) {
  auto value = test::parse_json(R"({"method": "Foo::get", "return": true})");
  EXPECT_TRUE(JsonValidation::has_field(value, "method"));
  EXPECT_FALSE(JsonValidation::has_field(value, "parameter"));
  EXPECT_TRUE(JsonValidation::boolean(value, "return"));
  EXPECT_THROW(JsonValidation::boolean(value, "method"), JsonValidationError);

  EXPECT_NO_THROW(
      JsonValidation::only_fields(value, {"method", "return"}));
  EXPECT_THROW(
      JsonValidation::only_fields(value, {"method"}),
      JsonValidationError);
  EXPECT_THROW(
      JsonValidation::only_fields(
          test::parse_json("[]"), {"method"}),
      JsonValidationError);
}

TEST_F(JsonValidationTest, ErrorMessages) {
  try {
    JsonValidation::string(test::parse_json(R"({"method": 1})"), "method");
    FAIL() << "Expected JsonValidationError";
  } catch (const JsonValidationError& error) {
    EXPECT_EQ(
        std::string(error.what()),
        R"(Invalid field `method` in `{"method":1}`: expected a string.)");
  }

  try {
    JsonValidation::only_fields(
        test::parse_json(R"({"site": null, "sinks": []})"), {"source", "site"});
    FAIL() << "Expected JsonValidationError";
  } catch (const JsonValidationError& error) {
    EXPECT_THAT(
        std::string(error.what()),
        testing::HasSubstr("Invalid field `sinks` in `"));
    EXPECT_THAT(
        std::string(error.what()),
        testing::HasSubstr("expected one of `site`, `source`."));
  }

  try {
    Kind::from_json(test::parse_json(R"("")"), KindFactory());
    FAIL() << "Expected JsonValidationError";
  } catch (const JsonValidationError& error) {
    EXPECT_EQ(
        std::string(error.what()),
        R"(Invalid JSON `""`: expected a non-empty kind name.)");
  }
}

TEST_F(JsonValidationTest, Reader) {
  EXPECT_THROW(JsonReader::parse_json("{"), std::invalid_argument);

  auto directory = test::make_temporary_directory("json");
  test::write_file(directory / "valid.json", R"({"sink": ["xss"]})");
  test::write_file(directory / "invalid.json", "[1,");

  EXPECT_EQ(
      JsonReader::parse_json_file(directory / "valid.json"),
      test::parse_json(R"({"sink": ["xss"]})"));
  EXPECT_THROW(
      JsonReader::parse_json_file(directory / "invalid.json"),
      std::invalid_argument);
  EXPECT_THROW(
      JsonReader::parse_json_file(directory / "missing.json"),
      std::ios_base::failure);

  auto value = test::parse_json(R"({"sinks": [], "kinds": ["xss"]})");
  JsonWriter::write_json_file(directory / "output.json", value);
  EXPECT_EQ(JsonReader::parse_json_file(directory / "output.json"), value);
  EXPECT_EQ(
      JsonWriter::to_compact_string(value), R"({"kinds":["xss"],"sinks":[]})");
}

} // namespace taintflow
