/*
 * Copyright 2020 Google LLC
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *      http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#include "simple-cas/scalar.h"

#include <cstdint>
#include <limits>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "simple-cas/error.h"

using namespace simple_cas;
using ::testing::HasSubstr;

namespace {

constexpr int64_t kMax = std::numeric_limits<int64_t>::max();
constexpr int64_t kMin = std::numeric_limits<int64_t>::min();

class EvaluateBinOpTest : public ::testing::Test {
 protected:
  void TestValue(BinOp op, int64_t lhs, int64_t rhs, int64_t expected) {
    SCOPED_TRACE(::testing::Message() << "[evaluating]: " << lhs << " "
                                      << bin_op_name(op) << " " << rhs);
    Error error;
    int64_t value = EvaluateBinOp(op, lhs, rhs, error);
    EXPECT_EQ(error.code(), ErrorCode::kOk);
    EXPECT_EQ(error.message(), "");
    EXPECT_EQ(value, expected);
  }

  void TestError(BinOp op, int64_t lhs, int64_t rhs, ErrorCode code,
                 const std::string& msg) {
    SCOPED_TRACE(::testing::Message() << "[evaluating]: " << lhs << " "
                                      << bin_op_name(op) << " " << rhs);
    Error error;
    EvaluateBinOp(op, lhs, rhs, error);
    EXPECT_EQ(error.code(), code);
    EXPECT_THAT(error.message(), HasSubstr(msg));
  }
};

TEST_F(EvaluateBinOpTest, Arithmetic) {
  TestValue(BinOp::Add, 1, 2, 3);
  TestValue(BinOp::Sub, 2, 5, -3);
  TestValue(BinOp::Mul, 6, 7, 42);
  TestValue(BinOp::Mul, -3, 4, -12);
  TestValue(BinOp::Div, 8, 2, 4);
  TestValue(BinOp::Div, 0, 5, 0);
}

TEST_F(EvaluateBinOpTest, DivisionRoundsDown) {
  TestValue(BinOp::Div, 7, 2, 3);
  TestValue(BinOp::Div, -7, 2, -4);
  TestValue(BinOp::Div, 7, -2, -4);
  TestValue(BinOp::Div, -7, -2, 3);
  TestValue(BinOp::Div, -6, 3, -2);
  TestValue(BinOp::Div, 6, -3, -2);
  TestValue(BinOp::Div, kMin, 1, kMin);
}

TEST_F(EvaluateBinOpTest, DivisionByZero) {
  TestError(BinOp::Div, 4, 0, ErrorCode::kDivisionByZero, "division by zero");
  TestError(BinOp::Div, 0, 0, ErrorCode::kDivisionByZero, "division by zero");
}

TEST_F(EvaluateBinOpTest, Overflow) {
  TestValue(BinOp::Add, kMax - 1, 1, kMax);
  TestValue(BinOp::Sub, kMin + 1, 1, kMin);

  TestError(BinOp::Add, kMax, 1, ErrorCode::kIntegerOverflow,
            "integer overflow");
  TestError(BinOp::Sub, kMin, 1, ErrorCode::kIntegerOverflow,
            "integer overflow");
  TestError(BinOp::Mul, kMax / 2 + 1, 2, ErrorCode::kIntegerOverflow,
            "integer overflow");
  TestError(BinOp::Div, kMin, -1, ErrorCode::kIntegerOverflow,
            "integer overflow");
}

TEST(ValidateConstantValueTest, RejectsNegativeValues) {
  Error error;
  EXPECT_TRUE(ValidateConstantValue(0, error));
  EXPECT_TRUE(ValidateConstantValue(kMax, error));
  EXPECT_FALSE(error);

  EXPECT_FALSE(ValidateConstantValue(-1, error));
  EXPECT_EQ(error.code(), ErrorCode::kNegativeConstant);
  EXPECT_THAT(error.message(), HasSubstr("negative constant: -1"));

  error.Clear();
  EXPECT_FALSE(error);
  EXPECT_EQ(error.message(), "");
}

}  // namespace
