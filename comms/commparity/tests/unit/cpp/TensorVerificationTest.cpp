// Copyright (c) Meta Platforms, Inc. and affiliates.

#include <cmath>

#include <ATen/ATen.h>
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "comms/commparity/TensorVerification.hpp"

using ::testing::HasSubstr;
using ::testing::Not;

namespace commparity::test {

class TensorVerificationTest : public ::testing::Test {
 protected:
  TestCase test_case_{16, ElementType::FLOAT32, ExecutionMode::EAGER, 0};
};

TEST_F(TensorVerificationTest, EqualTensorsPass) {
  for (auto dtype : {at::kFloat, at::kHalf, at::kBFloat16}) {
    auto expected = at::arange(16, at::kInt).to(dtype);
    auto result =
        verifyExactMatch(test_case_, 2, expected.clone(), expected, "buffer 1");
    EXPECT_TRUE(result.passed) << c10::toString(dtype);
    EXPECT_FALSE(result.mismatch_detail.has_value());
    EXPECT_EQ(result.rank, 2);
    EXPECT_EQ(result.test_case, test_case_);
  }
}

TEST_F(TensorVerificationTest, SingleElementDifferenceFails) {
  auto expected = at::full({16}, 8.0, at::kFloat);
  auto output = expected.clone();
  output[3] = 9.0;

  auto result = verifyExactMatch(test_case_, 0, output, expected, "buffer 2");
  EXPECT_FALSE(result.passed);
  ASSERT_TRUE(result.mismatch_detail.has_value());
  EXPECT_THAT(
      *result.mismatch_detail,
      HasSubstr("buffer 2: 1 of 16 elements differ; first 1:"));
  EXPECT_THAT(*result.mismatch_detail, HasSubstr("[3] output=9 expected=8"));
}

TEST_F(TensorVerificationTest, ReportsAtMostTenMismatches) {
  auto expected = at::zeros({64}, at::kBFloat16);
  auto output = at::ones({64}, at::kBFloat16);

  auto result = verifyExactMatch(test_case_, 0, output, expected, "replay 1");
  EXPECT_FALSE(result.passed);
  ASSERT_TRUE(result.mismatch_detail.has_value());
  EXPECT_THAT(
      *result.mismatch_detail,
      HasSubstr("64 of 64 elements differ; first 10:"));
  EXPECT_THAT(*result.mismatch_detail, HasSubstr("[9] "));
  EXPECT_THAT(*result.mismatch_detail, Not(HasSubstr("[10] ")));
}

TEST_F(TensorVerificationTest, ShapeMismatchFails) {
  auto result = verifyExactMatch(
      test_case_, 0, at::zeros({8}), at::zeros({16}), "buffer 1");
  EXPECT_FALSE(result.passed);
  ASSERT_TRUE(result.mismatch_detail.has_value());
  EXPECT_THAT(*result.mismatch_detail, HasSubstr("shape or dtype mismatch"));
}

TEST_F(TensorVerificationTest, DtypeMismatchFails) {
  auto result = verifyExactMatch(
      test_case_,
      0,
      at::zeros({16}, at::kHalf),
      at::zeros({16}, at::kFloat),
      "buffer 1");
  EXPECT_FALSE(result.passed);
}

TEST_F(TensorVerificationTest, ComparisonIsExact) {
  // Differences far below any tolerance still fail
  auto expected = at::full({4}, 1.0, at::kFloat);
  auto output = expected.clone();
  output[0] = std::nextafter(1.0f, 2.0f);
  EXPECT_FALSE(
      verifyExactMatch(test_case_, 0, output, expected, "buffer 1").passed);
}

} // namespace commparity::test
