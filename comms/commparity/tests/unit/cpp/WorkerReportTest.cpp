// Copyright (c) Meta Platforms, Inc. and affiliates.

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "comms/commparity/WorkerReport.hpp"

using ::testing::HasSubstr;

namespace commparity::test {

namespace {
WorkerReport mismatchReport() {
  WorkerReport report;
  report.rank = 5;
  report.state = WorkerState::FAILED;
  report.failed_in = WorkerState::RUNNING;
  report.error_kind = ErrorKind::VERIFICATION_MISMATCH;
  report.message = "Verification failed\\on rank 5\nsecond line";
  report.cases_completed = 17;
  VerificationResult failure;
  failure.test_case = TestCase{
      32768, ElementType::FLOAT16, ExecutionMode::GRAPH_REPLAY, 4};
  failure.rank = 5;
  failure.passed = false;
  failure.mismatch_detail = "buffer 2: 1 of 32768 elements differ;\n";
  report.failure = failure;
  return report;
}
} // namespace

TEST(WorkerReportTest, DoneReportRoundTrip) {
  WorkerReport report;
  report.rank = 2;
  report.state = WorkerState::DONE;
  report.cases_completed = 150;

  auto parsed = WorkerReport::deserialize(report.serialize());
  EXPECT_EQ(parsed.rank, 2);
  EXPECT_EQ(parsed.state, WorkerState::DONE);
  EXPECT_TRUE(parsed.succeeded());
  EXPECT_FALSE(parsed.error_kind.has_value());
  EXPECT_FALSE(parsed.failure.has_value());
  EXPECT_EQ(parsed.cases_completed, 150);
  EXPECT_EQ(parsed.describe(), "rank 2 done after 150 test cases");
}

TEST(WorkerReportTest, FailureReportKeepsDetail) {
  auto report = mismatchReport();
  auto parsed = WorkerReport::deserialize(report.serialize());
  EXPECT_FALSE(parsed.succeeded());
  EXPECT_EQ(parsed.failed_in, WorkerState::RUNNING);
  EXPECT_EQ(parsed.error_kind, ErrorKind::VERIFICATION_MISMATCH);
  EXPECT_EQ(parsed.message, report.message);
  EXPECT_EQ(parsed.cases_completed, 17);
  ASSERT_TRUE(parsed.failure.has_value());
  EXPECT_EQ(parsed.failure->test_case, report.failure->test_case);
  EXPECT_EQ(parsed.failure->rank, 5);
  EXPECT_FALSE(parsed.failure->passed);
  EXPECT_EQ(parsed.failure->mismatch_detail, report.failure->mismatch_detail);
}

TEST(WorkerReportTest, ToDynamicFields) {
  auto obj = mismatchReport().toDynamic();
  EXPECT_EQ(obj["rank"].asInt(), 5);
  EXPECT_EQ(obj["state"].asString(), "Failed");
  EXPECT_EQ(obj["error_kind"].asString(), "VerificationMismatch");
  EXPECT_EQ(obj["failure"]["element_type"].asString(), "float16");
  EXPECT_EQ(obj["failure"]["mode"].asString(), "graph");

  WorkerReport done;
  done.rank = 0;
  done.state = WorkerState::DONE;
  auto done_obj = done.toDynamic();
  EXPECT_EQ(done_obj.count("error_kind"), 0);
  EXPECT_EQ(done_obj.count("failure"), 0);
}

TEST(WorkerReportTest, MissingOptionalFieldsUseDefaults) {
  auto parsed = WorkerReport::deserialize(R"({"rank": 1, "state": "Done"})");
  EXPECT_EQ(parsed.rank, 1);
  EXPECT_TRUE(parsed.succeeded());
  EXPECT_EQ(parsed.failed_in, WorkerState::JOINING);
  EXPECT_TRUE(parsed.message.empty());
  EXPECT_EQ(parsed.cases_completed, 0);
}

TEST(WorkerReportTest, DescribeFailure) {
  auto description = mismatchReport().describe();
  EXPECT_THAT(description, HasSubstr("rank 5 Failed while in Running"));
  EXPECT_THAT(description, HasSubstr("with VerificationMismatch"));
  EXPECT_THAT(
      description,
      HasSubstr("TestCase(size=32768, dtype=float16, mode=graph, trial=4)"));
}

TEST(WorkerReportTest, RejectsMalformedPayloads) {
  // Not JSON
  EXPECT_THROW(WorkerReport::deserialize("rank=1"), std::invalid_argument);
  EXPECT_THROW(WorkerReport::deserialize(R"({"rank": 1)"), std::invalid_argument);
  EXPECT_THROW(WorkerReport::deserialize(""), std::invalid_argument);
  // Not an object
  EXPECT_THROW(WorkerReport::deserialize("[1, 2]"), std::invalid_argument);
  // Missing or mistyped required fields
  EXPECT_THROW(
      WorkerReport::deserialize(R"({"state": "Done"})"), std::invalid_argument);
  EXPECT_THROW(
      WorkerReport::deserialize(R"({"rank": "x", "state": "Done"})"),
      std::invalid_argument);
  EXPECT_THROW(
      WorkerReport::deserialize(R"({"rank": 1, "state": "Sleeping"})"),
      std::invalid_argument);
  EXPECT_THROW(
      WorkerReport::deserialize(
          R"({"rank": 1, "state": "Failed", "error_kind": "Oops"})"),
      std::invalid_argument);
  EXPECT_THROW(
      WorkerReport::deserialize(
          R"({"rank": 1, "state": "Failed", "message": 7})"),
      std::invalid_argument);
  // Incomplete test case
  EXPECT_THROW(
      WorkerReport::deserialize(
          R"({"rank": 1, "state": "Failed", "failure": {"size": 4}})"),
      std::invalid_argument);
  EXPECT_THROW(
      WorkerReport::deserialize(
          R"({"rank": 1, "state": "Failed", "failure": 4})"),
      std::invalid_argument);
}

TEST(WorkerReportTest, OutcomeSucceeded) {
  WorkerOutcome outcome;
  outcome.rank = 0;
  outcome.exit_code = 0;
  EXPECT_FALSE(outcome.succeeded());

  WorkerReport done;
  done.rank = 0;
  done.state = WorkerState::DONE;
  outcome.report = done;
  EXPECT_TRUE(outcome.succeeded());

  outcome.exit_code = 1;
  EXPECT_FALSE(outcome.succeeded());
}

TEST(WorkerReportTest, OutcomeDescribeWithoutReport) {
  WorkerOutcome outcome;
  outcome.rank = 3;
  outcome.term_signal = 9;
  EXPECT_EQ(
      outcome.describe(), "rank 3 exited without a report (killed by signal 9)");

  outcome.term_signal = 0;
  outcome.exit_code = 1;
  EXPECT_EQ(outcome.describe(), "rank 3 exited without a report (exit code 1)");
}

} // namespace commparity::test
