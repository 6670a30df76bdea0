// Copyright (c) Meta Platforms, Inc. and affiliates.

#include "comms/commparity/WorkerReport.hpp"

#include <stdexcept>
#include <utility>

#include <fmt/core.h>
#include <folly/json.h>

namespace commparity {

namespace {

WorkerState parseWorkerState(const std::string& str) {
  for (auto state :
       {WorkerState::JOINING,
        WorkerState::BACKEND_SELECTED,
        WorkerState::WARMUP,
        WorkerState::RUNNING,
        WorkerState::DONE,
        WorkerState::FAILED}) {
    if (getWorkerStateName(state) == str) {
      return state;
    }
  }
  throw std::invalid_argument(fmt::format("Unknown worker state '{}'", str));
}

const folly::dynamic& requireField(
    const folly::dynamic& obj,
    std::string_view where,
    const char* key) {
  const auto* value = obj.get_ptr(key);
  if (value == nullptr) {
    throw std::invalid_argument(fmt::format("{} is missing '{}'", where, key));
  }
  return *value;
}

int64_t getIntField(
    const folly::dynamic& obj,
    std::string_view where,
    const char* key) {
  const auto& value = requireField(obj, where, key);
  if (!value.isInt()) {
    throw std::invalid_argument(
        fmt::format("'{}' in {} must be an integer", key, where));
  }
  return value.getInt();
}

const std::string& getStringField(
    const folly::dynamic& obj,
    std::string_view where,
    const char* key) {
  const auto& value = requireField(obj, where, key);
  if (!value.isString()) {
    throw std::invalid_argument(
        fmt::format("'{}' in {} must be a string", key, where));
  }
  return value.getString();
}

VerificationResult failureFromDynamic(const folly::dynamic& obj) {
  constexpr std::string_view kWhere = "failed test case";
  if (!obj.isObject()) {
    throw std::invalid_argument("Failed test case must be a JSON object");
  }
  VerificationResult failure;
  failure.test_case.size = getIntField(obj, kWhere, "size");
  failure.test_case.element_type =
      parseElementType(getStringField(obj, kWhere, "element_type"));
  failure.test_case.mode =
      parseExecutionMode(getStringField(obj, kWhere, "mode"));
  failure.test_case.trial_index =
      static_cast<int>(getIntField(obj, kWhere, "trial"));
  failure.rank = static_cast<int>(getIntField(obj, kWhere, "rank"));
  const auto& passed = requireField(obj, kWhere, "passed");
  if (!passed.isBool()) {
    throw std::invalid_argument("'passed' in failed test case must be a bool");
  }
  failure.passed = passed.getBool();
  if (obj.count("detail") > 0) {
    failure.mismatch_detail = getStringField(obj, kWhere, "detail");
  }
  return failure;
}

} // namespace

std::string_view getWorkerStateName(WorkerState state) {
  switch (state) {
    case WorkerState::JOINING:
      return "Joining";
    case WorkerState::BACKEND_SELECTED:
      return "BackendSelected";
    case WorkerState::WARMUP:
      return "Warmup";
    case WorkerState::RUNNING:
      return "Running";
    case WorkerState::DONE:
      return "Done";
    case WorkerState::FAILED:
      return "Failed";
  }
  return "Unknown";
}

std::string WorkerReport::describe() const {
  if (succeeded()) {
    return fmt::format(
        "rank {} done after {} test cases", rank, cases_completed);
  }
  std::string description = fmt::format(
      "rank {} {} while in {}",
      rank,
      getWorkerStateName(state),
      getWorkerStateName(failed_in));
  if (error_kind) {
    description += fmt::format(" with {}", getErrorKindName(*error_kind));
  }
  if (failure) {
    description += " on " + failure->test_case.toString();
  }
  if (!message.empty()) {
    description += ": " + message;
  }
  return description;
}

folly::dynamic WorkerReport::toDynamic() const {
  folly::dynamic obj = folly::dynamic::object;
  obj["rank"] = rank;
  obj["state"] = std::string(getWorkerStateName(state));
  obj["failed_in"] = std::string(getWorkerStateName(failed_in));
  if (error_kind) {
    obj["error_kind"] = std::string(getErrorKindName(*error_kind));
  }
  obj["message"] = message;
  obj["cases_completed"] = cases_completed;
  if (failure) {
    const auto& test_case = failure->test_case;
    folly::dynamic case_obj = folly::dynamic::object;
    case_obj["size"] = test_case.size;
    case_obj["element_type"] =
        std::string(getElementTypeName(test_case.element_type));
    case_obj["mode"] = std::string(getModeName(test_case.mode));
    case_obj["trial"] = test_case.trial_index;
    case_obj["rank"] = failure->rank;
    case_obj["passed"] = failure->passed;
    if (failure->mismatch_detail) {
      case_obj["detail"] = *failure->mismatch_detail;
    }
    obj["failure"] = std::move(case_obj);
  }
  return obj;
}

WorkerReport WorkerReport::fromDynamic(const folly::dynamic& obj) {
  constexpr std::string_view kWhere = "worker report";
  if (!obj.isObject()) {
    throw std::invalid_argument("Worker report must be a JSON object");
  }

  WorkerReport report;
  report.rank = static_cast<int>(getIntField(obj, kWhere, "rank"));
  report.state = parseWorkerState(getStringField(obj, kWhere, "state"));
  if (obj.count("failed_in") > 0) {
    report.failed_in =
        parseWorkerState(getStringField(obj, kWhere, "failed_in"));
  }
  if (obj.count("error_kind") > 0) {
    const auto& kind = getStringField(obj, kWhere, "error_kind");
    report.error_kind = parseErrorKind(kind);
    if (!report.error_kind) {
      throw std::invalid_argument(
          fmt::format("Unknown error kind '{}' in worker report", kind));
    }
  }
  if (obj.count("message") > 0) {
    report.message = getStringField(obj, kWhere, "message");
  }
  if (obj.count("cases_completed") > 0) {
    report.cases_completed = getIntField(obj, kWhere, "cases_completed");
  }
  if (obj.count("failure") > 0) {
    report.failure = failureFromDynamic(obj["failure"]);
  }
  return report;
}

std::string WorkerReport::serialize() const {
  return folly::toJson(toDynamic());
}

WorkerReport WorkerReport::deserialize(std::string_view payload) {
  folly::dynamic obj;
  try {
    obj = folly::parseJson(folly::StringPiece(payload.data(), payload.size()));
  } catch (const std::exception& e) {
    throw std::invalid_argument(
        fmt::format("Failed to parse worker report: {}", e.what()));
  }
  return fromDynamic(obj);
}

std::string WorkerOutcome::describe() const {
  std::string description;
  if (report) {
    description = report->describe();
  } else {
    description = fmt::format("rank {} exited without a report", rank);
  }
  if (term_signal != 0) {
    description += fmt::format(" (killed by signal {})", term_signal);
  } else if (exit_code != 0) {
    description += fmt::format(" (exit code {})", exit_code);
  }
  return description;
}

} // namespace commparity
