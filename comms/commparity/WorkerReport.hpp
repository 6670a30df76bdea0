// Copyright (c) Meta Platforms, Inc. and affiliates.

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <folly/dynamic.h>

#include "comms/commparity/ParityException.hpp"
#include "comms/commparity/ParityTypes.hpp"

namespace commparity {

enum class WorkerState {
  JOINING = 0,
  BACKEND_SELECTED,
  WARMUP,
  RUNNING,
  DONE,
  FAILED,
};

std::string_view getWorkerStateName(WorkerState state);

/**
 * WorkerReport - What a worker tells the launcher when it exits.
 *
 * Travels to the launcher as a JSON object. deserialize() and fromDynamic()
 * throw std::invalid_argument for payloads that are not a well-formed report.
 */
struct WorkerReport {
  int rank{-1};
  WorkerState state{WorkerState::JOINING};
  // State the worker was in when it failed.
  WorkerState failed_in{WorkerState::JOINING};
  std::optional<ErrorKind> error_kind;
  std::string message;
  // Set when the failure happened while running a test case.
  std::optional<VerificationResult> failure;
  int64_t cases_completed{0};

  bool succeeded() const {
    return state == WorkerState::DONE;
  }

  std::string describe() const;

  folly::dynamic toDynamic() const;
  static WorkerReport fromDynamic(const folly::dynamic& obj);

  std::string serialize() const;
  static WorkerReport deserialize(std::string_view payload);
};

// How a worker process ended, as observed by the launcher.
struct WorkerOutcome {
  int rank{-1};
  // -1 if the process did not exit normally.
  int exit_code{-1};
  // Non-zero if the process was killed by a signal.
  int term_signal{0};
  // Missing if the worker died before writing a report.
  std::optional<WorkerReport> report;

  bool succeeded() const {
    return exit_code == 0 && report.has_value() && report->succeeded();
  }

  std::string describe() const;
};

} // namespace commparity
