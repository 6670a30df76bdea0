// Copyright (c) Meta Platforms, Inc. and affiliates.

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "comms/commparity/WorkerReport.hpp"

namespace commparity {

struct RunSummary {
  bool passed{false};
  int world_size{0};
  // Outcomes in the order they were recorded.
  std::vector<WorkerOutcome> outcomes;
  // First failing outcome in recording order, if any.
  std::optional<WorkerOutcome> first_failure;
  std::vector<int> missing_ranks;

  std::string describe() const;
};

/**
 * ResultAggregator - Folds per-rank outcomes into a group verdict.
 *
 * The run passes iff every rank in [0, world_size) recorded an outcome that
 * exited with status 0 and reported Done.
 */
class ResultAggregator {
 public:
  explicit ResultAggregator(int world_size);

  // Throws std::invalid_argument for ranks outside the group or recorded
  // twice.
  void record(WorkerOutcome outcome);

  RunSummary summarize() const;

 private:
  const int world_size_;
  std::vector<WorkerOutcome> outcomes_;
  std::vector<bool> seen_;
};

} // namespace commparity
