// Copyright (c) Meta Platforms, Inc. and affiliates.

#include "comms/commparity/ResultAggregator.hpp"

#include <stdexcept>
#include <utility>

#include <fmt/core.h>
#include <fmt/ranges.h>

namespace commparity {

ResultAggregator::ResultAggregator(int world_size)
    : world_size_(world_size),
      seen_(world_size > 0 ? static_cast<size_t>(world_size) : 0, false) {
  if (world_size <= 0) {
    throw std::invalid_argument(
        fmt::format("world_size must be positive, got {}", world_size));
  }
}

void ResultAggregator::record(WorkerOutcome outcome) {
  if (outcome.rank < 0 || outcome.rank >= world_size_) {
    throw std::invalid_argument(
        fmt::format(
            "Outcome for rank {} is outside of the group of size {}",
            outcome.rank,
            world_size_));
  }
  if (seen_[outcome.rank]) {
    throw std::invalid_argument(
        fmt::format("Outcome for rank {} recorded twice", outcome.rank));
  }
  seen_[outcome.rank] = true;
  outcomes_.push_back(std::move(outcome));
}

RunSummary ResultAggregator::summarize() const {
  RunSummary summary;
  summary.world_size = world_size_;
  summary.outcomes = outcomes_;
  for (int rank = 0; rank < world_size_; ++rank) {
    if (!seen_[rank]) {
      summary.missing_ranks.push_back(rank);
    }
  }
  for (const auto& outcome : outcomes_) {
    if (!outcome.succeeded()) {
      summary.first_failure = outcome;
      break;
    }
  }
  summary.passed = summary.missing_ranks.empty() && !summary.first_failure;
  return summary;
}

std::string RunSummary::describe() const {
  if (passed) {
    return fmt::format("PASSED: all {} workers completed", world_size);
  }
  std::string description = "FAILED";
  if (first_failure) {
    description += ": " + first_failure->describe();
  }
  if (!missing_ranks.empty()) {
    description += fmt::format(
        "; no outcome for ranks [{}]", fmt::join(missing_ranks, ", "));
  }
  return description;
}

} // namespace commparity
