// Copyright (c) Meta Platforms, Inc. and affiliates.

#include "comms/commparity/TestMatrix.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

#include <fmt/core.h>

namespace commparity {

namespace {

constexpr uint64_t kFnvOffsetBasis = 14695981039346656037ULL;
constexpr uint64_t kFnvPrime = 1099511628211ULL;

void fnvMix(uint64_t& hash, uint64_t value, int num_bytes) {
  for (int i = 0; i < num_bytes; ++i) {
    hash ^= (value >> (8 * i)) & 0xff;
    hash *= kFnvPrime;
  }
}

} // namespace

TestMatrixParams defaultTestMatrixParams(int num_trials) {
  return TestMatrixParams{
      .sizes = {512, 4096, 32768, 262144, 524288},
      .element_types =
          {ElementType::FLOAT32, ElementType::FLOAT16, ElementType::BFLOAT16},
      .modes = {ExecutionMode::EAGER, ExecutionMode::GRAPH_REPLAY},
      .num_trials = num_trials,
  };
}

TestMatrix::TestMatrix(TestMatrixParams params) : params_(std::move(params)) {
  if (params_.sizes.empty()) {
    throw std::invalid_argument("Test matrix needs at least one size");
  }
  if (params_.element_types.empty()) {
    throw std::invalid_argument("Test matrix needs at least one element type");
  }
  if (params_.modes.empty()) {
    throw std::invalid_argument("Test matrix needs at least one mode");
  }
  if (params_.num_trials < 0) {
    throw std::invalid_argument(
        fmt::format(
            "Number of trials must not be negative, got {}",
            params_.num_trials));
  }
  for (auto size : params_.sizes) {
    if (size <= 0) {
      throw std::invalid_argument(
          fmt::format("Test sizes must be positive, got {}", size));
    }
  }

  auto& sizes = params_.sizes;
  std::sort(sizes.begin(), sizes.end());
  sizes.erase(std::unique(sizes.begin(), sizes.end()), sizes.end());
}

size_t TestMatrix::size() const {
  return params_.modes.size() * params_.sizes.size() *
      params_.element_types.size() * static_cast<size_t>(params_.num_trials);
}

TestCase TestMatrix::at(size_t index) const {
  if (index >= size()) {
    throw std::out_of_range(
        fmt::format("Test case index {} out of range ({})", index, size()));
  }
  const size_t num_trials = params_.num_trials;
  const size_t num_types = params_.element_types.size();
  const size_t num_sizes = params_.sizes.size();

  TestCase test_case;
  test_case.trial_index = static_cast<int>(index % num_trials);
  index /= num_trials;
  test_case.element_type = params_.element_types[index % num_types];
  index /= num_types;
  test_case.size = params_.sizes[index % num_sizes];
  index /= num_sizes;
  test_case.mode = params_.modes[index];
  return test_case;
}

std::vector<TestCase> TestMatrix::enumerate() const {
  return std::vector<TestCase>(begin(), end());
}

uint64_t TestMatrix::digest() const {
  uint64_t hash = kFnvOffsetBasis;
  for (const auto& test_case : *this) {
    fnvMix(hash, static_cast<uint64_t>(test_case.size), 8);
    fnvMix(hash, static_cast<uint64_t>(test_case.element_type), 1);
    fnvMix(hash, static_cast<uint64_t>(test_case.mode), 1);
    fnvMix(hash, static_cast<uint64_t>(test_case.trial_index), 4);
  }
  return hash;
}

} // namespace commparity
