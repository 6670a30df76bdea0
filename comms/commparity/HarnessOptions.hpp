// Copyright (c) Meta Platforms, Inc. and affiliates.

#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include <c10/core/DeviceType.h>

#include "comms/commparity/BackendSelection.hpp"
#include "comms/commparity/ParityTypes.hpp"
#include "comms/commparity/TestMatrix.hpp"

namespace commparity {

constexpr int kDefaultWorldSize = 8;
constexpr int kLargeWorldSize = 16;
constexpr uint64_t kDefaultSeed = 42;
constexpr int kDefaultNumReplays = 2;

// Everything a worker needs besides its GroupConfig and rank.
struct RunOptions {
  TestMatrixParams matrix;
  uint64_t seed{kDefaultSeed};
  int num_replays{kDefaultNumReplays};
  std::chrono::milliseconds bootstrap_timeout{kDefaultBootstrapTimeout};
  // Bounds every device synchronization and is handed to the backends.
  std::chrono::milliseconds collective_timeout{kDefaultTimeout};
  c10::DeviceType device_type{c10::DeviceType::CUDA};

  bool operator==(const RunOptions& other) const = default;
};

/**
 * HarnessOptions - Process-level configuration of a parity run.
 *
 * Read once by the launcher. Workers receive the derived GroupConfig and
 * RunOptions and never look at the environment themselves.
 */
struct HarnessOptions {
  std::string master_addr{"localhost"};
  bool large_group{false};
  BackendToggles toggles;
  int num_trials{kDefaultNumTrials};
  uint64_t seed{kDefaultSeed};
  int num_replays{kDefaultNumReplays};
  std::chrono::milliseconds bootstrap_timeout{kDefaultBootstrapTimeout};
  std::chrono::milliseconds collective_timeout{kDefaultTimeout};
  c10::DeviceType device_type{c10::DeviceType::CUDA};

  // Reads the COMMPARITY_* variables and TEST_DEVICE. Throws
  // std::runtime_error on malformed values.
  static HarnessOptions fromEnv();

  int worldSize() const {
    return large_group ? kLargeWorldSize : kDefaultWorldSize;
  }

  // Default matrix with both modes.
  RunOptions runOptions() const;
};

} // namespace commparity
