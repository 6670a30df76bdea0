// Copyright (c) Meta Platforms, Inc. and affiliates.

#pragma once

#include <cstdlib>
#include <memory>
#include <string>

#include <gtest/gtest.h>

#include "comms/commparity/GroupLauncher.hpp"
#include "comms/commparity/HarnessOptions.hpp"
#include "comms/commparity/ResultAggregator.hpp"

namespace commparity::test {

// Check if running on CPU (for skipping CUDA-specific tests)
inline bool isRunningOnCPU() {
  const char* test_device_env = std::getenv("TEST_DEVICE");
  return test_device_env && std::string(test_device_env) == "cpu";
}

// Harness options from the environment, as commparity_launch reads them.
HarnessOptions getIntegrationOptions();

// Launches one group that runs `run` with the backend the toggles select.
RunSummary launchGroup(
    const HarnessOptions& options,
    const RunOptions& run,
    int world_size);

// Fails the current test with the summary of every failing worker.
void expectPassed(const RunSummary& summary);

} // namespace commparity::test
