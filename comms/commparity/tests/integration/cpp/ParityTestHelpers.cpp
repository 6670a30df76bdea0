// Copyright (c) Meta Platforms, Inc. and affiliates.

#include "ParityTestHelpers.hpp"

#include "comms/commparity/BackendSelection.hpp"
#include "comms/commparity/ProcessSpawner.hpp"

namespace commparity::test {

HarnessOptions getIntegrationOptions() {
  return HarnessOptions::fromEnv();
}

RunSummary launchGroup(
    const HarnessOptions& options,
    const RunOptions& run,
    int world_size) {
  GroupLauncher launcher(std::make_shared<ForkProcessSpawner>());
  return launcher.launch(
      world_size,
      options.master_addr,
      selectBackend(options.toggles),
      makeWorkerEntry(run));
}

void expectPassed(const RunSummary& summary) {
  EXPECT_TRUE(summary.passed) << summary.describe();
  for (const auto& outcome : summary.outcomes) {
    EXPECT_TRUE(outcome.succeeded()) << outcome.describe();
  }
}

} // namespace commparity::test
