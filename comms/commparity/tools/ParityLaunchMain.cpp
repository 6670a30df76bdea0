// Copyright (c) Meta Platforms, Inc. and affiliates.

// Forks a full parity group on this host for every execution mode and exits
// non-zero if any worker failed.

#include <cstdlib>
#include <exception>
#include <memory>

#include <gflags/gflags.h>

#include "comms/commparity/GroupLauncher.hpp"
#include "comms/commparity/HarnessOptions.hpp"
#include "comms/commparity/ParityException.hpp"
#include "comms/commparity/ParityLogging.hpp"

int main(int argc, char** argv) {
  gflags::SetUsageMessage(
      "Check accelerated allreduce backends against the reference backend. "
      "Configured through COMMPARITY_* environment variables.");
  gflags::ParseCommandLineFlags(&argc, &argv, true);
  commparity::tryParityLoggingInit(argv[0]);

  try {
    auto options = commparity::HarnessOptions::fromEnv();
    commparity::GroupLauncher launcher(
        std::make_shared<commparity::ForkProcessSpawner>());
    auto summary = commparity::runSuite(options, launcher);
    if (!summary.passed) {
      CP_LOG(ERROR) << summary.describe();
      return EXIT_FAILURE;
    }
    CP_LOG(INFO) << summary.describe();
    return EXIT_SUCCESS;
  } catch (const commparity::ParityException& e) {
    CP_LOG(ERROR) << commparity::getErrorKindName(e.kind()) << ": " << e.what();
    return EXIT_FAILURE;
  } catch (const std::exception& e) {
    CP_LOG(ERROR) << "Parity run failed: " << e.what();
    return EXIT_FAILURE;
  }
}
