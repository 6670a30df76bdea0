// Copyright (c) Meta Platforms, Inc. and affiliates.

// Runs a single rank of a parity group. Used when ranks are started by an
// external launcher (mpirun, torchrun) instead of commparity_launch.

#include <cstdlib>
#include <exception>

#include <gflags/gflags.h>

#include "comms/commparity/BackendSelection.hpp"
#include "comms/commparity/HarnessOptions.hpp"
#include "comms/commparity/ParityLogging.hpp"
#include "comms/commparity/ParityUtils.hpp"
#include "comms/commparity/WorkerDriver.hpp"

DEFINE_int32(rank, -1, "Rank of this worker (default: from launcher env)");
DEFINE_int32(
    world_size,
    -1,
    "Number of workers in the group (default: from launcher env)");
DEFINE_string(
    master_addr,
    "",
    "Rendezvous host (default: MASTER_ADDR, then COMMPARITY_TEST_MASTER_ADDR)");
DEFINE_int32(port, -1, "Rendezvous port (default: MASTER_PORT)");
DEFINE_string(
    backend,
    "",
    "Backend under test: none, mscclpp or custom_allreduce (default: from "
    "COMMPARITY_ENABLE_* toggles)");
DEFINE_string(mode, "all", "Execution modes to run: all, eager or graph");

namespace {

using namespace commparity;

int runWorker() {
  auto options = HarnessOptions::fromEnv();

  int rank = FLAGS_rank;
  int world_size = FLAGS_world_size;
  if (rank < 0 || world_size < 0) {
    auto [env_rank, env_size] = query_ranksize();
    rank = rank < 0 ? env_rank : rank;
    world_size = world_size < 0 ? env_size : world_size;
  }
  setDefaultLogRank(rank);

  std::string master_addr = FLAGS_master_addr;
  if (master_addr.empty()) {
    master_addr = env_to_value<std::string>("MASTER_ADDR", options.master_addr);
  }
  int port = FLAGS_port;
  if (port < 0) {
    port = env_to_value<int>("MASTER_PORT", -1);
  }

  BackendFlag backend_flag = FLAGS_backend.empty()
      ? selectBackend(options.toggles)
      : parseBackendFlag(FLAGS_backend);

  auto run_options = options.runOptions();
  if (FLAGS_mode != "all") {
    run_options.matrix.modes = {parseExecutionMode(FLAGS_mode)};
  }

  GroupConfig group{
      .world_size = world_size,
      .master_address = master_addr,
      .rendezvous_port = port,
      .backend_flag = backend_flag,
  };
  group.validate();

  WorkerDriver driver(WorkerContext{.rank = rank, .group = group}, run_options);
  auto report = driver.run();
  if (!report.succeeded()) {
    CP_LOG(ERROR) << "Worker failed: " << report.describe();
    return EXIT_FAILURE;
  }
  CP_LOG(INFO) << "Worker finished: " << report.describe();
  return EXIT_SUCCESS;
}

} // namespace

int main(int argc, char** argv) {
  gflags::SetUsageMessage("Run one rank of an allreduce parity group");
  gflags::ParseCommandLineFlags(&argc, &argv, true);
  commparity::tryParityLoggingInit(argv[0]);

  try {
    return runWorker();
  } catch (const std::exception& e) {
    CP_LOG(ERROR) << "Worker setup failed: " << e.what();
    return EXIT_FAILURE;
  }
}
