// Copyright (c) Meta Platforms, Inc. and affiliates.

#include "comms/commparity/GroupLauncher.hpp"

#include <chrono>
#include <stdexcept>
#include <thread>
#include <utility>
#include <vector>

#include <fmt/core.h>

#include "comms/commparity/BackendSelection.hpp"
#include "comms/commparity/ParityLogging.hpp"
#include "comms/commparity/PortAllocator.hpp"
#include "comms/commparity/WorkerDriver.hpp"

namespace commparity {

namespace {

// Keeps a spawner session open for the lifetime of the guard.
class SpawnerSession {
 public:
  explicit SpawnerSession(ProcessSpawner& spawner) : spawner_(spawner) {
    spawner_.start();
  }

  ~SpawnerSession() {
    try {
      spawner_.shutdown();
    } catch (const std::exception& e) {
      CP_LOG(ERROR) << "Failed to shut down spawner session: " << e.what();
    }
  }

  SpawnerSession(const SpawnerSession&) = delete;
  SpawnerSession& operator=(const SpawnerSession&) = delete;

 private:
  ProcessSpawner& spawner_;
};

void abandonWorkers(std::vector<std::unique_ptr<JoinHandle>>& handles) {
  for (auto& handle : handles) {
    handle->terminate();
  }
  for (auto& handle : handles) {
    try {
      handle->join();
    } catch (const std::exception& e) {
      CP_LOG(ERROR) << "Failed to join terminated worker for rank "
                    << handle->getRank() << ": " << e.what();
    }
  }
}

constexpr std::chrono::milliseconds kCollectPollInterval{10};

// A handle that cannot be polled is treated as finished so join() reports it.
bool workerFinished(JoinHandle& handle) {
  try {
    return handle.finished();
  } catch (const std::exception& e) {
    CP_LOG(ERROR) << "Failed to poll worker for rank " << handle.getRank()
                  << ": " << e.what();
    return true;
  }
}

// Never throws. A worker that cannot be joined is recorded as failed.
WorkerOutcome collectOutcome(JoinHandle& handle) {
  try {
    return handle.join();
  } catch (const std::exception& e) {
    WorkerReport report;
    report.rank = handle.getRank();
    report.state = WorkerState::FAILED;
    report.message = fmt::format("Failed to join worker: {}", e.what());
    CP_LOG(ERROR) << report.message << " (rank " << report.rank << ")";
    return WorkerOutcome{
        .rank = handle.getRank(), .exit_code = -1, .report = std::move(report)};
  }
}

} // namespace

WorkerEntry makeWorkerEntry(RunOptions options) {
  return [options = std::move(options)](const WorkerArgs& args) {
    tryParityLoggingInit("commparity_worker");
    WorkerDriver driver(
        WorkerContext{.rank = args.rank, .group = args.group}, options);
    return driver.run();
  };
}

GroupLauncher::GroupLauncher(
    std::shared_ptr<ProcessSpawner> spawner,
    PortAllocatorFn port_allocator)
    : spawner_(std::move(spawner)),
      port_allocator_(
          port_allocator ? std::move(port_allocator) : PortAllocatorFn(&getOpenPort)) {
  if (!spawner_) {
    throw std::invalid_argument("GroupLauncher needs a process spawner");
  }
}

RunSummary GroupLauncher::launch(
    int world_size,
    const std::string& master_address,
    BackendFlag backend_flag,
    const WorkerEntry& entry) {
  if (world_size <= 0) {
    throw std::invalid_argument(
        fmt::format("world_size must be positive, got {}", world_size));
  }

  GroupConfig group{
      .world_size = world_size,
      .master_address = master_address,
      .rendezvous_port = port_allocator_(),
      .backend_flag = backend_flag,
  };
  group.validate();
  CP_LOG(INFO) << "Launching " << world_size << " workers, rendezvous at "
               << group.master_address << ":" << group.rendezvous_port
               << ", backend flag " << getBackendFlagName(backend_flag);

  SpawnerSession session(*spawner_);

  std::vector<std::unique_ptr<JoinHandle>> handles;
  handles.reserve(world_size);
  try {
    for (int rank = 0; rank < world_size; ++rank) {
      handles.push_back(
          spawner_->spawn(entry, WorkerArgs{.group = group, .rank = rank}));
    }
  } catch (const std::exception& e) {
    CP_LOG(ERROR) << "Failed to spawn worker " << handles.size() << ": "
                  << e.what() << "; terminating " << handles.size()
                  << " started workers";
    abandonWorkers(handles);
    throw;
  }

  // Outcomes are recorded as workers finish, so the rank that failed first
  // is reported ahead of peers that only timed out waiting for it.
  ResultAggregator aggregator(world_size);
  std::vector<bool> collected(handles.size(), false);
  size_t remaining = handles.size();
  while (remaining > 0) {
    bool progressed = false;
    for (size_t i = 0; i < handles.size(); ++i) {
      if (collected[i] || !workerFinished(*handles[i])) {
        continue;
      }
      collected[i] = true;
      --remaining;
      progressed = true;
      auto outcome = collectOutcome(*handles[i]);
      if (!outcome.succeeded()) {
        CP_LOG(ERROR) << "Worker failed: " << outcome.describe();
      }
      aggregator.record(std::move(outcome));
    }
    if (!progressed) {
      std::this_thread::sleep_for(kCollectPollInterval);
    }
  }

  auto summary = aggregator.summarize();
  if (summary.passed) {
    CP_LOG(INFO) << summary.describe();
  } else {
    CP_LOG(ERROR) << summary.describe();
  }
  return summary;
}

RunSummary runSuite(
    const HarnessOptions& options,
    GroupLauncher& launcher,
    const WorkerEntryFactory& make_entry) {
  const auto backend_flag = selectBackend(options.toggles);
  const int world_size = options.worldSize();
  if (backend_flag == BackendFlag::NONE) {
    CP_LOG(WARNING) << "No accelerated backend selected; the suite compares "
                       "the reference backend against itself";
  }

  RunSummary summary;
  for (auto mode : {ExecutionMode::EAGER, ExecutionMode::GRAPH_REPLAY}) {
    auto run_options = options.runOptions();
    run_options.matrix.modes = {mode};
    CP_LOG(INFO) << "Running " << getModeName(mode) << " parity suite";
    summary = launcher.launch(
        world_size, options.master_addr, backend_flag, make_entry(run_options));
    if (!summary.passed) {
      break;
    }
  }
  return summary;
}

} // namespace commparity
