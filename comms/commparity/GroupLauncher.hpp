// Copyright (c) Meta Platforms, Inc. and affiliates.

#pragma once

#include <functional>
#include <memory>
#include <string>

#include "comms/commparity/HarnessOptions.hpp"
#include "comms/commparity/ParityTypes.hpp"
#include "comms/commparity/ProcessSpawner.hpp"
#include "comms/commparity/ResultAggregator.hpp"

namespace commparity {

using PortAllocatorFn = std::function<int()>;
using WorkerEntryFactory = std::function<WorkerEntry(const RunOptions&)>;

// Entry that drives one rank with WorkerDriver inside the worker process.
WorkerEntry makeWorkerEntry(RunOptions options);

/**
 * GroupLauncher - Starts a parity group on the local host and collects the
 * verdict.
 *
 * Every launch allocates a fresh rendezvous port and spawner session. The
 * session is shut down on every exit path. Workers are never cancelled
 * because a sibling failed; the launcher waits for all of them.
 */
class GroupLauncher {
 public:
  explicit GroupLauncher(
      std::shared_ptr<ProcessSpawner> spawner,
      PortAllocatorFn port_allocator = nullptr);

  // Spawns ranks 0..world_size-1 with identical GroupConfigs and joins them
  // in the order they finish. A worker whose handle fails to join is
  // recorded as a failed outcome without a process exit code. Throws std::invalid_argument for a non-positive
  // world_size and ResourceUnavailableError if no port can be allocated. If
  // spawning fails, already started workers are terminated and joined before
  // the error propagates.
  RunSummary launch(
      int world_size,
      const std::string& master_address,
      BackendFlag backend_flag,
      const WorkerEntry& entry);

 private:
  std::shared_ptr<ProcessSpawner> spawner_;
  PortAllocatorFn port_allocator_;
};

// Resolves the backend toggles, then launches one group per execution mode
// (eager first, then graph replay) and stops at the first failing group.
// Conflicting toggles throw BackendSelectionConflictError before anything is
// launched.
RunSummary runSuite(
    const HarnessOptions& options,
    GroupLauncher& launcher,
    const WorkerEntryFactory& make_entry = makeWorkerEntry);

} // namespace commparity
