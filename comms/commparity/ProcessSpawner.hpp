// Copyright (c) Meta Platforms, Inc. and affiliates.

#pragma once

#include <sys/types.h>

#include <functional>
#include <memory>

#include "comms/commparity/ParityTypes.hpp"
#include "comms/commparity/WorkerReport.hpp"

namespace commparity {

struct WorkerArgs {
  GroupConfig group;
  int rank{-1};
};

// Body of a worker process.
using WorkerEntry = std::function<WorkerReport(const WorkerArgs&)>;

// Handle to one spawned worker.
class JoinHandle {
 public:
  virtual ~JoinHandle() = default;

  virtual int getRank() const = 0;
  // True once the worker terminated, after which join() does not block.
  virtual bool finished() = 0;
  // Blocks until the worker terminates. Can only be called once.
  virtual WorkerOutcome join() = 0;
  // Asks the worker to stop immediately. join() must still be called.
  virtual void terminate() = 0;
};

/**
 * ProcessSpawner - Runs worker entries in separate processes.
 *
 * start() must precede spawn() and shutdown() ends the session. A spawner
 * can be started again after shutdown.
 */
class ProcessSpawner {
 public:
  virtual ~ProcessSpawner() = default;

  virtual void start() = 0;
  virtual std::unique_ptr<JoinHandle> spawn(
      const WorkerEntry& entry,
      const WorkerArgs& args) = 0;
  virtual void shutdown() = 0;
};

/**
 * ForkProcessSpawner - One forked child per worker.
 *
 * The child runs the entry, writes the serialized WorkerReport to a pipe and
 * leaves with _exit(): 0 if the report says Done, 1 otherwise. Nothing thrown
 * in the child unwinds back into the parent's code. Children inherit the
 * parent's memory image, so the parent must not have initialized a device
 * runtime before spawning.
 */
class ForkProcessSpawner : public ProcessSpawner {
 public:
  ForkProcessSpawner() = default;
  ~ForkProcessSpawner() override = default;

  void start() override;
  std::unique_ptr<JoinHandle> spawn(
      const WorkerEntry& entry,
      const WorkerArgs& args) override;
  void shutdown() override;

 private:
  bool started_{false};
};

} // namespace commparity
