// Copyright (c) Meta Platforms, Inc. and affiliates.

#pragma once

#include <functional>
#include <memory>
#include <vector>

namespace commparity {

// One unit of device work, enqueued on the current stream when invoked.
using DeviceOp = std::function<void()>;

// Opaque result of a capture. Only valid with the executor that created it.
class ReplayHandle {
 public:
  virtual ~ReplayHandle() = default;
};

/**
 * GraphExecutor - Records a sequence of device operations once and replays it.
 *
 * capture() records `ops` in order without their effects becoming visible;
 * replay() re-executes the recorded work against whatever the captured
 * buffers hold at that moment. Both throw DeviceError on device failures.
 */
class GraphExecutor {
 public:
  virtual ~GraphExecutor() = default;

  virtual std::unique_ptr<ReplayHandle> capture(
      const std::vector<DeviceOp>& ops) = 0;
  virtual void replay(ReplayHandle& handle) = 0;
};

} // namespace commparity
