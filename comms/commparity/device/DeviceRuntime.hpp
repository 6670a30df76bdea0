// Copyright (c) Meta Platforms, Inc. and affiliates.

#pragma once

#include <chrono>
#include <memory>

#include <c10/core/Device.h>
#include <c10/core/DeviceType.h>

#include "comms/commparity/ParityTypes.hpp"
#include "comms/commparity/device/GraphExecutor.hpp"

namespace commparity {

/**
 * DeviceRuntime - The device services a worker needs.
 *
 * A worker creates its runtime after it has been forked, so implementations
 * may initialize driver state lazily.
 */
class DeviceRuntime {
 public:
  virtual ~DeviceRuntime() = default;

  virtual c10::DeviceType deviceType() const = 0;
  // Number of devices visible to this process. Throws DeviceError.
  virtual int deviceCount() = 0;
  // Makes `index` the current device of the process and returns it.
  virtual c10::Device bindDevice(int index) = 0;
  // Blocks until all work enqueued on the bound device completed. Throws
  // DeviceError if the work fails or does not complete in time.
  virtual void synchronize() = 0;
  virtual std::unique_ptr<GraphExecutor> createGraphExecutor() = 0;
};

// `timeout` bounds every synchronize(). Throws std::invalid_argument for device
// types without a runtime.
std::shared_ptr<DeviceRuntime> createDeviceRuntime(
    c10::DeviceType type,
    std::chrono::milliseconds timeout = kDefaultTimeout);

} // namespace commparity
