// Copyright (c) Meta Platforms, Inc. and affiliates.

#include "comms/commparity/device/HostDeviceRuntime.hpp"

#include <stdexcept>
#include <utility>

#include <c10/util/Exception.h>
#include <fmt/core.h>

#include "comms/commparity/ParityException.hpp"

namespace commparity {

namespace {

class HostReplayHandle : public ReplayHandle {
 public:
  explicit HostReplayHandle(std::vector<DeviceOp> ops)
      : ops_(std::move(ops)) {}

  const std::vector<DeviceOp>& ops() const {
    return ops_;
  }

 private:
  std::vector<DeviceOp> ops_;
};

} // namespace

std::unique_ptr<ReplayHandle> HostGraphExecutor::capture(
    const std::vector<DeviceOp>& ops) {
  for (const auto& op : ops) {
    if (!op) {
      throw std::invalid_argument("Cannot capture an empty operation");
    }
  }
  return std::make_unique<HostReplayHandle>(ops);
}

void HostGraphExecutor::replay(ReplayHandle& handle) {
  auto* host_handle = dynamic_cast<HostReplayHandle*>(&handle);
  if (host_handle == nullptr) {
    throw std::invalid_argument(
        "Replay handle was not created by a HostGraphExecutor");
  }
  try {
    for (const auto& op : host_handle->ops()) {
      op();
    }
  } catch (const c10::Error& e) {
    throw DeviceError(fmt::format("Host graph replay failed: {}", e.what()));
  }
}

c10::Device HostDeviceRuntime::bindDevice(int index) {
  if (index != 0) {
    throw DeviceError(fmt::format("Invalid host device index {}", index));
  }
  return c10::Device(c10::DeviceType::CPU);
}

std::unique_ptr<GraphExecutor> HostDeviceRuntime::createGraphExecutor() {
  return std::make_unique<HostGraphExecutor>();
}

} // namespace commparity
