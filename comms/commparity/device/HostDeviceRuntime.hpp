// Copyright (c) Meta Platforms, Inc. and affiliates.

#pragma once

#include <memory>
#include <vector>

#include "comms/commparity/device/DeviceRuntime.hpp"

namespace commparity {

// Keeps the captured operations and runs them again on replay. Host work is
// synchronous, so nothing runs during capture.
class HostGraphExecutor : public GraphExecutor {
 public:
  std::unique_ptr<ReplayHandle> capture(
      const std::vector<DeviceOp>& ops) override;
  void replay(ReplayHandle& handle) override;
};

class HostDeviceRuntime : public DeviceRuntime {
 public:
  c10::DeviceType deviceType() const override {
    return c10::DeviceType::CPU;
  }
  int deviceCount() override {
    return 1;
  }
  c10::Device bindDevice(int index) override;
  void synchronize() override {}
  std::unique_ptr<GraphExecutor> createGraphExecutor() override;
};

} // namespace commparity
