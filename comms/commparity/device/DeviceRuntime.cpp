// Copyright (c) Meta Platforms, Inc. and affiliates.

#include "comms/commparity/device/DeviceRuntime.hpp"

#include <stdexcept>

#include <fmt/core.h>

#include "comms/commparity/device/HostDeviceRuntime.hpp"
#include "comms/commparity/device/cuda/CudaDeviceRuntime.hpp"

namespace commparity {

std::shared_ptr<DeviceRuntime> createDeviceRuntime(
    c10::DeviceType type,
    std::chrono::milliseconds timeout) {
  switch (type) {
    case c10::DeviceType::CUDA:
      return std::make_shared<CudaDeviceRuntime>(timeout);
    case c10::DeviceType::CPU:
      return std::make_shared<HostDeviceRuntime>();
    default:
      throw std::invalid_argument(
          fmt::format(
              "No device runtime for device type {}",
              c10::DeviceTypeName(type)));
  }
}

} // namespace commparity
