// Copyright (c) Meta Platforms, Inc. and affiliates.

#include "comms/commparity/BackendSelection.hpp"

#include <stdexcept>

#include <fmt/core.h>

#include "comms/commparity/ParityException.hpp"

namespace commparity {

BackendFlag selectBackend(const BackendToggles& toggles) {
  if (toggles.mscclpp && toggles.custom_allreduce) {
    throw BackendSelectionConflictError(
        "Only one accelerated backend can be enabled at a time, but both "
        "mscclpp and custom_allreduce are enabled");
  }
  if (toggles.mscclpp) {
    return BackendFlag::MSCCLPP;
  }
  if (toggles.custom_allreduce) {
    return BackendFlag::CUSTOM_ALLREDUCE;
  }
  return BackendFlag::NONE;
}

std::string getReferenceBackendName(c10::DeviceType device_type) {
  switch (device_type) {
    case c10::DeviceType::CUDA:
      return "nccl";
    case c10::DeviceType::CPU:
      return "gloo";
    default:
      throw std::invalid_argument(
          fmt::format(
              "No reference backend for device type {}",
              c10::DeviceTypeName(device_type)));
  }
}

std::string getActiveBackendName(
    BackendFlag flag,
    c10::DeviceType device_type) {
  switch (flag) {
    case BackendFlag::NONE:
      return getReferenceBackendName(device_type);
    case BackendFlag::MSCCLPP:
      return "mscclpp";
    case BackendFlag::CUSTOM_ALLREDUCE:
      return "custom_ar";
  }
  throw std::invalid_argument("Unknown backend flag");
}

} // namespace commparity
