// Copyright (c) Meta Platforms, Inc. and affiliates.

#pragma once

#include <string>

#include <c10/core/DeviceType.h>

#include "comms/commparity/ParityTypes.hpp"

namespace commparity {

// Accelerated backends requested by the environment. At most one may be set.
struct BackendToggles {
  bool mscclpp{false};
  bool custom_allreduce{false};

  bool operator==(const BackendToggles& other) const = default;
};

// Resolves the toggles into the flag carried by GroupConfig. Throws
// BackendSelectionConflictError if more than one backend is enabled.
BackendFlag selectBackend(const BackendToggles& toggles);

// "nccl" for CUDA devices, "gloo" for CPU.
std::string getReferenceBackendName(c10::DeviceType device_type);

// Factory name of the backend checked against the reference. BackendFlag::NONE
// maps to the reference backend itself.
std::string getActiveBackendName(
    BackendFlag flag,
    c10::DeviceType device_type);

} // namespace commparity
