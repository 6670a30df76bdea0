// Copyright (c) Meta Platforms, Inc. and affiliates.

#pragma once

#include <chrono>
#include <string>
#include <string_view>
#include <unordered_map>

#include <ATen/ATen.h>
#include <c10/core/Device.h>
#include <c10/util/intrusive_ptr.h>
#include <torch/csrc/distributed/c10d/Store.hpp>

#include "comms/commparity/ParityTypes.hpp"

namespace commparity {

inline constexpr const char* COMMPARITY_BACKEND_ABI_VERSION = "1.0";

struct BackendOptions {
  std::chrono::milliseconds timeout{kDefaultTimeout};
  // Store private to this backend instance. Used for bootstrap only.
  c10::intrusive_ptr<c10d::Store> store;
  std::unordered_map<std::string, std::string> hints;
};

/**
 * ParityBackend - Abstract base class for the allreduce implementations
 * under comparison.
 *
 * Thread Safety:
 * ParityBackend implementations are NOT thread-safe. All operations must be
 * serialized by the caller.
 *
 * Streams:
 * Device backends enqueue work on the current stream of their device and
 * return without waiting for it. Callers synchronize the device before
 * reading outputs. Enqueueing must be legal while the current stream is
 * being captured into a graph.
 */
class ParityBackend {
 public:
  virtual ~ParityBackend() = default;

  virtual void init(
      at::Device device,
      int rank,
      int size,
      const std::string& name,
      const BackendOptions& options = {}) = 0;
  virtual void finalize() = 0;
  virtual int getRank() const = 0;
  virtual int getSize() const = 0;

  // Name of the backend impl that's the same for all instances of a backend.
  virtual std::string_view getBackendName() const = 0;
  // Unique name for this instance of the backend.
  virtual std::string_view getCommName() const = 0;

  // Sums `input` across all ranks into `output`. `output` may alias `input`,
  // which makes the reduction in-place. Both must be contiguous with the same
  // dtype and number of elements.
  virtual void all_reduce(const at::Tensor& input, at::Tensor& output) = 0;
};

struct DynamicLoaderInterface {
  // Function pointers
  ParityBackend* (*new_backend)(void);
  void (*destroy_backend)(ParityBackend* backend);
  const char* (*get_supported_version)();
};

// Signature of the `create_dynamic_loader_<name>` symbol a backend plugin
// exports with C linkage.
using CreateDynamicLoaderFn = DynamicLoaderInterface (*)();

} // namespace commparity
