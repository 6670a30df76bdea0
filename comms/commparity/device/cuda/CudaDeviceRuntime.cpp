// Copyright (c) Meta Platforms, Inc. and affiliates.

#include "comms/commparity/device/cuda/CudaDeviceRuntime.hpp"

#include <stdexcept>
#include <thread>
#include <utility>

#include <ATen/cuda/CUDAContext.h>
#include <ATen/cuda/CUDAGraph.h>
#include <c10/cuda/CUDAGuard.h>
#include <c10/util/Exception.h>
#include <fmt/core.h>

#include "comms/commparity/ParityLogging.hpp"

namespace commparity {

namespace {

constexpr std::chrono::microseconds kSynchronizePollInterval{200};

class ScopedEvent {
 public:
  explicit ScopedEvent(std::shared_ptr<CudaApi> cuda_api)
      : cuda_api_(std::move(cuda_api)) {
    CP_CUDA_CHECK(
        cuda_api_,
        cuda_api_->eventCreateWithFlags(&event_, cudaEventDisableTiming),
        "Failed to create synchronization event");
  }

  ~ScopedEvent() {
    CP_CUDA_CHECK_IGNORE(
        cuda_api_,
        cuda_api_->eventDestroy(event_),
        "Failed to destroy synchronization event");
  }

  ScopedEvent(const ScopedEvent&) = delete;
  ScopedEvent& operator=(const ScopedEvent&) = delete;

  cudaEvent_t get() const {
    return event_;
  }

 private:
  std::shared_ptr<CudaApi> cuda_api_;
  cudaEvent_t event_{nullptr};
};

class CudaReplayHandle : public ReplayHandle {
 public:
  explicit CudaReplayHandle(std::unique_ptr<at::cuda::CUDAGraph> graph)
      : graph_(std::move(graph)) {}

  at::cuda::CUDAGraph& graph() {
    return *graph_;
  }

 private:
  std::unique_ptr<at::cuda::CUDAGraph> graph_;
};

// Leaves capture mode after an operation failed mid-capture so that the side
// stream stays usable. The original failure is what gets reported.
void endAbandonedCapture(at::cuda::CUDAGraph& graph) {
  try {
    graph.capture_end();
  } catch (const c10::Error& e) {
    CP_LOG(ERROR) << "Failed to end abandoned CUDA graph capture: "
                  << e.what_without_backtrace();
  }
}

} // namespace

CudaGraphExecutor::CudaGraphExecutor(
    int device_index,
    std::shared_ptr<CudaApi> cuda_api)
    : device_index_(device_index), cuda_api_(std::move(cuda_api)) {}

std::unique_ptr<ReplayHandle> CudaGraphExecutor::capture(
    const std::vector<DeviceOp>& ops) {
  auto graph = std::make_unique<at::cuda::CUDAGraph>();
  try {
    auto stream = at::cuda::getStreamFromPool(
        /*isHighPriority=*/false, static_cast<c10::DeviceIndex>(device_index_));
    at::cuda::CUDAStreamGuard guard(stream);

    graph->capture_begin();
    try {
      for (const auto& op : ops) {
        op();
      }
    } catch (...) {
      endAbandonedCapture(*graph);
      throw;
    }
    graph->capture_end();

    cudaStreamCaptureStatus status = cudaStreamCaptureStatusNone;
    CP_CUDA_CHECK(
        cuda_api_,
        cuda_api_->streamIsCapturing(stream.stream(), &status),
        "Failed to query capture status");
    if (status != cudaStreamCaptureStatusNone) {
      throw DeviceError("Stream is still capturing after capture_end");
    }
  } catch (const c10::Error& e) {
    throw DeviceError(
        fmt::format(
            "CUDA graph capture failed: {}", e.what_without_backtrace()));
  }
  return std::make_unique<CudaReplayHandle>(std::move(graph));
}

void CudaGraphExecutor::replay(ReplayHandle& handle) {
  auto* cuda_handle = dynamic_cast<CudaReplayHandle*>(&handle);
  if (cuda_handle == nullptr) {
    throw std::invalid_argument(
        "Replay handle was not created by a CudaGraphExecutor");
  }
  try {
    cuda_handle->graph().replay();
  } catch (const c10::Error& e) {
    throw DeviceError(
        fmt::format("CUDA graph replay failed: {}", e.what_without_backtrace()));
  }
}

CudaDeviceRuntime::CudaDeviceRuntime(std::chrono::milliseconds timeout)
    : CudaDeviceRuntime(std::make_shared<DefaultCudaApi>(), timeout) {}

CudaDeviceRuntime::CudaDeviceRuntime(
    std::shared_ptr<CudaApi> cuda_api,
    std::chrono::milliseconds timeout)
    : cuda_api_(std::move(cuda_api)), timeout_(timeout) {}

int CudaDeviceRuntime::deviceCount() {
  int device_count = 0;
  CP_CUDA_CHECK(
      cuda_api_,
      cuda_api_->getDeviceCount(&device_count),
      "Failed to get CUDA device count");
  return device_count;
}

c10::Device CudaDeviceRuntime::bindDevice(int index) {
  CP_CUDA_CHECK(
      cuda_api_,
      cuda_api_->setDevice(index),
      fmt::format("Failed to set device to {}", index));
  device_index_ = index;
  return c10::Device(c10::kCUDA, static_cast<c10::DeviceIndex>(index));
}

void CudaDeviceRuntime::synchronize() {
  if (device_index_ < 0) {
    throw DeviceError("No CUDA device bound before synchronizing");
  }
  ScopedEvent event(cuda_api_);
  CP_CUDA_CHECK(
      cuda_api_,
      cuda_api_->eventRecord(
          event.get(), cuda_api_->getCurrentCUDAStream(device_index_)),
      "Failed to record synchronization event");

  // A peer that died mid-collective leaves our kernels spinning forever, so
  // the wait is bounded instead of blocking in cudaDeviceSynchronize.
  const auto start = std::chrono::steady_clock::now();
  while (true) {
    cudaError_t status = cuda_api_->eventQuery(event.get());
    if (status == cudaSuccess) {
      return;
    }
    if (status != cudaErrorNotReady) {
      throw DeviceError(
          fmt::format(
              "Failed while waiting for device work: {}",
              cuda_api_->getErrorString(status)));
    }
    if (std::chrono::steady_clock::now() - start > timeout_) {
      throw DeviceError(
          fmt::format(
              "Device work on device {} did not complete within {} ms",
              device_index_,
              timeout_.count()));
    }
    std::this_thread::sleep_for(kSynchronizePollInterval);
  }
}

std::unique_ptr<GraphExecutor> CudaDeviceRuntime::createGraphExecutor() {
  if (device_index_ < 0) {
    throw DeviceError("No CUDA device bound before creating a graph executor");
  }
  return std::make_unique<CudaGraphExecutor>(device_index_, cuda_api_);
}

} // namespace commparity
