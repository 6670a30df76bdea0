// Copyright (c) Meta Platforms, Inc. and affiliates.

#pragma once

#include <chrono>
#include <memory>
#include <vector>

#include "comms/commparity/ParityTypes.hpp"
#include "comms/commparity/device/DeviceRuntime.hpp"
#include "comms/commparity/device/cuda/CudaApi.hpp"

namespace commparity {

// Captures into an at::cuda::CUDAGraph on a side stream taken from the pool.
// Replays are launched on the current stream, after any work already queued
// there.
class CudaGraphExecutor : public GraphExecutor {
 public:
  CudaGraphExecutor(int device_index, std::shared_ptr<CudaApi> cuda_api);

  std::unique_ptr<ReplayHandle> capture(
      const std::vector<DeviceOp>& ops) override;
  void replay(ReplayHandle& handle) override;

 private:
  const int device_index_;
  std::shared_ptr<CudaApi> cuda_api_;
};

// synchronize() waits for the current stream of the bound device, which is
// where backends enqueue and graphs replay. It gives up after `timeout`.
class CudaDeviceRuntime : public DeviceRuntime {
 public:
  explicit CudaDeviceRuntime(
      std::chrono::milliseconds timeout = kDefaultTimeout);
  CudaDeviceRuntime(
      std::shared_ptr<CudaApi> cuda_api,
      std::chrono::milliseconds timeout = kDefaultTimeout);

  c10::DeviceType deviceType() const override {
    return c10::DeviceType::CUDA;
  }
  int deviceCount() override;
  c10::Device bindDevice(int index) override;
  void synchronize() override;
  std::unique_ptr<GraphExecutor> createGraphExecutor() override;

 private:
  std::shared_ptr<CudaApi> cuda_api_;
  const std::chrono::milliseconds timeout_;
  int device_index_{-1};
};

} // namespace commparity
