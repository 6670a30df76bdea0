// Copyright (c) Meta Platforms, Inc. and affiliates.

#pragma once

#include <sstream>

#include <cuda_runtime.h>
#include <glog/logging.h>

#include "comms/commparity/ParityException.hpp"

namespace commparity {

#define CP_CUDA_CHECK(cuda_api, call, err_str)                            \
  do {                                                                    \
    cudaError_t status = call;                                            \
    if (status != cudaSuccess) {                                          \
      std::stringstream ss;                                               \
      ss << err_str << ": " << cuda_api->getErrorString(status) << " at " \
         << __FILE__ << ":" << __LINE__;                                  \
      throw ::commparity::DeviceError(ss.str());                          \
    }                                                                     \
  } while (0)

// Ignore variant for use in destructors - logs errors instead of throwing
#define CP_CUDA_CHECK_IGNORE(cuda_api, call, err_str)                      \
  do {                                                                     \
    cudaError_t status = call;                                             \
    if (status != cudaSuccess) {                                           \
      LOG(ERROR) << "[CP] " << err_str << ": "                             \
                 << cuda_api->getErrorString(status) << " at " << __FILE__ \
                 << ":" << __LINE__;                                       \
    }                                                                      \
  } while (0)

/**
 * Abstract interface for CUDA API operations.
 * This allows for dependency injection and testing by providing
 * a way to override CUDA API calls.
 */
class CudaApi {
 public:
  virtual ~CudaApi() = default;

  // Device management
  [[nodiscard]] virtual cudaError_t setDevice(int device) = 0;
  [[nodiscard]] virtual cudaError_t getDeviceCount(int* count) = 0;

  // Stream management
  virtual cudaStream_t getCurrentCUDAStream(int device_index) = 0;
  // cudaSuccess if all work on the stream completed, cudaErrorNotReady if not.
  [[nodiscard]] virtual cudaError_t streamQuery(cudaStream_t stream) = 0;
  [[nodiscard]] virtual cudaError_t streamIsCapturing(
      cudaStream_t stream,
      cudaStreamCaptureStatus* pCaptureStatus) = 0;

  // Event management
  [[nodiscard]] virtual cudaError_t eventCreateWithFlags(
      cudaEvent_t* event,
      unsigned int flags) = 0;
  [[nodiscard]] virtual cudaError_t eventDestroy(cudaEvent_t event) = 0;
  [[nodiscard]] virtual cudaError_t eventRecord(
      cudaEvent_t event,
      cudaStream_t stream) = 0;
  [[nodiscard]] virtual cudaError_t eventQuery(cudaEvent_t event) = 0;

  // Error handling
  virtual const char* getErrorString(cudaError_t error) = 0;
};

/**
 * Default implementation that calls the underlying CUDA APIs directly.
 */
class DefaultCudaApi : public CudaApi {
 public:
  ~DefaultCudaApi() override = default;

  [[nodiscard]] cudaError_t setDevice(int device) override;
  [[nodiscard]] cudaError_t getDeviceCount(int* count) override;

  cudaStream_t getCurrentCUDAStream(int device_index) override;
  [[nodiscard]] cudaError_t streamQuery(cudaStream_t stream) override;
  [[nodiscard]] cudaError_t streamIsCapturing(
      cudaStream_t stream,
      cudaStreamCaptureStatus* pCaptureStatus) override;

  [[nodiscard]] cudaError_t eventCreateWithFlags(
      cudaEvent_t* event,
      unsigned int flags) override;
  [[nodiscard]] cudaError_t eventDestroy(cudaEvent_t event) override;
  [[nodiscard]] cudaError_t eventRecord(
      cudaEvent_t event,
      cudaStream_t stream) override;
  [[nodiscard]] cudaError_t eventQuery(cudaEvent_t event) override;

  const char* getErrorString(cudaError_t error) override;
};

} // namespace commparity
