// Copyright (c) Meta Platforms, Inc. and affiliates.

#include "comms/commparity/device/cuda/CudaApi.hpp"

#include <ATen/cuda/CUDAContext.h>

namespace commparity {

cudaError_t DefaultCudaApi::setDevice(int device) {
  return cudaSetDevice(device);
}

cudaError_t DefaultCudaApi::getDeviceCount(int* count) {
  return cudaGetDeviceCount(count);
}

cudaStream_t DefaultCudaApi::getCurrentCUDAStream(int device_index) {
  return at::cuda::getCurrentCUDAStream(device_index).stream();
}

cudaError_t DefaultCudaApi::streamQuery(cudaStream_t stream) {
  return cudaStreamQuery(stream);
}

cudaError_t DefaultCudaApi::streamIsCapturing(
    cudaStream_t stream,
    cudaStreamCaptureStatus* pCaptureStatus) {
  return cudaStreamIsCapturing(stream, pCaptureStatus);
}

cudaError_t DefaultCudaApi::eventCreateWithFlags(
    cudaEvent_t* event,
    unsigned int flags) {
  return cudaEventCreateWithFlags(event, flags);
}

cudaError_t DefaultCudaApi::eventDestroy(cudaEvent_t event) {
  return cudaEventDestroy(event);
}

cudaError_t DefaultCudaApi::eventRecord(
    cudaEvent_t event,
    cudaStream_t stream) {
  return cudaEventRecord(event, stream);
}

cudaError_t DefaultCudaApi::eventQuery(cudaEvent_t event) {
  return cudaEventQuery(event);
}

const char* DefaultCudaApi::getErrorString(cudaError_t error) {
  return cudaGetErrorString(error);
}

} // namespace commparity
