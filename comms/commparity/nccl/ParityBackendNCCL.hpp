// Copyright (c) Meta Platforms, Inc. and affiliates.

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>

#include <ATen/ATen.h>
#include <glog/logging.h>
#include <nccl.h>

#include "comms/commparity/ParityBackend.hpp"
#include "comms/commparity/ParityException.hpp"
#include "comms/commparity/device/cuda/CudaApi.hpp"
#include "comms/commparity/nccl/NcclApi.hpp"

namespace commparity {

// NCCL status with the communicator's last error attached. Reported as a
// device error.
class NCCLException : public DeviceError {
 public:
  NCCLException(
      NcclApi& api,
      const std::string& message,
      ncclResult_t result,
      ncclComm_t comm);

  [[nodiscard]] ncclResult_t getResult() const noexcept {
    return result_;
  }

 private:
  ncclResult_t result_;
};

#define CP_NCCL_CHECK(nccl_api, nccl_comm, call, err_str)         \
  do {                                                            \
    ncclResult_t status = call;                                   \
    if (status != ncclSuccess) {                                  \
      throw NCCLException(*nccl_api, err_str, status, nccl_comm); \
    }                                                             \
  } while (0)

// Ignore variant for use in destructors - logs errors instead of throwing
#define CP_NCCL_CHECK_IGNORE(nccl_api, call, err_str)                      \
  do {                                                                     \
    ncclResult_t status = call;                                            \
    if (status != ncclSuccess) {                                           \
      LOG(ERROR) << "[CP] " << err_str << ": "                             \
                 << nccl_api->getErrorString(status) << " at " << __FILE__ \
                 << ":" << __LINE__;                                       \
    }                                                                      \
  } while (0)

ncclDataType_t getNcclDataType(const at::Tensor& tensor);

/**
 * ParityBackendNCCL - Reference allreduce on CUDA devices.
 *
 * The NCCL unique id is exchanged through the backend's private store: rank 0
 * publishes it and every other rank waits for it.
 *
 * A watchdog thread polls the communicator for asynchronous errors. finalize()
 * aborts instead of destroying the communicator if it failed or still has
 * work pending on the current stream, since ncclCommDestroy would wait for
 * that work forever once a peer is gone.
 */
class ParityBackendNCCL : public ParityBackend {
 public:
  static constexpr std::string_view kBackendName = "nccl";

  ParityBackendNCCL();
  ParityBackendNCCL(
      std::shared_ptr<NcclApi> nccl_api,
      std::shared_ptr<CudaApi> cuda_api);
  ~ParityBackendNCCL() override;

  ParityBackendNCCL(const ParityBackendNCCL&) = delete;
  ParityBackendNCCL& operator=(const ParityBackendNCCL&) = delete;

  void init(
      at::Device device,
      int rank,
      int size,
      const std::string& name,
      const BackendOptions& options = {}) override;
  void finalize() override;

  int getRank() const override {
    return rank_;
  }
  int getSize() const override {
    return size_;
  }
  std::string_view getBackendName() const override {
    return kBackendName;
  }
  std::string_view getCommName() const override {
    return name_;
  }

  void all_reduce(const at::Tensor& input, at::Tensor& output) override;

 private:
  ncclUniqueId exchangeUniqueId(const c10::intrusive_ptr<c10d::Store>& store);
  void checkInitialized() const;
  void checkAsyncError();
  ncclResult_t queryAsyncError();
  void abortNcclComm();

  void timeoutWatchdog() noexcept;
  void stopWatchdog();

  std::shared_ptr<NcclApi> nccl_api_;
  std::shared_ptr<CudaApi> cuda_api_;
  ncclComm_t nccl_comm_{nullptr};
  at::Device device_{at::kCUDA};
  int rank_{-1};
  int size_{-1};
  std::string name_;
  std::chrono::milliseconds timeout_{kDefaultTimeout};

  // First asynchronous error seen by the watchdog
  std::atomic<ncclResult_t> async_error_{ncclSuccess};
  std::atomic<bool> shutdown_{false};
  std::mutex watchdog_mutex_;
  std::condition_variable watchdog_cv_;
  std::thread watchdog_thread_;
};

} // namespace commparity
