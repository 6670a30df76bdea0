// Copyright (c) Meta Platforms, Inc. and affiliates.

#pragma once

#include <mutex>
#include <string>

#include <nccl.h>

namespace commparity {

/**
 * Abstract interface for the NCCL calls the reference backend makes.
 * This allows for dependency injection and testing by providing
 * a way to override NCCL API calls.
 */
class NcclApi {
 public:
  virtual ~NcclApi() = default;

  // Error handling
  virtual const char* getErrorString(ncclResult_t result) = 0;
  virtual std::string getLastError(ncclComm_t comm) = 0;

  // Unique ID generation
  [[nodiscard]] virtual ncclResult_t getUniqueId(ncclUniqueId* uniqueId) = 0;

  // Communicator management
  [[nodiscard]] virtual ncclResult_t commInitRankConfig(
      ncclComm_t* comm,
      int nranks,
      ncclUniqueId commId,
      int rank,
      ncclConfig_t* config) = 0;

  [[nodiscard]] virtual ncclResult_t commDestroy(ncclComm_t comm) = 0;

  [[nodiscard]] virtual ncclResult_t commAbort(ncclComm_t comm) = 0;

  [[nodiscard]] virtual ncclResult_t commGetAsyncError(
      ncclComm_t comm,
      ncclResult_t* asyncError) = 0;

  // Collective operations
  [[nodiscard]] virtual ncclResult_t allReduce(
      const void* sendbuff,
      void* recvbuff,
      size_t count,
      ncclDataType_t datatype,
      ncclRedOp_t op,
      ncclComm_t comm,
      cudaStream_t stream) = 0;
};

/**
 * Default implementation that calls the underlying NCCL APIs directly.
 */
class DefaultNcclApi : public NcclApi {
 public:
  ~DefaultNcclApi() override = default;

  const char* getErrorString(ncclResult_t result) override;
  std::string getLastError(ncclComm_t comm) override;

  [[nodiscard]] ncclResult_t getUniqueId(ncclUniqueId* uniqueId) override;

  [[nodiscard]] ncclResult_t commInitRankConfig(
      ncclComm_t* comm,
      int nranks,
      ncclUniqueId commId,
      int rank,
      ncclConfig_t* config) override;

  [[nodiscard]] ncclResult_t commDestroy(ncclComm_t comm) override;

  [[nodiscard]] ncclResult_t commAbort(ncclComm_t comm) override;

  [[nodiscard]] ncclResult_t commGetAsyncError(
      ncclComm_t comm,
      ncclResult_t* asyncError) override;

  [[nodiscard]] ncclResult_t allReduce(
      const void* sendbuff,
      void* recvbuff,
      size_t count,
      ncclDataType_t datatype,
      ncclRedOp_t op,
      ncclComm_t comm,
      cudaStream_t stream) override;

 private:
  mutable std::mutex api_mutex_;
};

} // namespace commparity
