// Copyright (c) Meta Platforms, Inc. and affiliates.

#pragma once

#include <string>

#include <gmock/gmock.h>
#include <nccl.h>

#include "comms/commparity/nccl/NcclApi.hpp"

namespace commparity::test {

/**
 * Mock implementation of NcclApi using Google Mock.
 */
class NcclMock : public NcclApi {
 public:
  ~NcclMock() override = default;

  // Error handling
  MOCK_METHOD(const char*, getErrorString, (ncclResult_t result), (override));
  MOCK_METHOD(std::string, getLastError, (ncclComm_t comm), (override));

  // Unique ID generation
  MOCK_METHOD(ncclResult_t, getUniqueId, (ncclUniqueId * uniqueId), (override));

  // Communicator management
  MOCK_METHOD(
      ncclResult_t,
      commInitRankConfig,
      (ncclComm_t * comm,
       int nranks,
       ncclUniqueId commId,
       int rank,
       ncclConfig_t* config),
      (override));
  MOCK_METHOD(ncclResult_t, commDestroy, (ncclComm_t comm), (override));
  MOCK_METHOD(ncclResult_t, commAbort, (ncclComm_t comm), (override));
  MOCK_METHOD(
      ncclResult_t,
      commGetAsyncError,
      (ncclComm_t comm, ncclResult_t* asyncError),
      (override));

  // Collective operations
  MOCK_METHOD(
      ncclResult_t,
      allReduce,
      (const void* sendbuff,
       void* recvbuff,
       size_t count,
       ncclDataType_t datatype,
       ncclRedOp_t op,
       ncclComm_t comm,
       cudaStream_t stream),
      (override));

  // Every call succeeds and the communicator is healthy.
  void setupDefaultBehaviors();
};

} // namespace commparity::test
