// Copyright (c) Meta Platforms, Inc. and affiliates.

#include <chrono>
#include <memory>

#include <ATen/ATen.h>
#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <torch/csrc/distributed/c10d/HashStore.hpp>

#include "comms/commparity/ParityException.hpp"
#include "comms/commparity/nccl/ParityBackendNCCL.hpp"
#include "comms/commparity/tests/unit/cpp/mocks/CudaMock.hpp"
#include "comms/commparity/tests/unit/cpp/mocks/NcclMock.hpp"

using ::testing::_;
using ::testing::DoAll;
using ::testing::HasSubstr;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::SetArgPointee;

namespace commparity::test {

namespace {
const ncclComm_t kComm = reinterpret_cast<ncclComm_t>(0x3000);
} // namespace

class ParityBackendNCCLTest : public ::testing::Test {
 protected:
  void SetUp() override {
    nccl_mock_ = std::make_shared<NiceMock<NcclMock>>();
    nccl_mock_->setupDefaultBehaviors();
    cuda_mock_ = std::make_shared<NiceMock<CudaMock>>();
    cuda_mock_->setupDefaultBehaviors();
  }

  std::unique_ptr<ParityBackendNCCL> initializedBackend() {
    auto backend = std::make_unique<ParityBackendNCCL>(nccl_mock_, cuda_mock_);
    BackendOptions options;
    options.store = c10::make_intrusive<c10d::HashStore>();
    options.timeout = std::chrono::milliseconds(1000);
    backend->init(at::Device(at::kCUDA, 0), 0, 1, "reference", options);
    return backend;
  }

  std::shared_ptr<NiceMock<NcclMock>> nccl_mock_;
  std::shared_ptr<NiceMock<CudaMock>> cuda_mock_;
};

TEST_F(ParityBackendNCCLTest, IdleCommunicatorIsDestroyed) {
  auto backend = initializedBackend();
  EXPECT_CALL(*nccl_mock_, commDestroy(kComm)).Times(1);
  EXPECT_CALL(*nccl_mock_, commAbort(_)).Times(0);

  backend->finalize();
  // Nothing is left to tear down
  backend->finalize();
}

TEST_F(ParityBackendNCCLTest, PendingWorkAbortsInsteadOfDestroying) {
  auto backend = initializedBackend();
  ON_CALL(*cuda_mock_, streamQuery(_)).WillByDefault(Return(cudaErrorNotReady));
  EXPECT_CALL(*nccl_mock_, commAbort(kComm)).Times(1);
  EXPECT_CALL(*nccl_mock_, commDestroy(_)).Times(0);

  try {
    backend->finalize();
    FAIL() << "Expected DeviceError";
  } catch (const DeviceError& e) {
    EXPECT_THAT(e.what(), HasSubstr("device work still pending"));
  }
  // The aborted communicator is gone; the destructor has nothing to abort
  backend.reset();
}

TEST_F(ParityBackendNCCLTest, AsyncErrorAbortsInsteadOfDestroying) {
  auto backend = initializedBackend();
  ON_CALL(*nccl_mock_, commGetAsyncError(kComm, _))
      .WillByDefault(
          DoAll(SetArgPointee<1>(ncclRemoteError), Return(ncclSuccess)));
  EXPECT_CALL(*nccl_mock_, commAbort(kComm)).Times(1);
  EXPECT_CALL(*nccl_mock_, commDestroy(_)).Times(0);

  try {
    backend->finalize();
    FAIL() << "Expected NCCLException";
  } catch (const NCCLException& e) {
    EXPECT_EQ(e.getResult(), ncclRemoteError);
    EXPECT_EQ(e.kind(), ErrorKind::DEVICE_ERROR);
    EXPECT_THAT(e.what(), HasSubstr("NCCL communicator failed"));
  }
}

TEST_F(ParityBackendNCCLTest, AllReduceReportsAsyncErrorBeforeEnqueueing) {
  auto backend = initializedBackend();
  ON_CALL(*nccl_mock_, commGetAsyncError(kComm, _))
      .WillByDefault(
          DoAll(SetArgPointee<1>(ncclSystemError), Return(ncclSuccess)));
  EXPECT_CALL(*nccl_mock_, allReduce(_, _, _, _, _, _, _)).Times(0);

  auto input = at::ones({4});
  auto output = at::empty({4});
  EXPECT_THROW(backend->all_reduce(input, output), NCCLException);
}

TEST_F(ParityBackendNCCLTest, UnfinalizedCommunicatorIsAbortedOnDestruction) {
  auto backend = initializedBackend();
  EXPECT_CALL(*nccl_mock_, commAbort(kComm)).Times(1);
  EXPECT_CALL(*nccl_mock_, commDestroy(_)).Times(0);
  backend.reset();
}

TEST_F(ParityBackendNCCLTest, InitRequiresAStore) {
  ParityBackendNCCL backend(nccl_mock_, cuda_mock_);
  EXPECT_THROW(
      backend.init(at::Device(at::kCUDA, 0), 0, 1, "reference", {}),
      std::invalid_argument);
}

} // namespace commparity::test
