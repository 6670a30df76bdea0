// Copyright (c) Meta Platforms, Inc. and affiliates.

#include "comms/commparity/tests/unit/cpp/mocks/NcclMock.hpp"

using ::testing::_;
using ::testing::DoAll;
using ::testing::Return;
using ::testing::SetArgPointee;

namespace commparity::test {

void NcclMock::setupDefaultBehaviors() {
  ON_CALL(*this, getErrorString(_))
      .WillByDefault(Return("mock nccl error string"));
  ON_CALL(*this, getLastError(_))
      .WillByDefault(Return("mock nccl last error details"));

  ON_CALL(*this, getUniqueId(_))
      .WillByDefault(
          DoAll(SetArgPointee<0>(ncclUniqueId{}), Return(ncclSuccess)));

  ON_CALL(*this, commInitRankConfig(_, _, _, _, _))
      .WillByDefault(DoAll(
          SetArgPointee<0>(reinterpret_cast<ncclComm_t>(0x3000)),
          Return(ncclSuccess)));
  ON_CALL(*this, commDestroy(_)).WillByDefault(Return(ncclSuccess));
  ON_CALL(*this, commAbort(_)).WillByDefault(Return(ncclSuccess));
  ON_CALL(*this, commGetAsyncError(_, _))
      .WillByDefault(DoAll(SetArgPointee<1>(ncclSuccess), Return(ncclSuccess)));

  ON_CALL(*this, allReduce(_, _, _, _, _, _, _))
      .WillByDefault(Return(ncclSuccess));
}

} // namespace commparity::test
