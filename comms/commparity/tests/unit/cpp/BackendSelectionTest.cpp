// Copyright (c) Meta Platforms, Inc. and affiliates.

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "comms/commparity/BackendSelection.hpp"
#include "comms/commparity/ParityException.hpp"

using ::testing::HasSubstr;

namespace commparity::test {

TEST(BackendSelectionTest, NoToggleSelectsNone) {
  EXPECT_EQ(selectBackend(BackendToggles{}), BackendFlag::NONE);
}

TEST(BackendSelectionTest, SingleToggle) {
  EXPECT_EQ(
      selectBackend(BackendToggles{.mscclpp = true}), BackendFlag::MSCCLPP);
  EXPECT_EQ(
      selectBackend(BackendToggles{.custom_allreduce = true}),
      BackendFlag::CUSTOM_ALLREDUCE);
}

TEST(BackendSelectionTest, BothTogglesConflict) {
  BackendToggles toggles{.mscclpp = true, .custom_allreduce = true};
  try {
    selectBackend(toggles);
    FAIL() << "Expected BackendSelectionConflictError";
  } catch (const BackendSelectionConflictError& e) {
    EXPECT_EQ(e.kind(), ErrorKind::BACKEND_SELECTION_CONFLICT);
    EXPECT_THAT(e.what(), HasSubstr("mscclpp"));
    EXPECT_THAT(e.what(), HasSubstr("custom_allreduce"));
  }
}

TEST(BackendSelectionTest, ReferenceBackendPerDevice) {
  EXPECT_EQ(getReferenceBackendName(c10::DeviceType::CUDA), "nccl");
  EXPECT_EQ(getReferenceBackendName(c10::DeviceType::CPU), "gloo");
  EXPECT_THROW(
      getReferenceBackendName(c10::DeviceType::Meta), std::invalid_argument);
}

TEST(BackendSelectionTest, ActiveBackendNames) {
  EXPECT_EQ(
      getActiveBackendName(BackendFlag::NONE, c10::DeviceType::CUDA), "nccl");
  EXPECT_EQ(
      getActiveBackendName(BackendFlag::NONE, c10::DeviceType::CPU), "gloo");
  EXPECT_EQ(
      getActiveBackendName(BackendFlag::MSCCLPP, c10::DeviceType::CUDA),
      "mscclpp");
  EXPECT_EQ(
      getActiveBackendName(
          BackendFlag::CUSTOM_ALLREDUCE, c10::DeviceType::CUDA),
      "custom_ar");
}

TEST(BackendSelectionTest, FlagNamesRoundTrip) {
  for (auto flag :
       {BackendFlag::NONE,
        BackendFlag::MSCCLPP,
        BackendFlag::CUSTOM_ALLREDUCE}) {
    EXPECT_EQ(parseBackendFlag(getBackendFlagName(flag)), flag);
  }
  EXPECT_THROW(parseBackendFlag("rccl"), std::invalid_argument);
}

} // namespace commparity::test
