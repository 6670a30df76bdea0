// Copyright (c) Meta Platforms, Inc. and affiliates.

#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include <ATen/ATen.h>
#include <gloo/context.h>

#include "comms/commparity/ParityBackend.hpp"

namespace commparity {

/**
 * ParityBackendGloo - Reference allreduce on CPU tensors.
 *
 * Reductions complete before all_reduce() returns. Out-of-place calls copy
 * the input into the output and reduce the output in place.
 */
class ParityBackendGloo : public ParityBackend {
 public:
  static constexpr std::string_view kBackendName = "gloo";

  ParityBackendGloo() = default;
  ~ParityBackendGloo() override = default;

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
  enum class InitializationState {
    UNINITIALIZED,
    INITIALIZED,
    FINALIZED,
  };

  void checkInitialized() const;
  uint32_t nextTag() {
    return collective_counter_++;
  }

  InitializationState init_state_{InitializationState::UNINITIALIZED};
  std::shared_ptr<::gloo::Context> context_;
  at::Device device_{at::kCPU};
  int rank_{-1};
  int size_{-1};
  std::string name_;
  std::chrono::milliseconds timeout_{kDefaultTimeout};
  uint32_t collective_counter_{0};
};

} // namespace commparity
