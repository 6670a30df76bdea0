// Copyright (c) Meta Platforms, Inc. and affiliates.

#pragma once

#include <memory>
#include <optional>
#include <string_view>

#include <ATen/ATen.h>
#include <ATen/core/Generator.h>

#include "comms/commparity/GroupMembership.hpp"
#include "comms/commparity/HarnessOptions.hpp"
#include "comms/commparity/ParityBackend.hpp"
#include "comms/commparity/ParityTypes.hpp"
#include "comms/commparity/TestMatrix.hpp"
#include "comms/commparity/WorkerReport.hpp"
#include "comms/commparity/device/DeviceRuntime.hpp"

namespace commparity {

// Buffer contents are drawn from [kInputLow, kInputHigh). Sums of up to 16
// such values stay exactly representable in bfloat16.
constexpr int64_t kInputLow = 1;
constexpr int64_t kInputHigh = 16;

/**
 * WorkerDriver - Runs one rank of a parity group from join to report.
 *
 * States advance Joining -> BackendSelected -> Warmup -> Running -> Done.
 * The first error or mismatch moves the worker to Failed and ends the run.
 * Backends are finalized on every exit path.
 */
class WorkerDriver {
 public:
  // `runtime` defaults to the runtime for options.device_type.
  WorkerDriver(
      WorkerContext context,
      RunOptions options,
      std::shared_ptr<DeviceRuntime> runtime = nullptr);
  ~WorkerDriver();

  WorkerDriver(const WorkerDriver&) = delete;
  WorkerDriver& operator=(const WorkerDriver&) = delete;

  // Never throws; failures are described by the returned report. Can only be
  // called once.
  WorkerReport run();

  WorkerState state() const {
    return state_;
  }
  const WorkerContext& context() const {
    return context_;
  }

 private:
  struct CaseBuffers {
    at::Tensor input1;
    at::Tensor input2;
    at::Tensor output1;
    at::Tensor output2;
  };

  void transition(WorkerState next);
  void join();
  void selectBackends();
  void warmup();
  void runMatrix(WorkerReport& report);

  VerificationResult runTestCase(const TestCase& test_case);
  VerificationResult runEager(const TestCase& test_case, CaseBuffers& buffers);
  VerificationResult runGraphReplay(
      const TestCase& test_case,
      CaseBuffers& buffers);
  VerificationResult verifyPair(
      const TestCase& test_case,
      const at::Tensor& output,
      const at::Tensor& expected,
      std::string_view label);

  at::Tensor makeInput(const TestCase& test_case);
  bool finalizeBackends();
  void fail(
      WorkerReport& report,
      ErrorKind kind,
      const std::string& message,
      std::optional<VerificationResult> failure);

  WorkerContext context_;
  const RunOptions options_;
  const TestMatrix matrix_;
  std::shared_ptr<DeviceRuntime> runtime_;
  std::unique_ptr<GroupMembership> membership_;
  std::shared_ptr<ParityBackend> reference_;
  std::shared_ptr<ParityBackend> active_;
  at::Device device_{at::kCPU};
  at::Generator generator_;
  WorkerState state_{WorkerState::JOINING};
  std::optional<TestCase> current_case_;
  bool started_{false};
};

} // namespace commparity
