// Copyright (c) Meta Platforms, Inc. and affiliates.

#include "comms/commparity/WorkerDriver.hpp"

#include <string>
#include <utility>
#include <vector>

#include <ATen/CPUGeneratorImpl.h>
#include <c10/util/Exception.h>
#include <fmt/core.h>

#include "comms/commparity/BackendFactory.hpp"
#include "comms/commparity/BackendSelection.hpp"
#include "comms/commparity/ParityException.hpp"
#include "comms/commparity/ParityLogging.hpp"
#include "comms/commparity/TensorVerification.hpp"

namespace commparity {

namespace {

constexpr std::string_view kReferenceName = "reference";
constexpr std::string_view kActiveName = "active";

} // namespace

WorkerDriver::WorkerDriver(
    WorkerContext context,
    RunOptions options,
    std::shared_ptr<DeviceRuntime> runtime)
    : context_(std::move(context)),
      options_(std::move(options)),
      matrix_(options_.matrix),
      runtime_(
          runtime ? std::move(runtime)
                  : createDeviceRuntime(
                        options_.device_type, options_.collective_timeout)),
      generator_(at::make_generator<at::CPUGeneratorImpl>(
          options_.seed + static_cast<uint64_t>(context_.rank))) {
  setDefaultLogRank(context_.rank);
}

WorkerDriver::~WorkerDriver() {
  finalizeBackends();
}

void WorkerDriver::transition(WorkerState next) {
  CP_LOG(INFO) << "Worker state " << getWorkerStateName(state_) << " -> "
               << getWorkerStateName(next);
  state_ = next;
}

WorkerReport WorkerDriver::run() {
  WorkerReport report;
  report.rank = context_.rank;
  if (started_) {
    fail(report, ErrorKind::DEVICE_ERROR, "Worker already ran", std::nullopt);
    report.state = state_;
    return report;
  }
  started_ = true;

  auto caseFailure =
      [this](const std::string& message) -> std::optional<VerificationResult> {
    if (!current_case_) {
      return std::nullopt;
    }
    return VerificationResult{
        .test_case = *current_case_,
        .rank = context_.rank,
        .passed = false,
        .mismatch_detail = message};
  };
  auto genericKind = [this]() {
    return state_ == WorkerState::JOINING ? ErrorKind::JOIN_FAILURE
                                          : ErrorKind::DEVICE_ERROR;
  };

  try {
    join();
    transition(WorkerState::BACKEND_SELECTED);
    selectBackends();
    transition(WorkerState::WARMUP);
    warmup();
    transition(WorkerState::RUNNING);
    runMatrix(report);
  } catch (const VerificationMismatchError& e) {
    fail(report, e.kind(), e.what(), e.result());
  } catch (const ParityException& e) {
    fail(report, e.kind(), e.what(), caseFailure(e.what()));
  } catch (const c10::Error& e) {
    std::string message = e.what_without_backtrace();
    fail(report, genericKind(), message, caseFailure(message));
  } catch (const std::exception& e) {
    fail(report, genericKind(), e.what(), caseFailure(e.what()));
  }

  bool finalized = finalizeBackends();
  if (state_ != WorkerState::FAILED) {
    if (finalized) {
      transition(WorkerState::DONE);
    } else {
      fail(
          report,
          ErrorKind::DEVICE_ERROR,
          "Failed to finalize backends",
          std::nullopt);
    }
  }

  report.state = state_;
  return report;
}

void WorkerDriver::join() {
  context_.group.validate();
  CP_LOG(INFO) << "Joining group of size " << context_.group.world_size
               << " at " << context_.group.master_address << ":"
               << context_.group.rendezvous_port << " with backend flag "
               << getBackendFlagName(context_.group.backend_flag);

  // The device is bound before the group barrier. A rank without one must
  // leave its peers waiting in join, not in backend bootstrap.
  int device_count = 0;
  try {
    device_count = runtime_->deviceCount();
  } catch (const ParityException& e) {
    throw JoinFailureError(
        fmt::format("Unable to query devices: {}", e.what()));
  }
  if (device_count <= 0) {
    throw JoinFailureError("No usable device available");
  }
  context_.local_device_index = context_.rank % device_count;
  try {
    device_ = runtime_->bindDevice(context_.local_device_index);
  } catch (const ParityException& e) {
    throw JoinFailureError(
        fmt::format(
            "Unable to bind device {}: {}",
            context_.local_device_index,
            e.what()));
  }
  CP_LOG(INFO) << "Bound to device " << device_;

  membership_ = std::make_unique<GroupMembership>(
      context_.group, context_.rank, options_.bootstrap_timeout);
  membership_->join(matrix_.digest());
}

void WorkerDriver::selectBackends() {
  const auto device_type = runtime_->deviceType();
  const auto reference_name = getReferenceBackendName(device_type);
  const auto active_name =
      getActiveBackendName(context_.group.backend_flag, device_type);

  auto makeOptions = [this](
                         const std::string& backend, std::string_view name) {
    BackendOptions options;
    options.timeout = options_.collective_timeout;
    options.store = membership_->getStore(
        fmt::format("commparity(backend={},name={})", backend, name));
    return options;
  };

  auto& factory = BackendFactory::get();
  reference_ = factory.create_backend(
      reference_name,
      device_,
      context_.rank,
      context_.group.world_size,
      std::string(kReferenceName),
      makeOptions(reference_name, kReferenceName));
  active_ = factory.create_backend(
      active_name,
      device_,
      context_.rank,
      context_.group.world_size,
      std::string(kActiveName),
      makeOptions(active_name, kActiveName));
  CP_LOG(INFO) << "Checking " << active_->getBackendName() << " against "
               << reference_->getBackendName();
}

void WorkerDriver::warmup() {
  auto buffer =
      at::zeros({1}, at::TensorOptions().dtype(at::kFloat).device(device_));
  reference_->all_reduce(buffer, buffer);
  runtime_->synchronize();
  membership_->barrier("warmup");
}

void WorkerDriver::runMatrix(WorkerReport& report) {
  for (const auto& test_case : matrix_) {
    current_case_ = test_case;
    auto result = runTestCase(test_case);
    if (!result.passed) {
      throw VerificationMismatchError(std::move(result));
    }
    ++report.cases_completed;
  }
  current_case_.reset();
  CP_LOG(INFO) << "Completed " << report.cases_completed << " test cases";
}

at::Tensor WorkerDriver::makeInput(const TestCase& test_case) {
  auto values = at::randint(
      kInputLow,
      kInputHigh,
      {test_case.size},
      generator_,
      at::TensorOptions().dtype(at::kInt));
  return values.to(device_, toScalarType(test_case.element_type));
}

VerificationResult WorkerDriver::runTestCase(const TestCase& test_case) {
  CaseBuffers buffers;
  buffers.input1 = makeInput(test_case);
  buffers.input2 = makeInput(test_case);
  buffers.output1 = at::empty_like(buffers.input1);
  buffers.output2 = at::empty_like(buffers.input2);

  switch (test_case.mode) {
    case ExecutionMode::EAGER:
      return runEager(test_case, buffers);
    case ExecutionMode::GRAPH_REPLAY:
      return runGraphReplay(test_case, buffers);
  }
  throw std::invalid_argument("Unknown execution mode");
}

VerificationResult WorkerDriver::verifyPair(
    const TestCase& test_case,
    const at::Tensor& output,
    const at::Tensor& expected,
    std::string_view label) {
  return verifyExactMatch(test_case, context_.rank, output, expected, label);
}

VerificationResult WorkerDriver::runEager(
    const TestCase& test_case,
    CaseBuffers& buffers) {
  active_->all_reduce(buffers.input1, buffers.output1);
  reference_->all_reduce(buffers.input1, buffers.input1);
  active_->all_reduce(buffers.input2, buffers.output2);
  reference_->all_reduce(buffers.input2, buffers.input2);
  runtime_->synchronize();

  auto result =
      verifyPair(test_case, buffers.output1, buffers.input1, "buffer 1");
  if (!result.passed) {
    return result;
  }
  return verifyPair(test_case, buffers.output2, buffers.input2, "buffer 2");
}

VerificationResult WorkerDriver::runGraphReplay(
    const TestCase& test_case,
    CaseBuffers& buffers) {
  auto pristine1 = buffers.input1.clone();
  auto pristine2 = buffers.input2.clone();
  runtime_->synchronize();

  auto executor = runtime_->createGraphExecutor();
  std::vector<DeviceOp> ops = {
      [&]() { active_->all_reduce(buffers.input1, buffers.output1); },
      [&]() { reference_->all_reduce(buffers.input1, buffers.input1); },
      [&]() { active_->all_reduce(buffers.input2, buffers.output2); },
      [&]() { reference_->all_reduce(buffers.input2, buffers.input2); },
  };
  auto handle = executor->capture(ops);

  at::Tensor first1;
  at::Tensor first2;
  for (int replay = 0; replay < options_.num_replays; ++replay) {
    buffers.input1.copy_(pristine1);
    buffers.input2.copy_(pristine2);
    executor->replay(*handle);
    runtime_->synchronize();

    auto result = verifyPair(
        test_case,
        buffers.output1,
        buffers.input1,
        fmt::format("buffer 1, replay {}", replay));
    if (!result.passed) {
      return result;
    }
    result = verifyPair(
        test_case,
        buffers.output2,
        buffers.input2,
        fmt::format("buffer 2, replay {}", replay));
    if (!result.passed) {
      return result;
    }

    if (replay == 0) {
      first1 = buffers.output1.clone();
      first2 = buffers.output2.clone();
      continue;
    }
    result = verifyPair(
        test_case,
        buffers.output1,
        first1,
        fmt::format("buffer 1, replay {} vs first replay", replay));
    if (!result.passed) {
      return result;
    }
    result = verifyPair(
        test_case,
        buffers.output2,
        first2,
        fmt::format("buffer 2, replay {} vs first replay", replay));
    if (!result.passed) {
      return result;
    }
  }
  return VerificationResult{
      .test_case = test_case, .rank = context_.rank, .passed = true};
}

bool WorkerDriver::finalizeBackends() {
  bool ok = true;
  for (auto* backend : {&active_, &reference_}) {
    if (!*backend) {
      continue;
    }
    try {
      (*backend)->finalize();
    } catch (const std::exception& e) {
      CP_LOG(ERROR, backend->get())
          << "Failed to finalize backend: " << e.what();
      ok = false;
    }
    backend->reset();
  }
  return ok;
}

void WorkerDriver::fail(
    WorkerReport& report,
    ErrorKind kind,
    const std::string& message,
    std::optional<VerificationResult> failure) {
  report.failed_in = state_;
  report.error_kind = kind;
  report.message = message;
  report.failure = std::move(failure);
  transition(WorkerState::FAILED);
  report.state = state_;
  CP_LOG(ERROR) << "Worker failed: " << report.describe();
}

} // namespace commparity
