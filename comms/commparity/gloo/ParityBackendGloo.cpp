// Copyright (c) Meta Platforms, Inc. and affiliates.

#include "comms/commparity/gloo/ParityBackendGloo.hpp"

#include <stdexcept>
#include <utility>

#include <fmt/core.h>
#include <gloo/allreduce.h>
#include <gloo/math.h>
#include <gloo/rendezvous/context.h>
#include <gloo/transport/tcp/device.h>

#include "comms/commparity/BackendFactory.hpp"
#include "comms/commparity/ParityException.hpp"
#include "comms/commparity/ParityLogging.hpp"
#include "comms/commparity/ParityUtils.hpp"
#include "comms/commparity/gloo/GlooStore.hpp"

namespace commparity {

#define GENERATE_ALL_TYPES(type, func, args...)                          \
  switch (type) {                                                        \
    case ::at::ScalarType::Float:                                        \
      func<float>(args);                                                 \
      break;                                                             \
    case ::at::ScalarType::Double:                                       \
      func<double>(args);                                                \
      break;                                                             \
    case ::at::ScalarType::Half:                                         \
      func<c10::Half>(args);                                             \
      break;                                                             \
    case ::at::ScalarType::BFloat16:                                     \
      func<c10::BFloat16>(args);                                         \
      break;                                                             \
    case ::at::ScalarType::Int:                                          \
      func<int32_t>(args);                                               \
      break;                                                             \
    case ::at::ScalarType::Long:                                         \
      func<int64_t>(args);                                               \
      break;                                                             \
    default:                                                             \
      throw std::invalid_argument(                                       \
          fmt::format(                                                   \
              "Unsupported tensor data type for Gloo: {}",               \
              c10::toString(type)));                                     \
  }

namespace {

template <typename T>
void setSumOutput(gloo::AllreduceOptions& opts, at::Tensor& tensor) {
  opts.setOutput(static_cast<T*>(tensor.data_ptr()), tensor.numel());
  opts.setReduceFunction(gloo::AllreduceOptions::Func(&::gloo::sum<T>));
}

} // namespace

void ParityBackendGloo::init(
    at::Device device,
    int rank,
    int size,
    const std::string& name,
    const BackendOptions& options) {
  if (init_state_ == InitializationState::INITIALIZED) {
    throw std::runtime_error("ParityBackendGloo already initialized");
  } else if (init_state_ == InitializationState::FINALIZED) {
    throw std::runtime_error("ParityBackendGloo already finalized");
  }
  if (!device.is_cpu()) {
    throw std::invalid_argument(
        fmt::format("Gloo backend only supports CPU, got {}", device.str()));
  }
  if (!options.store.defined()) {
    throw std::invalid_argument("Gloo backend needs a store for bootstrap");
  }

  device_ = device;
  rank_ = rank;
  size_ = size;
  name_ = name;
  timeout_ = options.timeout;

  ::gloo::transport::tcp::attr attr;
  attr.hostname = env_to_value<std::string>("COMMPARITY_GLOO_HOSTNAME", "");
  attr.iface = env_to_value<std::string>("COMMPARITY_GLOO_INTERFACE", "");
  const auto& hints = options.hints;
  if (hints.contains("hostname")) {
    attr.hostname = hints.at("hostname");
  }
  if (hints.contains("interface")) {
    attr.iface = hints.at("interface");
  }

  try {
    auto gloo_device = ::gloo::transport::tcp::CreateDevice(attr);
    auto context = std::make_shared<::gloo::rendezvous::Context>(rank_, size_);
    context->setTimeout(timeout_);

    std::shared_ptr<::gloo::rendezvous::Store> connectStore =
        std::make_shared<GlooStore>(options.store, timeout_);
    context->connectFullMesh(connectStore, gloo_device);
    context_ = std::move(context);
  } catch (const std::exception& e) {
    throw DeviceError(
        fmt::format("Failed to connect Gloo context '{}': {}", name_, e.what()));
  }

  init_state_ = InitializationState::INITIALIZED;
  CP_LOG(INFO, this) << "Gloo context connected";
}

void ParityBackendGloo::finalize() {
  if (init_state_ == InitializationState::UNINITIALIZED) {
    throw std::runtime_error("ParityBackendGloo not initialized");
  } else if (init_state_ == InitializationState::FINALIZED) {
    throw std::runtime_error("ParityBackendGloo already finalized");
  }
  init_state_ = InitializationState::FINALIZED;
  context_.reset();
}

void ParityBackendGloo::checkInitialized() const {
  if (init_state_ != InitializationState::INITIALIZED) {
    throw std::runtime_error("ParityBackendGloo not initialized");
  }
}

void ParityBackendGloo::all_reduce(
    const at::Tensor& input,
    at::Tensor& output) {
  checkInitialized();
  if (input.numel() != output.numel() ||
      input.scalar_type() != output.scalar_type()) {
    throw std::invalid_argument(
        "all_reduce input and output must match in size and dtype");
  }
  if (!input.is_contiguous() || !output.is_contiguous()) {
    throw std::runtime_error("Tensor must be contiguous for Gloo operations");
  }
  if (!input.is_cpu() || !output.is_cpu()) {
    throw std::invalid_argument("Gloo backend only supports CPU tensors");
  }

  if (output.data_ptr() != input.data_ptr()) {
    output.copy_(input);
  }

  gloo::AllreduceOptions opts(context_);
  opts.setTag(nextTag());
  opts.setTimeout(timeout_);
  GENERATE_ALL_TYPES(output.scalar_type(), setSumOutput, opts, output);

  try {
    gloo::allreduce(opts);
  } catch (const std::exception& e) {
    throw DeviceError(fmt::format("Gloo allreduce failed: {}", e.what()));
  }
}

} // namespace commparity

namespace {
class GlooRegistration {
 public:
  GlooRegistration() {
    commparity::BackendFactory::get().register_backend(
        std::string(commparity::ParityBackendGloo::kBackendName),
        []() { return std::make_shared<commparity::ParityBackendGloo>(); });
  }
};

static const GlooRegistration registration{};
} // namespace
