// Copyright (c) Meta Platforms, Inc. and affiliates.

#include "comms/commparity/nccl/ParityBackendNCCL.hpp"

#include <utility>
#include <vector>

#include <ATen/cuda/CUDAContext.h>
#include <fmt/core.h>

#include "comms/commparity/BackendFactory.hpp"
#include "comms/commparity/ParityLogging.hpp"

namespace commparity {

namespace {
constexpr std::string_view kUniqueIdKey = "nccl_unique_id";
constexpr std::chrono::seconds kWatchdogInterval{1};
} // namespace

NCCLException::NCCLException(
    NcclApi& nccl_api,
    const std::string& message,
    ncclResult_t result,
    ncclComm_t comm)
    : DeviceError(
          message + ": " + nccl_api.getErrorString(result) +
          " \nNCCL Last Error: " + nccl_api.getLastError(comm)),
      result_(result) {}

ncclDataType_t getNcclDataType(const at::Tensor& tensor) {
  switch (tensor.scalar_type()) {
    case at::ScalarType::Float:
      return ncclFloat32;
    case at::ScalarType::Double:
      return ncclFloat64;
    case at::ScalarType::Half:
      return ncclFloat16;
    case at::ScalarType::BFloat16:
      return ncclBfloat16;
    case at::ScalarType::Int:
      return ncclInt32;
    case at::ScalarType::Long:
      return ncclInt64;
    default:
      throw std::invalid_argument(
          fmt::format(
              "Unsupported tensor data type for NCCL: {}",
              c10::toString(tensor.scalar_type())));
  }
}

ParityBackendNCCL::ParityBackendNCCL()
    : ParityBackendNCCL(
          std::make_shared<DefaultNcclApi>(),
          std::make_shared<DefaultCudaApi>()) {}

ParityBackendNCCL::ParityBackendNCCL(
    std::shared_ptr<NcclApi> nccl_api,
    std::shared_ptr<CudaApi> cuda_api)
    : nccl_api_(std::move(nccl_api)), cuda_api_(std::move(cuda_api)) {}

ParityBackendNCCL::~ParityBackendNCCL() {
  stopWatchdog();
  if (nccl_comm_ != nullptr) {
    CP_LOG(WARNING, this) << "NCCL communicator was not finalized, aborting";
    CP_NCCL_CHECK_IGNORE(
        nccl_api_,
        nccl_api_->commAbort(nccl_comm_),
        "Failed to abort NCCL communicator");
    nccl_comm_ = nullptr;
  }
}

ncclUniqueId ParityBackendNCCL::exchangeUniqueId(
    const c10::intrusive_ptr<c10d::Store>& store) {
  ncclUniqueId uniqueId;
  std::string key(kUniqueIdKey);

  if (rank_ == 0) {
    CP_NCCL_CHECK(
        nccl_api_,
        nullptr,
        nccl_api_->getUniqueId(&uniqueId),
        "Failed to get NCCL unique ID");

    std::vector<uint8_t> vec(
        reinterpret_cast<uint8_t*>(&uniqueId),
        reinterpret_cast<uint8_t*>(&uniqueId) + sizeof(uniqueId));
    store->set(key, vec);
  } else {
    store->wait({key}, timeout_);
    auto vec = store->get(key);
    if (vec.size() != sizeof(ncclUniqueId)) {
      throw DeviceError("Invalid NCCL unique ID size");
    }
    uniqueId = *(reinterpret_cast<const ncclUniqueId*>(vec.data()));
  }
  return uniqueId;
}

void ParityBackendNCCL::init(
    at::Device device,
    int rank,
    int size,
    const std::string& name,
    const BackendOptions& options) {
  if (nccl_comm_ != nullptr) {
    throw std::runtime_error("ParityBackendNCCL already initialized");
  }
  if (!device.is_cuda() || !device.has_index()) {
    throw std::invalid_argument(
        fmt::format("NCCL backend needs an indexed CUDA device, got {}", device.str()));
  }
  if (!options.store.defined()) {
    throw std::invalid_argument("NCCL backend needs a store for bootstrap");
  }
  device_ = device;
  rank_ = rank;
  size_ = size;
  name_ = name;
  timeout_ = options.timeout;

  CP_CUDA_CHECK(
      cuda_api_,
      cuda_api_->setDevice(device_.index()),
      fmt::format("Failed to set device to {}", device_.index()));

  auto uniqueId = exchangeUniqueId(options.store);

  ncclConfig_t config = NCCL_CONFIG_INITIALIZER;
#if NCCL_VERSION_CODE >= NCCL_VERSION(2, 27, 0)
  config.commName = name_.c_str();
#endif

  ncclComm_t comm = nullptr;
  CP_NCCL_CHECK(
      nccl_api_,
      comm,
      nccl_api_->commInitRankConfig(&comm, size_, uniqueId, rank_, &config),
      "Failed to initialize NCCL communicator");
  if (comm == nullptr) {
    throw DeviceError("NCCL returned a null communicator");
  }
  nccl_comm_ = comm;
  CP_LOG(INFO, this) << "NCCL communicator initialized on " << device_;

  shutdown_ = false;
  watchdog_thread_ = std::thread(&ParityBackendNCCL::timeoutWatchdog, this);
}

void ParityBackendNCCL::finalize() {
  if (nccl_comm_ == nullptr) {
    return;
  }
  stopWatchdog();

  ncclResult_t asyncError = queryAsyncError();
  if (asyncError != ncclSuccess && asyncError != ncclInProgress) {
    NCCLException error(
        *nccl_api_, "NCCL communicator failed", asyncError, nccl_comm_);
    abortNcclComm();
    throw error;
  }

  cudaError_t pending = cuda_api_->streamQuery(
      cuda_api_->getCurrentCUDAStream(device_.index()));
  if (pending != cudaSuccess) {
    abortNcclComm();
    throw DeviceError(
        fmt::format(
            "NCCL communicator aborted with device work still pending: {}",
            cuda_api_->getErrorString(pending)));
  }

  ncclComm_t comm = std::exchange(nccl_comm_, nullptr);
  CP_NCCL_CHECK(
      nccl_api_,
      comm,
      nccl_api_->commDestroy(comm),
      "Failed to destroy NCCL communicator");
}

void ParityBackendNCCL::abortNcclComm() {
  ncclComm_t comm = std::exchange(nccl_comm_, nullptr);
  CP_LOG(ERROR, this) << "Aborting NCCL communicator on rank " << rank_;
  CP_NCCL_CHECK(
      nccl_api_, nullptr, nccl_api_->commAbort(comm), "NCCL Abort failed");
}

void ParityBackendNCCL::timeoutWatchdog() noexcept {
  CP_LOG(INFO, this) << "Watchdog thread starting for rank " << rank_;
  while (!shutdown_) {
    {
      std::unique_lock<std::mutex> lock(watchdog_mutex_);
      watchdog_cv_.wait_for(
          lock, kWatchdogInterval, [this]() { return shutdown_.load(); });
      if (shutdown_) {
        break;
      }
    }

    if (async_error_.load() != ncclSuccess) {
      continue;
    }
    ncclResult_t asyncError = ncclSuccess;
    ncclResult_t status = nccl_api_->commGetAsyncError(nccl_comm_, &asyncError);
    if (status != ncclSuccess) {
      asyncError = status;
    }
    if (asyncError != ncclSuccess && asyncError != ncclInProgress) {
      async_error_ = asyncError;
      CP_LOG(ERROR, this) << "NCCL communicator hit async error on rank "
                          << rank_ << ": "
                          << nccl_api_->getErrorString(asyncError);
    }
  }
}

void ParityBackendNCCL::stopWatchdog() {
  shutdown_ = true;
  {
    std::lock_guard<std::mutex> lock(watchdog_mutex_);
    watchdog_cv_.notify_all();
  }
  if (watchdog_thread_.joinable()) {
    watchdog_thread_.join();
  }
}

void ParityBackendNCCL::checkInitialized() const {
  if (nccl_comm_ == nullptr) {
    throw std::runtime_error("ParityBackendNCCL not initialized");
  }
}

ncclResult_t ParityBackendNCCL::queryAsyncError() {
  ncclResult_t asyncError = async_error_.load();
  if (asyncError != ncclSuccess) {
    return asyncError;
  }
  CP_NCCL_CHECK(
      nccl_api_,
      nccl_comm_,
      nccl_api_->commGetAsyncError(nccl_comm_, &asyncError),
      "Failed to query NCCL async error");
  return asyncError;
}

void ParityBackendNCCL::checkAsyncError() {
  ncclResult_t asyncError = queryAsyncError();
  if (asyncError != ncclSuccess && asyncError != ncclInProgress) {
    throw NCCLException(
        *nccl_api_, "NCCL communicator failed", asyncError, nccl_comm_);
  }
}

void ParityBackendNCCL::all_reduce(
    const at::Tensor& input,
    at::Tensor& output) {
  checkInitialized();
  checkAsyncError();
  if (input.numel() != output.numel() ||
      input.scalar_type() != output.scalar_type()) {
    throw std::invalid_argument(
        "all_reduce input and output must match in size and dtype");
  }
  if (!input.is_contiguous() || !output.is_contiguous()) {
    throw std::invalid_argument("all_reduce tensors must be contiguous");
  }
  if (input.device() != device_ || output.device() != device_) {
    throw std::invalid_argument(
        fmt::format("all_reduce tensors must live on {}", device_.str()));
  }

  auto stream = cuda_api_->getCurrentCUDAStream(device_.index());
  CP_NCCL_CHECK(
      nccl_api_,
      nccl_comm_,
      nccl_api_->allReduce(
          input.data_ptr(),
          output.data_ptr(),
          input.numel(),
          getNcclDataType(input),
          ncclSum,
          nccl_comm_,
          stream),
      "NCCL AllReduce failed");
  checkAsyncError();
}

} // namespace commparity

namespace {
class NCCLRegistration {
 public:
  NCCLRegistration() {
    commparity::BackendFactory::get().register_backend(
        std::string(commparity::ParityBackendNCCL::kBackendName),
        []() { return std::make_shared<commparity::ParityBackendNCCL>(); });
  }
};

static const NCCLRegistration registration{};
} // namespace
