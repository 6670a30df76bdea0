// Copyright (c) Meta Platforms, Inc. and affiliates.

#include "comms/commparity/BackendFactory.hpp"

#include <dlfcn.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <sstream>
#include <stdexcept>

#include "comms/commparity/ParityLogging.hpp"

namespace commparity {

namespace {

// BackendLib owns a dlopen() handle for a backend plugin and closes it on
// destruction. It is movable but not copyable. setLoader() must succeed
// before the library can create backend instances.
class BackendLib {
 public:
  explicit BackendLib(const char* path) {
    CP_LOG(INFO) << "Loading backend library: " << path;
    handle_ = dlopen(path, RTLD_LAZY | RTLD_LOCAL);
    if (handle_ == nullptr) {
      std::stringstream error_msg;
      error_msg << "Failed to load backend library: " << dlerror()
                << " path=" << path;
      throw std::runtime_error(error_msg.str());
    }
  }

  BackendLib(BackendLib&& other) noexcept
      : handle_(other.handle_), loader_(other.loader_) {
    other.handle_ = nullptr;
  }

  ~BackendLib() {
    if (handle_ != nullptr) {
      dlclose(handle_);
    }
  }

  BackendLib(const BackendLib&) = delete;
  BackendLib& operator=(const BackendLib&) = delete;
  BackendLib& operator=(BackendLib&&) = delete;

  bool setLoader(const std::string& loader_fn_name, std::stringstream& err) {
    auto create_loader_fn = reinterpret_cast<CreateDynamicLoaderFn>(
        dlsym(handle_, loader_fn_name.c_str()));

    if (create_loader_fn == nullptr) {
      err << "Failed to load function " << loader_fn_name
          << " from backend library";
      return false;
    }

    loader_ = create_loader_fn();

    if (loader_.new_backend == nullptr || loader_.destroy_backend == nullptr ||
        loader_.get_supported_version == nullptr) {
      err << "Dynamic loader interface missing required function pointers";
      return false;
    }

    std::string supported_version = loader_.get_supported_version();
    if (supported_version != COMMPARITY_BACKEND_ABI_VERSION) {
      err << "ABI version mismatch: " << supported_version
          << " != " << COMMPARITY_BACKEND_ABI_VERSION;
      return false;
    }

    return true;
  }

  DynamicLoaderInterface getLoader() const {
    return loader_;
  }

 private:
  void* handle_{nullptr};
  DynamicLoaderInterface loader_{};
};

BackendLib getBackendLib(const std::string& backend) {
  std::string env_key = "COMMPARITY_BACKEND_LIB_PATH_" + backend;
  std::transform(
      env_key.begin(), env_key.end(), env_key.begin(), [](unsigned char c) {
        return std::toupper(c);
      });

  const char* backend_lib_path = std::getenv(env_key.c_str());
  if (backend_lib_path == nullptr) {
    std::stringstream error_msg;
    error_msg << "Backend " << backend << " specified, but " << env_key
              << " not set";
    throw std::runtime_error(error_msg.str());
  }

  BackendLib backend_lib(backend_lib_path);

  std::string loader_fn_name = "create_dynamic_loader_" + backend;
  std::stringstream err;
  if (!backend_lib.setLoader(loader_fn_name, err)) {
    throw std::runtime_error(err.str());
  }
  return backend_lib;
}

// Keeps plugin libraries loaded for the lifetime of the process so that
// backend instances never outlive their code.
class BackendRegistry {
 public:
  DynamicLoaderInterface getBackend(const std::string& backend) {
    std::lock_guard<std::mutex> guard(mutex_);
    auto it = libs_.find(backend);
    if (it == libs_.end()) {
      it = libs_.emplace(backend, getBackendLib(backend)).first;
    }
    return it->second.getLoader();
  }

  void eraseBackend(const std::string& backend) {
    std::lock_guard<std::mutex> guard(mutex_);
    libs_.erase(backend);
  }

  static BackendRegistry& get() {
    static BackendRegistry instance;
    return instance;
  }

 private:
  std::mutex mutex_;
  std::unordered_map<std::string, BackendLib> libs_;
};

} // namespace

std::shared_ptr<ParityBackend> BackendFactory::create_backend(
    const std::string& backend,
    at::Device device,
    int rank,
    int size,
    const std::string& name,
    const BackendOptions& options) {
  std::function<std::shared_ptr<ParityBackend>()> factory;
  {
    std::lock_guard<std::mutex> guard(mutex_);
    if (auto it = backends_.find(backend); it != backends_.end()) {
      factory = it->second;
    }
  }

  std::shared_ptr<ParityBackend> impl =
      factory ? factory() : create_generic_backend(backend);
  if (!impl) {
    throw std::runtime_error("Backend factory returned null for " + backend);
  }

  CP_LOG(INFO) << "Initializing backend " << backend << " as " << name
               << " on " << device;
  impl->init(device, rank, size, name, options);
  return impl;
}

std::shared_ptr<ParityBackend> BackendFactory::create_generic_backend(
    const std::string& backend) {
  auto loader = BackendRegistry::get().getBackend(backend);

  ParityBackend* raw_backend = loader.new_backend();
  if (raw_backend == nullptr) {
    BackendRegistry::get().eraseBackend(backend);
    throw std::runtime_error("Failed to create backend instance");
  }

  // destroy_backend must run inside the plugin that allocated the instance
  auto deleter = [loader](ParityBackend* ptr) {
    if (ptr) {
      loader.destroy_backend(ptr);
    }
  };
  return std::shared_ptr<ParityBackend>(raw_backend, deleter);
}

void BackendFactory::register_backend(
    const std::string& backend,
    const std::function<std::shared_ptr<ParityBackend>()>& factory) {
  std::lock_guard<std::mutex> guard(mutex_);
  backends_.emplace(backend, factory);
}

bool BackendFactory::is_registered(const std::string& backend) {
  std::lock_guard<std::mutex> guard(mutex_);
  return backends_.contains(backend);
}

BackendFactory& BackendFactory::get() {
  static BackendFactory instance;
  return instance;
}

} // namespace commparity
