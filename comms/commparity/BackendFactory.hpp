// Copyright (c) Meta Platforms, Inc. and affiliates.

#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include <ATen/ATen.h>
#include <c10/core/Device.h>

#include "comms/commparity/ParityBackend.hpp"

namespace commparity {

/**
 * BackendFactory - Creates initialized backend instances by name.
 *
 * Backends linked into the process register themselves at static
 * initialization time. Any other name is loaded as a plugin from the shared
 * library named by COMMPARITY_BACKEND_LIB_PATH_<NAME>, which must export
 * `create_dynamic_loader_<name>`.
 */
class BackendFactory {
 public:
  static BackendFactory& get();

  std::shared_ptr<ParityBackend> create_backend(
      const std::string& backend,
      at::Device device,
      int rank,
      int size,
      const std::string& name,
      const BackendOptions& options = {});

  void register_backend(
      const std::string& backend,
      const std::function<std::shared_ptr<ParityBackend>()>& factory);

  bool is_registered(const std::string& backend);

 private:
  std::shared_ptr<ParityBackend> create_generic_backend(
      const std::string& backend);

  std::mutex mutex_;
  std::unordered_map<
      std::string,
      std::function<std::shared_ptr<ParityBackend>()>>
      backends_;
};

} // namespace commparity
