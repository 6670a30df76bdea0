// Copyright (c) Meta Platforms, Inc. and affiliates.

#include "comms/commparity/HarnessOptions.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

#include <fmt/core.h>

#include "comms/commparity/ParityUtils.hpp"

namespace commparity {

namespace {

c10::DeviceType deviceTypeFromEnv() {
  std::string device = env_to_value<std::string>("TEST_DEVICE", "cuda");
  std::transform(device.begin(), device.end(), device.begin(), [](unsigned char c) {
    return std::tolower(c);
  });
  if (device == "cpu") {
    return c10::DeviceType::CPU;
  }
  if (device == "cuda") {
    return c10::DeviceType::CUDA;
  }
  throw std::runtime_error(
      fmt::format("Unsupported TEST_DEVICE '{}', expected cpu or cuda", device));
}

} // namespace

HarnessOptions HarnessOptions::fromEnv() {
  HarnessOptions options;
  options.master_addr = env_to_value<std::string>(
      "COMMPARITY_TEST_MASTER_ADDR", options.master_addr);
  options.large_group =
      env_to_value<bool>("COMMPARITY_TEST_LARGE_GROUP", options.large_group);
  options.toggles.mscclpp = env_to_value<bool>(
      "COMMPARITY_ENABLE_MSCCLPP", options.toggles.mscclpp);
  options.toggles.custom_allreduce = env_to_value<bool>(
      "COMMPARITY_ENABLE_CUSTOM_ALLREDUCE", options.toggles.custom_allreduce);
  options.num_trials =
      env_to_value<int>("COMMPARITY_TEST_TRIALS", options.num_trials);
  options.seed = env_to_value<uint64_t>("COMMPARITY_TEST_SEED", options.seed);
  options.num_replays =
      env_to_value<int>("COMMPARITY_TEST_NUM_REPLAYS", options.num_replays);
  options.bootstrap_timeout = std::chrono::milliseconds(env_to_value<int64_t>(
      "COMMPARITY_BOOTSTRAP_TIMEOUT_MS", options.bootstrap_timeout.count()));
  options.collective_timeout =
      std::chrono::milliseconds(env_to_value<int64_t>(
          "COMMPARITY_COLLECTIVE_TIMEOUT_MS",
          options.collective_timeout.count()));
  options.device_type = deviceTypeFromEnv();

  if (options.num_trials < 0) {
    throw std::runtime_error(
        fmt::format(
            "COMMPARITY_TEST_TRIALS must not be negative, got {}",
            options.num_trials));
  }
  if (options.num_replays < 1) {
    throw std::runtime_error(
        fmt::format(
            "COMMPARITY_TEST_NUM_REPLAYS must be at least 1, got {}",
            options.num_replays));
  }
  if (options.bootstrap_timeout.count() <= 0) {
    throw std::runtime_error("COMMPARITY_BOOTSTRAP_TIMEOUT_MS must be positive");
  }
  if (options.collective_timeout.count() <= 0) {
    throw std::runtime_error(
        "COMMPARITY_COLLECTIVE_TIMEOUT_MS must be positive");
  }
  return options;
}

RunOptions HarnessOptions::runOptions() const {
  return RunOptions{
      .matrix = defaultTestMatrixParams(num_trials),
      .seed = seed,
      .num_replays = num_replays,
      .bootstrap_timeout = bootstrap_timeout,
      .collective_timeout = collective_timeout,
      .device_type = device_type,
  };
}

} // namespace commparity
