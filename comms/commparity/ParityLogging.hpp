// Copyright (c) Meta Platforms, Inc. and affiliates.

#pragma once

#include <string>
#include <string_view>

#include <fmt/core.h>
#include <glog/logging.h>

#include "comms/commparity/ParityBackend.hpp"

namespace commparity {

// Rank stamped on log lines that are not tied to a backend instance. -1
// (the default) leaves the rank out.
void setDefaultLogRank(int rank);
int getDefaultLogRank();

inline std::string getCommNamePrefix(const ParityBackend* backend) {
  return backend ? fmt::format("[name={}]", backend->getCommName()) : "";
}

inline std::string getRankPrefix(const ParityBackend* backend) {
  int rank = backend ? backend->getRank() : getDefaultLogRank();
  return rank >= 0 ? fmt::format("[rank={}]", rank) : "";
}

// Initializes glog once per process. Safe to call repeatedly.
void tryParityLoggingInit(std::string_view name);

} // namespace commparity

#define CP_LOG_METADATA(backend)                   \
  "[CP]" << ::commparity::getRankPrefix(backend) \
         << ::commparity::getCommNamePrefix(backend) << " "

// level is one of the following: INFO, WARNING, ERROR, FATAL
#define CP_LOG_WITH_PREFIX_BUILDER(level, backend) \
  LOG(level) << CP_LOG_METADATA(backend)
#define CP_LOG_PICKER(x, level, backend, FUNC, ...) FUNC
#define CP_LOG(...)                            \
  CP_LOG_PICKER(                               \
      ,                                        \
      ##__VA_ARGS__,                           \
      CP_LOG_WITH_PREFIX_BUILDER(__VA_ARGS__), \
      CP_LOG_WITH_PREFIX_BUILDER(__VA_ARGS__, nullptr))
