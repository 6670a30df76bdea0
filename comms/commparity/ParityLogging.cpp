// Copyright (c) Meta Platforms, Inc. and affiliates.

#include "comms/commparity/ParityLogging.hpp"

#include <atomic>
#include <string>

// Google glog's api does not have an external function that allows one to check
// if glog is initialized or not. It does have an internal function - so we are
// declaring it here. This is a hack but has been used by a bunch of others too
// (e.g. Torch).
namespace google::glog_internal_namespace_ {
bool IsGoogleLoggingInitialized();
} // namespace google::glog_internal_namespace_

namespace commparity {

namespace {
std::atomic<int> defaultLogRank{-1};
} // namespace

void setDefaultLogRank(int rank) {
  defaultLogRank.store(rank);
}

int getDefaultLogRank() {
  return defaultLogRank.load();
}

void tryParityLoggingInit(std::string_view name) {
  // glog keeps the pointer, so the name must outlive the process.
  static const std::string program_name(name);
  // This trick can only be used on UNIX platforms
  if (!::google::glog_internal_namespace_::IsGoogleLoggingInitialized()) {
    ::google::InitGoogleLogging(program_name.c_str());
#if !defined(__aarch64__)
    ::google::InstallFailureSignalHandler();
#endif
  }
}

} // namespace commparity
