// Copyright (c) Meta Platforms, Inc. and affiliates.

#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

#include "comms/commparity/ParityTypes.hpp"

namespace commparity {

enum class ErrorKind {
  RESOURCE_UNAVAILABLE = 0,
  JOIN_FAILURE,
  BACKEND_SELECTION_CONFLICT,
  VERIFICATION_MISMATCH,
  DEVICE_ERROR,
};

std::string_view getErrorKindName(ErrorKind kind);
std::optional<ErrorKind> parseErrorKind(std::string_view str);

// Base class for every failure the harness reports. The kind survives the
// trip from a worker process back to the launcher.
class ParityException : public std::runtime_error {
 public:
  ParityException(ErrorKind kind, const std::string& message);

  [[nodiscard]] ErrorKind kind() const noexcept {
    return kind_;
  }

 private:
  ErrorKind kind_;
};

// No free local port could be obtained.
class ResourceUnavailableError : public ParityException {
 public:
  explicit ResourceUnavailableError(const std::string& message)
      : ParityException(ErrorKind::RESOURCE_UNAVAILABLE, message) {}
};

// A worker could not join the group or agree with it on the run's shape.
class JoinFailureError : public ParityException {
 public:
  explicit JoinFailureError(const std::string& message)
      : ParityException(ErrorKind::JOIN_FAILURE, message) {}
};

// More than one accelerated backend was requested for the same run.
class BackendSelectionConflictError : public ParityException {
 public:
  explicit BackendSelectionConflictError(const std::string& message)
      : ParityException(ErrorKind::BACKEND_SELECTION_CONFLICT, message) {}
};

class VerificationMismatchError : public ParityException {
 public:
  explicit VerificationMismatchError(VerificationResult result);

  [[nodiscard]] const VerificationResult& result() const noexcept {
    return result_;
  }

 private:
  VerificationResult result_;
};

// A backend or device runtime operation failed.
class DeviceError : public ParityException {
 public:
  explicit DeviceError(const std::string& message)
      : ParityException(ErrorKind::DEVICE_ERROR, message) {}
};

} // namespace commparity
