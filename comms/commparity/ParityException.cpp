// Copyright (c) Meta Platforms, Inc. and affiliates.

#include "comms/commparity/ParityException.hpp"

#include <utility>

#include <fmt/core.h>

namespace commparity {

namespace {

std::string describeMismatch(const VerificationResult& result) {
  return fmt::format(
      "Verification failed on rank {} for {}: {}",
      result.rank,
      result.test_case.toString(),
      result.mismatch_detail.value_or("no detail"));
}

} // namespace

std::string_view getErrorKindName(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::RESOURCE_UNAVAILABLE:
      return "ResourceUnavailable";
    case ErrorKind::JOIN_FAILURE:
      return "JoinFailure";
    case ErrorKind::BACKEND_SELECTION_CONFLICT:
      return "BackendSelectionConflict";
    case ErrorKind::VERIFICATION_MISMATCH:
      return "VerificationMismatch";
    case ErrorKind::DEVICE_ERROR:
      return "DeviceError";
  }
  return "Unknown";
}

std::optional<ErrorKind> parseErrorKind(std::string_view str) {
  for (auto kind :
       {ErrorKind::RESOURCE_UNAVAILABLE,
        ErrorKind::JOIN_FAILURE,
        ErrorKind::BACKEND_SELECTION_CONFLICT,
        ErrorKind::VERIFICATION_MISMATCH,
        ErrorKind::DEVICE_ERROR}) {
    if (getErrorKindName(kind) == str) {
      return kind;
    }
  }
  return std::nullopt;
}

ParityException::ParityException(ErrorKind kind, const std::string& message)
    : std::runtime_error(message), kind_(kind) {}

VerificationMismatchError::VerificationMismatchError(VerificationResult result)
    : ParityException(
          ErrorKind::VERIFICATION_MISMATCH,
          describeMismatch(result)),
      result_(std::move(result)) {}

} // namespace commparity
