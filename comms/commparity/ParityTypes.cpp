// Copyright (c) Meta Platforms, Inc. and affiliates.

#include "comms/commparity/ParityTypes.hpp"

#include <stdexcept>

#include <fmt/core.h>

namespace commparity {

at::ScalarType toScalarType(ElementType type) {
  switch (type) {
    case ElementType::FLOAT32:
      return at::kFloat;
    case ElementType::FLOAT16:
      return at::kHalf;
    case ElementType::BFLOAT16:
      return at::kBFloat16;
  }
  throw std::invalid_argument("Unknown element type");
}

std::string_view getElementTypeName(ElementType type) {
  switch (type) {
    case ElementType::FLOAT32:
      return "float32";
    case ElementType::FLOAT16:
      return "float16";
    case ElementType::BFLOAT16:
      return "bfloat16";
  }
  return "unknown";
}

std::string_view getModeName(ExecutionMode mode) {
  switch (mode) {
    case ExecutionMode::EAGER:
      return "eager";
    case ExecutionMode::GRAPH_REPLAY:
      return "graph";
  }
  return "unknown";
}

std::string_view getBackendFlagName(BackendFlag flag) {
  switch (flag) {
    case BackendFlag::NONE:
      return "none";
    case BackendFlag::MSCCLPP:
      return "mscclpp";
    case BackendFlag::CUSTOM_ALLREDUCE:
      return "custom_allreduce";
  }
  return "unknown";
}

ElementType parseElementType(std::string_view str) {
  for (auto type :
       {ElementType::FLOAT32, ElementType::FLOAT16, ElementType::BFLOAT16}) {
    if (getElementTypeName(type) == str) {
      return type;
    }
  }
  throw std::invalid_argument(
      fmt::format("Unknown element type '{}'", std::string(str)));
}

ExecutionMode parseExecutionMode(std::string_view str) {
  if (str == getModeName(ExecutionMode::EAGER)) {
    return ExecutionMode::EAGER;
  }
  if (str == getModeName(ExecutionMode::GRAPH_REPLAY) || str == "graph_replay") {
    return ExecutionMode::GRAPH_REPLAY;
  }
  throw std::invalid_argument(
      fmt::format("Unknown execution mode '{}'", std::string(str)));
}

BackendFlag parseBackendFlag(std::string_view str) {
  for (auto flag :
       {BackendFlag::NONE,
        BackendFlag::MSCCLPP,
        BackendFlag::CUSTOM_ALLREDUCE}) {
    if (getBackendFlagName(flag) == str) {
      return flag;
    }
  }
  throw std::invalid_argument(
      fmt::format("Unknown backend flag '{}'", std::string(str)));
}

void GroupConfig::validate() const {
  if (world_size <= 0) {
    throw std::invalid_argument(
        fmt::format("world_size must be positive, got {}", world_size));
  }
  if (master_address.empty()) {
    throw std::invalid_argument("master_address must not be empty");
  }
  if (rendezvous_port < kMinPort || rendezvous_port > kMaxPort) {
    throw std::invalid_argument(
        fmt::format(
            "rendezvous_port must be in [{}, {}], got {}",
            kMinPort,
            kMaxPort,
            rendezvous_port));
  }
}

std::string TestCase::toString() const {
  return fmt::format(
      "TestCase(size={}, dtype={}, mode={}, trial={})",
      size,
      getElementTypeName(element_type),
      getModeName(mode),
      trial_index);
}

} // namespace commparity
