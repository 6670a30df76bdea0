// Copyright (c) Meta Platforms, Inc. and affiliates.

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <ATen/ATen.h>

namespace commparity {

// Element types the parity matrix covers. Small integers are exact in all
// three, so reductions can be compared bit-for-bit.
enum class ElementType {
  FLOAT32 = 0,
  FLOAT16,
  BFLOAT16,
};

enum class ExecutionMode {
  EAGER = 0,
  GRAPH_REPLAY,
};

// Which accelerated backend, if any, is checked against the reference
// backend. NONE runs a second, out-of-place instance of the reference backend.
enum class BackendFlag {
  NONE = 0,
  MSCCLPP,
  CUSTOM_ALLREDUCE,
};

at::ScalarType toScalarType(ElementType type);
std::string_view getElementTypeName(ElementType type);
std::string_view getModeName(ExecutionMode mode);
std::string_view getBackendFlagName(BackendFlag flag);

// Parse the names returned by the getters above. Throw std::invalid_argument
// on unknown names.
ElementType parseElementType(std::string_view str);
ExecutionMode parseExecutionMode(std::string_view str);
BackendFlag parseBackendFlag(std::string_view str);

constexpr int kMinPort = 1;
constexpr int kMaxPort = 65535;

constexpr std::chrono::milliseconds kDefaultTimeout = std::chrono::seconds(600);
constexpr std::chrono::milliseconds kDefaultBootstrapTimeout =
    std::chrono::seconds(60);

/**
 * GroupConfig - What every worker of one run needs to find the group.
 *
 * Created fresh by the launcher for each run and handed to every worker by
 * value; the rank is supplied separately per worker.
 */
struct GroupConfig {
  int world_size{0};
  std::string master_address;
  int rendezvous_port{0};
  BackendFlag backend_flag{BackendFlag::NONE};

  // Throws std::invalid_argument if a field is out of range.
  void validate() const;

  bool operator==(const GroupConfig& other) const = default;
};

struct WorkerContext {
  int rank{-1};
  // -1 until the worker binds a device while joining.
  int local_device_index{-1};
  GroupConfig group;
};

struct TestCase {
  int64_t size{0};
  ElementType element_type{ElementType::FLOAT32};
  ExecutionMode mode{ExecutionMode::EAGER};
  int trial_index{0};

  std::string toString() const;

  bool operator==(const TestCase& other) const = default;
};

struct VerificationResult {
  TestCase test_case;
  int rank{-1};
  bool passed{true};
  std::optional<std::string> mismatch_detail;
};

} // namespace commparity
