// Copyright (c) Meta Platforms, Inc. and affiliates.

#include "comms/commparity/TensorVerification.hpp"

#include <algorithm>
#include <cmath>
#include <string>
#include <utility>

#include <fmt/core.h>
#include <fmt/ranges.h>

namespace commparity {

VerificationResult verifyExactMatch(
    const TestCase& test_case,
    int rank,
    const at::Tensor& output,
    const at::Tensor& expected,
    std::string_view label) {
  VerificationResult result{
      .test_case = test_case, .rank = rank, .passed = true};

  if (!output.sizes().equals(expected.sizes()) ||
      output.scalar_type() != expected.scalar_type()) {
    result.passed = false;
    result.mismatch_detail = fmt::format(
        "{}: shape or dtype mismatch, output {} [{}] vs expected {} [{}]",
        label,
        c10::toString(output.scalar_type()),
        fmt::join(output.sizes(), ", "),
        c10::toString(expected.scalar_type()),
        fmt::join(expected.sizes(), ", "));
    return result;
  }

  // Widen to double so every supported element type compares exactly
  auto output_cpu = output.to(at::kCPU, at::kDouble).flatten();
  auto expected_cpu = expected.to(at::kCPU, at::kDouble).flatten();
  auto differs = output_cpu.ne(expected_cpu);
  auto num_diffs = differs.sum().item<int64_t>();
  if (num_diffs == 0) {
    return result;
  }

  auto indices = differs.nonzero().flatten();
  auto num_shown = std::min<int64_t>(kMaxReportedMismatches, num_diffs);
  std::string detail = fmt::format(
      "{}: {} of {} elements differ; first {}:",
      label,
      num_diffs,
      output_cpu.numel(),
      num_shown);
  for (int64_t i = 0; i < num_shown; ++i) {
    auto idx = indices[i].item<int64_t>();
    auto out_val = output_cpu[idx].item<double>();
    auto exp_val = expected_cpu[idx].item<double>();
    detail += fmt::format(
        " [{}] output={} expected={} diff={};",
        idx,
        out_val,
        exp_val,
        std::abs(out_val - exp_val));
  }

  result.passed = false;
  result.mismatch_detail = std::move(detail);
  return result;
}

} // namespace commparity
