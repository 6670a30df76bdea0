// Copyright (c) Meta Platforms, Inc. and affiliates.

#pragma once

#include <string_view>

#include <ATen/ATen.h>

#include "comms/commparity/ParityTypes.hpp"

namespace commparity {

constexpr int kMaxReportedMismatches = 10;

// Compares `output` against `expected` elementwise and exactly. On mismatch,
// the detail names `label`, the number of differing elements and the first
// kMaxReportedMismatches of them with both values and their absolute
// difference. Both tensors may live on any device.
VerificationResult verifyExactMatch(
    const TestCase& test_case,
    int rank,
    const at::Tensor& output,
    const at::Tensor& expected,
    std::string_view label);

} // namespace commparity
