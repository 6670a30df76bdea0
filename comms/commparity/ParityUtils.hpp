// Copyright (c) Meta Platforms, Inc. and affiliates.

#pragma once

#include <string>
#include <string_view>
#include <utility>

namespace commparity {

bool string_to_bool(std::string_view str);

// Convert environment variable to specified type, with default value if not set
template <typename T>
T env_to_value(std::string_view env_key, const T& default_value);

// Query rank and size from the launcher environment (COMMPARITY_RANK and
// COMMPARITY_SIZE, then MPI, then torchrun variables).
std::pair<int, int> query_ranksize();

std::string trim_whitespace(std::string_view str);

} // namespace commparity
