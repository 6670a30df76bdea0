// Copyright (c) Meta Platforms, Inc. and affiliates.

#include "comms/commparity/ParityUtils.hpp"

#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <sstream>
#include <stdexcept>
#include <type_traits>

namespace commparity {

std::string trim_whitespace(std::string_view str) {
  auto start = str.find_first_not_of(" \t\n\r\f\v");
  if (start == std::string_view::npos) {
    return "";
  }
  auto end = str.find_last_not_of(" \t\n\r\f\v");
  return std::string(str.substr(start, end - start + 1));
}

bool string_to_bool(std::string_view str) {
  std::string lowercase_str = trim_whitespace(str);
  std::transform(
      lowercase_str.begin(),
      lowercase_str.end(),
      lowercase_str.begin(),
      [](unsigned char c) { return std::tolower(c); });

  bool is_true =
      (lowercase_str == "1" || lowercase_str == "true" ||
       lowercase_str == "yes" || lowercase_str == "y");
  bool is_false =
      (lowercase_str == "0" || lowercase_str == "false" ||
       lowercase_str == "no" || lowercase_str == "n");

  if (!is_true && !is_false) {
    throw std::runtime_error("Invalid value for string " + std::string(str));
  }
  return is_true;
}

template <typename T>
T env_to_value(std::string_view env_key, const T& default_value) {
  const char* env_value = std::getenv(std::string(env_key).c_str());
  if (!env_value) {
    return default_value;
  }

  std::string value = trim_whitespace(env_value);
  if (value.empty()) {
    return default_value;
  }

  if constexpr (std::is_same_v<T, bool>) {
    return string_to_bool(value);
  } else if constexpr (std::is_same_v<T, std::string>) {
    return value;
  } else {
    T result;
    std::istringstream ss(value);
    ss >> result;
    if (ss.fail() || !ss.eof()) {
      throw std::runtime_error(
          "Invalid value for environment variable " + std::string(env_key) +
          ": " + value);
    }
    return result;
  }
}

template bool env_to_value<bool>(std::string_view, const bool&);
template int env_to_value<int>(std::string_view, const int&);
template int64_t env_to_value<int64_t>(std::string_view, const int64_t&);
template uint64_t env_to_value<uint64_t>(std::string_view, const uint64_t&);
template std::string env_to_value<std::string>(
    std::string_view,
    const std::string&);

std::pair<int, int> query_ranksize() {
  int rank = -1;
  int size = -1;

  // Lambda to query rank and size from a pair of environment variables,
  // returning true if both values were found
  auto tryQuery = [&](std::string_view rank_key, std::string_view size_key) {
    rank = env_to_value<int>(rank_key, -1);
    size = env_to_value<int>(size_key, -1);
    return rank != -1 && size != -1;
  };

  if (tryQuery("COMMPARITY_RANK", "COMMPARITY_SIZE") ||
      tryQuery("OMPI_COMM_WORLD_RANK", "OMPI_COMM_WORLD_SIZE") ||
      tryQuery("PMI_RANK", "PMI_SIZE") || tryQuery("RANK", "WORLD_SIZE")) {
    return std::make_pair(rank, size);
  }

  throw std::runtime_error(
      "Unable to determine rank and size from environment variables. "
      "Please set COMMPARITY_RANK and COMMPARITY_SIZE, or ensure you are "
      "running in a supported environment (Torchrun or MPI).");
}

} // namespace commparity
