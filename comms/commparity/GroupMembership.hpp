// Copyright (c) Meta Platforms, Inc. and affiliates.

#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_set>

#include <c10/util/intrusive_ptr.h>
#include <torch/csrc/distributed/c10d/Store.hpp>

#include "comms/commparity/ParityTypes.hpp"

namespace commparity {

/**
 * GroupMembership - One worker's view of the rendezvous store of its group.
 *
 * Rank 0 hosts a TCPStore at master_address:rendezvous_port and every rank
 * connects to it. The store is only used while bootstrapping: joining, the
 * warmup barrier and backend initialization.
 */
class GroupMembership {
 public:
  GroupMembership(
      GroupConfig group,
      int rank,
      std::chrono::milliseconds timeout = kDefaultBootstrapTimeout);

  // Connects to the store, claims this rank and checks that the whole group
  // agrees on world_size and on `matrix_digest`, then waits for every rank.
  // Throws JoinFailureError.
  void join(uint64_t matrix_digest);

  // Blocks until every rank entered a barrier with the same tag. Each call
  // uses a fresh set of keys. Throws JoinFailureError on timeout.
  void barrier(std::string_view tag);

  // Returns a view of the store under `prefix`. Prefixes cannot be reused.
  c10::intrusive_ptr<c10d::Store> getStore(std::string_view prefix);

  int getRank() const {
    return rank_;
  }
  int getSize() const {
    return group_.world_size;
  }
  bool isJoined() const {
    return root_.defined();
  }

 private:
  void connect();
  void checkAgreement(const std::string& key, const std::string& value);
  void waitForGroup(const std::string& key);

  const GroupConfig group_;
  const int rank_;
  const std::chrono::milliseconds timeout_;
  c10::intrusive_ptr<c10d::Store> root_;
  std::unordered_set<std::string> prefixes_;
  int barrier_count_{0};
};

} // namespace commparity
