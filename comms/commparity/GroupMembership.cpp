// Copyright (c) Meta Platforms, Inc. and affiliates.

#include "comms/commparity/GroupMembership.hpp"

#include <utility>
#include <vector>

#include <fmt/core.h>
#include <torch/csrc/distributed/c10d/PrefixStore.hpp>
#include <torch/csrc/distributed/c10d/TCPStore.hpp>

#include "comms/commparity/ParityException.hpp"
#include "comms/commparity/ParityLogging.hpp"

namespace commparity {

namespace {

std::vector<uint8_t> toBytes(const std::string& str) {
  return std::vector<uint8_t>(str.begin(), str.end());
}

std::string fromBytes(const std::vector<uint8_t>& bytes) {
  return std::string(bytes.begin(), bytes.end());
}

} // namespace

GroupMembership::GroupMembership(
    GroupConfig group,
    int rank,
    std::chrono::milliseconds timeout)
    : group_(std::move(group)), rank_(rank), timeout_(timeout) {}

void GroupMembership::connect() {
  c10d::TCPStoreOptions opts;
  opts.port = static_cast<uint16_t>(group_.rendezvous_port);
  opts.isServer = (rank_ == 0);
  opts.numWorkers = group_.world_size;
  opts.waitWorkers = false;
  opts.useLibUV = true;
  opts.timeout = timeout_;

  CP_LOG(INFO) << "Connecting to rendezvous store at " << group_.master_address
               << ":" << group_.rendezvous_port
               << (opts.isServer ? " (hosting)" : "");
  root_ = c10::make_intrusive<c10d::TCPStore>(group_.master_address, opts);
}

void GroupMembership::join(uint64_t matrix_digest) {
  if (rank_ < 0 || rank_ >= group_.world_size) {
    throw JoinFailureError(
        fmt::format(
            "Rank {} is outside of the group of size {}",
            rank_,
            group_.world_size));
  }
  if (root_.defined()) {
    throw JoinFailureError(fmt::format("Rank {} already joined", rank_));
  }

  try {
    connect();

    auto claims = root_->add(fmt::format("join/rank/{}", rank_), 1);
    if (claims != 1) {
      throw JoinFailureError(
          fmt::format("Rank {} was claimed by more than one worker", rank_));
    }

    checkAgreement("join/world_size", std::to_string(group_.world_size));
    checkAgreement("join/matrix_digest", fmt::format("{:016x}", matrix_digest));
    waitForGroup("join/arrived");
  } catch (const JoinFailureError&) {
    root_.reset();
    throw;
  } catch (const std::exception& e) {
    root_.reset();
    throw JoinFailureError(
        fmt::format(
            "Rank {} failed to join the group at {}:{}: {}",
            rank_,
            group_.master_address,
            group_.rendezvous_port,
            e.what()));
  }
  CP_LOG(INFO) << "Joined group of size " << group_.world_size;
}

void GroupMembership::checkAgreement(
    const std::string& key,
    const std::string& value) {
  // Rank 0 publishes its value and everybody else compares against it
  if (rank_ == 0) {
    root_->set(key, toBytes(value));
    return;
  }
  root_->wait({key}, timeout_);
  auto expected = fromBytes(root_->get(key));
  if (expected != value) {
    throw JoinFailureError(
        fmt::format(
            "Rank {} disagrees with rank 0 on {}: '{}' vs '{}'",
            rank_,
            key,
            value,
            expected));
  }
}

void GroupMembership::waitForGroup(const std::string& key) {
  // The last rank to arrive releases everybody else
  auto arrived = root_->add(key + "/count", 1);
  if (arrived == group_.world_size) {
    root_->set(key + "/done", toBytes("1"));
  }
  root_->wait({key + "/done"}, timeout_);
}

void GroupMembership::barrier(std::string_view tag) {
  if (!root_.defined()) {
    throw JoinFailureError("Barrier requested before joining the group");
  }
  auto key = fmt::format("barrier/{}/{}", tag, barrier_count_++);
  try {
    waitForGroup(key);
  } catch (const std::exception& e) {
    throw JoinFailureError(
        fmt::format("Group barrier '{}' failed: {}", tag, e.what()));
  }
}

c10::intrusive_ptr<c10d::Store> GroupMembership::getStore(
    std::string_view prefix) {
  if (!root_.defined()) {
    throw JoinFailureError("Store requested before joining the group");
  }
  std::string name(prefix);
  // Each backend instance needs its own namespace to avoid key collisions
  if (prefixes_.contains(name)) {
    throw std::runtime_error("Store prefix has been reused for: " + name);
  }
  prefixes_.insert(name);
  return c10::make_intrusive<c10d::PrefixStore>(name, root_->clone());
}

} // namespace commparity
