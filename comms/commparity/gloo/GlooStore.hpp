// Copyright (c) Meta Platforms, Inc. and affiliates.

#pragma once

#include <chrono>
#include <string>
#include <utility>
#include <vector>

#include <c10/util/intrusive_ptr.h>
#include <gloo/rendezvous/store.h>
#include <torch/csrc/distributed/c10d/Store.hpp>

namespace commparity {

// Exposes a backend's private c10d store to Gloo's rendezvous.
class GlooStore : public ::gloo::rendezvous::Store {
 public:
  GlooStore(
      c10::intrusive_ptr<::c10d::Store> store,
      std::chrono::milliseconds timeout)
      : store_(std::move(store)), timeout_(timeout) {}

  void set(const std::string& key, const std::vector<char>& value) override {
    store_->set(key, std::vector<uint8_t>(value.begin(), value.end()));
  }

  std::vector<char> get(const std::string& key) override {
    auto value = store_->get(key);
    return std::vector<char>(value.begin(), value.end());
  }

  void wait(const std::vector<std::string>& keys) override {
    store_->wait(keys, timeout_);
  }

  void wait(
      const std::vector<std::string>& keys,
      const std::chrono::milliseconds& timeout) override {
    store_->wait(keys, timeout);
  }

  bool has_v2_support() override {
    return store_->hasExtendedApi();
  }

  std::vector<std::vector<char>> multi_get(
      const std::vector<std::string>& keys) override {
    std::vector<std::vector<char>> res;
    for (auto& value : store_->multiGet(keys)) {
      res.emplace_back(value.begin(), value.end());
    }
    return res;
  }

  void multi_set(
      const std::vector<std::string>& keys,
      const std::vector<std::vector<char>>& values) override {
    std::vector<std::vector<uint8_t>> u_values;
    u_values.reserve(values.size());
    for (auto& value : values) {
      u_values.emplace_back(value.begin(), value.end());
    }
    store_->multiSet(keys, u_values);
  }

  void append(const std::string& key, const std::vector<char>& value) override {
    store_->append(key, std::vector<uint8_t>(value.begin(), value.end()));
  }

  int64_t add(const std::string& key, int64_t value) override {
    return store_->add(key, value);
  }

 private:
  c10::intrusive_ptr<::c10d::Store> store_;
  std::chrono::milliseconds timeout_;
};

} // namespace commparity
