// Copyright (c) Meta Platforms, Inc. and affiliates.

#pragma once

#include <cstddef>
#include <cstdint>
#include <iterator>
#include <vector>

#include "comms/commparity/ParityTypes.hpp"

namespace commparity {

constexpr int kDefaultNumTrials = 10;

struct TestMatrixParams {
  std::vector<int64_t> sizes;
  std::vector<ElementType> element_types;
  std::vector<ExecutionMode> modes;
  int num_trials{kDefaultNumTrials};

  bool operator==(const TestMatrixParams& other) const = default;
};

// Sizes {512, 4096, 32768, 262144, 524288}, all element types, both modes.
TestMatrixParams defaultTestMatrixParams(int num_trials = kDefaultNumTrials);

/**
 * TestMatrix - Deterministic enumeration of the test cases of one run.
 *
 * Cases are ordered by mode, then size (ascending), then element type (in
 * the given order), then trial index. Every worker of a group builds the same
 * matrix from the same parameters and walks it in the same order, which keeps
 * the collectives of all ranks matched up.
 */
class TestMatrix {
 public:
  class Iterator {
   public:
    using iterator_category = std::input_iterator_tag;
    using value_type = TestCase;
    using difference_type = std::ptrdiff_t;
    using pointer = void;
    using reference = TestCase;

    Iterator() = default;
    Iterator(const TestMatrix* matrix, size_t index)
        : matrix_(matrix), index_(index) {}

    TestCase operator*() const {
      return matrix_->at(index_);
    }
    Iterator& operator++() {
      ++index_;
      return *this;
    }
    Iterator operator++(int) {
      Iterator prev = *this;
      ++index_;
      return prev;
    }
    bool operator==(const Iterator& other) const {
      return index_ == other.index_;
    }

   private:
    const TestMatrix* matrix_{nullptr};
    size_t index_{0};
  };

  // Throws std::invalid_argument on empty dimensions, non-positive sizes or
  // a negative trial count. Duplicate sizes are collapsed.
  explicit TestMatrix(TestMatrixParams params);

  size_t size() const;
  TestCase at(size_t index) const;

  Iterator begin() const {
    return Iterator(this, 0);
  }
  Iterator end() const {
    return Iterator(this, size());
  }

  std::vector<TestCase> enumerate() const;

  // FNV-1a hash of the enumerated cases. Workers compare it while joining to
  // detect groups whose members would walk different matrices.
  uint64_t digest() const;

  const TestMatrixParams& params() const {
    return params_;
  }

 private:
  TestMatrixParams params_;
};

} // namespace commparity
