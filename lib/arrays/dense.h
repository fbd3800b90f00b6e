// Copyright 2025 Google LLC.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#ifndef NOCTIS_LIB_ARRAYS_DENSE_H_
#define NOCTIS_LIB_ARRAYS_DENSE_H_

#include <stddef.h>

#include <cstdint>
#include <memory>
#include <vector>

#include "util/panic.h"

namespace noctis {

// A dense two-dimensional array of field elements, stored with index i0
// varying fastest.  For an execution trace, n0_ is the column count
// (the width) and n1_ is the number of rows, so v_ is the row-major
// table that the proving backend consumes.
template <class Field>
class Dense {
  using Elt = typename Field::Elt;

 public:
  size_t n0_, n1_;
  std::vector<Elt> v_;

  Dense(size_t n0, size_t n1) : n0_(n0), n1_(n1), v_(n0 * n1) {}

  // no copies, but see clone() below
  Dense(const Dense& y) = delete;
  Dense operator=(const Dense& y) = delete;

  std::unique_ptr<Dense> clone() const {
    auto d = std::make_unique<Dense>(n0_, n1_);
    d->v_ = v_;
    return d;
  }

  size_t width() const { return n0_; }
  size_t rows() const { return n1_; }

  const Elt& at(size_t i0, size_t i1) const {
    check(i0 < n0_ && i1 < n1_, "Dense::at() out of range");
    return v_[i0 + n0_ * i1];
  }
};

// Fills a Dense array sequentially.  The caller pushes exactly
// n0_ * n1_ elements and checks size() at the end.
template <class Field>
class DenseFiller {
  using Elt = typename Field::Elt;

 public:
  explicit DenseFiller(Dense<Field>& w) : w_(w), i_(0) {}

  void push_back(const Elt& x) {
    check(i_ < w_.v_.size(), "DenseFiller overflow");
    w_.v_[i_++] = x;
  }

  // Pushes the BITS least-significant bits of X, LSB first, as the
  // field elements 0 and 1.
  void push_back(uint64_t x, size_t bits, const Field& F) {
    for (size_t i = 0; i < bits; ++i) {
      push_back(((x >> i) & 1u) ? F.one() : F.zero());
    }
  }

  size_t size() const { return i_; }

 private:
  Dense<Field>& w_;
  size_t i_;
};

}  // namespace noctis

#endif  // NOCTIS_LIB_ARRAYS_DENSE_H_
