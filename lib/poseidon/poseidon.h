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

#ifndef NOCTIS_LIB_POSEIDON_POSEIDON_H_
#define NOCTIS_LIB_POSEIDON_POSEIDON_H_

#include <stddef.h>

#include <array>
#include <utility>
#include <vector>

#include "util/panic.h"

namespace noctis {

// The Poseidon permutation over an arbitrary prime field, with the
// classic HADES schedule:
//
//   kFull/2 full rounds, kPartial partial rounds, kFull/2 full rounds
//
// where every round is
//
//   state[i] += ark[round * kWidth + i]     for all i
//   state[i] = state[i]^kAlpha              for all i (full round)
//   state[0] = state[0]^kAlpha              (partial round)
//   state = MDS * state
//
// The state is a plain std::array value; this class only owns the
// immutable round constants and mixing matrix, so a single const
// instance may be shared by any number of threads.
template <class Field, size_t kWidth, size_t kAlpha>
class Poseidon {
 public:
  using Elt = typename Field::Elt;
  using State = std::array<Elt, kWidth>;
  static constexpr size_t kStateWidth = kWidth;

  // ARK holds (full_rounds + partial_rounds) * kWidth constants, round
  // major.  MDS holds kWidth * kWidth entries, row major, and is applied
  // as state'[i] = sum_j MDS[i][j] * state[j].
  Poseidon(size_t full_rounds, size_t partial_rounds, std::vector<Elt> ark,
           std::vector<Elt> mds, const Field& F)
      : f_(F),
        full_rounds_(full_rounds),
        partial_rounds_(partial_rounds),
        ark_(std::move(ark)),
        mds_(std::move(mds)) {
    static_assert(kAlpha == 5 || kAlpha == 7, "unsupported S-box");
    check(full_rounds_ % 2 == 0, "full rounds must be even");
    check(ark_.size() == (full_rounds_ + partial_rounds_) * kWidth,
          "wrong number of round constants");
    check(mds_.size() == kWidth * kWidth, "wrong MDS size");
  }

  size_t rounds() const { return full_rounds_ + partial_rounds_; }
  size_t full_rounds() const { return full_rounds_; }
  size_t partial_rounds() const { return partial_rounds_; }

  void permute(State& s) const {
    size_t r = 0;
    for (size_t i = 0; i < full_rounds_ / 2; ++i, ++r) {
      add_round_constants(s, r);
      full_sbox(s);
      mix(s);
    }
    for (size_t i = 0; i < partial_rounds_; ++i, ++r) {
      add_round_constants(s, r);
      s[0] = sbox(s[0]);
      mix(s);
    }
    for (size_t i = 0; i < full_rounds_ / 2; ++i, ++r) {
      add_round_constants(s, r);
      full_sbox(s);
      mix(s);
    }
  }

  const Field& field() const { return f_; }

 private:
  Elt sbox(const Elt& x) const {
    return kAlpha == 5 ? f_.pow5(x) : f_.pow7(x);
  }

  void add_round_constants(State& s, size_t round) const {
    const Elt* c = &ark_[round * kWidth];
    for (size_t i = 0; i < kWidth; ++i) {
      f_.add(s[i], c[i]);
    }
  }

  void full_sbox(State& s) const {
    for (size_t i = 0; i < kWidth; ++i) {
      s[i] = sbox(s[i]);
    }
  }

  void mix(State& s) const {
    State t;
    for (size_t i = 0; i < kWidth; ++i) {
      Elt acc = f_.zero();
      for (size_t j = 0; j < kWidth; ++j) {
        f_.add(acc, f_.mulf(mds_[i * kWidth + j], s[j]));
      }
      t[i] = acc;
    }
    s = t;
  }

  const Field& f_;
  const size_t full_rounds_;
  const size_t partial_rounds_;
  const std::vector<Elt> ark_;
  const std::vector<Elt> mds_;
};

}  // namespace noctis

#endif  // NOCTIS_LIB_POSEIDON_POSEIDON_H_
