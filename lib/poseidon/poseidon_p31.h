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

#ifndef NOCTIS_LIB_POSEIDON_POSEIDON_P31_H_
#define NOCTIS_LIB_POSEIDON_POSEIDON_P31_H_

#include <stddef.h>

#include <vector>

#include "algebra/fp_p31.h"
#include "poseidon/poseidon.h"

namespace noctis {

// Poseidon over Fp31 with a 16-lane state: 8 rate lanes that absorb
// input and 8 capacity lanes that are never written directly.  The
// schedule is 4 full + 13 partial + 4 full rounds with S-box x^7.
//
// These are the parameters the vault's 31-bit prover was deployed with;
// changing any constant changes every commitment and root.
class PoseidonP31 {
 public:
  using Field = Fp31;
  using Elt = Field::Elt;
  static constexpr size_t kWidth = 16;
  static constexpr size_t kRate = 8;
  static constexpr size_t kFullRounds = 8;
  static constexpr size_t kPartialRounds = 13;
  using Permutation = Poseidon<Field, kWidth, 7>;
  using State = Permutation::State;

  explicit PoseidonP31(const Fp31& F);

  // One-shot sponge: absorb IN[0..n) kRate lanes at a time, permuting
  // after each chunk, and squeeze lane 0.  For n <= kRate this is a
  // single permutation.
  Elt hash_n(const Elt in[/*n*/], size_t n) const;

  Elt hash1(const Elt& a) const;
  Elt hash2(const Elt& a, const Elt& b) const;
  Elt hash3(const Elt& a, const Elt& b, const Elt& c) const;

  void permute(State& s) const { perm_.permute(s); }

  const Field& field() const { return f_; }

 private:
  const Fp31& f_;
  const Permutation perm_;
};

}  // namespace noctis

#endif  // NOCTIS_LIB_POSEIDON_POSEIDON_P31_H_
