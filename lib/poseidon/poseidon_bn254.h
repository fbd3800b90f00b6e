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

#ifndef NOCTIS_LIB_POSEIDON_POSEIDON_BN254_H_
#define NOCTIS_LIB_POSEIDON_POSEIDON_BN254_H_

#include <stddef.h>

#include <string>
#include <vector>

#include "algebra/fp_bn254.h"
#include "poseidon/poseidon.h"

namespace noctis {

// Poseidon over the BN254 scalar field, in the two widths the vault
// contract calls: t = 3 (2-to-1, Merkle nodes and nullifiers) and t = 4
// (3-to-1, balance-note commitments).  Both use 8 full rounds, x^5, and
// 57 (t = 3) or 56 (t = 4) partial rounds.
//
// The output must match the hash the contract already runs, bit for
// bit, so the round constants and MDS matrices are not part of this
// library.  They are a versioned data asset, exported from the same
// constant tables the on-chain hash was generated from, and loaded at
// run time.  There is no built-in fallback: without a valid asset a
// PoseidonBn254 cannot be constructed.
//
// Asset format: whitespace-separated tokens, '#' starts a comment.
//
//   poseidon_bn254 <version>
//   width <t>
//   full_rounds 8
//   partial_rounds <57 or 56>
//   alpha 5
//   ark
//   <(full_rounds + partial_rounds) * t constants, round major>
//   mds
//   <t * t constants, row major, state'[i] = sum_j mds[i][j] state[j]>
//   end
//
// Constants are decimal or 0x-prefixed hex and must be canonical
// (< r).
//
// The state layout is the circom one: lane 0 is the capacity lane and
// starts at zero, the inputs go to lanes 1..t-1, and the digest is lane
// 0 after the permutation.

enum PoseidonParamsStatus {
  POSEIDON_PARAMS_OK = 0,
  POSEIDON_PARAMS_IO_ERROR = 1,
  POSEIDON_PARAMS_MALFORMED = 2,
  POSEIDON_PARAMS_BAD_SCHEDULE = 3,
  POSEIDON_PARAMS_BAD_CONSTANT = 4,
  POSEIDON_PARAMS_WRONG_COUNT = 5,
  POSEIDON_PARAMS_DIGEST_MISMATCH = 6,
};

const char* poseidon_params_status_name(PoseidonParamsStatus s);

constexpr size_t kPoseidonBn254FullRounds = 8;
constexpr size_t kPoseidonBn254Alpha = 5;

// 57 for t = 3, 56 for t = 4, 0 for any width the vault does not use.
size_t poseidon_bn254_partial_rounds(size_t width);

struct PoseidonBn254Params {
  std::string version;
  std::string sha256;  // lower-case hex digest of the asset bytes
  size_t width = 0;
  size_t full_rounds = 0;
  size_t partial_rounds = 0;
  std::vector<Fp254::Elt> ark;
  std::vector<Fp254::Elt> mds;
};

// Parses an asset held in memory.  WIDTH is the width the caller
// expects; any other width or schedule is rejected.  On failure *PARAMS
// is left untouched.
PoseidonParamsStatus parse_poseidon_bn254_params(const std::string& text,
                                                 size_t width, const Fp254& F,
                                                 PoseidonBn254Params* params);

// Reads and parses the asset at PATH.  If SHA256_HEX is non-empty the
// file must have exactly that digest, so a deployment can pin the asset
// version it was audited with.
PoseidonParamsStatus load_poseidon_bn254_params(const std::string& path,
                                                size_t width,
                                                const std::string& sha256_hex,
                                                const Fp254& F,
                                                PoseidonBn254Params* params);

// Serializes PARAMS in the asset format above.
std::string poseidon_bn254_params_to_text(const PoseidonBn254Params& params,
                                          const Fp254& F);

class PoseidonBn254 {
 public:
  using Field = Fp254;
  using Elt = Field::Elt;
  using T3 = Poseidon<Fp254, 3, kPoseidonBn254Alpha>;
  using T4 = Poseidon<Fp254, 4, kPoseidonBn254Alpha>;

  // Both parameter sets must come from parse/load, which already
  // enforced their schedule.
  PoseidonBn254(const PoseidonBn254Params& t3, const PoseidonBn254Params& t4,
                const Fp254& F);

  // PoseidonT3(a, 0): the spending-key hash.
  Elt hash1(const Elt& a) const;
  // PoseidonT3(a, b)
  Elt hash2(const Elt& a, const Elt& b) const;
  // PoseidonT4(a, b, c)
  Elt hash3(const Elt& a, const Elt& b, const Elt& c) const;

  void permute3(T3::State& s) const { t3_.permute(s); }
  void permute4(T4::State& s) const { t4_.permute(s); }

  const Field& field() const { return f_; }

 private:
  const Fp254& f_;
  const T3 t3_;
  const T4 t4_;
};

}  // namespace noctis

#endif  // NOCTIS_LIB_POSEIDON_POSEIDON_BN254_H_
