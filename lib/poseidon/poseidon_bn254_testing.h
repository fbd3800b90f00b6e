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

#ifndef NOCTIS_LIB_POSEIDON_POSEIDON_BN254_TESTING_H_
#define NOCTIS_LIB_POSEIDON_POSEIDON_BN254_TESTING_H_

#include <stddef.h>

#include "algebra/bogorng.h"
#include "algebra/fp_bn254.h"
#include "poseidon/poseidon_bn254.h"

namespace noctis {

// Parameter sets with the deployed schedule (RF = 8, RP = 57/56, x^5)
// but made-up constants: Bogorng round constants and a Cauchy MDS
// 1/(x_i + y_j) with x_i = i and y_j = t + j.  They exercise the same
// code paths as the real asset.  They do NOT produce the on-chain hash
// and must never be used outside tests.
inline PoseidonBn254Params poseidon_bn254_testing_params(size_t width,
                                                         const Fp254& F) {
  PoseidonBn254Params p;
  p.version = "testing";
  p.width = width;
  p.full_rounds = kPoseidonBn254FullRounds;
  p.partial_rounds = poseidon_bn254_partial_rounds(width);

  Bogorng<Fp254> rng(&F, 1000 + width);
  for (size_t i = 0; i < (p.full_rounds + p.partial_rounds) * width; ++i) {
    p.ark.push_back(rng.next());
  }
  for (size_t i = 0; i < width; ++i) {
    for (size_t j = 0; j < width; ++j) {
      Fp254::Elt d = F.of_scalar(i + width + j);
      F.invert(d);
      p.mds.push_back(d);
    }
  }
  return p;
}

}  // namespace noctis

#endif  // NOCTIS_LIB_POSEIDON_POSEIDON_BN254_TESTING_H_
