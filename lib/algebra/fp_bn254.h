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

#ifndef NOCTIS_LIB_ALGEBRA_FP_BN254_H_
#define NOCTIS_LIB_ALGEBRA_FP_BN254_H_

#include <array>
#include <cstddef>
#include <cstdint>

#include "algebra/fp_generic.h"

namespace noctis {
// The scalar field of the BN254 (alt_bn128) curve,
//
//   r = 21888242871839275222246405745257275088548364400416034343698204186575808495617
//     = 0x30644e72e131a029b85045b68181585d2833e84879b9709143e1f593f0000001
//
// which is the field the EVM precompiles and every circom-derived
// on-chain hash operate in.  Canonical residues need 254 bits and must
// cross the contract boundary as 32-byte words.
struct Fp254Params {
  static const constexpr std::array<uint64_t, 4> kModulus = {
      0x43e1f593f0000001u,
      0x2833e84879b97091u,
      0xb85045b68181585du,
      0x30644e72e131a029u,
  };
  static constexpr size_t kBits = 254;
};

using Fp254 = FpGeneric<4, Fp254Params>;
}  // namespace noctis

#endif  // NOCTIS_LIB_ALGEBRA_FP_BN254_H_
