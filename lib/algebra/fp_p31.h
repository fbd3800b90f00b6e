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

#ifndef NOCTIS_LIB_ALGEBRA_FP_P31_H_
#define NOCTIS_LIB_ALGEBRA_FP_P31_H_

#include <array>
#include <cstddef>
#include <cstdint>

#include "algebra/fp_generic.h"

namespace noctis {
// Fp(15 * 2^27 + 1) = Fp(2013265921), a.k.a. BabyBear.  The field has
// roots of unity of order 2^27, which is what the STARK backend wants,
// and canonical residues fit in a uint32_t.
//
// A single 64-bit limb is wasteful for a 31-bit prime, but keeping the
// generic Montgomery representation lets the hash and Merkle code be
// shared with Fp254.
struct Fp31Params {
  static const constexpr std::array<uint64_t, 1> kModulus = {
      0x0000000078000001u,
  };
  static constexpr size_t kBits = 31;
};

using Fp31 = FpGeneric<1, Fp31Params>;
}  // namespace noctis

#endif  // NOCTIS_LIB_ALGEBRA_FP_P31_H_
