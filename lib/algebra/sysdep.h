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

#ifndef NOCTIS_LIB_ALGEBRA_SYSDEP_H_
#define NOCTIS_LIB_ALGEBRA_SYSDEP_H_

#include <cstddef>
#include <cstdint>

// Word-level primitives on 64-bit limbs.  All of them are written in
// terms of unsigned __int128, which gcc and clang lower to the native
// add-with-carry and widening multiply instructions.
namespace noctis {

using uint128_t = unsigned __int128;

// Returns a + b + *carry and sets *carry to the outgoing carry (0 or 1).
static inline uint64_t addcb(uint64_t a, uint64_t b, uint64_t* carry) {
  uint128_t s = static_cast<uint128_t>(a) + b + *carry;
  *carry = static_cast<uint64_t>(s >> 64);
  return static_cast<uint64_t>(s);
}

// Returns a - b - *borrow and sets *borrow to the outgoing borrow (0 or 1).
static inline uint64_t subb(uint64_t a, uint64_t b, uint64_t* borrow) {
  uint128_t d = static_cast<uint128_t>(a) - b - *borrow;
  *borrow = static_cast<uint64_t>(d >> 64) & 1u;
  return static_cast<uint64_t>(d);
}

// (*h, *l) = a * b.
static inline void mulq(uint64_t* l, uint64_t* h, uint64_t a, uint64_t b) {
  uint128_t p = static_cast<uint128_t>(a) * b;
  *l = static_cast<uint64_t>(p);
  *h = static_cast<uint64_t>(p >> 64);
}

// Returns a * b + c + *carry, setting *carry to the high word.  The sum
// cannot overflow 128 bits since (2^64-1)^2 + 2 * (2^64-1) = 2^128 - 1.
static inline uint64_t muladd(uint64_t a, uint64_t b, uint64_t c,
                              uint64_t* carry) {
  uint128_t p = static_cast<uint128_t>(a) * b + c + *carry;
  *carry = static_cast<uint64_t>(p >> 64);
  return static_cast<uint64_t>(p);
}

// (h[i], l[i]) = a * b[i] for i in [0, n).
static inline void mulhl(size_t n, uint64_t l[/*n*/], uint64_t h[/*n*/],
                         uint64_t a, const uint64_t b[/*n*/]) {
  for (size_t i = 0; i < n; ++i) {
    mulq(&l[i], &h[i], a, b[i]);
  }
}

}  // namespace noctis

#endif  // NOCTIS_LIB_ALGEBRA_SYSDEP_H_
