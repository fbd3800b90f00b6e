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

#ifndef NOCTIS_LIB_ALGEBRA_LIMB_H_
#define NOCTIS_LIB_ALGEBRA_LIMB_H_

#include <array>
#include <cstddef>
#include <cstdint>

namespace noctis {

// Fixed-size array of W64 little-endian 64-bit limbs.  Limb<> knows
// nothing about arithmetic; see Nat<> for that.
template <size_t W64>
class Limb {
 public:
  static constexpr size_t kU64 = W64;
  static constexpr size_t kBytes = 8 * W64;
  static constexpr size_t kBits = 64 * W64;

  uint64_t limb_[W64];

  Limb() : limb_{} {}

  explicit Limb(uint64_t x) : limb_{} { limb_[0] = x; }

  explicit Limb(const std::array<uint64_t, W64>& a) {
    for (size_t i = 0; i < W64; ++i) {
      limb_[i] = a[i];
    }
  }

  std::array<uint64_t, W64> u64() const {
    std::array<uint64_t, W64> a;
    for (size_t i = 0; i < W64; ++i) {
      a[i] = limb_[i];
    }
    return a;
  }

  // Little-endian byte serialization.
  void to_bytes(uint8_t a[/*kBytes*/]) const {
    for (size_t i = 0; i < W64; ++i) {
      uint64_t x = limb_[i];
      for (size_t j = 0; j < 8; ++j) {
        *a++ = x & 0xffu;
        x >>= 8;
      }
    }
  }

  void from_bytes(const uint8_t a[/*kBytes*/]) {
    for (size_t i = 0; i < W64; ++i) {
      uint64_t x = 0;
      for (size_t j = 8; j-- > 0;) {
        x = (x << 8) | a[8 * i + j];
      }
      limb_[i] = x;
    }
  }

  bool operator==(const Limb& y) const {
    for (size_t i = 0; i < W64; ++i) {
      if (limb_[i] != y.limb_[i]) return false;
    }
    return true;
  }
  bool operator!=(const Limb& y) const { return !operator==(y); }

  // Shift right by 0 <= z < 64 bits.
  void shiftr(size_t z) {
    if (z == 0) return;
    for (size_t i = 0; i + 1 < W64; ++i) {
      limb_[i] = (limb_[i] >> z) | (limb_[i + 1] << (64 - z));
    }
    limb_[W64 - 1] >>= z;
  }

  // Shift left by 0 <= z < 64 bits, returning the bits shifted out.
  uint64_t shiftl(size_t z) {
    if (z == 0) return 0;
    uint64_t out = limb_[W64 - 1] >> (64 - z);
    for (size_t i = W64; i-- > 1;) {
      limb_[i] = (limb_[i] << z) | (limb_[i - 1] >> (64 - z));
    }
    limb_[0] <<= z;
    return out;
  }

  uint64_t bit(size_t i) const { return (limb_[i / 64] >> (i % 64)) & 1u; }

  bool is_zero() const {
    uint64_t acc = 0;
    for (size_t i = 0; i < W64; ++i) {
      acc |= limb_[i];
    }
    return acc == 0;
  }
};

}  // namespace noctis

#endif  // NOCTIS_LIB_ALGEBRA_LIMB_H_
