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

#ifndef NOCTIS_LIB_ALGEBRA_NAT_H_
#define NOCTIS_LIB_ALGEBRA_NAT_H_

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include "algebra/limb.h"
#include "algebra/sysdep.h"
#include "util/panic.h"

namespace noctis {

// Value of the hex digit C, or -1 if C is not a hex digit.  Accepts
// both cases.
static inline int hex_digit(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

// Trusted variant of hex_digit().  Panics on malformed input.
static inline uint64_t digit(char c) {
  int d = hex_digit(c);
  check(d >= 0, "bad char");
  return static_cast<uint64_t>(d);
}

// Inverse of odd A modulo 2^64, by Newton iteration.  Each step doubles
// the number of correct low-order bits, starting from 3 (a * a == 1 mod 8
// for all odd a).
static inline uint64_t inv_mod_b(uint64_t a) {
  uint64_t x = a;
  for (size_t i = 0; i < 5; ++i) {
    x *= 2u - a * x;
  }
  return x;
}

// Natural numbers in [0, 2^(64 * W64)).
template <size_t W64>
class Nat : public Limb<W64> {
  using Super = Limb<W64>;

 public:
  using Super::kBits;
  using Super::kBytes;
  using Super::kU64;
  using Super::limb_;

  Nat() = default;
  explicit Nat(uint64_t x) : Super(x) {}
  explicit Nat(const std::array<uint64_t, W64>& a) : Super(a) {}

  // Decimal, or hex with a 0x/0X prefix.  This constructor is meant for
  // compile-time constants and panics on malformed text.  Use
  // of_untrusted_string() for anything that comes from outside.
  explicit Nat(const char* s) : Super() {
    check(s != nullptr, "null string");
    uint64_t base = 10;
    if (s[0] == '0' && (s[1] == 'x' || s[1] == 'X')) {
      base = 16;
      s += 2;
    }
    check(*s != '\0', "empty number");
    for (; *s; ++s) {
      uint64_t d = digit(*s);
      check(d < base, "bad char");
      check(mul_add_small(base, d) == 0, "number too large");
    }
  }

  // Same syntax as Nat(const char*), but returns nullopt instead of
  // panicking.  Never truncates: text whose value does not fit in W64
  // limbs is rejected.
  static std::optional<Nat> of_untrusted_string(const char* s) {
    if (s == nullptr) return std::nullopt;
    uint64_t base = 10;
    if (s[0] == '0' && (s[1] == 'x' || s[1] == 'X')) {
      base = 16;
      s += 2;
    }
    if (*s == '\0') return std::nullopt;

    Nat r;
    for (; *s; ++s) {
      int d = hex_digit(*s);
      if (d < 0 || static_cast<uint64_t>(d) >= base) return std::nullopt;
      if (r.mul_add_small(base, static_cast<uint64_t>(d)) != 0) {
        return std::nullopt;
      }
    }
    return r;
  }

  static Nat of_bytes(const uint8_t a[/*kBytes*/]) {
    Nat r;
    r.from_bytes(a);
    return r;
  }

  // this += y, returning the carry out.
  uint64_t add(const Nat& y) {
    uint64_t c = 0;
    for (size_t i = 0; i < W64; ++i) {
      limb_[i] = addcb(limb_[i], y.limb_[i], &c);
    }
    return c;
  }

  // this -= y, returning the borrow out.
  uint64_t sub(const Nat& y) {
    uint64_t b = 0;
    for (size_t i = 0; i < W64; ++i) {
      limb_[i] = subb(limb_[i], y.limb_[i], &b);
    }
    return b;
  }

  // this = this * m + a, returning the limb that falls off the top.
  uint64_t mul_add_small(uint64_t m, uint64_t a) {
    uint64_t carry = a;
    for (size_t i = 0; i < W64; ++i) {
      limb_[i] = muladd(limb_[i], m, 0, &carry);
    }
    return carry;
  }

  // Long division by a single limb: this = this / d, returns this % d.
  // Division by zero is a programming error.
  uint64_t divmod_small(uint64_t d) {
    check(d != 0, "division by zero");
    uint128_t rem = 0;
    for (size_t i = W64; i-- > 0;) {
      uint128_t cur = (rem << 64) | limb_[i];
      limb_[i] = static_cast<uint64_t>(cur / d);
      rem = cur % d;
    }
    return static_cast<uint64_t>(rem);
  }

  bool operator<(const Nat& y) const {
    for (size_t i = W64; i-- > 0;) {
      if (limb_[i] < y.limb_[i]) return true;
      if (limb_[i] > y.limb_[i]) return false;
    }
    return false;
  }
  bool operator>(const Nat& y) const { return y < *this; }
  bool operator<=(const Nat& y) const { return !(y < *this); }
  bool operator>=(const Nat& y) const { return !(*this < y); }

  // True iff the value fits in a single uint64_t.
  bool fits_u64() const {
    for (size_t i = 1; i < W64; ++i) {
      if (limb_[i] != 0) return false;
    }
    return true;
  }

  // Decimal representation, without leading zeros.
  std::string to_string() const {
    if (this->is_zero()) return "0";
    Nat t = *this;
    std::string s;
    while (!t.is_zero()) {
      uint64_t r = t.divmod_small(10);
      s.push_back(static_cast<char>('0' + r));
    }
    return std::string(s.rbegin(), s.rend());
  }

  // "0x" followed by exactly NDIGITS lower-case hex digits.  The value
  // must fit.
  std::string to_hex(size_t ndigits) const {
    check(ndigits <= 2 * kBytes, "too many hex digits");
    std::string s = "0x";
    for (size_t i = ndigits; i-- > 0;) {
      uint64_t nib = (limb_[i / 16] >> (4 * (i % 16))) & 0xfu;
      s.push_back("0123456789abcdef"[nib]);
    }
    for (size_t i = ndigits; i < 2 * kBytes; ++i) {
      check(((limb_[i / 16] >> (4 * (i % 16))) & 0xfu) == 0,
            "value does not fit in the requested width");
    }
    return s;
  }
};

}  // namespace noctis

#endif  // NOCTIS_LIB_ALGEBRA_NAT_H_
