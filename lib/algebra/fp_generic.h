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

#ifndef NOCTIS_LIB_ALGEBRA_FP_GENERIC_H_
#define NOCTIS_LIB_ALGEBRA_FP_GENERIC_H_

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include "algebra/nat.h"
#include "algebra/sysdep.h"
#include "util/panic.h"

namespace noctis {

// Prime field Fp with p < 2^(64 * W64 - 2), elements kept in Montgomery
// form x * R mod p with R = 2^(64 * W64).  Every operation returns the
// unique representative in [0, p), so two elements are equal iff their
// limbs are equal.
//
// OPS supplies the constants of a particular field:
//   kModulus  std::array<uint64_t, W64>, little-endian limbs of p
//   kBits     bit length of p; determines the external byte width
//
// This class is the capability interface that the hash, Merkle and
// circuit code is written against.  Fp254 and Fp31 are the two
// instances used by the vault.
template <size_t W64, class OPS>
class FpGeneric {
 public:
  using N = Nat<W64>;
  using limb_t = uint64_t;
  static constexpr size_t kU64 = W64;
  static constexpr size_t kBits = OPS::kBits;
  static constexpr size_t kBytes = (kBits + 7) / 8;

  struct Elt {
    N n;
    bool operator==(const Elt& y) const { return n == y.n; }
    bool operator!=(const Elt& y) const { return !operator==(y); }
  };

  FpGeneric() : m_(OPS::kModulus) {
    check((m_.limb_[0] & 1) == 1, "modulus must be odd");
    check((m_.limb_[W64 - 1] >> 62) == 0, "modulus too large");
    mprime_ = -inv_mod_b(m_.limb_[0]);

    // R^2 mod p by 2 * 64 * W64 modular doublings of 1.
    N r(1);
    for (size_t i = 0; i < 2 * N::kBits; ++i) {
      uint64_t c = r.shiftl(1);
      if (c != 0 || r >= m_) {
        r.sub(m_);
      }
    }
    rsquare_ = r;

    k_[0] = of_scalar(0);
    k_[1] = of_scalar(1);
    k_[2] = of_scalar(2);
    mone_ = negf(k_[1]);
    pm2_ = m_;
    pm2_.sub(N(2));
  }

  // Not copyable; pass fields by const reference.
  FpGeneric(const FpGeneric&) = delete;
  FpGeneric& operator=(const FpGeneric&) = delete;

  const Elt& zero() const { return k_[0]; }
  const Elt& one() const { return k_[1]; }
  const Elt& two() const { return k_[2]; }
  const Elt& mone() const { return mone_; }
  const N& modulus() const { return m_; }

  // x += y
  void add(Elt& x, const Elt& y) const {
    uint64_t c = x.n.add(y.n);
    if (c != 0 || x.n >= m_) {
      x.n.sub(m_);
    }
  }

  // x -= y
  void sub(Elt& x, const Elt& y) const {
    uint64_t b = x.n.sub(y.n);
    if (b != 0) {
      x.n.add(m_);
    }
  }

  // x = -x
  void neg(Elt& x) const {
    if (x.n.is_zero()) return;
    N t = m_;
    t.sub(x.n);
    x.n = t;
  }

  // x *= y.  Computes the full 2 * W64 limb product and then applies a
  // complete Montgomery reduction, W64 word-by-word steps each of which
  // clears one low limb, followed by a single conditional subtraction.
  // With a, b < p the intermediate value stays below 2 p R, so the extra
  // top limb of T catches every carry.
  void mul(Elt& x, const Elt& y) const { x.n = redc_product(x.n, y.n); }

  Elt addf(Elt x, const Elt& y) const {
    add(x, y);
    return x;
  }
  Elt subf(Elt x, const Elt& y) const {
    sub(x, y);
    return x;
  }
  Elt mulf(Elt x, const Elt& y) const {
    mul(x, y);
    return x;
  }
  Elt negf(Elt x) const {
    neg(x);
    return x;
  }

  // x^e by left-to-right square-and-multiply.
  Elt powf(const Elt& x, const N& e) const {
    Elt r = one();
    for (size_t i = N::kBits; i-- > 0;) {
      mul(r, r);
      if (e.bit(i)) {
        mul(r, x);
      }
    }
    return r;
  }

  // The S-box powers.
  Elt pow5(const Elt& x) const {
    Elt x2 = mulf(x, x);
    Elt x4 = mulf(x2, x2);
    return mulf(x4, x);
  }
  Elt pow7(const Elt& x) const {
    Elt x2 = mulf(x, x);
    Elt x3 = mulf(x2, x);
    Elt x6 = mulf(x3, x3);
    return mulf(x6, x);
  }

  // x = 1/x by Fermat.  Zero stays zero.
  void invert(Elt& x) const { x = powf(x, pm2_); }

  // a * R mod p.  Accepts any a < 2^(64 * W64), reducing it mod p.
  Elt to_montgomery(const N& a) const { return Elt{redc_product(a, rsquare_)}; }

  // The canonical residue of x.
  N from_montgomery(const Elt& x) const { return redc_product(x.n, N(1)); }

  Elt of_scalar(uint64_t a) const { return to_montgomery(N(a)); }

  Elt of_scalar_field(const std::array<uint64_t, W64>& a) const {
    return to_montgomery(N(a));
  }

  // Trusted constants only; panics on malformed text or on a value that is
  // not a canonical residue.
  Elt of_string(const char* s) const {
    N a(s);
    check(a < m_, "constant out of range");
    return to_montgomery(a);
  }

  // Parses decimal, or hex with an optional 0x/0X prefix.  Returns nullopt
  // for malformed text and for values >= p.
  std::optional<Elt> of_untrusted_string(const char* s) const {
    std::optional<N> a = N::of_untrusted_string(s);
    if (!a.has_value() || !(*a < m_)) return std::nullopt;
    return to_montgomery(*a);
  }

  // Hex without a prefix is accepted here, as it is by the hex codec of
  // the deployed tooling.
  std::optional<Elt> of_untrusted_hex(const std::string& s) const {
    if (s.size() >= 2 && s[0] == '0' && (s[1] == 'x' || s[1] == 'X')) {
      return of_untrusted_string(s.c_str());
    }
    return of_untrusted_string(("0x" + s).c_str());
  }

  // "0x" followed by 2 * kBytes lower-case digits.
  std::string to_hex(const Elt& x) const {
    return from_montgomery(x).to_hex(2 * kBytes);
  }

  std::string to_decimal(const Elt& x) const {
    return from_montgomery(x).to_string();
  }

  // The canonical residue as a machine integer.  Always succeeds for
  // fields of at most 64 bits; for larger fields the caller must know
  // that the value is small.
  uint64_t u64_of(const Elt& x) const {
    N a = from_montgomery(x);
    check(a.fits_u64(), "field element does not fit in 64 bits");
    return a.limb_[0];
  }

 private:
  N redc_product(const N& a, const N& b) const {
    limb_t t[2 * W64 + 1] = {};

    for (size_t i = 0; i < W64; ++i) {
      limb_t carry = 0;
      for (size_t j = 0; j < W64; ++j) {
        t[i + j] = muladd(a.limb_[i], b.limb_[j], t[i + j], &carry);
      }
      t[i + W64] = carry;
    }

    for (size_t i = 0; i < W64; ++i) {
      limb_t u = t[i] * mprime_;
      limb_t carry = 0;
      for (size_t j = 0; j < W64; ++j) {
        t[i + j] = muladd(u, m_.limb_[j], t[i + j], &carry);
      }
      for (size_t k = i + W64; k < 2 * W64 + 1 && carry != 0; ++k) {
        limb_t c = 0;
        t[k] = addcb(t[k], carry, &c);
        carry = c;
      }
    }

    N r;
    for (size_t i = 0; i < W64; ++i) {
      r.limb_[i] = t[i + W64];
    }
    if (t[2 * W64] != 0 || r >= m_) {
      r.sub(m_);
    }
    return r;
  }

  const N m_;
  limb_t mprime_;
  N rsquare_;
  N pm2_;
  Elt k_[3];
  Elt mone_;
};

}  // namespace noctis

#endif  // NOCTIS_LIB_ALGEBRA_FP_GENERIC_H_
