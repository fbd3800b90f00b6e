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

#ifndef NOCTIS_LIB_RANDOM_RANDOM_H_
#define NOCTIS_LIB_RANDOM_RANDOM_H_

#include <stddef.h>
#include <stdint.h>

#include <cstring>

namespace noctis {

// Source of fresh note material.  Subclasses provide bytes(); field
// elements and bounded integers are derived from it by rejection
// sampling, so they are uniform whenever the bytes are.
class RandomEngine {
 public:
  RandomEngine() = default;
  virtual ~RandomEngine() = default;

  // Not copyable, so that a stream is never replayed by accident.
  RandomEngine(const RandomEngine&) = delete;
  RandomEngine& operator=(const RandomEngine&) = delete;

  virtual void bytes(uint8_t buf[/*n*/], size_t n) = 0;

  // Uniform element of F.
  template <class Field>
  typename Field::Elt elt(const Field& F) {
    using N = typename Field::N;
    constexpr size_t kTopBits = Field::kBits % 8;
    uint8_t buf[N::kBytes];
    for (;;) {
      std::memset(buf, 0, sizeof(buf));
      bytes(buf, Field::kBytes);
      if (kTopBits != 0) {
        buf[Field::kBytes - 1] &= static_cast<uint8_t>((1u << kTopBits) - 1);
      }
      N n = N::of_bytes(buf);
      if (n < F.modulus()) {
        return F.to_montgomery(n);
      }
    }
  }

  template <class Field>
  void elt(typename Field::Elt e[/*n*/], size_t n, const Field& F) {
    for (size_t i = 0; i < n; ++i) {
      e[i] = elt(F);
    }
  }

  // Uniform integer in [0, ub).  UB must be nonzero.
  size_t nat(size_t ub) {
    size_t m = mask(ub - 1);
    for (;;) {
      uint8_t buf[sizeof(size_t)];
      bytes(buf, sizeof(buf));
      size_t r = 0;
      for (size_t i = 0; i < sizeof(buf); ++i) {
        r |= static_cast<size_t>(buf[i]) << (8 * i);
      }
      r &= m;
      if (r < ub) return r;
    }
  }

  // Smallest 2^k - 1 >= n.
  size_t mask(size_t n) const {
    size_t m = 0;
    while (m < n) m = 2 * m + 1;
    return m;
  }
};

}  // namespace noctis

#endif  // NOCTIS_LIB_RANDOM_RANDOM_H_
