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

#ifndef NOCTIS_LIB_ALGEBRA_BOGORNG_H_
#define NOCTIS_LIB_ALGEBRA_BOGORNG_H_

#include <cstdint>

namespace noctis {
// Totally bogus "random" number generator, used only for testing and
// for building test-only parameter sets.  The sequence is a fixed
// function of the seed, so test vectors stay stable across runs.
// It is the caller's responsibility to ensure the Field object outlives
// the generator.
template <class Field>
class Bogorng {
  using Elt = typename Field::Elt;

 public:
  explicit Bogorng(const Field* F, uint64_t seed = 123456789u)
      : f_(F), next_(F->of_scalar(seed)) {}

  Elt next() {
    // really old-school
    f_->mul(next_, f_->of_scalar(1103515245u));
    f_->add(next_, f_->of_scalar(12345u));
    return next_;
  }

  Elt nonzero() {
    Elt x;
    do {
      x = next();
    } while (x == f_->zero());
    return x;
  }

 private:
  const Field* f_;
  Elt next_;
};
}  // namespace noctis

#endif  // NOCTIS_LIB_ALGEBRA_BOGORNG_H_
