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

#ifndef NOCTIS_LIB_CIRCUITS_NOTE_NOTE_TESTING_H_
#define NOCTIS_LIB_CIRCUITS_NOTE_NOTE_TESTING_H_

#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>

#include "algebra/bogorng.h"
#include "arrays/dense.h"
#include "circuits/note/note_io.h"
#include "merkle/merkle_auth.h"

namespace noctis {

// Stands in for the proving system in tests: records what it was given
// and returns a fixed blob.
template <class Field>
class RecordingBackend : public ProvingBackend<Field> {
 public:
  bool prove(const Dense<Field>& trace, std::vector<uint8_t>* proof) override {
    ++calls;
    width = trace.width();
    rows = trace.rows();
    if (!succeed) return false;
    *proof = {0xde, 0xad, 0xbe, 0xef};
    return true;
  }

  bool succeed = true;
  size_t calls = 0;
  size_t width = 0;
  size_t rows = 0;
};

// A tree of NLEAVES pseudo-random leaves with LEAF at position INDEX.
template <class Hash>
MerkleTreeBuilder<Hash> tree_with_leaf(const Hash& H,
                                       const typename Hash::Elt& leaf,
                                       size_t index, size_t nleaves) {
  Bogorng<typename Hash::Field> rng(&H.field(), 987654321u);
  std::vector<typename Hash::Elt> leaves;
  for (size_t i = 0; i < nleaves; ++i) {
    leaves.push_back(i == index ? leaf : rng.next());
  }
  return MerkleTreeBuilder<Hash>(H, std::move(leaves));
}

// Integer value of bit columns [first, first + n) of row 0.
template <class Field>
uint64_t bits_value(const Dense<Field>& t, size_t first, size_t n,
                    const Field& F) {
  uint64_t v = 0;
  for (size_t i = 0; i < n; ++i) {
    v |= F.u64_of(t.at(first + i, 0)) << i;
  }
  return v;
}

}  // namespace noctis

#endif  // NOCTIS_LIB_CIRCUITS_NOTE_NOTE_TESTING_H_
