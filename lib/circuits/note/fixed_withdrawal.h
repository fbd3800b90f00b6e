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

#ifndef NOCTIS_LIB_CIRCUITS_NOTE_FIXED_WITHDRAWAL_H_
#define NOCTIS_LIB_CIRCUITS_NOTE_FIXED_WITHDRAWAL_H_

#include <array>
#include <cstddef>
#include <memory>
#include <utility>

#include "arrays/dense.h"
#include "circuits/note/note.h"
#include "circuits/note/note_constants.h"
#include "circuits/note/note_io.h"
#include "merkle/merkle_auth.h"
#include "util/log.h"
#include "util/panic.h"

namespace noctis {

// Withdrawal of a fixed-denomination note.
//
//   commitment = H2(secret, nullifier_preimage)
//   nullifier  = H1(nullifier_preimage)
//   root       = fold(commitment, path)
//
// The denomination is a public input only; the deposit contract keeps
// one tree per denomination, so it is not checked here.
//
// Trace (one row, kFixedTraceWidth columns):
//
//   root nullifier recipient denomination | siblings[20] | flags[20]
template <class Hash>
class FixedWithdrawal {
 public:
  using Field = typename Hash::Field;
  using Elt = typename Field::Elt;

  struct PublicInputs {
    Elt root;
    Elt nullifier;
    Elt recipient;
    Elt denomination;

    std::array<Elt, kFixedPublicInputs> ordered() const {
      return {root, nullifier, recipient, denomination};
    }
  };

  struct Witness {
    FixedNote<Field> note;
    MerklePath<Field> path;
  };

  explicit FixedWithdrawal(const Hash& H) : h_(H) {}

  static constexpr size_t width() { return kFixedTraceWidth; }

  // Validates W against PUB.  On success *TRACE holds the row; on
  // failure *TRACE is not touched.
  WithdrawalErrorCode generate_trace(
      const PublicInputs& pub, const Witness& w,
      std::unique_ptr<const Dense<Field>>* trace) const {
    const Field& F = h_.field();
    Elt commitment = fixed_note_commitment(h_, w.note);

    if (fixed_note_nullifier(h_, w.note) != pub.nullifier) {
      return refuse(WITHDRAWAL_INVALID_NULLIFIER);
    }
    if (!merkle_verify(h_, commitment, w.path, pub.root)) {
      return refuse(WITHDRAWAL_INVALID_MERKLE_PROOF);
    }

    auto t = std::make_unique<Dense<Field>>(width(), 1);
    DenseFiller<Field> filler(*t);
    for (const Elt& x : pub.ordered()) {
      filler.push_back(x);
    }
    for (size_t i = 0; i < kTreeDepth; ++i) {
      filler.push_back(w.path.siblings[i]);
    }
    for (size_t i = 0; i < kTreeDepth; ++i) {
      filler.push_back(w.path.flags[i] ? F.one() : F.zero());
    }
    check(filler.size() == width(), "FixedWithdrawal: short trace");

    *trace = std::move(t);
    return WITHDRAWAL_SUCCESS;
  }

 private:
  static WithdrawalErrorCode refuse(WithdrawalErrorCode c) {
    log(INFO, "fixed withdrawal refused: %s", withdrawal_error_message(c));
    return c;
  }

  const Hash& h_;
};

}  // namespace noctis

#endif  // NOCTIS_LIB_CIRCUITS_NOTE_FIXED_WITHDRAWAL_H_
