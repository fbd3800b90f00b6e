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

#ifndef NOCTIS_LIB_CIRCUITS_NOTE_BALANCE_WITHDRAWAL_H_
#define NOCTIS_LIB_CIRCUITS_NOTE_BALANCE_WITHDRAWAL_H_

#include <array>
#include <cstddef>
#include <cstdint>
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

// Partial or full withdrawal from a balance note, leaving the rest in a
// change note owned by the same spending key.
//
// The witness is checked in this order, and the first failing check
// decides the error:
//
//   key_hash   = H1(secret)
//   commitment = H3(key_hash, balance, randomness)
//   fold(commitment, path) == root             INVALID_MERKLE_PROOF
//   H2(secret, note_index) == nullifier        INVALID_NULLIFIER
//   balance >= amount                          INSUFFICIENT_BALANCE
//   balance - amount < 2^kRangeBits            BALANCE_OUT_OF_RANGE
//   change = balance - amount
//   change > 0:  H3(key_hash, change, new_randomness) == change_commitment
//                                              INVALID_CHANGE_COMMITMENT
//   change == 0: change_commitment == 0        CHANGE_COMMITMENT_NOT_ZERO
//
// balance and amount are compared as integers, the canonical residues
// of their field elements.
//
// Trace (one row, kBalanceTraceWidth columns):
//
//   root nullifier recipient amount change_commitment
//   | bits of (balance - amount), LSB first [64]
//   | siblings[20] | flags[20]
//
// The bit columns are what a downstream constraint system must restrict
// to {0, 1} and recombine into balance - amount; this class only checks
// the relation off-circuit.
template <class Hash>
class BalanceWithdrawal {
 public:
  using Field = typename Hash::Field;
  using Elt = typename Field::Elt;
  using N = typename Field::N;

  struct PublicInputs {
    Elt root;
    Elt nullifier;
    Elt recipient;
    Elt amount;
    Elt change_commitment;

    std::array<Elt, kBalancePublicInputs> ordered() const {
      return {root, nullifier, recipient, amount, change_commitment};
    }
  };

  struct Witness {
    BalanceNote<Field> note;
    uint64_t note_index;
    MerklePath<Field> path;
    Elt new_randomness;
  };

  explicit BalanceWithdrawal(const Hash& H) : h_(H) {}

  static constexpr size_t width() { return kBalanceTraceWidth; }

  // Validates W against PUB.  On success *TRACE holds the row; on
  // failure *TRACE is not touched.
  WithdrawalErrorCode generate_trace(
      const PublicInputs& pub, const Witness& w,
      std::unique_ptr<const Dense<Field>>* trace) const {
    const Field& F = h_.field();
    Elt key_hash = spending_key_hash(h_, w.note.secret);
    Elt commitment = balance_note_commitment(h_, key_hash, w.note.balance,
                                             w.note.randomness);

    if (!merkle_verify(h_, commitment, w.path, pub.root)) {
      return refuse(WITHDRAWAL_INVALID_MERKLE_PROOF);
    }
    if (balance_note_nullifier(h_, w.note.secret, w.note_index) !=
        pub.nullifier) {
      return refuse(WITHDRAWAL_INVALID_NULLIFIER);
    }

    uint64_t change;
    WithdrawalErrorCode rc = range_check(w.note.balance, pub.amount, &change);
    if (rc != WITHDRAWAL_SUCCESS) {
      return refuse(rc);
    }

    if (change > 0) {
      Elt want = balance_note_commitment(h_, key_hash, F.of_scalar(change),
                                         w.new_randomness);
      if (want != pub.change_commitment) {
        return refuse(WITHDRAWAL_INVALID_CHANGE_COMMITMENT);
      }
    } else if (pub.change_commitment != F.zero()) {
      return refuse(WITHDRAWAL_CHANGE_COMMITMENT_NOT_ZERO);
    }

    auto t = std::make_unique<Dense<Field>>(width(), 1);
    DenseFiller<Field> filler(*t);
    for (const Elt& x : pub.ordered()) {
      filler.push_back(x);
    }
    filler.push_back(change, kRangeBits, F);
    for (size_t i = 0; i < kTreeDepth; ++i) {
      filler.push_back(w.path.siblings[i]);
    }
    for (size_t i = 0; i < kTreeDepth; ++i) {
      filler.push_back(w.path.flags[i] ? F.one() : F.zero());
    }
    check(filler.size() == width(), "BalanceWithdrawal: short trace");

    *trace = std::move(t);
    return WITHDRAWAL_SUCCESS;
  }

 private:
  WithdrawalErrorCode range_check(const Elt& balance, const Elt& amount,
                                  uint64_t* change) const {
    const Field& F = h_.field();
    N b = F.from_montgomery(balance);
    N a = F.from_montgomery(amount);
    if (b < a) {
      return WITHDRAWAL_INSUFFICIENT_BALANCE;
    }
    b.sub(a);
    if (!b.fits_u64()) {
      return WITHDRAWAL_BALANCE_OUT_OF_RANGE;
    }
    *change = b.limb_[0];
    return WITHDRAWAL_SUCCESS;
  }

  static WithdrawalErrorCode refuse(WithdrawalErrorCode c) {
    log(INFO, "balance withdrawal refused: %s", withdrawal_error_message(c));
    return c;
  }

  const Hash& h_;
};

}  // namespace noctis

#endif  // NOCTIS_LIB_CIRCUITS_NOTE_BALANCE_WITHDRAWAL_H_
