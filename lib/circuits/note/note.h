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

#ifndef NOCTIS_LIB_CIRCUITS_NOTE_NOTE_H_
#define NOCTIS_LIB_CIRCUITS_NOTE_NOTE_H_

#include <cstdint>

#include "random/random.h"

namespace noctis {

// Derivations shared by the depositor (who publishes a commitment) and
// the circuits (which recompute it from the witness).  HASH is
// PoseidonP31 or PoseidonBn254.

// Fixed-denomination note: the leaf binds the secret and the nullifier
// preimage; spending reveals H1(preimage).
template <class Field>
struct FixedNote {
  typename Field::Elt secret;
  typename Field::Elt nullifier_preimage;
};

template <class Hash>
typename Hash::Elt fixed_note_commitment(
    const Hash& H, const FixedNote<typename Hash::Field>& n) {
  return H.hash2(n.secret, n.nullifier_preimage);
}

template <class Hash>
typename Hash::Elt fixed_note_nullifier(
    const Hash& H, const FixedNote<typename Hash::Field>& n) {
  return H.hash1(n.nullifier_preimage);
}

template <class Field>
FixedNote<Field> random_fixed_note(RandomEngine& rng, const Field& F) {
  FixedNote<Field> n;
  n.secret = rng.elt(F);
  n.nullifier_preimage = rng.elt(F);
  return n;
}

// Balance note: the leaf is H3(H1(secret), balance, randomness), and
// spending reveals H2(secret, index) where INDEX is the leaf position.
template <class Field>
struct BalanceNote {
  typename Field::Elt secret;
  typename Field::Elt balance;
  typename Field::Elt randomness;
};

template <class Hash>
typename Hash::Elt spending_key_hash(const Hash& H,
                                     const typename Hash::Elt& secret) {
  return H.hash1(secret);
}

template <class Hash>
typename Hash::Elt balance_note_commitment(
    const Hash& H, const typename Hash::Elt& key_hash,
    const typename Hash::Elt& balance, const typename Hash::Elt& randomness) {
  return H.hash3(key_hash, balance, randomness);
}

template <class Hash>
typename Hash::Elt balance_note_commitment(
    const Hash& H, const BalanceNote<typename Hash::Field>& n) {
  return balance_note_commitment(H, spending_key_hash(H, n.secret), n.balance,
                                 n.randomness);
}

template <class Hash>
typename Hash::Elt balance_note_nullifier(const Hash& H,
                                          const typename Hash::Elt& secret,
                                          uint64_t note_index) {
  return H.hash2(secret, H.field().of_scalar(note_index));
}

template <class Field>
BalanceNote<Field> random_balance_note(RandomEngine& rng, uint64_t balance,
                                       const Field& F) {
  BalanceNote<Field> n;
  n.secret = rng.elt(F);
  n.balance = F.of_scalar(balance);
  n.randomness = rng.elt(F);
  return n;
}

}  // namespace noctis

#endif  // NOCTIS_LIB_CIRCUITS_NOTE_NOTE_H_
