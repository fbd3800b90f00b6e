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

#ifndef NOCTIS_LIB_CIRCUITS_NOTE_NOTE_IO_H_
#define NOCTIS_LIB_CIRCUITS_NOTE_NOTE_IO_H_

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "arrays/dense.h"

namespace noctis {

// Outcome of witness validation.  Every failure names the check that
// refused the witness; none of them is retried.
enum WithdrawalErrorCode {
  WITHDRAWAL_SUCCESS = 0,
  WITHDRAWAL_INVALID_NULLIFIER = 1,
  WITHDRAWAL_INVALID_MERKLE_PROOF = 2,
  WITHDRAWAL_INSUFFICIENT_BALANCE = 3,
  WITHDRAWAL_BALANCE_OUT_OF_RANGE = 4,
  WITHDRAWAL_INVALID_CHANGE_COMMITMENT = 5,
  WITHDRAWAL_CHANGE_COMMITMENT_NOT_ZERO = 6,
  WITHDRAWAL_PROVER_FAILURE = 7,
};

const char* withdrawal_error_message(WithdrawalErrorCode c);

// The general-purpose proving system.  It receives the trace as a
// Dense array (width columns, one row per step) and returns opaque
// proof bytes.
template <class Field>
class ProvingBackend {
 public:
  virtual ~ProvingBackend() = default;

  // Returns false if no proof could be produced.
  virtual bool prove(const Dense<Field>& trace,
                     std::vector<uint8_t>* proof) = 0;
};

// What the on-chain verifier is called with: the public inputs in
// circuit order, and the proof blob.  The inputs are fixed-width hex
// strings for every field; u64 is filled as well when the field's
// residues fit in 64 bits.
struct WithdrawalExport {
  std::vector<std::string> public_inputs;
  std::vector<uint64_t> public_inputs_u64;
  std::vector<uint8_t> proof;
};

// Copies the first N columns of row 0 of TRACE, the public inputs, into
// *OUT.
template <class Field>
void export_public_inputs(const Dense<Field>& trace, size_t n, const Field& F,
                          WithdrawalExport* out) {
  out->public_inputs.clear();
  out->public_inputs_u64.clear();
  for (size_t i = 0; i < n; ++i) {
    const typename Field::Elt& x = trace.at(i, 0);
    out->public_inputs.push_back(F.to_hex(x));
    if (Field::kBits <= 64) {
      out->public_inputs_u64.push_back(F.u64_of(x));
    }
  }
}

// Hands TRACE to BACKEND and assembles the export tuple.
template <class Field>
WithdrawalErrorCode prove_and_export(const Dense<Field>& trace,
                                     size_t n_public, const Field& F,
                                     ProvingBackend<Field>& backend,
                                     WithdrawalExport* out) {
  std::vector<uint8_t> proof;
  if (!backend.prove(trace, &proof)) {
    return WITHDRAWAL_PROVER_FAILURE;
  }
  export_public_inputs(trace, n_public, F, out);
  out->proof = std::move(proof);
  return WITHDRAWAL_SUCCESS;
}

}  // namespace noctis

#endif  // NOCTIS_LIB_CIRCUITS_NOTE_NOTE_IO_H_
