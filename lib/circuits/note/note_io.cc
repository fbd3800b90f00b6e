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

#include "circuits/note/note_io.h"

namespace noctis {

const char* withdrawal_error_message(WithdrawalErrorCode c) {
  switch (c) {
    case WITHDRAWAL_SUCCESS:
      return "success";
    case WITHDRAWAL_INVALID_NULLIFIER:
      return "invalid nullifier";
    case WITHDRAWAL_INVALID_MERKLE_PROOF:
      return "invalid merkle proof";
    case WITHDRAWAL_INSUFFICIENT_BALANCE:
      return "insufficient balance";
    case WITHDRAWAL_BALANCE_OUT_OF_RANGE:
      return "balance - amount does not fit the range check";
    case WITHDRAWAL_INVALID_CHANGE_COMMITMENT:
      return "invalid change commitment";
    case WITHDRAWAL_CHANGE_COMMITMENT_NOT_ZERO:
      return "change commitment must be zero for a full withdrawal";
    case WITHDRAWAL_PROVER_FAILURE:
      return "proving backend failed";
  }
  return "unknown error";
}

}  // namespace noctis
