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

#ifndef NOCTIS_LIB_CIRCUITS_NOTE_NOTE_CONSTANTS_H_
#define NOCTIS_LIB_CIRCUITS_NOTE_NOTE_CONSTANTS_H_

#include <cstddef>

#include "merkle/merkle_auth.h"

namespace noctis {

// Bits in the decomposition of balance - amount.
static constexpr size_t kRangeBits = 64;

// Public inputs of each circuit, in export order.
// root, nullifier, recipient, denomination
static constexpr size_t kFixedPublicInputs = 4;
// root, nullifier, recipient, amount, change commitment
static constexpr size_t kBalancePublicInputs = 5;

// Trace widths: public inputs, [range bits], siblings, flags.
static constexpr size_t kFixedTraceWidth =
    kFixedPublicInputs + 2 * kTreeDepth;
static constexpr size_t kBalanceTraceWidth =
    kBalancePublicInputs + kRangeBits + 2 * kTreeDepth;

static_assert(kFixedTraceWidth == 44, "fixed withdrawal trace width");
static_assert(kBalanceTraceWidth == 109, "balance withdrawal trace width");

}  // namespace noctis

#endif  // NOCTIS_LIB_CIRCUITS_NOTE_NOTE_CONSTANTS_H_
