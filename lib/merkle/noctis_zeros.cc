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

// Prints the empty-subtree roots zeros[0..depth] of the commitment tree,
// one per line.  These initialise the incremental tree of the on-chain
// vault, so they must come from the same Poseidon constants the
// contract uses.
//
//   noctis_zeros --field=bn254 --params_t3=t3.txt --params_t4=t4.txt
//       [--sha256_t3=...] [--sha256_t4=...] [--depth=20]
//   noctis_zeros --field=p31 [--depth=20]

#include <cstddef>
#include <iostream>
#include <string>
#include <vector>

#include "absl/flags/flag.h"
#include "absl/flags/parse.h"
#include "algebra/fp_bn254.h"
#include "algebra/fp_p31.h"
#include "merkle/merkle_auth.h"
#include "poseidon/poseidon_bn254.h"
#include "poseidon/poseidon_p31.h"
#include "util/log.h"

ABSL_FLAG(std::string, field, "bn254", "Hash family: bn254 or p31");
ABSL_FLAG(std::string, params_t3, "",
          "Poseidon BN254 t=3 parameter asset (bn254 only)");
ABSL_FLAG(std::string, params_t4, "",
          "Poseidon BN254 t=4 parameter asset (bn254 only)");
ABSL_FLAG(std::string, sha256_t3, "",
          "Expected SHA-256 of the t=3 asset; empty disables the check");
ABSL_FLAG(std::string, sha256_t4, "",
          "Expected SHA-256 of the t=4 asset; empty disables the check");
ABSL_FLAG(int, depth, static_cast<int>(noctis::kTreeDepth),
          "Number of levels above the leaves");
ABSL_FLAG(bool, verbose, false, "Log at INFO level");

namespace noctis {
namespace {

template <class Hash>
void print_zeros(const Hash& H, size_t depth) {
  std::vector<typename Hash::Elt> z = merkle_zeros(H, depth);
  for (size_t i = 0; i < z.size(); ++i) {
    std::cout << i << " " << H.field().to_hex(z[i]) << std::endl;
  }
}

int run_bn254(size_t depth) {
  const Fp254 F;
  PoseidonBn254Params t3, t4;
  PoseidonParamsStatus st =
      load_poseidon_bn254_params(absl::GetFlag(FLAGS_params_t3), 3,
                                 absl::GetFlag(FLAGS_sha256_t3), F, &t3);
  if (st != POSEIDON_PARAMS_OK) {
    std::cerr << "Error loading --params_t3: "
              << poseidon_params_status_name(st) << std::endl;
    return 1;
  }
  st = load_poseidon_bn254_params(absl::GetFlag(FLAGS_params_t4), 4,
                                  absl::GetFlag(FLAGS_sha256_t4), F, &t4);
  if (st != POSEIDON_PARAMS_OK) {
    std::cerr << "Error loading --params_t4: "
              << poseidon_params_status_name(st) << std::endl;
    return 1;
  }
  const PoseidonBn254 H(t3, t4, F);
  print_zeros(H, depth);
  return 0;
}

int run_p31(size_t depth) {
  const Fp31 F;
  const PoseidonP31 H(F);
  print_zeros(H, depth);
  return 0;
}

}  // namespace
}  // namespace noctis

int main(int argc, char* argv[]) {
  absl::ParseCommandLine(argc, argv);
  if (absl::GetFlag(FLAGS_verbose)) {
    noctis::set_log_level(noctis::INFO);
  }

  int depth = absl::GetFlag(FLAGS_depth);
  if (depth < 0 || depth > 64) {
    std::cerr << "Error: --depth must be in [0, 64]" << std::endl;
    return 1;
  }

  std::string field = absl::GetFlag(FLAGS_field);
  if (field == "bn254") {
    return noctis::run_bn254(static_cast<size_t>(depth));
  }
  if (field == "p31") {
    return noctis::run_p31(static_cast<size_t>(depth));
  }
  std::cerr << "Error: unknown --field " << field << std::endl;
  return 1;
}
