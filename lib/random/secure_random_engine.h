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

#ifndef NOCTIS_LIB_RANDOM_SECURE_RANDOM_ENGINE_H_
#define NOCTIS_LIB_RANDOM_SECURE_RANDOM_ENGINE_H_

#include <stddef.h>
#include <stdint.h>

#include "random/random.h"
#include "util/crypto.h"

namespace noctis {

// RandomEngine backed by the openssl CSPRNG.
class SecureRandomEngine : public RandomEngine {
 public:
  SecureRandomEngine() = default;

  void bytes(uint8_t buf[/*n*/], size_t n) override { rand_bytes(buf, n); }
};

}  // namespace noctis

#endif  // NOCTIS_LIB_RANDOM_SECURE_RANDOM_ENGINE_H_
