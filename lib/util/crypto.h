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

#ifndef NOCTIS_LIB_UTIL_CRYPTO_H_
#define NOCTIS_LIB_UTIL_CRYPTO_H_

// Wraps the openssl primitives that the vault core needs outside of the
// circuit: SHA256 for pinning versioned parameter assets, and a source of
// random bytes for fresh note material.

#include <cstddef>
#include <cstdint>
#include <string>

#include "openssl/sha.h"

namespace noctis {

constexpr size_t kSHA256DigestSize = 32;

class SHA256 {
 public:
  SHA256() { SHA256_Init(&sha_); }

  // Disable copy for good measure.
  SHA256(const SHA256&) = delete;
  SHA256& operator=(const SHA256&) = delete;

  void Update(const uint8_t bytes[/*n*/], size_t n) {
    SHA256_Update(&sha_, bytes, n);
  }
  void DigestData(uint8_t digest[/* kSHA256DigestSize */]) {
    SHA256_Final(digest, &sha_);
  }

 private:
  SHA256_CTX sha_;
};

// Fills OUT with n bytes from the openssl CSPRNG, or panics.
void rand_bytes(uint8_t out[/*n*/], size_t n);

void hex_to_str(char out[/* 2*n + 1*/], const uint8_t in[/*n*/], size_t n);

// Lower-case hex SHA256 digest of the n bytes at IN.
std::string sha256_hex(const uint8_t in[/*n*/], size_t n);
std::string sha256_hex(const std::string& text);

}  // namespace noctis

#endif  // NOCTIS_LIB_UTIL_CRYPTO_H_
