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

#include "util/crypto.h"

#include <climits>
#include <cstddef>
#include <cstdint>
#include <string>

#include "util/panic.h"
#include "openssl/rand.h"

namespace noctis {

void rand_bytes(uint8_t out[/*n*/], size_t n) {
  // RAND_bytes() takes an int length.
  constexpr size_t kChunk = static_cast<size_t>(INT_MAX);
  while (n > 0) {
    size_t m = n < kChunk ? n : kChunk;
    int ret = RAND_bytes(out, static_cast<int>(m));
    check(ret == 1, "openssl RAND_bytes failed");
    out += m;
    n -= m;
  }
}

void hex_to_str(char out[/* 2*n + 1*/], const uint8_t in[/*n*/], size_t n) {
  for (size_t i = 0; i < n; ++i) {
    out[2 * i] = "0123456789abcdef"[in[i] >> 4];
    out[2 * i + 1] = "0123456789abcdef"[in[i] & 0xf];
  }
  out[2 * n] = '\0';
}

std::string sha256_hex(const uint8_t in[/*n*/], size_t n) {
  SHA256 sha;
  sha.Update(in, n);
  uint8_t digest[kSHA256DigestSize];
  sha.DigestData(digest);
  char buf[2 * kSHA256DigestSize + 1];
  hex_to_str(buf, digest, kSHA256DigestSize);
  return std::string(buf);
}

std::string sha256_hex(const std::string& text) {
  return sha256_hex(reinterpret_cast<const uint8_t*>(text.data()),
                    text.size());
}

}  // namespace noctis
