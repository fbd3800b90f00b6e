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

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <string>

#include "gtest/gtest.h"

namespace noctis {
namespace {

TEST(Crypto, Sha256) {
  const char* msg = "abc";
  EXPECT_EQ(sha256_hex(reinterpret_cast<const uint8_t*>(msg), strlen(msg)),
            "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
  EXPECT_EQ(sha256_hex(std::string("abc")),
            "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
  EXPECT_EQ(sha256_hex(nullptr, 0),
            "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");

  // Incremental updates agree with the one-shot digest.
  SHA256 sha;
  sha.Update(reinterpret_cast<const uint8_t*>("a"), 1);
  sha.Update(reinterpret_cast<const uint8_t*>("bc"), 2);
  uint8_t d[kSHA256DigestSize];
  sha.DigestData(d);
  char buf[2 * kSHA256DigestSize + 1];
  hex_to_str(buf, d, kSHA256DigestSize);
  EXPECT_EQ(std::string(buf), sha256_hex(reinterpret_cast<const uint8_t*>(msg),
                                         strlen(msg)));
}

TEST(Crypto, HexToStr) {
  const uint8_t in[3] = {0x00, 0xab, 0x7f};
  char out[7];
  hex_to_str(out, in, 3);
  EXPECT_STREQ(out, "00ab7f");
}

TEST(Crypto, RandBytes) {
  uint8_t a[32], b[32];
  rand_bytes(a, sizeof(a));
  rand_bytes(b, sizeof(b));
  EXPECT_NE(memcmp(a, b, sizeof(a)), 0);
}

}  // namespace
}  // namespace noctis
