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

#include "algebra/sysdep.h"

#include <cstdint>

#include "gtest/gtest.h"

namespace noctis {
namespace {
TEST(Sysdep, mulhl64) {
  uint64_t l, h;
  uint64_t b = (1ull << 47) + 1u;
  mulhl(1, &l, &h, (static_cast<uint64_t>(1) << 53) + 1u, &b);
  EXPECT_EQ(l, 1 + (1ull << 53) + (1ull << 47));
  EXPECT_EQ(h, 1ull << (53 + 47 - 64));
}

TEST(Sysdep, CarryChains) {
  uint64_t c = 0;
  EXPECT_EQ(addcb(~0ull, 1u, &c), 0u);
  EXPECT_EQ(c, 1u);
  EXPECT_EQ(addcb(~0ull, ~0ull, &c), ~0ull);
  EXPECT_EQ(c, 1u);

  uint64_t b = 0;
  EXPECT_EQ(subb(0u, 1u, &b), ~0ull);
  EXPECT_EQ(b, 1u);
  EXPECT_EQ(subb(5u, 3u, &b), 1u);
  EXPECT_EQ(b, 0u);
}

TEST(Sysdep, MulAddDoesNotOverflow) {
  // (2^64-1)^2 + 2 (2^64-1) = 2^128 - 1
  uint64_t carry = ~0ull;
  uint64_t lo = muladd(~0ull, ~0ull, ~0ull, &carry);
  EXPECT_EQ(lo, ~0ull);
  EXPECT_EQ(carry, ~0ull);
}
}  // namespace
}  // namespace noctis
