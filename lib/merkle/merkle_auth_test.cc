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

#include "merkle/merkle_auth.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include "algebra/bogorng.h"
#include "algebra/fp_bn254.h"
#include "algebra/fp_p31.h"
#include "benchmark/benchmark.h"
#include "poseidon/poseidon_bn254.h"
#include "poseidon/poseidon_bn254_testing.h"
#include "poseidon/poseidon_p31.h"
#include "gtest/gtest.h"

namespace noctis {
namespace {

typedef Fp31 Field;
typedef Field::Elt Elt;
static const Field F;
static const PoseidonP31 H(F);

std::vector<Elt> mkleaves(size_t n) {
  std::vector<Elt> leaves;
  Bogorng<Field> rng(&F);
  for (size_t i = 0; i < n; ++i) {
    leaves.push_back(rng.next());
  }
  return leaves;
}

TEST(MerkleAuth, Zeros) {
  std::vector<Elt> z = merkle_zeros(H, kTreeDepth);
  ASSERT_EQ(z.size(), kTreeDepth + 1);
  EXPECT_EQ(z[0], F.zero());
  EXPECT_EQ(F.u64_of(z[1]), 1643500915u);
  EXPECT_EQ(F.u64_of(z[20]), 345396044u);
  for (size_t i = 0; i < kTreeDepth; ++i) {
    EXPECT_EQ(z[i + 1], H.hash2(z[i], z[i]));
  }
}

TEST(MerkleAuth, EmptyTree) {
  MerkleTreeBuilder<PoseidonP31> mt(H, {});
  EXPECT_EQ(mt.size(), 0u);
  EXPECT_EQ(mt.root(), F.zero());
  EXPECT_FALSE(mt.proof(0).has_value());
}

TEST(MerkleAuth, OddLayersPadWithZero) {
  std::vector<Elt> l = mkleaves(3);
  MerkleTreeBuilder<PoseidonP31> mt(H, l);

  Elt n0 = H.hash2(l[0], l[1]);
  Elt n1 = H.hash2(l[2], F.zero());
  Elt cur = H.hash2(n0, n1);
  for (size_t level = 2; level < kTreeDepth; ++level) {
    cur = H.hash2(cur, F.zero());
  }
  EXPECT_EQ(mt.root(), cur);
  // never duplicated
  EXPECT_NE(n1, H.hash2(l[2], l[2]));
}

TEST(MerkleAuth, FoldConvention) {
  MerklePath<Field> path;
  path.siblings.fill(F.zero());
  path.flags.fill(false);
  Elt leaf = F.of_scalar(42);
  Elt s = F.of_scalar(7);
  path.siblings[0] = s;

  Elt cur = H.hash2(leaf, s);
  for (size_t i = 1; i < kTreeDepth; ++i) cur = H.hash2(cur, F.zero());
  EXPECT_EQ(merkle_root_from_path(H, leaf, path), cur);

  // flag set: the node is the right operand
  path.flags[0] = true;
  cur = H.hash2(s, leaf);
  for (size_t i = 1; i < kTreeDepth; ++i) cur = H.hash2(cur, F.zero());
  EXPECT_EQ(merkle_root_from_path(H, leaf, path), cur);
}

TEST(MerkleAuth, RoundTrip) {
  for (size_t n : {1, 2, 3, 5, 8, 13, 64, 100}) {
    std::vector<Elt> l = mkleaves(n);
    MerkleTreeBuilder<PoseidonP31> mt(H, l);
    Elt root = mt.root();
    for (size_t i = 0; i < n; ++i) {
      std::optional<MerklePath<Field>> path = mt.proof(i);
      ASSERT_TRUE(path.has_value());
      EXPECT_EQ(path->flags[0], (i & 1) != 0);
      EXPECT_TRUE(merkle_verify(H, l[i], *path, root)) << n << " " << i;
      EXPECT_EQ(mt.leaf(i), l[i]);
    }
    EXPECT_FALSE(mt.proof(n).has_value());
  }
}

TEST(MerkleAuth, TamperedPathsFail) {
  std::vector<Elt> l = mkleaves(37);
  MerkleTreeBuilder<PoseidonP31> mt(H, l);
  Elt root = mt.root();
  MerklePath<Field> path = *mt.proof(21);

  for (size_t i = 0; i < kTreeDepth; ++i) {
    MerklePath<Field> bad = path;
    F.add(bad.siblings[i], F.one());
    EXPECT_NE(merkle_root_from_path(H, l[21], bad), root) << i;

    bad = path;
    bad.flags[i] = !bad.flags[i];
    EXPECT_FALSE(merkle_verify(H, l[21], bad, root)) << i;
  }
  EXPECT_FALSE(merkle_verify(H, l[22], path, root));
}

TEST(MerkleAuth, Bn254RoundTrip) {
  const Fp254 G;
  const PoseidonBn254 HB(poseidon_bn254_testing_params(3, G),
                         poseidon_bn254_testing_params(4, G), G);
  std::vector<Fp254::Elt> l;
  Bogorng<Fp254> rng(&G);
  for (size_t i = 0; i < 11; ++i) {
    l.push_back(rng.next());
  }
  MerkleTreeBuilder<PoseidonBn254> mt(HB, l);
  for (size_t i = 0; i < l.size(); ++i) {
    EXPECT_TRUE(merkle_verify(HB, l[i], *mt.proof(i), mt.root()));
  }

  std::vector<Fp254::Elt> z = merkle_zeros(HB, 3);
  EXPECT_EQ(z[3], HB.hash2(z[2], z[2]));
}

TEST(MerkleAuth, TooManyLeaves) {
  std::vector<Elt> l((size_t{1} << kTreeDepth) + 1, F.zero());
  EXPECT_DEATH({ MerkleTreeBuilder<PoseidonP31> mt(H, l); }, "too many leaves");
}

void BM_MerkleRootFromPath(benchmark::State& state) {
  MerklePath<Field> path;
  path.siblings.fill(F.one());
  path.flags.fill(true);
  Elt leaf = F.of_scalar(3);
  for (auto _ : state) {
    benchmark::DoNotOptimize(merkle_root_from_path(H, leaf, path));
  }
}
BENCHMARK(BM_MerkleRootFromPath);

void BM_MerkleBuild(benchmark::State& state) {
  std::vector<Elt> l = mkleaves(state.range(0));
  for (auto _ : state) {
    MerkleTreeBuilder<PoseidonP31> mt(H, l);
    benchmark::DoNotOptimize(mt.root());
  }
}
BENCHMARK(BM_MerkleBuild)->Range(1 << 4, 1 << 12);

}  // namespace
}  // namespace noctis
