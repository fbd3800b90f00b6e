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

#ifndef NOCTIS_LIB_MERKLE_MERKLE_AUTH_H_
#define NOCTIS_LIB_MERKLE_MERKLE_AUTH_H_

#include <stddef.h>

#include <array>
#include <optional>
#include <utility>
#include <vector>

#include "util/panic.h"

namespace noctis {

// Depth of the vault's commitment tree: 2^20 notes per pool.
constexpr size_t kTreeDepth = 20;

// Authentication path of one leaf.  flags[i] is true when the node at
// level i is the RIGHT operand of its parent hash:
//
//   cur = flags[i] ? H(siblings[i], cur) : H(cur, siblings[i])
//
// Inverting this convention yields a different, valid-looking root, so
// every producer and consumer of paths goes through this type.
template <class Field>
struct MerklePath {
  using Elt = typename Field::Elt;
  std::array<Elt, kTreeDepth> siblings;
  std::array<bool, kTreeDepth> flags;
};

// The functions below are templated on a hasher HASH that provides
// Field, Elt, field() and hash2(a, b), i.e. PoseidonP31 or
// PoseidonBn254.

template <class Hash>
typename Hash::Elt merkle_root_from_path(
    const Hash& H, const typename Hash::Elt& leaf,
    const MerklePath<typename Hash::Field>& path) {
  typename Hash::Elt cur = leaf;
  for (size_t i = 0; i < kTreeDepth; ++i) {
    if (path.flags[i]) {
      cur = H.hash2(path.siblings[i], cur);
    } else {
      cur = H.hash2(cur, path.siblings[i]);
    }
  }
  return cur;
}

template <class Hash>
bool merkle_verify(const Hash& H, const typename Hash::Elt& leaf,
                   const MerklePath<typename Hash::Field>& path,
                   const typename Hash::Elt& root) {
  return merkle_root_from_path(H, leaf, path) == root;
}

// Roots of the empty subtrees: zeros[0] = 0, zeros[i+1] = H(zeros[i],
// zeros[i]), for i < depth.  An incremental on-chain tree is
// initialised with these.
template <class Hash>
std::vector<typename Hash::Elt> merkle_zeros(const Hash& H, size_t depth) {
  std::vector<typename Hash::Elt> z;
  z.reserve(depth + 1);
  z.push_back(H.field().zero());
  for (size_t i = 0; i < depth; ++i) {
    z.push_back(H.hash2(z[i], z[i]));
  }
  return z;
}

// Offline tree over a fixed leaf set, for tests and tooling.  Every
// layer is built up to level kTreeDepth.  A layer of odd length pads its
// last node as H(x, 0); the last node is never duplicated.
//
// The builder owns its layers; it is not meant to be shared between
// threads while it is being constructed.
template <class Hash>
class MerkleTreeBuilder {
 public:
  using Field = typename Hash::Field;
  using Elt = typename Hash::Elt;

  MerkleTreeBuilder(const Hash& H, std::vector<Elt> leaves) : h_(H) {
    check(leaves.size() <= (size_t{1} << kTreeDepth),
          "too many leaves for the tree depth");
    layers_.push_back(std::move(leaves));
    for (size_t level = 0; level < kTreeDepth; ++level) {
      const std::vector<Elt>& cur = layers_.back();
      std::vector<Elt> next;
      next.reserve((cur.size() + 1) / 2);
      for (size_t i = 0; i < cur.size(); i += 2) {
        const Elt& right = (i + 1 < cur.size()) ? cur[i + 1] : zero();
        next.push_back(h_.hash2(cur[i], right));
      }
      layers_.push_back(std::move(next));
    }
  }

  size_t size() const { return layers_[0].size(); }

  // The root of an empty tree is 0.
  Elt root() const {
    const std::vector<Elt>& top = layers_[kTreeDepth];
    return top.empty() ? zero() : top[0];
  }

  const Elt& leaf(size_t i) const { return layers_[0].at(i); }

  // Path of leaf INDEX, or nullopt if there is no such leaf.
  std::optional<MerklePath<Field>> proof(size_t index) const {
    if (index >= size()) return std::nullopt;
    MerklePath<Field> path;
    size_t idx = index;
    for (size_t level = 0; level < kTreeDepth; ++level) {
      const std::vector<Elt>& layer = layers_[level];
      size_t sib = idx ^ 1;
      path.siblings[level] = sib < layer.size() ? layer[sib] : zero();
      path.flags[level] = (idx & 1) != 0;
      idx >>= 1;
    }
    return path;
  }

 private:
  const Elt& zero() const { return h_.field().zero(); }

  const Hash& h_;
  // layers_[0] holds the leaves, layers_[kTreeDepth] the root.
  std::vector<std::vector<Elt>> layers_;
};

}  // namespace noctis

#endif  // NOCTIS_LIB_MERKLE_MERKLE_AUTH_H_
