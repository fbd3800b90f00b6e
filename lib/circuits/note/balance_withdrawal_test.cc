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

#include "circuits/note/balance_withdrawal.h"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

#include "algebra/fp_bn254.h"
#include "algebra/fp_p31.h"
#include "arrays/dense.h"
#include "benchmark/benchmark.h"
#include "circuits/note/note.h"
#include "circuits/note/note_constants.h"
#include "circuits/note/note_io.h"
#include "circuits/note/note_testing.h"
#include "merkle/merkle_auth.h"
#include "poseidon/poseidon_bn254.h"
#include "poseidon/poseidon_bn254_testing.h"
#include "poseidon/poseidon_p31.h"
#include "random/secure_random_engine.h"
#include "gtest/gtest.h"

namespace noctis {
namespace {

static const Fp31 F31;
static const PoseidonP31 H31(F31);
static const Fp254 F254;
static const PoseidonBn254 H254(poseidon_bn254_testing_params(3, F254),
                                poseidon_bn254_testing_params(4, F254), F254);

constexpr uint64_t kNoteIndex = 5;

template <class Hash>
struct Scenario {
  using Circuit = BalanceWithdrawal<Hash>;
  typename Circuit::PublicInputs pub;
  typename Circuit::Witness w;
};

// A note holding BALANCE at leaf kNoteIndex of a 12-leaf tree, and the
// public inputs of an honest withdrawal of AMOUNT from it.  CHANGE is
// balance - amount; when it is zero the change commitment is zero.
template <class Hash>
Scenario<Hash> make_scenario(const Hash& H, const typename Hash::Elt& balance,
                             const typename Hash::Elt& amount,
                             const typename Hash::Elt& change) {
  const typename Hash::Field& F = H.field();
  SecureRandomEngine rng;
  Scenario<Hash> s;
  s.w.note.secret = rng.elt(F);
  s.w.note.balance = balance;
  s.w.note.randomness = rng.elt(F);
  s.w.note_index = kNoteIndex;
  s.w.new_randomness = rng.elt(F);

  auto mt = tree_with_leaf(H, balance_note_commitment(H, s.w.note),
                           kNoteIndex, 12);
  s.w.path = *mt.proof(kNoteIndex);

  s.pub.root = mt.root();
  s.pub.nullifier = balance_note_nullifier(H, s.w.note.secret, kNoteIndex);
  s.pub.recipient = F.of_scalar(0xabcd);
  s.pub.amount = amount;
  if (change == F.zero()) {
    s.pub.change_commitment = F.zero();
  } else {
    s.pub.change_commitment = balance_note_commitment(
        H, spending_key_hash(H, s.w.note.secret), change, s.w.new_randomness);
  }
  return s;
}

template <class Hash>
Scenario<Hash> make_scenario(const Hash& H, uint64_t balance,
                             uint64_t amount) {
  const typename Hash::Field& F = H.field();
  uint64_t change = balance >= amount ? balance - amount : 0;
  return make_scenario(H, F.of_scalar(balance), F.of_scalar(amount),
                       F.of_scalar(change));
}

template <class Hash>
WithdrawalErrorCode run(const Hash& H, const Scenario<Hash>& s,
                        std::unique_ptr<const Dense<typename Hash::Field>>* t) {
  const BalanceWithdrawal<Hash> c(H);
  return c.generate_trace(s.pub, s.w, t);
}

template <class Hash>
void full_withdrawal(const Hash& H) {
  const typename Hash::Field& F = H.field();
  Scenario<Hash> s = make_scenario(H, 10000, 10000);
  EXPECT_EQ(s.pub.change_commitment, F.zero());

  std::unique_ptr<const Dense<typename Hash::Field>> t;
  ASSERT_EQ(run(H, s, &t), WITHDRAWAL_SUCCESS);
  ASSERT_TRUE(t != nullptr);
  EXPECT_EQ(t->width(), kBalanceTraceWidth);
  EXPECT_EQ(t->rows(), 1u);

  auto pub = s.pub.ordered();
  for (size_t i = 0; i < 5; ++i) {
    EXPECT_EQ(t->at(i, 0), pub[i]);
  }
  EXPECT_EQ(bits_value(*t, 5, kRangeBits, F), 0u);
  for (size_t i = 0; i < kTreeDepth; ++i) {
    EXPECT_EQ(t->at(69 + i, 0), s.w.path.siblings[i]);
    EXPECT_EQ(t->at(89 + i, 0), s.w.path.flags[i] ? F.one() : F.zero());
  }
}

template <class Hash>
void partial_withdrawal(const Hash& H) {
  const typename Hash::Field& F = H.field();
  Scenario<Hash> s = make_scenario(H, 10000, 6000);
  EXPECT_NE(s.pub.change_commitment, F.zero());

  std::unique_ptr<const Dense<typename Hash::Field>> t;
  ASSERT_EQ(run(H, s, &t), WITHDRAWAL_SUCCESS);
  EXPECT_EQ(t->at(4, 0), s.pub.change_commitment);

  typename Hash::Elt sum = F.zero();
  typename Hash::Elt pow2 = F.one();
  for (size_t i = 0; i < kRangeBits; ++i) {
    const typename Hash::Elt& b = t->at(5 + i, 0);
    EXPECT_TRUE(b == F.zero() || b == F.one());
    F.add(sum, F.mulf(b, pow2));
    pow2 = F.addf(pow2, pow2);
  }
  EXPECT_EQ(sum, F.of_scalar(4000));
  EXPECT_EQ(bits_value(*t, 5, kRangeBits, F), 4000u);
}

template <class Hash>
void overdraw(const Hash& H) {
  Scenario<Hash> s = make_scenario(H, 10000, 15000);
  std::unique_ptr<const Dense<typename Hash::Field>> t;
  EXPECT_EQ(run(H, s, &t), WITHDRAWAL_INSUFFICIENT_BALANCE);
  EXPECT_TRUE(t == nullptr);
}

template <class Hash>
void change_must_be_zero(const Hash& H) {
  const typename Hash::Field& F = H.field();
  Scenario<Hash> s = make_scenario(H, 10000, 10000);
  std::unique_ptr<const Dense<typename Hash::Field>> t;

  s.pub.change_commitment = F.one();
  EXPECT_EQ(run(H, s, &t), WITHDRAWAL_CHANGE_COMMITMENT_NOT_ZERO);

  // A well-formed commitment to a zero-value note is still rejected.
  s.pub.change_commitment = balance_note_commitment(
      H, spending_key_hash(H, s.w.note.secret), F.zero(), s.w.new_randomness);
  EXPECT_EQ(run(H, s, &t), WITHDRAWAL_CHANGE_COMMITMENT_NOT_ZERO);
  EXPECT_TRUE(t == nullptr);
}

template <class Hash>
void wrong_change(const Hash& H) {
  const typename Hash::Field& F = H.field();
  std::unique_ptr<const Dense<typename Hash::Field>> t;

  Scenario<Hash> s = make_scenario(H, 10000, 6000);
  F.add(s.w.new_randomness, F.one());
  EXPECT_EQ(run(H, s, &t), WITHDRAWAL_INVALID_CHANGE_COMMITMENT);

  s = make_scenario(H, 10000, 6000);
  s.pub.change_commitment = F.zero();
  EXPECT_EQ(run(H, s, &t), WITHDRAWAL_INVALID_CHANGE_COMMITMENT);

  // committing to the full balance instead of the change
  s = make_scenario(H, 10000, 6000);
  s.pub.change_commitment =
      balance_note_commitment(H, spending_key_hash(H, s.w.note.secret),
                              F.of_scalar(10000), s.w.new_randomness);
  EXPECT_EQ(run(H, s, &t), WITHDRAWAL_INVALID_CHANGE_COMMITMENT);
  EXPECT_TRUE(t == nullptr);
}

template <class Hash>
void wrong_nullifier(const Hash& H) {
  std::unique_ptr<const Dense<typename Hash::Field>> t;
  Scenario<Hash> s = make_scenario(H, 10000, 6000);
  s.w.note_index = kNoteIndex + 1;
  EXPECT_EQ(run(H, s, &t), WITHDRAWAL_INVALID_NULLIFIER);

  // The path is checked before the nullifier.
  H.field().add(s.pub.root, H.field().one());
  EXPECT_EQ(run(H, s, &t), WITHDRAWAL_INVALID_MERKLE_PROOF);
  EXPECT_TRUE(t == nullptr);
}

template <class Hash>
void wrong_path(const Hash& H) {
  const typename Hash::Field& F = H.field();
  std::unique_ptr<const Dense<typename Hash::Field>> t;
  for (size_t i = 0; i < kTreeDepth; ++i) {
    Scenario<Hash> s = make_scenario(H, 10000, 6000);
    F.add(s.w.path.siblings[i], F.one());
    EXPECT_EQ(run(H, s, &t), WITHDRAWAL_INVALID_MERKLE_PROOF) << i;
  }

  // A different balance is a different leaf.
  Scenario<Hash> s = make_scenario(H, 10000, 6000);
  s.w.note.balance = F.of_scalar(20000);
  EXPECT_EQ(run(H, s, &t), WITHDRAWAL_INVALID_MERKLE_PROOF);
  EXPECT_TRUE(t == nullptr);
}

TEST(BalanceWithdrawal, Width) {
  EXPECT_EQ(BalanceWithdrawal<PoseidonP31>::width(), 109u);
  EXPECT_EQ(BalanceWithdrawal<PoseidonBn254>::width(), 109u);
  // public inputs, change bits, siblings, flags
  EXPECT_EQ(kBalanceTraceWidth,
            kBalancePublicInputs + kRangeBits + kTreeDepth + kTreeDepth);
}

TEST(BalanceWithdrawal, FullWithdrawal) {
  full_withdrawal(H31);
  full_withdrawal(H254);
}

TEST(BalanceWithdrawal, PartialWithdrawal) {
  partial_withdrawal(H31);
  partial_withdrawal(H254);
}

TEST(BalanceWithdrawal, Overdraw) {
  overdraw(H31);
  overdraw(H254);
}

TEST(BalanceWithdrawal, ChangeCommitmentNotZero) {
  change_must_be_zero(H31);
  change_must_be_zero(H254);
}

TEST(BalanceWithdrawal, InvalidChangeCommitment) {
  wrong_change(H31);
  wrong_change(H254);
}

TEST(BalanceWithdrawal, InvalidNullifier) {
  wrong_nullifier(H31);
  wrong_nullifier(H254);
}

TEST(BalanceWithdrawal, InvalidMerkleProof) {
  wrong_path(H31);
  wrong_path(H254);
}

// balance - amount is compared on the integer residues, which for the
// 254-bit field need not fit in 64 bits.
TEST(BalanceWithdrawal, RangeBn254) {
  const Fp254& F = F254;
  auto two64 = F.of_string("18446744073709551616");

  // 2^64 + 5 - 10 = 2^64 - 5 fits
  auto balance = F.addf(two64, F.of_scalar(5));
  auto amount = F.of_scalar(10);
  auto change = F.subf(balance, amount);
  Scenario<PoseidonBn254> s = make_scenario(H254, balance, amount, change);
  std::unique_ptr<const Dense<Fp254>> t;
  ASSERT_EQ(run(H254, s, &t), WITHDRAWAL_SUCCESS);
  EXPECT_EQ(bits_value(*t, 5, kRangeBits, F), ~uint64_t{0} - 4u);

  // 2^64 + 10 - 10 = 2^64 does not
  balance = F.addf(two64, F.of_scalar(10));
  change = F.subf(balance, amount);
  s = make_scenario(H254, balance, amount, change);
  t.reset();
  EXPECT_EQ(run(H254, s, &t), WITHDRAWAL_BALANCE_OUT_OF_RANGE);
  EXPECT_TRUE(t == nullptr);

  // -1 is the largest residue, not a negative balance.
  s = make_scenario(H254, F.of_scalar(3), F.mone(), F.zero());
  EXPECT_EQ(run(H254, s, &t), WITHDRAWAL_INSUFFICIENT_BALANCE);
}

TEST(BalanceWithdrawal, RangeP31) {
  const Fp31& F = F31;
  // the whole field fits in the decomposition
  Scenario<PoseidonP31> s = make_scenario(H31, F.mone(), F.zero(), F.mone());
  std::unique_ptr<const Dense<Fp31>> t;
  ASSERT_EQ(run(H31, s, &t), WITHDRAWAL_SUCCESS);
  EXPECT_EQ(bits_value(*t, 5, kRangeBits, F), 2013265920u);

  s = make_scenario(H31, F.of_scalar(1), F.mone(), F.zero());
  EXPECT_EQ(run(H31, s, &t), WITHDRAWAL_INSUFFICIENT_BALANCE);
}

TEST(BalanceWithdrawal, RandomNotes) {
  SecureRandomEngine rng;
  for (size_t i = 0; i < 5; ++i) {
    uint64_t bal = 1 + rng.nat(1000000);
    uint64_t amt = rng.nat(bal + 1);
    BalanceNote<Fp31> n = random_balance_note(rng, bal, F31);
    EXPECT_EQ(n.balance, F31.of_scalar(bal));

    Scenario<PoseidonP31> s = make_scenario(H31, bal, amt);
    std::unique_ptr<const Dense<Fp31>> t;
    ASSERT_EQ(run(H31, s, &t), WITHDRAWAL_SUCCESS);
    EXPECT_EQ(bits_value(*t, 5, kRangeBits, F31), bal - amt);
  }
}

TEST(BalanceWithdrawal, ExportBn254) {
  Scenario<PoseidonBn254> s = make_scenario(H254, 10000, 6000);
  std::unique_ptr<const Dense<Fp254>> t;
  ASSERT_EQ(run(H254, s, &t), WITHDRAWAL_SUCCESS);

  RecordingBackend<Fp254> backend;
  WithdrawalExport out;
  ASSERT_EQ(prove_and_export(*t, kBalancePublicInputs, F254, backend, &out),
            WITHDRAWAL_SUCCESS);
  EXPECT_EQ(backend.width, kBalanceTraceWidth);
  ASSERT_EQ(out.public_inputs.size(), 5u);
  // 254-bit residues are exported as hex only.
  EXPECT_TRUE(out.public_inputs_u64.empty());
  EXPECT_EQ(out.public_inputs[0], F254.to_hex(s.pub.root));
  EXPECT_EQ(out.public_inputs[3], "0x" + std::string(60, '0') + "1770");
  EXPECT_EQ(out.public_inputs[4].size(), 66u);
  EXPECT_EQ(out.proof.size(), 4u);
}

void BM_BalanceWithdrawalTraceP31(benchmark::State& state) {
  Scenario<PoseidonP31> s = make_scenario(H31, 10000, 6000);
  for (auto _ : state) {
    std::unique_ptr<const Dense<Fp31>> t;
    benchmark::DoNotOptimize(run(H31, s, &t));
  }
}
BENCHMARK(BM_BalanceWithdrawalTraceP31);

void BM_BalanceWithdrawalTraceBn254(benchmark::State& state) {
  Scenario<PoseidonBn254> s = make_scenario(H254, 10000, 6000);
  for (auto _ : state) {
    std::unique_ptr<const Dense<Fp254>> t;
    benchmark::DoNotOptimize(run(H254, s, &t));
  }
}
BENCHMARK(BM_BalanceWithdrawalTraceBn254);

}  // namespace
}  // namespace noctis
