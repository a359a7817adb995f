//===-- hash_unittest.cpp - block hashing tests ---------------------------===//
//
// Copyright (c) 2025 Nuclearist <nuclearist@teknology-hub.com>
// Part of blockdelta, under the GNU General Public License v3.0 or later
// See COPYING in the project root for license information.
// SPDX-License-Identifier: GPL-3.0-or-later
//
//===----------------------------------------------------------------------===//
#include "hash.hpp"

#include "test_util.hpp"

#include <cstdint>
#include <cstring>
#include <gtest/gtest.h>
#include <span>
#include <string>

namespace blockdelta::hash {
namespace {

std::span<const unsigned char> bytes(const std::string &str) {
  return {reinterpret_cast<const unsigned char *>(str.data()), str.size()};
}

TEST(WeakHash, KnownValues) {
  EXPECT_EQ(weak_sum({}), 0u);
  const unsigned char one[]{1, 2, 3};
  // a = 6, b = 3 * 1 + 2 * 2 + 1 * 3 = 10
  EXPECT_EQ(weak_sum(one), 6u | 10u << 16);
}

TEST(WeakHash, RollMatchesFreshSum) {
  const auto data = test::random_bytes(4096, 1);
  const auto span = bytes(data);
  for (const std::uint32_t len : {1u, 7u, 64u, 1000u}) {
    auto weak = weak_sum(span.first(len));
    for (std::size_t pos = 1; pos + len <= span.size(); ++pos) {
      weak = weak_roll(weak, span[pos - 1], span[pos + len - 1], len);
      ASSERT_EQ(weak, weak_sum(span.subspan(pos, len)))
          << "len " << len << ", pos " << pos;
    }
  }
}

TEST(WeakHash, RollOutMatchesFreshSum) {
  const auto data = test::random_bytes(300, 2);
  const auto span = bytes(data);
  auto weak = weak_sum(span);
  for (std::size_t pos = 1; pos < span.size(); ++pos) {
    weak = weak_roll_out(weak, span[pos - 1],
                         static_cast<std::uint32_t>(span.size() - pos + 1));
    ASSERT_EQ(weak, weak_sum(span.subspan(pos))) << "pos " << pos;
  }
  EXPECT_EQ(weak_roll_out(weak, span.back(), 1), 0u);
}

TEST(WeakHash, IncrementalStateMatchesSum) {
  const auto data = test::random_bytes(1000, 3);
  const auto span = bytes(data);
  weak_state state{.a = 0, .b = 0};
  state.update(span.first(123));
  state.update(span.subspan(123, 500));
  state.update(span.subspan(623));
  EXPECT_EQ(state.value(), weak_sum(span));
}

TEST(WeakHash, EngineeredCollision) {
  // Swapping the pattern 1 0 0 1 for 0 1 1 0 keeps both sums unchanged
  std::string first(64, '\0');
  std::string second(64, '\0');
  first[30] = first[33] = 1;
  second[31] = second[32] = 1;
  EXPECT_EQ(weak_sum(bytes(first)), weak_sum(bytes(second)));

  sha1_ctx sha;
  ASSERT_TRUE(sha);
  bd_block_hash first_hash;
  bd_block_hash second_hash;
  ASSERT_TRUE(block_hash(sha, bytes(first), first_hash));
  ASSERT_TRUE(block_hash(sha, bytes(second), second_hash));
  EXPECT_EQ(first_hash.weak, second_hash.weak);
  EXPECT_FALSE(same_hash(first_hash, second_hash));
  EXPECT_TRUE(same_hash(first_hash, first_hash));
}

TEST(StrongHash, Sha1OfAbc) {
  static const unsigned char expected[strong_size]{
      0xa9, 0x99, 0x3e, 0x36, 0x47, 0x06, 0x81, 0x6a, 0xba, 0x3e,
      0x25, 0x71, 0x78, 0x50, 0xc2, 0x6c, 0x9c, 0xd0, 0xd8, 0x9d};
  sha1_ctx sha;
  ASSERT_TRUE(sha);
  unsigned char out[strong_size];
  ASSERT_TRUE(sha.digest(bytes("abc"), out));
  EXPECT_EQ(std::memcmp(out, expected, strong_size), 0);
  // The context is reusable
  ASSERT_TRUE(sha.digest(bytes("abc"), out));
  EXPECT_EQ(std::memcmp(out, expected, strong_size), 0);
}

} // namespace
} // namespace blockdelta::hash
