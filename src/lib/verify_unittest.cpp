//===-- verify_unittest.cpp - tree verification tests ---------------------===//
//
// Copyright (c) 2025 Nuclearist <nuclearist@teknology-hub.com>
// Part of blockdelta, under the GNU General Public License v3.0 or later
// See COPYING in the project root for license information.
// SPDX-License-Identifier: GPL-3.0-or-later
//
//===----------------------------------------------------------------------===//
#include "blockdelta/delta.h"

#include "blockdelta/content.h"
#include "blockdelta/error.h"
#include "test_util.hpp"

#include <cstdint>
#include <fcntl.h>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <string>
#include <unistd.h>

namespace blockdelta::delta {
namespace {

namespace fs = std::filesystem;

constexpr int block_size = 512;

class Verify : public testing::TestWithParam<int> {
protected:
  test::temp_dir dir;
  const fs::path root = dir / "tree";
  bd_signature ref{};
  bd_verify_result res{};

  void SetUp() override {
    test::write_file(root / "a", test::random_bytes(3 * block_size, 1));
    test::write_file(root / "b/c", test::random_bytes(5 * block_size + 7, 2));
    test::write_file(root / "b/d", "");
    test::write_file(root / "e", test::random_bytes(100, 3));
    const auto err = test::sign(root, block_size, 1, ref);
    ASSERT_TRUE(bd_err_success(&err)) << test::describe(err);
  }

  void TearDown() override {
    if (ref.buf) {
      bd_sig_free(&ref);
    }
  }

  bd_err verify() {
    return bd_verify(&ref, root.c_str(), GetParam(), nullptr, nullptr, &res);
  }

  /// Overwrite one byte of a file in place.
  void flip_byte(const fs::path &path, std::streamoff offset) {
    std::fstream file(path, std::ios::binary | std::ios::in | std::ios::out);
    ASSERT_TRUE(file);
    file.seekg(offset);
    char c;
    file.get(c);
    file.seekp(offset);
    file.put(static_cast<char>(c ^ 0x01));
  }
};

TEST_P(Verify, UnchangedTreePasses) {
  const auto err = verify();
  ASSERT_TRUE(bd_err_success(&err)) << test::describe(err);
  EXPECT_EQ(res.num_blocks, 3 + 6 + 0 + 1);
  EXPECT_EQ(res.num_mismatches, 0);
  EXPECT_EQ(res.first_file_index, -1);
  EXPECT_EQ(res.first_block_index, -1);
}

TEST_P(Verify, SingleByteFlip) {
  // Walk order: a, b/c, b/d, e
  ASSERT_NO_FATAL_FAILURE(flip_byte(root / "b/c", 2 * block_size + 10));
  auto err = verify();
  EXPECT_EQ(err.primary, BD_ERRC_verify);
  EXPECT_EQ(err.auxiliary, BD_ERRC_hash_mismatch);
  EXPECT_EQ(bd_err_get_category(&err), BD_ERR_CATEGORY_corruption);
  EXPECT_EQ(res.num_mismatches, 1);
  EXPECT_EQ(res.first_file_index, 1);
  EXPECT_EQ(res.first_block_index, 2);
}

TEST_P(Verify, FirstMismatchIsLowest) {
  ASSERT_NO_FATAL_FAILURE(flip_byte(root / "e", 0));
  ASSERT_NO_FATAL_FAILURE(flip_byte(root / "b/c", 4 * block_size));
  ASSERT_NO_FATAL_FAILURE(flip_byte(root / "b/c", 3 * block_size + 1));
  auto err = verify();
  EXPECT_EQ(err.auxiliary, BD_ERRC_hash_mismatch);
  EXPECT_EQ(res.num_mismatches, 3);
  EXPECT_EQ(res.first_file_index, 1);
  EXPECT_EQ(res.first_block_index, 3);
}

TEST_P(Verify, AppendedData) {
  {
    std::ofstream file(root / "a", std::ios::binary | std::ios::app);
    file << "extra";
  }
  auto err = verify();
  EXPECT_EQ(err.auxiliary, BD_ERRC_hash_mismatch);
  // One extra block
  EXPECT_EQ(res.num_mismatches, 1);
  EXPECT_EQ(res.first_file_index, 0);
  EXPECT_EQ(res.first_block_index, 3);
}

TEST_P(Verify, TruncatedFile) {
  fs::resize_file(root / "b/c", 2 * block_size + block_size / 2);
  auto err = verify();
  EXPECT_EQ(err.auxiliary, BD_ERRC_hash_mismatch);
  // Block 2 is short, blocks 3 to 5 are missing
  EXPECT_EQ(res.num_mismatches, 4);
  EXPECT_EQ(res.first_file_index, 1);
  EXPECT_EQ(res.first_block_index, 2);
}

TEST_P(Verify, EmptiedFile) {
  fs::resize_file(root / "e", 0);
  auto err = verify();
  EXPECT_EQ(err.auxiliary, BD_ERRC_hash_mismatch);
  EXPECT_EQ(res.num_mismatches, 1);
  EXPECT_EQ(res.first_file_index, 3);
  EXPECT_EQ(res.first_block_index, 0);
}

TEST_P(Verify, MissingFile) {
  fs::remove(root / "a");
  auto err = verify();
  EXPECT_EQ(err.type, BD_ERR_TYPE_os);
  EXPECT_EQ(err.primary, BD_ERRC_verify);
  EXPECT_EQ(bd_err_get_category(&err), BD_ERR_CATEGORY_io);
  bd_err_release(&err);
}

INSTANTIATE_TEST_SUITE_P(Threads, Verify, testing::Values(1, 3, 0));

TEST(VerifyStored, ZeroBlocks) {
  test::temp_dir dir;
  const auto root = dir / "tree";
  auto data = test::random_bytes(block_size, 4);
  data.append(3 * block_size, '\0');
  test::write_file(root / "sparse", data);
  test::write_file(root / "zeros", std::string(block_size + 1, '\0'));
  bd_signature sig;
  auto err = test::sign(root, block_size, 1, sig);
  ASSERT_TRUE(bd_err_success(&err)) << test::describe(err);
  const auto path = dir / "tree.sig";
  const int fd = open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
  ASSERT_GE(fd, 0);
  err = bd_sig_write(&sig, fd, nullptr);
  close(fd);
  bd_sig_free(&sig);
  ASSERT_TRUE(bd_err_success(&err)) << test::describe(err);

  bd_signature stored;
  err = test::read_sig(path, stored);
  ASSERT_TRUE(bd_err_success(&err)) << test::describe(err);
  bd_verify_result res;
  err = bd_verify(&stored, root.c_str(), 0, nullptr, nullptr, &res);
  EXPECT_TRUE(bd_err_success(&err)) << test::describe(err);
  EXPECT_EQ(res.num_blocks, 4 + 2);
  EXPECT_EQ(res.num_mismatches, 0);
  bd_sig_free(&stored);
}

TEST(VerifyArgs, NegativeThreadCount) {
  test::temp_dir dir;
  bd_signature sig;
  auto err = test::sign(dir.path(), block_size, 1, sig);
  ASSERT_TRUE(bd_err_success(&err)) << test::describe(err);
  bd_verify_result res;
  err = bd_verify(&sig, dir.path().c_str(), -1, nullptr, nullptr, &res);
  EXPECT_EQ(err.auxiliary, BD_ERRC_invalid_arg);
  bd_sig_free(&sig);
}

TEST(VerifyArgs, EmptyReference) {
  test::temp_dir dir;
  bd_signature sig;
  auto err = test::sign(dir.path(), block_size, 1, sig);
  ASSERT_TRUE(bd_err_success(&err)) << test::describe(err);
  bd_verify_result res;
  // There are no files to open, so the path isn't even accessed
  err = bd_verify(&sig, (dir / "missing").c_str(), 0, nullptr, nullptr, &res);
  EXPECT_TRUE(bd_err_success(&err));
  EXPECT_EQ(res.num_blocks, 0);
  bd_sig_free(&sig);
}

} // namespace
} // namespace blockdelta::delta
