//===-- signature_unittest.cpp - signature tests --------------------------===//
//
// Copyright (c) 2025 Nuclearist <nuclearist@teknology-hub.com>
// Part of blockdelta, under the GNU General Public License v3.0 or later
// See COPYING in the project root for license information.
// SPDX-License-Identifier: GPL-3.0-or-later
//
//===----------------------------------------------------------------------===//
#include "signature.hpp"

#include "blockdelta/base.h"
#include "blockdelta/content.h"
#include "blockdelta/content/signature.pb.h"
#include "blockdelta/error.h"
#include "hash.hpp"
#include "stream.hpp"
#include "test_util.hpp"
#include "wire.hpp"

#include <cstdint>
#include <cstring>
#include <fcntl.h>
#include <gtest/gtest.h>
#include <span>
#include <string>
#include <unistd.h>
#include <utility>
#include <vector>

namespace blockdelta::content {
namespace {

constexpr int block_size = 256;

class Signature : public testing::Test {
protected:
  test::temp_dir dir;
  std::vector<std::pair<std::string, std::string>> files;

  void SetUp() override {
    const std::pair<const char *, std::size_t> layout[]{
        {"tree/empty", 0},
        {"tree/one", 1},
        {"tree/short", block_size - 1},
        {"tree/exact", block_size},
        {"tree/sub/over", block_size + 1},
        {"tree/sub/three", block_size * 3}};
    std::uint32_t seed = 100;
    for (const auto &[path, size] : layout) {
      auto data = test::random_bytes(size, seed++);
      test::write_file(dir / path, data);
      files.emplace_back(path, std::move(data));
    }
  }

  std::filesystem::path root() const { return dir / "tree"; }

  static bool same_hashes(const bd_signature &left, const bd_signature &right) {
    if (left.num_hashes != right.num_hashes) {
      return false;
    }
    for (std::int64_t i = 0; i < left.num_hashes; ++i) {
      if (!hash::same_hash(left.hashes[i], right.hashes[i])) {
        return false;
      }
    }
    return true;
  }
};

TEST_F(Signature, BlockCounts) {
  bd_signature sig;
  const auto res = test::sign(root(), block_size, 1, sig);
  ASSERT_TRUE(bd_err_success(&res)) << test::describe(res);
  ASSERT_EQ(sig.container.num_files, 6);
  // Walk order: empty, exact, one, short, sub/over, sub/three
  const std::int64_t expected[]{0, 1, 1, 1, 2, 3};
  for (int i = 0; i < 6; ++i) {
    EXPECT_EQ(bd_sig_num_file_blocks(&sig, i), expected[i])
        << sig.container.files[i].path;
  }
  EXPECT_EQ(sig.num_hashes, 8);
  EXPECT_EQ(sig.block_size, block_size);

  // Check the hashes of the tail block of sub/over directly
  const auto &data = files[4].second;
  ASSERT_STREQ(sig.container.files[4].path, "sub/over");
  hash::sha1_ctx sha;
  bd_block_hash tail;
  ASSERT_TRUE(hash::block_hash(
      sha,
      {reinterpret_cast<const unsigned char *>(data.data()) + block_size, 1},
      tail));
  EXPECT_TRUE(hash::same_hash(sig.hashes[sig.file_hash_offsets[4] + 1], tail));
  bd_sig_free(&sig);
}

TEST_F(Signature, IndependentOfThreadCount) {
  bd_signature single;
  auto res = test::sign(root(), block_size, 1, single);
  ASSERT_TRUE(bd_err_success(&res)) << test::describe(res);
  for (const int num_threads : {0, 2, 8}) {
    bd_signature multi;
    res = test::sign(root(), block_size, num_threads, multi);
    ASSERT_TRUE(bd_err_success(&res)) << test::describe(res);
    EXPECT_TRUE(same_hashes(single, multi)) << num_threads << " threads";
    bd_sig_free(&multi);
  }
  bd_sig_free(&single);
}

TEST_F(Signature, StreamCallbackOrder) {
  bd_container ct;
  auto res = test::walk(root(), ct);
  ASSERT_TRUE(bd_err_success(&res)) << test::describe(res);
  std::vector<std::pair<int, std::int64_t>> order;
  res = bd_sig_compute_stream(
      &ct, root().c_str(), block_size,
      [](void *data, int file_index, std::int64_t block_index,
         const bd_block_hash *) -> bd_err {
        static_cast<std::vector<std::pair<int, std::int64_t>> *>(data)
            ->emplace_back(file_index, block_index);
        return bd_err_ok();
      },
      nullptr, &order);
  ASSERT_TRUE(bd_err_success(&res)) << test::describe(res);
  const std::vector<std::pair<int, std::int64_t>> expected{
      {1, 0}, {2, 0}, {3, 0}, {4, 0}, {4, 1}, {5, 0}, {5, 1}, {5, 2}};
  EXPECT_EQ(order, expected);
  bd_ct_free(&ct);
}

TEST_F(Signature, WriteReadRoundTrip) {
  bd_signature sig;
  auto res = test::sign(root(), block_size, 0, sig);
  ASSERT_TRUE(bd_err_success(&res)) << test::describe(res);
  sig.compression = {.algo = BD_COMP_ALGO_lzma, .quality = 2};
  const auto path = dir / "tree.sig";
  const int fd = open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
  ASSERT_GE(fd, 0);
  std::int64_t size = 0;
  res = bd_sig_write(&sig, fd, &size);
  close(fd);
  ASSERT_TRUE(bd_err_success(&res)) << test::describe(res);
  EXPECT_EQ(size, static_cast<std::int64_t>(std::filesystem::file_size(path)));

  bd_signature read;
  res = test::read_sig(path, read);
  ASSERT_TRUE(bd_err_success(&res)) << test::describe(res);
  EXPECT_EQ(read.block_size, block_size);
  EXPECT_EQ(read.compression.algo, BD_COMP_ALGO_lzma);
  EXPECT_EQ(read.compression.quality, 2);
  ASSERT_EQ(read.container.num_files, sig.container.num_files);
  for (int i = 0; i < read.container.num_files; ++i) {
    EXPECT_STREQ(read.container.files[i].path, sig.container.files[i].path);
    EXPECT_EQ(read.container.files[i].size, sig.container.files[i].size);
  }
  EXPECT_EQ(read.container.num_dirs, 1);
  EXPECT_TRUE(same_hashes(read, sig));
  bd_sig_free(&read);
  bd_sig_free(&sig);
}

TEST_F(Signature, ZeroBlocksRoundTrip) {
  // Zero-filled blocks have a weak hash of 0
  const auto zero_root = dir / "zero_tree";
  auto data = test::random_bytes(block_size, 11);
  data.append(2 * block_size, '\0');
  data += test::random_bytes(block_size, 12);
  test::write_file(zero_root / "zeros", data);
  bd_signature sig;
  auto res = test::sign(zero_root, block_size, 1, sig);
  ASSERT_TRUE(bd_err_success(&res)) << test::describe(res);
  ASSERT_EQ(sig.num_hashes, 4);
  EXPECT_EQ(sig.hashes[1].weak, 0u);
  EXPECT_EQ(sig.hashes[2].weak, 0u);

  const auto path = dir / "zeros.sig";
  const int fd = open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
  ASSERT_GE(fd, 0);
  res = bd_sig_write(&sig, fd, nullptr);
  close(fd);
  ASSERT_TRUE(bd_err_success(&res)) << test::describe(res);
  bd_signature read;
  res = test::read_sig(path, read);
  ASSERT_TRUE(bd_err_success(&res)) << test::describe(res);
  ASSERT_EQ(read.num_hashes, sig.num_hashes);
  for (std::int64_t i = 0; i < read.num_hashes; ++i) {
    EXPECT_EQ(read.hashes[i].weak, sig.hashes[i].weak) << "block " << i;
    EXPECT_TRUE(hash::same_hash(read.hashes[i], sig.hashes[i]))
        << "block " << i;
  }
  bd_sig_free(&read);
  bd_sig_free(&sig);
}

TEST_F(Signature, WriteTreeMatchesCompute) {
  bd_container ct;
  auto res = test::walk(root(), ct);
  ASSERT_TRUE(bd_err_success(&res)) << test::describe(res);
  const auto path = dir / "tree.sig";
  const int fd = open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
  ASSERT_GE(fd, 0);
  res = bd_sig_write_tree(&ct, root().c_str(), block_size, bd_comp_default(),
                          fd, nullptr, nullptr, nullptr);
  close(fd);
  ASSERT_TRUE(bd_err_success(&res)) << test::describe(res);
  bd_ct_free(&ct);

  bd_signature streamed;
  res = test::read_sig(path, streamed);
  ASSERT_TRUE(bd_err_success(&res)) << test::describe(res);
  bd_signature computed;
  res = test::sign(root(), block_size, 0, computed);
  ASSERT_TRUE(bd_err_success(&res)) << test::describe(res);
  EXPECT_TRUE(same_hashes(streamed, computed));
  bd_sig_free(&computed);
  bd_sig_free(&streamed);
}

TEST_F(Signature, FileChangedWhileHashing) {
  bd_container ct;
  auto res = test::walk(root(), ct);
  ASSERT_TRUE(bd_err_success(&res)) << test::describe(res);
  test::write_file(root() / "exact", "shorter now");
  bd_signature sig;
  res = bd_sig_compute(&ct, root().c_str(), block_size, 0, nullptr, nullptr,
                       &sig);
  EXPECT_EQ(res.primary, BD_ERRC_sig_compute);
  EXPECT_EQ(res.auxiliary, BD_ERRC_size_mismatch);
  EXPECT_EQ(bd_err_get_category(&res), BD_ERR_CATEGORY_corruption);
  ASSERT_NE(res.uri, nullptr);
  EXPECT_STREQ(res.uri, "exact");
  bd_err_release(&res);
  bd_ct_free(&ct);
}

TEST_F(Signature, InvalidBlockSize) {
  bd_container ct;
  auto res = test::walk(root(), ct);
  ASSERT_TRUE(bd_err_success(&res)) << test::describe(res);
  bd_signature sig;
  for (const int bad : {BD_MIN_BLOCK_SIZE - 1, BD_MAX_BLOCK_SIZE + 1, -5}) {
    res = bd_sig_compute(&ct, root().c_str(), bad, 0, nullptr, nullptr, &sig);
    EXPECT_EQ(res.auxiliary, BD_ERRC_invalid_arg) << bad;
    EXPECT_EQ(bd_err_get_category(&res), BD_ERR_CATEGORY_precondition);
  }
  bd_ct_free(&ct);
}

class SignatureStream : public testing::Test {
protected:
  test::temp_dir dir;

  /// Write raw stream bytes to a file and try to read a signature from it.
  bd_err read_bytes(const std::vector<unsigned char> &data) {
    const auto path = dir / "raw.sig";
    test::write_file(path, {reinterpret_cast<const char *>(data.data()),
                            data.size()});
    bd_signature sig;
    const auto res = test::read_sig(path, sig);
    if (bd_err_success(&res)) {
      bd_sig_free(&sig);
    }
    return res;
  }
};

TEST_F(SignatureStream, BadMagic) {
  const auto res = read_bytes({'N', 'O', 'P', 'E', 0, 0, 0, 0});
  EXPECT_EQ(res.primary, BD_ERRC_sig_read);
  EXPECT_EQ(res.auxiliary, BD_ERRC_magic_mismatch);
  EXPECT_EQ(bd_err_get_category(&res), BD_ERR_CATEGORY_format);
}

TEST_F(SignatureStream, EmptyFile) {
  auto res = read_bytes({});
  EXPECT_FALSE(bd_err_success(&res));
  EXPECT_EQ(bd_err_get_category(&res), BD_ERR_CATEGORY_format);
  bd_err_release(&res);
}

TEST_F(SignatureStream, UnsupportedAlgorithm) {
  io::mem_sink sink(BD_ERRC_sig_write);
  auto res = wire::write_magic(sink, wire::sig_magic);
  ASSERT_TRUE(bd_err_success(&res));
  SignatureHeader hdr;
  hdr.mutable_compression()->set_algorithm(
      static_cast<CompressionAlgorithm>(9));
  hdr.set_block_size(block_size);
  res = wire::write_header(sink, hdr, BD_ERRC_sig_write);
  ASSERT_TRUE(bd_err_success(&res));
  res = read_bytes(sink.data);
  EXPECT_EQ(res.auxiliary, BD_ERRC_unknown_comp);
  EXPECT_EQ(bd_err_get_category(&res), BD_ERR_CATEGORY_compression);
}

TEST_F(SignatureStream, TrailingHash) {
  test::write_file(dir / "tree/file", test::random_bytes(block_size, 7));
  bd_signature sig;
  auto res = test::sign(dir / "tree", block_size, 1, sig);
  ASSERT_TRUE(bd_err_success(&res)) << test::describe(res);
  const auto path = dir / "extra.sig";
  const int fd = open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
  ASSERT_GE(fd, 0);
  {
    sig_writer writer(fd, BD_ERRC_sig_write);
    res = writer.open(sig.container, sig.block_size, sig.compression);
    ASSERT_TRUE(bd_err_success(&res)) << test::describe(res);
    for (int i = 0; i < 2; ++i) {
      res = writer.write(sig.hashes[0]);
      ASSERT_TRUE(bd_err_success(&res)) << test::describe(res);
    }
    res = writer.finish();
    ASSERT_TRUE(bd_err_success(&res)) << test::describe(res);
  }
  close(fd);
  bd_sig_free(&sig);
  bd_signature read;
  res = test::read_sig(path, read);
  EXPECT_EQ(res.auxiliary, BD_ERRC_invalid_data);
  EXPECT_EQ(bd_err_get_category(&res), BD_ERR_CATEGORY_format);
}

TEST_F(SignatureStream, Truncated) {
  test::write_file(dir / "tree/file", test::random_bytes(block_size * 4, 8));
  bd_signature sig;
  auto res = test::sign(dir / "tree", block_size, 1, sig);
  ASSERT_TRUE(bd_err_success(&res)) << test::describe(res);
  const auto path = dir / "full.sig";
  const int fd = open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
  ASSERT_GE(fd, 0);
  res = bd_sig_write(&sig, fd, nullptr);
  close(fd);
  bd_sig_free(&sig);
  ASSERT_TRUE(bd_err_success(&res)) << test::describe(res);
  auto data = test::read_file(path);
  data.resize(data.size() - 10);
  res = read_bytes({data.begin(), data.end()});
  EXPECT_FALSE(bd_err_success(&res));
  bd_err_release(&res);
}

} // namespace
} // namespace blockdelta::content
