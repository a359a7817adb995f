//===-- delta_unittest.cpp - diff and apply tests -------------------------===//
//
// Copyright (c) 2025 Nuclearist <nuclearist@teknology-hub.com>
// Part of blockdelta, under the GNU General Public License v3.0 or later
// See COPYING in the project root for license information.
// SPDX-License-Identifier: GPL-3.0-or-later
//
//===----------------------------------------------------------------------===//
#include "blockdelta/delta.h"

#include "blockdelta/content.h"
#include "blockdelta/content/container.pb.h"
#include "blockdelta/content/patch.pb.h"
#include "blockdelta/error.h"
#include "hash.hpp"
#include "stream.hpp"
#include "test_util.hpp"
#include "wire.hpp"

#include <climits>
#include <cstdint>
#include <filesystem>
#include <gtest/gtest.h>
#include <span>
#include <string>

namespace blockdelta::delta {
namespace {

namespace fs = std::filesystem;

constexpr int block_size = 1024;

/// Diff and apply fixture with target, source and output tree roots.
class Delta : public testing::Test {
protected:
  test::temp_dir dir;
  const fs::path target = dir / "target";
  const fs::path source = dir / "source";
  const fs::path output = dir / "output";
  const fs::path patch = dir / "tree.patch";
  bd_diff_stats stats{};
  bd_apply_result result{};

  void SetUp() override {
    fs::create_directory(target);
    fs::create_directory(source);
  }

  /// Diff target (or the null tree) against source, then apply the patch to
  ///    a fresh output directory and compare it with the source.
  void round_trip(bool null_target = false, const test::diff_opts &opts = {}) {
    auto res = test::diff_trees(null_target ? nullptr : &target, source,
                                patch, opts, stats);
    ASSERT_TRUE(bd_err_success(&res)) << test::describe(res);
    EXPECT_EQ(stats.patch_size,
              static_cast<std::int64_t>(fs::file_size(patch)));
    res = test::apply_patch(patch, null_target ? nullptr : &target, output,
                            false, result);
    ASSERT_TRUE(bd_err_success(&res)) << test::describe(res);
    EXPECT_EQ(test::snapshot(output), test::snapshot(source));
  }

  std::int64_t source_size() const {
    std::int64_t size = 0;
    for (const auto &entry : fs::recursive_directory_iterator(source)) {
      if (entry.is_regular_file() && !entry.is_symlink()) {
        size += entry.file_size();
      }
    }
    return size;
  }
};

/// Fill a tree with a mix of entries shared by target and source fixtures.
void make_base_tree(const fs::path &root) {
  test::write_file(root / "bin/app", test::random_bytes(50000, 1));
  test::write_file(root / "bin/lib.so", test::random_bytes(20000, 2));
  test::write_file(root / "data/table.dat", test::random_bytes(9000, 3));
  test::write_file(root / "data/empty", "");
  test::write_file(root / "readme.txt", "version 1\n");
  test::write_file(root / "old/gone.txt", "obsolete");
  fs::create_directories(root / "logs");
  fs::create_symlink("bin/app", root / "run");
}

class DeltaRoundTrip : public Delta,
                       public testing::WithParamInterface<bd_comp_settings> {
};

TEST_P(DeltaRoundTrip, ModifiedTree) {
  make_base_tree(target);
  make_base_tree(source);
  // Insertion in the middle of a file
  auto app = test::random_bytes(50000, 1);
  app.insert(12345, test::random_bytes(777, 10));
  test::write_file(source / "bin/app", app);
  // Removal of a range and an appended tail
  auto lib = test::random_bytes(20000, 2);
  lib.erase(3000, 4000);
  lib += "tail";
  test::write_file(source / "bin/lib.so", lib);
  test::write_file(source / "readme.txt", "version 2\n");
  test::write_file(source / "new/fresh.bin", test::random_bytes(3000, 11));
  fs::remove_all(source / "old");
  fs::remove(source / "run");
  fs::create_symlink("bin/lib.so", source / "run");
  fs::permissions(source / "data/table.dat", fs::perms::owner_all);

  test::diff_opts opts;
  opts.compression = GetParam();
  ASSERT_NO_FATAL_FAILURE(round_trip(false, opts));
  EXPECT_EQ(stats.reused_bytes + stats.fresh_bytes, source_size());
  EXPECT_GT(stats.reused_bytes, 70000);
  EXPECT_LT(stats.fresh_bytes, 7000);
  EXPECT_EQ(result.touched_files, 6);
  EXPECT_EQ(result.bytes_written, source_size());
  EXPECT_EQ(result.num_dirs, 4);
  EXPECT_EQ(result.num_symlinks, 1);
  EXPECT_EQ(fs::status(output / "data/table.dat").permissions() &
                fs::perms::all,
            fs::perms::owner_all);
}

constexpr bd_comp_settings round_trip_settings[]{
    {.algo = BD_COMP_ALGO_none, .quality = 0},
    {.algo = BD_COMP_ALGO_deflate, .quality = 6},
    {.algo = BD_COMP_ALGO_lzma, .quality = 1}};

std::string
settings_name(const testing::TestParamInfo<bd_comp_settings> &info) {
  static constexpr const char *names[]{"none", "deflate", "lzma"};
  return names[info.param.algo];
}

INSTANTIATE_TEST_SUITE_P(Algorithms, DeltaRoundTrip,
                         testing::ValuesIn(round_trip_settings),
                         settings_name);

TEST_F(Delta, NullTarget) {
  make_base_tree(source);
  ASSERT_NO_FATAL_FAILURE(round_trip(true));
  EXPECT_EQ(stats.reused_bytes, 0);
  EXPECT_EQ(stats.fresh_bytes, source_size());
  EXPECT_EQ(stats.num_copy_ops, 0);
}

TEST_F(Delta, NullSource) {
  make_base_tree(target);
  ASSERT_NO_FATAL_FAILURE(round_trip());
  EXPECT_EQ(stats.reused_bytes, 0);
  EXPECT_EQ(stats.fresh_bytes, 0);
  EXPECT_TRUE(fs::is_empty(output));

  bd_patch p;
  const auto res = test::read_patch(patch, p);
  ASSERT_TRUE(bd_err_success(&res)) << test::describe(res);
  EXPECT_EQ(p.target.num_files, 6);
  EXPECT_EQ(p.source.num_files, 0);
  EXPECT_EQ(p.num_ops, 0);
  bd_patch_free(&p);
}

TEST_F(Delta, BothNull) {
  ASSERT_NO_FATAL_FAILURE(round_trip(true));
  EXPECT_EQ(stats.reused_bytes + stats.fresh_bytes, 0);
  EXPECT_TRUE(fs::is_empty(output));
}

TEST_F(Delta, IdenticalTrees) {
  make_base_tree(target);
  make_base_tree(source);
  ASSERT_NO_FATAL_FAILURE(round_trip());
  EXPECT_EQ(stats.fresh_bytes, 0);
  EXPECT_EQ(stats.num_literal_ops, 0);
  EXPECT_EQ(stats.reused_bytes, source_size());
}

TEST_F(Delta, PartialOverlap) {
  const auto old_data = test::random_bytes(4 * block_size, 20);
  test::write_file(target / "file", old_data);
  test::write_file(source / "file", old_data.substr(0, 2 * block_size) +
                                        test::random_bytes(2 * block_size, 21));
  ASSERT_NO_FATAL_FAILURE(round_trip());
  EXPECT_EQ(stats.reused_bytes, 2 * block_size);
  EXPECT_EQ(stats.fresh_bytes, 2 * block_size);
  // Adjacent block copies are merged
  EXPECT_EQ(stats.num_copy_ops, 1);
  EXPECT_EQ(stats.num_literal_ops, 1);
}

TEST_F(Delta, UnalignedMatchAndTail) {
  // 4 full blocks and a 100-byte tail block
  const auto old_data = test::random_bytes(4 * block_size + 100, 30);
  test::write_file(target / "file", old_data);
  test::write_file(source / "file", test::random_bytes(37, 31) + old_data);
  ASSERT_NO_FATAL_FAILURE(round_trip());
  EXPECT_EQ(stats.fresh_bytes, 37);
  EXPECT_EQ(stats.reused_bytes, 4 * block_size + 100);
  EXPECT_EQ(stats.num_copy_ops, 1);

  bd_patch p;
  const auto res = test::read_patch(patch, p);
  ASSERT_TRUE(bd_err_success(&res)) << test::describe(res);
  ASSERT_EQ(p.files[0].num_ops, 2);
  const auto &lit = p.files[0].ops[0];
  EXPECT_EQ(lit.type, BD_PATCH_OP_TYPE_literal);
  EXPECT_EQ(lit.length, 37);
  // A copy following a literal must not inherit the literal's payload
  const auto &copy = p.files[0].ops[1];
  EXPECT_EQ(copy.type, BD_PATCH_OP_TYPE_block_copy);
  EXPECT_EQ(copy.file_index, 0);
  EXPECT_EQ(copy.offset, 0);
  EXPECT_EQ(copy.length, 4 * block_size + 100);
  bd_patch_free(&p);
}

TEST_F(Delta, InteriorBlockModified) {
  const auto old_data = test::random_bytes(8 * block_size, 32);
  auto new_data = old_data;
  new_data[3 * block_size + 500] ^= 0x5A;
  test::write_file(target / "file", old_data);
  test::write_file(source / "file", new_data);
  ASSERT_NO_FATAL_FAILURE(round_trip());
  EXPECT_EQ(stats.fresh_bytes, block_size);
  EXPECT_EQ(stats.reused_bytes, 7 * block_size);
  EXPECT_EQ(stats.num_copy_ops, 2);
  EXPECT_EQ(stats.num_literal_ops, 1);

  bd_patch p;
  const auto res = test::read_patch(patch, p);
  ASSERT_TRUE(bd_err_success(&res)) << test::describe(res);
  ASSERT_EQ(p.files[0].num_ops, 3);
  const auto ops = p.files[0].ops;
  EXPECT_EQ(ops[0].type, BD_PATCH_OP_TYPE_block_copy);
  EXPECT_EQ(ops[0].offset, 0);
  EXPECT_EQ(ops[0].length, 3 * block_size);
  EXPECT_EQ(ops[1].type, BD_PATCH_OP_TYPE_literal);
  EXPECT_EQ(ops[1].length, block_size);
  EXPECT_EQ(ops[2].type, BD_PATCH_OP_TYPE_block_copy);
  EXPECT_EQ(ops[2].file_index, 0);
  EXPECT_EQ(ops[2].offset, 4 * block_size);
  EXPECT_EQ(ops[2].length, 4 * block_size);
  bd_patch_free(&p);
}

TEST_F(Delta, CrossFileDedupe) {
  const auto data = test::random_bytes(8 * block_size, 40);
  test::write_file(target / "a.bin", data);
  test::write_file(source / "b.bin", data);
  test::write_file(source / "c.bin",
                   data.substr(4 * block_size) + data.substr(0, 4 * block_size));
  ASSERT_NO_FATAL_FAILURE(round_trip());
  EXPECT_EQ(stats.fresh_bytes, 0);
  EXPECT_EQ(stats.reused_bytes, 16 * block_size);
  EXPECT_EQ(stats.num_literal_ops, 0);
  EXPECT_EQ(stats.num_copy_ops, 3);

  bd_patch p;
  const auto res = test::read_patch(patch, p);
  ASSERT_TRUE(bd_err_success(&res)) << test::describe(res);
  ASSERT_EQ(p.num_ops, 3);
  ASSERT_EQ(p.files[0].num_ops, 1);
  EXPECT_EQ(p.files[0].ops[0].type, BD_PATCH_OP_TYPE_block_copy);
  EXPECT_EQ(p.files[0].ops[0].file_index, 0);
  EXPECT_EQ(p.files[0].ops[0].offset, 0);
  EXPECT_EQ(p.files[0].ops[0].length, 8 * block_size);
  ASSERT_EQ(p.files[1].num_ops, 2);
  EXPECT_EQ(p.files[1].ops[0].offset, 4 * block_size);
  EXPECT_EQ(p.files[1].ops[1].offset, 0);
  bd_patch_free(&p);
}

TEST_F(Delta, WeakCollisionIsNotReused) {
  // Both blocks have the same weak hash but different contents
  std::string old_block(BD_MIN_BLOCK_SIZE, 'x');
  std::string new_block(BD_MIN_BLOCK_SIZE, 'x');
  old_block[20] = old_block[23] = 'y';
  new_block[21] = new_block[22] = 'y';
  const auto span = [](const std::string &str) {
    return std::span<const unsigned char>(
        reinterpret_cast<const unsigned char *>(str.data()), str.size());
  };
  ASSERT_EQ(hash::weak_sum(span(old_block)), hash::weak_sum(span(new_block)));
  test::write_file(target / "file", old_block);
  test::write_file(source / "file", new_block);
  test::diff_opts opts;
  opts.block_size = BD_MIN_BLOCK_SIZE;
  ASSERT_NO_FATAL_FAILURE(round_trip(false, opts));
  EXPECT_EQ(stats.reused_bytes, 0);
  EXPECT_EQ(stats.fresh_bytes, BD_MIN_BLOCK_SIZE);
}

TEST_F(Delta, LiteralRunsAreSplit) {
  test::write_file(source / "file", test::random_bytes(10000, 50));
  test::diff_opts opts;
  opts.max_literal_size = 4096;
  ASSERT_NO_FATAL_FAILURE(round_trip(true, opts));
  EXPECT_EQ(stats.num_literal_ops, 3);

  // The scanning path splits the same way
  test::write_file(target / "other", test::random_bytes(3000, 51));
  ASSERT_NO_FATAL_FAILURE(round_trip(false, opts));
  EXPECT_EQ(stats.num_literal_ops, 3);
  EXPECT_EQ(stats.fresh_bytes, 10000);
}

TEST_F(Delta, SourceSignatureByproduct) {
  make_base_tree(target);
  make_base_tree(source);
  test::write_file(source / "readme.txt", "version 2\n");
  test::diff_opts opts;
  opts.sig_path = dir / "source.sig";
  ASSERT_NO_FATAL_FAILURE(round_trip(false, opts));
  EXPECT_EQ(stats.sig_size,
            static_cast<std::int64_t>(fs::file_size(opts.sig_path)));

  bd_signature written;
  auto res = test::read_sig(opts.sig_path, written);
  ASSERT_TRUE(bd_err_success(&res)) << test::describe(res);
  bd_signature computed;
  res = test::sign(source, block_size, 0, computed);
  ASSERT_TRUE(bd_err_success(&res)) << test::describe(res);
  EXPECT_EQ(written.block_size, block_size);
  ASSERT_EQ(written.num_hashes, computed.num_hashes);
  for (std::int64_t i = 0; i < written.num_hashes; ++i) {
    EXPECT_TRUE(hash::same_hash(written.hashes[i], computed.hashes[i]))
        << "hash " << i;
  }
  bd_sig_free(&computed);
  bd_sig_free(&written);
}

TEST_F(Delta, InPlace) {
  make_base_tree(target);
  make_base_tree(source);
  // Swap the contents of two files, so each one reads the other's old data
  test::write_file(source / "bin/app", test::random_bytes(20000, 2));
  test::write_file(source / "bin/lib.so", test::random_bytes(50000, 1));
  fs::remove_all(source / "old");
  fs::remove(source / "run");
  test::write_file(source / "run", "now a file");
  fs::create_directories(source / "old/nested");
  auto res = test::diff_trees(&target, source, patch, {}, stats);
  ASSERT_TRUE(bd_err_success(&res)) << test::describe(res);
  EXPECT_EQ(stats.fresh_bytes, 10);

  res = test::apply_patch(patch, &target, target, true, result);
  ASSERT_TRUE(bd_err_success(&res)) << test::describe(res);
  EXPECT_EQ(test::snapshot(target), test::snapshot(source));
}

TEST_F(Delta, InPlaceRequiresAuthorization) {
  make_base_tree(target);
  make_base_tree(source);
  test::write_file(source / "readme.txt", "version 2\n");
  auto res = test::diff_trees(&target, source, patch, {}, stats);
  ASSERT_TRUE(bd_err_success(&res)) << test::describe(res);
  const auto before = test::snapshot(target);

  res = test::apply_patch(patch, &target, target / "." / "bin" / "..", false,
                          result);
  EXPECT_EQ(res.primary, BD_ERRC_apply);
  EXPECT_EQ(res.auxiliary, BD_ERRC_inplace_not_allowed);
  EXPECT_EQ(bd_err_get_category(&res), BD_ERR_CATEGORY_precondition);
  EXPECT_EQ(test::snapshot(target), before);
}

TEST_F(Delta, MissingTarget) {
  make_base_tree(target);
  make_base_tree(source);
  auto res = test::diff_trees(&target, source, patch, {}, stats);
  ASSERT_TRUE(bd_err_success(&res)) << test::describe(res);
  res = test::apply_patch(patch, nullptr, output, false, result);
  EXPECT_EQ(res.auxiliary, BD_ERRC_target_missing);
  EXPECT_EQ(bd_err_get_category(&res), BD_ERR_CATEGORY_precondition);
}

TEST_F(Delta, CorruptedTarget) {
  make_base_tree(target);
  make_base_tree(source);
  test::write_file(source / "readme.txt", "version 2\n");
  auto res = test::diff_trees(&target, source, patch, {}, stats);
  ASSERT_TRUE(bd_err_success(&res)) << test::describe(res);
  fs::resize_file(target / "bin/app", 40000);
  res = test::apply_patch(patch, &target, output, false, result);
  EXPECT_EQ(res.primary, BD_ERRC_apply);
  EXPECT_EQ(res.auxiliary, BD_ERRC_size_mismatch);
  EXPECT_EQ(bd_err_get_category(&res), BD_ERR_CATEGORY_corruption);
  ASSERT_NE(res.uri, nullptr);
  EXPECT_STREQ(res.uri, "bin/app");
  bd_err_release(&res);
}

TEST_F(Delta, CorruptedPatch) {
  make_base_tree(source);
  auto res = test::diff_trees(nullptr, source, patch, {}, stats);
  ASSERT_TRUE(bd_err_success(&res)) << test::describe(res);
  auto data = test::read_file(patch);
  data[0] ^= 0xFF;
  test::write_file(dir / "bad_magic.patch", data);
  res = test::apply_patch(dir / "bad_magic.patch", nullptr, output, false,
                          result);
  EXPECT_EQ(res.auxiliary, BD_ERRC_magic_mismatch);
  data = test::read_file(patch);
  data.resize(data.size() / 2);
  test::write_file(dir / "short.patch", data);
  res = test::apply_patch(dir / "short.patch", nullptr, dir / "output2", false,
                          result);
  EXPECT_FALSE(bd_err_success(&res));
  bd_err_release(&res);
}

TEST_F(Delta, CopyFromNonexistentTargetFile) {
  test::write_file(target / "t", "0123456789");
  io::mem_sink sink(BD_ERRC_diff);
  auto res = wire::write_magic(sink, wire::patch_magic);
  ASSERT_TRUE(bd_err_success(&res));
  const bd_comp_settings settings{.algo = BD_COMP_ALGO_none, .quality = 0};
  content::PatchHeader hdr;
  wire::comp_to_proto(settings, *hdr.mutable_compression());
  res = wire::write_header(sink, hdr, BD_ERRC_diff);
  ASSERT_TRUE(bd_err_success(&res));
  wire::msg_writer writer;
  res = writer.open(sink, settings, BD_ERRC_diff);
  ASSERT_TRUE(bd_err_success(&res));
  content::Container ct;
  auto &file = *ct.add_files();
  file.set_path("t");
  file.set_size(10);
  ct.set_size(10);
  res = writer.write(ct);
  ASSERT_TRUE(bd_err_success(&res));
  file.set_path("s");
  res = writer.write(ct);
  ASSERT_TRUE(bd_err_success(&res));
  content::FileHeader file_hdr;
  file_hdr.set_file_index(0);
  res = writer.write(file_hdr);
  ASSERT_TRUE(bd_err_success(&res));
  content::PatchOp op;
  op.set_kind(content::PATCH_OP_KIND_BLOCK_COPY);
  op.set_file_index(5);
  op.set_length(10);
  res = writer.write(op);
  ASSERT_TRUE(bd_err_success(&res));
  op.Clear();
  op.set_kind(content::PATCH_OP_KIND_FILE_END);
  res = writer.write(op);
  ASSERT_TRUE(bd_err_success(&res));
  res = writer.finish();
  ASSERT_TRUE(bd_err_success(&res));
  test::write_file(patch, {reinterpret_cast<const char *>(sink.data.data()),
                           sink.data.size()});

  res = test::apply_patch(patch, &target, output, false, result);
  EXPECT_EQ(res.primary, BD_ERRC_apply);
  EXPECT_EQ(res.auxiliary, BD_ERRC_invalid_data);
  EXPECT_EQ(bd_err_get_category(&res), BD_ERR_CATEGORY_format);
}

TEST_F(Delta, OversizedLiteral) {
  // The declared length is far larger than the payload can produce
  io::mem_sink sink(BD_ERRC_diff);
  auto res = wire::write_magic(sink, wire::patch_magic);
  ASSERT_TRUE(bd_err_success(&res));
  const bd_comp_settings settings{.algo = BD_COMP_ALGO_none, .quality = 0};
  content::PatchHeader hdr;
  wire::comp_to_proto(settings, *hdr.mutable_compression());
  res = wire::write_header(sink, hdr, BD_ERRC_diff);
  ASSERT_TRUE(bd_err_success(&res));
  wire::msg_writer writer;
  res = writer.open(sink, settings, BD_ERRC_diff);
  ASSERT_TRUE(bd_err_success(&res));
  res = writer.write(content::Container{});
  ASSERT_TRUE(bd_err_success(&res));
  content::Container ct;
  auto &file = *ct.add_files();
  file.set_path("huge");
  file.set_size(INT_MAX);
  ct.set_size(INT_MAX);
  res = writer.write(ct);
  ASSERT_TRUE(bd_err_success(&res));
  content::FileHeader file_hdr;
  file_hdr.set_file_index(0);
  res = writer.write(file_hdr);
  ASSERT_TRUE(bd_err_success(&res));
  content::PatchOp op;
  op.set_kind(content::PATCH_OP_KIND_LITERAL);
  op.set_length(INT_MAX);
  op.set_data("tiny");
  res = writer.write(op);
  ASSERT_TRUE(bd_err_success(&res));
  op.Clear();
  op.set_kind(content::PATCH_OP_KIND_FILE_END);
  res = writer.write(op);
  ASSERT_TRUE(bd_err_success(&res));
  res = writer.finish();
  ASSERT_TRUE(bd_err_success(&res));
  test::write_file(patch, {reinterpret_cast<const char *>(sink.data.data()),
                           sink.data.size()});

  res = test::apply_patch(patch, nullptr, output, false, result);
  EXPECT_EQ(res.type, BD_ERR_TYPE_sub);
  EXPECT_EQ(res.primary, BD_ERRC_apply);
  // Either the buffer can't be allocated or the payload is too short for it
  EXPECT_TRUE(res.auxiliary == BD_ERRC_mem_alloc ||
              res.auxiliary == BD_ERRC_invalid_data)
      << test::describe(res);
}

} // namespace
} // namespace blockdelta::delta
