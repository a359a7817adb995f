//===-- container_unittest.cpp - container tests --------------------------===//
//
// Copyright (c) 2025 Nuclearist <nuclearist@teknology-hub.com>
// Part of blockdelta, under the GNU General Public License v3.0 or later
// See COPYING in the project root for license information.
// SPDX-License-Identifier: GPL-3.0-or-later
//
//===----------------------------------------------------------------------===//
#include "container.hpp"

#include "blockdelta/content.h"
#include "blockdelta/content/container.pb.h"
#include "blockdelta/error.h"
#include "test_util.hpp"

#include <cstring>
#include <filesystem>
#include <gtest/gtest.h>
#include <span>
#include <string>
#include <string_view>
#include <sys/stat.h>
#include <vector>

namespace blockdelta::content {
namespace {

namespace fs = std::filesystem;

template <typename T> std::vector<std::string> paths(std::span<const T> entries) {
  std::vector<std::string> res;
  for (const auto &entry : entries) {
    res.emplace_back(entry.path);
  }
  return res;
}

class ContainerWalk : public testing::Test {
protected:
  test::temp_dir dir;

  void SetUp() override {
    test::write_file(dir / "b.txt", "bbb");
    test::write_file(dir / "A", "AAAAA");
    test::write_file(dir / "a/z.bin", "0123456789");
    test::write_file(dir / "a/sub/y", "");
    test::write_file(dir / ".git/config", "[core]");
    test::write_file(dir / "._meta", "meta");
    test::write_file(dir / "a/Thumbs.db", "thumbs");
    fs::create_symlink("z.bin", dir / "a/link");
    fs::permissions(dir / "a/z.bin", fs::perms::owner_read |
                                         fs::perms::owner_write |
                                         fs::perms::group_read);
    ASSERT_EQ(mkfifo((dir / "pipe").c_str(), 0644), 0);
  }
};

TEST_F(ContainerWalk, OrderAndOffsets) {
  bd_container ct;
  const auto res = test::walk(dir.path(), ct);
  ASSERT_TRUE(bd_err_success(&res)) << test::describe(res);
  EXPECT_EQ(paths(std::span<const bd_ct_dir>(ct.dirs, ct.num_dirs)),
            (std::vector<std::string>{"a", "a/sub"}));
  EXPECT_EQ(paths(std::span<const bd_ct_file>(ct.files, ct.num_files)),
            (std::vector<std::string>{"A", "a/sub/y", "a/z.bin", "b.txt"}));
  ASSERT_EQ(ct.num_files, 4);
  EXPECT_EQ(ct.files[0].size, 5);
  EXPECT_EQ(ct.files[0].offset, 0);
  EXPECT_EQ(ct.files[1].size, 0);
  EXPECT_EQ(ct.files[1].offset, 5);
  EXPECT_EQ(ct.files[2].size, 10);
  EXPECT_EQ(ct.files[2].offset, 5);
  EXPECT_EQ(ct.files[2].mode & 0777, 0640u);
  EXPECT_EQ(ct.files[3].offset, 15);
  EXPECT_EQ(ct.size, 18);
  ASSERT_EQ(ct.num_symlinks, 1);
  EXPECT_STREQ(ct.symlinks[0].path, "a/link");
  EXPECT_STREQ(ct.symlinks[0].target, "z.bin");
  bd_ct_free(&ct);
}

TEST_F(ContainerWalk, FilterExcludesSubtree) {
  bd_container ct;
  int num_calls = 0;
  const auto res = bd_ct_walk(
      dir.path().c_str(),
      [](void *data, const char *path, const char *name,
         bd_ct_entry_type type) -> bool {
        ++*static_cast<int *>(data);
        return std::strcmp(path, "a") != 0 &&
               bd_ct_default_filter(nullptr, path, name, type);
      },
      &num_calls, &ct);
  ASSERT_TRUE(bd_err_success(&res)) << test::describe(res);
  // .git, ._meta, A, a, b.txt; the pipe is skipped before filtering
  EXPECT_EQ(num_calls, 5);
  EXPECT_EQ(ct.num_dirs, 0);
  EXPECT_EQ(ct.num_symlinks, 0);
  EXPECT_EQ(paths(std::span<const bd_ct_file>(ct.files, ct.num_files)),
            (std::vector<std::string>{"A", "b.txt"}));
  EXPECT_EQ(ct.size, 8);
  bd_ct_free(&ct);
}

TEST_F(ContainerWalk, WithoutFilterIncludesMetadata) {
  bd_container ct;
  const auto res = bd_ct_walk(dir.path().c_str(), nullptr, nullptr, &ct);
  ASSERT_TRUE(bd_err_success(&res)) << test::describe(res);
  EXPECT_EQ(paths(std::span<const bd_ct_dir>(ct.dirs, ct.num_dirs)),
            (std::vector<std::string>{".git", "a", "a/sub"}));
  EXPECT_EQ(ct.num_files, 7);
  bd_ct_free(&ct);
}

TEST(Container, DefaultFilter) {
  EXPECT_FALSE(bd_ct_default_filter(nullptr, "x/.git", ".git",
                                    BD_CT_ENTRY_TYPE_dir));
  EXPECT_FALSE(bd_ct_default_filter(nullptr, ".DS_Store", ".DS_Store",
                                    BD_CT_ENTRY_TYPE_file));
  EXPECT_FALSE(bd_ct_default_filter(nullptr, "__MACOSX", "__MACOSX",
                                    BD_CT_ENTRY_TYPE_dir));
  EXPECT_FALSE(bd_ct_default_filter(nullptr, "d/._x", "._x",
                                    BD_CT_ENTRY_TYPE_file));
  EXPECT_TRUE(bd_ct_default_filter(nullptr, "d/.gitignore", ".gitignore",
                                   BD_CT_ENTRY_TYPE_file));
  EXPECT_TRUE(bd_ct_default_filter(nullptr, "git", "git",
                                   BD_CT_ENTRY_TYPE_dir));
}

TEST(Container, WalkMissingDirectory) {
  test::temp_dir dir;
  bd_container ct;
  auto res = test::walk(dir / "missing", ct);
  EXPECT_EQ(res.type, BD_ERR_TYPE_os);
  EXPECT_EQ(res.primary, BD_ERRC_walk);
  EXPECT_EQ(bd_err_get_category(&res), BD_ERR_CATEGORY_io);
  bd_err_release(&res);
}

TEST(Container, MessageValidation) {
  Container msg;
  auto &file = *msg.add_files();
  file.set_path("dir/file");
  file.set_size(10);
  file.set_offset(0);
  msg.set_size(10);
  auto &symlink = *msg.add_symlinks();
  symlink.set_path("dir/link");
  symlink.set_target("file");
  msg.add_dirs()->set_path("dir");

  bd_container ct;
  auto res = ct_from_proto(msg, ct, BD_ERRC_patch_read);
  ASSERT_TRUE(bd_err_success(&res)) << test::describe(res);
  EXPECT_STREQ(ct.files[0].path, "dir/file");
  EXPECT_STREQ(ct.symlinks[0].target, "file");
  EXPECT_STREQ(ct.dirs[0].path, "dir");
  Container back;
  ct_to_proto(ct, back);
  EXPECT_EQ(back.SerializeAsString(), msg.SerializeAsString());
  bd_ct_free(&ct);

  for (const std::string_view bad : {"", "/abs", "a//b", "a/./b", "../up",
                                     "a/..", "trailing/"}) {
    auto copy = msg;
    copy.mutable_files(0)->set_path(std::string(bad));
    res = ct_from_proto(copy, ct, BD_ERRC_patch_read);
    EXPECT_EQ(res.auxiliary, BD_ERRC_invalid_data) << "path \"" << bad << '"';
  }
  auto copy = msg;
  copy.mutable_files(0)->set_offset(1);
  res = ct_from_proto(copy, ct, BD_ERRC_patch_read);
  EXPECT_EQ(res.auxiliary, BD_ERRC_invalid_data);
  copy = msg;
  copy.set_size(11);
  res = ct_from_proto(copy, ct, BD_ERRC_patch_read);
  EXPECT_EQ(res.auxiliary, BD_ERRC_invalid_data);
  EXPECT_EQ(bd_err_get_category(&res), BD_ERR_CATEGORY_format);
  copy = msg;
  copy.mutable_files(0)->set_size(-1);
  res = ct_from_proto(copy, ct, BD_ERRC_patch_read);
  EXPECT_EQ(res.auxiliary, BD_ERRC_invalid_data);
}

TEST(Container, Copy) {
  test::temp_dir dir;
  test::write_file(dir / "x/y", "data");
  bd_container ct;
  auto res = test::walk(dir.path(), ct);
  ASSERT_TRUE(bd_err_success(&res)) << test::describe(res);
  bd_container copy;
  res = ct_copy(ct, copy, BD_ERRC_apply);
  ASSERT_TRUE(bd_err_success(&res)) << test::describe(res);
  bd_ct_free(&ct);
  ASSERT_EQ(copy.num_files, 1);
  EXPECT_STREQ(copy.files[0].path, "x/y");
  EXPECT_EQ(copy.size, 4);
  ASSERT_EQ(copy.num_dirs, 1);
  EXPECT_STREQ(copy.dirs[0].path, "x");
  bd_ct_free(&copy);
}

} // namespace
} // namespace blockdelta::content
