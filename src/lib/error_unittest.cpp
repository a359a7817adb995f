//===-- error_unittest.cpp - error inspection tests -----------------------===//
//
// Copyright (c) 2025 Nuclearist <nuclearist@teknology-hub.com>
// Part of blockdelta, under the GNU General Public License v3.0 or later
// See COPYING in the project root for license information.
// SPDX-License-Identifier: GPL-3.0-or-later
//
//===----------------------------------------------------------------------===//
#include "blockdelta/error.h"

#include "blockdelta/base.h"
#include "common/error.h"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <gtest/gtest.h>
#include <lzma.h>
#include <string_view>

namespace blockdelta {
namespace {

TEST(Error, SuccessValue) {
  auto err = bd_err_ok();
  EXPECT_TRUE(bd_err_success(&err));
  EXPECT_EQ(bd_err_get_category(&err), BD_ERR_CATEGORY_none);
  err = bd_err_basic(BD_ERRC_mem_alloc);
  EXPECT_FALSE(bd_err_success(&err));
  EXPECT_EQ(bd_err_get_category(&err), BD_ERR_CATEGORY_internal);
}

TEST(Error, Categories) {
  const struct {
    bd_errc aux;
    bd_err_category category;
  } cases[]{{BD_ERRC_magic_mismatch, BD_ERR_CATEGORY_format},
            {BD_ERRC_invalid_data, BD_ERR_CATEGORY_format},
            {BD_ERRC_unexpected_eof, BD_ERR_CATEGORY_format},
            {BD_ERRC_protobuf_deserialize, BD_ERR_CATEGORY_format},
            {BD_ERRC_unknown_comp, BD_ERR_CATEGORY_compression},
            {BD_ERRC_decompress, BD_ERR_CATEGORY_compression},
            {BD_ERRC_size_mismatch, BD_ERR_CATEGORY_corruption},
            {BD_ERRC_hash_mismatch, BD_ERR_CATEGORY_corruption},
            {BD_ERRC_inplace_not_allowed, BD_ERR_CATEGORY_precondition},
            {BD_ERRC_target_missing, BD_ERR_CATEGORY_precondition},
            {BD_ERRC_invalid_arg, BD_ERR_CATEGORY_precondition},
            {BD_ERRC_wt_start, BD_ERR_CATEGORY_internal},
            {BD_ERRC_mem_alloc, BD_ERR_CATEGORY_internal}};
  for (const auto &c : cases) {
    const auto err = bd_err_sub(BD_ERRC_apply, c.aux);
    EXPECT_EQ(bd_err_get_category(&err), c.category) << "code " << c.aux;
  }
  auto err = bd_err_comp(BD_ERR_TYPE_lzma, BD_ERRC_patch_read, LZMA_DATA_ERROR,
                         BD_ERRC_decompress);
  EXPECT_EQ(bd_err_get_category(&err), BD_ERR_CATEGORY_compression);
  err = bd_err_comp(BD_ERR_TYPE_zlib, BD_ERRC_diff, -3, BD_ERRC_compress);
  EXPECT_EQ(bd_err_get_category(&err), BD_ERR_CATEGORY_compression);
}

TEST(Error, Messages) {
  auto err = bd_err_sub(BD_ERRC_verify, BD_ERRC_hash_mismatch);
  auto msgs = bd_err_get_msgs(&err);
  EXPECT_EQ(msgs.type, BD_ERR_TYPE_sub);
  ASSERT_NE(msgs.type_str, nullptr);
  ASSERT_NE(msgs.primary, nullptr);
  ASSERT_NE(msgs.auxiliary, nullptr);
  EXPECT_NE(std::string_view(msgs.primary), msgs.auxiliary);
  EXPECT_EQ(msgs.extra, nullptr);
  EXPECT_EQ(msgs.uri_type, nullptr);
  bd_err_release_msgs(&msgs);

  err = bd_err_comp(BD_ERR_TYPE_lzma, BD_ERRC_patch_read, LZMA_DATA_ERROR,
                    BD_ERRC_decompress);
  msgs = bd_err_get_msgs(&err);
  EXPECT_STREQ(msgs.type_str, "liblzma");
  ASSERT_NE(msgs.auxiliary, nullptr);
  ASSERT_NE(msgs.extra, nullptr);
  bd_err_release_msgs(&msgs);
}

TEST(Error, OsErrorWithPath) {
  bd_err err{.type = BD_ERR_TYPE_os,
             .primary = BD_ERRC_walk,
             .auxiliary = ENOENT,
             .extra = BD_ERR_IO_TYPE_open,
             .uri = strdup("some/file")};
  EXPECT_EQ(bd_err_get_category(&err), BD_ERR_CATEGORY_io);
  auto msgs = bd_err_get_msgs(&err);
  EXPECT_STREQ(msgs.type_str, "OS");
  EXPECT_NE(msgs.auxiliary, nullptr);
  EXPECT_NE(msgs.extra, nullptr);
  EXPECT_NE(msgs.uri_type, nullptr);
  bd_err_release_msgs(&msgs);
  EXPECT_EQ(msgs.auxiliary, nullptr);
  bd_err_release(&err);
  EXPECT_EQ(err.uri, nullptr);
  // Releasing twice is harmless
  bd_err_release(&err);
}

TEST(Error, Version) {
  const std::string_view version = bd_version();
  EXPECT_FALSE(version.empty());
  EXPECT_NE(version.find('.'), std::string_view::npos);
}

} // namespace
} // namespace blockdelta
