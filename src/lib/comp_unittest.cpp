//===-- comp_unittest.cpp - compression stream tests ----------------------===//
//
// Copyright (c) 2025 Nuclearist <nuclearist@teknology-hub.com>
// Part of blockdelta, under the GNU General Public License v3.0 or later
// See COPYING in the project root for license information.
// SPDX-License-Identifier: GPL-3.0-or-later
//
//===----------------------------------------------------------------------===//
#include "comp.hpp"

#include "blockdelta/content.h"
#include "blockdelta/content/container.pb.h"
#include "blockdelta/error.h"
#include "stream.hpp"
#include "test_util.hpp"
#include "wire.hpp"

#include <algorithm>
#include <gtest/gtest.h>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace blockdelta::comp {
namespace {

std::span<const unsigned char> bytes(const std::string &str) {
  return {reinterpret_cast<const unsigned char *>(str.data()), str.size()};
}

/// Text-like data that compresses well.
std::string compressible(std::size_t size) {
  static constexpr std::string_view line =
      "The quick brown fox jumps over the lazy dog. 0123456789\n";
  std::string data;
  data.reserve(size + line.size());
  while (data.size() < size) {
    data.append(line);
  }
  data.resize(size);
  return data;
}

class CompRoundTrip : public testing::TestWithParam<bd_comp_settings> {};

TEST_P(CompRoundTrip, BufferRoundTrip) {
  const auto settings = GetParam();
  if (!bd_comp_supported(settings.algo)) {
    GTEST_SKIP() << "algorithm is not supported by this build";
  }
  ASSERT_TRUE([&] {
    const auto res = check_settings(settings, BD_ERRC_diff);
    return bd_err_success(&res);
  }());
  for (const auto &data :
       {std::string{}, compressible(200000), test::random_bytes(70000, 9)}) {
    std::vector<unsigned char> packed;
    auto res = compress(settings, bytes(data), packed, BD_ERRC_diff);
    ASSERT_TRUE(bd_err_success(&res)) << test::describe(res);
    if (settings.algo != BD_COMP_ALGO_none && data.size() == 200000) {
      EXPECT_LT(packed.size(), data.size() / 4);
    }
    std::vector<unsigned char> unpacked(data.size());
    res = decompress(settings.algo, packed, unpacked, BD_ERRC_apply);
    ASSERT_TRUE(bd_err_success(&res)) << test::describe(res);
    EXPECT_TRUE(std::equal(unpacked.begin(), unpacked.end(),
                           bytes(data).begin()));
  }
}

TEST_P(CompRoundTrip, MessageStreamRoundTrip) {
  const auto settings = GetParam();
  if (!bd_comp_supported(settings.algo)) {
    GTEST_SKIP() << "algorithm is not supported by this build";
  }
  io::mem_sink sink(BD_ERRC_sig_write);
  {
    wire::msg_writer writer;
    auto res = writer.open(sink, settings, BD_ERRC_sig_write);
    ASSERT_TRUE(bd_err_success(&res)) << test::describe(res);
    content::ContainerFile entry;
    for (int i = 0; i < 1000; ++i) {
      entry.set_path("dir/file_" + std::to_string(i));
      entry.set_size(i * 100);
      res = writer.write(entry);
      ASSERT_TRUE(bd_err_success(&res)) << test::describe(res);
    }
    res = writer.finish();
    ASSERT_TRUE(bd_err_success(&res)) << test::describe(res);
  }
  io::mem_source source(sink.data, BD_ERRC_sig_read);
  wire::msg_reader reader;
  auto res = reader.open(source, settings.algo, BD_ERRC_sig_read);
  ASSERT_TRUE(bd_err_success(&res)) << test::describe(res);
  content::ContainerFile entry;
  for (int i = 0; i < 1000; ++i) {
    res = reader.read(entry);
    ASSERT_TRUE(bd_err_success(&res)) << test::describe(res);
    EXPECT_EQ(entry.path(), "dir/file_" + std::to_string(i));
    EXPECT_EQ(entry.size(), i * 100);
  }
  res = reader.finish();
  EXPECT_TRUE(bd_err_success(&res)) << test::describe(res);
}

TEST(Comp, MessageStreamDefaultFields) {
  io::mem_sink sink(BD_ERRC_sig_write);
  {
    wire::msg_writer writer;
    auto res = writer.open(sink, {.algo = BD_COMP_ALGO_deflate, .quality = 6},
                           BD_ERRC_sig_write);
    ASSERT_TRUE(bd_err_success(&res)) << test::describe(res);
    content::ContainerFile entry;
    entry.set_path("first");
    entry.set_size(4096);
    res = writer.write(entry);
    ASSERT_TRUE(bd_err_success(&res)) << test::describe(res);
    // All fields at their defaults, so the encoded message is empty
    res = writer.write(content::ContainerFile{});
    ASSERT_TRUE(bd_err_success(&res)) << test::describe(res);
    entry.clear_path();
    entry.set_size(7);
    res = writer.write(entry);
    ASSERT_TRUE(bd_err_success(&res)) << test::describe(res);
    res = writer.finish();
    ASSERT_TRUE(bd_err_success(&res)) << test::describe(res);
  }
  io::mem_source source(sink.data, BD_ERRC_sig_read);
  wire::msg_reader reader;
  auto res = reader.open(source, BD_COMP_ALGO_deflate, BD_ERRC_sig_read);
  ASSERT_TRUE(bd_err_success(&res)) << test::describe(res);
  content::ContainerFile entry;
  res = reader.read(entry);
  ASSERT_TRUE(bd_err_success(&res)) << test::describe(res);
  EXPECT_EQ(entry.path(), "first");
  EXPECT_EQ(entry.size(), 4096);
  res = reader.read(entry);
  ASSERT_TRUE(bd_err_success(&res)) << test::describe(res);
  EXPECT_EQ(entry.path(), "");
  EXPECT_EQ(entry.size(), 0);
  res = reader.read(entry);
  ASSERT_TRUE(bd_err_success(&res)) << test::describe(res);
  EXPECT_EQ(entry.path(), "");
  EXPECT_EQ(entry.size(), 7);
  res = reader.finish();
  EXPECT_TRUE(bd_err_success(&res)) << test::describe(res);
}

constexpr bd_comp_settings round_trip_settings[]{
    {.algo = BD_COMP_ALGO_none, .quality = 0},
    {.algo = BD_COMP_ALGO_deflate, .quality = 1},
    {.algo = BD_COMP_ALGO_deflate, .quality = 9},
    {.algo = BD_COMP_ALGO_lzma, .quality = 6},
    {.algo = BD_COMP_ALGO_zstd, .quality = 3}};

std::string
settings_name(const testing::TestParamInfo<bd_comp_settings> &info) {
  static constexpr const char *names[]{"none", "deflate", "lzma", "zstd"};
  return std::string(names[info.param.algo]) + "_" +
         std::to_string(info.param.quality);
}

INSTANTIATE_TEST_SUITE_P(Algorithms, CompRoundTrip,
                         testing::ValuesIn(round_trip_settings),
                         settings_name);

class CompCorruption : public testing::TestWithParam<bd_comp_algo> {};

TEST_P(CompCorruption, FlippedByteIsDetected) {
  const bd_comp_settings settings{.algo = GetParam(), .quality = 6};
  const auto data = compressible(100000);
  std::vector<unsigned char> packed;
  auto res = compress(settings, bytes(data), packed, BD_ERRC_diff);
  ASSERT_TRUE(bd_err_success(&res)) << test::describe(res);
  ASSERT_GT(packed.size(), 32u);
  packed[packed.size() / 2] ^= 0x55;
  std::vector<unsigned char> unpacked(data.size());
  res = decompress(settings.algo, packed, unpacked, BD_ERRC_apply);
  EXPECT_FALSE(bd_err_success(&res));
  bd_err_release(&res);
}

TEST_P(CompCorruption, TruncationIsDetected) {
  const bd_comp_settings settings{.algo = GetParam(), .quality = 6};
  const auto data = compressible(100000);
  std::vector<unsigned char> packed;
  auto res = compress(settings, bytes(data), packed, BD_ERRC_diff);
  ASSERT_TRUE(bd_err_success(&res)) << test::describe(res);
  packed.resize(packed.size() - 8);
  std::vector<unsigned char> unpacked(data.size());
  res = decompress(settings.algo, packed, unpacked, BD_ERRC_apply);
  EXPECT_FALSE(bd_err_success(&res));
  bd_err_release(&res);
}

INSTANTIATE_TEST_SUITE_P(Algorithms, CompCorruption,
                         testing::Values(BD_COMP_ALGO_deflate,
                                         BD_COMP_ALGO_lzma));

TEST(Comp, SizeMismatchIsDetected) {
  const auto data = compressible(5000);
  std::vector<unsigned char> packed;
  auto res = compress(bd_comp_default(), bytes(data), packed, BD_ERRC_diff);
  ASSERT_TRUE(bd_err_success(&res)) << test::describe(res);
  std::vector<unsigned char> shorter(data.size() - 1);
  res = decompress(BD_COMP_ALGO_deflate, packed, shorter, BD_ERRC_apply);
  EXPECT_EQ(res.type, BD_ERR_TYPE_sub);
  EXPECT_EQ(res.auxiliary, BD_ERRC_invalid_data);
  std::vector<unsigned char> longer(data.size() + 1);
  res = decompress(BD_COMP_ALGO_deflate, packed, longer, BD_ERRC_apply);
  EXPECT_EQ(res.type, BD_ERR_TYPE_sub);
  EXPECT_EQ(res.auxiliary, BD_ERRC_invalid_data);
  res = decompress(BD_COMP_ALGO_none, packed, shorter, BD_ERRC_apply);
  EXPECT_FALSE(bd_err_success(&res));
}

TEST(Comp, SettingsValidation) {
  auto res = check_settings({.algo = BD_COMP_ALGO_deflate, .quality = 0},
                            BD_ERRC_diff);
  EXPECT_EQ(res.auxiliary, BD_ERRC_invalid_arg);
  EXPECT_EQ(bd_err_get_category(&res), BD_ERR_CATEGORY_precondition);
  res = check_settings({.algo = BD_COMP_ALGO_lzma, .quality = 10},
                       BD_ERRC_diff);
  EXPECT_EQ(res.auxiliary, BD_ERRC_invalid_arg);
  res = check_settings({.algo = BD_COMP_ALGO_zstd, .quality = 3},
                       BD_ERRC_diff);
  if (bd_comp_supported(BD_COMP_ALGO_zstd)) {
    EXPECT_TRUE(bd_err_success(&res)) << test::describe(res);
  } else {
    EXPECT_EQ(res.auxiliary, BD_ERRC_unknown_comp);
    EXPECT_EQ(bd_err_get_category(&res), BD_ERR_CATEGORY_compression);
  }
  // Unknown values are only representable on the wire
  content::CompressionSettings msg;
  msg.set_algorithm(static_cast<content::CompressionAlgorithm>(9));
  msg.set_quality(1);
  bd_comp_settings settings;
  res = wire::comp_from_proto(msg, settings, BD_ERRC_sig_read);
  EXPECT_EQ(res.primary, BD_ERRC_sig_read);
  EXPECT_EQ(res.auxiliary, BD_ERRC_unknown_comp);
  EXPECT_EQ(bd_err_get_category(&res), BD_ERR_CATEGORY_compression);
  EXPECT_TRUE(bd_comp_supported(BD_COMP_ALGO_none));
  EXPECT_TRUE(bd_comp_supported(BD_COMP_ALGO_deflate));
  EXPECT_TRUE(bd_comp_supported(BD_COMP_ALGO_lzma));
}

} // namespace
} // namespace blockdelta::comp
