//===-- test_util.hpp - unit test helpers ---------------------------------===//
//
// Copyright (c) 2025 Nuclearist <nuclearist@teknology-hub.com>
// Part of blockdelta, under the GNU General Public License v3.0 or later
// See COPYING in the project root for license information.
// SPDX-License-Identifier: GPL-3.0-or-later
//
//===----------------------------------------------------------------------===//
///
/// @file
/// Fixture trees in temporary directories and wrappers around the public API
///    for unit tests.
///
//===----------------------------------------------------------------------===//
#pragma once

#include "blockdelta/content.h"
#include "blockdelta/delta.h"
#include "blockdelta/error.h"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <string_view>

namespace blockdelta::test {

/// Temporary directory removed with all its contents on destruction.
class temp_dir {
public:
  temp_dir();
  ~temp_dir();
  temp_dir(const temp_dir &) = delete;
  temp_dir &operator=(const temp_dir &) = delete;

  const std::filesystem::path &path() const noexcept { return root; }
  /// Get the path of an entry inside the directory.
  std::filesystem::path operator/(std::string_view rel) const {
    return root / rel;
  }

private:
  std::filesystem::path root;
};

/// Generate deterministic pseudo-random bytes.
std::string random_bytes(std::size_t size, std::uint32_t seed);

/// Write a file, creating missing parent directories.
void write_file(const std::filesystem::path &path, std::string_view data);

/// Read a whole file.
std::string read_file(const std::filesystem::path &path);

/// Describe a tree as a map from relative paths to `d`, `f:<contents>` or
///    `l:<target>` entries.
std::map<std::string, std::string> snapshot(const std::filesystem::path &root);

/// Walk a tree with the default filter.
bd_err walk(const std::filesystem::path &root, bd_container &ct);

/// Walk and hash a tree.
bd_err sign(const std::filesystem::path &root, int block_size, int num_threads,
            bd_signature &sig);

/// Optional settings of @ref diff_trees.
struct diff_opts {
  bd_comp_settings compression = bd_comp_default();
  int block_size = 1024;
  int max_literal_size = 0;
  /// Path to write the source signature to, empty to skip it.
  std::filesystem::path sig_path;
};

/// Diff two trees, writing the patch to specified path.
///
/// @param target
///    Root of the target tree, or `nullptr` for the null tree.
/// @param source
///    Root of the source tree.
/// @param patch_path
///    Path to the patch file to create.
/// @param [in] opts
///    Optional settings.
/// @param [out] stats
///    Receives diff statistics.
/// @return A @ref bd_err indicating the result of operation.
bd_err diff_trees(const std::filesystem::path *target,
                  const std::filesystem::path &source,
                  const std::filesystem::path &patch_path,
                  const diff_opts &opts, bd_diff_stats &stats);

/// Apply a patch file.
///
/// @param patch_path
///    Path to the patch file.
/// @param target
///    Root of the target tree, or `nullptr` for the null tree.
/// @param output
///    Root of the output tree.
/// @param in_place
///    Whether the output may be the target.
/// @param [out] res
///    Receives the apply result.
/// @return A @ref bd_err indicating the result of operation.
bd_err apply_patch(const std::filesystem::path &patch_path,
                   const std::filesystem::path *target,
                   const std::filesystem::path &output, bool in_place,
                   bd_apply_result &res);

/// Read a signature file.
bd_err read_sig(const std::filesystem::path &path, bd_signature &sig);

/// Read a patch file.
bd_err read_patch(const std::filesystem::path &path, bd_patch &patch);

/// Format an error for test failure messages.
std::string describe(const bd_err &err);

} // namespace blockdelta::test
