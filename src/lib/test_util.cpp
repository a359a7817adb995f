//===-- test_util.cpp - unit test helpers ---------------------------------===//
//
// Copyright (c) 2025 Nuclearist <nuclearist@teknology-hub.com>
// Part of blockdelta, under the GNU General Public License v3.0 or later
// See COPYING in the project root for license information.
// SPDX-License-Identifier: GPL-3.0-or-later
//
//===----------------------------------------------------------------------===//
///
/// @file
/// Implementation of unit test helpers.
///
//===----------------------------------------------------------------------===//
#include "test_util.hpp"

#include "blockdelta/content.h"
#include "blockdelta/delta.h"
#include "blockdelta/error.h"
#include "blockdelta/os.h"

#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <fcntl.h>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <map>
#include <random>
#include <stdexcept>
#include <string>
#include <system_error>
#include <unistd.h>

namespace blockdelta::test {

namespace fs = std::filesystem;

temp_dir::temp_dir() {
  auto tmpl = (fs::temp_directory_path() / "blockdelta-test-XXXXXX").string();
  if (!mkdtemp(tmpl.data())) {
    throw std::system_error(errno, std::generic_category(), "mkdtemp");
  }
  root = tmpl;
}

temp_dir::~temp_dir() {
  std::error_code ec;
  fs::remove_all(root, ec);
}

std::string random_bytes(std::size_t size, std::uint32_t seed) {
  std::mt19937 gen(seed);
  std::uniform_int_distribution<int> dist(0, 255);
  std::string data(size, '\0');
  for (auto &c : data) {
    c = static_cast<char>(dist(gen));
  }
  return data;
}

void write_file(const fs::path &path, std::string_view data) {
  fs::create_directories(path.parent_path());
  std::ofstream file(path, std::ios::binary | std::ios::trunc);
  if (!file) {
    throw std::runtime_error("Failed to create " + path.string());
  }
  file.write(data.data(), static_cast<std::streamsize>(data.size()));
}

std::string read_file(const fs::path &path) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    throw std::runtime_error("Failed to open " + path.string());
  }
  return {std::istreambuf_iterator<char>(file),
          std::istreambuf_iterator<char>()};
}

std::map<std::string, std::string> snapshot(const fs::path &root) {
  std::map<std::string, std::string> entries;
  for (const auto &entry : fs::recursive_directory_iterator(root)) {
    auto rel = entry.path().lexically_relative(root).generic_string();
    if (entry.is_symlink()) {
      entries.emplace(std::move(rel),
                      "l:" + fs::read_symlink(entry.path()).string());
    } else if (entry.is_directory()) {
      entries.emplace(std::move(rel), "d");
    } else {
      entries.emplace(std::move(rel), "f:" + read_file(entry.path()));
    }
  }
  return entries;
}

bd_err walk(const fs::path &root, bd_container &ct) {
  return bd_ct_walk(root.c_str(), bd_ct_default_filter, nullptr, &ct);
}

bd_err sign(const fs::path &root, int block_size, int num_threads,
            bd_signature &sig) {
  bd_container ct;
  if (const auto res = walk(root, ct); !bd_err_success(&res)) {
    return res;
  }
  const auto res = bd_sig_compute(&ct, root.c_str(), block_size, num_threads,
                                  nullptr, nullptr, &sig);
  bd_ct_free(&ct);
  return res;
}

bd_err diff_trees(const fs::path *target, const fs::path &source,
                  const fs::path &patch_path, const diff_opts &opts,
                  bd_diff_stats &stats) {
  bd_signature target_sig;
  if (target) {
    if (const auto res = sign(*target, opts.block_size, 0, target_sig);
        !bd_err_success(&res)) {
      return res;
    }
  }
  bd_container source_ct;
  if (const auto res = walk(source, source_ct); !bd_err_success(&res)) {
    if (target) {
      bd_sig_free(&target_sig);
    }
    return res;
  }
  const int patch_fd =
      open(patch_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
  const int sig_fd = opts.sig_path.empty()
                         ? BD_OS_INVALID_HANDLE
                         : open(opts.sig_path.c_str(),
                                O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
  const bd_diff_args args{.target_sig = target ? &target_sig : nullptr,
                          .source = &source_ct,
                          .source_path = source.c_str(),
                          .compression = opts.compression,
                          .block_size = opts.block_size,
                          .max_literal_size = opts.max_literal_size,
                          .patch_handle = patch_fd,
                          .sig_handle = sig_fd,
                          .progress = nullptr,
                          .progress_data = nullptr};
  const auto res = bd_diff(&args, &stats);
  if (sig_fd >= 0) {
    close(sig_fd);
  }
  if (patch_fd >= 0) {
    close(patch_fd);
  }
  bd_ct_free(&source_ct);
  if (target) {
    bd_sig_free(&target_sig);
  }
  return res;
}

bd_err apply_patch(const fs::path &patch_path, const fs::path *target,
                   const fs::path &output, bool in_place,
                   bd_apply_result &res) {
  const int patch_fd = open(patch_path.c_str(), O_RDONLY | O_CLOEXEC);
  const bd_apply_args args{.patch_handle = patch_fd,
                           .target_path = target ? target->c_str() : nullptr,
                           .output_path = output.c_str(),
                           .in_place = in_place,
                           .progress = nullptr,
                           .progress_data = nullptr};
  const auto err = bd_apply(&args, &res);
  if (patch_fd >= 0) {
    close(patch_fd);
  }
  return err;
}

bd_err read_sig(const fs::path &path, bd_signature &sig) {
  const int fd = open(path.c_str(), O_RDONLY | O_CLOEXEC);
  const auto res = bd_sig_read(fd, &sig);
  if (fd >= 0) {
    close(fd);
  }
  return res;
}

bd_err read_patch(const fs::path &path, bd_patch &patch) {
  const int fd = open(path.c_str(), O_RDONLY | O_CLOEXEC);
  const auto res = bd_patch_read(fd, &patch);
  if (fd >= 0) {
    close(fd);
  }
  return res;
}

std::string describe(const bd_err &err) {
  auto msgs = bd_err_get_msgs(&err);
  std::string str = msgs.type_str;
  str.append(": ").append(msgs.primary);
  if (msgs.auxiliary) {
    str.append(" / ").append(msgs.auxiliary);
  }
  if (msgs.extra) {
    str.append(" / ").append(msgs.extra);
  }
  if (err.uri) {
    str.append(" (").append(err.uri).append(")");
  }
  bd_err_release_msgs(&msgs);
  return str;
}

} // namespace blockdelta::test
