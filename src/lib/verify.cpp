//===-- verify.cpp - verify engine ----------------------------------------===//
//
// Copyright (c) 2025 Nuclearist <nuclearist@teknology-hub.com>
// Part of blockdelta, under the GNU General Public License v3.0 or later
// See COPYING in the project root for license information.
// SPDX-License-Identifier: GPL-3.0-or-later
//
//===----------------------------------------------------------------------===//
///
/// @file
/// Implementation of @ref bd_verify.
///
//===----------------------------------------------------------------------===//
#include "blockdelta/delta.h"

#include "blockdelta/base.h"
#include "blockdelta/content.h"
#include "blockdelta/error.h"
#include "blockdelta/os.h"
#include "common/error.h"
#include "hash.hpp"
#include "os.h"

#include <algorithm>
#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <system_error>
#include <thread>
#include <vector>

namespace blockdelta::delta {

namespace {

/// Parallel verification context, shared by worker threads.
struct verify_ctx {
  /// Reference signature.
  const bd_signature &ref;
  /// Handle for the tree's root directory.
  bd_os_handle root_handle;
  /// Optional pointer to the progress callback.
  bd_progress_func *_Nullable progress;
  /// User data pointer passed to @ref progress.
  void *_Nullable progress_data;
  /// Index of the next file to be picked up by a worker.
  std::atomic_int next_file;
  /// Value indicating whether workers should stop.
  std::atomic_bool abort;
  /// Total number of mismatching blocks.
  std::atomic_int64_t num_mismatches;
  /// Mutex guarding @ref err, @ref done and the first mismatch position.
  std::mutex mtx;
  /// The first error encountered by a worker.
  bd_err err;
  /// Number of bytes hashed so far.
  std::int64_t done;
  /// File index of the first mismatch, or `-1`.
  int first_file;
  /// Block index of the first mismatch, or `-1`.
  std::int64_t first_block;

  /// Record a worker error, keeping only the first one.
  void fail(bd_err &res) {
    const std::scoped_lock lock(mtx);
    if (bd_err_success(&err)) {
      err = res;
    } else {
      bd_err_release(&res);
    }
    abort.store(true, std::memory_order::relaxed);
  }

  /// Record mismatches of a file.
  void mismatch(int file_index, std::int64_t block_index,
                std::int64_t count) {
    num_mismatches.fetch_add(count, std::memory_order::relaxed);
    const std::scoped_lock lock(mtx);
    if (first_file < 0 || file_index < first_file ||
        (file_index == first_file && block_index < first_block)) {
      first_file = file_index;
      first_block = block_index;
    }
  }

  /// Add hashed bytes to the progress and report it.
  void report(std::int64_t num_bytes) {
    if (!progress) {
      return;
    }
    const std::scoped_lock lock(mtx);
    done += num_bytes;
    progress(progress_data, done, ref.container.size);
  }
};

/// Worker thread procedure for @ref bd_verify.
///
/// @param [in, out] ctx
///    Shared verification context.
static void verify_worker(verify_ctx &ctx) {
  hash::file_hasher hasher(ctx.ref.block_size, BD_ERRC_verify);
  auto res = hasher.init();
  if (!bd_err_success(&res)) {
    ctx.fail(res);
    return;
  }
  const auto &ct = ctx.ref.container;
  while (!ctx.abort.load(std::memory_order::relaxed)) {
    const int file_index =
        ctx.next_file.fetch_add(1, std::memory_order::relaxed);
    if (file_index >= ct.num_files) {
      return;
    }
    const auto ref_hashes =
        ctx.ref.hashes + ctx.ref.file_hash_offsets[file_index];
    const auto num_ref = bd_sig_num_file_blocks(&ctx.ref, file_index);
    std::int64_t num_actual = 0;
    std::int64_t num_bad = 0;
    std::int64_t first_bad = -1;
    // The file is hashed at whatever size it has now, blocks present on one
    //    side only are mismatches
    res = hasher.hash_file(
        ctx.root_handle, ct.files[file_index].path, -1,
        [&](std::int64_t block_index, const bd_block_hash &hash) {
          ++num_actual;
          if (block_index >= num_ref ||
              !hash::same_hash(hash, ref_hashes[block_index])) {
            if (first_bad < 0) {
              first_bad = block_index;
            }
            ++num_bad;
          }
          return bd_err_ok();
        },
        [&ctx](std::int64_t num_bytes) { ctx.report(num_bytes); });
    if (!bd_err_success(&res)) {
      ctx.fail(res);
      return;
    }
    if (num_actual < num_ref) {
      if (first_bad < 0) {
        first_bad = num_actual;
      }
      num_bad += num_ref - num_actual;
    }
    if (num_bad) {
      ctx.mismatch(file_index, first_bad, num_bad);
    }
  }
}

} // namespace

} // namespace blockdelta::delta

//===-- Public function ---------------------------------------------------===//

using namespace blockdelta;
using namespace blockdelta::delta;

extern "C" bd_err bd_verify(const bd_signature *ref, const char *path,
                            int num_threads, bd_progress_func *progress,
                            void *data, bd_verify_result *res) {
  *res = {.num_blocks = ref->num_hashes,
          .num_mismatches = 0,
          .first_file_index = -1,
          .first_block_index = -1};
  if (num_threads < 0) {
    return bd_err_sub(BD_ERRC_verify, BD_ERRC_invalid_arg);
  }
  if (!ref->container.num_files) {
    return bd_err_ok();
  }
  const auto root_handle = bdi_os_dir_open(path);
  if (root_handle == BD_OS_INVALID_HANDLE) {
    return bdi_os_io_err_at(BDI_OS_CWD_HANDLE, path, BD_ERRC_verify,
                            bdi_os_get_last_error(), BD_ERR_IO_TYPE_open);
  }
  verify_ctx ctx{.ref = *ref,
                 .root_handle = root_handle,
                 .progress = progress,
                 .progress_data = data,
                 .next_file = 0,
                 .abort = false,
                 .num_mismatches = 0,
                 .mtx = {},
                 .err = bd_err_ok(),
                 .done = 0,
                 .first_file = -1,
                 .first_block = -1};
  const int num_workers = std::min(
      num_threads ? num_threads : bdi_os_get_nproc(), ref->container.num_files);
  std::vector<std::thread> threads;
  try {
    threads.reserve(num_workers - 1);
    for (int i = 1; i < num_workers; ++i) {
      threads.emplace_back(verify_worker, std::ref(ctx));
    }
  } catch (const std::system_error &) {
    auto err = bd_err_sub(BD_ERRC_verify, BD_ERRC_wt_start);
    ctx.fail(err);
  }
  // The calling thread is a worker too
  verify_worker(ctx);
  for (auto &thread : threads) {
    thread.join();
  }
  bdi_os_close_handle(root_handle);
  if (!bd_err_success(&ctx.err)) {
    return ctx.err;
  }
  res->num_mismatches = ctx.num_mismatches.load(std::memory_order::relaxed);
  if (res->num_mismatches) {
    res->first_file_index = ctx.first_file;
    res->first_block_index = ctx.first_block;
    return bd_err_sub(BD_ERRC_verify, BD_ERRC_hash_mismatch);
  }
  return bd_err_ok();
}
