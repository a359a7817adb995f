//===-- signature.cpp - signature computation and codec -------------------===//
//
// Copyright (c) 2025 Nuclearist <nuclearist@teknology-hub.com>
// Part of blockdelta, under the GNU General Public License v3.0 or later
// See COPYING in the project root for license information.
// SPDX-License-Identifier: GPL-3.0-or-later
//
//===----------------------------------------------------------------------===//
///
/// @file
/// Implementation of signature functions.
///
/// Signature stream layout:
///    `"BSIG" | SignatureHeader | compressed[Container | BlockHash*]`,
///    with block hashes of all files in container order.
///
//===----------------------------------------------------------------------===//
#include "signature.hpp"

#include "blockdelta/base.h"
#include "blockdelta/content.h"
#include "blockdelta/content/container.pb.h"
#include "blockdelta/content/signature.pb.h"
#include "blockdelta/error.h"
#include "blockdelta/os.h"
#include "common/error.h"
#include "comp.hpp"
#include "container.hpp"
#include "hash.hpp"
#include "os.h"
#include "stream.hpp"
#include "wire.hpp"

#include <algorithm>
#include <atomic>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <functional>
#include <google/protobuf/arena.h>
#include <mutex>
#include <span>
#include <system_error>
#include <thread>
#include <vector>

namespace blockdelta::content {

namespace {

//===-- Private types -----------------------------------------------------===//

/// Parallel signature computation context, shared by worker threads.
struct compute_ctx {
  /// Signature being computed.
  bd_signature &sig;
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
  /// Mutex guarding @ref err and @ref done.
  std::mutex mtx;
  /// The first error encountered by a worker.
  bd_err err;
  /// Number of bytes hashed so far.
  std::int64_t done;

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

  /// Add hashed bytes to the progress and report it.
  void report(std::int64_t num_bytes) {
    if (!progress) {
      return;
    }
    const std::scoped_lock lock(mtx);
    done += num_bytes;
    progress(progress_data, done, sig.container.size);
  }
};

/// Signature tree writing context, passed to @ref bd_sig_compute_stream
///    callbacks.
struct write_tree_ctx {
  /// Writer receiving block hashes.
  sig_writer &writer;
  /// Optional pointer to the user's progress callback.
  bd_progress_func *_Nullable progress;
  /// User data pointer passed to @ref progress.
  void *_Nullable progress_data;
};

//===-- Private functions -------------------------------------------------===//

/// Worker thread procedure for @ref bd_sig_compute.
///
/// @param [in, out] ctx
///    Shared computation context.
static void compute_worker(compute_ctx &ctx) {
  hash::file_hasher hasher(ctx.sig.block_size, BD_ERRC_sig_compute);
  auto res = hasher.init();
  if (!bd_err_success(&res)) {
    ctx.fail(res);
    return;
  }
  const auto &ct = ctx.sig.container;
  while (!ctx.abort.load(std::memory_order::relaxed)) {
    const int file_index = ctx.next_file.fetch_add(1, std::memory_order::relaxed);
    if (file_index >= ct.num_files) {
      return;
    }
    const auto &file = ct.files[file_index];
    // hashes is null when no file has data
    const auto hashes = ctx.sig.hashes + ctx.sig.file_hash_offsets[file_index];
    res = hasher.hash_file(
        ctx.root_handle, file.path, file.size,
        [hashes](std::int64_t block_index, const bd_block_hash &hash) {
          hashes[block_index] = hash;
          return bd_err_ok();
        },
        [&ctx](std::int64_t num_bytes) { ctx.report(num_bytes); });
    if (!bd_err_success(&res)) {
      ctx.fail(res);
      return;
    }
  }
}

/// @ref bd_block_hash_func for @ref bd_sig_write_tree.
static bd_err write_tree_hash(void *_Nullable data, int, std::int64_t,
                              const bd_block_hash *_Nonnull hash) {
  return static_cast<write_tree_ctx *>(data)->writer.write(*hash);
}

/// @ref bd_progress_func for @ref bd_sig_write_tree, forwarding to the user's
///    callback.
static void write_tree_progress(void *_Nullable data, std::int64_t current,
                                std::int64_t total) {
  const auto &ctx = *static_cast<write_tree_ctx *>(data);
  ctx.progress(ctx.progress_data, current, total);
}

/// Read a signature stream.
///
/// @param [in, out] source
///    Source to read from.
/// @param [out] sig
///    Receives the signature. On failure it may be partially filled.
/// @return A @ref bd_err indicating the result of operation.
static bd_err read_sig(io::source &source, bd_signature &sig) {
  if (const auto res =
          wire::read_magic(source, wire::sig_magic, BD_ERRC_sig_read);
      !bd_err_success(&res)) {
    return res;
  }
  google::protobuf::Arena arena;
  auto &hdr = *google::protobuf::Arena::Create<SignatureHeader>(&arena);
  if (const auto res = wire::read_header(source, hdr, BD_ERRC_sig_read);
      !bd_err_success(&res)) {
    return res;
  }
  if (const auto res = wire::comp_from_proto(hdr.compression(),
                                             sig.compression, BD_ERRC_sig_read);
      !bd_err_success(&res)) {
    return res;
  }
  if (!valid_block_size(hdr.block_size())) {
    return bd_err_sub(BD_ERRC_sig_read, BD_ERRC_invalid_data);
  }
  sig.block_size = hdr.block_size();
  wire::msg_reader reader;
  if (const auto res =
          reader.open(source, sig.compression.algo, BD_ERRC_sig_read);
      !bd_err_success(&res)) {
    return res;
  }
  {
    auto &ct_msg = *google::protobuf::Arena::Create<Container>(&arena);
    if (const auto res = reader.read(ct_msg); !bd_err_success(&res)) {
      return res;
    }
    if (const auto res =
            ct_from_proto(ct_msg, sig.container, BD_ERRC_sig_read);
        !bd_err_success(&res)) {
      return res;
    }
  }
  if (const auto res = sig_alloc(sig, BD_ERRC_sig_read);
      !bd_err_success(&res)) {
    return res;
  }
  auto &hash_msg = *google::protobuf::Arena::Create<BlockHash>(&arena);
  for (auto &hash : std::span(sig.hashes, sig.num_hashes)) {
    if (const auto res = reader.read(hash_msg); !bd_err_success(&res)) {
      return res;
    }
    if (hash_msg.strong().length() != hash::strong_size) {
      return bd_err_sub(BD_ERRC_sig_read, BD_ERRC_invalid_data);
    }
    hash.weak = hash_msg.weak();
    std::memcpy(hash.strong, hash_msg.strong().data(), hash::strong_size);
  }
  return reader.finish();
}

} // namespace

//===-- Internal functions ------------------------------------------------===//

bd_err sig_alloc(bd_signature &sig, bd_errc prim) {
  const auto &ct = sig.container;
  std::int64_t num_hashes = 0;
  for (const auto &file : std::span(ct.files, ct.num_files)) {
    num_hashes += num_blocks(file.size, sig.block_size);
  }
  const auto buf = std::malloc(sizeof(std::int64_t) * (ct.num_files + 1) +
                               sizeof(bd_block_hash) * num_hashes);
  if (!buf) {
    return bd_err_sub(prim, BD_ERRC_mem_alloc);
  }
  sig.buf = buf;
  sig.file_hash_offsets = static_cast<std::int64_t *>(buf);
  sig.hashes = num_hashes ? reinterpret_cast<bd_block_hash *>(
                                sig.file_hash_offsets + ct.num_files + 1)
                          : nullptr;
  sig.num_hashes = num_hashes;
  std::int64_t offset = 0;
  for (int i = 0; i < ct.num_files; ++i) {
    sig.file_hash_offsets[i] = offset;
    offset += num_blocks(ct.files[i].size, sig.block_size);
  }
  sig.file_hash_offsets[ct.num_files] = offset;
  return bd_err_ok();
}

//===-- sig_writer --------------------------------------------------------===//

bd_err sig_writer::open(const bd_container &ct, int block_size,
                        const bd_comp_settings &compression) {
  if (const auto res = comp::check_settings(compression, prim);
      !bd_err_success(&res)) {
    return res;
  }
  if (!valid_block_size(block_size)) {
    return bd_err_sub(prim, BD_ERRC_invalid_arg);
  }
  if (const auto res = wire::write_magic(sink, wire::sig_magic);
      !bd_err_success(&res)) {
    return res;
  }
  google::protobuf::Arena arena;
  auto &hdr = *google::protobuf::Arena::Create<SignatureHeader>(&arena);
  wire::comp_to_proto(compression, *hdr.mutable_compression());
  hdr.set_block_size(block_size);
  if (const auto res = wire::write_header(sink, hdr, prim);
      !bd_err_success(&res)) {
    return res;
  }
  if (const auto res = writer.open(sink, compression, prim);
      !bd_err_success(&res)) {
    return res;
  }
  auto &ct_msg = *google::protobuf::Arena::Create<Container>(&arena);
  ct_to_proto(ct, ct_msg);
  return writer.write(ct_msg);
}

bd_err sig_writer::write(const bd_block_hash &hash) {
  msg.set_weak(hash.weak);
  msg.set_strong(hash.strong, hash::strong_size);
  return writer.write(msg);
}

bd_err sig_writer::finish() {
  if (const auto res = writer.finish(); !bd_err_success(&res)) {
    return res;
  }
  return sink.flush() ? bd_err_ok() : sink.error;
}

} // namespace blockdelta::content

//===-- Public functions --------------------------------------------------===//

using namespace blockdelta;
using namespace blockdelta::content;

extern "C" {

bd_err bd_sig_compute(const bd_container *ct, const char *path, int block_size,
                      int num_threads, bd_progress_func *progress, void *data,
                      bd_signature *sig) {
  *sig = {};
  if (!block_size) {
    block_size = BD_DEFAULT_BLOCK_SIZE;
  }
  if (!valid_block_size(block_size) || num_threads < 0) {
    return bd_err_sub(BD_ERRC_sig_compute, BD_ERRC_invalid_arg);
  }
  if (const auto res = ct_copy(*ct, sig->container, BD_ERRC_sig_compute);
      !bd_err_success(&res)) {
    return res;
  }
  sig->compression = bd_comp_default();
  sig->block_size = block_size;
  if (const auto res = sig_alloc(*sig, BD_ERRC_sig_compute);
      !bd_err_success(&res)) {
    bd_sig_free(sig);
    return res;
  }
  if (!ct->num_files) {
    return bd_err_ok();
  }
  const auto root_handle = bdi_os_dir_open(path);
  if (root_handle == BD_OS_INVALID_HANDLE) {
    bd_sig_free(sig);
    return bdi_os_io_err_at(BDI_OS_CWD_HANDLE, path, BD_ERRC_sig_compute,
                            bdi_os_get_last_error(), BD_ERR_IO_TYPE_open);
  }
  compute_ctx ctx{.sig = *sig,
                  .root_handle = root_handle,
                  .progress = progress,
                  .progress_data = data,
                  .next_file = 0,
                  .abort = false,
                  .mtx = {},
                  .err = bd_err_ok(),
                  .done = 0};
  const int num_workers = std::min(
      num_threads ? num_threads : bdi_os_get_nproc(), ct->num_files);
  std::vector<std::thread> threads;
  try {
    threads.reserve(num_workers - 1);
    for (int i = 1; i < num_workers; ++i) {
      threads.emplace_back(compute_worker, std::ref(ctx));
    }
  } catch (const std::system_error &) {
    auto err = bd_err_sub(BD_ERRC_sig_compute, BD_ERRC_wt_start);
    ctx.fail(err);
  }
  // The calling thread is a worker too
  compute_worker(ctx);
  for (auto &thread : threads) {
    thread.join();
  }
  bdi_os_close_handle(root_handle);
  if (!bd_err_success(&ctx.err)) {
    bd_sig_free(sig);
    return ctx.err;
  }
  return bd_err_ok();
}

bd_err bd_sig_compute_stream(const bd_container *ct, const char *path,
                             int block_size, bd_block_hash_func *on_hash,
                             bd_progress_func *progress, void *data) {
  if (!block_size) {
    block_size = BD_DEFAULT_BLOCK_SIZE;
  }
  if (!valid_block_size(block_size)) {
    return bd_err_sub(BD_ERRC_sig_compute, BD_ERRC_invalid_arg);
  }
  if (!ct->num_files) {
    return bd_err_ok();
  }
  hash::file_hasher hasher(block_size, BD_ERRC_sig_compute);
  if (const auto res = hasher.init(); !bd_err_success(&res)) {
    return res;
  }
  const auto root_handle = bdi_os_dir_open(path);
  if (root_handle == BD_OS_INVALID_HANDLE) {
    return bdi_os_io_err_at(BDI_OS_CWD_HANDLE, path, BD_ERRC_sig_compute,
                            bdi_os_get_last_error(), BD_ERR_IO_TYPE_open);
  }
  std::int64_t done = 0;
  auto res = bd_err_ok();
  for (int i = 0; i < ct->num_files; ++i) {
    const auto &file = ct->files[i];
    res = hasher.hash_file(
        root_handle, file.path, file.size,
        [on_hash, data, i](std::int64_t block_index,
                           const bd_block_hash &hash) {
          return on_hash(data, i, block_index, &hash);
        },
        [progress, data, &done, ct](std::int64_t num_bytes) {
          if (progress) {
            done += num_bytes;
            progress(data, done, ct->size);
          }
        });
    if (!bd_err_success(&res)) {
      break;
    }
  }
  bdi_os_close_handle(root_handle);
  return res;
}

bd_err bd_sig_write(const bd_signature *sig, int handle, int64_t *size) {
  sig_writer writer(handle, BD_ERRC_sig_write);
  if (const auto res =
          writer.open(sig->container, sig->block_size, sig->compression);
      !bd_err_success(&res)) {
    return res;
  }
  for (const auto &hash : std::span(sig->hashes, sig->num_hashes)) {
    if (const auto res = writer.write(hash); !bd_err_success(&res)) {
      return res;
    }
  }
  if (const auto res = writer.finish(); !bd_err_success(&res)) {
    return res;
  }
  if (size) {
    *size = writer.size();
  }
  return bd_err_ok();
}

bd_err bd_sig_write_tree(const bd_container *ct, const char *path,
                         int block_size, bd_comp_settings compression,
                         int handle, bd_progress_func *progress, void *data,
                         int64_t *size) {
  if (!block_size) {
    block_size = BD_DEFAULT_BLOCK_SIZE;
  }
  sig_writer writer(handle, BD_ERRC_sig_write);
  if (const auto res = writer.open(*ct, block_size, compression);
      !bd_err_success(&res)) {
    return res;
  }
  write_tree_ctx ctx{
      .writer = writer, .progress = progress, .progress_data = data};
  if (const auto res = bd_sig_compute_stream(
          ct, path, block_size, write_tree_hash,
          progress ? write_tree_progress : nullptr, &ctx);
      !bd_err_success(&res)) {
    return res;
  }
  if (const auto res = writer.finish(); !bd_err_success(&res)) {
    return res;
  }
  if (size) {
    *size = writer.size();
  }
  return bd_err_ok();
}

bd_err bd_sig_read(int handle, bd_signature *sig) {
  *sig = {};
  io::file_source source(handle, BD_ERRC_sig_read);
  const auto res = read_sig(source, *sig);
  if (!bd_err_success(&res)) {
    bd_sig_free(sig);
  }
  return res;
}

void bd_sig_free(bd_signature *sig) {
  bd_ct_free(&sig->container);
  std::free(sig->buf);
  *sig = {};
}

} // extern "C"
