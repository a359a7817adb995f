//===-- apply.cpp - apply engine ------------------------------------------===//
//
// Copyright (c) 2025 Nuclearist <nuclearist@teknology-hub.com>
// Part of blockdelta, under the GNU General Public License v3.0 or later
// See COPYING in the project root for license information.
// SPDX-License-Identifier: GPL-3.0-or-later
//
//===----------------------------------------------------------------------===//
///
/// @file
/// Implementation of @ref bd_apply.
///
/// Output files are reconstructed in container order. When the output tree is
///    the target tree, every file is first reconstructed into a staging
///    directory inside it, and the tree is modified only after the last read
///    of target data has completed.
///
//===----------------------------------------------------------------------===//
#include "blockdelta/delta.h"

#include "blockdelta/content.h"
#include "blockdelta/content/patch.pb.h"
#include "blockdelta/error.h"
#include "blockdelta/os.h"
#include "common/error.h"
#include "comp.hpp"
#include "os.h"
#include "patch.hpp"

#include <algorithm>
#include <charconv>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <new>
#include <ranges>
#include <span>
#include <string.h>
#include <string_view>
#include <unordered_set>

namespace blockdelta::delta {

namespace {

/// Name prefix of the staging directory used for in-place application.
constexpr char stage_prefix[] = ".bd-stage-";

/// Size of the buffer for copying target data, in bytes.
constexpr std::size_t copy_buf_size = 0x100000;

/// Staged file name buffer, holding a file index in decimal.
struct staged_name {
  char buf[12];

  explicit staged_name(int file_index) {
    *std::to_chars(buf, buf + sizeof buf - 1, file_index).ptr = '\0';
  }
};

/// State of a single @ref bd_apply run.
class applier {
public:
  applier(const bd_apply_args &args, bd_apply_result &res)
      : args(args), result(res), reader(args.patch_handle, BD_ERRC_apply) {}
  ~applier() {
    close_target_file();
    if (out_file != BD_OS_INVALID_HANDLE) {
      bdi_os_close_handle(out_file);
    }
    if (stage_handle != BD_OS_INVALID_HANDLE) {
      // Remove whatever has been staged before the failure
      for (int i = 0; i < num_staged; ++i) {
        bdi_os_file_delete_at(stage_handle, staged_name(i).buf);
      }
      bdi_os_close_handle(stage_handle);
      bdi_os_dir_delete_at(out_handle, stage_name);
    }
    if (out_handle != BD_OS_INVALID_HANDLE) {
      bdi_os_close_handle(out_handle);
    }
    if (target_handle != BD_OS_INVALID_HANDLE) {
      bdi_os_close_handle(target_handle);
    }
    bd_ct_free(&target);
    bd_ct_free(&source);
  }

  bd_err run();

private:
  const bd_apply_args &args;
  bd_apply_result &result;
  patch_reader reader;
  bd_container target{};
  bd_container source{};
  bd_os_handle target_handle{BD_OS_INVALID_HANDLE};
  bd_os_handle out_handle{BD_OS_INVALID_HANDLE};
  /// Handle for the file being written.
  bd_os_handle out_file{BD_OS_INVALID_HANDLE};
  bd_os_handle stage_handle{BD_OS_INVALID_HANDLE};
  char stage_name[64];
  /// Number of files created in the staging directory.
  int num_staged{};
  /// Index of the target file that @ref target_file refers to, or `-1`.
  int target_index{-1};
  bd_os_handle target_file{BD_OS_INVALID_HANDLE};
  std::unique_ptr<unsigned char[]> copy_buf;
  /// Buffer for decompressed literal payloads.
  std::unique_ptr<unsigned char[]> lit_buf;
  std::size_t lit_buf_size{};
  /// Number of bytes written so far, for progress reporting.
  std::int64_t done{};

  void close_target_file() {
    if (target_file != BD_OS_INVALID_HANDLE) {
      bdi_os_close_handle(target_file);
      target_file = BD_OS_INVALID_HANDLE;
    }
    target_index = -1;
  }

  bd_err open_target_file(int file_index);
  bd_err write_data(std::span<const unsigned char> data);
  bd_err copy_range(int file_index, std::int64_t offset, std::int64_t len);
  bd_err write_file(int file_index, bd_os_handle dir_handle,
                    const char *_Nonnull name);
  bd_err create_dirs();
  bd_err create_symlinks();
  bd_err remove_stale();
  bd_err move_staged();
};

//===-- applier -----------------------------------------------------------===//

bd_err applier::run() {
  if (const auto res = reader.open(target, source); !bd_err_success(&res)) {
    return res;
  }
  if (!args.target_path &&
      (target.num_dirs || target.num_files || target.num_symlinks)) {
    return bd_err_sub(BD_ERRC_apply, BD_ERRC_target_missing);
  }
  const bool in_place =
      args.target_path && bdi_os_same_dir(args.target_path, args.output_path);
  if (in_place && !args.in_place) {
    return bd_err_sub(BD_ERRC_apply, BD_ERRC_inplace_not_allowed);
  }
  if (target.num_files) {
    target_handle = bdi_os_dir_open(args.target_path);
    if (target_handle == BD_OS_INVALID_HANDLE) {
      return bdi_os_io_err_at(BDI_OS_CWD_HANDLE, args.target_path,
                              BD_ERRC_apply, bdi_os_get_last_error(),
                              BD_ERR_IO_TYPE_open);
    }
  }
  out_handle = bdi_os_dir_create(args.output_path);
  if (out_handle == BD_OS_INVALID_HANDLE) {
    return bdi_os_io_err_at(BDI_OS_CWD_HANDLE, args.output_path, BD_ERRC_apply,
                            bdi_os_get_last_error(), BD_ERR_IO_TYPE_open);
  }
  copy_buf.reset(new (std::nothrow) unsigned char[copy_buf_size]);
  if (!copy_buf) {
    return bd_err_sub(BD_ERRC_apply, BD_ERRC_mem_alloc);
  }
  if (!in_place) {
    if (const auto res = create_dirs(); !bd_err_success(&res)) {
      return res;
    }
    for (int i = 0; i < source.num_files; ++i) {
      if (const auto res = write_file(i, out_handle, source.files[i].path);
          !bd_err_success(&res)) {
        return res;
      }
    }
    if (const auto res = reader.finish(); !bd_err_success(&res)) {
      return res;
    }
    close_target_file();
    if (const auto res = create_symlinks(); !bd_err_success(&res)) {
      return res;
    }
  } else {
    stage_handle = bdi_os_dir_create_unique_at(out_handle, stage_prefix,
                                               stage_name, sizeof stage_name);
    if (stage_handle == BD_OS_INVALID_HANDLE) {
      return bdi_os_io_err_at(out_handle, stage_prefix, BD_ERRC_apply,
                              bdi_os_get_last_error(), BD_ERR_IO_TYPE_open);
    }
    for (int i = 0; i < source.num_files; ++i) {
      num_staged = i + 1;
      if (const auto res = write_file(i, stage_handle, staged_name(i).buf);
          !bd_err_success(&res)) {
        return res;
      }
    }
    if (const auto res = reader.finish(); !bd_err_success(&res)) {
      return res;
    }
    // All target data has been read, the tree may be modified from here on
    close_target_file();
    if (const auto res = remove_stale(); !bd_err_success(&res)) {
      return res;
    }
    if (const auto res = create_dirs(); !bd_err_success(&res)) {
      return res;
    }
    if (const auto res = move_staged(); !bd_err_success(&res)) {
      return res;
    }
    if (const auto res = create_symlinks(); !bd_err_success(&res)) {
      return res;
    }
    bdi_os_close_handle(stage_handle);
    stage_handle = BD_OS_INVALID_HANDLE;
    if (!bdi_os_dir_delete_at(out_handle, stage_name)) {
      return bdi_os_io_err_at(out_handle, stage_name, BD_ERRC_apply,
                              bdi_os_get_last_error(), BD_ERR_IO_TYPE_delete);
    }
  }
  result.num_dirs = source.num_dirs;
  result.num_symlinks = source.num_symlinks;
  return bd_err_ok();
}

bd_err applier::open_target_file(int file_index) {
  if (file_index == target_index) {
    return bd_err_ok();
  }
  close_target_file();
  const auto &file = target.files[file_index];
  target_file = bdi_os_file_open_at(target_handle, file.path);
  if (target_file == BD_OS_INVALID_HANDLE) {
    return bdi_os_io_err_at(target_handle, file.path, BD_ERRC_apply,
                            bdi_os_get_last_error(), BD_ERR_IO_TYPE_open);
  }
  target_index = file_index;
  bdi_os_stat st;
  if (!bdi_os_file_stat(target_file, &st)) {
    return bdi_os_io_err(target_file, BD_ERRC_apply, bdi_os_get_last_error(),
                         BD_ERR_IO_TYPE_get_type);
  }
  if (st.size != file.size) {
    auto err = bd_err_sub(BD_ERRC_apply, BD_ERRC_size_mismatch);
    err.uri = strdup(file.path);
    return err;
  }
  return bd_err_ok();
}

bd_err applier::write_data(std::span<const unsigned char> data) {
  if (!bdi_os_file_write(out_file, data.data(), data.size())) {
    return bdi_os_io_err(out_file, BD_ERRC_apply, bdi_os_get_last_error(),
                         BD_ERR_IO_TYPE_write);
  }
  result.bytes_written += data.size();
  if (args.progress) {
    done += data.size();
    args.progress(args.progress_data, done, source.size);
  }
  return bd_err_ok();
}

bd_err applier::copy_range(int file_index, std::int64_t offset,
                           std::int64_t len) {
  if (const auto res = open_target_file(file_index); !bd_err_success(&res)) {
    return res;
  }
  while (len) {
    const auto chunk = static_cast<std::size_t>(
        std::min<std::int64_t>(len, copy_buf_size));
    if (!bdi_os_file_read_at(target_file, copy_buf.get(), chunk, offset)) {
      const auto errc = bdi_os_get_last_error();
      if (errc == BDI_OS_ERR_EOF) {
        // The file has been truncated after its size was checked
        auto err = bd_err_sub(BD_ERRC_apply, BD_ERRC_size_mismatch);
        err.uri = strdup(target.files[file_index].path);
        return err;
      }
      return bdi_os_io_err(target_file, BD_ERRC_apply, errc,
                           BD_ERR_IO_TYPE_read);
    }
    if (const auto res = write_data({copy_buf.get(), chunk});
        !bd_err_success(&res)) {
      return res;
    }
    offset += chunk;
    len -= chunk;
  }
  return bd_err_ok();
}

bd_err applier::write_file(int file_index, bd_os_handle dir_handle,
                           const char *name) {
  if (const auto res = reader.begin_file(file_index); !bd_err_success(&res)) {
    return res;
  }
  out_file = bdi_os_file_create_at(dir_handle, name);
  if (out_file == BD_OS_INVALID_HANDLE) {
    return bdi_os_io_err_at(dir_handle, name, BD_ERRC_apply,
                            bdi_os_get_last_error(), BD_ERR_IO_TYPE_open);
  }
  const auto algo = reader.compression().algo;
  for (;;) {
    const content::PatchOp *op;
    if (const auto res = reader.next_op(op); !bd_err_success(&res)) {
      return res;
    }
    if (!op) {
      break;
    }
    if (op->kind() == content::PATCH_OP_KIND_BLOCK_COPY) {
      if (const auto res =
              copy_range(op->file_index(), op->offset(), op->length());
          !bd_err_success(&res)) {
        return res;
      }
      continue;
    }
    // Untrusted length, the allocation may fail
    const auto len = static_cast<std::size_t>(op->length());
    if (len > lit_buf_size) {
      lit_buf.reset(new (std::nothrow) unsigned char[len]);
      if (!lit_buf) {
        lit_buf_size = 0;
        return bd_err_sub(BD_ERRC_apply, BD_ERRC_mem_alloc);
      }
      lit_buf_size = len;
    }
    const std::span<unsigned char> lit(lit_buf.get(), len);
    const auto &data = op->data();
    if (const auto res = comp::decompress(
            algo,
            {reinterpret_cast<const unsigned char *>(data.data()), data.size()},
            lit, BD_ERRC_apply);
        !bd_err_success(&res)) {
      return res;
    }
    if (const auto res = write_data(lit); !bd_err_success(&res)) {
      return res;
    }
  }
  if (!bdi_os_file_set_mode(out_file, source.files[file_index].mode)) {
    return bdi_os_io_err(out_file, BD_ERRC_apply, bdi_os_get_last_error(),
                         BD_ERR_IO_TYPE_apply_mode);
  }
  bdi_os_close_handle(out_file);
  out_file = BD_OS_INVALID_HANDLE;
  ++result.touched_files;
  return bd_err_ok();
}

bd_err applier::create_dirs() {
  for (const auto &dir : std::span(source.dirs, source.num_dirs)) {
    if (!bdi_os_dir_create_at(out_handle, dir.path, dir.mode)) {
      return bdi_os_io_err_at(out_handle, dir.path, BD_ERRC_apply,
                              bdi_os_get_last_error(), BD_ERR_IO_TYPE_open);
    }
  }
  return bd_err_ok();
}

bd_err applier::create_symlinks() {
  for (const auto &link : std::span(source.symlinks, source.num_symlinks)) {
    if (!bdi_os_file_delete_at(out_handle, link.path)) {
      if (const auto errc = bdi_os_get_last_error();
          errc != BDI_OS_ERR_FILE_NOT_FOUND) {
        return bdi_os_io_err_at(out_handle, link.path, BD_ERRC_apply, errc,
                                BD_ERR_IO_TYPE_delete);
      }
    }
    if (!bdi_os_symlink_at(link.target, out_handle, link.path)) {
      return bdi_os_io_err_at(out_handle, link.path, BD_ERRC_apply,
                              bdi_os_get_last_error(), BD_ERR_IO_TYPE_symlink);
    }
  }
  return bd_err_ok();
}

bd_err applier::remove_stale() {
  std::unordered_set<std::string_view> files;
  files.reserve(source.num_files);
  for (const auto &file : std::span(source.files, source.num_files)) {
    files.emplace(file.path);
  }
  std::unordered_set<std::string_view> symlinks;
  symlinks.reserve(source.num_symlinks);
  for (const auto &link : std::span(source.symlinks, source.num_symlinks)) {
    symlinks.emplace(link.path);
  }
  std::unordered_set<std::string_view> dirs;
  dirs.reserve(source.num_dirs);
  for (const auto &dir : std::span(source.dirs, source.num_dirs)) {
    dirs.emplace(dir.path);
  }
  for (const auto &file : std::span(target.files, target.num_files)) {
    if (!files.contains(file.path) &&
        !bdi_os_file_delete_at(out_handle, file.path)) {
      if (const auto errc = bdi_os_get_last_error();
          errc != BDI_OS_ERR_FILE_NOT_FOUND) {
        return bdi_os_io_err_at(out_handle, file.path, BD_ERRC_apply, errc,
                                BD_ERR_IO_TYPE_delete);
      }
    }
  }
  for (const auto &link : std::span(target.symlinks, target.num_symlinks)) {
    if (!symlinks.contains(link.path) &&
        !bdi_os_file_delete_at(out_handle, link.path)) {
      if (const auto errc = bdi_os_get_last_error();
          errc != BDI_OS_ERR_FILE_NOT_FOUND) {
        return bdi_os_io_err_at(out_handle, link.path, BD_ERRC_apply, errc,
                                BD_ERR_IO_TYPE_delete);
      }
    }
  }
  // Walk order lists parents before children, so deleting in reverse removes
  //    emptied subdirectories first
  for (const auto &dir :
       std::span(target.dirs, target.num_dirs) | std::views::reverse) {
    if (dirs.contains(dir.path) || bdi_os_dir_delete_at(out_handle, dir.path)) {
      continue;
    }
    if (const auto errc = bdi_os_get_last_error();
        errc != BDI_OS_ERR_DIR_NOT_EMPTY && errc != BDI_OS_ERR_FILE_NOT_FOUND) {
      return bdi_os_io_err_at(out_handle, dir.path, BD_ERRC_apply, errc,
                              BD_ERR_IO_TYPE_delete);
    }
  }
  return bd_err_ok();
}

bd_err applier::move_staged() {
  for (int i = 0; i < source.num_files; ++i) {
    const auto &file = source.files[i];
    if (!bdi_os_file_move(stage_handle, staged_name(i).buf, out_handle,
                          file.path)) {
      return bdi_os_io_err_at(out_handle, file.path, BD_ERRC_apply,
                              bdi_os_get_last_error(), BD_ERR_IO_TYPE_move);
    }
  }
  num_staged = 0;
  return bd_err_ok();
}

} // namespace

} // namespace blockdelta::delta

//===-- Public function ---------------------------------------------------===//

using namespace blockdelta::delta;

extern "C" bd_err bd_apply(const bd_apply_args *args, bd_apply_result *res) {
  *res = {};
  applier apply(*args, *res);
  return apply.run();
}
