//===-- container.cpp - container walking and conversion ------------------===//
//
// Copyright (c) 2025 Nuclearist <nuclearist@teknology-hub.com>
// Part of blockdelta, under the GNU General Public License v3.0 or later
// See COPYING in the project root for license information.
// SPDX-License-Identifier: GPL-3.0-or-later
//
//===----------------------------------------------------------------------===//
///
/// @file
/// Implementation of @ref bd_ct_walk, @ref bd_ct_default_filter,
///    @ref bd_ct_free and internal container functions.
///
/// Containers are stored in a single allocation: file entries come first,
///    then directory and symbolic link entries, then all strings. Every entry
///    struct has 8-byte alignment, so no padding between arrays is needed.
///
//===----------------------------------------------------------------------===//
#include "container.hpp"

#include "blockdelta/content.h"
#include "blockdelta/content/container.pb.h"
#include "blockdelta/error.h"
#include "blockdelta/os.h"
#include "common/error.h"
#include "os.h"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <google/protobuf/arena.h>
#include <limits>
#include <memory>
#include <ranges>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace blockdelta::content {

namespace {

//===-- Private types -----------------------------------------------------===//

/// Directory walking context, shared across recursion levels of
///    @ref walk_dir.
struct walk_ctx {
  /// Optional pointer to the entry filter function.
  bd_ct_filter_func *_Nullable filter;
  /// User data pointer passed to @ref filter.
  void *_Nullable data;
  /// Container message receiving the entries.
  Container &msg;
  /// Relative path of the entry being processed.
  std::string path;
};

//===-- Private functions -------------------------------------------------===//

/// Directory listing callback that collects entry names into a vector.
static void collect_name(void *_Nullable data, const char *_Nonnull name) {
  static_cast<std::vector<std::string> *>(data)->emplace_back(name);
}

/// Recursively walk a directory and add its entries to the container message.
///
/// @param [in, out] ctx
///    Walking context to use.
/// @param handle
///    Handle for the directory to walk.
/// @return A @ref bd_err indicating the result of operation.
static bd_err walk_dir(walk_ctx &ctx, bd_os_handle handle) {
  std::vector<std::string> names;
  if (!bdi_os_dir_list(handle, collect_name, &names)) {
    return bdi_os_io_err(handle, BD_ERRC_walk, bdi_os_get_last_error(),
                         BD_ERR_IO_TYPE_list);
  }
  // std::string comparison is bytewise, with characters compared as unsigned
  std::ranges::sort(names);
  const auto prefix_len = ctx.path.length();
  for (const auto &name : names) {
    bdi_os_stat st;
    if (!bdi_os_stat_at(handle, name.data(), &st)) {
      return bdi_os_io_err_at(handle, name.data(), BD_ERRC_walk,
                              bdi_os_get_last_error(),
                              BD_ERR_IO_TYPE_get_type);
    }
    bd_ct_entry_type type;
    switch (st.type) {
    case BDI_OS_ENTRY_TYPE_dir:
      type = BD_CT_ENTRY_TYPE_dir;
      break;
    case BDI_OS_ENTRY_TYPE_file:
      type = BD_CT_ENTRY_TYPE_file;
      break;
    case BDI_OS_ENTRY_TYPE_symlink:
      type = BD_CT_ENTRY_TYPE_symlink;
      break;
    default:
      continue;
    }
    ctx.path.resize(prefix_len);
    if (prefix_len) {
      ctx.path.push_back('/');
    }
    ctx.path.append(name);
    if (ctx.filter && !ctx.filter(ctx.data, ctx.path.data(), name.data(), type)) {
      continue;
    }
    switch (type) {
    case BD_CT_ENTRY_TYPE_dir: {
      auto &dir = *ctx.msg.add_dirs();
      dir.set_path(ctx.path);
      dir.set_mode(st.mode);
      const auto subdir_handle = bdi_os_dir_open_at(handle, name.data());
      if (subdir_handle == BD_OS_INVALID_HANDLE) {
        return bdi_os_io_err_at(handle, name.data(), BD_ERRC_walk,
                                bdi_os_get_last_error(), BD_ERR_IO_TYPE_open);
      }
      const auto res = walk_dir(ctx, subdir_handle);
      bdi_os_close_handle(subdir_handle);
      if (!bd_err_success(&res)) {
        return res;
      }
      break;
    }
    case BD_CT_ENTRY_TYPE_file: {
      auto &file = *ctx.msg.add_files();
      file.set_path(ctx.path);
      file.set_size(st.size);
      file.set_offset(ctx.msg.size());
      file.set_mode(st.mode);
      ctx.msg.set_size(ctx.msg.size() + st.size);
      break;
    }
    case BD_CT_ENTRY_TYPE_symlink: {
      const std::unique_ptr<char, decltype(&std::free)> target(
          bdi_os_readlink_at(handle, name.data()), std::free);
      if (!target) {
        return bdi_os_io_err_at(handle, name.data(), BD_ERRC_walk,
                                bdi_os_get_last_error(),
                                BD_ERR_IO_TYPE_readlink);
      }
      auto &symlink = *ctx.msg.add_symlinks();
      symlink.set_path(ctx.path);
      symlink.set_target(target.get());
      symlink.set_mode(st.mode);
    }
    } // switch (type)
  } // for (names)
  ctx.path.resize(prefix_len);
  return bd_err_ok();
}

/// Check whether a path is a valid relative entry path: non-empty, without
///    null characters, and made of non-empty components other than `.` and
///    `..`.
static bool valid_path(std::string_view path) noexcept {
  if (path.empty() || path.find('\0') != std::string_view::npos) {
    return false;
  }
  for (const auto component : path | std::views::split('/')) {
    const std::string_view sv(component.begin(), component.end());
    if (sv.empty() || sv == "." || sv == "..") {
      return false;
    }
  }
  return true;
}

/// Allocate the buffer for a container and set its array pointers and counts.
///
/// @param [out] ct
///    Container to allocate the buffer for.
/// @param num_dirs
///    Number of directory entries.
/// @param num_files
///    Number of file entries.
/// @param num_symlinks
///    Number of symbolic link entries.
/// @param str_size
///    Total size of all strings including their terminators, in bytes.
/// @return Pointer to the beginning of the string area, or `nullptr` if
///    allocation fails.
static char *_Nullable ct_alloc(bd_container &ct, int num_dirs, int num_files,
                                int num_symlinks, std::size_t str_size) {
  const auto arrays_size = sizeof(bd_ct_file) * num_files +
                           sizeof(bd_ct_dir) * num_dirs +
                           sizeof(bd_ct_symlink) * num_symlinks;
  const auto buf =
      static_cast<unsigned char *>(std::malloc(arrays_size + str_size + 1));
  if (!buf) {
    return nullptr;
  }
  ct.buf = buf;
  ct.files = num_files ? reinterpret_cast<bd_ct_file *>(buf) : nullptr;
  ct.dirs = num_dirs ? reinterpret_cast<bd_ct_dir *>(
                           buf + sizeof(bd_ct_file) * num_files)
                     : nullptr;
  ct.symlinks = num_symlinks
                    ? reinterpret_cast<bd_ct_symlink *>(
                          buf + sizeof(bd_ct_file) * num_files +
                          sizeof(bd_ct_dir) * num_dirs)
                    : nullptr;
  ct.num_dirs = num_dirs;
  ct.num_files = num_files;
  ct.num_symlinks = num_symlinks;
  return reinterpret_cast<char *>(buf + arrays_size);
}

/// Copy a string into the container's string area.
///
/// @param [in, out] next
///    Pointer to the next available character in the string area, advanced
///    past the copied string.
/// @param str
///    String to copy.
/// @return Pointer to the copied null-terminated string.
[[gnu::returns_nonnull]]
static const char *_Nonnull put_str(char *_Nonnull &next,
                                    std::string_view str) noexcept {
  const auto res = next;
  std::memcpy(next, str.data(), str.length());
  next[str.length()] = '\0';
  next += str.length() + 1;
  return res;
}

} // namespace

//===-- Internal functions ------------------------------------------------===//

bd_err ct_from_proto(const Container &msg, bd_container &ct, bd_errc prim) {
  // Validate entries and count string sizes
  std::size_t str_size = 0;
  for (const auto &dir : msg.dirs()) {
    if (!valid_path(dir.path())) {
      return bd_err_sub(prim, BD_ERRC_invalid_data);
    }
    str_size += dir.path().length() + 1;
  }
  std::int64_t offset = 0;
  for (const auto &file : msg.files()) {
    if (!valid_path(file.path()) || file.size() < 0 ||
        file.offset() != offset ||
        file.size() > std::numeric_limits<std::int64_t>::max() - offset) {
      return bd_err_sub(prim, BD_ERRC_invalid_data);
    }
    offset += file.size();
    str_size += file.path().length() + 1;
  }
  if (offset != msg.size()) {
    return bd_err_sub(prim, BD_ERRC_invalid_data);
  }
  for (const auto &symlink : msg.symlinks()) {
    if (!valid_path(symlink.path()) || symlink.target().empty() ||
        symlink.target().find('\0') != std::string::npos) {
      return bd_err_sub(prim, BD_ERRC_invalid_data);
    }
    str_size += symlink.path().length() + 1 + symlink.target().length() + 1;
  }
  // Build the container
  auto next_str = ct_alloc(ct, msg.dirs_size(), msg.files_size(),
                           msg.symlinks_size(), str_size);
  if (!next_str) {
    return bd_err_sub(prim, BD_ERRC_mem_alloc);
  }
  ct.size = msg.size();
  for (auto ct_dir = ct.dirs; const auto &dir : msg.dirs()) {
    ct_dir->path = put_str(next_str, dir.path());
    ct_dir->mode = dir.mode();
    ++ct_dir;
  }
  for (auto ct_file = ct.files; const auto &file : msg.files()) {
    ct_file->path = put_str(next_str, file.path());
    ct_file->size = file.size();
    ct_file->offset = file.offset();
    ct_file->mode = file.mode();
    ++ct_file;
  }
  for (auto ct_symlink = ct.symlinks; const auto &symlink : msg.symlinks()) {
    ct_symlink->path = put_str(next_str, symlink.path());
    ct_symlink->target = put_str(next_str, symlink.target());
    ct_symlink->mode = symlink.mode();
    ++ct_symlink;
  }
  return bd_err_ok();
}

void ct_to_proto(const bd_container &ct, Container &msg) {
  msg.mutable_dirs()->Reserve(ct.num_dirs);
  for (const auto &dir : std::span(ct.dirs, ct.num_dirs)) {
    auto &msg_dir = *msg.add_dirs();
    msg_dir.set_path(dir.path);
    msg_dir.set_mode(dir.mode);
  }
  msg.mutable_files()->Reserve(ct.num_files);
  for (const auto &file : std::span(ct.files, ct.num_files)) {
    auto &msg_file = *msg.add_files();
    msg_file.set_path(file.path);
    msg_file.set_size(file.size);
    msg_file.set_offset(file.offset);
    msg_file.set_mode(file.mode);
  }
  msg.mutable_symlinks()->Reserve(ct.num_symlinks);
  for (const auto &symlink : std::span(ct.symlinks, ct.num_symlinks)) {
    auto &msg_symlink = *msg.add_symlinks();
    msg_symlink.set_path(symlink.path);
    msg_symlink.set_target(symlink.target);
    msg_symlink.set_mode(symlink.mode);
  }
  msg.set_size(ct.size);
}

bd_err ct_copy(const bd_container &src, bd_container &dst, bd_errc prim) {
  std::size_t str_size = 0;
  for (const auto &dir : std::span(src.dirs, src.num_dirs)) {
    str_size += std::strlen(dir.path) + 1;
  }
  for (const auto &file : std::span(src.files, src.num_files)) {
    str_size += std::strlen(file.path) + 1;
  }
  for (const auto &symlink : std::span(src.symlinks, src.num_symlinks)) {
    str_size += std::strlen(symlink.path) + 1 + std::strlen(symlink.target) + 1;
  }
  auto next_str = ct_alloc(dst, src.num_dirs, src.num_files, src.num_symlinks,
                           str_size);
  if (!next_str) {
    return bd_err_sub(prim, BD_ERRC_mem_alloc);
  }
  dst.size = src.size;
  std::ranges::transform(std::span(src.dirs, src.num_dirs), dst.dirs,
                         [&next_str](const auto &dir) -> bd_ct_dir {
                           return {.path = put_str(next_str, dir.path),
                                   .mode = dir.mode};
                         });
  std::ranges::transform(std::span(src.files, src.num_files), dst.files,
                         [&next_str](const auto &file) -> bd_ct_file {
                           return {.path = put_str(next_str, file.path),
                                   .size = file.size,
                                   .offset = file.offset,
                                   .mode = file.mode};
                         });
  std::ranges::transform(
      std::span(src.symlinks, src.num_symlinks), dst.symlinks,
      [&next_str](const auto &symlink) -> bd_ct_symlink {
        const auto path = put_str(next_str, symlink.path);
        return {.path = path,
                .target = put_str(next_str, symlink.target),
                .mode = symlink.mode};
      });
  return bd_err_ok();
}

} // namespace blockdelta::content

//===-- Public functions --------------------------------------------------===//

using namespace blockdelta::content;

extern "C" {

bool bd_ct_default_filter(void *, const char *, const char *name,
                          bd_ct_entry_type) {
  static constexpr std::string_view excluded[]{
      ".git", ".hg", ".svn", ".DS_Store", "__MACOSX", "Thumbs.db"};
  const std::string_view sv(name);
  return !sv.starts_with("._") && std::ranges::find(excluded, sv) ==
                                       std::ranges::end(excluded);
}

bd_err bd_ct_walk(const char *path, bd_ct_filter_func *filter, void *data,
                  bd_container *ct) {
  *ct = {};
  const auto handle = bdi_os_dir_open(path);
  if (handle == BD_OS_INVALID_HANDLE) {
    return bdi_os_io_err_at(BDI_OS_CWD_HANDLE, path, BD_ERRC_walk,
                            bdi_os_get_last_error(), BD_ERR_IO_TYPE_open);
  }
  google::protobuf::Arena arena;
  auto &msg = *google::protobuf::Arena::Create<Container>(&arena);
  walk_ctx ctx{.filter = filter, .data = data, .msg = msg, .path = {}};
  const auto res = walk_dir(ctx, handle);
  bdi_os_close_handle(handle);
  if (!bd_err_success(&res)) {
    return res;
  }
  return ct_from_proto(msg, *ct, BD_ERRC_walk);
}

void bd_ct_free(bd_container *ct) {
  std::free(ct->buf);
  *ct = {};
}

} // extern "C"
