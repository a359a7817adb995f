//===-- os_linux.cpp - GNU/Linux OS functions implementation --------------===//
//
// Copyright (c) 2025 Nuclearist <nuclearist@teknology-hub.com>
// Part of blockdelta, under the GNU General Public License v3.0 or later
// See COPYING in the project root for license information.
// SPDX-License-Identifier: GPL-3.0-or-later
//
//===----------------------------------------------------------------------===//
///
/// @file
/// GNU/Linux implementation of @ref os.h.
///
//===----------------------------------------------------------------------===//
#include "os.h"

#include "blockdelta/error.h"
#include "blockdelta/os.h"

#include <atomic>
#include <cerrno>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <dirent.h>
#include <fcntl.h>
#include <filesystem>
#include <limits.h>
#include <string.h>
#include <sys/stat.h>
#include <system_error>
#include <unistd.h>

namespace blockdelta::os {

namespace {

/// Get the path that a file descriptor refers to.
///
/// @param fd
///    The file descriptor.
/// @return Path to the file as a heap-allocated null-terminated string, or
///    `nullptr` on failure.
static char *_Nullable fd_path(int fd) noexcept {
  char link[32];
  std::snprintf(link, sizeof link, "/proc/self/fd/%d", fd);
  char buf[PATH_MAX];
  const auto len = readlink(link, buf, sizeof buf - 1);
  if (len < 0) {
    return nullptr;
  }
  buf[len] = '\0';
  return strdup(buf);
}

/// Convert a `stat` structure into @ref bdi_os_stat.
///
/// @param [in] src
///    The structure to convert.
/// @param [out] st
///    The structure that receives converted values.
static void convert_stat(const struct stat &src, bdi_os_stat &st) noexcept {
  switch (src.st_mode & S_IFMT) {
  case S_IFDIR:
    st.type = BDI_OS_ENTRY_TYPE_dir;
    break;
  case S_IFREG:
    st.type = BDI_OS_ENTRY_TYPE_file;
    break;
  case S_IFLNK:
    st.type = BDI_OS_ENTRY_TYPE_symlink;
    break;
  default:
    st.type = BDI_OS_ENTRY_TYPE_other;
  }
  st.mode = src.st_mode & 07777;
  st.size = st.type == BDI_OS_ENTRY_TYPE_file ? src.st_size : 0;
}

} // namespace

extern "C" {

//===-- General functions -------------------------------------------------===//

void bdi_os_close_handle(int handle) { close(handle); }

char *bdi_os_get_err_msg(int errc) {
  char buf[256];
  // GNU strerror_r may return a static string instead of using buf
  const char *const msg = strerror_r(errc, buf, sizeof buf);
  return strdup(msg);
}

int bdi_os_get_last_error(void) { return errno; }

int bdi_os_get_nproc(void) {
  const auto res = sysconf(_SC_NPROCESSORS_ONLN);
  return res > 0 ? static_cast<int>(res) : 1;
}

//===-- I/O functions -----------------------------------------------------===//

bd_err bdi_os_io_err(int handle, bd_errc prim, int errc,
                     bd_err_io_type io_type) {
  return {.type = BD_ERR_TYPE_os,
          .primary = prim,
          .auxiliary = errc,
          .extra = io_type,
          .uri = fd_path(handle)};
}

bd_err bdi_os_io_err_at(int parent_dir_handle, const char *name, bd_errc prim,
                        int errc, bd_err_io_type io_type) {
  char *uri{};
  if (parent_dir_handle == AT_FDCWD || name[0] == '/') {
    uri = strdup(name);
  } else if (auto const dir_path = fd_path(parent_dir_handle); dir_path) {
    const auto dir_len = std::strlen(dir_path);
    const auto name_len = std::strlen(name);
    uri = static_cast<char *>(std::malloc(dir_len + 1 + name_len + 1));
    if (uri) {
      std::memcpy(uri, dir_path, dir_len);
      uri[dir_len] = '/';
      std::memcpy(&uri[dir_len + 1], name, name_len + 1);
    }
    std::free(dir_path);
  }
  return {.type = BD_ERR_TYPE_os,
          .primary = prim,
          .auxiliary = errc,
          .extra = io_type,
          .uri = uri};
}

bool bdi_os_stat_at(int parent_dir_handle, const char *name, bdi_os_stat *st) {
  struct stat buf;
  if (fstatat(parent_dir_handle, name, &buf, AT_SYMLINK_NOFOLLOW) < 0) {
    return false;
  }
  convert_stat(buf, *st);
  return true;
}

bool bdi_os_file_stat(int handle, bdi_os_stat *st) {
  struct stat buf;
  if (fstat(handle, &buf) < 0) {
    return false;
  }
  convert_stat(buf, *st);
  return true;
}

bool bdi_os_same_dir(const char *left, const char *right) {
  struct stat left_st;
  struct stat right_st;
  if (stat(left, &left_st) == 0 && stat(right, &right_st) == 0) {
    return left_st.st_dev == right_st.st_dev &&
           left_st.st_ino == right_st.st_ino;
  }
  std::error_code ec;
  auto left_path = std::filesystem::absolute(left, ec).lexically_normal();
  if (ec) {
    return false;
  }
  auto right_path = std::filesystem::absolute(right, ec).lexically_normal();
  if (ec) {
    return false;
  }
  // Trailing separators produce an empty last component
  if (!left_path.has_filename()) {
    left_path = left_path.parent_path();
  }
  if (!right_path.has_filename()) {
    right_path = right_path.parent_path();
  }
  return left_path == right_path;
}

//===--- Directory functions ----------------------------------------------===//

int bdi_os_dir_open(const char *path) {
  return open(path, O_RDONLY | O_DIRECTORY | O_CLOEXEC);
}

int bdi_os_dir_create(const char *path) {
  if (mkdir(path, 0755) < 0 && errno != EEXIST) {
    return -1;
  }
  return open(path, O_RDONLY | O_DIRECTORY | O_CLOEXEC);
}

int bdi_os_dir_open_at(int parent_dir_handle, const char *name) {
  return openat(parent_dir_handle, name,
                O_RDONLY | O_DIRECTORY | O_NOFOLLOW | O_CLOEXEC);
}

bool bdi_os_dir_create_at(int parent_dir_handle, const char *name,
                          std::uint32_t mode) {
  if (mkdirat(parent_dir_handle, name, mode) == 0) {
    return true;
  }
  if (errno != EEXIST) {
    return false;
  }
  struct stat buf;
  if (fstatat(parent_dir_handle, name, &buf, AT_SYMLINK_NOFOLLOW) < 0) {
    return false;
  }
  if (!S_ISDIR(buf.st_mode)) {
    errno = ENOTDIR;
    return false;
  }
  return true;
}

int bdi_os_dir_create_unique_at(int parent_dir_handle, const char *prefix,
                                char *name, int name_size) {
  static std::atomic_uint counter;
  for (;;) {
    std::snprintf(name, name_size, "%s%d-%u", prefix,
                  static_cast<int>(getpid()),
                  counter.fetch_add(1, std::memory_order::relaxed));
    if (mkdirat(parent_dir_handle, name, 0700) == 0) {
      return openat(parent_dir_handle, name,
                    O_RDONLY | O_DIRECTORY | O_NOFOLLOW | O_CLOEXEC);
    }
    if (errno != EEXIST) {
      return -1;
    }
  }
}

bool bdi_os_dir_list(int handle, bdi_os_dir_list_func *cb, void *data) {
  // fdopendir takes ownership of the descriptor, so give it a duplicate
  const int fd = openat(handle, ".", O_RDONLY | O_DIRECTORY | O_CLOEXEC);
  if (fd < 0) {
    return false;
  }
  const auto dir = fdopendir(fd);
  if (!dir) {
    const int errc = errno;
    close(fd);
    errno = errc;
    return false;
  }
  for (;;) {
    errno = 0;
    const auto ent = readdir(dir);
    if (!ent) {
      break;
    }
    if (ent->d_name[0] == '.' &&
        (ent->d_name[1] == '\0' ||
         (ent->d_name[1] == '.' && ent->d_name[2] == '\0'))) {
      continue;
    }
    cb(data, ent->d_name);
  }
  const int errc = errno;
  closedir(dir);
  errno = errc;
  return errc == 0;
}

bool bdi_os_dir_delete_at(int parent_dir_handle, const char *name) {
  return unlinkat(parent_dir_handle, name, AT_REMOVEDIR) == 0;
}

//===--- File functions ---------------------------------------------------===//

int bdi_os_file_open_at(int parent_dir_handle, const char *name) {
  return openat(parent_dir_handle, name, O_RDONLY | O_NOFOLLOW | O_CLOEXEC);
}

int bdi_os_file_create_at(int parent_dir_handle, const char *name) {
  return openat(parent_dir_handle, name,
                O_WRONLY | O_CREAT | O_TRUNC | O_NOFOLLOW | O_CLOEXEC, 0644);
}

std::int64_t bdi_os_file_read_some(int handle, void *buf, std::size_t n) {
  for (;;) {
    const auto res = read(handle, buf, n);
    if (res < 0 && errno == EINTR) {
      continue;
    }
    return res;
  }
}

bool bdi_os_file_read_at(int handle, void *buf, std::size_t n,
                         std::int64_t offset) {
  auto cur = static_cast<unsigned char *>(buf);
  while (n) {
    const auto res = pread(handle, cur, n, offset);
    if (res < 0) {
      if (errno == EINTR) {
        continue;
      }
      return false;
    }
    if (!res) {
      errno = BDI_OS_ERR_EOF;
      return false;
    }
    cur += res;
    offset += res;
    n -= res;
  }
  return true;
}

bool bdi_os_file_write(int handle, const void *buf, std::size_t n) {
  auto cur = static_cast<const unsigned char *>(buf);
  while (n) {
    const auto res = write(handle, cur, n);
    if (res < 0) {
      if (errno == EINTR) {
        continue;
      }
      return false;
    }
    cur += res;
    n -= res;
  }
  return true;
}

bool bdi_os_file_set_mode(int handle, std::uint32_t mode) {
  return fchmod(handle, mode) == 0;
}

bool bdi_os_file_move(int src_dir_handle, const char *src_name,
                      int tgt_dir_handle, const char *tgt_name) {
  return renameat(src_dir_handle, src_name, tgt_dir_handle, tgt_name) == 0;
}

bool bdi_os_file_delete_at(int parent_dir_handle, const char *name) {
  return unlinkat(parent_dir_handle, name, 0) == 0;
}

//===--- Symbolic link functions ------------------------------------------===//

bool bdi_os_symlink_at(const char *target, int parent_dir_handle,
                       const char *name) {
  return symlinkat(target, parent_dir_handle, name) == 0;
}

char *bdi_os_readlink_at(int parent_dir_handle, const char *name) {
  char buf[PATH_MAX];
  const auto len = readlinkat(parent_dir_handle, name, buf, sizeof buf - 1);
  if (len < 0) {
    return nullptr;
  }
  buf[len] = '\0';
  return strdup(buf);
}

} // extern "C"

} // namespace blockdelta::os
