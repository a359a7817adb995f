//===-- stream.cpp - byte sinks and sources implementation ----------------===//
//
// Copyright (c) 2025 Nuclearist <nuclearist@teknology-hub.com>
// Part of blockdelta, under the GNU General Public License v3.0 or later
// See COPYING in the project root for license information.
// SPDX-License-Identifier: GPL-3.0-or-later
//
//===----------------------------------------------------------------------===//
///
/// @file
/// Implementation of byte sink and source types.
///
//===----------------------------------------------------------------------===//
#include "stream.hpp"

#include "blockdelta/error.h"
#include "common/error.h"
#include "os.h"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <memory>

namespace blockdelta::io {

//===-- source ------------------------------------------------------------===//

bool source::read_exact(void *data, std::size_t size) {
  auto cur = static_cast<unsigned char *>(data);
  while (size) {
    const auto res = read(cur, size);
    if (res < 0) {
      return false;
    }
    if (!res) {
      error = bd_err_sub(prim, BD_ERRC_unexpected_eof);
      return false;
    }
    cur += res;
    size -= res;
  }
  return true;
}

//===-- file_sink ---------------------------------------------------------===//

file_sink::file_sink(bd_os_handle handle, bd_errc prim)
    : sink(prim), handle(handle),
      buf(std::make_unique_for_overwrite<unsigned char[]>(buf_size)),
      buf_used(0), total(0) {}

bool file_sink::write(const void *data, std::size_t size) {
  total += size;
  if (buf_used + size <= buf_size) {
    std::memcpy(&buf[buf_used], data, size);
    buf_used += size;
    return true;
  }
  if (!flush()) {
    return false;
  }
  if (size >= buf_size) {
    // Large writes bypass the buffer
    if (!bdi_os_file_write(handle, data, size)) {
      error = bdi_os_io_err(handle, prim, bdi_os_get_last_error(),
                            BD_ERR_IO_TYPE_write);
      return false;
    }
    return true;
  }
  std::memcpy(buf.get(), data, size);
  buf_used = size;
  return true;
}

bool file_sink::flush() {
  if (!buf_used) {
    return true;
  }
  if (!bdi_os_file_write(handle, buf.get(), buf_used)) {
    error = bdi_os_io_err(handle, prim, bdi_os_get_last_error(),
                          BD_ERR_IO_TYPE_write);
    return false;
  }
  buf_used = 0;
  return true;
}

//===-- file_source -------------------------------------------------------===//

file_source::file_source(bd_os_handle handle, bd_errc prim)
    : source(prim), handle(handle),
      buf(std::make_unique_for_overwrite<unsigned char[]>(buf_size)),
      buf_pos(0), buf_end(0) {}

std::int64_t file_source::read(void *data, std::size_t size) {
  if (buf_pos == buf_end) {
    const auto res = bdi_os_file_read_some(handle, buf.get(), buf_size);
    if (res < 0) {
      error = bdi_os_io_err(handle, prim, bdi_os_get_last_error(),
                            BD_ERR_IO_TYPE_read);
      return -1;
    }
    buf_pos = 0;
    buf_end = res;
    if (!res) {
      return 0;
    }
  }
  const auto n = std::min(size, buf_end - buf_pos);
  std::memcpy(data, &buf[buf_pos], n);
  buf_pos += n;
  return n;
}

//===-- mem_sink ----------------------------------------------------------===//

bool mem_sink::write(const void *data, std::size_t size) {
  const auto bytes = static_cast<const unsigned char *>(data);
  this->data.insert(this->data.end(), bytes, bytes + size);
  return true;
}

//===-- mem_source --------------------------------------------------------===//

std::int64_t mem_source::read(void *data, std::size_t size) {
  const auto n = std::min(size, remaining.size());
  if (n) {
    std::memcpy(data, remaining.data(), n);
  }
  remaining = remaining.subspan(n);
  return n;
}

} // namespace blockdelta::io
