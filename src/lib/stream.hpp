//===-- stream.hpp - byte sinks and sources -------------------------------===//
//
// Copyright (c) 2025 Nuclearist <nuclearist@teknology-hub.com>
// Part of blockdelta, under the GNU General Public License v3.0 or later
// See COPYING in the project root for license information.
// SPDX-License-Identifier: GPL-3.0-or-later
//
//===----------------------------------------------------------------------===//
///
/// @file
/// Declarations of byte sink and source types that compression streams and
///    message framing are layered on.
///
//===----------------------------------------------------------------------===//
#pragma once

#include "blockdelta/error.h"
#include "blockdelta/os.h"
#include "common/error.h"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <vector>

namespace blockdelta::io {

/// Byte sink interface.
class sink {
public:
  /// Error that caused the last failed call.
  bd_err error;

  virtual ~sink() = default;

  /// Write data to the sink.
  ///
  /// @param [in] data
  ///    Pointer to the data to write.
  /// @param size
  ///    Number of bytes to write.
  /// @return Value indicating whether the function succeeded. In case of
  ///    failure, @ref error describes the reason.
  virtual bool write(const void *_Nonnull data, std::size_t size) = 0;

protected:
  /// Primary error code for errors reported by the sink.
  bd_errc prim;

  explicit sink(bd_errc prim) noexcept
      : error(bd_err_ok()), prim(prim) {}
};

/// Byte source interface.
class source {
public:
  /// Error that caused the last failed call.
  bd_err error;

  virtual ~source() = default;

  /// Read up to @p size bytes from the source.
  ///
  /// @param [out] data
  ///    Pointer to the buffer that receives the data.
  /// @param size
  ///    Maximum number of bytes to read.
  /// @return Number of bytes read, `0` at the end of data, or `-1` on failure,
  ///    in which case @ref error describes the reason.
  virtual std::int64_t read(void *_Nonnull data, std::size_t size) = 0;

  /// Read exactly @p size bytes from the source.
  ///
  /// @param [out] data
  ///    Pointer to the buffer that receives the data.
  /// @param size
  ///    Number of bytes to read.
  /// @return Value indicating whether the function succeeded. If the source
  ///    ends too early, @ref error is set to @ref BD_ERRC_unexpected_eof.
  bool read_exact(void *_Nonnull data, std::size_t size);

protected:
  /// Primary error code for errors reported by the source.
  bd_errc prim;

  explicit source(bd_errc prim) noexcept
      : error(bd_err_ok()), prim(prim) {}
};

/// Buffered sink writing to a file.
class file_sink final : public sink {
public:
  /// Create a sink writing to specified file.
  ///
  /// @param handle
  ///    Handle for the file, opened for writing. The sink doesn't take
  ///    ownership of it.
  /// @param prim
  ///    Primary error code for I/O errors.
  file_sink(bd_os_handle handle, bd_errc prim);

  bool write(const void *_Nonnull data, std::size_t size) override;

  /// Write buffered data to the file.
  ///
  /// @return Value indicating whether the function succeeded.
  bool flush();

  /// Get the number of bytes written to the sink so far, including buffered
  ///    ones.
  constexpr std::int64_t size() const noexcept { return total; }

private:
  static constexpr std::size_t buf_size = 0x100000;

  bd_os_handle handle;
  std::unique_ptr<unsigned char[]> buf;
  std::size_t buf_used;
  std::int64_t total;
};

/// Buffered source reading from a file.
class file_source final : public source {
public:
  /// Create a source reading from specified file at its current position.
  ///
  /// @param handle
  ///    Handle for the file, opened for reading. The source doesn't take
  ///    ownership of it.
  /// @param prim
  ///    Primary error code for I/O errors.
  file_source(bd_os_handle handle, bd_errc prim);

  std::int64_t read(void *_Nonnull data, std::size_t size) override;

private:
  static constexpr std::size_t buf_size = 0x100000;

  bd_os_handle handle;
  std::unique_ptr<unsigned char[]> buf;
  std::size_t buf_pos;
  std::size_t buf_end;
};

/// Sink appending to a byte vector.
class mem_sink final : public sink {
public:
  /// Data written so far.
  std::vector<unsigned char> data;

  explicit mem_sink(bd_errc prim) noexcept : sink(prim) {}

  bool write(const void *_Nonnull data, std::size_t size) override;
};

/// Source reading from a memory buffer.
class mem_source final : public source {
public:
  mem_source(std::span<const unsigned char> data, bd_errc prim) noexcept
      : source(prim), remaining(data) {}

  std::int64_t read(void *_Nonnull data, std::size_t size) override;

private:
  std::span<const unsigned char> remaining;
};

} // namespace blockdelta::io
