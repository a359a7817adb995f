//===-- signature.hpp - internal signature functions ----------------------===//
//
// Copyright (c) 2025 Nuclearist <nuclearist@teknology-hub.com>
// Part of blockdelta, under the GNU General Public License v3.0 or later
// See COPYING in the project root for license information.
// SPDX-License-Identifier: GPL-3.0-or-later
//
//===----------------------------------------------------------------------===//
///
/// @file
/// Declarations of signature helpers shared by the signature, diff and verify
///    engines.
///
//===----------------------------------------------------------------------===//
#pragma once

#include "blockdelta/base.h"
#include "blockdelta/content.h"
#include "blockdelta/content/signature.pb.h"
#include "blockdelta/error.h"
#include "blockdelta/os.h"
#include "stream.hpp"
#include "wire.hpp"

#include <cstdint>

namespace blockdelta::content {

/// Check whether a block size is within the supported range.
constexpr bool valid_block_size(int block_size) noexcept {
  return block_size >= BD_MIN_BLOCK_SIZE && block_size <= BD_MAX_BLOCK_SIZE;
}

/// Get the number of blocks that a file of specified size is split into.
constexpr std::int64_t num_blocks(std::int64_t size, int block_size) noexcept {
  return (size + block_size - 1) / block_size;
}

/// Allocate the hash arrays of a signature and fill
///    @ref bd_signature::file_hash_offsets. The container and block size must
///    already be set.
///
/// @param [in, out] sig
///    Signature to allocate arrays for.
/// @param prim
///    Primary error code for reported errors.
/// @return A @ref bd_err indicating the result of operation.
bd_err sig_alloc(bd_signature &sig, bd_errc prim);

/// Writer of signature streams that receives block hashes one at a time.
class sig_writer {
public:
  /// Create a writer.
  ///
  /// @param handle
  ///    Handle for the file to write to, opened for writing.
  /// @param prim
  ///    Primary error code for reported errors.
  sig_writer(bd_os_handle handle, bd_errc prim) : sink(handle, prim), prim(prim) {}

  /// Write the stream prologue and the container.
  ///
  /// @param [in] ct
  ///    Container describing the tree.
  /// @param block_size
  ///    Block size of the signature, in bytes.
  /// @param [in] compression
  ///    Compression settings for the stream.
  /// @return A @ref bd_err indicating the result of operation.
  bd_err open(const bd_container &ct, int block_size,
              const bd_comp_settings &compression);

  /// Write the next block hash.
  bd_err write(const bd_block_hash &hash);

  /// Finalize the stream and flush it to the file.
  bd_err finish();

  /// Get the number of bytes written so far.
  std::int64_t size() const noexcept { return sink.size(); }

private:
  io::file_sink sink;
  bd_errc prim;
  wire::msg_writer writer;
  BlockHash msg;
};

} // namespace blockdelta::content
