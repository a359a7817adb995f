//===-- patch.hpp - patch stream reader -----------------------------------===//
//
// Copyright (c) 2025 Nuclearist <nuclearist@teknology-hub.com>
// Part of blockdelta, under the GNU General Public License v3.0 or later
// See COPYING in the project root for license information.
// SPDX-License-Identifier: GPL-3.0-or-later
//
//===----------------------------------------------------------------------===//
///
/// @file
/// Declaration of the patch stream reader shared by the apply engine and
///    @ref bd_patch_read.
///
/// Patch stream layout:
///    `"BDPT" | PatchHeader | compressed[target Container | source Container |
///    (FileHeader | PatchOp* | PatchOp{FILE_END})*]`, with one operation list
///    per source file in container order.
///
//===----------------------------------------------------------------------===//
#pragma once

#include "blockdelta/content.h"
#include "blockdelta/content/patch.pb.h"
#include "blockdelta/error.h"
#include "blockdelta/os.h"
#include "stream.hpp"
#include "wire.hpp"

#include <cstdint>
#include <google/protobuf/arena.h>

namespace blockdelta::delta {

/// Sequential reader of patch streams. Every operation it returns is
///    validated against the containers of the patch.
class patch_reader {
public:
  /// Create a reader.
  ///
  /// @param handle
  ///    Handle for the patch file, opened for reading.
  /// @param prim
  ///    Primary error code for reported errors.
  patch_reader(bd_os_handle handle, bd_errc prim);

  /// Read the stream prologue and both containers.
  ///
  /// @param [out] target
  ///    Receives the target container on success. It must be freed with
  ///    @ref bd_ct_free after use, and must outlive the reader.
  /// @param [out] source
  ///    Receives the source container on success. It must be freed with
  ///    @ref bd_ct_free after use, and must outlive the reader.
  /// @return A @ref bd_err indicating the result of operation.
  bd_err open(bd_container &target, bd_container &source);

  /// Get compression settings of the patch.
  constexpr const bd_comp_settings &compression() const noexcept {
    return comp;
  }

  /// Start reading the operation list of the next source file.
  ///
  /// @param file_index
  ///    Expected index of the file.
  /// @return A @ref bd_err indicating the result of operation,
  ///    @ref BD_ERRC_invalid_data if the list belongs to a different file.
  bd_err begin_file(int file_index);

  /// Read the next operation of the current file.
  ///
  /// @param [out] op
  ///    Receives the pointer to the operation message, valid until the next
  ///    call. `nullptr` is written when the file's list ends.
  /// @return A @ref bd_err indicating the result of operation,
  ///    @ref BD_ERRC_invalid_data if the operation is malformed or refers to
  ///    data outside the target tree, @ref BD_ERRC_size_mismatch if the
  ///    operations produce more data than the file's size.
  bd_err next_op(const content::PatchOp *_Nullable &op);

  /// Ensure that the stream has ended.
  ///
  /// @return A @ref bd_err indicating the result of operation.
  bd_err finish();

private:
  io::file_source source;
  bd_errc prim;
  bd_comp_settings comp;
  wire::msg_reader reader;
  google::protobuf::Arena arena;
  content::FileHeader &file_hdr;
  content::PatchOp &op;
  const bd_container *_Nullable target;
  const bd_container *_Nullable src;
  /// Index of the current source file.
  int cur_file;
  /// Number of bytes produced by the current file's operations so far.
  std::int64_t cur_len;
};

} // namespace blockdelta::delta
