//===-- error.cpp - error messages and categories -------------------------===//
//
// Copyright (c) 2025 Nuclearist <nuclearist@teknology-hub.com>
// Part of blockdelta, under the GNU General Public License v3.0 or later
// See COPYING in the project root for license information.
// SPDX-License-Identifier: GPL-3.0-or-later
//
//===----------------------------------------------------------------------===//
///
/// @file
/// Implementation of error inspection functions and @ref bd_version.
///
//===----------------------------------------------------------------------===//
#include "blockdelta/error.h"

#include "blockdelta/base.h"
#include "config.h"
#include "os.h"
#include "zlib_api.h"

#include <cstdlib>
#include <lzma.h>
#ifdef BDB_GETTEXT
#include <libintl.h>
#endif // def BDB_GETTEXT
#ifdef BDB_ZSTD
#include <zstd_errors.h>
#endif // def BDB_ZSTD

namespace blockdelta {

namespace {

#ifdef BDB_GETTEXT

[[gnu::returns_nonnull, gnu::nonnull(1)]]
static inline const char *_Nonnull bd_gettext(const char *_Nonnull msg) {
  return dgettext("blockdelta", msg);
}

#else // def BDB_GETTEXT

#define bd_gettext(msg) msg

#endif // def BDB_GETTEXT else

/// Get the message for a blockdelta error code.
static const char *_Nonnull errc_msg(int errc) {
  switch (errc) {
  case BD_ERRC_ok:
    return bd_gettext("Operation completed successfully");
  case BD_ERRC_apply:
    return bd_gettext("Failed to apply patch");
  case BD_ERRC_comp_init:
    return bd_gettext("Failed to initialize compression stream");
  case BD_ERRC_compress:
    return bd_gettext("Failed to compress data");
  case BD_ERRC_decompress:
    return bd_gettext("Failed to decompress data");
  case BD_ERRC_diff:
    return bd_gettext("Failed to compute patch");
  case BD_ERRC_hash_mismatch:
    return bd_gettext("Block hash mismatch");
  case BD_ERRC_inplace_not_allowed:
    return bd_gettext("Refusing to destructively patch the target tree "
                      "without in-place application enabled");
  case BD_ERRC_invalid_arg:
    return bd_gettext("Invalid argument value");
  case BD_ERRC_invalid_data:
    return bd_gettext("Encountered invalid data");
  case BD_ERRC_magic_mismatch:
    return bd_gettext("Magic number mismatch");
  case BD_ERRC_mem_alloc:
    return bd_gettext("Memory allocation failed");
  case BD_ERRC_patch_read:
    return bd_gettext("Failed to read patch");
  case BD_ERRC_protobuf_deserialize:
    return bd_gettext("Failed to deserialize Protobuf message");
  case BD_ERRC_protobuf_serialize:
    return bd_gettext("Failed to serialize Protobuf message");
  case BD_ERRC_sha:
    return bd_gettext("SHA-1 hashing failed");
  case BD_ERRC_sig_compute:
    return bd_gettext("Failed to compute signature");
  case BD_ERRC_sig_read:
    return bd_gettext("Failed to read signature");
  case BD_ERRC_sig_write:
    return bd_gettext("Failed to write signature");
  case BD_ERRC_size_mismatch:
    return bd_gettext("File size doesn't match the recorded one");
  case BD_ERRC_target_missing:
    return bd_gettext("The patch requires a target tree, but none was "
                      "provided");
  case BD_ERRC_unexpected_eof:
    return bd_gettext("Unexpected end of stream");
  case BD_ERRC_unknown_comp:
    return bd_gettext("Unsupported compression algorithm");
  case BD_ERRC_verify:
    return bd_gettext("Tree verification failed");
  case BD_ERRC_walk:
    return bd_gettext("Failed to walk directory tree");
  case BD_ERRC_wt_start:
    return bd_gettext("Failed to start worker thread");
  default:
    return bd_gettext("Unknown error code");
  }
}

/// Get the message for an I/O operation type.
static const char *_Nullable io_type_msg(int io_type) {
  switch (io_type) {
  case BD_ERR_IO_TYPE_none:
    return nullptr;
  case BD_ERR_IO_TYPE_open:
    return bd_gettext("Opening file or directory");
  case BD_ERR_IO_TYPE_get_type:
    return bd_gettext("Getting file status");
  case BD_ERR_IO_TYPE_list:
    return bd_gettext("Listing directory entries");
  case BD_ERR_IO_TYPE_read:
    return bd_gettext("Reading from file");
  case BD_ERR_IO_TYPE_write:
    return bd_gettext("Writing to file");
  case BD_ERR_IO_TYPE_apply_mode:
    return bd_gettext("Applying permission bits");
  case BD_ERR_IO_TYPE_move:
    return bd_gettext("Moving file or directory");
  case BD_ERR_IO_TYPE_delete:
    return bd_gettext("Deleting file or directory");
  case BD_ERR_IO_TYPE_symlink:
    return bd_gettext("Creating symbolic link");
  case BD_ERR_IO_TYPE_readlink:
    return bd_gettext("Reading symbolic link");
  default:
    return bd_gettext("Unknown I/O operation");
  }
}

/// Get the message for a liblzma return code.
static const char *_Nonnull lzma_msg(int code) {
  switch (code) {
  case LZMA_MEM_ERROR:
    return bd_gettext("Cannot allocate memory");
  case LZMA_MEMLIMIT_ERROR:
    return bd_gettext("Memory usage limit was reached");
  case LZMA_FORMAT_ERROR:
    return bd_gettext("File format not recognized");
  case LZMA_OPTIONS_ERROR:
    return bd_gettext("Invalid or unsupported options");
  case LZMA_DATA_ERROR:
    return bd_gettext("Data is corrupt");
  case LZMA_BUF_ERROR:
    return bd_gettext("No progress is possible");
  case LZMA_PROG_ERROR:
    return bd_gettext("Programming error");
  default:
    return bd_gettext("Unknown liblzma error");
  }
}

} // namespace

} // namespace blockdelta

//===-- Public functions --------------------------------------------------===//

using namespace blockdelta;

extern "C" {

const char *bd_version(void) { return BDB_VERSION; }

bd_err_category bd_err_get_category(const bd_err *err) {
  switch (err->type) {
  case BD_ERR_TYPE_basic:
    return err->primary == BD_ERRC_ok ? BD_ERR_CATEGORY_none
                                      : BD_ERR_CATEGORY_internal;
  case BD_ERR_TYPE_sub:
    switch (err->auxiliary) {
    case BD_ERRC_magic_mismatch:
    case BD_ERRC_invalid_data:
    case BD_ERRC_unexpected_eof:
    case BD_ERRC_protobuf_deserialize:
      return BD_ERR_CATEGORY_format;
    case BD_ERRC_unknown_comp:
    case BD_ERRC_comp_init:
    case BD_ERRC_compress:
    case BD_ERRC_decompress:
      return BD_ERR_CATEGORY_compression;
    case BD_ERRC_size_mismatch:
    case BD_ERRC_hash_mismatch:
      return BD_ERR_CATEGORY_corruption;
    case BD_ERRC_inplace_not_allowed:
    case BD_ERRC_target_missing:
    case BD_ERRC_invalid_arg:
      return BD_ERR_CATEGORY_precondition;
    default:
      return BD_ERR_CATEGORY_internal;
    }
  case BD_ERR_TYPE_os:
    return BD_ERR_CATEGORY_io;
  case BD_ERR_TYPE_zlib:
  case BD_ERR_TYPE_lzma:
  case BD_ERR_TYPE_zstd:
    return BD_ERR_CATEGORY_compression;
  default:
    return BD_ERR_CATEGORY_internal;
  }
}

bd_err_msgs bd_err_get_msgs(const bd_err *err) {
  bd_err_msgs msgs{.type = err->type,
                   .type_str = nullptr,
                   .primary = errc_msg(err->primary),
                   .auxiliary = nullptr,
                   .extra = nullptr,
                   .uri_type = nullptr};
  switch (err->type) {
  case BD_ERR_TYPE_basic:
    msgs.type_str = bd_gettext("Basic");
    break;
  case BD_ERR_TYPE_sub:
    msgs.type_str = bd_gettext("Compound");
    msgs.auxiliary = errc_msg(err->auxiliary);
    break;
  case BD_ERR_TYPE_os:
    msgs.type_str = bd_gettext("OS");
    msgs.auxiliary = bdi_os_get_err_msg(err->auxiliary);
    msgs.extra = io_type_msg(err->extra);
    break;
  case BD_ERR_TYPE_zlib:
    msgs.type_str = "zlib";
    msgs.auxiliary = bdi_z_zError(err->auxiliary);
    msgs.extra = errc_msg(err->extra);
    break;
  case BD_ERR_TYPE_lzma:
    msgs.type_str = "liblzma";
    msgs.auxiliary = lzma_msg(err->auxiliary);
    msgs.extra = errc_msg(err->extra);
    break;
  case BD_ERR_TYPE_zstd:
    msgs.type_str = "Zstandard";
#ifdef BDB_ZSTD
    msgs.auxiliary =
        ZSTD_getErrorString(static_cast<ZSTD_ErrorCode>(err->auxiliary));
#else  // def BDB_ZSTD
    msgs.auxiliary = bd_gettext("Zstandard support is not built in");
#endif // def BDB_ZSTD else
    msgs.extra = errc_msg(err->extra);
    break;
  default:
    msgs.type_str = bd_gettext("Unknown");
  }
  if (err->uri) {
    msgs.uri_type = bd_gettext("File path");
  }
  return msgs;
}

void bd_err_release_msgs(bd_err_msgs *err_msgs) {
  // OS error messages are the only heap-allocated ones
  if (err_msgs->type == BD_ERR_TYPE_os && err_msgs->auxiliary) {
    std::free(const_cast<char *>(err_msgs->auxiliary));
    err_msgs->auxiliary = nullptr;
  }
}

void bd_err_release(bd_err *err) {
  if (err->uri) {
    std::free(const_cast<char *>(err->uri));
    err->uri = nullptr;
  }
}

} // extern "C"
