//===-- error.h - blockdelta error type and function declarations ---------===//
//
// Copyright (c) 2025 Nuclearist <nuclearist@teknology-hub.com>
// Part of blockdelta, under the GNU General Public License v3.0 or later
// See COPYING in the project root for license information.
// SPDX-License-Identifier: GPL-3.0-or-later
//
//===----------------------------------------------------------------------===//
///
/// @file
/// Declarations of error-related types and functions used in blockdelta.
///
//===----------------------------------------------------------------------===//
#pragma once

#include "base.h"

//===-- Types -------------------------------------------------------------===//

/// blockdelta error type values.
/// This type identifies the error domain and which fields in @ref bd_err are
///    set, as well as their types. `primary` is set for all error types.
enum bd_err_type {
  /// Library internal error, only `primary` code is set.
  BD_ERR_TYPE_basic,
  /// Compound library internal error with a sub-operation defined by
  ///    `auxiliary` code, which has type @ref bd_errc. Errors related to a
  ///    specific file may also set `uri` to its path.
  BD_ERR_TYPE_sub,
  /// System call error, `auxiliary` code is a @ref bd_os_errc. I/O errors also
  ///    set `extra` to a non-zero @ref bd_err_io_type and `uri` to path to the
  ///    affected file.
  BD_ERR_TYPE_os,
  /// zlib error, `auxiliary` code is an `int` with a `Z_*` value, `extra` is a
  ///    @ref bd_errc identifying the failed stage.
  BD_ERR_TYPE_zlib,
  /// liblzma error, `auxiliary` code is an `lzma_ret`, `extra` is a
  ///    @ref bd_errc identifying the failed stage.
  BD_ERR_TYPE_lzma,
  /// Zstandard error, `auxiliary` code is a `ZSTD_ErrorCode`, `extra` is a
  ///    @ref bd_errc identifying the failed stage.
  BD_ERR_TYPE_zstd
};
/// @copydoc bd_err_type
typedef enum bd_err_type bd_err_type;

/// blockdelta error codes.
enum bd_errc {
  /// (0) Operation completed successfully.
  BD_ERRC_ok,
  /// (1) Failed to apply a patch.
  BD_ERRC_apply,
  /// (2) Failed to initialize a compression stream.
  BD_ERRC_comp_init,
  /// (3) Compression error.
  BD_ERRC_compress,
  /// (4) Decompression error.
  BD_ERRC_decompress,
  /// (5) Failed to compute a patch.
  BD_ERRC_diff,
  /// (6) Block hash mismatch.
  BD_ERRC_hash_mismatch,
  /// (7) Output path refers to the target tree, but in-place application was
  ///    not allowed.
  BD_ERRC_inplace_not_allowed,
  /// (8) Invalid argument value.
  BD_ERRC_invalid_arg,
  /// (9) Encountered invalid data.
  BD_ERRC_invalid_data,
  /// (10) Magic number mismatch.
  BD_ERRC_magic_mismatch,
  /// (11) Memory allocation error.
  BD_ERRC_mem_alloc,
  /// (12) Failed to read a patch.
  BD_ERRC_patch_read,
  /// (13) Failed to deserialize a Protobuf message.
  BD_ERRC_protobuf_deserialize,
  /// (14) Failed to serialize a Protobuf message.
  BD_ERRC_protobuf_serialize,
  /// (15) SHA-1 hashing error.
  BD_ERRC_sha,
  /// (16) Failed to compute a signature.
  BD_ERRC_sig_compute,
  /// (17) Failed to read a signature.
  BD_ERRC_sig_read,
  /// (18) Failed to write a signature.
  BD_ERRC_sig_write,
  /// (19) File size doesn't match the one recorded in the container.
  BD_ERRC_size_mismatch,
  /// (20) The patch requires a target tree, but none was provided.
  BD_ERRC_target_missing,
  /// (21) Unexpected end of stream.
  BD_ERRC_unexpected_eof,
  /// (22) Unsupported compression algorithm.
  BD_ERRC_unknown_comp,
  /// (23) Tree verification failed.
  BD_ERRC_verify,
  /// (24) Failed to walk a directory tree.
  BD_ERRC_walk,
  /// (25) Failed to start a worker thread.
  BD_ERRC_wt_start
};
/// @copydoc bd_errc
typedef enum bd_errc bd_errc;

/// Types of I/O operations that may fail.
enum bd_err_io_type {
  /// Not an I/O operation.
  BD_ERR_IO_TYPE_none,
  /// Creating or opening a file or directory.
  BD_ERR_IO_TYPE_open,
  /// Getting type, size or mode of a filesystem entry.
  BD_ERR_IO_TYPE_get_type,
  /// Listing directory entries.
  BD_ERR_IO_TYPE_list,
  /// Reading data from a file.
  BD_ERR_IO_TYPE_read,
  /// Writing data to a file.
  BD_ERR_IO_TYPE_write,
  /// Applying permission bits to a file or directory.
  BD_ERR_IO_TYPE_apply_mode,
  /// Moving a file or directory.
  BD_ERR_IO_TYPE_move,
  /// Deleting a file or directory.
  BD_ERR_IO_TYPE_delete,
  /// Creating a symbolic link.
  BD_ERR_IO_TYPE_symlink,
  /// Reading the target of a symbolic link.
  BD_ERR_IO_TYPE_readlink
};
/// @copydoc bd_err_io_type
typedef enum bd_err_io_type bd_err_io_type;

/// Broad error categories, used by callers to decide how to react to an error
///    without inspecting individual codes.
enum bd_err_category {
  /// Not an error.
  BD_ERR_CATEGORY_none,
  /// Read/write/open failure on a tree or a stream.
  BD_ERR_CATEGORY_io,
  /// Bad magic number, truncated stream or malformed record.
  BD_ERR_CATEGORY_format,
  /// Unsupported or corrupt compressed data.
  BD_ERR_CATEGORY_compression,
  /// Tree contents don't match the recorded sizes or hashes.
  BD_ERR_CATEGORY_corruption,
  /// The operation was refused before touching any data.
  BD_ERR_CATEGORY_precondition,
  /// Resource exhaustion or other internal failure.
  BD_ERR_CATEGORY_internal
};
/// @copydoc bd_err_category
typedef enum bd_err_category bd_err_category;

/// blockdelta error description structure.
typedef struct bd_err bd_err;
/// @copydoc bd_err
struct bd_err {
  // Type of the error. Defines which fields are set.
  bd_err_type type;
  /// Primary error code. Defines the outermost operation that has failed.
  bd_errc primary;
  /// Auxiliary error code, the value and type depend on @ref type.
  int auxiliary;
  /// Extra information value, the value and type depend on @ref type.
  int extra;
  /// May be set by certain errors to provide a file path, as a null-terminated
  ///    UTF-8 string.
  /// If set, must be freed with `free` after use, or with
  ///    @ref bd_err_release.
  const char *_Nullable uri;
};

/// Human-readable messages for @ref bd_err fields.
typedef struct bd_err_msgs bd_err_msgs;
/// @copydoc bd_err_msgs
struct bd_err_msgs {
  // Type of the error that the messages were produced for.
  bd_err_type type;
  /// String representation of @ref type.
  const char *_Nonnull type_str;
  /// Message for the primary error code.
  const char *_Nonnull primary;
  /// Message for the auxiliary error code, if the error has one.
  const char *_Nullable auxiliary;
  /// Message for the extra error code, if the error has one.
  const char *_Nullable extra;
  /// Message identifying type of string that `uri` refers to.
  const char *_Nullable uri_type;
};

//===-- Functions ---------------------------------------------------------===//

/// Check whether specified error structure indicates success.
///
/// @param [in] err
///    Pointer to the error structure to examine.
/// @return Value indicating whether @p err indicates success.
[[gnu::nothrow, gnu::nonnull(1), gnu::access(read_only, 1)]]
static inline bool bd_err_success(const bd_err *_Nonnull err) {
  return err->primary == BD_ERRC_ok;
}

#ifdef __cplusplus
extern "C" {
#endif // def __cplusplus

/// Get the category of specified error.
///
/// @param [in] err
///    Pointer to the error structure to classify.
/// @return Category that @p err belongs to.
[[gnu::BD_API, gnu::nonnull(1), gnu::access(read_only, 1)]]
bd_err_category bd_err_get_category(const bd_err *_Nonnull err);

/// Get human-readable messages for specified error structure.
///
/// @param [in] err
///    Pointer to the error structure to get messages for.
/// @return A structure containing messages for the error structure fields. It
///    must be released with @ref bd_err_release_msgs after use.
[[gnu::BD_API, gnu::nonnull(1), gnu::access(read_only, 1)]]
bd_err_msgs bd_err_get_msgs(const bd_err *_Nonnull err);

/// Release error messages.
///
/// @param [in, out] err_msgs
///    Pointer to the error messages structure to release.
[[gnu::BD_API, gnu::nonnull(1), gnu::access(read_write, 1)]]
void bd_err_release_msgs(bd_err_msgs *_Nonnull err_msgs);

/// Free the `uri` string of an error structure, if it's set.
///
/// @param [in, out] err
///    Pointer to the error structure to release.
[[gnu::BD_API, gnu::nonnull(1), gnu::access(read_write, 1)]]
void bd_err_release(bd_err *_Nonnull err);

#ifdef __cplusplus
} // extern "C"
#endif // def __cplusplus
