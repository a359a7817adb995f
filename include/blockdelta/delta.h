//===-- delta.h - blockdelta diff, apply and verify engines ---------------===//
//
// Copyright (c) 2025 Nuclearist <nuclearist@teknology-hub.com>
// Part of blockdelta, under the GNU General Public License v3.0 or later
// See COPYING in the project root for license information.
// SPDX-License-Identifier: GPL-3.0-or-later
//
//===----------------------------------------------------------------------===//
///
/// @file
/// Declarations of the engines that create patches, apply them, and verify
///    directory trees against signatures.
///
//===----------------------------------------------------------------------===//
#pragma once

#include "base.h"
#include "content.h"
#include "error.h"
#include "os.h"

#include <stdint.h>

//===-- Diff --------------------------------------------------------------===//

/// Input arguments for @ref bd_diff.
typedef struct bd_diff_args bd_diff_args;
/// @copydoc bd_diff_args
struct bd_diff_args {
  /// Pointer to the signature of the target tree, or `nullptr` to diff against
  ///    an empty tree.
  const bd_signature *_Nullable target_sig;
  /// Pointer to the container describing the source tree.
  const bd_container *_Nonnull source;
  /// Path to the root directory of the source tree, as a null-terminated
  ///    string. May be `nullptr` only if the source container has no files.
  const bd_os_char *_Nullable source_path;
  /// Compression descriptor for the patch stream and literal payloads.
  bd_comp_settings compression;
  /// Block size of the source signature written to @ref sig_handle, in bytes.
  ///    `0` selects the target signature's block size, or
  ///    @ref BD_DEFAULT_BLOCK_SIZE if there is no target signature.
  int block_size;
  /// Maximum size of a single literal operation, in bytes. `0` selects
  ///    @ref BD_DEFAULT_MAX_LITERAL_SIZE.
  int max_literal_size;
  /// Handle for the file to write the patch to, opened for writing.
  bd_os_handle patch_handle;
  /// Handle for the file to write the source tree's signature to, or
  ///    @ref BD_OS_INVALID_HANDLE to skip it.
  bd_os_handle sig_handle;
  /// Optional pointer to the progress callback.
  bd_progress_func *_Nullable progress;
  /// User data pointer passed to @ref progress.
  void *_Nullable progress_data;
};

/// Statistics of a @ref bd_diff run.
typedef struct bd_diff_stats bd_diff_stats;
/// @copydoc bd_diff_stats
struct bd_diff_stats {
  /// Number of source bytes expressed as copies of target data.
  int64_t reused_bytes;
  /// Number of source bytes stored as literals.
  int64_t fresh_bytes;
  /// Number of bytes written to the patch file.
  int64_t patch_size;
  /// Number of bytes written to the signature file.
  int64_t sig_size;
  /// Number of block copy operations emitted, after merging.
  int64_t num_copy_ops;
  /// Number of literal operations emitted.
  int64_t num_literal_ops;
};

//===-- Apply -------------------------------------------------------------===//

/// Input arguments for @ref bd_apply.
typedef struct bd_apply_args bd_apply_args;
/// @copydoc bd_apply_args
struct bd_apply_args {
  /// Handle for the patch file, opened for reading.
  bd_os_handle patch_handle;
  /// Path to the root directory of the target tree, as a null-terminated
  ///    string, or `nullptr` if the patch applies to an empty tree.
  const bd_os_char *_Nullable target_path;
  /// Path to the root directory of the output tree, as a null-terminated
  ///    string. Created if it doesn't exist.
  const bd_os_char *_Nonnull output_path;
  /// Value indicating whether @ref output_path may refer to the same directory
  ///    as @ref target_path.
  bool in_place;
  /// Optional pointer to the progress callback.
  bd_progress_func *_Nullable progress;
  /// User data pointer passed to @ref progress.
  void *_Nullable progress_data;
};

/// Result of a @ref bd_apply run.
typedef struct bd_apply_result bd_apply_result;
/// @copydoc bd_apply_result
struct bd_apply_result {
  /// Number of files written.
  int touched_files;
  /// Number of directories in the output tree.
  int num_dirs;
  /// Number of symbolic links in the output tree.
  int num_symlinks;
  /// Number of bytes written.
  int64_t bytes_written;
};

//===-- Verify ------------------------------------------------------------===//

/// Result of a @ref bd_verify run.
typedef struct bd_verify_result bd_verify_result;
/// @copydoc bd_verify_result
struct bd_verify_result {
  /// Number of reference blocks checked.
  int64_t num_blocks;
  /// Number of mismatching blocks, including blocks present on one side only.
  int64_t num_mismatches;
  /// Index of the file containing the first mismatching block, or `-1` if
  ///    there are none.
  int first_file_index;
  /// Index of the first mismatching block in its file, or `-1` if there are
  ///    none.
  int64_t first_block_index;
};

//===-- Functions ---------------------------------------------------------===//

#ifdef __cplusplus
extern "C" {
#endif // def __cplusplus

/// Create a patch that transforms the target tree into the source tree.
/// The patch stream has the layout
///    `magic | header | compressed[target container | source container |
///    per-file operation lists]`.
///
/// @param [in] args
///    Pointer to the input arguments.
/// @param [out] stats
///    Address of variable that receives statistics of the run on success.
/// @return A @ref bd_err indicating the result of operation.
[[gnu::BD_API, gnu::nonnull(1, 2), gnu::access(read_only, 1),
  gnu::access(write_only, 2)]]
bd_err bd_diff(const bd_diff_args *_Nonnull args,
               bd_diff_stats *_Nonnull stats);

/// Apply a patch, reconstructing the source tree in the output directory.
/// In-place application stages all output files first and modifies the target
///    tree only after every read from it has completed.
///
/// @param [in] args
///    Pointer to the input arguments.
/// @param [out] res
///    Address of variable that receives the result on success.
/// @return A @ref bd_err indicating the result of operation.
[[gnu::BD_API, gnu::nonnull(1, 2), gnu::access(read_only, 1),
  gnu::access(write_only, 2)]]
bd_err bd_apply(const bd_apply_args *_Nonnull args,
                bd_apply_result *_Nonnull res);

/// Verify a directory tree against a reference signature.
/// The tree is hashed using the reference container and block size, no walk
///    is performed.
///
/// @param [in] ref
///    Pointer to the reference signature.
/// @param [in] path
///    Path to the root directory of the tree, as a null-terminated string.
/// @param num_threads
///    Number of worker threads to use. `0` selects the number of logical
///    processors.
/// @param progress
///    Optional pointer to the progress callback.
/// @param [in, out] data
///    User data pointer passed to @p progress.
/// @param [out] res
///    Address of variable that receives the mismatch report. It's filled when
///    the function succeeds and when it fails with
///    @ref BD_ERRC_hash_mismatch.
/// @return A @ref bd_err indicating the result of operation. If any block
///    mismatches, the error is `{sub, verify, hash_mismatch}`.
[[gnu::BD_API, gnu::nonnull(1, 2, 6), gnu::access(read_only, 1),
  gnu::access(read_only, 2), gnu::access(write_only, 6)]]
bd_err bd_verify(const bd_signature *_Nonnull ref,
                 const bd_os_char *_Nonnull path, int num_threads,
                 bd_progress_func *_Nullable progress, void *_Nullable data,
                 bd_verify_result *_Nonnull res);

#ifdef __cplusplus
} // extern "C"
#endif // def __cplusplus
