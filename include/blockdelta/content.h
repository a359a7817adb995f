//===-- content.h - blockdelta content types and functions ----------------===//
//
// Copyright (c) 2025 Nuclearist <nuclearist@teknology-hub.com>
// Part of blockdelta, under the GNU General Public License v3.0 or later
// See COPYING in the project root for license information.
// SPDX-License-Identifier: GPL-3.0-or-later
//
//===----------------------------------------------------------------------===//
///
/// @file
/// Declarations of types and functions for describing directory trees and
///    their block signatures, and for reading patches.
///
/// blockdelta operates on 3 kinds of content objects:
///  Containers - immutable descriptions of a directory tree: its directories,
///    regular files and symbolic links, in a deterministic walk order. Files
///    are referenced by their index in the container's file array everywhere
///    else, so the order recorded in a container is never re-derived from the
///    filesystem after it was created.
///  Signatures - a container plus a (weak, strong) hash pair for each
///    fixed-size block of each file. They are the only thing the diff engine
///    needs to know about the old tree, and the reference the verify engine
///    checks a tree against.
///  Patches - per-file lists of operations that either copy a byte range
///    from a file of the old ("target") tree, or insert literal compressed
///    bytes. Applying a patch to the target tree reproduces the new ("source")
///    tree.
///
//===----------------------------------------------------------------------===//
#pragma once

#include "base.h"
#include "error.h"
#include "os.h"

#include <stdint.h>

//===-- Compression types -------------------------------------------------===//

/// Compression algorithms for signature and patch streams.
enum bd_comp_algo {
  /// Data is stored as-is.
  BD_COMP_ALGO_none,
  /// zlib deflate stream, quality is the compression level from 1 to 9.
  BD_COMP_ALGO_deflate,
  /// xz stream, quality is the preset level from 0 to 9.
  BD_COMP_ALGO_lzma,
  /// Zstandard frame, quality is the compression level from 1 to 22. Available
  ///    only if the library was built with Zstandard support.
  BD_COMP_ALGO_zstd
};
/// @copydoc bd_comp_algo
typedef enum bd_comp_algo bd_comp_algo;

/// Compression descriptor.
typedef struct bd_comp_settings bd_comp_settings;
/// @copydoc bd_comp_settings
struct bd_comp_settings {
  /// Compression algorithm.
  bd_comp_algo algo;
  /// Algorithm-specific quality level. Higher values produce smaller output
  ///    at the cost of more CPU time.
  int quality;
};

//===-- Container types ---------------------------------------------------===//

/// Types of container entries.
enum bd_ct_entry_type {
  /// Directory.
  BD_CT_ENTRY_TYPE_dir,
  /// Regular file.
  BD_CT_ENTRY_TYPE_file,
  /// Symbolic link.
  BD_CT_ENTRY_TYPE_symlink
};
/// @copydoc bd_ct_entry_type
typedef enum bd_ct_entry_type bd_ct_entry_type;

/// Container directory entry.
typedef struct bd_ct_dir bd_ct_dir;
/// @copydoc bd_ct_dir
struct bd_ct_dir {
  /// Path to the directory relative to tree root, with `/` separators, as a
  ///    null-terminated UTF-8 string.
  const char *_Nonnull path;
  /// Permission bits of the directory.
  uint32_t mode;
};

/// Container file entry.
typedef struct bd_ct_file bd_ct_file;
/// @copydoc bd_ct_file
struct bd_ct_file {
  /// Path to the file relative to tree root, with `/` separators, as a
  ///    null-terminated UTF-8 string.
  const char *_Nonnull path;
  /// Size of the file, in bytes.
  int64_t size;
  /// Offset of the file in the concatenation of all container files, in bytes.
  int64_t offset;
  /// Permission bits of the file.
  uint32_t mode;
};

/// Container symbolic link entry.
typedef struct bd_ct_symlink bd_ct_symlink;
/// @copydoc bd_ct_symlink
struct bd_ct_symlink {
  /// Path to the link relative to tree root, with `/` separators, as a
  ///    null-terminated UTF-8 string.
  const char *_Nonnull path;
  /// Target of the link, as a null-terminated UTF-8 string.
  const char *_Nonnull target;
  /// Permission bits of the link.
  uint32_t mode;
};

/// Directory tree description.
/// All entry arrays and strings are stored in a single buffer.
typedef struct bd_container bd_container;
/// @copydoc bd_container
struct bd_container {
  /// Pointer to the array of directory entries, in walk order.
  bd_ct_dir *_Nullable dirs;
  /// Pointer to the array of file entries, in walk order.
  bd_ct_file *_Nullable files;
  /// Pointer to the array of symbolic link entries, in walk order.
  bd_ct_symlink *_Nullable symlinks;
  /// Number of entries in @ref dirs.
  int num_dirs;
  /// Number of entries in @ref files.
  int num_files;
  /// Number of entries in @ref symlinks.
  int num_symlinks;
  /// Total size of all files, in bytes.
  int64_t size;
  /// Pointer to the buffer holding all entries and strings.
  void *_Nullable buf;
};

/// Container entry filter callback.
///
/// @param [in, out] data
///    User data pointer passed to @ref bd_ct_walk.
/// @param [in] path
///    Path to the entry relative to tree root, as a null-terminated UTF-8
///    string.
/// @param [in] name
///    Name of the entry (the last component of @p path), as a null-terminated
///    UTF-8 string.
/// @param type
///    Type of the entry.
/// @return Value indicating whether the entry should be included. Excluding a
///    directory excludes its whole subtree.
typedef bool bd_ct_filter_func(void *_Nullable data, const char *_Nonnull path,
                               const char *_Nonnull name,
                               bd_ct_entry_type type);

//===-- Signature types ---------------------------------------------------===//

/// Hash pair for a single block of file data.
typedef struct bd_block_hash bd_block_hash;
/// @copydoc bd_block_hash
struct bd_block_hash {
  /// Rolling checksum of the block.
  uint32_t weak;
  /// SHA-1 hash of the block.
  unsigned char strong[20];
};

/// Directory tree signature.
typedef struct bd_signature bd_signature;
/// @copydoc bd_signature
struct bd_signature {
  /// Description of the tree.
  bd_container container;
  /// Compression descriptor used when the signature is written.
  bd_comp_settings compression;
  /// Block size, in bytes.
  int block_size;
  /// Pointer to the array of all block hashes, grouped by file in container
  ///    order.
  bd_block_hash *_Nullable hashes;
  /// Number of elements in @ref hashes.
  int64_t num_hashes;
  /// Pointer to the array of `container.num_files + 1` indices into
  ///    @ref hashes. Hashes of file `i` occupy
  ///    [file_hash_offsets[i], file_hash_offsets[i + 1]).
  int64_t *_Nullable file_hash_offsets;
  /// Pointer to the buffer holding @ref hashes and @ref file_hash_offsets.
  void *_Nullable buf;
};

/// Block hash callback for @ref bd_sig_compute_stream.
///
/// @param [in, out] data
///    User data pointer passed to @ref bd_sig_compute_stream.
/// @param file_index
///    Index of the file in the container.
/// @param block_index
///    Index of the block in the file.
/// @param [in] hash
///    Pointer to the computed block hash.
/// @return Error to abort the computation with, or a success value to
///    continue.
typedef bd_err bd_block_hash_func(void *_Nullable data, int file_index,
                                  int64_t block_index,
                                  const bd_block_hash *_Nonnull hash);

//===-- Patch types -------------------------------------------------------===//

/// Patch operation types.
enum bd_patch_op_type {
  /// Copy a byte range from a target file.
  BD_PATCH_OP_TYPE_block_copy,
  /// Insert literal bytes.
  BD_PATCH_OP_TYPE_literal
};
/// @copydoc bd_patch_op_type
typedef enum bd_patch_op_type bd_patch_op_type;

/// Patch operation.
typedef struct bd_patch_op bd_patch_op;
/// @copydoc bd_patch_op
struct bd_patch_op {
  /// Type of the operation.
  bd_patch_op_type type;
  /// For @ref BD_PATCH_OP_TYPE_block_copy, index of the target file to copy
  ///    data from.
  int file_index;
  /// For @ref BD_PATCH_OP_TYPE_block_copy, offset of the range in the target
  ///    file, in bytes.
  int64_t offset;
  /// Number of bytes that the operation produces.
  int64_t length;
  /// For @ref BD_PATCH_OP_TYPE_literal, pointer to the compressed payload.
  const void *_Nullable data;
  /// For @ref BD_PATCH_OP_TYPE_literal, size of the compressed payload, in
  ///    bytes.
  int data_size;
};

/// Operation list of a single source file.
typedef struct bd_patch_file bd_patch_file;
/// @copydoc bd_patch_file
struct bd_patch_file {
  /// Pointer to the first operation of the file.
  bd_patch_op *_Nullable ops;
  /// Number of operations of the file.
  int num_ops;
};

/// Fully loaded patch, used for inspection.
typedef struct bd_patch bd_patch;
/// @copydoc bd_patch
struct bd_patch {
  /// Compression descriptor of the patch stream and literal payloads.
  bd_comp_settings compression;
  /// Description of the tree that the patch applies to.
  bd_container target;
  /// Description of the tree that the patch produces.
  bd_container source;
  /// Pointer to the array of `source.num_files` operation lists.
  bd_patch_file *_Nullable files;
  /// Pointer to the array of all operations.
  bd_patch_op *_Nullable ops;
  /// Number of elements in @ref ops.
  int64_t num_ops;
  /// Pointer to the buffer holding operation lists, operations and literal
  ///    payloads.
  void *_Nullable buf;
};

//===-- Functions ---------------------------------------------------------===//

/// Get default compression settings.
///
/// @return Settings selecting deflate at level 1.
[[gnu::nothrow, gnu::const]]
static inline bd_comp_settings bd_comp_default(void) {
  return
#ifdef __cplusplus
      {.algo = BD_COMP_ALGO_deflate, .quality = 1};
#else  // def __cplusplus
      (bd_comp_settings){.algo = BD_COMP_ALGO_deflate, .quality = 1};
#endif // def __cplusplus else
}

/// Get the number of blocks of a signature's file.
///
/// @param [in] sig
///    Pointer to the signature.
/// @param file_index
///    Index of the file in the signature's container.
/// @return Number of block hashes recorded for the file.
[[gnu::nothrow, gnu::nonnull(1), gnu::access(read_only, 1)]]
static inline int64_t bd_sig_num_file_blocks(const bd_signature *_Nonnull sig,
                                             int file_index) {
  return sig->file_hash_offsets[file_index + 1] -
         sig->file_hash_offsets[file_index];
}

#ifdef __cplusplus
extern "C" {
#endif // def __cplusplus

//===--- Compression functions --------------------------------------------===//

/// Check whether the library was built with support for specified compression
///    algorithm.
///
/// @param algo
///    Compression algorithm to check.
/// @return Value indicating whether @p algo is supported.
[[gnu::BD_API, gnu::const]] bool bd_comp_supported(bd_comp_algo algo);

//===--- Container functions ----------------------------------------------===//

/// Filter that excludes version control and OS metadata entries: `.git`,
///    `.hg`, `.svn`, `.DS_Store`, `__MACOSX`, `Thumbs.db`, and names
///    starting with `._`.
[[gnu::BD_API, gnu::nonnull(2, 3), gnu::access(read_only, 2),
  gnu::access(read_only, 3)]]
bool bd_ct_default_filter(void *_Nullable data, const char *_Nonnull path,
                          const char *_Nonnull name, bd_ct_entry_type type);

/// Walk a directory tree and describe it in a container.
/// Entries inside each directory are visited in bytewise name order, depth
///    first. Special files (FIFOs, sockets, devices) are skipped.
///
/// @param [in] path
///    Path to the root directory of the tree, as a null-terminated string.
/// @param filter
///    Optional pointer to the entry filter function.
/// @param [in, out] data
///    User data pointer passed to @p filter.
/// @param [out] ct
///    Address of variable that receives the container on success. It must be
///    freed with @ref bd_ct_free after use.
/// @return A @ref bd_err indicating the result of operation.
[[gnu::BD_API, gnu::nonnull(1, 4), gnu::access(read_only, 1),
  gnu::access(write_only, 4)]]
bd_err bd_ct_walk(const bd_os_char *_Nonnull path,
                  bd_ct_filter_func *_Nullable filter, void *_Nullable data,
                  bd_container *_Nonnull ct);

/// Free all memory allocated for the container.
///
/// @param [in, out] ct
///    Pointer to the container to free.
[[gnu::BD_API, gnu::nonnull(1), gnu::access(read_write, 1)]]
void bd_ct_free(bd_container *_Nonnull ct);

//===--- Signature functions ----------------------------------------------===//

/// Compute the signature of a directory tree.
/// Files are hashed in parallel, the result doesn't depend on the number of
///    threads.
///
/// @param [in] ct
///    Pointer to the container describing the tree. It is copied into the
///    signature.
/// @param [in] path
///    Path to the root directory of the tree, as a null-terminated string.
/// @param block_size
///    Block size to use, in bytes. `0` selects @ref BD_DEFAULT_BLOCK_SIZE.
/// @param num_threads
///    Number of worker threads to use. `0` selects the number of logical
///    processors.
/// @param progress
///    Optional pointer to the progress callback.
/// @param [in, out] data
///    User data pointer passed to @p progress.
/// @param [out] sig
///    Address of variable that receives the signature on success. Its
///    compression descriptor is set to @ref bd_comp_default. It must be freed
///    with @ref bd_sig_free after use.
/// @return A @ref bd_err indicating the result of operation.
[[gnu::BD_API, gnu::nonnull(1, 2, 7), gnu::access(read_only, 1),
  gnu::access(read_only, 2), gnu::access(write_only, 7)]]
bd_err bd_sig_compute(const bd_container *_Nonnull ct,
                      const bd_os_char *_Nonnull path, int block_size,
                      int num_threads, bd_progress_func *_Nullable progress,
                      void *_Nullable data, bd_signature *_Nonnull sig);

/// Compute block hashes of a directory tree sequentially, passing each one to
///    a callback instead of storing them. Hashes are delivered in container
///    order.
///
/// @param [in] ct
///    Pointer to the container describing the tree.
/// @param [in] path
///    Path to the root directory of the tree, as a null-terminated string.
/// @param block_size
///    Block size to use, in bytes.
/// @param on_hash
///    Pointer to the function that receives block hashes.
/// @param progress
///    Optional pointer to the progress callback.
/// @param [in, out] data
///    User data pointer passed to @p on_hash and @p progress.
/// @return A @ref bd_err indicating the result of operation. If @p on_hash
///    returns an error, that error is returned as-is.
[[gnu::BD_API, gnu::nonnull(1, 2, 4), gnu::access(read_only, 1),
  gnu::access(read_only, 2)]]
bd_err bd_sig_compute_stream(const bd_container *_Nonnull ct,
                             const bd_os_char *_Nonnull path, int block_size,
                             bd_block_hash_func *_Nonnull on_hash,
                             bd_progress_func *_Nullable progress,
                             void *_Nullable data);

/// Write a signature to a file.
///
/// @param [in] sig
///    Pointer to the signature to write. Its compression descriptor selects
///    the stream compression.
/// @param handle
///    Handle for the file to write to, opened for writing.
/// @param [out] size
///    Optional address of variable that receives the number of bytes written.
/// @return A @ref bd_err indicating the result of operation.
[[gnu::BD_API, gnu::nonnull(1), gnu::access(read_only, 1),
  gnu::access(write_only, 3)]]
bd_err bd_sig_write(const bd_signature *_Nonnull sig, bd_os_handle handle,
                    int64_t *_Nullable size);

/// Hash a directory tree and write its signature to a file without keeping
///    block hashes in memory.
///
/// @param [in] ct
///    Pointer to the container describing the tree.
/// @param [in] path
///    Path to the root directory of the tree, as a null-terminated string.
/// @param block_size
///    Block size to use, in bytes. `0` selects @ref BD_DEFAULT_BLOCK_SIZE.
/// @param compression
///    Compression descriptor for the stream.
/// @param handle
///    Handle for the file to write to, opened for writing.
/// @param progress
///    Optional pointer to the progress callback.
/// @param [in, out] data
///    User data pointer passed to @p progress.
/// @param [out] size
///    Optional address of variable that receives the number of bytes written.
/// @return A @ref bd_err indicating the result of operation.
[[gnu::BD_API, gnu::nonnull(1, 2), gnu::access(read_only, 1),
  gnu::access(read_only, 2), gnu::access(write_only, 8)]]
bd_err bd_sig_write_tree(const bd_container *_Nonnull ct,
                         const bd_os_char *_Nonnull path, int block_size,
                         bd_comp_settings compression, bd_os_handle handle,
                         bd_progress_func *_Nullable progress,
                         void *_Nullable data, int64_t *_Nullable size);

/// Read a signature from a file.
///
/// @param handle
///    Handle for the file to read from, opened for reading.
/// @param [out] sig
///    Address of variable that receives the signature on success. It must be
///    freed with @ref bd_sig_free after use.
/// @return A @ref bd_err indicating the result of operation.
[[gnu::BD_API, gnu::nonnull(2), gnu::access(write_only, 2)]]
bd_err bd_sig_read(bd_os_handle handle, bd_signature *_Nonnull sig);

/// Free all memory allocated for the signature.
///
/// @param [in, out] sig
///    Pointer to the signature to free.
[[gnu::BD_API, gnu::nonnull(1), gnu::access(read_write, 1)]]
void bd_sig_free(bd_signature *_Nonnull sig);

//===--- Patch functions --------------------------------------------------===//

/// Read a whole patch from a file into memory.
///
/// @param handle
///    Handle for the file to read from, opened for reading.
/// @param [out] patch
///    Address of variable that receives the patch on success. It must be freed
///    with @ref bd_patch_free after use.
/// @return A @ref bd_err indicating the result of operation.
[[gnu::BD_API, gnu::nonnull(2), gnu::access(write_only, 2)]]
bd_err bd_patch_read(bd_os_handle handle, bd_patch *_Nonnull patch);

/// Free all memory allocated for the patch.
///
/// @param [in, out] patch
///    Pointer to the patch to free.
[[gnu::BD_API, gnu::nonnull(1), gnu::access(read_write, 1)]]
void bd_patch_free(bd_patch *_Nonnull patch);

#ifdef __cplusplus
} // extern "C"
#endif // def __cplusplus
