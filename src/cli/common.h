//===-- common.h - common blockdelta-cli declarations ---------------------===//
//
// Copyright (c) 2025 Nuclearist <nuclearist@teknology-hub.com>
// Part of blockdelta, under the GNU General Public License v3.0 or later
// See COPYING in the project root for license information.
// SPDX-License-Identifier: GPL-3.0-or-later
//
//===----------------------------------------------------------------------===//
///
/// @file
/// Declarations of types, global variables and functions used across multiple
///    modules.
///
//===----------------------------------------------------------------------===//
#pragma once

#include "config.h"
#include "blockdelta/base.h"
#include "blockdelta/content.h"
#include "blockdelta/error.h"
#include "blockdelta/os.h"

#include <stddef.h>
#include <stdint.h>
#ifdef BDB_GETTEXT
#include <libintl.h>

[[gnu::returns_nonnull, gnu::nonnull(1), gnu::access(read_only, 1)]]
static inline const char *_Nonnull bdl_gettext(const char *_Nonnull msg) {
  return dgettext("blockdelta", msg);
}

#else // def BDB_GETTEXT

#define bdl_gettext(msg) msg

#endif // def BDB_GETTEXT else

/// Global blockdelta-cli context.
typedef struct bdl_ctx bdl_ctx;
/// @copydoc bdl_ctx
struct bdl_ctx {
  /// Value indicating whether only errors should be printed.
  bool quiet;
  /// Value indicating whether a progress bar may be drawn on stderr.
  bool progress_bar;
  /// Value indicating whether a progress bar line is currently displayed.
  bool progress_shown;
  /// Tick count of the last progress bar update.
  uint64_t progress_ticks;
};

/// Command types.
enum bdl_cmd_type {
  /// Display help message.
  BDL_CMD_TYPE_help,
  /// Create a patch between two trees.
  BDL_CMD_TYPE_diff,
  /// Apply a patch.
  BDL_CMD_TYPE_apply,
  /// Create a signature of a tree.
  BDL_CMD_TYPE_sign,
  /// Verify a tree against a signature.
  BDL_CMD_TYPE_verify,
#ifdef BDB_CLI_DUMP
  /// Dump a signature or patch file in human-readable form to stdout.
  BDL_CMD_TYPE_dump
#endif // def BDB_CLI_DUMP
};
/// @copydoc bdl_cmd_type
typedef enum bdl_cmd_type bdl_cmd_type;

/// Command descriptor.
typedef struct bdl_command bdl_command;
/// @copydoc bdl_command
struct bdl_command {
  /// Type of the command.
  bdl_cmd_type type;
  union {
    /// "diff" command arguments.
    struct {
      /// Path to the target tree directory or its signature file, or
      ///    @ref BDL_OS_NULL_TREE.
      const bd_os_char *_Nonnull target;
      /// Path to the source tree directory, or @ref BDL_OS_NULL_TREE.
      const bd_os_char *_Nonnull source;
      /// Path to the patch file to create.
      const bd_os_char *_Nonnull patch;
      /// Compression descriptor for the patch and its signature.
      bd_comp_settings compression;
      /// Block size, `0` for default.
      int block_size;
      /// Number of threads for hashing the target tree, `0` for default.
      int num_threads;
      /// Value indicating whether the patch should be verified after it's
      ///    created.
      bool verify;
    } diff;
    /// "apply" command arguments.
    struct {
      /// Path to the patch file.
      const bd_os_char *_Nonnull patch;
      /// Path to the target tree directory, or @ref BDL_OS_NULL_TREE.
      const bd_os_char *_Nonnull target;
      /// Path to the output directory.
      const bd_os_char *_Nonnull output;
      /// Value indicating whether the target tree may be patched in place.
      bool in_place;
    } apply;
    /// "sign" command arguments.
    struct {
      /// Path to the tree directory.
      const bd_os_char *_Nonnull path;
      /// Path to the signature file to create.
      const bd_os_char *_Nonnull signature;
      /// Compression descriptor for the signature.
      bd_comp_settings compression;
      /// Block size, `0` for default.
      int block_size;
    } sign;
    /// "verify" command arguments.
    struct {
      /// Path to the signature file.
      const bd_os_char *_Nonnull signature;
      /// Path to the tree directory.
      const bd_os_char *_Nonnull path;
      /// Number of threads, `0` for default.
      int num_threads;
    } verify;
#ifdef BDB_CLI_DUMP
    /// "dump" command arguments.
    struct {
      /// Path to the signature or patch file.
      const bd_os_char *_Nonnull path;
    } dump;
#endif // def BDB_CLI_DUMP
  }; // union
};

/// Global instance of @ref bdl_ctx.
extern bdl_ctx bdl_g_ctx;

/// Display an error message for specified blockdelta error, and release it.
///
/// @param [in, out] err
///    Pointer to the blockdelta error object to display message for.
[[gnu::visibility("internal"), gnu::nonnull(1), gnu::access(read_write, 1)]]
void bdl_print_err(bd_err *_Nonnull err);

/// Print the help message.
[[gnu::visibility("internal")]]
void bdl_print_help(void);

/// Print an operation announcement line, unless in quiet mode.
[[gnu::visibility("internal"), gnu::format(printf, 1, 2)]]
void bdl_op(const char *_Nonnull fmt, ...);

/// Print a statistics line, unless in quiet mode.
[[gnu::visibility("internal"), gnu::format(printf, 1, 2)]]
void bdl_stat(const char *_Nonnull fmt, ...);

/// @ref bd_progress_func that draws a progress bar on stderr.
[[gnu::visibility("internal")]]
void bdl_progress(void *_Nullable data, int64_t current, int64_t total);

/// Finish the progress bar line, if one is displayed.
[[gnu::visibility("internal")]]
void bdl_progress_end(void);

/// Format a byte count with binary unit prefixes.
///
/// @param num_bytes
///    Number of bytes to format.
/// @param [out] buf
///    Buffer that receives the formatted null-terminated string.
/// @param buf_size
///    Size of the buffer pointed to by @p buf.
/// @return @p buf.
[[gnu::visibility("internal"), gnu::nonnull(2), gnu::access(write_only, 2, 3),
  gnu::returns_nonnull]]
char *_Nonnull bdl_humanize(int64_t num_bytes, char *_Nonnull buf,
                            size_t buf_size);

/// Print the size, entry counts and throughput line for a processed tree.
///
/// @param size
///    Total size of the tree's files, in bytes.
/// @param num_files
///    Number of files in the tree.
/// @param num_dirs
///    Number of directories in the tree.
/// @param num_symlinks
///    Number of symbolic links in the tree.
/// @param start_ticks
///    Tick count at the start of the operation.
[[gnu::visibility("internal")]]
void bdl_print_tree_stats(int64_t size, int num_files, int num_dirs,
                          int num_symlinks, uint64_t start_ticks);

/// Parse command-line arguments.
///
/// @param argc
///    Number of arguments passed to the program.
/// @param [in] argv
///    Pointer to the array of arguments passed to the program.
/// @param [out] cmd
///    Address of variable that receives the parsed command descriptor on
///    success.
/// @return Value indicating whether parsing succeeded.
[[gnu::visibility("internal"), gnu::nonnull(2, 3), gnu::access(read_only, 2, 1),
  gnu::access(write_only, 3)]]
bool bdl_parse_cmd(int argc, bd_os_char *_Nonnull *_Nonnull argv,
                   bdl_command *_Nonnull cmd);

/// Run a command.
///
/// @param [in] cmd
///    Pointer to the descriptor of the command to run.
/// @return Value indicating whether execution succeeded.
[[gnu::visibility("internal"), gnu::nonnull(1), gnu::access(read_only, 1)]]
bool bdl_run_cmd(const bdl_command *_Nonnull cmd);
