//===-- os.h - OS-specific blockdelta-cli declarations --------------------===//
//
// Copyright (c) 2025 Nuclearist <nuclearist@teknology-hub.com>
// Part of blockdelta, under the GNU General Public License v3.0 or later
// See COPYING in the project root for license information.
// SPDX-License-Identifier: GPL-3.0-or-later
//
//===----------------------------------------------------------------------===//
///
/// @file
/// Declarations of OS-specific functions used by blockdelta-cli.
///
//===----------------------------------------------------------------------===//
#pragma once

#include "blockdelta/base.h" // IWYU pragma: keep
#include "blockdelta/error.h"
#include "blockdelta/os.h"

#include <stdint.h>

//===-- OS-specific declarations ------------------------------------------===//

#ifdef __linux__

/// @def BDL_OS_PRI_str
/// Format specifier for printing @ref bd_os_char strings via printf family
///     of functions.
#define BDL_OS_PRI_str "s"
/// @def BDL_OS_NULL_TREE
/// Path that stands for the empty tree in command-line arguments.
#define BDL_OS_NULL_TREE "/dev/null"

#endif // def __linux__

//===-- Functions ---------------------------------------------------------===//

/// Create a @ref bd_err describing a failed I/O operation on specified path.
///
/// @param prim
///    Primary error code.
/// @param errc
///    OS error code.
/// @param io_type
///    Type of the I/O operation that failed.
/// @param [in] path
///    Path to the affected file, as a null-terminated string. It's copied into
///    the error's `uri`.
/// @return A @ref bd_err describing the I/O error.
[[gnu::visibility("internal"), gnu::nonnull(4), gnu::access(read_only, 4)]]
bd_err bdl_os_io_err(bd_errc prim, bd_os_errc errc, bd_err_io_type io_type,
                     const bd_os_char *_Nonnull path);

//===-- General functions -------------------------------------------------===//

/// Close operating system resource handle.
///
/// @param handle
///    OS handle to close.
[[gnu::visibility("internal")]]
void bdl_os_close_handle(bd_os_handle handle);

/// Get the last error code set by a system call.
///
/// @return OS-specific error code.
[[gnu::visibility("internal")]]
bd_os_errc bdl_os_get_last_error(void);

/// Get the number of milliseconds passed since some point in the past, where
///    the point is guaranteed to be consistent during program runtime.
///
/// @return Number of milliseconds passed since some point in the past.
[[gnu::visibility("internal")]]
uint64_t bdl_os_get_ticks(void);

/// Check whether the standard error stream refers to a terminal.
///
/// @return Value indicating whether stderr is a terminal.
[[gnu::visibility("internal")]]
bool bdl_os_stderr_is_tty(void);

//===-- I/O functions -----------------------------------------------------===//

/// Check whether a path refers to a directory, following symbolic links.
///
/// @param [in] path
///    Path to check, as a null-terminated string.
/// @param [out] is_dir
///    Address of variable that receives the result on success.
/// @return Value indicating whether the function succeeded. Use
///    @ref bdl_os_get_last_error to get the error code in case of failure.
[[gnu::visibility("internal"), gnu::nonnull(1, 2), gnu::access(read_only, 1),
  gnu::access(write_only, 2)]]
bool bdl_os_is_dir(const bd_os_char *_Nonnull path, bool *_Nonnull is_dir);

/// Open a file for reading.
///
/// @param [in] path
///    Path to the file to open, as a null-terminated string.
/// @return Handle for the opened file, or @ref BD_OS_INVALID_HANDLE if the
///    function fails. Use @ref bdl_os_get_last_error to get the error code.
///    The returned handle must be closed with @ref bdl_os_close_handle after
///    use.
[[gnu::visibility("internal"), gnu::nonnull(1), gnu::access(read_only, 1)]]
bd_os_handle bdl_os_file_open(const bd_os_char *_Nonnull path);

/// Create a file for writing, or truncate it if it exists.
///
/// @param [in] path
///    Path to the file to create, as a null-terminated string.
/// @return Handle for the created file, or @ref BD_OS_INVALID_HANDLE if the
///    function fails. Use @ref bdl_os_get_last_error to get the error code.
///    The returned handle must be closed with @ref bdl_os_close_handle after
///    use.
[[gnu::visibility("internal"), gnu::nonnull(1), gnu::access(read_only, 1)]]
bd_os_handle bdl_os_file_create(const bd_os_char *_Nonnull path);

/// Create a new uniquely named directory in the system's temporary directory.
///
/// @return Path to the created directory, as a heap-allocated null-terminated
///    string, or `NULL` if the function fails. Use
///    @ref bdl_os_get_last_error to get the error code. The returned pointer
///    must be freed with `free` after use.
[[gnu::visibility("internal")]]
bd_os_char *_Nullable bdl_os_make_temp_dir(void);

/// Delete a directory with all its contents.
///
/// @param [in] path
///    Path to the directory to delete, as a null-terminated string.
/// @return Value indicating whether the function succeeded. Use
///    @ref bdl_os_get_last_error to get the error code in case of failure.
[[gnu::visibility("internal"), gnu::nonnull(1), gnu::access(read_only, 1)]]
bool bdl_os_remove_tree(const bd_os_char *_Nonnull path);
