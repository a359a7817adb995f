//===-- os.h - OS-specific code -------------------------------------------===//
//
// Copyright (c) 2025 Nuclearist <nuclearist@teknology-hub.com>
// Part of blockdelta, under the GNU General Public License v3.0 or later
// See COPYING in the project root for license information.
// SPDX-License-Identifier: GPL-3.0-or-later
//
//===----------------------------------------------------------------------===//
///
/// @file
/// Declarations of macros, types and functions that are implemented
///    differently on different operating systems. Implementations are provided
///    by corresponding os_*.cpp.
///
//===----------------------------------------------------------------------===//
#pragma once

#include "blockdelta/base.h" // IWYU pragma: keep
#include "blockdelta/error.h"
#include "blockdelta/os.h"

#include <stddef.h>
#include <stdint.h>

//===-- OS-specific declarations ------------------------------------------===//

#ifdef __linux__

#include <errno.h> // IWYU pragma: keep
#include <fcntl.h> // IWYU pragma: keep

/// @def BDI_OS_CWD_HANDLE
/// Pseudo-handle referring to the current working directory, accepted by
///    functions with a parent directory handle parameter.
#define BDI_OS_CWD_HANDLE AT_FDCWD
/// @def BDI_OS_ERR_ALREADY_EXISTS
/// @ref bd_os_errc value indicating that target file/directory already exists.
#define BDI_OS_ERR_ALREADY_EXISTS EEXIST
/// @def BDI_OS_ERR_DIR_NOT_EMPTY
/// @ref bd_os_errc value indicating that target directory is not empty.
#define BDI_OS_ERR_DIR_NOT_EMPTY ENOTEMPTY
/// @def BDI_OS_ERR_FILE_NOT_FOUND
/// @ref bd_os_errc value indicating that a file was not found.
#define BDI_OS_ERR_FILE_NOT_FOUND ENOENT
/// @def BDI_OS_ERR_IS_DIR
/// @ref bd_os_errc value indicating that target pathname is a directory.
#define BDI_OS_ERR_IS_DIR EISDIR
/// @def BDI_OS_ERR_EOF
/// @ref bd_os_errc value reported when a file ends before the requested
///    number of bytes could be read.
#define BDI_OS_ERR_EOF ENODATA

#endif // def __linux__

//===-- OS-independent types ----------------------------------------------===//

/// Filesystem entry types distinguished by the library.
enum bdi_os_entry_type {
  /// Directory.
  BDI_OS_ENTRY_TYPE_dir,
  /// Regular file.
  BDI_OS_ENTRY_TYPE_file,
  /// Symbolic link.
  BDI_OS_ENTRY_TYPE_symlink,
  /// Any other kind of entry (FIFO, socket, device).
  BDI_OS_ENTRY_TYPE_other
};
/// @copydoc bdi_os_entry_type
typedef enum bdi_os_entry_type bdi_os_entry_type;

/// Filesystem entry status.
typedef struct bdi_os_stat bdi_os_stat;
/// @copydoc bdi_os_stat
struct bdi_os_stat {
  /// Type of the entry.
  bdi_os_entry_type type;
  /// Permission bits of the entry.
  uint32_t mode;
  /// For regular files, size of the file, in bytes.
  int64_t size;
};

/// Directory listing callback.
///
/// @param [in, out] data
///    User data pointer passed to @ref bdi_os_dir_list.
/// @param [in] name
///    Name of the entry, as a null-terminated string.
typedef void bdi_os_dir_list_func(void *_Nullable data,
                                  const bd_os_char *_Nonnull name);

//===-- Functions ---------------------------------------------------------===//

#ifdef __cplusplus
extern "C" {
#endif // def __cplusplus

//===-- General functions -------------------------------------------------===//

/// Close operating system resource handle.
///
/// @param handle
///    OS handle to close.
[[gnu::visibility("internal")]]
void bdi_os_close_handle(bd_os_handle handle);

/// Get the message for specified error code.
///
/// @param errc
///    OS error code to get the message for.
/// @return Human-readable message for @p errc, as a heap-allocated
///    null-terminated UTF-8 string. It must be freed with `free` after use.
[[gnu::visibility("internal"), gnu::returns_nonnull]]
char *_Nonnull bdi_os_get_err_msg(bd_os_errc errc);

/// Get the last error code set by a system call.
///
/// @return OS-specific error code.
[[gnu::visibility("internal")]] bd_os_errc bdi_os_get_last_error(void);

/// Get the number of available logical processors in the system.
///
/// @return Number of available logical processors.
[[gnu::visibility("internal")]] int bdi_os_get_nproc(void);

//===-- I/O functions -----------------------------------------------------===//

/// Create an I/O error object for specified file/directory handle and OS error
///    code.
///
/// @param handle
///    Handle for the file/directory.
/// @param prim
///    Primary error code.
/// @param errc
///    OS error code.
/// @param io_type
///    Type of the I/O operation that failed.
/// @return A @ref bd_err describing the I/O error.
[[gnu::visibility("internal")]]
bd_err bdi_os_io_err(bd_os_handle handle, bd_errc prim, bd_os_errc errc,
                     bd_err_io_type io_type);

/// Create an I/O error object for specified parent directory handle,
///     file/directory name, and OS error code.
///
/// @param parent_dir_handle
///    Handle for the parent directory.
/// @param [in] name
///    Name of the file/directory that was subject to failed I/O operation, as a
///    null-terminated string.
/// @param prim
///    Primary error code.
/// @param errc
///    OS error code.
/// @param io_type
///    Type of the I/O operation that failed.
/// @return A @ref bd_err describing the I/O error.
[[gnu::visibility("internal"), gnu::nonnull(2), gnu::access(read_only, 2)]]
bd_err bdi_os_io_err_at(bd_os_handle parent_dir_handle,
                        const bd_os_char *_Nonnull name, bd_errc prim,
                        bd_os_errc errc, bd_err_io_type io_type);

/// Get status of a filesystem entry at specified directory, without following
///    symbolic links.
///
/// @param parent_dir_handle
///    Handle for the parent directory.
/// @param [in] name
///    Relative path to the entry, as a null-terminated string.
/// @param [out] st
///    Address of variable that receives the entry status.
/// @return Value indicating whether the function succeeded. Use
///    @ref bdi_os_get_last_error to get the error code in case of failure.
[[gnu::visibility("internal"), gnu::nonnull(2, 3), gnu::access(read_only, 2),
  gnu::access(write_only, 3)]]
bool bdi_os_stat_at(bd_os_handle parent_dir_handle,
                    const bd_os_char *_Nonnull name, bdi_os_stat *_Nonnull st);

/// Get status of an open file.
///
/// @param handle
///    OS handle for the file.
/// @param [out] st
///    Address of variable that receives the file status.
/// @return Value indicating whether the function succeeded. Use
///    @ref bdi_os_get_last_error to get the error code in case of failure.
[[gnu::visibility("internal"), gnu::nonnull(2), gnu::access(write_only, 2)]]
bool bdi_os_file_stat(bd_os_handle handle, bdi_os_stat *_Nonnull st);

/// Check whether two paths refer to the same directory. Paths that exist are
///    compared by device and inode numbers, other ones lexically after
///    normalization.
///
/// @param [in] left
///    The first path to compare, as a null-terminated string.
/// @param [in] right
///    The second path to compare, as a null-terminated string.
/// @return Value indicating whether @p left and @p right refer to the same
///    directory.
[[gnu::visibility("internal"), gnu::nonnull(1, 2), gnu::access(read_only, 1),
  gnu::access(read_only, 2)]]
bool bdi_os_same_dir(const bd_os_char *_Nonnull left,
                     const bd_os_char *_Nonnull right);

//===--- Directory functions ----------------------------------------------===//

/// Open a directory.
///
/// @param [in] path
///    Path to the directory to open, as a null-terminated string.
/// @return Handle for the opened directory, or @ref BD_OS_INVALID_HANDLE if
///    the function fails. Use @ref bdi_os_get_last_error to get the error
///    code. The returned handle must be closed with @ref bdi_os_close_handle
///    after use.
[[gnu::visibility("internal"), gnu::nonnull(1), gnu::access(read_only, 1)]]
bd_os_handle bdi_os_dir_open(const bd_os_char *_Nonnull path);

/// Open a directory, or create it if it doesn't exist.
///
/// @param [in] path
///    Path to the directory to open/create, as a null-terminated string.
/// @return Handle for the opened directory, or @ref BD_OS_INVALID_HANDLE if
///    the function fails. Use @ref bdi_os_get_last_error to get the error
///    code. The returned handle must be closed with @ref bdi_os_close_handle
///    after use.
[[gnu::visibility("internal"), gnu::nonnull(1), gnu::access(read_only, 1)]]
bd_os_handle bdi_os_dir_create(const bd_os_char *_Nonnull path);

/// Open a subdirectory at specified directory.
///
/// @param parent_dir_handle
///    Handle for the parent directory.
/// @param [in] name
///    Relative path to the subdirectory to open, as a null-terminated string.
/// @return Handle for the opened subdirectory, or @ref BD_OS_INVALID_HANDLE
///    if the function fails. Use @ref bdi_os_get_last_error to get the error
///    code. The returned handle must be closed with @ref bdi_os_close_handle
///    after use.
[[gnu::visibility("internal"), gnu::nonnull(2), gnu::access(read_only, 2)]]
bd_os_handle bdi_os_dir_open_at(bd_os_handle parent_dir_handle,
                                const bd_os_char *_Nonnull name);

/// Create a subdirectory at specified directory. An existing directory is
///    not an error.
///
/// @param parent_dir_handle
///    Handle for the parent directory.
/// @param [in] name
///    Relative path to the subdirectory to create, as a null-terminated
///    string. Its parent must exist.
/// @param mode
///    Permission bits to create the directory with.
/// @return Value indicating whether the function succeeded. Use
///    @ref bdi_os_get_last_error to get the error code in case of failure.
[[gnu::visibility("internal"), gnu::nonnull(2), gnu::access(read_only, 2)]]
bool bdi_os_dir_create_at(bd_os_handle parent_dir_handle,
                          const bd_os_char *_Nonnull name, uint32_t mode);

/// Create a new uniquely named subdirectory at specified directory.
///
/// @param parent_dir_handle
///    Handle for the parent directory.
/// @param [in] prefix
///    Name prefix for the subdirectory, as a null-terminated string.
/// @param [out] name
///    Pointer to the buffer that receives the name of created subdirectory,
///    as a null-terminated string.
/// @param name_size
///    Size of the buffer pointed to by @p name, in characters.
/// @return Handle for the created subdirectory, or @ref BD_OS_INVALID_HANDLE
///    if the function fails. Use @ref bdi_os_get_last_error to get the error
///    code. The returned handle must be closed with @ref bdi_os_close_handle
///    after use.
[[gnu::visibility("internal"), gnu::nonnull(2, 3), gnu::access(read_only, 2),
  gnu::access(write_only, 3, 4)]]
bd_os_handle bdi_os_dir_create_unique_at(bd_os_handle parent_dir_handle,
                                         const bd_os_char *_Nonnull prefix,
                                         bd_os_char *_Nonnull name,
                                         int name_size);

/// Call a function for every entry of a directory, except `.` and `..`.
/// Entries are passed in unspecified order.
///
/// @param handle
///    Handle for the directory to list. The function doesn't take ownership
///    of it.
/// @param cb
///    Pointer to the function to call for each entry.
/// @param [in, out] data
///    User data pointer passed to @p cb.
/// @return Value indicating whether the function succeeded. Use
///    @ref bdi_os_get_last_error to get the error code in case of failure.
[[gnu::visibility("internal"), gnu::nonnull(2)]]
bool bdi_os_dir_list(bd_os_handle handle, bdi_os_dir_list_func *_Nonnull cb,
                     void *_Nullable data);

/// Delete an empty subdirectory at specified directory.
///
/// @param parent_dir_handle
///    Handle for the parent directory.
/// @param [in] name
///    Relative path to the subdirectory to delete, as a null-terminated
///    string.
/// @return Value indicating whether the function succeeded. Use
///    @ref bdi_os_get_last_error to get the error code in case of failure.
[[gnu::visibility("internal"), gnu::nonnull(2), gnu::access(read_only, 2)]]
bool bdi_os_dir_delete_at(bd_os_handle parent_dir_handle,
                          const bd_os_char *_Nonnull name);

//===--- File functions ---------------------------------------------------===//

/// Open a file at specified directory for reading.
///
/// @param parent_dir_handle
///    Handle for the parent directory.
/// @param [in] name
///    Relative path to the file to open, as a null-terminated string.
/// @return Handle for the opened file, or @ref BD_OS_INVALID_HANDLE if the
///    function fails. Use @ref bdi_os_get_last_error to get the error code.
///    The returned handle must be closed with @ref bdi_os_close_handle after
///    use.
[[gnu::visibility("internal"), gnu::nonnull(2), gnu::access(read_only, 2)]]
bd_os_handle bdi_os_file_open_at(bd_os_handle parent_dir_handle,
                                 const bd_os_char *_Nonnull name);

/// Create a file at specified directory for writing, or truncate it if it
///    exists.
///
/// @param parent_dir_handle
///    Handle for the parent directory.
/// @param [in] name
///    Relative path to the file to create, as a null-terminated string.
/// @return Handle for the created file, or @ref BD_OS_INVALID_HANDLE if the
///    function fails. Use @ref bdi_os_get_last_error to get the error code.
///    The returned handle must be closed with @ref bdi_os_close_handle after
///    use.
[[gnu::visibility("internal"), gnu::nonnull(2), gnu::access(read_only, 2)]]
bd_os_handle bdi_os_file_create_at(bd_os_handle parent_dir_handle,
                                   const bd_os_char *_Nonnull name);

/// Read up to @p n bytes from file at its current position.
///
/// @param handle
///    OS handle for the file.
/// @param [out] buf
///    Pointer to the buffer that receives the read data.
/// @param n
///    Maximum number of bytes to read.
/// @return Number of bytes read, `0` at end of file, or `-1` on failure. Use
///    @ref bdi_os_get_last_error to get the error code in case of failure.
[[gnu::visibility("internal"), gnu::nonnull(2), gnu::access(write_only, 2, 3)]]
int64_t bdi_os_file_read_some(bd_os_handle handle, void *_Nonnull buf,
                              size_t n);

/// Read data from file at specified offset. Exactly @p n bytes will be read.
///
/// @param handle
///    OS handle for the file.
/// @param [out] buf
///    Pointer to the buffer that receives the read data.
/// @param n
///    Number of bytes to read.
/// @param offset
///    Offset in the file to read from, in bytes.
/// @return Value indicating whether the function succeeded. Use
///    @ref bdi_os_get_last_error to get the error code in case of failure,
///    which is @ref BDI_OS_ERR_EOF if the file is too short.
[[gnu::visibility("internal"), gnu::nonnull(2), gnu::access(write_only, 2, 3)]]
bool bdi_os_file_read_at(bd_os_handle handle, void *_Nonnull buf, size_t n,
                         int64_t offset);

/// Write data to file. Exactly @p n bytes will be written.
///
/// @param handle
///    OS handle for the file.
/// @param [in] buf
///    Pointer to the buffer containing the data to write.
/// @param n
///    Number of bytes to write.
/// @return Value indicating whether the function succeeded. Use
///    @ref bdi_os_get_last_error to get the error code in case of failure.
[[gnu::visibility("internal"), gnu::nonnull(2), gnu::access(read_only, 2, 3)]]
bool bdi_os_file_write(bd_os_handle handle, const void *_Nonnull buf,
                       size_t n);

/// Apply permission bits to an open file or directory.
///
/// @param handle
///    OS handle for the file or directory.
/// @param mode
///    Permission bits to apply.
/// @return Value indicating whether the function succeeded. Use
///    @ref bdi_os_get_last_error to get the error code in case of failure.
[[gnu::visibility("internal")]]
bool bdi_os_file_set_mode(bd_os_handle handle, uint32_t mode);

/// Move a file or directory, replacing the destination file if it exists.
///
/// @param src_dir_handle
///    Handle for the directory to move the entry from.
/// @param [in] src_name
///    Relative path to the entry to move, as a null-terminated string.
/// @param tgt_dir_handle
///    Handle for the directory to move the entry to.
/// @param [in] tgt_name
///    Relative path to the destination, as a null-terminated string.
/// @return Value indicating whether the function succeeded. Use
///    @ref bdi_os_get_last_error to get the error code in case of failure.
[[gnu::visibility("internal"), gnu::nonnull(2, 4), gnu::access(read_only, 2),
  gnu::access(read_only, 4)]]
bool bdi_os_file_move(bd_os_handle src_dir_handle,
                      const bd_os_char *_Nonnull src_name,
                      bd_os_handle tgt_dir_handle,
                      const bd_os_char *_Nonnull tgt_name);

/// Delete a file or a symbolic link at specified directory.
///
/// @param parent_dir_handle
///    Handle for the parent directory.
/// @param [in] name
///    Relative path to the entry to delete, as a null-terminated string.
/// @return Value indicating whether the function succeeded. Use
///    @ref bdi_os_get_last_error to get the error code in case of failure.
[[gnu::visibility("internal"), gnu::nonnull(2), gnu::access(read_only, 2)]]
bool bdi_os_file_delete_at(bd_os_handle parent_dir_handle,
                           const bd_os_char *_Nonnull name);

//===--- Symbolic link functions ------------------------------------------===//

/// Create a symbolic link at specified directory.
///
/// @param [in] target
///    Target of the link, as a null-terminated string.
/// @param parent_dir_handle
///    Handle for the parent directory.
/// @param [in] name
///    Relative path to the link to create, as a null-terminated string.
/// @return Value indicating whether the function succeeded. Use
///    @ref bdi_os_get_last_error to get the error code in case of failure.
[[gnu::visibility("internal"), gnu::nonnull(1, 3), gnu::access(read_only, 1),
  gnu::access(read_only, 3)]]
bool bdi_os_symlink_at(const bd_os_char *_Nonnull target,
                       bd_os_handle parent_dir_handle,
                       const bd_os_char *_Nonnull name);

/// Read the target of a symbolic link at specified directory.
///
/// @param parent_dir_handle
///    Handle for the parent directory.
/// @param [in] name
///    Relative path to the link, as a null-terminated string.
/// @return Target of the link, as a heap-allocated null-terminated string, or
///    `nullptr` if the function fails. Use @ref bdi_os_get_last_error to get
///    the error code in case of failure. The returned pointer must be freed
///    with `free` after use.
[[gnu::visibility("internal"), gnu::nonnull(2), gnu::access(read_only, 2)]]
bd_os_char *_Nullable bdi_os_readlink_at(bd_os_handle parent_dir_handle,
                                         const bd_os_char *_Nonnull name);

#ifdef __cplusplus
} // extern "C"
#endif // def __cplusplus
