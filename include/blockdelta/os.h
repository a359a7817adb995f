//===-- os.h - OS-specific blockdelta declarations ------------------------===//
//
// Copyright (c) 2025 Nuclearist <nuclearist@teknology-hub.com>
// Part of blockdelta, under the GNU General Public License v3.0 or later
// See COPYING in the project root for license information.
// SPDX-License-Identifier: GPL-3.0-or-later
//
//===----------------------------------------------------------------------===//
///
/// @file
/// Declarations of OS-specific types and macros used in the public API.
///
//===----------------------------------------------------------------------===//
#pragma once

#ifdef __linux__
// Linux-specific declarations

/// OS type for pathname characters.
typedef char bd_os_char;
/// OS error code type.
typedef int bd_os_errc;
/// OS type for handles for files or other system resources.
typedef int bd_os_handle;
/// @def BD_OS_STR
/// Make a string literal for @ref bd_os_char string.
#define BD_OS_STR(str) str
/// @def BD_OS_INVALID_HANDLE
/// Invalid value for @ref bd_os_handle.
#define BD_OS_INVALID_HANDLE -1

#else // def __linux__

#error Unsupported target OS. Only Linux (__linux__) is supported.

#endif // def __linux__ else
