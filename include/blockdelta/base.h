//===-- base.h - basic blockdelta declarations ----------------------------===//
//
// Copyright (c) 2025 Nuclearist <nuclearist@teknology-hub.com>
// Part of blockdelta, under the GNU General Public License v3.0 or later
// See COPYING in the project root for license information.
// SPDX-License-Identifier: GPL-3.0-or-later
//
//===----------------------------------------------------------------------===//
///
/// @file
/// Declarations of blockdelta's basic macros, types and functions.
///
//===----------------------------------------------------------------------===//
#pragma once

#include <stdint.h>
#ifndef __cplusplus
#include <stdbool.h> // IWYU pragma: keep
#endif // ndef __cplusplus

//===-- Compiler macros ---------------------------------------------------===//

#ifndef __clang__
// Clang nullability attributes are replaced with mock macros for other
//    compilers.

#ifndef _Nullable
#define _Nullable
#endif // ndef _Nullable
#ifndef _Nonnull
#define _Nonnull
#endif // ndef _Nonnull
#ifndef _Null_unspecified
#define _Null_unspecified
#endif // ndef _Null_unspecified

#endif // ndef __clang__

// Public API attribute.
#define BD_API visibility("default")

//===-- Common constants --------------------------------------------------===//

/// @def BD_DEFAULT_BLOCK_SIZE
/// Block size used when none is specified, in bytes.
#define BD_DEFAULT_BLOCK_SIZE 65536
/// @def BD_MIN_BLOCK_SIZE
/// The smallest accepted block size, in bytes.
#define BD_MIN_BLOCK_SIZE 64
/// @def BD_MAX_BLOCK_SIZE
/// The largest accepted block size, in bytes.
#define BD_MAX_BLOCK_SIZE 0x4000000
/// @def BD_DEFAULT_MAX_LITERAL_SIZE
/// Maximum size of a single literal run produced by the diff engine when none
///    is specified, in bytes.
#define BD_DEFAULT_MAX_LITERAL_SIZE 0x400000

//===-- Common types ------------------------------------------------------===//

/// Progress callback. Invoked with monotonically increasing @p current values
///    while an operation processes data.
///
/// @param [in, out] data
///    User data pointer passed to the operation.
/// @param current
///    Number of bytes processed so far.
/// @param total
///    Total number of bytes to process.
typedef void bd_progress_func(void *_Nullable data, int64_t current,
                              int64_t total);

#ifdef __cplusplus
extern "C" {
#endif // def __cplusplus

/// Get the version of blockdelta library.
///
/// @return Pointer to the statically allocated null-terminated version string.
[[gnu::BD_API, gnu::returns_nonnull]] const char *_Nonnull bd_version(void);

#ifdef __cplusplus
} // extern "C"
#endif // def __cplusplus
