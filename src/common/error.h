//===-- error.h - error creation helpers ----------------------------------===//
//
// Copyright (c) 2025 Nuclearist <nuclearist@teknology-hub.com>
// Part of blockdelta, under the GNU General Public License v3.0 or later
// See COPYING in the project root for license information.
// SPDX-License-Identifier: GPL-3.0-or-later
//
//===----------------------------------------------------------------------===//
///
/// @file
/// Helper functions for creating @ref bd_err objects.
///
//===----------------------------------------------------------------------===//
#pragma once

#include "blockdelta/error.h"

/// Create a basic @ref bd_err for specified error code.
///
/// @param errc
///    Error code to create error object for.
/// @return A @ref bd_err for specified error code.
[[gnu::nothrow, gnu::const]]
static inline bd_err bd_err_basic(bd_errc errc) {
  return
#ifdef __cplusplus
      {.type = BD_ERR_TYPE_basic,
       .primary = errc,
       .auxiliary = 0,
       .extra = 0,
       .uri = nullptr};
#else  // def __cplusplus
      (bd_err){.type = BD_ERR_TYPE_basic, .primary = errc};
#endif // def __cplusplus else
}

/// Create a @ref bd_err object indicating success.
/// @return A @ref bd_err indicating success.
[[gnu::nothrow, gnu::const]]
static inline bd_err bd_err_ok(void) { return bd_err_basic(BD_ERRC_ok); }

/// Create a compound @ref bd_err.
///
/// @param prim
///    Primary error code.
/// @param aux
///    Auxiliary error code.
/// @return A @ref bd_err for specified error codes.
[[gnu::nothrow, gnu::const]]
static inline bd_err bd_err_sub(bd_errc prim, bd_errc aux) {
  return
#ifdef __cplusplus
      {.type = BD_ERR_TYPE_sub,
       .primary = prim,
       .auxiliary = aux,
       .extra = 0,
       .uri = nullptr};
#else  // def __cplusplus
      (bd_err){.type = BD_ERR_TYPE_sub, .primary = prim, .auxiliary = aux};
#endif // def __cplusplus else
}

/// Create a compression library @ref bd_err.
///
/// @param type
///    Error type identifying the library.
/// @param prim
///    Primary error code.
/// @param code
///    Library-specific error code.
/// @param stage
///    Error code identifying the failed stage.
/// @return A @ref bd_err for specified error codes.
[[gnu::nothrow, gnu::const]]
static inline bd_err bd_err_comp(bd_err_type type, bd_errc prim, int code,
                                 bd_errc stage) {
  return
#ifdef __cplusplus
      {.type = type,
       .primary = prim,
       .auxiliary = code,
       .extra = stage,
       .uri = nullptr};
#else  // def __cplusplus
      (bd_err){
          .type = type, .primary = prim, .auxiliary = code, .extra = stage};
#endif // def __cplusplus else
}
