//===-- zlib_api.h - zlib adapter API -------------------------------------===//
//
// Copyright (c) 2025 Nuclearist <nuclearist@teknology-hub.com>
// Part of blockdelta, under the GNU General Public License v3.0 or later
// See COPYING in the project root for license information.
// SPDX-License-Identifier: GPL-3.0-or-later
//
//===----------------------------------------------------------------------===//
///
/// @file
/// Type definitions and macros that are resolved to zlib or zlib-ng based on
///    the build option.
///
//===----------------------------------------------------------------------===//
#pragma once

#include "config.h" // IWYU pragma: keep

#include <stdint.h>

#ifdef BDB_ZNG
#include <zlib-ng.h>

typedef zng_stream bdi_z_stream;
#define bdi_z_deflate zng_deflate
#define bdi_z_deflateEnd zng_deflateEnd
#define bdi_z_deflateInit zng_deflateInit
#define bdi_z_inflate zng_inflate
#define bdi_z_inflateEnd zng_inflateEnd
#define bdi_z_inflateInit zng_inflateInit
#define bdi_z_zError zng_zError

#else // def BDB_ZNG
#include <zlib.h>

typedef z_stream bdi_z_stream;
#define bdi_z_deflate deflate
#define bdi_z_deflateEnd deflateEnd
#define bdi_z_deflateInit deflateInit
#define bdi_z_inflate inflate
#define bdi_z_inflateEnd inflateEnd
#define bdi_z_inflateInit inflateInit
#define bdi_z_zError zError

#endif // def BDB_ZNG else
