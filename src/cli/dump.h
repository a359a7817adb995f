//===-- dump.h - blockdelta file dumping functions ------------------------===//
//
// Copyright (c) 2025 Nuclearist <nuclearist@teknology-hub.com>
// Part of blockdelta, under the GNU General Public License v3.0 or later
// See COPYING in the project root for license information.
// SPDX-License-Identifier: GPL-3.0-or-later
//
//===----------------------------------------------------------------------===//
///
/// @file
/// Declarations of functions for dumping blockdelta files in human-readable
///    form.
///
//===----------------------------------------------------------------------===//
#pragma once

#include "blockdelta/base.h"
#include "blockdelta/os.h"

/// Dump a signature or patch file to stdout. The file type is detected by its
///    magic number.
///
/// @param [in] path
///    Path to the file to dump, as a null-terminated string.
/// @return Value indicating whether the operation succeeded.
[[gnu::visibility("internal"), gnu::nonnull(1), gnu::access(read_only, 1)]]
bool bdl_dump(const bd_os_char *_Nonnull path);
