//===-- container.hpp - internal container functions ----------------------===//
//
// Copyright (c) 2025 Nuclearist <nuclearist@teknology-hub.com>
// Part of blockdelta, under the GNU General Public License v3.0 or later
// See COPYING in the project root for license information.
// SPDX-License-Identifier: GPL-3.0-or-later
//
//===----------------------------------------------------------------------===//
///
/// @file
/// Declarations of functions converting containers between their flat
///    in-memory form and their message form.
///
//===----------------------------------------------------------------------===//
#pragma once

#include "blockdelta/content.h"
#include "blockdelta/content/container.pb.h"
#include "blockdelta/error.h"

namespace blockdelta::content {

/// Build a flat container out of its message form, validating it.
///
/// @param [in] msg
///    Container message to convert.
/// @param [out] ct
///    Receives the container on success. It must be freed with
///    @ref bd_ct_free after use.
/// @param prim
///    Primary error code for reported errors.
/// @return A @ref bd_err indicating the result of operation,
///    @ref BD_ERRC_invalid_data if the message doesn't describe a valid tree.
bd_err ct_from_proto(const Container &msg, bd_container &ct, bd_errc prim);

/// Convert a container to its message form.
///
/// @param [in] ct
///    Container to convert.
/// @param [out] msg
///    Message that receives the container.
void ct_to_proto(const bd_container &ct, Container &msg);

/// Create a deep copy of a container.
///
/// @param [in] src
///    Container to copy.
/// @param [out] dst
///    Receives the copy on success. It must be freed with @ref bd_ct_free
///    after use.
/// @param prim
///    Primary error code for reported errors.
/// @return A @ref bd_err indicating the result of operation.
bd_err ct_copy(const bd_container &src, bd_container &dst, bd_errc prim);

} // namespace blockdelta::content
