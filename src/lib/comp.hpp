//===-- comp.hpp - compression streams ------------------------------------===//
//
// Copyright (c) 2025 Nuclearist <nuclearist@teknology-hub.com>
// Part of blockdelta, under the GNU General Public License v3.0 or later
// See COPYING in the project root for license information.
// SPDX-License-Identifier: GPL-3.0-or-later
//
//===----------------------------------------------------------------------===//
///
/// @file
/// Declarations of compression encoder and decoder streams. They implement
///    Protobuf's copying stream interfaces so length-delimited messages can be
///    written to and read from them through the adaptors.
///
//===----------------------------------------------------------------------===//
#pragma once

#include "blockdelta/content.h"
#include "blockdelta/error.h"
#include "stream.hpp"

#include <cstddef>
#include <google/protobuf/io/zero_copy_stream_impl_lite.h>
#include <memory>
#include <span>
#include <vector>

namespace blockdelta::comp {

/// Compressing stream writing its output to a sink.
class encoder : public google::protobuf::io::CopyingOutputStream {
public:
  /// Error that caused the last failed call.
  bd_err error;

  /// Compress remaining input and finalize the compressed stream.
  ///
  /// @return Value indicating whether the function succeeded. In case of
  ///    failure, @ref error describes the reason.
  virtual bool finish() = 0;

protected:
  /// Sink receiving compressed data.
  io::sink &out;
  /// Primary error code for reported errors.
  bd_errc prim;

  encoder(io::sink &out, bd_errc prim) noexcept
      : error(bd_err_ok()), out(out), prim(prim) {}

  /// Forward a failure of @ref out to @ref error.
  ///
  /// @return `false`.
  bool sink_failed() noexcept {
    error = out.error;
    return false;
  }
};

/// Decompressing stream reading its input from a source.
/// `Read` returns `0` only after the compressed stream has been fully decoded
///    and no bytes follow it in the source.
class decoder : public google::protobuf::io::CopyingInputStream {
public:
  /// Error that caused the last failed call.
  bd_err error;

protected:
  /// Source providing compressed data.
  io::source &in;
  /// Primary error code for reported errors.
  bd_errc prim;

  decoder(io::source &in, bd_errc prim) noexcept
      : error(bd_err_ok()), in(in), prim(prim) {}

  /// Forward a failure of @ref in to @ref error.
  ///
  /// @return `-1`.
  int source_failed() noexcept {
    error = in.error;
    return -1;
  }

  /// Ensure that the source has no data left after the end of compressed
  ///    stream.
  ///
  /// @param leftover
  ///    Number of input bytes already fetched but not consumed by the
  ///    decompressor.
  /// @return `0` on success, `-1` if trailing data is present or the source
  ///    fails.
  int check_trailing(std::size_t leftover);
};

/// Check whether compression settings are valid and supported by the build.
///
/// @param [in] settings
///    Compression settings to check.
/// @param prim
///    Primary error code for the returned error.
/// @return A @ref bd_err indicating the result of the check.
bd_err check_settings(const bd_comp_settings &settings, bd_errc prim);

/// Create an encoder for specified compression settings.
///
/// @param [in] settings
///    Compression settings, validated with @ref check_settings.
/// @param [in, out] out
///    Sink receiving compressed data.
/// @param prim
///    Primary error code for reported errors.
/// @param [out] err
///    Receives the error if the function fails.
/// @return Pointer to the created encoder, or `nullptr` on failure.
std::unique_ptr<encoder> make_encoder(const bd_comp_settings &settings,
                                      io::sink &out, bd_errc prim,
                                      bd_err &err);

/// Create a decoder for specified compression algorithm.
///
/// @param algo
///    Compression algorithm of the stream.
/// @param [in, out] in
///    Source providing compressed data.
/// @param prim
///    Primary error code for reported errors.
/// @param [out] err
///    Receives the error if the function fails.
/// @return Pointer to the created decoder, or `nullptr` on failure.
std::unique_ptr<decoder> make_decoder(bd_comp_algo algo, io::source &in,
                                      bd_errc prim, bd_err &err);

/// Compress a buffer in one go.
///
/// @param [in] settings
///    Compression settings, validated with @ref check_settings.
/// @param data
///    Data to compress.
/// @param [out] out
///    Vector that receives compressed data, its previous contents are
///    replaced.
/// @param prim
///    Primary error code for reported errors.
/// @return A @ref bd_err indicating the result of operation.
bd_err compress(const bd_comp_settings &settings,
                std::span<const unsigned char> data,
                std::vector<unsigned char> &out, bd_errc prim);

/// Decompress a buffer in one go. The decompressed size must be exactly the
///    size of @p out.
///
/// @param algo
///    Compression algorithm of the data.
/// @param data
///    Compressed data.
/// @param [out] out
///    Buffer that receives decompressed data.
/// @param prim
///    Primary error code for reported errors.
/// @return A @ref bd_err indicating the result of operation.
bd_err decompress(bd_comp_algo algo, std::span<const unsigned char> data,
                  std::span<unsigned char> out, bd_errc prim);

} // namespace blockdelta::comp
