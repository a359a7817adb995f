//===-- wire.hpp - signature and patch stream framing ---------------------===//
//
// Copyright (c) 2025 Nuclearist <nuclearist@teknology-hub.com>
// Part of blockdelta, under the GNU General Public License v3.0 or later
// See COPYING in the project root for license information.
// SPDX-License-Identifier: GPL-3.0-or-later
//
//===----------------------------------------------------------------------===//
///
/// @file
/// Declarations of the framing shared by signature and patch streams.
///
/// Both stream kinds have the layout
///    `magic | header | compressed[message*]`, where the magic is a
///    little-endian 32-bit number, the header is a varint length-prefixed
///    uncompressed message that carries compression settings of the rest,
///    and every message in the compressed part is varint length-prefixed as
///    well.
///
//===----------------------------------------------------------------------===//
#pragma once

#include "blockdelta/content.h"
#include "blockdelta/content/compression.pb.h"
#include "blockdelta/error.h"
#include "comp.hpp"
#include "stream.hpp"

#include <cstdint>
#include <google/protobuf/io/zero_copy_stream_impl_lite.h>
#include <google/protobuf/message_lite.h>
#include <memory>

namespace blockdelta::wire {

/// Magic number of signature streams, "BSIG" on disk.
inline constexpr std::uint32_t sig_magic = 0x47495342;
/// Magic number of patch streams, "BDPT" on disk.
inline constexpr std::uint32_t patch_magic = 0x54504442;

/// Write a stream magic number.
///
/// @param [in, out] out
///    Sink to write to.
/// @param magic
///    Magic number to write.
/// @return A @ref bd_err indicating the result of operation.
bd_err write_magic(io::sink &out, std::uint32_t magic);

/// Read a stream magic number and check it.
///
/// @param [in, out] in
///    Source to read from.
/// @param magic
///    Expected magic number.
/// @param prim
///    Primary error code for reported errors.
/// @return A @ref bd_err indicating the result of operation,
///    @ref BD_ERRC_magic_mismatch if the magic is different.
bd_err read_magic(io::source &in, std::uint32_t magic, bd_errc prim);

/// Write a length-prefixed uncompressed header message.
///
/// @param [in, out] out
///    Sink to write to.
/// @param [in] msg
///    Header message to write.
/// @param prim
///    Primary error code for reported errors.
/// @return A @ref bd_err indicating the result of operation.
bd_err write_header(io::sink &out, const google::protobuf::MessageLite &msg,
                    bd_errc prim);

/// Read a length-prefixed uncompressed header message.
///
/// @param [in, out] in
///    Source to read from. It's read byte by byte, so no data past the header
///    is consumed.
/// @param [out] msg
///    Message that receives the header.
/// @param prim
///    Primary error code for reported errors.
/// @return A @ref bd_err indicating the result of operation.
bd_err read_header(io::source &in, google::protobuf::MessageLite &msg,
                   bd_errc prim);

/// Convert compression settings to their message representation.
void comp_to_proto(const bd_comp_settings &settings,
                   content::CompressionSettings &msg);

/// Convert compression settings from their message representation.
///
/// @param [in] msg
///    Message to convert.
/// @param [out] settings
///    Receives the converted settings.
/// @param prim
///    Primary error code for reported errors.
/// @return A @ref bd_err indicating the result of operation,
///    @ref BD_ERRC_unknown_comp if the algorithm is not supported by the
///    build.
bd_err comp_from_proto(const content::CompressionSettings &msg,
                       bd_comp_settings &settings, bd_errc prim);

/// Writer of length-prefixed messages into a compressed stream.
class msg_writer {
public:
  /// Start the compressed part of a stream.
  ///
  /// @param [in, out] out
  ///    Sink receiving compressed data. It must outlive the writer.
  /// @param [in] settings
  ///    Compression settings, validated with @ref comp::check_settings.
  /// @param prim
  ///    Primary error code for reported errors.
  /// @return A @ref bd_err indicating the result of operation.
  bd_err open(io::sink &out, const bd_comp_settings &settings, bd_errc prim);

  /// Write a message.
  ///
  /// @param [in] msg
  ///    Message to write.
  /// @return A @ref bd_err indicating the result of operation.
  bd_err write(const google::protobuf::MessageLite &msg);

  /// Flush buffered messages and finalize the compressed stream.
  ///
  /// @return A @ref bd_err indicating the result of operation.
  bd_err finish();

private:
  bd_errc prim;
  std::unique_ptr<comp::encoder> enc;
  std::unique_ptr<google::protobuf::io::CopyingOutputStreamAdaptor> adaptor;
};

/// Reader of length-prefixed messages from a compressed stream.
class msg_reader {
public:
  /// Start reading the compressed part of a stream.
  ///
  /// @param [in, out] in
  ///    Source providing compressed data. It must outlive the reader.
  /// @param algo
  ///    Compression algorithm of the stream.
  /// @param prim
  ///    Primary error code for reported errors.
  /// @return A @ref bd_err indicating the result of operation.
  bd_err open(io::source &in, bd_comp_algo algo, bd_errc prim);

  /// Read the next message. The end of stream is an error.
  ///
  /// @param [out] msg
  ///    Message that receives the data.
  /// @return A @ref bd_err indicating the result of operation,
  ///    @ref BD_ERRC_unexpected_eof if there are no more messages.
  bd_err read(google::protobuf::MessageLite &msg);

  /// Ensure that the stream has no more messages.
  ///
  /// @return A @ref bd_err indicating the result of operation,
  ///    @ref BD_ERRC_invalid_data if there is trailing data.
  bd_err finish();

private:
  bd_errc prim;
  std::unique_ptr<comp::decoder> dec;
  std::unique_ptr<google::protobuf::io::CopyingInputStreamAdaptor> adaptor;
};

} // namespace blockdelta::wire
