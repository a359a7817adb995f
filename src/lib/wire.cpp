//===-- wire.cpp - signature and patch stream framing ---------------------===//
//
// Copyright (c) 2025 Nuclearist <nuclearist@teknology-hub.com>
// Part of blockdelta, under the GNU General Public License v3.0 or later
// See COPYING in the project root for license information.
// SPDX-License-Identifier: GPL-3.0-or-later
//
//===----------------------------------------------------------------------===//
///
/// @file
/// Implementation of stream framing functions and message writer/reader.
///
//===----------------------------------------------------------------------===//
#include "wire.hpp"

#include "blockdelta/content.h"
#include "blockdelta/content/compression.pb.h"
#include "blockdelta/error.h"
#include "common/error.h"
#include "comp.hpp"
#include "stream.hpp"

#include <cstdint>
#include <google/protobuf/io/coded_stream.h>
#include <google/protobuf/io/zero_copy_stream_impl_lite.h>
#include <google/protobuf/message_lite.h>
#include <google/protobuf/util/delimited_message_util.h>
#include <memory>
#include <string>

namespace blockdelta::wire {

namespace {

/// Maximum accepted size of a header message, in bytes.
static constexpr std::uint32_t max_header_size = 0x10000;

} // namespace

//===-- Stream prologue ---------------------------------------------------===//

bd_err write_magic(io::sink &out, std::uint32_t magic) {
  const unsigned char bytes[4]{
      static_cast<unsigned char>(magic), static_cast<unsigned char>(magic >> 8),
      static_cast<unsigned char>(magic >> 16),
      static_cast<unsigned char>(magic >> 24)};
  return out.write(bytes, sizeof bytes) ? bd_err_ok() : out.error;
}

bd_err read_magic(io::source &in, std::uint32_t magic, bd_errc prim) {
  unsigned char bytes[4];
  if (!in.read_exact(bytes, sizeof bytes)) {
    return in.error;
  }
  const std::uint32_t value = bytes[0] | bytes[1] << 8 | bytes[2] << 16 |
                              static_cast<std::uint32_t>(bytes[3]) << 24;
  return value == magic ? bd_err_ok()
                        : bd_err_sub(prim, BD_ERRC_magic_mismatch);
}

bd_err write_header(io::sink &out, const google::protobuf::MessageLite &msg,
                    bd_errc prim) {
  std::string data;
  if (!msg.SerializeToString(&data)) {
    return bd_err_sub(prim, BD_ERRC_protobuf_serialize);
  }
  unsigned char prefix[5];
  const auto prefix_end =
      google::protobuf::io::CodedOutputStream::WriteVarint32ToArray(
          static_cast<std::uint32_t>(data.size()), prefix);
  if (!out.write(prefix, prefix_end - prefix) ||
      !out.write(data.data(), data.size())) {
    return out.error;
  }
  return bd_err_ok();
}

bd_err read_header(io::source &in, google::protobuf::MessageLite &msg,
                   bd_errc prim) {
  std::uint32_t size = 0;
  for (int shift = 0;; shift += 7) {
    if (shift > 28) {
      return bd_err_sub(prim, BD_ERRC_invalid_data);
    }
    unsigned char byte;
    if (!in.read_exact(&byte, 1)) {
      return in.error;
    }
    size |= static_cast<std::uint32_t>(byte & 0x7F) << shift;
    if (!(byte & 0x80)) {
      break;
    }
  }
  if (size > max_header_size) {
    return bd_err_sub(prim, BD_ERRC_invalid_data);
  }
  std::string data(size, '\0');
  if (size && !in.read_exact(data.data(), size)) {
    return in.error;
  }
  if (!msg.ParseFromString(data)) {
    return bd_err_sub(prim, BD_ERRC_protobuf_deserialize);
  }
  return bd_err_ok();
}

//===-- Compression settings conversion -----------------------------------===//

void comp_to_proto(const bd_comp_settings &settings,
                   content::CompressionSettings &msg) {
  switch (settings.algo) {
  case BD_COMP_ALGO_none:
    msg.set_algorithm(content::COMPRESSION_ALGORITHM_NONE);
    break;
  case BD_COMP_ALGO_deflate:
    msg.set_algorithm(content::COMPRESSION_ALGORITHM_DEFLATE);
    break;
  case BD_COMP_ALGO_lzma:
    msg.set_algorithm(content::COMPRESSION_ALGORITHM_LZMA);
    break;
  case BD_COMP_ALGO_zstd:
    msg.set_algorithm(content::COMPRESSION_ALGORITHM_ZSTD);
  }
  msg.set_quality(settings.quality);
}

bd_err comp_from_proto(const content::CompressionSettings &msg,
                       bd_comp_settings &settings, bd_errc prim) {
  switch (msg.algorithm()) {
  case content::COMPRESSION_ALGORITHM_NONE:
    settings.algo = BD_COMP_ALGO_none;
    break;
  case content::COMPRESSION_ALGORITHM_DEFLATE:
    settings.algo = BD_COMP_ALGO_deflate;
    break;
  case content::COMPRESSION_ALGORITHM_LZMA:
    settings.algo = BD_COMP_ALGO_lzma;
    break;
  case content::COMPRESSION_ALGORITHM_ZSTD:
    settings.algo = BD_COMP_ALGO_zstd;
    break;
  default:
    return bd_err_sub(prim, BD_ERRC_unknown_comp);
  }
  settings.quality = msg.quality();
  return bd_comp_supported(settings.algo)
             ? bd_err_ok()
             : bd_err_sub(prim, BD_ERRC_unknown_comp);
}

//===-- msg_writer --------------------------------------------------------===//

bd_err msg_writer::open(io::sink &out, const bd_comp_settings &settings,
                        bd_errc prim) {
  this->prim = prim;
  auto res = bd_err_ok();
  enc = comp::make_encoder(settings, out, prim, res);
  if (!enc) {
    return res;
  }
  adaptor = std::make_unique<google::protobuf::io::CopyingOutputStreamAdaptor>(
      enc.get());
  return bd_err_ok();
}

bd_err msg_writer::write(const google::protobuf::MessageLite &msg) {
  if (!google::protobuf::util::SerializeDelimitedToZeroCopyStream(
          msg, adaptor.get())) {
    return bd_err_success(&enc->error)
               ? bd_err_sub(prim, BD_ERRC_protobuf_serialize)
               : enc->error;
  }
  return bd_err_ok();
}

bd_err msg_writer::finish() {
  if (!adaptor->Flush() || !enc->finish()) {
    return enc->error;
  }
  return bd_err_ok();
}

//===-- msg_reader --------------------------------------------------------===//

bd_err msg_reader::open(io::source &in, bd_comp_algo algo, bd_errc prim) {
  this->prim = prim;
  auto res = bd_err_ok();
  dec = comp::make_decoder(algo, in, prim, res);
  if (!dec) {
    return res;
  }
  adaptor = std::make_unique<google::protobuf::io::CopyingInputStreamAdaptor>(
      dec.get());
  return bd_err_ok();
}

bd_err msg_reader::read(google::protobuf::MessageLite &msg) {
  // Parsing merges into existing fields, and default values are never
  //    serialized
  msg.Clear();
  bool clean_eof;
  if (google::protobuf::util::ParseDelimitedFromZeroCopyStream(
          &msg, adaptor.get(), &clean_eof)) {
    return bd_err_ok();
  }
  if (!bd_err_success(&dec->error)) {
    return dec->error;
  }
  return bd_err_sub(prim, clean_eof ? BD_ERRC_unexpected_eof
                                    : BD_ERRC_protobuf_deserialize);
}

bd_err msg_reader::finish() {
  const void *data;
  int size;
  while (adaptor->Next(&data, &size)) {
    if (size) {
      return bd_err_sub(prim, BD_ERRC_invalid_data);
    }
  }
  return dec->error;
}

} // namespace blockdelta::wire
