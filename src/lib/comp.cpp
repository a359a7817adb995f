//===-- comp.cpp - compression streams implementation ---------------------===//
//
// Copyright (c) 2025 Nuclearist <nuclearist@teknology-hub.com>
// Part of blockdelta, under the GNU General Public License v3.0 or later
// See COPYING in the project root for license information.
// SPDX-License-Identifier: GPL-3.0-or-later
//
//===----------------------------------------------------------------------===//
///
/// @file
/// Implementation of compression encoders and decoders, and of
///    @ref bd_comp_supported.
///
//===----------------------------------------------------------------------===//
#include "comp.hpp"

#include "blockdelta/content.h"
#include "blockdelta/error.h"
#include "common/error.h"
#include "config.h" // IWYU pragma: keep
#include "stream.hpp"
#include "zlib_api.h"

#include <algorithm>
#include <climits>
#include <cstddef>
#include <cstdint>
#include <lzma.h>
#include <memory>
#include <span>
#include <utility>
#include <vector>
#ifdef BDB_ZSTD
#include <zstd.h>
#endif // def BDB_ZSTD

namespace blockdelta::comp {

namespace {

/// Size of intermediate buffers used by encoders and decoders, in bytes.
static constexpr std::size_t stream_buf_size = 0x10000;

//===-- Encoders ----------------------------------------------------------===//

/// Encoder that stores data as-is.
class none_encoder final : public encoder {
public:
  none_encoder(io::sink &out, bd_errc prim) noexcept : encoder(out, prim) {}

  bool Write(const void *buffer, int size) override {
    return out.write(buffer, size) ? true : sink_failed();
  }

  bool finish() override { return true; }
};

/// zlib deflate encoder.
class deflate_encoder final : public encoder {
public:
  deflate_encoder(io::sink &out, bd_errc prim) noexcept
      : encoder(out, prim), strm{}, initialized(false) {}
  ~deflate_encoder() {
    if (initialized) {
      bdi_z_deflateEnd(&strm);
    }
  }

  /// Initialize the zlib stream.
  ///
  /// @param level
  ///    Compression level.
  /// @return Value indicating whether the function succeeded.
  bool init(int level) {
    if (const int res = bdi_z_deflateInit(&strm, level); res != Z_OK) {
      error = bd_err_comp(BD_ERR_TYPE_zlib, prim, res, BD_ERRC_comp_init);
      return false;
    }
    initialized = true;
    return true;
  }

  bool Write(const void *buffer, int size) override {
    strm.next_in =
        static_cast<decltype(strm.next_in)>(const_cast<void *>(buffer));
    strm.avail_in = size;
    return run(Z_NO_FLUSH);
  }

  bool finish() override {
    strm.avail_in = 0;
    return run(Z_FINISH);
  }

private:
  bdi_z_stream strm;
  bool initialized;
  unsigned char buf[stream_buf_size];

  /// Run deflate until all input is consumed, or the stream is finished for
  ///    @p flush = `Z_FINISH`.
  bool run(int flush) {
    for (;;) {
      strm.next_out = buf;
      strm.avail_out = sizeof buf;
      const int res = bdi_z_deflate(&strm, flush);
      if (res == Z_STREAM_ERROR) {
        error = bd_err_comp(BD_ERR_TYPE_zlib, prim, res, BD_ERRC_compress);
        return false;
      }
      const auto produced = sizeof buf - strm.avail_out;
      if (produced && !out.write(buf, produced)) {
        return sink_failed();
      }
      if (flush == Z_FINISH) {
        if (res == Z_STREAM_END) {
          return true;
        }
      } else if (!strm.avail_in && strm.avail_out) {
        return true;
      }
    }
  }
};

/// liblzma xz encoder.
class lzma_encoder final : public encoder {
public:
  lzma_encoder(io::sink &out, bd_errc prim) noexcept : encoder(out, prim) {}
  ~lzma_encoder() { lzma_end(&strm); }

  /// Initialize the xz stream.
  ///
  /// @param preset
  ///    Compression preset level.
  /// @return Value indicating whether the function succeeded.
  bool init(int preset) {
    if (const auto res = lzma_easy_encoder(&strm, static_cast<uint32_t>(preset),
                                           LZMA_CHECK_CRC64);
        res != LZMA_OK) {
      error = bd_err_comp(BD_ERR_TYPE_lzma, prim, res, BD_ERRC_comp_init);
      return false;
    }
    return true;
  }

  bool Write(const void *buffer, int size) override {
    strm.next_in = static_cast<const std::uint8_t *>(buffer);
    strm.avail_in = size;
    return run(LZMA_RUN);
  }

  bool finish() override {
    strm.avail_in = 0;
    return run(LZMA_FINISH);
  }

private:
  lzma_stream strm = LZMA_STREAM_INIT;
  unsigned char buf[stream_buf_size];

  /// Run the encoder until all input is consumed, or the stream is finished
  ///    for @p action = `LZMA_FINISH`.
  bool run(lzma_action action) {
    for (;;) {
      strm.next_out = buf;
      strm.avail_out = sizeof buf;
      const auto res = lzma_code(&strm, action);
      if (res != LZMA_OK && res != LZMA_STREAM_END) {
        error = bd_err_comp(BD_ERR_TYPE_lzma, prim, res, BD_ERRC_compress);
        return false;
      }
      const auto produced = sizeof buf - strm.avail_out;
      if (produced && !out.write(buf, produced)) {
        return sink_failed();
      }
      if (action == LZMA_FINISH) {
        if (res == LZMA_STREAM_END) {
          return true;
        }
      } else if (!strm.avail_in && strm.avail_out) {
        return true;
      }
    }
  }
};

#ifdef BDB_ZSTD
/// Zstandard encoder.
class zstd_encoder final : public encoder {
public:
  zstd_encoder(io::sink &out, bd_errc prim) noexcept
      : encoder(out, prim), ctx(ZSTD_createCCtx(), ZSTD_freeCCtx) {}

  /// Initialize the compression context.
  ///
  /// @param level
  ///    Compression level.
  /// @return Value indicating whether the function succeeded.
  bool init(int level) {
    if (!ctx) {
      error = bd_err_sub(prim, BD_ERRC_mem_alloc);
      return false;
    }
    if (const auto res =
            ZSTD_CCtx_setParameter(ctx.get(), ZSTD_c_compressionLevel, level);
        ZSTD_isError(res)) {
      error = bd_err_comp(BD_ERR_TYPE_zstd, prim, ZSTD_getErrorCode(res),
                          BD_ERRC_comp_init);
      return false;
    }
    return true;
  }

  bool Write(const void *buffer, int size) override {
    ZSTD_inBuffer in{.src = buffer, .size = static_cast<std::size_t>(size),
                     .pos = 0};
    while (in.pos < in.size) {
      ZSTD_outBuffer zout{.dst = buf, .size = sizeof buf, .pos = 0};
      const auto res =
          ZSTD_compressStream2(ctx.get(), &zout, &in, ZSTD_e_continue);
      if (ZSTD_isError(res)) {
        error = bd_err_comp(BD_ERR_TYPE_zstd, prim, ZSTD_getErrorCode(res),
                            BD_ERRC_compress);
        return false;
      }
      if (zout.pos && !out.write(buf, zout.pos)) {
        return sink_failed();
      }
    }
    return true;
  }

  bool finish() override {
    ZSTD_inBuffer in{.src = nullptr, .size = 0, .pos = 0};
    for (;;) {
      ZSTD_outBuffer zout{.dst = buf, .size = sizeof buf, .pos = 0};
      const auto res = ZSTD_compressStream2(ctx.get(), &zout, &in, ZSTD_e_end);
      if (ZSTD_isError(res)) {
        error = bd_err_comp(BD_ERR_TYPE_zstd, prim, ZSTD_getErrorCode(res),
                            BD_ERRC_compress);
        return false;
      }
      if (zout.pos && !out.write(buf, zout.pos)) {
        return sink_failed();
      }
      if (!res) {
        return true;
      }
    }
  }

private:
  std::unique_ptr<ZSTD_CCtx, decltype(&ZSTD_freeCCtx)> ctx;
  unsigned char buf[stream_buf_size];
};
#endif // def BDB_ZSTD

//===-- Decoders ----------------------------------------------------------===//

/// Decoder for data stored as-is.
class none_decoder final : public decoder {
public:
  none_decoder(io::source &in, bd_errc prim) noexcept : decoder(in, prim) {}

  int Read(void *buffer, int size) override {
    const auto res = in.read(buffer, size);
    return res < 0 ? source_failed() : static_cast<int>(res);
  }
};

/// zlib inflate decoder.
class deflate_decoder final : public decoder {
public:
  deflate_decoder(io::source &in, bd_errc prim) noexcept
      : decoder(in, prim), strm{}, initialized(false), ended(false),
        pending(false) {}
  ~deflate_decoder() {
    if (initialized) {
      bdi_z_inflateEnd(&strm);
    }
  }

  /// Initialize the zlib stream.
  ///
  /// @return Value indicating whether the function succeeded.
  bool init() {
    if (const int res = bdi_z_inflateInit(&strm); res != Z_OK) {
      error = bd_err_comp(BD_ERR_TYPE_zlib, prim, res, BD_ERRC_comp_init);
      return false;
    }
    initialized = true;
    return true;
  }

  int Read(void *buffer, int size) override {
    if (ended) {
      return 0;
    }
    strm.next_out = static_cast<unsigned char *>(buffer);
    strm.avail_out = size;
    for (;;) {
      if (!strm.avail_in && !pending) {
        const auto res = in.read(buf, sizeof buf);
        if (res < 0) {
          return source_failed();
        }
        if (!res) {
          error = bd_err_sub(prim, BD_ERRC_unexpected_eof);
          return -1;
        }
        strm.next_in = buf;
        strm.avail_in = res;
      }
      const int res = bdi_z_inflate(&strm, Z_NO_FLUSH);
      pending = !strm.avail_out;
      const int produced = size - static_cast<int>(strm.avail_out);
      if (res == Z_STREAM_END) {
        ended = true;
        return check_trailing(strm.avail_in) < 0 ? -1 : produced;
      }
      if (res != Z_OK && res != Z_BUF_ERROR) {
        error = bd_err_comp(BD_ERR_TYPE_zlib, prim, res, BD_ERRC_decompress);
        return -1;
      }
      if (produced) {
        return produced;
      }
    }
  }

private:
  bdi_z_stream strm;
  bool initialized;
  bool ended;
  /// Value indicating whether the last call filled the whole output buffer,
  ///    so more output may be available without new input.
  bool pending;
  unsigned char buf[stream_buf_size];
};

/// liblzma xz decoder.
class lzma_decoder final : public decoder {
public:
  lzma_decoder(io::source &in, bd_errc prim) noexcept
      : decoder(in, prim), ended(false), pending(false) {}
  ~lzma_decoder() { lzma_end(&strm); }

  /// Initialize the xz stream.
  ///
  /// @return Value indicating whether the function succeeded.
  bool init() {
    if (const auto res = lzma_stream_decoder(&strm, UINT64_MAX, 0);
        res != LZMA_OK) {
      error = bd_err_comp(BD_ERR_TYPE_lzma, prim, res, BD_ERRC_comp_init);
      return false;
    }
    return true;
  }

  int Read(void *buffer, int size) override {
    if (ended) {
      return 0;
    }
    strm.next_out = static_cast<std::uint8_t *>(buffer);
    strm.avail_out = size;
    for (;;) {
      if (!strm.avail_in && !pending) {
        const auto res = in.read(buf, sizeof buf);
        if (res < 0) {
          return source_failed();
        }
        if (!res) {
          error = bd_err_sub(prim, BD_ERRC_unexpected_eof);
          return -1;
        }
        strm.next_in = buf;
        strm.avail_in = res;
      }
      const auto res = lzma_code(&strm, LZMA_RUN);
      pending = !strm.avail_out;
      const int produced = size - static_cast<int>(strm.avail_out);
      if (res == LZMA_STREAM_END) {
        ended = true;
        return check_trailing(strm.avail_in) < 0 ? -1 : produced;
      }
      if (res != LZMA_OK && res != LZMA_BUF_ERROR) {
        error = bd_err_comp(BD_ERR_TYPE_lzma, prim, res, BD_ERRC_decompress);
        return -1;
      }
      if (produced) {
        return produced;
      }
    }
  }

private:
  lzma_stream strm = LZMA_STREAM_INIT;
  bool ended;
  /// Value indicating whether the last call filled the whole output buffer,
  ///    so more output may be available without new input.
  bool pending;
  unsigned char buf[stream_buf_size];
};

#ifdef BDB_ZSTD
/// Zstandard decoder.
class zstd_decoder final : public decoder {
public:
  zstd_decoder(io::source &in, bd_errc prim) noexcept
      : decoder(in, prim), ctx(ZSTD_createDCtx(), ZSTD_freeDCtx),
        in_buf{.src = buf, .size = 0, .pos = 0}, ended(false),
        pending(false) {}

  /// Check that the decompression context has been created.
  ///
  /// @return Value indicating whether the function succeeded.
  bool init() {
    if (!ctx) {
      error = bd_err_sub(prim, BD_ERRC_mem_alloc);
      return false;
    }
    return true;
  }

  int Read(void *buffer, int size) override {
    if (ended) {
      return 0;
    }
    ZSTD_outBuffer zout{
        .dst = buffer, .size = static_cast<std::size_t>(size), .pos = 0};
    for (;;) {
      if (in_buf.pos == in_buf.size && !pending) {
        const auto res = in.read(buf, sizeof buf);
        if (res < 0) {
          return source_failed();
        }
        if (!res) {
          error = bd_err_sub(prim, BD_ERRC_unexpected_eof);
          return -1;
        }
        in_buf.size = res;
        in_buf.pos = 0;
      }
      const auto res = ZSTD_decompressStream(ctx.get(), &zout, &in_buf);
      if (ZSTD_isError(res)) {
        error = bd_err_comp(BD_ERR_TYPE_zstd, prim, ZSTD_getErrorCode(res),
                            BD_ERRC_decompress);
        return -1;
      }
      pending = zout.pos == zout.size;
      if (!res) {
        ended = true;
        return check_trailing(in_buf.size - in_buf.pos) < 0
                   ? -1
                   : static_cast<int>(zout.pos);
      }
      if (zout.pos) {
        return zout.pos;
      }
    }
  }

private:
  std::unique_ptr<ZSTD_DCtx, decltype(&ZSTD_freeDCtx)> ctx;
  ZSTD_inBuffer in_buf;
  bool ended;
  /// Value indicating whether the last call filled the whole output buffer,
  ///    so more output may be available without new input.
  bool pending;
  unsigned char buf[stream_buf_size];
};
#endif // def BDB_ZSTD

} // namespace

//===-- Internal functions ------------------------------------------------===//

int decoder::check_trailing(std::size_t leftover) {
  if (leftover) {
    error = bd_err_sub(prim, BD_ERRC_invalid_data);
    return -1;
  }
  unsigned char byte;
  const auto res = in.read(&byte, 1);
  if (res < 0) {
    return source_failed();
  }
  if (res) {
    error = bd_err_sub(prim, BD_ERRC_invalid_data);
    return -1;
  }
  return 0;
}

bd_err check_settings(const bd_comp_settings &settings, bd_errc prim) {
  int min_quality;
  int max_quality;
  switch (settings.algo) {
  case BD_COMP_ALGO_none:
    return bd_err_ok();
  case BD_COMP_ALGO_deflate:
    min_quality = Z_BEST_SPEED;
    max_quality = Z_BEST_COMPRESSION;
    break;
  case BD_COMP_ALGO_lzma:
    min_quality = 0;
    max_quality = 9;
    break;
#ifdef BDB_ZSTD
  case BD_COMP_ALGO_zstd:
    min_quality = 1;
    max_quality = ZSTD_maxCLevel();
    break;
#endif // def BDB_ZSTD
  default:
    return bd_err_sub(prim, BD_ERRC_unknown_comp);
  }
  if (settings.quality < min_quality || settings.quality > max_quality) {
    return bd_err_sub(prim, BD_ERRC_invalid_arg);
  }
  return bd_err_ok();
}

std::unique_ptr<encoder> make_encoder(const bd_comp_settings &settings,
                                      io::sink &out, bd_errc prim,
                                      bd_err &err) {
  switch (settings.algo) {
  case BD_COMP_ALGO_none:
    return std::make_unique<none_encoder>(out, prim);
  case BD_COMP_ALGO_deflate: {
    auto enc = std::make_unique<deflate_encoder>(out, prim);
    if (!enc->init(settings.quality)) {
      err = enc->error;
      return nullptr;
    }
    return enc;
  }
  case BD_COMP_ALGO_lzma: {
    auto enc = std::make_unique<lzma_encoder>(out, prim);
    if (!enc->init(settings.quality)) {
      err = enc->error;
      return nullptr;
    }
    return enc;
  }
#ifdef BDB_ZSTD
  case BD_COMP_ALGO_zstd: {
    auto enc = std::make_unique<zstd_encoder>(out, prim);
    if (!enc->init(settings.quality)) {
      err = enc->error;
      return nullptr;
    }
    return enc;
  }
#endif // def BDB_ZSTD
  default:
    err = bd_err_sub(prim, BD_ERRC_unknown_comp);
    return nullptr;
  }
}

std::unique_ptr<decoder> make_decoder(bd_comp_algo algo, io::source &in,
                                      bd_errc prim, bd_err &err) {
  switch (algo) {
  case BD_COMP_ALGO_none:
    return std::make_unique<none_decoder>(in, prim);
  case BD_COMP_ALGO_deflate: {
    auto dec = std::make_unique<deflate_decoder>(in, prim);
    if (!dec->init()) {
      err = dec->error;
      return nullptr;
    }
    return dec;
  }
  case BD_COMP_ALGO_lzma: {
    auto dec = std::make_unique<lzma_decoder>(in, prim);
    if (!dec->init()) {
      err = dec->error;
      return nullptr;
    }
    return dec;
  }
#ifdef BDB_ZSTD
  case BD_COMP_ALGO_zstd: {
    auto dec = std::make_unique<zstd_decoder>(in, prim);
    if (!dec->init()) {
      err = dec->error;
      return nullptr;
    }
    return dec;
  }
#endif // def BDB_ZSTD
  default:
    err = bd_err_sub(prim, BD_ERRC_unknown_comp);
    return nullptr;
  }
}

bd_err compress(const bd_comp_settings &settings,
                std::span<const unsigned char> data,
                std::vector<unsigned char> &out, bd_errc prim) {
  if (settings.algo == BD_COMP_ALGO_none) {
    out.assign(data.begin(), data.end());
    return bd_err_ok();
  }
  io::mem_sink sink(prim);
  sink.data.reserve(data.size() / 2);
  auto res = bd_err_ok();
  const auto enc = make_encoder(settings, sink, prim, res);
  if (!enc) {
    return res;
  }
  while (!data.empty()) {
    const auto n = std::min<std::size_t>(data.size(), INT_MAX);
    if (!enc->Write(data.data(), static_cast<int>(n))) {
      return enc->error;
    }
    data = data.subspan(n);
  }
  if (!enc->finish()) {
    return enc->error;
  }
  out = std::move(sink.data);
  return bd_err_ok();
}

bd_err decompress(bd_comp_algo algo, std::span<const unsigned char> data,
                  std::span<unsigned char> out, bd_errc prim) {
  io::mem_source source(data, prim);
  auto res = bd_err_ok();
  const auto dec = make_decoder(algo, source, prim, res);
  if (!dec) {
    return res;
  }
  while (!out.empty()) {
    const auto n = dec->Read(
        out.data(), static_cast<int>(std::min<std::size_t>(out.size(), INT_MAX)));
    if (n < 0) {
      return dec->error;
    }
    if (!n) {
      // Decompressed data is shorter than expected
      return bd_err_sub(prim, BD_ERRC_invalid_data);
    }
    out = out.subspan(n);
  }
  // Ensure that there is no more decompressed data
  unsigned char byte;
  const auto n = dec->Read(&byte, 1);
  if (n < 0) {
    return dec->error;
  }
  return n ? bd_err_sub(prim, BD_ERRC_invalid_data) : bd_err_ok();
}

} // namespace blockdelta::comp

//===-- Public functions --------------------------------------------------===//

extern "C" {

bool bd_comp_supported(bd_comp_algo algo) {
  switch (algo) {
  case BD_COMP_ALGO_none:
  case BD_COMP_ALGO_deflate:
  case BD_COMP_ALGO_lzma:
    return true;
#ifdef BDB_ZSTD
  case BD_COMP_ALGO_zstd:
    return true;
#endif // def BDB_ZSTD
  default:
    return false;
  }
}

} // extern "C"
