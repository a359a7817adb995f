//===-- diff.cpp - diff engine --------------------------------------------===//
//
// Copyright (c) 2025 Nuclearist <nuclearist@teknology-hub.com>
// Part of blockdelta, under the GNU General Public License v3.0 or later
// See COPYING in the project root for license information.
// SPDX-License-Identifier: GPL-3.0-or-later
//
//===----------------------------------------------------------------------===//
///
/// @file
/// Implementation of @ref bd_diff.
///
/// Every source file is scanned with a window of the target signature's block
///    size that slides one byte at a time. At each position the window's weak
///    hash is looked up among all target blocks, candidates of the same length
///    are confirmed by SHA-1 of the window, and a confirmed match becomes a
///    block copy operation while the window jumps past it. Bytes that the
///    window slides over without a match accumulate into literal operations.
///
/// Source file data passes through a buffer that always holds the pending
///    literal run plus the current window and the byte following it. The
///    same data is fed to the source signature writer, so the byproduct
///    signature costs no extra reads.
///
//===----------------------------------------------------------------------===//
#include "blockdelta/delta.h"

#include "blockdelta/base.h"
#include "blockdelta/content.h"
#include "blockdelta/content/container.pb.h"
#include "blockdelta/content/patch.pb.h"
#include "blockdelta/error.h"
#include "blockdelta/os.h"
#include "common/error.h"
#include "comp.hpp"
#include "container.hpp"
#include "hash.hpp"
#include "os.h"
#include "signature.hpp"
#include "stream.hpp"
#include "wire.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <google/protobuf/arena.h>
#include <memory>
#include <optional>
#include <span>
#include <string.h>
#include <tuple>
#include <vector>

namespace blockdelta::delta {

namespace {

//===-- Private types -----------------------------------------------------===//

/// Entry of the target block lookup table.
struct lookup_entry {
  /// Weak hash of the block.
  std::uint32_t weak;
  /// Index of the target file containing the block.
  int file_index;
  /// Index of the block in its file.
  std::int64_t block_index;
};

/// Lookup table of target blocks by weak hash. Entries are sorted by
///    (weak, file_index, block_index), and a bitmap indexed by the upper half
///    of weak hashes rejects most misses without a search.
class block_lookup {
public:
  /// Fill the table with all blocks of a signature.
  void build(const bd_signature &sig) {
    entries.reserve(sig.num_hashes);
    for (int i = 0; i < sig.container.num_files; ++i) {
      const auto first = sig.file_hash_offsets[i];
      const auto num_blocks = sig.file_hash_offsets[i + 1] - first;
      for (std::int64_t j = 0; j < num_blocks; ++j) {
        const auto weak = sig.hashes[first + j].weak;
        entries.push_back({.weak = weak, .file_index = i, .block_index = j});
        filter[weak >> 22] |= std::uint64_t{1} << (weak >> 16 & 63);
      }
    }
    std::ranges::sort(entries, [](const auto &left, const auto &right) {
      return std::tie(left.weak, left.file_index, left.block_index) <
             std::tie(right.weak, right.file_index, right.block_index);
    });
  }

  /// Check whether the table has no entries.
  bool empty() const noexcept { return entries.empty(); }

  /// Get all entries with specified weak hash.
  std::span<const lookup_entry> find(std::uint32_t weak) const {
    if (!(filter[weak >> 22] & std::uint64_t{1} << (weak >> 16 & 63))) {
      return {};
    }
    const auto range =
        std::ranges::equal_range(entries, weak, {}, &lookup_entry::weak);
    return {range.begin(), range.end()};
  }

private:
  std::vector<lookup_entry> entries;
  std::uint64_t filter[0x10000 / 64]{};
};

/// State of a single @ref bd_diff run.
class differ {
public:
  differ(const bd_diff_args &args, bd_diff_stats &stats)
      : args(args), stats(stats), target(args.target_sig),
        sink(args.patch_handle, BD_ERRC_diff),
        op(*google::protobuf::Arena::Create<content::PatchOp>(&arena)),
        file_hdr(*google::protobuf::Arena::Create<content::FileHeader>(&arena)) {}
  ~differ() {
    if (file_handle != BD_OS_INVALID_HANDLE) {
      bdi_os_close_handle(file_handle);
    }
    if (root_handle != BD_OS_INVALID_HANDLE) {
      bdi_os_close_handle(root_handle);
    }
  }

  bd_err run();

private:
  const bd_diff_args &args;
  bd_diff_stats &stats;
  const bd_signature *_Nullable target;
  /// Block size of the target signature, or `0` if there is none.
  int block_size{};
  int max_literal_size{};
  block_lookup lookup;
  hash::sha1_ctx sha;
  io::file_sink sink;
  wire::msg_writer writer;
  google::protobuf::Arena arena;
  content::PatchOp &op;
  content::FileHeader &file_hdr;
  /// Buffer for compressed literal payloads.
  std::vector<unsigned char> comp_buf;
  bd_os_handle root_handle{BD_OS_INVALID_HANDLE};
  /// Handle for the current source file.
  bd_os_handle file_handle{BD_OS_INVALID_HANDLE};
  /// Current source file.
  const bd_ct_file *_Nullable cur_file{};

  //===--- Source data buffer ---------------------------------------------===//

  std::unique_ptr<unsigned char[]> buf;
  std::size_t buf_size{};
  /// Offset of the first buffered byte in the current file.
  std::int64_t buf_off{};
  /// Number of bytes in the buffer.
  std::size_t buf_len{};
  /// Number of source bytes read so far, for progress reporting.
  std::int64_t done{};

  //===--- Pending block copy ---------------------------------------------===//

  /// Target file index of the pending copy, or `-1` if there is none.
  int copy_file{-1};
  std::int64_t copy_offset{};
  std::int64_t copy_len{};

  //===--- Source signature -----------------------------------------------===//

  std::optional<content::sig_writer> sig;
  int sig_block_size{};
  hash::sha1_ctx sig_sha;
  hash::weak_state sig_weak{};
  /// Number of bytes in the current source signature block.
  int sig_filled{};

  /// Get the buffered byte at specified file offset.
  unsigned char at(std::int64_t offset) const noexcept {
    return buf[offset - buf_off];
  }
  /// Get buffered data at specified file offset.
  std::span<const unsigned char> data(std::int64_t offset,
                                      std::size_t len) const noexcept {
    return {&buf[offset - buf_off], len};
  }

  bd_err write_prologue();
  bd_err diff_file(int file_index);
  bd_err diff_literals();
  bd_err diff_scan();
  bd_err fill(std::int64_t end, std::int64_t keep_from);
  bd_err read_into(unsigned char *_Nonnull dst, std::size_t n);
  bd_err find_match(std::int64_t pos, std::size_t wlen, std::uint32_t weak,
                    const lookup_entry *_Nullable &match);
  bd_err emit_copy(int file_index, std::int64_t offset, std::int64_t len);
  bd_err flush_copy();
  bd_err emit_literal(std::span<const unsigned char> data);
  bd_err sig_update(std::span<const unsigned char> data);
  bd_err sig_flush_block();
};

//===-- differ ------------------------------------------------------------===//

bd_err differ::run() {
  if (const auto res = comp::check_settings(args.compression, BD_ERRC_diff);
      !bd_err_success(&res)) {
    return res;
  }
  max_literal_size = args.max_literal_size ? args.max_literal_size
                                           : BD_DEFAULT_MAX_LITERAL_SIZE;
  if (max_literal_size < 0) {
    return bd_err_sub(BD_ERRC_diff, BD_ERRC_invalid_arg);
  }
  if (target) {
    if (!content::valid_block_size(target->block_size)) {
      return bd_err_sub(BD_ERRC_diff, BD_ERRC_invalid_arg);
    }
    block_size = target->block_size;
  }
  sig_block_size = args.block_size ? args.block_size
                   : target        ? target->block_size
                                   : BD_DEFAULT_BLOCK_SIZE;
  const auto &src = *args.source;
  if (src.num_files && !args.source_path) {
    return bd_err_sub(BD_ERRC_diff, BD_ERRC_invalid_arg);
  }
  if (args.sig_handle != BD_OS_INVALID_HANDLE) {
    if (!sig_sha) {
      return bd_err_sub(BD_ERRC_diff, BD_ERRC_sha);
    }
    sig.emplace(args.sig_handle, BD_ERRC_diff);
    if (const auto res = sig->open(src, sig_block_size, args.compression);
        !bd_err_success(&res)) {
      return res;
    }
  }
  if (const auto res = write_prologue(); !bd_err_success(&res)) {
    return res;
  }
  if (src.num_files) {
    if (target) {
      lookup.build(*target);
    }
    if (!sha) {
      return bd_err_sub(BD_ERRC_diff, BD_ERRC_sha);
    }
    buf_size = max_literal_size;
    if (!lookup.empty()) {
      buf_size += 2 * static_cast<std::size_t>(block_size);
    }
    buf = std::make_unique_for_overwrite<unsigned char[]>(buf_size);
    root_handle = bdi_os_dir_open(args.source_path);
    if (root_handle == BD_OS_INVALID_HANDLE) {
      return bdi_os_io_err_at(BDI_OS_CWD_HANDLE, args.source_path,
                              BD_ERRC_diff, bdi_os_get_last_error(),
                              BD_ERR_IO_TYPE_open);
    }
  }
  for (int i = 0; i < src.num_files; ++i) {
    if (const auto res = diff_file(i); !bd_err_success(&res)) {
      return res;
    }
  }
  if (const auto res = writer.finish(); !bd_err_success(&res)) {
    return res;
  }
  if (!sink.flush()) {
    return sink.error;
  }
  stats.patch_size = sink.size();
  if (sig) {
    if (const auto res = sig->finish(); !bd_err_success(&res)) {
      return res;
    }
    stats.sig_size = sig->size();
  }
  return bd_err_ok();
}

bd_err differ::write_prologue() {
  if (const auto res = wire::write_magic(sink, wire::patch_magic);
      !bd_err_success(&res)) {
    return res;
  }
  {
    content::PatchHeader hdr;
    wire::comp_to_proto(args.compression, *hdr.mutable_compression());
    if (const auto res = wire::write_header(sink, hdr, BD_ERRC_diff);
        !bd_err_success(&res)) {
      return res;
    }
  }
  if (const auto res = writer.open(sink, args.compression, BD_ERRC_diff);
      !bd_err_success(&res)) {
    return res;
  }
  google::protobuf::Arena ct_arena;
  auto &msg = *google::protobuf::Arena::Create<content::Container>(&ct_arena);
  if (target) {
    content::ct_to_proto(target->container, msg);
  }
  if (const auto res = writer.write(msg); !bd_err_success(&res)) {
    return res;
  }
  msg.Clear();
  content::ct_to_proto(*args.source, msg);
  return writer.write(msg);
}

bd_err differ::diff_file(int file_index) {
  file_hdr.set_file_index(file_index);
  if (const auto res = writer.write(file_hdr); !bd_err_success(&res)) {
    return res;
  }
  cur_file = &args.source->files[file_index];
  if (cur_file->size) {
    file_handle = bdi_os_file_open_at(root_handle, cur_file->path);
    if (file_handle == BD_OS_INVALID_HANDLE) {
      return bdi_os_io_err_at(root_handle, cur_file->path, BD_ERRC_diff,
                              bdi_os_get_last_error(), BD_ERR_IO_TYPE_open);
    }
    bdi_os_stat st;
    if (!bdi_os_file_stat(file_handle, &st)) {
      return bdi_os_io_err(file_handle, BD_ERRC_diff, bdi_os_get_last_error(),
                           BD_ERR_IO_TYPE_get_type);
    }
    if (st.size != cur_file->size) {
      auto err = bd_err_sub(BD_ERRC_diff, BD_ERRC_size_mismatch);
      err.uri = strdup(cur_file->path);
      return err;
    }
    buf_off = 0;
    buf_len = 0;
    if (const auto res = lookup.empty() ? diff_literals() : diff_scan();
        !bd_err_success(&res)) {
      return res;
    }
    bdi_os_close_handle(file_handle);
    file_handle = BD_OS_INVALID_HANDLE;
    if (const auto res = flush_copy(); !bd_err_success(&res)) {
      return res;
    }
    if (sig_filled) {
      if (const auto res = sig_flush_block(); !bd_err_success(&res)) {
        return res;
      }
    }
  }
  op.Clear();
  op.set_kind(content::PATCH_OP_KIND_FILE_END);
  return writer.write(op);
}

bd_err differ::diff_literals() {
  for (std::int64_t offset = 0; offset < cur_file->size;) {
    const auto len = static_cast<std::size_t>(std::min<std::int64_t>(
        max_literal_size, cur_file->size - offset));
    if (const auto res = read_into(buf.get(), len); !bd_err_success(&res)) {
      return res;
    }
    if (const auto res = emit_literal({buf.get(), len});
        !bd_err_success(&res)) {
      return res;
    }
    offset += len;
  }
  return bd_err_ok();
}

bd_err differ::diff_scan() {
  const auto size = cur_file->size;
  std::int64_t pos = 0;
  // Start of the pending literal run
  std::int64_t lit_start = 0;
  auto wlen =
      static_cast<std::size_t>(std::min<std::int64_t>(block_size, size));
  if (const auto res = fill(wlen + 1, 0); !bd_err_success(&res)) {
    return res;
  }
  auto weak = hash::weak_sum(data(pos, wlen));
  while (pos < size) {
    const lookup_entry *match;
    if (const auto res = find_match(pos, wlen, weak, match);
        !bd_err_success(&res)) {
      return res;
    }
    if (match) {
      if (pos > lit_start) {
        if (const auto res = emit_literal(data(lit_start, pos - lit_start));
            !bd_err_success(&res)) {
          return res;
        }
      }
      if (const auto res =
              emit_copy(match->file_index,
                        match->block_index * block_size, wlen);
          !bd_err_success(&res)) {
        return res;
      }
      pos += wlen;
      lit_start = pos;
      if (pos < size) {
        wlen = static_cast<std::size_t>(
            std::min<std::int64_t>(block_size, size - pos));
        if (const auto res = fill(pos + wlen + 1, lit_start);
            !bd_err_success(&res)) {
          return res;
        }
        weak = hash::weak_sum(data(pos, wlen));
      }
      continue;
    }
    if (pos + static_cast<std::int64_t>(wlen) < size) {
      // Full window, wlen == block_size
      weak = hash::weak_roll(weak, at(pos), at(pos + block_size), block_size);
    } else {
      weak = hash::weak_roll_out(weak, at(pos), wlen);
      --wlen;
    }
    ++pos;
    if (pos - lit_start == max_literal_size) {
      if (const auto res = emit_literal(data(lit_start, max_literal_size));
          !bd_err_success(&res)) {
        return res;
      }
      lit_start = pos;
    }
    if (wlen) {
      if (const auto res = fill(pos + wlen + 1, lit_start);
          !bd_err_success(&res)) {
        return res;
      }
    }
  }
  if (pos > lit_start) {
    return emit_literal(data(lit_start, pos - lit_start));
  }
  return bd_err_ok();
}

bd_err differ::fill(std::int64_t end, std::int64_t keep_from) {
  const auto file_end = std::min(end, cur_file->size);
  if (buf_off + static_cast<std::int64_t>(buf_len) >= file_end) {
    return bd_err_ok();
  }
  // Drop data before keep_from and read as much as fits
  const auto drop = static_cast<std::size_t>(keep_from - buf_off);
  if (drop) {
    buf_len -= drop;
    std::memmove(buf.get(), &buf[drop], buf_len);
    buf_off = keep_from;
  }
  const auto len = static_cast<std::size_t>(std::min<std::int64_t>(
      buf_size - buf_len, cur_file->size - buf_off - buf_len));
  if (const auto res = read_into(&buf[buf_len], len); !bd_err_success(&res)) {
    return res;
  }
  buf_len += len;
  return bd_err_ok();
}

bd_err differ::read_into(unsigned char *dst, std::size_t n) {
  const std::span<const unsigned char> read_data(dst, n);
  while (n) {
    const auto res = bdi_os_file_read_some(file_handle, dst, n);
    if (res < 0) {
      return bdi_os_io_err(file_handle, BD_ERRC_diff, bdi_os_get_last_error(),
                           BD_ERR_IO_TYPE_read);
    }
    if (!res) {
      // The file has been truncated after it was opened
      auto err = bd_err_sub(BD_ERRC_diff, BD_ERRC_size_mismatch);
      err.uri = strdup(cur_file->path);
      return err;
    }
    dst += res;
    n -= res;
  }
  if (const auto res = sig_update(read_data); !bd_err_success(&res)) {
    return res;
  }
  if (args.progress) {
    done += read_data.size();
    args.progress(args.progress_data, done, args.source->size);
  }
  return bd_err_ok();
}

bd_err differ::find_match(std::int64_t pos, std::size_t wlen,
                          std::uint32_t weak, const lookup_entry *&match) {
  match = nullptr;
  const auto candidates = lookup.find(weak);
  if (candidates.empty()) {
    return bd_err_ok();
  }
  // The window's SHA-1 is computed only once a candidate of the same length
  //    is found
  bool have_strong = false;
  unsigned char strong[hash::strong_size];
  for (const auto &candidate : candidates) {
    const auto &file = target->container.files[candidate.file_index];
    const auto offset = candidate.block_index * block_size;
    if (std::min<std::int64_t>(block_size, file.size - offset) !=
        static_cast<std::int64_t>(wlen)) {
      continue;
    }
    if (!have_strong) {
      if (!sha.digest(data(pos, wlen), strong)) {
        return bd_err_sub(BD_ERRC_diff, BD_ERRC_sha);
      }
      have_strong = true;
    }
    const auto &block_hash =
        target->hashes[target->file_hash_offsets[candidate.file_index] +
                       candidate.block_index];
    if (std::memcmp(block_hash.strong, strong, sizeof strong)) {
      continue;
    }
    // Prefer the block that continues the pending copy
    if (candidate.file_index == copy_file &&
        offset == copy_offset + copy_len) {
      match = &candidate;
      break;
    }
    if (!match) {
      match = &candidate;
      if (copy_file < 0) {
        break;
      }
    }
  }
  return bd_err_ok();
}

bd_err differ::emit_copy(int file_index, std::int64_t offset,
                         std::int64_t len) {
  stats.reused_bytes += len;
  if (file_index == copy_file && offset == copy_offset + copy_len) {
    copy_len += len;
    return bd_err_ok();
  }
  if (const auto res = flush_copy(); !bd_err_success(&res)) {
    return res;
  }
  copy_file = file_index;
  copy_offset = offset;
  copy_len = len;
  return bd_err_ok();
}

bd_err differ::flush_copy() {
  if (copy_file < 0) {
    return bd_err_ok();
  }
  op.Clear();
  op.set_kind(content::PATCH_OP_KIND_BLOCK_COPY);
  op.set_file_index(copy_file);
  op.set_offset(copy_offset);
  op.set_length(copy_len);
  copy_file = -1;
  ++stats.num_copy_ops;
  return writer.write(op);
}

bd_err differ::emit_literal(std::span<const unsigned char> data) {
  if (const auto res = flush_copy(); !bd_err_success(&res)) {
    return res;
  }
  if (const auto res =
          comp::compress(args.compression, data, comp_buf, BD_ERRC_diff);
      !bd_err_success(&res)) {
    return res;
  }
  op.Clear();
  op.set_kind(content::PATCH_OP_KIND_LITERAL);
  op.set_length(data.size());
  op.set_data(comp_buf.data(), comp_buf.size());
  stats.fresh_bytes += data.size();
  ++stats.num_literal_ops;
  return writer.write(op);
}

bd_err differ::sig_update(std::span<const unsigned char> data) {
  if (!sig) {
    return bd_err_ok();
  }
  while (!data.empty()) {
    if (!sig_filled && !sig_sha.init()) {
      return bd_err_sub(BD_ERRC_diff, BD_ERRC_sha);
    }
    const auto part = data.first(
        std::min<std::size_t>(sig_block_size - sig_filled, data.size()));
    sig_weak.update(part);
    if (!sig_sha.update(part)) {
      return bd_err_sub(BD_ERRC_diff, BD_ERRC_sha);
    }
    sig_filled += part.size();
    data = data.subspan(part.size());
    if (sig_filled == sig_block_size) {
      if (const auto res = sig_flush_block(); !bd_err_success(&res)) {
        return res;
      }
    }
  }
  return bd_err_ok();
}

bd_err differ::sig_flush_block() {
  bd_block_hash hash;
  hash.weak = sig_weak.value();
  if (!sig_sha.final(hash.strong)) {
    return bd_err_sub(BD_ERRC_diff, BD_ERRC_sha);
  }
  sig_weak = {};
  sig_filled = 0;
  return sig->write(hash);
}

} // namespace

} // namespace blockdelta::delta

//===-- Public function ---------------------------------------------------===//

using namespace blockdelta::delta;

extern "C" bd_err bd_diff(const bd_diff_args *args, bd_diff_stats *stats) {
  *stats = {};
  differ diff(*args, *stats);
  return diff.run();
}
