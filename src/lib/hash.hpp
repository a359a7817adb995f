//===-- hash.hpp - block hashing primitives -------------------------------===//
//
// Copyright (c) 2025 Nuclearist <nuclearist@teknology-hub.com>
// Part of blockdelta, under the GNU General Public License v3.0 or later
// See COPYING in the project root for license information.
// SPDX-License-Identifier: GPL-3.0-or-later
//
//===----------------------------------------------------------------------===//
///
/// @file
/// Weak rolling checksum, SHA-1 context wrapper, and file block hasher shared
///    by signature and verify engines.
///
/// The weak hash is the rsync two-sum checksum: for a window
///    `x[0] .. x[n - 1]`, `a = sum(x[i])` and `b = sum((n - i) * x[i])`, both
///    modulo 2^16, packed as `a | b << 16`. Sliding the window by one byte
///    needs only the outgoing byte, the incoming byte and the window length.
///
//===----------------------------------------------------------------------===//
#pragma once

#include "blockdelta/content.h"
#include "blockdelta/error.h"
#include "blockdelta/os.h"
#include "common/error.h"
#include "os.h"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <new>
#include <openssl/evp.h>
#include <openssl/types.h>
#include <span>
#include <string.h>

namespace blockdelta::hash {

//===-- Weak hash ---------------------------------------------------------===//

/// Incremental weak hash state for data that arrives in several parts.
struct weak_state {
  /// Sum of all bytes.
  std::uint32_t a;
  /// Sum of all prefix sums.
  std::uint32_t b;

  /// Feed data into the state.
  constexpr void update(std::span<const unsigned char> data) noexcept {
    for (const auto x : data) {
      a += x;
      b += a;
    }
  }

  /// Get the weak hash of all data fed so far.
  constexpr std::uint32_t value() const noexcept {
    return (a & 0xFFFF) | b << 16;
  }
};

/// Compute the weak hash of a window.
constexpr std::uint32_t weak_sum(std::span<const unsigned char> data) noexcept {
  weak_state state{.a = 0, .b = 0};
  state.update(data);
  return state.value();
}

/// Slide a window by one byte.
///
/// @param weak
///    Weak hash of the current window.
/// @param out
///    First byte of the current window, which leaves it.
/// @param in
///    Byte that enters the window at its end.
/// @param len
///    Length of the window, in bytes.
/// @return Weak hash of the new window.
constexpr std::uint32_t weak_roll(std::uint32_t weak, unsigned char out,
                                  unsigned char in, std::uint32_t len) noexcept {
  const std::uint32_t a = ((weak & 0xFFFF) - out + in) & 0xFFFF;
  const std::uint32_t b = ((weak >> 16) - len * out + a) & 0xFFFF;
  return a | b << 16;
}

/// Drop the first byte of a window without adding a new one.
///
/// @param weak
///    Weak hash of the current window.
/// @param out
///    First byte of the current window, which leaves it.
/// @param len
///    Length of the current window, in bytes.
/// @return Weak hash of the window that is one byte shorter.
constexpr std::uint32_t weak_roll_out(std::uint32_t weak, unsigned char out,
                                      std::uint32_t len) noexcept {
  const std::uint32_t a = ((weak & 0xFFFF) - out) & 0xFFFF;
  const std::uint32_t b = ((weak >> 16) - len * out) & 0xFFFF;
  return a | b << 16;
}

//===-- Strong hash -------------------------------------------------------===//

/// Size of a strong hash, in bytes.
inline constexpr int strong_size = 20;

/// Reusable SHA-1 digest context.
class sha1_ctx {
public:
  sha1_ctx() : ctx(EVP_MD_CTX_new(), EVP_MD_CTX_free) {}

  /// Check whether the context has been allocated successfully.
  explicit operator bool() const noexcept { return ctx != nullptr; }

  /// Start a new digest.
  bool init() noexcept {
    return EVP_DigestInit_ex2(ctx.get(), EVP_sha1(), nullptr) == 1;
  }

  /// Feed data into the digest.
  bool update(std::span<const unsigned char> data) noexcept {
    return EVP_DigestUpdate(ctx.get(), data.data(), data.size()) == 1;
  }

  /// Finish the digest.
  ///
  /// @param [out] out
  ///    Buffer that receives the hash.
  /// @return Value indicating whether the function succeeded.
  bool final(unsigned char (&out)[strong_size]) noexcept {
    unsigned int len;
    return EVP_DigestFinal_ex(ctx.get(), out, &len) == 1;
  }

  /// Compute the hash of a buffer in one go.
  bool digest(std::span<const unsigned char> data,
              unsigned char (&out)[strong_size]) noexcept {
    return init() && update(data) && final(out);
  }

private:
  std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx;
};

/// Compute the hash pair of a block.
///
/// @param [in, out] sha
///    SHA-1 context to use.
/// @param data
///    Block data.
/// @param [out] hash
///    Receives the hash pair.
/// @return Value indicating whether the function succeeded.
inline bool block_hash(sha1_ctx &sha, std::span<const unsigned char> data,
                       bd_block_hash &hash) noexcept {
  hash.weak = weak_sum(data);
  return sha.digest(data, hash.strong);
}

/// Check whether two block hash pairs are equal.
constexpr bool same_hash(const bd_block_hash &left,
                         const bd_block_hash &right) noexcept {
  if (left.weak != right.weak) {
    return false;
  }
  for (int i = 0; i < strong_size; ++i) {
    if (left.strong[i] != right.strong[i]) {
      return false;
    }
  }
  return true;
}

//===-- File hasher -------------------------------------------------------===//

/// Per-thread state for hashing files block by block.
class file_hasher {
public:
  /// Create a hasher.
  ///
  /// @param block_size
  ///    Block size, in bytes.
  /// @param prim
  ///    Primary error code for reported errors.
  file_hasher(int block_size, bd_errc prim)
      : block_size(block_size), prim(prim) {}

  /// Allocate the block buffer and digest context.
  ///
  /// @return A @ref bd_err indicating the result of operation.
  bd_err init() {
    buf.reset(new (std::nothrow) unsigned char[block_size]);
    if (!buf) {
      return bd_err_sub(prim, BD_ERRC_mem_alloc);
    }
    return sha ? bd_err_ok() : bd_err_sub(prim, BD_ERRC_sha);
  }

  /// Hash all blocks of a file.
  ///
  /// @param root_handle
  ///    Handle for the tree's root directory.
  /// @param [in] path
  ///    Path to the file relative to the root, as a null-terminated string.
  /// @param expected_size
  ///    Size that the file must have, or `-1` to hash whatever is there.
  /// @param on_hash
  ///    Callable invoked as `bd_err(std::int64_t block_index,
  ///    const bd_block_hash &hash)` for each block, in order.
  /// @param on_progress
  ///    Callable invoked as `void(std::int64_t num_bytes)` after each block.
  /// @return A @ref bd_err indicating the result of operation,
  ///    @ref BD_ERRC_size_mismatch if the file's size differs from
  ///    @p expected_size.
  template <typename HashFn, typename ProgressFn>
  bd_err hash_file(bd_os_handle root_handle, const char *_Nonnull path,
                   std::int64_t expected_size, HashFn &&on_hash,
                   ProgressFn &&on_progress) {
    const auto handle = bdi_os_file_open_at(root_handle, path);
    if (handle == BD_OS_INVALID_HANDLE) {
      return bdi_os_io_err_at(root_handle, path, prim, bdi_os_get_last_error(),
                              BD_ERR_IO_TYPE_open);
    }
    const auto res = hash_handle(handle, path, expected_size, on_hash,
                                 on_progress);
    bdi_os_close_handle(handle);
    return res;
  }

private:
  int block_size;
  bd_errc prim;
  std::unique_ptr<unsigned char[]> buf;
  sha1_ctx sha;

  template <typename HashFn, typename ProgressFn>
  bd_err hash_handle(bd_os_handle handle, const char *_Nonnull path,
                     std::int64_t expected_size, HashFn &on_hash,
                     ProgressFn &on_progress) {
    bdi_os_stat st;
    if (!bdi_os_file_stat(handle, &st)) {
      return bdi_os_io_err(handle, prim, bdi_os_get_last_error(),
                           BD_ERR_IO_TYPE_get_type);
    }
    if (expected_size >= 0 && st.size != expected_size) {
      return size_mismatch(path);
    }
    auto remaining = st.size;
    for (std::int64_t block_index = 0; remaining; ++block_index) {
      const auto block_len =
          static_cast<std::size_t>(std::min<std::int64_t>(remaining, block_size));
      // Read the whole block, the file may be read in several parts
      for (std::size_t filled = 0; filled < block_len;) {
        const auto res =
            bdi_os_file_read_some(handle, &buf[filled], block_len - filled);
        if (res < 0) {
          return bdi_os_io_err(handle, prim, bdi_os_get_last_error(),
                               BD_ERR_IO_TYPE_read);
        }
        if (!res) {
          return size_mismatch(path);
        }
        filled += res;
      }
      bd_block_hash hash;
      if (!block_hash(sha, {buf.get(), block_len}, hash)) {
        return bd_err_sub(prim, BD_ERRC_sha);
      }
      if (const auto res = on_hash(block_index, hash); !bd_err_success(&res)) {
        return res;
      }
      on_progress(static_cast<std::int64_t>(block_len));
      remaining -= block_len;
    }
    return bd_err_ok();
  }

  /// Create a size mismatch error pointing at specified file.
  bd_err size_mismatch(const char *_Nonnull path) const {
    auto err = bd_err_sub(prim, BD_ERRC_size_mismatch);
    err.uri = strdup(path);
    return err;
  }
};

} // namespace blockdelta::hash
