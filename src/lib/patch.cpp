//===-- patch.cpp - patch stream reading ----------------------------------===//
//
// Copyright (c) 2025 Nuclearist <nuclearist@teknology-hub.com>
// Part of blockdelta, under the GNU General Public License v3.0 or later
// See COPYING in the project root for license information.
// SPDX-License-Identifier: GPL-3.0-or-later
//
//===----------------------------------------------------------------------===//
///
/// @file
/// Implementation of @ref blockdelta::delta::patch_reader,
///    @ref bd_patch_read and @ref bd_patch_free.
///
//===----------------------------------------------------------------------===//
#include "patch.hpp"

#include "blockdelta/content.h"
#include "blockdelta/content/container.pb.h"
#include "blockdelta/content/patch.pb.h"
#include "blockdelta/error.h"
#include "blockdelta/os.h"
#include "common/error.h"
#include "container.hpp"
#include "stream.hpp"
#include "wire.hpp"

#include <climits>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <google/protobuf/arena.h>
#include <string.h>
#include <vector>

namespace blockdelta::delta {

//===-- patch_reader ------------------------------------------------------===//

patch_reader::patch_reader(bd_os_handle handle, bd_errc prim)
    : source(handle, prim), prim(prim), comp(),
      file_hdr(*google::protobuf::Arena::Create<content::FileHeader>(&arena)),
      op(*google::protobuf::Arena::Create<content::PatchOp>(&arena)),
      target(nullptr), src(nullptr), cur_file(-1), cur_len(0) {}

bd_err patch_reader::open(bd_container &target, bd_container &source) {
  target = {};
  source = {};
  if (const auto res =
          wire::read_magic(this->source, wire::patch_magic, prim);
      !bd_err_success(&res)) {
    return res;
  }
  {
    content::PatchHeader hdr;
    if (const auto res = wire::read_header(this->source, hdr, prim);
        !bd_err_success(&res)) {
      return res;
    }
    if (const auto res = wire::comp_from_proto(hdr.compression(), comp, prim);
        !bd_err_success(&res)) {
      return res;
    }
  }
  if (const auto res = reader.open(this->source, comp.algo, prim);
      !bd_err_success(&res)) {
    return res;
  }
  google::protobuf::Arena ct_arena;
  auto &msg = *google::protobuf::Arena::Create<content::Container>(&ct_arena);
  if (const auto res = reader.read(msg); !bd_err_success(&res)) {
    return res;
  }
  if (const auto res = content::ct_from_proto(msg, target, prim);
      !bd_err_success(&res)) {
    return res;
  }
  msg.Clear();
  auto res = reader.read(msg);
  if (bd_err_success(&res)) {
    res = content::ct_from_proto(msg, source, prim);
  }
  if (!bd_err_success(&res)) {
    bd_ct_free(&target);
    return res;
  }
  this->target = &target;
  src = &source;
  return bd_err_ok();
}

bd_err patch_reader::begin_file(int file_index) {
  if (const auto res = reader.read(file_hdr); !bd_err_success(&res)) {
    return res;
  }
  if (file_hdr.file_index() != file_index) {
    return bd_err_sub(prim, BD_ERRC_invalid_data);
  }
  cur_file = file_index;
  cur_len = 0;
  return bd_err_ok();
}

bd_err patch_reader::next_op(const content::PatchOp *&op) {
  if (const auto res = reader.read(this->op); !bd_err_success(&res)) {
    return res;
  }
  const auto &file = src->files[cur_file];
  switch (this->op.kind()) {
  case content::PATCH_OP_KIND_FILE_END:
    if (cur_len != file.size) {
      auto err = bd_err_sub(prim, BD_ERRC_size_mismatch);
      err.uri = strdup(file.path);
      return err;
    }
    op = nullptr;
    return bd_err_ok();
  case content::PATCH_OP_KIND_BLOCK_COPY: {
    const int index = this->op.file_index();
    if (index < 0 || index >= target->num_files || this->op.offset() < 0 ||
        this->op.length() <= 0 ||
        this->op.offset() > target->files[index].size - this->op.length()) {
      return bd_err_sub(prim, BD_ERRC_invalid_data);
    }
    break;
  }
  case content::PATCH_OP_KIND_LITERAL:
    if (this->op.length() <= 0 || this->op.length() > INT_MAX ||
        this->op.data().empty() || this->op.data().length() > INT_MAX) {
      return bd_err_sub(prim, BD_ERRC_invalid_data);
    }
    break;
  default:
    return bd_err_sub(prim, BD_ERRC_invalid_data);
  }
  if (this->op.length() > file.size - cur_len) {
    auto err = bd_err_sub(prim, BD_ERRC_size_mismatch);
    err.uri = strdup(file.path);
    return err;
  }
  cur_len += this->op.length();
  op = &this->op;
  return bd_err_ok();
}

bd_err patch_reader::finish() { return reader.finish(); }

} // namespace blockdelta::delta

//===-- Public functions --------------------------------------------------===//

using namespace blockdelta;

namespace {

/// Read all operations of a patch.
///
/// @param [in, out] reader
///    Reader positioned after the containers.
/// @param [in, out] patch
///    Patch with containers set, receiving operation lists.
/// @return A @ref bd_err indicating the result of operation.
static bd_err read_ops(delta::patch_reader &reader, bd_patch &patch) {
  std::vector<bd_patch_op> ops;
  std::vector<std::size_t> payload_offsets;
  std::vector<unsigned char> payloads;
  std::vector<int> file_num_ops(patch.source.num_files);
  for (int i = 0; i < patch.source.num_files; ++i) {
    if (const auto res = reader.begin_file(i); !bd_err_success(&res)) {
      return res;
    }
    for (;;) {
      const content::PatchOp *op;
      if (const auto res = reader.next_op(op); !bd_err_success(&res)) {
        return res;
      }
      if (!op) {
        break;
      }
      if (op->kind() == content::PATCH_OP_KIND_BLOCK_COPY) {
        ops.push_back({.type = BD_PATCH_OP_TYPE_block_copy,
                       .file_index = op->file_index(),
                       .offset = op->offset(),
                       .length = op->length(),
                       .data = nullptr,
                       .data_size = 0});
        payload_offsets.push_back(0);
      } else {
        ops.push_back({.type = BD_PATCH_OP_TYPE_literal,
                       .file_index = 0,
                       .offset = 0,
                       .length = op->length(),
                       .data = nullptr,
                       .data_size = static_cast<int>(op->data().length())});
        payload_offsets.push_back(payloads.size());
        payloads.insert(payloads.end(), op->data().begin(), op->data().end());
      }
      ++file_num_ops[i];
    }
  }
  if (const auto res = reader.finish(); !bd_err_success(&res)) {
    return res;
  }
  // Move everything into a single buffer
  const auto buf = static_cast<unsigned char *>(
      std::malloc(sizeof(bd_patch_file) * patch.source.num_files +
                  sizeof(bd_patch_op) * ops.size() + payloads.size() + 1));
  if (!buf) {
    return bd_err_sub(BD_ERRC_patch_read, BD_ERRC_mem_alloc);
  }
  patch.buf = buf;
  patch.files = patch.source.num_files ? reinterpret_cast<bd_patch_file *>(buf)
                                       : nullptr;
  patch.ops = ops.empty() ? nullptr
                          : reinterpret_cast<bd_patch_op *>(
                                buf + sizeof(bd_patch_file) *
                                          patch.source.num_files);
  patch.num_ops = ops.size();
  const auto payload_buf = buf + sizeof(bd_patch_file) * patch.source.num_files +
                           sizeof(bd_patch_op) * ops.size();
  if (!payloads.empty()) {
    std::memcpy(payload_buf, payloads.data(), payloads.size());
  }
  for (std::size_t i = 0; i < ops.size(); ++i) {
    patch.ops[i] = ops[i];
    if (ops[i].type == BD_PATCH_OP_TYPE_literal) {
      patch.ops[i].data = payload_buf + payload_offsets[i];
    }
  }
  auto next_op = patch.ops;
  for (int i = 0; i < patch.source.num_files; ++i) {
    patch.files[i] = {.ops = file_num_ops[i] ? next_op : nullptr,
                      .num_ops = file_num_ops[i]};
    next_op += file_num_ops[i];
  }
  return bd_err_ok();
}

} // namespace

extern "C" {

bd_err bd_patch_read(int handle, bd_patch *patch) {
  *patch = {};
  delta::patch_reader reader(handle, BD_ERRC_patch_read);
  if (const auto res = reader.open(patch->target, patch->source);
      !bd_err_success(&res)) {
    return res;
  }
  patch->compression = reader.compression();
  const auto res = read_ops(reader, *patch);
  if (!bd_err_success(&res)) {
    bd_patch_free(patch);
  }
  return res;
}

void bd_patch_free(bd_patch *patch) {
  bd_ct_free(&patch->target);
  bd_ct_free(&patch->source);
  std::free(patch->buf);
  *patch = {};
}

} // extern "C"
