/* vim:set ts=2 sw=2 sts=2 et: */
/**
 * \author     Marcus Holland-Moritz (github@mhxnet.de)
 * \copyright  Copyright (c) Marcus Holland-Moritz
 *
 * This file is part of seedsync.
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the “Software”), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in
 * all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED “AS IS”, WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 *
 * SPDX-License-Identifier: MIT
 */

#include <seedsync/seed_error.h>

#include <seedsync/internal/detail/align_clone_range.h>

namespace seedsync::internal::detail {

namespace {

constexpr file_off_t align_down(file_off_t x, file_size_t block_size) {
  return x / block_size * block_size;
}

constexpr file_off_t align_up(file_off_t x, file_size_t block_size) {
  return align_down(x + block_size - 1, block_size);
}

} // namespace

clone_layout
align_clone_range(file_off_t src_offset, file_size_t length,
                  file_off_t dst_offset, file_size_t block_size,
                  std::error_code& ec) {
  ec.clear();

  if (block_size <= 0 || src_offset < 0 || dst_offset < 0 || length < 0) {
    ec = std::make_error_code(std::errc::invalid_argument);
    return {};
  }

  if (src_offset % block_size != dst_offset % block_size) {
    ec = make_error_code(seed_errc::alignment_mismatch);
    return {};
  }

  auto const src_end = src_offset + length;
  auto const dst_end = dst_offset + length;
  auto const align_start = align_up(src_offset, block_size);
  auto const align_end = align_down(src_end, block_size);

  clone_layout layout;

  if (align_start >= align_end) {
    // not a single whole block, copy everything
    layout.head = {src_offset, length};
    layout.head_dst = dst_offset;
    layout.clone = {src_end, 0};
    layout.clone_dst = dst_end;
    layout.tail = {src_end, 0};
    layout.tail_dst = dst_end;
    return layout;
  }

  layout.head = {src_offset, align_start - src_offset};
  layout.head_dst = dst_offset;
  layout.clone = {align_start, align_end - align_start};
  layout.clone_dst = dst_offset + (align_start - src_offset);
  layout.tail = {align_end, src_end - align_end};
  layout.tail_dst = dst_offset + (align_end - src_offset);

  return layout;
}

} // namespace seedsync::internal::detail
