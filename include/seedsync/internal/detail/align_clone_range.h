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

#pragma once

#include <system_error>

#include <seedsync/file_range.h>
#include <seedsync/types.h>

namespace seedsync::internal::detail {

/**
 * Split of a byte range into copied edges and a block-aligned clone
 *
 * The source ranges `head`, `clone` and `tail` are adjacent, in this
 * order, and together cover exactly the input range. Each `*_dst` is the
 * destination offset the corresponding range must be written to.
 */
struct clone_layout {
  file_range head;
  file_off_t head_dst{0};
  file_range clone;
  file_off_t clone_dst{0};
  file_range tail;
  file_off_t tail_dst{0};
};

/**
 * Compute the clone layout for `length` bytes from `src_offset` to
 * `dst_offset`
 *
 * Fails with `seed_errc::alignment_mismatch` if the two offsets have a
 * different phase relative to `block_size`, and with
 * `std::errc::invalid_argument` for a non-positive block size or negative
 * offsets. If no whole block fits into the range, `clone` is empty and
 * `head` covers the full range.
 */
clone_layout
align_clone_range(file_off_t src_offset, file_size_t length,
                  file_off_t dst_offset, file_size_t block_size,
                  std::error_code& ec);

} // namespace seedsync::internal::detail
