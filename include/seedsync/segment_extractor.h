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

#include <cstddef>
#include <memory>
#include <system_error>

#include <seedsync/types.h>

namespace seedsync {

class clone_access;
class file_writer;
class logger;
class seed_segment;

struct segment_extractor_options {
  size_t copy_buffer_size{static_cast<size_t>(1) << 20};
};

/**
 * Materializes seed segments in a destination file
 *
 * Bytes are either copied or, if the segment allows it, shared with the
 * seed by cloning all whole filesystem blocks and copying the unaligned
 * edges. Failures are reported as `seed_error`, see `seed_errc` for the
 * possible reasons. Nothing is retried.
 */
class segment_extractor {
 public:
  segment_extractor(logger& lgr, clone_access const& ca,
                    segment_extractor_options const& opts = {});

  /**
   * Write `seg` to `dst` at `offset`
   *
   * \param length      The number of bytes the caller expects `seg` to
   *                    provide. Must match `seg.size()`, otherwise nothing
   *                    is touched and `seed_errc::length_mismatch` is
   *                    reported.
   * \param block_size  The clone granularity of the destination filesystem.
   */
  void write_into(seed_segment const& seg, file_writer& dst, file_off_t offset,
                  file_size_t length, file_size_t block_size) const {
    impl_->write_into(seg, dst, offset, length, block_size);
  }

  /**
   * Same as above, but reports engine failures through `ec`
   *
   * Only the `seed_errc` value is kept. Callers that need the file and
   * operation that failed must use the throwing overload and inspect the
   * `seed_error`.
   */
  void write_into(seed_segment const& seg, file_writer& dst, file_off_t offset,
                  file_size_t length, file_size_t block_size,
                  std::error_code& ec) const;

  file_size_t bytes_copied() const { return impl_->bytes_copied(); }
  file_size_t bytes_cloned() const { return impl_->bytes_cloned(); }

  class impl {
   public:
    virtual ~impl() = default;

    virtual void write_into(seed_segment const& seg, file_writer& dst,
                            file_off_t offset, file_size_t length,
                            file_size_t block_size) const = 0;
    virtual file_size_t bytes_copied() const = 0;
    virtual file_size_t bytes_cloned() const = 0;
  };

 private:
  std::unique_ptr<impl const> impl_;
};

} // namespace seedsync
