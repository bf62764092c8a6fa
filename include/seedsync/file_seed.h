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
#include <filesystem>
#include <memory>
#include <span>
#include <utility>

#include <seedsync/chunk_index.h>
#include <seedsync/seed_segment.h>

namespace seedsync {

class clone_access;
class logger;

/**
 * An existing file with a known chunk index, used as a source of bytes
 *
 * Construction probes once whether the seed can share blocks with the
 * destination. After that, the seed is immutable and can be queried from
 * multiple threads.
 */
class file_seed {
 public:
  file_seed(logger& lgr, clone_access const& ca,
            std::filesystem::path const& dst_file,
            std::filesystem::path const& src_file, chunk_index index);

  /**
   * Find the longest run of seed chunks matching `chunks` from its start
   *
   * Every position of `chunks[0]` in the seed is considered. On a tie,
   * the position found first while indexing the seed wins.
   *
   * \returns The number of matched chunks and the matching segment, or
   *          `{0, seed_segment{}}` if the first chunk is not in the seed.
   */
  std::pair<size_t, seed_segment>
  longest_match_with(std::span<index_chunk const> chunks) const {
    return impl_->longest_match_with(chunks);
  }

  std::filesystem::path const& source_path() const {
    return impl_->source_path();
  }

  chunk_index const& index() const { return impl_->index(); }

  bool can_reflink() const { return impl_->can_reflink(); }

  class impl {
   public:
    virtual ~impl() = default;

    virtual std::pair<size_t, seed_segment>
    longest_match_with(std::span<index_chunk const> chunks) const = 0;
    virtual std::filesystem::path const& source_path() const = 0;
    virtual chunk_index const& index() const = 0;
    virtual bool can_reflink() const = 0;
  };

 private:
  std::unique_ptr<impl const> impl_;
};

} // namespace seedsync
