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

#include <filesystem>
#include <span>

#include <seedsync/chunk_index.h>
#include <seedsync/types.h>

namespace seedsync {

/**
 * A run of chunks in a seed file matching a run of chunks in the target
 *
 * This is a view into the index of the `file_seed` that produced it and
 * must not outlive that seed. An empty segment means "no match".
 */
class seed_segment {
 public:
  seed_segment() = default;
  seed_segment(std::filesystem::path const& source,
               std::span<index_chunk const> chunks, bool can_reflink,
               bool needs_validation)
      : source_{&source}
      , chunks_{chunks}
      , can_reflink_{can_reflink}
      , needs_validation_{needs_validation} {}

  bool empty() const noexcept { return chunks_.empty(); }
  explicit operator bool() const noexcept { return !empty(); }

  std::span<index_chunk const> chunks() const noexcept { return chunks_; }

  file_size_t size() const noexcept {
    return empty() ? 0 : chunks_.back().end() - chunks_.front().start;
  }

  file_off_t source_offset() const noexcept {
    return empty() ? 0 : chunks_.front().start;
  }

  std::filesystem::path const& source_path() const;

  bool can_reflink() const noexcept { return can_reflink_; }
  bool needs_validation() const noexcept { return needs_validation_; }

  seed_segment with_reflink(bool can_reflink) const {
    auto seg = *this;
    seg.can_reflink_ = can_reflink;
    return seg;
  }

  seed_segment with_validation(bool needs_validation) const {
    auto seg = *this;
    seg.needs_validation_ = needs_validation;
    return seg;
  }

 private:
  std::filesystem::path const* source_{nullptr};
  std::span<index_chunk const> chunks_;
  bool can_reflink_{false};
  bool needs_validation_{false};
};

} // namespace seedsync
