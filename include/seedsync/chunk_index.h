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
#include <iosfwd>
#include <span>
#include <vector>

#include <seedsync/chunk_id.h>
#include <seedsync/types.h>

namespace seedsync {

struct index_chunk {
  chunk_id id;
  file_off_t start{0};
  file_size_t size{0};

  file_off_t end() const noexcept { return start + size; }

  friend bool operator==(index_chunk const&, index_chunk const&) = default;
};

std::ostream& operator<<(std::ostream& os, index_chunk const& c);

/**
 * Decomposition of a file into content-addressed chunks
 *
 * Chunks are ordered by offset, start at offset zero, have a non-zero
 * size and are contiguous. The constructor rejects anything else. An
 * index is immutable once constructed.
 */
class chunk_index {
 public:
  chunk_index() = default;
  explicit chunk_index(std::vector<index_chunk> chunks);

  std::span<index_chunk const> chunks() const { return chunks_; }

  index_chunk const& operator[](size_t i) const { return chunks_[i]; }

  size_t size() const { return chunks_.size(); }
  bool empty() const { return chunks_.empty(); }

  file_size_t total_size() const {
    return chunks_.empty() ? 0 : chunks_.back().end();
  }

 private:
  std::vector<index_chunk> chunks_;
};

/**
 * Build the index of an existing file from externally chosen chunk sizes
 *
 * Every chunk is hashed from the file's current content. The sizes must
 * add up to the size of the file.
 */
chunk_index index_file(std::filesystem::path const& path,
                       std::span<file_size_t const> chunk_sizes);

} // namespace seedsync
