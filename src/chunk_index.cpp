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

#include <ostream>
#include <utility>

#include <fmt/format.h>

#include <seedsync/chunk_index.h>
#include <seedsync/error.h>
#include <seedsync/file_reader.h>

namespace seedsync {

std::ostream& operator<<(std::ostream& os, index_chunk const& c) {
  return os << fmt::format("{}@[{}, {})", c.id, c.start, c.end());
}

chunk_index::chunk_index(std::vector<index_chunk> chunks)
    : chunks_{std::move(chunks)} {
  file_off_t expected_start{0};

  for (size_t i = 0; i < chunks_.size(); ++i) {
    auto const& c = chunks_[i];

    if (c.size <= 0) {
      SEEDSYNC_THROW(runtime_error,
                     fmt::format("chunk {} has invalid size {}", i, c.size));
    }

    if (c.start != expected_start) {
      SEEDSYNC_THROW(runtime_error,
                     fmt::format("chunk {} starts at {}, expected {}", i,
                                 c.start, expected_start));
    }

    expected_start = c.end();
  }
}

chunk_index index_file(std::filesystem::path const& path,
                       std::span<file_size_t const> chunk_sizes) {
  auto reader = file_reader::open(path);
  auto const file_size = reader.size();

  std::vector<index_chunk> chunks;
  std::vector<std::byte> buffer;
  file_off_t offset{0};

  chunks.reserve(chunk_sizes.size());

  for (auto size : chunk_sizes) {
    if (size <= 0 || offset + size > file_size) {
      SEEDSYNC_THROW(runtime_error,
                     fmt::format("chunk size {} at offset {} does not fit "
                                 "into {} ({} bytes)",
                                 size, offset, path.string(), file_size));
    }

    buffer.resize(static_cast<size_t>(size));
    reader.read_at(offset, buffer.data(), buffer.size());
    chunks.push_back({chunk_id::digest(buffer), offset, size});
    offset += size;
  }

  if (offset != file_size) {
    SEEDSYNC_THROW(runtime_error,
                   fmt::format("chunk sizes cover {} bytes, but {} has {}",
                               offset, path.string(), file_size));
  }

  return chunk_index{std::move(chunks)};
}

} // namespace seedsync
