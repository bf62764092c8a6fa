/* vim:set ts=2 sw=2 sts=2 et: */
/**
 * \author     Marcus Holland-Moritz (github@mhxnet.de)
 * \copyright  Copyright (c) Marcus Holland-Moritz
 *
 * This file is part of seedsync.
 *
 * seedsync is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * seedsync is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with seedsync.  If not, see <https://www.gnu.org/licenses/>.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include <algorithm>
#include <cerrno>
#include <utility>
#include <vector>

#include <fmt/format.h>

#include <seedsync/error.h>
#include <seedsync/file_reader.h>
#include <seedsync/file_writer.h>

#include "test_helpers.h"

namespace seedsync::test {

bool clone_access_mock::can_clone(
    std::filesystem::path const& dst [[maybe_unused]],
    std::filesystem::path const& src [[maybe_unused]],
    std::error_code& ec) const {
  std::lock_guard lock(mx_);
  ++probes_;
  ec = can_clone_error_;
  return !ec && can_clone_;
}

void clone_access_mock::clone_range(file_writer& dst, file_reader const& src,
                                    file_off_t src_offset, file_size_t length,
                                    file_off_t dst_offset,
                                    std::error_code& ec) const {
  {
    std::lock_guard lock(mx_);
    calls_.push_back({src.path(), dst.path(), src_offset, length, dst_offset});
  }

  if (clone_error_) {
    ec = clone_error_;
    return;
  }

  if (src_offset % block_size_ != 0 || dst_offset % block_size_ != 0 ||
      length % block_size_ != 0) {
    ec.assign(EINVAL, std::generic_category());
    return;
  }

  std::vector<std::byte> buffer(static_cast<size_t>(length));

  src.read_at(src_offset, buffer.data(), buffer.size(), ec);

  if (!ec) {
    dst.write_at(dst_offset, buffer.data(), buffer.size(), ec);
  }
}

file_size_t
clone_access_mock::block_size(std::filesystem::path const& path
                              [[maybe_unused]],
                              std::error_code& ec) const {
  ec = block_size_error_;
  return ec ? 0 : block_size_;
}

std::vector<clone_access_mock::clone_call>
clone_access_mock::clone_calls() const {
  std::lock_guard lock(mx_);
  return calls_;
}

size_t clone_access_mock::probe_count() const {
  std::lock_guard lock(mx_);
  return probes_;
}

void memory_chunk_store::add(std::string_view data) {
  add_raw(id_of(data), data);
}

void memory_chunk_store::add_all(std::string_view data,
                                 std::span<file_size_t const> sizes) {
  size_t offset = 0;
  for (auto size : sizes) {
    add(data.substr(offset, static_cast<size_t>(size)));
    offset += static_cast<size_t>(size);
  }
}

void memory_chunk_store::add_raw(chunk_id const& id, std::string_view data) {
  auto const* p = reinterpret_cast<std::byte const*>(data.data());
  chunks_[id].assign(p, p + data.size());
}

std::vector<std::byte> memory_chunk_store::get_chunk(chunk_id const& id) const {
  std::lock_guard lock(mx_);
  ++fetches_;
  auto it = chunks_.find(id);
  if (it == chunks_.end()) {
    SEEDSYNC_THROW(runtime_error, fmt::format("chunk {} not in store", id));
  }
  return it->second;
}

size_t memory_chunk_store::fetch_count() const {
  std::lock_guard lock(mx_);
  return fetches_;
}

chunk_id id_of(std::string_view data) {
  return chunk_id::digest(data.data(), data.size());
}

chunk_index
make_index(std::string_view data, std::span<file_size_t const> sizes) {
  std::vector<index_chunk> chunks;
  file_off_t offset = 0;

  for (auto size : sizes) {
    auto const piece =
        data.substr(static_cast<size_t>(offset), static_cast<size_t>(size));
    chunks.push_back({id_of(piece), offset, size});
    offset += size;
  }

  return chunk_index(std::move(chunks));
}

std::string create_random_string(size_t size, uint8_t min, uint8_t max,
                                 std::mt19937_64& gen) {
  std::string rv;
  rv.resize(size);
  std::uniform_int_distribution<> byte_dist{min, max};
  std::generate(rv.begin(), rv.end(), [&] { return byte_dist(gen); });
  return rv;
}

std::string create_random_string(size_t size, std::mt19937_64& gen) {
  return create_random_string(size, 0, 255, gen);
}

std::string create_random_string(size_t size, size_t seed) {
  std::mt19937_64 tmprng{seed};
  return create_random_string(size, tmprng);
}

} // namespace seedsync::test
