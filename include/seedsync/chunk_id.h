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

#include <array>
#include <cstddef>
#include <cstring>
#include <functional>
#include <iosfwd>
#include <span>
#include <string>
#include <string_view>

#include <fmt/format.h>

namespace seedsync {

/**
 * Content hash identifying a chunk
 *
 * A chunk ID is the SHA-512/256 digest of the chunk's bytes. It is only
 * ever used as an equality key.
 */
class chunk_id {
 public:
  static constexpr size_t kSize{32};

  using value_type = std::array<std::byte, kSize>;

  chunk_id() = default;
  explicit chunk_id(value_type const& value)
      : value_{value} {}

  static chunk_id from_hex(std::string_view hex);
  static chunk_id digest(void const* data, size_t size);
  static chunk_id digest(std::span<std::byte const> data) {
    return digest(data.data(), data.size());
  }

  std::span<std::byte const, kSize> bytes() const { return value_; }

  std::string to_string() const;

  size_t hash() const noexcept {
    size_t h;
    static_assert(sizeof(h) <= kSize);
    std::memcpy(&h, value_.data(), sizeof(h));
    return h;
  }

  friend bool operator==(chunk_id const&, chunk_id const&) = default;

 private:
  value_type value_{};
};

std::ostream& operator<<(std::ostream& os, chunk_id const& id);

} // namespace seedsync

template <>
struct std::hash<seedsync::chunk_id> {
  size_t operator()(seedsync::chunk_id const& id) const noexcept {
    return id.hash();
  }
};

template <>
struct fmt::formatter<seedsync::chunk_id> : fmt::formatter<std::string_view> {
  template <typename FormatContext>
  auto format(seedsync::chunk_id const& id, FormatContext& ctx) const {
    return fmt::formatter<std::string_view>::format(id.to_string(), ctx);
  }
};
