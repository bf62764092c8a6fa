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

#include <boost/algorithm/hex.hpp>

#include <fmt/format.h>

#include <seedsync/checksum.h>
#include <seedsync/chunk_id.h>
#include <seedsync/error.h>

namespace seedsync {

chunk_id chunk_id::from_hex(std::string_view hex) {
  if (hex.size() != 2 * kSize) {
    SEEDSYNC_THROW(runtime_error,
                   fmt::format("invalid chunk id length {} (expected {})",
                               hex.size(), 2 * kSize));
  }

  value_type value;
  auto out = reinterpret_cast<unsigned char*>(value.data());

  try {
    boost::algorithm::unhex(hex.begin(), hex.end(), out);
  } catch (boost::algorithm::hex_decode_error const&) {
    SEEDSYNC_THROW(runtime_error, fmt::format("invalid chunk id: {}", hex));
  }

  return chunk_id{value};
}

chunk_id chunk_id::digest(void const* data, size_t size) {
  value_type value;
  checksum cs(checksum::sha2_512_256);
  SEEDSYNC_CHECK(cs.digest_size() == kSize, "unexpected digest size");
  cs.update(data, size);
  if (!cs.finalize(value.data())) {
    SEEDSYNC_THROW(runtime_error, "failed to finalize chunk digest");
  }
  return chunk_id{value};
}

std::string chunk_id::to_string() const {
  std::string result;
  result.resize(2 * kSize);
  auto p = reinterpret_cast<unsigned char const*>(value_.data());
  boost::algorithm::hex_lower(p, p + kSize, result.begin());
  return result;
}

std::ostream& operator<<(std::ostream& os, chunk_id const& id) {
  return os << id.to_string();
}

} // namespace seedsync
