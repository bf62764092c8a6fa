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

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <cstdint>
#include <cstring>
#include <span>
#include <sstream>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

#include <fmt/format.h>

#include <seedsync/checksum.h>
#include <seedsync/chunk_id.h>
#include <seedsync/error.h>

using namespace seedsync;
using namespace std::string_view_literals;

namespace {

constexpr auto const payload{"Hello, World!"sv};

constexpr auto const payload_sha512_256{
    "0686F0A605973DC1BF035D1E2B9BAD1985A0BFF712DDD88ABD8D2593E5F99030"sv};

std::string lower(std::string_view s) {
  std::string rv{s};
  for (auto& c : rv) {
    if (c >= 'A' && c <= 'F') {
      c = c - 'A' + 'a';
    }
  }
  return rv;
}

} // namespace

TEST(checksum_test, sha2_512_256) {
  checksum cs(checksum::sha2_512_256);
  cs.update(payload.data(), payload.size());

  std::vector<uint8_t> digest(cs.digest_size());
  ASSERT_EQ(32U, digest.size());
  ASSERT_TRUE(cs.finalize(digest.data()));

  std::vector<uint8_t> tmp(digest.size());
  EXPECT_FALSE(cs.finalize(tmp.data()));

  auto const id = chunk_id::digest(payload.data(), payload.size());
  EXPECT_EQ(0, std::memcmp(digest.data(), id.bytes().data(), digest.size()));
}

TEST(chunk_id_test, digest) {
  auto const id = chunk_id::digest(payload.data(), payload.size());

  EXPECT_EQ(lower(payload_sha512_256), id.to_string());
  EXPECT_EQ(id, chunk_id::from_hex(payload_sha512_256));
  EXPECT_EQ(id, chunk_id::from_hex(lower(payload_sha512_256)));

  std::ostringstream oss;
  oss << id;
  EXPECT_EQ(id.to_string(), oss.str());
  EXPECT_EQ(id.to_string(), fmt::format("{}", id));

  auto const bytes = std::as_bytes(std::span{payload.data(), payload.size()});
  EXPECT_EQ(id, chunk_id::digest(bytes));
}

TEST(chunk_id_test, equality_and_hash) {
  auto const a = chunk_id::digest("a", 1);
  auto const b = chunk_id::digest("b", 1);

  EXPECT_EQ(a, chunk_id::digest("a", 1));
  EXPECT_NE(a, b);
  EXPECT_NE(a, chunk_id{});

  std::unordered_set<chunk_id> ids{a, b, chunk_id::digest("a", 1)};
  EXPECT_EQ(2U, ids.size());
  EXPECT_TRUE(ids.contains(b));
}

TEST(chunk_id_test, from_hex_errors) {
  EXPECT_THAT([] { chunk_id::from_hex("0686f0"); },
              ::testing::ThrowsMessage<runtime_error>(
                  ::testing::HasSubstr("invalid chunk id length 6")));

  std::string bad(64, '0');
  bad[10] = 'x';

  EXPECT_THAT([&] { chunk_id::from_hex(bad); },
              ::testing::ThrowsMessage<runtime_error>(
                  ::testing::HasSubstr("invalid chunk id")));
}
