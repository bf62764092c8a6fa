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

#include <array>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <seedsync/chunk_index.h>
#include <seedsync/error.h>
#include <seedsync/file_util.h>

#include "test_helpers.h"

using namespace seedsync;

TEST(chunk_index_test, basic) {
  auto const data = test::create_random_string(300);
  auto const index = test::make_index(data, {100, 50, 150});

  ASSERT_EQ(3U, index.size());
  EXPECT_FALSE(index.empty());
  EXPECT_EQ(300, index.total_size());

  EXPECT_EQ(0, index[0].start);
  EXPECT_EQ(100, index[0].end());
  EXPECT_EQ(100, index[1].start);
  EXPECT_EQ(150, index[1].end());
  EXPECT_EQ(150, index[2].start);
  EXPECT_EQ(300, index[2].end());

  EXPECT_EQ(test::id_of(data.substr(100, 50)), index[1].id);

  std::ostringstream oss;
  oss << index[1];
  EXPECT_EQ(index[1].id.to_string() + "@[100, 150)", oss.str());
}

TEST(chunk_index_test, empty) {
  chunk_index index;

  EXPECT_TRUE(index.empty());
  EXPECT_EQ(0U, index.size());
  EXPECT_EQ(0, index.total_size());
  EXPECT_TRUE(index.chunks().empty());

  EXPECT_NO_THROW(chunk_index{std::vector<index_chunk>{}});
}

TEST(chunk_index_test, rejects_invalid_layouts) {
  auto const a = test::id_of("a");
  auto const b = test::id_of("b");

  auto make = [](std::vector<index_chunk> chunks) {
    return chunk_index{std::move(chunks)};
  };

  // gap
  EXPECT_THAT(
      [&] { make({{a, 0, 10}, {b, 11, 10}}); },
      ::testing::ThrowsMessage<runtime_error>(
          ::testing::HasSubstr("chunk 1 starts at 11, expected 10")));

  // overlap
  EXPECT_THAT([&] { make({{a, 0, 10}, {b, 5, 10}}); },
              ::testing::Throws<runtime_error>());

  // not starting at zero
  EXPECT_THAT(
      [&] { make({{a, 4, 10}}); },
      ::testing::ThrowsMessage<runtime_error>(
          ::testing::HasSubstr("chunk 0 starts at 4, expected 0")));

  // zero size
  EXPECT_THAT([&] { make({{a, 0, 10}, {b, 10, 0}}); },
              ::testing::ThrowsMessage<runtime_error>(
                  ::testing::HasSubstr("chunk 1 has invalid size 0")));
}

TEST(chunk_index_test, index_file) {
  temporary_directory td("seedsync");
  auto const path = td.path() / "file.bin";
  auto const data = test::create_random_string(10000, 42);

  write_file(path, data);

  std::array<file_size_t, 4> const sizes{4096, 1000, 4000, 904};
  auto const index = index_file(path, sizes);

  EXPECT_EQ(10000, index.total_size());
  ASSERT_EQ(4U, index.size());

  auto const expected = test::make_index(data, sizes);

  EXPECT_THAT(index.chunks(), ::testing::ElementsAreArray(expected.chunks()));
}

TEST(chunk_index_test, index_file_errors) {
  temporary_directory td("seedsync");
  auto const path = td.path() / "file.bin";

  write_file(path, test::create_random_string(1000));

  std::array<file_size_t, 2> const too_short{500, 400};
  std::array<file_size_t, 2> const too_long{500, 600};
  std::array<file_size_t, 2> const invalid{1000, 0};

  EXPECT_THAT([&] { index_file(path, too_short); },
              ::testing::ThrowsMessage<runtime_error>(
                  ::testing::HasSubstr("chunk sizes cover 900 bytes")));
  EXPECT_THAT([&] { index_file(path, too_long); },
              ::testing::ThrowsMessage<runtime_error>(
                  ::testing::HasSubstr("does not fit")));
  EXPECT_THAT([&] { index_file(path, invalid); },
              ::testing::Throws<runtime_error>());
  EXPECT_THAT([&] { index_file(td.path() / "missing", too_short); },
              ::testing::Throws<system_error>());
}
