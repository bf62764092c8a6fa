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

#include <filesystem>
#include <iterator>
#include <string>
#include <system_error>
#include <vector>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <seedsync/clone_access_generic.h>
#include <seedsync/error.h>
#include <seedsync/file_reader.h>
#include <seedsync/file_util.h>
#include <seedsync/file_writer.h>

#include "test_helpers.h"

using namespace seedsync;
namespace fs = std::filesystem;

TEST(file_util_test, temporary_directory) {
  fs::path path;

  {
    temporary_directory td("seedsync");
    path = td.path();

    EXPECT_TRUE(fs::is_directory(path));
    EXPECT_THAT(path.filename().string(), ::testing::StartsWith("seedsync."));

    write_file(path / "file", "hello");
    EXPECT_EQ("hello", read_file(path / "file"));
  }

  EXPECT_FALSE(fs::exists(path));
}

TEST(file_util_test, read_write_errors) {
  temporary_directory td;
  std::error_code ec;

  read_file(td.path() / "missing", ec);
  EXPECT_EQ(ec, std::errc::no_such_file_or_directory);

  write_file(td.path() / "no" / "such" / "dir", "x", ec);
  EXPECT_EQ(ec, std::errc::no_such_file_or_directory);

  EXPECT_THROW(read_file(td.path() / "missing"), std::system_error);
}

TEST(file_io_test, write_and_read) {
  temporary_directory td("seedsync");
  auto const path = td.path() / "data.bin";
  auto const data = test::create_random_string(10000, 3);

  {
    auto w = file_writer::create(path);
    EXPECT_TRUE(w);
    EXPECT_EQ(path, w.path());
    w.write_at(5000, data.data() + 5000, 5000);
    w.write_at(0, data.data(), 5000);
    w.close();
    EXPECT_FALSE(w);
  }

  auto r = file_reader::open(path);

  EXPECT_EQ(10000, r.size());

  std::string buf(3000, '\0');
  r.read_at(4000, buf.data(), buf.size());

  EXPECT_TRUE(buf == data.substr(4000, 3000));

  std::error_code ec;
  r.read_at(9000, buf.data(), 2000, ec);

  EXPECT_EQ(ec, std::errc::io_error);
  EXPECT_THROW(r.read_at(9000, buf.data(), 2000), system_error);
}

TEST(file_io_test, open_keeps_content_create_truncates) {
  temporary_directory td("seedsync");
  auto const path = td.path() / "data.bin";

  write_file(path, "0123456789");

  {
    auto w = file_writer::open(path);
    w.write_at(2, "ab", 2);
  }

  EXPECT_EQ("01ab456789", read_file(path));

  {
    auto w = file_writer::open(path);
    w.truncate(4);
  }

  EXPECT_EQ("01ab", read_file(path));

  {
    auto w = file_writer::create(path);
    w.write_at(0, "x", 1);
  }

  EXPECT_EQ("x", read_file(path));
}

TEST(file_io_test, move_only_handles) {
  temporary_directory td("seedsync");
  auto const path = td.path() / "data.bin";

  write_file(path, "abc");

  auto r1 = file_reader::open(path);
  auto const fd = r1.fd();
  auto r2 = std::move(r1);

  EXPECT_FALSE(r1);
  EXPECT_TRUE(r2);
  EXPECT_EQ(fd, r2.fd());
  EXPECT_EQ(3, r2.size());
}

TEST(file_io_test, open_errors) {
  temporary_directory td("seedsync");
  std::error_code ec;

  auto r = file_reader::open(td.path() / "missing", ec);

  EXPECT_FALSE(r);
  EXPECT_EQ(ec, std::errc::no_such_file_or_directory);

  auto w = file_writer::open(td.path() / "missing" / "file", ec);

  EXPECT_FALSE(w);
  EXPECT_EQ(ec, std::errc::no_such_file_or_directory);

  EXPECT_THAT([&] { file_reader::open(td.path() / "missing"); },
              ::testing::ThrowsMessage<system_error>(
                  ::testing::HasSubstr("open ")));
}

TEST(clone_access_generic_test, probe_and_block_size) {
  temporary_directory td("seedsync");
  auto const src = td.path() / "seed.bin";
  auto const dst = td.path() / "target.bin";
  clone_access_generic ca;
  std::error_code ec;

  write_file(src, test::create_random_string(3 * 4096, 9));

  // whether this works depends on the filesystem, but it must not fail
  ca.can_clone(dst, src, ec);
  EXPECT_FALSE(ec) << ec.message();

  // the probe must not leave anything behind
  EXPECT_EQ(1, std::distance(fs::directory_iterator(td.path()),
                             fs::directory_iterator()));

  ca.can_clone(dst, td.path() / "missing", ec);
  EXPECT_EQ(ec, std::errc::no_such_file_or_directory);

  auto const bs = ca.block_size(dst, ec);
  EXPECT_FALSE(ec) << ec.message();
  EXPECT_GT(bs, 0);

  EXPECT_EQ(bs, ca.block_size(td.path(), ec));
}

TEST(clone_access_generic_test, clone_range) {
  temporary_directory td("seedsync");
  auto const src_path = td.path() / "seed.bin";
  auto const dst_path = td.path() / "target.bin";
  clone_access_generic ca;
  std::error_code ec;

  auto const bs = ca.block_size(dst_path, ec);
  ASSERT_FALSE(ec) << ec.message();

  auto const data =
      test::create_random_string(static_cast<size_t>(4 * bs), 11);

  write_file(src_path, data);

  auto const supported = ca.can_clone(dst_path, src_path, ec);
  ASSERT_FALSE(ec) << ec.message();

  auto src = file_reader::open(src_path);
  auto dst = file_writer::create(dst_path);

  // zero length is a no-op rather than "clone to end of file"
  ca.clone_range(dst, src, 0, 0, 0, ec);
  EXPECT_FALSE(ec) << ec.message();
  EXPECT_EQ(0U, fs::file_size(dst_path));

  if (!supported) {
    GTEST_SKIP() << "reflinks not supported in " << td.path();
  }

  ca.clone_range(dst, src, bs, 2 * bs, 2 * bs, ec);
  ASSERT_FALSE(ec) << ec.message();
  dst.close();

  auto const out = read_file(dst_path);

  ASSERT_EQ(static_cast<size_t>(4 * bs), out.size());
  EXPECT_TRUE(out.substr(2 * bs) == data.substr(bs, 2 * bs));
}
