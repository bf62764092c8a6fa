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

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <string>
#include <system_error>
#include <vector>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <seedsync/file_seed.h>
#include <seedsync/file_util.h>
#include <seedsync/file_writer.h>
#include <seedsync/seed_error.h>
#include <seedsync/segment_extractor.h>

#include "test_helpers.h"
#include "test_logger.h"

using namespace seedsync;
namespace fs = std::filesystem;

namespace {

constexpr file_size_t kBlockSize{4096};

template <typename F>
std::error_code seed_error_of(F&& f) {
  try {
    f();
  } catch (seed_error const& e) {
    return e.code();
  }
  return {};
}

class segment_extractor_test : public ::testing::Test {
 protected:
  void SetUp() override {
    seed_path = td.path() / "seed.img";
    target_path = td.path() / "target.img";
    seed_data = test::create_random_string(16788, 7);
    write_file(seed_path, seed_data);
    // offsets 0, 1000, 5096, 13288, 16288
    seed_index = test::make_index(seed_data, {1000, 4096, 8192, 3000, 500});
  }

  file_seed make_seed() {
    return file_seed(lgr, ca, target_path, seed_path, seed_index);
  }

  // segment covering seed chunks 1..3, bytes [1000, 16288)
  seed_segment middle_segment(file_seed const& seed) {
    auto [n, seg] =
        seed.longest_match_with(seed.index().chunks().subspan(1, 3));
    EXPECT_EQ(3U, n);
    return seg;
  }

  temporary_directory td{"seedsync"};
  test::test_logger lgr;
  test::clone_access_mock ca{kBlockSize};
  fs::path seed_path;
  fs::path target_path;
  std::string seed_data;
  chunk_index seed_index;
};

} // namespace

TEST_F(segment_extractor_test, length_mismatch_touches_nothing) {
  auto seed = make_seed();
  auto seg = middle_segment(seed);
  segment_extractor ex(lgr, ca);
  auto dst = file_writer::create(target_path);

  // the source is gone, but the length check comes first
  fs::remove(seed_path);

  auto ec = seed_error_of(
      [&] { ex.write_into(seg, dst, 0, seg.size() - 1, kBlockSize); });

  EXPECT_EQ(ec, seed_errc::length_mismatch);
  EXPECT_EQ(0U, fs::file_size(target_path));
  EXPECT_EQ(0, ex.bytes_copied());
}

TEST_F(segment_extractor_test, copy) {
  auto seed = make_seed();
  auto seg = middle_segment(seed).with_reflink(false);
  segment_extractor ex(lgr, ca, {.copy_buffer_size = 1000});

  {
    auto dst = file_writer::create(target_path);
    ex.write_into(seg, dst, 123, 15288, kBlockSize);
    dst.close();
  }

  auto const expected = std::string(123, '\0') + seed_data.substr(1000, 15288);
  auto const actual = read_file(target_path);

  ASSERT_EQ(expected.size(), actual.size());
  EXPECT_TRUE(expected == actual);

  // the copied bytes hash to the segment's chunk ids
  file_off_t offset = 123;
  for (auto const& c : seg.chunks()) {
    auto const piece = actual.substr(offset, c.size);
    EXPECT_EQ(c.id, test::id_of(piece)) << c;
    offset += c.size;
  }

  EXPECT_EQ(15288, ex.bytes_copied());
  EXPECT_EQ(0, ex.bytes_cloned());
  EXPECT_TRUE(ca.clone_calls().empty());
}

TEST_F(segment_extractor_test, validation_detects_modified_seed) {
  auto seed = make_seed();
  auto seg = middle_segment(seed).with_reflink(false);
  segment_extractor ex(lgr, ca);

  // flip a byte in the last chunk of the segment
  auto modified = seed_data;
  modified[14000] ^= 0x20;
  write_file(seed_path, modified);

  auto dst = file_writer::create(target_path);

  auto ec =
      seed_error_of([&] { ex.write_into(seg, dst, 0, seg.size(), kBlockSize); });

  EXPECT_EQ(ec, seed_errc::seed_mismatch);
  EXPECT_EQ(0U, fs::file_size(target_path));

  // without validation, the data is taken as is
  ex.write_into(seg.with_validation(false), dst, 0, seg.size(), kBlockSize);
  dst.close();

  EXPECT_TRUE(read_file(target_path) == modified.substr(1000, 15288));
}

TEST_F(segment_extractor_test, validation_detects_truncated_seed) {
  auto seed = make_seed();
  auto seg = middle_segment(seed).with_reflink(false);
  segment_extractor ex(lgr, ca);

  fs::resize_file(seed_path, 10000);

  auto dst = file_writer::create(target_path);

  auto ec =
      seed_error_of([&] { ex.write_into(seg, dst, 0, seg.size(), kBlockSize); });

  EXPECT_EQ(ec, seed_errc::io_error);
  EXPECT_EQ(0U, fs::file_size(target_path));
}

TEST_F(segment_extractor_test, missing_seed) {
  auto seed = make_seed();
  auto seg = middle_segment(seed);
  segment_extractor ex(lgr, ca);
  auto dst = file_writer::create(target_path);

  fs::remove(seed_path);

  try {
    ex.write_into(seg, dst, 0, seg.size(), kBlockSize);
    FAIL() << "expected seed_error";
  } catch (seed_error const& e) {
    EXPECT_EQ(seed_errc::io_error, e.errc());
    EXPECT_EQ("open", e.operation());
    EXPECT_EQ(seed_path, e.path());
    EXPECT_EQ(e.cause(), std::errc::no_such_file_or_directory);
  }
}

TEST_F(segment_extractor_test, clone) {
  auto seed = make_seed();
  auto seg = middle_segment(seed);
  segment_extractor ex(lgr, ca);

  ASSERT_TRUE(seg.can_reflink());

  {
    auto dst = file_writer::create(target_path);
    ex.write_into(seg, dst, 5096, 15288, kBlockSize);
    dst.close();
  }

  auto const calls = ca.clone_calls();

  ASSERT_EQ(1U, calls.size());
  EXPECT_EQ(seed_path, calls[0].src);
  EXPECT_EQ(target_path, calls[0].dst);
  EXPECT_EQ(4096, calls[0].src_offset);
  EXPECT_EQ(8192, calls[0].length);
  EXPECT_EQ(8192, calls[0].dst_offset);

  EXPECT_EQ(8192, ex.bytes_cloned());
  EXPECT_EQ(3096 + 4000, ex.bytes_copied());

  auto const expected =
      std::string(5096, '\0') + seed_data.substr(1000, 15288);

  EXPECT_TRUE(read_file(target_path) == expected);
}

TEST_F(segment_extractor_test, clone_without_whole_block) {
  auto seed = make_seed();
  // just the 3000 byte chunk at 13288
  auto [n, seg] = seed.longest_match_with(seed.index().chunks().subspan(3, 1));
  segment_extractor ex(lgr, ca);

  ASSERT_EQ(1U, n);
  ASSERT_TRUE(seg.can_reflink());

  {
    auto dst = file_writer::create(target_path);
    ex.write_into(seg, dst, 13288, 3000, kBlockSize);
    dst.close();
  }

  EXPECT_TRUE(ca.clone_calls().empty());
  EXPECT_EQ(0, ex.bytes_cloned());
  EXPECT_EQ(3000, ex.bytes_copied());
  EXPECT_TRUE(read_file(target_path).substr(13288) ==
              seed_data.substr(13288, 3000));
}

TEST_F(segment_extractor_test, clone_alignment_mismatch) {
  auto seed = make_seed();
  auto seg = middle_segment(seed);
  segment_extractor ex(lgr, ca);
  auto dst = file_writer::create(target_path);

  auto ec =
      seed_error_of([&] { ex.write_into(seg, dst, 0, seg.size(), kBlockSize); });

  EXPECT_EQ(ec, seed_errc::alignment_mismatch);
  EXPECT_TRUE(ca.clone_calls().empty());

  // a plain copy works at any offset
  ex.write_into(seg.with_reflink(false), dst, 0, seg.size(), kBlockSize);
  dst.close();

  EXPECT_TRUE(read_file(target_path) == seed_data.substr(1000, 15288));
}

TEST_F(segment_extractor_test, clone_unsupported) {
  auto seed = make_seed();
  auto seg = middle_segment(seed);
  segment_extractor ex(lgr, ca);
  auto dst = file_writer::create(target_path);

  for (int err : {EOPNOTSUPP, EXDEV, EINVAL, ENOTTY}) {
    ca.set_clone_error({err, std::generic_category()});

    auto ec = seed_error_of(
        [&] { ex.write_into(seg, dst, 5096, seg.size(), kBlockSize); });

    EXPECT_EQ(ec, seed_errc::clone_unsupported) << std::strerror(err);
  }

  ca.set_clone_error({EIO, std::generic_category()});

  auto ec = seed_error_of(
      [&] { ex.write_into(seg, dst, 5096, seg.size(), kBlockSize); });

  EXPECT_EQ(ec, seed_errc::io_error);
  EXPECT_EQ(0, ex.bytes_cloned());

  // a failed clone leaves the edges unwritten
  EXPECT_EQ(0, ex.bytes_copied());
  EXPECT_EQ(0U, fs::file_size(target_path));
}

TEST_F(segment_extractor_test, error_code_overload) {
  auto seed = make_seed();
  auto seg = middle_segment(seed).with_reflink(false);
  segment_extractor ex(lgr, ca);
  auto dst = file_writer::create(target_path);

  std::error_code ec;

  ex.write_into(seg, dst, 0, 42, kBlockSize, ec);
  EXPECT_EQ(ec, seed_errc::length_mismatch);

  // the file and operation are only available from the exception
  try {
    ex.write_into(seg, dst, 0, 42, kBlockSize);
    FAIL() << "expected seed_error";
  } catch (seed_error const& e) {
    EXPECT_EQ(e.code(), ec);
    EXPECT_EQ(seed_path, e.path());
    EXPECT_EQ("write_into", e.operation());
  }

  ex.write_into(seg, dst, 0, seg.size(), kBlockSize, ec);
  EXPECT_FALSE(ec) << ec.message();
  EXPECT_EQ(seg.size(), ex.bytes_copied());
}

TEST_F(segment_extractor_test, empty_segment) {
  segment_extractor ex(lgr, ca);
  auto dst = file_writer::create(target_path);

  EXPECT_NO_THROW(ex.write_into(seed_segment{}, dst, 0, 0, kBlockSize));

  auto ec = seed_error_of(
      [&] { ex.write_into(seed_segment{}, dst, 0, 1, kBlockSize); });

  EXPECT_EQ(ec, seed_errc::length_mismatch);
  EXPECT_EQ(0U, fs::file_size(target_path));
}
