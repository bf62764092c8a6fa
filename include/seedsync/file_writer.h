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
#include <system_error>
#include <utility>

#include <seedsync/types.h>

namespace seedsync {

/**
 * Writable file handle using positioned writes only
 *
 * Concurrent writers may share one `file_writer` as long as the byte
 * ranges they write do not overlap.
 */
class file_writer {
 public:
  // opens an existing file or creates an empty one, keeping its contents
  static file_writer
  open(std::filesystem::path const& path, std::error_code& ec);
  static file_writer open(std::filesystem::path const& path);

  // creates the file, truncating it if it exists
  static file_writer
  create(std::filesystem::path const& path, std::error_code& ec);
  static file_writer create(std::filesystem::path const& path);

  file_writer() = default;
  ~file_writer();

  file_writer(file_writer&& other) noexcept;
  file_writer& operator=(file_writer&& other) noexcept;

  file_writer(file_writer const&) = delete;
  file_writer& operator=(file_writer const&) = delete;

  explicit operator bool() const noexcept { return fd_ >= 0; }

  int fd() const noexcept { return fd_; }
  std::filesystem::path const& path() const noexcept { return path_; }

  void write_at(file_off_t offset, void const* buffer, size_t count,
                std::error_code& ec);
  void write_at(file_off_t offset, void const* buffer, size_t count);

  void truncate(file_size_t size, std::error_code& ec);
  void truncate(file_size_t size);

  void close(std::error_code& ec);
  void close();

 private:
  file_writer(int fd, std::filesystem::path path)
      : fd_{fd}
      , path_{std::move(path)} {}

  static file_writer open_with_flags(std::filesystem::path const& path,
                                     int flags, std::error_code& ec);

  int fd_{-1};
  std::filesystem::path path_;
};

} // namespace seedsync
