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

#include <cerrno>
#include <cstdint>
#include <iostream>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <seedsync/error.h>
#include <seedsync/file_reader.h>

namespace seedsync {

namespace fs = std::filesystem;

file_reader file_reader::open(fs::path const& path, std::error_code& ec) {
  ec.clear();

  auto fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);

  if (fd < 0) {
    ec = std::error_code(errno, std::generic_category());
    return {};
  }

  return file_reader{fd, path};
}

file_reader file_reader::open(fs::path const& path) {
  std::error_code ec;
  auto reader = open(path, ec);
  if (ec) {
    SEEDSYNC_THROW(system_error, "open " + path.string(), ec);
  }
  return reader;
}

file_reader::~file_reader() {
  std::error_code ec;

  close(ec);

  if (ec) {
    std::cerr << "error closing " << path_ << ": " << ec.message() << "\n";
  }
}

file_reader::file_reader(file_reader&& other) noexcept
    : fd_{std::exchange(other.fd_, -1)}
    , path_{std::move(other.path_)} {}

file_reader& file_reader::operator=(file_reader&& other) noexcept {
  if (this != &other) {
    std::error_code ec;
    close(ec);
    fd_ = std::exchange(other.fd_, -1);
    path_ = std::move(other.path_);
  }
  return *this;
}

void file_reader::read_at(file_off_t offset, void* buffer, size_t count,
                          std::error_code& ec) const {
  ec.clear();

  if (fd_ < 0) {
    ec = std::make_error_code(std::errc::bad_file_descriptor);
    return;
  }

  auto p = reinterpret_cast<uint8_t*>(buffer);
  auto off = static_cast<off_t>(offset);

  while (count > 0) {
    auto n = ::pread(fd_, p, count, off);

    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }

      ec = std::error_code(errno, std::generic_category());

      return;
    }

    if (n == 0) {
      // file is shorter than expected
      ec = std::make_error_code(std::errc::io_error);
      return;
    }

    off += static_cast<off_t>(n);
    p += static_cast<size_t>(n);
    count -= static_cast<size_t>(n);
  }
}

void file_reader::read_at(file_off_t offset, void* buffer, size_t count) const {
  std::error_code ec;
  read_at(offset, buffer, count, ec);
  if (ec) {
    SEEDSYNC_THROW(system_error, "read " + path_.string(), ec);
  }
}

file_size_t file_reader::size(std::error_code& ec) const {
  ec.clear();

  struct ::stat st;

  if (::fstat(fd_, &st) != 0) {
    ec = std::error_code(errno, std::generic_category());
    return 0;
  }

  return static_cast<file_size_t>(st.st_size);
}

file_size_t file_reader::size() const {
  std::error_code ec;
  auto rv = size(ec);
  if (ec) {
    SEEDSYNC_THROW(system_error, "fstat " + path_.string(), ec);
  }
  return rv;
}

void file_reader::close(std::error_code& ec) {
  ec.clear();

  if (fd_ >= 0) {
    if (::close(fd_) == -1) {
      ec = std::error_code(errno, std::generic_category());
    }

    fd_ = -1;
  }
}

void file_reader::close() {
  std::error_code ec;
  close(ec);
  if (ec) {
    SEEDSYNC_THROW(system_error, "close " + path_.string(), ec);
  }
}

} // namespace seedsync
