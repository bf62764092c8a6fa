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
#include <unistd.h>

#include <seedsync/error.h>
#include <seedsync/file_writer.h>

namespace seedsync {

namespace fs = std::filesystem;

file_writer file_writer::open_with_flags(fs::path const& path, int flags,
                                         std::error_code& ec) {
  ec.clear();

  auto fd = ::open(path.c_str(), flags | O_CLOEXEC, 0644);

  if (fd < 0) {
    ec = std::error_code(errno, std::generic_category());
    return {};
  }

  return file_writer{fd, path};
}

file_writer file_writer::open(fs::path const& path, std::error_code& ec) {
  return open_with_flags(path, O_CREAT | O_RDWR, ec);
}

file_writer file_writer::open(fs::path const& path) {
  std::error_code ec;
  auto writer = open(path, ec);
  if (ec) {
    SEEDSYNC_THROW(system_error, "open " + path.string(), ec);
  }
  return writer;
}

file_writer file_writer::create(fs::path const& path, std::error_code& ec) {
  return open_with_flags(path, O_CREAT | O_TRUNC | O_RDWR, ec);
}

file_writer file_writer::create(fs::path const& path) {
  std::error_code ec;
  auto writer = create(path, ec);
  if (ec) {
    SEEDSYNC_THROW(system_error, "create " + path.string(), ec);
  }
  return writer;
}

file_writer::~file_writer() {
  std::error_code ec;

  close(ec);

  if (ec) {
    std::cerr << "error closing " << path_ << ": " << ec.message() << "\n";
  }
}

file_writer::file_writer(file_writer&& other) noexcept
    : fd_{std::exchange(other.fd_, -1)}
    , path_{std::move(other.path_)} {}

file_writer& file_writer::operator=(file_writer&& other) noexcept {
  if (this != &other) {
    std::error_code ec;
    close(ec);
    fd_ = std::exchange(other.fd_, -1);
    path_ = std::move(other.path_);
  }
  return *this;
}

void file_writer::write_at(file_off_t offset, void const* buffer, size_t count,
                           std::error_code& ec) {
  ec.clear();

  if (fd_ < 0) {
    ec = std::make_error_code(std::errc::bad_file_descriptor);
    return;
  }

  auto p = reinterpret_cast<uint8_t const*>(buffer);
  auto off = static_cast<off_t>(offset);

  while (count > 0) {
    auto n = ::pwrite(fd_, p, count, off);

    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }

      ec = std::error_code(errno, std::generic_category());

      return;
    }

    off += static_cast<off_t>(n);
    p += static_cast<size_t>(n);
    count -= static_cast<size_t>(n);
  }
}

void file_writer::write_at(file_off_t offset, void const* buffer,
                           size_t count) {
  std::error_code ec;
  write_at(offset, buffer, count, ec);
  if (ec) {
    SEEDSYNC_THROW(system_error, "write " + path_.string(), ec);
  }
}

void file_writer::truncate(file_size_t size, std::error_code& ec) {
  ec.clear();

  if (::ftruncate(fd_, static_cast<off_t>(size)) != 0) {
    ec = std::error_code(errno, std::generic_category());
  }
}

void file_writer::truncate(file_size_t size) {
  std::error_code ec;
  truncate(size, ec);
  if (ec) {
    SEEDSYNC_THROW(system_error, "truncate " + path_.string(), ec);
  }
}

void file_writer::close(std::error_code& ec) {
  ec.clear();

  if (fd_ >= 0) {
    if (::close(fd_) == -1) {
      ec = std::error_code(errno, std::generic_category());
    }

    fd_ = -1;
  }
}

void file_writer::close() {
  std::error_code ec;
  close(ec);
  if (ec) {
    SEEDSYNC_THROW(system_error, "close " + path_.string(), ec);
  }
}

} // namespace seedsync
