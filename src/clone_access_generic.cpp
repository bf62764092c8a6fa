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
#include <string>

#include <fcntl.h>
#include <sys/ioctl.h>
#include <sys/stat.h>
#include <unistd.h>

#ifdef __linux__
#include <linux/fs.h>
#endif

#include <seedsync/clone_access_generic.h>
#include <seedsync/file_reader.h>
#include <seedsync/file_writer.h>
#include <seedsync/scope_exit.h>

namespace seedsync {

namespace fs = std::filesystem;
namespace {

fs::path directory_of(fs::path const& path) {
  auto dir = path.parent_path();
  return dir.empty() ? fs::path{"."} : dir;
}

std::error_code last_error() { return {errno, std::generic_category()}; }

#ifdef FICLONERANGE
int ficlonerange(int dst_fd, int src_fd, file_off_t src_offset,
                 file_size_t length, file_off_t dst_offset) {
  struct ::file_clone_range cr{};
  cr.src_fd = src_fd;
  cr.src_offset = static_cast<__u64>(src_offset);
  cr.src_length = static_cast<__u64>(length);
  cr.dest_offset = static_cast<__u64>(dst_offset);
  return ::ioctl(dst_fd, FICLONERANGE, &cr);
}
#endif

} // namespace

bool clone_access_generic::can_clone(fs::path const& dst, fs::path const& src,
                                     std::error_code& ec) const {
  ec.clear();

  struct ::stat src_st;
  struct ::stat dir_st;
  auto const dir = directory_of(dst);

  if (::stat(src.c_str(), &src_st) != 0 || ::stat(dir.c_str(), &dir_st) != 0) {
    ec = last_error();
    return false;
  }

  // blocks can't be shared across devices
  if (src_st.st_dev != dir_st.st_dev) {
    return false;
  }

#ifdef FICLONERANGE
  auto reader = file_reader::open(src, ec);

  if (ec) {
    return false;
  }

  auto tmpfile = (dir / ".seedsync_clone_probe_XXXXXX").string();
  auto fd = ::mkstemp(tmpfile.data());

  if (fd < 0) {
    ec = last_error();
    return false;
  }

  ::unlink(tmpfile.c_str());

  scope_exit close_probe{[fd] { ::close(fd); }};

  // a zero length clones the whole file, which only touches metadata
  return ficlonerange(fd, reader.fd(), 0, 0, 0) == 0;
#else
  return false;
#endif
}

void clone_access_generic::clone_range(
    file_writer& dst [[maybe_unused]], file_reader const& src [[maybe_unused]],
    file_off_t src_offset [[maybe_unused]], file_size_t length,
    file_off_t dst_offset [[maybe_unused]], std::error_code& ec) const {
  ec.clear();

  // the kernel treats a zero length as "up to the end of the source"
  if (length == 0) {
    return;
  }

#ifdef FICLONERANGE
  if (ficlonerange(dst.fd(), src.fd(), src_offset, length, dst_offset) != 0) {
    ec = last_error();
  }
#else
  ec = std::make_error_code(std::errc::operation_not_supported);
#endif
}

file_size_t clone_access_generic::block_size(fs::path const& path,
                                             std::error_code& ec) const {
  ec.clear();

  struct ::stat st;
  auto const target = fs::exists(path, ec) ? path : directory_of(path);

  if (ec) {
    return 0;
  }

  if (::stat(target.c_str(), &st) != 0) {
    ec = last_error();
    return 0;
  }

  return static_cast<file_size_t>(st.st_blksize);
}

} // namespace seedsync
