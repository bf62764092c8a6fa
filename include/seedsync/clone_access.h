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

#include <filesystem>
#include <system_error>

#include <seedsync/types.h>

namespace seedsync {

class file_reader;
class file_writer;

/**
 * Filesystem copy-on-write capability
 *
 * All errors are reported as the raw OS error code; it is up to the caller
 * to decide which of them mean "not supported".
 */
class clone_access {
 public:
  virtual ~clone_access() = default;

  // whether `src` can share blocks with a file created at `dst`
  virtual bool
  can_clone(std::filesystem::path const& dst, std::filesystem::path const& src,
            std::error_code& ec) const = 0;

  // shares `length` bytes at `src_offset` of `src` as `dst_offset` of `dst`
  virtual void clone_range(file_writer& dst, file_reader const& src,
                           file_off_t src_offset, file_size_t length,
                           file_off_t dst_offset,
                           std::error_code& ec) const = 0;

  // preferred block size of the filesystem holding `path`
  virtual file_size_t
  block_size(std::filesystem::path const& path, std::error_code& ec) const = 0;
};

} // namespace seedsync
