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
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>

#include <seedsync/error.h>

namespace seedsync {

/**
 * Failure classes of the seed engine
 *
 * These are the only codes a `seed_error` carries. The underlying OS
 * error, if any, is available through `seed_error::cause()`.
 */
enum class seed_errc {
  // caller's expected length disagrees with the segment size
  length_mismatch = 1,
  // seed file content no longer matches its chunk index
  seed_mismatch,
  // source and destination have a different phase modulo block size
  alignment_mismatch,
  // filesystem declined the clone request
  clone_unsupported,
  // any read, write or open failure
  io_error,
};

std::error_category const& seed_category() noexcept;

std::error_code make_error_code(seed_errc e) noexcept;

class seed_error : public error {
 public:
  seed_error(seed_errc code, std::filesystem::path path,
             std::string_view operation, std::string_view detail,
             source_location loc);
  seed_error(seed_errc code, std::filesystem::path path,
             std::string_view operation, std::error_code cause,
             source_location loc);

  char const* what() const noexcept override { return what_.c_str(); }

  std::error_code code() const noexcept { return make_error_code(code_); }
  seed_errc errc() const noexcept { return code_; }
  std::filesystem::path const& path() const noexcept { return path_; }
  std::string const& operation() const noexcept { return operation_; }
  std::error_code const& cause() const noexcept { return cause_; }

 private:
  seed_errc code_;
  std::filesystem::path path_;
  std::string operation_;
  std::error_code cause_;
  std::string what_;
};

} // namespace seedsync

template <>
struct std::is_error_code_enum<seedsync::seed_errc> : std::true_type {};
