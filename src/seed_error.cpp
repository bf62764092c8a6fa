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

#include <utility>

#include <fmt/format.h>

#include <seedsync/seed_error.h>
#include <seedsync/util.h>

namespace seedsync {

namespace {

class seed_category_impl : public std::error_category {
 public:
  char const* name() const noexcept override { return "seedsync"; }

  std::string message(int ev) const override {
    switch (static_cast<seed_errc>(ev)) {
    case seed_errc::length_mismatch:
      return "length mismatch";
    case seed_errc::seed_mismatch:
      return "seed does not match its index";
    case seed_errc::alignment_mismatch:
      return "block alignment mismatch";
    case seed_errc::clone_unsupported:
      return "clone not supported";
    case seed_errc::io_error:
      return "I/O error";
    }
    return fmt::format("unknown seed error {}", ev);
  }
};

std::string make_what(seed_errc code, std::filesystem::path const& path,
                      std::string_view operation, std::string_view detail,
                      source_location const& loc) {
  auto msg = fmt::format("[{}:{}] {}: {} {}", basename(loc.file_name()),
                         loc.line(), seed_category().message(
                                         static_cast<int>(code)),
                         operation, path.string());
  if (!detail.empty()) {
    msg += fmt::format(": {}", detail);
  }
  return msg;
}

} // namespace

std::error_category const& seed_category() noexcept {
  static seed_category_impl const instance;
  return instance;
}

std::error_code make_error_code(seed_errc e) noexcept {
  return {static_cast<int>(e), seed_category()};
}

seed_error::seed_error(seed_errc code, std::filesystem::path path,
                       std::string_view operation, std::string_view detail,
                       source_location loc)
    : error{loc}
    , code_{code}
    , path_{std::move(path)}
    , operation_{operation}
    , what_{make_what(code_, path_, operation_, detail, loc)} {}

seed_error::seed_error(seed_errc code, std::filesystem::path path,
                       std::string_view operation, std::error_code cause,
                       source_location loc)
    : error{loc}
    , code_{code}
    , path_{std::move(path)}
    , operation_{operation}
    , cause_{cause}
    , what_{make_what(code_, path_, operation_,
                      cause_ ? cause_.message() : std::string{}, loc)} {}

} // namespace seedsync
