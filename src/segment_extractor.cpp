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

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <vector>

#include <fmt/format.h>

#include <seedsync/clone_access.h>
#include <seedsync/file_reader.h>
#include <seedsync/file_writer.h>
#include <seedsync/logger.h>
#include <seedsync/seed_error.h>
#include <seedsync/seed_segment.h>
#include <seedsync/segment_extractor.h>

#include <seedsync/internal/detail/align_clone_range.h>

namespace seedsync {

namespace {

bool is_clone_unsupported(std::error_code const& ec) {
  if (ec.category() != std::generic_category() &&
      ec.category() != std::system_category()) {
    return false;
  }

  switch (ec.value()) {
  case EOPNOTSUPP:
#if ENOTSUP != EOPNOTSUPP
  case ENOTSUP:
#endif
  case EXDEV:
  case ENOTTY:
  case EINVAL:
  case ENOSYS:
    return true;
  default:
    return false;
  }
}

template <typename LoggerPolicy>
class segment_extractor_ final : public segment_extractor::impl {
 public:
  segment_extractor_(logger& lgr, clone_access const& ca,
                     segment_extractor_options const& opts)
      : LOG_PROXY_INIT(lgr)
      , ca_{ca}
      , opts_{opts} {}

  void write_into(seed_segment const& seg, file_writer& dst, file_off_t offset,
                  file_size_t length, file_size_t block_size) const override {
    if (length != seg.size()) {
      throw seed_error(
          seed_errc::length_mismatch, seg.source_path(), "write_into",
          fmt::format("unable to copy {} bytes to {}, segment has {} bytes",
                      length, dst.path().string(), seg.size()),
          SEEDSYNC_CURRENT_SOURCE_LOCATION);
    }

    if (seg.empty()) {
      return;
    }

    std::error_code ec;
    auto src = file_reader::open(seg.source_path(), ec);

    if (ec) {
      throw seed_error(seed_errc::io_error, seg.source_path(), "open", ec,
                       SEEDSYNC_CURRENT_SOURCE_LOCATION);
    }

    // make sure the seed still holds what its index claims
    if (seg.needs_validation()) {
      validate(seg, src);
    }

    LOG_TRACE << (seg.can_reflink() ? "cloning " : "copying ") << length
              << " bytes from " << seg.source_path() << "@"
              << seg.source_offset() << " to " << dst.path() << "@" << offset;

    if (seg.can_reflink()) {
      clone(src, dst, seg.source_offset(), length, offset, block_size);
    } else {
      copy(src, dst, seg.source_offset(), length, offset);
    }
  }

  file_size_t bytes_copied() const override { return bytes_copied_.load(); }
  file_size_t bytes_cloned() const override { return bytes_cloned_.load(); }

 private:
  void validate(seed_segment const& seg, file_reader const& src) const {
    std::vector<std::byte> buffer;

    for (auto const& c : seg.chunks()) {
      buffer.resize(static_cast<size_t>(c.size));

      std::error_code ec;
      src.read_at(c.start, buffer.data(), buffer.size(), ec);

      if (ec) {
        throw seed_error(seed_errc::io_error, src.path(), "validate", ec,
                         SEEDSYNC_CURRENT_SOURCE_LOCATION);
      }

      if (auto const id = chunk_id::digest(buffer); id != c.id) {
        LOG_DEBUG << "chunk at " << c.start << " in " << src.path()
                  << " hashes to " << id << ", index has " << c.id;
        throw seed_error(
            seed_errc::seed_mismatch, src.path(), "validate",
            fmt::format("chunk {} at offset {} doesn't match its data", c.id,
                        c.start),
            SEEDSYNC_CURRENT_SOURCE_LOCATION);
      }
    }
  }

  void copy(file_reader const& src, file_writer& dst, file_off_t src_offset,
            file_size_t length, file_off_t dst_offset) const {
    if (length <= 0) {
      return;
    }

    std::vector<std::byte> buffer(static_cast<size_t>(std::min<file_size_t>(
        length, std::max<size_t>(opts_.copy_buffer_size, 1))));
    file_size_t done{0};

    while (done < length) {
      auto const n = static_cast<size_t>(
          std::min<file_size_t>(length - done, buffer.size()));
      std::error_code ec;

      src.read_at(src_offset + done, buffer.data(), n, ec);

      if (ec) {
        throw seed_error(seed_errc::io_error, src.path(), "read", ec,
                         SEEDSYNC_CURRENT_SOURCE_LOCATION);
      }

      dst.write_at(dst_offset + done, buffer.data(), n, ec);

      if (ec) {
        throw seed_error(seed_errc::io_error, dst.path(), "write", ec,
                         SEEDSYNC_CURRENT_SOURCE_LOCATION);
      }

      done += static_cast<file_size_t>(n);
    }

    bytes_copied_ += length;
  }

  void clone(file_reader const& src, file_writer& dst, file_off_t src_offset,
             file_size_t length, file_off_t dst_offset,
             file_size_t block_size) const {
    std::error_code ec;
    auto const layout = internal::detail::align_clone_range(
        src_offset, length, dst_offset, block_size, ec);

    if (ec == seed_errc::alignment_mismatch) {
      throw seed_error(
          seed_errc::alignment_mismatch, dst.path(), "clone",
          fmt::format("reflink ranges not aligned between {}@{} and {}@{} "
                      "(block size {})",
                      src.path().string(), src_offset, dst.path().string(),
                      dst_offset, block_size),
          SEEDSYNC_CURRENT_SOURCE_LOCATION);
    }

    if (ec) {
      SEEDSYNC_THROW(runtime_error,
                     fmt::format("invalid clone request: {} bytes from {} to "
                                 "{} with block size {}: {}",
                                 length, src_offset, dst_offset, block_size,
                                 ec.message()));
    }

    // clone first so a failed clone leaves the destination untouched
    if (layout.clone.empty()) {
      LOG_TRACE << "no whole block in " << length << " bytes at "
                << src_offset << ", skipping clone";
    } else {
      ca_.clone_range(dst, src, layout.clone.offset(), layout.clone.size(),
                      layout.clone_dst, ec);

      if (ec) {
        throw seed_error(is_clone_unsupported(ec)
                             ? seed_errc::clone_unsupported
                             : seed_errc::io_error,
                         dst.path(), "clone", ec,
                         SEEDSYNC_CURRENT_SOURCE_LOCATION);
      }

      bytes_cloned_ += layout.clone.size();
    }

    copy(src, dst, layout.head.offset(), layout.head.size(), layout.head_dst);
    copy(src, dst, layout.tail.offset(), layout.tail.size(), layout.tail_dst);
  }

  LOG_PROXY_DECL(LoggerPolicy);
  clone_access const& ca_;
  segment_extractor_options const opts_;
  std::atomic<file_size_t> mutable bytes_copied_{0};
  std::atomic<file_size_t> mutable bytes_cloned_{0};
};

} // namespace

segment_extractor::segment_extractor(logger& lgr, clone_access const& ca,
                                     segment_extractor_options const& opts)
    : impl_{make_unique_logging_object<impl, segment_extractor_, logger_policies>(
          lgr, ca, opts)} {}

void segment_extractor::write_into(seed_segment const& seg, file_writer& dst,
                                   file_off_t offset, file_size_t length,
                                   file_size_t block_size,
                                   std::error_code& ec) const {
  ec.clear();

  try {
    impl_->write_into(seg, dst, offset, length, block_size);
  } catch (seed_error const& e) {
    ec = e.code();
  }
}

} // namespace seedsync
