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

#include <unordered_map>
#include <vector>

#include <fmt/format.h>

#include <seedsync/clone_access.h>
#include <seedsync/error.h>
#include <seedsync/file_seed.h>
#include <seedsync/logger.h>

namespace seedsync {

namespace fs = std::filesystem;

namespace {

template <typename LoggerPolicy>
class file_seed_ final : public file_seed::impl {
 public:
  file_seed_(logger& lgr, clone_access const& ca, fs::path const& dst_file,
             fs::path const& src_file, chunk_index index)
      : LOG_PROXY_INIT(lgr)
      , src_file_{src_file}
      , index_{std::move(index)}
      , can_reflink_{probe(ca, dst_file, src_file)} {
    auto const chunks = index_.chunks();

    for (size_t i = 0; i < chunks.size(); ++i) {
      pos_[chunks[i].id].push_back(i);
    }

    LOG_VERBOSE << "seed " << src_file_ << ": " << chunks.size()
                << " chunks, " << pos_.size() << " unique, reflink "
                << (can_reflink_ ? "supported" : "not supported");
  }

  std::pair<size_t, seed_segment>
  longest_match_with(std::span<index_chunk const> chunks) const override {
    if (chunks.empty() || index_.empty()) {
      return {0, seed_segment{}};
    }

    auto it = pos_.find(chunks.front().id);

    if (it == pos_.end()) {
      return {0, seed_segment{}};
    }

    std::span<index_chunk const> match;

    for (auto p : it->second) {
      auto m = max_match_from(chunks, p);
      if (m.size() > match.size()) {
        match = m;
      }
    }

    LOG_TRACE << "seed " << src_file_ << ": " << match.size()
              << " chunk match for " << chunks.front().id << " from "
              << it->second.size() << " candidate(s)";

    return {match.size(), seed_segment{src_file_, match, can_reflink_, true}};
  }

  fs::path const& source_path() const override { return src_file_; }

  chunk_index const& index() const override { return index_; }

  bool can_reflink() const override { return can_reflink_; }

 private:
  static bool probe(clone_access const& ca, fs::path const& dst_file,
                    fs::path const& src_file) {
    std::error_code ec;
    auto rv = ca.can_clone(dst_file, src_file, ec);
    if (ec) {
      SEEDSYNC_THROW(system_error,
                     fmt::format("cannot probe reflink support from {} to {}",
                                 src_file.string(), dst_file.string()),
                     ec);
    }
    return rv;
  }

  // seed chunks from position `p` that match `chunks` from its start
  std::span<index_chunk const>
  max_match_from(std::span<index_chunk const> chunks, size_t p) const {
    auto const seed = index_.chunks();
    size_t sp = 0;
    size_t dp = p;

    while (dp < seed.size() && sp < chunks.size() &&
           chunks[sp].id == seed[dp].id) {
      ++dp;
      ++sp;
    }

    return seed.subspan(p, dp - p);
  }

  LOG_PROXY_DECL(LoggerPolicy);
  fs::path const src_file_;
  chunk_index const index_;
  bool const can_reflink_;
  std::unordered_map<chunk_id, std::vector<size_t>> pos_;
};

} // namespace

fs::path const& seed_segment::source_path() const {
  static fs::path const empty;
  return source_ ? *source_ : empty;
}

file_seed::file_seed(logger& lgr, clone_access const& ca,
                     fs::path const& dst_file, fs::path const& src_file,
                     chunk_index index)
    : impl_{make_unique_logging_object<impl, file_seed_, logger_policies>(
          lgr, ca, dst_file, src_file, std::move(index))} {}

} // namespace seedsync
