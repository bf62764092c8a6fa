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

#include <exception>
#include <mutex>
#include <ostream>
#include <vector>

#include <fmt/format.h>

#include <seedsync/chunk_index.h>
#include <seedsync/chunk_store.h>
#include <seedsync/clone_access.h>
#include <seedsync/error.h>
#include <seedsync/file_assembler.h>
#include <seedsync/file_range.h>
#include <seedsync/file_writer.h>
#include <seedsync/logger.h>
#include <seedsync/seed_error.h>
#include <seedsync/segment_extractor.h>
#include <seedsync/util.h>

#include <seedsync/internal/worker_group.h>

namespace seedsync {

namespace fs = std::filesystem;

namespace {

struct assemble_step {
  size_t first{0};
  size_t count{0};
  file_range range;
  // empty if the chunks have to come from the store
  seed_segment segment;
};

struct step_result {
  size_t chunks_from_seeds{0};
  size_t chunks_from_store{0};
  file_size_t bytes_from_seeds{0};
  file_size_t bytes_from_store{0};
  size_t seed_fallbacks{0};
  size_t clone_fallbacks{0};
};

template <typename LoggerPolicy>
class file_assembler_ final : public file_assembler::impl {
 public:
  file_assembler_(logger& lgr, clone_access const& ca,
                  assemble_options const& opts)
      : LOG_PROXY_INIT(lgr)
      , ca_{ca}
      , opts_{opts} {}

  assemble_stats
  assemble(fs::path const& dst, chunk_index const& target,
           std::span<file_seed const> seeds,
           chunk_store const& store) const override {
    auto ti = LOG_TIMED_VERBOSE;

    auto writer = file_writer::open(dst);
    writer.truncate(target.total_size());

    auto const block_size = get_block_size(dst);
    auto const steps = plan(target, seeds, block_size);

    LOG_DEBUG << "assembling " << dst << " from " << target.size()
              << " chunks in " << steps.size() << " steps, block size "
              << block_size;

    segment_extractor extractor(
        LOG_GET_LOGGER, ca_,
        {.copy_buffer_size = opts_.copy_buffer_size});

    assemble_stats stats;
    stats.chunks_total = target.size();
    stats.bytes_total = target.total_size();

    std::mutex mx;
    std::exception_ptr first_error;

    auto run = [&](assemble_step const& step) {
      auto const r = execute(step, target, writer, extractor, block_size, store);
      std::lock_guard lock(mx);
      stats.chunks_from_seeds += r.chunks_from_seeds;
      stats.chunks_from_store += r.chunks_from_store;
      stats.bytes_from_seeds += r.bytes_from_seeds;
      stats.bytes_from_store += r.bytes_from_store;
      stats.seed_fallbacks += r.seed_fallbacks;
      stats.clone_fallbacks += r.clone_fallbacks;
    };

    if (opts_.num_workers == 1 || steps.size() < 2) {
      for (auto const& step : steps) {
        run(step);
      }
    } else {
      internal::worker_group wg(LOG_GET_LOGGER, "assemble", opts_.num_workers);

      for (auto const& step : steps) {
        wg.add_job([&run, &mx, &first_error, &step] {
          try {
            run(step);
          } catch (...) {
            std::lock_guard lock(mx);
            if (!first_error) {
              first_error = std::current_exception();
            }
          }
        });
      }

      wg.wait();
      wg.stop();

      if (first_error) {
        std::rethrow_exception(first_error);
      }
    }

    writer.close();

    stats.bytes_cloned = extractor.bytes_cloned();
    stats.bytes_copied = extractor.bytes_copied();

    ti << "assembled " << dst << " (" << size_with_unit(stats.bytes_total)
       << ", " << stats.chunks_from_seeds << " chunks from seeds, "
       << stats.chunks_from_store << " from store)";

    return stats;
  }

 private:
  file_size_t get_block_size(fs::path const& dst) const {
    file_size_t bs;

    if (opts_.block_size) {
      bs = *opts_.block_size;
    } else {
      std::error_code ec;
      bs = ca_.block_size(dst, ec);

      if (ec) {
        SEEDSYNC_THROW(system_error,
                       fmt::format("cannot determine block size of {}",
                                   dst.string()),
                       ec);
      }
    }

    if (bs <= 0) {
      SEEDSYNC_THROW(runtime_error,
                     fmt::format("invalid block size {} for {}", bs,
                                 dst.string()));
    }

    return bs;
  }

  std::vector<assemble_step> plan(chunk_index const& target,
                                  std::span<file_seed const> seeds,
                                  file_size_t block_size) const {
    auto const chunks = target.chunks();
    std::vector<assemble_step> steps;
    size_t pos = 0;

    while (pos < chunks.size()) {
      size_t best = 0;
      seed_segment seg;

      // earlier seeds win on equal match length
      for (auto const& seed : seeds) {
        auto [n, s] = seed.longest_match_with(chunks.subspan(pos));
        if (n > best) {
          best = n;
          seg = s;
        }
      }

      if (best == 0) {
        auto const& c = chunks[pos];
        steps.push_back({pos, 1, {c.start, c.size}, {}});
        ++pos;
        continue;
      }

      auto const start = chunks[pos].start;
      auto const end = chunks[pos + best - 1].end();

      if (seg.can_reflink() && seg.source_offset() % block_size !=
                                   start % block_size) {
        LOG_TRACE << "segment at " << seg.source_offset() << " in "
                  << seg.source_path() << " cannot be cloned to " << start
                  << ", copying";
        seg = seg.with_reflink(false);
      }

      steps.push_back({pos, best, {start, end - start}, seg});
      pos += best;
    }

    return steps;
  }

  step_result
  execute(assemble_step const& step, chunk_index const& target,
          file_writer& writer, segment_extractor const& extractor,
          file_size_t block_size, chunk_store const& store) const {
    step_result r;

    if (!step.segment.empty()) {
      if (write_segment(step, writer, extractor, block_size, r)) {
        r.chunks_from_seeds = step.count;
        r.bytes_from_seeds = step.range.size();
        return r;
      }

      ++r.seed_fallbacks;
    }

    auto const chunks = target.chunks().subspan(step.first, step.count);

    for (auto const& c : chunks) {
      auto const data = store.get_chunk(c.id);

      if (static_cast<file_size_t>(data.size()) != c.size) {
        SEEDSYNC_THROW(runtime_error,
                       fmt::format("chunk {} from store has {} bytes, "
                                   "expected {}",
                                   c.id, data.size(), c.size));
      }

      if (opts_.verify_store_chunks) {
        if (auto const id = chunk_id::digest(data); id != c.id) {
          SEEDSYNC_THROW(runtime_error,
                         fmt::format("chunk {} from store hashes to {}", c.id,
                                     id));
        }
      }

      writer.write_at(c.start, data.data(), data.size());

      ++r.chunks_from_store;
      r.bytes_from_store += c.size;
    }

    return r;
  }

  // returns false if the seed data was rejected
  bool write_segment(assemble_step const& step, file_writer& writer,
                     segment_extractor const& extractor,
                     file_size_t block_size, step_result& r) const {
    auto const& seg = step.segment;

    try {
      extractor.write_into(seg, writer, step.range.offset(),
                           step.range.size(), block_size);
      return true;
    } catch (seed_error const& e) {
      switch (e.errc()) {
      case seed_errc::alignment_mismatch:
      case seed_errc::clone_unsupported:
        LOG_DEBUG << "clone failed, copying instead: " << e.what();
        ++r.clone_fallbacks;
        break;

      case seed_errc::seed_mismatch:
        LOG_WARN << e.what() << ", fetching " << step.count
                 << " chunk(s) from store";
        return false;

      default:
        throw;
      }
    }

    // the seed data has already been validated at this point
    extractor.write_into(seg.with_reflink(false).with_validation(false),
                         writer, step.range.offset(), step.range.size(),
                         block_size);

    return true;
  }

  LOG_PROXY_DECL(LoggerPolicy);
  clone_access const& ca_;
  assemble_options const opts_;
};

} // namespace

std::ostream& operator<<(std::ostream& os, assemble_stats const& stats) {
  return os << fmt::format(
             "{} chunks ({} bytes): {} from seeds ({} bytes, {} cloned, {} "
             "copied), {} from store ({} bytes), {} seed fallback(s), {} "
             "clone fallback(s)",
             stats.chunks_total, stats.bytes_total, stats.chunks_from_seeds,
             stats.bytes_from_seeds, stats.bytes_cloned, stats.bytes_copied,
             stats.chunks_from_store, stats.bytes_from_store,
             stats.seed_fallbacks, stats.clone_fallbacks);
}

file_assembler::file_assembler(logger& lgr, clone_access const& ca,
                               assemble_options const& opts)
    : impl_{make_unique_logging_object<impl, file_assembler_, logger_policies>(
          lgr, ca, opts)} {}

} // namespace seedsync
