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
#include <iosfwd>
#include <memory>
#include <optional>
#include <span>

#include <seedsync/file_seed.h>
#include <seedsync/types.h>

namespace seedsync {

class chunk_store;
class clone_access;
class logger;

struct assemble_options {
  // zero means one worker per hardware thread
  size_t num_workers{1};
  // clone granularity, queried from the destination if not set
  std::optional<file_size_t> block_size{};
  size_t copy_buffer_size{static_cast<size_t>(1) << 20};
  bool verify_store_chunks{true};
};

struct assemble_stats {
  size_t chunks_total{0};
  size_t chunks_from_seeds{0};
  size_t chunks_from_store{0};
  file_size_t bytes_total{0};
  file_size_t bytes_from_seeds{0};
  file_size_t bytes_from_store{0};
  file_size_t bytes_cloned{0};
  file_size_t bytes_copied{0};
  // seed segments that were rejected and fetched from the store instead
  size_t seed_fallbacks{0};
  // clone attempts that were retried as plain copies
  size_t clone_fallbacks{0};
};

std::ostream& operator<<(std::ostream& os, assemble_stats const& stats);

/**
 * Reconstructs a file from its chunk index
 *
 * Runs of chunks found in any of the seeds are copied or cloned from the
 * seed, everything else is fetched from the chunk store. Seed segments
 * that fail validation fall back to the store, failed clones fall back to
 * plain copies. All other errors are propagated.
 */
class file_assembler {
 public:
  file_assembler(logger& lgr, clone_access const& ca,
                 assemble_options const& opts = {});

  assemble_stats assemble(std::filesystem::path const& dst,
                          chunk_index const& target,
                          std::span<file_seed const> seeds,
                          chunk_store const& store) const {
    return impl_->assemble(dst, target, seeds, store);
  }

  class impl {
   public:
    virtual ~impl() = default;

    virtual assemble_stats
    assemble(std::filesystem::path const& dst, chunk_index const& target,
             std::span<file_seed const> seeds,
             chunk_store const& store) const = 0;
  };

 private:
  std::unique_ptr<impl const> impl_;
};

} // namespace seedsync
