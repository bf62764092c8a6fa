/* vim:set ts=2 sw=2 sts=2 et: */
/**
 * \author     Marcus Holland-Moritz (github@mhxnet.de)
 * \copyright  Copyright (c) Marcus Holland-Moritz
 *
 * This file is part of seedsync.
 *
 * seedsync is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * seedsync is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with seedsync.  If not, see <https://www.gnu.org/licenses/>.
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include <atomic>
#include <chrono>
#include <thread>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <seedsync/internal/worker_group.h>

#include "test_logger.h"

using namespace seedsync;
using seedsync::internal::worker_group;

TEST(worker_group_test, runs_all_jobs) {
  test::test_logger lgr;
  worker_group wg(lgr, "test", 4);

  EXPECT_TRUE(wg);
  EXPECT_TRUE(wg.running());
  EXPECT_EQ(4U, wg.size());

  std::atomic<int> sum{0};

  for (int i = 1; i <= 1000; ++i) {
    EXPECT_TRUE(wg.add_job([&sum, i] { sum += i; }));
  }

  wg.wait();

  EXPECT_EQ(500500, sum.load());
  EXPECT_EQ(0U, wg.queue_size());

  wg.stop();

  EXPECT_FALSE(wg.running());
  EXPECT_FALSE(wg.add_job([] {}));
}

TEST(worker_group_test, bounded_queue) {
  test::test_logger lgr;
  worker_group wg(lgr, "bounded", 1, 2);

  std::atomic<bool> release{false};
  std::atomic<int> done{0};

  auto job = [&] {
    while (!release) {
      std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    ++done;
  };

  wg.add_job(job);

  std::thread producer([&] {
    for (int i = 0; i < 5; ++i) {
      wg.add_job(job);
    }
  });

  std::this_thread::sleep_for(std::chrono::milliseconds(50));

  EXPECT_LE(wg.queue_size(), 2U);

  release = true;
  producer.join();
  wg.wait();

  EXPECT_EQ(6, done.load());
}

TEST(worker_group_test, default_worker_count) {
  test::test_logger lgr;
  worker_group wg(lgr, "auto", 0);

  EXPECT_GE(wg.size(), 1U);
}

TEST(worker_group_test, logs_startup) {
  test::test_logger lgr(logger::DEBUG);

  {
    worker_group wg(lgr, "logging", 2);
  }

  EXPECT_EQ(1U, lgr.count(logger::DEBUG, "starting 2 logging worker(s)"))
      << lgr;
}
