/* binapi: Structured API Channel
 * Copyright (c) 2023 Akamai Technologies, Inc.; and other contributors.
 * Each commit is copyright by its respective author or author's employer.
 *
 * Licensed under the MIT License:
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in
 * all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN
 * THE SOFTWARE. */

/// @file
#include "binapi/api/detail/sync_queue.hpp"
#include <gtest/gtest.h>
#include <boost/thread/thread.hpp>

namespace binapi::test
{

namespace
{
using Int_queue = api::detail::Sync_queue<int>;
}

TEST(Sync_queue, Fifo_and_capacity)
{
  Int_queue queue(2);
  EXPECT_EQ(queue.capacity(), 2u);
  EXPECT_TRUE(queue.try_push(1));
  EXPECT_TRUE(queue.try_push(2));
  EXPECT_FALSE(queue.try_push(3));
  EXPECT_EQ(queue.size(), 2u);
  EXPECT_EQ(*queue.pop(), 1);
  EXPECT_EQ(*queue.try_pop(), 2);
  EXPECT_FALSE(queue.try_pop());
}

TEST(Sync_queue, Timed_pop)
{
  using boost::chrono::milliseconds;

  Int_queue queue;
  const auto start = Fine_clock::now();
  EXPECT_FALSE(queue.pop_for(milliseconds(20)));
  EXPECT_GE(Fine_clock::now() - start, Fine_duration(milliseconds(15)));

  boost::thread pusher([&]()
  {
    boost::this_thread::sleep_for(milliseconds(20));
    queue.push(5);
  });
  const auto item = queue.pop_for(Fine_duration::max());
  pusher.join();
  ASSERT_TRUE(item);
  EXPECT_EQ(*item, 5);
}

TEST(Sync_queue, Close)
{
  Int_queue queue(1);
  EXPECT_TRUE(queue.push(1));

  // A pusher blocked on a full queue is released by close().
  bool pushed = true;
  boost::thread pusher([&]() { pushed = queue.push(2); });
  queue.close();
  pusher.join();
  EXPECT_FALSE(pushed);
  EXPECT_TRUE(queue.closed());

  // Items queued before closing remain poppable; then nothing.
  EXPECT_EQ(*queue.pop(), 1);
  EXPECT_FALSE(queue.pop());
  EXPECT_FALSE(queue.push(3));
  queue.close();
}

} // namespace binapi::test
