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
#pragma once

#include "binapi/api/api_fwd.hpp"
#include <flow/util/util_fwd.hpp>
#include <boost/thread/condition_variable.hpp>
#include <boost/thread/locks.hpp>
#include <boost/core/noncopyable.hpp>
#include <deque>
#include <optional>

namespace binapi::api::detail
{

// Types.

/**
 * Thread-safe FIFO of `Item`s, optionally bounded, with blocking, blocking-with-timeout, and non-blocking ends;
 * plus a one-way close.  This is the sole conduit between an api::Channel and its provider (one queue per
 * direction, plus the notification-control pair; see Channel_queues); and the notification delivery queue
 * handed to Channel::subscribe_notification().
 *
 * Semantics:
 *   - push() blocks while the queue is at capacity (backpressure); try_push() instead returns `false` at once.
 *   - pop() blocks until an item is available; pop_for() is the same but gives up after a timeout.
 *   - close() is permanent: subsequent push()es fail; pop()s drain the remaining items, then return nothing
 *     immediately instead of blocking.  Every blocked caller is woken.
 *
 * @tparam Item
 *         Movable value type.
 */
template<typename Item>
class Sync_queue :
  private boost::noncopyable
{
public:
  // Types.

  /// Short-hand for sizes/capacity.
  using size_type = size_t;

  // Constants.

  /// Capacity value meaning no capacity limit (push() never blocks).
  static constexpr size_type S_UNBOUNDED = 0;

  // Constructors/destructor.

  /**
   * Constructs empty, open queue.
   *
   * @param capacity
   *        Max number of items queued at a time; or #S_UNBOUNDED.
   */
  explicit Sync_queue(size_type capacity = S_UNBOUNDED);

  // Methods.

  /**
   * Appends the item, first waiting for space to appear if the queue is full.
   *
   * @param item
   *        Item to move-in.
   * @return `true` if queued; `false` if the queue is (or became, while waiting for space) closed.
   */
  bool push(Item&& item);

  /**
   * Appends the item if there is space for it right now; never blocks.
   *
   * @param item
   *        Item to move-in.  Untouched if `false` returned.
   * @return `true` if queued; `false` if full or closed.
   */
  bool try_push(Item&& item);

  /**
   * Removes and returns the oldest item, first waiting for one to appear if empty.
   *
   * @return The item; or nothing if the queue is closed and empty.
   */
  std::optional<Item> pop();

  /**
   * Same as pop() but gives up after the given timeout.
   *
   * @param timeout
   *        Max time to wait; `Fine_duration::max()` means wait indefinitely, same as pop().
   * @return The item; or nothing if timed out or the queue is closed and empty.
   */
  std::optional<Item> pop_for(Fine_duration timeout);

  /**
   * Removes and returns the oldest item if one is available right now; never blocks.
   *
   * @return See above.
   */
  std::optional<Item> try_pop();

  /// Closes the queue permanently (no-op if already closed) and wakes all waiters.
  void close();

  /**
   * Whether close() has been called.
   * @return See above.
   */
  bool closed() const;

  /**
   * Number of items currently queued.
   * @return See above.
   */
  size_type size() const;

  /**
   * Capacity passed to ctor.
   * @return See above.
   */
  size_type capacity() const;

private:
  // Types.

  /// Short-hand for #m_mutex type.
  using Mutex = flow::util::Mutex_non_recursive;

  /// Short-hand for #Mutex lock; must be `unique_lock` to work with the condition variables.
  using Lock = boost::unique_lock<Mutex>;

  // Methods.

  /**
   * Whether there is no space for another item.  #m_mutex must be locked.
   * @return See above.
   */
  bool full() const;

  /**
   * Pops front item and signals a waiting pusher.  #m_mutex must be locked; #m_items must not be empty.
   * @return See above.
   */
  Item pop_front();

  // Data.

  /// See capacity().
  const size_type m_capacity;

  /// Protects all mutable data.
  mutable Mutex m_mutex;

  /// Signaled when an item is added, or on close().
  boost::condition_variable m_not_empty;

  /// Signaled when an item is removed, or on close().
  boost::condition_variable m_not_full;

  /// The items, oldest at front.
  std::deque<Item> m_items;

  /// See closed().
  bool m_closed;
}; // class Sync_queue

// Template implementations.

template<typename Item>
Sync_queue<Item>::Sync_queue(size_type capacity) :
  m_capacity(capacity),
  m_closed(false)
{
  // Nothing else.
}

template<typename Item>
bool Sync_queue<Item>::full() const
{
  return (m_capacity != S_UNBOUNDED) && (m_items.size() >= m_capacity);
}

template<typename Item>
Item Sync_queue<Item>::pop_front()
{
  Item item = std::move(m_items.front());
  m_items.pop_front();
  m_not_full.notify_one();
  return item;
}

template<typename Item>
bool Sync_queue<Item>::push(Item&& item)
{
  Lock lock(m_mutex);
  m_not_full.wait(lock, [&]() -> bool { return m_closed || (!full()); });

  if (m_closed)
  {
    return false;
  }
  // else

  m_items.emplace_back(std::move(item));
  m_not_empty.notify_one();
  return true;
}

template<typename Item>
bool Sync_queue<Item>::try_push(Item&& item)
{
  Lock lock(m_mutex);
  if (m_closed || full())
  {
    return false;
  }
  // else

  m_items.emplace_back(std::move(item));
  m_not_empty.notify_one();
  return true;
}

template<typename Item>
std::optional<Item> Sync_queue<Item>::pop()
{
  Lock lock(m_mutex);
  m_not_empty.wait(lock, [&]() -> bool { return m_closed || (!m_items.empty()); });

  if (m_items.empty())
  {
    return std::nullopt; // Closed and drained.
  }
  // else
  return pop_front();
}

template<typename Item>
std::optional<Item> Sync_queue<Item>::pop_for(Fine_duration timeout)
{
  /* Fine_duration::max() would overflow inside the timed wait (now() + timeout); and anyway it is our
   * documented stand-in for "no timeout." */
  if (timeout == Fine_duration::max())
  {
    return pop();
  }
  // else

  Lock lock(m_mutex);
  m_not_empty.wait_for(lock, timeout, [&]() -> bool { return m_closed || (!m_items.empty()); });
  // Whether it timed out or not, the result is decided by what's in there now.

  if (m_items.empty())
  {
    return std::nullopt;
  }
  // else
  return pop_front();
}

template<typename Item>
std::optional<Item> Sync_queue<Item>::try_pop()
{
  Lock lock(m_mutex);
  if (m_items.empty())
  {
    return std::nullopt;
  }
  // else
  return pop_front();
}

template<typename Item>
void Sync_queue<Item>::close()
{
  {
    Lock lock(m_mutex);
    if (m_closed)
    {
      return;
    }
    m_closed = true;
  }
  m_not_empty.notify_all();
  m_not_full.notify_all();
}

template<typename Item>
bool Sync_queue<Item>::closed() const
{
  Lock lock(m_mutex);
  return m_closed;
}

template<typename Item>
typename Sync_queue<Item>::size_type Sync_queue<Item>::size() const
{
  Lock lock(m_mutex);
  return m_items.size();
}

template<typename Item>
typename Sync_queue<Item>::size_type Sync_queue<Item>::capacity() const
{
  return m_capacity;
}

} // namespace binapi::api::detail
