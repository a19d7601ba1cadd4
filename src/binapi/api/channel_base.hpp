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
#include <boost/chrono/duration.hpp>

namespace binapi::api
{

// Types.

/**
 * Empty type usable as the `Metadata` template parameter of Channel, when the caller has no context to attach
 * to its channels.
 */
struct Null_metadata {};

/// `Channel` base that contains non-parameterized `public` items such as constants.
class Channel_base
{
public:
  // Constants.

  /**
   * Default max time that Channel reply-receiving APIs wait for a reply before emitting
   * error::Code::S_REPLY_TIMEOUT.  Changeable per channel via Channel::set_reply_timeout().
   */
  static const Fine_duration S_DEFAULT_REPLY_TIMEOUT;

  /// Default capacity of the request queue, as used by Channel_provider::new_api_channel().
  static constexpr size_t S_DEFAULT_REQ_QUEUE_SZ = 100;

  /// Default capacity of the reply queue, as used by Channel_provider::new_api_channel().
  static constexpr size_t S_DEFAULT_REPLY_QUEUE_SZ = 100;

  /**
   * Suggested capacity of a notification delivery queue (Notif_queue), which the caller of
   * Channel::subscribe_notification() creates.  Events arriving while it is full are dropped.
   */
  static constexpr size_t S_DEFAULT_NOTIF_QUEUE_SZ = 100;
}; // class Channel_base

} // namespace binapi::api
