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

#include "binapi/api/message.hpp"
#include "binapi/api/detail/sync_queue.hpp"
#include <flow/util/blob.hpp>

namespace binapi::api
{

// Types.

/// A request that will be sent to the peer: pushed by Channel onto the Request_queue; consumed by the provider.
struct Vpp_request
{
  // Data.

  /// Message to be sent (encoded and framed by the provider).
  Message_ptr m_msg;

  /// `true` if 0+ replies followed by a terminator are expected; `false` if exactly 1 reply is expected.
  bool m_multipart;
};

/**
 * A reply received from the peer: pushed by the provider onto the Reply_queue; consumed by Channel.
 * Exactly one of the following holds:
 *   - #m_err_code is truthy: the exchange failed in the provider/transport; other members are meaningless;
 *   - #m_last_reply_received is `true`: terminator of a multipart exchange; #m_data is ignored;
 *   - otherwise: #m_data is the encoded payload of message #m_msg_id, decodable via Message_decoder.
 */
struct Vpp_reply
{
  // Data.

  /// Peer-assigned ID of the message encoded in #m_data.
  msg_id_t m_msg_id;

  /// Encoded payload (framing removed).
  flow::util::Blob m_data;

  /// In a multipart exchange: `true` if this is the terminator (carries no data).
  bool m_last_reply_received;

  /// Error attached by the provider; falsy normally.
  Error_code m_err_code;
};

/**
 * A live registration for delivery of a specific notification message type.  Created by
 * Channel::subscribe_notification(); its address is its identity for Channel::unsubscribe_notification().
 */
struct Notif_subscription
{
  // Data.

  /**
   * Caller-owned queue where notification messages are delivered.  Its capacity is the caller's choice;
   * if it is full when an event arrives, that event is not delivered into it (dropped).
   */
  std::shared_ptr<Notif_queue> m_notif_queue;

  /// Returns a new blank instance of the specific message expected as the notification.
  Msg_factory m_msg_factory;
};

/// A control request to add or remove a Notif_subscription, exchanged via the Notif_subs_queue.
struct Notif_subscribe_request
{
  // Data.

  /// The subscription to add or remove.
  std::shared_ptr<Notif_subscription> m_subscription;

  /// `true` to subscribe; `false` to unsubscribe.
  bool m_subscribe;
};

/**
 * The bundle of queues joining one Channel to its provider (and notification dispatcher).  The Channel holds
 * one copy; the provider another; each queue is therefore shared.  Closing #m_req_queue (see Channel::close())
 * is the signal to the provider that the Channel is done.
 */
struct Channel_queues
{
  // Methods.

  /**
   * Creates a bundle of new open queues.
   *
   * @param req_queue_sz
   *        Capacity of #m_req_queue; or `Sync_queue::S_UNBOUNDED`.
   * @param reply_queue_sz
   *        Capacity of #m_reply_queue; or `Sync_queue::S_UNBOUNDED`.
   * @return See above.
   */
  static Channel_queues create(size_t req_queue_sz, size_t reply_queue_sz);

  // Data.

  /// Requests from the Channel to the provider.
  std::shared_ptr<Request_queue> m_req_queue;

  /// Replies from the provider to the Channel.
  std::shared_ptr<Reply_queue> m_reply_queue;

  /// Notification subscribe/unsubscribe requests from the Channel.
  std::shared_ptr<Notif_subs_queue> m_notif_subs_queue;

  /// Acknowledgements to #m_notif_subs_queue items, in order.
  std::shared_ptr<Notif_subs_reply_queue> m_notif_subs_reply_queue;
};

} // namespace binapi::api
