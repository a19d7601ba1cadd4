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

#include "binapi/api/envelope.hpp"
#include "binapi/api/message_decoder.hpp"
#include <flow/log/log.hpp>
#include <flow/util/util.hpp>
#include <flow/util/blob.hpp>
#include <boost/unordered_map.hpp>
#include <vector>

namespace binapi::api
{

// Types.

/**
 * The provider-side counterpart of Channel::subscribe_notification() and buddy: keeps the registry of live
 * Notif_subscription objects, serves the control-queue handshake, and delivers each incoming notification
 * (message ID + encoded payload, as received from the peer) into the queue of every matching subscription.
 *
 * One `*this` may serve many `Channel`s: serve_subscription_request() is given the queues of the particular
 * channel.  All methods are thread-safe; delivery is non-blocking.  Delivery holds the registry lock throughout, so once
 * an unsubscribe has been processed nothing further reaches that subscription's queue.
 *
 * Each delivery gets a fresh message from the subscription's factory, decoded from the payload.  If the
 * subscriber's queue is full, the notification is dropped for that subscriber (and a warning logged).
 */
class Notif_dispatcher :
  public flow::log::Log_context
{
public:
  // Constructors/destructor.

  /**
   * Constructs dispatcher with no subscriptions.
   *
   * @param logger_ptr
   *        Logger to use for subsequently logging.
   * @param msg_decoder
   *        Decodes notification payloads; must outlive `*this`.
   * @param msg_identifier
   *        Resolves the message ID of each subscription's message type; must outlive `*this`.
   */
  explicit Notif_dispatcher(flow::log::Logger* logger_ptr,
                            const Message_decoder* msg_decoder, const Message_identifier* msg_identifier);

  // Methods.

  /**
   * Blocks until the given channel's notification control queue yields a request; processes it via
   * process_subscribe_request(); pushes the result onto the acknowledgement queue.
   *
   * @param queues
   *        The channel's queues.
   * @return `false` if the control queue was closed (and drained), so nothing was served; else `true`.
   */
  bool serve_subscription_request(const Channel_queues& queues);

  /**
   * Adds or removes the given subscription.
   *
   * @param request
   *        The request.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_NIL_MESSAGE (null subscription, or factory returned null),
   *        error::Code::S_INCOMPATIBLE_MESSAGE (subscribe: message type unknown to peer),
   *        error::Code::S_SUBSCRIPTION_NOT_FOUND (unsubscribe: not registered).
   */
  void process_subscribe_request(const Notif_subscribe_request& request, Error_code* err_code = 0);

  /**
   * Delivers a notification received from the peer to all subscriptions registered for its message ID.
   *
   * @param msg_id
   *        Message ID of the notification.
   * @param data
   *        Encoded payload.
   * @return Number of queues into which the notification was delivered.
   */
  size_t dispatch_notification(msg_id_t msg_id, const flow::util::Blob& data);

  /**
   * Number of live subscriptions.
   * @return See above.
   */
  size_t n_subscriptions() const;

private:
  // Types.

  /// Short-hand for mutex type.
  using Mutex = flow::util::Mutex_non_recursive;

  /// Short-hand for #Mutex lock.
  using Lock_guard = flow::util::Lock_guard<Mutex>;

  /// Short-hand for subscription handle.
  using Subscription_ptr = std::shared_ptr<Notif_subscription>;

  // Data.

  /// See ctor.
  const Message_decoder* const m_msg_decoder;

  /// See ctor.
  const Message_identifier* const m_msg_identifier;

  /// Protects #m_subs.
  mutable Mutex m_mutex;

  /// Message ID => subscriptions to it, in order of subscription.
  boost::unordered_map<msg_id_t, std::vector<Subscription_ptr>> m_subs;
}; // class Notif_dispatcher

} // namespace binapi::api
