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

#include "binapi/api/channel_base.hpp"
#include "binapi/api/envelope.hpp"
#include "binapi/api/message_decoder.hpp"
#include "binapi/api/error.hpp"
#include <flow/log/log.hpp>
#include <flow/error/error.hpp>
#include <flow/util/util.hpp>
#include <boost/chrono/round.hpp>
#include <boost/core/noncopyable.hpp>
#include <vector>
#include <sstream>
#include <utility>
#include <cassert>
#include <string>

namespace binapi::api
{

// Types.

/**
 * The main communication interface with the peer: one logical conversation.  A `*this` shares (with the
 * Channel_provider that created it) a bundle of queues (Channel_queues): one for requests to the peer, one for
 * replies from it, and a pair for notification subscribe/unsubscribe control.  It refers to the (shared,
 * read-only) Message_decoder and Message_identifier collaborators.  It owns no transport resources.
 *
 * ### Request/reply ###
 * send_request() pushes a request envelope and returns a Request_ctx; Request_ctx::receive_reply() then
 * blocks (subject to reply_timeout()) for the next reply envelope and correlates it to the message the caller
 * expects:
 *   - an error carried in the envelope (put there by the provider) is forwarded unchanged;
 *   - the envelope's message ID must equal the ID the Message_identifier assigns to the expected message;
 *     else error::Code::S_UNEXPECTED_MESSAGE_ID and the target message is not touched;
 *   - the payload is decoded via the Message_decoder into the target message.
 *
 * send_multi_request() and Multi_request_ctx are the same for exchanges in which the peer answers with
 * 0+ replies followed by a terminator; Multi_request_ctx::receive_reply() is called repeatedly until it
 * reports the terminator.
 *
 * Correlation is purely by order plus message ID: replies are consumed in the order the provider delivers them,
 * which must be the order of the requests.  Therefore:
 *
 * @warning Do not use one `*this` from multiple threads concurrently, or interleave two outstanding
 *          exchanges on it; replies would mix, typically yielding error::Code::S_UNEXPECTED_MESSAGE_ID.
 *          Use multiple `Channel`s instead.
 *
 * ### Notifications ###
 * subscribe_notification() and unsubscribe_notification() perform a synchronous request/acknowledge handshake
 * over the control queues, independent of the request/reply queues.  Events are delivered (by the
 * notification dispatcher, such as Notif_dispatcher, not by `*this`) into the caller's queue.  These calls
 * have no timeout.
 *
 * ### Error reporting ###
 * Every fallible method takes trailing `Error_code* err_code`; null means throw `flow::error::Runtime_error`
 * on failure.  When thrown, the exception's context names operation-specific detail, e.g., the timeout
 * duration or the incompatible message's name and CRC.
 *
 * ### Closing ###
 * close() (also invoked by the dtor) closes the request queue, which is the provider's signal to release its
 * resources pertaining to `*this`.
 *
 * @tparam Metadata
 *         Type of the opaque value attached at construction and returned by metadata(); Null_metadata if
 *         none is needed.  Must be movable.
 */
template<typename Metadata>
class Channel :
  public Channel_base,
  public flow::log::Log_context,
  private boost::noncopyable
{
public:
  // Types.

  /// Short-hand for the `Metadata` template parameter.
  using Metadata_t = Metadata;

  class Request_ctx;
  class Multi_request_ctx;

  // Constructors/destructor.

  /**
   * Constructs the channel, wired to queues whose other end is operated by the provider.  Intended to be
   * invoked by a Channel_provider, not directly by the end user.
   *
   * @param logger_ptr
   *        Logger to use for subsequently logging.
   * @param nickname
   *        Human-readable nickname of the new channel, as shown in logs/printouts.
   * @param queues
   *        The queues; `*this` shares ownership of each.  None may be null.
   * @param msg_decoder
   *        Decoder; must outlive `*this`.
   * @param msg_identifier
   *        Identifier; must outlive `*this`.
   * @param metadata
   *        Opaque value, returned by metadata().
   */
  explicit Channel(flow::log::Logger* logger_ptr, util::String_view nickname, const Channel_queues& queues,
                   const Message_decoder* msg_decoder, const Message_identifier* msg_identifier,
                   Metadata metadata = Metadata());

  /// Invokes close() (if not already done).
  ~Channel();

  // Methods.

  /**
   * Returns the metadata given to ctor.
   * @return See above.
   */
  const Metadata& metadata() const;

  /**
   * Returns nickname given to ctor.
   * @return See above.
   */
  const std::string& nickname() const;

  /**
   * Sets the max time the reply-receiving APIs wait for a reply before emitting error::Code::S_REPLY_TIMEOUT.
   * Applies to receives started subsequently, not to one already waiting.
   *
   * @param timeout
   *        The timeout.  `Fine_duration::max()` means no timeout.
   */
  void set_reply_timeout(Fine_duration timeout);

  /**
   * Returns the current reply timeout.  Initially Channel_base::S_DEFAULT_REPLY_TIMEOUT.
   * @return See above.
   */
  Fine_duration reply_timeout() const;

  /**
   * Closes the request queue, signaling to the provider that this channel's resources are to be released.
   * Subsequent sends fail with error::Code::S_CHANNEL_CLOSED.  Repeated calls are no-ops.
   */
  void close();

  /**
   * Non-blockingly (unless the request queue is full) sends a request, to which exactly one reply is expected.
   * Any error the provider encounters in sending it is delivered in the reply and thus emitted by
   * Request_ctx::receive_reply().
   *
   * @param msg
   *        The request.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_NIL_MESSAGE, error::Code::S_CHANNEL_CLOSED.
   * @return Context on which to receive the reply; invalid (Request_ctx::valid() is `false`) on error.
   */
  Request_ctx send_request(Message_ptr msg, Error_code* err_code = 0);

  /**
   * Same as send_request() but for a multipart request: 0+ replies followed by a terminator are expected.
   *
   * @param msg
   *        See send_request().
   * @param err_code
   *        See send_request().
   * @return See send_request().
   */
  Multi_request_ctx send_multi_request(Message_ptr msg, Error_code* err_code = 0);

  /**
   * Subscribes for delivery of notification messages of the type produced by `msg_factory` into `notif_queue`.
   * Blocks (without timeout) until the notification dispatcher acknowledges.  The caller is responsible for
   * creating the queue with its preferred capacity; if it is full when a notification arrives, that notification
   * is not delivered into it.
   *
   * @param notif_queue
   *        Delivery queue.  Must not be null.
   * @param msg_factory
   *        Returns a new blank instance of the expected notification message.  Must not be empty.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_NIL_MESSAGE (null queue or empty factory), error::Code::S_CHANNEL_CLOSED,
   *        or whatever the dispatcher acknowledges with (e.g., error::Code::S_INCOMPATIBLE_MESSAGE).
   * @return The subscription, to pass to unsubscribe_notification() later; null on error.
   */
  std::shared_ptr<Notif_subscription> subscribe_notification(std::shared_ptr<Notif_queue> notif_queue,
                                                             Msg_factory msg_factory, Error_code* err_code = 0);

  /**
   * Unsubscribes from notifications tied to the given subscription.  Blocks (without timeout) until the
   * notification dispatcher acknowledges.  After successful return nothing further is delivered on its behalf.
   *
   * @param subscription
   *        Value returned by subscribe_notification().
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_NIL_MESSAGE (null subscription), error::Code::S_CHANNEL_CLOSED,
   *        or whatever the dispatcher acknowledges with (e.g., error::Code::S_SUBSCRIPTION_NOT_FOUND).
   */
  void unsubscribe_notification(const std::shared_ptr<Notif_subscription>& subscription,
                                Error_code* err_code = 0);

  /**
   * Checks whether the given messages are compatible with the version of the peer to which we are connected:
   * i.e., whether the Message_identifier knows each one's name + CRC.  Stops at the first incompatible message.
   *
   * @param msgs
   *        Messages to check.  Only name and CRC matter.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_INCOMPATIBLE_MESSAGE, error::Code::S_NIL_MESSAGE.
   * @return Null if all are compatible (or on S_NIL_MESSAGE); else the first incompatible one.
   */
  const Message* check_message_compatibility(const std::vector<const Message*>& msgs,
                                             Error_code* err_code = 0) const;

private:
  // Methods.

  /**
   * Sends a request envelope.  Emits errors as send_request().
   *
   * @param msg
   *        See send_request().
   * @param multipart
   *        See Vpp_request::m_multipart.
   * @param err_code
   *        Not null.
   * @return `true` on success.
   */
  bool send_request_impl(Message_ptr&& msg, bool multipart, Error_code* err_code);

  /**
   * The correlation routine shared by Request_ctx::receive_reply() and Multi_request_ctx::receive_reply():
   * receives one reply envelope (subject to timeout) and, unless it is an error or a terminator, validates its
   * message ID against the one expected for `*msg` and decodes it into `*msg`.
   *
   * @param msg
   *        Target message.
   * @param err_code
   *        Not null.  #Error_code generated: error::Code::S_NIL_MESSAGE, error::Code::S_REPLY_TIMEOUT,
   *        error::Code::S_CHANNEL_CLOSED (reply queue closed and drained), error::Code::S_INCOMPATIBLE_MESSAGE,
   *        error::Code::S_UNEXPECTED_MESSAGE_ID, error::Code::S_DECODE_FAILED, or an error from the envelope.
   * @return `true` if and only if the envelope was a multipart terminator (no decoding done).
   */
  bool receive_reply_impl(Message* msg, Error_code* err_code);

  /**
   * Performs one notification control exchange: push request; await acknowledgement.
   *
   * @param subscription
   *        See Notif_subscribe_request.
   * @param subscribe
   *        See Notif_subscribe_request.
   * @param err_code
   *        Not null.
   */
  void notif_subscribe_impl(const std::shared_ptr<Notif_subscription>& subscription, bool subscribe,
                            Error_code* err_code);

  /**
   * Builds the context string for a thrown `flow::error::Runtime_error`, adding detail pertinent to
   * the given error.
   *
   * @param op
   *        Name of the public API that failed.
   * @param channel_or_null
   *        The channel involved, if known.
   * @param msg_or_null
   *        The message involved, if any.
   * @param err_code
   *        Truthy error.
   * @return See above.
   */
  static std::string failure_context(util::String_view op, const Channel* channel_or_null,
                                     const Message* msg_or_null, const Error_code& err_code);

  // Data.

  /// See nickname().
  const std::string m_nickname;

  /// The queues shared with the provider.
  const Channel_queues m_queues;

  /// Decodes reply payloads.
  const Message_decoder* const m_msg_decoder;

  /// Resolves expected message IDs.
  const Message_identifier* const m_msg_identifier;

  /// See reply_timeout().
  Fine_duration m_reply_timeout;

  /// See metadata().
  const Metadata m_metadata;
}; // class Channel

/**
 * Context of an ongoing simple request (exactly one reply expected), as returned by Channel::send_request().
 * Single-use: after one receive_reply() that consumed a reply (successfully or not), `*this` becomes invalid.
 * Movable, not copyable.
 *
 * @warning `*this` refers to the originating Channel, which must outlive it (or at least any further call on it).
 *          Behavior is undefined otherwise.
 */
template<typename Metadata>
class Channel<Metadata>::Request_ctx
{
public:
  // Constructors/destructor.

  /// Constructs an invalid context.  receive_reply() will emit error::Code::S_INVALID_CONTEXT.
  Request_ctx();

  /**
   * Move-constructs; `src` becomes invalid.
   * @param src
   *        Source.
   */
  Request_ctx(Request_ctx&& src);

  /// Disallow copying.
  Request_ctx(const Request_ctx&) = delete;

  // Methods.

  /**
   * Move-assigns; `src` becomes invalid.
   * @param src
   *        Source.
   * @return `*this`.
   */
  Request_ctx& operator=(Request_ctx&& src);

  /// Disallow copying.
  Request_ctx& operator=(const Request_ctx&) = delete;

  /**
   * Whether receive_reply() may be called.
   * @return See above.
   */
  bool valid() const;

  /**
   * Receives the reply (blocking until it arrives, or the channel's reply timeout passes) and decodes it into
   * `*msg`.  Do not use `*msg` contents unless this succeeds.
   *
   * @param msg
   *        Target message: a blank (or reusable) instance of the expected reply type.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_INVALID_CONTEXT, error::Code::S_UNEXPECTED_TERMINATOR, those of the correlation routine
   *        (see Channel class doc header), or an error forwarded from the provider.
   */
  void receive_reply(Message* msg, Error_code* err_code = 0);

private:
  // Friends.

  /// Channel creates valid contexts.
  friend class Channel;

  // Constructors.

  /**
   * Constructs a valid context.
   * @param channel
   *        The channel; not null.
   */
  explicit Request_ctx(Channel* channel);

  // Data.

  /// The channel; null if invalid.
  Channel* m_channel;
}; // class Channel::Request_ctx

/**
 * Context of an ongoing multipart request (0+ replies then a terminator expected), as returned by
 * Channel::send_multi_request().  Becomes invalid once receive_reply() reports the terminator.
 * Movable, not copyable.
 *
 * @warning As with Request_ctx, the originating Channel must outlive `*this`.
 */
template<typename Metadata>
class Channel<Metadata>::Multi_request_ctx
{
public:
  // Constructors/destructor.

  /// Constructs an invalid context.
  Multi_request_ctx();

  /**
   * Move-constructs; `src` becomes invalid.
   * @param src
   *        Source.
   */
  Multi_request_ctx(Multi_request_ctx&& src);

  /// Disallow copying.
  Multi_request_ctx(const Multi_request_ctx&) = delete;

  // Methods.

  /**
   * Move-assigns; `src` becomes invalid.
   * @param src
   *        Source.
   * @return `*this`.
   */
  Multi_request_ctx& operator=(Multi_request_ctx&& src);

  /// Disallow copying.
  Multi_request_ctx& operator=(const Multi_request_ctx&) = delete;

  /**
   * Whether receive_reply() may be called.
   * @return See above.
   */
  bool valid() const;

  /**
   * Receives the next reply of the exchange (blocking until it arrives, or the channel's reply timeout passes)
   * and decodes it into `*msg`; unless it is the terminator, in which case `true` is returned, `*msg` is not
   * touched, and the exchange is over.  Do not use `*msg` contents if `true` is returned or an error is emitted.
   *
   * @param msg
   *        Target message: a blank (or reusable) instance of the expected reply type.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_INVALID_CONTEXT, those of the correlation routine (see Channel class doc header),
   *        or an error forwarded from the provider.
   * @return `true` if the terminator was received; `false` otherwise (including on error).
   */
  bool receive_reply(Message* msg, Error_code* err_code = 0);

private:
  // Friends.

  /// Channel creates valid contexts.
  friend class Channel;

  // Constructors.

  /**
   * Constructs a valid context.
   * @param channel
   *        The channel; not null.
   */
  explicit Multi_request_ctx(Channel* channel);

  // Data.

  /// The channel; null if invalid.
  Channel* m_channel;
}; // class Channel::Multi_request_ctx

// Template implementations.

/**
 * Internally used macro; public API users should disregard.
 * @internal
 * Convenience macro for *this* file only: non-inline class template methods are hideous to read (+ write).
 * These are `undef`-ed at the end of the file.
 */
#define TEMPLATE_API_CHANNEL \
  template<typename Metadata>
/// See nearby `TEMPLATE_...` macro; same deal here.
#define CLASS_API_CHANNEL \
  Channel<Metadata>

TEMPLATE_API_CHANNEL
CLASS_API_CHANNEL::Channel(flow::log::Logger* logger_ptr, util::String_view nickname, const Channel_queues& queues,
                           const Message_decoder* msg_decoder, const Message_identifier* msg_identifier,
                           Metadata metadata) :
  flow::log::Log_context(logger_ptr, Log_component::S_API),
  m_nickname(nickname),
  m_queues(queues),
  m_msg_decoder(msg_decoder),
  m_msg_identifier(msg_identifier),
  m_reply_timeout(S_DEFAULT_REPLY_TIMEOUT),
  m_metadata(std::move(metadata))
{
  using boost::chrono::round;
  using boost::chrono::milliseconds;

  assert(m_queues.m_req_queue && m_queues.m_reply_queue
         && m_queues.m_notif_subs_queue && m_queues.m_notif_subs_reply_queue
         && "Provider must supply all queues.");
  assert(m_msg_decoder && m_msg_identifier);

  FLOW_LOG_INFO("api::Channel [" << *this << "]: Created: request queue capacity "
                "[" << m_queues.m_req_queue->capacity() << "], reply queue capacity "
                "[" << m_queues.m_reply_queue->capacity() << "] (0 = unbounded); "
                "reply timeout [" << round<milliseconds>(m_reply_timeout).count() << " ms].");
}

TEMPLATE_API_CHANNEL
CLASS_API_CHANNEL::~Channel()
{
  FLOW_LOG_INFO("api::Channel [" << *this << "]: Shutting down.");
  close();
}

TEMPLATE_API_CHANNEL
const Metadata& CLASS_API_CHANNEL::metadata() const
{
  return m_metadata;
}

TEMPLATE_API_CHANNEL
const std::string& CLASS_API_CHANNEL::nickname() const
{
  return m_nickname;
}

TEMPLATE_API_CHANNEL
void CLASS_API_CHANNEL::set_reply_timeout(Fine_duration timeout)
{
  using boost::chrono::round;
  using boost::chrono::milliseconds;

  if (timeout == Fine_duration::max())
  {
    FLOW_LOG_INFO("api::Channel [" << *this << "]: Reply timeout disabled.");
  }
  else
  {
    FLOW_LOG_INFO("api::Channel [" << *this << "]: Reply timeout set to "
                  "[" << round<milliseconds>(timeout).count() << " ms].");
  }
  m_reply_timeout = timeout;
}

TEMPLATE_API_CHANNEL
Fine_duration CLASS_API_CHANNEL::reply_timeout() const
{
  return m_reply_timeout;
}

TEMPLATE_API_CHANNEL
void CLASS_API_CHANNEL::close()
{
  if (m_queues.m_req_queue->closed())
  {
    return;
  }
  // else

  FLOW_LOG_INFO("api::Channel [" << *this << "]: Closing request queue; provider shall release the channel.  "
                "Requests still queued: [" << m_queues.m_req_queue->size() << "].");
  m_queues.m_req_queue->close();
}

TEMPLATE_API_CHANNEL
typename CLASS_API_CHANNEL::Request_ctx CLASS_API_CHANNEL::send_request(Message_ptr msg, Error_code* err_code)
{
  Request_ctx ctx;
  if (flow::error::exec_and_throw_on_error
        ([&](Error_code* actual_err_code) -> Request_ctx { return send_request(std::move(msg), actual_err_code); },
         &ctx, err_code, "Channel::send_request()"))
  {
    return ctx;
  }
  // else: err_code is not null.

  if (!send_request_impl(std::move(msg), false, err_code))
  {
    return ctx; // Invalid.
  }
  // else
  return Request_ctx(this);
}

TEMPLATE_API_CHANNEL
typename CLASS_API_CHANNEL::Multi_request_ctx
  CLASS_API_CHANNEL::send_multi_request(Message_ptr msg, Error_code* err_code)
{
  Multi_request_ctx ctx;
  if (flow::error::exec_and_throw_on_error
        ([&](Error_code* actual_err_code) -> Multi_request_ctx
           { return send_multi_request(std::move(msg), actual_err_code); },
         &ctx, err_code, "Channel::send_multi_request()"))
  {
    return ctx;
  }
  // else: err_code is not null.

  if (!send_request_impl(std::move(msg), true, err_code))
  {
    return ctx; // Invalid.
  }
  // else
  return Multi_request_ctx(this);
}

TEMPLATE_API_CHANNEL
bool CLASS_API_CHANNEL::send_request_impl(Message_ptr&& msg, bool multipart, Error_code* err_code)
{
  assert(err_code);
  err_code->clear();

  if (!msg)
  {
    FLOW_LOG_WARNING("api::Channel [" << *this << "]: Send requested with null message.  Ignoring.");
    *err_code = error::Code::S_NIL_MESSAGE;
    return false;
  }
  // else

  FLOW_LOG_TRACE("api::Channel [" << *this << "]: Sending request [" << *msg << "]; "
                 "multipart reply expected? = [" << multipart << "].");

  if (!m_queues.m_req_queue->push(Vpp_request{ std::move(msg), multipart }))
  {
    FLOW_LOG_WARNING("api::Channel [" << *this << "]: Send requested, but the channel has been closed.  "
                     "Emitting error.");
    *err_code = error::Code::S_CHANNEL_CLOSED;
    return false;
  }
  // else
  return true;
} // Channel::send_request_impl()

TEMPLATE_API_CHANNEL
bool CLASS_API_CHANNEL::receive_reply_impl(Message* msg, Error_code* err_code)
{
  using boost::chrono::round;
  using boost::chrono::milliseconds;

  assert(err_code);
  err_code->clear();

  if (!msg)
  {
    FLOW_LOG_WARNING("api::Channel [" << *this << "]: Reply receipt requested with null target message.");
    *err_code = error::Code::S_NIL_MESSAGE;
    return false;
  }
  // else

  // Blocks until a reply arrives or the timeout expires.
  auto reply = m_queues.m_reply_queue->pop_for(m_reply_timeout);

  if (!reply)
  {
    if (m_queues.m_reply_queue->closed())
    {
      FLOW_LOG_WARNING("api::Channel [" << *this << "]: Awaiting reply for [" << *msg << "], but the provider "
                       "closed the reply queue.  Emitting error.");
      *err_code = error::Code::S_CHANNEL_CLOSED;
      return false;
    }
    // else

    FLOW_LOG_WARNING("api::Channel [" << *this << "]: No reply for [" << *msg << "] received within the "
                     "timeout period [" << round<milliseconds>(m_reply_timeout).count() << " ms].  "
                     "Emitting error.");
    *err_code = error::Code::S_REPLY_TIMEOUT;
    return false;
  }
  // else

  if (reply->m_err_code)
  {
    *err_code = reply->m_err_code;
    FLOW_LOG_WARNING("api::Channel [" << *this << "]: Reply for [" << *msg << "] carries error "
                     "[" << *err_code << "] [" << err_code->message() << "] from provider.  Forwarding it.");
    return false;
  }
  // else

  if (reply->m_last_reply_received)
  {
    FLOW_LOG_TRACE("api::Channel [" << *this << "]: Received multipart terminator.");
    return true;
  }
  // else

  // Message checks.
  Error_code id_err_code;
  const auto exp_msg_id = m_msg_identifier->get_message_id(*msg, &id_err_code);
  if (id_err_code)
  {
    FLOW_LOG_WARNING("api::Channel [" << *this << "]: Message [" << msg->message_name() << "] with CRC "
                     "[" << msg->crc_string() << "] is not compatible with the peer we are connected to "
                     "(identifier said [" << id_err_code << "] [" << id_err_code.message() << "]).");
    *err_code = error::Code::S_INCOMPATIBLE_MESSAGE;
    return false;
  }
  // else

  if (reply->m_msg_id != exp_msg_id)
  {
    FLOW_LOG_WARNING("api::Channel [" << *this << "]: Received invalid message ID: expected [" << exp_msg_id << "] "
                     "([" << msg->message_name() << "]), but got [" << reply->m_msg_id << "].  Check that multiple "
                     "threads are not sharing a single channel.");
    *err_code = error::Code::S_UNEXPECTED_MESSAGE_ID;
    return false;
  }
  // else

  Error_code decode_err_code;
  m_msg_decoder->decode_msg(reply->m_data, msg, &decode_err_code);
  if (decode_err_code)
  {
    FLOW_LOG_WARNING("api::Channel [" << *this << "]: Could not decode reply payload sized "
                     "[" << reply->m_data.size() << "] into [" << *msg << "]: decoder said "
                     "[" << decode_err_code << "] [" << decode_err_code.message() << "].");
    *err_code = error::Code::S_DECODE_FAILED;
    return false;
  }
  // else

  FLOW_LOG_TRACE("api::Channel [" << *this << "]: Received reply [" << *msg << "] (ID [" << exp_msg_id << "]).");
  return false;
} // Channel::receive_reply_impl()

TEMPLATE_API_CHANNEL
std::shared_ptr<Notif_subscription>
  CLASS_API_CHANNEL::subscribe_notification(std::shared_ptr<Notif_queue> notif_queue, Msg_factory msg_factory,
                                            Error_code* err_code)
{
  using std::shared_ptr;
  using std::make_shared;

  shared_ptr<Notif_subscription> subscription;
  if (flow::error::exec_and_throw_on_error
        ([&](Error_code* actual_err_code) -> shared_ptr<Notif_subscription>
           { return subscribe_notification(std::move(notif_queue), std::move(msg_factory), actual_err_code); },
         &subscription, err_code, "Channel::subscribe_notification()"))
  {
    return subscription;
  }
  // else: err_code is not null.

  if ((!notif_queue) || (!msg_factory))
  {
    FLOW_LOG_WARNING("api::Channel [" << *this << "]: Subscribe requested with null queue or empty factory.");
    *err_code = error::Code::S_NIL_MESSAGE;
    return subscription;
  }
  // else

  subscription = make_shared<Notif_subscription>(Notif_subscription{ std::move(notif_queue),
                                                                     std::move(msg_factory) });
  notif_subscribe_impl(subscription, true, err_code);
  if (*err_code)
  {
    subscription.reset();
  }
  return subscription;
}

TEMPLATE_API_CHANNEL
void CLASS_API_CHANNEL::unsubscribe_notification(const std::shared_ptr<Notif_subscription>& subscription,
                                                 Error_code* err_code)
{
  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { unsubscribe_notification(subscription, actual_err_code); },
         err_code, "Channel::unsubscribe_notification()"))
  {
    return;
  }
  // else: err_code is not null.

  if (!subscription)
  {
    FLOW_LOG_WARNING("api::Channel [" << *this << "]: Unsubscribe requested with null subscription.");
    *err_code = error::Code::S_NIL_MESSAGE;
    return;
  }
  // else

  notif_subscribe_impl(subscription, false, err_code);
}

TEMPLATE_API_CHANNEL
void CLASS_API_CHANNEL::notif_subscribe_impl(const std::shared_ptr<Notif_subscription>& subscription,
                                             bool subscribe, Error_code* err_code)
{
  assert(err_code);
  err_code->clear();

  FLOW_LOG_TRACE("api::Channel [" << *this << "]: Notification " << (subscribe ? "subscribe" : "unsubscribe")
                 << " request for subscription [" << subscription.get() << "]; awaiting acknowledgement.");

  if (!m_queues.m_notif_subs_queue->push(Notif_subscribe_request{ subscription, subscribe }))
  {
    FLOW_LOG_WARNING("api::Channel [" << *this << "]: Notification control queue closed.  Emitting error.");
    *err_code = error::Code::S_CHANNEL_CLOSED;
    return;
  }
  // else

  // No timeout here: the dispatcher always answers (or closes the reply queue).
  const auto ack = m_queues.m_notif_subs_reply_queue->pop();
  if (!ack)
  {
    FLOW_LOG_WARNING("api::Channel [" << *this << "]: Notification control reply queue closed before "
                     "acknowledgement.  Emitting error.");
    *err_code = error::Code::S_CHANNEL_CLOSED;
    return;
  }
  // else

  *err_code = *ack;
  if (*err_code)
  {
    FLOW_LOG_WARNING("api::Channel [" << *this << "]: Notification " << (subscribe ? "subscribe" : "unsubscribe")
                     << " request refused: [" << *err_code << "] [" << err_code->message() << "].");
  }
} // Channel::notif_subscribe_impl()

TEMPLATE_API_CHANNEL
const Message* CLASS_API_CHANNEL::check_message_compatibility(const std::vector<const Message*>& msgs,
                                                              Error_code* err_code) const
{
  if (!err_code)
  {
    Error_code our_err_code;
    const auto bad_msg = check_message_compatibility(msgs, &our_err_code);
    if (our_err_code)
    {
      throw flow::error::Runtime_error(our_err_code,
                                       failure_context("Channel::check_message_compatibility()",
                                                       this, bad_msg, our_err_code));
    }
    return bad_msg;
  }
  // else

  err_code->clear();
  for (const auto msg : msgs)
  {
    if (!msg)
    {
      FLOW_LOG_WARNING("api::Channel [" << *this << "]: Compatibility check given null message.");
      *err_code = error::Code::S_NIL_MESSAGE;
      return nullptr;
    }
    // else

    Error_code id_err_code;
    m_msg_identifier->get_message_id(*msg, &id_err_code);
    if (id_err_code)
    {
      FLOW_LOG_WARNING("api::Channel [" << *this << "]: Message [" << msg->message_name() << "] with CRC "
                       "[" << msg->crc_string() << "] is not compatible with the peer we are connected to.");
      *err_code = error::Code::S_INCOMPATIBLE_MESSAGE;
      return msg;
    }
  }

  FLOW_LOG_TRACE("api::Channel [" << *this << "]: All [" << msgs.size() << "] messages are compatible.");
  return nullptr;
} // Channel::check_message_compatibility()

TEMPLATE_API_CHANNEL
std::string CLASS_API_CHANNEL::failure_context(util::String_view op, const Channel* channel_or_null,
                                               const Message* msg_or_null, const Error_code& err_code)
{
  using boost::chrono::round;
  using boost::chrono::milliseconds;
  using std::ostringstream;

  ostringstream os;
  os << op;
  if (channel_or_null)
  {
    os << " on channel [" << *channel_or_null << ']';
  }

  if ((err_code == error::Code::S_REPLY_TIMEOUT) && channel_or_null)
  {
    os << ": no reply received within the timeout period "
          "[" << round<milliseconds>(channel_or_null->reply_timeout()).count() << " ms]";
  }
  else if (((err_code == error::Code::S_INCOMPATIBLE_MESSAGE) || (err_code == error::Code::S_UNEXPECTED_MESSAGE_ID))
           && msg_or_null)
  {
    os << ": message [" << msg_or_null->message_name() << "] with CRC [" << msg_or_null->crc_string() << ']';
  }
  return os.str();
}

// Request_ctx template implementations.

TEMPLATE_API_CHANNEL
CLASS_API_CHANNEL::Request_ctx::Request_ctx() :
  m_channel(nullptr)
{
  // That's it.
}

TEMPLATE_API_CHANNEL
CLASS_API_CHANNEL::Request_ctx::Request_ctx(Channel* channel) :
  m_channel(channel)
{
  assert(m_channel);
}

TEMPLATE_API_CHANNEL
CLASS_API_CHANNEL::Request_ctx::Request_ctx(Request_ctx&& src) :
  m_channel(std::exchange(src.m_channel, nullptr))
{
  // That's it.
}

TEMPLATE_API_CHANNEL
typename CLASS_API_CHANNEL::Request_ctx& CLASS_API_CHANNEL::Request_ctx::operator=(Request_ctx&& src)
{
  if (&src != this)
  {
    m_channel = std::exchange(src.m_channel, nullptr);
  }
  return *this;
}

TEMPLATE_API_CHANNEL
bool CLASS_API_CHANNEL::Request_ctx::valid() const
{
  return m_channel;
}

TEMPLATE_API_CHANNEL
void CLASS_API_CHANNEL::Request_ctx::receive_reply(Message* msg, Error_code* err_code)
{
  if (!err_code)
  {
    const Channel* const channel = m_channel; // Save it: we are about to be consumed.
    Error_code our_err_code;
    receive_reply(msg, &our_err_code);
    if (our_err_code)
    {
      throw flow::error::Runtime_error(our_err_code,
                                       failure_context("Request_ctx::receive_reply()", channel, msg, our_err_code));
    }
    return;
  }
  // else

  if (!m_channel)
  {
    *err_code = error::Code::S_INVALID_CONTEXT;
    return;
  }
  // else

  const bool last_reply_received = m_channel->receive_reply_impl(msg, err_code);
  if (*err_code == error::Code::S_NIL_MESSAGE)
  {
    return; // Nothing was consumed; the context remains usable.
  }
  // else

  const auto channel = std::exchange(m_channel, nullptr);
  if (last_reply_received)
  {
    FLOW_LOG_SET_CONTEXT(channel->get_logger(), Log_component::S_API);
    FLOW_LOG_WARNING("api::Channel [" << *channel << "]: Multipart terminator received while a simple reply was "
                     "expected for [" << *msg << "].  Emitting error.");
    *err_code = error::Code::S_UNEXPECTED_TERMINATOR;
  }
} // Channel::Request_ctx::receive_reply()

// Multi_request_ctx template implementations.

TEMPLATE_API_CHANNEL
CLASS_API_CHANNEL::Multi_request_ctx::Multi_request_ctx() :
  m_channel(nullptr)
{
  // That's it.
}

TEMPLATE_API_CHANNEL
CLASS_API_CHANNEL::Multi_request_ctx::Multi_request_ctx(Channel* channel) :
  m_channel(channel)
{
  assert(m_channel);
}

TEMPLATE_API_CHANNEL
CLASS_API_CHANNEL::Multi_request_ctx::Multi_request_ctx(Multi_request_ctx&& src) :
  m_channel(std::exchange(src.m_channel, nullptr))
{
  // That's it.
}

TEMPLATE_API_CHANNEL
typename CLASS_API_CHANNEL::Multi_request_ctx&
  CLASS_API_CHANNEL::Multi_request_ctx::operator=(Multi_request_ctx&& src)
{
  if (&src != this)
  {
    m_channel = std::exchange(src.m_channel, nullptr);
  }
  return *this;
}

TEMPLATE_API_CHANNEL
bool CLASS_API_CHANNEL::Multi_request_ctx::valid() const
{
  return m_channel;
}

TEMPLATE_API_CHANNEL
bool CLASS_API_CHANNEL::Multi_request_ctx::receive_reply(Message* msg, Error_code* err_code)
{
  if (!err_code)
  {
    const Channel* const channel = m_channel;
    Error_code our_err_code;
    const bool last_reply_received = receive_reply(msg, &our_err_code);
    if (our_err_code)
    {
      throw flow::error::Runtime_error(our_err_code,
                                       failure_context("Multi_request_ctx::receive_reply()",
                                                       channel, msg, our_err_code));
    }
    return last_reply_received;
  }
  // else

  if (!m_channel)
  {
    *err_code = error::Code::S_INVALID_CONTEXT;
    return false;
  }
  // else

  const bool last_reply_received = m_channel->receive_reply_impl(msg, err_code);
  if (last_reply_received)
  {
    m_channel = nullptr; // Exchange over.
  }
  return last_reply_received;
}

TEMPLATE_API_CHANNEL
std::ostream& operator<<(std::ostream& os, const CLASS_API_CHANNEL& val)
{
  return os << '[' << val.nickname() << "]@" << static_cast<const void*>(&val);
}

#undef CLASS_API_CHANNEL
#undef TEMPLATE_API_CHANNEL

} // namespace binapi::api
