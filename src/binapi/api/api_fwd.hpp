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

#include "binapi/common.hpp"
#include <capnp/message.h>
#include <memory>
#include <cstdint>
#include <ostream>
#include <string>

/**
 * Module of binapi containing the client-side structured API channel: sending typed requests to the peer and
 * receiving exactly the matching typed replies (simple or multipart), subscribing to peer-originated
 * notifications, and checking message definitions for compatibility with the connected peer.
 *
 * The big daddy is api::Channel.  Its operation depends on collaborators that are specified only as interfaces:
 *   - Message_decoder: raw reply bytes => described Message (a concrete impl: Capnp_codec);
 *   - Message_identifier: Message (name + CRC) => peer-assigned numeric ID (a concrete impl: Msg_id_table);
 *   - Channel_provider: builds `Channel`s wired to a live transport to the peer.
 *
 * The provider and the Channel communicate strictly via a bundle of queues (Channel_queues): the Channel pushes
 * Vpp_request envelopes and pops Vpp_reply envelopes; a parallel pair of queues carries notification
 * subscribe/unsubscribe control requests (Notif_subscribe_request) and their acknowledgements (served by, e.g.,
 * Notif_dispatcher).
 */
namespace binapi::api
{

// Types.

// Find doc headers near the bodies of these compound types.

enum class Message_type;
class Message;
class Data_type;

class Message_decoder;
class Message_identifier;

struct Vpp_request;
struct Vpp_reply;
struct Notif_subscription;
struct Notif_subscribe_request;
struct Channel_queues;

struct Null_metadata;

class Channel_base;
template<typename Metadata = Null_metadata>
class Channel;
template<typename Metadata = Null_metadata>
class Channel_provider;

class Msg_id_table;
class Notif_dispatcher;

class Capnp_message_base;
template<typename Message_body>
class Capnp_message;
template<typename Type_body>
class Capnp_data_type;
class Capnp_codec;

template<typename Capnp_reader>
struct Ostreamable_capnp_brief;

namespace detail
{
template<typename Item>
class Sync_queue;
}

/**
 * Numeric message identifier as assigned by the peer to each message definition (name + CRC) it supports.
 * Meaningful only within the context of one connection to one peer version; it is resolved via
 * Message_identifier and never stored inside a Message.
 */
using msg_id_t = uint16_t;

/// Short-hand for ref-counted pointer to a Message.  Requests and notifications are exchanged in this form.
using Message_ptr = std::shared_ptr<Message>;

/// Short-hand for a notification message factory: returns a fresh (blank) instance of the expected event type.
using Msg_factory = Function<Message_ptr ()>;

/// Queue carrying requests from a Channel to its provider.
using Request_queue = detail::Sync_queue<Vpp_request>;

/// Queue carrying replies from a provider to a Channel.
using Reply_queue = detail::Sync_queue<Vpp_reply>;

/// Queue carrying notification subscribe/unsubscribe requests from a Channel to the notification dispatcher.
using Notif_subs_queue = detail::Sync_queue<Notif_subscribe_request>;

/// Queue carrying acknowledgements (falsy `Error_code` on success) back to the Channel.
using Notif_subs_reply_queue = detail::Sync_queue<Error_code>;

/// Caller-owned queue into which notification messages are delivered.
using Notif_queue = detail::Sync_queue<Message_ptr>;

/// Alias for capnp's MessageBuilder interface.  Rationale: as part of our API, we use our identifier style.
using Capnp_msg_builder_interface = ::capnp::MessageBuilder;

/// Alias for capnp's MessageReader interface.  Rationale: as part of our API, we use our identifier style.
using Capnp_msg_reader_interface = ::capnp::MessageReader;

// Free functions.

/**
 * Prints string representation of the given Message_type to the given `ostream`.
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, Message_type val);

/**
 * Prints string representation of the given Message (name, CRC, type) to the given `ostream`.
 *
 * @relatesalso Message
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Message& val);

/**
 * Prints string representation of the given api::Channel to the given `ostream`.
 *
 * @relatesalso Channel
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
template<typename Metadata>
std::ostream& operator<<(std::ostream& os, const Channel<Metadata>& val);

/**
 * Prints string representation of the given Msg_id_table to the given `ostream`.
 *
 * @relatesalso Msg_id_table
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Msg_id_table& val);

/**
 * Prints string representation of the given Notif_dispatcher to the given `ostream`.
 *
 * @relatesalso Notif_dispatcher
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Notif_dispatcher& val);

/**
 * Prints string representation of the given Capnp_codec to the given `ostream`.
 *
 * @relatesalso Capnp_codec
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Capnp_codec& val);

/**
 * Convenience function that returns an object passable to `ostream<<` to print a
 * one-line/potentially-truncated representation to that stream, given an arbitrary capnp `Reader`.
 *
 * @param capnp_reader
 *        The `Reader` to presumably print.  Tip: if you have a `Builder builder` to print then pass
 *        `builder.asReader()` here.
 * @return See above.
 */
template<typename Capnp_reader>
Ostreamable_capnp_brief<Capnp_reader> ostreamable_capnp_brief(const Capnp_reader& capnp_reader);

/**
 * Hexadecimal (`0x`-prefixed) capnp type ID of the given capnp-generated struct; the CRC of Capnp_message and
 * Capnp_data_type.
 *
 * @tparam Capnp_struct
 *         capnp-generated struct type.
 * @return See above.
 */
template<typename Capnp_struct>
std::string capnp_type_id_string();

/**
 * Prints string representation (one-line/potentially-truncated form) of the given capnp `Reader`, via proxy object,
 * to the given `ostream`.
 *
 * @warning Potentially the entire underlying capnp tree shall be traversed to make the output work
 *          (even if ultimately the output is truncated for length).  This can be quite slow.  Do not use in
 *          perf-critical paths, unless verbose-logging (etc.) is enabled.
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
template<typename Capnp_reader>
std::ostream& operator<<(std::ostream& os, const Ostreamable_capnp_brief<Capnp_reader>& val);

} // namespace binapi::api
