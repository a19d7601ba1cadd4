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
#include <string>

namespace binapi::api
{

// Types.

/// The kind of a Message, as declared by the peer's API definition.
enum class Message_type
{
  /// A request sent to the peer.
  S_REQUEST,
  /// A reply received from the peer, to a request.
  S_REPLY,
  /// A notification (event) pushed by the peer unsolicited.
  S_EVENT,
  /// Other message kinds (e.g., counters).
  S_OTHER
}; // enum class Message_type

/**
 * Interface implemented by every binary API message definition: it is a *descriptor* (name, CRC, type) plus,
 * in practice, the message's fields which a Message_decoder knows how to fill.
 *
 * The identity of a message across the transport is its name *and* its CRC (the checksum of its definition):
 * the peer assigns numeric IDs (#msg_id_t) per (name, CRC) pair, so a message whose definition changed in
 * the peer's version will fail to resolve (see Message_identifier, Channel::check_message_compatibility()).
 */
class Message
{
public:
  // Constructors/destructor.

  /// Boring virtual destructor.
  virtual ~Message();

  // Methods.

  /**
   * The original name of the message as defined in the peer's API.
   * @return See above.
   */
  virtual std::string message_name() const = 0;

  /**
   * The kind of message.
   * @return See above.
   */
  virtual Message_type message_type() const = 0;

  /**
   * String with the CRC checksum of the message definition (a hexadecimal number, e.g., `"0x51077d14"`).
   * @return See above.
   */
  virtual std::string crc_string() const = 0;
}; // class Message

/// Interface implemented by every binary API data type (non-message) definition.
class Data_type
{
public:
  // Constructors/destructor.

  /// Boring virtual destructor.
  virtual ~Data_type();

  // Methods.

  /**
   * The original name of the type as defined in the peer's API.
   * @return See above.
   */
  virtual std::string type_name() const = 0;

  /**
   * See Message::crc_string().
   * @return See above.
   */
  virtual std::string crc_string() const = 0;
}; // class Data_type

// Free functions.

/**
 * Returns the identity key of the given message as used for ID lookups: `"<name>:<crc>"`.  Message names are API
 * identifiers (letters, digits, underscores) and CRCs are hexadecimal, so neither contains the colon.
 *
 * @param msg
 *        Message.
 * @return See above.
 */
std::string msg_key(const Message& msg);

/**
 * Returns the identity key for the given message name and CRC string: `"<name>:<crc>"`.
 *
 * @param name
 *        See Message::message_name().
 * @param crc
 *        See Message::crc_string().
 * @return See above.
 */
std::string msg_key(util::String_view name, util::String_view crc);

} // namespace binapi::api
