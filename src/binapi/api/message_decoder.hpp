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
#include <flow/util/blob.hpp>

namespace binapi::api
{

// Types.

/**
 * Interface of the collaborator that decodes binary-encoded payload data into a provided Message.
 * A Channel holds a reference to one; it only ever calls decode_msg() (from the thread invoking the
 * reply-receiving API), so an impl shared among many `Channel`s must merely make decode_msg() thread-safe.
 *
 * @see Capnp_codec: a concrete impl.
 */
class Message_decoder
{
public:
  // Constructors/destructor.

  /// Boring virtual destructor.
  virtual ~Message_decoder();

  // Methods.

  /**
   * Decodes the given payload into `*msg`, replacing its fields.  On failure `*msg` may be partially modified.
   *
   * @param data
   *        The payload bytes, exactly as received (framing already removed).
   * @param msg
   *        Target message; must not be null.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  Impls decide the codes; the Channel
   *        translates any failure into error::Code::S_DECODE_FAILED.
   */
  virtual void decode_msg(const flow::util::Blob& data, Message* msg, Error_code* err_code = 0) const = 0;
}; // class Message_decoder

/**
 * Interface of the collaborator that identifies generated API messages: maps a Message (by name + CRC) to the
 * numeric ID assigned to it by the peer we are connected to.  As with Message_decoder, this is read-only from
 * the Channel's point of view and may be shared among `Channel`s.
 *
 * @see Msg_id_table: a concrete impl.
 */
class Message_identifier
{
public:
  // Constructors/destructor.

  /// Boring virtual destructor.
  virtual ~Message_identifier();

  // Methods.

  /**
   * Returns the message ID of the given message.
   *
   * @param msg
   *        The message; only its name and CRC matter.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  Impls shall emit a truthy code if
   *        the name + CRC are not known to the peer (e.g., error::Code::S_UNKNOWN_MESSAGE).
   * @return The ID; 0 if error emitted (though 0 may also be a valid ID).
   */
  virtual msg_id_t get_message_id(const Message& msg, Error_code* err_code = 0) const = 0;
}; // class Message_identifier

} // namespace binapi::api
