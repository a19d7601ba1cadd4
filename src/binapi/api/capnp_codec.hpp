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

#include "binapi/api/message_decoder.hpp"
#include <flow/log/log.hpp>
#include <flow/util/blob.hpp>

namespace binapi::api
{

// Types.

/**
 * Message_decoder impl (and the matching encoder) for messages deriving from Capnp_message: the payload is
 * the standard capnp flat (unpacked) single-message encoding of the message's body struct, segment table
 * included.  Stateless apart from logging; thread-safe.
 *
 * Decoding copies the payload into a word-aligned buffer and reads it with `capnp::FlatArrayMessageReader`,
 * whose default limits apply (traversal limit, nesting limit); data violating them or otherwise malformed
 * yield error::Code::S_CODEC_MALFORMED_PAYLOAD.
 */
class Capnp_codec :
  public Message_decoder,
  public flow::log::Log_context
{
public:
  // Constructors/destructor.

  /**
   * Constructs codec.
   *
   * @param logger_ptr
   *        Logger to use for subsequently logging.
   */
  explicit Capnp_codec(flow::log::Logger* logger_ptr);

  // Methods.

  /**
   * Encodes the given message's fields into `*data` (replacing its contents).
   *
   * @param msg
   *        The message; must derive from Capnp_message.
   * @param data
   *        Target; must not be null.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_CODEC_UNSUPPORTED_MESSAGE.
   */
  void encode_msg(const Message& msg, flow::util::Blob* data, Error_code* err_code = 0) const;

  /**
   * Implements Message_decoder API.
   *
   * @param data
   *        See Message_decoder.
   * @param msg
   *        See Message_decoder.  Must derive from Capnp_message.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_NIL_MESSAGE, error::Code::S_CODEC_UNSUPPORTED_MESSAGE,
   *        error::Code::S_CODEC_MALFORMED_PAYLOAD.
   */
  void decode_msg(const flow::util::Blob& data, Message* msg, Error_code* err_code = 0) const override;
}; // class Capnp_codec

} // namespace binapi::api
