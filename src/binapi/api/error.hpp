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
#include <boost/system/error_code.hpp>
#include <istream>
#include <ostream>

/**
 * Namespace containing the binapi::api module's extension of boost.system error conventions, so that that API
 * can return codes/messages from within its own new set of error codes/messages.  Every fallible binapi::api
 * operation takes a trailing `Error_code* err_code` argument: if null, failure throws `flow::error::Runtime_error`
 * wrapping the code; if not null the code is emitted into `*err_code` (falsy on success).
 *
 * An `Error_code` emitted by a reply-receiving API may also be one of *another* category: it is then an error
 * the provider (transport) attached to the reply envelope, forwarded unchanged.
 */
namespace binapi::api::error
{

// Types.

/// Numeric value of the lowest Code.
constexpr int S_CODE_LOWEST_INT_VALUE = 1;

/// All possible errors returned (via `Error_code` arguments) by binapi::api functions/methods.
enum class Code
{
  /// Reply receipt: request context is invalid (default-constructed, failed send, or already consumed).
  S_INVALID_CONTEXT = S_CODE_LOWEST_INT_VALUE,

  /// Null message passed in where a message is required.
  S_NIL_MESSAGE,

  /// Reply receipt: no reply arrived within the channel's reply timeout.
  S_REPLY_TIMEOUT,

  /// Message (name + CRC) is not compatible with (not known to) the peer we are connected to.
  S_INCOMPATIBLE_MESSAGE,

  /// Reply receipt: reply message ID does not match the expected message (are threads sharing one channel?).
  S_UNEXPECTED_MESSAGE_ID,

  /// Reply receipt: reply payload could not be decoded into the target message.
  S_DECODE_FAILED,

  /// Reply receipt: multipart terminator received while a simple (single) reply was expected.
  S_UNEXPECTED_TERMINATOR,

  /// Channel operation attempted after the channel (or the queue it needs) was closed.
  S_CHANNEL_CLOSED,

  /// Notification unsubscribe: the given subscription is not registered.
  S_SUBSCRIPTION_NOT_FOUND,

  /// Message identification: no numeric ID is registered for the given message name + CRC.
  S_UNKNOWN_MESSAGE,

  /// Codec: the message is not of a kind this codec can encode/decode.
  S_CODEC_UNSUPPORTED_MESSAGE,

  /// Codec: payload bytes are not a valid serialization of the target message.
  S_CODEC_MALFORMED_PAYLOAD,

  /// SENTINEL: Not an error.  This Code must never be issued by an error/success-emitting API; I/O use only.
  S_END_SENTINEL
}; // enum class Code

// Free functions.

/**
 * Given a `Code` `enum` value, creates a lightweight `flow::Error_code` (`boost::system::error_code`)
 * representing that error.  This is needed to make the `boost::system::error_code::error_code<Code>()` template
 * implementation work.  Or, slightly more in English, it glues the (completely general) `Error_code`
 * to the (binapi-specific) error code set `Code`, so that one can implicitly convert from the latter to the former.
 *
 * @param err_code
 *        The `enum` value.
 * @return Corresponding `Error_code`.
 */
Error_code make_error_code(Code err_code);

/**
 * Deserializes a Code from a standard input stream.  Reads up to but not including the next
 * non-alphanumeric-or-underscore character; the resulting string is then mapped to a Code.  If none is
 * recognized, Code::S_END_SENTINEL is the result.  The recognized values are:
 *   - Code symbol as output by `operator<<` (case-insensitive); or
 *   - the integer value of the Code.
 *
 * @param is
 *        Stream from which to deserialize.
 * @param val
 *        Value to set.
 * @return `is`.
 */
std::istream& operator>>(std::istream& is, Code& val);

/**
 * Serializes a Code to a standard output stream: its symbol sans the `S_` prefix (e.g., `REPLY_TIMEOUT`).
 *
 * @param os
 *        Stream to which to serialize.
 * @param val
 *        Value to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, Code val);

} // namespace binapi::api::error

namespace boost::system
{

// Types.

/**
 * Ummm -- it specializes this `struct` to -- look -- the end result is boost.system uses this as
 * authorization to make `enum` `Code` convertible to `Error_code`.  The non-specialized
 * version of this sets `value` to `false`, so that random arbitary `enum`s can't just be used as
 * `Error_code`s.  Note that this is the offical way to accomplish that, as (confusingly but
 * formally) documented in boost.system docs.
 */
template<>
struct is_error_code_enum<::binapi::api::error::Code>
{
  /// Means `Code` `enum` values can be used for `Error_code`.
  static const bool value = true;
};

} // namespace boost::system
