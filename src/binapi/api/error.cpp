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
#include "binapi/api/error.hpp"
#include <cassert>

namespace binapi::api::error
{

// Types.

/// The boost.system category for errors returned by the binapi::api module.
class Category :
  public boost::system::error_category
{
public:
  // Constants.

  /// The one Category.
  static const Category S_CATEGORY;

  // Methods.

  /**
   * Returns a `static` string representing this category's name/identity.
   *
   * @return See above.
   */
  const char* name() const noexcept override;

  /**
   * Returns a string describing the given error in this category.
   *
   * @param val
   *        Underlying integer value of a `Code`.
   * @return See above.
   */
  std::string message(int val) const override;

  /**
   * Returns the symbol of the given `Code`, sans the `S_` prefix.
   *
   * @param code
   *        The code.
   * @return See above.
   */
  static util::String_view code_symbol(Code code);

private:
  // Constructors.

  /// Boring constructor.
  explicit Category();
}; // class Category

// Static initializations.

const Category Category::S_CATEGORY;

// Implementations.

Error_code make_error_code(Code err_code)
{
  /* Assign Category as the category for binapi::api::error::Code-cast error_codes;
   * this basically glues together Category::name()/message() with the Code enum. */
  return Error_code(static_cast<int>(err_code), Category::S_CATEGORY);
}

Category::Category() = default;

const char* Category::name() const noexcept // Virtual.
{
  return "binapi/api";
}

std::string Category::message(int val) const // Virtual.
{
  // KEEP THESE STRINGS IN SYNC WITH COMMENT IN error.hpp ON THE INDIVIDUAL ENUM MEMBERS!

  switch (static_cast<Code>(val))
  {
  case Code::S_INVALID_CONTEXT:
    return "Reply receipt: request context is invalid (default-constructed, failed send, or already consumed).";
  case Code::S_NIL_MESSAGE:
    return "Null message passed in where a message is required.";
  case Code::S_REPLY_TIMEOUT:
    return "Reply receipt: no reply arrived within the channel's reply timeout.";
  case Code::S_INCOMPATIBLE_MESSAGE:
    return "Message (name + CRC) is not compatible with (not known to) the peer we are connected to.";
  case Code::S_UNEXPECTED_MESSAGE_ID:
    return "Reply receipt: reply message ID does not match the expected message "
           "(are threads sharing one channel?).";
  case Code::S_DECODE_FAILED:
    return "Reply receipt: reply payload could not be decoded into the target message.";
  case Code::S_UNEXPECTED_TERMINATOR:
    return "Reply receipt: multipart terminator received while a simple (single) reply was expected.";
  case Code::S_CHANNEL_CLOSED:
    return "Channel operation attempted after the channel (or the queue it needs) was closed.";
  case Code::S_SUBSCRIPTION_NOT_FOUND:
    return "Notification unsubscribe: the given subscription is not registered.";
  case Code::S_UNKNOWN_MESSAGE:
    return "Message identification: no numeric ID is registered for the given message name + CRC.";
  case Code::S_CODEC_UNSUPPORTED_MESSAGE:
    return "Codec: the message is not of a kind this codec can encode/decode.";
  case Code::S_CODEC_MALFORMED_PAYLOAD:
    return "Codec: payload bytes are not a valid serialization of the target message.";

  case Code::S_END_SENTINEL:
    assert(false && "SENTINEL: Not an error.  "
                    "This Code must never be issued by an error/success-emitting API; I/O use only.");
  }
  assert(false);
  return "";
} // Category::message()

util::String_view Category::code_symbol(Code code) // Static.
{
  // Note: Must satisfy istream_to_enum() requirements.

  switch (code)
  {
  case Code::S_INVALID_CONTEXT:
    return "INVALID_CONTEXT";
  case Code::S_NIL_MESSAGE:
    return "NIL_MESSAGE";
  case Code::S_REPLY_TIMEOUT:
    return "REPLY_TIMEOUT";
  case Code::S_INCOMPATIBLE_MESSAGE:
    return "INCOMPATIBLE_MESSAGE";
  case Code::S_UNEXPECTED_MESSAGE_ID:
    return "UNEXPECTED_MESSAGE_ID";
  case Code::S_DECODE_FAILED:
    return "DECODE_FAILED";
  case Code::S_UNEXPECTED_TERMINATOR:
    return "UNEXPECTED_TERMINATOR";
  case Code::S_CHANNEL_CLOSED:
    return "CHANNEL_CLOSED";
  case Code::S_SUBSCRIPTION_NOT_FOUND:
    return "SUBSCRIPTION_NOT_FOUND";
  case Code::S_UNKNOWN_MESSAGE:
    return "UNKNOWN_MESSAGE";
  case Code::S_CODEC_UNSUPPORTED_MESSAGE:
    return "CODEC_UNSUPPORTED_MESSAGE";
  case Code::S_CODEC_MALFORMED_PAYLOAD:
    return "CODEC_MALFORMED_PAYLOAD";

  case Code::S_END_SENTINEL:
    return "END_SENTINEL";
  }
  assert(false);
  return "";
}

std::ostream& operator<<(std::ostream& os, Code val)
{
  // Note: Must satisfy istream_to_enum() requirements.
  return os << Category::code_symbol(val);
}

std::istream& operator>>(std::istream& is, Code& val)
{
  /* Range [<1st Code>, END_SENTINEL); no match => END_SENTINEL;
   * allow for number instead of ostream<< string; case-insensitive. */
  val = flow::util::istream_to_enum(&is, Code::S_END_SENTINEL, Code::S_END_SENTINEL, true, false,
                                    Code(S_CODE_LOWEST_INT_VALUE));
  return is;
}

} // namespace binapi::api::error
