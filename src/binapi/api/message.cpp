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
#include "binapi/api/message.hpp"
#include <flow/util/util.hpp>

namespace binapi::api
{

// Implementations.

Message::~Message() = default;

Data_type::~Data_type() = default;

std::string msg_key(const Message& msg)
{
  return msg_key(msg.message_name(), msg.crc_string());
}

std::string msg_key(util::String_view name, util::String_view crc)
{
  return flow::util::ostream_op_string(name, ':', crc);
}

std::ostream& operator<<(std::ostream& os, Message_type val)
{
  switch (val)
  {
  case Message_type::S_REQUEST:
    return os << "REQUEST";
  case Message_type::S_REPLY:
    return os << "REPLY";
  case Message_type::S_EVENT:
    return os << "EVENT";
  case Message_type::S_OTHER:
    return os << "OTHER";
  }
  return os << "UNKNOWN[" << static_cast<int>(val) << ']';
}

std::ostream& operator<<(std::ostream& os, const Message& val)
{
  return os << '[' << val.message_type() << ' ' << val.message_name() << " crc[" << val.crc_string() << "]]@"
            << static_cast<const void*>(&val);
}

} // namespace binapi::api
