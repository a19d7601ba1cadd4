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
#include "binapi/api/capnp_codec.hpp"
#include "binapi/api/capnp_message.hpp"
#include "binapi/api/error.hpp"
#include <flow/error/error.hpp>
#include <capnp/serialize.h>
#include <kj/exception.h>
#include <cstring>
#include <cassert>
#include <sstream>

namespace binapi::api
{

// Implementations.

Capnp_codec::Capnp_codec(flow::log::Logger* logger_ptr) :
  flow::log::Log_context(logger_ptr, Log_component::S_CODEC)
{
  // That's it.
}

void Capnp_codec::encode_msg(const Message& msg, flow::util::Blob* data, Error_code* err_code) const
{
  using flow::util::Blob;
  using std::memcpy;

  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { encode_msg(msg, data, actual_err_code); },
         err_code, "Capnp_codec::encode_msg()"))
  {
    return;
  }
  // else: err_code is not null.

  assert(data);

  const auto capnp_msg = dynamic_cast<const Capnp_message_base*>(&msg);
  if (!capnp_msg)
  {
    FLOW_LOG_WARNING("Capnp_codec [" << *this << "]: Cannot encode [" << msg << "]: not a capnp-backed message.");
    *err_code = error::Code::S_CODEC_UNSUPPORTED_MESSAGE;
    return;
  }
  // else

  const auto words = capnp_msg->payload_to_flat_array();
  const auto bytes = words.asBytes();

  *data = Blob(get_logger(), bytes.size());
  memcpy(data->data(), bytes.begin(), bytes.size());
  err_code->clear();

  FLOW_LOG_TRACE("Capnp_codec [" << *this << "]: Encoded [" << msg << "] into [" << bytes.size() << "] bytes.");
} // Capnp_codec::encode_msg()

void Capnp_codec::decode_msg(const flow::util::Blob& data, Message* msg, Error_code* err_code) const
{
  using ::capnp::word;
  using ::capnp::FlatArrayMessageReader;
  using std::memcpy;

  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { decode_msg(data, msg, actual_err_code); },
         err_code, "Capnp_codec::decode_msg()"))
  {
    return;
  }
  // else: err_code is not null.

  if (!msg)
  {
    *err_code = error::Code::S_NIL_MESSAGE;
    return;
  }
  // else

  const auto capnp_msg = dynamic_cast<Capnp_message_base*>(msg);
  if (!capnp_msg)
  {
    FLOW_LOG_WARNING("Capnp_codec [" << *this << "]: Cannot decode into [" << *msg << "]: not a capnp-backed "
                     "message.");
    *err_code = error::Code::S_CODEC_UNSUPPORTED_MESSAGE;
    return;
  }
  // else

  const size_t n_bytes = data.size();
  if ((n_bytes == 0) || ((n_bytes % sizeof(word)) != 0))
  {
    FLOW_LOG_WARNING("Capnp_codec [" << *this << "]: Cannot decode into [" << *msg << "]: payload size "
                     "[" << n_bytes << "] is not a positive multiple of the capnp word size.");
    *err_code = error::Code::S_CODEC_MALFORMED_PAYLOAD;
    return;
  }
  // else

  // The Blob's buffer carries no word-alignment guarantee; capnp requires it.
  auto words = kj::heapArray<word>(n_bytes / sizeof(word));
  memcpy(words.begin(), data.const_data(), n_bytes);

  try
  {
    FlatArrayMessageReader reader(words.asPtr());
    capnp_msg->load_payload(&reader);
  }
  catch (const kj::Exception& exc)
  {
    FLOW_LOG_WARNING("Capnp_codec [" << *this << "]: Cannot decode [" << n_bytes << "] bytes into [" << *msg << "]: "
                     "capnp said [" << exc.getDescription().cStr() << "].");
    *err_code = error::Code::S_CODEC_MALFORMED_PAYLOAD;
    return;
  }

  err_code->clear();

  const auto logger_ptr = get_logger();
  if (logger_ptr && logger_ptr->should_log(flow::log::Sev::S_DATA, get_log_component()))
  {
    std::ostringstream os;
    capnp_msg->print_payload_brief(os);
    FLOW_LOG_DATA("Capnp_codec [" << *this << "]: Decoded [" << *msg << "]: " << os.str());
  }
} // Capnp_codec::decode_msg()

std::ostream& operator<<(std::ostream& os, const Capnp_codec& val)
{
  return os << '@' << static_cast<const void*>(&val);
}

} // namespace binapi::api
