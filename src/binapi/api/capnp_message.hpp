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
#include <capnp/message.h>
#include <capnp/serialize.h>
#include <capnp/pretty-print.h>
#include <kj/string.h>
#include <boost/core/noncopyable.hpp>
#include <ostream>
#include <sstream>
#include <string>

namespace binapi::api
{

// Types.

/**
 * Proxy object referring to a capnp `Reader` for straightforward output via overloaded `ostream<<`:
 * one-line/potentially-truncated form.
 * To construct one pithily please use ostreamable_capnp_brief() free function.
 * If you have a `Builder` to print use `.asReader()` on it inside parentheses of that call.
 */
template<typename Capnp_reader>
struct Ostreamable_capnp_brief
{
  // Data.
  /// The encapsulated `Reader`.
  const Capnp_reader& m_capnp_reader;
};

/**
 * The non-parameterized interface of Capnp_message, through which Capnp_codec encodes and decodes any
 * Cap'n Proto-backed message without knowing its schema.  The message's fields are the root struct of
 * a capnp message owned by `*this`; its name and type are given at construction.
 */
class Capnp_message_base :
  public Message,
  private boost::noncopyable
{
public:
  // Methods.

  /**
   * Implements Message API.
   * @return See above.
   */
  std::string message_name() const override;

  /**
   * Implements Message API.
   * @return See above.
   */
  Message_type message_type() const override;

  /**
   * Serializes the fields into the standard capnp flat (unpacked) encoding, segment table included.
   * @return See above.
   */
  virtual kj::Array<::capnp::word> payload_to_flat_array() const = 0;

  /**
   * Replaces the fields with those of the root struct of the given capnp message.
   * Throws `kj::Exception` if the data are not a valid encoding of that struct.
   *
   * @param reader
   *        Source.
   */
  virtual void load_payload(Capnp_msg_reader_interface* reader) = 0;

  /**
   * Prints the fields in one-line/potentially-truncated form.
   *
   * @param os
   *        Stream to which to write.
   */
  virtual void print_payload_brief(std::ostream& os) const = 0;

protected:
  // Constructors/destructor.

  /**
   * Constructs the descriptor part.
   *
   * @param name
   *        See message_name().
   * @param type
   *        See message_type().
   */
  explicit Capnp_message_base(util::String_view name, Message_type type);

private:
  // Data.

  /// See message_name().
  const std::string m_name;

  /// See message_type().
  const Message_type m_type;
}; // class Capnp_message_base

/**
 * A Message whose fields are the capnp-generated struct `Message_body`.  The CRC of the definition is the
 * capnp type ID of `Message_body` (so any schema change to the struct that alters its ID is caught by the
 * compatibility check).  Typically a concrete message type derives from this, passing its name and type:
 *
 *   ~~~
 *   class Control_ping : public Capnp_message<schema::ControlPing>
 *   {
 *   public:
 *     Control_ping() : Capnp_message("control_ping", Message_type::S_REQUEST) {}
 *   };
 *   ~~~
 *
 * @tparam Message_body
 *         capnp-generated struct type.
 */
template<typename Message_body>
class Capnp_message :
  public Capnp_message_base
{
public:
  // Types.

  /// See `Message_body` template parameter.
  using Body = Message_body;

  /// Short-hand for capnp-generated mutating `Builder` nested class of #Body.
  using Body_builder = typename Body::Builder;

  /// Short-hand for capnp-generated read-only `Reader` nested class of #Body.
  using Body_reader = typename Body::Reader;

  // Constructors/destructor.

  /**
   * Constructs message with default (blank) fields.
   *
   * @param name
   *        See Capnp_message_base.
   * @param type
   *        See Capnp_message_base.
   */
  explicit Capnp_message(util::String_view name, Message_type type);

  // Methods.

  /**
   * Implements Message API: hexadecimal capnp type ID of #Body.
   * @return See above.
   */
  std::string crc_string() const override;

  /**
   * The fields, for mutation.
   * @return See above.
   */
  Body_builder body_root();

  /**
   * The fields, read-only.
   * @return See above.
   */
  Body_reader body_root() const;

  /**
   * Implements Capnp_message_base API.
   * @return See above.
   */
  kj::Array<::capnp::word> payload_to_flat_array() const override;

  /**
   * Implements Capnp_message_base API.
   * @param reader
   *        See above.
   */
  void load_payload(Capnp_msg_reader_interface* reader) override;

  /**
   * Implements Capnp_message_base API.
   * @param os
   *        See above.
   */
  void print_payload_brief(std::ostream& os) const override;

private:
  // Data.

  /// Owns the fields.
  ::capnp::MallocMessageBuilder m_payload_msg_builder;

  /// Root of #m_payload_msg_builder.
  Body_builder m_body_root;
}; // class Capnp_message

/**
 * A Data_type descriptor for a capnp-generated struct `Type_body` used as a field type within messages.  As with
 * Capnp_message, the CRC is the capnp type ID of the struct.
 *
 * @tparam Type_body
 *         capnp-generated struct type.
 */
template<typename Type_body>
class Capnp_data_type :
  public Data_type
{
public:
  // Types.

  /// See `Type_body` template parameter.
  using Body = Type_body;

  // Constructors/destructor.

  /**
   * Constructs descriptor.
   *
   * @param name
   *        See type_name().
   */
  explicit Capnp_data_type(util::String_view name);

  // Methods.

  /**
   * Implements Data_type API.
   * @return See above.
   */
  std::string type_name() const override;

  /**
   * Implements Data_type API: hexadecimal capnp type ID of #Body.
   * @return See above.
   */
  std::string crc_string() const override;

private:
  // Data.

  /// See type_name().
  const std::string m_name;
}; // class Capnp_data_type

// Template implementations.

template<typename Message_body>
Capnp_message<Message_body>::Capnp_message(util::String_view name, Message_type type) :
  Capnp_message_base(name, type),
  m_body_root(m_payload_msg_builder.initRoot<Body>())
{
  // That's it.
}

template<typename Message_body>
std::string Capnp_message<Message_body>::crc_string() const
{
  return capnp_type_id_string<Body>();
}

template<typename Message_body>
typename Capnp_message<Message_body>::Body_builder Capnp_message<Message_body>::body_root()
{
  return m_body_root;
}

template<typename Message_body>
typename Capnp_message<Message_body>::Body_reader Capnp_message<Message_body>::body_root() const
{
  return m_body_root.asReader();
}

template<typename Message_body>
kj::Array<::capnp::word> Capnp_message<Message_body>::payload_to_flat_array() const
{
  // Copy into a fresh builder: serializing our own needs non-const access and may include orphaned garbage.
  ::capnp::MallocMessageBuilder out_msg_builder;
  out_msg_builder.setRoot(m_body_root.asReader());
  return ::capnp::messageToFlatArray(out_msg_builder);
}

template<typename Message_body>
void Capnp_message<Message_body>::load_payload(Capnp_msg_reader_interface* reader)
{
  m_payload_msg_builder.setRoot(reader->getRoot<Body>());
  m_body_root = m_payload_msg_builder.getRoot<Body>();
}

template<typename Message_body>
void Capnp_message<Message_body>::print_payload_brief(std::ostream& os) const
{
  const auto body_reader = body_root();
  os << ostreamable_capnp_brief(body_reader);
}

template<typename Type_body>
Capnp_data_type<Type_body>::Capnp_data_type(util::String_view name) :
  m_name(name)
{
  // That's it.
}

template<typename Type_body>
std::string Capnp_data_type<Type_body>::type_name() const
{
  return m_name;
}

template<typename Type_body>
std::string Capnp_data_type<Type_body>::crc_string() const
{
  return capnp_type_id_string<Body>();
}

template<typename Capnp_struct>
std::string capnp_type_id_string()
{
  std::ostringstream os;
  os << std::showbase << std::hex << ::capnp::typeId<Capnp_struct>();
  return os.str();
}

template<typename Capnp_reader>
Ostreamable_capnp_brief<Capnp_reader> ostreamable_capnp_brief(const Capnp_reader& capnp_reader)
{
  return Ostreamable_capnp_brief<Capnp_reader>{ capnp_reader };
}

template<typename Capnp_reader>
std::ostream& operator<<(std::ostream& os, const Ostreamable_capnp_brief<Capnp_reader>& val)
{
  using kj::str;
  using kj::String;
  using util::String_view;

  constexpr size_t MAX_SZ = 256;
  constexpr String_view TRUNC_SUFFIX = "... )"; // Fake the end to look like the end of the real pretty-print.
  const String capnp_str = str(val.m_capnp_reader);
  if (capnp_str.size() > MAX_SZ)
  {
    return os << String_view(capnp_str.begin(), MAX_SZ - TRUNC_SUFFIX.size()) << TRUNC_SUFFIX;
  }
  // else
  return os << capnp_str.cStr();
}

} // namespace binapi::api
