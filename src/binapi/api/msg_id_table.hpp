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
#include <flow/util/util.hpp>
#include <boost/unordered_map.hpp>
#include <optional>
#include <string>

namespace binapi::api
{

// Types.

/**
 * Message_identifier impl backed by a table of `"<name>:<crc>"` (see msg_key()) => #msg_id_t, as learned from the peer we are
 * connected to (typically the provider fills it upon connecting, from the peer's message table).
 * Registration and lookup may occur concurrently from any threads.
 */
class Msg_id_table :
  public Message_identifier,
  public flow::log::Log_context
{
public:
  // Constructors/destructor.

  /**
   * Constructs an empty table.
   *
   * @param logger_ptr
   *        Logger to use for subsequently logging.
   */
  explicit Msg_id_table(flow::log::Logger* logger_ptr);

  // Methods.

  /**
   * Registers the ID the peer assigned to the given message definition; replaces any previous ID for it.
   * An ID maps to one message at a time: if another definition held `id`, that one becomes unregistered.
   *
   * @param name
   *        Message name.
   * @param crc
   *        Message CRC string.
   * @param id
   *        The ID.
   */
  void register_msg(util::String_view name, util::String_view crc, msg_id_t id);

  /**
   * Same as the other overload, taking name and CRC from the given message.
   *
   * @param msg
   *        Message.
   * @param id
   *        The ID.
   */
  void register_msg(const Message& msg, msg_id_t id);

  /**
   * Implements Message_identifier API.
   *
   * @param msg
   *        See Message_identifier.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_UNKNOWN_MESSAGE.
   * @return See Message_identifier.
   */
  msg_id_t get_message_id(const Message& msg, Error_code* err_code = 0) const override;

  /**
   * Reverse lookup: the msg_key() key registered for the given ID, if any.
   *
   * @param id
   *        The ID.
   * @return See above.
   */
  std::optional<std::string> msg_key_of(msg_id_t id) const;

  /**
   * Number of registered messages.
   * @return See above.
   */
  size_t size() const;

private:
  // Types.

  /// Short-hand for mutex type.
  using Mutex = flow::util::Mutex_non_recursive;

  /// Short-hand for #Mutex lock.
  using Lock_guard = flow::util::Lock_guard<Mutex>;

  // Data.

  /// Protects the maps.
  mutable Mutex m_mutex;

  /// Key => ID.
  boost::unordered_map<std::string, msg_id_t> m_ids_by_key;

  /// ID => key.
  boost::unordered_map<msg_id_t, std::string> m_keys_by_id;
}; // class Msg_id_table

} // namespace binapi::api
