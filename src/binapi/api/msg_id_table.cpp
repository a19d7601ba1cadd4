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
#include "binapi/api/msg_id_table.hpp"
#include "binapi/api/message.hpp"
#include "binapi/api/error.hpp"
#include <flow/error/error.hpp>

namespace binapi::api
{

// Implementations.

Msg_id_table::Msg_id_table(flow::log::Logger* logger_ptr) :
  flow::log::Log_context(logger_ptr, Log_component::S_CODEC)
{
  // That's it.
}

void Msg_id_table::register_msg(util::String_view name, util::String_view crc, msg_id_t id)
{
  auto key = msg_key(name, crc);

  Lock_guard lock(m_mutex);

  const auto it = m_ids_by_key.find(key);
  if (it != m_ids_by_key.end())
  {
    if (it->second == id)
    {
      return;
    }
    // else
    FLOW_LOG_INFO("Msg_id_table [" << *this << "]: Message [" << key << "] re-registered: ID "
                  "[" << it->second << "] => [" << id << "].");
    const auto old_it = m_keys_by_id.find(it->second);
    if ((old_it != m_keys_by_id.end()) && (old_it->second == key))
    {
      m_keys_by_id.erase(old_it);
    }
    it->second = id;
  }
  else
  {
    FLOW_LOG_TRACE("Msg_id_table [" << *this << "]: Message [" << key << "] registered with ID [" << id << "].");
    m_ids_by_key.emplace(key, id);
  }

  // An ID names one message at a time: whichever key held it before no longer resolves.
  const auto prev_owner_it = m_keys_by_id.find(id);
  if (prev_owner_it != m_keys_by_id.end())
  {
    if (prev_owner_it->second != key)
    {
      FLOW_LOG_INFO("Msg_id_table [" << *this << "]: ID [" << id << "] moves from message "
                    "[" << prev_owner_it->second << "] to [" << key << "]; the former is now unregistered.");
      m_ids_by_key.erase(prev_owner_it->second);
    }
    prev_owner_it->second = std::move(key);
  }
  else
  {
    m_keys_by_id.emplace(id, std::move(key));
  }
}

void Msg_id_table::register_msg(const Message& msg, msg_id_t id)
{
  register_msg(msg.message_name(), msg.crc_string(), id);
}

msg_id_t Msg_id_table::get_message_id(const Message& msg, Error_code* err_code) const
{
  msg_id_t id;
  if (flow::error::exec_and_throw_on_error
        ([&](Error_code* actual_err_code) -> msg_id_t { return get_message_id(msg, actual_err_code); },
         &id, err_code, "Msg_id_table::get_message_id()"))
  {
    return id;
  }
  // else: err_code is not null.

  const auto key = msg_key(msg);

  Lock_guard lock(m_mutex);
  const auto it = m_ids_by_key.find(key);
  if (it == m_ids_by_key.end())
  {
    FLOW_LOG_TRACE("Msg_id_table [" << *this << "]: Message [" << key << "] unknown.");
    *err_code = error::Code::S_UNKNOWN_MESSAGE;
    return 0;
  }
  // else

  err_code->clear();
  return it->second;
}

std::optional<std::string> Msg_id_table::msg_key_of(msg_id_t id) const
{
  Lock_guard lock(m_mutex);
  const auto it = m_keys_by_id.find(id);
  if (it == m_keys_by_id.end())
  {
    return std::nullopt;
  }
  return it->second;
}

size_t Msg_id_table::size() const
{
  Lock_guard lock(m_mutex);
  return m_ids_by_key.size();
}

std::ostream& operator<<(std::ostream& os, const Msg_id_table& val)
{
  return os << '@' << static_cast<const void*>(&val);
}

} // namespace binapi::api
