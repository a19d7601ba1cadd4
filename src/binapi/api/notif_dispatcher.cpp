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
#include "binapi/api/notif_dispatcher.hpp"
#include "binapi/api/error.hpp"
#include <flow/error/error.hpp>
#include <algorithm>
#include <cassert>

namespace binapi::api
{

// Implementations.

Notif_dispatcher::Notif_dispatcher(flow::log::Logger* logger_ptr,
                                   const Message_decoder* msg_decoder, const Message_identifier* msg_identifier) :
  flow::log::Log_context(logger_ptr, Log_component::S_NOTIF),
  m_msg_decoder(msg_decoder),
  m_msg_identifier(msg_identifier)
{
  assert(m_msg_decoder && m_msg_identifier);
}

bool Notif_dispatcher::serve_subscription_request(const Channel_queues& queues)
{
  auto request = queues.m_notif_subs_queue->pop();
  if (!request)
  {
    FLOW_LOG_TRACE("Notif_dispatcher [" << *this << "]: Control queue closed; nothing to serve.");
    return false;
  }
  // else

  Error_code err_code;
  process_subscribe_request(*request, &err_code);
  if (!queues.m_notif_subs_reply_queue->push(Error_code(err_code)))
  {
    FLOW_LOG_WARNING("Notif_dispatcher [" << *this << "]: Acknowledgement queue closed; channel will not see "
                     "result [" << err_code << "] [" << err_code.message() << "].");
  }
  return true;
}

void Notif_dispatcher::process_subscribe_request(const Notif_subscribe_request& request, Error_code* err_code)
{
  using std::find;

  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { process_subscribe_request(request, actual_err_code); },
         err_code, "Notif_dispatcher::process_subscribe_request()"))
  {
    return;
  }
  // else: err_code is not null.

  err_code->clear();

  const auto& sub = request.m_subscription;
  if (!sub)
  {
    FLOW_LOG_WARNING("Notif_dispatcher [" << *this << "]: Null subscription in control request.");
    *err_code = error::Code::S_NIL_MESSAGE;
    return;
  }
  // else

  if (!request.m_subscribe)
  {
    Lock_guard lock(m_mutex);
    for (auto map_it = m_subs.begin(); map_it != m_subs.end(); ++map_it)
    {
      auto& subs = map_it->second;
      const auto it = find(subs.begin(), subs.end(), sub);
      if (it != subs.end())
      {
        FLOW_LOG_INFO("Notif_dispatcher [" << *this << "]: Removed subscription [" << sub.get() << "] for "
                      "message ID [" << map_it->first << "].");
        subs.erase(it);
        if (subs.empty())
        {
          m_subs.erase(map_it);
        }
        return;
      }
    }

    FLOW_LOG_WARNING("Notif_dispatcher [" << *this << "]: Unsubscribe for unknown subscription "
                     "[" << sub.get() << "].");
    *err_code = error::Code::S_SUBSCRIPTION_NOT_FOUND;
    return;
  } // if (!request.m_subscribe)
  // else: subscribe.

  // The factory's product tells us the message type; its ID is what incoming notifications carry.
  const auto probe = sub->m_msg_factory ? sub->m_msg_factory() : Message_ptr();
  if (!probe)
  {
    FLOW_LOG_WARNING("Notif_dispatcher [" << *this << "]: Subscription [" << sub.get() << "] factory yielded "
                     "no message.");
    *err_code = error::Code::S_NIL_MESSAGE;
    return;
  }
  // else

  Error_code id_err_code;
  const auto msg_id = m_msg_identifier->get_message_id(*probe, &id_err_code);
  if (id_err_code)
  {
    FLOW_LOG_WARNING("Notif_dispatcher [" << *this << "]: Cannot subscribe: message [" << probe->message_name() << "] "
                     "with CRC [" << probe->crc_string() << "] is not compatible with the peer.");
    *err_code = error::Code::S_INCOMPATIBLE_MESSAGE;
    return;
  }
  // else

  Lock_guard lock(m_mutex);
  m_subs[msg_id].emplace_back(sub);
  FLOW_LOG_INFO("Notif_dispatcher [" << *this << "]: Added subscription [" << sub.get() << "] for "
                "[" << *probe << "] (ID [" << msg_id << "]).");
} // Notif_dispatcher::process_subscribe_request()

size_t Notif_dispatcher::dispatch_notification(msg_id_t msg_id, const flow::util::Blob& data)
{
  // Lock held through delivery, so an unsubscribe that has returned cannot race with a push below.  try_push() never
  // blocks, so neither does this.
  Lock_guard lock(m_mutex);
  const auto it = m_subs.find(msg_id);
  if (it == m_subs.end())
  {
    FLOW_LOG_TRACE("Notif_dispatcher [" << *this << "]: No subscriptions for notification ID [" << msg_id << "].");
    return 0;
  }
  // else
  const auto& subs = it->second;

  size_t n_delivered = 0;
  for (const auto& sub : subs)
  {
    auto msg = sub->m_msg_factory();
    if (!msg)
    {
      FLOW_LOG_WARNING("Notif_dispatcher [" << *this << "]: Subscription [" << sub.get() << "] factory yielded "
                       "no message.  Skipping.");
      continue;
    }
    // else

    Error_code err_code;
    m_msg_decoder->decode_msg(data, msg.get(), &err_code);
    if (err_code)
    {
      FLOW_LOG_WARNING("Notif_dispatcher [" << *this << "]: Could not decode notification ID [" << msg_id << "] "
                       "into [" << *msg << "]: [" << err_code << "] [" << err_code.message() << "].  Skipping.");
      continue;
    }
    // else

    if (!sub->m_notif_queue->try_push(std::move(msg)))
    {
      FLOW_LOG_WARNING("Notif_dispatcher [" << *this << "]: Notification ID [" << msg_id << "] dropped for "
                       "subscription [" << sub.get() << "]: queue full (capacity "
                       "[" << sub->m_notif_queue->capacity() << "]) or closed.");
      continue;
    }
    // else
    ++n_delivered;
  }

  FLOW_LOG_TRACE("Notif_dispatcher [" << *this << "]: Notification ID [" << msg_id << "] delivered to "
                 "[" << n_delivered << "] of [" << subs.size() << "] subscribers.");
  return n_delivered;
} // Notif_dispatcher::dispatch_notification()

size_t Notif_dispatcher::n_subscriptions() const
{
  Lock_guard lock(m_mutex);
  size_t n = 0;
  for (const auto& id_and_subs : m_subs)
  {
    n += id_and_subs.second.size();
  }
  return n;
}

std::ostream& operator<<(std::ostream& os, const Notif_dispatcher& val)
{
  return os << '@' << static_cast<const void*>(&val);
}

} // namespace binapi::api
