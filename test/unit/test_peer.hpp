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

#include "binapi/api/channel_provider.hpp"
#include "binapi/api/msg_id_table.hpp"
#include "binapi/api/capnp_codec.hpp"
#include "binapi/api/notif_dispatcher.hpp"
#include <flow/async/single_thread_task_loop.hpp>
#include <atomic>
#include <map>
#include <optional>
#include <vector>

namespace binapi::test
{

// Types.

/// Metadata the test peer attaches to each of its channels.
struct Peer_metadata
{
  /// Name of the peer that created the channel.
  std::string m_peer_name;

  /// 1-based ordinal of the channel among those created by the peer.
  unsigned int m_channel_idx;
};

/**
 * In-process stand-in for the far end of a connection: a Channel_provider whose every channel is serviced
 * by a pair of threads, one answering requests the way the data plane would, one serving notification
 * (un)subscriptions.  Knows `control_ping` (simple) and `sw_interface_dump` (multipart, over the interfaces
 * added via add_interface()); anything else is answered with an error reply.  Events are raised via
 * emit_interface_event().
 *
 * Destroy every channel obtained from `*this` before `*this`.
 */
class Test_peer :
  public api::Channel_provider<Peer_metadata>,
  public flow::log::Log_context
{
public:
  // Constants.

  /// `vpePid` in each control ping reply.
  static constexpr uint32_t S_PEER_PID = 4242;

  // Constructors/destructor.

  /**
   * Constructs peer with no interfaces, knowing all test messages except Show_version.
   *
   * @param logger_ptr
   *        Logger to use for subsequently logging.
   */
  explicit Test_peer(flow::log::Logger* logger_ptr);

  /// Closes the queues of all channels and joins their service threads.
  ~Test_peer() override;

  // Methods.

  /**
   * Implements Channel_provider API.
   * @param err_code
   *        Not used: never fails.
   * @return See above.
   */
  std::unique_ptr<Channel_obj> new_api_channel(Error_code* err_code = 0) override;

  /**
   * Implements Channel_provider API.
   * @param req_queue_sz
   *        See above.
   * @param reply_queue_sz
   *        See above.
   * @param err_code
   *        Not used: never fails.
   * @return See above.
   */
  std::unique_ptr<Channel_obj> new_api_channel_buffered(size_t req_queue_sz, size_t reply_queue_sz,
                                                        Error_code* err_code = 0) override;

  /**
   * Adds an interface reported by `sw_interface_dump`.
   *
   * @param sw_if_index
   *        Index.
   * @param name
   *        Name.
   */
  void add_interface(uint32_t sw_if_index, const std::string& name);

  /**
   * Makes the next request (only) fail in "transmission" with the given error.
   *
   * @param err_code
   *        Error to attach to the reply.
   */
  void fail_next_request(const Error_code& err_code);

  /**
   * Raises `sw_interface_event` to all subscribers.
   *
   * @param sw_if_index
   *        Index.
   * @param admin_up
   *        State.
   * @return Number of subscriber queues that received it.
   */
  size_t emit_interface_event(uint32_t sw_if_index, bool admin_up);

  /**
   * Blocks until the request service thread of the given channel (1-based, in order of creation) exits,
   * which occurs once the channel is closed.
   *
   * @param channel_idx
   *        See above.
   */
  void await_channel_release(unsigned int channel_idx);

  /**
   * Total number of requests answered.
   * @return See above.
   */
  size_t n_requests_served() const;

  /**
   * The message table of `*this`.
   * @return See above.
   */
  const api::Msg_id_table& msg_id_table() const;

  /**
   * The codec of `*this`.
   * @return See above.
   */
  const api::Capnp_codec& codec() const;

  /**
   * The notification dispatcher of `*this`.
   * @return See above.
   */
  const api::Notif_dispatcher& notif_dispatcher() const;

private:
  // Types.

  /// Per-channel service state.
  struct Served_channel
  {
    /// Our copy of the channel's queues.
    api::Channel_queues m_queues;

    /// Runs serve_requests().
    std::unique_ptr<flow::async::Single_thread_task_loop> m_req_loop;

    /// Runs the notification control loop.
    std::unique_ptr<flow::async::Single_thread_task_loop> m_notif_loop;
  };

  // Methods.

  /**
   * Answers requests from the given queues until the request queue is closed; then closes the reply queue.
   *
   * @param queues
   *        Queues.
   */
  void serve_requests(const api::Channel_queues& queues);

  /**
   * Answers one request.
   *
   * @param request
   *        Request.
   * @param reply_queue
   *        Where to push replies.
   */
  void answer(const api::Vpp_request& request, api::Reply_queue* reply_queue);

  /**
   * Pushes encoded reply.
   *
   * @param msg
   *        Reply message.
   * @param reply_queue
   *        Queue.
   */
  void push_reply(const api::Message& msg, api::Reply_queue* reply_queue);

  // Data.

  /// See msg_id_table().
  api::Msg_id_table m_msg_id_table;

  /// See codec().
  api::Capnp_codec m_codec;

  /// See notif_dispatcher().
  api::Notif_dispatcher m_notif_dispatcher;

  /// Protects #m_interfaces and #m_next_failure.
  mutable flow::util::Mutex_non_recursive m_mutex;

  /// Interfaces by index.
  std::map<uint32_t, std::string> m_interfaces;

  /// See fail_next_request().
  std::optional<Error_code> m_next_failure;

  /// See n_requests_served().
  std::atomic<size_t> m_n_requests_served;

  /// One per channel created, in order.
  std::vector<std::unique_ptr<Served_channel>> m_channels;
}; // class Test_peer

} // namespace binapi::test
