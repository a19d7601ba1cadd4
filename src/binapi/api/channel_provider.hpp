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

#include "binapi/api/channel.hpp"
#include <memory>

namespace binapi::api
{

// Types.

/**
 * Interface of a source of `Channel`s wired to a live transport to the peer (e.g., a connection object).
 * An impl creates the Channel_queues, constructs the Channel on its side of them, and then services them:
 * it pops and transmits Vpp_request items; pushes Vpp_reply items in order of requests (with the
 * multipart terminator where applicable; or with an error attached if transmission failed); serves the
 * notification control queues (see Notif_dispatcher); and releases its resources when it finds the request
 * queue closed.
 *
 * @tparam Metadata
 *         See Channel.
 */
template<typename Metadata>
class Channel_provider
{
public:
  // Types.

  /// The channel type provided.
  using Channel_obj = Channel<Metadata>;

  // Constructors/destructor.

  /// Boring virtual destructor.
  virtual ~Channel_provider() = default;

  // Methods.

  /**
   * Returns a new Channel with request and reply queues of default capacity
   * (Channel_base::S_DEFAULT_REQ_QUEUE_SZ, Channel_base::S_DEFAULT_REPLY_QUEUE_SZ).
   *
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  Impls decide the codes.
   * @return The channel; null on error.
   */
  virtual std::unique_ptr<Channel_obj> new_api_channel(Error_code* err_code = 0) = 0;

  /**
   * Returns a new Channel with request and reply queues of the given capacities.
   *
   * @param req_queue_sz
   *        Request queue capacity.
   * @param reply_queue_sz
   *        Reply queue capacity.
   * @param err_code
   *        See new_api_channel().
   * @return See new_api_channel().
   */
  virtual std::unique_ptr<Channel_obj> new_api_channel_buffered(size_t req_queue_sz, size_t reply_queue_sz,
                                                                Error_code* err_code = 0) = 0;
}; // class Channel_provider

} // namespace binapi::api
