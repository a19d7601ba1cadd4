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

#include <flow/common.hpp>
#include <flow/log/log.hpp>
#include <flow/util/util.hpp>
#include <flow/util/string_view.hpp>
#include <boost/unordered_map.hpp>
#include <string>

/**
 * Catch-all namespace for the binapi project: the client-side structured API channel used to converse with
 * a packet-processing peer over its binary message API.  The big daddy is api::Channel; everything else in
 * binapi::api either feeds it (descriptors, envelopes, queues) or plugs into it (decoder, identifier, provider,
 * notification dispatcher).
 */
namespace binapi
{

// Types.

/// Short-hand for Flow's `Error_code`; all fallible APIs here emit these (see api::error).
using Error_code = flow::Error_code;

/// Short-hand for Flow's high-precision clock.
using Fine_clock = flow::Fine_clock;

/// Short-hand for a duration of #Fine_clock; used for reply timeouts among other things.
using Fine_duration = flow::Fine_duration;

/// Short-hand for Flow's polymorphic function object template.
template<typename Signature>
using Function = flow::Function<Signature>;

/**
 * The `flow::log::Component` payload enumeration for all logging done by binapi.  Configure a
 * `flow::log::Config` with it via `init_component_to_union_idx_mapping<Log_component>()` and
 * `init_component_names<Log_component>(S_BINAPI_LOG_COMPONENT_NAME_MAP, ...)`.
 */
enum class Log_component
{
  /// Uncategorized; should be rare.
  S_UNCAT = 0,
  /// api::Channel, its request contexts, and the provider interface.
  S_API,
  /// Notification dispatch (api::Notif_dispatcher).
  S_NOTIF,
  /// Message encoding/decoding and identification (api::Capnp_codec, api::Msg_id_table).
  S_CODEC,
  /// SENTINEL: Not a component.  Equals the number of components.
  S_END_SENTINEL
}; // enum class Log_component

/// Namespace short-hand: util (Flow's util, plus our own additions if any).
namespace util
{

/// Short-hand for Flow's `String_view`.
using String_view = flow::util::String_view;

} // namespace util

// Constants.

/// Mapping from each #Log_component to its name as printed in log output.
extern const boost::unordered_multimap<Log_component, std::string> S_BINAPI_LOG_COMPONENT_NAME_MAP;

} // namespace binapi
