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

#include "binapi/api/capnp_message.hpp"
#include "test_msgs.capnp.h"

namespace binapi::test
{

// Types.

class Control_ping : public api::Capnp_message<schema::ControlPing>
{
public:
  Control_ping() : Capnp_message("control_ping", api::Message_type::S_REQUEST) {}
};

class Control_ping_reply : public api::Capnp_message<schema::ControlPingReply>
{
public:
  Control_ping_reply() : Capnp_message("control_ping_reply", api::Message_type::S_REPLY) {}
};

class Sw_interface_dump : public api::Capnp_message<schema::SwInterfaceDump>
{
public:
  Sw_interface_dump() : Capnp_message("sw_interface_dump", api::Message_type::S_REQUEST) {}
};

class Sw_interface_details : public api::Capnp_message<schema::SwInterfaceDetails>
{
public:
  Sw_interface_details() : Capnp_message("sw_interface_details", api::Message_type::S_REPLY) {}
};

class Mac_address : public api::Capnp_data_type<schema::MacAddress>
{
public:
  Mac_address() : Capnp_data_type("mac_address") {}
};

class Sw_interface_event : public api::Capnp_message<schema::SwInterfaceEvent>
{
public:
  Sw_interface_event() : Capnp_message("sw_interface_event", api::Message_type::S_EVENT) {}
};

class Show_version : public api::Capnp_message<schema::ShowVersion>
{
public:
  Show_version() : Capnp_message("show_version", api::Message_type::S_REQUEST) {}
};

/// IDs the test peer assigns.
enum class Test_msg_id : api::msg_id_t
{
  S_CONTROL_PING = 10,
  S_CONTROL_PING_REPLY,
  S_SW_INTERFACE_DUMP,
  S_SW_INTERFACE_DETAILS,
  S_SW_INTERFACE_EVENT
};

// Free functions.

/**
 * Registers all test messages except Show_version, as a peer would upon connecting.
 *
 * @param id_table
 *        Table to fill.
 */
void register_test_msgs(api::Msg_id_table* id_table);

/**
 * Returns the ID registered by register_test_msgs().
 *
 * @param id
 *        Enum value.
 * @return See above.
 */
api::msg_id_t to_msg_id(Test_msg_id id);

} // namespace binapi::test
