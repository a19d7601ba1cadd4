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
#include "test_common.hpp"
#include "test_msgs.hpp"
#include "binapi/api/msg_id_table.hpp"
#include <flow/log/simple_ostream_logger.hpp>
#include <flow/log/config.hpp>

namespace binapi::test
{

// Implementations.

flow::log::Logger* test_logger()
{
  using flow::log::Config;
  using flow::log::Sev;
  using flow::log::Simple_ostream_logger;
  using flow::Flow_log_component;

  static Config s_log_config = []() -> Config
  {
    Config log_config(Sev::S_WARNING);
    log_config.init_component_to_union_idx_mapping<Flow_log_component>(1000, 999);
    log_config.init_component_to_union_idx_mapping<Log_component>(2000, 999);
    log_config.init_component_names<Flow_log_component>(flow::S_FLOW_LOG_COMPONENT_NAME_MAP, false, "flow-");
    log_config.init_component_names<Log_component>(S_BINAPI_LOG_COMPONENT_NAME_MAP, false, "binapi-");
    return log_config;
  }();
  static Simple_ostream_logger s_logger(&s_log_config);

  return &s_logger;
}

void register_test_msgs(api::Msg_id_table* id_table)
{
  id_table->register_msg(Control_ping(), to_msg_id(Test_msg_id::S_CONTROL_PING));
  id_table->register_msg(Control_ping_reply(), to_msg_id(Test_msg_id::S_CONTROL_PING_REPLY));
  id_table->register_msg(Sw_interface_dump(), to_msg_id(Test_msg_id::S_SW_INTERFACE_DUMP));
  id_table->register_msg(Sw_interface_details(), to_msg_id(Test_msg_id::S_SW_INTERFACE_DETAILS));
  id_table->register_msg(Sw_interface_event(), to_msg_id(Test_msg_id::S_SW_INTERFACE_EVENT));
}

api::msg_id_t to_msg_id(Test_msg_id id)
{
  return static_cast<api::msg_id_t>(id);
}

} // namespace binapi::test
