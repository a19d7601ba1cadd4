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
#include "binapi/api/channel.hpp"
#include "binapi/api/notif_dispatcher.hpp"
#include "binapi/api/msg_id_table.hpp"
#include "binapi/api/capnp_codec.hpp"
#include "test_common.hpp"
#include "test_msgs.hpp"
#include <flow/async/single_thread_task_loop.hpp>
#include <boost/thread/thread.hpp>
#include <boost/thread/future.hpp>
#include <boost/chrono.hpp>
#include <gtest/gtest.h>
#include <atomic>

namespace binapi::test
{

namespace
{

using Test_channel = api::Channel<api::Null_metadata>;
using api::Notif_queue;
using std::make_shared;

/// Channel whose notification control queues are served by a dispatcher on a separate thread.
class Notif_test : public ::testing::Test
{
protected:
  Notif_test() :
    m_id_table(test_logger()),
    m_codec(test_logger()),
    m_dispatcher(test_logger(), &m_codec, &m_id_table),
    m_queues(api::Channel_queues::create(4, 4)),
    m_channel(test_logger(), "notif_chan", m_queues, &m_codec, &m_id_table),
    m_ctl_loop(test_logger(), "notif_ctl")
  {
    register_test_msgs(&m_id_table);

    m_ctl_loop.start();
    m_ctl_loop.post([this]()
    {
      while (m_dispatcher.serve_subscription_request(m_queues))
      {
      }
    });
  }

  ~Notif_test() override
  {
    m_queues.m_notif_subs_queue->close();
    m_ctl_loop.stop();
  }

  size_t emit_event(uint32_t sw_if_index, bool admin_up)
  {
    Sw_interface_event event;
    event.body_root().setSwIfIndex(sw_if_index);
    event.body_root().setAdminUp(admin_up);
    flow::util::Blob data(test_logger());
    m_codec.encode_msg(event, &data);
    return m_dispatcher.dispatch_notification(to_msg_id(Test_msg_id::S_SW_INTERFACE_EVENT), data);
  }

  static api::Message_ptr new_event()
  {
    return make_shared<Sw_interface_event>();
  }

  api::Msg_id_table m_id_table;
  api::Capnp_codec m_codec;
  api::Notif_dispatcher m_dispatcher;
  const api::Channel_queues m_queues;
  Test_channel m_channel;
  flow::async::Single_thread_task_loop m_ctl_loop;
}; // class Notif_test

} // namespace (anon)

TEST_F(Notif_test, Subscribe_then_deliver)
{
  const auto notif_queue = make_shared<Notif_queue>(api::Channel_base::S_DEFAULT_NOTIF_QUEUE_SZ);

  Error_code err_code;
  const auto sub = m_channel.subscribe_notification(notif_queue, &Notif_test::new_event, &err_code);
  ASSERT_FALSE(err_code);
  ASSERT_TRUE(sub);
  EXPECT_EQ(m_dispatcher.n_subscriptions(), 1u);

  EXPECT_EQ(emit_event(3, true), 1u);
  EXPECT_EQ(emit_event(4, false), 1u);

  const auto first = notif_queue->try_pop();
  ASSERT_TRUE(first);
  const auto& event = dynamic_cast<const Sw_interface_event&>(**first);
  EXPECT_EQ(event.body_root().getSwIfIndex(), 3u);
  EXPECT_TRUE(event.body_root().getAdminUp());

  const auto second = notif_queue->try_pop();
  ASSERT_TRUE(second);
  EXPECT_EQ(dynamic_cast<const Sw_interface_event&>(**second).body_root().getSwIfIndex(), 4u);
  EXPECT_NE(first->get(), second->get()); // Each delivery is a fresh message.
}

TEST_F(Notif_test, Unsubscribe_stops_delivery)
{
  const auto notif_queue = make_shared<Notif_queue>(8);
  const auto sub = m_channel.subscribe_notification(notif_queue, &Notif_test::new_event);
  EXPECT_EQ(emit_event(1, true), 1u);

  Error_code err_code;
  m_channel.unsubscribe_notification(sub, &err_code);
  ASSERT_FALSE(err_code);
  EXPECT_EQ(m_dispatcher.n_subscriptions(), 0u);

  EXPECT_EQ(emit_event(2, true), 0u);
  EXPECT_EQ(notif_queue->size(), 1u);

  // Already removed.
  m_channel.unsubscribe_notification(sub, &err_code);
  EXPECT_EQ(err_code, api::error::Code::S_SUBSCRIPTION_NOT_FOUND);
  EXPECT_THROW(m_channel.unsubscribe_notification(sub), flow::error::Runtime_error);
}

TEST_F(Notif_test, Unsubscribe_waits_for_delivery_in_progress)
{
  const auto notif_queue = make_shared<Notif_queue>(8);

  // The 1st factory call is the subscribe handshake's; the 2nd is the delivery, which we hold until released.
  std::atomic<int> n_factory_calls(0);
  boost::promise<void> in_factory;
  auto in_factory_future = in_factory.get_future();
  boost::promise<void> release_factory;
  auto release_future = release_factory.get_future().share();
  const auto sub = m_channel.subscribe_notification(notif_queue, [&]() -> api::Message_ptr
  {
    if (n_factory_calls++ == 1)
    {
      in_factory.set_value();
      release_future.wait();
    }
    return new_event();
  });
  ASSERT_TRUE(sub);

  size_t n_delivered = 0;
  boost::thread dispatch_thread([&]() { n_delivered = emit_event(9, true); });
  in_factory_future.wait();

  std::atomic<bool> unsubscribed(false);
  size_t queue_sz_at_unsubscribe = 0;
  Error_code unsub_err_code;
  boost::thread unsub_thread([&]()
  {
    m_channel.unsubscribe_notification(sub, &unsub_err_code);
    queue_sz_at_unsubscribe = notif_queue->size();
    unsubscribed = true;
  });

  boost::this_thread::sleep_for(boost::chrono::milliseconds(100));
  EXPECT_FALSE(unsubscribed); // Cannot complete while a delivery to the subscription is in progress.

  release_factory.set_value();
  dispatch_thread.join();
  unsub_thread.join();

  EXPECT_FALSE(unsub_err_code);
  EXPECT_EQ(n_delivered, 1u);
  // Whatever was delivered was delivered before unsubscribe returned.
  EXPECT_EQ(notif_queue->size(), queue_sz_at_unsubscribe);
  EXPECT_EQ(emit_event(10, true), 0u);
  EXPECT_EQ(notif_queue->size(), 1u);
}

TEST_F(Notif_test, Multiple_subscribers)
{
  const auto queue1 = make_shared<Notif_queue>(8);
  const auto queue2 = make_shared<Notif_queue>(8);
  const auto sub1 = m_channel.subscribe_notification(queue1, &Notif_test::new_event);
  const auto sub2 = m_channel.subscribe_notification(queue2, &Notif_test::new_event);
  EXPECT_NE(sub1, sub2);

  EXPECT_EQ(emit_event(7, true), 2u);
  EXPECT_EQ(queue1->size(), 1u);
  EXPECT_EQ(queue2->size(), 1u);

  m_channel.unsubscribe_notification(sub1);
  EXPECT_EQ(emit_event(8, true), 1u);
  EXPECT_EQ(queue1->size(), 1u);
  EXPECT_EQ(queue2->size(), 2u);
}

TEST_F(Notif_test, Full_queue_drops)
{
  const auto notif_queue = make_shared<Notif_queue>(1);
  const auto sub = m_channel.subscribe_notification(notif_queue, &Notif_test::new_event);

  EXPECT_EQ(emit_event(1, true), 1u);
  EXPECT_EQ(emit_event(2, true), 0u); // Dropped; not blocked.
  EXPECT_EQ(notif_queue->size(), 1u);

  const auto msg = notif_queue->try_pop();
  ASSERT_TRUE(msg);
  EXPECT_EQ(dynamic_cast<const Sw_interface_event&>(**msg).body_root().getSwIfIndex(), 1u);
}

TEST_F(Notif_test, Subscribe_incompatible)
{
  const auto notif_queue = make_shared<Notif_queue>(8);
  Error_code err_code;
  const auto sub = m_channel.subscribe_notification(notif_queue,
                                                    []() -> api::Message_ptr { return make_shared<Show_version>(); },
                                                    &err_code);
  EXPECT_EQ(err_code, api::error::Code::S_INCOMPATIBLE_MESSAGE);
  EXPECT_FALSE(sub);
  EXPECT_EQ(m_dispatcher.n_subscriptions(), 0u);
}

TEST_F(Notif_test, Subscribe_nil)
{
  Error_code err_code;
  EXPECT_FALSE(m_channel.subscribe_notification(nullptr, &Notif_test::new_event, &err_code));
  EXPECT_EQ(err_code, api::error::Code::S_NIL_MESSAGE);
  EXPECT_FALSE(m_channel.subscribe_notification(make_shared<Notif_queue>(1), api::Msg_factory(), &err_code));
  EXPECT_EQ(err_code, api::error::Code::S_NIL_MESSAGE);
  m_channel.unsubscribe_notification(nullptr, &err_code);
  EXPECT_EQ(err_code, api::error::Code::S_NIL_MESSAGE);
}

TEST_F(Notif_test, Control_queue_closed)
{
  m_queues.m_notif_subs_queue->close();

  Error_code err_code;
  EXPECT_FALSE(m_channel.subscribe_notification(make_shared<Notif_queue>(1), &Notif_test::new_event, &err_code));
  EXPECT_EQ(err_code, api::error::Code::S_CHANNEL_CLOSED);
}

TEST(Notif_dispatcher, No_subscribers)
{
  api::Msg_id_table id_table(test_logger());
  api::Capnp_codec codec(test_logger());
  api::Notif_dispatcher dispatcher(test_logger(), &codec, &id_table);
  EXPECT_EQ(dispatcher.dispatch_notification(1, flow::util::Blob(test_logger())), 0u);
  EXPECT_EQ(dispatcher.n_subscriptions(), 0u);
}

} // namespace binapi::test
