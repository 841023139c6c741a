/* Flow-Chan: Core
 * Copyright 2023 Akamai Technologies, Inc.
 *
 * Licensed under the Apache License, Version 2.0 (the
 * "License"); you may not use this file except in
 * compliance with the License.  You may obtain a copy
 * of the License at
 *
 *   https://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in
 * writing, software distributed under the License is
 * distributed on an "AS IS" BASIS, WITHOUT WARRANTIES OR
 * CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing
 * permissions and limitations under the License. */

#include "chan/channel/udp_socket_channel.hpp"
#include "chan/channel/channel_registry.hpp"
#include "chan/channel/channel_stats.hpp"
#include "chan/event/asio_event_source.hpp"
#include "chan/test/test_fakes.hpp"
#include "chan/test/test_logger.hpp"
#include "chan/test/test_common_util.hpp"
#include "chan/error.hpp"
#include <flow/error/error.hpp>
#include <gtest/gtest.h>
#include <future>
#include <limits>
#include <sys/socket.h>
#include <netinet/in.h>

namespace chan::channel::test
{

namespace
{

using chan::test::Test_logger;
using chan::test::Fake_event_source;
using chan::test::Recording_registry;
using chan::test::Recording_stats_sink;
using Handler = chan::test::Recording_handler<Udp_socket_channel>;
using Endpoint = Udp_socket_channel::Endpoint;
using Address = Udp_socket_channel::Address;
using util::Native_handle;
using util::Blob_const;
using util::Blob_mutable;

const util::Fine_duration S_PATIENCE = boost::chrono::seconds(5);
const util::Fine_duration S_SETTLE_TIME = boost::chrono::milliseconds(100);

/// Registration indices in a Fake_event_source, as a Udp_socket_channel makes them.
const size_t S_READ_REG = 0;
const size_t S_WRITE_REG = 1;

/// Loopback, any port.
Endpoint loopback_endpoint()
{
  return Endpoint(boost::asio::ip::address_v4::loopback(), 0);
}

/// Receives one datagram, waiting for it if needed.
std::string receive_string(Udp_socket_channel* channel, size_t max_size = 64,
                           Multipoint_read_result* result_out = nullptr)
{
  EXPECT_TRUE(channel->await_readable(S_PATIENCE));
  std::string str(max_size, '\0');
  const auto result = channel->receive(Blob_mutable(str.data(), str.size()));
  EXPECT_TRUE(result);
  if (!result)
  {
    return std::string();
  }
  // else
  if (result_out)
  {
    *result_out = *result;
  }
  str.resize(result->m_n_rcvd);
  return str;
}

} // Anonymous namespace

TEST(Udp_socket_channel_test, Send_receive)
{
  Test_logger logger;
  Fake_event_source event_source;
  Channel_stats stats_a("a");
  Channel_stats stats_b("b");
  Udp_socket_channel chan_a(&logger, "a", &event_source, loopback_endpoint(), nullptr, nullptr, &stats_a);
  Udp_socket_channel chan_b(&logger, "b", &event_source, loopback_endpoint(), nullptr, nullptr, &stats_b);
  const auto addr_a = chan_a.local_address();
  const auto addr_b = chan_b.local_address();
  EXPECT_NE(addr_a.port(), 0);
  EXPECT_TRUE(chan_a.is_open());

  // Nothing pending: none, and no error.
  char buf[8];
  Error_code err_code;
  EXPECT_FALSE(chan_b.receive(Blob_mutable(buf, sizeof(buf)), &err_code));
  EXPECT_FALSE(err_code);

  EXPECT_TRUE(chan_a.send(addr_b, Blob_const("hello", 5)));
  Multipoint_read_result result;
  EXPECT_EQ(receive_string(&chan_b, 64, &result), "hello");
  EXPECT_EQ(result.m_n_rcvd, 5u);
  EXPECT_EQ(result.m_source, addr_a);
  EXPECT_FALSE(result.m_destination);

  EXPECT_EQ(stats_a.total_bytes_written(), 5u);
  EXPECT_EQ(stats_b.total_bytes_read(), 5u);
  EXPECT_EQ(stats_a.total_bytes_read(), 0u);

  // Datagram longer than the buffer: truncated; rest is gone.
  EXPECT_TRUE(chan_a.send(addr_b, Blob_const("0123456789", 10)));
  EXPECT_EQ(receive_string(&chan_b, 4), "0123");
  EXPECT_FALSE(chan_b.receive(Blob_mutable(buf, sizeof(buf)), &err_code));
  EXPECT_FALSE(err_code);
  EXPECT_EQ(stats_b.total_bytes_read(), 9u);
}

TEST(Udp_socket_channel_test, Gather_send)
{
  Test_logger logger;
  Fake_event_source event_source;
  Recording_stats_sink stats;
  Udp_socket_channel chan_a(&logger, "a", &event_source, loopback_endpoint(), nullptr, nullptr, &stats);
  Udp_socket_channel chan_b(&logger, "b", &event_source, loopback_endpoint(), nullptr);
  const auto addr_b = chan_b.local_address();

  const std::vector<Blob_const> srcs{ Blob_const("he", 2), Blob_const(nullptr, 0), Blob_const("llo", 3),
                                      Blob_const("!", 1) };
  // One datagram, same as a single send() of the concatenation.
  EXPECT_TRUE(chan_a.send(addr_b, srcs));
  EXPECT_EQ(receive_string(&chan_b), "hello!");
  EXPECT_TRUE(chan_a.send(addr_b, srcs, 1, 2));
  EXPECT_EQ(receive_string(&chan_b), "llo");
  EXPECT_EQ(stats.m_n_written, 9u);

  Error_code err_code;
  EXPECT_FALSE(chan_a.send(addr_b, srcs, 3, 2, &err_code));
  EXPECT_EQ(err_code, error::Code::S_INVALID_ARGUMENT);
  EXPECT_THROW(chan_a.send(addr_b, srcs, 5, 0), flow::error::Runtime_error);
}

TEST(Udp_socket_channel_test, Gather_send_too_large)
{
  Test_logger logger;
  Fake_event_source event_source;
  Recording_stats_sink stats;
  Udp_socket_channel chan_a(&logger, "a", &event_source, loopback_endpoint(), nullptr, nullptr, &stats);
  Udp_socket_channel chan_b(&logger, "b", &event_source, loopback_endpoint(), nullptr);
  const auto addr_b = chan_b.local_address();

  /* The sizes are lies: the total is checked before anything is copied, so the bytes are never touched.
   * Sizes add up to just over the limit; and then to "wrap-around" territory, which must not fool the check. */
  const char byte = 'x';
  const size_t max = Udp_socket_channel::S_MAX_STAGED_SIZE;
  EXPECT_EQ(max, size_t(std::numeric_limits<int>::max()));
  const std::vector<Blob_const> srcs1{ Blob_const(&byte, max), Blob_const(&byte, 1) };
  const std::vector<Blob_const> srcs2{ Blob_const(&byte, 1), Blob_const(&byte, std::numeric_limits<size_t>::max()) };

  Error_code err_code;
  EXPECT_FALSE(chan_a.send(addr_b, srcs1, &err_code));
  EXPECT_EQ(err_code, error::Code::S_MESSAGE_SIZE_EXCEEDS_LIMIT);
  EXPECT_FALSE(chan_a.send(addr_b, srcs2, &err_code));
  EXPECT_EQ(err_code, error::Code::S_MESSAGE_SIZE_EXCEEDS_LIMIT);

  EXPECT_EQ(stats.m_n_written, 0u);
  EXPECT_FALSE(chan_b.await_readable(S_SETTLE_TIME));
}

TEST(Udp_socket_channel_test, Unsupported)
{
  Test_logger logger;
  Fake_event_source event_source;
  Udp_socket_channel channel(&logger, "u", &event_source, loopback_endpoint(), nullptr);

  const auto group = boost::asio::ip::make_address("239.1.2.3");
  const auto iface = boost::asio::ip::make_address("127.0.0.1");
  Error_code err_code;
  channel.join(group, iface, &err_code);
  EXPECT_EQ(err_code, error::Code::S_OPERATION_NOT_SUPPORTED);
  channel.join(group, iface, boost::asio::ip::make_address("10.0.0.1"), &err_code);
  EXPECT_EQ(err_code, error::Code::S_OPERATION_NOT_SUPPORTED);
  channel.shutdown_reads(&err_code);
  EXPECT_EQ(err_code, error::Code::S_OPERATION_NOT_SUPPORTED);
  channel.shutdown_writes(&err_code);
  EXPECT_EQ(err_code, error::Code::S_OPERATION_NOT_SUPPORTED);
  EXPECT_THROW(channel.join(group, iface), flow::error::Runtime_error);
  EXPECT_THROW(channel.shutdown_writes(), flow::error::Runtime_error);
  EXPECT_TRUE(channel.is_open());

  EXPECT_TRUE(channel.options().empty());
  channel.get_option(config::Option<int>("IP_TTL"), &err_code);
  EXPECT_EQ(err_code, error::Code::S_OPTION_UNSUPPORTED);
  channel.set_option(config::Option<int>("IP_TTL"), 4, &err_code);
  EXPECT_EQ(err_code, error::Code::S_OPTION_UNSUPPORTED);
}

TEST(Udp_socket_channel_test, Dispatch)
{
  Test_logger logger(flow::log::Sev::S_WARNING);
  Fake_event_source event_source;
  auto handler = std::make_shared<Handler>();
  Udp_socket_channel channel(&logger, "u", &event_source, loopback_endpoint(), handler);
  const auto& regs = event_source.registrations();

  ASSERT_EQ(regs.size(), 2u);
  EXPECT_EQ(regs[S_READ_REG]->m_direction, event::Interest::S_READ);
  EXPECT_EQ(regs[S_WRITE_REG]->m_direction, event::Interest::S_WRITE);
  EXPECT_EQ(regs[S_READ_REG]->m_resource, regs[S_WRITE_REG]->m_resource);

  EXPECT_FALSE(event_source.fire(S_READ_REG));
  channel.resume_reads();
  EXPECT_TRUE(event_source.fire(S_READ_REG));
  EXPECT_EQ(handler->m_n_readable, 1u);
  channel.resume_writes();
  channel.suspend_writes();
  EXPECT_FALSE(event_source.fire(S_WRITE_REG));

  handler->m_on_writable = [](Udp_socket_channel&) { throw std::runtime_error("bad write"); };
  EXPECT_TRUE(chan::test::check_output([&]()
  {
    channel.resume_writes();
    EXPECT_TRUE(event_source.fire(S_WRITE_REG));
  }, std::cerr, "Write handler threw an exception \\[bad write\\]"));
  channel.resume_writes();
  EXPECT_TRUE(event_source.fire(S_WRITE_REG));
  EXPECT_EQ(handler->m_n_writable, 2u);
}

TEST(Udp_socket_channel_test, Event_driven_receive)
{
  Test_logger logger;
  event::Asio_event_source event_source(&logger, "evt", 1, 1);
  auto handler = std::make_shared<Handler>();
  std::promise<std::string> rcvd;
  handler->m_on_readable = [&](Udp_socket_channel& channel)
  {
    char buf[16];
    const auto result = channel.receive(Blob_mutable(buf, sizeof(buf)));
    if (result)
    {
      rcvd.set_value(std::string(buf, result->m_n_rcvd));
    }
    else
    {
      channel.resume_reads(); // Spurious; wait again.
    }
  };
  Udp_socket_channel receiver(&logger, "rcv", &event_source, loopback_endpoint(), handler);
  Udp_socket_channel sender(&logger, "snd", &event_source, loopback_endpoint(), nullptr);

  receiver.resume_reads();
  EXPECT_TRUE(sender.send(receiver.local_address(), Blob_const("ping", 4)));
  auto rcvd_future = rcvd.get_future();
  ASSERT_EQ(rcvd_future.wait_for(std::chrono::seconds(5)), std::future_status::ready);
  EXPECT_EQ(rcvd_future.get(), "ping");
}

TEST(Udp_socket_channel_test, Close)
{
  Test_logger logger;
  Fake_event_source event_source;
  Recording_registry registry;
  Recording_stats_sink stats;
  auto handler = std::make_shared<Handler>();
  Udp_socket_channel channel(&logger, "u", &event_source, loopback_endpoint(), handler, &registry, &stats);
  const auto& regs = event_source.registrations();
  const auto addr = channel.local_address();

  channel.resume_reads();
  Error_code err_code;
  channel.close(&err_code);
  EXPECT_FALSE(err_code);
  EXPECT_FALSE(channel.is_open());
  EXPECT_EQ(handler->m_n_closed, 1u);
  EXPECT_EQ(stats.m_n_unregisters, 1u);
  EXPECT_EQ(registry.removed(), std::vector<Channel*>{ &channel });
  EXPECT_TRUE(regs[S_READ_REG]->m_cancelled);
  EXPECT_TRUE(regs[S_WRITE_REG]->m_cancelled);

  // Second close: nothing happens again.
  channel.close(&err_code);
  EXPECT_FALSE(err_code);
  EXPECT_EQ(handler->m_n_closed, 1u);
  EXPECT_EQ(stats.m_n_unregisters, 1u);
  EXPECT_EQ(registry.removed().size(), 1u);

  // I/O on a closed channel.
  EXPECT_FALSE(channel.send(addr, Blob_const("x", 1), &err_code));
  EXPECT_EQ(err_code, boost::asio::error::bad_descriptor);
  char buf[1];
  EXPECT_FALSE(channel.receive(Blob_mutable(buf, 1), &err_code));
  EXPECT_EQ(err_code, boost::asio::error::bad_descriptor);
  channel.local_address(&err_code);
  EXPECT_EQ(err_code, boost::asio::error::bad_descriptor);
  channel.resume_reads();
  EXPECT_FALSE(event_source.fire(S_READ_REG));
  EXPECT_FALSE(channel.await_writable(&err_code));
  EXPECT_EQ(err_code, error::Code::S_INVALID_ARGUMENT);
}

TEST(Udp_socket_channel_test, Close_survives_throwing_collaborators)
{
  Test_logger logger;
  Fake_event_source event_source;
  Recording_registry registry;
  Recording_stats_sink stats;
  registry.m_throw = true;
  stats.m_throw = true;
  auto handler = std::make_shared<Handler>();
  handler->m_on_closed = [](Udp_socket_channel&) { throw std::runtime_error("bad close"); };
  Udp_socket_channel chan_a(&logger, "a", &event_source, loopback_endpoint(), handler, &registry, &stats);
  Udp_socket_channel chan_b(&logger, "b", &event_source, loopback_endpoint(), nullptr);

  // A throwing stats sink does not make I/O fail.
  Error_code err_code;
  EXPECT_TRUE(chan_a.send(chan_b.local_address(), Blob_const("x", 1), &err_code));
  EXPECT_FALSE(err_code);
  EXPECT_TRUE(chan_b.send(chan_a.local_address(), Blob_const("y", 1), &err_code));
  EXPECT_EQ(receive_string(&chan_a), "y");

  chan_a.close(&err_code);
  EXPECT_FALSE(err_code);
  EXPECT_FALSE(chan_a.is_open());
  EXPECT_EQ(handler->m_n_closed, 1u);
  EXPECT_EQ(stats.m_n_unregisters, 1u);
  EXPECT_EQ(registry.removed().size(), 1u);
  EXPECT_TRUE(event_source.registrations()[S_READ_REG]->m_cancelled);
}

TEST(Udp_socket_channel_test, Adopt_socket)
{
  Test_logger logger;
  Fake_event_source event_source;

  const int raw = ::socket(AF_INET6, SOCK_DGRAM, 0);
  ASSERT_NE(raw, -1);
  Udp_socket_channel channel(&logger, "v6", &event_source, Native_handle(raw), nullptr);
  EXPECT_TRUE(channel.is_open());
  EXPECT_TRUE(channel.local_address().address().is_v6());
  EXPECT_EQ(event_source.registrations()[S_READ_REG]->m_resource, Native_handle(raw));

  Error_code err_code;
  Udp_socket_channel bad(&logger, "bad", &event_source, Native_handle(), nullptr, nullptr, nullptr, &err_code);
  EXPECT_EQ(err_code, error::Code::S_INVALID_ARGUMENT);
  EXPECT_FALSE(bad.is_open());
  EXPECT_THROW(Udp_socket_channel(&logger, "bad", &event_source, Native_handle(), nullptr),
               flow::error::Runtime_error);
}

TEST(Udp_socket_channel_test, Failed_setup)
{
  Test_logger logger;
  Fake_event_source event_source;
  event_source.m_fail_registration_with = boost::system::errc::make_error_code(boost::system::errc::no_buffer_space);
  Recording_stats_sink stats;
  Recording_registry registry;
  auto handler = std::make_shared<Handler>();

  Error_code err_code;
  {
    Udp_socket_channel channel(&logger, "doomed", &event_source, loopback_endpoint(), handler, &registry, &stats,
                               &err_code);
    EXPECT_EQ(err_code, boost::system::errc::no_buffer_space);
    EXPECT_FALSE(channel.is_open());
  }
  EXPECT_EQ(handler->m_n_closed, 0u);
  EXPECT_EQ(stats.m_n_unregisters, 0u);
  EXPECT_TRUE(registry.removed().empty());
}

} // namespace chan::channel::test
