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

#include "chan/channel/channel_registry.hpp"
#include "chan/channel/channel_stats.hpp"
#include "chan/channel/pipe_channel.hpp"
#include "chan/test/test_fakes.hpp"
#include "chan/test/test_logger.hpp"
#include <gtest/gtest.h>
#include <unistd.h>

namespace chan::channel::test
{

namespace
{

using chan::test::Test_logger;
using chan::test::Fake_event_source;
using Handler = chan::test::Recording_handler<Pipe_channel>;
using util::Native_handle;

/// Makes a Pipe_channel over both ends of a new pipe, tracked by `registry`.
std::unique_ptr<Pipe_channel> make_channel(flow::log::Logger* logger_ptr, event::Event_source* event_source,
                                           util::String_view nickname, std::shared_ptr<Handler> handler,
                                           Managed_channel_registry* registry)
{
  int fds[2];
  EXPECT_EQ(::pipe(fds), 0);
  auto channel = std::make_unique<Pipe_channel>(logger_ptr, nickname, event_source,
                                                Native_handle(fds[0]), Native_handle(fds[1]),
                                                std::move(handler), registry);
  registry->add_channel(channel.get());
  return channel;
}

} // Anonymous namespace

TEST(Channel_registry_test, Close_all)
{
  Test_logger logger;
  Fake_event_source event_source;
  Managed_channel_registry registry(&logger);
  auto handler = std::make_shared<Handler>();

  const auto chan1 = make_channel(&logger, &event_source, "one", handler, &registry);
  const auto chan2 = make_channel(&logger, &event_source, "two", handler, &registry);
  registry.add_channel(chan1.get()); // Duplicate: ignored.
  EXPECT_EQ(registry.size(), 2u);
  EXPECT_TRUE(registry.contains(chan1.get()));

  // A channel closed on its own leaves the registry.
  chan2->close();
  EXPECT_EQ(registry.size(), 1u);
  EXPECT_FALSE(registry.contains(chan2.get()));

  EXPECT_EQ(registry.close_all(), 0u);
  EXPECT_EQ(registry.size(), 0u);
  EXPECT_FALSE(chan1->is_open());
  EXPECT_EQ(handler->m_n_closed, 2u);

  // Nothing left to do.
  EXPECT_EQ(registry.close_all(), 0u);
}

TEST(Channel_registry_test, Close_all_skips_channel_destroyed_meanwhile)
{
  Test_logger logger;
  Fake_event_source event_source;
  Managed_channel_registry registry(&logger);

  // Whichever channel close_all() closes first, its handler closes and destroys the other one.
  std::unique_ptr<Pipe_channel> chans[2];
  bool first = true;
  auto handler = std::make_shared<Handler>();
  handler->m_on_closed = [&](Pipe_channel& closed)
  {
    if (!first)
    {
      return;
    }
    // else
    first = false;
    for (auto& other : chans)
    {
      if (other && (other.get() != &closed))
      {
        other->close();
        other.reset();
      }
    }
  };
  chans[0] = make_channel(&logger, &event_source, "one", handler, &registry);
  chans[1] = make_channel(&logger, &event_source, "two", handler, &registry);

  EXPECT_EQ(registry.close_all(), 0u);
  EXPECT_EQ(registry.size(), 0u);
  EXPECT_EQ(handler->m_n_closed, 2u);
  EXPECT_EQ(int(bool(chans[0])) + int(bool(chans[1])), 1);
}

TEST(Channel_registry_test, Close_all_counts_errors)
{
  Test_logger logger;
  Fake_event_source event_source;
  Managed_channel_registry registry(&logger);
  auto handler = std::make_shared<Handler>();

  const auto good = make_channel(&logger, &event_source, "good", handler, &registry);
  const auto bad = make_channel(&logger, &event_source, "bad", handler, &registry);

  // Pull the sink out from under one channel; its close will report failure.
  ::close(event_source.registrations()[3]->m_resource.m_native_handle);

  EXPECT_EQ(registry.close_all(), 1u);
  EXPECT_EQ(registry.size(), 0u);
  EXPECT_FALSE(good->is_open());
  EXPECT_FALSE(bad->is_open());
  EXPECT_EQ(handler->m_n_closed, 2u);
}

TEST(Channel_registry_test, Stats)
{
  Channel_stats stats("s");
  EXPECT_EQ(stats.name(), "s");
  EXPECT_TRUE(stats.registered());
  stats.bytes_read(3);
  stats.bytes_read(4);
  stats.bytes_written(10);
  EXPECT_EQ(stats.total_bytes_read(), 7u);
  EXPECT_EQ(stats.total_bytes_written(), 10u);
  stats.unregister();
  EXPECT_FALSE(stats.registered());
}

} // namespace chan::channel::test
