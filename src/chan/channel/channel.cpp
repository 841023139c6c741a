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

/// @file
#include "chan/channel/channel_registry.hpp"
#include "chan/channel/channel_stats.hpp"

namespace chan::channel
{

// Channel_registry implementations.

Channel_registry::~Channel_registry() = default;

// Managed_channel_registry implementations.

Managed_channel_registry::Managed_channel_registry(flow::log::Logger* logger_ptr) :
  flow::log::Log_context(logger_ptr, Log_component::S_CHANNEL)
{
  // Yep.
}

void Managed_channel_registry::add_channel(Channel* channel)
{
  assert(channel);

  flow::util::Lock_guard<decltype(m_mutex)> lock(m_mutex);
  if (m_channels.insert(channel).second)
  {
    FLOW_LOG_TRACE("Channel registry [" << this << "]: Now tracking channel [" << *channel << "]; "
                   "count [" << m_channels.size() << "].");
  }
}

void Managed_channel_registry::remove_channel(Channel* channel)
{
  flow::util::Lock_guard<decltype(m_mutex)> lock(m_mutex);
  if (m_channels.erase(channel) != 0)
  {
    // Careful: do not call into *channel (it is mid-close()); printing its address is fine.
    FLOW_LOG_TRACE("Channel registry [" << this << "]: No longer tracking channel @[" << channel << "]; "
                   "count [" << m_channels.size() << "].");
  }
}

bool Managed_channel_registry::contains(const Channel* channel) const
{
  flow::util::Lock_guard<decltype(m_mutex)> lock(m_mutex);
  return m_channels.find(const_cast<Channel*>(channel)) != m_channels.end();
}

size_t Managed_channel_registry::size() const
{
  flow::util::Lock_guard<decltype(m_mutex)> lock(m_mutex);
  return m_channels.size();
}

size_t Managed_channel_registry::close_all()
{
  FLOW_LOG_INFO("Channel registry [" << this << "]: Closing all [" << size() << "] tracked channels.");

  /* One at a time, each picked under the lock: a channel closed (or closed and destroyed) since the previous pick,
   * e.g., by a handler reacting to an earlier close, is then simply no longer there.  `tried` keeps a channel whose
   * close() somehow left it tracked from being picked forever. */
  boost::unordered_set<Channel*> tried;
  size_t n_errors = 0;
  while (true)
  {
    Channel* channel = nullptr;
    {
      flow::util::Lock_guard<decltype(m_mutex)> lock(m_mutex);
      for (const auto candidate : m_channels)
      {
        if (tried.count(candidate) == 0)
        {
          channel = candidate;
          break;
        }
      }
    }
    if (!channel)
    {
      break;
    }
    // else

    tried.insert(channel);
    Error_code err_code;
    channel->close(&err_code);
    if (err_code)
    {
      ++n_errors;
      // Careful: close()'s on_closed handler may have destroyed *channel by now; print the address only.
      FLOW_LOG_WARNING("Channel registry [" << this << "]: Closing channel @[" << channel << "] reported error "
                       "[" << err_code << "] [" << err_code.message() << "]; continuing.");
    }
  }
  return n_errors;
} // Managed_channel_registry::close_all()

// Channel_stats_sink implementations.

Channel_stats_sink::~Channel_stats_sink() = default;

// Channel_stats implementations.

Channel_stats::Channel_stats(util::String_view name) :
  m_name(name),
  m_bytes_read(0),
  m_bytes_written(0),
  m_registered(true)
{
  // That's it.
}

void Channel_stats::bytes_read(size_t n_bytes)
{
  m_bytes_read += n_bytes;
}

void Channel_stats::bytes_written(size_t n_bytes)
{
  m_bytes_written += n_bytes;
}

void Channel_stats::unregister()
{
  m_registered = false;
}

uint64_t Channel_stats::total_bytes_read() const
{
  return m_bytes_read;
}

uint64_t Channel_stats::total_bytes_written() const
{
  return m_bytes_written;
}

bool Channel_stats::registered() const
{
  return m_registered;
}

const std::string& Channel_stats::name() const
{
  return m_name;
}

// Free function implementations.

std::ostream& operator<<(std::ostream& os, const Channel& val)
{
  return os << '[' << val.nickname() << "]@" << static_cast<const void*>(&val);
}

} // namespace chan::channel
