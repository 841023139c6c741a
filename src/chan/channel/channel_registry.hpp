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
#pragma once

#include "chan/channel/channel.hpp"
#include <flow/log/log.hpp>
#include <flow/util/util.hpp>
#include <boost/unordered_set.hpp>

namespace chan::channel
{

// Types.

/**
 * The owner a channel reports to when it closes.  A channel given a registry calls remove_channel() from every
 * close(); so implementations must tolerate removal of a channel not (or no longer) present.  remove_channel() may
 * throw; the channel logs that and completes its close() regardless.
 */
class Channel_registry
{
public:
  // Constructors/destructor.

  /// Boring virtual destructor.
  virtual ~Channel_registry();

  // Methods.

  /**
   * Forgets the given channel.  Invoked from within `channel->close()`; must not call back into the channel.
   *
   * @param channel
   *        The channel.
   */
  virtual void remove_channel(Channel* channel) = 0;
}; // class Channel_registry

/**
 * Channel_registry that tracks a set of open channels and can close them all (e.g., at shutdown).  The user
 * add_channel()s each channel after constructing it with `*this` as its registry.
 *
 * ### Thread safety ###
 * All methods may be called concurrently.  close_all() closes channels outside its internal lock, so the
 * channels' own remove_channel() calls do not deadlock.  It looks each channel up right before closing it; so a
 * tracked channel may be closed by anyone (and then destroyed) while close_all() runs, including by the handler of
 * a channel close_all() just closed.  The one thing not allowed: destroying, on another thread, a channel that
 * close_all() may be closing at that moment, i.e., one still tracked.  Close it first.
 */
class Managed_channel_registry :
  public Channel_registry,
  public flow::log::Log_context
{
public:
  // Constructors/destructor.

  /**
   * Constructs empty registry.
   *
   * @param logger_ptr
   *        Logger to use for logging subsequently.
   */
  explicit Managed_channel_registry(flow::log::Logger* logger_ptr);

  // Methods.

  /**
   * Starts tracking the given channel.  No-op if already tracked.
   *
   * @param channel
   *        The channel; must stay alive until removed.
   */
  void add_channel(Channel* channel);

  /**
   * Implements Channel_registry API.  No-op if not tracked.
   *
   * @param channel
   *        See Channel_registry.
   */
  void remove_channel(Channel* channel) override;

  /**
   * Returns `true` if and only if the given channel is tracked.
   *
   * @param channel
   *        The channel.
   * @return See above.
   */
  bool contains(const Channel* channel) const;

  /**
   * Number of tracked channels.
   * @return See above.
   */
  size_t size() const;

  /**
   * close()s every tracked channel (each of which removes itself), logging (not propagating) close errors.
   * Channels added meanwhile may or may not be closed.
   * @return Number of channels whose close() reported an error.
   */
  size_t close_all();

private:
  // Data.

  /// Protects #m_channels.
  mutable flow::util::Mutex_non_recursive m_mutex;

  /// The tracked channels.
  boost::unordered_set<Channel*> m_channels;
}; // class Managed_channel_registry

} // namespace chan::channel
