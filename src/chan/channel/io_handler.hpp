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

#include "chan/channel/channel_fwd.hpp"

namespace chan::channel
{

// Types.

/**
 * What the user implements to be told about a channel's readiness and closure.  All three are invoked from
 * event threads (on_closed() from whichever thread closed the channel) and must not block for long.
 *
 * None of these should throw.  If one does anyway, the exception is caught, logged at WARNING level, and
 * discarded; see Fault_isolating_handler.
 *
 * @tparam Channel_obj
 *         The channel type: Pipe_channel or Udp_socket_channel.
 */
template<typename Channel_obj>
class Io_handler
{
public:
  // Constructors/destructor.

  /// Boring virtual destructor.
  virtual ~Io_handler() = default;

  // Methods.

  /**
   * The channel's read handle fired: it is (likely) readable.  Re-arm with `channel.resume_reads()` to be told
   * again.
   *
   * @param channel
   *        The channel.
   */
  virtual void on_readable(Channel_obj& channel) = 0;

  /**
   * The channel's write handle fired: it is (likely) writable.  Re-arm with `channel.resume_writes()` to be told
   * again.
   *
   * @param channel
   *        The channel.
   */
  virtual void on_writable(Channel_obj& channel) = 0;

  /**
   * The channel was closed.  Invoked exactly once.
   *
   * @param channel
   *        The channel.
   */
  virtual void on_closed(Channel_obj& channel) = 0;
}; // class Io_handler

} // namespace chan::channel
