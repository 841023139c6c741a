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
#include "chan/config/configurable.hpp"

namespace chan::channel
{

// Types.

/**
 * The part of every channel that does not depend on its kind: open/closed state, closing, and a name;
 * plus the config::Configurable facet.  This is what a Channel_registry tracks.
 */
class Channel : public config::Configurable
{
public:
  // Methods.

  /**
   * Returns `true` if and only if every OS resource making up the channel is open.
   * @return See above.
   */
  virtual bool is_open() const = 0;

  /**
   * Closes the channel.  Idempotent.  The user's Io_handler::on_closed() is invoked exactly once over the
   * lifetime of the channel, by whichever close() gets there first.  See each implementation for error semantics.
   *
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.
   */
  virtual void close(Error_code* err_code = 0) = 0;

  /**
   * Human-readable name given at construction.
   * @return See above.
   */
  virtual const std::string& nickname() const = 0;
}; // class Channel

} // namespace chan::channel
