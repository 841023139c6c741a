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

#include "chan/event/readiness_handle.hpp"
#include <memory>

namespace chan::event
{

// Types.

/**
 * Interface of anything that watches resources for readiness and, through Readiness_handle objects, lets the
 * registrant control when it is notified.  Channels depend only on this interface; Asio_event_source implements it.
 */
class Event_source
{
public:
  // Constructors/destructor.

  /// Boring virtual destructor.
  virtual ~Event_source();

  // Methods.

  /**
   * Registers interest in readiness of `resource` in direction `direction`.  The returned handle is
   * suspended; see Readiness_handle for the arming model.  The handle is exclusively owned by the caller; the event
   * source must retain at most a weak association with it, so that destroying the handle is always safe.
   *
   * The resource must stay open at least until the handle is cancelled; the caller remains its owner.
   *
   * @param resource
   *        Open descriptor.
   * @param direction
   *        Interest::S_READ or Interest::S_WRITE.
   * @param on_ready
   *        Invoked, from an unspecified event thread, each time the armed handle observes readiness.  It must not
   *        throw; an exception escaping it is logged and discarded.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_INVALID_ARGUMENT (null resource, bad direction); system errors.
   * @return The handle; or null on error.
   */
  virtual std::unique_ptr<Readiness_handle> register_interest(util::Native_handle resource, Interest direction,
                                                              util::Task&& on_ready, Error_code* err_code = 0) = 0;
}; // class Event_source

} // namespace chan::event
