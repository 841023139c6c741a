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

#include "chan/event/event_fwd.hpp"
#include "chan/util/native_handle.hpp"

namespace chan::event
{

// Types.

/**
 * A live registration of one resource, in one direction, with an Event_source: the thing a channel holds in
 * order to control whether it wants to be told about readiness.  Obtain one via Event_source::register_interest().
 *
 * ### Arming model ###
 * A handle is created suspended (interest() is Interest::S_NONE).  resume() arms it; when the resource next
 * becomes ready in the registered direction, the event source invokes the registered callback once and the handle
 * goes back to suspended.  To be told again, call resume() again (from the callback itself is fine and typical).
 * suspend() disarms without waiting for anything.  None of these perform I/O on the resource.
 *
 * ### Cancellation ###
 * cancel_key() detaches permanently; it is idempotent.  Thereafter suspend() and resume() do nothing and return
 * Handle_op_result::S_ALREADY_CANCELLED; they never fail.  That is the expected outcome when a channel's close()
 * races with the channel's own handler calling resume(), so channels absorb it silently.
 *
 * ### Thread safety ###
 * All methods are safe to call concurrently with each other and with the callback executing.
 *
 * @see Asio_event_source for the implementation shipped with Flow-Chan.
 */
class Readiness_handle
{
public:
  // Constructors/destructor.

  /// Cancels the handle (cancel_key()) if not yet done.  Implementations must ensure this.
  virtual ~Readiness_handle();

  // Methods.

  /**
   * Disarms: the callback will not be invoked (again) until resume().  A callback invocation already in
   * progress is unaffected.
   *
   * @return See Handle_op_result.
   */
  virtual Handle_op_result suspend() = 0;

  /**
   * Arms (if not already armed) for the intersection of `interest` and the registered direction; if that
   * intersection is empty this is equivalent to suspend().
   *
   * @param interest
   *        Requested interest.
   * @return See Handle_op_result.
   */
  virtual Handle_op_result resume(Interest interest) = 0;

  /**
   * Permanently detaches from the event source; the callback will never be invoked again.  Idempotent.
   *
   * Called from outside any readiness callback, this also waits for an invocation in progress on another thread
   * to return.  Called from inside a readiness callback (of this handle or any other) it does not wait, since the
   * other callback may itself be waiting on ours; e.g., a channel's read and write callbacks both closing it at
   * the same time.  A callback must therefore not destroy objects another callback may still be using.
   */
  virtual void cancel_key() = 0;

  /**
   * Returns `true` if and only if cancel_key() has been called.
   * @return See above.
   */
  virtual bool cancelled() const = 0;

  /**
   * Current interest: the registered direction if armed; Interest::S_NONE if suspended or cancelled.
   * @return See above.
   */
  virtual Interest interest() const = 0;

  /**
   * The direction given to Event_source::register_interest().
   * @return See above.
   */
  virtual Interest direction() const = 0;

  /**
   * The resource given to Event_source::register_interest().
   * @return See above.
   */
  virtual util::Native_handle resource() const = 0;
}; // class Readiness_handle

} // namespace chan::event
