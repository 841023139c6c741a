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

#include "chan/common.hpp"
#include "chan/util/util_fwd.hpp"
#include <optional>

/**
 * Flow-Chan module containing the *event source* abstraction and its boost.asio-based implementation.
 *
 * An event source (event::Event_source) watches OS resources for readiness.  Registering a resource with it
 * yields an event::Readiness_handle: a live binding of that resource, one direction (read or write), and a
 * callback.  The handle is how its owner (typically a channel::Pipe_channel or channel::Udp_socket_channel)
 * arms, disarms and finally detaches the registration.  When an armed handle's resource becomes ready, the event
 * source invokes the callback once, on one of its event threads.
 *
 * event::Asio_event_source is the implementation we ship; event::Event_source_factory builds one from
 * config::Configurable options.  event::await_readiness() is the blocking counterpart: no event source involved,
 * the calling thread simply waits.
 */
namespace chan::event
{

// Types.

// Find doc headers near the bodies of these compound types.

class Readiness_handle;
class Event_source;
class Asio_event_source;
class Event_source_factory;

/**
 * Readiness direction(s): what a Readiness_handle is registered for, and what it is currently interested in.
 * The values are bit flags; Interest::S_READ_WRITE is the union of the other two.
 */
enum class Interest
{
  /// No interest: suspended.
  S_NONE = 0,
  /// Readability.
  S_READ = 1,
  /// Writability.
  S_WRITE = 2,
  /// Readability or writability.
  S_READ_WRITE = 3
}; // enum class Interest

/**
 * Outcome of Readiness_handle::suspend() and Readiness_handle::resume().  Neither is an error: a handle
 * cancelled (possibly concurrently) by its owner's close is a normal occurrence, and callers treat both as success.
 */
enum class Handle_op_result
{
  /// Interest changed as requested.
  S_OK,
  /// Handle was already cancelled; nothing changed.
  S_ALREADY_CANCELLED
}; // enum class Handle_op_result

// Free functions.

/**
 * Returns the directions present in both `val1` and `val2`.
 *
 * @param val1
 *        Interest.
 * @param val2
 *        Interest.
 * @return See above.
 */
Interest intersect(Interest val1, Interest val2);

/**
 * Prints string representation of the given Interest to the given `ostream`.
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, Interest val);

/**
 * Prints string representation of the given Handle_op_result to the given `ostream`.
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, Handle_op_result val);

/**
 * Prints string representation of the given Readiness_handle to the given `ostream`.
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Readiness_handle& val);

/**
 * Prints string representation of the given Asio_event_source to the given `ostream`.
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Asio_event_source& val);

/**
 * Blocks the calling thread until the given descriptor is ready for reading (or writing), or the timeout
 * elapses, whichever happens first.  No I/O is performed on the descriptor.
 *
 * This is the primitive behind the `await_readable()` and `await_writable()` methods of the channels.  It uses a
 * private, temporary `Task_engine`, so it neither needs nor disturbs any Event_source registration of the same
 * descriptor.
 *
 * @param logger_ptr
 *        Logger to use for logging subsequently.
 * @param hndl
 *        Descriptor to watch.  Must be open.
 * @param snd_else_rcv
 *        `true` to wait for writability; `false` for readability.
 * @param timeout_or_none
 *        Timeout; or `std::nullopt` to wait indefinitely.
 * @param err_code
 *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
 *        error::Code::S_INVALID_ARGUMENT (`hndl.null()`); system errors from the reactor.
 * @return `true` if the descriptor became ready; `false` if the timeout elapsed first (or on error).
 */
bool await_readiness(flow::log::Logger* logger_ptr, util::Native_handle hndl, bool snd_else_rcv,
                     std::optional<util::Fine_duration> timeout_or_none, Error_code* err_code = 0);

} // namespace chan::event
