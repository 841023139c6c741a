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

/**
 * Flow-Chan module containing the channels: objects that wrap already-open, non-blocking OS resources and
 * tell a user-supplied handler when those resources become readable or writable.
 *
 * The pieces:
 *   - channel::Channel: what every channel is, as far as a registry is concerned (open/close).
 *   - channel::Io_handler: what the user implements to be told about readiness and closure.
 *   - channel::Fault_isolating_handler: decorator that invokes an Io_handler and contains anything it throws.
 *   - channel::Pipe_channel: bidirectional stream composed of a pipe's read end and a (possibly other) pipe's
 *     write end.
 *   - channel::Udp_socket_channel: datagram channel with per-call peer addressing.
 *   - channel::Channel_registry, channel::Managed_channel_registry: who is told when a channel closes; and a
 *     registry able to close everything it tracks.
 *   - channel::Channel_stats_sink, channel::Channel_stats: per-channel byte counters.
 *
 * Readiness comes from an event::Event_source, through event::Readiness_handle objects each channel owns.
 * Channel I/O never blocks, except the explicitly blocking `await_*()` methods.
 */
namespace chan::channel
{

// Types.

// Find doc headers near the bodies of these compound types.

class Channel;
template<typename Channel_obj>
class Io_handler;
template<typename Channel_obj>
class Fault_isolating_handler;
class Channel_registry;
class Managed_channel_registry;
class Channel_stats_sink;
class Channel_stats;
class Pipe_channel;
class Udp_socket_channel;
struct Multipoint_read_result;

// Free functions.

/**
 * Prints string representation of the given channel to the given `ostream`.
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Channel& val);

/**
 * Prints string representation of the given Multipoint_read_result to the given `ostream`.
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Multipoint_read_result& val);

} // namespace chan::channel
