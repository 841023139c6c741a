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

#include <flow/util/util.hpp>

#include "chan/detail/common.hpp"
#include <boost/asio.hpp>

/* We build in C++17 mode ourselves, and the headers (templates, inline stuff) require it of the `#include`ing
 * translation unit as well.  Enforce it rather than letting some obscure template error speak for us. */
#if (!defined(__cplusplus)) || (__cplusplus < 201703L)
#  error "To compile a translation unit that `#include`s any chan/ API headers, use C++17 compile mode or later."
#endif

/**
 * Catch-all namespace for the Flow-Chan project: a library/API in modern C++17 providing readiness-event-driven
 * channels over non-blocking transport resources (pipes, stream sockets, datagram sockets).  Application code
 * registers interest in readability/writability of a channel and is called back, on an event thread, when the
 * resource becomes ready -- without dedicating a thread per connection.
 *
 * Flow-Chan modules overview
 * --------------------------
 * Bottom-up:
 *
 *   -# chan::util: Basic building blocks.  util::Native_handle is a trivial wrapper around a native handle
 *      (FD); util::Asio_waitable_native_handle lets one `async_wait()` readiness on such a handle.
 *   -# chan::error: The error codes (boost.system style) emitted by all the modules below, outside of
 *      plain system errors.
 *   -# chan::config: The *Configurable facet* -- named, typed options with get/set -- and the
 *      config::Configurable_factory that builds an object from such options.
 *   -# chan::event: The event source, i.e., what watches resources and fires callbacks; and the
 *      event::Readiness_handle, the live registration of one (resource, direction) pair with an event source.
 *      event::Asio_event_source is the boost.asio-based implementation.
 *   -# chan::channel: The channels themselves, built on top of all of the above.  channel::Pipe_channel
 *      composes a pipe's two ends into a bidirectional stream; channel::Udp_socket_channel wraps a datagram socket
 *      with per-call addressing.  User code implements channel::Io_handler to be told about readiness.
 *
 * Relationship with Flow and Boost
 * --------------------------------
 * Flow-Chan requires Flow and Boost, not only for internal implementation purposes but also in its APIs.
 * `flow::log` is the logging system; `flow::Error_code` and related conventions are used for error reporting;
 * boost.asio buffers and endpoints appear in the channel APIs.
 *
 * ### Error reporting ###
 * The standards and mechanics w/r/t error reporting are entirely inherited from Flow.  Therefore see the
 * `namespace flow` doc header's "Error reporting" section.  Briefly: a method that can fail takes a trailing
 * `Error_code* err_code` arg; if null, failure throws `flow::error::Runtime_error`; else `*err_code` is set
 * (to success or failure) and nothing is thrown.
 *
 * ### Logging ###
 * We use `flow::log`.  Supply a `flow::log::Logger` into the various constructors in order to enable logging;
 * passing null makes it log nowhere.
 */
namespace chan
{

// Types.

/// Short-hand for `flow::Error_code` which is very common.
using Error_code = flow::Error_code;

/// Short-hand for polymorphic functor holder which is very common.  This is essentially `std::function`.
template<typename Signature>
using Function = flow::Function<Signature>;

#ifdef CHAN_DOXYGEN_ONLY // Actual compilation will ignore the below; but Doxygen will scan it and generate docs.

/**
 * The `flow::log::Component` payload enumeration containing the log components used by Flow-Chan internal logging.
 * The actual members are generated by `flow::log` macro magic from `log_component_enum_declare.macros.hpp`;
 * look there.
 */
enum class Log_component
{
  /// Placeholder for Doxygen purposes only.
  S_END_SENTINEL
};

/**
 * The map generated by `flow::log` macro magic that maps each enumerated value in chan::Log_component to its
 * string representation as used in log output and verbosity config.
 */
extern const boost::unordered_multimap<Log_component, std::string> S_CHAN_LOG_COMPONENT_NAME_MAP;

#endif // CHAN_DOXYGEN_ONLY

} // namespace chan
