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

#include "chan/channel/io_handler.hpp"
#include <flow/log/log.hpp>
#include <memory>

namespace chan::channel
{

// Types.

/**
 * Io_handler decorator that forwards each callback to the wrapped handler and contains any exception the latter
 * throws: the exception is logged (WARNING) and dropped, never rethrown.  So a faulty handler cannot take down an
 * event thread, and the next readiness event is dispatched as usual.
 *
 * A channel holds one of these around the user's handler, fixed at construction, and binds each of its readiness
 * handles to the matching method.
 *
 * @tparam Channel_obj
 *         See Io_handler.
 */
template<typename Channel_obj>
class Fault_isolating_handler :
  public Io_handler<Channel_obj>,
  public flow::log::Log_context
{
public:
  // Types.

  /// Short-hand for the decorated type.
  using Handler = Io_handler<Channel_obj>;

  // Constructors/destructor.

  /**
   * Wraps the given handler.
   *
   * @param logger_ptr
   *        Logger to which faults are reported.
   * @param handler
   *        The wrapped handler.  May be null, in which case the callbacks do nothing.
   */
  explicit Fault_isolating_handler(flow::log::Logger* logger_ptr, std::shared_ptr<Handler> handler);

  // Methods.

  /**
   * Invokes wrapped handler's same-named method, containing exceptions.
   * @param channel
   *        See Io_handler.
   */
  void on_readable(Channel_obj& channel) override;

  /**
   * Invokes wrapped handler's same-named method, containing exceptions.
   * @param channel
   *        See Io_handler.
   */
  void on_writable(Channel_obj& channel) override;

  /**
   * Invokes wrapped handler's same-named method, containing exceptions.
   * @param channel
   *        See Io_handler.
   */
  void on_closed(Channel_obj& channel) override;

  /**
   * The wrapped handler.
   * @return See above.
   */
  const std::shared_ptr<Handler>& handler() const;

private:
  // Methods.

  /**
   * Invokes `(m_handler.get()->*callback)(channel)` and contains anything it throws.
   *
   * @param callback
   *        Which method.
   * @param what
   *        For logging: which kind of callback.
   * @param channel
   *        The channel.
   */
  void dispatch(void (Handler::*callback)(Channel_obj&), util::String_view what, Channel_obj& channel);

  // Data.

  /// See ctor.
  const std::shared_ptr<Handler> m_handler;
}; // class Fault_isolating_handler

// Template implementations.

template<typename Channel_obj>
Fault_isolating_handler<Channel_obj>::Fault_isolating_handler(flow::log::Logger* logger_ptr,
                                                              std::shared_ptr<Handler> handler) :
  flow::log::Log_context(logger_ptr, Log_component::S_CHANNEL),
  m_handler(std::move(handler))
{
  // That's it.
}

template<typename Channel_obj>
void Fault_isolating_handler<Channel_obj>::on_readable(Channel_obj& channel)
{
  dispatch(&Handler::on_readable, "Read", channel);
}

template<typename Channel_obj>
void Fault_isolating_handler<Channel_obj>::on_writable(Channel_obj& channel)
{
  dispatch(&Handler::on_writable, "Write", channel);
}

template<typename Channel_obj>
void Fault_isolating_handler<Channel_obj>::on_closed(Channel_obj& channel)
{
  dispatch(&Handler::on_closed, "Close", channel);
}

template<typename Channel_obj>
const std::shared_ptr<typename Fault_isolating_handler<Channel_obj>::Handler>&
  Fault_isolating_handler<Channel_obj>::handler() const
{
  return m_handler;
}

template<typename Channel_obj>
void Fault_isolating_handler<Channel_obj>::dispatch(void (Handler::*callback)(Channel_obj&), util::String_view what,
                                                    Channel_obj& channel)
{
  if (!m_handler)
  {
    return;
  }
  // else

  try
  {
    (m_handler.get()->*callback)(channel);
  }
  catch (const std::exception& exc)
  {
    FLOW_LOG_WARNING("Channel [" << channel << "]: " << what << " handler threw an exception "
                     "[" << exc.what() << "]; ignoring it.");
  }
  catch (...)
  {
    FLOW_LOG_WARNING("Channel [" << channel << "]: " << what << " handler threw a non-std::exception; "
                     "ignoring it.");
  }
} // Fault_isolating_handler::dispatch()

} // namespace chan::channel
