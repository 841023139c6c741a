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
#include "chan/event/event_source.hpp"
#include "chan/util/asio_waitable_native_hndl.hpp"
#include "chan/error.hpp"
#include <flow/error/error.hpp>
#include <boost/chrono/round.hpp>
#include <chrono>

namespace chan::event
{

// Implementations.

Readiness_handle::~Readiness_handle() = default;

Event_source::~Event_source() = default;

Interest intersect(Interest val1, Interest val2)
{
  return Interest(int(val1) & int(val2));
}

std::ostream& operator<<(std::ostream& os, Interest val)
{
  switch (val)
  {
  case Interest::S_NONE:
    return os << "none";
  case Interest::S_READ:
    return os << "read";
  case Interest::S_WRITE:
    return os << "write";
  case Interest::S_READ_WRITE:
    return os << "read|write";
  }
  return os << "interest[" << int(val) << ']';
}

std::ostream& operator<<(std::ostream& os, Handle_op_result val)
{
  return os << ((val == Handle_op_result::S_OK) ? "OK" : "ALREADY_CANCELLED");
}

std::ostream& operator<<(std::ostream& os, const Readiness_handle& val)
{
  os << "hndl[" << val.resource() << '/' << val.direction() << ']';
  if (val.cancelled())
  {
    return os << "(cancelled)";
  }
  // else
  return os << '(' << val.interest() << ")@" << static_cast<const void*>(&val);
}

bool await_readiness(flow::log::Logger* logger_ptr, util::Native_handle hndl, bool snd_else_rcv,
                     std::optional<util::Fine_duration> timeout_or_none, Error_code* err_code)
{
  using util::Asio_waitable_native_handle;
  using flow::util::Task_engine;
  using boost::chrono::duration_cast;
  using boost::chrono::round;
  using boost::chrono::microseconds;
  using boost::chrono::nanoseconds;

  bool ready;
  if (flow::error::exec_and_throw_on_error
        ([&](Error_code* actual_err_code) -> bool
           { return await_readiness(logger_ptr, hndl, snd_else_rcv, timeout_or_none, actual_err_code); },
         &ready, err_code, "event::await_readiness()"))
  {
    return ready;
  }
  // else

  FLOW_LOG_SET_CONTEXT(logger_ptr, Log_component::S_EVENT);

  if (hndl.null())
  {
    *err_code = error::Code::S_INVALID_ARGUMENT;
    return false;
  }
  // else
  err_code->clear();

  /* A private engine means a private epoll set, so registering hndl here cannot collide with the event source's
   * registrations.  Declaration order matters: `waitable` is destroyed (release()d) before `task_engine`,
   * whose destruction then discards any not-yet-invoked handler. */
  Task_engine task_engine;
  Asio_waitable_native_handle waitable(task_engine.get_executor());
  waitable.assign(hndl, err_code);
  if (*err_code)
  {
    return false;
  }
  // else

  bool fired = false;
  Error_code wait_err_code;
  waitable.async_wait(snd_else_rcv ? Asio_waitable_native_handle::Base::wait_write
                                   : Asio_waitable_native_handle::Base::wait_read,
                      [&](const Error_code& async_err_code)
  {
    fired = true;
    wait_err_code = async_err_code;
  });

  if (timeout_or_none)
  {
    FLOW_LOG_TRACE("Awaiting [" << (snd_else_rcv ? "writability" : "readability") << "] of [" << hndl << "]; "
                   "timeout ~[" << round<microseconds>(*timeout_or_none) << "].");
    task_engine.run_one_for(std::chrono::nanoseconds(duration_cast<nanoseconds>(*timeout_or_none).count()));
  }
  else
  {
    FLOW_LOG_TRACE("Awaiting [" << (snd_else_rcv ? "writability" : "readability") << "] of [" << hndl << "]; "
                   "no timeout.");
    task_engine.run_one();
  }

  if (!fired)
  {
    FLOW_LOG_TRACE("Await of [" << hndl << "] timed out.");
    return false;
  }
  // else

  if (wait_err_code)
  {
    *err_code = wait_err_code;
    FLOW_LOG_WARNING("Await of [" << hndl << "] failed with error [" << *err_code << "] "
                     "[" << err_code->message() << "].");
    return false;
  }
  // else

  return true;
} // await_readiness()

} // namespace chan::event
