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
#include "chan/event/detail/asio_readiness_handle.hpp"
#include "chan/util/util_fwd.hpp"
#include <flow/error/error.hpp>

namespace chan::event
{

// Static initializations.

thread_local unsigned int Asio_readiness_handle::s_dispatch_depth = 0;

// Implementations.

Asio_readiness_handle::State::State(flow::util::Task_engine* task_engine, Interest direction,
                                    util::Task&& on_ready) :
  m_direction(direction),
  m_on_ready(std::move(on_ready)),
  m_waitable(task_engine->get_executor()),
  m_armed(false),
  m_wait_in_flight(false),
  m_dispatching(false),
  m_cancelled(false)
{
  // Yep.
}

Asio_readiness_handle::Asio_readiness_handle(flow::log::Logger* logger_ptr, flow::util::Task_engine* task_engine,
                                             util::Native_handle resource, util::Native_handle dup_resource,
                                             Interest direction, util::Task&& on_ready, Error_code* err_code) :
  flow::log::Log_context(logger_ptr, Log_component::S_EVENT),
  m_resource(resource),
  m_state(std::make_shared<State>(task_engine, direction, std::move(on_ready)))
{
  assert(err_code);

  m_state->m_dup_resource = dup_resource;
  m_state->m_waitable.assign(dup_resource, err_code);
  if (*err_code)
  {
    FLOW_LOG_WARNING("Readiness handle [" << *this << "]: Could not register watched descriptor [" << dup_resource
                     << "] with reactor; error [" << *err_code << "] [" << err_code->message() << "].  "
                     "Handle is born cancelled.");
    m_state->m_cancelled = true;
    util::close_native_handle(get_logger(), &m_state->m_dup_resource);
    return;
  }
  // else

  FLOW_LOG_TRACE("Readiness handle [" << *this << "]: Registered; watching [" << dup_resource << "]; suspended.");
}

Asio_readiness_handle::~Asio_readiness_handle()
{
  cancel_key();
}

Handle_op_result Asio_readiness_handle::suspend()
{
  flow::util::Lock_guard<Mutex> lock(m_state->m_mutex);

  if (m_state->m_cancelled)
  {
    return Handle_op_result::S_ALREADY_CANCELLED;
  }
  // else

  /* Any outstanding wait stays outstanding; on completion it will see !m_armed and do nothing (and a resume() in the
   * meantime would simply reuse it). */
  m_state->m_armed = false;
  return Handle_op_result::S_OK;
}

Handle_op_result Asio_readiness_handle::resume(Interest interest)
{
  Lock lock(m_state->m_mutex);

  if (m_state->m_cancelled)
  {
    return Handle_op_result::S_ALREADY_CANCELLED;
  }
  // else

  if (intersect(interest, m_state->m_direction) == Interest::S_NONE)
  {
    m_state->m_armed = false;
    return Handle_op_result::S_OK;
  }
  // else

  m_state->m_armed = true;
  if ((!m_state->m_wait_in_flight) && (!m_state->m_dispatching))
  {
    start_wait(get_logger(), m_state);
  }
  // else { Outstanding wait will do; or on_wait_done() will start one after the callback returns. }

  return Handle_op_result::S_OK;
} // Asio_readiness_handle::resume()

void Asio_readiness_handle::cancel_key()
{
  Lock lock(m_state->m_mutex);

  if (!m_state->m_cancelled)
  {
    FLOW_LOG_TRACE("Readiness handle [" << *this << "]: Cancelling.");

    m_state->m_cancelled = true;
    m_state->m_armed = false;
    if (m_state->m_waitable.is_open())
    {
      // Outstanding async_wait() (if any) completes with operation_aborted; release() alone would discard it.
      Error_code sys_err_code;
      m_state->m_waitable.cancel(sys_err_code);
      if (sys_err_code)
      {
        FLOW_ERROR_SYS_ERROR_LOG_WARNING();
      }
      m_state->m_waitable.release();
    }
    util::close_native_handle(get_logger(), &m_state->m_dup_resource);
  }

  /* Whether we cancelled just now or earlier: do not return while the callback runs elsewhere.  Unless we are
   * inside a callback ourselves (this handle's or another's): that one may be cancelling us right back. */
  if (s_dispatch_depth == 0)
  {
    m_state->m_dispatch_done.wait(lock, [&]() -> bool { return !m_state->m_dispatching; });
  }
} // Asio_readiness_handle::cancel_key()

bool Asio_readiness_handle::cancelled() const
{
  flow::util::Lock_guard<Mutex> lock(m_state->m_mutex);
  return m_state->m_cancelled;
}

Interest Asio_readiness_handle::interest() const
{
  flow::util::Lock_guard<Mutex> lock(m_state->m_mutex);
  return m_state->m_armed ? m_state->m_direction : Interest::S_NONE;
}

Interest Asio_readiness_handle::direction() const
{
  return m_state->m_direction;
}

util::Native_handle Asio_readiness_handle::resource() const
{
  return m_resource;
}

void Asio_readiness_handle::start_wait(flow::log::Logger* logger_ptr, const std::shared_ptr<State>& state) // Static.
{
  using util::Asio_waitable_native_handle;
  using std::weak_ptr;

  assert(state->m_armed && (!state->m_wait_in_flight) && (!state->m_cancelled));

  state->m_wait_in_flight = true;
  state->m_waitable.async_wait((state->m_direction == Interest::S_READ)
                                 ? Asio_waitable_native_handle::Base::wait_read
                                 : Asio_waitable_native_handle::Base::wait_write,
                               [logger_ptr, state_observer = weak_ptr<State>(state)]
                                 (const Error_code& async_err_code)
  {
    on_wait_done(logger_ptr, state_observer, async_err_code);
  });
}

void Asio_readiness_handle::on_wait_done(flow::log::Logger* logger_ptr, const std::weak_ptr<State>& state_observer,
                                         const Error_code& async_err_code) // Static.
{
  FLOW_LOG_SET_CONTEXT(logger_ptr, Log_component::S_EVENT);

  const auto state = state_observer.lock();
  if (!state)
  {
    return; // Handle is gone.
  }
  // else

  Lock lock(state->m_mutex);

  state->m_wait_in_flight = false;
  if (state->m_cancelled || (async_err_code == boost::asio::error::operation_aborted))
  {
    return;
  }
  // else

  if (async_err_code)
  {
    // The resource is in trouble; the callback's own I/O attempt will surface the actual error to the user.
    const auto sys_err_code = async_err_code;
    FLOW_ERROR_SYS_ERROR_LOG_WARNING();
    FLOW_LOG_WARNING("Readiness wait on [" << state->m_dup_resource << "] reported error; treating as readiness.");
  }

  if (!state->m_armed)
  {
    return; // Suspended while the wait was outstanding.
  }
  // else

  state->m_armed = false; // One-shot.
  state->m_dispatching = true;
  const auto watched = state->m_dup_resource;
  lock.unlock();

  ++s_dispatch_depth;
  try
  {
    state->m_on_ready();
  }
  catch (const std::exception& exc)
  {
    FLOW_LOG_WARNING("Readiness callback for [" << watched << "] threw exception "
                     "[" << exc.what() << "]; discarding it.");
  }
  catch (...)
  {
    FLOW_LOG_WARNING("Readiness callback for [" << watched << "] threw a non-std::exception; discarding it.");
  }
  --s_dispatch_depth;

  lock.lock();
  state->m_dispatching = false;
  state->m_dispatch_done.notify_all();
  if (state->m_armed && (!state->m_cancelled) && (!state->m_wait_in_flight))
  {
    // Callback (or someone, meanwhile) re-armed us.
    start_wait(logger_ptr, state);
  }
} // Asio_readiness_handle::on_wait_done()

} // namespace chan::event
