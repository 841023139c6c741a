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
#include "chan/util/asio_waitable_native_hndl.hpp"
#include <flow/log/log.hpp>
#include <flow/util/util.hpp>
#include <boost/thread/condition_variable.hpp>
#include <memory>

namespace chan::event
{

// Types.

/**
 * The Readiness_handle produced by Asio_event_source.  Not part of the public API: users see it only as
 * a Readiness_handle.
 *
 * ### Internals ###
 * All mutable state lives in a `shared_ptr<State>`.  Each `async_wait()` completion handler captures only a
 * `weak_ptr` to it; so the handle (and thus State) may be destroyed while a wait is outstanding, and the handler
 * then does nothing.  State::m_mutex protects everything in State, including every touch of State::m_waitable
 * (boost.asio I/O objects are not safe for concurrent use).
 *
 * At most one `async_wait()` is outstanding at any time (State::m_wait_in_flight).  A wait is started when the
 * handle becomes armed, unless a wait is outstanding already or the callback is executing; in the latter case the
 * post-callback bookkeeping starts it if the callback re-armed.  A completed wait with the handle still armed
 * disarms it and invokes the callback outside the lock.
 */
class Asio_readiness_handle :
  public Readiness_handle,
  public flow::log::Log_context
{
public:
  // Constructors/destructor.

  /**
   * Registers.  Takes ownership of `dup_resource` (closing it on cancel_key()).
   *
   * @param logger_ptr
   *        Logger to use for logging subsequently.
   * @param task_engine
   *        Engine of the event thread that shall serve this handle.
   * @param resource
   *        The registered descriptor (as given by the user).
   * @param dup_resource
   *        A `dup()` of `resource` to actually watch.
   * @param direction
   *        Interest::S_READ or Interest::S_WRITE.
   * @param on_ready
   *        Callback.
   * @param err_code
   *        Set to failure if reactor registration failed; the handle is then already cancelled.
   */
  explicit Asio_readiness_handle(flow::log::Logger* logger_ptr, flow::util::Task_engine* task_engine,
                                 util::Native_handle resource, util::Native_handle dup_resource,
                                 Interest direction, util::Task&& on_ready, Error_code* err_code);

  /// Cancels.
  ~Asio_readiness_handle() override;

  // Methods.

  /**
   * Implements Readiness_handle API.
   * @return See Readiness_handle.
   */
  Handle_op_result suspend() override;

  /**
   * Implements Readiness_handle API.
   * @param interest
   *        See Readiness_handle.
   * @return See Readiness_handle.
   */
  Handle_op_result resume(Interest interest) override;

  /// Implements Readiness_handle API.
  void cancel_key() override;

  /**
   * Implements Readiness_handle API.
   * @return See Readiness_handle.
   */
  bool cancelled() const override;

  /**
   * Implements Readiness_handle API.
   * @return See Readiness_handle.
   */
  Interest interest() const override;

  /**
   * Implements Readiness_handle API.
   * @return See Readiness_handle.
   */
  Interest direction() const override;

  /**
   * Implements Readiness_handle API.
   * @return See Readiness_handle.
   */
  util::Native_handle resource() const override;

private:
  // Types.

  /// Short-hand for mutex type.
  using Mutex = flow::util::Mutex_non_recursive;

  /// Short-hand for lock type usable with a condition variable.
  using Lock = boost::unique_lock<Mutex>;

  /// See class doc header.
  struct State
  {
    // Constructors/destructor.

    /**
     * Loads fields.
     *
     * @param task_engine
     *        See Asio_readiness_handle ctor.
     * @param direction
     *        See Asio_readiness_handle ctor.
     * @param on_ready
     *        See Asio_readiness_handle ctor.
     */
    explicit State(flow::util::Task_engine* task_engine, Interest direction, util::Task&& on_ready);

    // Data.

    /// Protects everything else here except the `const` members.
    mutable Mutex m_mutex;

    /// Signalled when #m_dispatching becomes `false`.
    boost::condition_variable m_dispatch_done;

    /// Registered direction.
    const Interest m_direction;

    /// The callback.  Invoked outside #m_mutex.
    const util::Task m_on_ready;

    /// Watcher of #m_dup_resource.
    util::Asio_waitable_native_handle m_waitable;

    /// The descriptor we watch and own.  `.null()` once closed.
    util::Native_handle m_dup_resource;

    /// Armed?
    bool m_armed;

    /// Is an `async_wait()` outstanding?
    bool m_wait_in_flight;

    /// Is #m_on_ready executing?
    bool m_dispatching;

    /// cancel_key() called?
    bool m_cancelled;
  }; // struct State

  // Methods.

  /**
   * Starts an `async_wait()`.  Pre-condition: #m_state mutex locked; armed; no wait outstanding; not cancelled.
   *
   * @param logger_ptr
   *        Logger.
   * @param state
   *        The state.
   */
  static void start_wait(flow::log::Logger* logger_ptr, const std::shared_ptr<State>& state);

  /**
   * `async_wait()` completion handler.
   *
   * @param logger_ptr
   *        Logger.
   * @param state_observer
   *        The state, if still alive.
   * @param async_err_code
   *        Result of the wait.
   */
  static void on_wait_done(flow::log::Logger* logger_ptr, const std::weak_ptr<State>& state_observer,
                           const Error_code& async_err_code);

  // Data.

  /**
   * Number of readiness callbacks (of any Asio_readiness_handle) currently executing on this thread.  Nonzero means
   * cancel_key() must not wait: see Readiness_handle::cancel_key().
   */
  static thread_local unsigned int s_dispatch_depth;

  /// The registered descriptor.
  const util::Native_handle m_resource;

  /// See class doc header.
  const std::shared_ptr<State> m_state;
}; // class Asio_readiness_handle

} // namespace chan::event
