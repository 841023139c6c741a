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

#include "chan/util/native_handle.hpp"
#include <boost/asio.hpp>

namespace chan::util
{

// Types.

/**
 * Useful if using boost.asio to *watch* a descriptor for readability or writability without reading or writing
 * through boost.asio: a boost.asio I/O object that stores a Native_handle and exposes `async_wait()`, and
 * that does *not* close the descriptor when destroyed.
 *
 * event::Asio_event_source uses one per live event::Readiness_handle.  The handle it loads is a duplicate (see
 * duplicate_native_handle()) of the channel's own descriptor, so that (1) a read-registration and a
 * write-registration of the same resource on the same `Task_engine` do not collide (epoll would report `EEXIST`);
 * and (2) the registrant closing its original descriptor cannot confuse the reactor.  Whoever loads a handle
 * remains responsible for closing it, after this object release()s it or is destroyed.
 *
 * ### Use ###
 *   - Construct from an executor (or execution context) and a Native_handle; or without a handle followed by
 *     assign().
 *   - `async_wait(Base::wait_read, F)` or `async_wait(Base::wait_write, F)`; `F(const Error_code&)` is invoked,
 *     from a thread running the `Task_engine`, once the descriptor is ready in that direction or once the
 *     wait is aborted (`boost::asio::error::operation_aborted`) via cancel().  release() without cancel() drops a
 *     pending `F` without calling it.
 */
class Asio_waitable_native_handle : protected boost::asio::posix::descriptor
{
public:
  // Types.

  /// Short-hand for our base type; can be used for, e.g., `Base::wait_write` and `Base::wait_read`.
  using Base = boost::asio::posix::descriptor;

  // Constructors/destructor.

  /**
   * Registers `hndl` with the reactor of `ex`'s `Task_engine`.  Throws on failure, as the boost.asio base does.
   *
   * @param ex
   *        Executor of the engine that will run the wait handlers.
   * @param hndl
   *        Open descriptor; must not be `.null()`.
   */
  explicit Asio_waitable_native_handle(const Base::executor_type& ex, Native_handle hndl);

  /// Empty; see assign().  @param ex See other ctor.
  explicit Asio_waitable_native_handle(const Base::executor_type& ex);

  /// Takes over `src`'s descriptor, if any.  @param src Moved-from object.
  Asio_waitable_native_handle(Asio_waitable_native_handle&& src);

  /// release()s (does *not* close) the stored descriptor if any; pending waits are discarded, so cancel() first.
  ~Asio_waitable_native_handle();

  // Methods.

  /// Takes over `src`'s descriptor, if any.  @param src Moved-from object.  @return `*this`.
  Asio_waitable_native_handle& operator=(Asio_waitable_native_handle&& src);

  /**
   * The currently loaded descriptor, or `.null()` if there is none.
   *
   * @return See above.
   */
  Native_handle native_handle();

  /**
   * Loads `hndl` (non-`.null()`), release()ing the current descriptor first if any.
   *
   * @param hndl
   *        Descriptor to watch.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        system errors from the reactor registration (e.g., bad descriptor).
   */
  void assign(Native_handle hndl, Error_code* err_code = 0);

  // The following come straight from `posix::basic_descriptor`; see boost.asio docs.

  using Base::async_wait;
  using Base::release;
  using Base::is_open;
  using Base::cancel;
}; // class Asio_waitable_native_handle

} // namespace chan::util
