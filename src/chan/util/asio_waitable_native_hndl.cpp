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
#include "chan/util/asio_waitable_native_hndl.hpp"
#include "chan/common.hpp"
#include <flow/error/error.hpp>

namespace chan::util
{

// Implementations.

Asio_waitable_native_handle::Asio_waitable_native_handle(const Base::executor_type& ex, Native_handle hndl) :
  Base(ex, hndl.m_native_handle)
{
  // Base ctor throws on a bad descriptor (epoll_ctl(ADD) fails); .null() would be one of those.
  assert(!hndl.null());
}

Asio_waitable_native_handle::Asio_waitable_native_handle(const Base::executor_type& ex) :
  Base(ex)
{
  // Yep.
}

Asio_waitable_native_handle::Asio_waitable_native_handle(Asio_waitable_native_handle&& src) = default;

Asio_waitable_native_handle& Asio_waitable_native_handle::operator=(Asio_waitable_native_handle&& src) = default;

Asio_waitable_native_handle::~Asio_waitable_native_handle()
{
  // We are for watching only; the descriptor is not ours to close.  Base dtor then sees a not-open descriptor.
  if (is_open())
  {
    release();
  }
}

Native_handle Asio_waitable_native_handle::native_handle()
{
  return Base::is_open() ? Native_handle(Base::native_handle()) : Native_handle();
}

void Asio_waitable_native_handle::assign(Native_handle hndl, Error_code* err_code)
{
  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { assign(hndl, actual_err_code); },
         err_code, "util::Asio_waitable_native_handle::assign()"))
  {
    return;
  }
  // else

  assert(!hndl.null());

  if (is_open())
  {
    release();
  }

  Base::assign(hndl.m_native_handle, *err_code);
}

} // namespace chan::util
