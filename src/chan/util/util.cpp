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
#include "chan/util/util_fwd.hpp"
#include "chan/util/native_handle.hpp"
#include "chan/error.hpp"
#include <flow/error/error.hpp>
#include <fcntl.h>
#include <unistd.h>

namespace chan::util
{

// Initializations.

const std::string EMPTY_STRING;

// Implementations.

Native_handle duplicate_native_handle(flow::log::Logger* logger_ptr, Native_handle hndl, Error_code* err_code)
{
  using boost::system::system_category;
  using ::dup;

  Native_handle result;
  if (flow::error::exec_and_throw_on_error
        ([&](Error_code* actual_err_code) -> Native_handle
           { return duplicate_native_handle(logger_ptr, hndl, actual_err_code); },
         &result, err_code, "util::duplicate_native_handle()"))
  {
    return result;
  }
  // else

  FLOW_LOG_SET_CONTEXT(logger_ptr, Log_component::S_UTIL);

  if (hndl.null())
  {
    *err_code = error::Code::S_INVALID_ARGUMENT;
    FLOW_LOG_WARNING("Asked to duplicate a null descriptor; refusing.");
    return result;
  }
  // else

  const auto raw = dup(hndl.m_native_handle);
  if (raw == -1)
  {
    *err_code = Error_code(errno, system_category());
    FLOW_LOG_WARNING("Tried to dup() descriptor [" << hndl << "] but encountered error [" << *err_code << "] "
                     "[" << err_code->message() << "].");
    return result;
  }
  // else

  err_code->clear();
  result.m_native_handle = raw;
  return result;
} // duplicate_native_handle()

void set_non_blocking(flow::log::Logger* logger_ptr, Native_handle hndl, bool non_blocking, Error_code* err_code)
{
  using boost::system::system_category;
  using ::fcntl;

  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code)
           { set_non_blocking(logger_ptr, hndl, non_blocking, actual_err_code); },
         err_code, "util::set_non_blocking()"))
  {
    return;
  }
  // else

  FLOW_LOG_SET_CONTEXT(logger_ptr, Log_component::S_UTIL);

  if (hndl.null())
  {
    *err_code = error::Code::S_INVALID_ARGUMENT;
    FLOW_LOG_WARNING("Asked to change blocking mode of a null descriptor; refusing.");
    return;
  }
  // else

  int flags = fcntl(hndl.m_native_handle, F_GETFL);
  if (flags != -1)
  {
    flags = non_blocking ? (flags | O_NONBLOCK) : (flags & ~O_NONBLOCK);
    if (fcntl(hndl.m_native_handle, F_SETFL, flags) != -1)
    {
      err_code->clear();
      return;
    }
  }
  // else

  *err_code = Error_code(errno, system_category());
  FLOW_LOG_WARNING("Tried to set non-blocking mode [" << non_blocking << "] on descriptor [" << hndl << "] but "
                   "encountered error [" << *err_code << "] [" << err_code->message() << "].");
} // set_non_blocking()

void close_native_handle(flow::log::Logger* logger_ptr, Native_handle* hndl)
{
  using boost::system::system_category;
  using ::close;

  assert(hndl);
  if (hndl->null())
  {
    return;
  }
  // else

  FLOW_LOG_SET_CONTEXT(logger_ptr, Log_component::S_UTIL);

  if (close(hndl->m_native_handle) == -1)
  {
    const Error_code sys_err_code(errno, system_category());
    FLOW_LOG_WARNING("Closing descriptor [" << *hndl << "] reported error; the descriptor is released anyway.");
    FLOW_ERROR_SYS_ERROR_LOG_WARNING();
  }
  else
  {
    FLOW_LOG_TRACE("Closed descriptor [" << *hndl << "].");
  }

  *hndl = Native_handle();
} // close_native_handle()

const uint8_t* blob_data(const Blob_const& blob)
{
  return static_cast<const uint8_t*>(blob.data());
}

uint8_t* blob_data(const Blob_mutable& blob)
{
  return static_cast<uint8_t*>(blob.data());
}

} // namespace chan::util
