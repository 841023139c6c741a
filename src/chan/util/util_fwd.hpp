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
#include <flow/async/async_fwd.hpp>
#include <flow/util/util_fwd.hpp>
#include <boost/asio/buffer.hpp>

/**
 * Flow-Chan module providing miscellaneous utilities: the descriptor wrapper util::Native_handle and the few
 * descriptor operations built on it; util::Asio_waitable_native_handle for watching readiness of a descriptor
 * with boost.asio; and short-hands for Flow and boost.asio types used throughout the other modules.
 */
namespace chan::util
{

// Types.

// Find doc headers near the bodies of these compound types.

struct Native_handle;
class Asio_waitable_native_handle;

/// Short-hand for Flow's `String_view`.
using String_view = flow::util::String_view;
/// Short-hand for Flow's `Fine_duration`.
using Fine_duration = flow::Fine_duration;

/// Short-hand for polymorphic function (a-la `std::function<>`) that takes no arguments and returns nothing.
using Task = flow::async::Task;

/// Short-hand for boost.asio execution context; the thing on which boost.asio I/O objects and timers run.
using Task_engine = flow::util::Task_engine;

/**
 * Short-hand for an immutable blob somewhere in memory, stored as exactly a `void const *` and a `size_t`.
 * This is what a channel writes *from*.
 */
using Blob_const = boost::asio::const_buffer;

/// Short-hand for an mutable blob somewhere in memory; what a channel reads *into*.
using Blob_mutable = boost::asio::mutable_buffer;

// Constants.

/// A (default-cted) string.  May be useful for functions returning `const std::string&`.
extern const std::string EMPTY_STRING;

// Free functions.

/**
 * Obtains a new descriptor referring to the same open file description as `hndl` (`dup()`).  The caller owns
 * the result and must eventually close_native_handle() it.
 *
 * The principal use is registering a resource with a boost.asio reactor without that registration interfering
 * with another registration (or with the owner closing the original descriptor).
 *
 * @param logger_ptr
 *        Logger to use for logging (WARNING on error only).
 * @param hndl
 *        Descriptor to duplicate.  Must not be `.null()`.
 * @param err_code
 *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
 *        system errors from `dup()`, or error::Code::S_INVALID_ARGUMENT if `hndl.null()`.
 * @return The new descriptor; or `.null()` on error.
 */
Native_handle duplicate_native_handle(flow::log::Logger* logger_ptr, Native_handle hndl, Error_code* err_code = 0);

/**
 * Places the given descriptor into (or out of) non-blocking mode (`O_NONBLOCK`).
 *
 * @param logger_ptr
 *        Logger to use for logging (WARNING on error only).
 * @param hndl
 *        Descriptor.  Must not be `.null()`.
 * @param non_blocking
 *        `true` to set `O_NONBLOCK`; `false` to clear it.
 * @param err_code
 *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
 *        system errors from `fcntl()`, or error::Code::S_INVALID_ARGUMENT if `hndl.null()`.
 */
void set_non_blocking(flow::log::Logger* logger_ptr, Native_handle hndl, bool non_blocking,
                      Error_code* err_code = 0);

/**
 * Closes `*hndl` and makes it `.null()`; no-op if it is already `.null()`.  A failing `close()` is logged
 * as a WARNING; as with the POSIX call itself the descriptor is released regardless, so there is nothing
 * for the caller to do about it.
 *
 * @param logger_ptr
 *        Logger to use for logging.
 * @param hndl
 *        Pointer to descriptor.  Must not be null.
 */
void close_native_handle(flow::log::Logger* logger_ptr, Native_handle* hndl);

/**
 * Syntactic-sugary helper that returns pointer to first byte in an immutable buffer, as `const uint8_t*`.
 *
 * @param blob
 *        The buffer.
 * @return See above.
 */
const uint8_t* blob_data(const Blob_const& blob);

/**
 * Syntactic-sugary helper that returns pointer to first byte in a mutable buffer, as `uint8_t*`.
 *
 * @param blob
 *        The buffer.
 * @return See above.
 */
uint8_t* blob_data(const Blob_mutable& blob);

} // namespace chan::util
