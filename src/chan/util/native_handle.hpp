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

#include <ostream>
#include <flow/common.hpp>

namespace chan::util
{

#ifndef FLOW_OS_LINUX
static_assert(false, "Flow-Chan watches readiness of descriptors via epoll-backed boost.asio reactors; "
                       "build in Linux only.");
#endif

// Types.

/**
 * A monolayer-thin wrapper around a native handle, a/k/a descriptor a/k/a FD, as watched by an event source and
 * wrapped by the channels.  It exists so that the handle (1) has a type more expressive than `int`;
 * (2) prints nicely; and (3) can be "moved from" in the sense of leaving behind a `null()` handle.
 *
 * It is *not* an owning (RAII) type: destroying a Native_handle never closes anything.  Who owns the
 * underlying descriptor is documented at each API that takes or returns one.  See close_native_handle() and
 * duplicate_native_handle() for the few operations we perform on descriptors directly.
 *
 * Native_handle is light-weight: pass it by value.
 */
struct Native_handle
{
  // Types.

  /// The native handle type.  POSIX descriptor.
  using handle_t = int;

  // Constants.

  /// The value for #m_native_handle such that `null() == true`.  No open descriptor ever equals this.
  static const handle_t S_NULL_HANDLE;

  // Data.

  /// The descriptor (possibly #S_NULL_HANDLE).  Assign and access it directly as needed.
  handle_t m_native_handle;

  // Constructors/destructor.

  /**
   * Wraps `native_handle`, by default the null value.  Implicit, so an `int` descriptor can be passed wherever a
   * Native_handle is expected.
   *
   * @param native_handle
   *        Descriptor or #S_NULL_HANDLE.
   */
  Native_handle(handle_t native_handle = S_NULL_HANDLE);

  /**
   * Takes over `src`'s descriptor value, leaving `src` null, so that a stale copy cannot be closed twice by mistake.
   *
   * @param src
   *        Moved-from object.
   */
  Native_handle(Native_handle&& src);

  /// Plain copy; both objects then name the same descriptor.  @param src Copied object.
  Native_handle(const Native_handle& src);

  // Methods.

  /**
   * Same as move ctor but for an existing object.  Self-move leaves `*this` alone.
   *
   * @param src
   *        Moved-from object.
   * @return `*this`.
   */
  Native_handle& operator=(Native_handle&& src);

  /// Plain copy.  @param src Copied object.  @return `*this`.
  Native_handle& operator=(const Native_handle& src);

  /**
   * Whether the wrapped value is #S_NULL_HANDLE.
   * @return See above.
   */
  bool null() const;
}; // struct Native_handle

// Free functions.

/// Equality of descriptor values.  @param val1 Left operand.  @param val2 Right operand.  @return See above.
bool operator==(Native_handle val1, Native_handle val2);

/// `!(val1 == val2)`.  @param val1 Left operand.  @param val2 Right operand.  @return See above.
bool operator!=(Native_handle val1, Native_handle val2);

/**
 * Orders by descriptor value (null first), for sorted containers and deterministic log output.
 *
 * @param val1
 *        Left operand.
 * @param val2
 *        Right operand.
 * @return See above.
 */
bool operator<(Native_handle val1, Native_handle val2);

/**
 * Lets Native_handle key a `boost::unordered_*` container.
 *
 * @param val
 *        Object.
 * @return Hash of the descriptor value.
 */
size_t hash_value(Native_handle val);

/**
 * Prints `fd[N]`, or `fd[none]` if null.
 *
 * @param os
 *        Target stream.
 * @param val
 *        Object.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Native_handle& val);

} // namespace chan::util
