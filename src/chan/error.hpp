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

/**
 * Namespace containing the Flow-Chan error codes: the boost.system-style enumeration error::Code plus the machinery
 * that lets those values be used as #Error_code.  Errors from the operating system (and boost.asio) are
 * reported as-is with their own categories; error::Code covers what the library itself decides.
 */
namespace chan::error
{

// Types.

/// Numeric value of the lowest Code.
constexpr int S_CODE_LOWEST_INT_VALUE = 1;

/**
 * All possible errors returned (via #Error_code arguments) by `chan::` functions/methods *outside of*
 * system-triggered errors such as `boost::asio::error::eof`.
 *
 * ### Symbolic I/O ###
 * `ostream << Code::S_X` prints `"X"`, e.g., `"OPTION_UNSUPPORTED"`; `istream >>` accepts the same (case-insensitive)
 * or the integer value.
 */
enum class Code
{
  /// The channel or object does not support the requested operation at all (e.g., multicast join).
  S_OPERATION_NOT_SUPPORTED = S_CODE_LOWEST_INT_VALUE,

  /// Configurable object does not support the named option.
  S_OPTION_UNSUPPORTED,

  /// Configurable object supports the named option but rejects the supplied value.
  S_OPTION_VALUE_INVALID,

  /// Outgoing message would exceed the largest message that can be staged for a single send; nothing was sent.
  S_MESSAGE_SIZE_EXCEEDS_LIMIT,

  /// User called an API with 1 or more arguments against the API spec.
  S_INVALID_ARGUMENT,

  /// Factory has already created its object; it can neither be reconfigured nor create another.
  S_FACTORY_ALREADY_CREATED,

  /// SENTINEL: Not an error.  This Code must never be issued by an error/success-emitting API; I/O use only.
  S_END_SENTINEL
}; // enum class Code

// Free functions.

/**
 * Wraps a Code in an #Error_code of the `"chan"` category.  boost.system finds this by argument-dependent lookup,
 * which is what makes `Error_code ec = Code::S_X;` compile.
 *
 * @param err_code
 *        Code to wrap.
 * @return See above.
 */
Error_code make_error_code(Code err_code);

/**
 * Reads a Code written by `operator<<()`: the symbol without its `S_` prefix (any case) or the numeric value.
 * Unrecognized input yields Code::S_END_SENTINEL.
 *
 * @param is
 *        Source stream.
 * @param val
 *        Result.
 * @return `is`.
 */
std::istream& operator>>(std::istream& is, Code& val);

/**
 * Serializes a Code to a standard output stream.  Prints `"X"` for `Code::S_X`.
 *
 * @param os
 *        Stream to which to serialize.
 * @param val
 *        Value to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, Code val);

} // namespace chan::error

/// Opts error::Code into boost.system.
namespace boost::system
{

// Types.

/// Marks chan::error::Code as an enum that converts implicitly to #Error_code.
template<>
struct is_error_code_enum<::chan::error::Code>
{
  /// Yes.
  static const bool value = true;
};

} // namespace boost::system
