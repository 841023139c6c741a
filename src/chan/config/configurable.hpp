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

#include "chan/config/option.hpp"
#include "chan/error.hpp"
#include <flow/error/error.hpp>
#include <any>
#include <set>

namespace chan::config
{

// Types.

/**
 * Interface (facet) of an object whose behavior can be inspected and adjusted through named, typed options.
 *
 * Users call the get_option() and set_option() templates with an `Option<Value>` key.  These check the key against
 * options() (failing with error::Code::S_OPTION_UNSUPPORTED if absent) and then hand off to the implementation's
 * get_option_impl() / set_option_impl(), which operate on type-erased values and need only worry about the
 * semantics of each supported option; including rejecting values with error::Code::S_OPTION_VALUE_INVALID.
 *
 * An implementation supporting no options at all (e.g., channel::Pipe_channel) returns an empty options() set;
 * its `*_impl()` are then never invoked.
 *
 * ### Thread safety ###
 * Up to the implementation; those in Flow-Chan document it.
 */
class Configurable
{
public:
  // Constructors/destructor.

  /// Boring virtual destructor.
  virtual ~Configurable();

  // Methods.

  /**
   * Returns the current value of the given option.
   *
   * @tparam Value
   *         See Option.
   * @param option
   *        Key.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_OPTION_UNSUPPORTED; or whatever the implementation emits.
   * @return The value; or default-constructed `Value` on error.
   */
  template<typename Value>
  Value get_option(const Option<Value>& option, Error_code* err_code = 0) const;

  /**
   * Changes the value of the given option.
   *
   * @tparam Value
   *         See Option.
   * @param option
   *        Key.
   * @param value
   *        New value.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_OPTION_UNSUPPORTED, error::Code::S_OPTION_VALUE_INVALID; or whatever else the
   *        implementation emits.
   */
  template<typename Value>
  void set_option(const Option<Value>& option, const Value& value, Error_code* err_code = 0);

  /**
   * Names of the options supported by `*this`.  Never changes during the lifetime of `*this`.
   * @return See above.  Possibly empty.
   */
  virtual std::set<std::string> options() const = 0;

  /**
   * Returns `true` if and only if `option.name()` is among options().
   *
   * @param option
   *        Key.
   * @return See above.
   */
  bool supports_option(const Option_base& option) const;

protected:
  // Methods.

  /**
   * Loads the current value of a supported option into `*value`, which on input is empty.  Invoked only for
   * an option among options(); `err_code` is not null and is clear on input.
   *
   * @param option
   *        Key.
   * @param value
   *        The value (type `Option<X>::Value_type` for the actual type of `option`) must be loaded here on success.
   * @param err_code
   *        Set on failure.
   */
  virtual void get_option_impl(const Option_base& option, std::any* value, Error_code* err_code) const = 0;

  /**
   * Applies a new value to a supported option.  Invoked only for an option among options(); `err_code` is not
   * null and is clear on input.
   *
   * @param option
   *        Key.
   * @param value
   *        The value, of type `Option<X>::Value_type` for the actual type of `option`.
   * @param err_code
   *        Set on failure, typically to error::Code::S_OPTION_VALUE_INVALID.
   */
  virtual void set_option_impl(const Option_base& option, const std::any& value, Error_code* err_code) = 0;
}; // class Configurable

// Template implementations.

template<typename Value>
Value Configurable::get_option(const Option<Value>& option, Error_code* err_code) const
{
  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(Value, get_option, option, _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  if (!supports_option(option))
  {
    *err_code = error::Code::S_OPTION_UNSUPPORTED;
    return Value();
  }
  // else

  err_code->clear();
  std::any value;
  get_option_impl(option, &value, err_code);
  if (*err_code)
  {
    return Value();
  }
  // else

  const auto value_ptr = std::any_cast<Value>(&value);
  assert(value_ptr && "get_option_impl() loaded a value of a type different from the option's.  Bug?");
  return *value_ptr;
} // Configurable::get_option()

template<typename Value>
void Configurable::set_option(const Option<Value>& option, const Value& value, Error_code* err_code)
{
  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { set_option(option, value, actual_err_code); },
         err_code, "config::Configurable::set_option()"))
  {
    return;
  }
  // else

  if (!supports_option(option))
  {
    *err_code = error::Code::S_OPTION_UNSUPPORTED;
    return;
  }
  // else

  err_code->clear();
  set_option_impl(option, std::any(value), err_code);
} // Configurable::set_option()

} // namespace chan::config
