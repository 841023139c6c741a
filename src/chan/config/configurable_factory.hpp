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

#include "chan/config/configurable.hpp"
#include <atomic>
#include <memory>

namespace chan::config
{

// Types.

/**
 * A Configurable whose purpose is to build one object of type `Created_obj` from its configuration.  The user
 * set_option()s as desired, then calls create() once.  From that point on the factory is spent: create() and
 * set_option() both fail with error::Code::S_FACTORY_ALREADY_CREATED.  get_option() keeps working, reporting the
 * configuration the object was built with.
 *
 * A subclass implements options(), get_option_impl(), set_config_option_impl() (the pre-create() counterpart of
 * set_option_impl()), and create_impl().
 *
 * ### Thread safety ###
 * Not safe to call set_option() concurrently with anything else.  create() is safe to race against itself: at
 * most one call proceeds to create_impl().
 *
 * @tparam Created_obj
 *         Type of the object built.
 */
template<typename Created_obj>
class Configurable_factory : public Configurable
{
public:
  // Methods.

  /**
   * Builds the object from the current configuration, unless already done once.
   *
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_FACTORY_ALREADY_CREATED; or whatever create_impl() emits.
   * @return The object; or null on error.
   */
  std::unique_ptr<Created_obj> create(Error_code* err_code = 0);

  /**
   * Returns `true` if and only if create() has been invoked (whether or not it succeeded).
   * @return See above.
   */
  bool created() const;

protected:
  // Methods.

  /**
   * Implements Configurable API: fails with error::Code::S_FACTORY_ALREADY_CREATED if created(); else forwards to
   * set_config_option_impl().
   *
   * @param option
   *        See Configurable.
   * @param value
   *        See Configurable.
   * @param err_code
   *        See Configurable.
   */
  void set_option_impl(const Option_base& option, const std::any& value, Error_code* err_code) final;

  /**
   * Applies a new value to a supported option before create().  Semantics otherwise as for
   * Configurable::set_option_impl().
   *
   * @param option
   *        See Configurable.
   * @param value
   *        See Configurable.
   * @param err_code
   *        See Configurable.
   */
  virtual void set_config_option_impl(const Option_base& option, const std::any& value, Error_code* err_code) = 0;

  /**
   * Builds the object.  Invoked at most once.  `err_code` is not null and is clear on input.
   *
   * @param err_code
   *        Set on failure.
   * @return See create().
   */
  virtual std::unique_ptr<Created_obj> create_impl(Error_code* err_code) = 0;

private:
  // Data.

  /// Latch flipped by the first create().
  std::atomic<bool> m_created{false};
}; // class Configurable_factory

// Template implementations.

template<typename Created_obj>
std::unique_ptr<Created_obj> Configurable_factory<Created_obj>::create(Error_code* err_code)
{
  using Ptr = std::unique_ptr<Created_obj>;

  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(Ptr, create, _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  if (m_created.exchange(true))
  {
    *err_code = error::Code::S_FACTORY_ALREADY_CREATED;
    return Ptr();
  }
  // else

  err_code->clear();
  return create_impl(err_code);
}

template<typename Created_obj>
bool Configurable_factory<Created_obj>::created() const
{
  return m_created;
}

template<typename Created_obj>
void Configurable_factory<Created_obj>::set_option_impl(const Option_base& option, const std::any& value,
                                                        Error_code* err_code)
{
  if (m_created)
  {
    *err_code = error::Code::S_FACTORY_ALREADY_CREATED;
    return;
  }
  // else
  set_config_option_impl(option, value, err_code);
}

} // namespace chan::config
