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

#include "chan/config/config_fwd.hpp"
#include <string>

namespace chan::config
{

// Types.

/**
 * The untyped part of an option key: just its name.  Configurable implementations dispatch on this; users deal
 * in the typed Option.
 */
class Option_base
{
public:
  // Constructors/destructor.

  /**
   * Constructs the key.
   *
   * @param name
   *        Name; must be unique among the options of any one Configurable.
   */
  explicit Option_base(util::String_view name);

  // Methods.

  /**
   * Name given to ctor.
   * @return See above.
   */
  const std::string& name() const;

private:
  // Data.

  /// See name().
  std::string m_name;
}; // class Option_base

/**
 * A named option key carrying, at compile time, the type of its value.  A Configurable's get and set of a given
 * `Option<Value>` can only produce and accept `Value`; so a type mismatch between key and value does not compile.
 *
 * Keys are typically `static const` members of the class that supports them, e.g.,
 * event::Event_source_factory::S_READ_THREADS.
 *
 * @tparam Value
 *         Value type.  Must be copyable and default-constructible.
 */
template<typename Value>
class Option : public Option_base
{
public:
  // Types.

  /// Short-hand for template parameter.
  using Value_type = Value;

  // Constructors/destructor.

  /**
   * Constructs the key.
   *
   * @param name
   *        See Option_base ctor.
   */
  explicit Option(util::String_view name);
}; // class Option

// Template implementations.

template<typename Value>
Option<Value>::Option(util::String_view name) :
  Option_base(name)
{
  // Yep.
}

} // namespace chan::config
