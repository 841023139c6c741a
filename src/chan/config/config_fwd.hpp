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
#include "chan/util/util_fwd.hpp"

/**
 * Flow-Chan module providing the *Configurable facet*: named, typed options (config::Option) that an object may
 * support for get/set (config::Configurable), and factories configured through the same facet
 * (config::Configurable_factory).
 *
 * Any object that is configurable advertises the (possibly empty) set of option names it supports via
 * Configurable::options().  Asking for an option not in that set fails with error::Code::S_OPTION_UNSUPPORTED;
 * supplying a value the object rejects fails with error::Code::S_OPTION_VALUE_INVALID.  The two are
 * distinct by design of the API, so that a caller can probe support before choosing a value.
 */
namespace chan::config
{

// Types.

// Find doc headers near the bodies of these compound types.

class Option_base;
template<typename Value>
class Option;
class Configurable;
template<typename Created_obj>
class Configurable_factory;

// Free functions.

/**
 * Prints string representation of the given option key to the given `ostream`.
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Option_base& val);

/**
 * Returns `true` if and only if the two keys have the same name.
 *
 * @param val1
 *        Object.
 * @param val2
 *        Object.
 * @return See above.
 */
bool operator==(const Option_base& val1, const Option_base& val2);

/**
 * Negation of similar `==`.
 *
 * @param val1
 *        Object.
 * @param val2
 *        Object.
 * @return See above.
 */
bool operator!=(const Option_base& val1, const Option_base& val2);

} // namespace chan::config
