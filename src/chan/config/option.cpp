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
#include "chan/config/option.hpp"

namespace chan::config
{

Option_base::Option_base(util::String_view name) :
  m_name(name)
{
  // That's it.
}

const std::string& Option_base::name() const
{
  return m_name;
}

std::ostream& operator<<(std::ostream& os, const Option_base& val)
{
  return os << "option[" << val.name() << ']';
}

bool operator==(const Option_base& val1, const Option_base& val2)
{
  return val1.name() == val2.name();
}

bool operator!=(const Option_base& val1, const Option_base& val2)
{
  return !(val1 == val2);
}

} // namespace chan::config
