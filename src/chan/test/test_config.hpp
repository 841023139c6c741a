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

#pragma once

#include <flow/log/log.hpp>

namespace chan::test
{

/**
 * Process-wide settings for the unit tests.  Loaded once, from the environment, on first access.
 *   - `CHAN_TEST_LOG_SEV`: lowest severity the Test_logger lets through (e.g., `TRACE`); default `WARNING`.
 */
struct Test_config
{
  // Methods.

  /**
   * Returns the singleton.
   *
   * @return See above.
   */
  static const Test_config& get_singleton();

  // Data.

  /// Lowest severity logged by a default-constructed Test_logger.
  flow::log::Sev m_sev;

private:
  // Constructors/destructor.

  /// Loads from environment.
  Test_config();
}; // struct Test_config

} // namespace chan::test
