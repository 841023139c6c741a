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

/// @cond
// -^- Doxygen, please ignore the following.  This is wacky macro magic and not a regular `#pragma once` header.

/* Same approach as the similarly-named file in Flow; see that for docs.
 * Add new components at the end; do not renumber. */

// Rarely used component corresponding to log call sites outside namespace `chan::X`, for all X in ::chan.
FLOW_LOG_CFG_COMPONENT_DEFINE(UNCAT, 0)
// Logging from namespace chan::event.
FLOW_LOG_CFG_COMPONENT_DEFINE(EVENT, 1)
// Logging from namespace chan::channel.
FLOW_LOG_CFG_COMPONENT_DEFINE(CHANNEL, 2)
// Logging from namespace chan::config.
FLOW_LOG_CFG_COMPONENT_DEFINE(CONFIG, 3)
// Logging from namespace chan::util.
FLOW_LOG_CFG_COMPONENT_DEFINE(UTIL, 4)
// Logging from namespace chan::*::test.
FLOW_LOG_CFG_COMPONENT_DEFINE(TEST, 5)

// -v- Doxygen, please stop ignoring.
/// @endcond
