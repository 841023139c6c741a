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

#include <flow/log/simple_ostream_logger.hpp>
#include <chan/common.hpp>
#include "chan/test/test_config.hpp"

namespace chan::test
{

/**
 * Logger used by every unit test.  Prints through a flow::log::Simple_ostream_logger (INFO and below to `std::cout`,
 * WARNING and above to `std::cerr`) and knows the names of both chan::Log_component and flow::Flow_log_component
 * values.  A test expecting a warning therefore wraps the code under test in check_output() on `std::cerr`.
 */
class Test_logger :
  public flow::log::Logger
{
public:
  /// Sets up the component tables.  @param min_severity Messages less severe than this are dropped.
  Test_logger(const flow::log::Sev& min_severity = Test_config::get_singleton().m_sev) :
    m_config(min_severity),
    m_logger(&m_config)
  {
    // m_logger only keeps the pointer, so filling in m_config afterwards is fine.
    m_config.init_component_to_union_idx_mapping<Log_component>
      (100, flow::log::Config::standard_component_payload_enum_sparse_length<Log_component>());
    m_config.init_component_names<Log_component>(chan::S_CHAN_LOG_COMPONENT_NAME_MAP, false, "chan-");
    m_config.init_component_to_union_idx_mapping<flow::Flow_log_component>
      (200, flow::log::Config::standard_component_payload_enum_sparse_length<flow::Flow_log_component>());
    m_config.init_component_names<flow::Flow_log_component>(flow::S_FLOW_LOG_COMPONENT_NAME_MAP, false, "flow-");
  }

  /// Mutable access to the filter, e.g., to raise verbosity for one test.  @return See above.
  flow::log::Config& get_config()
  {
    return *m_logger.m_config;
  }

  // Logger API: all delegated.

  bool should_log(flow::log::Sev sev, const flow::log::Component& component) const override
  {
    return m_logger.should_log(sev, component);
  }

  bool logs_asynchronously() const override
  {
    return m_logger.logs_asynchronously();
  }

  void do_log(flow::log::Msg_metadata* metadata, flow::util::String_view msg) override
  {
    m_logger.do_log(metadata, msg);
  }

private:
  /// Filter and component names; #m_logger points here.
  flow::log::Config m_config;

  /// Does the printing.
  flow::log::Simple_ostream_logger m_logger;
}; // class Test_logger

} // namespace chan::test
