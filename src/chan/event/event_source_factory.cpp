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
#include "chan/event/event_source_factory.hpp"
#include "chan/error.hpp"

namespace chan::event
{

// Static initializations.

const config::Option<std::string> Event_source_factory::S_NAME("NAME");
const config::Option<size_t> Event_source_factory::S_READ_THREADS("READ_THREADS");
const config::Option<size_t> Event_source_factory::S_WRITE_THREADS("WRITE_THREADS");

// Implementations.

Event_source_factory::Event_source_factory(flow::log::Logger* logger_ptr) :
  flow::log::Log_context(logger_ptr, Log_component::S_CONFIG),
  m_name("chan"),
  m_n_read_threads(2),
  m_n_write_threads(1)
{
  // Yep.
}

std::set<std::string> Event_source_factory::options() const
{
  return { S_NAME.name(), S_READ_THREADS.name(), S_WRITE_THREADS.name() };
}

void Event_source_factory::get_option_impl(const config::Option_base& option, std::any* value, Error_code*) const
{
  if (option == S_NAME)
  {
    *value = m_name;
  }
  else if (option == S_READ_THREADS)
  {
    *value = m_n_read_threads;
  }
  else
  {
    assert(option == S_WRITE_THREADS);
    *value = m_n_write_threads;
  }
}

void Event_source_factory::set_config_option_impl(const config::Option_base& option, const std::any& value,
                                                  Error_code* err_code)
{
  using std::any_cast;

  if (option == S_NAME)
  {
    m_name = any_cast<const std::string&>(value);
    FLOW_LOG_TRACE("Event source factory: [" << option << "] = [" << m_name << "].");
    return;
  }
  // else

  const auto n_threads = any_cast<size_t>(value);
  if (n_threads == 0)
  {
    FLOW_LOG_WARNING("Event source factory: [" << option << "] must be at least 1; rejecting 0.");
    *err_code = error::Code::S_OPTION_VALUE_INVALID;
    return;
  }
  // else

  ((option == S_READ_THREADS) ? m_n_read_threads : m_n_write_threads) = n_threads;
  FLOW_LOG_TRACE("Event source factory: [" << option << "] = [" << n_threads << "].");
} // Event_source_factory::set_config_option_impl()

std::unique_ptr<Asio_event_source> Event_source_factory::create_impl(Error_code*)
{
  FLOW_LOG_INFO("Event source factory: Creating event source [" << m_name << "] with "
                "[" << m_n_read_threads << "] read threads, [" << m_n_write_threads << "] write threads.  "
                "Factory is now spent.");
  return std::make_unique<Asio_event_source>(get_logger(), m_name, m_n_read_threads, m_n_write_threads);
}

} // namespace chan::event
