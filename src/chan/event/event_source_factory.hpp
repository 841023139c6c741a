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

#include "chan/event/asio_event_source.hpp"
#include "chan/config/configurable_factory.hpp"
#include <flow/log/log.hpp>

namespace chan::event
{

// Types.

/**
 * Builds an Asio_event_source from options set through the config::Configurable facet.
 *
 * Supported options:
 *   - #S_NAME: nickname of the event source; default `"chan"`.
 *   - #S_READ_THREADS: size of the read-interest thread pool; default 2; 0 is rejected
 *     (error::Code::S_OPTION_VALUE_INVALID).
 *   - #S_WRITE_THREADS: size of the write-interest thread pool; default 1; 0 is rejected likewise.
 *
 * Example:
 *
 *   ~~~
 *   Event_source_factory factory(get_logger());
 *   factory.set_option(Event_source_factory::S_READ_THREADS, size_t(4));
 *   auto event_source = factory.create(); // Throws if already created.
 *   ~~~
 */
class Event_source_factory :
  public config::Configurable_factory<Asio_event_source>,
  public flow::log::Log_context
{
public:
  // Constants.

  /// Option: nickname.
  static const config::Option<std::string> S_NAME;

  /// Option: number of read-interest event threads.
  static const config::Option<size_t> S_READ_THREADS;

  /// Option: number of write-interest event threads.
  static const config::Option<size_t> S_WRITE_THREADS;

  // Constructors/destructor.

  /**
   * Constructs factory with default configuration.
   *
   * @param logger_ptr
   *        Logger to use for logging subsequently; also passed to the created event source.
   */
  explicit Event_source_factory(flow::log::Logger* logger_ptr);

  // Methods.

  /**
   * Implements Configurable API.
   * @return #S_NAME, #S_READ_THREADS and #S_WRITE_THREADS names.
   */
  std::set<std::string> options() const override;

protected:
  // Methods.

  /**
   * Implements Configurable API.
   *
   * @param option
   *        See Configurable.
   * @param value
   *        See Configurable.
   * @param err_code
   *        See Configurable.
   */
  void get_option_impl(const config::Option_base& option, std::any* value, Error_code* err_code) const override;

  /**
   * Implements Configurable_factory API.
   *
   * @param option
   *        See Configurable_factory.
   * @param value
   *        See Configurable_factory.
   * @param err_code
   *        See Configurable_factory.
   */
  void set_config_option_impl(const config::Option_base& option, const std::any& value,
                              Error_code* err_code) override;

  /**
   * Implements Configurable_factory API.
   *
   * @param err_code
   *        See Configurable_factory.
   * @return See Configurable_factory.
   */
  std::unique_ptr<Asio_event_source> create_impl(Error_code* err_code) override;

private:
  // Data.

  /// Value of #S_NAME.
  std::string m_name;

  /// Value of #S_READ_THREADS.
  size_t m_n_read_threads;

  /// Value of #S_WRITE_THREADS.
  size_t m_n_write_threads;
}; // class Event_source_factory

} // namespace chan::event
