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
#include "chan/event/asio_event_source.hpp"
#include "chan/event/detail/asio_readiness_handle.hpp"
#include "chan/error.hpp"
#include <flow/error/error.hpp>

namespace chan::event
{

// Implementations.

Asio_event_source::Asio_event_source(flow::log::Logger* logger_ptr, util::String_view nickname_str,
                                     size_t n_read_threads, size_t n_write_threads) :
  flow::log::Log_context(logger_ptr, Log_component::S_EVENT),
  m_nickname(nickname_str),
  m_next_read_idx(0),
  m_next_write_idx(0)
{
  start_pool(&m_read_loops, (n_read_threads == 0) ? 1 : n_read_threads, "r");
  start_pool(&m_write_loops, (n_write_threads == 0) ? 1 : n_write_threads, "w");

  FLOW_LOG_INFO("Event source [" << *this << "]: Started [" << m_read_loops.size() << "] read-interest and "
                "[" << m_write_loops.size() << "] write-interest event threads.");
}

Asio_event_source::~Asio_event_source()
{
  FLOW_LOG_INFO("Event source [" << *this << "]: Shutting down; stopping event threads.");

  for (auto& loop : m_read_loops)
  {
    loop->stop();
  }
  for (auto& loop : m_write_loops)
  {
    loop->stop();
  }
}

void Asio_event_source::start_pool(Loop_pool* pool, size_t n_threads, util::String_view role)
{
  using flow::async::Single_thread_task_loop;
  using flow::async::reset_this_thread_pinning;
  using flow::util::ostream_op_string;
  using std::make_unique;

  pool->reserve(n_threads);
  for (size_t idx = 0; idx != n_threads; ++idx)
  {
    // (Linux) OS thread name truncates to 15 chars; put the distinguishing part first.
    auto& loop = pool->emplace_back(make_unique<Single_thread_task_loop>
                                      (get_logger(), ostream_op_string(role, idx, '-', m_nickname)));
    loop->start(reset_this_thread_pinning);
  }
}

std::unique_ptr<Readiness_handle>
  Asio_event_source::register_interest(util::Native_handle resource, Interest direction,
                                       util::Task&& on_ready, Error_code* err_code)
{
  using Ptr = std::unique_ptr<Readiness_handle>;

  Ptr result;
  if (flow::error::exec_and_throw_on_error
        ([&](Error_code* actual_err_code) -> Ptr
           { return register_interest(resource, direction, std::move(on_ready), actual_err_code); },
         &result, err_code, "event::Asio_event_source::register_interest()"))
  {
    return result;
  }
  // else

  if (resource.null() || ((direction != Interest::S_READ) && (direction != Interest::S_WRITE)))
  {
    FLOW_LOG_WARNING("Event source [" << *this << "]: Cannot register resource [" << resource << "] for "
                     "direction [" << direction << "]: need a non-null descriptor and exactly one direction.");
    *err_code = error::Code::S_INVALID_ARGUMENT;
    return result;
  }
  // else

  const auto dup_resource = util::duplicate_native_handle(get_logger(), resource, err_code);
  if (*err_code)
  {
    return result;
  }
  // else

  const bool rd_else_wr = direction == Interest::S_READ;
  auto& pool = rd_else_wr ? m_read_loops : m_write_loops;
  auto& next_idx = rd_else_wr ? m_next_read_idx : m_next_write_idx;
  auto& loop = *pool[next_idx++ % pool.size()];

  result = std::make_unique<Asio_readiness_handle>(get_logger(), loop.task_engine().get(), resource, dup_resource,
                                                   direction, std::move(on_ready), err_code);
  if (*err_code)
  {
    result.reset(); // Handle closed dup_resource.
    return result;
  }
  // else

  FLOW_LOG_TRACE("Event source [" << *this << "]: Registered resource [" << resource << "] for [" << direction << "] "
                 "on thread [" << loop.nickname() << "].");
  return result;
} // Asio_event_source::register_interest()

const std::string& Asio_event_source::nickname() const
{
  return m_nickname;
}

size_t Asio_event_source::read_thread_count() const
{
  return m_read_loops.size();
}

size_t Asio_event_source::write_thread_count() const
{
  return m_write_loops.size();
}

std::ostream& operator<<(std::ostream& os, const Asio_event_source& val)
{
  return os << '[' << val.nickname() << "]@" << static_cast<const void*>(&val);
}

} // namespace chan::event
