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

#include "chan/event/event_source.hpp"
#include <flow/async/single_thread_task_loop.hpp>
#include <flow/log/log.hpp>
#include <boost/noncopyable.hpp>
#include <atomic>
#include <memory>
#include <vector>

namespace chan::event
{

// Types.

/**
 * Event_source implemented on boost.asio reactors (epoll, in Linux), with a fixed set of event threads.
 *
 * There are two pools of threads: one serving read interest, the other write interest; each thread is a
 * `flow::async::Single_thread_task_loop` with its own `Task_engine`.  register_interest() assigns the new handle to
 * the next thread of the matching pool, round-robin; all callback invocations of that handle then occur on that
 * thread.  Hence at most one callback per handle is in flight at a time, and a channel's read callbacks never
 * compete with its write callbacks for a thread.
 *
 * Each handle watches its own `dup()` of the registered descriptor (see util::Asio_waitable_native_handle), closed
 * when the handle is cancelled.  So a read handle and a write handle on the same socket coexist, and the owner of
 * the original descriptor may close it at any time after cancelling.
 *
 * Normally built via Event_source_factory.
 *
 * ### Lifetime ###
 * Destroying `*this` stops and joins all event threads.  Every handle it produced must be destroyed first (in
 * practice: close and destroy the channels before the event source).
 *
 * ### Thread safety ###
 * register_interest() may be called concurrently from any threads.
 */
class Asio_event_source :
  public Event_source,
  public flow::log::Log_context,
  private boost::noncopyable
{
public:
  // Constructors/destructor.

  /**
   * Starts the event threads.
   *
   * @param logger_ptr
   *        Logger to use for logging subsequently.
   * @param nickname_str
   *        Human-readable name; used in log messages and (truncated) in OS thread names.
   * @param n_read_threads
   *        Size of the read-interest pool.  Must be positive (1 is assumed if 0).
   * @param n_write_threads
   *        Size of the write-interest pool.  Must be positive (1 is assumed if 0).
   */
  explicit Asio_event_source(flow::log::Logger* logger_ptr, util::String_view nickname_str,
                             size_t n_read_threads, size_t n_write_threads);

  /// Stops and joins the event threads.
  ~Asio_event_source() override;

  // Methods.

  /**
   * Implements Event_source API.
   *
   * @param resource
   *        See Event_source.
   * @param direction
   *        See Event_source.
   * @param on_ready
   *        See Event_source.
   * @param err_code
   *        See Event_source.
   * @return See Event_source.
   */
  std::unique_ptr<Readiness_handle> register_interest(util::Native_handle resource, Interest direction,
                                                      util::Task&& on_ready, Error_code* err_code = 0) override;

  /**
   * Nickname given to ctor.
   * @return See above.
   */
  const std::string& nickname() const;

  /**
   * Number of read-interest threads.
   * @return See above.
   */
  size_t read_thread_count() const;

  /**
   * Number of write-interest threads.
   * @return See above.
   */
  size_t write_thread_count() const;

private:
  // Types.

  /// Short-hand for the thread pool type.
  using Loop_pool = std::vector<std::unique_ptr<flow::async::Single_thread_task_loop>>;

  // Methods.

  /**
   * Creates and starts the given number of loops, appending them to `*pool`.
   *
   * @param pool
   *        Pool to fill.
   * @param n_threads
   *        How many.
   * @param role
   *        For thread naming: "r" or "w".
   */
  void start_pool(Loop_pool* pool, size_t n_threads, util::String_view role);

  // Data.

  /// See nickname().
  const std::string m_nickname;

  /// Read-interest pool; never empty.
  Loop_pool m_read_loops;

  /// Write-interest pool; never empty.
  Loop_pool m_write_loops;

  /// Round-robin cursor into #m_read_loops (mod its size).
  std::atomic<size_t> m_next_read_idx;

  /// Round-robin cursor into #m_write_loops (mod its size).
  std::atomic<size_t> m_next_write_idx;
}; // class Asio_event_source

} // namespace chan::event
