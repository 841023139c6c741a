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

#include "chan/channel/channel.hpp"
#include "chan/channel/fault_isolating_handler.hpp"
#include "chan/event/event_source.hpp"
#include <flow/log/log.hpp>
#include <flow/util/util.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>
#include <boost/noncopyable.hpp>
#include <atomic>
#include <optional>
#include <vector>

namespace chan::channel
{

// Types.

/**
 * Bidirectional byte-stream channel composed of two independently owned unidirectional halves: a readable
 * resource (*source*; typically a pipe's read end) and a writable resource (*sink*; typically the write end of
 * another pipe, or even of the same pipe).  The user's Io_handler is told when the source is readable and when
 * the sink is writable, each time the corresponding interest is armed via resume_reads() / resume_writes().
 *
 * ### I/O ###
 * read() and write() go straight to the resource: one `read()`/`readv()` or `write()`/`writev()` system call,
 * no buffering.  They never block.  The result is the byte count, where 0 with a falsy #Error_code means
 * would-block (and, for an empty buffer sequence, simply nothing to do).  End-of-stream on read is reported as
 * `boost::asio::error::eof`.  Writing to a pipe whose read end is closed yields `EPIPE`; the process should
 * ignore `SIGPIPE`.
 *
 * ### Readiness ###
 * Construction registers one read handle (source) and one write handle (sink) with the given event::Event_source;
 * both start suspended.  Each firing invokes, via Fault_isolating_handler, Io_handler::on_readable() or
 * Io_handler::on_writable() once and disarms that direction (see event::Readiness_handle).  suspend/resume after
 * close silently do nothing.
 *
 * ### Closing ###
 * close() closes the source first, logging but not reporting any failure; then the sink, reporting any failure.
 * Whether or not that failed, it then removes `*this` from the registry (if any), fires Io_handler::on_closed()
 * (only the first time ever), and cancels both readiness handles.  close() is idempotent and safe to call
 * concurrently from several threads, including from within the handler.  shutdown_reads() and shutdown_writes()
 * close one half only, without notifying on_closed().
 *
 * ### Options ###
 * None: options() is empty and get/set fail with error::Code::S_OPTION_UNSUPPORTED.
 *
 * ### Thread safety ###
 * All methods may be called concurrently.  Each half is protected by its own mutex.  The destructor closes
 * (if not yet closed) and must not race with other calls.
 */
class Pipe_channel :
  public Channel,
  public flow::log::Log_context,
  private boost::noncopyable
{
public:
  // Types.

  /// Short-hand for the user handler type.
  using Handler = Io_handler<Pipe_channel>;

  // Constructors/destructor.

  /**
   * Takes ownership of the given open descriptors and registers them with `event_source`.  On failure
   * the descriptors are closed, `*this` is not open, and Io_handler::on_closed() shall never fire.
   *
   * @param logger_ptr
   *        Logger to use for logging subsequently.
   * @param nickname_str
   *        Human-readable name.
   * @param event_source
   *        Event source; must outlive `*this`.
   * @param source_hndl_moved
   *        Readable descriptor; becomes `.null()`.
   * @param sink_hndl_moved
   *        Writable descriptor; becomes `.null()`.
   * @param handler
   *        The user handler.  May be null (no notifications).
   * @param registry
   *        Registry told of close(); or null.  Must outlive `*this`.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        system errors from setting non-blocking mode or from event::Event_source::register_interest().
   */
  explicit Pipe_channel(flow::log::Logger* logger_ptr, util::String_view nickname_str,
                        event::Event_source* event_source,
                        util::Native_handle&& source_hndl_moved, util::Native_handle&& sink_hndl_moved,
                        std::shared_ptr<Handler> handler,
                        Channel_registry* registry = nullptr, Error_code* err_code = 0);

  /// close()s, if not yet done, logging any error.
  ~Pipe_channel() override;

  // Methods.

  /**
   * Reads into the given buffer.  See class doc header.
   *
   * @param target
   *        Buffer.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        `boost::asio::error::eof`, `boost::asio::error::bad_descriptor` (source shut down or closed); system
   *        errors.
   * @return Bytes read; 0 if would-block or on error.
   */
  size_t read(const util::Blob_mutable& target, Error_code* err_code = 0);

  /**
   * Scatter-reads into the given buffers, in order.  See class doc header.
   *
   * @param targets
   *        Buffers.
   * @param err_code
   *        See other read().
   * @return See other read().
   */
  size_t read(const std::vector<util::Blob_mutable>& targets, Error_code* err_code = 0);

  /**
   * Scatter-reads into `targets[offset]`, ..., `targets[offset + length - 1]`.
   *
   * @param targets
   *        Buffers.
   * @param offset
   *        First buffer index.
   * @param length
   *        Number of buffers.
   * @param err_code
   *        See other read(); plus error::Code::S_INVALID_ARGUMENT if the sub-range exceeds `targets`.
   * @return See other read().
   */
  size_t read(const std::vector<util::Blob_mutable>& targets, size_t offset, size_t length,
              Error_code* err_code = 0);

  /**
   * Writes from the given buffer.  See class doc header.
   *
   * @param src
   *        Buffer.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        `boost::asio::error::bad_descriptor` (sink shut down or closed); system errors including `EPIPE`.
   * @return Bytes written; 0 if would-block or on error.
   */
  size_t write(const util::Blob_const& src, Error_code* err_code = 0);

  /**
   * Gather-writes from the given buffers, in order.
   *
   * @param srcs
   *        Buffers.
   * @param err_code
   *        See other write().
   * @return See other write().
   */
  size_t write(const std::vector<util::Blob_const>& srcs, Error_code* err_code = 0);

  /**
   * Gather-writes from `srcs[offset]`, ..., `srcs[offset + length - 1]`.
   *
   * @param srcs
   *        Buffers.
   * @param offset
   *        First buffer index.
   * @param length
   *        Number of buffers.
   * @param err_code
   *        See other write(); plus error::Code::S_INVALID_ARGUMENT if the sub-range exceeds `srcs`.
   * @return See other write().
   */
  size_t write(const std::vector<util::Blob_const>& srcs, size_t offset, size_t length, Error_code* err_code = 0);

  /// Disarms read interest.
  void suspend_reads();

  /// Disarms write interest.
  void suspend_writes();

  /// Arms read interest: Io_handler::on_readable() once the source is readable.
  void resume_reads();

  /// Arms write interest: Io_handler::on_writable() once the sink is writable.
  void resume_writes();

  /**
   * Closes the source only, and cancels the read handle.  No-op if already closed.
   *
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated: system errors.
   */
  void shutdown_reads(Error_code* err_code = 0);

  /**
   * Closes the sink only, and cancels the write handle.  No-op if already closed.
   *
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated: system errors.
   */
  void shutdown_writes(Error_code* err_code = 0);

  /**
   * Blocks until the source is readable.  A close() from another thread meanwhile does not end the wait; use the
   * timeout overload if one may come.
   *
   * @param err_code
   *        See event::await_readiness().
   * @return `true` unless error.
   */
  bool await_readable(Error_code* err_code = 0);

  /**
   * Blocks until the source is readable or the timeout elapses.
   *
   * @param timeout
   *        Timeout.
   * @param err_code
   *        See event::await_readiness().
   * @return `true` if readable; `false` on timeout or error.
   */
  bool await_readable(util::Fine_duration timeout, Error_code* err_code = 0);

  /**
   * Blocks until the sink is writable.  As with await_readable(), a concurrent close() does not end the wait.
   *
   * @param err_code
   *        See event::await_readiness().
   * @return `true` unless error.
   */
  bool await_writable(Error_code* err_code = 0);

  /**
   * Blocks until the sink is writable or the timeout elapses.
   *
   * @param timeout
   *        Timeout.
   * @param err_code
   *        See event::await_readiness().
   * @return `true` if writable; `false` on timeout or error.
   */
  bool await_writable(util::Fine_duration timeout, Error_code* err_code = 0);

  /**
   * Implements Channel API: `true` if and only if both halves are open.
   * @return See above.
   */
  bool is_open() const override;

  /**
   * Implements Channel API.  See class doc header.
   *
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        system errors from closing the sink.
   */
  void close(Error_code* err_code = 0) override;

  /**
   * Implements Channel API.
   * @return See above.
   */
  const std::string& nickname() const override;

  /**
   * Implements Configurable API.
   * @return Empty set.
   */
  std::set<std::string> options() const override;

  /**
   * The user handler given to ctor.
   * @return See above.
   */
  const std::shared_ptr<Handler>& handler() const;

protected:
  // Methods.

  /**
   * Implements Configurable API.  Never invoked, as options() is empty.
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
   * Implements Configurable API.  Never invoked, as options() is empty.
   *
   * @param option
   *        See Configurable.
   * @param value
   *        See Configurable.
   * @param err_code
   *        See Configurable.
   */
  void set_option_impl(const config::Option_base& option, const std::any& value, Error_code* err_code) override;

private:
  // Types.

  /// Short-hand for mutex type.
  using Mutex = flow::util::Mutex_non_recursive;

  /// Short-hand for lock type.
  using Lock_guard = flow::util::Lock_guard<Mutex>;

  /// Short-hand for one half's resource type.
  using Half = boost::asio::posix::stream_descriptor;

  // Methods.

  /**
   * Body of the read() overloads.
   *
   * @tparam Buffer_sequence
   *         boost.asio mutable buffer sequence.
   * @param targets
   *        Buffers.
   * @param err_code
   *        Not null.
   * @return See read().
   */
  template<typename Buffer_sequence>
  size_t read_impl(const Buffer_sequence& targets, Error_code* err_code);

  /**
   * Body of the write() overloads.
   *
   * @tparam Buffer_sequence
   *         boost.asio const buffer sequence.
   * @param srcs
   *        Buffers.
   * @param err_code
   *        Not null.
   * @return See write().
   */
  template<typename Buffer_sequence>
  size_t write_impl(const Buffer_sequence& srcs, Error_code* err_code);

  /**
   * Closes the given half if open; helper of close() and `shutdown_*()`.
   *
   * @param half
   *        The half.
   * @param mutex
   *        Its mutex.
   * @param what
   *        For logging.
   * @return Error from `close()`; success if closed fine or was not open.
   */
  Error_code close_half(Half* half, Mutex* mutex, util::String_view what);

  /**
   * The body of the `await_*()` methods: event::await_readiness() on a `dup()` of the half's descriptor, taken
   * under its mutex.  A concurrent close() thus cannot leave the wait watching a recycled descriptor number; it
   * does not end the wait either.
   *
   * @param half
   *        The half.
   * @param mutex
   *        Its mutex.
   * @param snd_else_rcv
   *        See event::await_readiness().
   * @param timeout_or_none
   *        See event::await_readiness().
   * @param err_code
   *        See event::await_readiness(); plus system errors from `dup()`.  A closed half yields
   *        error::Code::S_INVALID_ARGUMENT.
   * @return See event::await_readiness().
   */
  bool await_half(Half* half, Mutex* mutex, bool snd_else_rcv, std::optional<util::Fine_duration> timeout_or_none,
                  Error_code* err_code);

  /// Removes `*this` from #m_registry (if any), logging any exception.
  void deregister();

  // Data.

  /// See nickname().
  const std::string m_nickname;

  /// Invokes the user handler.
  Fault_isolating_handler<Pipe_channel> m_dispatch;

  /// See ctor.
  Channel_registry* const m_registry;

  /// Execution context for #m_source and #m_sink.  Never `run()`: we only use them for non-blocking I/O.
  flow::util::Task_engine m_nb_task_engine;

  /// Protects #m_source.
  mutable Mutex m_source_mutex;

  /// The readable half.
  Half m_source;

  /// Protects #m_sink.
  mutable Mutex m_sink_mutex;

  /// The writable half.
  Half m_sink;

  /// Read-interest handle; null if ctor failed.
  std::unique_ptr<event::Readiness_handle> m_read_hndl;

  /// Write-interest handle; null if ctor failed.
  std::unique_ptr<event::Readiness_handle> m_write_hndl;

  /// Latch: `true` once Io_handler::on_closed() has been (or is being) invoked, or can no longer be.
  std::atomic<bool> m_closed_notified;
}; // class Pipe_channel

} // namespace chan::channel
