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
#include "chan/util/default_init_allocator.hpp"
#include <flow/log/log.hpp>
#include <flow/util/util.hpp>
#include <boost/asio/ip/udp.hpp>
#include <boost/noncopyable.hpp>
#include <atomic>
#include <optional>
#include <vector>

namespace chan::channel
{

// Types.

/// What Udp_socket_channel::receive() reports about one received datagram.
struct Multipoint_read_result
{
  // Types.

  /// Short-hand for address type.
  using Endpoint = boost::asio::ip::udp::endpoint;

  // Data.

  /// Number of bytes placed into the target buffer (the datagram is truncated to the buffer's size).
  size_t m_n_rcvd;

  /// Sender.
  Endpoint m_source;

  /// Local destination address, if known.  Never known in the present implementation.
  std::optional<Endpoint> m_destination;
}; // struct Multipoint_read_result

/**
 * Connectionless datagram channel over a UDP socket, with the peer given per call: receive() reports the
 * sender of each datagram; send() takes the target.  One read handle and one write handle are registered on the
 * same socket (the event source watches a `dup()` for each, so they do not interfere).
 *
 * receive() and send() never block: no datagram pending makes receive() return an empty result; a full send
 * buffer makes send() return `false`.  Gather-send copies the buffers into one contiguous staging buffer and
 * performs a single send, so the datagram on the wire is their concatenation; its total size is checked against
 * #S_MAX_STAGED_SIZE before anything is copied.
 *
 * Byte counts go to the Channel_stats_sink, if one is given: received bytes to Channel_stats_sink::bytes_read(),
 * sent bytes to Channel_stats_sink::bytes_written().  close() unregisters it.
 *
 * Not supported (error::Code::S_OPERATION_NOT_SUPPORTED): multicast join(), shutdown_reads(), shutdown_writes().
 * No options are supported either.
 *
 * ### Closing ###
 * The first close() closes the socket; then, even if that failed, removes `*this` from the registry, cancels both
 * handles, fires Io_handler::on_closed(), and unregisters the stats sink.  Later close() calls do nothing.
 *
 * ### Thread safety ###
 * All methods may be called concurrently, except that the destructor must not race with anything.
 */
class Udp_socket_channel :
  public Channel,
  public flow::log::Log_context,
  private boost::noncopyable
{
public:
  // Types.

  /// Short-hand for the user handler type.
  using Handler = Io_handler<Udp_socket_channel>;

  /// Short-hand for address type.
  using Endpoint = Multipoint_read_result::Endpoint;

  /// Short-hand for IP address type.
  using Address = boost::asio::ip::address;

  /// Short-hand for receive() result.
  using Read_result_or_none = std::optional<Multipoint_read_result>;

  // Constants.

  /// Largest total gather-send size: the largest message we are prepared to stage in one buffer.
  static const size_t S_MAX_STAGED_SIZE;

  // Constructors/destructor.

  /**
   * Takes ownership of the given open UDP socket and registers it with `event_source`.  On failure the socket is
   * closed, `*this` is not open, and Io_handler::on_closed() shall never fire.
   *
   * @param logger_ptr
   *        Logger to use for logging subsequently.
   * @param nickname_str
   *        Human-readable name.
   * @param event_source
   *        Event source; must outlive `*this`.
   * @param socket_hndl_moved
   *        Open UDP socket descriptor (IPv4 or IPv6); becomes `.null()`.
   * @param handler
   *        The user handler.  May be null (no notifications).
   * @param registry
   *        Registry told of close(); or null.  Must outlive `*this`.
   * @param stats
   *        Byte-count sink; or null.  Must outlive `*this`.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        system errors.
   */
  explicit Udp_socket_channel(flow::log::Logger* logger_ptr, util::String_view nickname_str,
                              event::Event_source* event_source, util::Native_handle&& socket_hndl_moved,
                              std::shared_ptr<Handler> handler, Channel_registry* registry = nullptr,
                              Channel_stats_sink* stats = nullptr, Error_code* err_code = 0);

  /**
   * Opens a UDP socket bound to `local_endpoint` and proceeds as the other ctor.
   *
   * @param logger_ptr
   *        See other ctor.
   * @param nickname_str
   *        See other ctor.
   * @param event_source
   *        See other ctor.
   * @param local_endpoint
   *        Address to bind; port 0 picks an ephemeral port (see local_address()).
   * @param handler
   *        See other ctor.
   * @param registry
   *        See other ctor.
   * @param stats
   *        See other ctor.
   * @param err_code
   *        See other ctor.
   */
  explicit Udp_socket_channel(flow::log::Logger* logger_ptr, util::String_view nickname_str,
                              event::Event_source* event_source, const Endpoint& local_endpoint,
                              std::shared_ptr<Handler> handler, Channel_registry* registry = nullptr,
                              Channel_stats_sink* stats = nullptr, Error_code* err_code = 0);

  /// close()s, if not yet done, logging any error.
  ~Udp_socket_channel() override;

  // Methods.

  /**
   * Receives one datagram, if one is pending.
   *
   * @param target
   *        Buffer.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        `boost::asio::error::bad_descriptor` (closed); system errors.
   * @return Empty if no datagram was pending or on error; else see Multipoint_read_result.
   */
  Read_result_or_none receive(const util::Blob_mutable& target, Error_code* err_code = 0);

  /**
   * Sends one datagram.
   *
   * @param target
   *        Destination.
   * @param src
   *        Payload.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        `boost::asio::error::bad_descriptor` (closed); system errors (e.g., message too long).
   * @return `true` if sent; `false` if zero bytes went out (would-block) or on error.
   */
  bool send(const Endpoint& target, const util::Blob_const& src, Error_code* err_code = 0);

  /**
   * Sends one datagram made of the concatenation of the given buffers.
   *
   * @param target
   *        Destination.
   * @param srcs
   *        Payload pieces.
   * @param err_code
   *        See other send(); plus error::Code::S_MESSAGE_SIZE_EXCEEDS_LIMIT.
   * @return See other send().
   */
  bool send(const Endpoint& target, const std::vector<util::Blob_const>& srcs, Error_code* err_code = 0);

  /**
   * Sends one datagram made of the concatenation of `srcs[offset]`, ..., `srcs[offset + length - 1]`.
   *
   * @param target
   *        Destination.
   * @param srcs
   *        Payload pieces.
   * @param offset
   *        First buffer index.
   * @param length
   *        Number of buffers.
   * @param err_code
   *        See other send(); plus error::Code::S_INVALID_ARGUMENT if the sub-range exceeds `srcs`, and
   *        error::Code::S_MESSAGE_SIZE_EXCEEDS_LIMIT if the total exceeds #S_MAX_STAGED_SIZE (nothing is
   *        copied or sent).
   * @return See other send().
   */
  bool send(const Endpoint& target, const std::vector<util::Blob_const>& srcs, size_t offset, size_t length,
            Error_code* err_code = 0);

  /**
   * Multicast join: not supported.
   *
   * @param group
   *        Group address.
   * @param interface_addr
   *        Local interface address.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_OPERATION_NOT_SUPPORTED, always.
   */
  void join(const Address& group, const Address& interface_addr, Error_code* err_code = 0);

  /**
   * Source-specific multicast join: not supported.
   *
   * @param group
   *        Group address.
   * @param interface_addr
   *        Local interface address.
   * @param source
   *        Source address.
   * @param err_code
   *        See other join().
   */
  void join(const Address& group, const Address& interface_addr, const Address& source, Error_code* err_code = 0);

  /// Disarms read interest.
  void suspend_reads();

  /// Disarms write interest.
  void suspend_writes();

  /// Arms read interest: Io_handler::on_readable() once a datagram is pending.
  void resume_reads();

  /// Arms write interest: Io_handler::on_writable() once the socket is writable.
  void resume_writes();

  /**
   * Not supported.
   *
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_OPERATION_NOT_SUPPORTED, always.
   */
  void shutdown_reads(Error_code* err_code = 0);

  /**
   * Not supported.
   *
   * @param err_code
   *        See shutdown_reads().
   */
  void shutdown_writes(Error_code* err_code = 0);

  /**
   * Blocks until a datagram is pending.  A close() from another thread meanwhile does not end the wait; use the
   * timeout overload if one may come.
   *
   * @param err_code
   *        See event::await_readiness().
   * @return `true` unless error.
   */
  bool await_readable(Error_code* err_code = 0);

  /**
   * Blocks until a datagram is pending or the timeout elapses.
   *
   * @param timeout
   *        Timeout.
   * @param err_code
   *        See event::await_readiness().
   * @return `true` if readable; `false` on timeout or error.
   */
  bool await_readable(util::Fine_duration timeout, Error_code* err_code = 0);

  /**
   * Blocks until the socket is writable.
   *
   * @param err_code
   *        See event::await_readiness().
   * @return `true` unless error.
   */
  bool await_writable(Error_code* err_code = 0);

  /**
   * Blocks until the socket is writable or the timeout elapses.
   *
   * @param timeout
   *        Timeout.
   * @param err_code
   *        See event::await_readiness().
   * @return `true` if writable; `false` on timeout or error.
   */
  bool await_writable(util::Fine_duration timeout, Error_code* err_code = 0);

  /**
   * The address the socket is bound to.
   *
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        `boost::asio::error::bad_descriptor` (closed); system errors.
   * @return See above; default-constructed on error.
   */
  Endpoint local_address(Error_code* err_code = 0) const;

  /**
   * Implements Channel API: `true` if and only if the socket is open.
   * @return See above.
   */
  bool is_open() const override;

  /**
   * Implements Channel API.  See class doc header.
   *
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        system errors from closing the socket (first call only).
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

  /// Staging buffer for gather-send; no pointless zeroing on resize.
  using Staging_buffer = std::vector<uint8_t, util::Default_init_allocator<uint8_t>>;

  // Methods.

  /**
   * Common ctor body, once #m_socket is open (or not, if `*err_code` is already set).
   *
   * @param event_source
   *        See ctor.
   * @param err_code
   *        Not null.
   */
  void init(event::Event_source* event_source, Error_code* err_code);

  /**
   * The body of the `await_*()` methods.  Same approach as Pipe_channel's: waits on a `dup()` of the socket,
   * taken under #m_socket_mutex, so a concurrent close() cannot redirect the wait to a recycled descriptor number.
   *
   * @param snd_else_rcv
   *        See event::await_readiness().
   * @param timeout_or_none
   *        See event::await_readiness().
   * @param err_code
   *        See event::await_readiness(); plus system errors from `dup()`.
   * @return See event::await_readiness().
   */
  bool await_socket(bool snd_else_rcv, std::optional<util::Fine_duration> timeout_or_none, Error_code* err_code);

  /**
   * Invokes `(m_stats->*func)(n)`, if #m_stats, logging anything thrown.
   *
   * @param func
   *        Which counter.
   * @param n
   *        Count.
   */
  void count_bytes(void (Channel_stats_sink::*func)(size_t), size_t n);

  // Data.

  /// See nickname().
  const std::string m_nickname;

  /// Invokes the user handler.
  Fault_isolating_handler<Udp_socket_channel> m_dispatch;

  /// See ctor.
  Channel_registry* const m_registry;

  /// See ctor.
  Channel_stats_sink* const m_stats;

  /// Execution context for #m_socket.  Never `run()`.
  flow::util::Task_engine m_nb_task_engine;

  /// Protects #m_socket.
  mutable Mutex m_socket_mutex;

  /// The socket.
  boost::asio::ip::udp::socket m_socket;

  /// Read-interest handle; null if ctor failed.
  std::unique_ptr<event::Readiness_handle> m_read_hndl;

  /// Write-interest handle; null if ctor failed.
  std::unique_ptr<event::Readiness_handle> m_write_hndl;

  /// Latch: `true` once close() has begun (or can no longer do anything).
  std::atomic<bool> m_closed;
}; // class Udp_socket_channel

} // namespace chan::channel
