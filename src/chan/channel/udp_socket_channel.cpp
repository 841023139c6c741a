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
#include "chan/channel/udp_socket_channel.hpp"
#include "chan/channel/channel_registry.hpp"
#include "chan/channel/channel_stats.hpp"
#include "chan/error.hpp"
#include <flow/error/error.hpp>
#include <cstring>
#include <limits>
#include <sys/socket.h>

namespace chan::channel
{

// Static initializations.

const size_t Udp_socket_channel::S_MAX_STAGED_SIZE = std::numeric_limits<int>::max();

// Implementations.

Udp_socket_channel::Udp_socket_channel(flow::log::Logger* logger_ptr, util::String_view nickname_str,
                                       event::Event_source* event_source, util::Native_handle&& socket_hndl_moved,
                                       std::shared_ptr<Handler> handler, Channel_registry* registry,
                                       Channel_stats_sink* stats, Error_code* err_code) :
  flow::log::Log_context(logger_ptr, Log_component::S_CHANNEL),
  m_nickname(nickname_str),
  m_dispatch(logger_ptr, std::move(handler)),
  m_registry(registry),
  m_stats(stats),
  m_socket(m_nb_task_engine),
  m_closed(false)
{
  using boost::asio::ip::udp;
  using boost::system::system_category;
  using ::getsockname;

  Error_code our_err_code;
  Error_code* const actual_err_code = err_code ? err_code : &our_err_code;
  actual_err_code->clear();

  util::Native_handle socket_hndl(std::move(socket_hndl_moved));

  // We need the address family to tell boost.asio which protocol the adopted socket speaks.
  ::sockaddr_storage addr;
  ::socklen_t addr_len = sizeof(addr);
  if (socket_hndl.null())
  {
    *actual_err_code = error::Code::S_INVALID_ARGUMENT;
  }
  else if (getsockname(socket_hndl.m_native_handle, reinterpret_cast<::sockaddr*>(&addr), &addr_len) == -1)
  {
    *actual_err_code = Error_code(errno, system_category());
  }
  else
  {
    m_socket.assign((addr.ss_family == AF_INET6) ? udp::v6() : udp::v4(), socket_hndl.m_native_handle,
                    *actual_err_code);
  }

  if (*actual_err_code && (!m_socket.is_open()))
  {
    // Not adopted: still ours to close.
    util::close_native_handle(get_logger(), &socket_hndl);
  }

  init(event_source, actual_err_code);
  if (*actual_err_code && (!err_code))
  {
    throw flow::error::Runtime_error(our_err_code, "channel::Udp_socket_channel::Udp_socket_channel(1)");
  }
} // Udp_socket_channel::Udp_socket_channel(1)

Udp_socket_channel::Udp_socket_channel(flow::log::Logger* logger_ptr, util::String_view nickname_str,
                                       event::Event_source* event_source, const Endpoint& local_endpoint,
                                       std::shared_ptr<Handler> handler, Channel_registry* registry,
                                       Channel_stats_sink* stats, Error_code* err_code) :
  flow::log::Log_context(logger_ptr, Log_component::S_CHANNEL),
  m_nickname(nickname_str),
  m_dispatch(logger_ptr, std::move(handler)),
  m_registry(registry),
  m_stats(stats),
  m_socket(m_nb_task_engine),
  m_closed(false)
{
  Error_code our_err_code;
  Error_code* const actual_err_code = err_code ? err_code : &our_err_code;
  actual_err_code->clear();

  m_socket.open(local_endpoint.protocol(), *actual_err_code);
  if (!*actual_err_code)
  {
    m_socket.bind(local_endpoint, *actual_err_code);
  }

  init(event_source, actual_err_code);
  if (*actual_err_code && (!err_code))
  {
    throw flow::error::Runtime_error(our_err_code, "channel::Udp_socket_channel::Udp_socket_channel(2)");
  }
} // Udp_socket_channel::Udp_socket_channel(2)

void Udp_socket_channel::init(event::Event_source* event_source, Error_code* err_code)
{
  using event::Interest;

  if (!*err_code)
  {
    m_socket.non_blocking(true, *err_code);
  }

  const util::Native_handle socket_hndl(m_socket.is_open() ? m_socket.native_handle()
                                                           : util::Native_handle::S_NULL_HANDLE);
  if (!*err_code)
  {
    m_read_hndl = event_source->register_interest(socket_hndl, Interest::S_READ,
                                                  [this]() { m_dispatch.on_readable(*this); }, err_code);
  }
  if (!*err_code)
  {
    m_write_hndl = event_source->register_interest(socket_hndl, Interest::S_WRITE,
                                                   [this]() { m_dispatch.on_writable(*this); }, err_code);
  }

  if (*err_code)
  {
    FLOW_LOG_WARNING("UDP channel [" << *this << "]: Setting up over socket [" << socket_hndl << "] failed with "
                     "error [" << *err_code << "] [" << err_code->message() << "].  Closing whatever was set up; "
                     "channel is unusable.");
    m_closed = true; // Never fire on_closed(): we never opened.
    m_read_hndl.reset();
    m_write_hndl.reset();

    Error_code sys_err_code;
    m_socket.close(sys_err_code);
    if (sys_err_code)
    {
      FLOW_ERROR_SYS_ERROR_LOG_WARNING();
    }
    return;
  }
  // else

  Error_code ignored_err_code;
  FLOW_LOG_INFO("UDP channel [" << *this << "]: Created over socket [" << socket_hndl << "] bound to "
                "[" << m_socket.local_endpoint(ignored_err_code) << "].");
} // Udp_socket_channel::init()

Udp_socket_channel::~Udp_socket_channel()
{
  Error_code err_code;
  close(&err_code);
  if (err_code)
  {
    FLOW_LOG_WARNING("UDP channel [" << *this << "]: Implicit close in destructor reported error "
                     "[" << err_code << "] [" << err_code.message() << "]; nothing more to do about it.");
  }
}

Udp_socket_channel::Read_result_or_none Udp_socket_channel::receive(const util::Blob_mutable& target,
                                                                    Error_code* err_code)
{
  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(Read_result_or_none, receive, target, _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  Multipoint_read_result result;
  {
    Lock_guard lock(m_socket_mutex);

    if (!m_socket.is_open())
    {
      *err_code = boost::asio::error::bad_descriptor;
      return std::nullopt;
    }
    // else

    result.m_n_rcvd = m_socket.receive_from(target, result.m_source, 0, *err_code);
  }

  if ((*err_code == boost::asio::error::would_block) || (*err_code == boost::asio::error::try_again))
  {
    err_code->clear();
    return std::nullopt;
  }
  // else

  if (*err_code)
  {
    FLOW_LOG_WARNING("UDP channel [" << *this << "]: Receive failed with error [" << *err_code << "] "
                     "[" << err_code->message() << "].");
    return std::nullopt;
  }
  // else

  FLOW_LOG_TRACE("UDP channel [" << *this << "]: Received: " << result << '.');
  count_bytes(&Channel_stats_sink::bytes_read, result.m_n_rcvd);
  return result;
} // Udp_socket_channel::receive()

bool Udp_socket_channel::send(const Endpoint& target, const util::Blob_const& src, Error_code* err_code)
{
  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(bool, send, target, src, _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  size_t n_sent;
  {
    Lock_guard lock(m_socket_mutex);

    if (!m_socket.is_open())
    {
      *err_code = boost::asio::error::bad_descriptor;
      return false;
    }
    // else

    n_sent = m_socket.send_to(src, target, 0, *err_code);
  }

  if ((*err_code == boost::asio::error::would_block) || (*err_code == boost::asio::error::try_again))
  {
    err_code->clear();
    FLOW_LOG_TRACE("UDP channel [" << *this << "]: Send of [" << src.size() << "] bytes to [" << target << "] "
                   "would block; not sent.");
    return false;
  }
  // else

  if (*err_code)
  {
    FLOW_LOG_WARNING("UDP channel [" << *this << "]: Send of [" << src.size() << "] bytes to [" << target << "] "
                     "failed with error [" << *err_code << "] [" << err_code->message() << "].");
    return false;
  }
  // else

  FLOW_LOG_TRACE("UDP channel [" << *this << "]: Sent [" << n_sent << "] bytes to [" << target << "].");
  count_bytes(&Channel_stats_sink::bytes_written, n_sent);
  return n_sent != 0;
} // Udp_socket_channel::send(1)

bool Udp_socket_channel::send(const Endpoint& target, const std::vector<util::Blob_const>& srcs,
                              Error_code* err_code)
{
  return send(target, srcs, 0, srcs.size(), err_code);
}

bool Udp_socket_channel::send(const Endpoint& target, const std::vector<util::Blob_const>& srcs,
                              size_t offset, size_t length, Error_code* err_code)
{
  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(bool, send, target, flow::util::bind_ns::cref(srcs), offset, length, _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  if ((offset > srcs.size()) || (length > (srcs.size() - offset)))
  {
    FLOW_LOG_WARNING("UDP channel [" << *this << "]: Gather-send sub-range [" << offset << ", +" << length << ") "
                     "exceeds buffer sequence of size [" << srcs.size() << "].");
    *err_code = error::Code::S_INVALID_ARGUMENT;
    return false;
  }
  // else

  const auto srcs_begin = srcs.begin() + offset;
  const auto srcs_end = srcs_begin + length;

  // Total up front, so nothing is copied (or allocated) if it is too much.  Careful not to overflow the sum.
  size_t total = 0;
  for (auto src_it = srcs_begin; src_it != srcs_end; ++src_it)
  {
    if (src_it->size() > (S_MAX_STAGED_SIZE - total))
    {
      FLOW_LOG_WARNING("UDP channel [" << *this << "]: Gather-send of [" << length << "] buffers to [" << target << "] "
                       "totals more than the limit [" << S_MAX_STAGED_SIZE << "]; not sending.");
      *err_code = error::Code::S_MESSAGE_SIZE_EXCEEDS_LIMIT;
      return false;
    }
    // else
    total += src_it->size();
  }

  Staging_buffer staging(total);
  size_t pos = 0;
  for (auto src_it = srcs_begin; src_it != srcs_end; ++src_it)
  {
    if (src_it->size() != 0)
    {
      std::memcpy(staging.data() + pos, src_it->data(), src_it->size());
      pos += src_it->size();
    }
  }
  assert(pos == total);

  return send(target, util::Blob_const(staging.data(), staging.size()), err_code);
} // Udp_socket_channel::send(3)

void Udp_socket_channel::join(const Address& group, const Address& interface_addr, Error_code* err_code)
{
  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { join(group, interface_addr, actual_err_code); },
         err_code, "channel::Udp_socket_channel::join(1)"))
  {
    return;
  }
  // else

  FLOW_LOG_WARNING("UDP channel [" << *this << "]: Multicast join of [" << group << "] on [" << interface_addr << "] "
                   "requested; not supported.");
  *err_code = error::Code::S_OPERATION_NOT_SUPPORTED;
}

void Udp_socket_channel::join(const Address& group, const Address& interface_addr, const Address& source,
                              Error_code* err_code)
{
  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { join(group, interface_addr, source, actual_err_code); },
         err_code, "channel::Udp_socket_channel::join(2)"))
  {
    return;
  }
  // else

  FLOW_LOG_WARNING("UDP channel [" << *this << "]: Multicast join of [" << group << "] on [" << interface_addr << "] "
                   "from [" << source << "] requested; not supported.");
  *err_code = error::Code::S_OPERATION_NOT_SUPPORTED;
}

void Udp_socket_channel::suspend_reads()
{
  if (m_read_hndl)
  {
    // S_ALREADY_CANCELLED is fine: we are closing or closed.
    FLOW_LOG_TRACE("UDP channel [" << *this << "]: Suspend reads: [" << m_read_hndl->suspend() << "].");
  }
}

void Udp_socket_channel::suspend_writes()
{
  if (m_write_hndl)
  {
    FLOW_LOG_TRACE("UDP channel [" << *this << "]: Suspend writes: [" << m_write_hndl->suspend() << "].");
  }
}

void Udp_socket_channel::resume_reads()
{
  if (m_read_hndl)
  {
    FLOW_LOG_TRACE("UDP channel [" << *this << "]: Resume reads: "
                   "[" << m_read_hndl->resume(event::Interest::S_READ) << "].");
  }
}

void Udp_socket_channel::resume_writes()
{
  if (m_write_hndl)
  {
    FLOW_LOG_TRACE("UDP channel [" << *this << "]: Resume writes: "
                   "[" << m_write_hndl->resume(event::Interest::S_WRITE) << "].");
  }
}

void Udp_socket_channel::shutdown_reads(Error_code* err_code)
{
  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { shutdown_reads(actual_err_code); },
         err_code, "channel::Udp_socket_channel::shutdown_reads()"))
  {
    return;
  }
  // else
  *err_code = error::Code::S_OPERATION_NOT_SUPPORTED;
}

void Udp_socket_channel::shutdown_writes(Error_code* err_code)
{
  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { shutdown_writes(actual_err_code); },
         err_code, "channel::Udp_socket_channel::shutdown_writes()"))
  {
    return;
  }
  // else
  *err_code = error::Code::S_OPERATION_NOT_SUPPORTED;
}

bool Udp_socket_channel::await_readable(Error_code* err_code)
{
  return await_socket(false, std::nullopt, err_code);
}

bool Udp_socket_channel::await_readable(util::Fine_duration timeout, Error_code* err_code)
{
  return await_socket(false, timeout, err_code);
}

bool Udp_socket_channel::await_writable(Error_code* err_code)
{
  return await_socket(true, std::nullopt, err_code);
}

bool Udp_socket_channel::await_writable(util::Fine_duration timeout, Error_code* err_code)
{
  return await_socket(true, timeout, err_code);
}

Udp_socket_channel::Endpoint Udp_socket_channel::local_address(Error_code* err_code) const
{
  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(Endpoint, local_address, _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  Lock_guard lock(m_socket_mutex);
  if (!m_socket.is_open())
  {
    *err_code = boost::asio::error::bad_descriptor;
    return Endpoint();
  }
  // else
  return m_socket.local_endpoint(*err_code);
}

bool Udp_socket_channel::is_open() const
{
  Lock_guard lock(m_socket_mutex);
  return m_socket.is_open();
}

void Udp_socket_channel::close(Error_code* err_code)
{
  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { close(actual_err_code); },
         err_code, "channel::Udp_socket_channel::close()"))
  {
    return;
  }
  // else

  err_code->clear();
  if (m_closed.exchange(true))
  {
    return;
  }
  // else

  FLOW_LOG_INFO("UDP channel [" << *this << "]: Closing.");

  {
    Lock_guard lock(m_socket_mutex);
    m_socket.close(*err_code);
  }
  if (*err_code)
  {
    FLOW_LOG_WARNING("UDP channel [" << *this << "]: Closing socket reported error [" << *err_code << "] "
                     "[" << err_code->message() << "]; completing close anyway.");
  }

  // The rest happens regardless of the above.  No lock is held: handle cancellation may wait for a callback.
  if (m_registry)
  {
    try
    {
      m_registry->remove_channel(this);
    }
    catch (const std::exception& exc)
    {
      FLOW_LOG_WARNING("UDP channel [" << *this << "]: Registry removal threw exception [" << exc.what() << "]; "
                       "continuing close.");
    }
  }

  if (m_read_hndl)
  {
    m_read_hndl->cancel_key();
  }
  if (m_write_hndl)
  {
    m_write_hndl->cancel_key();
  }

  m_dispatch.on_closed(*this);

  if (m_stats)
  {
    try
    {
      m_stats->unregister();
    }
    catch (const std::exception& exc)
    {
      FLOW_LOG_WARNING("UDP channel [" << *this << "]: Stats unregistration threw exception "
                       "[" << exc.what() << "]; ignoring.");
    }
  }
} // Udp_socket_channel::close()

bool Udp_socket_channel::await_socket(bool snd_else_rcv, std::optional<util::Fine_duration> timeout_or_none,
                                      Error_code* err_code)
{
  bool ready;
  if (flow::error::exec_and_throw_on_error
        ([&](Error_code* actual_err_code) -> bool
           { return await_socket(snd_else_rcv, timeout_or_none, actual_err_code); },
         &ready, err_code, "channel::Udp_socket_channel::await_readable/writable()"))
  {
    return ready;
  }
  // else

  util::Native_handle watched;
  {
    Lock_guard lock(m_socket_mutex);
    if (m_socket.is_open())
    {
      watched = util::duplicate_native_handle(get_logger(), util::Native_handle(m_socket.native_handle()), err_code);
      if (*err_code)
      {
        return false;
      }
    }
  }

  ready = event::await_readiness(get_logger(), watched, snd_else_rcv, timeout_or_none, err_code);
  util::close_native_handle(get_logger(), &watched);
  return ready;
}

void Udp_socket_channel::count_bytes(void (Channel_stats_sink::*func)(size_t), size_t n)
{
  if (!m_stats)
  {
    return;
  }
  // else

  try
  {
    (m_stats->*func)(n);
  }
  catch (const std::exception& exc)
  {
    FLOW_LOG_WARNING("UDP channel [" << *this << "]: Stats update threw exception [" << exc.what() << "]; "
                     "ignoring.");
  }
}

const std::string& Udp_socket_channel::nickname() const
{
  return m_nickname;
}

std::set<std::string> Udp_socket_channel::options() const
{
  return {};
}

void Udp_socket_channel::get_option_impl(const config::Option_base&, std::any*, Error_code* err_code) const
{
  *err_code = error::Code::S_OPTION_UNSUPPORTED;
}

void Udp_socket_channel::set_option_impl(const config::Option_base&, const std::any&, Error_code* err_code)
{
  *err_code = error::Code::S_OPTION_UNSUPPORTED;
}

const std::shared_ptr<Udp_socket_channel::Handler>& Udp_socket_channel::handler() const
{
  return m_dispatch.handler();
}

std::ostream& operator<<(std::ostream& os, const Multipoint_read_result& val)
{
  os << '[' << val.m_n_rcvd << "] bytes from [" << val.m_source << ']';
  if (val.m_destination)
  {
    os << " to [" << *val.m_destination << ']';
  }
  return os;
}

} // namespace chan::channel
