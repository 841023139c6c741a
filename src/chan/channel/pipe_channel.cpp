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
#include "chan/channel/pipe_channel.hpp"
#include "chan/channel/channel_registry.hpp"
#include "chan/error.hpp"
#include <flow/error/error.hpp>

namespace chan::channel
{

// Implementations.

Pipe_channel::Pipe_channel(flow::log::Logger* logger_ptr, util::String_view nickname_str,
                           event::Event_source* event_source,
                           util::Native_handle&& source_hndl_moved, util::Native_handle&& sink_hndl_moved,
                           std::shared_ptr<Handler> handler,
                           Channel_registry* registry, Error_code* err_code) :
  flow::log::Log_context(logger_ptr, Log_component::S_CHANNEL),
  m_nickname(nickname_str),
  m_dispatch(logger_ptr, std::move(handler)),
  m_registry(registry),
  m_source(m_nb_task_engine),
  m_sink(m_nb_task_engine),
  m_closed_notified(false)
{
  using event::Interest;
  using util::Native_handle;

  Error_code our_err_code;
  Error_code* const actual_err_code = err_code ? err_code : &our_err_code;
  actual_err_code->clear();

  const Native_handle source_hndl(std::move(source_hndl_moved));
  const Native_handle sink_hndl(std::move(sink_hndl_moved));

  m_source.assign(source_hndl.m_native_handle, *actual_err_code);
  if (!*actual_err_code)
  {
    m_sink.assign(sink_hndl.m_native_handle, *actual_err_code);
  }
  if (!*actual_err_code)
  {
    m_source.non_blocking(true, *actual_err_code);
  }
  if (!*actual_err_code)
  {
    m_sink.non_blocking(true, *actual_err_code);
  }
  if (!*actual_err_code)
  {
    m_read_hndl = event_source->register_interest(source_hndl, Interest::S_READ,
                                                  [this]() { m_dispatch.on_readable(*this); },
                                                  actual_err_code);
  }
  if (!*actual_err_code)
  {
    m_write_hndl = event_source->register_interest(sink_hndl, Interest::S_WRITE,
                                                   [this]() { m_dispatch.on_writable(*this); },
                                                   actual_err_code);
  }

  if (*actual_err_code)
  {
    FLOW_LOG_WARNING("Pipe channel [" << *this << "]: Setting up over source [" << source_hndl << "] and "
                     "sink [" << sink_hndl << "] failed with error [" << *actual_err_code << "] "
                     "[" << actual_err_code->message() << "].  Closing whatever was set up; channel is unusable.");

    m_closed_notified = true; // Never fire on_closed(): we never opened.
    m_read_hndl.reset();
    m_write_hndl.reset();

    // Whatever was not yet adopted by a Half we close directly.
    Native_handle leftover_source(m_source.is_open() ? Native_handle() : source_hndl);
    Native_handle leftover_sink(m_sink.is_open() ? Native_handle() : sink_hndl);
    close_half(&m_source, &m_source_mutex, "source");
    close_half(&m_sink, &m_sink_mutex, "sink");
    util::close_native_handle(get_logger(), &leftover_source);
    util::close_native_handle(get_logger(), &leftover_sink);

    if (!err_code)
    {
      throw flow::error::Runtime_error(our_err_code, "channel::Pipe_channel::Pipe_channel()");
    }
    return;
  }
  // else

  FLOW_LOG_INFO("Pipe channel [" << *this << "]: Created over source [" << source_hndl << "] and "
                "sink [" << sink_hndl << "].");
} // Pipe_channel::Pipe_channel()

Pipe_channel::~Pipe_channel()
{
  Error_code err_code;
  close(&err_code);
  if (err_code)
  {
    FLOW_LOG_WARNING("Pipe channel [" << *this << "]: Implicit close in destructor reported error "
                     "[" << err_code << "] [" << err_code.message() << "]; nothing more to do about it.");
  }
}

template<typename Buffer_sequence>
size_t Pipe_channel::read_impl(const Buffer_sequence& targets, Error_code* err_code)
{
  assert(err_code);

  Lock_guard lock(m_source_mutex);

  if (!m_source.is_open())
  {
    *err_code = boost::asio::error::bad_descriptor;
    return 0;
  }
  // else

  const size_t n_rcvd = m_source.read_some(targets, *err_code);
  if ((*err_code == boost::asio::error::would_block) || (*err_code == boost::asio::error::try_again))
  {
    err_code->clear();
    return 0;
  }
  // else

  if (*err_code)
  {
    if (*err_code == boost::asio::error::eof)
    {
      FLOW_LOG_TRACE("Pipe channel [" << *this << "]: Source reached end-of-stream.");
    }
    else
    {
      FLOW_LOG_WARNING("Pipe channel [" << *this << "]: Read failed with error [" << *err_code << "] "
                       "[" << err_code->message() << "].");
    }
    return 0;
  }
  // else

  FLOW_LOG_TRACE("Pipe channel [" << *this << "]: Read [" << n_rcvd << "] bytes.");
  return n_rcvd;
} // Pipe_channel::read_impl()

template<typename Buffer_sequence>
size_t Pipe_channel::write_impl(const Buffer_sequence& srcs, Error_code* err_code)
{
  assert(err_code);

  Lock_guard lock(m_sink_mutex);

  if (!m_sink.is_open())
  {
    *err_code = boost::asio::error::bad_descriptor;
    return 0;
  }
  // else

  const size_t n_sent = m_sink.write_some(srcs, *err_code);
  if ((*err_code == boost::asio::error::would_block) || (*err_code == boost::asio::error::try_again))
  {
    err_code->clear();
    return 0;
  }
  // else

  if (*err_code)
  {
    FLOW_LOG_WARNING("Pipe channel [" << *this << "]: Write failed with error [" << *err_code << "] "
                     "[" << err_code->message() << "].");
    return 0;
  }
  // else

  FLOW_LOG_TRACE("Pipe channel [" << *this << "]: Wrote [" << n_sent << "] bytes.");
  return n_sent;
} // Pipe_channel::write_impl()

size_t Pipe_channel::read(const util::Blob_mutable& target, Error_code* err_code)
{
  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(size_t, read, target, _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  return read_impl(target, err_code);
}

size_t Pipe_channel::read(const std::vector<util::Blob_mutable>& targets, Error_code* err_code)
{
  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(size_t, read, flow::util::bind_ns::cref(targets), _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  return read_impl(targets, err_code);
}

size_t Pipe_channel::read(const std::vector<util::Blob_mutable>& targets, size_t offset, size_t length,
                          Error_code* err_code)
{
  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(size_t, read, flow::util::bind_ns::cref(targets), offset, length, _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  if ((offset > targets.size()) || (length > (targets.size() - offset)))
  {
    FLOW_LOG_WARNING("Pipe channel [" << *this << "]: Scatter-read sub-range [" << offset << ", +" << length << ") "
                     "exceeds buffer sequence of size [" << targets.size() << "].");
    *err_code = error::Code::S_INVALID_ARGUMENT;
    return 0;
  }
  // else

  return read_impl(std::vector<util::Blob_mutable>(targets.begin() + offset, targets.begin() + offset + length),
                   err_code);
}

size_t Pipe_channel::write(const util::Blob_const& src, Error_code* err_code)
{
  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(size_t, write, src, _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  return write_impl(src, err_code);
}

size_t Pipe_channel::write(const std::vector<util::Blob_const>& srcs, Error_code* err_code)
{
  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(size_t, write, flow::util::bind_ns::cref(srcs), _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  return write_impl(srcs, err_code);
}

size_t Pipe_channel::write(const std::vector<util::Blob_const>& srcs, size_t offset, size_t length,
                           Error_code* err_code)
{
  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(size_t, write, flow::util::bind_ns::cref(srcs), offset, length, _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  if ((offset > srcs.size()) || (length > (srcs.size() - offset)))
  {
    FLOW_LOG_WARNING("Pipe channel [" << *this << "]: Gather-write sub-range [" << offset << ", +" << length << ") "
                     "exceeds buffer sequence of size [" << srcs.size() << "].");
    *err_code = error::Code::S_INVALID_ARGUMENT;
    return 0;
  }
  // else

  return write_impl(std::vector<util::Blob_const>(srcs.begin() + offset, srcs.begin() + offset + length), err_code);
}

void Pipe_channel::suspend_reads()
{
  if (m_read_hndl)
  {
    // S_ALREADY_CANCELLED is fine: we are closing or closed.
    FLOW_LOG_TRACE("Pipe channel [" << *this << "]: Suspend reads: [" << m_read_hndl->suspend() << "].");
  }
}

void Pipe_channel::suspend_writes()
{
  if (m_write_hndl)
  {
    FLOW_LOG_TRACE("Pipe channel [" << *this << "]: Suspend writes: [" << m_write_hndl->suspend() << "].");
  }
}

void Pipe_channel::resume_reads()
{
  if (m_read_hndl)
  {
    FLOW_LOG_TRACE("Pipe channel [" << *this << "]: Resume reads: "
                   "[" << m_read_hndl->resume(event::Interest::S_READ) << "].");
  }
}

void Pipe_channel::resume_writes()
{
  if (m_write_hndl)
  {
    FLOW_LOG_TRACE("Pipe channel [" << *this << "]: Resume writes: "
                   "[" << m_write_hndl->resume(event::Interest::S_WRITE) << "].");
  }
}

void Pipe_channel::shutdown_reads(Error_code* err_code)
{
  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { shutdown_reads(actual_err_code); },
         err_code, "channel::Pipe_channel::shutdown_reads()"))
  {
    return;
  }
  // else

  FLOW_LOG_INFO("Pipe channel [" << *this << "]: Shutting down reads.");
  *err_code = close_half(&m_source, &m_source_mutex, "source");
  if (m_read_hndl)
  {
    m_read_hndl->cancel_key();
  }
}

void Pipe_channel::shutdown_writes(Error_code* err_code)
{
  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { shutdown_writes(actual_err_code); },
         err_code, "channel::Pipe_channel::shutdown_writes()"))
  {
    return;
  }
  // else

  FLOW_LOG_INFO("Pipe channel [" << *this << "]: Shutting down writes.");
  *err_code = close_half(&m_sink, &m_sink_mutex, "sink");
  if (m_write_hndl)
  {
    m_write_hndl->cancel_key();
  }
}

bool Pipe_channel::await_readable(Error_code* err_code)
{
  return await_half(&m_source, &m_source_mutex, false, std::nullopt, err_code);
}

bool Pipe_channel::await_readable(util::Fine_duration timeout, Error_code* err_code)
{
  return await_half(&m_source, &m_source_mutex, false, timeout, err_code);
}

bool Pipe_channel::await_writable(Error_code* err_code)
{
  return await_half(&m_sink, &m_sink_mutex, true, std::nullopt, err_code);
}

bool Pipe_channel::await_writable(util::Fine_duration timeout, Error_code* err_code)
{
  return await_half(&m_sink, &m_sink_mutex, true, timeout, err_code);
}

bool Pipe_channel::is_open() const
{
  {
    Lock_guard lock(m_source_mutex);
    if (!m_source.is_open())
    {
      return false;
    }
  }
  Lock_guard lock(m_sink_mutex);
  return m_sink.is_open();
}

void Pipe_channel::close(Error_code* err_code)
{
  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { close(actual_err_code); },
         err_code, "channel::Pipe_channel::close()"))
  {
    return;
  }
  // else

  FLOW_LOG_TRACE("Pipe channel [" << *this << "]: Close requested.");

  // Source first; its failure is logged (in close_half()) and otherwise not our user's concern.
  close_half(&m_source, &m_source_mutex, "source");

  *err_code = close_half(&m_sink, &m_sink_mutex, "sink");

  // The rest happens regardless of the above.  No lock is held: handle cancellation may wait for a callback.
  deregister();

  if (!m_closed_notified.exchange(true))
  {
    FLOW_LOG_INFO("Pipe channel [" << *this << "]: Closed; notifying handler.");
    m_dispatch.on_closed(*this);
  }

  if (m_read_hndl)
  {
    m_read_hndl->cancel_key();
  }
  if (m_write_hndl)
  {
    m_write_hndl->cancel_key();
  }
} // Pipe_channel::close()

Error_code Pipe_channel::close_half(Half* half, Mutex* mutex, util::String_view what)
{
  Error_code sys_err_code;

  Lock_guard lock(*mutex);
  if (half->is_open())
  {
    half->close(sys_err_code);
    if (sys_err_code)
    {
      FLOW_LOG_WARNING("Pipe channel [" << *this << "]: Closing " << what << " reported error.");
      FLOW_ERROR_SYS_ERROR_LOG_WARNING();
    }
    else
    {
      FLOW_LOG_TRACE("Pipe channel [" << *this << "]: Closed " << what << '.');
    }
  }
  return sys_err_code;
}

bool Pipe_channel::await_half(Half* half, Mutex* mutex, bool snd_else_rcv,
                              std::optional<util::Fine_duration> timeout_or_none, Error_code* err_code)
{
  bool ready;
  if (flow::error::exec_and_throw_on_error
        ([&](Error_code* actual_err_code) -> bool
           { return await_half(half, mutex, snd_else_rcv, timeout_or_none, actual_err_code); },
         &ready, err_code, "channel::Pipe_channel::await_readable/writable()"))
  {
    return ready;
  }
  // else

  util::Native_handle watched;
  {
    Lock_guard lock(*mutex);
    if (half->is_open())
    {
      watched = util::duplicate_native_handle(get_logger(), util::Native_handle(half->native_handle()), err_code);
      if (*err_code)
      {
        return false;
      }
    }
  }
  // If closed, `watched` is .null(), and await_readiness() says so.

  ready = event::await_readiness(get_logger(), watched, snd_else_rcv, timeout_or_none, err_code);
  util::close_native_handle(get_logger(), &watched);
  return ready;
}

void Pipe_channel::deregister()
{
  if (!m_registry)
  {
    return;
  }
  // else

  try
  {
    m_registry->remove_channel(this);
  }
  catch (const std::exception& exc)
  {
    FLOW_LOG_WARNING("Pipe channel [" << *this << "]: Registry removal threw exception [" << exc.what() << "]; "
                     "continuing close.");
  }
}

const std::string& Pipe_channel::nickname() const
{
  return m_nickname;
}

std::set<std::string> Pipe_channel::options() const
{
  return {};
}

void Pipe_channel::get_option_impl(const config::Option_base&, std::any*, Error_code* err_code) const
{
  *err_code = error::Code::S_OPTION_UNSUPPORTED;
}

void Pipe_channel::set_option_impl(const config::Option_base&, const std::any&, Error_code* err_code)
{
  *err_code = error::Code::S_OPTION_UNSUPPORTED;
}

const std::shared_ptr<Pipe_channel::Handler>& Pipe_channel::handler() const
{
  return m_dispatch.handler();
}

} // namespace chan::channel
