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

#include <chan/event/event_source_factory.hpp>
#include <chan/channel/pipe_channel.hpp>
#include <chan/channel/udp_socket_channel.hpp>
#include <chan/channel/channel_stats.hpp>
#include <flow/log/simple_ostream_logger.hpp>
#include <flow/log/async_file_logger.hpp>
#include <flow/util/blob.hpp>
#include <unistd.h>

namespace
{

/// Logs whatever arrives on the pipe; logs the close.
class Echo_logger :
  public chan::channel::Io_handler<chan::channel::Pipe_channel>,
  public flow::log::Log_context
{
public:
  explicit Echo_logger(flow::log::Logger* logger_ptr) :
    flow::log::Log_context(logger_ptr, flow::Flow_log_component::S_UNCAT),
    m_target(logger_ptr, 1000)
  {
    // Yep.
  }

  void on_readable(chan::channel::Pipe_channel& channel) override
  {
    chan::Error_code err_code;
    const auto n_rcvd = channel.read(chan::util::Blob_mutable(m_target.data(), m_target.size()), &err_code);
    if (err_code)
    {
      FLOW_LOG_WARNING("Problem reading; unexpected!  Error: [" << err_code << "] [" << err_code.message() << "].");
      return;
    }
    // else

    FLOW_LOG_INFO("Received message we sent: "
                  "[" << std::string(reinterpret_cast<const char*>(m_target.const_data()), n_rcvd) << "].");
    channel.resume_reads();
  }

  void on_writable(chan::channel::Pipe_channel&) override
  {
    // Not interested.
  }

  void on_closed(chan::channel::Pipe_channel& channel) override
  {
    FLOW_LOG_INFO("Channel [" << channel << "] closed.");
  }

private:
  flow::util::Blob m_target;
}; // class Echo_logger

} // Anonymous namespace

/* This little thing is *not* a unit-test; it is built to ensure the proper stuff links through our
 * build process.  We try to use a compiled thing or two; and a template (header-only) thing or two;
 * not so much for correctness testing but to see it build successfully and run without barfing. */
int main(int argc, char const * const * argv)
{
  using chan::event::Event_source_factory;
  using chan::channel::Pipe_channel;
  using chan::channel::Udp_socket_channel;
  using chan::channel::Channel_stats;
  using chan::util::Native_handle;
  using chan::util::Blob_const;

  using flow::log::Simple_ostream_logger;
  using flow::log::Async_file_logger;
  using flow::log::Config;
  using flow::log::Sev;
  using flow::Flow_log_component;

  using std::string;
  using std::exception;

  const string LOG_FILE = "chan_core_link_test.log";
  const int BAD_EXIT = 1;

  /* Set up logging within this function.  We could easily just use `cout` and `cerr` instead, but this
   * Flow stuff will give us time stamps and such for free. */
  Config std_log_config;
  std_log_config.init_component_to_union_idx_mapping<Flow_log_component>(1000, 999);
  std_log_config.init_component_names<Flow_log_component>(flow::S_FLOW_LOG_COMPONENT_NAME_MAP, false, "link_test-");

  Simple_ostream_logger std_logger(&std_log_config);
  FLOW_LOG_SET_CONTEXT(&std_logger, Flow_log_component::S_UNCAT);

  // This is separate: the Chan/Flow logging will go into this file.
  const string log_file((argc >= 2) ? string(argv[1]) : LOG_FILE);
  FLOW_LOG_INFO("Opening log file [" << log_file << "] for Chan/Flow logs only.");
  Config log_config = std_log_config;
  log_config.init_component_to_union_idx_mapping<chan::Log_component>(2000, 999);
  log_config.init_component_names<chan::Log_component>(chan::S_CHAN_LOG_COMPONENT_NAME_MAP, false, "chan-");
  log_config.configure_default_verbosity(Sev::S_DATA, true); // High-verbosity.  Use S_INFO in production.
  Async_file_logger log_logger(nullptr, &log_config, log_file, false /* No rotation; we're no serious business. */);

  try
  {
    Event_source_factory factory(&log_logger);
    factory.set_option(Event_source_factory::S_NAME, string("link"));
    factory.set_option(Event_source_factory::S_READ_THREADS, size_t(1));
    const auto event_source = factory.create();

    int fds[2];
    if (::pipe(fds) == -1)
    {
      FLOW_LOG_WARNING("pipe() failed; cannot continue.");
      return BAD_EXIT;
    }
    // else

    Pipe_channel pipe_chan(&log_logger, "loop", event_source.get(), Native_handle(fds[0]), Native_handle(fds[1]),
                           std::make_shared<Echo_logger>(&std_logger));
    pipe_chan.resume_reads();

    const string PAYLOAD = "Hello, world!";
    pipe_chan.write(Blob_const(PAYLOAD.data(), PAYLOAD.size()));
    FLOW_LOG_INFO("Wrote message into pipe: [" << PAYLOAD << "].");

    // A UDP datagram to ourselves, for good measure; synchronously.
    Channel_stats stats("udp");
    Udp_socket_channel udp_chan(&log_logger, "udp", event_source.get(),
                                Udp_socket_channel::Endpoint(boost::asio::ip::address_v4::loopback(), 0),
                                nullptr, nullptr, &stats);
    udp_chan.send(udp_chan.local_address(), Blob_const(PAYLOAD.data(), PAYLOAD.size()));
    if (udp_chan.await_readable(boost::chrono::seconds(1)))
    {
      string target(PAYLOAD.size(), '\0');
      const auto result = udp_chan.receive(chan::util::Blob_mutable(target.data(), target.size()));
      if (result)
      {
        FLOW_LOG_INFO("Received datagram [" << target.substr(0, result->m_n_rcvd) << "] from "
                      "[" << result->m_source << "]; stats: [" << stats.total_bytes_read() << "] bytes in.");
      }
    }

    // Don't judge us.  Again, we aren't demo-ing best practices here!
    FLOW_LOG_INFO("Sleeping for a sec; then will exit (message should arrive very shortly from now).");
    flow::util::this_thread::sleep_for(boost::chrono::seconds(1));
    pipe_chan.close();
    FLOW_LOG_INFO("Exiting.");
  } // try
  catch (const exception& exc)
  {
    FLOW_LOG_WARNING("Caught exception: [" << exc.what() << "].");
    return BAD_EXIT;
  }

  return 0;
} // main()
