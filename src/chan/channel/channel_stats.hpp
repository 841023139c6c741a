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

#include "chan/channel/channel_fwd.hpp"
#include <atomic>
#include <string>

namespace chan::channel
{

// Types.

/**
 * Receiver of a channel's byte counts.  Best-effort: a channel logs (and otherwise ignores) anything these throw.
 */
class Channel_stats_sink
{
public:
  // Constructors/destructor.

  /// Boring virtual destructor.
  virtual ~Channel_stats_sink();

  // Methods.

  /**
   * `n_bytes` were received.
   * @param n_bytes
   *        Count.
   */
  virtual void bytes_read(size_t n_bytes) = 0;

  /**
   * `n_bytes` were sent.
   * @param n_bytes
   *        Count.
   */
  virtual void bytes_written(size_t n_bytes) = 0;

  /// The channel closed; no further counts will arrive.
  virtual void unregister() = 0;
}; // class Channel_stats_sink

/**
 * Channel_stats_sink that keeps atomic totals, readable at any time from any thread.
 */
class Channel_stats : public Channel_stats_sink
{
public:
  // Constructors/destructor.

  /**
   * Constructs zeroed, registered record.
   *
   * @param name
   *        Name of the record (e.g., the channel's nickname).
   */
  explicit Channel_stats(util::String_view name);

  // Methods.

  /**
   * Implements Channel_stats_sink API.
   * @param n_bytes
   *        See Channel_stats_sink.
   */
  void bytes_read(size_t n_bytes) override;

  /**
   * Implements Channel_stats_sink API.
   * @param n_bytes
   *        See Channel_stats_sink.
   */
  void bytes_written(size_t n_bytes) override;

  /// Implements Channel_stats_sink API.
  void unregister() override;

  /**
   * Total of bytes_read() args.
   * @return See above.
   */
  uint64_t total_bytes_read() const;

  /**
   * Total of bytes_written() args.
   * @return See above.
   */
  uint64_t total_bytes_written() const;

  /**
   * `false` once unregister() was called.
   * @return See above.
   */
  bool registered() const;

  /**
   * Name given to ctor.
   * @return See above.
   */
  const std::string& name() const;

private:
  // Data.

  /// See name().
  const std::string m_name;

  /// See total_bytes_read().
  std::atomic<uint64_t> m_bytes_read;

  /// See total_bytes_written().
  std::atomic<uint64_t> m_bytes_written;

  /// See registered().
  std::atomic<bool> m_registered;
}; // class Channel_stats

} // namespace chan::channel
