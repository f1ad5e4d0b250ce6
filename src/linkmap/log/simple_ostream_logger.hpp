/* Linkmap
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

#include "linkmap/log/ostream_log_msg_writer.hpp"
#include "linkmap/log/log.hpp"
#include "linkmap/util/util_fwd.hpp"
#include <iostream>

namespace linkmap::log
{

// Types.

/**
 * Logger for console programs: writes Sev::S_WARNING and more severe messages to one stream (by default `cerr`), the
 * rest to another (by default `cout`), before do_log() returns.  Filtering and format come from a Config.
 *
 * do_log() may be called concurrently; lines never interleave, even with both streams going to one terminal.  Nothing
 * else should write to the streams meanwhile.
 */
class Simple_ostream_logger :
  public Logger
{
public:
  // Constructors/destructor.

  /**
   * Constructs the logger.  The two streams may be the same.
   *
   * @param config
   *        Filter and format settings.  Must outlive `*this`.
   * @param os
   *        Stream for messages less severe than WARNING.
   * @param os_for_err
   *        Stream for WARNING and more severe messages.
   */
  explicit Simple_ostream_logger(Config* config,
                                 std::ostream& os = std::cout, std::ostream& os_for_err = std::cerr);

  // Methods.

  /**
   * Defers to Config::should_log().
   *
   * @param sev
   *        Severity.
   * @param component
   *        Component.
   * @return See above.
   */
  bool should_log(Sev sev, const Component& component) const override;

  /**
   * Writes the line to the stream for its severity.
   *
   * @param metadata
   *        Call site information.
   * @param msg
   *        Message.
   */
  void do_log(const Msg_metadata& metadata, util::String_view msg) override;

  /**
   * The Config given to the ctor.
   * @return See above.
   */
  Config* config() const;

private:
  // Data.

  /// See ctor.
  Config* const m_config;

  /// Writes to `os`.
  Ostream_log_msg_writer m_writer;

  /// Writes to `os_for_err`.
  Ostream_log_msg_writer m_err_writer;

  /// Held while writing to either stream.
  util::Mutex_non_recursive m_mutex;
}; // class Simple_ostream_logger

} // namespace linkmap::log
