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
#include "linkmap/util/string_ostream.hpp"
#include "linkmap/util/util_fwd.hpp"

namespace linkmap::log
{

/**
 * Logger keeping every line, formatted as by Simple_ostream_logger, in memory.  The tests use it to check what the
 * map logged.  All methods may be called concurrently.
 */
class Buffer_logger :
  public Logger
{
public:
  // Constructors/destructor.

  /**
   * Constructs the logger with nothing logged.
   *
   * @param config
   *        Filter and format settings.  Must outlive `*this`.
   */
  explicit Buffer_logger(Config* config);

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
   * Appends the line.
   *
   * @param metadata
   *        Call site information.
   * @param msg
   *        Message.
   */
  void do_log(const Msg_metadata& metadata, util::String_view msg) override;

  /**
   * Everything logged so far.
   * @return See above.
   */
  std::string buffer_str_copy() const;

private:
  // Data.

  /// See ctor.
  Config* const m_config;

  /// The lines.
  util::String_ostream m_buffer;

  /// Formats lines into #m_buffer.
  Ostream_log_msg_writer m_writer;

  /// Guards #m_buffer.
  mutable util::Mutex_non_recursive m_mutex;
}; // class Buffer_logger

} // namespace linkmap::log
