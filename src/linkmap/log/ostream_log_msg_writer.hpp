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

#include "linkmap/log/log.hpp"
#include <ostream>

namespace linkmap::log
{

// Types.

/**
 * Writes log lines to an `ostream`, each formatted as
 *
 *   `<time stamp> [<sev>]: T<thread ID>: <component>: <file>:<function>(<line>): <message>`
 *
 * and flushed.  `<component>: ` is left out when Config has no name for the component.  The time stamp follows
 * Config::m_use_human_friendly_time_stamps: `YYYY-MM-DD HH:MM:SS.uuuuuu +ZZZZ` local time, or `SSSSSSSSSS.uuuuuu`
 * since Epoch.  `<sev>` is a four-letter tag such as `warn`.
 *
 * Does not change the stream's formatting state.  Not thread-safe; the owning Logger serializes calls.
 */
class Ostream_log_msg_writer
{
public:
  // Constructors/destructor.

  /**
   * Constructs the writer.
   *
   * @param config
   *        Component names and time stamp style.  Must outlive `*this`.
   * @param os
   *        Destination.  Must outlive `*this`.
   */
  explicit Ostream_log_msg_writer(const Config& config, std::ostream& os);

  // Methods.

  /**
   * Writes one line.
   *
   * @param metadata
   *        Call site information.
   * @param msg
   *        Message.
   */
  void log(const Msg_metadata& metadata, util::String_view msg);

private:
  // Data.

  /// See ctor.
  const Config& m_config;

  /// See ctor.
  std::ostream& m_os;
}; // class Ostream_log_msg_writer

} // namespace linkmap::log
