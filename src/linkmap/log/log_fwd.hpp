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

#include "linkmap/common.hpp"
#include <iosfwd>

/**
 * Linkmap module for logging.  The map logs little (compactions, failed `at()` lookups, aborted traversals), and it
 * does so through a Logger interface the user can implement on top of whatever they already log with.
 *
 * A class that logs derives from Log_context, which holds a `Logger*` (null silences it) and a Component, and then
 * calls LINKMAP_LOG_INFO() and friends with an `ostream`-style fragment.  The fragment is evaluated only if
 * Logger::should_log() says so.  Simple_ostream_logger (console) and Buffer_logger (string, for tests) are the
 * ready-made Loggers; both filter and name components through a Config.
 */
namespace linkmap::log
{

// Types.

// Find doc headers near the bodies of these compound types.

class Buffer_logger;
class Component;
class Config;
class Logger;
class Log_context;
struct Msg_metadata;
class Ostream_log_msg_writer;
class Simple_ostream_logger;

/**
 * Message severity.  Lower is more severe; a filter set to severity S passes S and everything lower.  Printed as the
 * name without `S_`, and read back from that name in any case, so it works as a boost.program_options value.
 */
enum class Sev : size_t
{
  /// As a filter: pass nothing.  Never a message's severity.
  S_NONE = 0,
  /// Fatal error.
  S_FATAL,
  /// Error.
  S_ERROR,
  /// Something went wrong, but rarely enough that logging it costs nothing.
  S_WARNING,
  /// Normal event, rare enough that logging it costs nothing.
  S_INFO,
  /// Normal event of little interest.
  S_DEBUG,
  /// Frequent event; logging these can slow things down.
  S_TRACE,
  /// Like TRACE, possibly dumping bulk data.
  S_DATA,
  /// Not a value; one past the last one.
  S_END_SENTINEL
}; // enum class Sev

// Free functions.

/**
 * Prints `val` as its name without `S_`, e.g., `WARNING`.
 *
 * @param os
 *        Stream.
 * @param val
 *        Value.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, Sev val);

/**
 * Reads a Sev printed by `<<`, ignoring case.  An unknown name reads as Sev::S_NONE.
 *
 * @param is
 *        Stream.
 * @param val
 *        Result.
 * @return `is`.
 */
std::istream& operator>>(std::istream& is, Sev& val);

} // namespace linkmap::log
