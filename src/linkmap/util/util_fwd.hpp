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
#include <boost/thread/mutex.hpp>
#include <boost/thread/thread.hpp>
#include <iosfwd>
#include <string_view>

/// Linkmap module of small general-purpose helpers used by the other modules.
namespace linkmap::util
{

// Types.

// Find doc headers near the bodies of these compound types.

class String_ostream;

/// Non-owning view of `char`s.
using String_view = std::string_view;

/// Identifies the thread that logged a message.
using Thread_id = boost::thread::id;

/// Plain exclusive mutex.
using Mutex_non_recursive = boost::mutex;

/**
 * Scoped lock on a mutex.
 *
 * @tparam Mutex
 *         Mutex type, normally #Mutex_non_recursive.
 */
template<typename Mutex>
using Lock_guard = boost::unique_lock<Mutex>;

// Free functions.

/**
 * Returns the string that `os << arg1 << arg2 << ...` would print.
 *
 * @tparam T
 *         Types printable by `ostream <<`.
 * @param ostream_args
 *        The values, printed left to right.
 * @return See above.
 */
template<typename... T>
std::string ostream_op_string(const T&... ostream_args);

/**
 * Reads one `enum` value from a stream by name, ignoring case.  The name is the longest run of alphanumerics and
 * underscores at the read position; a run matching no value's `<<` output, or an empty run, gives `enum_default`.
 * Characters after the run are left in the stream.  Handy for writing `operator>>` of an `enum`.
 *
 * @tparam Enum
 *         `enum` type whose values from `enum_lowest` up to `enum_sentinel` (exclusive) are consecutive.
 * @param is_ptr
 *        The stream.
 * @param enum_default
 *        Result when nothing matches.
 * @param enum_sentinel
 *        First value past the candidates.
 * @param enum_lowest
 *        First candidate.
 * @return See above.
 */
template<typename Enum>
Enum istream_to_enum(std::istream* is_ptr, Enum enum_default, Enum enum_sentinel, Enum enum_lowest = Enum(0));

/**
 * Formats a source location as `file:function(line)`.
 *
 * @param file
 *        File name.
 * @param function
 *        Function name.
 * @param line
 *        Line number.
 * @return See above.
 */
std::string get_where_am_i_str(String_view file, String_view function, unsigned int line);

} // namespace linkmap::util

// Macros.

/// `std::string` of the form `file:function(line)` for the invocation site; `file` has no directory.
#define LINKMAP_UTIL_WHERE_AM_I_STR() \
  ::linkmap::util::get_where_am_i_str \
    (::linkmap::util::get_last_path_segment(::linkmap::util::String_view(__FILE__)), \
     ::linkmap::util::String_view(__FUNCTION__), __LINE__)

/**
 * String literal of the form `path/file:ARG_function(line)` for the invocation site.  Unlike
 * LINKMAP_UTIL_WHERE_AM_I_STR() it costs nothing at run time, so it suits code that may never need it.
 *
 * @param ARG_function
 *        Function identifier; stringified, not evaluated.
 */
#define LINKMAP_UTIL_WHERE_AM_I_LITERAL(ARG_function) \
  __FILE__ ":" #ARG_function "(" LINKMAP_UTIL_STRINGIFY_EXPANDED(__LINE__) ")"

/// Stringifies `ARG_val` after expanding it.
#define LINKMAP_UTIL_STRINGIFY_EXPANDED(ARG_val) LINKMAP_UTIL_STRINGIFY(ARG_val)

/// Stringifies `ARG_val` as written.
#define LINKMAP_UTIL_STRINGIFY(ARG_val) #ARG_val

/**
 * Wraps a multi-statement macro body so that `MACRO(...);` is a single statement.  `break;` in the body leaves it.
 *
 * @param ARG_body
 *        Statements.
 */
#define LINKMAP_UTIL_SEMICOLON_SAFE(ARG_body) \
  do \
  { \
    ARG_body \
  } \
  while (false)
