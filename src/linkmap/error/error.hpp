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

#include "linkmap/error/error_fwd.hpp"
#include "linkmap/log/log.hpp"
#include "linkmap/util/detail/util.hpp"
#include <boost/system/system_error.hpp>
#include <string>
#include <utility>

namespace linkmap::error
{

// Types.

/**
 * What Linkmap throws: a `boost::system::system_error` holding an #Error_code and a context string.  what() reads
 * `"<context>: <message of the code>"`; without a code (falsy) it is the context alone.
 */
class Runtime_error :
  public boost::system::system_error
{
public:
  // Constructors/destructor.

  /**
   * Constructs the exception.
   *
   * @param err_code_or_success
   *        The code, or a falsy one for none.
   * @param context
   *        Where or why, e.g., LINKMAP_UTIL_WHERE_AM_I_STR().
   */
  explicit Runtime_error(const Error_code& err_code_or_success, util::String_view context = "");

  /**
   * Constructs the exception without a code.
   *
   * @param context
   *        The whole message.
   */
  explicit Runtime_error(util::String_view context);

  // Methods.

  /**
   * See class doc header.
   * @return See above.
   */
  const char* what() const noexcept override;

private:
  // Data.

  /// what() when there is no code.
  const std::string m_what_without_code;
}; // class Runtime_error

// Template implementations.

template<typename Func, typename Ret>
bool exec_and_throw_on_error(const Func& func, Ret* ret, Error_code* err_code, util::String_view context)
{
  if (err_code)
  {
    return false;
  }
  // else

  Error_code local_err_code;
  Ret result = func(&local_err_code);
  if (local_err_code)
  {
    throw Runtime_error(local_err_code, context);
  }
  // else
  *ret = std::move(result);
  return true;
}

} // namespace linkmap::error

// Macros.

/**
 * In a method following the `Error_code* err_code` convention, once `err_code` is known to be non-null: logs the
 * error at INFO and stores it in `*err_code`.  INFO, since the caller asked to receive the error, so it is likely
 * routine for them.
 *
 * @param ARG_val
 *        Anything convertible to #linkmap::Error_code.
 */
#define LINKMAP_ERROR_EMIT_ERROR_LOG_INFO(ARG_val) \
  LINKMAP_UTIL_SEMICOLON_SAFE \
  ( \
    const ::linkmap::Error_code LINKMAP_ERROR_emitted(ARG_val); \
    LINKMAP_LOG_INFO("Emitting error [" << LINKMAP_ERROR_emitted << "] " \
                     "[" << LINKMAP_ERROR_emitted.message() << "]."); \
    *err_code = LINKMAP_ERROR_emitted; \
  )

/**
 * Logs an error at WARNING; normally right before throwing it.
 *
 * @param ARG_val
 *        Anything convertible to #linkmap::Error_code.
 */
#define LINKMAP_ERROR_LOG_ERROR(ARG_val) \
  LINKMAP_UTIL_SEMICOLON_SAFE \
  ( \
    const ::linkmap::Error_code LINKMAP_ERROR_logged(ARG_val); \
    LINKMAP_LOG_WARNING("Error [" << LINKMAP_ERROR_logged << "] [" << LINKMAP_ERROR_logged.message() << "]."); \
  )

/**
 * First statement of a method `M(..., Error_code* err_code)` returning `ARG_ret_type`: if `err_code` is null, calls
 * `ARG_function_name(...)` again with `_1` standing for a local `Error_code*`, then returns the result or throws
 * error::Runtime_error.  Otherwise does nothing, so the code after it may assume `err_code` is non-null.
 *
 *   ~~~
 *   int Parser::parse(const string& text, Error_code* err_code) const
 *   {
 *     LINKMAP_ERROR_EXEC_AND_THROW_ON_ERROR(int, parse, text, _1);
 *     // else: err_code is not null.
 *     ...
 *   }
 *   ~~~
 *
 * @param ARG_ret_type
 *        Return type of the method; default-constructible, with no unparenthesized comma.
 * @param ARG_function_name
 *        Method to call, normally the enclosing one.
 * @param ...
 *        Its arguments, `_1` in place of `err_code`.
 */
#define LINKMAP_ERROR_EXEC_AND_THROW_ON_ERROR(ARG_ret_type, ARG_function_name, ...) \
  LINKMAP_UTIL_SEMICOLON_SAFE \
  ( \
    ARG_ret_type LINKMAP_ERROR_result; \
    if (::linkmap::error::exec_and_throw_on_error \
          ([&](::linkmap::Error_code* _1) -> ARG_ret_type { return ARG_function_name(__VA_ARGS__); }, \
           &LINKMAP_ERROR_result, err_code, LINKMAP_UTIL_WHERE_AM_I_LITERAL(ARG_function_name))) \
    { \
      return LINKMAP_ERROR_result; \
    } \
  )
