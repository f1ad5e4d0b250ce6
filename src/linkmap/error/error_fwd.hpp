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

#include "linkmap/util/util_fwd.hpp"
#include "linkmap/common.hpp"

/**
 * Linkmap module supporting the `Error_code* err_code` convention (see the linkmap namespace doc header): the
 * Runtime_error exception and macros that make a method honor the convention with little code.  The codes
 * themselves belong to the modules emitting them, e.g., linkmap::map::error::Code.
 */
namespace linkmap::error
{

// Types.

// Find doc headers near the bodies of these compound types.

class Runtime_error;

// Free functions.

/**
 * The part of LINKMAP_ERROR_EXEC_AND_THROW_ON_ERROR() that is not a macro.  With a non-null `err_code` it only
 * returns `false`, and the caller goes on to do the work itself.  With a null one it calls `func` with a local
 * #Error_code; on failure it throws Runtime_error with that code and `context`, and on success it stores the result
 * in `*ret` and returns `true`.
 *
 * @tparam Func
 *         Callable as `Ret func(Error_code*)`.
 * @tparam Ret
 *         Result type.
 * @param func
 *        The operation, given a non-null `Error_code*`.
 * @param ret
 *        Receives the result.
 * @param err_code
 *        The `err_code` the caller got.
 * @param context
 *        Exception context, such as the call site.
 * @return Whether `func` ran.
 */
template<typename Func, typename Ret>
bool exec_and_throw_on_error(const Func& func, Ret* ret, Error_code* err_code, util::String_view context);

} // namespace linkmap::error
