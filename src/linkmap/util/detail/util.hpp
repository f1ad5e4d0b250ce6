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

namespace linkmap::util
{

// Free functions.

/**
 * The part of `full_path` after its last `/` or `\`, or all of it if there is none.  The result views the same
 * characters.  `constexpr` so that the log macros can strip `__FILE__` at compile time.
 *
 * @param full_path
 *        A path.
 * @return See above.
 */
constexpr String_view get_last_path_segment(String_view full_path)
{
  const auto sep_pos = full_path.find_last_of("/\\");
  return (sep_pos == String_view::npos) ? full_path : full_path.substr(sep_pos + 1);
}

} // namespace linkmap::util
