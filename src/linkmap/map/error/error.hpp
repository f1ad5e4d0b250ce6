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

/// Error codes of the linkmap::map module.  Assignable straight to #Error_code thanks to make_error_code().
namespace linkmap::map::error
{

// Types.

/// The codes.  Category name: `linkmap/map`.
enum class Code
{
  /// Key not found.
  S_KEY_NOT_FOUND = 1,
  /// Traversal aborted by the supplied function.
  S_TRAVERSE_ABORTED
}; // enum class Code

// Functions.

/**
 * The #Error_code for `err_code`.  Found by ADL when a #Code converts to #Error_code.
 *
 * @param err_code
 *        A code.
 * @return See above.
 */
Error_code make_error_code(Code err_code);

} // namespace linkmap::map::error

namespace boost::system
{

// Types.

/// Lets linkmap::map::error::Code convert implicitly to linkmap::Error_code.
template<>
struct is_error_code_enum<::linkmap::map::error::Code>
{
  /// See above.
  static const bool value = true;
};

} // namespace boost::system
