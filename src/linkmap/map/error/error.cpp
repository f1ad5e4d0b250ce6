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
#include "linkmap/map/error/error.hpp"

namespace linkmap::map::error
{

namespace
{

/// boost.system category of the #Code values.
class Category :
  public boost::system::error_category
{
public:
  /**
   * Category name.
   * @return See above.
   */
  const char* name() const noexcept override
  {
    return "linkmap/map";
  }

  /**
   * Text of a code; matches the doc comment of its #Code member.
   *
   * @param val
   *        `int` value of a #Code.
   * @return See above.
   */
  std::string message(int val) const override
  {
    switch (Code(val))
    {
    case Code::S_KEY_NOT_FOUND:
      return "Key not found.";
    case Code::S_TRAVERSE_ABORTED:
      return "Traversal aborted by the supplied function.";
    }
    return "Unknown linkmap/map error code [" + std::to_string(val) + "].";
  }
}; // class Category

/// The one Category.
const Category S_CATEGORY{};

} // namespace (anonymous)

// Implementations.

Error_code make_error_code(Code err_code)
{
  return Error_code(int(err_code), S_CATEGORY);
}

} // namespace linkmap::map::error
