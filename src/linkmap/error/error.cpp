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
#include "linkmap/error/error.hpp"

namespace linkmap::error
{

// Implementations.

Runtime_error::Runtime_error(const Error_code& err_code_or_success, util::String_view context) :
  // With a falsy code the base would tack a meaningless message onto the context; so then keep the context here.
  boost::system::system_error(err_code_or_success, err_code_or_success ? std::string(context) : std::string()),
  m_what_without_code(err_code_or_success ? std::string() : std::string(context))
{
  // Nothing.
}

Runtime_error::Runtime_error(util::String_view context) :
  Runtime_error(Error_code(), context)
{
  // Nothing.
}

const char* Runtime_error::what() const noexcept // Virtual.
{
  if (code())
  {
    return boost::system::system_error::what();
  }
  // else
  return m_what_without_code.c_str();
}

} // namespace linkmap::error
