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
#include "linkmap/util/detail/util.hpp"
#include "linkmap/util/string_ostream.hpp"
#include <boost/algorithm/string/predicate.hpp>
#include <boost/lexical_cast.hpp>
#include <cctype>
#include <istream>
#include <locale>
#include <type_traits>

namespace linkmap::util
{

// Template implementations.

template<typename... T>
std::string ostream_op_string(const T&... ostream_args)
{
  std::string result;
  {
    String_ostream os(&result);
    (os.os() << ... << ostream_args) << std::flush;
  }
  return result;
}

template<typename Enum>
Enum istream_to_enum(std::istream* is_ptr, Enum enum_default, Enum enum_sentinel, Enum enum_lowest)
{
  using boost::algorithm::iequals;
  using boost::lexical_cast;
  using std::string;
  using raw_t = std::underlying_type_t<Enum>;

  const auto is_name_char = [](int ch) { return (std::isalnum(ch) != 0) || (ch == '_'); };

  string name;
  while (is_ptr->good() && is_name_char(is_ptr->peek()))
  {
    name.push_back(char(is_ptr->get()));
  }
  if (name.empty())
  {
    return enum_default;
  }
  // else

  for (auto raw = raw_t(enum_lowest); raw != raw_t(enum_sentinel); ++raw)
  {
    if (iequals(name, lexical_cast<string>(Enum(raw)), std::locale::classic()))
    {
      return Enum(raw);
    }
  }
  return enum_default;
} // istream_to_enum()

} // namespace linkmap::util
