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
#include "linkmap/test/test_common_util.hpp"
#include "linkmap/util/string_ostream.hpp"
#include <regex>

namespace linkmap::test
{

bool check_output(const std::string& output, const std::vector<std::string>& regexes)
{
  for (const auto& regex : regexes)
  {
    if (!std::regex_search(output, std::regex(regex)))
    {
      return false;
    }
  }
  return true;
}

std::string collect_output(const std::function<void()>& func, std::ostream& os, bool echo)
{
  util::String_ostream captured;
  std::streambuf* const orig_buf = os.rdbuf(captured.os().rdbuf());
  func();
  os.flush();
  os.rdbuf(orig_buf);
  captured.os().flush();

  if (echo)
  {
    os << captured.str() << std::flush;
  }
  return captured.str();
}

} // namespace linkmap::test
