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
#include "linkmap/util/util.hpp"
#include "linkmap/log/log.hpp"
#include <gtest/gtest.h>
#include <iomanip>
#include <iterator>
#include <sstream>

namespace linkmap::util::test
{

namespace
{
using std::string;
} // Anonymous namespace

TEST(Util_misc, Ostream_op_string)
{
  EXPECT_EQ(ostream_op_string("size [", 3, "] ok [", true, "] ", std::setw(3), 'x'), "size [3] ok [1]   x");
  EXPECT_EQ(ostream_op_string(), "");
  EXPECT_EQ(ostream_op_string(log::Sev::S_TRACE), "TRACE");
}

TEST(Util_misc, Where_am_i)
{
  EXPECT_EQ(get_last_path_segment("/usr/src/map.hpp"), "map.hpp");
  EXPECT_EQ(get_last_path_segment("C:\\src\\map.hpp"), "map.hpp");
  EXPECT_EQ(get_last_path_segment("map.hpp"), "map.hpp");
  EXPECT_EQ(get_last_path_segment("src/"), "");
  static_assert(get_last_path_segment("a/b.cpp") == String_view("b.cpp"), "Should be usable at compile time.");

  EXPECT_EQ(get_where_am_i_str("map.hpp", "at", 12), "map.hpp:at(12)");
  const string here = LINKMAP_UTIL_WHERE_AM_I_STR();
  EXPECT_EQ(here.find("util_test.cpp:TestBody("), 0u) << here;
}

TEST(Util_misc, Istream_to_enum)
{
  using log::Sev;

  const auto read = [](const string& text, string* rest)
  {
    std::istringstream is(text);
    const auto result = istream_to_enum(&is, Sev::S_NONE, Sev::S_END_SENTINEL);
    rest->assign(std::istreambuf_iterator<char>(is), std::istreambuf_iterator<char>());
    return result;
  };

  string rest;
  EXPECT_EQ(read("warning", &rest), Sev::S_WARNING);
  EXPECT_TRUE(rest.empty());
  EXPECT_EQ(read("TrAcE:linkmap-map", &rest), Sev::S_TRACE);
  EXPECT_EQ(rest, ":linkmap-map");
  EXPECT_EQ(read("tracer", &rest), Sev::S_NONE);
  EXPECT_EQ(read(" info", &rest), Sev::S_NONE);
  EXPECT_EQ(rest, " info");

  // Values below enum_lowest are not candidates.
  std::istringstream is("none");
  EXPECT_EQ(istream_to_enum(&is, Sev::S_INFO, Sev::S_END_SENTINEL, Sev::S_FATAL), Sev::S_INFO);
}

TEST(String_ostream, Interface)
{
  String_ostream own;
  own.os() << "abc" << 12 << std::flush;
  EXPECT_EQ(own.str(), "abc12");

  string target = "pre-";
  {
    String_ostream os(&target);
    EXPECT_EQ(&os.str(), &target);
    os.os() << std::setw(4) << std::setfill('0') << 7 << std::flush;
  }
  EXPECT_EQ(target, "pre-0007");
}

} // namespace linkmap::util::test
