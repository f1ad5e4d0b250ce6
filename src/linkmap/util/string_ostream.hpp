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
#include <boost/iostreams/device/back_inserter.hpp>
#include <boost/iostreams/stream.hpp>
#include <boost/noncopyable.hpp>
#include <string>

namespace linkmap::util
{

/**
 * `ostream` appending to an `std::string` that the user reads in place.  The string is the one passed to the
 * constructor or, given null, one owned by `*this`.  Output shows up in str() once os() is flushed.
 *
 * The log macros build each message with one of these, straight into the `std::string` they hand to the Logger.
 */
class String_ostream :
  private boost::noncopyable
{
public:
  // Constructors/destructor.

  /**
   * Constructs the stream.
   *
   * @param target_str
   *        String to append to; or null to use an internal one.  Leave it alone while `*this` exists.
   */
  explicit String_ostream(std::string* target_str = nullptr);

  // Methods.

  /**
   * The stream.
   * @return See above.
   */
  std::ostream& os();

  /**
   * The string written so far (up to the last flush).
   * @return See above.
   */
  const std::string& str() const;

private:
  // Data.

  /// Target when the constructor got null.
  std::string m_own_str;

  /// Where output goes.
  std::string& m_str;

  /// Appends to #m_str.
  boost::iostreams::stream<boost::iostreams::back_insert_device<std::string>> m_os;
}; // class String_ostream

} // namespace linkmap::util
