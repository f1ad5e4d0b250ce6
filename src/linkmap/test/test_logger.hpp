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

#include "linkmap/log/config.hpp"
#include "linkmap/log/simple_ostream_logger.hpp"
#include "linkmap/common.hpp"

namespace linkmap::test
{

/**
 * Console Logger for tests that just want to see what was logged.  Linkmap's components are registered as
 * `LINKMAP-*`; the filter is #s_default_sev unless the test asks for something else.
 */
class Test_logger :
  public log::Logger
{
public:
  // Data.

  /// Default filter of new loggers.  The test program sets it from its `--minloglevel` option.
  static log::Sev s_default_sev;

  // Constructors/destructor.

  /**
   * Constructs the logger.
   *
   * @param sev
   *        Most verbose severity let through.
   */
  explicit Test_logger(log::Sev sev = s_default_sev);

  // Methods.

  /**
   * The filter and format settings, for a test to adjust.
   * @return See above.
   */
  log::Config& config();

  /**
   * Forwards to the console logger.
   *
   * @param sev
   *        Severity.
   * @param component
   *        Component.
   * @return See above.
   */
  bool should_log(log::Sev sev, const log::Component& component) const override;

  /**
   * Forwards to the console logger.
   *
   * @param metadata
   *        Call site information.
   * @param msg
   *        Message.
   */
  void do_log(const log::Msg_metadata& metadata, util::String_view msg) override;

private:
  // Data.

  /// Settings of #m_logger.
  log::Config m_config;

  /// Writes to `cout` and `cerr`.
  log::Simple_ostream_logger m_logger;
}; // class Test_logger

} // namespace linkmap::test
