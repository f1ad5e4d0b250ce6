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
#include "linkmap/log/simple_ostream_logger.hpp"
#include "linkmap/log/config.hpp"

namespace linkmap::log
{

// Implementations.

Simple_ostream_logger::Simple_ostream_logger(Config* config, std::ostream& os, std::ostream& os_for_err) :
  m_config(config),
  m_writer(*m_config, os),
  m_err_writer(*m_config, os_for_err)
{
  // Nothing.
}

bool Simple_ostream_logger::should_log(Sev sev, const Component& component) const // Virtual.
{
  return m_config->should_log(sev, component);
}

void Simple_ostream_logger::do_log(const Msg_metadata& metadata, util::String_view msg) // Virtual.
{
  util::Lock_guard<util::Mutex_non_recursive> lock(m_mutex);
  ((metadata.m_msg_sev <= Sev::S_WARNING) ? m_err_writer : m_writer).log(metadata, msg);
}

Config* Simple_ostream_logger::config() const
{
  return m_config;
}

} // namespace linkmap::log
