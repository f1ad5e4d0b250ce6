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
#include "linkmap/log/ostream_log_msg_writer.hpp"
#include "linkmap/log/config.hpp"
#include <fmt/chrono.h>
#include <fmt/format.h>
#include <array>

namespace linkmap::log
{

namespace
{

/// Four-letter tags of the Sev values, indexed by value.
const std::array<util::String_view, size_t(Sev::S_END_SENTINEL)> S_SEV_TAGS
  = {{ "null", "fatl", "eror", "warn", "info", "debg", "trce", "data" }};

} // namespace (anonymous)

// Implementations.

Ostream_log_msg_writer::Ostream_log_msg_writer(const Config& config, std::ostream& os) :
  m_config(config),
  m_os(os)
{
  // Nothing.
}

void Ostream_log_msg_writer::log(const Msg_metadata& metadata, util::String_view msg)
{
  using boost::chrono::duration_cast;
  using boost::chrono::microseconds;
  using boost::chrono::system_clock;

  const auto usec_since_epoch = duration_cast<microseconds>(metadata.m_called_when.time_since_epoch()).count();
  const auto usec = usec_since_epoch % 1000000;

  // fmt does the padding, so the stream's fill and width stay untouched.
  if (m_config.m_use_human_friendly_time_stamps)
  {
    const auto local_tm = fmt::localtime(system_clock::to_time_t(metadata.m_called_when));
    m_os << fmt::format("{0:%Y-%m-%d %H:%M:%S}.{1:06} {0:%z} ", local_tm, usec);
  }
  else
  {
    m_os << fmt::format("{}.{:06} ", usec_since_epoch / 1000000, usec);
  }

  m_os << '[' << S_SEV_TAGS[size_t(metadata.m_msg_sev)] << "]: T" << metadata.m_call_thread_id << ": ";
  if (m_config.output_component(&m_os, metadata.m_msg_component))
  {
    m_os << ": ";
  }
  m_os << util::get_where_am_i_str(metadata.m_msg_src_file, metadata.m_msg_src_function, metadata.m_msg_src_line)
       << ": " << msg << std::endl;
} // Ostream_log_msg_writer::log()

} // namespace linkmap::log
