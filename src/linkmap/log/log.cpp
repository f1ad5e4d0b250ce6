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
#include "linkmap/log/log.hpp"
#include <array>
#include <ostream>
#include <utility>

namespace linkmap::log
{

namespace
{

/// Names of the Sev values, indexed by value.
const std::array<util::String_view, size_t(Sev::S_END_SENTINEL)> S_SEV_NAMES
  = {{ "NONE", "FATAL", "ERROR", "WARNING", "INFO", "DEBUG", "TRACE", "DATA" }};

} // namespace (anonymous)

// Implementations.

Logger::~Logger() = default;

Component::Component() :
  m_payload_type(nullptr),
  m_payload_raw(0)
{
  // Nothing.
}

bool Component::empty() const
{
  return m_payload_type == nullptr;
}

std::type_index Component::payload_type_index() const
{
  return *m_payload_type;
}

Component::enum_raw_t Component::payload_enum_raw_value() const
{
  return m_payload_raw;
}

Log_context::Log_context(Logger* logger) :
  m_logger(logger)
{
  // Nothing.
}

void Log_context::swap(Log_context& other)
{
  std::swap(m_logger, other.m_logger);
  std::swap(m_component, other.m_component);
}

Logger* Log_context::get_logger() const
{
  return m_logger;
}

const Component& Log_context::get_log_component() const
{
  return m_component;
}

std::ostream& operator<<(std::ostream& os, Sev val)
{
  if (val < Sev::S_END_SENTINEL)
  {
    return os << S_SEV_NAMES[size_t(val)];
  }
  // else
  return os << "SEV_" << size_t(val);
}

std::istream& operator>>(std::istream& is, Sev& val)
{
  val = util::istream_to_enum(&is, Sev::S_NONE, Sev::S_END_SENTINEL);
  return is;
}

} // namespace linkmap::log
