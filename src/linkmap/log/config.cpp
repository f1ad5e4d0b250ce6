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
#include "linkmap/log/config.hpp"
#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/lexical_cast.hpp>
#include <locale>
#include <ostream>

namespace linkmap::log
{

// Static initializations.

const Sev Config::S_DEFAULT_SEV = Sev::S_INFO;
const Config::raw_sev_t Config::S_SEV_UNSET = raw_sev_t(-1);

// Implementations.

Config::Config(Sev default_sev) :
  m_use_human_friendly_time_stamps(true),
  m_default_sev(raw_sev_t(default_sev))
{
  // Nothing.
}

Config::Config(const Config& src) :
  m_use_human_friendly_time_stamps(src.m_use_human_friendly_time_stamps),
  m_default_sev(src.m_default_sev.load()),
  m_components(src.m_components),
  m_idxs_by_key(src.m_idxs_by_key),
  m_idxs_by_name(src.m_idxs_by_name)
{
  // Nothing.
}

Config::Registered_component::Registered_component(std::string name) :
  m_name(std::move(name)),
  m_sev(S_SEV_UNSET)
{
  // Nothing.
}

Config::Registered_component::Registered_component(const Registered_component& src) :
  m_name(src.m_name),
  m_sev(src.m_sev.load())
{
  // Nothing.
}

void Config::register_component(const Component_key& key, std::string name)
{
  const auto idx_it = m_idxs_by_key.find(key);
  if (idx_it == m_idxs_by_key.end())
  {
    m_idxs_by_name[name] = m_components.size();
    m_idxs_by_key.emplace(key, m_components.size());
    m_components.emplace_back(std::move(name));
    return;
  }
  // else: a new name for a known component.

  auto& registered = m_components[idx_it->second];
  m_idxs_by_name.erase(registered.m_name);
  m_idxs_by_name[name] = idx_it->second;
  registered.m_name = std::move(name);
}

const Config::Registered_component* Config::find_component(const Component_key& key) const
{
  const auto idx_it = m_idxs_by_key.find(key);
  return (idx_it == m_idxs_by_key.end()) ? nullptr : &m_components[idx_it->second];
}

const Config::Registered_component* Config::find_component(util::String_view name) const
{
  const auto idx_it = m_idxs_by_name.find(normalized_name(name));
  return (idx_it == m_idxs_by_name.end()) ? nullptr : &m_components[idx_it->second];
}

bool Config::should_log(Sev sev, const Component& component) const
{
  auto most_verbose = S_SEV_UNSET;
  if (!component.empty())
  {
    const auto registered = find_component(Component_key(component.payload_type_index(),
                                                         component.payload_enum_raw_value()));
    if (registered)
    {
      most_verbose = registered->m_sev.load(std::memory_order_relaxed);
    }
  }
  if (most_verbose == S_SEV_UNSET)
  {
    most_verbose = m_default_sev.load(std::memory_order_relaxed);
  }

  return raw_sev_t(sev) <= most_verbose;
}

bool Config::output_component(std::ostream* os, const Component& component) const
{
  if (component.empty())
  {
    return false;
  }
  // else
  const auto registered = find_component(Component_key(component.payload_type_index(),
                                                       component.payload_enum_raw_value()));
  if (!registered)
  {
    return false;
  }
  // else
  *os << registered->m_name;
  return true;
}

void Config::set_default_verbosity(Sev sev, bool reset_components)
{
  m_default_sev = raw_sev_t(sev);
  if (reset_components)
  {
    for (const auto& registered : m_components)
    {
      registered.m_sev = S_SEV_UNSET;
    }
  }
}

bool Config::set_component_verbosity_by_name(Sev sev, util::String_view name)
{
  const auto registered = find_component(name);
  if (!registered)
  {
    return false;
  }
  // else
  registered->m_sev = raw_sev_t(sev);
  return true;
}

bool Config::parse_verbosity(util::String_view verbosity, std::string* err_msg)
{
  using boost::algorithm::iequals;
  using boost::algorithm::is_any_of;
  using boost::algorithm::split;
  using std::string;
  using std::vector;

  const auto fail = [&](const string& why) -> bool
  {
    if (err_msg)
    {
      *err_msg = why;
    }
    return false;
  };

  // (component or null for the default, severity), in order.
  vector<std::pair<const Registered_component*, Sev>> settings;

  const string verbosity_str(verbosity);
  vector<string> items;
  if (!verbosity_str.empty())
  {
    split(items, verbosity_str, is_any_of(";"));
  }
  for (const auto& item : items)
  {
    vector<string> fields;
    split(fields, item, is_any_of(":"));
    if (item.empty() || (fields.size() > 2))
    {
      return fail(util::ostream_op_string("Item [", item, "] in [", verbosity_str, "] is not "
                                          "`<sev>`, `ALL:<sev>` or `<component>:<sev>`."));
    }
    // else

    const string& sev_str = fields.back();
    Sev sev = Sev::S_END_SENTINEL;
    try
    {
      sev = boost::lexical_cast<Sev>(sev_str);
    }
    catch (const boost::bad_lexical_cast&)
    {
      // Trailing junk after the name.  Leave sev as the sentinel.
    }
    // `>>` reads an unknown name as NONE; so NONE only counts if spelled out.
    if ((sev == Sev::S_END_SENTINEL) || ((sev == Sev::S_NONE) && (!iequals(sev_str, "NONE"))))
    {
      return fail(util::ostream_op_string("[", sev_str, "] in [", verbosity_str, "] is not a severity."));
    }
    // else

    const Registered_component* registered = nullptr;
    if ((fields.size() == 2) && (!iequals(fields.front(), "ALL")))
    {
      registered = find_component(fields.front());
      if (!registered)
      {
        return fail(util::ostream_op_string("Component [", fields.front(), "] is not registered."));
      }
    }
    settings.emplace_back(registered, sev);
  } // for (item : items)

  // All valid.  Apply.
  set_default_verbosity(S_DEFAULT_SEV, true);
  for (const auto& setting : settings)
  {
    if (setting.first)
    {
      setting.first->m_sev = raw_sev_t(setting.second);
    }
    else
    {
      m_default_sev = raw_sev_t(setting.second);
    }
  }

  if (err_msg)
  {
    err_msg->clear();
  }
  return true;
} // Config::parse_verbosity()

std::string Config::normalized_name(util::String_view name) // Static.
{
  return boost::algorithm::to_upper_copy(std::string(name), std::locale::classic());
}

} // namespace linkmap::log
