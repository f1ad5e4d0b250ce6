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

#include "linkmap/log/log.hpp"
#include <boost/unordered_map.hpp>
#include <atomic>
#include <cstdint>
#include <string>
#include <typeindex>
#include <utility>
#include <vector>

namespace linkmap::log
{

// Types.

/**
 * Filter and naming settings for the Logger implementations of this module.
 *
 * A message passes should_log() if its severity is no more verbose than the one set for its component, or the
 * default severity if its component has none set (or is not registered, or is empty).  Components become known via
 * register_components(), which also names them; names are what output_component() prints and what
 * set_component_verbosity_by_name() and parse_verbosity() accept.  For example:
 *
 *   ~~~
 *   log::Config config;
 *   config.register_components(S_LINKMAP_LOG_COMPONENT_NAME_MAP, "linkmap-");
 *   config.parse_verbosity("warning;linkmap-map:trace"); // Only the map logs below WARNING.
 *   ~~~
 *
 * Register everything before logging starts.  After that, should_log() and output_component() are safe to call
 * concurrently with each other and with the `set_*()` methods and parse_verbosity().
 */
class Config
{
public:
  // Constants.

  /// Default severity of a new Config, and the one parse_verbosity() starts from: Sev::S_INFO.
  static const Sev S_DEFAULT_SEV;

  // Constructors/destructor.

  /**
   * No components; the given default severity.
   *
   * @param default_sev
   *        Default severity.
   */
  explicit Config(Sev default_sev = S_DEFAULT_SEV);

  /**
   * Copies the registrations and the current severities of `src`.
   *
   * @param src
   *        Source object.
   */
  Config(const Config& src);

  // Methods.

  /// Not assignable.
  Config& operator=(const Config&) = delete;

  /**
   * Registers each value in `names` under the name `name_prefix` + its name, upper-cased.  Re-registering a value
   * renames it.  Values absent from `names` stay unregistered: the default severity applies to them, and they
   * print no component name.
   *
   * @tparam Component_payload
   *         A Component payload `enum`.
   * @param names
   *        Value-to-name map; names must be unique across everything registered.
   * @param name_prefix
   *        Prepended to every name.
   */
  template<typename Component_payload>
  void register_components(const boost::unordered_map<Component_payload, std::string>& names,
                           util::String_view name_prefix = util::String_view());

  /**
   * Whether a message with the given severity and component passes.  See class doc header.
   *
   * @param sev
   *        Severity.
   * @param component
   *        Component; may be empty().
   * @return See above.
   */
  bool should_log(Sev sev, const Component& component) const;

  /**
   * Prints the registered name of `component`, if it has one.
   *
   * @param os
   *        Stream.
   * @param component
   *        Component; may be empty().
   * @return `true` if something was printed.
   */
  bool output_component(std::ostream* os, const Component& component) const;

  /**
   * Sets the default severity.
   *
   * @param sev
   *        Severity.
   * @param reset_components
   *        Also forget every per-component severity.
   */
  void set_default_verbosity(Sev sev, bool reset_components);

  /**
   * Sets the severity of one registered component.
   *
   * @tparam Component_payload
   *         A Component payload `enum`.
   * @param sev
   *        Severity.
   * @param component_payload
   *        The component.
   * @return `false` if it is not registered (nothing changes); else `true`.
   */
  template<typename Component_payload>
  bool set_component_verbosity(Sev sev, Component_payload component_payload);

  /**
   * Sets the severity of the component registered under `name` (prefix included, any case).
   *
   * @param sev
   *        Severity.
   * @param name
   *        Name.
   * @return `false` if there is no such name (nothing changes); else `true`.
   */
  bool set_component_verbosity_by_name(Sev sev, util::String_view name);

  /**
   * Sets all severities from text such as `"warning;linkmap-map:trace"`: items separated by `;`, each either
   * `<sev>` or `ALL:<sev>` (the default severity) or `<component name>:<sev>`.  The Config is first reset to
   * #S_DEFAULT_SEV with no per-component severities; then the items apply left to right.  Empty text just resets.
   *
   * If any item is malformed, or names an unknown component or severity, nothing changes at all.
   *
   * @param verbosity
   *        The text.
   * @param err_msg
   *        If not null: on failure, what was wrong; on success, cleared.
   * @return `true` on success.
   */
  bool parse_verbosity(util::String_view verbosity, std::string* err_msg = nullptr);

  // Data.  (Public!)

  /// Time stamps in loggers using `*this`: local date and time if `true`; seconds since Epoch if `false`.
  bool m_use_human_friendly_time_stamps;

private:
  // Types.

  /// Sev as stored; #S_SEV_UNSET means none set.
  using raw_sev_t = uint8_t;

  /// A registered component: its name and severity.
  struct Registered_component
  {
    /**
     * Named, with no severity set.
     * @param name
     *        Name.
     */
    explicit Registered_component(std::string name);

    /**
     * Copies `src`, loading its severity.
     * @param src
     *        Source object.
     */
    Registered_component(const Registered_component& src);

    /// Full, upper-cased name.
    std::string m_name;

    /// Severity, or #S_SEV_UNSET.  Changes while the rest of `*this` stays put.
    mutable std::atomic<raw_sev_t> m_sev;
  }; // struct Registered_component

  /// A Component minus its emptiness: payload type and value.
  using Component_key = std::pair<std::type_index, Component::enum_raw_t>;

  // Constants.

  /// See #raw_sev_t.
  static const raw_sev_t S_SEV_UNSET;

  // Methods.

  /**
   * Non-template core of register_components().
   *
   * @param key
   *        The component.
   * @param name
   *        Full, upper-cased name.
   */
  void register_component(const Component_key& key, std::string name);

  /**
   * The registered component for `key`, or null.
   * @param key
   *        The component.
   * @return See above.
   */
  const Registered_component* find_component(const Component_key& key) const;

  /**
   * The registered component named `name` (any case), or null.
   * @param name
   *        Name.
   * @return See above.
   */
  const Registered_component* find_component(util::String_view name) const;

  /**
   * `name` upper-cased.
   * @param name
   *        Name.
   * @return See above.
   */
  static std::string normalized_name(util::String_view name);

  // Data.

  /// Default severity.
  std::atomic<raw_sev_t> m_default_sev;

  /// Registered components.  Grows only during registration.
  std::vector<Registered_component> m_components;

  /// Index into #m_components by component.
  boost::unordered_map<Component_key, size_t> m_idxs_by_key;

  /// Index into #m_components by name.
  boost::unordered_map<std::string, size_t> m_idxs_by_name;
}; // class Config

// Template implementations.

template<typename Component_payload>
void Config::register_components(const boost::unordered_map<Component_payload, std::string>& names,
                                 util::String_view name_prefix)
{
  for (const auto& payload_and_name : names)
  {
    const Component component(payload_and_name.first);
    register_component(Component_key(component.payload_type_index(), component.payload_enum_raw_value()),
                       normalized_name(std::string(name_prefix) + payload_and_name.second));
  }
}

template<typename Component_payload>
bool Config::set_component_verbosity(Sev sev, Component_payload component_payload)
{
  const Component component(component_payload);
  const auto registered = find_component(Component_key(component.payload_type_index(),
                                                       component.payload_enum_raw_value()));
  if (!registered)
  {
    return false;
  }
  // else
  registered->m_sev = raw_sev_t(sev);
  return true;
}

} // namespace linkmap::log
