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

#include "linkmap/log/log_fwd.hpp"
#include "linkmap/util/util.hpp"
#include <boost/chrono/system_clocks.hpp>
#include <boost/noncopyable.hpp>
#include <boost/thread/thread.hpp>
#include <typeindex>
#include <typeinfo>
#include <type_traits>

// Macros.  These (conceptually) belong to the linkmap::log namespace (hence the prefix for each macro).

/**
 * Logs a WARNING message to `get_logger()` under component `get_log_component()`, both looked up at the call
 * site (normally the accessors of a log::Log_context base).  Example:
 *
 *   ~~~
 *   LINKMAP_LOG_WARNING("Key [" << key << "] absent; map has [" << size() << "] keys.");
 *   ~~~
 *
 * Nothing happens, and the fragment is not evaluated, if the logger is null or filters the message out.
 *
 * @param ARG_stream_fragment
 *        What one would write after `os <<`, without a trailing newline.
 */
#define LINKMAP_LOG_WARNING(ARG_stream_fragment) \
  LINKMAP_LOG_WITH_CHECKING(::linkmap::log::Sev::S_WARNING, ARG_stream_fragment)

/**
 * Logs an INFO message.  See LINKMAP_LOG_WARNING().
 *
 * @param ARG_stream_fragment
 *        See LINKMAP_LOG_WARNING().
 */
#define LINKMAP_LOG_INFO(ARG_stream_fragment) \
  LINKMAP_LOG_WITH_CHECKING(::linkmap::log::Sev::S_INFO, ARG_stream_fragment)

/**
 * Logs a TRACE message.  See LINKMAP_LOG_WARNING().
 *
 * @param ARG_stream_fragment
 *        See LINKMAP_LOG_WARNING().
 */
#define LINKMAP_LOG_TRACE(ARG_stream_fragment) \
  LINKMAP_LOG_WITH_CHECKING(::linkmap::log::Sev::S_TRACE, ARG_stream_fragment)

/**
 * The body of the severity macros above: asks Logger::should_log(); if it agrees, formats the fragment, collects
 * the call site's metadata, and passes both to Logger::do_log().
 *
 * @param ARG_sev
 *        A log::Sev.
 * @param ARG_stream_fragment
 *        See LINKMAP_LOG_WARNING().
 */
#define LINKMAP_LOG_WITH_CHECKING(ARG_sev, ARG_stream_fragment) \
  LINKMAP_UTIL_SEMICOLON_SAFE \
  ( \
    ::linkmap::log::Logger* const LINKMAP_LOG_logger = get_logger(); \
    if ((!LINKMAP_LOG_logger) || (!LINKMAP_LOG_logger->should_log(ARG_sev, get_log_component()))) \
    { \
      break; \
    } \
    /* else */ \
    std::string LINKMAP_LOG_msg; \
    { \
      ::linkmap::util::String_ostream LINKMAP_LOG_msg_os(&LINKMAP_LOG_msg); \
      LINKMAP_LOG_msg_os.os() << ARG_stream_fragment << std::flush; \
    } \
    /* Stripped at compile time. */ \
    constexpr ::linkmap::util::String_view LINKMAP_LOG_file = ::linkmap::util::get_last_path_segment(__FILE__); \
    /* Parenthesized so the commas do not split macro arguments. */ \
    const ::linkmap::log::Msg_metadata LINKMAP_LOG_metadata \
      ({ get_log_component(), ARG_sev, LINKMAP_LOG_file, __LINE__, __FUNCTION__, \
         ::boost::chrono::system_clock::now(), ::boost::this_thread::get_id() }); \
    LINKMAP_LOG_logger->do_log(LINKMAP_LOG_metadata, LINKMAP_LOG_msg); \
  )

namespace linkmap::log
{

// Types.

/**
 * Which part of the program a message comes from: a value of some `enum` together with which `enum` it is, so that
 * Linkmap's #Linkmap_log_component and the user's own component `enum`s can coexist in one Config.
 * Default-constructed means no component.
 */
class Component
{
public:
  // Types.

  /// Integer form of a payload.  The underlying type of every payload `enum` must be exactly this.
  using enum_raw_t = unsigned int;

  // Constructors/destructor.

  /// No component.
  Component();

  /**
   * Component for the given `enum` value.
   *
   * @tparam Payload
   *         `enum` (normally `enum class`) with underlying type #enum_raw_t.
   * @param payload
   *        The value.
   */
  template<typename Payload>
  Component(Payload payload);

  // Methods.

  /**
   * `true` if default-constructed.
   * @return See above.
   */
  bool empty() const;

  /**
   * The payload as `Payload`, which must be the type it was constructed with.  Not for an empty() Component.
   *
   * @tparam Payload
   *         See constructor.
   * @return See above.
   */
  template<typename Payload>
  Payload payload() const;

  /**
   * Identifies the payload's `enum` type.  Not for an empty() Component.
   * @return See above.
   */
  std::type_index payload_type_index() const;

  /**
   * The payload as an integer.  Not for an empty() Component.
   * @return See above.
   */
  enum_raw_t payload_enum_raw_value() const;

private:
  // Data.

  /// `typeid` of the payload type; null if empty().
  const std::type_info* m_payload_type;

  /// The payload as an integer.
  enum_raw_t m_payload_raw;
}; // class Component

/// Everything a Logger gets about a message besides its text.
struct Msg_metadata
{
  // Data.

  /// Component; may be empty().
  Component m_msg_component;

  /// Severity; a real one (not NONE or END_SENTINEL).
  Sev m_msg_sev;

  /// Source file, no directory.
  util::String_view m_msg_src_file;

  /// Source line.
  unsigned int m_msg_src_line;

  /// Function logging.
  util::String_view m_msg_src_function;

  /// Time of the call.
  boost::chrono::system_clock::time_point m_called_when;

  /// Thread of the call.
  util::Thread_id m_call_thread_id;
}; // struct Msg_metadata

/**
 * Receives log messages.  Implement it to send Linkmap's messages wherever the rest of the application logs.
 *
 * Both methods may be called from several threads at once (one Linked_hash_map may be read by many threads), so an
 * implementation must cope with that.
 */
class Logger :
  private boost::noncopyable
{
public:
  // Constructors/destructor.

  /// Boring virtual destructor.
  virtual ~Logger();

  // Methods.

  /**
   * Filter: whether a message of this severity and component should be logged.  The macros only format a message
   * after this returns `true`.
   *
   * @param sev
   *        Severity.
   * @param component
   *        Component; may be empty().
   * @return See above.
   */
  virtual bool should_log(Sev sev, const Component& component) const = 0;

  /**
   * Logs a message that passed should_log().  Neither argument may be used after this returns.
   *
   * @param metadata
   *        Call site information.
   * @param msg
   *        The text, without trailing newline.
   */
  virtual void do_log(const Msg_metadata& metadata, util::String_view msg) = 0;
}; // class Logger

/**
 * Base for classes that log: supplies the get_logger() and get_log_component() the `LINKMAP_LOG_...()` macros
 * call.  Copyable, so a derived value type can pass its logger on to the objects it creates.
 */
class Log_context
{
public:
  // Constructors/destructor.

  /**
   * Stores the logger and no component.
   *
   * @param logger
   *        Logger, or null for no logging.
   */
  explicit Log_context(Logger* logger = nullptr);

  /**
   * Stores the logger and component.
   *
   * @tparam Component_payload
   *         See Component.
   * @param logger
   *        Logger, or null for no logging.
   * @param component_payload
   *        Component value.
   */
  template<typename Component_payload>
  explicit Log_context(Logger* logger, Component_payload component_payload);

  // Methods.

  /**
   * Exchanges logger and component with `other`.
   *
   * @param other
   *        The other object.
   */
  void swap(Log_context& other);

  /**
   * The logger; may be null.
   * @return See above.
   */
  Logger* get_logger() const;

  /**
   * The component.
   * @return See above.
   */
  const Component& get_log_component() const;

private:
  // Data.

  /// See get_logger().
  Logger* m_logger;

  /// See get_log_component().
  Component m_component;
}; // class Log_context

// Template implementations.

template<typename Payload>
Component::Component(Payload payload) :
  m_payload_type(&typeid(Payload)),
  m_payload_raw(static_cast<enum_raw_t>(payload))
{
  static_assert(std::is_enum_v<Payload> && std::is_same_v<std::underlying_type_t<Payload>, enum_raw_t>,
                "A component payload must be an enum whose underlying type is enum_raw_t.");
}

template<typename Payload>
Payload Component::payload() const
{
  return Payload(m_payload_raw);
}

template<typename Component_payload>
Log_context::Log_context(Logger* logger, Component_payload component_payload) :
  m_logger(logger),
  m_component(component_payload)
{
  // Nothing.
}

} // namespace linkmap::log
