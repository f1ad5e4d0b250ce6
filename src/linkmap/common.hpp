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

#include <boost/system/error_code.hpp>
#include <boost/unordered_map.hpp>
#include <string>

// Linked_hash_map and the log macros are header-inlined, so the including translation unit needs C++17 as well.
#if (!defined(__cplusplus)) || (__cplusplus < 201703L)
#  error "Translation units including linkmap/ headers must be compiled as C++17 or later."
#endif

/**
 * Top-level namespace of Linkmap: an immutable hash map that remembers insertion order
 * (map::Linked_hash_map), and the handful of modules it leans on for logging (log), exceptions (error), and small
 * utilities (util).
 *
 * Each module `X` is a sub-namespace; `X/X_fwd.hpp` holds its forward declarations and free function prototypes,
 * and internals live under `X/detail/`.  Only the names used all over the place sit directly in `linkmap`.
 *
 * A method that can fail takes a trailing `Error_code* err_code`.  Passing a non-null pointer gets the outcome
 * written there; passing null gets an error::Runtime_error thrown on failure.  A failure that can only be a caller
 * bug (Linked_hash_map::at() with an absent key) always throws.
 */
namespace linkmap
{

// Types.

/// boost.system error code.  Falsy means success.
using Error_code = boost::system::error_code;

/// Log component payloads used by Linkmap's own log call sites.  See log::Component.
enum class Linkmap_log_component : unsigned int
{
  /// Not in any particular module (e.g., example programs).
  S_UNCAT = 0,
  /// linkmap::map.
  S_MAP,
  /// Not a value; one past the last one.
  S_END_SENTINEL
}; // enum class Linkmap_log_component

/// Names of the #Linkmap_log_component values, for log::Config::register_components().
extern const boost::unordered_map<Linkmap_log_component, std::string> S_LINKMAP_LOG_COMPONENT_NAME_MAP;

} // namespace linkmap
