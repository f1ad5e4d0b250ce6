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

#include <cstddef>

namespace linkmap::map::detail
{

// Types.

/**
 * What the index of a Linked_hash_map stores per key: the position of the key's slot in the Ordered_log, plus
 * (a copy of) the mapped-value, so that a lookup never needs to touch the log.
 *
 * @tparam Mapped_t
 *         See Linked_hash_map.
 */
template<typename Mapped_t>
struct Entry
{
  // Types.

  /// Convenience alias for template arg.
  using Mapped = Mapped_t;

  // Data.

  /// Index of the key's slot within the log.  Stable until the owning map is packed.
  std::size_t m_pos;

  /// The mapped-value; always equal to the one in the slot at #m_pos.
  Mapped m_mapped;
}; // struct Entry

// Free functions.

/**
 * Returns `true` if and only if the two entries hold equal mapped-values.  The positions are ignored: they are
 * a detail of the representation, not of the map's value.
 *
 * @relatesalso Entry
 *
 * @param val1
 *        Object to compare.
 * @param val2
 *        Object to compare.
 * @return See above.
 */
template<typename Mapped_t>
bool operator==(const Entry<Mapped_t>& val1, const Entry<Mapped_t>& val2)
{
  return val1.m_mapped == val2.m_mapped;
}

/**
 * Negation of the `==` counterpart.
 *
 * @relatesalso Entry
 *
 * @param val1
 *        Object to compare.
 * @param val2
 *        Object to compare.
 * @return See above.
 */
template<typename Mapped_t>
bool operator!=(const Entry<Mapped_t>& val1, const Entry<Mapped_t>& val2)
{
  return !(val1 == val2);
}

} // namespace linkmap::map::detail
