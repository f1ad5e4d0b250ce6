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

#include "linkmap/common.hpp"
#include <boost/functional/hash.hpp>
#include <functional>
#include <ostream>

/**
 * Linkmap module containing Linked_hash_map, an immutable hash map that remembers the order in which its keys were
 * first inserted; plus the free functions that combine such maps (union_of(), difference(), ...).
 *
 * A Linked_hash_map is a value: no operation modifies it.  insert(), erase(), and the rest return a new map, while
 * the original remains usable and unchanged.  Copying one is a reference-count increment.
 */
namespace linkmap::map
{

// Types.

// Find doc headers near the bodies of these compound types.

template<typename Key, typename Mapped, typename Hash = boost::hash<Key>, typename Pred = std::equal_to<Key>>
class Linked_hash_map;

// Free functions.

/**
 * Equivalent to `val1.swap(val2)`.
 *
 * @relatesalso Linked_hash_map
 * @param val1
 *        Object.
 * @param val2
 *        Object.
 */
template<typename Key, typename Mapped, typename Hash, typename Pred>
void swap(Linked_hash_map<Key, Mapped, Hash, Pred>& val1, Linked_hash_map<Key, Mapped, Hash, Pred>& val2);

/**
 * Returns `true` if and only if the two maps hold the same number of key/mapped-value pairs and, walking both in
 * order, each pair of keys is equivalent according to `val1.key_eq()` and each pair of mapped values compares equal
 * by `Mapped::operator==()`.  Order matters.  Tombstones, positions, and loggers do not take part.  So two maps
 * with a case-insensitive `Pred` compare equal when their keys differ only in case.
 *
 * @relatesalso Linked_hash_map
 * @param val1
 *        Object to compare.
 * @param val2
 *        Object to compare.
 * @return See above.
 */
template<typename Key, typename Mapped, typename Hash, typename Pred>
bool operator==(const Linked_hash_map<Key, Mapped, Hash, Pred>& val1,
                const Linked_hash_map<Key, Mapped, Hash, Pred>& val2);

/**
 * Negation of the `==` counterpart.
 *
 * @relatesalso Linked_hash_map
 * @param val1
 *        Object to compare.
 * @param val2
 *        Object to compare.
 * @return See above.
 */
template<typename Key, typename Mapped, typename Hash, typename Pred>
bool operator!=(const Linked_hash_map<Key, Mapped, Hash, Pred>& val1,
                const Linked_hash_map<Key, Mapped, Hash, Pred>& val2);

/**
 * Prints the map's pairs, in order, in the form `fromList [(k1, v1), (k2, v2)]`.  #Key and #Mapped must be
 * `ostream`-printable.
 *
 * @relatesalso Linked_hash_map
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
template<typename Key, typename Mapped, typename Hash, typename Pred>
std::ostream& operator<<(std::ostream& os, const Linked_hash_map<Key, Mapped, Hash, Pred>& val);

/**
 * Equivalent to `val1.union_of(val2)`: the left-biased union.
 *
 * @relatesalso Linked_hash_map
 * @param val1
 *        The map whose values and order win.
 * @param val2
 *        The other map.
 * @return See Linked_hash_map::union_of().
 */
template<typename Key, typename Mapped, typename Hash, typename Pred>
Linked_hash_map<Key, Mapped, Hash, Pred> union_of(const Linked_hash_map<Key, Mapped, Hash, Pred>& val1,
                                                  const Linked_hash_map<Key, Mapped, Hash, Pred>& val2);

/**
 * Equivalent to `val1.union_with(func, val2)`.
 *
 * @relatesalso Linked_hash_map
 * @tparam Func
 *         See Linked_hash_map::union_with().
 * @param func
 *        Combines `val1`'s and `val2`'s values for a key in both: `func(val1_mapped, val2_mapped)`.
 * @param val1
 *        The map whose order wins.
 * @param val2
 *        The other map.
 * @return See Linked_hash_map::union_with().
 */
template<typename Key, typename Mapped, typename Hash, typename Pred, typename Func>
Linked_hash_map<Key, Mapped, Hash, Pred> union_with(const Func& func,
                                                    const Linked_hash_map<Key, Mapped, Hash, Pred>& val1,
                                                    const Linked_hash_map<Key, Mapped, Hash, Pred>& val2);

/**
 * Left-biased union of all the maps in a range: `union_of(...union_of(union_of(empty, m1), m2)..., mN)`.
 * Equivalent to `Map::unions(maps.begin(), maps.end())`.
 *
 * @relatesalso Linked_hash_map
 * @tparam Map_range
 *         A range (e.g., `std::vector`) of Linked_hash_map objects; `Map_range::value_type` must be the map type.
 * @param maps
 *        The maps.
 * @return See above.
 */
template<typename Map_range>
typename Map_range::value_type unions(const Map_range& maps);

/**
 * Equivalent to `val1.difference(val2)`.
 *
 * @relatesalso Linked_hash_map
 * @param val1
 *        The map whose pairs are kept.
 * @param val2
 *        The map whose keys are removed.
 * @return See Linked_hash_map::difference().
 */
template<typename Key, typename Mapped, typename Hash, typename Pred, typename Other_mapped>
Linked_hash_map<Key, Mapped, Hash, Pred> difference(const Linked_hash_map<Key, Mapped, Hash, Pred>& val1,
                                                    const Linked_hash_map<Key, Other_mapped, Hash, Pred>& val2);

/**
 * Equivalent to `val1.intersection(val2)`.
 *
 * @relatesalso Linked_hash_map
 * @param val1
 *        The map whose pairs are kept.
 * @param val2
 *        The map whose keys select them.
 * @return See Linked_hash_map::intersection().
 */
template<typename Key, typename Mapped, typename Hash, typename Pred, typename Other_mapped>
Linked_hash_map<Key, Mapped, Hash, Pred> intersection(const Linked_hash_map<Key, Mapped, Hash, Pred>& val1,
                                                      const Linked_hash_map<Key, Other_mapped, Hash, Pred>& val2);

/**
 * Equivalent to `val1.intersection_with(func, val2)`.
 *
 * @relatesalso Linked_hash_map
 * @tparam Func
 *         See Linked_hash_map::intersection_with().
 * @param func
 *        See Linked_hash_map::intersection_with().
 * @param val1
 *        The map whose order is kept.
 * @param val2
 *        The other map.
 * @return See Linked_hash_map::intersection_with().
 */
template<typename Key, typename Mapped, typename Hash, typename Pred, typename Other_mapped, typename Func>
typename Linked_hash_map<Key, Mapped, Hash, Pred>::template Intersection_with_result<Func, Other_mapped>
  intersection_with(const Func& func,
                    const Linked_hash_map<Key, Mapped, Hash, Pred>& val1,
                    const Linked_hash_map<Key, Other_mapped, Hash, Pred>& val2);

} // namespace linkmap::map
