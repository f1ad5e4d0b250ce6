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

#include <boost/iterator/filter_iterator.hpp>
#include <boost/iterator/transform_iterator.hpp>
#include <cassert>
#include <cstddef>
#include <optional>
#include <utility>
#include <vector>

namespace linkmap::map::detail
{

// Types.

/**
 * The insertion-ordered half of a Linked_hash_map: a dense, position-addressable sequence of slots, each either
 * occupied by a key/mapped-value pair or a tombstone left behind by an erasure.  Appending never moves existing
 * slots, and tombstoning one never shifts the others; so a position, once handed out by append(), stays valid
 * (and is recorded in the map's index) until the owner rebuilds the whole log.
 *
 * Iteration (begin(), end()) visits only the occupied slots, in position order.  slots() exposes the raw
 * sequence, tombstones included, for the rare algorithm that needs it (reverse walks; position-preserving
 * transforms).
 *
 * ### Thread safety ###
 * Same as for `std::vector<>`.  (In practice a log is only modified while its owning map is being built, after
 * which it is never touched except through `const` access.)
 *
 * @tparam Key_t
 *         See Linked_hash_map.
 * @tparam Mapped_t
 *         See Linked_hash_map.
 */
template<typename Key_t, typename Mapped_t>
class Ordered_log
{
public:
  // Types.

  /// Convenience alias for template arg.
  using Key = Key_t;

  /// Convenience alias for template arg.
  using Mapped = Mapped_t;

  /// Contents of an occupied slot.
  using Value = std::pair<Key, Mapped>;

  /// A slot: a #Value if occupied; `nullopt` if a tombstone.
  using Slot = std::optional<Value>;

  /// The underlying sequence.
  using Slot_seq = std::vector<Slot>;

  /// Type for index into the log; and for the log's size.
  using size_type = std::size_t;

  /// Predicate selecting the occupied slots.
  struct Slot_is_occupied
  {
    /**
     * Returns `true` if and only if `slot` is not a tombstone.
     * @param slot
     *        The slot.
     * @return See above.
     */
    bool operator()(const Slot& slot) const { return slot.has_value(); }
  };

  /// Function object yielding the #Value inside an occupied slot.
  struct Slot_to_value
  {
    /**
     * Returns the contents of `slot`, which must not be a tombstone.
     * @param slot
     *        The slot.
     * @return See above.
     */
    const Value& operator()(const Slot& slot) const { return *slot; }
  };

  /// Iterator over the #Value of each occupied slot, in position order.
  using Const_iterator
    = boost::transform_iterator<Slot_to_value,
                                boost::filter_iterator<Slot_is_occupied, typename Slot_seq::const_iterator>>;

  // Constructors/destructor.

  /// Constructs an empty log.
  Ordered_log();

  // Methods.

  /**
   * Adds an occupied slot holding `value` at position size().
   *
   * @param value
   *        The key/mapped-value pair.
   * @return The new slot's position.
   */
  size_type append(Value value);

  /**
   * Turns the occupied slot at `pos` into a tombstone.  No other slot moves.
   *
   * @param pos
   *        Position of an occupied slot.
   */
  void tombstone(size_type pos);

  /**
   * Replaces the mapped-value in the occupied slot at `pos`, keeping its key and position.
   *
   * @param pos
   *        Position of an occupied slot.
   * @param mapped
   *        The new mapped-value.
   */
  void replace_mapped(size_type pos, Mapped mapped);

  /**
   * Pre-allocates room for `n` slots in total.
   * @param n
   *        Slot count.
   */
  void reserve(size_type n);

  /**
   * Returns the raw slot sequence, tombstones included.
   * @return See above.
   */
  const Slot_seq& slots() const;

  /**
   * Returns the number of slots, tombstones included.
   * @return See above.
   */
  size_type size() const;

  /**
   * Returns the number of occupied slots.
   * @return See above.
   */
  size_type n_occupied() const;

  /**
   * Returns iterator to the first occupied slot's #Value; or end() if none.
   * @return See above.
   */
  Const_iterator begin() const;

  /**
   * Returns the past-the-end counterpart of begin().
   * @return See above.
   */
  Const_iterator end() const;

  /**
   * Returns a log of the same shape (same size; tombstones at the same positions) whose each occupied slot
   * holds the same key and the mapped-value `func(key, mapped)` computed from the corresponding slot of `*this`.
   * `func` is invoked on the occupied slots in position order.
   *
   * @tparam New_mapped
   *         The resulting log's `Mapped` type.
   * @tparam Func
   *         Callable as `New_mapped func(const Key&, const Mapped&)`.
   * @param func
   *        The transform.
   * @return See above.
   */
  template<typename New_mapped, typename Func>
  Ordered_log<Key, New_mapped> transformed(const Func& func) const;

private:
  // Friends.

  /// Other instantiations (differing in `Mapped`), so transformed() can fill in its result directly.
  template<typename Other_key, typename Other_mapped>
  friend class Ordered_log;

  // Data.

  /// The slots; position is index.
  Slot_seq m_slots;

  /// Count of non-tombstone elements in #m_slots.
  size_type m_n_occupied;
}; // class Ordered_log

// Template implementations.

template<typename Key_t, typename Mapped_t>
Ordered_log<Key_t, Mapped_t>::Ordered_log() :
  m_n_occupied(0)
{
  // That's all.
}

template<typename Key_t, typename Mapped_t>
typename Ordered_log<Key_t, Mapped_t>::size_type Ordered_log<Key_t, Mapped_t>::append(Value value)
{
  m_slots.emplace_back(std::move(value));
  ++m_n_occupied;
  return m_slots.size() - 1;
}

template<typename Key_t, typename Mapped_t>
void Ordered_log<Key_t, Mapped_t>::tombstone(size_type pos)
{
  assert(pos < m_slots.size());
  assert(m_slots[pos]);

  m_slots[pos].reset();
  --m_n_occupied;
}

template<typename Key_t, typename Mapped_t>
void Ordered_log<Key_t, Mapped_t>::replace_mapped(size_type pos, Mapped mapped)
{
  assert(pos < m_slots.size());
  assert(m_slots[pos]);

  m_slots[pos]->second = std::move(mapped);
}

template<typename Key_t, typename Mapped_t>
void Ordered_log<Key_t, Mapped_t>::reserve(size_type n)
{
  m_slots.reserve(n);
}

template<typename Key_t, typename Mapped_t>
const typename Ordered_log<Key_t, Mapped_t>::Slot_seq& Ordered_log<Key_t, Mapped_t>::slots() const
{
  return m_slots;
}

template<typename Key_t, typename Mapped_t>
typename Ordered_log<Key_t, Mapped_t>::size_type Ordered_log<Key_t, Mapped_t>::size() const
{
  return m_slots.size();
}

template<typename Key_t, typename Mapped_t>
typename Ordered_log<Key_t, Mapped_t>::size_type Ordered_log<Key_t, Mapped_t>::n_occupied() const
{
  return m_n_occupied;
}

template<typename Key_t, typename Mapped_t>
typename Ordered_log<Key_t, Mapped_t>::Const_iterator Ordered_log<Key_t, Mapped_t>::begin() const
{
  return Const_iterator(boost::make_filter_iterator(Slot_is_occupied(), m_slots.begin(), m_slots.end()),
                        Slot_to_value());
}

template<typename Key_t, typename Mapped_t>
typename Ordered_log<Key_t, Mapped_t>::Const_iterator Ordered_log<Key_t, Mapped_t>::end() const
{
  return Const_iterator(boost::make_filter_iterator(Slot_is_occupied(), m_slots.end(), m_slots.end()),
                        Slot_to_value());
}

template<typename Key_t, typename Mapped_t>
template<typename New_mapped, typename Func>
Ordered_log<Key_t, New_mapped> Ordered_log<Key_t, Mapped_t>::transformed(const Func& func) const
{
  Ordered_log<Key, New_mapped> result;
  result.m_slots.reserve(m_slots.size());

  for (const auto& slot : m_slots)
  {
    if (slot)
    {
      result.m_slots.emplace_back(std::in_place, slot->first, func(slot->first, slot->second));
    }
    else
    {
      result.m_slots.emplace_back(); // Tombstone stays a tombstone, at the same position.
    }
  }
  result.m_n_occupied = m_n_occupied;

  return result;
} // Ordered_log::transformed()

} // namespace linkmap::map::detail
