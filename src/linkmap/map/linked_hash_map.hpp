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

#include "linkmap/map/map_fwd.hpp"
#include "linkmap/map/detail/entry.hpp"
#include "linkmap/map/detail/ordered_log.hpp"
#include "linkmap/map/error/error.hpp"
#include "linkmap/error/error.hpp"
#include "linkmap/log/log.hpp"
#include <boost/make_shared.hpp>
#include <boost/shared_ptr.hpp>
#include <boost/unordered_map.hpp>
#include <algorithm>
#include <cstddef>
#include <initializer_list>
#include <optional>
#include <type_traits>
#include <utility>
#include <vector>

namespace linkmap::map
{

// Types.

/**
 * An immutable map from unique keys to mapped-values that remembers the order in which each key was first inserted.
 * Lookup by key has the speed of an `unordered_map<>`; iteration, to_list(), and the folds go in insertion order.
 *
 * The object is a value.  None of the methods modifies `*this` (except assignment and swap()); those that
 * "modify" -- insert(), insert_with(), adjust(), erase(), pack(), and the bulk operations -- return a new map and
 * leave `*this` as it was.  So:
 *
 *   ~~~
 *   using Map = linkmap::map::Linked_hash_map<std::string, int>;
 *   const Map m1{ { "a", 1 }, { "b", 2 } };
 *   const auto m2 = m1.insert("c", 3).erase("a"); // m2 is fromList [(b, 2), (c, 3)].
 *   // m1 is still fromList [(a, 1), (b, 2)].
 *   ~~~
 *
 * Ordering rules:
 *   - Inserting a key not yet in the map puts it last.
 *   - Inserting a key already in the map replaces its mapped-value but keeps its place.
 *   - Erasing a key removes it; the others keep their relative order.  Re-inserting it later puts it last.
 *
 * ### Performance ###
 * Copying a map (including copy-assignment, and "moving", which is the same thing) is constant-time: the
 * representation is immutable and shared through a reference-counted pointer.  Every query (lookup(), at(),
 * member(), size(), ...) is a hash lookup or constant-time.  Every method producing a new map is linear in its
 * size, because it builds a fresh representation (full copy-on-write).  Building a map through a long chain of
 * insert() calls is therefore quadratic; use from_list() (or the range/`initializer_list` constructors) or one of
 * the bulk operations instead, all of which are linear.
 *
 * ### Representation ###
 * Each map owns (jointly with its copies) an immutable `Rep`:
 *   - An *index*: `boost::unordered_map` from #Key to detail::Entry, i.e., (position, mapped-value).
 *   - An *ordered log*: detail::Ordered_log, the slots in insertion order, each holding a key/mapped-value pair or
 *     a tombstone left behind by erase().
 *
 * For every key in the index, the log slot at the entry's position holds that key and the same mapped-value; and the
 * number of occupied slots equals the index's size().  erase() tombstones the key's slot rather than shifting the
 * others.  When (after an erase()) tombstones make up at least half of the log, the log is rebuilt without them
 * ("packed"); pack() does the same on demand.  log_size() exposes the slot count, tombstones included.
 *
 * ### Logging ###
 * The map is a log::Log_context (component Linkmap_log_component::S_MAP) with the logger given at construction,
 * null by default.  Every map derived from a given one (by insert(), map(), union_with(), ...) uses the same logger.
 * Logged: compaction (TRACE); duplicate-key handling in from_list() (TRACE); at() on a missing key (WARNING);
 * traverse_with_key() failure (INFO).
 *
 * ### Thread safety ###
 * Any number of threads may use the same map (and its copies) concurrently, as long as none assigns to or swaps that
 * particular object.  The functions passed to the bulk operations are invoked on the calling thread, sequentially.
 *
 * @tparam Key_t
 *         Key type.  Must be copyable, and #Hash and #Pred must be applicable to it.
 * @tparam Mapped_t
 *         The mapped-value type.  Must be copyable.
 * @tparam Hash_t
 *         Hasher type.  Same requirements and behavior as `boost::unordered_map<>` counterpart.  With the default
 *         (`boost::hash<Key>`), a #Key type lacking a hash function can be given one via a free function
 *         `size_t hash_value(const Key&)` in the same namespace as #Key.
 * @tparam Pred_t
 *         Equality-determiner type.  Same requirements and behavior as `boost::unordered_map<>` counterpart.
 */
template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
class Linked_hash_map :
  public log::Log_context
{
public:
  // Types.

  /// Convenience alias for template arg.
  using Key = Key_t;

  /// Convenience alias for template arg.
  using Mapped = Mapped_t;

  /// Convenience alias for template arg.
  using Hash = Hash_t;

  /// Convenience alias for template arg.
  using Pred = Pred_t;

  /// Short-hand for key/mapped-value pairs, as yielded by iteration and to_list().
  using Value = std::pair<Key, Mapped>;

  /// The sequence type of to_list() and from_list().
  using Value_list = std::vector<Value>;

  /// Type for index into array of items, where items are all applicable objects including `Value`s and `Key`s.
  using size_type = std::size_t;

  /// Type for difference of `size_type`s.
  using difference_type = std::ptrdiff_t;

  /// Type for iterating over the pairs, in order; #Value is read-only through it.
  using Const_iterator = typename detail::Ordered_log<Key, Mapped>::Const_iterator;

  // Standard-container spellings of the above, so generic code and `<algorithm>` can use the map.

  /// Same as #Key.
  using key_type = Key;
  /// Same as #Mapped.
  using mapped_type = Mapped;
  /// Same as #Value.
  using value_type = Value;
  /// Same as #Hash.
  using hasher = Hash;
  /// Same as #Pred.
  using key_equal = Pred;
  using const_pointer = const Value*;
  using const_reference = const Value&;
  /// Same as #Const_iterator.
  using const_iterator = Const_iterator;
  /// Also #Const_iterator: nothing can be modified through an iterator of an immutable map.
  using iterator = Const_iterator;

  /**
   * Type of map returned by map() given a `Func`: same keys, mapped-values of the type `Func` returns.
   * @tparam Func
   *         See map().
   */
  template<typename Func>
  using Map_result
    = Linked_hash_map<Key, std::decay_t<std::invoke_result_t<const Func&, const Mapped&>>, Hash, Pred>;

  /**
   * Type of map returned by map_with_key() given a `Func`.
   * @tparam Func
   *         See map_with_key().
   */
  template<typename Func>
  using Map_with_key_result
    = Linked_hash_map<Key, std::decay_t<std::invoke_result_t<const Func&, const Key&, const Mapped&>>, Hash, Pred>;

  /**
   * Type of map returned by traverse_with_key() given a `Func`.
   * @tparam Func
   *         See traverse_with_key().
   */
  template<typename Func>
  using Traverse_result
    = Linked_hash_map<Key,
                      std::decay_t<std::invoke_result_t<const Func&, const Key&, const Mapped&, Error_code*>>,
                      Hash, Pred>;

  /**
   * Type of map returned by intersection_with() given a `Func` and the other map's mapped-value type.
   * @tparam Func
   *         See intersection_with().
   * @tparam Other_mapped
   *         See intersection_with().
   */
  template<typename Func, typename Other_mapped>
  using Intersection_with_result
    = Linked_hash_map<Key,
                      std::decay_t<std::invoke_result_t<const Func&, const Mapped&, const Other_mapped&>>,
                      Hash, Pred>;

  // Constructors/destructor.

  /**
   * Constructs an empty map.
   *
   * @param logger_ptr
   *        The logger for this map and all maps derived from it; null (the default) disables logging.
   * @param hasher_obj
   *        Hashes a #Key; keys equal per `pred` must hash the same.
   * @param pred
   *        Key equality; decides which keys count as the same key, here and in `operator==()`.
   */
  explicit Linked_hash_map(log::Logger* logger_ptr = nullptr,
                           const Hash& hasher_obj = Hash{},
                           const Pred& pred = Pred{});

  /**
   * Constructs a map from the given pairs, as from_list() would.  Typically:
   * `Map m{ { key1, value1 }, { key2, value2 } }`.
   *
   * @param values
   *        The pairs.  A key appearing more than once ends up at its first place, with its last value.
   * @param logger_ptr
   *        See other constructor.
   * @param hasher_obj
   *        See other constructor.
   * @param pred
   *        See other constructor.
   */
  explicit Linked_hash_map(std::initializer_list<Value> values,
                           log::Logger* logger_ptr = nullptr,
                           const Hash& hasher_obj = Hash{},
                           const Pred& pred = Pred{});

  /**
   * Constructs a map from the pairs in the range `[first, last)`, as from_list() would.
   *
   * @tparam Forward_it
   *         Forward iterator type whose pointee has `first` and `second` convertible to #Key and #Mapped.
   *         (The range may be walked twice.)
   * @param first
   *        Start of range.
   * @param last
   *        End of range.
   * @param logger_ptr
   *        See other constructor.
   * @param hasher_obj
   *        See other constructor.
   * @param pred
   *        See other constructor.
   */
  template<typename Forward_it>
  explicit Linked_hash_map(Forward_it first, Forward_it last,
                           log::Logger* logger_ptr = nullptr,
                           const Hash& hasher_obj = Hash{},
                           const Pred& pred = Pred{});

  /**
   * Constructs a map equal to `src`, sharing its representation; constant-time.  As there is no move constructor,
   * this one is used for moves as well, so a moved-from map remains unchanged.
   *
   * @param src
   *        Source object.
   */
  Linked_hash_map(const Linked_hash_map& src);

  // Methods.

  /**
   * Makes `*this` equal to `src`, sharing its representation (and logger); constant-time.
   *
   * @param src
   *        Source object.
   * @return `*this`.
   */
  Linked_hash_map& operator=(const Linked_hash_map& src);

  /**
   * Swaps the contents (and loggers) of this map and `other`; constant-time.
   *
   * @param other
   *        The other map.
   */
  void swap(Linked_hash_map& other);

  /**
   * Builds a map from a list of pairs.  The result equals folding insert() over `values` left to right, starting
   * from an empty map: a key appearing more than once sits at the place of its first occurrence and holds the
   * mapped-value of its last one.  Linear time.
   *
   * @param values
   *        The pairs.
   * @param logger_ptr
   *        See the 1st constructor.
   * @param hasher_obj
   *        See the 1st constructor.
   * @param pred
   *        See the 1st constructor.
   * @return See above.
   */
  static Linked_hash_map from_list(const Value_list& values,
                                   log::Logger* logger_ptr = nullptr,
                                   const Hash& hasher_obj = Hash{},
                                   const Pred& pred = Pred{});

  /**
   * Like from_list(), but a key's repeated occurrences are combined as insert_with() would combine them: the value
   * stored for a key after its occurrences `v1, v2, v3` is `func(v3, func(v2, v1))`.
   *
   * @tparam Func
   *         Callable as `Mapped func(const Mapped& new_mapped, const Mapped& old_mapped)`.
   * @param func
   *        The combining function.
   * @param values
   *        The pairs.
   * @param logger_ptr
   *        See the 1st constructor.
   * @param hasher_obj
   *        See the 1st constructor.
   * @param pred
   *        See the 1st constructor.
   * @return See above.
   */
  template<typename Func>
  static Linked_hash_map from_list_with(const Func& func,
                                        const Value_list& values,
                                        log::Logger* logger_ptr = nullptr,
                                        const Hash& hasher_obj = Hash{},
                                        const Pred& pred = Pred{});

  /**
   * Returns a map holding the one given pair.
   *
   * @param key
   *        The key.
   * @param mapped
   *        The mapped-value.
   * @param logger_ptr
   *        See the 1st constructor.
   * @param hasher_obj
   *        See the 1st constructor.
   * @param pred
   *        See the 1st constructor.
   * @return See above.
   */
  static Linked_hash_map singleton(const Key& key, const Mapped& mapped,
                                   log::Logger* logger_ptr = nullptr,
                                   const Hash& hasher_obj = Hash{},
                                   const Pred& pred = Pred{});

  /**
   * Left-biased union of the maps in `[first, last)`: `union_of(...union_of(union_of(empty, m1), m2)..., mN)`.
   * The result uses the logger, #Hash, and #Pred of the first map; if the range is empty, it is an empty map without
   * a logger.
   *
   * @tparam Input_it
   *         Input iterator type whose pointee is a `Linked_hash_map`.
   * @param first
   *        Start of range.
   * @param last
   *        End of range.
   * @return See above.
   */
  template<typename Input_it>
  static Linked_hash_map unions(Input_it first, Input_it last);

  /**
   * Returns the mapped-value for `key`, or `nullopt` if `key` is not in the map.
   *
   * @param key
   *        Key whose equal to look for.
   * @return See above.
   */
  std::optional<Mapped> lookup(const Key& key) const;

  /**
   * Returns `true` if and only if `key` is in the map.
   *
   * @param key
   *        Key whose equal to look for.
   * @return See above.
   */
  bool member(const Key& key) const;

  /**
   * Returns 1 if `key` is in the map; else 0.
   *
   * @param key
   *        Key whose equal to look for.
   * @return 0 or 1.
   */
  size_type count(const Key& key) const;

  /**
   * Returns the mapped-value for `key`, which must be in the map.  A missing key is a programming error: it is
   * logged (WARNING) and reported by throwing error::Runtime_error with error code
   * map::error::Code::S_KEY_NOT_FOUND.
   *
   * @param key
   *        Key whose equal to look for.
   * @return Reference to the mapped-value; valid as long as `*this` (or a copy of it) exists unchanged.
   */
  const Mapped& at(const Key& key) const;

  /**
   * Returns the mapped-value for `key`, or `default_mapped` if `key` is not in the map.
   *
   * @param default_mapped
   *        Value to return if `key` is not found.
   * @param key
   *        Key whose equal to look for.
   * @return See above.
   */
  Mapped lookup_default(const Mapped& default_mapped, const Key& key) const;

  /**
   * Returns `true` if and only if size() is 0.
   * @return See above.
   */
  bool empty() const;

  /**
   * Returns the number of keys in the map.  Constant-time.
   * @return See above.
   */
  size_type size() const;

  /**
   * Returns the number of slots in the ordered log: size() plus the tombstones left by erase() since the last
   * compaction.  Not part of the map's value (see `==`), but useful for reasoning about space use.
   *
   * @return See above.
   */
  size_type log_size() const;

  /**
   * Returns a map equal to `*this` but with `key` mapped to `mapped`.  If `key` was already present, it keeps
   * its place; otherwise it becomes last.
   *
   * @param key
   *        The key.
   * @param mapped
   *        The mapped-value.
   * @return See above.
   */
  Linked_hash_map insert(const Key& key, const Mapped& mapped) const;

  /**
   * Like insert(), except that if `key` is present with mapped-value `old_mapped`, it ends up holding
   * `func(mapped, old_mapped)` (note the order: new, old).
   *
   * @tparam Func
   *         Callable as `Mapped func(const Mapped& new_mapped, const Mapped& old_mapped)`.
   * @param func
   *        The combining function; not invoked if `key` is absent.
   * @param key
   *        The key.
   * @param mapped
   *        The new mapped-value.
   * @return See above.
   */
  template<typename Func>
  Linked_hash_map insert_with(const Func& func, const Key& key, const Mapped& mapped) const;

  /**
   * Returns a map equal to `*this` but with `key`'s mapped-value `old_mapped` replaced by `func(old_mapped)`; or
   * simply a copy of `*this` if `key` is absent.  The key keeps its place.
   *
   * @tparam Func
   *         Callable as `Mapped func(const Mapped& old_mapped)`.
   * @param func
   *        The update function.
   * @param key
   *        The key.
   * @return See above.
   */
  template<typename Func>
  Linked_hash_map adjust(const Func& func, const Key& key) const;

  /**
   * Returns a map equal to `*this` but without `key` (a copy of `*this`, if `key` is absent).  The other keys keep
   * their relative order.  The result is packed (see pack()) if at least half of its log slots would otherwise be
   * tombstones; that check is done even if `key` was absent.
   *
   * @param key
   *        The key.
   * @return See above.
   */
  Linked_hash_map erase(const Key& key) const;

  /**
   * Returns a map equal to `*this` whose log has no tombstones: `log_size() == size()`.
   * @return See above.
   */
  Linked_hash_map pack() const;

  /**
   * Returns the pairs, in order.
   * @return See above.
   */
  Value_list to_list() const;

  /**
   * Returns the keys, in order.
   * @return See above.
   */
  std::vector<Key> keys() const;

  /**
   * Returns the mapped-values, in order.
   * @return See above.
   */
  std::vector<Mapped> elems() const;

  /**
   * Returns a map with the same keys, in the same order, each mapped to `func(mapped)`.  The mapped-value type
   * of the result is whatever `func` returns.
   *
   * @tparam Func
   *         Callable as `New_mapped func(const Mapped&)`.
   * @param func
   *        The transform; invoked once per key, in order.
   * @return See above.
   */
  template<typename Func>
  Map_result<Func> map(const Func& func) const;

  /**
   * Like map(), but `func` also receives the key: `func(key, mapped)`.
   *
   * @tparam Func
   *         Callable as `New_mapped func(const Key&, const Mapped&)`.
   * @param func
   *        The transform; invoked once per key, in order.
   * @return See above.
   */
  template<typename Func>
  Map_with_key_result<Func> map_with_key(const Func& func) const;

  /**
   * Like map_with_key(), but `func` may fail.  `func` is called on each pair in order, one at a time, as
   * `func(key, mapped, &func_err_code)` with `func_err_code` initially falsy.  If `func` leaves it truthy, no further
   * calls are made, and the traversal as a whole fails with that error.  (map::error::Code::S_TRAVERSE_ABORTED is
   * available to `func` for this purpose, though any error will do.)
   *
   * @tparam Func
   *         Callable as `New_mapped func(const Key&, const Mapped&, Error_code*)`.
   * @param func
   *        The transform.
   * @param err_code
   *        See linkmap::error.  On failure: the error `func` emitted; the returned map is then empty.
   * @return The transformed map; or an empty map on failure (if `err_code` is non-null).
   */
  template<typename Func>
  Traverse_result<Func> traverse_with_key(const Func& func, Error_code* err_code = nullptr) const;

  /**
   * Left fold over the mapped-values, in order: `func(...func(func(init, v1), v2)..., vN)`.
   *
   * @tparam Func
   *         Callable as `Acc func(Acc acc, const Mapped&)`.
   * @tparam Acc
   *         Accumulator type.
   * @param func
   *        The step function.
   * @param init
   *        Initial accumulator.
   * @return See above.
   */
  template<typename Func, typename Acc>
  Acc fold_left(const Func& func, Acc init) const;

  /**
   * Right fold over the mapped-values, in order: `func(v1, func(v2, ...func(vN, init)...))`.  (So `func` is invoked
   * on the last value first.)
   *
   * @tparam Func
   *         Callable as `Acc func(const Mapped&, Acc acc)`.
   * @tparam Acc
   *         Accumulator type.
   * @param func
   *        The step function.
   * @param init
   *        Initial accumulator.
   * @return See above.
   */
  template<typename Func, typename Acc>
  Acc fold_right(const Func& func, Acc init) const;

  /**
   * Like fold_right(), but `func` also receives the key: `func(key, mapped, acc)`.
   *
   * @tparam Func
   *         Callable as `Acc func(const Key&, const Mapped&, Acc acc)`.
   * @tparam Acc
   *         Accumulator type.
   * @param func
   *        The step function.
   * @param init
   *        Initial accumulator.
   * @return See above.
   */
  template<typename Func, typename Acc>
  Acc fold_right_with_key(const Func& func, Acc init) const;

  /**
   * Returns a packed map of the pairs whose mapped-value satisfies `keep(mapped)`, in the same order.
   *
   * @tparam Func
   *         Callable as `bool keep(const Mapped&)`.
   * @param keep
   *        The predicate.
   * @return See above.
   */
  template<typename Func>
  Linked_hash_map filter(const Func& keep) const;

  /**
   * Returns a packed map of the pairs satisfying `keep(key, mapped)`, in the same order.
   *
   * @tparam Func
   *         Callable as `bool keep(const Key&, const Mapped&)`.
   * @param keep
   *        The predicate.
   * @return See above.
   */
  template<typename Func>
  Linked_hash_map filter_with_key(const Func& keep) const;

  /**
   * Left-biased union: every key of `*this` (with its mapped-value, at its place), followed by every key of
   * `other` absent from `*this`, in `other`'s order.  Equivalent to union_with() with a `func` returning its 1st
   * argument.
   *
   * @param other
   *        The other map.
   * @return See above.
   */
  Linked_hash_map union_of(const Linked_hash_map& other) const;

  /**
   * Union with a combining function: the result of inserting each pair `(k, other_mapped)` of `other`, in order,
   * into `*this` via `insert_with()`; where `k` is already in `*this` with `mapped`, the stored value is
   * `func(mapped, other_mapped)`.  Keys of `*this` keep their places; keys only in `other` follow them.
   *
   * @tparam Func
   *         Callable as `Mapped func(const Mapped& mapped, const Mapped& other_mapped)`.
   * @param func
   *        The combining function.
   * @param other
   *        The other map.
   * @return See above.
   */
  template<typename Func>
  Linked_hash_map union_with(const Func& func, const Linked_hash_map& other) const;

  /**
   * Returns a packed map of the pairs of `*this` whose key is not in `other`, in the same order.
   *
   * @tparam Other_mapped
   *         `other`'s mapped-value type; immaterial.
   * @param other
   *        The map whose keys to exclude.
   * @return See above.
   */
  template<typename Other_mapped>
  Linked_hash_map difference(const Linked_hash_map<Key, Other_mapped, Hash, Pred>& other) const;

  /**
   * Returns a packed map of the pairs of `*this` whose key is also in `other`, in the same order.
   *
   * @tparam Other_mapped
   *         `other`'s mapped-value type; immaterial.
   * @param other
   *        The map whose keys to keep.
   * @return See above.
   */
  template<typename Other_mapped>
  Linked_hash_map intersection(const Linked_hash_map<Key, Other_mapped, Hash, Pred>& other) const;

  /**
   * Returns a packed map of the keys in both `*this` and `other`, in `*this`'s order, each mapped to
   * `func(mapped, other_mapped)`.
   *
   * @tparam Func
   *         Callable as `New_mapped func(const Mapped& mapped, const Other_mapped& other_mapped)`.
   * @tparam Other_mapped
   *         `other`'s mapped-value type.
   * @param func
   *        The combining function.
   * @param other
   *        The other map.
   * @return See above.
   */
  template<typename Func, typename Other_mapped>
  Intersection_with_result<Func, Other_mapped>
    intersection_with(const Func& func, const Linked_hash_map<Key, Other_mapped, Hash, Pred>& other) const;

  /**
   * Returns the #Hash instance.
   * @return See above.
   */
  Hash hash_function() const;

  /**
   * Returns the #Pred instance.
   * @return See above.
   */
  Pred key_eq() const;

  /**
   * Returns iterator to the first pair, or end() if empty().  Iterators stay valid as long as `*this` (or a copy
   * of it) exists unchanged.
   *
   * @return See above.
   */
  Const_iterator begin() const;

  /**
   * Returns the past-the-end counterpart of begin().
   * @return See above.
   */
  Const_iterator end() const;

  /**
   * Synonym of begin().
   * @return See above.
   */
  Const_iterator cbegin() const;

  /**
   * Synonym of end().
   * @return See above.
   */
  Const_iterator cend() const;

private:
  // Friends.

  /// Instantiations with other mapped-value types build their results (map(), ...) through our private API.
  template<typename Other_key, typename Other_mapped, typename Other_hash, typename Other_pred>
  friend class Linked_hash_map;

  // Types.

  /// The index: key to (position in #Log, mapped-value).
  using Index = boost::unordered_map<Key, detail::Entry<Mapped>, Hash, Pred>;

  /// The ordered log of slots.
  using Log = detail::Ordered_log<Key, Mapped>;

  /// The representation shared by a map and its copies.  Immutable once a map points to it.
  struct Rep
  {
    /**
     * Constructs empty index and log.
     * @param hasher_obj
     *        See Linked_hash_map 1st constructor.
     * @param pred
     *        See Linked_hash_map 1st constructor.
     */
    explicit Rep(const Hash& hasher_obj, const Pred& pred);

    /// See Linked_hash_map doc header.
    Index m_index;

    /// See Linked_hash_map doc header.
    Log m_log;
  }; // struct Rep

  /// Pointer to the shared, immutable #Rep.
  using Rep_ptr = boost::shared_ptr<const Rep>;

  /// Pointer to a #Rep under construction.
  using Rep_mutable_ptr = boost::shared_ptr<Rep>;

  // Constructors.

  /**
   * Constructs a map with the given logging context and representation.
   *
   * @param log_ctx
   *        Logger and component to use.
   * @param rep
   *        The representation.  Must not be null.
   */
  explicit Linked_hash_map(const log::Log_context& log_ctx, Rep_ptr rep);

  // Methods.

  /**
   * Returns a new, mutable copy of #m_rep.
   * @return See above.
   */
  Rep_mutable_ptr copy_rep() const;

  /**
   * Builds a representation from the pairs in `[first, last)`, combining repeated keys' values with `combine`
   * as insert_with() would.
   *
   * @tparam Forward_it
   *         See range constructor.
   * @tparam Func
   *         See from_list_with().
   * @param first
   *        Start of range.
   * @param last
   *        End of range.
   * @param combine
   *        See from_list_with().
   * @param hasher_obj
   *        See 1st constructor.
   * @param pred
   *        See 1st constructor.
   * @return See above.
   */
  template<typename Forward_it, typename Func>
  Rep_mutable_ptr rep_from_range(Forward_it first, Forward_it last, const Func& combine,
                                 const Hash& hasher_obj, const Pred& pred) const;

  /**
   * Returns `*this`'s logging context with `rep` if `rep` has less than twice as many slots as keys (or no
   * tombstones at all); else with a packed copy of `rep`.
   *
   * @param rep
   *        The representation.
   * @return See above.
   */
  Linked_hash_map compacted_if_sparse(Rep_ptr rep) const;

  /**
   * Performs insert_with() in place on a representation under construction.
   *
   * @tparam Func
   *         See insert_with().
   * @param rep
   *        The representation.
   * @param func
   *        See insert_with().
   * @param key
   *        See insert_with().
   * @param mapped
   *        See insert_with().
   */
  template<typename Func>
  static void insert_with_in_rep(Rep* rep, const Func& func, const Key& key, const Mapped& mapped);

  /**
   * Builds a representation whose log is `log` and whose index is built to match it.
   *
   * @param log
   *        The log; moved-from.
   * @param hasher_obj
   *        See 1st constructor.
   * @param pred
   *        See 1st constructor.
   * @return See above.
   */
  static Rep_mutable_ptr rep_from_log(Log&& log, const Hash& hasher_obj, const Pred& pred);

  /**
   * Builds a packed copy of `rep`.
   *
   * @param rep
   *        The representation.
   * @return See above.
   */
  static Rep_mutable_ptr packed_rep(const Rep& rep);

  // Data.

  /// The representation; never null.  Shared with the copies of `*this`.
  Rep_ptr m_rep;
}; // class Linked_hash_map

// Free functions: in *_fwd.hpp.

// Template implementations.

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::Rep::Rep(const Hash& hasher_obj, const Pred& pred) :
  m_index(0, hasher_obj, pred)
{
  // That's all.
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::Linked_hash_map(log::Logger* logger_ptr,
                                                                  const Hash& hasher_obj,
                                                                  const Pred& pred) :
  log::Log_context(logger_ptr, Linkmap_log_component::S_MAP),
  m_rep(boost::make_shared<Rep>(hasher_obj, pred))
{
  // That's all.
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::Linked_hash_map(std::initializer_list<Value> values,
                                                                  log::Logger* logger_ptr,
                                                                  const Hash& hasher_obj,
                                                                  const Pred& pred) :
  Linked_hash_map(values.begin(), values.end(), logger_ptr, hasher_obj, pred)
{
  // That's all.
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
template<typename Forward_it>
Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::Linked_hash_map(Forward_it first, Forward_it last,
                                                                  log::Logger* logger_ptr,
                                                                  const Hash& hasher_obj,
                                                                  const Pred& pred) :
  log::Log_context(logger_ptr, Linkmap_log_component::S_MAP),
  // Log_context is set up by now, so rep_from_range() can log.
  m_rep(rep_from_range(first, last,
                       [](const Mapped& new_mapped, const Mapped&) -> Mapped { return new_mapped; },
                       hasher_obj, pred))
{
  // That's all.
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::Linked_hash_map(const Linked_hash_map& src) = default;

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::Linked_hash_map(const log::Log_context& log_ctx, Rep_ptr rep) :
  log::Log_context(log_ctx),
  m_rep(std::move(rep))
{
  // That's all.
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>&
  Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::operator=(const Linked_hash_map& src) = default;

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
void Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::swap(Linked_hash_map& other)
{
  using std::swap;

  log::Log_context::swap(other);
  swap(m_rep, other.m_rep); // Pointer exchange.
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>
  Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::from_list(const Value_list& values,
                                                              log::Logger* logger_ptr,
                                                              const Hash& hasher_obj,
                                                              const Pred& pred)
{
  return Linked_hash_map(values.begin(), values.end(), logger_ptr, hasher_obj, pred);
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
template<typename Func>
Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>
  Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::from_list_with(const Func& func,
                                                                   const Value_list& values,
                                                                   log::Logger* logger_ptr,
                                                                   const Hash& hasher_obj,
                                                                   const Pred& pred)
{
  Linked_hash_map result(logger_ptr, hasher_obj, pred);
  result.m_rep = result.rep_from_range(values.begin(), values.end(), func, hasher_obj, pred);
  return result;
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>
  Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::singleton(const Key& key, const Mapped& mapped,
                                                              log::Logger* logger_ptr,
                                                              const Hash& hasher_obj,
                                                              const Pred& pred)
{
  return Linked_hash_map({ Value(key, mapped) }, logger_ptr, hasher_obj, pred);
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
template<typename Input_it>
Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>
  Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::unions(Input_it first, Input_it last)
{
  if (first == last)
  {
    return Linked_hash_map();
  }
  // else

  /* union_of(empty, m1) is m1's pairs in m1's order, i.e., m1 packed.  From there on it is a plain fold; but do it
   * in one mutable Rep instead of one new Rep per map. */
  const Linked_hash_map head = *first;
  const auto rep = packed_rep(*head.m_rep);
  for (++first; first != last; ++first)
  {
    for (const auto& value : first->m_rep->m_log)
    {
      insert_with_in_rep(rep.get(),
                         [](const Mapped&, const Mapped& old_mapped) -> Mapped { return old_mapped; },
                         value.first, value.second);
    }
  }

  return Linked_hash_map(head, rep);
} // Linked_hash_map::unions()

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
std::optional<typename Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::Mapped>
  Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::lookup(const Key& key) const
{
  const auto idx_it = m_rep->m_index.find(key);
  if (idx_it == m_rep->m_index.end())
  {
    return std::nullopt;
  }
  return idx_it->second.m_mapped;
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
bool Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::member(const Key& key) const
{
  return m_rep->m_index.find(key) != m_rep->m_index.end();
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
typename Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::size_type
  Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::count(const Key& key) const
{
  return m_rep->m_index.count(key);
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
const typename Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::Mapped&
  Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::at(const Key& key) const
{
  const auto idx_it = m_rep->m_index.find(key);
  if (idx_it == m_rep->m_index.end())
  {
    const Error_code err_code(error::Code::S_KEY_NOT_FOUND);
    LINKMAP_ERROR_LOG_ERROR(err_code);
    throw ::linkmap::error::Runtime_error(err_code, LINKMAP_UTIL_WHERE_AM_I_STR());
  }
  // else

  return idx_it->second.m_mapped;
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
typename Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::Mapped
  Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::lookup_default(const Mapped& default_mapped,
                                                                   const Key& key) const
{
  const auto idx_it = m_rep->m_index.find(key);
  return (idx_it == m_rep->m_index.end()) ? default_mapped : idx_it->second.m_mapped;
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
bool Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::empty() const
{
  return m_rep->m_index.empty();
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
typename Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::size_type
  Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::size() const
{
  return m_rep->m_index.size();
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
typename Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::size_type
  Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::log_size() const
{
  return m_rep->m_log.size();
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>
  Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::insert(const Key& key, const Mapped& mapped) const
{
  return insert_with([](const Mapped& new_mapped, const Mapped&) -> Mapped { return new_mapped; },
                     key, mapped);
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
template<typename Func>
Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>
  Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::insert_with(const Func& func,
                                                                const Key& key, const Mapped& mapped) const
{
  const auto rep = copy_rep();
  insert_with_in_rep(rep.get(), func, key, mapped);
  return Linked_hash_map(*this, rep);
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
template<typename Func>
Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>
  Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::adjust(const Func& func, const Key& key) const
{
  if (!member(key))
  {
    return *this;
  }
  // else

  const auto rep = copy_rep();
  auto& entry = rep->m_index.find(key)->second;
  entry.m_mapped = func(static_cast<const Mapped&>(entry.m_mapped));
  rep->m_log.replace_mapped(entry.m_pos, entry.m_mapped);

  return Linked_hash_map(*this, rep);
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>
  Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::erase(const Key& key) const
{
  if (!member(key))
  {
    return compacted_if_sparse(m_rep);
  }
  // else

  const auto rep = copy_rep();
  const auto idx_it = rep->m_index.find(key);
  rep->m_log.tombstone(idx_it->second.m_pos);
  rep->m_index.erase(idx_it);

  return compacted_if_sparse(rep);
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t> Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::pack() const
{
  if (log_size() == size())
  {
    return *this; // Already packed.
  }
  // else
  return Linked_hash_map(*this, packed_rep(*m_rep));
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
typename Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::Value_list
  Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::to_list() const
{
  return Value_list(begin(), end());
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
std::vector<typename Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::Key>
  Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::keys() const
{
  std::vector<Key> result;
  result.reserve(size());
  for (const auto& value : *this)
  {
    result.push_back(value.first);
  }
  return result;
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
std::vector<typename Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::Mapped>
  Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::elems() const
{
  std::vector<Mapped> result;
  result.reserve(size());
  for (const auto& value : *this)
  {
    result.push_back(value.second);
  }
  return result;
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
template<typename Func>
typename Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::template Map_result<Func>
  Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::map(const Func& func) const
{
  return map_with_key([&](const Key&, const Mapped& mapped) { return func(mapped); });
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
template<typename Func>
typename Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::template Map_with_key_result<Func>
  Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::map_with_key(const Func& func) const
{
  using Result_map = Map_with_key_result<Func>;
  using New_mapped = typename Result_map::Mapped;

  // Keys, positions, and tombstones stay exactly as they are; the index is rebuilt over the new values.
  auto log = m_rep->m_log.template transformed<New_mapped>(func);
  return Result_map(*this, Result_map::rep_from_log(std::move(log), hash_function(), key_eq()));
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
template<typename Func>
typename Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::template Traverse_result<Func>
  Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::traverse_with_key(const Func& func, Error_code* err_code) const
{
  using Result_map = Traverse_result<Func>;
  using New_mapped = typename Result_map::Mapped;

  LINKMAP_ERROR_EXEC_AND_THROW_ON_ERROR(Result_map, traverse_with_key, func, _1);
  // ^-- Throws or returns if err_code is null.  Else:

  /* Run every effect first, in order, stopping at the first failure; only then assemble the result.  That way
   * nothing is built for a traversal that does not complete. */
  std::vector<New_mapped> new_values;
  new_values.reserve(size());
  for (const auto& value : m_rep->m_log)
  {
    Error_code func_err_code;
    auto new_mapped = func(value.first, value.second, &func_err_code);
    if (func_err_code)
    {
      LINKMAP_LOG_INFO("Linked_hash_map [" << this << "]: traversal stopped by the supplied function at "
                       "key [" << (new_values.size() + 1) << "] of [" << size() << "].");
      LINKMAP_ERROR_EMIT_ERROR_LOG_INFO(func_err_code);
      return Result_map(get_logger(), hash_function(), key_eq());
    }
    // else
    new_values.emplace_back(std::move(new_mapped));
  }

  err_code->clear();

  // transformed() visits the occupied slots in the same order as the loop above.
  size_type value_idx = 0;
  auto log = m_rep->m_log.template transformed<New_mapped>([&](const Key&, const Mapped&) -> New_mapped
  {
    return std::move(new_values[value_idx++]);
  });
  return Result_map(*this, Result_map::rep_from_log(std::move(log), hash_function(), key_eq()));
} // Linked_hash_map::traverse_with_key()

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
template<typename Func, typename Acc>
Acc Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::fold_left(const Func& func, Acc init) const
{
  for (const auto& value : *this)
  {
    init = func(std::move(init), value.second);
  }
  return init;
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
template<typename Func, typename Acc>
Acc Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::fold_right(const Func& func, Acc init) const
{
  return fold_right_with_key([&](const Key&, const Mapped& mapped, Acc acc) -> Acc
  {
    return func(mapped, std::move(acc));
  }, std::move(init));
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
template<typename Func, typename Acc>
Acc Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::fold_right_with_key(const Func& func, Acc init) const
{
  const auto& slots = m_rep->m_log.slots();
  for (auto slot_it = slots.rbegin(); slot_it != slots.rend(); ++slot_it)
  {
    if (*slot_it)
    {
      init = func((*slot_it)->first, (*slot_it)->second, std::move(init));
    }
  }
  return init;
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
template<typename Func>
Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>
  Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::filter(const Func& keep) const
{
  return filter_with_key([&](const Key&, const Mapped& mapped) -> bool { return keep(mapped); });
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
template<typename Func>
Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>
  Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::filter_with_key(const Func& keep) const
{
  Log log;
  for (const auto& value : *this)
  {
    if (keep(value.first, value.second))
    {
      log.append(value);
    }
  }
  return Linked_hash_map(*this, rep_from_log(std::move(log), hash_function(), key_eq()));
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>
  Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::union_of(const Linked_hash_map& other) const
{
  return union_with([](const Mapped& mapped, const Mapped&) -> Mapped { return mapped; }, other);
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
template<typename Func>
Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>
  Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::union_with(const Func& func, const Linked_hash_map& other) const
{
  /* Insert other's pairs in order, as by insert_with() with func's arguments flipped: insert_with() passes
   * (new, old), which here is (other's, ours); func wants (ours, other's). */
  const auto flipped_func = [&](const Mapped& other_mapped, const Mapped& mapped) -> Mapped
  {
    return func(mapped, other_mapped);
  };

  const auto rep = copy_rep();
  for (const auto& value : other)
  {
    insert_with_in_rep(rep.get(), flipped_func, value.first, value.second);
  }
  return Linked_hash_map(*this, rep);
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
template<typename Other_mapped>
Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>
  Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::difference
    (const Linked_hash_map<Key, Other_mapped, Hash, Pred>& other) const
{
  return filter_with_key([&](const Key& key, const Mapped&) -> bool { return !other.member(key); });
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
template<typename Other_mapped>
Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>
  Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::intersection
    (const Linked_hash_map<Key, Other_mapped, Hash, Pred>& other) const
{
  return filter_with_key([&](const Key& key, const Mapped&) -> bool { return other.member(key); });
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
template<typename Func, typename Other_mapped>
typename Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::template Intersection_with_result<Func, Other_mapped>
  Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::intersection_with
    (const Func& func, const Linked_hash_map<Key, Other_mapped, Hash, Pred>& other) const
{
  using Result_map = Intersection_with_result<Func, Other_mapped>;
  using Result_log = typename Result_map::Log;
  using Result_value = typename Result_map::Value;

  const auto& other_index = other.m_rep->m_index;
  Result_log log;
  for (const auto& value : *this)
  {
    const auto other_idx_it = other_index.find(value.first);
    if (other_idx_it != other_index.end())
    {
      log.append(Result_value(value.first, func(value.second, other_idx_it->second.m_mapped)));
    }
  }
  return Result_map(*this, Result_map::rep_from_log(std::move(log), hash_function(), key_eq()));
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
typename Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::Hash
  Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::hash_function() const
{
  return m_rep->m_index.hash_function();
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
typename Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::Pred
  Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::key_eq() const
{
  return m_rep->m_index.key_eq();
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
typename Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::Const_iterator
  Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::begin() const
{
  return m_rep->m_log.begin();
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
typename Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::Const_iterator
  Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::end() const
{
  return m_rep->m_log.end();
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
typename Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::Const_iterator
  Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::cbegin() const
{
  return begin();
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
typename Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::Const_iterator
  Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::cend() const
{
  return end();
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
typename Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::Rep_mutable_ptr
  Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::copy_rep() const
{
  return boost::make_shared<Rep>(*m_rep);
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
template<typename Forward_it, typename Func>
typename Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::Rep_mutable_ptr
  Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::rep_from_range(Forward_it first, Forward_it last,
                                                                   const Func& combine,
                                                                   const Hash& hasher_obj,
                                                                   const Pred& pred) const
{
  const auto rep = boost::make_shared<Rep>(hasher_obj, pred);
  auto& index = rep->m_index;
  auto& log = rep->m_log;

  /* One pass builds the index, each key holding the position of its 1st occurrence in the input and the
   * combination of all its values.  Until a duplicate shows up, input position == log position, so the log is built
   * alongside; in the common no-duplicates case that is all. */
  bool dups_found = false;
  size_type input_pos = 0;
  for (auto value_it = first; value_it != last; ++value_it, ++input_pos)
  {
    const auto result = index.emplace(value_it->first, detail::Entry<Mapped>{input_pos, value_it->second});
    if (result.second)
    {
      if (!dups_found)
      {
        log.append(Value(value_it->first, value_it->second));
      }
    }
    else
    {
      auto& entry = result.first->second;
      entry.m_mapped = combine(static_cast<const Mapped&>(value_it->second),
                               static_cast<const Mapped&>(entry.m_mapped));
      dups_found = true;
    }
  }

  if (!dups_found)
  {
    return rep;
  }
  // else

  LINKMAP_LOG_TRACE("Linked_hash_map [" << this << "]: building from [" << input_pos << "] pairs with repeated "
                    "keys; [" << index.size() << "] distinct keys remain.");

  /* 2nd pass: re-emit the log, each key at its 1st occurrence, with its final value.  A key's 1st occurrence is
   * where the input position equals the one in its entry; once emitted, its entry holds the (smaller or equal) log
   * position instead, which no later input position can equal. */
  log = Log();
  log.reserve(index.size());
  input_pos = 0;
  for (auto value_it = first; value_it != last; ++value_it, ++input_pos)
  {
    auto& entry = index.find(value_it->first)->second;
    if (entry.m_pos == input_pos)
    {
      entry.m_pos = log.append(Value(value_it->first, entry.m_mapped));
    }
  }

  return rep;
} // Linked_hash_map::rep_from_range()

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>
  Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::compacted_if_sparse(Rep_ptr rep) const
{
  const auto n_slots = rep->m_log.size();
  const auto n_keys = rep->m_index.size();

  if ((n_slots < 2 * n_keys) || (n_slots == n_keys))
  {
    return Linked_hash_map(*this, std::move(rep));
  }
  // else

  LINKMAP_LOG_TRACE("Linked_hash_map [" << this << "]: compacting: [" << n_slots << "] log slots hold "
                    "[" << n_keys << "] keys; dropping [" << (n_slots - n_keys) << "] tombstones.");
  return Linked_hash_map(*this, packed_rep(*rep));
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
template<typename Func>
void Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::insert_with_in_rep(Rep* rep, const Func& func,
                                                                           const Key& key, const Mapped& mapped)
{
  auto& index = rep->m_index;
  const auto idx_it = index.find(key);
  if (idx_it == index.end())
  {
    const auto pos = rep->m_log.append(Value(key, mapped));
    index.emplace(key, detail::Entry<Mapped>{pos, mapped});
    return;
  }
  // else

  auto& entry = idx_it->second;
  entry.m_mapped = func(mapped, static_cast<const Mapped&>(entry.m_mapped));
  rep->m_log.replace_mapped(entry.m_pos, entry.m_mapped);
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
typename Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::Rep_mutable_ptr
  Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::rep_from_log(Log&& log, const Hash& hasher_obj, const Pred& pred)
{
  const auto rep = boost::make_shared<Rep>(hasher_obj, pred);
  rep->m_log = std::move(log);

  const auto& slots = rep->m_log.slots();
  rep->m_index.reserve(rep->m_log.n_occupied());
  for (size_type pos = 0; pos != slots.size(); ++pos)
  {
    if (slots[pos])
    {
      rep->m_index.emplace(slots[pos]->first, detail::Entry<Mapped>{pos, slots[pos]->second});
    }
  }

  return rep;
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
typename Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::Rep_mutable_ptr
  Linked_hash_map<Key_t, Mapped_t, Hash_t, Pred_t>::packed_rep(const Rep& rep)
{
  Log log;
  log.reserve(rep.m_log.n_occupied());
  for (const auto& value : rep.m_log)
  {
    log.append(value);
  }
  return rep_from_log(std::move(log), rep.m_index.hash_function(), rep.m_index.key_eq());
}

template<typename Key, typename Mapped, typename Hash, typename Pred>
void swap(Linked_hash_map<Key, Mapped, Hash, Pred>& val1, Linked_hash_map<Key, Mapped, Hash, Pred>& val2)
{
  val1.swap(val2);
}

template<typename Key, typename Mapped, typename Hash, typename Pred>
bool operator==(const Linked_hash_map<Key, Mapped, Hash, Pred>& val1,
                const Linked_hash_map<Key, Mapped, Hash, Pred>& val2)
{
  const auto key_eq = val1.key_eq();
  return (val1.size() == val2.size())
         && std::equal(val1.begin(), val1.end(), val2.begin(),
                       [&](const auto& value1, const auto& value2)
  {
    return key_eq(value1.first, value2.first) && (value1.second == value2.second);
  });
}

template<typename Key, typename Mapped, typename Hash, typename Pred>
bool operator!=(const Linked_hash_map<Key, Mapped, Hash, Pred>& val1,
                const Linked_hash_map<Key, Mapped, Hash, Pred>& val2)
{
  return !(val1 == val2);
}

template<typename Key, typename Mapped, typename Hash, typename Pred>
std::ostream& operator<<(std::ostream& os, const Linked_hash_map<Key, Mapped, Hash, Pred>& val)
{
  os << "fromList [";
  bool first = true;
  for (const auto& value : val)
  {
    if (!first)
    {
      os << ", ";
    }
    first = false;
    os << '(' << value.first << ", " << value.second << ')';
  }
  return os << ']';
}

template<typename Key, typename Mapped, typename Hash, typename Pred>
Linked_hash_map<Key, Mapped, Hash, Pred> union_of(const Linked_hash_map<Key, Mapped, Hash, Pred>& val1,
                                                  const Linked_hash_map<Key, Mapped, Hash, Pred>& val2)
{
  return val1.union_of(val2);
}

template<typename Key, typename Mapped, typename Hash, typename Pred, typename Func>
Linked_hash_map<Key, Mapped, Hash, Pred> union_with(const Func& func,
                                                    const Linked_hash_map<Key, Mapped, Hash, Pred>& val1,
                                                    const Linked_hash_map<Key, Mapped, Hash, Pred>& val2)
{
  return val1.union_with(func, val2);
}

template<typename Map_range>
typename Map_range::value_type unions(const Map_range& maps)
{
  return Map_range::value_type::unions(maps.begin(), maps.end());
}

template<typename Key, typename Mapped, typename Hash, typename Pred, typename Other_mapped>
Linked_hash_map<Key, Mapped, Hash, Pred> difference(const Linked_hash_map<Key, Mapped, Hash, Pred>& val1,
                                                    const Linked_hash_map<Key, Other_mapped, Hash, Pred>& val2)
{
  return val1.difference(val2);
}

template<typename Key, typename Mapped, typename Hash, typename Pred, typename Other_mapped>
Linked_hash_map<Key, Mapped, Hash, Pred> intersection(const Linked_hash_map<Key, Mapped, Hash, Pred>& val1,
                                                      const Linked_hash_map<Key, Other_mapped, Hash, Pred>& val2)
{
  return val1.intersection(val2);
}

template<typename Key, typename Mapped, typename Hash, typename Pred, typename Other_mapped, typename Func>
typename Linked_hash_map<Key, Mapped, Hash, Pred>::template Intersection_with_result<Func, Other_mapped>
  intersection_with(const Func& func,
                    const Linked_hash_map<Key, Mapped, Hash, Pred>& val1,
                    const Linked_hash_map<Key, Other_mapped, Hash, Pred>& val2)
{
  return val1.intersection_with(func, val2);
}

} // namespace linkmap::map
