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
#include "linkmap/map/linked_hash_map.hpp"
#include "linkmap/log/buffer_logger.hpp"
#include "linkmap/log/config.hpp"
#include "linkmap/test/test_common_util.hpp"
#include "linkmap/test/test_logger.hpp"
#include "linkmap/util/util.hpp"
#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <gtest/gtest.h>
#include <algorithm>
#include <list>
#include <string>
#include <type_traits>

namespace linkmap::map::test
{

namespace
{
using std::string;
using std::vector;
using Map = Linked_hash_map<string, int>;
using Value_list = Map::Value_list;

/// Case-insensitive hash, to go with Ci_equal.
struct Ci_hash
{
  size_t operator()(const string& key) const
  {
    return boost::hash<string>()(boost::algorithm::to_lower_copy(key));
  }
};

/// Case-insensitive key equality.
struct Ci_equal
{
  bool operator()(const string& key1, const string& key2) const
  {
    return boost::algorithm::iequals(key1, key2);
  }
};

/// Registers Linkmap's components as `LINKMAP-*` and switches to Epoch time stamps, which are easier to match.
void setup_config(log::Config* config)
{
  config->m_use_human_friendly_time_stamps = false;
  config->register_components(S_LINKMAP_LOG_COMPONENT_NAME_MAP, "linkmap-");
}

/**
 * Checks the representation invariants through the public API: iteration, keys(), lookups, and log_size() all
 * agree with each other and with size().
 */
template<typename Map_t>
void check_invariants(const Map_t& map, const string& ctx)
{
  size_t n_iterated = 0;
  for (const auto& value : map)
  {
    ++n_iterated;
    const auto mapped = map.lookup(value.first);
    ASSERT_TRUE(mapped) << ctx;
    EXPECT_EQ(*mapped, value.second) << ctx;
    EXPECT_TRUE(map.member(value.first)) << ctx;
  }
  EXPECT_EQ(n_iterated, map.size()) << ctx;
  EXPECT_EQ(map.keys().size(), map.size()) << ctx;
  EXPECT_EQ(map.empty(), map.size() == 0) << ctx;
  EXPECT_GE(map.log_size(), map.size()) << ctx;
  EXPECT_LT(map.log_size(), std::max<size_t>(2 * map.size(), 1)) << ctx; // Compaction keeps tombstones bounded.
}

/// The map obtained by inserting `values` one by one, in order, into an empty map.
Map fold_inserts(const Value_list& values)
{
  Map result;
  for (const auto& value : values)
  {
    result = result.insert(value.first, value.second);
  }
  return result;
}

} // Anonymous namespace

// Tags a failure with the line that checked it.
#define CTX util::ostream_op_string("Caller context [", LINKMAP_UTIL_WHERE_AM_I_STR(), "].")

TEST(Linked_hash_map, Construction_and_queries)
{
  linkmap::test::Test_logger logger;

  const Map empty_map(&logger);
  EXPECT_TRUE(empty_map.empty());
  EXPECT_EQ(empty_map.size(), 0u);
  EXPECT_EQ(empty_map.log_size(), 0u);
  EXPECT_TRUE(empty_map.begin() == empty_map.end());
  EXPECT_FALSE(empty_map.lookup("a"));
  EXPECT_EQ(empty_map.get_logger(), &logger);
  check_invariants(empty_map, CTX);

  const auto one = Map::singleton("x", 9);
  EXPECT_EQ(one.to_list(), (Value_list{ { "x", 9 } }));
  EXPECT_EQ(one.get_logger(), nullptr);

  const Map map1{ { "b", 2 }, { "a", 1 }, { "c", 3 } };
  EXPECT_EQ(map1.size(), 3u);
  EXPECT_EQ(map1.keys(), (vector<string>{ "b", "a", "c" })); // Insertion order, not key order.
  EXPECT_EQ(map1.elems(), (vector<int>{ 2, 1, 3 }));
  EXPECT_EQ(map1.lookup("a"), 1);
  EXPECT_FALSE(map1.lookup("z"));
  EXPECT_TRUE(map1.member("c"));
  EXPECT_FALSE(map1.member("z"));
  EXPECT_EQ(map1.count("c"), 1u);
  EXPECT_EQ(map1.count("z"), 0u);
  EXPECT_EQ(map1.lookup_default(-1, "b"), 2);
  EXPECT_EQ(map1.lookup_default(-1, "z"), -1);
  EXPECT_EQ(map1.at("c"), 3);
  check_invariants(map1, CTX);

  // Range constructor, from any forward range of pairs.
  const std::list<std::pair<const string, int>> src{ { "p", 1 }, { "q", 2 } };
  const Map map2(src.begin(), src.end(), &logger);
  EXPECT_EQ(map2.to_list(), (Value_list{ { "p", 1 }, { "q", 2 } }));
  EXPECT_EQ(map2.get_logger(), &logger);

  // Range-for.
  string concat;
  for (const auto& value : map1)
  {
    concat += value.first + std::to_string(value.second);
  }
  EXPECT_EQ(concat, "b2a1c3");

  // ostream output.
  EXPECT_EQ(util::ostream_op_string(map1), "fromList [(b, 2), (a, 1), (c, 3)]");
  EXPECT_EQ(util::ostream_op_string(empty_map), "fromList []");
} // TEST(Linked_hash_map, Construction_and_queries)

TEST(Linked_hash_map, Insert)
{
  const Map map0;
  const auto map1 = map0.insert("a", 1).insert("b", 2).insert("c", 3);

  // New keys go last.
  EXPECT_EQ(map1.to_list(), (Value_list{ { "a", 1 }, { "b", 2 }, { "c", 3 } }));
  // Nothing is modified in place.
  EXPECT_TRUE(map0.empty());

  // Existing key: value replaced, place kept, size unchanged.
  const auto map2 = map1.insert("b", 20);
  EXPECT_EQ(map2.to_list(), (Value_list{ { "a", 1 }, { "b", 20 }, { "c", 3 } }));
  EXPECT_EQ(map2.size(), 3u);
  EXPECT_EQ(map2.log_size(), 3u);
  EXPECT_EQ(map1.at("b"), 2);
  check_invariants(map2, CTX);

  // insert_with() passes (new, old).
  vector<std::pair<int, int>> calls;
  const auto minus = [&](int new_mapped, int old_mapped)
  {
    calls.emplace_back(new_mapped, old_mapped);
    return new_mapped - old_mapped;
  };
  const auto map3 = map2.insert_with(minus, "b", 100);
  EXPECT_EQ(map3.at("b"), 80);
  ASSERT_EQ(calls.size(), 1u);
  EXPECT_EQ(calls.front(), (std::pair<int, int>(100, 20)));
  EXPECT_EQ(map3.keys(), map2.keys());

  // Absent key: like insert(); func not called.
  const auto map4 = map3.insert_with(minus, "d", 4);
  EXPECT_EQ(map4.to_list(), (Value_list{ { "a", 1 }, { "b", 80 }, { "c", 3 }, { "d", 4 } }));
  EXPECT_EQ(calls.size(), 1u);
  check_invariants(map4, CTX);
} // TEST(Linked_hash_map, Insert)

TEST(Linked_hash_map, Adjust)
{
  const Map map1{ { "a", 1 }, { "b", 2 } };
  int n_calls = 0;
  const auto twice = [&](int mapped) { ++n_calls; return mapped * 2; };

  const auto map2 = map1.adjust(twice, "a");
  EXPECT_EQ(map2.to_list(), (Value_list{ { "a", 2 }, { "b", 2 } }));
  EXPECT_EQ(map1.at("a"), 1);
  EXPECT_EQ(n_calls, 1);

  const auto map3 = map2.adjust(twice, "zzz");
  EXPECT_EQ(map3, map2);
  EXPECT_EQ(n_calls, 1);
  check_invariants(map3, CTX);
}

TEST(Linked_hash_map, Erase_and_compaction)
{
  log::Config cfg(log::Sev::S_TRACE);
  setup_config(&cfg);
  log::Buffer_logger logger(&cfg);

  const Map map1({ { "a", 1 }, { "b", 2 }, { "c", 3 }, { "d", 4 } }, &logger);

  // 4 slots, 3 keys: under the threshold, so the tombstone stays.
  const auto map2 = map1.erase("b");
  EXPECT_EQ(map2.to_list(), (Value_list{ { "a", 1 }, { "c", 3 }, { "d", 4 } }));
  EXPECT_EQ(map2.size(), 3u);
  EXPECT_EQ(map2.log_size(), 4u);
  EXPECT_FALSE(map2.member("b"));
  EXPECT_EQ(map1.size(), 4u); // Untouched.
  check_invariants(map2, CTX);
  EXPECT_EQ(logger.buffer_str_copy().find("compacting"), string::npos);

  // Absent key: no change; the threshold is not reached either.
  const auto map3 = map2.erase("zzz");
  EXPECT_EQ(map3, map2);
  EXPECT_EQ(map3.log_size(), 4u);

  // 4 slots, 2 keys: compacted right away.
  const auto map4 = map2.erase("c");
  EXPECT_EQ(map4.to_list(), (Value_list{ { "a", 1 }, { "d", 4 } }));
  EXPECT_EQ(map4.log_size(), 2u);
  check_invariants(map4, CTX);
  EXPECT_TRUE(linkmap::test::check_output
                (logger.buffer_str_copy(),
                 { "\\[trce\\]: T[^:]+: LINKMAP-MAP: linked_hash_map\\.hpp:compacted_if_sparse\\([0-9]+\\): "
                     ".*\\[4\\] log slots hold \\[2\\] keys" }))
    << logger.buffer_str_copy();

  // Erasing then re-inserting puts the key last.
  const auto map5 = map2.insert("b", 22);
  EXPECT_EQ(map5.to_list(), (Value_list{ { "a", 1 }, { "c", 3 }, { "d", 4 }, { "b", 22 } }));
  EXPECT_EQ(map5.log_size(), 5u);
  check_invariants(map5, CTX);

  // Erase everything.
  const auto map6 = map5.erase("a").erase("c").erase("d").erase("b");
  EXPECT_TRUE(map6.empty());
  EXPECT_EQ(map6.log_size(), 0u);
  EXPECT_EQ(map6.get_logger(), &logger);
  check_invariants(map6, CTX);

  const auto map7 = Map().erase("a");
  EXPECT_TRUE(map7.empty());
} // TEST(Linked_hash_map, Erase_and_compaction)

TEST(Linked_hash_map, Erase_keeps_tombstones_bounded)
{
  // Any sequence of erasures leaves fewer than 2 slots per key.
  Value_list values;
  for (int idx = 0; idx != 50; ++idx)
  {
    values.emplace_back("k" + std::to_string(idx), idx);
  }
  auto map = Map::from_list(values);
  for (int idx = 0; idx < 50; idx += 3)
  {
    map = map.erase("k" + std::to_string(idx));
    check_invariants(map, CTX);
  }
  for (int idx = 49; idx >= 0; idx -= 2)
  {
    map = map.erase("k" + std::to_string(idx));
    check_invariants(map, CTX);
  }

  // Survivors are in their original relative order.
  int prev = -1;
  for (const auto& value : map)
  {
    EXPECT_GT(value.second, prev);
    prev = value.second;
  }
}

TEST(Linked_hash_map, Pack)
{
  const auto map1 = Map{ { "a", 1 }, { "b", 2 }, { "c", 3 }, { "d", 4 } }.erase("a");
  ASSERT_EQ(map1.log_size(), 4u);

  const auto map2 = map1.pack();
  EXPECT_EQ(map2.log_size(), map2.size());
  EXPECT_EQ(map2.to_list(), map1.to_list());
  EXPECT_EQ(map2, map1);
  check_invariants(map2, CTX);

  // Positions are dense after packing: a new key's slot is right after the others.
  EXPECT_EQ(map2.insert("e", 5).log_size(), 4u);

  const auto map3 = map2.pack();
  EXPECT_EQ(map3.log_size(), 3u);
}

TEST(Linked_hash_map, At)
{
  log::Config cfg(log::Sev::S_INFO);
  setup_config(&cfg);
  log::Buffer_logger logger(&cfg);
  const Map map1({ { "a", 1 } }, &logger);

  EXPECT_EQ(map1.at("a"), 1);
  EXPECT_THROW(map1.at("b"), linkmap::error::Runtime_error);

  try
  {
    map1.at("b");
    ADD_FAILURE() << "at() should have thrown.";
  }
  catch (const linkmap::error::Runtime_error& exc)
  {
    EXPECT_EQ(exc.code(), Error_code(error::Code::S_KEY_NOT_FOUND));
    EXPECT_NE(string(exc.what()).find("Key not found"), string::npos) << exc.what();
  }

  // Logged as a warning before the throw.
  EXPECT_TRUE(linkmap::test::check_output
                (logger.buffer_str_copy(),
                 { "\\[warn\\]: T[^:]+: LINKMAP-MAP: linked_hash_map\\.hpp:at\\([0-9]+\\): Error "
                     "\\[linkmap/map:1\\] \\[Key not found\\.\\]" }))
    << logger.buffer_str_copy();
}

TEST(Linked_hash_map, From_list)
{
  log::Config cfg(log::Sev::S_TRACE);
  setup_config(&cfg);
  log::Buffer_logger logger(&cfg);

  // No duplicates.
  const auto map1 = Map::from_list({ { "a", 1 }, { "b", 2 }, { "c", 3 } }, &logger);
  EXPECT_EQ(map1.to_list(), (Value_list{ { "a", 1 }, { "b", 2 }, { "c", 3 } }));
  EXPECT_EQ(map1.log_size(), 3u);
  EXPECT_EQ(logger.buffer_str_copy().find("repeated"), string::npos);

  // Duplicates: first place, last value.
  const auto map2 = Map::from_list({ { "a", 1 }, { "b", 2 }, { "a", 3 } }, &logger);
  EXPECT_EQ(map2.to_list(), (Value_list{ { "a", 3 }, { "b", 2 } }));
  EXPECT_EQ(map2.log_size(), 2u);
  check_invariants(map2, CTX);
  EXPECT_TRUE(linkmap::test::check_output(logger.buffer_str_copy(),
                                          { "\\[trce\\].*\\[3\\] pairs with repeated keys; \\[2\\] distinct" }))
    << logger.buffer_str_copy();

  // Same as inserting one by one, duplicates or not.
  const Value_list values{ { "x", 1 }, { "y", 2 }, { "x", 3 }, { "z", 4 }, { "y", 5 }, { "w", 6 }, { "z", 7 },
                           { "x", 8 } };
  const auto map3 = Map::from_list(values);
  EXPECT_EQ(map3, fold_inserts(values));
  EXPECT_EQ(map3.to_list(), (Value_list{ { "x", 8 }, { "y", 5 }, { "z", 7 }, { "w", 6 } }));
  check_invariants(map3, CTX);

  EXPECT_TRUE(Map::from_list({}).empty());

  // Round trip, including across tombstones.
  const auto map4 = map3.erase("y");
  EXPECT_EQ(Map::from_list(map4.to_list()), map4);
  EXPECT_EQ(Map::from_list(map3.to_list()), map3);
} // TEST(Linked_hash_map, From_list)

TEST(Linked_hash_map, From_list_with)
{
  using Str_map = Linked_hash_map<string, string>;

  const auto concat = [](const string& new_mapped, const string& old_mapped) { return new_mapped + old_mapped; };
  const auto map1 = Str_map::from_list_with(concat, { { "a", "x" }, { "b", "q" }, { "a", "y" }, { "a", "z" } });
  EXPECT_EQ(map1.to_list(), (Str_map::Value_list{ { "a", "zyx" }, { "b", "q" } }));
  EXPECT_EQ(map1.to_list(), Str_map().insert_with(concat, "a", "x").insert_with(concat, "b", "q")
                                      .insert_with(concat, "a", "y").insert_with(concat, "a", "z").to_list());
}

TEST(Linked_hash_map, Union)
{
  const Map map_a{ { "k1", 1 }, { "k2", 2 } };
  const Map map_b{ { "k2", 3 }, { "k3", 4 } };

  // Left-biased: a's value and place win; b-only keys follow, in b's order.
  const auto map1 = union_of(map_a, map_b);
  EXPECT_EQ(map1.to_list(), (Value_list{ { "k1", 1 }, { "k2", 2 }, { "k3", 4 } }));
  EXPECT_EQ(map_a.union_of(map_b), map1);

  // func gets (a's, b's).
  const auto combine = [](int mapped_a, int mapped_b) { return (mapped_a * 10) + mapped_b; };
  const auto map2 = union_with(combine, map_a, map_b);
  EXPECT_EQ(map2.to_list(), (Value_list{ { "k1", 1 }, { "k2", 23 }, { "k3", 4 } }));
  const auto map3 = union_with(combine, map_b, map_a);
  EXPECT_EQ(map3.to_list(), (Value_list{ { "k2", 32 }, { "k3", 4 }, { "k1", 1 } }));
  check_invariants(map3, CTX);

  // Same as folding insert_with() with func flipped over b's pairs.
  auto folded = map_a;
  for (const auto& value : map_b)
  {
    folded = folded.insert_with([&](int new_mapped, int old_mapped) { return combine(old_mapped, new_mapped); },
                                value.first, value.second);
  }
  EXPECT_EQ(folded, map2);

  EXPECT_EQ(union_of(map_a, Map()), map_a);
  EXPECT_EQ(union_of(Map(), map_a), map_a);

  // unions(): left-to-right.
  const Map map_c{ { "k3", 5 }, { "k0", 0 } };
  const auto map4 = unions(vector<Map>{ map_a, map_b, map_c });
  EXPECT_EQ(map4.to_list(), (Value_list{ { "k1", 1 }, { "k2", 2 }, { "k3", 4 }, { "k0", 0 } }));
  EXPECT_EQ(map4, union_of(union_of(map_a, map_b), map_c));
  EXPECT_TRUE(unions(vector<Map>()).empty());

  // unions() starts from the first map packed.
  const auto map5 = unions(std::list<Map>{ map_c.insert("k9", 9).erase("k3") });
  EXPECT_EQ(map5.to_list(), (Value_list{ { "k0", 0 }, { "k9", 9 } }));
  EXPECT_EQ(map5.log_size(), 2u);
} // TEST(Linked_hash_map, Union)

TEST(Linked_hash_map, Map_and_map_with_key)
{
  const auto map1 = Map{ { "a", 1 }, { "b", 2 }, { "c", 3 }, { "d", 4 } }.erase("b");
  ASSERT_EQ(map1.log_size(), 4u);

  const auto map2 = map1.map([](int mapped) { return mapped * 1.5; });
  static_assert(std::is_same_v<std::decay_t<decltype(map2)>::Mapped, double>,
                "map() should yield the function's return type.");
  EXPECT_EQ(map2.keys(), map1.keys());
  EXPECT_EQ(map2.elems(), (vector<double>{ 1.5, 4.5, 6 }));
  EXPECT_EQ(map2.log_size(), 4u); // Tombstones (so positions) preserved.
  check_invariants(map2, CTX);

  const auto map3 = map1.map_with_key([](const string& key, int mapped) { return key + std::to_string(mapped); });
  EXPECT_EQ(map3.to_list(), (Linked_hash_map<string, string>::Value_list{ { "a", "a1" }, { "c", "c3" },
                                                                          { "d", "d4" } }));
  EXPECT_EQ(map3.log_size(), 4u);

  // The result behaves like any map: e.g., new keys still go last.
  EXPECT_EQ(map3.insert("b", "b2").keys(), (vector<string>{ "a", "c", "d", "b" }));
}

TEST(Linked_hash_map, Traverse_with_key)
{
  log::Config cfg(log::Sev::S_INFO);
  setup_config(&cfg);
  log::Buffer_logger logger(&cfg);
  const auto map1 = Map({ { "a", 1 }, { "b", 2 }, { "c", 3 }, { "d", 4 } }, &logger).erase("b");
  ASSERT_EQ(map1.log_size(), 4u);

  vector<string> visited;
  Error_code err_code;

  // Success: every live pair, in order; tombstones skipped; positions preserved.
  const auto map2 = map1.traverse_with_key([&](const string& key, int mapped, Error_code*) -> string
  {
    visited.push_back(key);
    return key + std::to_string(mapped);
  }, &err_code);
  EXPECT_FALSE(err_code);
  EXPECT_EQ(visited, (vector<string>{ "a", "c", "d" }));
  EXPECT_EQ(map2.to_list(), (Linked_hash_map<string, string>::Value_list{ { "a", "a1" }, { "c", "c3" },
                                                                          { "d", "d4" } }));
  EXPECT_EQ(map2.log_size(), 4u);
  EXPECT_EQ(map2.get_logger(), &logger);
  check_invariants(map2, CTX);

  // Failure: stops at the first error, which becomes the traversal's.
  const auto fail_at_c = [&](const string& key, int mapped, Error_code* func_err_code) -> int
  {
    visited.push_back(key);
    if (key == "c")
    {
      *func_err_code = error::Code::S_TRAVERSE_ABORTED;
    }
    return mapped;
  };

  visited.clear();
  const auto map3 = map1.traverse_with_key(fail_at_c, &err_code);
  EXPECT_EQ(err_code, Error_code(error::Code::S_TRAVERSE_ABORTED));
  EXPECT_TRUE(map3.empty());
  EXPECT_EQ(visited, (vector<string>{ "a", "c" }));
  EXPECT_TRUE(linkmap::test::check_output(logger.buffer_str_copy(),
                                          { "\\[info\\].*traversal stopped.*key \\[2\\] of \\[3\\]",
                                            "\\[info\\].*Emitting error \\[linkmap/map:2\\]" }))
    << logger.buffer_str_copy();

  // With a null Error_code*, the failure is thrown.
  visited.clear();
  try
  {
    map1.traverse_with_key(fail_at_c);
    ADD_FAILURE() << "traverse_with_key() should have thrown.";
  }
  catch (const linkmap::error::Runtime_error& exc)
  {
    EXPECT_EQ(exc.code(), Error_code(error::Code::S_TRAVERSE_ABORTED));
  }
  EXPECT_EQ(visited, (vector<string>{ "a", "c" }));

  // A successful call clears a previously set err_code.
  visited.clear();
  const auto map4 = map1.traverse_with_key([](const string&, int mapped, Error_code*) { return mapped; }, &err_code);
  EXPECT_FALSE(err_code);
  EXPECT_EQ(map4, map1);
} // TEST(Linked_hash_map, Traverse_with_key)

TEST(Linked_hash_map, Folds)
{
  const auto map1 = Map{ { "a", 1 }, { "x", 0 }, { "b", 2 }, { "c", 3 } }.erase("x");
  ASSERT_EQ(map1.log_size(), 4u);

  EXPECT_EQ(map1.fold_left([](int acc, int mapped) { return (acc * 10) + mapped; }, 0), 123);
  EXPECT_EQ(map1.fold_right([](int mapped, int acc) { return (acc * 10) + mapped; }, 0), 321);
  EXPECT_EQ(map1.fold_right([](int mapped, vector<int> acc)
                            {
                              acc.insert(acc.begin(), mapped);
                              return acc;
                            }, vector<int>()),
            map1.elems()); // fold_right with "cons" rebuilds the list.
  EXPECT_EQ(map1.fold_right_with_key([](const string& key, int, string acc) { return key + acc; }, string("!")),
            "abc!");
  EXPECT_EQ(Map().fold_right([](int mapped, int acc) { return mapped + acc; }, 7), 7);
}

TEST(Linked_hash_map, Filter_and_set_ops)
{
  const auto map1 = Map{ { "a", 1 }, { "b", 2 }, { "c", 3 }, { "d", 4 }, { "e", 5 } }.erase("e");

  const auto evens = map1.filter([](int mapped) { return mapped % 2 == 0; });
  EXPECT_EQ(evens.to_list(), (Value_list{ { "b", 2 }, { "d", 4 } }));
  EXPECT_EQ(evens.log_size(), 2u);
  check_invariants(evens, CTX);

  const auto not_c = map1.filter_with_key([](const string& key, int) { return key != "c"; });
  EXPECT_EQ(not_c.to_list(), (Value_list{ { "a", 1 }, { "b", 2 }, { "d", 4 } }));

  const Linked_hash_map<string, string> other{ { "d", "x" }, { "b", "y" }, { "z", "w" } };

  const auto diff = difference(map1, other);
  EXPECT_EQ(diff.to_list(), (Value_list{ { "a", 1 }, { "c", 3 } }));
  EXPECT_EQ(diff.log_size(), 2u);

  const auto common = intersection(map1, other);
  EXPECT_EQ(common.to_list(), (Value_list{ { "b", 2 }, { "d", 4 } })); // map1's order and values.

  const auto joined = intersection_with([](int mapped, const string& other_mapped)
                                        {
                                          return other_mapped + std::to_string(mapped);
                                        }, map1, other);
  EXPECT_EQ(joined.to_list(), (Linked_hash_map<string, string>::Value_list{ { "b", "y2" }, { "d", "x4" } }));
  check_invariants(joined, CTX);

  EXPECT_EQ(map1.difference(Map()), map1);
  EXPECT_TRUE(map1.intersection(Map()).empty());
}

TEST(Linked_hash_map, Equality_copy_swap)
{
  using std::swap; // This enables proper ADL.

  const Map map1{ { "a", 1 }, { "b", 2 } };
  const Map map2{ { "b", 2 }, { "a", 1 } };

  // Order matters.
  EXPECT_NE(map1, map2);
  EXPECT_EQ(map1, Map::from_list(map1.to_list()));
  EXPECT_NE(map1, map1.insert("a", 5));

  // Tombstones do not.
  const auto map3 = map1.insert("c", 3).erase("c");
  EXPECT_NE(map3.log_size(), map1.log_size());
  EXPECT_EQ(map3, map1);

  // Copies are equal and independent of later derivations.
  auto map4 = map1;
  const auto map5 = std::move(map4);
  EXPECT_EQ(map5, map1);
  EXPECT_EQ(map4, map1); // A "move" is a copy.

  Map map6 = map1;
  Map map7 = map2;
  swap(map6, map7);
  EXPECT_EQ(map6, map2);
  EXPECT_EQ(map7, map1);

  // Iterators and references stay valid as long as the map they came from.
  const auto& mapped_ref = map7.at("b");
  map6 = map7.insert("b", 200);
  EXPECT_EQ(mapped_ref, 2);
} // TEST(Linked_hash_map, Equality_copy_swap)

TEST(Linked_hash_map, Custom_hash_and_pred)
{
  using Ci_map = Linked_hash_map<string, int, Ci_hash, Ci_equal>;

  const Ci_map map1{ { "Key", 1 }, { "other", 2 }, { "KEY", 3 } };
  EXPECT_EQ(map1.size(), 2u);
  EXPECT_EQ(map1.to_list(), (Ci_map::Value_list{ { "Key", 3 }, { "other", 2 } })); // First spelling kept.
  EXPECT_EQ(map1.at("kEy"), 3);
  EXPECT_TRUE(map1.erase("OTHER").keys() == vector<string>{ "Key" });

  // Derived maps keep the hasher and predicate.
  const auto map2 = map1.map([](int mapped) { return mapped * 2; }).insert("KEY", 10);
  EXPECT_EQ(map2.size(), 2u);
  EXPECT_EQ(map2.at("key"), 10);
  check_invariants(map2, CTX);

  // Equality compares keys with the predicate, so spelling differences the predicate ignores do not count.
  EXPECT_TRUE((Ci_map{ { "Key", 1 }, { "other", 2 } }) == (Ci_map{ { "KEY", 1 }, { "OTHER", 2 } }));
  EXPECT_TRUE(map1 == (Ci_map{ { "kEY", 3 }, { "Other", 2 } }));
  EXPECT_FALSE((Ci_map{ { "Key", 1 } }) == (Ci_map{ { "KEY", 2 } }));
  EXPECT_FALSE((Ci_map{ { "Key", 1 } }) == (Ci_map{ { "Kex", 1 } }));
  // Order still matters.
  EXPECT_TRUE((Ci_map{ { "a", 1 }, { "B", 2 } }) != (Ci_map{ { "b", 2 }, { "A", 1 } }));
} // TEST(Linked_hash_map, Custom_hash_and_pred)

} // namespace linkmap::map::test
