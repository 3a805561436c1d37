/* odict
 * Copyright 2026 The odict Authors
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


#include "odict/dict/ordered_map.hpp"
#include "odict/test/test_logger.hpp"
#include "odict/util/util.hpp"
#include <gtest/gtest.h>
#include <map>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace odict::dict::test
{

namespace
{
using std::string;
using std::vector;
using Map = Ordered_map<string, int>;

struct Obj
{
  string m_str;
  Obj() = default;
  Obj(const char* str) : m_str(str) {}
  bool operator==(const Obj& rhs) const { return m_str == rhs.m_str; }
};

size_t hash_value(const Obj& obj) { return boost::hash_value(obj.m_str); }

std::ostream& operator<<(std::ostream& os, const Obj& obj) { return os << obj.m_str; }

} // Anonymous namespace

// Yes... this is very cheesy... but this is a test, so I don't really care.
#define CTX util::ostream_op_string("Caller context [", ODICT_UTIL_WHERE_AM_I_STR(), "].")

TEST(Ordered_map, Interface)
{
  using std::swap; // This enables proper ADL.

  odict::test::Test_logger logger;

  const auto keys_check = [](const auto& map, const vector<string>& exp, const string& ctx)
  {
    ASSERT_EQ(map.size(), exp.size()) << ctx;
    ASSERT_EQ(map.size() == 0, map.empty()) << ctx;
    size_t idx = 0;
    for (const auto& key_and_mapped : map)
    {
      EXPECT_EQ(key_and_mapped.first, exp[idx]) << ctx;
      ++idx;
    }
    for (auto rit = map.crbegin(); rit != map.crend(); ++rit)
    {
      --idx;
      EXPECT_EQ(rit->first, exp[idx]) << ctx;
    }
    EXPECT_EQ(map.keys(), exp) << ctx;
  };

  { // Basic set/get/order block.
    Map map1(&logger);
    keys_check(map1, {}, CTX);

    map1.set("b", 1);
    map1.set("a", 2);
    map1.set("c", 3);
    keys_check(map1, { "b", "a", "c" }, CTX);
    EXPECT_EQ(map1.values(), (vector<int>{ 1, 2, 3 })) << CTX;

    map1.set("a", 20); // Present: value replaced, position kept.
    keys_check(map1, { "b", "a", "c" }, CTX);
    EXPECT_EQ(map1.get("a"), 20) << CTX;

    map1["d"] = 4; // Absent: appended.
    map1["b"] = 10; // Present: position kept.
    keys_check(map1, { "b", "a", "c", "d" }, CTX);
    EXPECT_EQ(map1.values(), (vector<int>{ 10, 20, 3, 4 })) << CTX;

    EXPECT_EQ(map1["zz"], 0) << CTX; // operator[] inserts Mapped{}.
    keys_check(map1, { "b", "a", "c", "d", "zz" }, CTX);

    EXPECT_TRUE(map1.contains("c")) << CTX;
    EXPECT_FALSE(map1.contains("q")) << CTX;
    EXPECT_EQ(map1.count("c"), 1u) << CTX;
    EXPECT_EQ(map1.count("q"), 0u) << CTX;
    EXPECT_EQ(map1.find("q"), map1.end()) << CTX;
    EXPECT_EQ(map1.find("c")->second, 3) << CTX;

    const auto& map1_const = map1;
    EXPECT_EQ(map1_const.get("d"), 4) << CTX;
    EXPECT_EQ(map1_const.find("q"), map1_const.cend()) << CTX;
    EXPECT_EQ(map1.find("c"), map1_const.find("c")) << CTX; // Mixed mutable/immutable comparison.

    const auto items = map1.items();
    ASSERT_EQ(items.size(), 5u) << CTX;
    EXPECT_EQ(items[1], (Map::Value_movable{ "a", 20 })) << CTX;
  } // Basic set/get/order block.

  { // Removal block.
    Map map1{{ { "a", 1 }, { "b", 2 }, { "c", 3 }, { "d", 4 } }, &logger};

    map1.remove("b");
    keys_check(map1, { "a", "c", "d" }, CTX);

    map1.set("b", 5); // Re-added after removal => at the end.
    keys_check(map1, { "a", "c", "d", "b" }, CTX);

    EXPECT_EQ(map1.erase("q"), 0u) << CTX;
    EXPECT_EQ(map1.erase("c"), 1u) << CTX;
    keys_check(map1, { "a", "d", "b" }, CTX);

    auto it = map1.erase(map1.find("d"));
    ASSERT_NE(it, map1.end()) << CTX;
    EXPECT_EQ(it->first, "b") << CTX;
    it = map1.erase(it);
    EXPECT_EQ(it, map1.end()) << CTX;
    keys_check(map1, { "a" }, CTX);

    EXPECT_EQ(map1.pop_key("a"), 1) << CTX;
    keys_check(map1, {}, CTX);

    map1.update({ { "x", 1 }, { "y", 2 } });
    EXPECT_EQ(map1.pop_key_or("q", 42), 42) << CTX;
    keys_check(map1, { "x", "y" }, CTX);
    EXPECT_EQ(map1.pop_key_or("x", 42), 1) << CTX;
    keys_check(map1, { "y" }, CTX);

    map1.clear();
    keys_check(map1, {}, CTX);
    map1.set("after_clear", 1);
    keys_check(map1, { "after_clear" }, CTX);
  } // Removal block.

  { // Pop block.
    Map map1{{ { "a", 1 }, { "b", 2 }, { "c", 3 } }, &logger};

    EXPECT_EQ(map1.pop(), (Map::Value_movable{ "c", 3 })) << CTX; // LIFO.
    EXPECT_EQ(map1.pop(false), (Map::Value_movable{ "a", 1 })) << CTX; // FIFO.
    keys_check(map1, { "b" }, CTX);
    EXPECT_EQ(map1.pop(true), (Map::Value_movable{ "b", 2 })) << CTX;
    keys_check(map1, {}, CTX);

    // Freed slots get reused; order must still be insertion order.
    map1.set("x", 1);
    map1.set("y", 2);
    map1.set("z", 3);
    keys_check(map1, { "x", "y", "z" }, CTX);
  } // Pop block.

  { // set_default()/insert() block.
    Map map1(&logger);
    EXPECT_EQ(map1.set_default("a", 5), 5) << CTX;
    EXPECT_EQ(map1.set_default("a", 7), 5) << CTX; // Present: no change.
    EXPECT_EQ(map1.set_default("b"), 0) << CTX;
    keys_check(map1, { "a", "b" }, CTX);

    auto result = map1.insert(Map::Value{ "a", 100 });
    EXPECT_FALSE(result.second) << CTX;
    EXPECT_EQ(result.first->second, 5) << CTX;
    result = map1.insert(Map::Value_movable{ "c", 100 });
    EXPECT_TRUE(result.second) << CTX;
    EXPECT_EQ(result.first->first, "c") << CTX;
    keys_check(map1, { "a", "b", "c" }, CTX);

    result.first->second = 200; // Assigning through an iterator is fine.
    EXPECT_EQ(map1.get("c"), 200) << CTX;
  } // set_default()/insert() block.

  { // Initializer list: later duplicates overwrite the value and keep the first position.
    const Map map1{{ { "a", 1 }, { "b", 2 }, { "a", 3 } }};
    keys_check(map1, { "a", "b" }, CTX);
    EXPECT_EQ(map1.get("a"), 3) << CTX;
  }

  { // Copy/move/swap block.
    Map map1{{ { "a", 1 }, { "b", 2 } }, &logger};
    auto map2 = map1.copy();
    EXPECT_EQ(map1, map2) << CTX;
    EXPECT_EQ(map2.get_logger(), &logger) << CTX;

    map2.set("a", 100);
    map2.set("c", 3);
    EXPECT_EQ(map1.get("a"), 1) << CTX; // Independent storage.
    keys_check(map1, { "a", "b" }, CTX);
    keys_check(map2, { "a", "b", "c" }, CTX);

    Map map3(map2);
    EXPECT_EQ(map3, map2) << CTX;
    map3 = map1;
    EXPECT_EQ(map3, map1) << CTX;

    Map map4(std::move(map3));
    keys_check(map4, { "a", "b" }, CTX);
    keys_check(map3, {}, CTX); // Moved-from: empty yet usable.
    map3.set("q", 1);
    keys_check(map3, { "q" }, CTX);

    map4 = std::move(map2);
    keys_check(map4, { "a", "b", "c" }, CTX);
    keys_check(map2, {}, CTX);

    swap(map3, map4);
    keys_check(map3, { "a", "b", "c" }, CTX);
    keys_check(map4, { "q" }, CTX);
  } // Copy/move/swap block.

  { // Factories/update block.
    const vector<string> keys{ "c", "a", "c", "b" };
    const auto map1 = Map::from_keys(keys, 7);
    keys_check(map1, { "c", "a", "b" }, CTX);
    EXPECT_EQ(map1.values(), (vector<int>{ 7, 7, 7 })) << CTX;

    const auto map2 = Map::from_keys({ "x", "y" });
    EXPECT_EQ(map2.values(), (vector<int>{ 0, 0 })) << CTX;

    const vector<std::pair<string, int>> pairs{ { "p", 1 }, { "q", 2 }, { "p", 3 } };
    const auto map3 = Map::from_pairs(pairs, &logger);
    keys_check(map3, { "p", "q" }, CTX);
    EXPECT_EQ(map3.get("p"), 3) << CTX;

    Map map4{{ { "q", 0 }, { "z", 9 } }};
    map4.update(map3); // Another Ordered_map works as a range.
    keys_check(map4, { "q", "z", "p" }, CTX);
    EXPECT_EQ(map4.values(), (vector<int>{ 2, 9, 3 })) << CTX;
  } // Factories/update block.

  { // Custom key type block.
    Ordered_map<Obj, Obj> map1{{ { "k1", "v1" }, { "k2", "v2" } }};
    EXPECT_EQ(map1.get("k2").m_str, "v2") << CTX;
    EXPECT_EQ(util::ostream_op_string(map1), "Ordered_map([(k1, v1), (k2, v2)])") << CTX;
  }
} // TEST(Ordered_map, Interface)

TEST(Ordered_map, Errors)
{
  odict::test::Test_logger logger;
  Map map1{{ { "a", 1 } }, &logger};

  try
  {
    map1.get("q");
    ADD_FAILURE() << "get() of absent key should have thrown.";
  }
  catch (const ::odict::error::Runtime_error& exc)
  {
    EXPECT_EQ(exc.code(), error::Code::S_KEY_NOT_FOUND);
  }
  EXPECT_THROW(static_cast<const Map&>(map1).get("q"), ::odict::error::Runtime_error);
  EXPECT_THROW(map1.remove("q"), ::odict::error::Runtime_error);
  EXPECT_THROW(map1.pop_key("q"), ::odict::error::Runtime_error);

  Error_code err_code;
  map1.remove("q", &err_code);
  EXPECT_EQ(err_code, error::Code::S_KEY_NOT_FOUND);
  map1.remove("a", &err_code);
  EXPECT_FALSE(err_code);
  EXPECT_TRUE(map1.empty());

  EXPECT_THROW(map1.pop(), ::odict::error::Runtime_error);
  EXPECT_THROW(map1.pop(false), ::odict::error::Runtime_error);
  const auto popped = map1.pop(true, &err_code);
  EXPECT_EQ(err_code, error::Code::S_EMPTY_CONTAINER);
  EXPECT_EQ(popped, Map::Value_movable{});

  EXPECT_EQ(map1.pop_key("q", &err_code), 0);
  EXPECT_EQ(err_code, error::Code::S_KEY_NOT_FOUND);

  // Failures must not have changed anything.
  map1.set("b", 2);
  EXPECT_EQ(map1.pop_key("b", &err_code), 2);
  EXPECT_FALSE(err_code);
  EXPECT_TRUE(map1.empty());
} // TEST(Ordered_map, Errors)

TEST(Ordered_map, Equality)
{
  const Map map1{{ { "a", 1 }, { "b", 2 } }};
  const Map map2{{ { "b", 2 }, { "a", 1 } }};
  const Map map3{{ { "a", 1 }, { "b", 3 } }};

  // Ordered_map vs. Ordered_map: order matters.
  EXPECT_TRUE(map1 == map1.copy());
  EXPECT_FALSE(map1 == map2);
  EXPECT_TRUE(map1 != map2);
  EXPECT_TRUE(map1 != map3);
  EXPECT_TRUE(map1 != Map{});
  EXPECT_TRUE(Map{} == Map{});

  // Ordered_map vs. plain maps: order is irrelevant.
  const std::map<string, int> std_map{ { "b", 2 }, { "a", 1 } };
  const std::unordered_map<string, int> std_hash_map{ { "b", 2 }, { "a", 1 } };
  const boost::unordered_map<string, int> boost_hash_map{ { "b", 2 }, { "a", 1 } };
  EXPECT_TRUE(map1 == std_map);
  EXPECT_TRUE(map2 == std_map);
  EXPECT_TRUE(std_map == map2);
  EXPECT_TRUE(map3 != std_map);
  EXPECT_TRUE(std_map != map3);
  EXPECT_TRUE(map1 == std_hash_map);
  EXPECT_TRUE(std_hash_map == map2);
  EXPECT_TRUE(map3 != std_hash_map);
  EXPECT_TRUE(map1 == boost_hash_map);
  EXPECT_TRUE(boost_hash_map == map2);
  EXPECT_TRUE(boost_hash_map != map3);

  const std::map<string, int> bigger{ { "b", 2 }, { "a", 1 }, { "c", 3 } };
  EXPECT_TRUE(map1 != bigger);
  EXPECT_FALSE(map1.equals_unordered(bigger));
} // TEST(Ordered_map, Equality)

TEST(Ordered_map, Printing)
{
  EXPECT_EQ(util::ostream_op_string(Map{}), "Ordered_map()");
  EXPECT_EQ(util::ostream_op_string(Map{{ { "x", 1 }, { "y", 2 } }}), "Ordered_map([(x, 1), (y, 2)])");
}

TEST(Ordered_map, Iterators)
{
  Map map1{{ { "a", 1 }, { "b", 2 }, { "c", 3 } }};

  // An iterator stays valid across other insertions and erasures.
  auto it_b = map1.find("b");
  for (int idx = 0; idx != 100; ++idx)
  {
    map1.set(util::ostream_op_string("k", idx), idx);
  }
  map1.erase("a");
  map1.erase("c");
  EXPECT_EQ(it_b->first, "b");
  EXPECT_EQ(it_b->second, 2);
  ASSERT_NE(std::next(it_b), map1.end());
  EXPECT_EQ(std::next(it_b)->first, "k0");
  EXPECT_EQ(it_b, map1.begin());

  // Walk backwards from end().
  auto it = map1.end();
  --it;
  EXPECT_EQ(it->first, "k99");
  EXPECT_EQ(map1.rbegin()->first, "k99");
  EXPECT_EQ(std::prev(map1.rend())->first, "b");

  Map::Const_iterator c_it = it; // Mutable-to-immutable conversion.
  EXPECT_EQ(c_it, it);
  EXPECT_EQ(std::distance(map1.cbegin(), map1.cend()), 101);
} // TEST(Ordered_map, Iterators)

} // namespace odict::dict::test
