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


#include "odict/dict/detail/seq_arena.hpp"
#include <gtest/gtest.h>
#include <string>
#include <utility>
#include <vector>

namespace odict::dict::detail::test
{

namespace
{
using std::string;
using std::vector;
using Arena = Seq_arena<std::pair<const string, int>>;
using Iterator = Seq_iterator<Arena, false>;
using Const_iterator = Seq_iterator<Arena, true>;

vector<string> keys_of(const Arena& arena)
{
  vector<string> keys;
  for (auto handle = arena.front(); handle != Arena::S_SENTINEL; handle = arena.next(handle))
  {
    keys.push_back(arena.value(handle).first);
  }
  return keys;
}

} // Anonymous namespace

TEST(Seq_arena, Link_unlink)
{
  Arena arena;
  EXPECT_TRUE(arena.empty());
  EXPECT_EQ(arena.size(), 0u);
  EXPECT_EQ(arena.front(), Arena::S_SENTINEL);
  EXPECT_EQ(arena.back(), Arena::S_SENTINEL);

  const auto h_a = arena.link_back("a", 1);
  const auto h_b = arena.link_back("b", 2);
  const auto h_c = arena.link_back("c", 3);
  EXPECT_EQ(keys_of(arena), (vector<string>{ "a", "b", "c" }));
  EXPECT_EQ(arena.size(), 3u);
  EXPECT_EQ(arena.front(), h_a);
  EXPECT_EQ(arena.back(), h_c);
  EXPECT_EQ(arena.prev(h_b), h_a);
  EXPECT_EQ(arena.next(h_c), Arena::S_SENTINEL);

  // Unlinking the middle splices the neighbors; the other handles keep pointing at their values.
  arena.unlink(h_b);
  EXPECT_EQ(keys_of(arena), (vector<string>{ "a", "c" }));
  EXPECT_EQ(arena.next(h_a), h_c);
  EXPECT_EQ(arena.prev(h_c), h_a);
  EXPECT_EQ(arena.value(h_c).second, 3);
  EXPECT_EQ(arena.size(), 2u);
  EXPECT_EQ(arena.n_slots(), 3u);

  // The freed slot is reused, and the new node goes at the end.
  const auto h_d = arena.link_back("d", 4);
  EXPECT_EQ(h_d, h_b);
  EXPECT_EQ(arena.n_slots(), 3u);
  EXPECT_EQ(keys_of(arena), (vector<string>{ "a", "c", "d" }));

  arena.unlink(h_a);
  arena.unlink(h_c);
  arena.unlink(h_d);
  EXPECT_TRUE(arena.empty());
  EXPECT_EQ(arena.size(), 0u);

  arena.link_back("e", 5);
  arena.clear();
  EXPECT_TRUE(arena.empty());
  EXPECT_EQ(arena.n_slots(), 0u);
} // TEST(Seq_arena, Link_unlink)

TEST(Seq_arena, Copy_and_swap)
{
  Arena arena1;
  arena1.link_back("a", 1);
  const auto h_b = arena1.link_back("b", 2);
  arena1.link_back("c", 3);
  arena1.unlink(h_b);

  // A copy keeps the free list too, so handles mean the same thing in both.
  Arena arena2(arena1);
  EXPECT_EQ(keys_of(arena2), (vector<string>{ "a", "c" }));
  EXPECT_EQ(arena2.link_back("x", 9), h_b);
  EXPECT_EQ(keys_of(arena1), (vector<string>{ "a", "c" }));

  arena1.swap(arena2);
  EXPECT_EQ(keys_of(arena1), (vector<string>{ "a", "c", "x" }));
  EXPECT_EQ(keys_of(arena2), (vector<string>{ "a", "c" }));
}

TEST(Seq_arena, Iterators)
{
  Arena arena;
  const auto h_a = arena.link_back("a", 1);
  arena.link_back("b", 2);

  Iterator it(&arena, h_a);
  const Iterator end(&arena, Arena::S_SENTINEL);
  it->second = 10;
  EXPECT_EQ(arena.value(h_a).second, 10);
  ++it;
  EXPECT_EQ((*it).first, "b");
  EXPECT_EQ(it++->first, "b");
  EXPECT_EQ(it, end);
  --it;
  EXPECT_EQ(it->first, "b");

  // Growth relocates values but not positions.
  for (int idx = 0; idx != 50; ++idx)
  {
    arena.link_back(std::to_string(idx), idx);
  }
  EXPECT_EQ(it->first, "b");

  const Const_iterator c_it(it);
  EXPECT_EQ(c_it, it);
  EXPECT_EQ(it, c_it);
  EXPECT_NE(Const_iterator(end), c_it);
  EXPECT_EQ(Iterator(), Iterator());
} // TEST(Seq_arena, Iterators)

} // namespace odict::dict::detail::test
