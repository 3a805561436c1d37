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


#include "odict/dict/serialization.hpp"
#include "odict/test/test_logger.hpp"
#include <boost/archive/text_iarchive.hpp>
#include <boost/archive/text_oarchive.hpp>
#include <boost/archive/xml_iarchive.hpp>
#include <boost/archive/xml_oarchive.hpp>
#include <boost/serialization/string.hpp>
#include <boost/serialization/vector.hpp>
#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include <vector>

namespace odict::dict::test
{

namespace
{
using std::string;
using std::vector;
using Map = Ordered_map<string, int>;
} // Anonymous namespace

TEST(Ordered_map_serialization, Text_archive)
{
  odict::test::Test_logger logger;
  const Map map1{{ { "z", 26 }, { "a", 1 }, { "m", 13 } }, &logger};

  std::stringstream ss;
  {
    boost::archive::text_oarchive o_ar(ss);
    o_ar << map1;
  }

  // Loading replaces what was there; the Logger of the target stays.
  Map map2{{ { "q", 0 } }, &logger};
  {
    boost::archive::text_iarchive i_ar(ss);
    i_ar >> map2;
  }
  EXPECT_EQ(map2, map1); // Order-sensitive: the order survived.
  EXPECT_EQ(map2.keys(), (vector<string>{ "z", "a", "m" }));
  EXPECT_EQ(map2.get_logger(), &logger);

  // Empty map.
  const Map map3;
  std::stringstream ss2;
  {
    boost::archive::text_oarchive o_ar(ss2);
    o_ar << map3;
  }
  {
    boost::archive::text_iarchive i_ar(ss2);
    i_ar >> map2;
  }
  EXPECT_TRUE(map2.empty());
} // TEST(Ordered_map_serialization, Text_archive)

TEST(Ordered_map_serialization, Xml_archive_default_map)
{
  using Dmap = Default_ordered_map<string, vector<int>>;
  const Dmap map1(std::nullopt, {{ "b", { 1, 2 } }, { "a", {} }});

  std::stringstream ss;
  {
    boost::archive::xml_oarchive o_ar(ss);
    o_ar << boost::serialization::make_nvp("map", map1);
  }

  // The factory is not archived: the target keeps its own.
  Dmap map2([]() { return vector<int>{ 7 }; });
  {
    boost::archive::xml_iarchive i_ar(ss);
    i_ar >> boost::serialization::make_nvp("map", map2);
  }
  EXPECT_EQ(map2.keys(), (vector<string>{ "b", "a" }));
  EXPECT_EQ(map2.get("b"), (vector<int>{ 1, 2 }));
  EXPECT_TRUE(map2.get("a").empty());
  ASSERT_TRUE(map2.default_factory());
  EXPECT_EQ(map2.get("new"), vector<int>{ 7 });
} // TEST(Ordered_map_serialization, Xml_archive_default_map)

} // namespace odict::dict::test
