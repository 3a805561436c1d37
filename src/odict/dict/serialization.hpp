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


/// @file
#pragma once

#include "odict/dict/default_ordered_map.hpp"
#include <boost/serialization/collection_size_type.hpp>
#include <boost/serialization/nvp.hpp>
#include <boost/serialization/split_free.hpp>
#include <boost/serialization/utility.hpp>
#include <cstddef>
#include <utility>

/* Boost.Serialization support for dict::Ordered_map and dict::Default_ordered_map.  `#include` this, plus the
 * `boost/serialization/...` headers for your #Key and #Mapped types, and `ar << map` / `ar >> map` work with any
 * Boost archive.  The archived form is the element count followed by the key/mapped-value pairs in iteration order;
 * loading replays them through `set()`, so the order survives the round trip.
 *
 * A Default_ordered_map archives only its entries: a factory is code, not data, so a loaded map keeps whatever
 * factory it was constructed with. */

namespace boost::serialization
{

// Free functions.

/**
 * Writes the elements of the given map, in iteration order, to the given archive.
 *
 * @tparam Archive
 *         Boost output archive type.
 * @param ar
 *        Archive.
 * @param map
 *        Map to save.
 */
template<typename Archive, typename Key, typename Mapped, typename Hash, typename Pred>
void save(Archive& ar, const ::odict::dict::Ordered_map<Key, Mapped, Hash, Pred>& map, const unsigned int)
{
  using Value_movable = typename ::odict::dict::Ordered_map<Key, Mapped, Hash, Pred>::Value_movable;

  const collection_size_type count(map.size());
  ar << BOOST_SERIALIZATION_NVP(count);
  for (const auto& key_and_mapped : map)
  {
    const Value_movable item(key_and_mapped);
    ar << make_nvp("item", item);
  }
}

/**
 * Replaces the contents of the given map with the elements read from the given archive, in archived order.
 *
 * @tparam Archive
 *         Boost input archive type.
 * @param ar
 *        Archive.
 * @param map
 *        Map to load into.  Its Logger, factory (if any) and hashing are untouched.
 */
template<typename Archive, typename Key, typename Mapped, typename Hash, typename Pred>
void load(Archive& ar, ::odict::dict::Ordered_map<Key, Mapped, Hash, Pred>& map, const unsigned int)
{
  using Value_movable = typename ::odict::dict::Ordered_map<Key, Mapped, Hash, Pred>::Value_movable;

  ODICT_LOG_SET_CONTEXT(map.get_logger(), ::odict::Odict_log_component::S_DICT);

  map.clear();

  collection_size_type count;
  ar >> BOOST_SERIALIZATION_NVP(count);
  const std::size_t n_items(count);
  ODICT_LOG_TRACE("Ordered_map [" << &map << "]: Loading [" << n_items << "] elements from archive.");

  for (std::size_t idx = 0; idx != n_items; ++idx)
  {
    Value_movable item;
    ar >> make_nvp("item", item);
    map.set(std::move(item.first), std::move(item.second));
  }
}

/**
 * Dispatches to save() or load().
 *
 * @tparam Archive
 *         Boost archive type.
 * @param ar
 *        Archive.
 * @param map
 *        Map.
 * @param version
 *        Class version.
 */
template<typename Archive, typename Key, typename Mapped, typename Hash, typename Pred>
void serialize(Archive& ar, ::odict::dict::Ordered_map<Key, Mapped, Hash, Pred>& map, const unsigned int version)
{
  split_free(ar, map, version);
}

/**
 * Archives the entries of the given Default_ordered_map exactly as those of an Ordered_map.
 *
 * @tparam Archive
 *         Boost archive type.
 * @param ar
 *        Archive.
 * @param map
 *        Map.
 * @param version
 *        Class version.
 */
template<typename Archive, typename Key, typename Mapped, typename Hash, typename Pred>
void serialize(Archive& ar, ::odict::dict::Default_ordered_map<Key, Mapped, Hash, Pred>& map,
               const unsigned int version)
{
  split_free(ar, static_cast<::odict::dict::Ordered_map<Key, Mapped, Hash, Pred>&>(map), version);
}

} // namespace boost::serialization
