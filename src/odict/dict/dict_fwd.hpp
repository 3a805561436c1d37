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

#include "odict/common.hpp"
#include <boost/functional/hash.hpp>
#include <boost/unordered_map.hpp>
#include <functional>
#include <iostream>
#include <map>
#include <unordered_map>

/**
 * odict module containing the insertion-ordered associative containers: Ordered_map and its auto-vivifying
 * subclass Default_ordered_map.  Both combine hash lookup by key with iteration in the order keys were first
 * inserted.  Errors are reported per the #odict::Error_code conventions using the dict::error::Code set.
 */
namespace odict::dict
{

// Types.

// Find doc headers near the bodies of these compound types.

template<typename Key, typename Mapped, typename Hash = boost::hash<Key>, typename Pred = std::equal_to<Key>>
class Ordered_map;

template<typename Key, typename Mapped, typename Hash = boost::hash<Key>, typename Pred = std::equal_to<Key>>
class Default_ordered_map;

// Free functions.

/**
 * Equivalent to `val1.swap(val2)`.
 *
 * @relatesalso Ordered_map
 * @param val1
 *        Object.
 * @param val2
 *        Object.
 */
template<typename Key, typename Mapped, typename Hash, typename Pred>
void swap(Ordered_map<Key, Mapped, Hash, Pred>& val1, Ordered_map<Key, Mapped, Hash, Pred>& val2);

/**
 * Order-sensitive equality: `true` if and only if both maps have the same size, and walking both in insertion order
 * yields pairwise-equal keys and mapped values.  So `{a: 1, b: 2}` and `{b: 2, a: 1}` are *not* equal.
 *
 * @relatesalso Ordered_map
 * @param val1
 *        Object.
 * @param val2
 *        Object.
 * @return See above.
 */
template<typename Key, typename Mapped, typename Hash, typename Pred>
bool operator==(const Ordered_map<Key, Mapped, Hash, Pred>& val1, const Ordered_map<Key, Mapped, Hash, Pred>& val2);

/**
 * Negation of the order-sensitive `operator==()`.
 *
 * @relatesalso Ordered_map
 * @param val1
 *        Object.
 * @param val2
 *        Object.
 * @return See above.
 */
template<typename Key, typename Mapped, typename Hash, typename Pred>
bool operator!=(const Ordered_map<Key, Mapped, Hash, Pred>& val1, const Ordered_map<Key, Mapped, Hash, Pred>& val2);

/**
 * Order-insensitive equality against an unordered (non-Ordered_map) map: see Ordered_map::equals_unordered().
 *
 * @relatesalso Ordered_map
 * @param val1
 *        Object.
 * @param val2
 *        Object.
 * @return See above.
 */
template<typename Key, typename Mapped, typename Hash, typename Pred,
         typename Hash2, typename Pred2, typename Allocator>
bool operator==(const Ordered_map<Key, Mapped, Hash, Pred>& val1,
                const boost::unordered_map<Key, Mapped, Hash2, Pred2, Allocator>& val2);

/**
 * Order-insensitive equality against an unordered (non-Ordered_map) map: see Ordered_map::equals_unordered().
 *
 * @relatesalso Ordered_map
 * @param val1
 *        Object.
 * @param val2
 *        Object.
 * @return See above.
 */
template<typename Key, typename Mapped, typename Hash, typename Pred,
         typename Hash2, typename Pred2, typename Allocator>
bool operator==(const boost::unordered_map<Key, Mapped, Hash2, Pred2, Allocator>& val1,
                const Ordered_map<Key, Mapped, Hash, Pred>& val2);

/**
 * Order-insensitive equality against an unordered (non-Ordered_map) map: see Ordered_map::equals_unordered().
 *
 * @relatesalso Ordered_map
 * @param val1
 *        Object.
 * @param val2
 *        Object.
 * @return See above.
 */
template<typename Key, typename Mapped, typename Hash, typename Pred,
         typename Hash2, typename Pred2, typename Allocator>
bool operator==(const Ordered_map<Key, Mapped, Hash, Pred>& val1,
                const std::unordered_map<Key, Mapped, Hash2, Pred2, Allocator>& val2);

/**
 * Order-insensitive equality against an unordered (non-Ordered_map) map: see Ordered_map::equals_unordered().
 *
 * @relatesalso Ordered_map
 * @param val1
 *        Object.
 * @param val2
 *        Object.
 * @return See above.
 */
template<typename Key, typename Mapped, typename Hash, typename Pred,
         typename Hash2, typename Pred2, typename Allocator>
bool operator==(const std::unordered_map<Key, Mapped, Hash2, Pred2, Allocator>& val1,
                const Ordered_map<Key, Mapped, Hash, Pred>& val2);

/**
 * Order-insensitive equality against a sorted map: see Ordered_map::equals_unordered().  The sorting order of
 * `val2` is irrelevant; only the key/value set is compared.
 *
 * @relatesalso Ordered_map
 * @param val1
 *        Object.
 * @param val2
 *        Object.
 * @return See above.
 */
template<typename Key, typename Mapped, typename Hash, typename Pred, typename Compare, typename Allocator>
bool operator==(const Ordered_map<Key, Mapped, Hash, Pred>& val1,
                const std::map<Key, Mapped, Compare, Allocator>& val2);

/**
 * Order-insensitive equality against a sorted map: see Ordered_map::equals_unordered().
 *
 * @relatesalso Ordered_map
 * @param val1
 *        Object.
 * @param val2
 *        Object.
 * @return See above.
 */
template<typename Key, typename Mapped, typename Hash, typename Pred, typename Compare, typename Allocator>
bool operator==(const std::map<Key, Mapped, Compare, Allocator>& val1,
                const Ordered_map<Key, Mapped, Hash, Pred>& val2);

/**
 * Negation of the corresponding `operator==()`.
 *
 * @relatesalso Ordered_map
 * @param val1
 *        Object.
 * @param val2
 *        Object.
 * @return See above.
 */
template<typename Key, typename Mapped, typename Hash, typename Pred,
         typename Hash2, typename Pred2, typename Allocator>
bool operator!=(const Ordered_map<Key, Mapped, Hash, Pred>& val1,
                const boost::unordered_map<Key, Mapped, Hash2, Pred2, Allocator>& val2);

/**
 * Negation of the corresponding `operator==()`.
 *
 * @relatesalso Ordered_map
 * @param val1
 *        Object.
 * @param val2
 *        Object.
 * @return See above.
 */
template<typename Key, typename Mapped, typename Hash, typename Pred,
         typename Hash2, typename Pred2, typename Allocator>
bool operator!=(const boost::unordered_map<Key, Mapped, Hash2, Pred2, Allocator>& val1,
                const Ordered_map<Key, Mapped, Hash, Pred>& val2);

/**
 * Negation of the corresponding `operator==()`.
 *
 * @relatesalso Ordered_map
 * @param val1
 *        Object.
 * @param val2
 *        Object.
 * @return See above.
 */
template<typename Key, typename Mapped, typename Hash, typename Pred,
         typename Hash2, typename Pred2, typename Allocator>
bool operator!=(const Ordered_map<Key, Mapped, Hash, Pred>& val1,
                const std::unordered_map<Key, Mapped, Hash2, Pred2, Allocator>& val2);

/**
 * Negation of the corresponding `operator==()`.
 *
 * @relatesalso Ordered_map
 * @param val1
 *        Object.
 * @param val2
 *        Object.
 * @return See above.
 */
template<typename Key, typename Mapped, typename Hash, typename Pred,
         typename Hash2, typename Pred2, typename Allocator>
bool operator!=(const std::unordered_map<Key, Mapped, Hash2, Pred2, Allocator>& val1,
                const Ordered_map<Key, Mapped, Hash, Pred>& val2);

/**
 * Negation of the corresponding `operator==()`.
 *
 * @relatesalso Ordered_map
 * @param val1
 *        Object.
 * @param val2
 *        Object.
 * @return See above.
 */
template<typename Key, typename Mapped, typename Hash, typename Pred, typename Compare, typename Allocator>
bool operator!=(const Ordered_map<Key, Mapped, Hash, Pred>& val1,
                const std::map<Key, Mapped, Compare, Allocator>& val2);

/**
 * Negation of the corresponding `operator==()`.
 *
 * @relatesalso Ordered_map
 * @param val1
 *        Object.
 * @param val2
 *        Object.
 * @return See above.
 */
template<typename Key, typename Mapped, typename Hash, typename Pred, typename Compare, typename Allocator>
bool operator!=(const std::map<Key, Mapped, Compare, Allocator>& val1,
                const Ordered_map<Key, Mapped, Hash, Pred>& val2);

/**
 * Prints string representation of the given Ordered_map to the given `ostream`: `Ordered_map([(k1, v1), (k2, v2)])`
 * in insertion order; or `Ordered_map()` if empty.  `Key` and `Mapped` must themselves support `ostream<<`.
 *
 * @relatesalso Ordered_map
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
template<typename Key, typename Mapped, typename Hash, typename Pred>
std::ostream& operator<<(std::ostream& os, const Ordered_map<Key, Mapped, Hash, Pred>& val);

/**
 * Prints string representation of the given Default_ordered_map to the given `ostream`:
 * `Default_ordered_map(<factory>, Ordered_map([...]))`, or with `None` in place of `<factory>` if there is no factory.
 *
 * @relatesalso Default_ordered_map
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
template<typename Key, typename Mapped, typename Hash, typename Pred>
std::ostream& operator<<(std::ostream& os, const Default_ordered_map<Key, Mapped, Hash, Pred>& val);

} // namespace odict::dict
