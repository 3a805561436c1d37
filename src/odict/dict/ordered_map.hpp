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

#include "odict/dict/dict_fwd.hpp"
#include "odict/dict/detail/seq_arena.hpp"
#include "odict/dict/error/error.hpp"
#include "odict/error/error.hpp"
#include "odict/log/log.hpp"
#include <boost/unordered_map.hpp>
#include <cassert>
#include <cstddef>
#include <initializer_list>
#include <iterator>
#include <utility>
#include <vector>

namespace odict::dict
{

/**
 * An object of this class is a map that combines the lookup speed of an `unordered_map<>` with iteration in
 * *insertion order*: the order in which keys were first added.  Overwriting the value of an existing key leaves its
 * position alone; removing a key and adding it again puts it at the end.
 *
 * The API is generally that of an `unordered_map<>`, plus a handful of operations that only make sense for an
 * ordered dictionary: pop() from either end, pop_key(), set_default(), keys()/values()/items() snapshots, update(),
 * and the from_keys()/from_pairs() factories.  Every operation is constant time on average, except the
 * whole-container ones (copy, clear(), snapshots, equality), which are linear.
 *
 * Move semantics for both keys and mapped-values are supported (let `T` be a concrete type for a `*this` and `x`
 * a `*this`):
 *   - `x.set(std::move(key), std::move(mapped))`;
 *   - `x.insert(T::Value_movable{..., ...})`;
 *   - `x[std::move(key)] = std::move(mapped)`.
 *
 * There is the standard complement of container-wide move operations: move-construction, move-assignment, and
 * `swap()` (all constant-time, excluding any implied `this->clear()` in the move-assignment).  A moved-from
 * `*this` is empty and usable.
 *
 * ### Equality ###
 * Comparing two Ordered_map%s is order-sensitive: `{a: 1, b: 2} != {b: 2, a: 1}`.  Comparing an Ordered_map with a
 * `boost::unordered_map`, `std::unordered_map` or `std::map` (in either direction) compares only the key/value sets.
 * See equals_unordered() for other map types.
 *
 * ### Errors ###
 * get() throws error::Runtime_error with dict::error::Code::S_KEY_NOT_FOUND for a missing key.  The other APIs that
 * can fail routinely (remove(), pop(), pop_key()) follow the #odict::Error_code convention: pass null (the default)
 * to get an exception, or non-null to get the code set in place.  Every emitted error is logged at INFO severity.
 *
 * ### Iterators and references ###
 * Iterators are bidirectional and yield #Value (key/mapped pairs, the key being `const`).  An iterator remains valid
 * until its own element is erased; insertions and other erasures do not disturb it.  A *reference* or pointer to a
 * stored value (including what get() and `operator[]` return) is invalidated by any subsequent insertion, as in an
 * `std::vector`.  Mutating `*this` during iteration (other than assigning to `it->second`) is allowed, but which
 * elements the iteration then visits is unspecified.
 *
 * ### Logging ###
 * `*this` is a log::Log_context: pass a `log::Logger*` (may be null) at construction.  Logging uses component
 * Odict_log_component::S_DICT.  Whole-container operations log at TRACE.
 *
 * ### Thread safety ###
 * Same as for `unordered_map<>`.
 *
 * @internal
 * ### Impl notes ###
 * Storage is a detail::Seq_arena: a doubly linked circular sequence of nodes, each holding a #Value, addressed by
 * integer handles inside an `std::vector`, with handle 0 as a permanent sentinel.  Lookup goes through #m_index, an
 * `unordered_map` from #Key to node handle.  Hence each key is stored twice: once in #m_index, once in its node.  The
 * invariant tying the two together: the set of keys in #m_index equals the set of keys in the linked nodes, and each
 * index entry's handle is the node carrying its key.  Every mutator maintains it by changing both in one step;
 * link_new() and unlink() are the only places nodes come and go.
 * @endinternal
 *
 * @tparam Key_t
 *         Key type.  Must be copy-constructible; and default-constructible to use pop().  Printable via `ostream<<`
 *         to use the `ostream<<` of `*this`.
 * @tparam Mapped_t
 *         The 2nd (satellite) part of the #Value pair type.  Must be default-constructible to use `operator[]`,
 *         pop(), pop_key() and set_default()'s default argument.
 * @tparam Hash_t
 *         Hasher type.  Same requirements and behavior as `boost::unordered_map<>` counterpart.  If using the default
 *         value for #Hash (`boost::hash<Key>`), but there is no hash function already defined for #Key, then the
 *         easiest way to define it is: make a `size_t hash_value(Key)` free function in the same namespace as #Key.
 * @tparam Pred_t
 *         Equality-determiner type.  Same requirements and behavior as `boost::unordered_map<>` counterpart.
 */
template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
class Ordered_map :
  public log::Log_context
{
public:
  // Types.

  /// Key type.
  using Key = Key_t;

  /// Mapped value type.
  using Mapped = Mapped_t;

  /// Hasher of #Key.
  using Hash = Hash_t;

  /// Equality of #Key.
  using Pred = Pred_t;

  /// An entry, as stored and as iterators show it.
  using Value = std::pair<Key const, Mapped>;

  /// An entry with a mutable key: the argument of the moving insert(), and what pop() and items() return.
  using Value_movable = std::pair<Key, Mapped>;

private:
  // Types.  These are here in the middle of public block due to inability to forward-declare aliases.

  /// The node storage.
  using Arena = detail::Seq_arena<Value>;

  /// Short-hand for arena node handle.
  using Handle = typename Arena::Handle;

public:
  // Types (continued).

  /// Sizes and counts.
  using size_type = std::size_t;

  /// Iterator distance.
  using difference_type = std::ptrdiff_t;

  /// Bidirectional iterator, in insertion order, through which the #Mapped part may be modified.
  using Iterator = detail::Seq_iterator<Arena, false>;

  /// Read-only counterpart of #Iterator.
  using Const_iterator = detail::Seq_iterator<Arena, true>;

  /// #Iterator in reverse insertion order.
  using Reverse_iterator = std::reverse_iterator<Iterator>;

  /// #Const_iterator in reverse insertion order.
  using Const_reverse_iterator = std::reverse_iterator<Const_iterator>;

  // Standard container aliases.

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
  /// Reference to #Value.
  using reference = Value&;
  /// Reference to `const` #Value.
  using const_reference = const Value&;
  /// Same as #Iterator.
  using iterator = Iterator;
  /// Same as #Const_iterator.
  using const_iterator = Const_iterator;
  /// Same as #Reverse_iterator.
  using reverse_iterator = Reverse_iterator;
  /// Same as #Const_reverse_iterator.
  using const_reverse_iterator = Const_reverse_iterator;

  // Constructors/destructor.

  /**
   * Constructs empty structure with some basic parameters.
   *
   * @param logger_ptr
   *        The Logger to use for logging subsequently; null to not log.
   * @param n_buckets
   *        Number of buckets for the lookup index.  Use -1 to use the default.
   * @param hasher_obj
   *        Instance of the hash function type (`hasher_obj(k)` should be `size_t` hash of key `k`).
   * @param pred
   *        Instance of the equality function type (`pred(k1, k2)` should return `true` if and
   *        only if the keys are equal by value).
   */
  explicit Ordered_map(log::Logger* logger_ptr = nullptr,
                       size_type n_buckets = size_type(-1),
                       const Hash& hasher_obj = Hash{},
                       const Pred& pred = Pred{});

  /**
   * Constructs structure with some basic parameters, and values initialized from initializer list.
   * The values are assigned in list order with set() semantics: a repeated key keeps the position of its first
   * occurrence and the value of its last.
   *
   * @param values
   *        Values with which to fill the structure after initializing it.
   *        Typically you'd provide a series of key/value pairs like this:
   *        `{{ "a", 1 }, { "b", 2 }, ...}`.
   * @param logger_ptr
   *        See other constructor.
   * @param n_buckets
   *        See other constructor.
   * @param hasher_obj
   *        See other constructor.
   * @param pred
   *        See other constructor.
   */
  explicit Ordered_map(std::initializer_list<Value> values,
                       log::Logger* logger_ptr = nullptr,
                       size_type n_buckets = size_type(-1),
                       const Hash& hasher_obj = Hash{},
                       const Pred& pred = Pred{});

  /**
   * Constructs object that is a copy of the given source: same elements, in the same order, with independent
   * storage; same Logger and log Component.
   *
   * @param src
   *        Source object.
   */
  Ordered_map(const Ordered_map& src);

  /**
   * Constructs object by making it equal to the given source, while the given source becomes as-if
   * default-cted (except for its Logger, which becomes null).
   *
   * @param src
   *        Source object which is emptied.
   */
  Ordered_map(Ordered_map&& src);

  // Methods.

  /**
   * Overwrites the contents of this structure to be equal to the given source.  Equivalent to `swap()` with a copy.
   *
   * @param src
   *        Source object.
   * @return `*this`.
   */
  Ordered_map& operator=(const Ordered_map& src);

  /**
   * Overwrites the contents of this structure to be equal to the given source, while the given source becomes
   * empty.
   *
   * @param src
   *        Source object which is emptied.
   * @return `*this`.
   */
  Ordered_map& operator=(Ordered_map&& src);

  /**
   * Swaps the contents of this structure and `other`, including Logger and log Component.  Constant time.
   *
   * @param other
   *        Other object.
   */
  void swap(Ordered_map& other);

  /**
   * Associates `mapped` with `key`.  If `key` is absent, it is appended at the end of the iteration order; if
   * present, only its mapped value is replaced and its position is unchanged.
   *
   * @param key
   *        Key.
   * @param mapped
   *        Value.
   */
  void set(const Key& key, const Mapped& mapped);

  /**
   * Identical to the other overload, except that the key and value are moved, not copied, into `*this`.
   *
   * @param key
   *        Key.
   * @param mapped
   *        Value.
   */
  void set(Key&& key, Mapped&& mapped);

  /**
   * Attempts to insert the given key/mapped-value pair into the map.  If the key is already present in the map,
   * does nothing.  Otherwise inserts it at the end of the iteration order.
   *
   * @param key_and_mapped
   *        The key/mapped-value pair to attempt to insert.  A copy of this value is placed in `*this`.
   * @return A pair whose second element is `true` if and only if the insertion occurred; and whose first element
   *         is an iterator pointing to either the newly inserted element or already present one with a key equal to
   *         `key_and_mapped.first`.
   */
  std::pair<Iterator, bool> insert(const Value& key_and_mapped);

  /**
   * Identical to the other overload, except that (if key not already present) the key and mapped-value are moved,
   * not copied, into `*this`.
   *
   * @param key_and_mapped
   *        The key/mapped-value pair to attempt to insert (both key and mapped-value are moved-from, if insertion
   *        occurs).
   * @return See other overload.
   */
  std::pair<Iterator, bool> insert(Value_movable&& key_and_mapped);

  /**
   * Either finds the #Mapped value at the given key, or if not found inserts one with a default-constructed
   * `Mapped{}` at the end of the iteration order.  Then returns reference to the in-structure stored #Mapped value.
   *
   * @param key
   *        The key to find.  Copied if absent.
   * @return Reference to the stored #Mapped.
   */
  Mapped& operator[](const Key& key);

  /**
   * Identical to the other overload, except that if `key` is not already present in the map, it is moved, not
   * copied, into `*this`.
   *
   * @param key
   *        The key to find.  Moved if absent.
   * @return See other overload.
   */
  Mapped& operator[](Key&& key);

  /**
   * Returns reference to the #Mapped value at the given key.  No side effects.
   *
   * @param key
   *        The key to find.
   * @return Reference to the stored #Mapped.
   * @throws error::Runtime_error with dict::error::Code::S_KEY_NOT_FOUND, if `key` is absent.
   */
  Mapped& get(const Key& key);

  /**
   * Identical to the other overload but `const`.
   *
   * @param key
   *        The key to find.
   * @return Reference to the stored #Mapped.
   * @throws error::Runtime_error with dict::error::Code::S_KEY_NOT_FOUND, if `key` is absent.
   */
  const Mapped& get(const Key& key) const;

  /**
   * Attempts to find value at the given key in the map.
   *
   * @param key
   *        The key to find.
   * @return Iterator to the found element; or end() if not found.
   */
  Iterator find(const Key& key);

  /**
   * Attempts to find value at the given key in the map.
   *
   * @param key
   *        The key to find.
   * @return Iterator to the found element; or cend() if not found.
   */
  Const_iterator find(const Key& key) const;

  /**
   * Returns the number of times a key is equivalent to the given one is present in the map: either 1 or 0.
   *
   * @param key
   *        Key whose equal to find.
   * @return 0 or 1.
   */
  size_type count(const Key& key) const;

  /**
   * Returns `true` if and only if the given key is present.
   *
   * @param key
   *        Key to find.
   * @return See above.
   */
  bool contains(const Key& key) const;

  /**
   * Removes the element with the given key.  The positions of the other elements are unchanged.
   *
   * @param key
   *        Key to remove.
   * @param err_code
   *        See #odict::Error_code.  dict::error::Code::S_KEY_NOT_FOUND if `key` is absent.
   */
  void remove(const Key& key, Error_code* err_code = nullptr);

  /**
   * Erases the element pointed to by the given valid iterator.
   *
   * @param it
   *        Iterator of element to erase.  Must not be end().
   * @return Iterator one position past (in iteration order) the erased element, or end() if it was the last one.
   */
  Iterator erase(const Const_iterator& it);

  /**
   * Erases the element with the given key, if it exists.  Like remove() but not an error if absent.
   *
   * @param key
   *        Key such that its equal's (if found) element will be erased.
   * @return Number of elements erased (0 or 1).
   */
  size_type erase(const Key& key);

  /**
   * Removes and returns an element from either end of the iteration order: the last one (LIFO) if `last`, else
   * the first one (FIFO).
   *
   * @param last
   *        `true` to pop the most recently inserted element; `false` for the least recently inserted.
   * @param err_code
   *        See #odict::Error_code.  dict::error::Code::S_EMPTY_CONTAINER if `empty()`.
   * @return The removed key and value; default-constructed if `*err_code` is set to an error.
   */
  Value_movable pop(bool last = true, Error_code* err_code = nullptr);

  /**
   * Removes the element with the given key and returns its value.
   *
   * @param key
   *        Key to remove.
   * @param err_code
   *        See #odict::Error_code.  dict::error::Code::S_KEY_NOT_FOUND if `key` is absent.
   * @return The removed value; default-constructed if `*err_code` is set to an error.
   */
  Mapped pop_key(const Key& key, Error_code* err_code = nullptr);

  /**
   * Removes the element with the given key and returns its value; or, if absent, returns `default_val` and changes
   * nothing.  Never fails.
   *
   * @param key
   *        Key to remove.
   * @param default_val
   *        Value to return if `key` is absent.
   * @return See above.
   */
  Mapped pop_key_or(const Key& key, Mapped default_val);

  /**
   * Returns the value at the given key, first inserting `(key, default_val)` at the end if `key` is absent.
   *
   * @param key
   *        Key.
   * @param default_val
   *        Value to insert if `key` is absent.
   * @return Reference to the stored #Mapped.
   */
  Mapped& set_default(const Key& key, const Mapped& default_val = Mapped{});

  /// Makes it so that `size() == 0`.
  void clear();

  /**
   * Returns an independent copy of `*this`: same elements in the same order, same Logger.  Equivalent to the copy
   * constructor.
   *
   * @return See above.
   */
  Ordered_map copy() const;

  /**
   * Returns the keys, in iteration order.
   * @return See above.
   */
  std::vector<Key> keys() const;

  /**
   * Returns the mapped values, in iteration order.
   * @return See above.
   */
  std::vector<Mapped> values() const;

  /**
   * Returns copies of the key/mapped-value pairs, in iteration order.
   * @return See above.
   */
  std::vector<Value_movable> items() const;

  /**
   * `set()`s each key/mapped-value pair of the given range, in the range's order.
   *
   * @tparam Pair_range
   *         Any range (e.g., a container) of elements `p` such that `p.first` is a #Key and `p.second` a #Mapped;
   *         including another Ordered_map.
   * @param pairs
   *        The pairs.
   */
  template<typename Pair_range>
  void update(const Pair_range& pairs);

  /**
   * `set()`s each key/mapped-value pair of the given list, in order.
   *
   * @param pairs
   *        The pairs.
   */
  void update(std::initializer_list<Value> pairs);

  /**
   * Returns `true` if and only if `other` contains exactly the same key/mapped-value pairs as `*this`, disregarding
   * order.  This is the comparison `operator==()` uses against `boost::unordered_map`, `std::unordered_map` and
   * `std::map`.
   *
   * @tparam Map
   *         Any associative container with `size()`, `find(Key)` and `end()`, whose iterators point to pairs.
   * @param other
   *        Other map.
   * @return See above.
   */
  template<typename Map>
  bool equals_unordered(const Map& other) const;

  /**
   * Returns first position in the iteration order: the least recently inserted element; or end() if empty.
   * @return See above.
   */
  Iterator begin();

  /**
   * Returns one past last position in the iteration order.
   * @return See above.
   */
  Iterator end();

  /**
   * Returns first position in the iteration order.
   * @return See above.
   */
  Const_iterator begin() const;

  /**
   * Returns one past last position in the iteration order.
   * @return See above.
   */
  Const_iterator end() const;

  /**
   * Synonym of `begin() const`.
   * @return See above.
   */
  Const_iterator cbegin() const;

  /**
   * Synonym of `end() const`.
   * @return See above.
   */
  Const_iterator cend() const;

  /**
   * Returns first position in the reverse iteration order: the most recently inserted element.
   * @return See above.
   */
  Reverse_iterator rbegin();

  /**
   * Returns one past last position in the reverse iteration order.
   * @return See above.
   */
  Reverse_iterator rend();

  /**
   * Returns first position in the reverse iteration order.
   * @return See above.
   */
  Const_reverse_iterator crbegin() const;

  /**
   * Returns one past last position in the reverse iteration order.
   * @return See above.
   */
  Const_reverse_iterator crend() const;

  /**
   * Returns `true` if and only if container is empty.
   * @return See above.
   */
  bool empty() const;

  /**
   * Returns number of elements stored.
   * @return See above.
   */
  size_type size() const;

  /**
   * Returns max number of elements that can be stored.
   * @return See above.
   */
  size_type max_size() const;

  /**
   * Constructs a map assigning `default_val` to each key of `keys`, in the order of `keys`.  A repeated key keeps
   * the position of its first occurrence.
   *
   * @tparam Key_range
   *         Any range of #Key.
   * @param keys
   *        The keys.
   * @param default_val
   *        The value for every key.
   * @param logger_ptr
   *        See constructor.
   * @return See above.
   */
  template<typename Key_range>
  static Ordered_map from_keys(const Key_range& keys, const Mapped& default_val = Mapped{},
                               log::Logger* logger_ptr = nullptr);

  /**
   * Identical to the other overload, taking the keys as an initializer list.
   *
   * @param keys
   *        The keys.
   * @param default_val
   *        The value for every key.
   * @param logger_ptr
   *        See constructor.
   * @return See above.
   */
  static Ordered_map from_keys(std::initializer_list<Key> keys, const Mapped& default_val = Mapped{},
                               log::Logger* logger_ptr = nullptr);

  /**
   * Constructs a map from an ordered range of key/mapped-value pairs, `set()`ting each in order.
   *
   * @tparam Pair_range
   *         See update().
   * @param pairs
   *        The pairs.
   * @param logger_ptr
   *        See constructor.
   * @return See above.
   */
  template<typename Pair_range>
  static Ordered_map from_pairs(const Pair_range& pairs, log::Logger* logger_ptr = nullptr);

protected:
  // Methods.

  /**
   * Core of set() and friends: overwrites the value of an existing key in place, or links a new node at the end.
   *
   * @tparam Key_arg
   *         Something from which a #Key can be constructed, and which can be looked up in #m_index.
   * @tparam Mapped_arg
   *         Something from which a #Mapped can be constructed or assigned.
   * @param key
   *        Key.
   * @param mapped
   *        Value.
   * @return Reference to the stored #Mapped.
   */
  template<typename Key_arg, typename Mapped_arg>
  Mapped& assign(Key_arg&& key, Mapped_arg&& mapped);

  /**
   * Logs (INFO) the given error and throws error::Runtime_error carrying it.  For the APIs that report failure
   * only by exception.
   *
   * @param code
   *        The error.
   * @param context
   *        Context for the exception, typically ODICT_UTIL_WHERE_AM_I_STR() of the caller.
   */
  [[noreturn]] void throw_error(error::Code code, util::String_view context) const;

private:
  // Types.

  /// Short-hand for the lookup index: key to node handle.
  using Index = boost::unordered_map<Key, Handle, Hash, Pred>;

  // Methods.

  /**
   * Links a new node carrying the given key and value at the end and adds it to #m_index.  The key must be absent.
   *
   * @tparam Key_arg
   *         See assign().
   * @tparam Mapped_arg
   *         See assign().
   * @param key
   *        Key.
   * @param mapped
   *        Value.
   * @return Handle of the new node.
   */
  template<typename Key_arg, typename Mapped_arg>
  Handle link_new(Key_arg&& key, Mapped_arg&& mapped);

  /**
   * Removes the given index entry and unlinks its node.
   *
   * @param index_it
   *        Valid iterator into #m_index.
   */
  void unlink(typename Index::iterator index_it);

  // Data.

  /// Lookup from key to the handle of the node carrying it.
  Index m_index;

  /// The nodes, in iteration order.
  Arena m_arena;
}; // class Ordered_map

// Free functions: in *_fwd.hpp.

// Template implementations.

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
Ordered_map<Key_t, Mapped_t, Hash_t, Pred_t>::Ordered_map(log::Logger* logger_ptr,
                                                          size_type n_buckets,
                                                          const Hash& hasher_obj,
                                                          const Pred& pred) :
  log::Log_context(logger_ptr, Odict_log_component::S_DICT),
  // 0 buckets lets the index pick its own minimum.
  m_index((n_buckets == size_type(-1)) ? 0 : n_buckets, hasher_obj, pred)
{
  // That's all.
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
Ordered_map<Key_t, Mapped_t, Hash_t, Pred_t>::Ordered_map(std::initializer_list<Value> values,
                                                          log::Logger* logger_ptr,
                                                          size_type n_buckets,
                                                          const Hash& hasher_obj,
                                                          const Pred& pred) :
  Ordered_map(logger_ptr, n_buckets, hasher_obj, pred)
{
  update(values);
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
Ordered_map<Key_t, Mapped_t, Hash_t, Pred_t>::Ordered_map(const Ordered_map& src) :
  log::Log_context(src),
  // Handles are arena indices, so a verbatim copy of both halves keeps them consistent.
  m_index(src.m_index),
  m_arena(src.m_arena)
{
  // That's all.
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
Ordered_map<Key_t, Mapped_t, Hash_t, Pred_t>::Ordered_map(Ordered_map&& src) :
  Ordered_map(nullptr, size_type(-1), src.m_index.hash_function(), src.m_index.key_eq())
{
  swap(src);
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
Ordered_map<Key_t, Mapped_t, Hash_t, Pred_t>&
  Ordered_map<Key_t, Mapped_t, Hash_t, Pred_t>::operator=(const Ordered_map& src)
{
  /* Copy-and-swap: the arena's nodes hold pair<const Key, Mapped>, which cannot be assigned over, so there is no
   * element-wise assignment to do anyway. */
  if (&src != this)
  {
    Ordered_map src_copy(src);
    swap(src_copy);
  }
  return *this;
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
Ordered_map<Key_t, Mapped_t, Hash_t, Pred_t>&
  Ordered_map<Key_t, Mapped_t, Hash_t, Pred_t>::operator=(Ordered_map&& src)
{
  if (&src != this)
  {
    clear();
    swap(src);
  }
  return *this;
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
void Ordered_map<Key_t, Mapped_t, Hash_t, Pred_t>::swap(Ordered_map& other)
{
  using std::swap;

  log::Log_context::swap(other);
  swap(m_index, other.m_index); // unordered_map<> exchange; constant-time.
  m_arena.swap(other.m_arena); // vector<> exchanges; constant-time.  Handles in each m_index still match.
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
void Ordered_map<Key_t, Mapped_t, Hash_t, Pred_t>::set(const Key& key, const Mapped& mapped)
{
  assign(key, mapped);
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
void Ordered_map<Key_t, Mapped_t, Hash_t, Pred_t>::set(Key&& key, Mapped&& mapped)
{
  assign(std::move(key), std::move(mapped));
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
template<typename Key_arg, typename Mapped_arg>
Mapped_t& Ordered_map<Key_t, Mapped_t, Hash_t, Pred_t>::assign(Key_arg&& key, Mapped_arg&& mapped)
{
  const auto index_it = m_index.find(key);
  if (index_it != m_index.end())
  {
    // Present: overwrite in place; position unchanged.
    auto& stored = m_arena.value(index_it->second).second;
    stored = std::forward<Mapped_arg>(mapped);
    return stored;
  }
  // else

  return m_arena.value(link_new(std::forward<Key_arg>(key), std::forward<Mapped_arg>(mapped))).second;
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
template<typename Key_arg, typename Mapped_arg>
typename Ordered_map<Key_t, Mapped_t, Hash_t, Pred_t>::Handle
  Ordered_map<Key_t, Mapped_t, Hash_t, Pred_t>::link_new(Key_arg&& key, Mapped_arg&& mapped)
{
  const auto handle = m_arena.link_back(std::forward<Key_arg>(key), std::forward<Mapped_arg>(mapped));

  // `key` may be moved-from now; take the index's copy from the node.
  try
  {
    m_index.emplace(m_arena.value(handle).first, handle);
  }
  catch (...)
  {
    // Keep the index and the sequence in agreement; then let the caller see the failure.
    m_arena.unlink(handle);
    throw;
  }

  return handle;
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
void Ordered_map<Key_t, Mapped_t, Hash_t, Pred_t>::unlink(typename Index::iterator index_it)
{
  const auto handle = index_it->second;
  m_index.erase(index_it);
  m_arena.unlink(handle);
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
std::pair<typename Ordered_map<Key_t, Mapped_t, Hash_t, Pred_t>::Iterator, bool>
  Ordered_map<Key_t, Mapped_t, Hash_t, Pred_t>::insert(const Value& key_and_mapped)
{
  using std::pair;

  const auto index_it = m_index.find(key_and_mapped.first);
  return (index_it == m_index.end())
           ? pair<Iterator, bool>{Iterator(&m_arena, link_new(key_and_mapped.first, key_and_mapped.second)),
                                  true}
           : pair<Iterator, bool>{Iterator(&m_arena, index_it->second), false};
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
std::pair<typename Ordered_map<Key_t, Mapped_t, Hash_t, Pred_t>::Iterator, bool>
  Ordered_map<Key_t, Mapped_t, Hash_t, Pred_t>::insert(Value_movable&& key_and_mapped)
{
  using std::pair;

  const auto index_it = m_index.find(key_and_mapped.first);
  return (index_it == m_index.end())
           ? pair<Iterator, bool>{Iterator(&m_arena, link_new(std::move(key_and_mapped.first),
                                                              std::move(key_and_mapped.second))),
                                  true}
           : pair<Iterator, bool>{Iterator(&m_arena, index_it->second), false};
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
Mapped_t& Ordered_map<Key_t, Mapped_t, Hash_t, Pred_t>::operator[](const Key& key)
{
  const auto index_it = m_index.find(key);
  return m_arena.value((index_it == m_index.end()) ? link_new(key, Mapped{}) : index_it->second).second;
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
Mapped_t& Ordered_map<Key_t, Mapped_t, Hash_t, Pred_t>::operator[](Key&& key)
{
  const auto index_it = m_index.find(key);
  return m_arena.value((index_it == m_index.end()) ? link_new(std::move(key), Mapped{}) : index_it->second).second;
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
Mapped_t& Ordered_map<Key_t, Mapped_t, Hash_t, Pred_t>::get(const Key& key)
{
  const auto index_it = m_index.find(key);
  if (index_it == m_index.end())
  {
    throw_error(error::Code::S_KEY_NOT_FOUND, ODICT_UTIL_WHERE_AM_I_STR());
  }
  // else
  return m_arena.value(index_it->second).second;
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
const Mapped_t& Ordered_map<Key_t, Mapped_t, Hash_t, Pred_t>::get(const Key& key) const
{
  const auto index_it = m_index.find(key);
  if (index_it == m_index.end())
  {
    throw_error(error::Code::S_KEY_NOT_FOUND, ODICT_UTIL_WHERE_AM_I_STR());
  }
  // else
  return m_arena.value(index_it->second).second;
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
void Ordered_map<Key_t, Mapped_t, Hash_t, Pred_t>::throw_error(error::Code code, util::String_view context) const
{
  Error_code our_err_code;
  Error_code* const err_code = &our_err_code; // ODICT_ERROR_EMIT_ERROR_LOG_INFO() sets *err_code.
  ODICT_ERROR_EMIT_ERROR_LOG_INFO(code);
  throw ::odict::error::Runtime_error(our_err_code, context);
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
typename Ordered_map<Key_t, Mapped_t, Hash_t, Pred_t>::Iterator
  Ordered_map<Key_t, Mapped_t, Hash_t, Pred_t>::find(const Key& key)
{
  const auto index_it = m_index.find(key);
  return Iterator(&m_arena, (index_it == m_index.end()) ? Arena::S_SENTINEL : index_it->second);
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
typename Ordered_map<Key_t, Mapped_t, Hash_t, Pred_t>::Const_iterator
  Ordered_map<Key_t, Mapped_t, Hash_t, Pred_t>::find(const Key& key) const
{
  const auto index_it = m_index.find(key);
  return Const_iterator(&m_arena, (index_it == m_index.end()) ? Arena::S_SENTINEL : index_it->second);
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
typename Ordered_map<Key_t, Mapped_t, Hash_t, Pred_t>::size_type
  Ordered_map<Key_t, Mapped_t, Hash_t, Pred_t>::count(const Key& key) const
{
  return m_index.count(key);
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
bool Ordered_map<Key_t, Mapped_t, Hash_t, Pred_t>::contains(const Key& key) const
{
  return m_index.find(key) != m_index.end();
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
void Ordered_map<Key_t, Mapped_t, Hash_t, Pred_t>::remove(const Key& key, Error_code* err_code)
{
  if (::odict::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { remove(key, actual_err_code); },
         err_code, ODICT_UTIL_WHERE_AM_I_STR()))
  {
    return;
  }
  // else

  const auto index_it = m_index.find(key);
  if (index_it == m_index.end())
  {
    ODICT_ERROR_EMIT_ERROR_LOG_INFO(error::Code::S_KEY_NOT_FOUND);
    return;
  }
  // else

  err_code->clear();
  unlink(index_it);
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
typename Ordered_map<Key_t, Mapped_t, Hash_t, Pred_t>::Iterator
  Ordered_map<Key_t, Mapped_t, Hash_t, Pred_t>::erase(const Const_iterator& it)
{
  assert(it.m_handle != Arena::S_SENTINEL);

  const auto next_handle = m_arena.next(it.m_handle);
  m_index.erase(it->first);
  m_arena.unlink(it.m_handle); // Invalidates `it` (and *it): it->first is no longer touched past this point.
  return Iterator(&m_arena, next_handle);
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
typename Ordered_map<Key_t, Mapped_t, Hash_t, Pred_t>::size_type
  Ordered_map<Key_t, Mapped_t, Hash_t, Pred_t>::erase(const Key& key)
{
  const auto index_it = m_index.find(key);
  if (index_it == m_index.end())
  {
    return 0;
  }
  // else

  unlink(index_it);
  return 1;
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
typename Ordered_map<Key_t, Mapped_t, Hash_t, Pred_t>::Value_movable
  Ordered_map<Key_t, Mapped_t, Hash_t, Pred_t>::pop(bool last, Error_code* err_code)
{
  ODICT_ERROR_EXEC_AND_THROW_ON_ERROR(Value_movable, pop, last, _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  if (m_arena.empty())
  {
    ODICT_ERROR_EMIT_ERROR_LOG_INFO(error::Code::S_EMPTY_CONTAINER);
    return Value_movable{};
  }
  // else

  err_code->clear();

  const auto handle = last ? m_arena.back() : m_arena.front();
  auto& stored = m_arena.value(handle);
  // The stored key is const, hence copied; the value is moved out.
  Value_movable result{stored.first, std::move(stored.second)};

  unlink(m_index.find(result.first));
  return result;
} // Ordered_map::pop()

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
Mapped_t Ordered_map<Key_t, Mapped_t, Hash_t, Pred_t>::pop_key(const Key& key, Error_code* err_code)
{
  ODICT_ERROR_EXEC_AND_THROW_ON_ERROR(Mapped, pop_key, key, _1);

  const auto index_it = m_index.find(key);
  if (index_it == m_index.end())
  {
    ODICT_ERROR_EMIT_ERROR_LOG_INFO(error::Code::S_KEY_NOT_FOUND);
    return Mapped{};
  }
  // else

  err_code->clear();

  Mapped result(std::move(m_arena.value(index_it->second).second));
  unlink(index_it);
  return result;
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
Mapped_t Ordered_map<Key_t, Mapped_t, Hash_t, Pred_t>::pop_key_or(const Key& key, Mapped default_val)
{
  const auto index_it = m_index.find(key);
  if (index_it == m_index.end())
  {
    return default_val;
  }
  // else

  Mapped result(std::move(m_arena.value(index_it->second).second));
  unlink(index_it);
  return result;
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
Mapped_t& Ordered_map<Key_t, Mapped_t, Hash_t, Pred_t>::set_default(const Key& key, const Mapped& default_val)
{
  const auto index_it = m_index.find(key);
  return m_arena.value((index_it == m_index.end()) ? link_new(key, default_val) : index_it->second).second;
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
void Ordered_map<Key_t, Mapped_t, Hash_t, Pred_t>::clear()
{
  ODICT_LOG_TRACE("Ordered_map [" << this << "]: Clearing [" << size() << "] elements.");

  m_index.clear();
  m_arena.clear();
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
Ordered_map<Key_t, Mapped_t, Hash_t, Pred_t> Ordered_map<Key_t, Mapped_t, Hash_t, Pred_t>::copy() const
{
  ODICT_LOG_TRACE("Ordered_map [" << this << "]: Copying [" << size() << "] elements.");
  return *this;
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
std::vector<Key_t> Ordered_map<Key_t, Mapped_t, Hash_t, Pred_t>::keys() const
{
  std::vector<Key> result;
  result.reserve(size());
  for (const auto& key_and_mapped : *this)
  {
    result.push_back(key_and_mapped.first);
  }
  return result;
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
std::vector<Mapped_t> Ordered_map<Key_t, Mapped_t, Hash_t, Pred_t>::values() const
{
  std::vector<Mapped> result;
  result.reserve(size());
  for (const auto& key_and_mapped : *this)
  {
    result.push_back(key_and_mapped.second);
  }
  return result;
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
std::vector<typename Ordered_map<Key_t, Mapped_t, Hash_t, Pred_t>::Value_movable>
  Ordered_map<Key_t, Mapped_t, Hash_t, Pred_t>::items() const
{
  return std::vector<Value_movable>(begin(), end());
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
template<typename Pair_range>
void Ordered_map<Key_t, Mapped_t, Hash_t, Pred_t>::update(const Pair_range& pairs)
{
  for (const auto& key_and_mapped : pairs)
  {
    assign(key_and_mapped.first, key_and_mapped.second);
  }
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
void Ordered_map<Key_t, Mapped_t, Hash_t, Pred_t>::update(std::initializer_list<Value> pairs)
{
  for (const auto& key_and_mapped : pairs)
  {
    assign(key_and_mapped.first, key_and_mapped.second);
  }
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
template<typename Map>
bool Ordered_map<Key_t, Mapped_t, Hash_t, Pred_t>::equals_unordered(const Map& other) const
{
  if (size() != other.size())
  {
    return false;
  }
  // else

  for (const auto& key_and_mapped : *this)
  {
    const auto other_it = other.find(key_and_mapped.first);
    if ((other_it == other.end()) || (!(other_it->second == key_and_mapped.second)))
    {
      return false;
    }
  }
  return true;
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
typename Ordered_map<Key_t, Mapped_t, Hash_t, Pred_t>::Iterator
  Ordered_map<Key_t, Mapped_t, Hash_t, Pred_t>::begin()
{
  return Iterator(&m_arena, m_arena.front());
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
typename Ordered_map<Key_t, Mapped_t, Hash_t, Pred_t>::Iterator
  Ordered_map<Key_t, Mapped_t, Hash_t, Pred_t>::end()
{
  return Iterator(&m_arena, Arena::S_SENTINEL);
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
typename Ordered_map<Key_t, Mapped_t, Hash_t, Pred_t>::Const_iterator
  Ordered_map<Key_t, Mapped_t, Hash_t, Pred_t>::begin() const
{
  return Const_iterator(&m_arena, m_arena.front());
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
typename Ordered_map<Key_t, Mapped_t, Hash_t, Pred_t>::Const_iterator
  Ordered_map<Key_t, Mapped_t, Hash_t, Pred_t>::end() const
{
  return Const_iterator(&m_arena, Arena::S_SENTINEL);
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
typename Ordered_map<Key_t, Mapped_t, Hash_t, Pred_t>::Const_iterator
  Ordered_map<Key_t, Mapped_t, Hash_t, Pred_t>::cbegin() const
{
  return begin();
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
typename Ordered_map<Key_t, Mapped_t, Hash_t, Pred_t>::Const_iterator
  Ordered_map<Key_t, Mapped_t, Hash_t, Pred_t>::cend() const
{
  return end();
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
typename Ordered_map<Key_t, Mapped_t, Hash_t, Pred_t>::Reverse_iterator
  Ordered_map<Key_t, Mapped_t, Hash_t, Pred_t>::rbegin()
{
  return Reverse_iterator(end());
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
typename Ordered_map<Key_t, Mapped_t, Hash_t, Pred_t>::Reverse_iterator
  Ordered_map<Key_t, Mapped_t, Hash_t, Pred_t>::rend()
{
  return Reverse_iterator(begin());
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
typename Ordered_map<Key_t, Mapped_t, Hash_t, Pred_t>::Const_reverse_iterator
  Ordered_map<Key_t, Mapped_t, Hash_t, Pred_t>::crbegin() const
{
  return Const_reverse_iterator(end());
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
typename Ordered_map<Key_t, Mapped_t, Hash_t, Pred_t>::Const_reverse_iterator
  Ordered_map<Key_t, Mapped_t, Hash_t, Pred_t>::crend() const
{
  return Const_reverse_iterator(begin());
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
bool Ordered_map<Key_t, Mapped_t, Hash_t, Pred_t>::empty() const
{
  return m_index.empty();
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
typename Ordered_map<Key_t, Mapped_t, Hash_t, Pred_t>::size_type
  Ordered_map<Key_t, Mapped_t, Hash_t, Pred_t>::size() const
{
  return m_index.size();
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
typename Ordered_map<Key_t, Mapped_t, Hash_t, Pred_t>::size_type
  Ordered_map<Key_t, Mapped_t, Hash_t, Pred_t>::max_size() const
{
  return m_index.max_size();
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
template<typename Key_range>
Ordered_map<Key_t, Mapped_t, Hash_t, Pred_t>
  Ordered_map<Key_t, Mapped_t, Hash_t, Pred_t>::from_keys(const Key_range& keys, const Mapped& default_val,
                                                          log::Logger* logger_ptr) // Static.
{
  Ordered_map result(logger_ptr);
  for (const auto& key : keys)
  {
    result.assign(key, default_val);
  }
  return result;
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
Ordered_map<Key_t, Mapped_t, Hash_t, Pred_t>
  Ordered_map<Key_t, Mapped_t, Hash_t, Pred_t>::from_keys(std::initializer_list<Key> keys, const Mapped& default_val,
                                                          log::Logger* logger_ptr) // Static.
{
  return from_keys<std::initializer_list<Key>>(keys, default_val, logger_ptr);
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
template<typename Pair_range>
Ordered_map<Key_t, Mapped_t, Hash_t, Pred_t>
  Ordered_map<Key_t, Mapped_t, Hash_t, Pred_t>::from_pairs(const Pair_range& pairs,
                                                           log::Logger* logger_ptr) // Static.
{
  Ordered_map result(logger_ptr);
  result.update(pairs);
  return result;
}

template<typename Key, typename Mapped, typename Hash, typename Pred>
void swap(Ordered_map<Key, Mapped, Hash, Pred>& val1, Ordered_map<Key, Mapped, Hash, Pred>& val2)
{
  val1.swap(val2);
}

template<typename Key, typename Mapped, typename Hash, typename Pred>
bool operator==(const Ordered_map<Key, Mapped, Hash, Pred>& val1, const Ordered_map<Key, Mapped, Hash, Pred>& val2)
{
  if (val1.size() != val2.size())
  {
    return false;
  }
  // else

  auto it2 = val2.begin();
  for (const auto& key_and_mapped1 : val1)
  {
    if ((!(key_and_mapped1.first == it2->first)) || (!(key_and_mapped1.second == it2->second)))
    {
      return false;
    }
    ++it2;
  }
  return true;
}

template<typename Key, typename Mapped, typename Hash, typename Pred>
bool operator!=(const Ordered_map<Key, Mapped, Hash, Pred>& val1, const Ordered_map<Key, Mapped, Hash, Pred>& val2)
{
  return !(val1 == val2);
}

template<typename Key, typename Mapped, typename Hash, typename Pred,
         typename Hash2, typename Pred2, typename Allocator>
bool operator==(const Ordered_map<Key, Mapped, Hash, Pred>& val1,
                const boost::unordered_map<Key, Mapped, Hash2, Pred2, Allocator>& val2)
{
  return val1.equals_unordered(val2);
}

template<typename Key, typename Mapped, typename Hash, typename Pred,
         typename Hash2, typename Pred2, typename Allocator>
bool operator==(const boost::unordered_map<Key, Mapped, Hash2, Pred2, Allocator>& val1,
                const Ordered_map<Key, Mapped, Hash, Pred>& val2)
{
  return val2.equals_unordered(val1);
}

template<typename Key, typename Mapped, typename Hash, typename Pred,
         typename Hash2, typename Pred2, typename Allocator>
bool operator==(const Ordered_map<Key, Mapped, Hash, Pred>& val1,
                const std::unordered_map<Key, Mapped, Hash2, Pred2, Allocator>& val2)
{
  return val1.equals_unordered(val2);
}

template<typename Key, typename Mapped, typename Hash, typename Pred,
         typename Hash2, typename Pred2, typename Allocator>
bool operator==(const std::unordered_map<Key, Mapped, Hash2, Pred2, Allocator>& val1,
                const Ordered_map<Key, Mapped, Hash, Pred>& val2)
{
  return val2.equals_unordered(val1);
}

template<typename Key, typename Mapped, typename Hash, typename Pred, typename Compare, typename Allocator>
bool operator==(const Ordered_map<Key, Mapped, Hash, Pred>& val1,
                const std::map<Key, Mapped, Compare, Allocator>& val2)
{
  return val1.equals_unordered(val2);
}

template<typename Key, typename Mapped, typename Hash, typename Pred, typename Compare, typename Allocator>
bool operator==(const std::map<Key, Mapped, Compare, Allocator>& val1,
                const Ordered_map<Key, Mapped, Hash, Pred>& val2)
{
  return val2.equals_unordered(val1);
}

template<typename Key, typename Mapped, typename Hash, typename Pred,
         typename Hash2, typename Pred2, typename Allocator>
bool operator!=(const Ordered_map<Key, Mapped, Hash, Pred>& val1,
                const boost::unordered_map<Key, Mapped, Hash2, Pred2, Allocator>& val2)
{
  return !(val1 == val2);
}

template<typename Key, typename Mapped, typename Hash, typename Pred,
         typename Hash2, typename Pred2, typename Allocator>
bool operator!=(const boost::unordered_map<Key, Mapped, Hash2, Pred2, Allocator>& val1,
                const Ordered_map<Key, Mapped, Hash, Pred>& val2)
{
  return !(val1 == val2);
}

template<typename Key, typename Mapped, typename Hash, typename Pred,
         typename Hash2, typename Pred2, typename Allocator>
bool operator!=(const Ordered_map<Key, Mapped, Hash, Pred>& val1,
                const std::unordered_map<Key, Mapped, Hash2, Pred2, Allocator>& val2)
{
  return !(val1 == val2);
}

template<typename Key, typename Mapped, typename Hash, typename Pred,
         typename Hash2, typename Pred2, typename Allocator>
bool operator!=(const std::unordered_map<Key, Mapped, Hash2, Pred2, Allocator>& val1,
                const Ordered_map<Key, Mapped, Hash, Pred>& val2)
{
  return !(val1 == val2);
}

template<typename Key, typename Mapped, typename Hash, typename Pred, typename Compare, typename Allocator>
bool operator!=(const Ordered_map<Key, Mapped, Hash, Pred>& val1,
                const std::map<Key, Mapped, Compare, Allocator>& val2)
{
  return !(val1 == val2);
}

template<typename Key, typename Mapped, typename Hash, typename Pred, typename Compare, typename Allocator>
bool operator!=(const std::map<Key, Mapped, Compare, Allocator>& val1,
                const Ordered_map<Key, Mapped, Hash, Pred>& val2)
{
  return !(val1 == val2);
}

template<typename Key, typename Mapped, typename Hash, typename Pred>
std::ostream& operator<<(std::ostream& os, const Ordered_map<Key, Mapped, Hash, Pred>& val)
{
  if (val.empty())
  {
    return os << "Ordered_map()";
  }
  // else

  os << "Ordered_map([";
  bool first = true;
  for (const auto& key_and_mapped : val)
  {
    if (!first)
    {
      os << ", ";
    }
    first = false;
    os << '(' << key_and_mapped.first << ", " << key_and_mapped.second << ')';
  }
  return os << "])";
}

} // namespace odict::dict
