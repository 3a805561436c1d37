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
#include <cassert>
#include <cstddef>
#include <iterator>
#include <optional>
#include <type_traits>
#include <utility>
#include <vector>

namespace odict::dict::detail
{

// Types.

/**
 * Doubly linked, circular sequence of values whose nodes live in a contiguous arena (an `std::vector`) and link to
 * each other by integer handle rather than by pointer.  Handle 0 is a permanent sentinel node carrying no value;
 * it is both the "before the first" and the "after the last" position, so the sequence is never empty internally
 * and every link/unlink is the same four-handle update with no head/tail special cases.
 *
 * Freed node slots go onto a free list and are reused by subsequent link_back() calls.  Hence a live node's handle
 * never changes until that node is unlinked; this is what makes Seq_iterator (arena pointer plus handle) survive
 * unrelated insertions and erasures even though the arena itself may reallocate.  A *reference* to a value, on the
 * other hand, is invalidated by any link_back() that grows the arena, as with `std::vector`.
 *
 * This is the storage half of Ordered_map; the lookup-by-key half is an `unordered_map` from key to Handle.
 *
 * @tparam Value_t
 *         Type stored in each node.  Must be copy-constructible for the arena to be copied and
 *         move-constructible for it to grow.  Need not be assignable (`std::pair<const Key, Mapped>` is not).
 */
template<typename Value_t>
class Seq_arena
{
public:
  // Types.

  /// Convenience alias for template arg.
  using Value = Value_t;

  /// Index of a node within the arena.
  using Handle = std::size_t;

  /// Expresses sizes/lengths of relevant things.
  using size_type = std::size_t;

  // Constants.

  /// Handle of the sentinel node.
  static constexpr Handle S_SENTINEL = 0;

  // Constructors/destructor.

  /// Constructs empty sequence: just the sentinel, linked to itself.
  Seq_arena();

  // Methods.

  /**
   * Constructs a new value from the given args in a free (recycled or new) slot and links it just before the
   * sentinel, making it the last element.
   *
   * @tparam Ctor_args
   *         Types of args to `Value` constructor.
   * @param ctor_args
   *        Args to `Value` constructor.  May refer to values stored in `*this`.
   * @return Handle of the new node.
   */
  template<typename... Ctor_args>
  Handle link_back(Ctor_args&&... ctor_args);

  /**
   * Unlinks the given node (splicing its neighbors together), destroys its value and puts its slot on the free list.
   *
   * @param handle
   *        Handle of a live, non-sentinel node.
   */
  void unlink(Handle handle);

  /// Destroys all values and frees all slots, keeping only the sentinel, linked to itself.
  void clear();

  /**
   * Exchanges contents with another arena.  Constant time.
   *
   * @param other
   *        Other object.
   */
  void swap(Seq_arena& other);

  /**
   * Value stored in the given node.
   *
   * @param handle
   *        Handle of a live, non-sentinel node.
   * @return Reference, valid until the next link_back() or until `handle` is unlinked.
   */
  Value& value(Handle handle);

  /**
   * Value stored in the given node.
   *
   * @param handle
   *        Handle of a live, non-sentinel node.
   * @return See other overload.
   */
  const Value& value(Handle handle) const;

  /**
   * Handle of the node after the given one; the sentinel if `handle` is the last.
   *
   * @param handle
   *        Handle of a live node or the sentinel.
   * @return See above.
   */
  Handle next(Handle handle) const;

  /**
   * Handle of the node before the given one; the sentinel if `handle` is the first.
   *
   * @param handle
   *        Handle of a live node or the sentinel.
   * @return See above.
   */
  Handle prev(Handle handle) const;

  /**
   * Handle of the first node; the sentinel if empty().
   * @return See above.
   */
  Handle front() const;

  /**
   * Handle of the last node; the sentinel if empty().
   * @return See above.
   */
  Handle back() const;

  /**
   * Number of live (linked) nodes.
   * @return See above.
   */
  size_type size() const;

  /**
   * `true` if and only if size() is 0.
   * @return See above.
   */
  bool empty() const;

  /**
   * Number of slots allocated in the arena, live or free, not counting the sentinel.  Grows only when
   * link_back() finds no free slot; shrinks only on clear().
   *
   * @return See above.
   */
  size_type n_slots() const;

private:
  // Types.

  /// A slot in the arena.  A free slot and the sentinel hold no value.
  struct Node
  {
    /// The stored value; empty in the sentinel and in free slots.
    std::optional<Value> m_value;
    /// Handle of the previous node in the sequence.  Meaningless in free slots.
    Handle m_prev;
    /// Handle of the next node in the sequence.  Meaningless in free slots.
    Handle m_next;
  };

  // Data.

  /// The arena.  `m_nodes[S_SENTINEL]` always exists.
  std::vector<Node> m_nodes;

  /// Handles of free slots, reused LIFO.
  std::vector<Handle> m_free_handles;
}; // class Seq_arena

/**
 * Bidirectional iterator over a Seq_arena, in sequence order, yielding `Value&` (or `const Value&`).  Stores the
 * arena pointer and the current handle; the past-the-end position is the sentinel.  Decrementing the past-the-end
 * iterator yields the last element, so `std::reverse_iterator` works on it.
 *
 * A Seq_iterator stays valid across link_back() and across unlinking of any node other than its own.
 *
 * @tparam Arena
 *         The Seq_arena type.
 * @tparam IS_CONST
 *         `true` for a const-iterator.
 */
template<typename Arena, bool IS_CONST>
class Seq_iterator
{
public:
  // Types.

  /// For iterator compliance (hence the irregular capitalization).
  using iterator_category = std::bidirectional_iterator_tag;
  /// For iterator compliance (hence the irregular capitalization).
  using value_type = typename Arena::Value;
  /// For iterator compliance (hence the irregular capitalization).
  using difference_type = std::ptrdiff_t;
  /// For iterator compliance (hence the irregular capitalization).
  using pointer = std::conditional_t<IS_CONST, const value_type*, value_type*>;
  /// For iterator compliance (hence the irregular capitalization).
  using reference = std::conditional_t<IS_CONST, const value_type&, value_type&>;

  /// Arena pointer type, respecting constness.
  using Arena_ptr = std::conditional_t<IS_CONST, const Arena*, Arena*>;

  // Constructors/destructor.

  /// Constructs a singular iterator, usable only as an assignment target.
  Seq_iterator();

  /**
   * Constructs iterator at the given position.
   *
   * @param arena
   *        The arena.
   * @param handle
   *        A live node or the sentinel (past-the-end).
   */
  explicit Seq_iterator(Arena_ptr arena, typename Arena::Handle handle);

  /**
   * Converts mutable iterator to const iterator, pointing at the same position.
   *
   * @tparam OTHER_IS_CONST
   *         Must be `false` for `IS_CONST == true`; otherwise this is the copy constructor case.
   * @param src
   *        Source.
   */
  template<bool OTHER_IS_CONST, typename = std::enable_if_t<IS_CONST && (!OTHER_IS_CONST)>>
  Seq_iterator(const Seq_iterator<Arena, OTHER_IS_CONST>& src);

  // Methods.

  /**
   * Dereferences.  Undefined behavior at past-the-end.
   * @return See above.
   */
  reference operator*() const;

  /**
   * Dereferences.  Undefined behavior at past-the-end.
   * @return See above.
   */
  pointer operator->() const;

  /**
   * Advances to the next position.
   * @return `*this`.
   */
  Seq_iterator& operator++();

  /**
   * Advances to the next position.
   * @return Copy of pre-increment `*this`.
   */
  Seq_iterator operator++(int);

  /**
   * Steps back to the previous position.
   * @return `*this`.
   */
  Seq_iterator& operator--();

  /**
   * Steps back to the previous position.
   * @return Copy of pre-decrement `*this`.
   */
  Seq_iterator operator--(int);

  /**
   * `true` if and only if both refer to the same position.  A friend, so that a mutable iterator on either side
   * converts to const when compared with a const one.
   *
   * @param val1
   *        Object.
   * @param val2
   *        Object.
   * @return See above.
   */
  friend bool operator==(const Seq_iterator& val1, const Seq_iterator& val2)
  {
    return (val1.m_arena == val2.m_arena) && (val1.m_handle == val2.m_handle);
  }

  /**
   * Negation of `operator==()`.
   *
   * @param val1
   *        Object.
   * @param val2
   *        Object.
   * @return See above.
   */
  friend bool operator!=(const Seq_iterator& val1, const Seq_iterator& val2)
  {
    return !(val1 == val2);
  }

private:
  // Friends.

  /// The const flavor must read our data when converting.
  template<typename Other_arena, bool OTHER_IS_CONST>
  friend class Seq_iterator;

  /// The container uses the handle to erase by iterator.
  template<typename Key, typename Mapped, typename Hash, typename Pred>
  friend class ::odict::dict::Ordered_map;

  // Data.

  /// The arena; null only in a singular iterator.
  Arena_ptr m_arena;

  /// Current position.
  typename Arena::Handle m_handle;
}; // class Seq_iterator

// Template implementations.

template<typename Value_t>
Seq_arena<Value_t>::Seq_arena() :
  m_nodes(1)
{
  m_nodes[S_SENTINEL].m_prev = S_SENTINEL;
  m_nodes[S_SENTINEL].m_next = S_SENTINEL;
}

template<typename Value_t>
template<typename... Ctor_args>
typename Seq_arena<Value_t>::Handle Seq_arena<Value_t>::link_back(Ctor_args&&... ctor_args)
{
  Handle handle;
  if (m_free_handles.empty())
  {
    /* Build the value before growing the vector: ctor_args may alias a value in m_nodes, which the reallocation
     * inside push_back() would destroy. */
    Node node{ std::optional<Value>(std::in_place, std::forward<Ctor_args>(ctor_args)...), S_SENTINEL, S_SENTINEL };
    handle = m_nodes.size();
    m_nodes.push_back(std::move(node));
  }
  else
  {
    handle = m_free_handles.back();
    m_nodes[handle].m_value.emplace(std::forward<Ctor_args>(ctor_args)...);
    m_free_handles.pop_back(); // Only after emplace() succeeded.
  }

  // Splice in between the current last node and the sentinel.
  auto& node = m_nodes[handle];
  auto& sentinel = m_nodes[S_SENTINEL];
  node.m_prev = sentinel.m_prev;
  node.m_next = S_SENTINEL;
  m_nodes[sentinel.m_prev].m_next = handle;
  sentinel.m_prev = handle;

  return handle;
} // Seq_arena::link_back()

template<typename Value_t>
void Seq_arena<Value_t>::unlink(Handle handle)
{
  assert(handle != S_SENTINEL);
  auto& node = m_nodes[handle];
  assert(node.m_value);

  m_nodes[node.m_prev].m_next = node.m_next;
  m_nodes[node.m_next].m_prev = node.m_prev;
  node.m_value.reset();

  m_free_handles.push_back(handle);
}

template<typename Value_t>
void Seq_arena<Value_t>::clear()
{
  m_nodes.resize(1);
  m_nodes[S_SENTINEL].m_prev = S_SENTINEL;
  m_nodes[S_SENTINEL].m_next = S_SENTINEL;
  m_free_handles.clear();
}

template<typename Value_t>
void Seq_arena<Value_t>::swap(Seq_arena& other)
{
  using std::swap;

  swap(m_nodes, other.m_nodes);
  swap(m_free_handles, other.m_free_handles);
}

template<typename Value_t>
typename Seq_arena<Value_t>::Value& Seq_arena<Value_t>::value(Handle handle)
{
  assert(handle != S_SENTINEL);
  return *(m_nodes[handle].m_value);
}

template<typename Value_t>
const typename Seq_arena<Value_t>::Value& Seq_arena<Value_t>::value(Handle handle) const
{
  assert(handle != S_SENTINEL);
  return *(m_nodes[handle].m_value);
}

template<typename Value_t>
typename Seq_arena<Value_t>::Handle Seq_arena<Value_t>::next(Handle handle) const
{
  return m_nodes[handle].m_next;
}

template<typename Value_t>
typename Seq_arena<Value_t>::Handle Seq_arena<Value_t>::prev(Handle handle) const
{
  return m_nodes[handle].m_prev;
}

template<typename Value_t>
typename Seq_arena<Value_t>::Handle Seq_arena<Value_t>::front() const
{
  return next(S_SENTINEL);
}

template<typename Value_t>
typename Seq_arena<Value_t>::Handle Seq_arena<Value_t>::back() const
{
  return prev(S_SENTINEL);
}

template<typename Value_t>
typename Seq_arena<Value_t>::size_type Seq_arena<Value_t>::size() const
{
  return n_slots() - m_free_handles.size();
}

template<typename Value_t>
bool Seq_arena<Value_t>::empty() const
{
  return front() == S_SENTINEL;
}

template<typename Value_t>
typename Seq_arena<Value_t>::size_type Seq_arena<Value_t>::n_slots() const
{
  return m_nodes.size() - 1;
}

template<typename Arena, bool IS_CONST>
Seq_iterator<Arena, IS_CONST>::Seq_iterator() :
  m_arena(nullptr),
  m_handle(Arena::S_SENTINEL)
{
  // Nothing else.
}

template<typename Arena, bool IS_CONST>
Seq_iterator<Arena, IS_CONST>::Seq_iterator(Arena_ptr arena, typename Arena::Handle handle) :
  m_arena(arena),
  m_handle(handle)
{
  // Nothing else.
}

template<typename Arena, bool IS_CONST>
template<bool OTHER_IS_CONST, typename>
Seq_iterator<Arena, IS_CONST>::Seq_iterator(const Seq_iterator<Arena, OTHER_IS_CONST>& src) :
  m_arena(src.m_arena),
  m_handle(src.m_handle)
{
  // Nothing else.
}

template<typename Arena, bool IS_CONST>
typename Seq_iterator<Arena, IS_CONST>::reference Seq_iterator<Arena, IS_CONST>::operator*() const
{
  return m_arena->value(m_handle);
}

template<typename Arena, bool IS_CONST>
typename Seq_iterator<Arena, IS_CONST>::pointer Seq_iterator<Arena, IS_CONST>::operator->() const
{
  return &(m_arena->value(m_handle));
}

template<typename Arena, bool IS_CONST>
Seq_iterator<Arena, IS_CONST>& Seq_iterator<Arena, IS_CONST>::operator++()
{
  m_handle = m_arena->next(m_handle);
  return *this;
}

template<typename Arena, bool IS_CONST>
Seq_iterator<Arena, IS_CONST> Seq_iterator<Arena, IS_CONST>::operator++(int)
{
  const auto pre = *this;
  operator++();
  return pre;
}

template<typename Arena, bool IS_CONST>
Seq_iterator<Arena, IS_CONST>& Seq_iterator<Arena, IS_CONST>::operator--()
{
  m_handle = m_arena->prev(m_handle);
  return *this;
}

template<typename Arena, bool IS_CONST>
Seq_iterator<Arena, IS_CONST> Seq_iterator<Arena, IS_CONST>::operator--(int)
{
  const auto pre = *this;
  operator--();
  return pre;
}

} // namespace odict::dict::detail
