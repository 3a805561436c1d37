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

#include "odict/dict/ordered_map.hpp"
#include <boost/make_shared.hpp>
#include <boost/shared_ptr.hpp>
#include <optional>
#include <utility>

namespace odict::dict
{

/**
 * An Ordered_map that can produce values for missing keys: given a *factory* (a no-arg function returning a
 * #Mapped), reading a missing key through get() or `operator[]` inserts the factory's result at the end of the
 * iteration order and returns a reference to it.  Without a factory such a read fails with
 * dict::error::Code::S_KEY_NOT_FOUND, exactly as with Ordered_map::get().  Every other operation, including the
 * `const` get(), behaves as in Ordered_map.
 *
 * The factory's presence is expressed by `std::optional`, not by an empty #Factory: passing a present-but-empty
 * #Factory to a constructor is a programmer error reported with dict::error::Code::S_INVALID_ARGUMENT.
 *
 * Copies (copy construction, copy()) share one factory callable with the source: a factory with state (for example
 * a counter) sees invocations made through any of them.  The entries themselves are independent.
 *
 * Note that get() and `operator[]` here hide, rather than override, the Ordered_map counterparts: use `*this` through
 * a reference to this type to get the auto-vivifying behavior.
 *
 * @tparam Key_t
 *         See Ordered_map.
 * @tparam Mapped_t
 *         See Ordered_map.
 * @tparam Hash_t
 *         See Ordered_map.
 * @tparam Pred_t
 *         See Ordered_map.
 */
template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
class Default_ordered_map :
  public Ordered_map<Key_t, Mapped_t, Hash_t, Pred_t>
{
public:
  // Types.

  /// Short-hand for our base.
  using Base = Ordered_map<Key_t, Mapped_t, Hash_t, Pred_t>;

  /// Convenience alias for template arg.
  using Key = Key_t;

  /// Convenience alias for template arg.
  using Mapped = Mapped_t;

  /// Convenience alias for template arg.
  using Hash = Hash_t;

  /// Convenience alias for template arg.
  using Pred = Pred_t;

  /// See Ordered_map.
  using Value = typename Base::Value;

  /// See Ordered_map.
  using size_type = typename Base::size_type;

  /// The type of the function producing a value for a missing key.
  using Factory = Function<Mapped ()>;

  // Constructors/destructor.

  /**
   * Constructs empty structure.
   *
   * @param factory
   *        The factory; or `std::nullopt` for none.  If present it must not be empty.
   * @param logger_ptr
   *        See Ordered_map.
   * @param n_buckets
   *        See Ordered_map.
   * @param hasher_obj
   *        See Ordered_map.
   * @param pred
   *        See Ordered_map.
   * @throws error::Runtime_error with dict::error::Code::S_INVALID_ARGUMENT, if `factory` is present but empty.
   */
  explicit Default_ordered_map(std::optional<Factory> factory = std::nullopt,
                               log::Logger* logger_ptr = nullptr,
                               size_type n_buckets = size_type(-1),
                               const Hash& hasher_obj = Hash{},
                               const Pred& pred = Pred{});

  /**
   * Constructs structure filled from the given initializer list as in the corresponding Ordered_map constructor.
   *
   * @param factory
   *        See other constructor.
   * @param values
   *        See Ordered_map.
   * @param logger_ptr
   *        See Ordered_map.
   * @param n_buckets
   *        See Ordered_map.
   * @param hasher_obj
   *        See Ordered_map.
   * @param pred
   *        See Ordered_map.
   * @throws error::Runtime_error with dict::error::Code::S_INVALID_ARGUMENT, if `factory` is present but empty.
   */
  explicit Default_ordered_map(std::optional<Factory> factory,
                               std::initializer_list<Value> values,
                               log::Logger* logger_ptr = nullptr,
                               size_type n_buckets = size_type(-1),
                               const Hash& hasher_obj = Hash{},
                               const Pred& pred = Pred{});

  /**
   * Constructs object that is a copy of the given source, as in Ordered_map; the copy shares the source's factory.
   *
   * @param src
   *        Source object.
   */
  Default_ordered_map(const Default_ordered_map& src);

  /**
   * Constructs object by taking over the elements of the given source, as in Ordered_map.  The source becomes empty
   * but keeps its factory, which it now shares with `*this`.
   *
   * @param src
   *        Source object which is emptied.
   */
  Default_ordered_map(Default_ordered_map&& src);

  // Methods.

  /**
   * Makes `*this` a copy of `src`, factory included.
   *
   * @param src
   *        Source object.
   * @return `*this`.
   */
  Default_ordered_map& operator=(const Default_ordered_map& src);

  /**
   * Takes over the elements of `src`, which becomes empty; both end up sharing the factory of `src`.
   *
   * @param src
   *        Source object which is emptied.
   * @return `*this`.
   */
  Default_ordered_map& operator=(Default_ordered_map&& src);

  // Our base is dependent on template args: bring in the log::Log_context accessors the logging macros call.
  using Base::get_logger;
  using Base::get_log_component;

  /**
   * Returns reference to the #Mapped value at the given key; if absent and there is a factory, first appends
   * `(key, factory())`.
   *
   * @param key
   *        The key to find.
   * @return Reference to the stored #Mapped.
   * @throws error::Runtime_error with dict::error::Code::S_KEY_NOT_FOUND, if `key` is absent and there is no
   *         factory.  Also whatever the factory throws.
   */
  Mapped& get(const Key& key);

  /**
   * Same as Ordered_map::get() `const`: no factory invocation, since `*this` cannot change.
   *
   * @param key
   *        The key to find.
   * @return Reference to the stored #Mapped.
   * @throws error::Runtime_error with dict::error::Code::S_KEY_NOT_FOUND, if `key` is absent.
   */
  const Mapped& get(const Key& key) const;

  /**
   * Synonym of get().
   *
   * @param key
   *        The key to find.
   * @return See get().
   */
  Mapped& operator[](const Key& key);

  /**
   * Identical to the other overload, except that if `key` is inserted it is moved, not copied, into `*this`.
   *
   * @param key
   *        The key to find.
   * @return See get().
   */
  Mapped& operator[](Key&& key);

  /**
   * Returns a copy of `*this`: independent entries, shared factory, same Logger.
   * @return See above.
   */
  Default_ordered_map copy() const;

  /**
   * Returns the factory, if any.
   * @return See above.
   */
  const std::optional<Factory>& default_factory() const;

private:
  // Methods.

  /**
   * Core of get() and `operator[]`.
   *
   * @tparam Key_arg
   *         `const Key&` or `Key`.
   * @param key
   *        The key.
   * @return See get().
   */
  template<typename Key_arg>
  Mapped& get_or_make(Key_arg&& key);

  /**
   * Validates the given factory and wraps it so that copies of the result share one callable.
   *
   * @param factory
   *        See constructor.
   * @return The wrapped factory, or `std::nullopt`.
   */
  std::optional<Factory> share_factory(std::optional<Factory>&& factory) const;

  // Data.

  /// The factory, if any.  Each copy of the stored #Factory invokes the same callable.
  std::optional<Factory> m_factory;
}; // class Default_ordered_map

// Free functions: in *_fwd.hpp.

// Template implementations.

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
Default_ordered_map<Key_t, Mapped_t, Hash_t, Pred_t>::Default_ordered_map(std::optional<Factory> factory,
                                                                          log::Logger* logger_ptr,
                                                                          size_type n_buckets,
                                                                          const Hash& hasher_obj,
                                                                          const Pred& pred) :
  Base(logger_ptr, n_buckets, hasher_obj, pred),
  m_factory(share_factory(std::move(factory)))
{
  // That's all.
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
Default_ordered_map<Key_t, Mapped_t, Hash_t, Pred_t>::Default_ordered_map(std::optional<Factory> factory,
                                                                          std::initializer_list<Value> values,
                                                                          log::Logger* logger_ptr,
                                                                          size_type n_buckets,
                                                                          const Hash& hasher_obj,
                                                                          const Pred& pred) :
  Base(values, logger_ptr, n_buckets, hasher_obj, pred),
  m_factory(share_factory(std::move(factory)))
{
  // That's all.
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
Default_ordered_map<Key_t, Mapped_t, Hash_t, Pred_t>::Default_ordered_map(const Default_ordered_map& src) = default;

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
Default_ordered_map<Key_t, Mapped_t, Hash_t, Pred_t>::Default_ordered_map(Default_ordered_map&& src) :
  Base(std::move(static_cast<Base&>(src))),
  // Copy, not move: a moved-from Function is empty, yet the source's optional would still say it has a factory.
  m_factory(src.m_factory)
{
  // That's all.
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
Default_ordered_map<Key_t, Mapped_t, Hash_t, Pred_t>&
  Default_ordered_map<Key_t, Mapped_t, Hash_t, Pred_t>::operator=(const Default_ordered_map& src) = default;

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
Default_ordered_map<Key_t, Mapped_t, Hash_t, Pred_t>&
  Default_ordered_map<Key_t, Mapped_t, Hash_t, Pred_t>::operator=(Default_ordered_map&& src)
{
  Base::operator=(std::move(static_cast<Base&>(src)));
  m_factory = src.m_factory; // See move constructor.
  return *this;
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
std::optional<typename Default_ordered_map<Key_t, Mapped_t, Hash_t, Pred_t>::Factory>
  Default_ordered_map<Key_t, Mapped_t, Hash_t, Pred_t>::share_factory(std::optional<Factory>&& factory) const
{
  if (!factory)
  {
    return std::nullopt;
  }
  // else

  if (factory->empty())
  {
    this->throw_error(error::Code::S_INVALID_ARGUMENT, ODICT_UTIL_WHERE_AM_I_STR());
  }
  // else

  auto callable = boost::make_shared<Factory>(std::move(*factory));
  return Factory([callable]() -> Mapped { return (*callable)(); });
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
template<typename Key_arg>
Mapped_t& Default_ordered_map<Key_t, Mapped_t, Hash_t, Pred_t>::get_or_make(Key_arg&& key)
{
  const auto it = this->find(key);
  if (it != this->end())
  {
    return it->second;
  }
  // else

  if (!m_factory)
  {
    this->throw_error(error::Code::S_KEY_NOT_FOUND, ODICT_UTIL_WHERE_AM_I_STR());
  }
  // else

  // Keys can be anything (and large); do not print them.
  ODICT_LOG_TRACE("Default_ordered_map [" << this << "]: Key absent; invoking factory; will append at "
                  "position [" << this->size() << "].");

  /* Invoke the factory before touching the structure: if it throws, nothing has changed.  Then set() semantics:
   * key absent, so this appends. */
  Mapped made((*m_factory)());
  return this->assign(std::forward<Key_arg>(key), std::move(made));
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
Mapped_t& Default_ordered_map<Key_t, Mapped_t, Hash_t, Pred_t>::get(const Key& key)
{
  return get_or_make(key);
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
const Mapped_t& Default_ordered_map<Key_t, Mapped_t, Hash_t, Pred_t>::get(const Key& key) const
{
  return Base::get(key);
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
Mapped_t& Default_ordered_map<Key_t, Mapped_t, Hash_t, Pred_t>::operator[](const Key& key)
{
  return get_or_make(key);
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
Mapped_t& Default_ordered_map<Key_t, Mapped_t, Hash_t, Pred_t>::operator[](Key&& key)
{
  return get_or_make(std::move(key));
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
Default_ordered_map<Key_t, Mapped_t, Hash_t, Pred_t> Default_ordered_map<Key_t, Mapped_t, Hash_t, Pred_t>::copy() const
{
  ODICT_LOG_TRACE("Default_ordered_map [" << this << "]: Copying [" << this->size() << "] elements.");
  return *this;
}

template<typename Key_t, typename Mapped_t, typename Hash_t, typename Pred_t>
const std::optional<typename Default_ordered_map<Key_t, Mapped_t, Hash_t, Pred_t>::Factory>&
  Default_ordered_map<Key_t, Mapped_t, Hash_t, Pred_t>::default_factory() const
{
  return m_factory;
}

template<typename Key, typename Mapped, typename Hash, typename Pred>
std::ostream& operator<<(std::ostream& os, const Default_ordered_map<Key, Mapped, Hash, Pred>& val)
{
  os << "Default_ordered_map(";
  if (val.default_factory())
  {
    os << "<factory>";
  }
  else
  {
    os << "None";
  }
  return os << ", " << static_cast<const Ordered_map<Key, Mapped, Hash, Pred>&>(val) << ')';
}

} // namespace odict::dict
