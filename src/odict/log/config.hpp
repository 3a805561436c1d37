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

#include "odict/log/log.hpp"
#include <boost/unordered_map.hpp>
#include <atomic>
#include <cassert>
#include <cstdint>
#include <typeindex>
#include <vector>

namespace odict::log
{

// Types.

/**
 * Verbosity settings and component names, for use by a Logger: Simple_ostream_logger takes a `Config*`, asks
 * output_whether_should_log() in its should_log(), and prints components through output_component_to_ostream().
 *
 * A message passes if its Sev is at most the *verbosity* that applies to it, which is the first of these that is
 * set: the calling thread's override (see this_thread_verbosity_override()); the verbosity of its Component;
 * the default verbosity.
 *
 * Before a Component can have a verbosity or a name, its `enum` type must be registered via
 * register_components().  Each registered value gets a slot in one flat table (its *union index*), so several
 * `enum` types can share a Config.  test::Test_logger shows the usual setup, for odict::Odict_log_component.
 *
 * ### Thread safety ###
 * The `output_*()` methods may run concurrently with each other and with the `configure_*()` methods.
 * register_components() must be done before any concurrent use.
 */
class Config
{
public:
  // Types.

  /// Index of a component's slot in the table shared by all registered `enum` types.
  using component_union_idx_t = Component::enum_raw_t;

  // Constants.

  /// Default verbosity, if none is given: Sev::S_INFO.
  static const Sev S_MOST_VERBOSE_SEV_DEFAULT;

  // Constructors/destructor.

  /**
   * Constructs a Config with no components registered.
   *
   * @param most_verbose_sev_default
   *        The default verbosity.
   */
  explicit Config(Sev most_verbose_sev_default = S_MOST_VERBOSE_SEV_DEFAULT);

  /**
   * Copies `src`, which must not be modified concurrently.
   *
   * @param src
   *        Source.
   */
  Config(const Config& src);

  /// Not movable.
  Config(Config&&) = delete;

  // Methods.

  /// Not assignable.
  void operator=(const Config&) = delete;

  /// Not assignable.
  void operator=(Config&&) = delete;

  /**
   * Whether a message of the given severity and component passes; see the class doc header for the rules.
   * This is what a Logger's should_log() typically returns.
   *
   * @param sev
   *        Message severity.
   * @param component
   *        Message component; may be empty.
   * @return See above.
   */
  bool output_whether_should_log(Sev sev, const Component& component) const;

  /**
   * Prints the name of `component`; or, if it is registered but has no name, its union index.  Prints nothing
   * for an empty or unregistered one.
   *
   * @param os
   *        Stream; not null.
   * @param component
   *        Component.
   * @return Whether anything was printed.
   */
  bool output_component_to_ostream(std::ostream* os, const Component& component) const;

  /**
   * Registers an `enum` type of components, naming its values.  Each name is upper-cased and prefixed with
   * `name_prefix` (also upper-cased): with prefix `"odict-"`, odict::Odict_log_component::S_DICT named `"DICT"`
   * becomes `"ODICT-DICT"`.  That is how it is printed, and (case-insensitively) how configure_*_by_name()
   * and configure_from_spec() find it.  Registering one type twice is not allowed.
   *
   * @tparam Component_payload
   *         `enum class`, underlying type Component::enum_raw_t, whose last member is `S_END_SENTINEL`.
   * @param component_names
   *        Names; values absent from it are registered but unnamed.  Names must be unique and non-empty.
   * @param name_prefix
   *        Prefix of every name.
   */
  template<typename Component_payload>
  void register_components(const boost::unordered_map<Component_payload, std::string>& component_names,
                           util::String_view name_prefix = util::String_view());

  /**
   * Sets the default verbosity.
   *
   * @param most_verbose_sev_default
   *        The new default.
   * @param reset
   *        If `true`, also unsets the verbosity of every component, so the default applies to all.
   */
  void configure_default_verbosity(Sev most_verbose_sev_default, bool reset);

  /**
   * Sets the verbosity of one component.
   *
   * @tparam Component_payload
   *         A registered `enum` type.
   * @param most_verbose_sev
   *        The verbosity.
   * @param component_payload
   *        The component.
   * @return `false` if `Component_payload` is not registered; else `true`.
   */
  template<typename Component_payload>
  bool configure_component_verbosity(Sev most_verbose_sev, Component_payload component_payload);

  /**
   * Sets the verbosity of one component, given by name (see register_components()), in any case.
   *
   * @param most_verbose_sev
   *        The verbosity.
   * @param component_name
   *        Full name, prefix included.
   * @return `false` if no such name is registered; else `true`.
   */
  bool configure_component_verbosity_by_name(Sev most_verbose_sev, util::String_view component_name);

  /**
   * Applies a whole verbosity configuration given as a compact string, such as one taken from an environment
   * variable: `"SEV[,NAME=SEV]..."`.  The first (mandatory) item is the default verbosity, as if given to
   * configure_default_verbosity() with `reset == false`; each subsequent item is as if given to
   * configure_component_verbosity_by_name().  Each `SEV` is in any form accepted by `operator>>(istream&, Sev&)`;
   * white space around items is ignored.  Example: `"warning,ODICT-DICT=trace"`.
   *
   * Either the entire string is applied, or (on failure) nothing is.
   *
   * @param spec
   *        See above.
   * @return `true` on success; `false` if `spec` is malformed, or names an unknown component.
   */
  bool configure_from_spec(util::String_view spec);

  /**
   * The calling thread's verbosity override, to read or assign.  Sev::S_END_SENTINEL, the initial value, means
   * none; any other value decides every message from this thread, whatever the rest of the configuration says.
   *
   * @return Pointer to thread-local storage; not null.
   */
  static Sev* this_thread_verbosity_override();

  // Data.

  /**
   * How Ostream_log_msg_writer stamps messages: if `true`, local date and time with microseconds and UTC offset;
   * if `false`, seconds since the Epoch with microseconds.  Read when the writer is constructed.
   */
  bool m_use_human_friendly_time_stamps;

private:
  // Types.

  /// A Sev as stored in the tables; `raw_sev_t(-1)` means unset.
  using raw_sev_t = uint8_t;

  /// `atomic<raw_sev_t>` that can live in a `vector`: constructible with a value, and copyable.
  class Atomic_raw_sev : public std::atomic<raw_sev_t>
  {
  public:
    /**
     * Constructs the atomic.
     *
     * @param init_val
     *        Initial value; unset by default.
     */
    Atomic_raw_sev(raw_sev_t init_val = raw_sev_t(-1));

    /**
     * Constructs the atomic with the current value of `src`.
     *
     * @param src
     *        Source.
     */
    Atomic_raw_sev(const Atomic_raw_sev& src);
  }; // class Atomic_raw_sev

  // Methods.

  /**
   * Upper-cased copy of `name`.
   *
   * @param name
   *        Name.
   * @return See above.
   */
  static std::string normalized_component_name(util::String_view name);

  /**
   * Union index of a non-empty Component; `-1` if its `enum` type is not registered.
   *
   * @param component
   *        Component.
   * @return See above.
   */
  component_union_idx_t component_to_union_idx(const Component& component) const;

  /**
   * Stores the verbosity of one component.
   *
   * @param component_union_idx
   *        Valid union index.
   * @param most_verbose_sev_or_none
   *        Sev as #raw_sev_t; or `-1` to unset.
   */
  void store_severity_by_component(component_union_idx_t component_union_idx, raw_sev_t most_verbose_sev_or_none);

  // Data.

  /// For each registered `enum` type: the union index of its value 0.
  boost::unordered_map<std::type_index, component_union_idx_t> m_union_idx_offsets_by_payload_type;

  /// The default verbosity.
  Atomic_raw_sev m_verbosity_default;

  /// Verbosity of each component, by union index.  Grows only in register_components().
  std::vector<Atomic_raw_sev> m_verbosities_by_component;

  /// Names of the named components, by union index.
  boost::unordered_map<component_union_idx_t, std::string> m_component_names_by_union_idx;

  /// Inverse of #m_component_names_by_union_idx.
  boost::unordered_map<std::string, component_union_idx_t> m_component_union_idxs_by_name;
}; // class Config

// Template implementations.

template<typename Component_payload>
void Config::register_components(const boost::unordered_map<Component_payload, std::string>& component_names,
                                 util::String_view name_prefix)
{
  using std::string;

  const auto offset = component_union_idx_t(m_verbosities_by_component.size());
  const auto inserted = m_union_idx_offsets_by_payload_type.emplace(typeid(Component_payload), offset).second;
  assert(inserted && "Component enum type registered twice.");
  (void)inserted;

  m_verbosities_by_component.resize(m_verbosities_by_component.size()
                                      + size_t(Component_payload::S_END_SENTINEL));

  const string prefix(normalized_component_name(name_prefix));
  for (const auto& payload_and_name : component_names)
  {
    assert(!payload_and_name.second.empty());
    const auto component_union_idx = offset + static_cast<component_union_idx_t>(payload_and_name.first);
    string name(prefix + normalized_component_name(payload_and_name.second));

    assert(!util::key_exists(m_component_union_idxs_by_name, name));
    m_component_union_idxs_by_name.emplace(name, component_union_idx);
    m_component_names_by_union_idx.emplace(component_union_idx, std::move(name));
  }
} // Config::register_components()

template<typename Component_payload>
bool Config::configure_component_verbosity(Sev most_verbose_sev, Component_payload component_payload)
{
  const auto component_union_idx = component_to_union_idx(Component(component_payload));
  if (component_union_idx == component_union_idx_t(-1))
  {
    return false;
  }
  // else

  store_severity_by_component(component_union_idx, raw_sev_t(most_verbose_sev));
  return true;
}

} // namespace odict::log
