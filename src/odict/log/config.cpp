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
#include "odict/log/config.hpp"
#include <boost/algorithm/string.hpp>
#include <sstream>
#include <utility>

namespace odict::log
{

// Static initializations.

const Sev Config::S_MOST_VERBOSE_SEV_DEFAULT = Sev::S_INFO;

// Implementations.

Config::Config(Sev most_verbose_sev_default) :
  m_use_human_friendly_time_stamps(true),
  m_verbosity_default(raw_sev_t(most_verbose_sev_default))
{
  // Nothing.
}

Config::Config(const Config&) = default;

bool Config::output_whether_should_log(Sev sev, const Component& component) const
{
  using std::memory_order_relaxed;

  const auto sev_override = *(this_thread_verbosity_override());
  if (sev_override != Sev::S_END_SENTINEL)
  {
    return sev <= sev_override;
  }
  // else

  if (!component.empty())
  {
    const auto component_union_idx = component_to_union_idx(component);
    if (component_union_idx != component_union_idx_t(-1))
    {
      const auto most_verbose_sev_raw = m_verbosities_by_component[component_union_idx].load(memory_order_relaxed);
      if (most_verbose_sev_raw != raw_sev_t(-1))
      {
        return sev <= Sev(most_verbose_sev_raw);
      }
    }
  }
  // Unregistered, or no verbosity of its own.

  return sev <= Sev(m_verbosity_default.load(memory_order_relaxed));
} // Config::output_whether_should_log()

bool Config::output_component_to_ostream(std::ostream* os, const Component& component) const
{
  assert(os);

  if (component.empty())
  {
    return false;
  }
  // else

  const auto component_union_idx = component_to_union_idx(component);
  if (component_union_idx == component_union_idx_t(-1))
  {
    return false;
  }
  // else

  const auto name_it = m_component_names_by_union_idx.find(component_union_idx);
  if (name_it == m_component_names_by_union_idx.end())
  {
    *os << component_union_idx;
  }
  else
  {
    *os << name_it->second;
  }
  return true;
}

void Config::configure_default_verbosity(Sev most_verbose_sev, bool reset)
{
  m_verbosity_default.store(raw_sev_t(most_verbose_sev), std::memory_order_relaxed);

  if (reset)
  {
    for (size_t idx = 0; idx != m_verbosities_by_component.size(); ++idx)
    {
      store_severity_by_component(component_union_idx_t(idx), raw_sev_t(-1));
    }
  }
}

bool Config::configure_component_verbosity_by_name(Sev most_verbose_sev, util::String_view component_name)
{
  const auto idx_it = m_component_union_idxs_by_name.find(normalized_component_name(component_name));
  if (idx_it == m_component_union_idxs_by_name.end())
  {
    return false;
  }
  // else

  store_severity_by_component(idx_it->second, raw_sev_t(most_verbose_sev));
  return true;
}

bool Config::configure_from_spec(util::String_view spec)
{
  using boost::algorithm::split;
  using boost::algorithm::trim_copy;
  using boost::algorithm::is_any_of;
  using std::string;
  using std::vector;
  using std::pair;

  // Parses one severity token in its entirety; S_NONE is accepted only when spelled out.
  const auto parse_sev = [](const string& token, Sev* sev) -> bool
  {
    std::istringstream is(token);
    is >> *sev;
    if (is.peek() != std::char_traits<char>::eof())
    {
      return false; // Trailing junk.
    }
    // else
    return (*sev != Sev::S_NONE) || boost::algorithm::iequals(token, "NONE") || (token == "0");
  };

  vector<string> items;
  split(items, string(spec), is_any_of(","));
  assert(!items.empty()); // split() always yields at least one (possibly empty) item.

  Sev default_sev;
  if (!parse_sev(trim_copy(items.front()), &default_sev))
  {
    return false;
  }
  // else

  vector<pair<component_union_idx_t, Sev>> component_sevs;
  for (auto item_it = items.begin() + 1; item_it != items.end(); ++item_it)
  {
    const auto eq_pos = item_it->find('=');
    if (eq_pos == string::npos)
    {
      return false;
    }
    // else

    const auto idx_it = m_component_union_idxs_by_name.find
                          (normalized_component_name(trim_copy(item_it->substr(0, eq_pos))));
    Sev sev;
    if ((idx_it == m_component_union_idxs_by_name.end())
        || (!parse_sev(trim_copy(item_it->substr(eq_pos + 1)), &sev)))
    {
      return false;
    }
    // else
    component_sevs.emplace_back(idx_it->second, sev);
  }

  // Validated everything; now apply it.
  configure_default_verbosity(default_sev, false);
  for (const auto& component_sev : component_sevs)
  {
    store_severity_by_component(component_sev.first, raw_sev_t(component_sev.second));
  }
  return true;
} // Config::configure_from_spec()

Sev* Config::this_thread_verbosity_override() // Static.
{
  thread_local Sev verbosity_override = Sev::S_END_SENTINEL;
  return &verbosity_override;
}

std::string Config::normalized_component_name(util::String_view name) // Static.
{
  return boost::algorithm::to_upper_copy(std::string(name), std::locale::classic());
}

Config::component_union_idx_t Config::component_to_union_idx(const Component& component) const
{
  const auto offset_it = m_union_idx_offsets_by_payload_type.find(component.payload_type_index());
  return (offset_it == m_union_idx_offsets_by_payload_type.end())
           ? component_union_idx_t(-1)
           : (offset_it->second + component.payload_enum_raw_value());
}

void Config::store_severity_by_component(component_union_idx_t component_union_idx, raw_sev_t most_verbose_sev_or_none)
{
  assert(component_union_idx < m_verbosities_by_component.size());

  // Relaxed: no other data need be ordered with it, and readers may see the old value briefly.
  m_verbosities_by_component[component_union_idx].store(most_verbose_sev_or_none, std::memory_order_relaxed);
}

Config::Atomic_raw_sev::Atomic_raw_sev(raw_sev_t init_val) :
  std::atomic<raw_sev_t>(init_val)
{
  // Nothing.
}

Config::Atomic_raw_sev::Atomic_raw_sev(const Atomic_raw_sev& src) :
  std::atomic<raw_sev_t>(src.load(std::memory_order_relaxed))
{
  // Nothing.
}

} // namespace odict::log
