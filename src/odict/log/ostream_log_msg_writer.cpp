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
#include "odict/log/ostream_log_msg_writer.hpp"
#include "odict/log/config.hpp"
#include <fmt/chrono.h>
#include <cassert>
#include <iterator>

namespace odict::log
{

// Static initializations.

const std::array<util::String_view, size_t(Sev::S_END_SENTINEL)> Ostream_log_msg_writer::S_SEV_STRS
  {{ "none", "fatl", "eror", "warn", "info", "debg", "trce", "data" }};

// Implementations.

Ostream_log_msg_writer::Ostream_log_msg_writer(const Config& config, std::ostream& os) :
  m_config(config),
  m_human_friendly_time_stamps(m_config.m_use_human_friendly_time_stamps),
  m_os(os)
{
  // Nothing.
}

void Ostream_log_msg_writer::log(const Msg_metadata& metadata, util::String_view msg)
{
  assert(metadata.m_msg_sev != Sev::S_NONE);

  format_time_stamp(metadata.m_called_when);
  m_os.write(m_time_stamp_buf.data(), std::streamsize(m_time_stamp_buf.size()));

  m_os << '[' << S_SEV_STRS[size_t(metadata.m_msg_sev)] << "]: T";
  if (metadata.m_call_thread_nickname.empty())
  {
    m_os << metadata.m_call_thread_id;
  }
  else
  {
    m_os << metadata.m_call_thread_nickname;
  }
  m_os << ": ";

  if (m_config.output_component_to_ostream(&m_os, metadata.m_msg_component))
  {
    m_os << ": ";
  }

  m_os << ODICT_UTIL_WHERE_AM_I_FROM_ARGS(metadata.m_msg_src_file, metadata.m_msg_src_function,
                                          metadata.m_msg_src_line)
       << ": " << msg << '\n' << std::flush;
}

void Ostream_log_msg_writer::format_time_stamp(const Msg_metadata::Time_stamp& called_when)
{
  using std::chrono::duration_cast;
  using std::chrono::microseconds;
  using std::chrono::system_clock;

  const auto usec_since_epoch = duration_cast<microseconds>(called_when.time_since_epoch()).count();
  const auto sec = usec_since_epoch / 1000000;
  const auto usec = usec_since_epoch % 1000000;

  m_time_stamp_buf.clear();
  if (m_human_friendly_time_stamps)
  {
    const auto local_tm = fmt::localtime(system_clock::to_time_t(called_when));
    fmt::format_to(std::back_inserter(m_time_stamp_buf), "{0:%Y-%m-%d %H:%M:%S}.{1:06} {0:%z} ", local_tm, usec);
  }
  else
  {
    fmt::format_to(std::back_inserter(m_time_stamp_buf), "{}.{:06} ", sec, usec);
  }
}

} // namespace odict::log
