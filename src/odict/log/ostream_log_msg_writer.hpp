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
#include <boost/noncopyable.hpp>
#include <fmt/format.h>
#include <array>

namespace odict::log
{

/**
 * Writes log messages, one line each, onto an `ostream`; the formatting half of Simple_ostream_logger.
 * A line reads:
 *
 *   `<time stamp> [<sevr>]: T<thread nickname or ID>: <component>: <file>:<function>(<line>): <msg>`
 *
 * `<component>: ` is left out when Config::output_component_to_ostream() prints nothing.  Per
 * Config::m_use_human_friendly_time_stamps, as of construction, the time stamp is either local time
 * (`2024-01-31 13:45:07.000123 +0100`) or seconds since the Epoch (`1706705107.000123`).
 *
 * ### Thread safety ###
 * log() must not be called concurrently; Simple_ostream_logger holds a mutex around it.
 */
class Ostream_log_msg_writer :
  private boost::noncopyable
{
public:
  // Constants.

  /// The 4-letter tag of each Sev, indexed by its numeric value.
  static const std::array<util::String_view, size_t(Sev::S_END_SENTINEL)> S_SEV_STRS;

  // Constructors/destructor.

  /**
   * Constructs the writer.  Writes nothing.
   *
   * @param config
   *        Component names come from here; must outlive `*this`.
   * @param os
   *        Destination; must outlive `*this`.
   */
  explicit Ostream_log_msg_writer(const Config& config, std::ostream& os);

  // Methods.

  /**
   * Writes one line, then flushes.
   *
   * @param metadata
   *        See Logger::do_log().
   * @param msg
   *        See Logger::do_log().
   */
  void log(const Msg_metadata& metadata, util::String_view msg);

private:
  // Methods.

  /**
   * Formats the time stamp of a message, and the space after it, into #m_time_stamp_buf.
   *
   * @param called_when
   *        When the message was logged.
   */
  void format_time_stamp(const Msg_metadata::Time_stamp& called_when);

  // Data.

  /// See constructor.
  const Config& m_config;

  /// Copy of Config::m_use_human_friendly_time_stamps, as of construction.
  const bool m_human_friendly_time_stamps;

  /// See constructor.
  std::ostream& m_os;

  /// Reused for each time stamp.
  fmt::memory_buffer m_time_stamp_buf;
}; // class Ostream_log_msg_writer

} // namespace odict::log
