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

#include "odict/log/ostream_log_msg_writer.hpp"
#include "odict/log/log.hpp"
#include "odict/util/util_fwd.hpp"
#include <boost/shared_ptr.hpp>
#include <array>

namespace odict::log
{

// Types.

/**
 * Logger writing each message as a line (see Ostream_log_msg_writer) to an `ostream`: messages of Sev::S_WARNING
 * and worse to one stream, by default `cerr`, and the rest to another, by default `cout`.  Synchronous: the line
 * is written and flushed before do_log() returns.  The filter is Config::output_whether_should_log().
 *
 * ### Thread safety ###
 * Safe for concurrent use.  A mutex keeps lines from interleaving.
 */
class Simple_ostream_logger :
  public Logger
{
public:
  // Constructors/destructor.

  /**
   * Constructs the Logger.  The two streams may be the same one.
   *
   * @param config
   *        Filter and format settings; must outlive `*this`.
   * @param os
   *        Destination of messages less severe than Sev::S_WARNING.
   * @param os_for_err
   *        Destination of the others.
   */
  explicit Simple_ostream_logger(Config* config,
                                 std::ostream& os = std::cout, std::ostream& os_for_err = std::cerr);

  // Methods.

  /**
   * Asks #m_config.
   *
   * @param sev
   *        See Logger::should_log().
   * @param component
   *        See Logger::should_log().
   * @return See Logger::should_log().
   */
  bool should_log(Sev sev, const Component& component) const override;

  /**
   * Writes the message to the stream for its severity.
   *
   * @param metadata
   *        See Logger::do_log().
   * @param msg
   *        See Logger::do_log().
   */
  void do_log(Msg_metadata* metadata, util::String_view msg) override;

  // Data.

  /// The Config given to the constructor; may be changed subject to Config's thread safety rules.
  Config* const m_config;

private:
  // Data.

  /// Writers for the less severe (`[0]`) and more severe (`[1]`) messages; one writer if the streams are the same.
  std::array<boost::shared_ptr<Ostream_log_msg_writer>, 2> m_os_writers;

  /// Serializes do_log().
  util::Mutex_non_recursive m_log_mutex;
}; // class Simple_ostream_logger

} // namespace odict::log
