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
#include "odict/log/simple_ostream_logger.hpp"
#include "odict/log/config.hpp"
#include <boost/make_shared.hpp>
#include <cassert>

namespace odict::log
{

Simple_ostream_logger::Simple_ostream_logger(Config* config, std::ostream& os, std::ostream& os_for_err) :
  m_config(config)
{
  assert(m_config);

  m_os_writers[0] = boost::make_shared<Ostream_log_msg_writer>(*m_config, os);
  m_os_writers[1] = (&os_for_err == &os)
                      ? m_os_writers[0]
                      : boost::make_shared<Ostream_log_msg_writer>(*m_config, os_for_err);
}

bool Simple_ostream_logger::should_log(Sev sev, const Component& component) const // Virtual.
{
  return m_config->output_whether_should_log(sev, component);
}

void Simple_ostream_logger::do_log(Msg_metadata* metadata, util::String_view msg) // Virtual.
{
  assert(metadata);
  const bool severe = metadata->m_msg_sev <= Sev::S_WARNING;

  util::Lock_guard<util::Mutex_non_recursive> lock(m_log_mutex);
  m_os_writers[severe ? 1 : 0]->log(*metadata, msg);
}

} // namespace odict::log
