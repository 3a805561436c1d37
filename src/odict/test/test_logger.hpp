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

#include "odict/test/test_config.hpp"
#include "odict/log/config.hpp"
#include "odict/log/simple_ostream_logger.hpp"
#include "odict/common.hpp"
#include <iostream>

namespace odict::test
{

/**
 * log::Logger for unit tests: knows the odict log components (named with the `"odict-"` prefix) and filters
 * per Test_config::m_log_spec.  Output goes to the console or, if a test wants to inspect it, to one given stream.
 */
class Test_logger :
  public log::Logger
{
public:
  /**
   * Constructs the logger, ready to use.
   *
   * @param os_or_null
   *        If not null, all messages (of any severity) go to `*os_or_null`, which must outlive `*this`.
   *        If null, they go to `cout` and (from Sev::S_WARNING up) `cerr`.
   * @param log_spec
   *        Verbosity configuration; see log::Config::configure_from_spec().  If it is invalid, the default
   *        verbosity (Sev::S_INFO) stays in force, and a warning is logged.
   */
  explicit Test_logger(std::ostream* os_or_null = nullptr,
                       util::String_view log_spec = Test_config::get_singleton().m_log_spec) :
    m_config(log::Sev::S_INFO),
    m_logger(&m_config,
             os_or_null ? *os_or_null : std::cout,
             os_or_null ? *os_or_null : std::cerr)
  {
    m_config.register_components(S_ODICT_LOG_COMPONENT_NAME_MAP, "odict-");

    // Names are registered, so `NAME=SEV` items can be resolved now.
    if (!m_config.configure_from_spec(log_spec))
    {
      ODICT_LOG_SET_CONTEXT(this, Odict_log_component::S_LOG);
      ODICT_LOG_WARNING("Ignoring invalid test log configuration [" << log_spec << "]; "
                        "check environment variable [" << Test_config::S_LOG_SPEC_ENV_VAR << "].");
    }
  }

  /**
   * Returns the verbosity configuration, which a test may change at will.
   *
   * @return See above.
   */
  log::Config& get_config()
  {
    return m_config;
  }

  /// Delegates to the stream logger.
  bool should_log(log::Sev sev, const log::Component& component) const override
  {
    return m_logger.should_log(sev, component);
  }

  /// Delegates to the stream logger.
  void do_log(log::Msg_metadata* metadata, util::String_view msg) override
  {
    m_logger.do_log(metadata, msg);
  }

private:
  /// Verbosity configuration; #m_logger keeps a pointer to it.
  log::Config m_config;

  /// Does the actual writing.
  log::Simple_ostream_logger m_logger;
}; // class Test_logger

} // namespace odict::test
