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

#include "odict/util/util_fwd.hpp"
#include <string>

namespace odict::test
{

/**
 * Process-wide settings of the unit tests; taken from the environment once, at first use.
 */
class Test_config
{
public:
  /**
   * Returns the singleton, constructing it on first call.
   *
   * @return See above.
   */
  static Test_config& get_singleton();

  /**
   * Name of the environment variable that, if set, replaces #m_log_spec; in the form accepted by
   * log::Config::configure_from_spec(), e.g., `"trace"` or `"info,odict-dict=data"`.
   */
  static const std::string S_LOG_SPEC_ENV_VAR;

  /// Verbosity configuration applied by each test::Test_logger.
  std::string m_log_spec;

private:
  /// Constructor: loads the environment, if applicable.
  Test_config();
}; // class Test_config

} // namespace odict::test
