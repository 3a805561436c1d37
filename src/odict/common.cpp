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
#include "odict/common.hpp"

namespace odict
{

// Static initializers.

// Keep in sync with Odict_log_component.  The user picks the prefix; test::Test_logger uses "odict-".
const boost::unordered_map<Odict_log_component, std::string> S_ODICT_LOG_COMPONENT_NAME_MAP
  {
    { Odict_log_component::S_UNCAT, "UNCAT" },
    { Odict_log_component::S_LOG, "LOG" },
    { Odict_log_component::S_ERROR, "ERROR" },
    { Odict_log_component::S_UTIL, "UTIL" },
    { Odict_log_component::S_DICT, "DICT" }
  };

} // namespace odict
