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

#include "odict/common.hpp"
#include <string>
#include <string_view>

namespace odict::util
{

// Types.

/// The string view type used throughout odict APIs.
using String_view = std::string_view;

// Free functions.

/**
 * The part of `path` after its last `/`; all of it if there is none.  Usable at compile time, so for a
 * `__FILE__` literal the work is typically done by the compiler.
 *
 * @param path
 *        A path such as `__FILE__`.
 * @return View into `path`.
 */
constexpr String_view get_last_path_segment(String_view path);

/**
 * Backs ODICT_UTIL_WHERE_AM_I_STR(): `"<last segment of file>:<function>(<line>)"`.
 *
 * @param file
 *        Source file path.
 * @param function
 *        Function name.
 * @param line
 *        Line number.
 * @return See above.
 */
std::string get_where_am_i_str(String_view file, String_view function, unsigned int line);

} // namespace odict::util
