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

#include "odict/util/detail/util_fwd.hpp"

namespace odict::util
{

// Free functions: in *_fwd.hpp.

// Template/constexpr implementations.

constexpr String_view get_last_path_segment(String_view full_path)
{
  String_view path(full_path); // Copies only the pointer and length.
#  ifdef ODICT_OS_WIN
  constexpr char SEP = '\\';
#  else
  constexpr char SEP = '/';
#  endif
  /* This is path.rfind(SEP), done by hand: older gcc versions refuse to evaluate rfind() in a constexpr
   * context, while the equivalent hand-written loop is fine. */
  for (auto idx = path.size(); idx != 0; --idx)
  {
    if (path[idx - 1] == SEP)
    {
      path.remove_prefix(idx);
      break;
    }
  }

  return path;
} // get_last_path_segment()

} // namespace odict::util

// Macros.

/**
 * Helper macro, same as ODICT_UTIL_WHERE_AM_I(), but takes the source location details as arguments instead of
 * grabbing them from `__FILE__`, `__FUNCTION__`, `__LINE__`.
 *
 * @param ARG_file
 *        File name as a `String_view`; typically just the part past the last dir separator.
 * @param ARG_function
 *        Function name, as from `__FUNCTION__`, as a `String_view` or `const char*`.
 * @param ARG_line
 *        Line number, as from `__LINE__`.
 * @return `ostream` fragment `X` (suitable for, for example: `std::cout << X << ": Hi!"`).
 */
#define ODICT_UTIL_WHERE_AM_I_FROM_ARGS(ARG_file, ARG_function, ARG_line) \
  ARG_file << ':' << ARG_function << '(' << ARG_line << ')'
