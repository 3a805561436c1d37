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
#include "odict/util/detail/util.hpp"
#include <string>

namespace odict::util
{

// Implementations.

std::string get_where_am_i_str(String_view file, String_view function, unsigned int line)
{
  const auto line_str = std::to_string(line);

  std::string out;
  out.reserve(file.size() + function.size() + line_str.size() + 3);
  out.append(get_last_path_segment(file)) += ':';
  out.append(function) += '(';
  out.append(line_str) += ')';
  return out;
}

} // namespace odict::util
