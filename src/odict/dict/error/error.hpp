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

/**
 * Error codes of the odict::dict containers, pluggable into #odict::Error_code (boost.system) so they can be set
 * into an `Error_code*` or carried by error::Runtime_error.  The numeric values of Code are stable: only append.
 */
namespace odict::dict::error
{

// Types.

/// All possible errors returned (via #odict::Error_code arguments or error::Runtime_error exceptions) by dict APIs.
enum class Code
{
  /// The requested key is not present in the container.
  S_KEY_NOT_FOUND = 1,
  /// Attempted to remove an element from an empty container.
  S_EMPTY_CONTAINER,
  /// An argument was unusable; for example a present but empty default factory.
  S_INVALID_ARGUMENT
}; // enum class Code

// Free functions.

/**
 * Converts a Code to an #odict::Error_code in the dict category; boost.system finds it by ADL, which is what makes
 * `Error_code ec = Code::S_KEY_NOT_FOUND;` compile.
 *
 * @param err_code
 *        The code.
 * @return See above.
 */
Error_code make_error_code(Code err_code);

} // namespace odict::dict::error

namespace boost::system
{

/// Marks error::Code as an error code `enum`, enabling the implicit conversion to #odict::Error_code.
template<>
struct is_error_code_enum<::odict::dict::error::Code>
{
  /// Yes.
  static const bool value = true;
};

} // namespace boost::system
