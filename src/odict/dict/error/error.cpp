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
#include "odict/dict/error/error.hpp"
#include <cassert>
#include <string>

namespace odict::dict::error
{

// Types.

/// boost.system category of the error::Code values: supplies `name()` and `message()` to any #odict::Error_code
/// holding one.  Only make_error_code() needs to see it.
class Category :
  public boost::system::error_category
{
public:
  /// The one instance.
  static const Category S_CATEGORY;

  /**
   * Category name; appears in `ostream << Error_code` output as in `odict_dict:1`.
   *
   * @return A string literal.
   */
  const char* name() const noexcept override;

  /**
   * Description of one error::Code, given as `int`.
   *
   * @param val
   *        Code value.
   * @return See above.
   */
  std::string message(int val) const override;

private:
  /// Only #S_CATEGORY exists.
  explicit Category();
}; // class Category

// Static initializations.

const Category Category::S_CATEGORY;

// Implementations.

Error_code make_error_code(Code err_code)
{
  return Error_code{static_cast<int>(err_code), Category::S_CATEGORY};
}

Category::Category() = default;

const char* Category::name() const noexcept // Virtual.
{
  return "odict_dict";
}

std::string Category::message(int val) const // Virtual.
{
  // Same text as the doc comments on the Code members.
  switch (static_cast<Code>(val))
  {
  case Code::S_KEY_NOT_FOUND:
    return "The requested key is not present in the container.";
  case Code::S_EMPTY_CONTAINER:
    return "Attempted to remove an element from an empty container.";
  case Code::S_INVALID_ARGUMENT:
    return "An argument was unusable; for example a present but empty default factory.";
  }
  assert(false && "Value does not belong to Code.");
  return "Unknown odict_dict error.";
} // Category::message()

} // namespace odict::dict::error
