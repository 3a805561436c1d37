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
#include "odict/util/detail/util.hpp"
#include "odict/util/string_ostream.hpp"
#include <boost/algorithm/string/predicate.hpp>
#include <boost/lexical_cast.hpp>
#include <cctype>
#include <locale>
#include <type_traits>

namespace odict::util
{

// Template implementations.

template<typename Container>
bool key_exists(const Container& container, const typename Container::key_type& key)
{
  return container.find(key) != container.end();
}

template<typename ...T>
void ostream_op_to_string(std::string* target_str, T const &... ostream_args)
{
  String_ostream os(target_str);
  (os.os() << ... << ostream_args) << std::flush;
}

template<typename ...T>
std::string ostream_op_string(T const &... ostream_args)
{
  std::string str;
  ostream_op_to_string(&str, ostream_args...);
  return str;
}

template<typename Enum>
Enum istream_to_enum(std::istream* is_ptr, Enum enum_default, Enum enum_sentinel, Enum enum_lowest)
{
  using boost::lexical_cast;
  using boost::bad_lexical_cast;
  using std::string;
  using Traits = std::char_traits<char>;
  using enum_t = std::underlying_type_t<Enum>;

  auto& is = *is_ptr;

  string token;
  for (auto ch = is.peek(); (ch != Traits::eof()) && (std::isalnum(ch) || (ch == '_')); ch = is.peek())
  {
    token += Traits::to_char_type(is.get());
  }

  if (token.empty())
  {
    return enum_default;
  }
  // else

  if (std::isdigit(static_cast<unsigned char>(token.front())))
  {
    enum_t num;
    try
    {
      num = lexical_cast<enum_t>(token);
    }
    catch (const bad_lexical_cast&)
    {
      return enum_default; // Overflow, or digits followed by letters.
    }
    return ((num >= enum_t(enum_lowest)) && (num < enum_t(enum_sentinel))) ? Enum(num) : enum_default;
  }
  // else

  for (auto num = enum_t(enum_lowest); num != enum_t(enum_sentinel); ++num)
  {
    if (boost::algorithm::iequals(token, lexical_cast<string>(Enum(num)), std::locale::classic()))
    {
      return Enum(num);
    }
  }
  return enum_default;
} // istream_to_enum()

} // namespace odict::util
