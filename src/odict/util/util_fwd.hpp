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
#include <boost/thread/thread.hpp>
#include <boost/thread/mutex.hpp>
#include <boost/thread/locks.hpp>
#include <iostream>
#include <string>

/**
 * odict module of small general-purpose helpers: string building via `<<`, source-location strings and
 * `enum` parsing, mostly in service of the `log` and `error` modules.
 */
namespace odict::util
{

// Types.

class String_ostream;

/// Thread ID type, as recorded into each log message.
using Thread_id = boost::thread::id;

/// The mutex we use wherever one is needed; not recursive.
using Mutex_non_recursive = boost::mutex;

/**
 * RAII lock of a mutex such as #Mutex_non_recursive.
 *
 * @tparam Mutex
 *         Mutex type.
 */
template<typename Mutex>
using Lock_guard = boost::unique_lock<Mutex>;

// Free functions.

/**
 * Whether `key` is in the associative `container`.
 *
 * @tparam Container
 *         Anything with `key_type` and `find()`; `std::map`, `boost::unordered_map`, etc.
 * @param container
 *        Container.
 * @param key
 *        Key.
 * @return See above.
 */
template<typename Container>
bool key_exists(const Container& container, const typename Container::key_type& key);

/**
 * Appends to `*target_str` what `os << arg1 << arg2 << ...` would print.  `std::endl` and other manipulator
 * templates cannot be passed; use `'\n'`.
 *
 * @tparam T
 *         Types printable with `<<`.
 * @param target_str
 *        String to append to.
 * @param ostream_args
 *        What to print.
 */
template<typename ...T>
void ostream_op_to_string(std::string* target_str, T const &... ostream_args);

/**
 * ostream_op_to_string() into a new string.
 *
 * @tparam T
 *         See ostream_op_to_string().
 * @param ostream_args
 *        See ostream_op_to_string().
 * @return The string.
 */
template<typename ...T>
std::string ostream_op_string(T const &... ostream_args);

/**
 * Reads an `enum` value from a stream: consumes the longest run of alphanumerics and underscores, then maps it.
 * A run starting with a digit is taken as the numeric value; any other run is compared, ignoring case, to the
 * `<<` output of each value in [`enum_lowest`, `enum_sentinel`).  No match (including an empty run) yields
 * `enum_default`.  Handy for `operator>>`; see log::Sev.
 *
 * @tparam Enum
 *         `enum class` with `<<` output, whose values are [0, `enum_sentinel`).
 * @param is_ptr
 *        Input stream.
 * @param enum_default
 *        Result on no match.
 * @param enum_sentinel
 *        One past the last valid value.
 * @param enum_lowest
 *        The first value to consider.
 * @return See above.
 */
template<typename Enum>
Enum istream_to_enum(std::istream* is_ptr, Enum enum_default, Enum enum_sentinel, Enum enum_lowest = Enum(0));

// Macros.

/**
 * `<<`-fragment giving the current `file:function(line)`, the file without its directories; as in
 * `os << ODICT_UTIL_WHERE_AM_I() << ": here."`.
 */
#define ODICT_UTIL_WHERE_AM_I() \
  ODICT_UTIL_WHERE_AM_I_FROM_ARGS(::odict::util::get_last_path_segment \
                                    (::odict::util::String_view(__FILE__, sizeof(__FILE__) - 1)), \
                                  ::odict::util::String_view(__FUNCTION__, sizeof(__FUNCTION__) - 1), \
                                  __LINE__)

/// ODICT_UTIL_WHERE_AM_I() as an `std::string`.
#define ODICT_UTIL_WHERE_AM_I_STR() \
  ::odict::util::get_where_am_i_str(::odict::util::String_view(__FILE__, sizeof(__FILE__) - 1), \
                                    ::odict::util::String_view(__FUNCTION__, sizeof(__FUNCTION__) - 1), \
                                    __LINE__)

/**
 * Compile-time ODICT_UTIL_WHERE_AM_I(): a string literal, so the file is the full `__FILE__`, and the function is
 * given by the caller.
 *
 * @param ARG_function
 *        Function name, as an identifier.
 */
#define ODICT_UTIL_WHERE_AM_I_LITERAL(ARG_function) \
  __FILE__ ":" #ARG_function "(" ODICT_UTIL_STRINGIFY(__LINE__) ")"

/**
 * Turns the expansion of `ARG_x` into a string literal.
 *
 * @param ARG_x
 *        Macro argument, such as `__LINE__`.
 */
#define ODICT_UTIL_STRINGIFY(ARG_x) \
  ODICT_UTIL_STRINGIFY_NO_EXPAND(ARG_x)

/// Helper of ODICT_UTIL_STRINGIFY(): turns `ARG_x`, unexpanded, into a string literal.
#define ODICT_UTIL_STRINGIFY_NO_EXPAND(ARG_x) \
  #ARG_x

/**
 * Wraps a statement-like macro body in `do { } while (false)`, so `M(...);` behaves as one statement anywhere,
 * including an unbraced `if` branch.
 *
 * @param ARG_func_macro_definition
 *        The body.
 */
#define ODICT_UTIL_SEMICOLON_SAFE(ARG_func_macro_definition) \
  do \
  { \
    ARG_func_macro_definition \
  } \
  while (false)

} // namespace odict::util
