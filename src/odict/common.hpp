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

#include <boost/system/error_code.hpp>
#include <boost/unordered_map.hpp>
#include <functional>
#include <string>

/**
 * @mainpage
 *
 * odict provides dict::Ordered_map, an associative container that remembers insertion order, and
 * dict::Default_ordered_map, which in addition creates missing values on lookup.  Supporting them: `log`
 * (logging with per-component verbosity), `error` (boost.system error codes and the exception carrying them),
 * and `util` (what those two need).
 */

#if (!defined(__cplusplus)) || (__cplusplus < 201703L)
#  error "odict headers require C++17 or later."
#endif

// Macros.

#ifdef ODICT_DOXYGEN_ONLY

/// Defined if and only if building for Linux.
#  define ODICT_OS_LINUX
/// Defined if and only if building for macOS.
#  define ODICT_OS_MAC
/// Defined if and only if building for Windows.
#  define ODICT_OS_WIN

#else

#  ifdef __linux__
#    define ODICT_OS_LINUX
#  elif defined(__APPLE__)
#    define ODICT_OS_MAC
#  elif defined(_WIN32) || defined(_WIN64)
#    define ODICT_OS_WIN
#  endif

#endif

/**
 * Top namespace of odict; each module has its own namespace within (`odict::dict`, `odict::log`, ...).  The few
 * items directly here are used by all of them.
 */
namespace odict
{

// Types.

/**
 * The error code type of odict (boost.system's).  Truthy means failure.
 *
 * Any odict API that fails in the ordinary course of things takes a last argument `Error_code* err_code = nullptr`:
 *   - Null `err_code`: a failure throws error::Runtime_error, whose `code()` is the error.
 *   - Non-null: `*err_code` is set to success or to the error, and nothing is thrown; after a failure the return
 *     value, if any, is default-constructed.
 *
 * ODICT_ERROR_EXEC_AND_THROW_ON_ERROR() supplies the throwing behavior.
 */
using Error_code = boost::system::error_code;

template<typename Signature>
class Function;

/**
 * The function wrapper odict uses: `std::function`, plus empty() as in `boost::function`.
 *
 * @tparam Result
 *         Return type.
 * @tparam Args
 *         Parameter types.
 */
template<typename Result, typename... Args>
class Function<Result (Args...)> :
  public std::function<Result (Args...)>
{
public:
  /// The base.
  using Function_base = std::function<Result (Args...)>;

  /// All of `std::function`'s constructors.
  using Function_base::Function_base;

  /**
   * Whether `*this` has no target.
   *
   * @return See above.
   */
  bool empty() const noexcept;
}; // class Function<Result (Args...)>

/**
 * log::Component payloads of odict's own logging, one per module.  A program that wants odict's messages
 * named and filterable by component registers this `enum` with its log::Config, as test::Test_logger does.
 */
enum class Odict_log_component : unsigned int
{
  /// Anything not in one of the modules below.
  S_UNCAT = 0,
  /// odict::log.
  S_LOG,
  /// odict::error.
  S_ERROR,
  /// odict::util.
  S_UTIL,
  /// odict::dict.
  S_DICT,
  /// One past the last value.
  S_END_SENTINEL
}; // enum class Odict_log_component

// Data.

/// Name of each Odict_log_component value, for log::Config::register_components().
extern const boost::unordered_map<Odict_log_component, std::string> S_ODICT_LOG_COMPONENT_NAME_MAP;

// Template implementations.

template<typename Result, typename... Args>
bool Function<Result (Args...)>::empty() const noexcept
{
  return !*this;
}

} // namespace odict
