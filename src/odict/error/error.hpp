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

#include "odict/error/error_fwd.hpp"
#include "odict/log/log.hpp"
#include "odict/util/util.hpp"
#include <boost/system/system_error.hpp>

namespace odict::error
{

/**
 * The exception thrown by odict APIs: a boost.system `system_error` (hence an `std::runtime_error`) carrying the
 * #Error_code that was emitted, so `code()` can be compared against, for example, dict::error::Code values.
 *
 * what() reads `"<context>: <code().message()>"`; the context is normally the source location of the API that
 * failed, as filled in by ODICT_ERROR_EXEC_AND_THROW_ON_ERROR().
 */
class Runtime_error :
  public boost::system::system_error
{
public:
  /**
   * Constructs the exception.
   *
   * @param err_code
   *        The error; should be truthy.
   * @param context
   *        Where it happened.
   */
  explicit Runtime_error(const Error_code& err_code, util::String_view context);
}; // class Runtime_error

// Template implementations.

template<typename Func, typename Ret>
bool exec_and_throw_on_error(const Func& func, Ret* ret, Error_code* err_code, util::String_view context)
{
  if (err_code)
  {
    return false;
  }
  // else

  Error_code local_err_code;
  *ret = func(&local_err_code);
  if (local_err_code)
  {
    throw Runtime_error(local_err_code, context);
  }
  return true;
}

template<typename Func>
bool exec_void_and_throw_on_error(const Func& func, Error_code* err_code, util::String_view context)
{
  if (err_code)
  {
    return false;
  }
  // else

  Error_code local_err_code;
  func(&local_err_code);
  if (local_err_code)
  {
    throw Runtime_error(local_err_code, context);
  }
  return true;
}

} // namespace odict::error

// Macros.

/**
 * Reports an error from inside an API following the `Error_code* err_code` convention: logs it at
 * log::Sev::S_INFO, with the code and its message, then stores it into `*err_code`.  Errors of the odict containers
 * are ordinary outcomes of lookups (an absent key, an empty map), hence INFO rather than WARNING.
 *
 * Requires, in scope, a non-null `Error_code* err_code` and the ability to log (see ODICT_LOG_INFO()).
 *
 * @param ARG_val
 *        Anything convertible to #Error_code; typically a dict::error::Code.
 */
#define ODICT_ERROR_EMIT_ERROR_LOG_INFO(ARG_val) \
  ODICT_UTIL_SEMICOLON_SAFE \
  ( \
    const ::odict::Error_code ODICT_ERROR_emitted_err_code(ARG_val); \
    ODICT_LOG_INFO("Error code emitted: [" << ODICT_ERROR_emitted_err_code << "] " \
                   "[" << ODICT_ERROR_emitted_err_code.message() << "]."); \
    *err_code = ODICT_ERROR_emitted_err_code; \
  )

/**
 * Gives an API `Ret f(..., Error_code* err_code = nullptr)` its throwing form; place it first in the body.
 * With a null `err_code` it calls `f()` again with a local #Error_code in place of `_1`, then either returns
 * that call's result or throws error::Runtime_error.  With a non-null one it is a no-op.
 *
 * @param ARG_ret_type
 *        `Ret`; default-constructible, and without commas (use an alias if need be).
 * @param ARG_function_name
 *        `f`, as an identifier: it is both called and stringified into the exception context.
 * @param ...
 *        Arguments of the recursive call, `_1` standing for the `Error_code*`.
 */
#define ODICT_ERROR_EXEC_AND_THROW_ON_ERROR(ARG_ret_type, ARG_function_name, ...) \
  ODICT_UTIL_SEMICOLON_SAFE \
  ( \
    ARG_ret_type ODICT_ERROR_result; \
    if (::odict::error::exec_and_throw_on_error \
          ([&](::odict::Error_code* _1) -> ARG_ret_type { return ARG_function_name(__VA_ARGS__); }, \
           &ODICT_ERROR_result, err_code, ODICT_UTIL_WHERE_AM_I_LITERAL(ARG_function_name))) \
    { \
      return ODICT_ERROR_result; \
    } \
  )
