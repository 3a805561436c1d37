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
#include "odict/common.hpp"

/**
 * odict module for reporting failures: one exception type, plus the glue that lets each fallible API offer
 * both a throwing and an #Error_code-setting form.  The codes themselves are defined per module; see dict::error.
 */
namespace odict::error
{

// Types.

class Runtime_error;

// Free functions.

/**
 * The non-macro half of ODICT_ERROR_EXEC_AND_THROW_ON_ERROR(); not normally called directly.
 *
 * If `err_code` is not null, does nothing and returns `false`: the calling API should go on to do its work and
 * report into `*err_code`.  Otherwise runs `func(&e)`, `e` being a local #Error_code, and throws if `e` ended up
 * truthy; or else stores the result into `*ret` and returns `true`, meaning the caller should return `*ret`.
 *
 * @tparam Func
 *         Callable `Ret (Error_code*)`, which calls the API itself with a non-null `Error_code*`.
 * @tparam Ret
 *         Default-constructible result type of the API.
 * @param func
 *        See above.
 * @param ret
 *        Receives the result of `func()`, when it runs and succeeds.
 * @param err_code
 *        The API's own `err_code` argument.
 * @param context
 *        Prefix of Runtime_error::what(), if thrown.
 * @return See above.
 * @throws Runtime_error
 */
template<typename Func, typename Ret>
bool exec_and_throw_on_error(const Func& func, Ret* ret, Error_code* err_code, util::String_view context);

/**
 * exec_and_throw_on_error() for APIs returning `void`.  Short enough to use without a macro.
 *
 * @tparam Func
 *         Callable `void (Error_code*)`.
 * @param func
 *        See exec_and_throw_on_error().
 * @param err_code
 *        See exec_and_throw_on_error().
 * @param context
 *        See exec_and_throw_on_error().
 * @return See exec_and_throw_on_error().
 * @throws Runtime_error
 */
template<typename Func>
bool exec_void_and_throw_on_error(const Func& func, Error_code* err_code, util::String_view context);

} // namespace odict::error
