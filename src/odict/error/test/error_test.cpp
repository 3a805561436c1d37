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


#include "odict/error/error.hpp"
#include "odict/dict/error/error.hpp"
#include "odict/util/util.hpp"
#include <gtest/gtest.h>
#include <string>

namespace odict::error::test
{

namespace
{
using std::string;

/// Stand-in for a library API following the `Error_code* err_code = nullptr` convention.
int halve(int val, Error_code* err_code = nullptr)
{
  ODICT_ERROR_EXEC_AND_THROW_ON_ERROR(int, halve, val, _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  if ((val % 2) != 0)
  {
    *err_code = dict::error::Code::S_INVALID_ARGUMENT;
    return 0;
  }
  // else
  err_code->clear();
  return val / 2;
}

/// Same but returning nothing.
void check_even(int val, Error_code* err_code = nullptr)
{
  if (exec_void_and_throw_on_error([&](Error_code* actual_err_code) { check_even(val, actual_err_code); },
                                   err_code, "check_even()"))
  {
    return;
  }
  // else

  if ((val % 2) != 0)
  {
    *err_code = dict::error::Code::S_INVALID_ARGUMENT;
    return;
  }
  // else
  err_code->clear();
}

} // Anonymous namespace

TEST(Error, Exec_and_throw)
{
  EXPECT_EQ(halve(8), 4);

  Error_code err_code;
  EXPECT_EQ(halve(7, &err_code), 0);
  EXPECT_EQ(err_code, dict::error::Code::S_INVALID_ARGUMENT);
  EXPECT_EQ(halve(6, &err_code), 3);
  EXPECT_FALSE(err_code);

  try
  {
    halve(7);
    ADD_FAILURE() << "Should have thrown.";
  }
  catch (const Runtime_error& exc)
  {
    EXPECT_EQ(exc.code(), dict::error::Code::S_INVALID_ARGUMENT);
    // The context names the failing API.
    EXPECT_NE(string(exc.what()).find("halve"), string::npos) << exc.what();
  }

  EXPECT_NO_THROW(check_even(2));
  EXPECT_THROW(check_even(3), Runtime_error);
  check_even(3, &err_code);
  EXPECT_TRUE(err_code);
} // TEST(Error, Exec_and_throw)

TEST(Error, Runtime_error)
{
  const Runtime_error with_code(dict::error::Code::S_EMPTY_CONTAINER, "ctx");
  EXPECT_EQ(with_code.code(), dict::error::Code::S_EMPTY_CONTAINER);
  const string what(with_code.what());
  EXPECT_EQ(what, "ctx: " + with_code.code().message());
  EXPECT_NE(what.find("empty container"), string::npos) << what;
}

TEST(Error, Dict_codes)
{
  const Error_code key_not_found(dict::error::Code::S_KEY_NOT_FOUND);
  EXPECT_EQ(string(key_not_found.category().name()), "odict_dict");
  EXPECT_EQ(key_not_found.value(), 1);
  EXPECT_EQ(key_not_found.message(), "The requested key is not present in the container.");
  EXPECT_NE(Error_code(dict::error::Code::S_EMPTY_CONTAINER), key_not_found);
  EXPECT_EQ(Error_code(dict::error::Code::S_INVALID_ARGUMENT).category(), key_not_found.category());
}

} // namespace odict::error::test
