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
#include <boost/iostreams/stream.hpp>
#include <boost/iostreams/device/back_inserter.hpp>
#include <boost/noncopyable.hpp>

namespace odict::util
{

/**
 * An `ostream` that appends straight onto an `std::string`: either one the caller owns or one inside `*this`.
 * Unlike `ostringstream::str()`, str() copies nothing, which matters on the logging path where every message is
 * built this way.  Call `os() << flush` before reading str().
 *
 * Not safe for concurrent access, same as any stream.
 */
class String_ostream :
  private boost::noncopyable
{
public:
  /**
   * Wraps `*target_str`, or an internal empty string if `target_str` is null.
   *
   * @param target_str
   *        The string to append to; or null.  While `*this` lives, `*target_str` must not be touched directly.
   */
  explicit String_ostream(std::string* target_str = nullptr);

  /**
   * The stream writing into str().
   *
   * @return See above.
   */
  std::ostream& os();

  /**
   * The string being written; the same object throughout the life of `*this`.
   *
   * @return See above.
   */
  const std::string& str() const;

private:
  /// Device appending to an `std::string`.
  using Appender = boost::iostreams::back_insert_device<std::string>;

  /// The internal string; used only when the constructor was given null.
  std::string m_own_str;

  /// #m_own_str or the caller's string.
  std::string* const m_target;

  /// Appends to `*m_target`.
  Appender m_appender;

  /// The `ostream` on top of #m_appender.
  boost::iostreams::stream<Appender> m_os;
}; // class String_ostream

} // namespace odict::util
