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
#include <iostream>

/**
 * odict module for logging.  Library code logs through the ODICT_LOG_...() macros into a Logger chosen by the
 * user, possibly none (null: no logging at all).  Which messages pass is decided per Component and Sev by a Config.
 * Simple_ostream_logger, writing lines to `ostream`s such as `cout`, is the Logger odict itself provides.
 */
namespace odict::log
{

// Types.

class Component;
class Config;
class Logger;
class Log_context;
struct Msg_metadata;
class Ostream_log_msg_writer;
class Simple_ostream_logger;

/**
 * Severity of a log message, most severe first; so `sev <= threshold` is how a filter passes a message whose
 * severity is `sev`.  The more verbose a level, the more frequent its messages should be allowed to be.
 */
enum class Sev : size_t
{
  /// Not for messages; as a threshold it passes nothing.  Also what `operator>>` yields for unrecognized input.
  S_NONE = 0,
  /// The program is about to abort.
  S_FATAL,
  /// Something went wrong, worse than a warning.
  S_ERROR,
  /// Something suspicious or wrong, but infrequent.
  S_WARNING,
  /// Something noteworthy and infrequent; the default threshold.
  S_INFO,
  /// Infrequent detail, of interest mainly when debugging odict itself.
  S_DEBUG,
  /// Possibly frequent detail, such as one message per container operation.
  S_TRACE,
  /// Like Sev::S_TRACE, with variable-length payload dumps.
  S_DATA,
  /// One past the last value.
  S_END_SENTINEL
}; // enum class Sev

// Free functions.

/**
 * Reads a Sev as printed by `operator<<` (any case), or as its number; see util::istream_to_enum().
 * Unrecognized input yields Sev::S_NONE.
 *
 * @param is
 *        Input stream.
 * @param val
 *        Result.
 * @return `is`.
 */
std::istream& operator>>(std::istream& is, Sev& val);

/**
 * Prints a Sev as its name in capitals, for example `WARNING`.
 *
 * @param os
 *        Output stream.
 * @param val
 *        Value; not Sev::S_END_SENTINEL.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, Sev val);

/**
 * Same as `val1.swap(val2)`.
 *
 * @param val1
 *        Object.
 * @param val2
 *        Object.
 */
void swap(Log_context& val1, Log_context& val2);

} // namespace odict::log
