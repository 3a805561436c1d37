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
#include "odict/log/log.hpp"
#include <cassert>

namespace odict::log
{

// Static initializations.

boost::thread_specific_ptr<std::string> Logger::s_this_thread_nickname_ptr;

// Logger implementations.

void Logger::this_thread_set_logged_nickname(util::String_view thread_nickname, Logger* logger_ptr) // Static.
{
  if (thread_nickname.empty())
  {
    s_this_thread_nickname_ptr.reset();
  }
  else
  {
    s_this_thread_nickname_ptr.reset(new std::string(thread_nickname));
  }

  if (logger_ptr)
  {
    ODICT_LOG_SET_CONTEXT(logger_ptr, Odict_log_component::S_LOG);
    ODICT_LOG_INFO("Thread ID [" << boost::this_thread::get_id() << "] is now nicknamed "
                   "[" << thread_nickname << "] in the log.");
  }
}

void Logger::set_thread_info_in_msg_metadata(Msg_metadata* msg_metadata) // Static.
{
  assert(msg_metadata);

  auto const nickname_ptr = s_this_thread_nickname_ptr.get();
  if (nickname_ptr)
  {
    msg_metadata->m_call_thread_nickname = *nickname_ptr;
    msg_metadata->m_call_thread_id = util::Thread_id();
    return;
  }
  // else

  msg_metadata->m_call_thread_nickname.clear();
  msg_metadata->m_call_thread_id = boost::this_thread::get_id();
}

// Component implementations.

Component::Component() :
  m_payload_type_or_null(nullptr),
  m_payload_enum_raw_value(0)
{
  // Nothing.
}

bool Component::empty() const
{
  return m_payload_type_or_null == nullptr;
}

const std::type_info& Component::payload_type() const
{
  assert(!empty());
  return *m_payload_type_or_null;
}

std::type_index Component::payload_type_index() const
{
  return payload_type();
}

Component::enum_raw_t Component::payload_enum_raw_value() const
{
  assert(!empty());
  return m_payload_enum_raw_value;
}

// Log_context implementations.

Log_context::Log_context(Logger* logger) :
  m_logger(logger)
{
  // Nothing.
}

Log_context::Log_context(const Log_context& src) = default;

Log_context::Log_context(Log_context&& src) :
  Log_context()
{
  swap(src);
}

Log_context& Log_context::operator=(const Log_context& src) = default;

Log_context& Log_context::operator=(Log_context&& src)
{
  if (&src != this)
  {
    Log_context(std::move(src)).swap(*this);
  }
  return *this;
}

Logger* Log_context::get_logger() const
{
  return m_logger;
}

const Component& Log_context::get_log_component() const
{
  return m_component;
}

void Log_context::swap(Log_context& other)
{
  using std::swap;

  swap(m_logger, other.m_logger);
  swap(m_component, other.m_component);
}

void swap(Log_context& val1, Log_context& val2)
{
  val1.swap(val2);
}

// Sev implementations.

std::ostream& operator<<(std::ostream& os, Sev val)
{
  // Each name must be parseable back by operator>>(); so no leading digits.
  switch (val)
  {
  case Sev::S_NONE:
    return os << "NONE";
  case Sev::S_FATAL:
    return os << "FATAL";
  case Sev::S_ERROR:
    return os << "ERROR";
  case Sev::S_WARNING:
    return os << "WARNING";
  case Sev::S_INFO:
    return os << "INFO";
  case Sev::S_DEBUG:
    return os << "DEBUG";
  case Sev::S_TRACE:
    return os << "TRACE";
  case Sev::S_DATA:
    return os << "DATA";
  case Sev::S_END_SENTINEL:
    break;
  }
  assert(false && "Sentinel or corrupt log::Sev value.");
  return os;
}

std::istream& operator>>(std::istream& is, Sev& val)
{
  val = util::istream_to_enum(&is, Sev::S_NONE, Sev::S_END_SENTINEL);
  return is;
}

} // namespace odict::log
