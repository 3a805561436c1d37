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

#include "odict/log/log_fwd.hpp"
#include "odict/util/util.hpp"
#include "odict/util/string_ostream.hpp"
#include <boost/noncopyable.hpp>
#include <boost/thread/tss.hpp>
#include <chrono>
#include <string>
#include <typeinfo>
#include <typeindex>

// Macros.

/**
 * Logs a message of severity log::Sev::S_WARNING, if the Logger's filter allows it for the current Component.
 * The Logger is `get_logger()` and the Component `get_log_component()`, as found at the call site: usually methods
 * inherited from log::Log_context, or locals made by ODICT_LOG_SET_CONTEXT().  A null Logger means no logging.
 *
 * The message is built, and the arguments evaluated, only if the filter passes.
 *
 * @param ARG_stream_fragment
 *        What would follow `os << ` to print the message, such as `"Size [" << size() << "]."`.  No trailing
 *        newline.
 */
#define ODICT_LOG_WARNING(ARG_stream_fragment) \
  ODICT_LOG_WITH_CHECKING(::odict::log::Sev::S_WARNING, ARG_stream_fragment)

/// Like ODICT_LOG_WARNING() but with log::Sev::S_FATAL.
#define ODICT_LOG_FATAL(ARG_stream_fragment) \
  ODICT_LOG_WITH_CHECKING(::odict::log::Sev::S_FATAL, ARG_stream_fragment)

/// Like ODICT_LOG_WARNING() but with log::Sev::S_ERROR.
#define ODICT_LOG_ERROR(ARG_stream_fragment) \
  ODICT_LOG_WITH_CHECKING(::odict::log::Sev::S_ERROR, ARG_stream_fragment)

/// Like ODICT_LOG_WARNING() but with log::Sev::S_INFO.
#define ODICT_LOG_INFO(ARG_stream_fragment) \
  ODICT_LOG_WITH_CHECKING(::odict::log::Sev::S_INFO, ARG_stream_fragment)

/// Like ODICT_LOG_WARNING() but with log::Sev::S_DEBUG.
#define ODICT_LOG_DEBUG(ARG_stream_fragment) \
  ODICT_LOG_WITH_CHECKING(::odict::log::Sev::S_DEBUG, ARG_stream_fragment)

/// Like ODICT_LOG_WARNING() but with log::Sev::S_TRACE.
#define ODICT_LOG_TRACE(ARG_stream_fragment) \
  ODICT_LOG_WITH_CHECKING(::odict::log::Sev::S_TRACE, ARG_stream_fragment)

/// Like ODICT_LOG_WARNING() but with log::Sev::S_DATA.
#define ODICT_LOG_DATA(ARG_stream_fragment) \
  ODICT_LOG_WITH_CHECKING(::odict::log::Sev::S_DATA, ARG_stream_fragment)

/**
 * Declares local `get_logger()` and `get_log_component()` callables, so the `ODICT_LOG_...()` macros that follow
 * in the same block use the given Logger and Component.  For code with no log::Log_context at hand: free
 * functions, `static` methods, and lambdas outside the class.
 *
 * @param ARG_logger_ptr
 *        `Logger*`; may be null.
 * @param ARG_component_payload
 *        The Component's payload, such as `odict::Odict_log_component::S_DICT`.
 */
#define ODICT_LOG_SET_CONTEXT(ARG_logger_ptr, ARG_component_payload) \
  [[maybe_unused]] \
    const auto get_logger \
      = [logger_ptr_copy = static_cast<::odict::log::Logger*>(ARG_logger_ptr)] \
          () -> ::odict::log::Logger* { return logger_ptr_copy; }; \
  [[maybe_unused]] \
    const auto get_log_component = [component = ::odict::log::Component(ARG_component_payload)] \
                                     () -> const ::odict::log::Component & \
  { \
    return component; \
  }

/**
 * ODICT_LOG_WARNING() with the severity as an argument.
 *
 * @param ARG_sev
 *        log::Sev.
 * @param ARG_stream_fragment
 *        See ODICT_LOG_WARNING().
 */
#define ODICT_LOG_WITH_CHECKING(ARG_sev, ARG_stream_fragment) \
  ODICT_UTIL_SEMICOLON_SAFE \
  ( \
    ::odict::log::Logger const * const ODICT_LOG_W_CHK_logger = get_logger(); \
    if (ODICT_LOG_W_CHK_logger && ODICT_LOG_W_CHK_logger->should_log(ARG_sev, get_log_component())) \
    { \
      ODICT_LOG_WITHOUT_CHECKING(ARG_sev, ARG_stream_fragment); \
    } \
  )

/**
 * ODICT_LOG_WITH_CHECKING() minus the Logger::should_log() filter: the message is built and handed to
 * Logger::do_log() unconditionally, unless `get_logger()` is null.  For callers that have done the check already.
 *
 * @param ARG_sev
 *        log::Sev.
 * @param ARG_stream_fragment
 *        See ODICT_LOG_WARNING().
 */
#define ODICT_LOG_WITHOUT_CHECKING(ARG_sev, ARG_stream_fragment) \
  ODICT_UTIL_SEMICOLON_SAFE \
  ( \
    ::odict::log::Logger* const ODICT_LOG_WO_CHK_logger = get_logger(); \
    if (!ODICT_LOG_WO_CHK_logger) \
    { \
      break; \
    } \
    /* else */ \
    constexpr ::odict::util::String_view ODICT_LOG_WO_CHK_file \
      = ::odict::util::get_last_path_segment(::odict::util::String_view(__FILE__, sizeof(__FILE__) - 1)); \
    ::odict::log::Msg_metadata ODICT_LOG_WO_CHK_metadata; \
    ODICT_LOG_WO_CHK_metadata.m_msg_component = get_log_component(); \
    ODICT_LOG_WO_CHK_metadata.m_msg_sev = ARG_sev; \
    ODICT_LOG_WO_CHK_metadata.m_msg_src_file = ODICT_LOG_WO_CHK_file; \
    ODICT_LOG_WO_CHK_metadata.m_msg_src_line = __LINE__; \
    ODICT_LOG_WO_CHK_metadata.m_msg_src_function \
      = ::odict::util::String_view(__FUNCTION__, sizeof(__FUNCTION__) - 1); \
    ODICT_LOG_WO_CHK_metadata.m_called_when = ::std::chrono::system_clock::now(); \
    ::odict::log::Logger::set_thread_info_in_msg_metadata(&ODICT_LOG_WO_CHK_metadata); \
    ::odict::util::String_ostream ODICT_LOG_WO_CHK_os; \
    ODICT_LOG_WO_CHK_os.os() << ARG_stream_fragment << ::std::flush; \
    ODICT_LOG_WO_CHK_logger->do_log(&ODICT_LOG_WO_CHK_metadata, ODICT_LOG_WO_CHK_os.str()); \
  )

namespace odict::log
{

// Types.

/**
 * Identifies the part of a program a log message comes from: a value of some `enum class` (whose underlying type
 * must be #enum_raw_t), remembered as the `enum` type's identity plus the value as an integer.  Several `enum`
 * types may coexist in one program; odict's own is odict::Odict_log_component.  Config maps each Component to a
 * name and, optionally, a verbosity of its own.
 *
 * A default-constructed Component is empty: "no particular component".
 */
class Component
{
public:
  // Types.

  /// Required underlying type of any payload `enum`.
  using enum_raw_t = unsigned int;

  // Constructors/destructor.

  /// Constructs an empty Component.
  Component();

  /**
   * Constructs a Component holding the given `enum` value.  Implicit, so a payload can be passed wherever a
   * Component is expected.
   *
   * @tparam Payload
   *         `enum class` type with underlying type #enum_raw_t.
   * @param payload
   *        The value.
   */
  template<typename Payload>
  Component(Payload payload);

  // Methods.

  /**
   * Whether `*this` holds no payload.
   *
   * @return See above.
   */
  bool empty() const;

  /**
   * The payload as the given `enum` type.  Undefined behavior if empty() or `Payload` is the wrong type.
   *
   * @tparam Payload
   *         The payload type.
   * @return See above.
   */
  template<typename Payload>
  Payload payload() const;

  /**
   * `typeid` of the payload type.  Undefined behavior if empty().
   *
   * @return See above.
   */
  const std::type_info& payload_type() const;

  /**
   * payload_type() as a key usable in associative containers.
   *
   * @return See above.
   */
  std::type_index payload_type_index() const;

  /**
   * The payload as an integer.  Undefined behavior if empty().
   *
   * @return See above.
   */
  enum_raw_t payload_enum_raw_value() const;

private:
  // Data.

  /// `&typeid(Payload)`; null if and only if empty().
  std::type_info const * m_payload_type_or_null;

  /// The payload as an integer; meaningless if empty().
  enum_raw_t m_payload_enum_raw_value;
}; // class Component

/**
 * Everything known about a message at its call site, other than the text itself.  The `ODICT_LOG_...()` macros
 * fill one in and pass it to Logger::do_log(); only Logger implementations need to read it.
 */
struct Msg_metadata
{
  // Types.

  /// Type of #m_called_when.  Wall clock time, so that it can be printed as a date.
  using Time_stamp = std::chrono::system_clock::time_point;

  // Data.

  /// Component, from the Log_context or ODICT_LOG_SET_CONTEXT().
  Component m_msg_component;

  /// Severity, from the macro used.
  Sev m_msg_sev;

  /// Source file name, directories stripped.  Points to static storage.
  util::String_view m_msg_src_file;

  /// Source line.
  unsigned int m_msg_src_line;

  /// Function name (`__FUNCTION__`).  Points to static storage.
  util::String_view m_msg_src_function;

  /// When the message was logged.
  Time_stamp m_called_when;

  /// Nickname of the logging thread (see Logger::this_thread_set_logged_nickname()); empty if it has none.
  std::string m_call_thread_nickname;

  /// ID of the logging thread, if #m_call_thread_nickname is empty; otherwise a default-constructed ID.
  util::Thread_id m_call_thread_id;
}; // struct Msg_metadata

/**
 * The interface through which odict logs, implemented by the user (or see Simple_ostream_logger) and passed by
 * pointer to each logging object, such as a dict::Ordered_map, at construction.
 *
 * should_log() is the filter, asked before a message is even built; do_log() then writes the built message,
 * synchronously.  A typical should_log() just asks a Config.
 *
 * ### Thread safety ###
 * Both methods may be called concurrently from any threads; an implementation must cope.
 */
class Logger :
  private boost::noncopyable
{
public:
  // Constructors/destructor.

  /// Destructor.
  virtual ~Logger() = default;

  // Methods.

  /**
   * Whether a message of the given severity and component should be logged.
   *
   * @param sev
   *        Severity.
   * @param component
   *        Component; may be empty.
   * @return See above.
   */
  virtual bool should_log(Sev sev, const Component& component) const = 0;

  /**
   * Writes a message, without consulting should_log().  Neither argument may be accessed after it returns.
   *
   * @param metadata
   *        See Msg_metadata.
   * @param msg
   *        The message text, not empty, without trailing newline.
   */
  virtual void do_log(Msg_metadata* metadata, util::String_view msg) = 0;

  /**
   * Gives the calling thread a nickname, which its log messages then show in place of the thread ID; or, with
   * an empty nickname, takes it away.
   *
   * @param thread_nickname
   *        The nickname; or empty.
   * @param logger_ptr
   *        If not null, an INFO message about the change is logged through it.
   */
  static void this_thread_set_logged_nickname(util::String_view thread_nickname = util::String_view(),
                                              Logger* logger_ptr = nullptr);

  /**
   * Fills in the `m_call_thread_*` members of `*msg_metadata` for the calling thread.
   *
   * @param msg_metadata
   *        Not null.
   */
  static void set_thread_info_in_msg_metadata(Msg_metadata* msg_metadata);

private:
  // Data.

  /// Each thread's nickname; null for none.
  static boost::thread_specific_ptr<std::string> s_this_thread_nickname_ptr;
}; // class Logger

/**
 * Holder of a `Logger*` and a Component, meant to be a base class: a class deriving from it gets get_logger() and
 * get_log_component(), so the `ODICT_LOG_...()` macros work unadorned inside its methods.  dict::Ordered_map is
 * one such class.
 *
 * ### Thread safety ###
 * Concurrent `const` access is fine; anything else needs external locking.
 */
class Log_context
{
public:
  // Constructors/destructor.

  /**
   * Stores the Logger and an empty Component.
   *
   * @param logger
   *        Logger; null for none.
   */
  explicit Log_context(Logger* logger = nullptr);

  /**
   * Stores the Logger and a Component holding the given payload.
   *
   * @tparam Component_payload
   *         See Component.
   * @param logger
   *        Logger; null for none.
   * @param component_payload
   *        Payload of the Component.
   */
  template<typename Component_payload>
  explicit Log_context(Logger* logger, Component_payload component_payload);

  /**
   * Copies the Logger pointer and the Component.
   *
   * @param src
   *        Source.
   */
  explicit Log_context(const Log_context& src);

  /**
   * Takes the Logger pointer and the Component, leaving `src` as if default-constructed.
   *
   * @param src
   *        Source.
   */
  Log_context(Log_context&& src);

  // Methods.

  /**
   * Copies the Logger pointer and the Component.
   *
   * @param src
   *        Source.
   * @return `*this`.
   */
  Log_context& operator=(const Log_context& src);

  /**
   * Takes the Logger pointer and the Component, leaving `src` as if default-constructed.
   *
   * @param src
   *        Source.
   * @return `*this`.
   */
  Log_context& operator=(Log_context&& src);

  /**
   * Exchanges contents with `other`.
   *
   * @param other
   *        The other object.
   */
  void swap(Log_context& other);

  /**
   * The Logger; possibly null.
   *
   * @return See above.
   */
  Logger* get_logger() const;

  /**
   * The Component.
   *
   * @return See above.
   */
  const Component& get_log_component() const;

private:
  // Data.

  /// See get_logger().
  Logger* m_logger;

  /// See get_log_component().
  Component m_component;
}; // class Log_context

// Template implementations.

template<typename Payload>
Component::Component(Payload payload) :
  m_payload_type_or_null(&(typeid(Payload))),
  m_payload_enum_raw_value(static_cast<enum_raw_t>(payload))
{
  static_assert(std::is_enum_v<Payload>, "Component payload must be an enum.");
  static_assert(std::is_same_v<std::underlying_type_t<Payload>, enum_raw_t>,
                "Component payload enum must have enum_raw_t as its underlying type.");
}

template<typename Payload>
Payload Component::payload() const
{
  return static_cast<Payload>(m_payload_enum_raw_value);
}

template<typename Component_payload>
Log_context::Log_context(Logger* logger, Component_payload component_payload) :
  m_logger(logger),
  m_component(component_payload)
{
  // Nothing.
}

} // namespace odict::log
