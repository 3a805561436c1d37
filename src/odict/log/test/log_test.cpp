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


#include "odict/log/log.hpp"
#include "odict/log/config.hpp"
#include "odict/log/simple_ostream_logger.hpp"
#include "odict/dict/ordered_map.hpp"
#include "odict/util/util.hpp"
#include "odict/test/test_logger.hpp"
#include <gtest/gtest.h>
#include <sstream>

namespace odict::log::test
{

namespace
{
using std::string;

/// Config with the odict components registered, as a user of the library would set it up.
void register_components(Config* config)
{
  config->register_components(S_ODICT_LOG_COMPONENT_NAME_MAP, "odict-");
}

bool contains(const string& haystack, util::String_view needle)
{
  return haystack.find(needle) != string::npos;
}

} // Anonymous namespace

// Yes... this is very cheesy... but this is a test, so I don't really care.
#define CTX util::ostream_op_string("Caller context [", ODICT_UTIL_WHERE_AM_I_STR(), "].")

TEST(Log_context, Interface)
{
  using std::swap; // ADL-swap.

  Config cfg;
  Simple_ostream_logger logger1{&cfg};
  Simple_ostream_logger logger2{&cfg};

  const auto comps_equal = [](const Component& c1, const Component& c2, const string& ctx)
  {
    if (c1.empty() && c2.empty())
    {
      return; // So equal then.
    }
    // Better both be not-empty.
    EXPECT_EQ(c1.empty(), c2.empty()) << ctx;
    EXPECT_EQ(c1.payload_type(), c2.payload_type()) << ctx;
    EXPECT_EQ(int(c1.payload_enum_raw_value()), int(c2.payload_enum_raw_value())) << ctx;
  };

  Log_context ctx1;
  EXPECT_TRUE(ctx1.get_log_component().empty());
  EXPECT_EQ(ctx1.get_logger(), nullptr);

  ctx1 = Log_context{&logger1, Odict_log_component::S_DICT};
  EXPECT_EQ(ctx1.get_logger(), &logger1);
  comps_equal(ctx1.get_log_component(), Odict_log_component::S_DICT, CTX);
  EXPECT_EQ(ctx1.get_log_component().payload<Odict_log_component>(), Odict_log_component::S_DICT);

  Log_context ctx2{&logger2, Odict_log_component::S_UTIL};
  Log_context ctx3{ctx2}; // Copy.
  EXPECT_EQ(ctx3.get_logger(), &logger2);
  comps_equal(ctx3.get_log_component(), ctx2.get_log_component(), CTX);

  swap(ctx1, ctx3);
  EXPECT_EQ(ctx1.get_logger(), &logger2);
  EXPECT_EQ(ctx3.get_logger(), &logger1);
  comps_equal(ctx3.get_log_component(), Odict_log_component::S_DICT, CTX);

  Log_context ctx4{std::move(ctx3)}; // Move: source becomes as-if default-cted.
  EXPECT_EQ(ctx4.get_logger(), &logger1);
  EXPECT_EQ(ctx3.get_logger(), nullptr);
  EXPECT_TRUE(ctx3.get_log_component().empty());
} // TEST(Log_context, Interface)

TEST(Sev, Stream_io)
{
  EXPECT_EQ(util::ostream_op_string(Sev::S_WARNING), "WARNING");
  EXPECT_EQ(util::ostream_op_string(Sev::S_DATA), "DATA");

  const auto parse = [](const string& str)
  {
    std::istringstream is(str);
    Sev sev;
    is >> sev;
    return sev;
  };

  EXPECT_EQ(parse("trace"), Sev::S_TRACE);
  EXPECT_EQ(parse("INFO"), Sev::S_INFO);
  EXPECT_EQ(parse("2"), Sev::S_ERROR);
  EXPECT_EQ(parse("bogus"), Sev::S_NONE);
  EXPECT_EQ(parse("99"), Sev::S_NONE);
}

TEST(Config, Verbosity)
{
  Config cfg; // Default: INFO.
  register_components(&cfg);

  const Component dict_comp(Odict_log_component::S_DICT);
  const Component util_comp(Odict_log_component::S_UTIL);

  EXPECT_TRUE(cfg.output_whether_should_log(Sev::S_INFO, dict_comp));
  EXPECT_FALSE(cfg.output_whether_should_log(Sev::S_DEBUG, dict_comp));
  EXPECT_TRUE(cfg.output_whether_should_log(Sev::S_WARNING, Component()));

  EXPECT_TRUE(cfg.configure_component_verbosity(Sev::S_TRACE, Odict_log_component::S_DICT));
  EXPECT_TRUE(cfg.output_whether_should_log(Sev::S_TRACE, dict_comp));
  EXPECT_FALSE(cfg.output_whether_should_log(Sev::S_DATA, dict_comp));
  EXPECT_FALSE(cfg.output_whether_should_log(Sev::S_DEBUG, util_comp));

  // Names are case-insensitive and carry the registered prefix.
  EXPECT_TRUE(cfg.configure_component_verbosity_by_name(Sev::S_ERROR, "odict-util"));
  EXPECT_FALSE(cfg.output_whether_should_log(Sev::S_WARNING, util_comp));
  EXPECT_FALSE(cfg.configure_component_verbosity_by_name(Sev::S_ERROR, "no-such-component"));

  // Reset drops the per-component settings.
  cfg.configure_default_verbosity(Sev::S_WARNING, true);
  EXPECT_FALSE(cfg.output_whether_should_log(Sev::S_TRACE, dict_comp));
  EXPECT_TRUE(cfg.output_whether_should_log(Sev::S_WARNING, util_comp));
  EXPECT_FALSE(cfg.output_whether_should_log(Sev::S_INFO, util_comp));

  // A thread-local override beats everything.
  *(Config::this_thread_verbosity_override()) = Sev::S_DATA;
  EXPECT_TRUE(cfg.output_whether_should_log(Sev::S_DATA, util_comp));
  *(Config::this_thread_verbosity_override()) = Sev::S_END_SENTINEL;
  EXPECT_FALSE(cfg.output_whether_should_log(Sev::S_DATA, util_comp));
} // TEST(Config, Verbosity)

TEST(Config, From_spec)
{
  Config cfg;
  register_components(&cfg);

  const Component dict_comp(Odict_log_component::S_DICT);
  const Component util_comp(Odict_log_component::S_UTIL);

  EXPECT_TRUE(cfg.configure_from_spec(" warning , odict-dict=TRACE,ODICT-UTIL = 1"));
  EXPECT_TRUE(cfg.output_whether_should_log(Sev::S_TRACE, dict_comp));
  EXPECT_FALSE(cfg.output_whether_should_log(Sev::S_ERROR, util_comp));
  EXPECT_TRUE(cfg.output_whether_should_log(Sev::S_FATAL, util_comp));
  EXPECT_TRUE(cfg.output_whether_should_log(Sev::S_WARNING, Component()));
  EXPECT_FALSE(cfg.output_whether_should_log(Sev::S_INFO, Component()));

  // Each of these fails as a whole; nothing above changes.
  for (const auto bad_spec : { "", "verbose", "info,", "info,odict-dict", "info,no-such-component=info",
                               "info,odict-dict=loud", "info x" })
  {
    EXPECT_FALSE(cfg.configure_from_spec(bad_spec)) << bad_spec;
  }
  EXPECT_TRUE(cfg.output_whether_should_log(Sev::S_TRACE, dict_comp));
  EXPECT_FALSE(cfg.output_whether_should_log(Sev::S_INFO, Component()));

  // NONE is allowed when spelled out.
  EXPECT_TRUE(cfg.configure_from_spec("none"));
  EXPECT_FALSE(cfg.output_whether_should_log(Sev::S_FATAL, Component()));
} // TEST(Config, From_spec)

TEST(Simple_ostream_logger, Output)
{
  Config cfg(Sev::S_TRACE);
  register_components(&cfg);
  cfg.m_use_human_friendly_time_stamps = false;
  std::ostringstream os;
  Simple_ostream_logger logger(&cfg, os, os);

  {
    ODICT_LOG_SET_CONTEXT(&logger, Odict_log_component::S_UTIL);
    ODICT_LOG_INFO("Hello [" << 42 << "].");
    ODICT_LOG_DATA("Too verbose; filtered out.");
  }

  const auto out1 = os.str();
  EXPECT_TRUE(contains(out1, "[info]: T")) << out1;
  EXPECT_TRUE(contains(out1, ": ODICT-UTIL: ")) << out1;
  EXPECT_TRUE(contains(out1, "log_test.cpp:")) << out1;
  EXPECT_TRUE(contains(out1, "Hello [42].\n")) << out1;
  EXPECT_FALSE(contains(out1, "filtered out")) << out1;

  // A thread nickname replaces the thread ID.
  Logger::this_thread_set_logged_nickname("tester");
  {
    ODICT_LOG_SET_CONTEXT(&logger, Odict_log_component::S_LOG);
    ODICT_LOG_WARNING("Named.");
  }
  Logger::this_thread_set_logged_nickname();
  EXPECT_TRUE(contains(os.str(), "[warn]: Ttester: ODICT-LOG: ")) << os.str();
} // TEST(Simple_ostream_logger, Output)

TEST(Test_logger, Dict_errors)
{
  std::ostringstream os;
  odict::test::Test_logger logger(&os, "warning,odict-dict=info");

  // Errors emitted by the containers are logged at INFO with the DICT component.
  dict::Ordered_map<string, int> map(&logger);
  Error_code err_code;
  map.remove("absent", &err_code);
  EXPECT_TRUE(err_code);
  const auto out = os.str();
  EXPECT_TRUE(contains(out, ": ODICT-DICT: ")) << out;
  EXPECT_TRUE(contains(out, "Error code emitted")) << out;

  // An invalid configuration is reported, and the default stays.
  std::ostringstream os2;
  odict::test::Test_logger logger2(&os2, "info,odict-nonsense=trace");
  EXPECT_TRUE(contains(os2.str(), "[warn]: ")) << os2.str();
  EXPECT_TRUE(logger2.should_log(Sev::S_INFO, Component(Odict_log_component::S_DICT)));
  EXPECT_FALSE(logger2.should_log(Sev::S_DEBUG, Component(Odict_log_component::S_DICT)));
} // TEST(Test_logger, Dict_errors)

} // namespace odict::log::test
