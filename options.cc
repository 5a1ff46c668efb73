
#include "base.hh"
#include <cstring>

#include "i18n.h"
#include "options.hh"
#include "sanity.hh"

using std::string;

using option::bad_arg_internal;

template<typename T>
bool has_arg() { return true; }
template<>
bool has_arg<bool>() { return false; }

// gettext("") is the catalog header, not the empty string
static char const *
safe_gettext(char const * msgid)
{
  if (std::strlen(msgid) == 0)
    return msgid;
  return _(msgid);
}

namespace {
  // attaches a member setter or resetter to one options object
  struct bound_setter
  {
    options * obj;
    void (options::*fun)(std::string);
    bound_setter(options * o, void (options::*f)(std::string))
      : obj(o), fun(f)
    {}
    void operator()(std::string arg)
    {
      (obj->*fun)(arg);
    }
  };

  struct bound_resetter
  {
    options * obj;
    void (options::*fun)();
    bound_resetter(options * o, void (options::*f)())
      : obj(o), fun(f)
    {}
    void operator()()
    {
      (obj->*fun)();
    }
  };
}

options::options()
{
# define OPT(name, optstring, type, default_, description)      \
  name = type ( default_ );                                     \
  name ## _given = false;

# include "options_list.hh"

# undef OPT
}

option::concrete_option_set
options::all_options()
{
  option::concrete_option_set out;

# define OPT(name, optstring, type, default_, description)              \
  out.options.insert(option::concrete_option                            \
                     (optstring, safe_gettext(description),             \
                      has_arg<type >(),                                 \
                      bound_setter(this, &options::set_ ## name),       \
                      bound_resetter(this, &options::reset_ ## name)));

# include "options_list.hh"

# undef OPT

  return out;
}

# define OPT(name, optstring, type, default_, description)      \
  void options::reset_ ## name ()                               \
  {                                                             \
    name = type ( default_ );                                   \
    name ## _given = false;                                     \
  }                                                             \
  void options::set_ ## name (std::string arg)                  \
  {                                                             \
    name ## _given = true;                                      \
    real_set_ ## name (arg);                                    \
  }                                                             \
  void options::real_set_ ## name (std::string arg)

#define option_bodies
# include "options_list.hh"
#undef option_bodies

# undef OPT

#ifdef BUILD_UNIT_TESTS
#include "unit_tests.hh"

UNIT_TEST(options, from_command_line)
{
  options opts;
  option::concrete_option_set os = opts.all_options();

  char const * cmdline[] = {"flexarc", "--dir", "/srv/flex",
                            "--date=2026-01-05", "--keep-bases",
                            "archive", "-o", "out.xml", "-"};
  os.from_command_line(9, cmdline);

  UNIT_TEST_CHECK(opts.dir == "/srv/flex");
  UNIT_TEST_CHECK(opts.dir_given);
  UNIT_TEST_CHECK(opts.date == date_t::from_string("20260105"));
  UNIT_TEST_CHECK(opts.keep_bases);
  UNIT_TEST_CHECK(opts.output == "out.xml");
  UNIT_TEST_CHECK(!opts.help);
  UNIT_TEST_REQUIRE(opts.args.size() == 2);
  UNIT_TEST_CHECK(opts.args[0] == "archive");
  UNIT_TEST_CHECK(opts.args[1] == "-");

  os.reset();
  UNIT_TEST_CHECK(!opts.keep_bases);
  UNIT_TEST_CHECK(!opts.dir_given);
  UNIT_TEST_CHECK(!opts.date.valid());
  UNIT_TEST_CHECK(opts.args.empty());
}

UNIT_TEST(options, bad_arguments)
{
  options opts;
  option::concrete_option_set os = opts.all_options();

  {
    char const * cmdline[] = {"flexarc", "--date", "2026-02-29"};
    UNIT_TEST_CHECK_THROW(os.from_command_line(3, cmdline), option::bad_arg);
  }
  {
    char const * cmdline[] = {"flexarc", "--dir="};
    UNIT_TEST_CHECK_THROW(os.from_command_line(2, cmdline), option::bad_arg);
  }
  {
    char const * cmdline[] = {"flexarc", "--keep-bases=yes"};
    UNIT_TEST_CHECK_THROW(os.from_command_line(2, cmdline),
                          option::extra_arg);
  }
  {
    char const * cmdline[] = {"flexarc", "--db", "x"};
    UNIT_TEST_CHECK_THROW(os.from_command_line(3, cmdline),
                          option::unknown_option);
  }
}

#endif // BUILD_UNIT_TESTS

// Local Variables:
// mode: C++
// fill-column: 76
// c-file-style: "gnu"
// indent-tabs-mode: nil
// End:
// vim: et:sw=2:sts=2:ts=2:cino=>2s,{s,\:s,+s,t0,g0,^-2,e-2,n-2,p2s,(0,=s:
