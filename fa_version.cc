// Copyright (C) 2004 Nathaniel Smith <njs@pobox.com>
//
// This program is made available under the GNU GPL version 2.0 or
// greater. See the accompanying file COPYING for details.
//
// This program is distributed WITHOUT ANY WARRANTY; without even the
// implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR
// PURPOSE.

// the version command, and the text that --version prints

#include "base.hh"
#include <iostream>
#include <sstream>

#include <boost/version.hpp>
#include <boost/config.hpp>

#include "app_state.hh"
#include "cmd.hh"
#include "i18n.h"
#include "platform.hh"
#include "fa_version.hh"
#include "sanity.hh"

using std::cout;
using std::ostringstream;
using std::string;

CMD(version, "version", "", "",
    N_("Shows the program version"),
    N_("With --debug, also shows the platform and the libraries "
       "the program was built with."))
{
  N(args.empty(),
    F("no arguments allowed"));

  string version;
  if (app.opts.debug)
    get_full_version(version);
  else
    get_version(version);
  cout << version << '\n';
}

void
get_version(string & out)
{
  out = PACKAGE_STRING;
}

void
print_version()
{
  string s;
  get_version(s);
  cout << s << '\n';
}

void
get_full_version(string & out)
{
  ostringstream oss;
  string s;
  get_version(s);
  oss << s << '\n';
  get_system_flavour(s);
  oss << F("Running on          : %s\n"
           "C++ compiler        : %s\n"
           "C++ standard library: %s\n"
           "Boost version       : %s")
    % s
    % BOOST_COMPILER
    % BOOST_STDLIB
    % BOOST_LIB_VERSION;
  out = oss.str();
}

#ifdef BUILD_UNIT_TESTS
#include "unit_tests.hh"

UNIT_TEST(fa_version, full_version)
{
  string short_version, full_version;
  get_version(short_version);
  get_full_version(full_version);
  UNIT_TEST_CHECK(short_version == PACKAGE_STRING);
  UNIT_TEST_CHECK(full_version.compare(0, short_version.size() + 1,
                                       short_version + "\n") == 0);
  UNIT_TEST_CHECK(full_version.find(BOOST_LIB_VERSION) != string::npos);
}

#endif // BUILD_UNIT_TESTS

// Local Variables:
// mode: C++
// fill-column: 76
// c-file-style: "gnu"
// indent-tabs-mode: nil
// End:
// vim: et:sw=2:sts=2:ts=2:cino=>2s,{s,\:s,+s,t0,g0,^-2,e-2,n-2,p2s,(0,=s:
