// Copyright (C) 2002 Graydon Hoare <graydon@pobox.com>
//
// This program is made available under the GNU GPL version 2.0 or
// greater. See the accompanying file COPYING for details.
//
// This program is distributed WITHOUT ANY WARRANTY; without even the
// implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR
// PURPOSE.

#include "base.hh"
#include "app_state.hh"
#include "constants.hh"
#include "file_io.hh"
#include "platform.hh"

using std::string;

app_state::app_state()
{}

app_state::~app_state()
{}

string
app_state::archive_dir() const
{
  if (opts.dir_given)
    return opts.dir;
  return join_path(get_default_confdir(), constants::default_archive_name);
}

date_t
app_state::archive_date() const
{
  if (opts.date_given)
    return opts.date;
  return date_t::now();
}

archive_options
app_state::get_archive_options() const
{
  archive_options out;
  out.prune_bases = !opts.keep_bases;
  return out;
}

#ifdef BUILD_UNIT_TESTS
#include "unit_tests.hh"

UNIT_TEST(app_state, option_defaults)
{
  app_state app;
  UNIT_TEST_CHECK(app.get_archive_options().prune_bases);
  UNIT_TEST_CHECK(app.archive_date().valid());

  app.opts.dir = "/srv/flex";
  app.opts.dir_given = true;
  app.opts.keep_bases = true;
  app.opts.date = date_t::from_string("2026-01-05");
  app.opts.date_given = true;
  UNIT_TEST_CHECK(app.archive_dir() == "/srv/flex");
  UNIT_TEST_CHECK(!app.get_archive_options().prune_bases);
  UNIT_TEST_CHECK(app.archive_date() == date_t::from_string("2026-01-05"));
}

#endif // BUILD_UNIT_TESTS

// Local Variables:
// mode: C++
// fill-column: 76
// c-file-style: "gnu"
// indent-tabs-mode: nil
// End:
// vim: et:sw=2:sts=2:ts=2:cino=>2s,{s,\:s,+s,t0,g0,^-2,e-2,n-2,p2s,(0,=s:
