// Copyright (C) 2026 flexarc contributors
//
// This program is made available under the GNU GPL version 2.0 or
// greater. See the accompanying file COPYING for details.
//
// This program is distributed WITHOUT ANY WARRANTY; without even the
// implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR
// PURPOSE.

#include "base.hh"
#include "vector.hh"

#include "archive.hh"
#include "archive_check.hh"
#include "sanity.hh"
#include "ui.hh"

using std::make_pair;
using std::string;
using std::vector;

// the approach here is to rebuild the snapshot of every artifact, one
// date at a time, and sort the dates by what happened.  a failure on one
// date doesn't stop the others from being checked.

void
check_archive(archive const & arc, check_results & out)
{
  out.good.clear();
  out.bad.clear();
  out.orphaned.clear();

  vector<artifact> all;
  arc.list(all);

  for (vector<artifact>::const_iterator i = all.begin();
       i != all.end(); ++i)
    {
      data contents;
      try
        {
          if (arc.restore(i->date, contents))
            out.good.push_back(i->date);
          else
            out.orphaned.push_back(i->date);
        }
      catch (informative_failure & e)
        {
          L(FL("checking %s: %s") % i->name % e.what());
          out.bad.push_back(make_pair(i->date, string(e.what())));
        }
    }
}

void
report_check(check_results const & results)
{
  for (vector< std::pair<date_t, string> >::const_iterator
         i = results.bad.begin(); i != results.bad.end(); ++i)
    P(F("snapshot for %s cannot be restored: %s") % i->first % i->second);

  for (vector<date_t>::const_iterator i = results.orphaned.begin();
       i != results.orphaned.end(); ++i)
    P(F("delta for %s has no base") % *i);

  if (!results.orphaned.empty())
    W(F("%d orphaned deltas") % results.orphaned.size());

  size_t total = results.good.size() + results.bad.size()
    + results.orphaned.size();
  P(F("check complete: %d artifacts; %d restorable; %d damaged; %d orphaned")
    % total % results.good.size() % results.bad.size()
    % results.orphaned.size());

  if (results.serious())
    E(false, F("serious problems detected"));
  else if (!results.orphaned.empty())
    P(F("minor problems detected"));
  else
    P(F("archive is good"));
}

#ifdef BUILD_UNIT_TESTS
#include "file_io.hh"
#include "unit_tests.hh"

UNIT_TEST(archive_check, sorts_dates)
{
  string dir = unit_test::make_scratch_dir();
  write_data(join_path(dir, "delta_20260101.patch"),
             data("@@ -1 +1 @@\n-<a/>\n+<b/>\n"), dir);
  write_data(join_path(dir, "base_20260102.xml"),
             data("<r>\n<a/>\n</r>\n"), dir);
  write_data(join_path(dir, "delta_20260103.patch"),
             data("@@ -2 +2 @@\n-<a/>\n+<b/>\n"), dir);
  write_data(join_path(dir, "delta_20260104.patch"),
             data("@@ -2 +2 @@\n-<a/>\n+<c/>\n"), dir);

  archive arc(dir);
  check_results r;
  check_archive(arc, r);

  UNIT_TEST_REQUIRE(r.orphaned.size() == 1);
  UNIT_TEST_CHECK(r.orphaned[0] == date_t::from_string("2026-01-01"));
  UNIT_TEST_REQUIRE(r.good.size() == 2);
  UNIT_TEST_CHECK(r.good[0] == date_t::from_string("2026-01-02"));
  UNIT_TEST_CHECK(r.good[1] == date_t::from_string("2026-01-03"));
  // the last delta expects the line the one before it replaced
  UNIT_TEST_REQUIRE(r.bad.size() == 1);
  UNIT_TEST_CHECK(r.bad[0].first == date_t::from_string("2026-01-04"));
  UNIT_TEST_CHECK(r.serious());
  UNIT_TEST_CHECK_THROW(report_check(r), informative_failure);

  delete_dir_recursive(dir);
}

UNIT_TEST(archive_check, clean_archive)
{
  string dir = unit_test::make_scratch_dir();
  archive arc(dir);
  arc.store(data("<r>\n<a/>\n</r>\n"), date_t::from_string("2026-01-01"));
  arc.store(data("<r>\n<a/>\n</r>\n"), date_t::from_string("2026-01-02"));

  check_results r;
  check_archive(arc, r);
  UNIT_TEST_CHECK(r.good.size() == 2);
  UNIT_TEST_CHECK(!r.serious());
  UNIT_TEST_CHECK_NOT_THROW(report_check(r), informative_failure);

  delete_dir_recursive(dir);
}

#endif // BUILD_UNIT_TESTS

// Local Variables:
// mode: C++
// fill-column: 76
// c-file-style: "gnu"
// indent-tabs-mode: nil
// End:
// vim: et:sw=2:sts=2:ts=2:cino=>2s,{s,\:s,+s,t0,g0,^-2,e-2,n-2,p2s,(0,=s:
