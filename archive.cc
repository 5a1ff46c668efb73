// Copyright (C) 2026 flexarc contributors
//
// This program is made available under the GNU GPL version 2.0 or
// greater. See the accompanying file COPYING for details.
//
// This program is distributed WITHOUT ANY WARRANTY; without even the
// implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR
// PURPOSE.

#include "base.hh"
#include <utility>
#include "vector.hh"

#include "archive.hh"
#include "constants.hh"
#include "diff_patch.hh"
#include "file_io.hh"
#include "patch_document.hh"
#include "sanity.hh"
#include "simplestring_xform.hh"

using std::make_pair;
using std::map;
using std::pair;
using std::string;
using std::vector;

typedef map<date_t, artifact>::const_iterator index_iter;

string
artifact_name(artifact::kind_t kind, date_t const & when)
{
  I(when.valid());
  if (kind == artifact::base_file)
    return constants::base_prefix + when.as_iso_8601_basic()
      + constants::base_suffix;
  else
    return constants::delta_prefix + when.as_iso_8601_basic()
      + constants::delta_suffix;
}

static bool
match_affixes(string const & name,
              string const & prefix, string const & suffix,
              string & middle)
{
  if (name.size() != prefix.size() + constants::artifact_date_len
      + suffix.size())
    return false;
  if (name.compare(0, prefix.size(), prefix) != 0)
    return false;
  if (name.compare(name.size() - suffix.size(), suffix.size(), suffix) != 0)
    return false;
  middle = name.substr(prefix.size(), constants::artifact_date_len);
  return middle.find_first_not_of("0123456789") == string::npos;
}

bool
parse_artifact_name(string const & name,
                    artifact::kind_t & kind,
                    date_t & when)
{
  string middle;
  if (match_affixes(name, constants::base_prefix, constants::base_suffix,
                    middle))
    kind = artifact::base_file;
  else if (match_affixes(name, constants::delta_prefix,
                         constants::delta_suffix, middle))
    kind = artifact::delta_file;
  else
    return false;
  return date_t::parse(middle, when);
}

archive::archive(string const & dir, archive_options const & opts)
  : dir(dir), opts(opts)
{
  load_index();
}

void
archive::load_index()
{
  vector<string> files, dirs;
  try
    {
      E(directory_exists(dir),
        F("archive directory '%s' does not exist") % dir);
      read_directory(dir, files, dirs);
    }
  catch (informative_failure & e)
    {
      throw archive_unavailable(e.what());
    }

  index.clear();
  for (vector<string>::const_iterator i = files.begin();
       i != files.end(); ++i)
    {
      artifact a;
      if (!parse_artifact_name(*i, a.kind, a.date))
        {
          L(FL("ignoring '%s' in archive '%s'") % *i % dir);
          continue;
        }
      a.name = *i;
      try
        {
          a.size = get_file_size(path_of(a));
        }
      catch (informative_failure & e)
        {
          throw archive_unavailable(e.what());
        }

      map<date_t, artifact>::iterator j = index.find(a.date);
      if (j == index.end())
        {
          index.insert(make_pair(a.date, a));
          continue;
        }

      // left behind by an interrupted store; the full copy is the one to
      // trust.
      artifact const & b = a.is_base() ? a : j->second;
      artifact const & d = a.is_base() ? j->second : a;
      W(F("both '%s' and '%s' exist in '%s'; using '%s'")
        % b.name % d.name % dir % b.name);
      if (a.is_base())
        j->second = a;
    }

  L(FL("archive '%s': %d artifacts") % dir % index.size());
}

string
archive::path_of(artifact const & a) const
{
  return join_path(dir, a.name);
}

void
archive::read_artifact(artifact const & a, data & out) const
{
  try
    {
      read_data(path_of(a), out);
    }
  catch (informative_failure & e)
    {
      throw archive_unavailable(e.what());
    }
}

bool
archive::find_prior_base(date_t const & on_or_before, artifact & out) const
{
  index_iter i = index.upper_bound(on_or_before);
  while (i != index.begin())
    {
      --i;
      if (i->second.is_base())
        {
          out = i->second;
          return true;
        }
    }
  return false;
}

void
archive::deltas_between(date_t const & after,
                        date_t const & through,
                        vector<artifact> & out) const
{
  out.clear();
  for (index_iter i = index.upper_bound(after);
       i != index.end() && i->first <= through; ++i)
    if (!i->second.is_base())
      out.push_back(i->second);
}

bool
archive::latest(artifact & out) const
{
  if (index.empty())
    return false;
  out = index.rbegin()->second;
  return true;
}

void
archive::list(vector<artifact> & out) const
{
  out.clear();
  for (index_iter i = index.begin(); i != index.end(); ++i)
    out.push_back(i->second);
}

bool
archive::restore(date_t const & when, data & out) const
{
  artifact b;
  if (!find_prior_base(when, b))
    {
      L(FL("no base on or before %s in '%s'") % when % dir);
      return false;
    }

  data base_text;
  read_artifact(b, base_text);
  vector<string> lines;
  split_into_text_lines(base_text(), lines);

  vector<artifact> deltas;
  deltas_between(b.date, when, deltas);
  L(FL("restoring %s from %s and %d deltas") % when % b.name % deltas.size());

  for (vector<artifact>::const_iterator i = deltas.begin();
       i != deltas.end(); ++i)
    {
      data patch_text;
      read_artifact(*i, patch_text);

      vector<string> patched;
      try
        {
          patch_document doc;
          parse_patch(delta(patch_text()), doc);
          apply_patch(lines, doc, patched);
        }
      catch (malformed_hunk_header & e)
        {
          throw malformed_hunk_header((F("%s: %s") % i->name % e.what()).str());
        }
      catch (patch_conflict & e)
        {
          throw patch_conflict((F("%s: %s") % i->name % e.what()).str());
        }
      lines.swap(patched);
    }

  string tmp;
  join_text_lines(lines, tmp);
  out = data(tmp);
  return true;
}

void
archive::write_artifact(artifact::kind_t kind, date_t const & when,
                        data const & contents)
{
  artifact a;
  a.date = when;
  a.kind = kind;
  a.name = artifact_name(kind, when);
  // the temporary file goes in the archive directory itself, so the
  // final rename never crosses filesystems
  write_data(path_of(a), contents, dir);
  a.size = contents().size();
  index[when] = a;
  L(FL("wrote %s (%d bytes)") % a.name % a.size);
}

void
archive::remove(date_t const & when)
{
  // both kinds, in case an interrupted store left a pair behind
  bool removed = false;
  artifact::kind_t const kinds[] = { artifact::base_file,
                                     artifact::delta_file };
  for (size_t k = 0; k < sizeof(kinds) / sizeof(kinds[0]); ++k)
    {
      string const p = join_path(dir, artifact_name(kinds[k], when));
      if (file_exists(p))
        {
          delete_file(p);
          removed = true;
        }
    }
  index.erase(when);
  if (removed)
    L(FL("removed artifacts for %s") % when);
}

void
archive::prune_bases_before(date_t const & when)
{
  vector<date_t> doomed;
  for (index_iter i = index.begin();
       i != index.end() && i->first < when; ++i)
    if (i->second.is_base())
      doomed.push_back(i->first);

  for (vector<date_t>::const_iterator i = doomed.begin();
       i != doomed.end(); ++i)
    remove(*i);

  if (!doomed.empty())
    L(FL("pruned %d bases older than %s") % doomed.size() % when);
}

namespace
{
  // one artifact store() is about to write
  struct pending_artifact
  {
    date_t date;
    artifact::kind_t kind;
    data contents;
  };
}

// decides whether TEXT goes in as a delta against PREVIOUS or as a new
// base.  without a previous snapshot it is always a base.
static void
encode_snapshot(retention_policy const & retention,
                data const & text, date_t const & when,
                bool have_previous, data const & previous,
                string const & previous_name,
                pending_artifact & out)
{
  out.date = when;
  out.kind = artifact::base_file;
  out.contents = text;
  if (!have_previous)
    return;

  delta d;
  make_delta(previous, text, previous_name,
             artifact_name(artifact::delta_file, when), d);

  if (!retention.should_promote_to_base(previous().size(), d().size()))
    {
      out.kind = artifact::delta_file;
      out.contents = data(d());
    }
}

void
archive::store(data const & text, date_t const & when)
{
  I(when.valid());
  L(FL("storing %d bytes for %s in '%s'") % text().size() % when % dir);

  // every snapshot this needs is rebuilt before anything is deleted, so
  // a damaged chain throws with the directory still as it was.

  bool have_previous = false;
  data previous;
  string previous_name;
  index_iter p = index.lower_bound(when);
  if (p != index.begin())
    {
      --p;
      have_previous = restore(p->first, previous);
      previous_name = p->second.name;
    }

  // snapshots for later days are deltas against what is about to change
  // underneath them; they are written again after it.  a delta with no
  // base is dropped: a base written before it would give it the wrong
  // starting text.
  vector< pair<date_t, data> > tail;
  for (index_iter i = index.upper_bound(when); i != index.end(); ++i)
    {
      data content;
      if (restore(i->first, content))
        tail.push_back(make_pair(i->first, content));
      else
        W(F("snapshot for %s has no base and is dropped") % i->first);
    }

  vector<pending_artifact> pending;
  pending_artifact next;
  encode_snapshot(opts.retention, text, when,
                  have_previous, previous, previous_name, next);
  pending.push_back(next);

  data const * prior = &text;
  for (vector< pair<date_t, data> >::const_iterator i = tail.begin();
       i != tail.end(); ++i)
    {
      pending_artifact const & last = pending.back();
      encode_snapshot(opts.retention, i->second, i->first,
                      true, *prior, artifact_name(last.kind, last.date),
                      next);
      pending.push_back(next);
      prior = &i->second;
    }

  vector<date_t> doomed;
  for (index_iter i = index.lower_bound(when); i != index.end(); ++i)
    doomed.push_back(i->first);
  for (vector<date_t>::const_iterator i = doomed.begin();
       i != doomed.end(); ++i)
    remove(*i);

  for (vector<pending_artifact>::const_iterator i = pending.begin();
       i != pending.end(); ++i)
    {
      write_artifact(i->kind, i->date, i->contents);
      if (i->kind == artifact::base_file && opts.prune_bases)
        prune_bases_before(i->date);
    }
}

#ifdef BUILD_UNIT_TESTS
#include <boost/lexical_cast.hpp>
#include "unit_tests.hh"

using boost::lexical_cast;

static date_t
jan(int day)
{
  string d = lexical_cast<string>(day);
  if (d.size() < 2)
    d = "0" + d;
  return date_t::from_string("2026-01-" + d);
}

// a report with N trade lines, stamped with DAY, each line tagged with TAG
static data
report(int day, int n, string const & tag = "Trade")
{
  string s = "<FlexQueryResponse queryName=\"daily\" type=\"AF\">\n"
    "<FlexStatements count=\"1\">\n"
    "<FlexStatement accountId=\"U1234567\" toDate=\"" + jan(day).as_iso_8601_basic()
    + "\">\n";
  for (int i = 0; i < n; ++i)
    s += "<" + tag + " tradeID=\"" + lexical_cast<string>(1000 + i)
      + "\" symbol=\"ABC\" quantity=\"10\"/>\n";
  s += "</FlexStatement>\n</FlexStatements>\n</FlexQueryResponse>\n";
  return data(s);
}

static vector<artifact>
listing(archive const & arc)
{
  vector<artifact> out;
  arc.list(out);
  return out;
}

UNIT_TEST(archive, artifact_names)
{
  UNIT_TEST_CHECK(artifact_name(artifact::base_file, jan(29))
                  == "base_20260129.xml");
  UNIT_TEST_CHECK(artifact_name(artifact::delta_file, jan(30))
                  == "delta_20260130.patch");

  artifact::kind_t k;
  date_t d;
  UNIT_TEST_CHECK(parse_artifact_name("delta_20260130.patch", k, d));
  UNIT_TEST_CHECK(k == artifact::delta_file);
  UNIT_TEST_CHECK(d == jan(30));
  UNIT_TEST_CHECK(parse_artifact_name("base_20260129.xml", k, d));
  UNIT_TEST_CHECK(k == artifact::base_file);

  UNIT_TEST_CHECK(!parse_artifact_name("base_2026-01-29.xml", k, d));
  UNIT_TEST_CHECK(!parse_artifact_name("base_20260229.xml", k, d));
  UNIT_TEST_CHECK(!parse_artifact_name("base_20260129.xml.zip", k, d));
  UNIT_TEST_CHECK(!parse_artifact_name("fa1b2c3d.tmp", k, d));
  UNIT_TEST_CHECK(!parse_artifact_name("delta_20260130.xml", k, d));
}

UNIT_TEST(archive, two_day_scenario)
{
  string dir = unit_test::make_scratch_dir();
  {
    archive arc(dir);
    arc.store(data("<r><a/><b/></r>"), jan(29));
    UNIT_TEST_REQUIRE(listing(arc).size() == 1);
    UNIT_TEST_CHECK(listing(arc)[0].is_base());

    arc.store(data("<r><a/><b/><c/></r>"), jan(30));
    // the patch for a one-line file outweighs the file, so the new day
    // is a base and the old one is pruned
    vector<artifact> all = listing(arc);
    UNIT_TEST_REQUIRE(all.size() == 1);
    UNIT_TEST_CHECK(all[0].is_base());
    UNIT_TEST_CHECK(all[0].name == "base_20260130.xml");

    data out;
    UNIT_TEST_CHECK(arc.restore(jan(30), out));
    UNIT_TEST_CHECK(out() == "<r><a/><b/><c/></r>");
    UNIT_TEST_CHECK(!arc.restore(jan(1), out));
  }
  {
    // and the same from a fresh look at the directory
    archive arc(dir);
    data out;
    UNIT_TEST_CHECK(arc.restore(jan(30), out));
    UNIT_TEST_CHECK(out() == "<r><a/><b/><c/></r>");
    UNIT_TEST_CHECK(!arc.restore(jan(1), out));
  }
  delete_dir_recursive(dir);
}

UNIT_TEST(archive, small_change_is_delta)
{
  string dir = unit_test::make_scratch_dir();
  archive arc(dir);
  arc.store(report(29, 100), jan(29));
  arc.store(report(30, 101), jan(30));

  vector<artifact> all = listing(arc);
  UNIT_TEST_REQUIRE(all.size() == 2);
  UNIT_TEST_CHECK(all[0].is_base());
  UNIT_TEST_CHECK(all[0].name == "base_20260129.xml");
  UNIT_TEST_CHECK(!all[1].is_base());
  UNIT_TEST_CHECK(all[1].name == "delta_20260130.patch");
  UNIT_TEST_CHECK(all[1].size < all[0].size);

  data patch_text;
  arc.read_artifact(all[1], patch_text);
  string const headers("--- base_20260129.xml\n"
                       "+++ delta_20260130.patch\n");
  UNIT_TEST_CHECK(patch_text().compare(0, headers.size(), headers) == 0);

  data out;
  UNIT_TEST_CHECK(arc.restore(jan(30), out));
  UNIT_TEST_CHECK(out == report(30, 101));
  // a day with nothing of its own is the snapshot before it
  UNIT_TEST_CHECK(arc.restore(jan(31), out));
  UNIT_TEST_CHECK(out == report(30, 101));
  delete_dir_recursive(dir);
}

UNIT_TEST(archive, chain_with_pruning)
{
  string dir = unit_test::make_scratch_dir();
  archive arc(dir);
  for (int day = 1; day <= 4; ++day)
    arc.store(report(day, 100 + day), jan(day));
  // a different kind of report entirely forces a new base
  for (int day = 5; day <= 7; ++day)
    arc.store(report(day, 100 + day, "CashTransaction"), jan(day));

  vector<artifact> all = listing(arc);
  UNIT_TEST_REQUIRE(all.size() == 6);
  // the base for the first four days is gone; their deltas stay
  UNIT_TEST_CHECK(!all[0].is_base() && all[0].date == jan(2));
  UNIT_TEST_CHECK(all[3].is_base() && all[3].date == jan(5));
  UNIT_TEST_CHECK(!all[4].is_base() && !all[5].is_base());

  data out;
  for (int day = 1; day <= 4; ++day)
    UNIT_TEST_CHECK(!arc.restore(jan(day), out));
  for (int day = 5; day <= 7; ++day)
    {
      UNIT_TEST_CHECK(arc.restore(jan(day), out));
      UNIT_TEST_CHECK(out == report(day, 100 + day, "CashTransaction"));
    }
  delete_dir_recursive(dir);
}

UNIT_TEST(archive, chain_keeping_bases)
{
  string dir = unit_test::make_scratch_dir();
  archive_options opts;
  opts.prune_bases = false;
  archive arc(dir, opts);
  for (int day = 1; day <= 4; ++day)
    arc.store(report(day, 100 + day), jan(day));
  for (int day = 5; day <= 7; ++day)
    arc.store(report(day, 100 + day, "CashTransaction"), jan(day));

  UNIT_TEST_CHECK(listing(arc).size() == 7);

  data out;
  for (int day = 1; day <= 4; ++day)
    {
      UNIT_TEST_CHECK(arc.restore(jan(day), out));
      UNIT_TEST_CHECK(out == report(day, 100 + day));
    }
  for (int day = 5; day <= 7; ++day)
    {
      UNIT_TEST_CHECK(arc.restore(jan(day), out));
      UNIT_TEST_CHECK(out == report(day, 100 + day, "CashTransaction"));
    }
  delete_dir_recursive(dir);
}

UNIT_TEST(archive, rearchive_same_day)
{
  string dir = unit_test::make_scratch_dir();
  archive arc(dir);
  arc.store(report(1, 50), jan(1));
  arc.store(report(2, 51), jan(2));
  arc.store(report(2, 51), jan(2));

  vector<artifact> all = listing(arc);
  UNIT_TEST_CHECK(all.size() == 2);

  data out;
  UNIT_TEST_CHECK(arc.restore(jan(2), out));
  UNIT_TEST_CHECK(out == report(2, 51));

  // a later fetch for the same day replaces it
  arc.store(report(2, 52), jan(2));
  UNIT_TEST_CHECK(listing(arc).size() == 2);
  UNIT_TEST_CHECK(arc.restore(jan(2), out));
  UNIT_TEST_CHECK(out == report(2, 52));
  UNIT_TEST_CHECK(arc.restore(jan(1), out));
  UNIT_TEST_CHECK(out == report(1, 50));

  // and nothing else is left on disk
  vector<string> files, dirs;
  read_directory(dir, files, dirs);
  UNIT_TEST_CHECK(files.size() == 2);
  delete_dir_recursive(dir);
}

UNIT_TEST(archive, out_of_order)
{
  string dir = unit_test::make_scratch_dir();
  archive arc(dir);
  arc.store(report(1, 100), jan(1));
  arc.store(report(3, 102), jan(3));
  arc.store(report(2, 101), jan(2));

  data out;
  for (int day = 1; day <= 3; ++day)
    {
      UNIT_TEST_CHECK(arc.restore(jan(day), out));
      UNIT_TEST_CHECK(out == report(day, 99 + day));
    }

  // before everything else
  arc.store(report(10, 90), jan(10));
  arc.store(report(1, 99), date_t::from_string("2025-12-31"));
  UNIT_TEST_CHECK(arc.restore(date_t::from_string("2025-12-31"), out));
  UNIT_TEST_CHECK(out == report(1, 99));
  UNIT_TEST_CHECK(arc.restore(jan(1), out));
  UNIT_TEST_CHECK(out == report(1, 100));
  UNIT_TEST_CHECK(arc.restore(jan(2), out));
  UNIT_TEST_CHECK(out == report(2, 101));
  UNIT_TEST_CHECK(arc.restore(jan(10), out));
  UNIT_TEST_CHECK(out == report(10, 90));
  delete_dir_recursive(dir);
}

UNIT_TEST(archive, conflicting_delta)
{
  string dir = unit_test::make_scratch_dir();
  {
    archive arc(dir);
    arc.store(data("<r>\n<a/>\n</r>\n"), jan(1));
  }
  write_data(join_path(dir, "delta_20260102.patch"),
             data("--- base_20260101.xml\n"
                  "+++ delta_20260102.patch\n"
                  "@@ -2 +2 @@\n"
                  "-<x/>\n"
                  "+<b/>\n"),
             dir);
  archive arc(dir);
  data out;
  UNIT_TEST_CHECK_THROW(arc.restore(jan(2), out), patch_conflict);
  UNIT_TEST_CHECK(arc.restore(jan(1), out));
  UNIT_TEST_CHECK(out() == "<r>\n<a/>\n</r>\n");

  delete_file(join_path(dir, "delta_20260102.patch"));
  write_data(join_path(dir, "delta_20260103.patch"),
             data("@@ -2 +2 junk\n-<a/>\n+<b/>\n"), dir);
  archive arc2(dir);
  UNIT_TEST_CHECK_THROW(arc2.restore(jan(3), out), malformed_hunk_header);
  delete_dir_recursive(dir);
}

UNIT_TEST(archive, failed_store_keeps_history)
{
  string dir = unit_test::make_scratch_dir();
  archive_options opts;
  opts.prune_bases = false;
  {
    archive arc(dir, opts);
    arc.store(report(1, 100), jan(1));
    arc.store(report(2, 101), jan(2));
    arc.store(report(4, 100, "Order"), jan(4));
    arc.store(report(5, 100, "Order"), jan(5));
    vector<artifact> all = listing(arc);
    UNIT_TEST_REQUIRE(all.size() == 4);
    UNIT_TEST_REQUIRE(all[0].is_base() && !all[1].is_base());
    UNIT_TEST_REQUIRE(all[2].is_base() && !all[3].is_base());
  }

  // the snapshot before the new day can't be rebuilt
  write_data(join_path(dir, "delta_20260102.patch"),
             data("@@ -4 +4 @@\n-<nope/>\n+<yes/>\n"), dir);
  {
    archive arc(dir, opts);
    UNIT_TEST_CHECK_THROW(arc.store(report(3, 102), jan(3)), patch_conflict);
    UNIT_TEST_CHECK(listing(arc).size() == 4);
  }
  {
    archive arc(dir, opts);
    vector<artifact> all = listing(arc);
    UNIT_TEST_REQUIRE(all.size() == 4);
    UNIT_TEST_CHECK(all[2].name == "base_20260104.xml");
    UNIT_TEST_CHECK(all[3].name == "delta_20260105.patch");
    data out;
    UNIT_TEST_CHECK(arc.restore(jan(4), out));
    UNIT_TEST_CHECK(out == report(4, 100, "Order"));
    UNIT_TEST_CHECK(arc.restore(jan(5), out));
    UNIT_TEST_CHECK(out == report(5, 100, "Order"));
  }

  // a later snapshot can't be rebuilt
  delete_file(join_path(dir, "delta_20260102.patch"));
  write_data(join_path(dir, "delta_20260105.patch"),
             data("@@ -4 +4 @@\n-<nope/>\n+<yes/>\n"), dir);
  {
    archive arc(dir, opts);
    UNIT_TEST_CHECK_THROW(arc.store(report(3, 102), jan(3)), patch_conflict);
  }
  {
    archive arc(dir, opts);
    UNIT_TEST_CHECK(listing(arc).size() == 3);
    data out;
    // nothing was written for the third day
    UNIT_TEST_CHECK(arc.restore(jan(3), out));
    UNIT_TEST_CHECK(out == report(1, 100));
    UNIT_TEST_CHECK(arc.restore(jan(4), out));
    UNIT_TEST_CHECK(out == report(4, 100, "Order"));
  }
  delete_dir_recursive(dir);
}

UNIT_TEST(archive, orphans_after_date_are_dropped)
{
  string dir = unit_test::make_scratch_dir();
  archive arc(dir);
  arc.store(report(1, 100), jan(1));
  arc.store(report(2, 101), jan(2));
  arc.store(report(3, 100, "Order"), jan(3));
  // the first base is pruned and the delta after it has nothing to apply to
  vector<artifact> all = listing(arc);
  UNIT_TEST_REQUIRE(all.size() == 2);
  UNIT_TEST_CHECK(!all[0].is_base() && all[0].date == jan(2));
  UNIT_TEST_CHECK(all[1].is_base() && all[1].date == jan(3));

  // a new first day would become the base that delta is applied to
  arc.store(report(1, 100, "Order"), jan(1));
  all = listing(arc);
  UNIT_TEST_REQUIRE(all.size() == 2);
  UNIT_TEST_CHECK(all[0].is_base() && all[0].date == jan(1));
  UNIT_TEST_CHECK(!all[1].is_base() && all[1].date == jan(3));
  UNIT_TEST_CHECK(!file_exists(join_path(dir, "delta_20260102.patch")));

  data out;
  UNIT_TEST_CHECK(arc.restore(jan(2), out));
  UNIT_TEST_CHECK(out == report(1, 100, "Order"));
  UNIT_TEST_CHECK(arc.restore(jan(3), out));
  UNIT_TEST_CHECK(out == report(3, 100, "Order"));
  delete_dir_recursive(dir);
}

UNIT_TEST(archive, unavailable)
{
  string dir = unit_test::make_scratch_dir();
  UNIT_TEST_CHECK_THROW(archive missing(join_path(dir, "missing")),
                        archive_unavailable);

  string f = join_path(dir, "plain");
  write_data(f, data("x"), dir);
  UNIT_TEST_CHECK_THROW(archive not_a_dir(f), archive_unavailable);

  // an artifact that vanishes under us
  archive arc(dir);
  arc.store(data("<r/>\n"), jan(1));
  delete_file(join_path(dir, "base_20260101.xml"));
  data out;
  UNIT_TEST_CHECK_THROW(arc.restore(jan(1), out), archive_unavailable);
  delete_dir_recursive(dir);
}

UNIT_TEST(archive, crash_leftovers)
{
  string dir = unit_test::make_scratch_dir();
  write_data(join_path(dir, "base_20260105.xml"), data("<full/>\n"), dir);
  write_data(join_path(dir, "delta_20260105.patch"),
             data("@@ -1 +1 @@\n-<other/>\n+<full/>\n"), dir);
  write_data(join_path(dir, "fa1b2c3d.tmp"), data("<partial"), dir);
  write_data(join_path(dir, "notes.txt"), data("hello\n"), dir);

  archive arc(dir);
  vector<artifact> all = listing(arc);
  UNIT_TEST_REQUIRE(all.size() == 1);
  UNIT_TEST_CHECK(all[0].is_base());
  data out;
  UNIT_TEST_CHECK(arc.restore(jan(5), out));
  UNIT_TEST_CHECK(out() == "<full/>\n");

  // storing the day again clears out both files
  arc.store(data("<again/>\n"), jan(5));
  UNIT_TEST_CHECK(!path_exists(join_path(dir, "delta_20260105.patch")));
  UNIT_TEST_CHECK(arc.restore(jan(5), out));
  UNIT_TEST_CHECK(out() == "<again/>\n");
  delete_dir_recursive(dir);
}

UNIT_TEST(archive, empty_snapshot)
{
  string dir = unit_test::make_scratch_dir();
  archive arc(dir);
  arc.store(data(""), jan(1));
  arc.store(data(""), jan(2));
  data out(string("junk"));
  UNIT_TEST_CHECK(arc.restore(jan(2), out));
  UNIT_TEST_CHECK(out().empty());
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
