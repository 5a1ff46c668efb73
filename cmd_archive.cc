// Copyright (C) 2026 flexarc contributors
//
// This program is made available under the GNU GPL version 2.0 or
// greater. See the accompanying file COPYING for details.
//
// This program is distributed WITHOUT ANY WARRANTY; without even the
// implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR
// PURPOSE.

#include "base.hh"
#include <iostream>
#include <iomanip>

#include "app_state.hh"
#include "archive.hh"
#include "archive_check.hh"
#include "cmd.hh"
#include "file_io.hh"
#include "i18n.h"
#include "ui.hh"

using std::cout;
using std::setw;
using std::string;
using std::vector;

// the commands that read and write the archive named by --dir

static string
require_archive_dir(app_state & app)
{
  string dir = app.archive_dir();
  require_path_is_directory(dir,
                            F("archive directory '%s' does not exist") % dir,
                            F("archive directory '%s' is a file") % dir);
  return dir;
}

CMD(archive, "archive", "", N_("FILE"),
    N_("Stores a report snapshot in the archive"),
    N_("Reads the report from FILE, or from standard input if FILE is '-', "
       "and stores it as the snapshot for --date (default today).  "
       "A snapshot already stored for that day is replaced; snapshots "
       "for later days keep their contents.  "
       "The archive directory is created if it does not exist."))
{
  if (args.size() != 1)
    throw usage(execid);

  data text;
  read_data_for_command_line(idx(args, 0), text);

  string dir = app.archive_dir();
  if (!directory_exists(dir))
    {
      L(FL("creating archive directory '%s'") % dir);
      mkdir_p(dir);
    }

  date_t when = app.archive_date();
  archive arc(dir, app.get_archive_options());
  arc.store(text, when);
  P(F("stored snapshot for %s") % when);
}

CMD(restore, "restore", "cat", "",
    N_("Prints the snapshot stored for a day"),
    N_("Rebuilds the snapshot for --date (default today) from the newest "
       "base on or before that day and the deltas after it, and writes "
       "it to standard output, or to the file named by --output."))
{
  if (!args.empty())
    throw usage(execid);

  string dir = require_archive_dir(app);
  date_t when = app.archive_date();
  archive arc(dir, app.get_archive_options());

  data text;
  N(arc.restore(when, text),
    F("no snapshot stored for %s") % when);

  if (app.opts.output_given)
    write_data(app.opts.output, text, dirname_of(app.opts.output));
  else
    {
      cout.write(text().data(), text().size());
      cout.flush();
    }
}

CMD(list, "list", "", "",
    N_("Lists the files in the archive"),
    N_("Prints one line for each base and delta, oldest first: "
       "its date, its kind, its size in bytes, and its file name."))
{
  if (!args.empty())
    throw usage(execid);

  string dir = require_archive_dir(app);
  archive arc(dir, app.get_archive_options());

  vector<artifact> all;
  arc.list(all);
  for (vector<artifact>::const_iterator i = all.begin();
       i != all.end(); ++i)
    cout << i->date << "  "
         << (i->is_base() ? "base " : "delta") << "  "
         << setw(10) << i->size << "  "
         << i->name << '\n';
}

CMD(check, "check", "", "",
    N_("Verifies that every snapshot can be restored"),
    N_("Rebuilds the snapshot for every day in the archive and reports "
       "the days that cannot be rebuilt.  Deltas left without a base "
       "by pruning are reported but are not an error."))
{
  if (!args.empty())
    throw usage(execid);

  string dir = require_archive_dir(app);
  archive arc(dir, app.get_archive_options());

  check_results results;
  check_archive(arc, results);
  report_check(results);
}

#ifdef BUILD_UNIT_TESTS
#include "unit_tests.hh"

namespace {
  args_vector
  one_arg(string const & a)
  {
    args_vector out;
    out.push_back(a);
    return out;
  }
}

UNIT_TEST(cmd_archive, archive_and_restore)
{
  string dir = unit_test::make_scratch_dir();
  string report = join_path(dir, "report.xml");
  string restored = join_path(dir, "restored.xml");

  app_state app;
  app.opts.dir = join_path(dir, "archive");
  app.opts.dir_given = true;
  app.opts.date = date_t::from_string("2026-01-05");
  app.opts.date_given = true;
  // these one-line changes are too large to keep as deltas
  app.opts.keep_bases = true;

  write_data(report, data("<r>\n<a/>\n</r>\n"), dir);
  commands::process(app, "archive", one_arg(report));
  UNIT_TEST_CHECK(directory_exists(app.opts.dir));

  app.opts.date = date_t::from_string("2026-01-06");
  write_data(report, data("<r>\n<b/>\n</r>\n"), dir);
  commands::process(app, "archive", one_arg(report));

  app.opts.output = restored;
  app.opts.output_given = true;

  data text;
  app.opts.date = date_t::from_string("2026-01-05");
  commands::process(app, "restore", args_vector());
  read_data(restored, text);
  UNIT_TEST_CHECK(text() == "<r>\n<a/>\n</r>\n");

  app.opts.date = date_t::from_string("2026-01-07");
  commands::process(app, "restore", args_vector());
  read_data(restored, text);
  UNIT_TEST_CHECK(text() == "<r>\n<b/>\n</r>\n");

  app.opts.date = date_t::from_string("2026-01-04");
  UNIT_TEST_CHECK_THROW(commands::process(app, "restore", args_vector()),
                        informative_failure);

  UNIT_TEST_CHECK_NOT_THROW(commands::process(app, "check", args_vector()),
                            informative_failure);

  delete_dir_recursive(dir);
}

UNIT_TEST(cmd_archive, bad_invocations)
{
  string dir = unit_test::make_scratch_dir();

  app_state app;
  app.opts.dir = join_path(dir, "missing");
  app.opts.dir_given = true;

  UNIT_TEST_CHECK_THROW(commands::process(app, "restore", args_vector()),
                        informative_failure);
  UNIT_TEST_CHECK_THROW(commands::process(app, "list", args_vector()),
                        informative_failure);
  UNIT_TEST_CHECK_THROW(commands::process(app, "archive", args_vector()),
                        usage);
  UNIT_TEST_CHECK_THROW(commands::process(app, "restore", one_arg("x")),
                        usage);
  UNIT_TEST_CHECK_THROW(commands::process(app, "archive",
                                          one_arg(join_path(dir, "nope"))),
                        informative_failure);
  // nothing was archived, so nothing was created
  UNIT_TEST_CHECK(!path_exists(app.opts.dir));

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
