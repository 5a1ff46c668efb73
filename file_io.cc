// Copyright (C) 2002 Graydon Hoare <graydon@pobox.com>
//
// This program is made available under the GNU GPL version 2.0 or
// greater. See the accompanying file COPYING for details.
//
// This program is distributed WITHOUT ANY WARRANTY; without even the
// implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR
// PURPOSE.

#include "base.hh"
#include <iostream>
#include <fstream>
#include <sstream>

#include "file_io.hh"
#include "sanity.hh"
#include "platform.hh"

using std::cin;
using std::ifstream;
using std::ios_base;
using std::istream;
using std::ostringstream;
using std::string;
using std::vector;

void
require_path_is_directory(string const & path,
                          i18n_format const & message_if_nonexistent,
                          i18n_format const & message_if_file)
{
  switch (get_path_status(path))
    {
    case path::nonexistent:
      N(false, message_if_nonexistent);
      break;
    case path::file:
      N(false, message_if_file);
      break;
    case path::directory:
      return;
    }
}

bool
path_exists(string const & p)
{
  return get_path_status(p) != path::nonexistent;
}

bool
directory_exists(string const & p)
{
  return get_path_status(p) == path::directory;
}

bool
file_exists(string const & p)
{
  return get_path_status(p) == path::file;
}

string
dirname_of(string const & path)
{
  string p(path);
  while (p.size() > 1 && p[p.size() - 1] == '/')
    p.erase(p.size() - 1);
  string::size_type slash = p.rfind('/');
  if (slash == string::npos)
    return ".";
  if (slash == 0)
    return "/";
  return p.substr(0, slash);
}

string
join_path(string const & dir, string const & leaf)
{
  if (dir.empty())
    return leaf;
  if (dir[dir.size() - 1] == '/')
    return dir + leaf;
  return dir + "/" + leaf;
}

void
mkdir_p(string const & p)
{
  switch (get_path_status(p))
    {
    case path::directory:
      return;
    case path::file:
      E(false, F("could not create directory '%s': it is a file") % p);
      break;
    case path::nonexistent:
      string const parent = dirname_of(p);
      if (parent != p && parent != ".")
        mkdir_p(parent);
      do_mkdir(p);
      break;
    }
}

void
delete_file(string const & p)
{
  E(file_exists(p), F("file to delete '%s' does not exist") % p);
  do_remove(p);
}

namespace
{
  struct fill_name_vec : public dirent_consumer
  {
    fill_name_vec(vector<string> & v) : v(v) { v.clear(); }
    virtual void consume(char const * s)
    { v.push_back(string(s)); }

  private:
    vector<string> & v;
  };

  struct file_deleter : public dirent_consumer
  {
    file_deleter(string const & p) : parent(p) {}
    virtual void consume(char const * f)
    { do_remove(join_path(parent, f)); }

  private:
    string const & parent;
  };
}

void
delete_dir_recursive(string const & p)
{
  E(directory_exists(p),
    F("directory to delete, '%s', does not exist") % p);

  // files (and anything else that isn't a directory) are deleted as they
  // are encountered; subdirectories afterward.
  vector<string> subdirs;
  fill_name_vec subdir_fill(subdirs);
  file_deleter delete_files(p);

  do_read_directory(p, delete_files, subdir_fill, delete_files);
  for (vector<string>::const_iterator i = subdirs.begin();
       i != subdirs.end(); i++)
    delete_dir_recursive(join_path(p, *i));
  do_remove(p);
}

static void
read_stream(istream & in, string const & name, data & dat)
{
  ostringstream buf;
  buf << in.rdbuf();
  E(!in.bad(), F("error reading %s") % name);
  dat = data(buf.str());
}

void
read_data(string const & p, data & dat)
{
  E(file_exists(p), F("file %s does not exist or is not a regular file") % p);

  ifstream file(p.c_str(), ios_base::in | ios_base::binary);
  E(file, F("cannot open file %s for reading") % p);
  // an empty file makes operator<<(streambuf*) set failbit on the
  // destination; that is not an error.
  if (file.peek() == ifstream::traits_type::eof())
    {
      E(!file.bad(), F("error reading %s") % p);
      dat = data();
      return;
    }
  read_stream(file, p, dat);
}

void
read_directory(string const & path,
               vector<string> & files,
               vector<string> & dirs)
{
  vector<string> special_files;
  fill_name_vec ff(files), df(dirs), sf(special_files);
  do_read_directory(path, ff, df, sf);
  E(special_files.empty(), F("cannot handle special files in dir '%s'") % path);
}

// This function can only be called once per run.
void
read_data_stdin(data & dat)
{
  static bool have_consumed_stdin = false;
  N(!have_consumed_stdin, F("Cannot read standard input multiple times"));
  have_consumed_stdin = true;
  if (cin.peek() == istream::traits_type::eof())
    {
      dat = data();
      return;
    }
  read_stream(cin, "standard input", dat);
}

void
read_data_for_command_line(string const & path, data & dat)
{
  if (path == "-")
    read_data_stdin(dat);
  else
    {
      N(file_exists(path), F("file '%s' does not exist") % path);
      read_data(path, dat);
    }
}

void
write_data(string const & p,
           data const & dat,
           string const & tmpdir)
{
  E(!directory_exists(p),
    F("file '%s' cannot be overwritten as data; it is a directory") % p);

  write_data_worker(p, dat(), tmpdir, false);
}

#ifdef BUILD_UNIT_TESTS
#include "unit_tests.hh"

UNIT_TEST(file_io, dirname_of)
{
  UNIT_TEST_CHECK(dirname_of("a/b/c") == "a/b");
  UNIT_TEST_CHECK(dirname_of("a/b/c/") == "a/b");
  UNIT_TEST_CHECK(dirname_of("c") == ".");
  UNIT_TEST_CHECK(dirname_of("/c") == "/");
  UNIT_TEST_CHECK(join_path("a/b", "c") == "a/b/c");
  UNIT_TEST_CHECK(join_path("a/b/", "c") == "a/b/c");
}

UNIT_TEST(file_io, write_read_and_replace)
{
  string dir = unit_test::make_scratch_dir();
  string f = join_path(dir, "x.xml");

  write_data(f, data("one\r\ntwo"), dir);
  data got;
  read_data(f, got);
  UNIT_TEST_CHECK(got() == "one\r\ntwo");

  write_data(f, data(""), dir);
  read_data(f, got);
  UNIT_TEST_CHECK(got().empty());

  // only the target remains; the temp file was renamed into place
  vector<string> files, dirs;
  read_directory(dir, files, dirs);
  UNIT_TEST_CHECK(files.size() == 1);
  UNIT_TEST_CHECK(dirs.empty());

  delete_file(f);
  UNIT_TEST_CHECK(!path_exists(f));
  UNIT_TEST_CHECK_THROW(read_data(f, got), informative_failure);

  delete_dir_recursive(dir);
}

UNIT_TEST(file_io, mkdir_p)
{
  string dir = unit_test::make_scratch_dir();
  string deep = join_path(join_path(dir, "a"), "b/c");
  mkdir_p(deep);
  UNIT_TEST_CHECK(directory_exists(deep));
  // idempotent
  mkdir_p(deep);

  string f = join_path(dir, "plain");
  write_data(f, data("x"), dir);
  UNIT_TEST_CHECK_THROW(mkdir_p(f), informative_failure);
  UNIT_TEST_CHECK_THROW(mkdir_p(join_path(f, "sub")), informative_failure);

  delete_dir_recursive(dir);
  UNIT_TEST_CHECK(!path_exists(dir));
}

UNIT_TEST(file_io, missing_directory)
{
  string dir = unit_test::make_scratch_dir();
  vector<string> files, dirs;
  UNIT_TEST_CHECK_THROW(read_directory(join_path(dir, "nope"), files, dirs),
                        informative_failure);
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
