// Copyright (C) 2002 Graydon Hoare <graydon@pobox.com>
//
// This program is made available under the GNU GPL version 2.0 or
// greater. See the accompanying file COPYING for details.
//
// This program is distributed WITHOUT ANY WARRANTY; without even the
// implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR
// PURPOSE.

#include "base.hh"
#include "sanity.hh"
#include "ui.hh"
#include "simplestring_xform.hh"

#include <iostream>
#include <fstream>
#include <set>
#include <cstring>
#include <typeinfo>

#include "current_exception.hh"

using std::clog;
using std::cout;
using std::endl;
using std::ios_base;
using std::ofstream;
using std::set;
using std::string;

struct user_interface ui;

struct user_interface::impl
{
  set<string> issued_warnings;
};

// user_interface has both constructor/destructor and initialize/
// deinitialize because there's only one of these objects, it's
// global, and we don't want global constructors/destructors doing
// any real work.  see flexarc.cc for how this is handled.

user_interface::user_interface() : prog_name("?"), imp(0) {}

user_interface::~user_interface()
{}

void
user_interface::initialize()
{
  imp = new user_interface::impl;

  cout.exceptions(ios_base::badbit);
  clog.unsetf(ios_base::unitbuf);
}

void
user_interface::deinitialize()
{
  I(imp);
  delete imp;
  imp = 0;
}

void
user_interface::warn(string const & warning)
{
  I(imp);
  if (imp->issued_warnings.find(warning) == imp->issued_warnings.end())
    {
      string message;
      prefix_lines_with(_("warning: "), warning, message);
      inform(message);
    }
  imp->issued_warnings.insert(warning);
}

void
user_interface::warn(format_base const & fmt)
{
  warn(fmt.str());
}

// this message should be kept consistent with unix/main.cc's
// bug_report_message (it is not exactly the same)
void
user_interface::fatal(string const & fatal)
{
  inform(F("fatal: %s\n"
           "this is almost certainly a bug in %s.\n"
           "please send this error message, the output of '%s --version',\n"
           "and a description of what you were doing to %s.")
         % fatal % PACKAGE_NAME % prog_name % PACKAGE_BUGREPORT);
  global_sanity.dump_buffer();
}

void
user_interface::fatal(format_base const & fmt)
{
  fatal(fmt.str());
}

// Report what we can about a fatal exception (caught in the outermost catch
// handlers) which is from the std::exception hierarchy.
void
user_interface::fatal_exception(std::exception const & ex)
{
  using std::strcmp;
  using std::strncmp;
  char const * ex_name = typeid(ex).name();
  char const * ex_dem  = demangle_typename(ex_name);
  char const * ex_what = ex.what();

  if (ex_dem == 0)
    ex_dem = ex_name;

  if (!strncmp(ex_dem, "class ", 6))
    ex_dem += 6;

  // only print what() if it says more than the type name does
  if (ex_what == 0 || ex_what[0] == 0
      || !strcmp(ex_what, ex_name)
      || !strcmp(ex_what, ex_dem))
    this->fatal(ex_dem);
  else
    this->fatal(i18n_format("%s: %s") % ex_dem % ex_what);
}

// As above, for an exception of unknown type.
void
user_interface::fatal_exception()
{
  std::type_info *ex_type = get_current_exception_type();
  if (ex_type)
    {
      char const * ex_name = ex_type->name();
      char const * ex_dem  = demangle_typename(ex_name);
      if (ex_dem == 0)
        ex_dem = ex_name;
      this->fatal(ex_dem);
    }
  else
    this->fatal("exception of unknown type");
}

string
user_interface::output_prefix()
{
  if (prog_name.empty())
    return "?: ";
  return prog_name + ": ";
}

static inline string
sanitize(string const & line)
{
  // control characters other than newline would garble the terminal
  string tmp;
  tmp.reserve(line.size());
  for (size_t i = 0; i < line.size(); ++i)
    {
      if ((line[i] == '\n')
          || (static_cast<unsigned char>(line[i]) >= static_cast<unsigned char>(0x20)
              && line[i] != static_cast<char>(0x7F)))
        tmp += line[i];
      else
        tmp += ' ';
    }
  return tmp;
}

void
user_interface::redirect_log_to(string const & filename)
{
  static ofstream filestr;
  if (filestr.is_open())
    filestr.close();
  filestr.open(filename.c_str(), ofstream::out | ofstream::app);
  E(filestr.is_open(), F("failed to open log file '%s'") % filename);
  clog.rdbuf(filestr.rdbuf());
}

void
user_interface::inform(string const & line)
{
  string prefixed;
  string trimmed(line);
  while (!trimmed.empty() && trimmed[trimmed.size() - 1] == '\n')
    trimmed.erase(trimmed.size() - 1);
  prefix_lines_with(output_prefix(), trimmed, prefixed);
  clog << sanitize(prefixed) << endl; // flushes
}

void
user_interface::inform(format_base const & fmt)
{
  inform(fmt.str());
}

// Local Variables:
// mode: C++
// fill-column: 76
// c-file-style: "gnu"
// indent-tabs-mode: nil
// End:
// vim: et:sw=2:sts=2:ts=2:cino=>2s,{s,\:s,+s,t0,g0,^-2,e-2,n-2,p2s,(0,=s:
