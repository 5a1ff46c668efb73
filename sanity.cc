// Copyright (C) 2002 Graydon Hoare <graydon@pobox.com>
//
// This program is made available under the GNU GPL version 2.0 or
// greater. See the accompanying file COPYING for details.
//
// This program is distributed WITHOUT ANY WARRANTY; without even the
// implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR
// PURPOSE.

#include "base.hh"
#include <algorithm>
#include <iterator>
#include <fstream>
#include <sstream>
#include <locale>
#include "vector.hh"

#include <boost/format.hpp>
#include <boost/circular_buffer.hpp>

#include "constants.hh"
#include "platform.hh"
#include "sanity.hh"
#include "simplestring_xform.hh"

using std::exception;
using std::locale;
using std::logic_error;
using std::ofstream;
using std::ostream;
using std::ostream_iterator;
using std::ostringstream;
using std::runtime_error;
using std::string;
using std::vector;

using boost::format;

struct sanity::impl
{
  bool debug;
  bool quiet;
  boost::circular_buffer<char> logbuf;
  string filename;

  impl() :
    debug(false), quiet(false), logbuf(constants::log_buffer_sz)
  {}
};

// debugging / logging system

sanity::sanity() : imp(NULL)
{}

sanity::~sanity()
{
  delete imp;
}

void
sanity::initialize(int argc, char ** argv, char const * lc_all)
{
  // the unit tester may initialize more than once; keep the first buffer.
  if (!imp)
    imp = new impl;

  string system_flavour;
  get_system_flavour(system_flavour);
  L(FL("started up on %s") % system_flavour);

  ostringstream cmdline;
  for (int i = 0; i < argc; ++i)
    {
      if (i)
        cmdline << ", ";
      cmdline << '\'' << argv[i] << '\'';
    }
  L(FL("command line: %s") % cmdline.str());

  if (!lc_all)
    lc_all = "n/a";
  L(FL("set locale: LC_ALL=%s") % lc_all);
}

void
sanity::dump_buffer()
{
  I(imp);
  if (!imp->filename.empty())
    {
      ofstream out(imp->filename.c_str());
      if (out)
        {
          copy(imp->logbuf.begin(), imp->logbuf.end(),
               ostream_iterator<char>(out));
          inform_message((FL("wrote debugging log to %s\n"
                             "if reporting a bug, please include this file")
                          % imp->filename).str());
        }
      else
        inform_message((FL("failed to write debugging log to %s")
                        % imp->filename).str());
    }
  else
    inform_message("discarding debug log, because I have nowhere to write it\n"
                   "(maybe you want --debug or --dump?)");
}

void
sanity::set_debug()
{
  I(imp);
  imp->quiet = false;
  imp->debug = true;

  // replay whatever was logged before the flag was seen
  string buffered(imp->logbuf.begin(), imp->logbuf.end());
  vector<string> lines;
  split_into_lines(buffered, lines);
  for (vector<string>::const_iterator i = lines.begin(); i != lines.end(); ++i)
    inform_log(*i);
}

void
sanity::set_quiet()
{
  I(imp);
  imp->debug = false;
  imp->quiet = true;
}

void
sanity::set_dump_path(string const & path)
{
  I(imp);
  if (imp->filename.empty())
    {
      L(FL("setting dump path to %s") % path);
      imp->filename = path;
    }
}

string
sanity::do_format(format_base const & fmt, char const * file, int line)
{
  try
    {
      return fmt.str();
    }
  catch (exception & e)
    {
      inform_error((F("fatal: formatter failed on %s:%d: %s")
                    % file
                    % line
                    % e.what()).str());
      throw;
    }
}

// every message lands in the ring buffer, clipped to one log line and
// newline-terminated, whether or not it is shown.
void
sanity::append_to_buffer(string const & str)
{
  if (!imp)
    return;
  string clipped(str, 0, constants::log_line_sz);
  copy(clipped.begin(), clipped.end(), back_inserter(imp->logbuf));
  if (clipped.empty() || clipped[clipped.size() - 1] != '\n')
    imp->logbuf.push_back('\n');
}

void
sanity::log(plain_format const & fmt,
            char const * file, int line)
{
  string str = do_format(fmt, file, line);
  append_to_buffer(str);
  if (imp && imp->debug)
    inform_log(str);
}

void
sanity::progress(i18n_format const & i18nfmt,
                 char const * file, int line)
{
  string str = do_format(i18nfmt, file, line);
  append_to_buffer(str);
  if (!imp || !imp->quiet)
    inform_message(str);
}

void
sanity::warning(i18n_format const & i18nfmt,
                char const * file, int line)
{
  string str = do_format(i18nfmt, file, line);
  append_to_buffer("warning: " + str);
  inform_warning(str);
}

void
sanity::naughty_failure(char const * expr, i18n_format const & explain,
                        char const * file, int line)
{
  string message;
  if (!imp)
    throw logic_error("sanity::naughty_failure occured "
                      "before sanity::initialize");
  log(FL("%s:%d: usage constraint '%s' violated") % file % line % expr,
      file, line);
  prefix_lines_with(_("misuse: "), do_format(explain, file, line), message);
  throw informative_failure(message);
}

void
sanity::error_failure(char const * expr, i18n_format const & explain,
                      char const * file, int line)
{
  string message;
  if (!imp)
    throw logic_error("sanity::error_failure occured "
                      "before sanity::initialize");
  log(FL("%s:%d: detected error '%s' violated") % file % line % expr,
      file, line);
  prefix_lines_with(_("error: "), do_format(explain, file, line), message);
  throw informative_failure(message);
}

void
sanity::invariant_failure(char const * expr, char const * file, int line)
{
  char const * pattern = N_("%s:%d: invariant '%s' violated");
  if (imp)
    log(FL(pattern) % file % line % expr, file, line);
  throw logic_error((F(pattern) % file % line % expr).str());
}

void
sanity::index_failure(char const * vec_expr,
                      char const * idx_expr,
                      unsigned long sz,
                      unsigned long idx,
                      char const * file, int line)
{
  char const * pattern
    = N_("%s:%d: index '%s' = %d overflowed vector '%s' with size %d");
  if (imp)
    log(FL(pattern) % file % line % idx_expr % idx % vec_expr % sz,
        file, line);
  throw logic_error((F(pattern)
                     % file % line % idx_expr % idx % vec_expr % sz).str());
}

static locale const &
get_user_locale()
{
  // if LC_CTYPE names a locale the runtime does not know, the classic
  // locale has to do.
  static bool init = false;
  static locale user_locale;
  if (!init)
    {
      init = true;
      try
        {
          user_locale = locale("");
        }
      catch (runtime_error &)
        {
          user_locale = locale::classic();
        }
    }
  return user_locale;
}

struct
format_base::impl
{
  format fmt;
  ostringstream oss;

  impl(impl const & other) : fmt(other.fmt)
  {}

  impl(char const * pattern)
    : fmt(pattern)
  {}
  impl(string const & pattern)
    : fmt(pattern)
  {}
  impl(char const * pattern, locale const & loc)
    : fmt(pattern, loc)
  {}
  impl(string const & pattern, locale const & loc)
    : fmt(pattern, loc)
  {}
};

format_base::format_base(format_base const & other)
  : pimpl(other.pimpl ? new impl(*(other.pimpl)) : NULL)
{}

format_base::~format_base()
{
  delete pimpl;
}

format_base &
format_base::operator=(format_base const & other)
{
  if (&other != this)
    {
      impl * tmp = other.pimpl ? new impl(*(other.pimpl)) : NULL;
      delete pimpl;
      pimpl = tmp;
    }
  return *this;
}

format_base::format_base(char const * pattern, bool use_locale)
  : pimpl(use_locale ? new impl(pattern, get_user_locale())
                     : new impl(pattern))
{}

format_base::format_base(string const & pattern, bool use_locale)
  : pimpl(use_locale ? new impl(pattern, get_user_locale())
                     : new impl(pattern))
{}

ostream &
format_base::get_stream() const
{
  return pimpl->oss;
}

void
format_base::flush_stream() const
{
  pimpl->fmt % pimpl->oss.str();
  pimpl->oss.str(string());
}

string
format_base::str() const
{
  return pimpl->fmt.str();
}

ostream &
operator<<(ostream & os, format_base const & fmt)
{
  return os << fmt.str();
}

i18n_format F(const char * str)
{
  return i18n_format(gettext(str));
}

i18n_format FP(const char * str1, const char * strn, unsigned long count)
{
  return i18n_format(ngettext(str1, strn, count));
}

plain_format FL(const char * str)
{
  return plain_format(str);
}

// Local Variables:
// mode: C++
// fill-column: 76
// c-file-style: "gnu"
// indent-tabs-mode: nil
// End:
// vim: et:sw=2:sts=2:ts=2:cino=>2s,{s,\:s,+s,t0,g0,^-2,e-2,n-2,p2s,(0,=s:
