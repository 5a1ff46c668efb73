#ifndef __UI_HH__
#define __UI_HH__

// Copyright (C) 2002 Graydon Hoare <graydon@pobox.com>
//
// This program is made available under the GNU GPL version 2.0 or
// greater. See the accompanying file COPYING for details.
//
// This program is distributed WITHOUT ANY WARRANTY; without even the
// implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR
// PURPOSE.

// the global user_interface object 'ui' owns clog, so no writing to it
// directly!  snapshot text restored for the user goes to cout (or a file)
// and never through here.

#include <exception>

class format_base;

struct user_interface
{
public:
  user_interface();
  ~user_interface();
  void initialize();
  void deinitialize();
  void warn(std::string const & warning);
  void warn(format_base const & fmt);
  void fatal(std::string const & fatal);
  void fatal(format_base const & fmt);
  void inform(std::string const & line);
  void inform(format_base const & fmt);
  void fatal_exception(std::exception const & ex);
  void fatal_exception();
  void redirect_log_to(std::string const & filename);

  std::string output_prefix();
  std::string prog_name;

private:
  struct impl;
  impl * imp;
};

extern struct user_interface ui;

// Local Variables:
// mode: C++
// fill-column: 76
// c-file-style: "gnu"
// indent-tabs-mode: nil
// End:
// vim: et:sw=2:sts=2:ts=2:cino=>2s,{s,\:s,+s,t0,g0,^-2,e-2,n-2,p2s,(0,=s:

#endif // __UI_HH__
