#ifndef __APP_STATE_HH__
#define __APP_STATE_HH__

// Copyright (C) 2002 Graydon Hoare <graydon@pobox.com>
//
// This program is made available under the GNU GPL version 2.0 or
// greater. See the accompanying file COPYING for details.
//
// This program is distributed WITHOUT ANY WARRANTY; without even the
// implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR
// PURPOSE.

#include "archive.hh"
#include "options.hh"

// everything a command needs to know about this run of the program:
// the parsed options, and what they mean for the archive.
class app_state
{
public:
  explicit app_state();
  ~app_state();

  options opts;

  // --dir, or the default archive under the configuration directory
  std::string archive_dir() const;
  // --date, or today
  date_t archive_date() const;
  archive_options get_archive_options() const;
};

// Local Variables:
// mode: C++
// fill-column: 76
// c-file-style: "gnu"
// indent-tabs-mode: nil
// End:
// vim: et:sw=2:sts=2:ts=2:cino=>2s,{s,\:s,+s,t0,g0,^-2,e-2,n-2,p2s,(0,=s:

#endif // __APP_STATE_HH__
