#ifndef __FLEXARC_SANITY_HH__
#define __FLEXARC_SANITY_HH__

// Copyright (C) 2002 Graydon Hoare <graydon@pobox.com>
//
// This program is made available under the GNU GPL version 2.0 or
// greater. See the accompanying file COPYING for details.
//
// This program is distributed WITHOUT ANY WARRANTY; without even the
// implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR
// PURPOSE.

#include "sanity.hh"

// the sanity object used by the program and the unit tester; it reports
// everything through the global ui object.
struct flexarc_sanity : public sanity
{
  flexarc_sanity();
  ~flexarc_sanity();
  void initialize(int, char **, char const *);

private:
  void inform_log(std::string const &msg);
  void inform_message(std::string const &msg);
  void inform_warning(std::string const &msg);
  void inform_error(std::string const &msg);
};

// Local Variables:
// mode: C++
// fill-column: 76
// c-file-style: "gnu"
// indent-tabs-mode: nil
// End:
// vim: et:sw=2:sts=2:ts=2:cino=>2s,{s,\:s,+s,t0,g0,^-2,e-2,n-2,p2s,(0,=s:

#endif
