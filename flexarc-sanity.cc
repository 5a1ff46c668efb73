// Copyright (C) 2002 Graydon Hoare <graydon@pobox.com>
//
// This program is made available under the GNU GPL version 2.0 or
// greater. See the accompanying file COPYING for details.
//
// This program is distributed WITHOUT ANY WARRANTY; without even the
// implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR
// PURPOSE.

#include "base.hh"
#include "flexarc-sanity.hh"
#include "ui.hh"

static flexarc_sanity real_sanity;
sanity & global_sanity = real_sanity;

flexarc_sanity::flexarc_sanity()
{}

flexarc_sanity::~flexarc_sanity()
{}

void
flexarc_sanity::initialize(int argc, char ** argv, char const * lc_all)
{
  this->sanity::initialize(argc, argv, lc_all);
  L(FL("%s version %s") % PACKAGE_NAME % PACKAGE_VERSION);
}

void
flexarc_sanity::inform_log(std::string const &msg)
{
  ui.inform(msg);
}

void
flexarc_sanity::inform_message(std::string const &msg)
{
  ui.inform(msg);
}

void
flexarc_sanity::inform_warning(std::string const &msg)
{
  ui.warn(msg);
}

void
flexarc_sanity::inform_error(std::string const &msg)
{
  ui.inform(msg);
}

// Local Variables:
// mode: C++
// fill-column: 76
// c-file-style: "gnu"
// indent-tabs-mode: nil
// End:
// vim: et:sw=2:sts=2:ts=2:cino=>2s,{s,\:s,+s,t0,g0,^-2,e-2,n-2,p2s,(0,=s:
