// Copyright (C) 2002 Graydon Hoare <graydon@pobox.com>
//
// This program is made available under the GNU GPL version 2.0 or
// greater. See the accompanying file COPYING for details.
//
// This program is distributed WITHOUT ANY WARRANTY; without even the
// implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR
// PURPOSE.

// aggregate constants.  use "char const foo[]" rather than std::string
// so that nothing here needs a static constructor.

#include "base.hh"
#include "constants.hh"

#include <boost/static_assert.hpp>

namespace constants
{
  char const base_prefix[] = "base_";
  char const base_suffix[] = ".xml";
  char const delta_prefix[] = "delta_";
  char const delta_suffix[] = ".patch";

  char const default_confdir_name[] = ".flexarc";
  char const default_archive_name[] = "flex_queries";

  char const no_newline_marker[] = "\\ No newline at end of file";

  BOOST_STATIC_ASSERT(small_base_max_delta_percent <= 100);
  BOOST_STATIC_ASSERT(large_base_max_delta_percent
                      <= small_base_max_delta_percent);
  BOOST_STATIC_ASSERT(log_line_sz < log_buffer_sz);
}

// Local Variables:
// mode: C++
// fill-column: 76
// c-file-style: "gnu"
// indent-tabs-mode: nil
// End:
// vim: et:sw=2:sts=2:ts=2:cino=>2s,{s,\:s,+s,t0,g0,^-2,e-2,n-2,p2s,(0,=s:
