#ifndef __ARCHIVE_CHECK_HH__
#define __ARCHIVE_CHECK_HH__

// Copyright (C) 2026 flexarc contributors
//
// This program is made available under the GNU GPL version 2.0 or
// greater. See the accompanying file COPYING for details.
//
// This program is distributed WITHOUT ANY WARRANTY; without even the
// implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR
// PURPOSE.

#include <utility>
#include "vector.hh"

#include "dates.hh"

class archive;

struct check_results
{
  // dates whose snapshot restored
  std::vector<date_t> good;
  // dates whose snapshot could not be rebuilt, with the reason
  std::vector< std::pair<date_t, std::string> > bad;
  // deltas with no base on or before them; expected after pruning
  std::vector<date_t> orphaned;

  bool serious() const { return !bad.empty(); }
};

// tries to restore the snapshot of every artifact in ARC
void check_archive(archive const & arc, check_results & out);

// prints the findings; throws if there are serious problems
void report_check(check_results const & results);

// Local Variables:
// mode: C++
// fill-column: 76
// c-file-style: "gnu"
// indent-tabs-mode: nil
// End:
// vim: et:sw=2:sts=2:ts=2:cino=>2s,{s,\:s,+s,t0,g0,^-2,e-2,n-2,p2s,(0,=s:

#endif // __ARCHIVE_CHECK_HH__
