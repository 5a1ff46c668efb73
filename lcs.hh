#ifndef __LCS_HH__
#define __LCS_HH__

// Copyright (C) 2026 flexarc contributors
// Copyright (C) 2002 Graydon Hoare <graydon@pobox.com>
//
// This program is made available under the GNU GPL version 2.0 or
// greater. See the accompanying file COPYING for details.
//
// This program is distributed WITHOUT ANY WARRANTY; without even the
// implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR
// PURPOSE.

#include "vector.hh"

// computes a shortest edit script turning sequence A into sequence B.
// the sequences are interned lines (see interner.hh), so two elements
// are equal exactly when the lines they stand for are.
//
// edits come out ordered by position.  an edit e < 0 deletes A[-1 - e];
// an edit e > 0 inserts B[e - 1].  an empty script means A == B.

void
edit_script(std::vector<long>::const_iterator begin_a,
            std::vector<long>::const_iterator end_a,
            std::vector<long>::const_iterator begin_b,
            std::vector<long>::const_iterator end_b,
            std::vector<long> & edits_out);

// the elements common to A and B, in order, recovered from an edit
// script as produced above.
void
longest_common_subsequence(std::vector<long> const & a,
                           std::vector<long> const & edits,
                           std::vector<long> & lcs);

// Local Variables:
// mode: C++
// fill-column: 76
// c-file-style: "gnu"
// indent-tabs-mode: nil
// End:
// vim: et:sw=2:sts=2:ts=2:cino=>2s,{s,\:s,+s,t0,g0,^-2,e-2,n-2,p2s,(0,=s:

#endif // __LCS_HH__
