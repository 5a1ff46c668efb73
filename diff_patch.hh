#ifndef __DIFF_PATCH_HH__
#define __DIFF_PATCH_HH__

// Copyright (C) 2026 flexarc contributors
// Copyright (C) 2008 Stephen Leake <stephen_leake@stephe-leake.org>
// Copyright (C) 2002 Graydon Hoare <graydon@pobox.com>
//
// This program is made available under the GNU GPL version 2.0 or
// greater. See the accompanying file COPYING for details.
//
// This program is distributed WITHOUT ANY WARRANTY; without even the
// implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR
// PURPOSE.

#include "vector.hh"
#include "vocab.hh"
#include "patch_document.hh"

// stripped down, in-process versions of diff and patch, working on
// lines that keep their newline.  the diffs carry no context lines.

// a patch that does not fit the text it is applied to
class patch_conflict : public informative_failure
{
public:
  explicit patch_conflict(std::string const & s)
    : informative_failure(s) {}
};

// a minimal zero-context diff from OLD_LINES to NEW_LINES.  identical
// inputs give an empty document.
void make_patch(std::vector<std::string> const & old_lines,
                std::vector<std::string> const & new_lines,
                std::string const & from_name,
                std::string const & to_name,
                patch_document & out);

// the same on whole texts, producing patch text.  equal texts give an
// empty delta.
void make_delta(data const & older,
                data const & newer,
                std::string const & from_name,
                std::string const & to_name,
                delta & out);

// throws patch_conflict
void apply_patch(std::vector<std::string> const & lines,
                 patch_document const & patch,
                 std::vector<std::string> & out);

// throws malformed_hunk_header or patch_conflict
void apply_delta(data const & older,
                 delta const & del,
                 data & newer);

// Local Variables:
// mode: C++
// fill-column: 76
// c-file-style: "gnu"
// indent-tabs-mode: nil
// End:
// vim: et:sw=2:sts=2:ts=2:cino=>2s,{s,\:s,+s,t0,g0,^-2,e-2,n-2,p2s,(0,=s:

#endif // __DIFF_PATCH_HH__
