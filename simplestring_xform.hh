#ifndef __SIMPLESTRING_XFORM_HH__
#define __SIMPLESTRING_XFORM_HH__

// Copyright (C) 2002 Graydon Hoare <graydon@pobox.com>
//
// This program is made available under the GNU GPL version 2.0 or
// greater. See the accompanying file COPYING for details.
//
// This program is distributed WITHOUT ANY WARRANTY; without even the
// implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR
// PURPOSE.

#include <set>
#include "vector.hh"

// Split message text on '\n', dropping the terminators.  Used for
// formatting diagnostics, not for snapshot content.
void split_into_lines(std::string const & in,
                      std::vector<std::string> & out);

// Split snapshot text into lines, each keeping its '\n'.  The final
// element lacks one iff the text does not end in a newline.  '\r' is
// ordinary content.  join_text_lines(split_into_text_lines(x)) == x.
void split_into_text_lines(std::string const & in,
                           std::vector<std::string> & out);

void join_text_lines(std::vector<std::string> const & in,
                     std::string & out);

void prefix_lines_with(std::string const & prefix,
                       std::string const & lines,
                       std::string & out);

// split on single spaces; "a  b" gives "a", "", "b"
void split_into_words(std::string const & in,
                      std::vector<std::string> & out);

std::string join_words(std::set<std::string> const & in,
                       std::string const & sep = " ");

// Local Variables:
// mode: C++
// fill-column: 76
// c-file-style: "gnu"
// indent-tabs-mode: nil
// End:
// vim: et:sw=2:sts=2:ts=2:cino=>2s,{s,\:s,+s,t0,g0,^-2,e-2,n-2,p2s,(0,=s:

#endif
