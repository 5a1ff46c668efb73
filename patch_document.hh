#ifndef __PATCH_DOCUMENT_HH__
#define __PATCH_DOCUMENT_HH__

// Copyright (C) 2026 flexarc contributors
//
// This program is made available under the GNU GPL version 2.0 or
// greater. See the accompanying file COPYING for details.
//
// This program is distributed WITHOUT ANY WARRANTY; without even the
// implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR
// PURPOSE.

#include "vector.hh"
#include "vocab.hh"
#include "sanity.hh"

// the in-memory form of a delta artifact.  on disk a patch document is a
// unified diff:
//
//   --- <from>
//   +++ <to>
//   @@ -<old_start>[,<old_count>] +<new_start>[,<new_count>] @@
//   -removed line
//   +inserted line
//   \ No newline at end of file
//
// the "\" marker follows a line whose text has no terminating newline.
// line kinds are resolved once, when the text is parsed; nothing
// downstream looks at the first character of a line.

// unparseable hunk header, or a hunk body that disagrees with its header
class malformed_hunk_header : public informative_failure
{
public:
  explicit malformed_hunk_header(std::string const & s)
    : informative_failure(s) {}
};

struct hunk_line
{
  enum kind_t { context, insert, remove };

  kind_t kind;
  // includes the '\n' terminator, unless the line had none
  std::string text;

  hunk_line(kind_t kind, std::string const & text)
    : kind(kind), text(text)
  {}
  bool operator==(hunk_line const & other) const
  {
    return kind == other.kind && text == other.text;
  }
};

// the ranges are as printed in the header: a range with a zero count
// names the line just before the gap, any other range names its first
// line.  both are 1-based.
struct hunk
{
  std::size_t old_start;
  std::size_t old_count;
  std::size_t new_start;
  std::size_t new_count;
  std::vector<hunk_line> lines;

  hunk()
    : old_start(0), old_count(0), new_start(0), new_count(0)
  {}
};

struct patch_document
{
  // header names, informational only
  std::string from_name;
  std::string to_name;
  std::vector<hunk> hunks;

  bool empty() const { return hunks.empty(); }
};

// parses one "@@ -a[,b] +c[,d] @@" line into the four range fields of H;
// an omitted count is 1.  throws malformed_hunk_header.
void parse_hunk_header(std::string const & line, hunk & h);

// the header line for H, without a trailing newline
std::string format_hunk_header(hunk const & h);

// throws malformed_hunk_header
void parse_patch(delta const & text, patch_document & out);

// a document without hunks writes as the empty string
void write_patch(patch_document const & doc, delta & out);

// Local Variables:
// mode: C++
// fill-column: 76
// c-file-style: "gnu"
// indent-tabs-mode: nil
// End:
// vim: et:sw=2:sts=2:ts=2:cino=>2s,{s,\:s,+s,t0,g0,^-2,e-2,n-2,p2s,(0,=s:

#endif // __PATCH_DOCUMENT_HH__
