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

#include "base.hh"
#include "vector.hh"

#include "diff_patch.hh"
#include "interner.hh"
#include "lcs.hh"
#include "sanity.hh"
#include "simplestring_xform.hh"

using std::string;
using std::vector;

namespace
{
  // for messages; the stored text keeps its newline
  string
  display_line(string const & line)
  {
    if (!line.empty() && line[line.size() - 1] == '\n')
      return line.substr(0, line.size() - 1);
    return line;
  }
}

// collects the edits of a script into hunks.  with no context to carry,
// a hunk is a run of edits with no common line between them; the
// removals are written before the insertions.

struct hunk_writer
{
  vector<string> const & a;
  vector<string> const & b;
  patch_document & doc;
  size_t a_begin, b_begin;
  vector<hunk_line> removed;
  vector<hunk_line> inserted;

  hunk_writer(vector<string> const & a,
              vector<string> const & b,
              patch_document & doc)
    : a(a), b(b), doc(doc), a_begin(0), b_begin(0)
  {}

  void begin_hunk(size_t a_pos, size_t b_pos)
  {
    flush_hunk();
    a_begin = a_pos;
    b_begin = b_pos;
  }

  void delete_at(size_t a_pos)
  {
    removed.push_back(hunk_line(hunk_line::remove, idx(a, a_pos)));
  }

  void insert_at(size_t b_pos)
  {
    inserted.push_back(hunk_line(hunk_line::insert, idx(b, b_pos)));
  }

  void flush_hunk()
  {
    if (removed.empty() && inserted.empty())
      return;

    hunk h;
    h.old_count = removed.size();
    h.new_count = inserted.size();
    // an empty range is named by the line before it
    h.old_start = h.old_count > 0 ? a_begin + 1 : a_begin;
    h.new_start = h.new_count > 0 ? b_begin + 1 : b_begin;
    h.lines.reserve(removed.size() + inserted.size());
    h.lines.insert(h.lines.end(), removed.begin(), removed.end());
    h.lines.insert(h.lines.end(), inserted.begin(), inserted.end());
    doc.hunks.push_back(h);

    removed.clear();
    inserted.clear();
  }
};

static void
walk_edit_script(vector<long> const & edits, hunk_writer & w)
{
  // a and b are the next unconsumed positions; between hunks they move
  // together over common lines.
  size_t a = 0, b = 0;
  bool in_hunk = false;

  for (vector<long>::const_iterator e = edits.begin();
       e != edits.end(); ++e)
    {
      if (*e < 0)
        {
          size_t del = static_cast<size_t>(-1 - *e);
          I(del >= a);
          if (!in_hunk || del != a)
            {
              b += del - a;
              a = del;
              w.begin_hunk(a, b);
            }
          w.delete_at(a++);
        }
      else
        {
          size_t ins = static_cast<size_t>(*e - 1);
          I(ins >= b);
          if (!in_hunk || ins != b)
            {
              a += ins - b;
              b = ins;
              w.begin_hunk(a, b);
            }
          w.insert_at(b++);
        }
      in_hunk = true;
    }
  w.flush_hunk();
}

void
make_patch(vector<string> const & old_lines,
           vector<string> const & new_lines,
           string const & from_name,
           string const & to_name,
           patch_document & out)
{
  out.from_name = from_name;
  out.to_name = to_name;
  out.hunks.clear();

  vector<long> left_interned, right_interned, edits;
  interner<long> in;

  left_interned.reserve(old_lines.size());
  for (vector<string>::const_iterator i = old_lines.begin();
       i != old_lines.end(); ++i)
    left_interned.push_back(in.intern(*i));

  right_interned.reserve(new_lines.size());
  for (vector<string>::const_iterator i = new_lines.begin();
       i != new_lines.end(); ++i)
    right_interned.push_back(in.intern(*i));

  edit_script(left_interned.begin(), left_interned.end(),
              right_interned.begin(), right_interned.end(),
              edits);

  hunk_writer w(old_lines, new_lines, out);
  walk_edit_script(edits, w);

  L(FL("make_patch: %d -> %d lines, %d edits in %d hunks")
    % old_lines.size() % new_lines.size() % edits.size() % out.hunks.size());
}

void
make_delta(data const & older,
           data const & newer,
           string const & from_name,
           string const & to_name,
           delta & out)
{
  vector<string> old_lines, new_lines;
  split_into_text_lines(older(), old_lines);
  split_into_text_lines(newer(), new_lines);

  patch_document doc;
  make_patch(old_lines, new_lines, from_name, to_name, doc);
  write_patch(doc, out);
}

void
apply_patch(vector<string> const & lines,
            patch_document const & patch,
            vector<string> & out)
{
  vector<string> result(lines);

  for (vector<hunk>::const_iterator h = patch.hunks.begin();
       h != patch.hunks.end(); ++h)
    {
      if (h->old_count > 0 && h->old_start == 0)
        throw patch_conflict((F("hunk %s starts before the first line")
                              % format_hunk_header(*h)).str());

      // header numbers refer to the unpatched text; hunks applied so far
      // have shifted everything after them.
      long line_idx = static_cast<long>(h->old_count > 0
                                        ? h->old_start - 1
                                        : h->old_start);
      line_idx += static_cast<long>(result.size())
        - static_cast<long>(lines.size());
      if (line_idx < 0)
        throw patch_conflict((F("hunk %s overlaps the hunk before it")
                              % format_hunk_header(*h)).str());

      size_t pos = static_cast<size_t>(line_idx);
      for (vector<hunk_line>::const_iterator l = h->lines.begin();
           l != h->lines.end(); ++l)
        {
          switch (l->kind)
            {
            case hunk_line::context:
              // trailing context may run off the end
              if (pos < result.size())
                ++pos;
              break;

            case hunk_line::remove:
              if (pos >= result.size())
                throw patch_conflict((F("hunk %s removes line %d of a %d line text")
                                      % format_hunk_header(*h)
                                      % (pos + 1) % result.size()).str());
              if (result[pos] != l->text)
                throw patch_conflict((F("hunk %s expects '%s' at line %d, found '%s'")
                                      % format_hunk_header(*h)
                                      % display_line(l->text)
                                      % (pos + 1)
                                      % display_line(result[pos])).str());
              result.erase(result.begin() + pos);
              break;

            case hunk_line::insert:
              if (pos > result.size())
                throw patch_conflict((F("hunk %s inserts at line %d of a %d line text")
                                      % format_hunk_header(*h)
                                      % (pos + 1) % result.size()).str());
              result.insert(result.begin() + pos, l->text);
              ++pos;
              break;
            }
        }
    }

  out.swap(result);
}

void
apply_delta(data const & older,
            delta const & del,
            data & newer)
{
  patch_document doc;
  parse_patch(del, doc);

  vector<string> old_lines, new_lines;
  split_into_text_lines(older(), old_lines);
  apply_patch(old_lines, doc, new_lines);

  string tmp;
  join_text_lines(new_lines, tmp);
  newer = data(tmp);
}

#ifdef BUILD_UNIT_TESTS
#include "unit_tests.hh"
#include "randomfile.hh"
#include <iostream>

using std::cerr;

static void dump_incorrect_patch(vector<string> const & expected,
                                 vector<string> const & got,
                                 string const & prefix)
{
  size_t mx = expected.size();
  if (mx < got.size())
    mx = got.size();
  for (size_t i = 0; i < mx; ++i)
    {
      cerr << "bad patch: " << i << " [" << prefix << "]\t";

      if (i < expected.size())
        cerr << '[' << display_line(expected[i]) << "]\t";
      else
        cerr << "[--nil--]\t";

      if (i < got.size())
        cerr << '[' << display_line(got[i]) << "]\t";
      else
        cerr << "[--nil--]\t";

      cerr << '\n';
    }
}

static vector<string>
text_lines(string const & s)
{
  vector<string> out;
  split_into_text_lines(s, out);
  return out;
}

UNIT_TEST(diff_patch, identical_is_empty)
{
  delta d;
  make_delta(data("<r>\n<a/>\n</r>\n"), data("<r>\n<a/>\n</r>\n"),
             "from", "to", d);
  UNIT_TEST_CHECK(d().empty());

  make_delta(data(""), data(""), "from", "to", d);
  UNIT_TEST_CHECK(d().empty());

  // and the empty delta changes nothing
  data out;
  apply_delta(data("<r/>\n"), delta(""), out);
  UNIT_TEST_CHECK(out() == "<r/>\n");
}

UNIT_TEST(diff_patch, header_forms)
{
  patch_document doc;

  // insertion in the middle names the line before the gap
  make_patch(text_lines("a\nb\n"), text_lines("a\nx\nb\n"), "o", "n", doc);
  UNIT_TEST_REQUIRE(doc.hunks.size() == 1);
  UNIT_TEST_CHECK(format_hunk_header(doc.hunks[0]) == "@@ -1,0 +2 @@");

  // insertion at the very start
  make_patch(text_lines("a\n"), text_lines("z\na\n"), "o", "n", doc);
  UNIT_TEST_REQUIRE(doc.hunks.size() == 1);
  UNIT_TEST_CHECK(format_hunk_header(doc.hunks[0]) == "@@ -0,0 +1 @@");

  // deletion
  make_patch(text_lines("a\nx\nb\n"), text_lines("a\nb\n"), "o", "n", doc);
  UNIT_TEST_REQUIRE(doc.hunks.size() == 1);
  UNIT_TEST_CHECK(format_hunk_header(doc.hunks[0]) == "@@ -2 +1,0 @@");

  // replacement of two lines by three
  make_patch(text_lines("a\nb\nc\nd\n"), text_lines("a\nB\nC\nX\nd\n"),
             "o", "n", doc);
  UNIT_TEST_REQUIRE(doc.hunks.size() == 1);
  UNIT_TEST_CHECK(format_hunk_header(doc.hunks[0]) == "@@ -2,2 +2,3 @@");
  UNIT_TEST_REQUIRE(doc.hunks[0].lines.size() == 5);
  UNIT_TEST_CHECK(doc.hunks[0].lines[0].kind == hunk_line::remove);
  UNIT_TEST_CHECK(doc.hunks[0].lines[1].kind == hunk_line::remove);
  UNIT_TEST_CHECK(doc.hunks[0].lines[2].kind == hunk_line::insert);
}

UNIT_TEST(diff_patch, text_form)
{
  delta d;
  make_delta(data("<r>\n<a/>\n</r>\n"), data("<r>\n<b/>\n</r>\n"),
             "base_20260129.xml", "delta_20260130.patch", d);
  UNIT_TEST_CHECK(d() == ("--- base_20260129.xml\n"
                          "+++ delta_20260130.patch\n"
                          "@@ -2 +2 @@\n"
                          "-<a/>\n"
                          "+<b/>\n"));
}

UNIT_TEST(diff_patch, deterministic)
{
  randomizer rng;
  vector<string> older, newer;
  file_randomizer::build_random_revision(older, newer, 20, rng);
  string o, n;
  join_text_lines(older, o);
  join_text_lines(newer, n);

  delta d1, d2;
  make_delta(data(o), data(n), "a", "b", d1);
  make_delta(data(o), data(n), "a", "b", d2);
  UNIT_TEST_CHECK(d1 == d2);
}

UNIT_TEST(diff_patch, final_newline_round_trip)
{
  data out;
  delta d;

  make_delta(data("<r>\n</r>"), data("<r>\n</r>\n"), "a", "b", d);
  UNIT_TEST_CHECK(!d().empty());
  apply_delta(data("<r>\n</r>"), d, out);
  UNIT_TEST_CHECK(out() == "<r>\n</r>\n");

  make_delta(data("<r>\n</r>\n"), data("<r>\n</r>"), "a", "b", d);
  apply_delta(data("<r>\n</r>\n"), d, out);
  UNIT_TEST_CHECK(out() == "<r>\n</r>");

  make_delta(data("<r><a/><b/></r>"), data("<r><a/><b/><c/></r>"),
             "a", "b", d);
  apply_delta(data("<r><a/><b/></r>"), d, out);
  UNIT_TEST_CHECK(out() == "<r><a/><b/><c/></r>");

  // CR is content, not a line break
  make_delta(data("a\r\nb\r\n"), data("a\r\nc\r\n"), "a", "b", d);
  apply_delta(data("a\r\nb\r\n"), d, out);
  UNIT_TEST_CHECK(out() == "a\r\nc\r\n");
}

UNIT_TEST(diff_patch, multiple_hunks_shift)
{
  string o, n;
  for (int i = 1; i <= 10; ++i)
    o += boost::lexical_cast<string>(i) + "\n";
  // drop 2, grow after 8, replace 10
  n = "1\n3\n4\n5\n6\n7\n8\nnew a\nnew b\n9\nten\n";

  delta d;
  make_delta(data(o), data(n), "a", "b", d);
  patch_document doc;
  parse_patch(d, doc);
  UNIT_TEST_CHECK(doc.hunks.size() == 3);

  data out;
  apply_delta(data(o), d, out);
  UNIT_TEST_CHECK(out() == n);
}

UNIT_TEST(diff_patch, insertion_after_empty_region)
{
  vector<string> out;
  patch_document doc;
  parse_patch(delta("@@ -2,0 +3,2 @@\n+x\n+y\n"), doc);
  apply_patch(text_lines("a\nb\nc\n"), doc, out);
  UNIT_TEST_CHECK(out == text_lines("a\nb\nx\ny\nc\n"));
}

UNIT_TEST(diff_patch, conflict)
{
  delta d;
  make_delta(data("<r>\n<a/>\n</r>\n"), data("<r>\n<b/>\n</r>\n"),
             "a", "b", d);
  data out;
  UNIT_TEST_CHECK_THROW(apply_delta(data("<r>\n<x/>\n</r>\n"), d, out),
                        patch_conflict);
  // the no-newline form of a line is a different line
  UNIT_TEST_CHECK_THROW(apply_delta(data("<r>\n<a/>"), d, out),
                        patch_conflict);
}

UNIT_TEST(diff_patch, past_end)
{
  data out;
  UNIT_TEST_CHECK_THROW(apply_delta(data("a\nb\n"),
                                    delta("@@ -5,0 +6 @@\n+x\n"), out),
                        patch_conflict);
  UNIT_TEST_CHECK_THROW(apply_delta(data("a\nb\n"),
                                    delta("@@ -3 +2,0 @@\n-x\n"), out),
                        patch_conflict);
  UNIT_TEST_CHECK_THROW(apply_delta(data("a\nb\n"),
                                    delta("@@ -0 +0,0 @@\n-a\n"), out),
                        patch_conflict);
}

UNIT_TEST(diff_patch, context_is_clamped)
{
  vector<string> out;
  patch_document doc;
  parse_patch(delta("@@ -1,2 +1,3 @@\n a\n b\n+c\n"), doc);
  apply_patch(text_lines("a\n"), doc, out);
  UNIT_TEST_CHECK(out == text_lines("a\nc\n"));
}

UNIT_TEST(diff_patch, malformed_delta)
{
  data out;
  UNIT_TEST_CHECK_THROW(apply_delta(data("a\n"), delta("@@ -1 +1\n-a\n+b\n"), out),
                        malformed_hunk_header);
}

// high tech randomizing test
UNIT_TEST(diff_patch, randomizing_round_trip)
{
  randomizer rng;
  for (int i = 0; i < 100; ++i)
    {
      vector<string> older, newer, patched;
      file_randomizer::build_random_revision(older, newer, 1 + i / 4, rng);

      patch_document doc;
      make_patch(older, newer, "older", "newer", doc);
      for (vector<hunk>::const_iterator h = doc.hunks.begin();
           h != doc.hunks.end(); ++h)
        for (vector<hunk_line>::const_iterator l = h->lines.begin();
             l != h->lines.end(); ++l)
          UNIT_TEST_CHECK(l->kind != hunk_line::context);

      apply_patch(older, doc, patched);
      if (patched != newer)
        dump_incorrect_patch(newer, patched, "random patch");
      UNIT_TEST_CHECK(patched == newer);

      // and through the text form
      string o, n;
      join_text_lines(older, o);
      join_text_lines(newer, n);
      delta d;
      data out;
      make_delta(data(o), data(n), "older", "newer", d);
      apply_delta(data(o), d, out);
      UNIT_TEST_CHECK(out() == n);
    }
}

#endif // BUILD_UNIT_TESTS

// Local Variables:
// mode: C++
// fill-column: 76
// c-file-style: "gnu"
// indent-tabs-mode: nil
// End:
// vim: et:sw=2:sts=2:ts=2:cino=>2s,{s,\:s,+s,t0,g0,^-2,e-2,n-2,p2s,(0,=s:
