// Copyright (C) 2026 flexarc contributors
//
// This program is made available under the GNU GPL version 2.0 or
// greater. See the accompanying file COPYING for details.
//
// This program is distributed WITHOUT ANY WARRANTY; without even the
// implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR
// PURPOSE.

#include "base.hh"
#include <sstream>
#include "vector.hh"

#include "constants.hh"
#include "patch_document.hh"
#include "simplestring_xform.hh"

using std::ostringstream;
using std::size_t;
using std::string;
using std::vector;

namespace
{
  // walks a single hunk header line
  struct header_cursor
  {
    string const & line;
    size_t pos;

    explicit header_cursor(string const & line)
      : line(line), pos(0)
    {}

    void fail(char const * what)
    {
      throw malformed_hunk_header((F("malformed hunk header '%s': %s")
                                   % line % _(what)).str());
    }

    bool at_end() const
    {
      return pos >= line.size();
    }

    void expect(string const & tok, char const * what)
    {
      if (line.compare(pos, tok.size(), tok) != 0)
        fail(what);
      pos += tok.size();
    }

    // at least one space
    void spaces()
    {
      if (at_end() || line[pos] != ' ')
        fail(N_("expected a space"));
      while (!at_end() && line[pos] == ' ')
        ++pos;
    }

    size_t number()
    {
      if (at_end() || line[pos] < '0' || line[pos] > '9')
        fail(N_("expected a line number"));
      size_t n = 0;
      while (!at_end() && line[pos] >= '0' && line[pos] <= '9')
        {
          size_t digit = static_cast<size_t>(line[pos] - '0');
          if (n > (static_cast<size_t>(-1) - digit) / 10)
            fail(N_("line number out of range"));
          n = n * 10 + digit;
          ++pos;
        }
      return n;
    }

    void range(size_t & start, size_t & count)
    {
      start = number();
      if (!at_end() && line[pos] == ',')
        {
          ++pos;
          count = number();
        }
      else
        count = 1;
    }
  };

  string
  strip_newline(string const & s)
  {
    string::size_type end = s.size();
    if (end > 0 && s[end - 1] == '\n')
      --end;
    return s.substr(0, end);
  }

  bool
  is_blank(string const & line)
  {
    return line == "\n" || line.empty();
  }

  bool
  starts_with(string const & line, string const & prefix)
  {
    return line.compare(0, prefix.size(), prefix) == 0;
  }

  void
  write_range(ostringstream & oss, size_t start, size_t count)
  {
    oss << start;
    if (count != 1)
      oss << ',' << count;
  }

  void
  write_line(ostringstream & oss, char prefix, string const & text)
  {
    oss << prefix << text;
    if (text.empty() || text[text.size() - 1] != '\n')
      oss << '\n' << constants::no_newline_marker << '\n';
  }
}

void
parse_hunk_header(string const & line, hunk & h)
{
  string const stripped = strip_newline(line);
  header_cursor c(stripped);
  size_t old_start, old_count, new_start, new_count;

  c.expect("@@", N_("missing opening '@@'"));
  c.spaces();
  c.expect("-", N_("missing '-' range"));
  c.range(old_start, old_count);
  c.spaces();
  c.expect("+", N_("missing '+' range"));
  c.range(new_start, new_count);
  c.spaces();
  c.expect("@@", N_("junk before closing '@@'"));
  // anything after the closing "@@" is commentary

  h.old_start = old_start;
  h.old_count = old_count;
  h.new_start = new_start;
  h.new_count = new_count;
}

string
format_hunk_header(hunk const & h)
{
  ostringstream oss;
  oss << "@@ -";
  write_range(oss, h.old_start, h.old_count);
  oss << " +";
  write_range(oss, h.new_start, h.new_count);
  oss << " @@";
  return oss.str();
}

void
parse_patch(delta const & text, patch_document & out)
{
  vector<string> lines;
  split_into_text_lines(text(), lines);

  out.from_name.clear();
  out.to_name.clear();
  out.hunks.clear();

  size_t i = 0;

  // optional file headers
  while (i < lines.size() && out.hunks.empty())
    {
      string const & line = lines[i];
      if (is_blank(line))
        ++i;
      else if (starts_with(line, "--- "))
        {
          out.from_name = strip_newline(line.substr(4));
          ++i;
        }
      else if (starts_with(line, "+++ "))
        {
          out.to_name = strip_newline(line.substr(4));
          ++i;
        }
      else if (starts_with(line, "@@"))
        break;
      else
        throw malformed_hunk_header((F("unexpected line before first hunk: '%s'")
                                     % strip_newline(line)).str());
    }

  while (i < lines.size())
    {
      if (is_blank(lines[i]))
        {
          ++i;
          continue;
        }

      hunk h;
      parse_hunk_header(lines[i], h);
      L(FL("parsing hunk %s") % format_hunk_header(h));
      ++i;

      // the header counts say how many body lines follow; this is what
      // lets a body line's own text start with "-", "+" or "@@".
      size_t old_left = h.old_count;
      size_t new_left = h.new_count;
      while (old_left > 0 || new_left > 0)
        {
          if (i >= lines.size())
            throw malformed_hunk_header((F("hunk %s is truncated")
                                         % format_hunk_header(h)).str());
          string const & line = lines[i++];
          if (is_blank(line))
            continue;

          string body = line.substr(1);
          switch (line[0])
            {
            case '-':
              if (old_left == 0)
                throw malformed_hunk_header((F("hunk %s removes too many lines")
                                             % format_hunk_header(h)).str());
              h.lines.push_back(hunk_line(hunk_line::remove, body));
              --old_left;
              break;
            case '+':
              if (new_left == 0)
                throw malformed_hunk_header((F("hunk %s inserts too many lines")
                                             % format_hunk_header(h)).str());
              h.lines.push_back(hunk_line(hunk_line::insert, body));
              --new_left;
              break;
            case ' ':
              if (old_left == 0 || new_left == 0)
                throw malformed_hunk_header((F("hunk %s has too much context")
                                             % format_hunk_header(h)).str());
              h.lines.push_back(hunk_line(hunk_line::context, body));
              --old_left;
              --new_left;
              break;
            case '\\':
              if (h.lines.empty())
                throw malformed_hunk_header((F("hunk %s starts with a '\\' marker")
                                             % format_hunk_header(h)).str());
              h.lines.back().text = strip_newline(h.lines.back().text);
              break;
            default:
              throw malformed_hunk_header((F("unexpected line in hunk %s: '%s'")
                                           % format_hunk_header(h)
                                           % strip_newline(line)).str());
            }
        }

      // a marker for the hunk's last line comes after the counts run out
      if (i < lines.size() && starts_with(lines[i], "\\"))
        {
          if (h.lines.empty())
            throw malformed_hunk_header((F("hunk %s has a stray '\\' marker")
                                         % format_hunk_header(h)).str());
          h.lines.back().text = strip_newline(h.lines.back().text);
          ++i;
        }

      out.hunks.push_back(h);
    }
}

void
write_patch(patch_document const & doc, delta & out)
{
  if (doc.empty())
    {
      out = delta();
      return;
    }

  ostringstream oss;
  oss << "--- " << doc.from_name << '\n'
      << "+++ " << doc.to_name << '\n';

  for (vector<hunk>::const_iterator h = doc.hunks.begin();
       h != doc.hunks.end(); ++h)
    {
      oss << format_hunk_header(*h) << '\n';
      for (vector<hunk_line>::const_iterator l = h->lines.begin();
           l != h->lines.end(); ++l)
        {
          switch (l->kind)
            {
            case hunk_line::context:
              write_line(oss, ' ', l->text);
              break;
            case hunk_line::insert:
              write_line(oss, '+', l->text);
              break;
            case hunk_line::remove:
              write_line(oss, '-', l->text);
              break;
            }
        }
    }

  out = delta(oss.str());
}

#ifdef BUILD_UNIT_TESTS
#include "unit_tests.hh"

UNIT_TEST(patch_document, hunk_header_full)
{
  hunk h;
  parse_hunk_header("@@ -12,3 +14,5 @@", h);
  UNIT_TEST_CHECK(h.old_start == 12);
  UNIT_TEST_CHECK(h.old_count == 3);
  UNIT_TEST_CHECK(h.new_start == 14);
  UNIT_TEST_CHECK(h.new_count == 5);

  // trailing newline and commentary are fine
  parse_hunk_header("@@ -1,0 +2,2 @@ <FlexStatement>\n", h);
  UNIT_TEST_CHECK(h.old_start == 1);
  UNIT_TEST_CHECK(h.old_count == 0);
  UNIT_TEST_CHECK(h.new_start == 2);
  UNIT_TEST_CHECK(h.new_count == 2);
}

UNIT_TEST(patch_document, hunk_header_default_counts)
{
  hunk h;
  parse_hunk_header("@@ -7 +9 @@", h);
  UNIT_TEST_CHECK(h.old_start == 7);
  UNIT_TEST_CHECK(h.old_count == 1);
  UNIT_TEST_CHECK(h.new_start == 9);
  UNIT_TEST_CHECK(h.new_count == 1);

  parse_hunk_header("@@ -3,0 +4 @@", h);
  UNIT_TEST_CHECK(h.old_count == 0);
  UNIT_TEST_CHECK(h.new_count == 1);
}

UNIT_TEST(patch_document, hunk_header_malformed)
{
  hunk h;
  UNIT_TEST_CHECK_THROW(parse_hunk_header("", h), malformed_hunk_header);
  UNIT_TEST_CHECK_THROW(parse_hunk_header("-1 +1 @@", h), malformed_hunk_header);
  UNIT_TEST_CHECK_THROW(parse_hunk_header("@@ -1 +1", h), malformed_hunk_header);
  UNIT_TEST_CHECK_THROW(parse_hunk_header("@@ 1 +1 @@", h), malformed_hunk_header);
  UNIT_TEST_CHECK_THROW(parse_hunk_header("@@ -1 1 @@", h), malformed_hunk_header);
  UNIT_TEST_CHECK_THROW(parse_hunk_header("@@ -a +1 @@", h), malformed_hunk_header);
  UNIT_TEST_CHECK_THROW(parse_hunk_header("@@ -1, +1 @@", h), malformed_hunk_header);
  UNIT_TEST_CHECK_THROW(parse_hunk_header("@@ -1 +1 x @@", h), malformed_hunk_header);
  UNIT_TEST_CHECK_THROW(parse_hunk_header("@@ -99999999999999999999999 +1 @@", h),
                        malformed_hunk_header);
  UNIT_TEST_CHECK_THROW(parse_hunk_header("<r>", h), malformed_hunk_header);
}

UNIT_TEST(patch_document, hunk_header_format)
{
  hunk h;
  h.old_start = 4; h.old_count = 1; h.new_start = 4; h.new_count = 2;
  UNIT_TEST_CHECK(format_hunk_header(h) == "@@ -4 +4,2 @@");
  h.old_start = 3; h.old_count = 0; h.new_start = 4; h.new_count = 1;
  UNIT_TEST_CHECK(format_hunk_header(h) == "@@ -3,0 +4 @@");
}

UNIT_TEST(patch_document, parse_simple)
{
  patch_document doc;
  parse_patch(delta("--- base_20260129.xml\n"
                    "+++ 20260130\n"
                    "@@ -2 +2,2 @@\n"
                    "-<a/>\n"
                    "+<b/>\n"
                    "+<c/>\n"), doc);
  UNIT_TEST_CHECK(doc.from_name == "base_20260129.xml");
  UNIT_TEST_CHECK(doc.to_name == "20260130");
  UNIT_TEST_REQUIRE(doc.hunks.size() == 1);
  hunk const & h = doc.hunks[0];
  UNIT_TEST_REQUIRE(h.lines.size() == 3);
  UNIT_TEST_CHECK(h.lines[0] == hunk_line(hunk_line::remove, "<a/>\n"));
  UNIT_TEST_CHECK(h.lines[1] == hunk_line(hunk_line::insert, "<b/>\n"));
  UNIT_TEST_CHECK(h.lines[2] == hunk_line(hunk_line::insert, "<c/>\n"));
}

UNIT_TEST(patch_document, parse_header_lookalikes)
{
  // body lines whose text looks like headers are taken by count
  patch_document doc;
  parse_patch(delta("--- a\n"
                    "+++ b\n"
                    "@@ -1,2 +1,2 @@\n"
                    "--- not a header\n"
                    "-@@ -1 +1 @@\n"
                    "++++ nor this\n"
                    "+-\n"), doc);
  UNIT_TEST_REQUIRE(doc.hunks.size() == 1);
  hunk const & h = doc.hunks[0];
  UNIT_TEST_REQUIRE(h.lines.size() == 4);
  UNIT_TEST_CHECK(h.lines[0] == hunk_line(hunk_line::remove, "-- not a header\n"));
  UNIT_TEST_CHECK(h.lines[1] == hunk_line(hunk_line::remove, "@@ -1 +1 @@\n"));
  UNIT_TEST_CHECK(h.lines[2] == hunk_line(hunk_line::insert, "+++ nor this\n"));
  UNIT_TEST_CHECK(h.lines[3] == hunk_line(hunk_line::insert, "-\n"));
}

UNIT_TEST(patch_document, parse_no_newline_marker)
{
  patch_document doc;
  parse_patch(delta("--- a\n"
                    "+++ b\n"
                    "@@ -3 +3 @@\n"
                    "-</r>\n"
                    "\\ No newline at end of file\n"
                    "+</r>\n"), doc);
  UNIT_TEST_REQUIRE(doc.hunks.size() == 1);
  UNIT_TEST_REQUIRE(doc.hunks[0].lines.size() == 2);
  UNIT_TEST_CHECK(doc.hunks[0].lines[0].text == "</r>");
  UNIT_TEST_CHECK(doc.hunks[0].lines[1].text == "</r>\n");

  // marker after the last line of the last hunk
  parse_patch(delta("@@ -3,0 +4 @@\n"
                    "+tail\n"
                    "\\ No newline at end of file\n"), doc);
  UNIT_TEST_REQUIRE(doc.hunks.size() == 1);
  UNIT_TEST_REQUIRE(doc.hunks[0].lines.size() == 1);
  UNIT_TEST_CHECK(doc.hunks[0].lines[0].text == "tail");
}

UNIT_TEST(patch_document, parse_skips_blank_lines)
{
  patch_document doc;
  parse_patch(delta("\n--- a\n+++ b\n\n@@ -1 +1 @@\n-x\n\n+y\n\n"), doc);
  UNIT_TEST_REQUIRE(doc.hunks.size() == 1);
  UNIT_TEST_CHECK(doc.hunks[0].lines.size() == 2);
}

UNIT_TEST(patch_document, parse_malformed)
{
  patch_document doc;
  // junk before the first hunk
  UNIT_TEST_CHECK_THROW(parse_patch(delta("hello\n@@ -1 +1 @@\n-a\n+b\n"), doc),
                        malformed_hunk_header);
  // body shorter than its counts
  UNIT_TEST_CHECK_THROW(parse_patch(delta("@@ -1,2 +1 @@\n-a\n+b\n"), doc),
                        malformed_hunk_header);
  // body longer than its counts
  UNIT_TEST_CHECK_THROW(parse_patch(delta("@@ -1 +1 @@\n-a\n+b\n+c\n"), doc),
                        malformed_hunk_header);
  // bad header
  UNIT_TEST_CHECK_THROW(parse_patch(delta("@@ -x +1 @@\n-a\n+b\n"), doc),
                        malformed_hunk_header);
  // marker with nothing to attach to
  UNIT_TEST_CHECK_THROW(parse_patch(delta("@@ -1 +1 @@\n\\ No newline at end of file\n"),
                                    doc),
                        malformed_hunk_header);
  // unprefixed line inside a body
  UNIT_TEST_CHECK_THROW(parse_patch(delta("@@ -1 +1 @@\nx\n+b\n"), doc),
                        malformed_hunk_header);
}

UNIT_TEST(patch_document, write_forms)
{
  patch_document doc;
  delta out;

  write_patch(doc, out);
  UNIT_TEST_CHECK(out().empty());

  doc.from_name = "old";
  doc.to_name = "new";
  hunk h;
  h.old_start = 2; h.old_count = 1; h.new_start = 2; h.new_count = 1;
  h.lines.push_back(hunk_line(hunk_line::remove, "<a/>\n"));
  h.lines.push_back(hunk_line(hunk_line::insert, "<b/>"));
  doc.hunks.push_back(h);
  write_patch(doc, out);
  UNIT_TEST_CHECK(out() == ("--- old\n"
                            "+++ new\n"
                            "@@ -2 +2 @@\n"
                            "-<a/>\n"
                            "+<b/>\n"
                            "\\ No newline at end of file\n"));

  // and it reads back the same
  patch_document back;
  parse_patch(out, back);
  UNIT_TEST_REQUIRE(back.hunks.size() == 1);
  UNIT_TEST_CHECK(back.hunks[0].lines == doc.hunks[0].lines);
}

#endif // BUILD_UNIT_TESTS

// Local Variables:
// mode: C++
// fill-column: 76
// c-file-style: "gnu"
// indent-tabs-mode: nil
// End:
// vim: et:sw=2:sts=2:ts=2:cino=>2s,{s,\:s,+s,t0,g0,^-2,e-2,n-2,p2s,(0,=s:
