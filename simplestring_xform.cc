// Copyright (C) 2002 Graydon Hoare <graydon@pobox.com>
//
// This program is made available under the GNU GPL version 2.0 or
// greater. See the accompanying file COPYING for details.
//
// This program is distributed WITHOUT ANY WARRANTY; without even the
// implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR
// PURPOSE.

#include "base.hh"
#include "simplestring_xform.hh"
#include "sanity.hh"

#include <sstream>

using std::set;
using std::string;
using std::vector;
using std::ostringstream;

void
split_into_lines(string const & in,
                 vector<string> & out)
{
  out.clear();
  string::size_type begin = 0;
  string::size_type end = in.find('\n', begin);

  while (end != string::npos)
    {
      out.push_back(in.substr(begin, end - begin));
      begin = end + 1;
      if (begin >= in.size())
        break;
      end = in.find('\n', begin);
    }
  if (begin < in.size())
    out.push_back(in.substr(begin));
}

void
split_into_text_lines(string const & in,
                      vector<string> & out)
{
  out.clear();
  string::size_type begin = 0;
  while (begin < in.size())
    {
      string::size_type end = in.find('\n', begin);
      if (end == string::npos)
        {
          // last line without trailing newline
          out.push_back(in.substr(begin));
          break;
        }
      out.push_back(in.substr(begin, end + 1 - begin));
      begin = end + 1;
    }
}

void
join_text_lines(vector<string> const & in,
                string & out)
{
  string::size_type sz = 0;
  for (vector<string>::const_iterator i = in.begin(); i != in.end(); ++i)
    sz += i->size();
  out.clear();
  out.reserve(sz);
  for (vector<string>::const_iterator i = in.begin(); i != in.end(); ++i)
    out += *i;
}

void
prefix_lines_with(string const & prefix, string const & lines, string & out)
{
  vector<string> msgs;
  split_into_lines(lines, msgs);

  ostringstream oss;
  for (vector<string>::const_iterator i = msgs.begin();
       i != msgs.end();)
    {
      oss << prefix << *i;
      i++;
      if (i != msgs.end())
        oss << '\n';
    }

  out = oss.str();
}

void
split_into_words(string const & in, vector<string> & out)
{
  out.clear();
  if (in.empty())
    return;

  string::size_type begin = 0;
  string::size_type end = in.find(' ', begin);
  while (end != string::npos)
    {
      out.push_back(in.substr(begin, end - begin));
      begin = end + 1;
      end = in.find(' ', begin);
    }
  out.push_back(in.substr(begin));
}

string
join_words(set<string> const & in, string const & sep)
{
  string out;
  for (set<string>::const_iterator i = in.begin(); i != in.end(); ++i)
    {
      if (i != in.begin())
        out += sep;
      out += *i;
    }
  return out;
}

#ifdef BUILD_UNIT_TESTS
#include "unit_tests.hh"

UNIT_TEST(simplestring_xform, split_into_lines)
{
  vector<string> lines;

  split_into_lines("", lines);
  UNIT_TEST_CHECK(lines.empty());

  split_into_lines("one\ntwo", lines);
  UNIT_TEST_REQUIRE(lines.size() == 2);
  UNIT_TEST_CHECK(lines[0] == "one");
  UNIT_TEST_CHECK(lines[1] == "two");

  split_into_lines("one\n\nthree\n", lines);
  UNIT_TEST_REQUIRE(lines.size() == 3);
  UNIT_TEST_CHECK(lines[1] == "");
  UNIT_TEST_CHECK(lines[2] == "three");
}

UNIT_TEST(simplestring_xform, split_into_text_lines)
{
  vector<string> lines;

  split_into_text_lines("", lines);
  UNIT_TEST_CHECK(lines.empty());

  split_into_text_lines("\n", lines);
  UNIT_TEST_REQUIRE(lines.size() == 1);
  UNIT_TEST_CHECK(lines[0] == "\n");

  split_into_text_lines("<r>\n<a/>\n</r>", lines);
  UNIT_TEST_REQUIRE(lines.size() == 3);
  UNIT_TEST_CHECK(lines[0] == "<r>\n");
  UNIT_TEST_CHECK(lines[1] == "<a/>\n");
  UNIT_TEST_CHECK(lines[2] == "</r>");

  // carriage returns are content, not separators
  split_into_text_lines("a\r\nb\rc\n", lines);
  UNIT_TEST_REQUIRE(lines.size() == 2);
  UNIT_TEST_CHECK(lines[0] == "a\r\n");
  UNIT_TEST_CHECK(lines[1] == "b\rc\n");
}

UNIT_TEST(simplestring_xform, join_text_lines_is_exact)
{
  char const * samples[] = { "", "\n", "\n\n", "x", "x\n", "x\ny",
                             "x\r\ny\r\n", "\n\nx\n\n", 0 };
  for (int i = 0; samples[i]; ++i)
    {
      vector<string> lines;
      string joined;
      split_into_text_lines(samples[i], lines);
      join_text_lines(lines, joined);
      UNIT_TEST_CHECK(joined == samples[i]);
    }
}

UNIT_TEST(simplestring_xform, prefix_lines_with)
{
  string out;
  prefix_lines_with("flexarc: ", "one\ntwo", out);
  UNIT_TEST_CHECK(out == "flexarc: one\nflexarc: two");
  prefix_lines_with("p: ", "", out);
  UNIT_TEST_CHECK(out == "");
}

UNIT_TEST(simplestring_xform, split_into_words)
{
  vector<string> words;

  split_into_words("", words);
  UNIT_TEST_CHECK(words.empty());

  split_into_words("cat", words);
  UNIT_TEST_REQUIRE(words.size() == 1);
  UNIT_TEST_CHECK(words[0] == "cat");

  split_into_words("cat  show", words);
  UNIT_TEST_REQUIRE(words.size() == 3);
  UNIT_TEST_CHECK(words[0] == "cat");
  UNIT_TEST_CHECK(words[1] == "");
  UNIT_TEST_CHECK(words[2] == "show");
}

UNIT_TEST(simplestring_xform, join_words)
{
  set<string> s;
  UNIT_TEST_CHECK(join_words(s) == "");

  s.insert("restore");
  UNIT_TEST_CHECK(join_words(s, ", ") == "restore");

  s.insert("cat");
  UNIT_TEST_CHECK(join_words(s) == "cat restore");
  UNIT_TEST_CHECK(join_words(s, ", ") == "cat, restore");
}

#endif // BUILD_UNIT_TESTS

// Local Variables:
// mode: C++
// fill-column: 76
// c-file-style: "gnu"
// indent-tabs-mode: nil
// End:
// vim: et:sw=2:sts=2:ts=2:cino=>2s,{s,\:s,+s,t0,g0,^-2,e-2,n-2,p2s,(0,=s:
