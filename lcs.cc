// Copyright (C) 2026 flexarc contributors
// Copyright (C) 2002 Graydon Hoare <graydon@pobox.com>
//
// This program is made available under the GNU GPL version 2.0 or
// greater. See the accompanying file COPYING for details.
//
// This program is distributed WITHOUT ANY WARRANTY; without even the
// implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR
// PURPOSE.

/*

   this is eugene myers' O(ND) difference algorithm, in its linear space
   refinement: walk the edit graph from both corners at once until the
   two paths meet on a "middle snake", split the problem there and
   recurse on both halves.  common prefixes and suffixes are stripped
   before every bisection, which is where most of the time goes for
   machine-generated reports that differ in a handful of lines.

   see myers, "An O(ND) Difference Algorithm and Its Variations",
   Algorithmica 1 (1986).  the shape of the bisection follows the one in
   google's diff-match-patch.

*/

#include "base.hh"
#include <algorithm>
#include "vector.hh"

#include "lcs.hh"
#include "sanity.hh"

using std::vector;

struct myers_edit_calculator
{
  typedef vector<long>::const_iterator iter;

  iter const a;
  iter const b;
  vector<long> & edits;

  myers_edit_calculator(iter a, iter b, vector<long> & edits)
    : a(a), b(b), edits(edits)
  {}

  void delete_range(long lo, long hi)
  {
    for (long i = lo; i < hi; ++i)
      edits.push_back(-1 - i);
  }

  void insert_range(long lo, long hi)
  {
    for (long j = lo; j < hi; ++j)
      edits.push_back(j + 1);
  }

  void diff(long a_lo, long a_hi, long b_lo, long b_hi)
  {
    while (a_lo < a_hi && b_lo < b_hi && a[a_lo] == b[b_lo])
      {
        ++a_lo;
        ++b_lo;
      }
    while (a_lo < a_hi && b_lo < b_hi && a[a_hi - 1] == b[b_hi - 1])
      {
        --a_hi;
        --b_hi;
      }

    if (a_lo == a_hi)
      insert_range(b_lo, b_hi);
    else if (b_lo == b_hi)
      delete_range(a_lo, a_hi);
    else
      bisect(a_lo, a_hi, b_lo, b_hi);
  }

  // x and y are offsets of the middle snake's end, relative to a_lo and
  // b_lo.
  void split(long a_lo, long a_hi, long b_lo, long b_hi, long x, long y)
  {
    diff(a_lo, a_lo + x, b_lo, b_lo + y);
    diff(a_lo + x, a_hi, b_lo + y, b_hi);
  }

  void bisect(long a_lo, long a_hi, long b_lo, long b_hi)
  {
    long const n = a_hi - a_lo;
    long const m = b_hi - b_lo;
    I(n > 0 && m > 0);

    long const max_d = (n + m + 1) / 2;
    long const v_offset = max_d;
    long const v_length = 2 * max_d + 2;
    vector<long> v1(v_length, -1);
    vector<long> v2(v_length, -1);
    v1[v_offset + 1] = 0;
    v2[v_offset + 1] = 0;

    // when the total length is odd the forward path is the one that
    // collides with the reverse path, otherwise the reverse one is.
    long const delta = n - m;
    bool const front = (delta % 2 != 0);

    // these keep the diagonals from walking off the grid
    long k1start = 0, k1end = 0, k2start = 0, k2end = 0;

    for (long d = 0; d < max_d; ++d)
      {
        // forward path
        for (long k1 = -d + k1start; k1 <= d - k1end; k1 += 2)
          {
            long const k1_offset = v_offset + k1;
            long x1;
            if (k1 == -d || (k1 != d && v1[k1_offset - 1] < v1[k1_offset + 1]))
              x1 = v1[k1_offset + 1];
            else
              x1 = v1[k1_offset - 1] + 1;
            long y1 = x1 - k1;
            while (x1 < n && y1 < m && a[a_lo + x1] == b[b_lo + y1])
              {
                ++x1;
                ++y1;
              }
            v1[k1_offset] = x1;
            if (x1 > n)
              k1end += 2;
            else if (y1 > m)
              k1start += 2;
            else if (front)
              {
                long const k2_offset = v_offset + delta - k1;
                if (k2_offset >= 0 && k2_offset < v_length
                    && v2[k2_offset] != -1)
                  {
                    // reverse paths that left the grid can't meet us
                    long const x2 = v2[k2_offset];
                    long const y2 = x2 - (delta - k1);
                    if (x2 <= n && y2 <= m && x1 >= n - x2)
                      {
                        split(a_lo, a_hi, b_lo, b_hi, x1, y1);
                        return;
                      }
                  }
              }
          }

        // reverse path, counted from the bottom right corner
        for (long k2 = -d + k2start; k2 <= d - k2end; k2 += 2)
          {
            long const k2_offset = v_offset + k2;
            long x2;
            if (k2 == -d || (k2 != d && v2[k2_offset - 1] < v2[k2_offset + 1]))
              x2 = v2[k2_offset + 1];
            else
              x2 = v2[k2_offset - 1] + 1;
            long y2 = x2 - k2;
            while (x2 < n && y2 < m
                   && a[a_hi - x2 - 1] == b[b_hi - y2 - 1])
              {
                ++x2;
                ++y2;
              }
            v2[k2_offset] = x2;
            if (x2 > n)
              k2end += 2;
            else if (y2 > m)
              k2start += 2;
            else if (!front)
              {
                long const k1_offset = v_offset + delta - k2;
                if (k1_offset >= 0 && k1_offset < v_length
                    && v1[k1_offset] != -1)
                  {
                    long const x1 = v1[k1_offset];
                    long const y1 = v_offset + x1 - k1_offset;
                    if (x1 <= n && y1 <= m && x1 >= n - x2)
                      {
                        split(a_lo, a_hi, b_lo, b_hi, x1, y1);
                        return;
                      }
                  }
              }
          }
      }

    // no common element at all
    delete_range(a_lo, a_hi);
    insert_range(b_lo, b_hi);
  }
};

void
edit_script(vector<long>::const_iterator begin_a,
            vector<long>::const_iterator end_a,
            vector<long>::const_iterator begin_b,
            vector<long>::const_iterator end_b,
            vector<long> & edits_out)
{
  edits_out.clear();
  myers_edit_calculator calc(begin_a, begin_b, edits_out);
  calc.diff(0, end_a - begin_a, 0, end_b - begin_b);
}

void
longest_common_subsequence(vector<long> const & a,
                           vector<long> const & edits,
                           vector<long> & lcs)
{
  lcs.clear();
  size_t edx = 0;
  for (size_t adx = 0; adx < a.size(); ++adx)
    {
      // inserts don't consume anything from A
      while (edx < edits.size() && edits[edx] > 0)
        ++edx;
      if (edx < edits.size()
          && static_cast<size_t>(-1 - edits[edx]) == adx)
        ++edx;
      else
        lcs.push_back(a[adx]);
    }
}

#ifdef BUILD_UNIT_TESTS
#include "unit_tests.hh"
#include "randomizer.hh"

using std::string;

static vector<long>
to_seq(string const & s)
{
  return vector<long>(s.begin(), s.end());
}

// replay an edit script against A; must reproduce B
static vector<long>
replay_edits(vector<long> const & a, vector<long> const & b,
             vector<long> const & edits)
{
  vector<long> out;
  size_t adx = 0;
  for (vector<long>::const_iterator e = edits.begin();
       e != edits.end(); ++e)
    {
      if (*e < 0)
        {
          size_t del = static_cast<size_t>(-1 - *e);
          I(del >= adx);
          while (adx < del)
            out.push_back(idx(a, adx++));
          ++adx;
        }
      else
        {
          size_t ins = static_cast<size_t>(*e - 1);
          while (out.size() < ins)
            out.push_back(idx(a, adx++));
          out.push_back(idx(b, ins));
        }
    }
  while (adx < a.size())
    out.push_back(idx(a, adx++));
  return out;
}

// textbook quadratic LCS length, for checking minimality
static size_t
lcs_length(vector<long> const & a, vector<long> const & b)
{
  vector< vector<size_t> > t(a.size() + 1,
                             vector<size_t>(b.size() + 1, 0));
  for (size_t i = 1; i <= a.size(); ++i)
    for (size_t j = 1; j <= b.size(); ++j)
      {
        if (a[i - 1] == b[j - 1])
          t[i][j] = t[i - 1][j - 1] + 1;
        else
          t[i][j] = std::max(t[i - 1][j], t[i][j - 1]);
      }
  return t[a.size()][b.size()];
}

UNIT_TEST(lcs, identical)
{
  vector<long> a = to_seq("abcdef"), edits;
  edit_script(a.begin(), a.end(), a.begin(), a.end(), edits);
  UNIT_TEST_CHECK(edits.empty());
}

UNIT_TEST(lcs, empty_sides)
{
  vector<long> a = to_seq("abc"), e, edits;
  edit_script(e.begin(), e.end(), a.begin(), a.end(), edits);
  UNIT_TEST_REQUIRE(edits.size() == 3);
  UNIT_TEST_CHECK(edits[0] == 1 && edits[1] == 2 && edits[2] == 3);

  edit_script(a.begin(), a.end(), e.begin(), e.end(), edits);
  UNIT_TEST_REQUIRE(edits.size() == 3);
  UNIT_TEST_CHECK(edits[0] == -1 && edits[1] == -2 && edits[2] == -3);

  edit_script(e.begin(), e.end(), e.begin(), e.end(), edits);
  UNIT_TEST_CHECK(edits.empty());
}

UNIT_TEST(lcs, myers_paper_example)
{
  // the example from the paper has an edit distance of 5
  vector<long> a = to_seq("abcabba"), b = to_seq("cbabac"), edits, lcs;
  edit_script(a.begin(), a.end(), b.begin(), b.end(), edits);
  UNIT_TEST_CHECK(edits.size() == 5);
  UNIT_TEST_CHECK(replay_edits(a, b, edits) == b);
  longest_common_subsequence(a, edits, lcs);
  UNIT_TEST_CHECK(lcs.size() == 4);
}

UNIT_TEST(lcs, single_replacement)
{
  vector<long> a = to_seq("xay"), b = to_seq("xby"), edits;
  edit_script(a.begin(), a.end(), b.begin(), b.end(), edits);
  UNIT_TEST_REQUIRE(edits.size() == 2);
  UNIT_TEST_CHECK(edits[0] == -2);
  UNIT_TEST_CHECK(edits[1] == 2);
}

UNIT_TEST(lcs, randomized_minimal)
{
  randomizer rng;
  for (int round = 0; round < 200; ++round)
    {
      vector<long> a, b, edits;
      size_t len_a = rng.uniform(30), len_b = rng.uniform(30);
      // a small alphabet makes for plenty of partial matches
      for (size_t i = 0; i < len_a; ++i)
        a.push_back(static_cast<long>(rng.uniform(4)));
      for (size_t i = 0; i < len_b; ++i)
        b.push_back(static_cast<long>(rng.uniform(4)));

      edit_script(a.begin(), a.end(), b.begin(), b.end(), edits);
      UNIT_TEST_CHECK(replay_edits(a, b, edits) == b);
      UNIT_TEST_CHECK(edits.size()
                      == a.size() + b.size() - 2 * lcs_length(a, b));
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
