// Copyright (C) 2002 Graydon Hoare <graydon@pobox.com>
//
// This program is made available under the GNU GPL version 2.0 or
// greater. See the accompanying file COPYING for details.
//
// This program is distributed WITHOUT ANY WARRANTY; without even the
// implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR
// PURPOSE.

#include "base.hh"
#include <ostream>
#include "vocab.hh"

using std::ostream;
using std::string;

static string const empty_rep;

string const &
immutable_string::get() const
{
  if (_rep)
    return *_rep;
  else
    return empty_rep;
}

ostream &
operator<<(ostream & o, data const & d)
{
  return o << d();
}

ostream &
operator<<(ostream & o, delta const & d)
{
  return o << d();
}

#ifdef BUILD_UNIT_TESTS
#include "unit_tests.hh"

UNIT_TEST(vocab, default_is_empty)
{
  data d;
  delta dl;
  UNIT_TEST_CHECK(d().empty());
  UNIT_TEST_CHECK(dl().empty());
  UNIT_TEST_CHECK(d == data(""));
}

UNIT_TEST(vocab, copies_share_contents)
{
  data a("<r><a/></r>\n");
  data b = a;
  UNIT_TEST_CHECK(a == b);
  UNIT_TEST_CHECK(&a() == &b());
  UNIT_TEST_CHECK(data("a") < data("b"));
  UNIT_TEST_CHECK(data("a") != data("b"));
}

#endif // BUILD_UNIT_TESTS

// Local Variables:
// mode: C++
// fill-column: 76
// c-file-style: "gnu"
// indent-tabs-mode: nil
// End:
// vim: et:sw=2:sts=2:ts=2:cino=>2s,{s,\:s,+s,t0,g0,^-2,e-2,n-2,p2s,(0,=s:
