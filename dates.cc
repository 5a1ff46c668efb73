// Copyright (C) 2026 flexarc contributors
// Copyright (C) 2007 Zack Weinberg <zackw@panix.com>
//
// This program is made available under the GNU GPL version 2.0 or
// greater. See the accompanying file COPYING for details.
//
// This program is distributed WITHOUT ANY WARRANTY; without even the
// implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR
// PURPOSE.

#include "base.hh"
#include "dates.hh"

#include <ctime>
#include <ostream>
#include <boost/format.hpp>

using std::string;

// Dates follow the Gregorian calendar:
//
//  - Years not divisible by 4 have 365 days.
//  - Years divisible by 4 have 366 days, except ...
//  - Years divisible by 100 have only 365 days, except ...
//  - Years divisible by 400 have 366 days.

static unsigned char const MONTHS[] = {
  31, // jan
  28, // feb (non-leap)
  31, // mar
  30, // apr
  31, // may
  30, // jun
  31, // jul
  31, // aug
  30, // sep
  31, // oct
  30, // nov
  31, // dec
};

static inline bool
is_leap_year(u32 year)
{
  return (year % 4 == 0
    && (year % 100 != 0 || year % 400 == 0));
}

static inline u32
days_in_month(u32 year, u32 month)
{
  if (month == 2 && is_leap_year(year))
    return MONTHS[month - 1] + 1;
  return MONTHS[month - 1];
}

// Reads COUNT decimal digits starting at POS.
static bool
read_digits(string const & s, string::size_type pos, size_t count, u32 & out)
{
  if (pos + count > s.size())
    return false;
  out = 0;
  for (size_t i = 0; i < count; ++i)
    {
      char c = s[pos + i];
      if (c < '0' || c > '9')
        return false;
      out = out * 10 + (c - '0');
    }
  return true;
}

string
date_t::as_iso_8601_extended() const
{
  I(this->valid());
  return (boost::format("%04u-%02u-%02u") % year % month % day).str();
}

string
date_t::as_iso_8601_basic() const
{
  I(this->valid());
  return (boost::format("%04u%02u%02u") % year % month % day).str();
}

bool
date_t::operator<(date_t const & other) const
{
  if (year != other.year)
    return year < other.year;
  if (month != other.month)
    return month < other.month;
  return day < other.day;
}

bool
date_t::operator==(date_t const & other) const
{
  return year == other.year && month == other.month && day == other.day;
}

std::ostream &
operator<< (std::ostream & o, date_t const & d)
{
  return o << d.as_iso_8601_extended();
}

date_t
date_t::now()
{
  std::time_t t = std::time(0);
  struct tm b;
  struct tm * res = localtime_r(&t, &b);
  I(res != 0);
  return date_t(b.tm_year + 1900, b.tm_mon + 1, b.tm_mday);
}

bool
date_t::parse(string const & s, date_t & out)
{
  u32 y, m, d;
  string::size_type pos = 0;

  if (!read_digits(s, pos, 4, y))
    return false;
  pos += 4;

  // the dashes are optional, but it is all or nothing
  bool extended = (pos < s.size() && s[pos] == '-');
  if (extended)
    pos++;

  if (!read_digits(s, pos, 2, m))
    return false;
  pos += 2;

  if (extended)
    {
      if (pos >= s.size() || s[pos] != '-')
        return false;
      pos++;
    }

  if (!read_digits(s, pos, 2, d))
    return false;
  pos += 2;

  if (pos != s.size())
    return false;

  if (y == 0 || m < 1 || m > 12)
    return false;
  if (d < 1 || d > days_in_month(y, m))
    return false;

  out = date_t(y, m, d);
  return true;
}

date_t
date_t::from_string(string const & s)
{
  date_t d;
  N(parse(s, d),
    F("unrecognized date '%s' (expected YYYY-MM-DD or YYYYMMDD)") % s);
  return d;
}

#ifdef BUILD_UNIT_TESTS
#include "unit_tests.hh"

UNIT_TEST(date, from_string)
{
#define OK(x,y) UNIT_TEST_CHECK(date_t::from_string(x).as_iso_8601_extended() \
                            == (y))
#define NO(x) UNIT_TEST_CHECK_THROW(date_t::from_string(x), informative_failure)

  // canonical format
  OK("2026-01-29", "2026-01-29");
  OK("1999-12-31", "1999-12-31");
  // basic format
  OK("20260130", "2026-01-30");
  OK("00010101", "0001-01-01");

  // leap years
  OK("2000-02-29", "2000-02-29");
  OK("2024-02-29", "2024-02-29");
  NO("2026-02-29");
  NO("1900-02-29");

  // mixed separators
  NO("2026-0129");
  NO("202601-29");
  // wrong lengths and junk
  NO("");
  NO("2026-1-29");
  NO("26-01-29");
  NO("2026-01-290");
  NO("2026-01-29T00:00:00");
  NO(" 2026-01-29");
  NO("2026/01/29");
  // out of range fields
  NO("0000-01-01");
  NO("2026-00-10");
  NO("2026-13-10");
  NO("2026-04-31");
  NO("2026-01-00");
  NO("2026-01-32");

#undef OK
#undef NO
}

UNIT_TEST(date, basic_form)
{
  UNIT_TEST_CHECK(date_t::from_string("2026-01-29").as_iso_8601_basic()
                  == "20260129");
  UNIT_TEST_CHECK(date_t::from_string("0999-07-04").as_iso_8601_basic()
                  == "09990704");
}

UNIT_TEST(date, ordering)
{
  date_t a = date_t::from_string("2025-12-31");
  date_t b = date_t::from_string("2026-01-01");
  date_t c = date_t::from_string("2026-01-02");
  date_t c2 = date_t::from_string("20260102");

  UNIT_TEST_CHECK(a < b);
  UNIT_TEST_CHECK(b < c);
  UNIT_TEST_CHECK(!(c < b));
  UNIT_TEST_CHECK(c == c2);
  UNIT_TEST_CHECK(c <= c2);
  UNIT_TEST_CHECK(c >= c2);
  UNIT_TEST_CHECK(a != b);
  UNIT_TEST_CHECK(c > a);
  UNIT_TEST_CHECK(date_t::from_string("2026-02-01")
                  > date_t::from_string("2026-01-31"));
}

UNIT_TEST(date, parse_does_not_throw)
{
  date_t d;
  UNIT_TEST_CHECK(!d.valid());
  UNIT_TEST_CHECK(!date_t::parse("notadate", d));
  UNIT_TEST_CHECK(!d.valid());
  UNIT_TEST_CHECK(date_t::parse("20260129", d));
  UNIT_TEST_CHECK(d.valid());
  UNIT_TEST_CHECK(d.as_iso_8601_extended() == "2026-01-29");
}

UNIT_TEST(date, now)
{
  date_t n = date_t::now();
  UNIT_TEST_CHECK(n.valid());
  UNIT_TEST_CHECK(n > date_t::from_string("2000-01-01"));
}

#endif // BUILD_UNIT_TESTS

// Local Variables:
// mode: C++
// fill-column: 76
// c-file-style: "gnu"
// indent-tabs-mode: nil
// End:
// vim: et:sw=2:sts=2:ts=2:cino=>2s,{s,\:s,+s,t0,g0,^-2,e-2,n-2,p2s,(0,=s:
