// Copyright (C) 2007 Zack Weinberg <zackw@panix.com>
//
// This program is made available under the GNU GPL version 2.0 or
// greater. See the accompanying file COPYING for details.
//
// This program is distributed WITHOUT ANY WARRANTY; without even the
// implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR
// PURPOSE.

#ifndef DATES_HH
#define DATES_HH

// Calendar dates, as used to key snapshots in the archive.  There is no
// time of day and no time zone: a report belongs to the day it was
// fetched for.

#include "numeric_vocab.hh"
#include "sanity.hh"

struct date_t
{
  // For the benefit of the --date option.
  date_t() : year(0), month(0), day(0) {}
  bool valid() const { return year != 0; }

  // The local system's idea of today.
  static date_t now();

  // ISO 8601 calendar dates, "extended" (2026-01-29) or "basic"
  // (20260129).  Anything else, including impossible days such as
  // 2026-02-29, is the user's fault.
  static date_t from_string(std::string const &);

  // As from_string, but report failure instead of throwing.  Used when
  // scanning artifact names.
  static bool parse(std::string const &, date_t &);

  std::string as_iso_8601_extended() const;
  std::string as_iso_8601_basic() const;

  bool operator<(date_t const & other) const;
  bool operator==(date_t const & other) const;
  bool operator!=(date_t const & other) const { return !(*this == other); }
  bool operator>(date_t const & other) const { return other < *this; }
  bool operator<=(date_t const & other) const { return !(other < *this); }
  bool operator>=(date_t const & other) const { return !(*this < other); }

private:
  u32 year;
  u32 month;
  u32 day;

  date_t(u32 y, u32 m, u32 d) : year(y), month(m), day(d) {}
};

std::ostream & operator<< (std::ostream & o, date_t const & d);

#endif // dates.hh

// Local Variables:
// mode: C++
// fill-column: 76
// c-file-style: "gnu"
// indent-tabs-mode: nil
// End:
// vim: et:sw=2:sts=2:ts=2:cino=>2s,{s,\:s,+s,t0,g0,^-2,e-2,n-2,p2s,(0,=s:
