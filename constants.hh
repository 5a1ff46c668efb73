#ifndef __CONSTANTS_HH__
#define __CONSTANTS_HH__

// Copyright (C) 2002 Graydon Hoare <graydon@pobox.com>
//
// This program is made available under the GNU GPL version 2.0 or
// greater. See the accompanying file COPYING for details.
//
// This program is distributed WITHOUT ANY WARRANTY; without even the
// implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR
// PURPOSE.

#include <cstddef>
#include "numeric_vocab.hh"

namespace constants
{
  // this file contains magic constants which you could, in theory, tweak.
  // scalar constants live here so the compiler sees their values;
  // aggregate constants are defined in constants.cc.

  // size in bytes of the in-memory debug log ring buffer
  std::size_t const log_buffer_sz = 0xffff;

  // maximum length of a single log line
  std::size_t const log_line_sz = 0x300;

  // assumed width of the terminal, when we can't query for it directly
  std::size_t const default_terminal_width = 72;

  // retention policy.  a delta is kept as long as it is no larger than
  // the given percentage of the snapshot it was computed from; snapshots
  // smaller than small_base_sz bytes get the more lenient ratio.
  std::size_t const small_base_sz = 2048;
  std::size_t const small_base_max_delta_percent = 95;
  std::size_t const large_base_max_delta_percent = 30;

  // number of calendar digits in an artifact file name (YYYYMMDD)
  std::size_t const artifact_date_len = 8;

  // artifact file naming
  extern char const base_prefix[];
  extern char const base_suffix[];
  extern char const delta_prefix[];
  extern char const delta_suffix[];

  // name of the per-user directory, below $HOME, and of the archive
  // directory within it
  extern char const default_confdir_name[];
  extern char const default_archive_name[];

  // marker line following a patch line that has no terminating newline
  extern char const no_newline_marker[];
}

// Local Variables:
// mode: C++
// fill-column: 76
// c-file-style: "gnu"
// indent-tabs-mode: nil
// End:
// vim: et:sw=2:sts=2:ts=2:cino=>2s,{s,\:s,+s,t0,g0,^-2,e-2,n-2,p2s,(0,=s:

#endif // __CONSTANTS_HH__
