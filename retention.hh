#ifndef __RETENTION_HH__
#define __RETENTION_HH__

// Copyright (C) 2026 flexarc contributors
//
// This program is made available under the GNU GPL version 2.0 or
// greater. See the accompanying file COPYING for details.
//
// This program is distributed WITHOUT ANY WARRANTY; without even the
// implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR
// PURPOSE.

#include <cstddef>

// decides whether a new snapshot is stored as a delta against the
// previous one or as a fresh base.  BASE_SIZE is the size of the text
// the delta was computed from.

struct retention_policy
{
  // below this many bytes, the small ratio applies
  std::size_t small_base_size;
  // largest delta kept, as a percentage of the base
  std::size_t small_base_percent;
  std::size_t large_base_percent;

  retention_policy();

  bool should_promote_to_base(std::size_t base_size,
                              std::size_t delta_size) const;
};

// with the default thresholds from constants.hh
bool should_promote_to_base(std::size_t base_size, std::size_t delta_size);

// Local Variables:
// mode: C++
// fill-column: 76
// c-file-style: "gnu"
// indent-tabs-mode: nil
// End:
// vim: et:sw=2:sts=2:ts=2:cino=>2s,{s,\:s,+s,t0,g0,^-2,e-2,n-2,p2s,(0,=s:

#endif // __RETENTION_HH__
