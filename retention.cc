// Copyright (C) 2026 flexarc contributors
//
// This program is made available under the GNU GPL version 2.0 or
// greater. See the accompanying file COPYING for details.
//
// This program is distributed WITHOUT ANY WARRANTY; without even the
// implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR
// PURPOSE.

#include "base.hh"
#include "constants.hh"
#include "retention.hh"
#include "sanity.hh"

using std::size_t;

retention_policy::retention_policy()
  : small_base_size(constants::small_base_sz),
    small_base_percent(constants::small_base_max_delta_percent),
    large_base_percent(constants::large_base_max_delta_percent)
{}

bool
retention_policy::should_promote_to_base(size_t base_size,
                                         size_t delta_size) const
{
  size_t percent = (base_size < small_base_size
                    ? small_base_percent
                    : large_base_percent);

  // integer arithmetic keeps the boundary exact
  bool promote = static_cast<u64>(delta_size) * 100
    > static_cast<u64>(base_size) * percent;

  L(FL("retention: base %d bytes, delta %d bytes, limit %d%%: %s")
    % base_size % delta_size % percent
    % (promote ? "new base" : "delta"));
  return promote;
}

bool
should_promote_to_base(size_t base_size, size_t delta_size)
{
  return retention_policy().should_promote_to_base(base_size, delta_size);
}

#ifdef BUILD_UNIT_TESTS
#include "unit_tests.hh"

UNIT_TEST(retention, small_base)
{
  UNIT_TEST_CHECK(!should_promote_to_base(1000, 0));
  UNIT_TEST_CHECK(!should_promote_to_base(1000, 950));
  UNIT_TEST_CHECK(should_promote_to_base(1000, 951));
  UNIT_TEST_CHECK(should_promote_to_base(1000, 5000));
  UNIT_TEST_CHECK(!should_promote_to_base(2047, 1944));
  UNIT_TEST_CHECK(should_promote_to_base(2047, 1945));
}

UNIT_TEST(retention, large_base)
{
  UNIT_TEST_CHECK(!should_promote_to_base(5000, 1500));
  UNIT_TEST_CHECK(should_promote_to_base(5000, 1501));
  UNIT_TEST_CHECK(should_promote_to_base(5000, 2000));
  // the large ratio starts at exactly 2048 bytes
  UNIT_TEST_CHECK(should_promote_to_base(2048, 615));
  UNIT_TEST_CHECK(!should_promote_to_base(2048, 614));
}

UNIT_TEST(retention, empty_base)
{
  // anything at all against an empty snapshot is a new base
  UNIT_TEST_CHECK(should_promote_to_base(0, 1));
  UNIT_TEST_CHECK(!should_promote_to_base(0, 0));
}

UNIT_TEST(retention, custom_thresholds)
{
  retention_policy p;
  p.small_base_size = 0;
  p.large_base_percent = 50;
  UNIT_TEST_CHECK(!p.should_promote_to_base(100, 50));
  UNIT_TEST_CHECK(p.should_promote_to_base(100, 51));
}

#endif // BUILD_UNIT_TESTS

// Local Variables:
// mode: C++
// fill-column: 76
// c-file-style: "gnu"
// indent-tabs-mode: nil
// End:
// vim: et:sw=2:sts=2:ts=2:cino=>2s,{s,\:s,+s,t0,g0,^-2,e-2,n-2,p2s,(0,=s:
