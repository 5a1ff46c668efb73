#ifndef __RANDOMIZER_HH__
#define __RANDOMIZER_HH__

// Copyright (C) 2006 Graydon Hoare <graydon@pobox.com>
//
// This program is made available under the GNU GPL version 2.0 or
// greater. See the accompanying file COPYING for details.
//
// This program is distributed WITHOUT ANY WARRANTY; without even the
// implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR
// PURPOSE.

// random choices for the unit tests, on top of boost::random.  the
// generator is seeded with a fixed value so a failing test fails the
// same way every time.

#include <cstddef>
#include <boost/cstdint.hpp>
#include <boost/random/mersenne_twister.hpp>

struct randomizer
{
  boost::mt19937 rng;

  randomizer();
  explicit randomizer(boost::uint32_t seed);

  // uniform process in [0,n); n must be positive
  std::size_t uniform(std::size_t n);

  // boolean process with prob(true) = p, prob(false) = 1-p.
  bool bernoulli(double p);

  // true one time in n
  bool flip(std::size_t n = 2);
};

// Local Variables:
// mode: C++
// fill-column: 76
// c-file-style: "gnu"
// indent-tabs-mode: nil
// End:
// vim: et:sw=2:sts=2:ts=2:cino=>2s,{s,\:s,+s,t0,g0,^-2,e-2,n-2,p2s,(0,=s:

#endif
