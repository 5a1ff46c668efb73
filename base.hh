#ifndef __BASE_HH__
#define __BASE_HH__

// Copyright (C) 2007 Zack Weinberg <zackw@panix.com>
//
// This program is made available under the GNU GPL version 2.0 or
// greater. See the accompanying file COPYING for details.
//
// This program is distributed WITHOUT ANY WARRANTY; without even the
// implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR
// PURPOSE.

// Declarations every translation unit in flexarc sees.  Include it first.

#include "config.h"

#define BOOST_DISABLE_THREADS
#define BOOST_SP_DISABLE_THREADS

#include <iosfwd>
#include <string>

// NORETURN(void function()); for functions that always throw.
#if defined(__GNUC__)
#define NORETURN(x) x __attribute__((noreturn))
#else
#define NORETURN(x) x
#endif

// Local Variables:
// mode: C++
// fill-column: 76
// c-file-style: "gnu"
// indent-tabs-mode: nil
// End:
// vim: et:sw=2:sts=2:ts=2:cino=>2s,{s,\:s,+s,t0,g0,^-2,e-2,n-2,p2s,(0,=s:

#endif
