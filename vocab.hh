#ifndef __VOCAB_HH__
#define __VOCAB_HH__

// Copyright (C) 2002 Graydon Hoare <graydon@pobox.com>
//
// This program is made available under the GNU GPL version 2.0 or
// greater. See the accompanying file COPYING for details.
//
// This program is distributed WITHOUT ANY WARRANTY; without even the
// implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR
// PURPOSE.

#include <boost/shared_ptr.hpp>

// wraps things which are otherwise strings in a bit of typesafety, so a
// patch document cannot be handed to something expecting a snapshot.

// copying a shared_ptr is cheaper than copying a multi-megabyte report.
class immutable_string
{
  boost::shared_ptr<std::string> _rep;

public:
  immutable_string()
  {}
  immutable_string(std::string const & s)
    : _rep(new std::string(s))
  {}

  std::string const & get() const;
};

#define ATOMIC(ty)                                     \
class ty {                                             \
  immutable_string s;                                  \
public:                                                \
  ty() {}                                              \
  explicit ty(std::string const & str) : s(str) {}     \
  std::string const & operator()() const               \
    { return s.get(); }                                \
  bool operator<(ty const & other) const               \
    { return s.get() < other.s.get(); }                \
  bool operator==(ty const & other) const              \
    { return s.get() == other.s.get(); }               \
  bool operator!=(ty const & other) const              \
    { return s.get() != other.s.get(); }               \
};                                                     \
std::ostream & operator<<(std::ostream &, ty const &);

ATOMIC(data);         // full text of a snapshot, or raw artifact bytes
ATOMIC(delta);        // text of a patch document

#undef ATOMIC

// Local Variables:
// mode: C++
// fill-column: 76
// c-file-style: "gnu"
// indent-tabs-mode: nil
// End:
// vim: et:sw=2:sts=2:ts=2:cino=>2s,{s,\:s,+s,t0,g0,^-2,e-2,n-2,p2s,(0,=s:

#endif // __VOCAB_HH__
