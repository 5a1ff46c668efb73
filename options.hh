#ifndef __OPTIONS_HH__
#define __OPTIONS_HH__

#include "option.hh"
#include "dates.hh"

// the parsed command line.  each entry of options_list.hh becomes a
// member NAME, a flag NAME_given, and the setter and resetter that the
// concrete option for it calls.
struct options
{
  options();

  // every option, attached to this object
  option::concrete_option_set all_options();

# define OPT(name, optstring, type, default_, description)      \
  public:                                                       \
  type name;                                                    \
  bool name ## _given;                                          \
private:                                                        \
  void set_ ## name (std::string arg);                          \
  void real_set_ ## name (std::string arg);                     \
  void reset_ ## name ();

# include "options_list.hh"

# undef OPT
};

#endif

// Local Variables:
// mode: C++
// fill-column: 76
// c-file-style: "gnu"
// indent-tabs-mode: nil
// End:
// vim: et:sw=2:sts=2:ts=2:cino=>2s,{s,\:s,+s,t0,g0,^-2,e-2,n-2,p2s,(0,=s:
