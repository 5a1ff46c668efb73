#ifndef __COMMANDS_HH__
#define __COMMANDS_HH__

// Copyright (C) 2002 Graydon Hoare <graydon@pobox.com>
//
// This program is made available under the GNU GPL version 2.0 or
// greater. See the accompanying file COPYING for details.
//
// This program is distributed WITHOUT ANY WARRANTY; without even the
// implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR
// PURPOSE.

#include "vector.hh"
#include "option.hh"
class app_state;

// this defines a global function which processes command-line-like
// things.  a command line names one command, followed by its arguments;
// all --options have been processed by the main program before the
// command runs.

namespace commands {
  // the primary name of a command; empty for "no command"
  typedef std::string command_id;

  void explain_usage(command_id const & cmd, std::ostream & out);
  command_id complete_command(std::string const & word);
  void process(app_state & app, command_id const & ident,
               args_vector const & args);
};

struct usage
{
  usage(commands::command_id const & w) : which(w) {}
  commands::command_id which;
};

// Local Variables:
// mode: C++
// fill-column: 76
// c-file-style: "gnu"
// indent-tabs-mode: nil
// End:
// vim: et:sw=2:sts=2:ts=2:cino=>2s,{s,\:s,+s,t0,g0,^-2,e-2,n-2,p2s,(0,=s:

#endif
