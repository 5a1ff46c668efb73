#ifndef __CMD_HH__
#define __CMD_HH__

// Copyright (C) 2002 Graydon Hoare <graydon@pobox.com>
//
// This program is made available under the GNU GPL version 2.0 or
// greater. See the accompanying file COPYING for details.
//
// This program is distributed WITHOUT ANY WARRANTY; without even the
// implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR
// PURPOSE.

#include <set>

#include "commands.hh"
#include "options.hh"
#include "sanity.hh"

class app_state;

namespace commands
{
  class command
  {
  public:
    typedef std::set< std::string > names_set;

  private:
    // NB: these strings are stored _un_translated, because we cannot
    // translate them until after main starts, by which time the
    // command objects have all been constructed.
    std::string m_primary_name;
    names_set m_names;
    bool m_hidden;
    std::string m_params;
    std::string m_abstract;
    std::string m_desc;

  public:
    command(std::string const & primary_name,
            std::string const & other_names,
            bool hidden,
            std::string const & params,
            std::string const & abstract,
            std::string const & desc);

    virtual ~command(void);

    std::string const & primary_name(void) const;
    names_set const & names(void) const;
    bool hidden(void) const;
    virtual std::string params(void) const;
    virtual std::string abstract(void) const;
    virtual std::string desc(void) const;

    bool operator<(command const & cmd) const;

    virtual void exec(app_state & app,
                      command_id const & execid,
                      args_vector const & args) const = 0;

    bool has_name(std::string const & name) const;
  };
};

#define _CMD2(C, name, aliases, hidden, params, abstract, desc)     \
namespace commands {                                                 \
  class cmd_ ## C : public command                                   \
  {                                                                  \
  public:                                                            \
    cmd_ ## C() : command(name, aliases, hidden,                     \
                          params, abstract, desc)                    \
    {}                                                               \
    virtual void exec(app_state & app,                               \
                      command_id const & execid,                     \
                      args_vector const & args) const;               \
  };                                                                 \
  cmd_ ## C C ## _cmd;                                               \
}                                                                    \
void commands::cmd_ ## C::exec(app_state & app,                      \
                               command_id const & execid,            \
                               args_vector const & args) const

#define CMD(C, name, aliases, params, abstract, desc) \
  _CMD2(C, name, aliases, false, params, abstract, desc)

#define CMD_HIDDEN(C, name, aliases, params, abstract, desc) \
  _CMD2(C, name, aliases, true, params, abstract, desc)

// Local Variables:
// mode: C++
// fill-column: 76
// c-file-style: "gnu"
// indent-tabs-mode: nil
// End:
// vim: et:sw=2:sts=2:ts=2:cino=>2s,{s,\:s,+s,t0,g0,^-2,e-2,n-2,p2s,(0,=s:

#endif
