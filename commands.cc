// Copyright (C) 2002 Graydon Hoare <graydon@pobox.com>
// Copyright (C) 2007 Julio M. Merino Vidal <jmmv@NetBSD.org>
//
// This program is made available under the GNU GPL version 2.0 or
// greater. See the accompanying file COPYING for details.
//
// This program is distributed WITHOUT ANY WARRANTY; without even the
// implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR
// PURPOSE.

#include "base.hh"
#include <map>
#include <algorithm>
#include <iostream>
#include <cstring>

#include "i18n.h"
#include "simplestring_xform.hh"
#include "ui.hh"
#include "cmd.hh"
#include "app_state.hh"

using std::map;
using std::ostream;
using std::set;
using std::string;
using std::strlen;
using std::vector;

// this file defines the task-oriented "top level" commands which can be
// issued as part of a flexarc command line. the command line can only
// have one such command on it, followed by a vector of strings which are
// its arguments. all --options will be processed by the main program
// *before* calling a command

namespace commands
{
  const char * safe_gettext(const char * msgid)
  {
    if (strlen(msgid) == 0)
      return msgid;

    return _(msgid);
  }

  typedef map< string, command * > command_map;

  // The command objects are static objects spread over several files
  // (cmd_*.cc), constructed in no particular order, so the table they
  // register in is initialized on demand.
  static command_map & all_commands()
  {
    static command_map cmds;
    return cmds;
  }
}

//
// Implementation of the commands::command class.
//
namespace commands {
  command::command(std::string const & primary_name,
                   std::string const & other_names,
                   bool hidden,
                   std::string const & params,
                   std::string const & abstract,
                   std::string const & desc)
    : m_primary_name(primary_name),
      m_hidden(hidden),
      m_params(params),
      m_abstract(abstract),
      m_desc(desc)
  {
    // A warning about the use of other_names: it is split on spaces, so
    // "restore" with other_names "cat show" has three names.
    m_names.insert(primary_name);

    vector< string > onv;
    split_into_words(other_names, onv);
    for (vector< string >::const_iterator i = onv.begin();
         i != onv.end(); ++i)
      if (!i->empty())
        m_names.insert(*i);

    I(all_commands().find(primary_name) == all_commands().end());
    all_commands()[primary_name] = this;
  }

  command::~command(void)
  {
  }

  std::string const &
  command::primary_name(void) const
  {
    return m_primary_name;
  }

  const command::names_set &
  command::names(void) const
  {
    return m_names;
  }

  bool
  command::hidden(void) const
  {
    return m_hidden;
  }

  std::string
  command::params() const
  {
    return safe_gettext(m_params.c_str());
  }

  std::string
  command::abstract() const
  {
    return safe_gettext(m_abstract.c_str());
  }

  std::string
  command::desc() const
  {
    return abstract() + ".\n" + safe_gettext(m_desc.c_str());
  }

  bool
  command::operator<(command const & cmd) const
  {
    return m_primary_name < cmd.m_primary_name;
  }

  bool
  command::has_name(std::string const & name) const
  {
    return names().find(name) != names().end();
  }
}

namespace commands
{
  command_id
  complete_command(std::string const & word)
  {
    command_map const & cmds = all_commands();

    // an exact name, including an alias, always wins
    for (command_map::const_iterator i = cmds.begin(); i != cmds.end(); ++i)
      if (i->second->has_name(word))
        return i->first;

    set< string > matches;
    for (command_map::const_iterator i = cmds.begin(); i != cmds.end(); ++i)
      {
        command::names_set const & names = i->second->names();
        for (command::names_set::const_iterator j = names.begin();
             j != names.end(); ++j)
          if (!word.empty() && j->compare(0, word.size(), word) == 0)
            matches.insert(i->first);
      }

    if (matches.empty())
      {
        N(false,
          F("unknown command '%s'") % word);
      }
    else if (matches.size() > 1)
      {
        string err =
          (F("'%s' is ambiguous; possible completions are:") % word).str();
        for (set< string >::const_iterator i = matches.begin();
             i != matches.end(); ++i)
          err += '\n' + *i;
        N(false, i18n_format(err));
      }

    I(matches.size() == 1);
    return *matches.begin();
  }

  static command const *
  find_command(command_id const & ident)
  {
    command_map::const_iterator i = all_commands().find(ident);

    // This function is only used internally with an identifier returned
    // by complete_command.  Therefore, it must always exist.
    I(i != all_commands().end());

    return i->second;
  }

  // Prints the abstract description of the given command properly
  // indented.  The tag starts at column two.  The description starts at
  // column colabstract.
  static void describe(const string & tag, const string & abstract,
                       size_t colabstract, ostream & out)
  {
    I(colabstract > 0);

    size_t col = 2 + tag.size() + 1;
    out << "  " << tag << " ";
    if (col < colabstract)
      out << string(colabstract - col, ' ');
    out << abstract << '\n';
  }

  static void explain_commands(ostream & out)
  {
    vector< command const * > sorted;

    size_t colabstract = 0;
    for (command_map::const_iterator i = all_commands().begin();
         i != all_commands().end(); ++i)
      {
        command const * cmd = i->second;

        if (cmd->hidden())
          continue;

        size_t len = join_words(cmd->names(), ", ").size() + 4;
        if (colabstract < len)
          colabstract = len;

        sorted.push_back(cmd);
      }

    for (vector< command const * >::const_iterator i = sorted.begin();
         i != sorted.end(); ++i)
      describe(join_words((*i)->names(), ", "), (*i)->abstract(),
               colabstract, out);
  }

  static void explain_cmd_usage(command_id const & ident, ostream & out)
  {
    vector< string > lines;
    command const * cmd = find_command(ident);

    out << F("Syntax specific to '%s %s':") % ui.prog_name % ident
        << "\n\n";

    // Print command parameters.
    split_into_lines(cmd->params(), lines);
    if (lines.empty())
      out << "  " << ident << '\n';
    for (vector< string >::const_iterator j = lines.begin();
         j != lines.end(); ++j)
      out << "  " << ident << ' ' << *j << '\n';
    out << '\n';

    // Print command description.
    out << F("Description for '%s %s':") % ui.prog_name % ident << "\n\n";
    split_into_lines(cmd->desc(), lines);
    for (vector< string >::const_iterator j = lines.begin();
         j != lines.end(); ++j)
      out << "  " << *j << '\n';
    out << '\n';

    // Print all available aliases.
    if (cmd->names().size() > 1)
      {
        command::names_set othernames = cmd->names();
        othernames.erase(ident);
        out << "  " << F("Aliases: %s.") % join_words(othernames, ", ")
            << '\n';
      }
  }

  void explain_usage(command_id const & ident, ostream & out)
  {
    if (ident.empty())
      {
        out << F("Commands:") << "\n\n";
        explain_commands(out);
        out << '\n'
            << F("For information on a specific command, type "
                 "'%s help <command_name>'.") % ui.prog_name
            << "\n\n"
            << F("Note that you can always abbreviate a command "
                 "name as long as it does not conflict with other "
                 "names.")
            << "\n";
      }
    else
      explain_cmd_usage(ident, out);
  }

  void process(app_state & app, command_id const & ident,
               args_vector const & args)
  {
    command const * cmd = find_command(ident);

    L(FL("executing command '%s'") % ident);

    cmd->exec(app, ident, args);
  }
}
////////////////////////////////////////////////////////////////////////

CMD(help, "help", "", N_("[command]"),
    N_("Displays help about commands and options"),
    "")
{
  if (args.size() < 1)
    {
      app.opts.help = true;
      throw usage(command_id());
    }

  N(args.size() == 1,
    F("'%s' takes at most one argument") % execid);
  command_id id = commands::complete_command(idx(args, 0));
  app.opts.help = true;
  throw usage(id);
}

#ifdef BUILD_UNIT_TESTS
#include <sstream>
#include "unit_tests.hh"

UNIT_TEST(commands, complete_command)
{
  using commands::complete_command;

  UNIT_TEST_CHECK(complete_command("archive") == "archive");
  UNIT_TEST_CHECK(complete_command("restore") == "restore");

  // aliases name their command
  UNIT_TEST_CHECK(complete_command("cat") == "restore");

  // unique prefixes complete
  UNIT_TEST_CHECK(complete_command("li") == "list");
  UNIT_TEST_CHECK(complete_command("che") == "check");
  UNIT_TEST_CHECK(complete_command("res") == "restore");

  // "c" could be cat or check
  UNIT_TEST_CHECK_THROW(complete_command("c"), informative_failure);
  UNIT_TEST_CHECK_THROW(complete_command("frobnicate"), informative_failure);
  UNIT_TEST_CHECK_THROW(complete_command(""), informative_failure);
}

UNIT_TEST(commands, explain_usage)
{
  {
    std::ostringstream out;
    commands::explain_usage(commands::command_id(), out);
    UNIT_TEST_CHECK(out.str().find("  archive ") != string::npos);
    UNIT_TEST_CHECK(out.str().find("  cat, restore ") != string::npos);
  }

  {
    std::ostringstream out;
    commands::explain_usage("restore", out);
    UNIT_TEST_CHECK(out.str().find("Aliases: cat.") != string::npos);
  }
}

UNIT_TEST(commands, help_throws_usage)
{
  app_state app;
  args_vector args;
  args.push_back("restore");

  bool thrown = false;
  try
    {
      commands::process(app, "help", args);
    }
  catch (usage & u)
    {
      thrown = true;
      UNIT_TEST_CHECK(u.which == "restore");
    }
  UNIT_TEST_CHECK(thrown);
  UNIT_TEST_CHECK(app.opts.help);
}

#endif // BUILD_UNIT_TESTS

// Local Variables:
// mode: C++
// fill-column: 76
// c-file-style: "gnu"
// indent-tabs-mode: nil
// End:
// vim: et:sw=2:sts=2:ts=2:cino=>2s,{s,\:s,+s,t0,g0,^-2,e-2,n-2,p2s,(0,=s:
