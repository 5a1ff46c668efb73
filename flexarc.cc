// Copyright (C) 2002 Graydon Hoare <graydon@pobox.com>
//
// This program is made available under the GNU GPL version 2.0 or
// greater. See the accompanying file COPYING for details.
//
// This program is distributed WITHOUT ANY WARRANTY; without even the
// implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR
// PURPOSE.


#include "base.hh"
#include <iostream>
#include <locale.h>

#include "i18n.h"
#include "app_state.hh"
#include "commands.hh"
#include "sanity.hh"
#include "ui.hh"
#include "fa_version.hh"
#include "option.hh"


using std::cout;
using std::cerr;
using std::string;
using std::ios_base;

// main option processing and exception handling code

// all options are global: each means the same thing for every command
// that uses it, and every command ignores the ones it has no use for.
//
// "ui" is a global object, through which all messages to the user go.
// see ui.hh for it
//
// "commands" is a static table in commands.cc which associates top-level
// commands, given on the command-line, to the archive tasks.
//
// "app_state" holds the parsed options of this run.

// this file defines cpp_main, which does option processing and sub-command
// dispatching, and provides the outermost exception catch clauses.  it is
// called by main, in unix/main.cc; that function is responsible for
// trapping fatal conditions reported by the operating system (signals).

// this program should *never* unexpectedly terminate without dumping some
// diagnostics.  if the fatal condition is an invariant check or anything
// else that produces a C++ exception caught in this file, the debug logs
// will be dumped out.  if the fatal condition is only caught in the lower-
// level handlers in main.cc, at least we'll get a friendly error message.

// Wrapper class which ensures proper setup and teardown of the global ui
// object.  (We do not want to use global con/destructors for this, as they
// execute outside the protection of main.cc's signal handlers.)
struct ui_library
{
  ui_library() { ui.initialize(); }
  ~ui_library() { ui.deinitialize(); }
};

// This is in a separate procedure so it can be called from code that's called
// before cpp_main(), such as program option object creation code.  It's made
// so it can be called multiple times as well.
void localize_flexarc()
{
  static int init = 0;
  if (!init)
    {
      setlocale(LC_ALL, "");
      bindtextdomain(PACKAGE, LOCALEDIR);
      textdomain(PACKAGE);
      init = 1;
    }
}

// read command-line options and return the command name
static commands::command_id
read_options(options & opts, args_vector const & args)
{
  option::concrete_option_set optset = opts.all_options();
  optset.from_command_line(args);

  commands::command_id cmd;
  if (!opts.args.empty())
    {
      // the first positional argument names the command; the rest are
      // its arguments
      cmd = commands::complete_command(opts.args[0]);
      I(!cmd.empty());
      opts.args.erase(opts.args.begin());
    }
  return cmd;
}

static string
base_name(string const & path)
{
  string::size_type slash = path.rfind('/');
  if (slash == string::npos)
    return path;
  return path.substr(slash + 1);
}

int
cpp_main(int argc, char ** argv)
{
  int ret = 0;

  // go-go gadget i18n
  localize_flexarc();

  // set up global ui object - must occur before anything that might try to
  // issue a diagnostic
  ui_library acquire_ui;

  // we want to catch any early informative_failures
  try
    {
      // Set up the global sanity object.  No destructor is needed and
      // therefore no wrapper object is needed either.
      global_sanity.initialize(argc, argv, setlocale(LC_ALL, 0));

      args_vector args;
      for (int i = 1; i < argc; ++i)
        args.push_back(argv[i]);

      // find base name of executable and save it in the global ui object
      ui.prog_name = base_name(argv[0]);
      I(!ui.prog_name.empty());

      app_state app;
      try
        {
          commands::command_id cmd = read_options(app.opts, args);

          if (app.opts.version)
            {
              print_version();
              return 0;
            }

          if (app.opts.log_given)
            ui.redirect_log_to(app.opts.log);

          // stop here if they asked for help
          if (app.opts.help)
            {
              throw usage(cmd);
            }

          // main options processed, now invoke the
          // sub-command w/ remaining args
          if (cmd.empty())
            {
              throw usage(commands::command_id());
            }
          else
            {
              commands::process(app, cmd, app.opts.args);
              // The command will raise any problems itself through
              // exceptions.  If we reach this point, it is because it
              // worked correctly.
              return 0;
            }
        }
      catch (option::option_error const & e)
        {
          N(false, i18n_format("%s") % e.what());
        }
      catch (usage & u)
        {
          // we send --help output to stdout, so that "flexarc --help | less"
          // works but we send error-triggered usage information to stderr,
          // so that if you screw up in a script, you don't just get usage
          // information sent merrily down your pipes.
          std::ostream & usage_stream = (app.opts.help ? cout : cerr);

          usage_stream << F("Usage: %s [OPTION...] command [ARG...]") %
                          ui.prog_name << "\n\n";
          usage_stream << F("Global options:") << "\n\n";
          usage_stream << app.opts.all_options().get_usage_str() << '\n';

          commands::explain_usage(u.which, usage_stream);
          if (app.opts.help)
            return 0;
          else
            return 2;
        }
    }
  catch (informative_failure & inf)
    {
      ui.inform(inf.what());
      return 1;
    }
  catch (ios_base::failure const & ex)
    {
      // an error has already been printed
      return 1;
    }
  catch (std::bad_alloc &)
    {
      ui.inform(_("error: memory exhausted"));
      return 1;
    }
  catch (std::exception const & ex)
    {
      ui.fatal_exception (ex);
      return 3;
    }
  catch (...)
    {
      ui.fatal_exception ();
      return 3;
    }

  // control cannot reach this point
  ui.fatal("impossible: reached end of cpp_main");
  return ret;
}

// Local Variables:
// mode: C++
// fill-column: 76
// c-file-style: "gnu"
// indent-tabs-mode: nil
// End:
// vim: et:sw=2:sts=2:ts=2:cino=>2s,{s,\:s,+s,t0,g0,^-2,e-2,n-2,p2s,(0,=s:
