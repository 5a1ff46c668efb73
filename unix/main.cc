// Copyright (C) 2006  Zack Weinberg  <zackw@panix.com>
// Based on code by Graydon Hoare and contributors
//
// This program is made available under the GNU GPL version 2.0 or
// greater. See the accompanying file COPYING for details.
//
// This program is distributed WITHOUT ANY WARRANTY; without even the
// implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR
// PURPOSE.


// The outermost main().  The program logic starts in flexarc.cc's
// cpp_main(); this file only traps operating-system-level error reports.
//
// Signals come in two varieties: those that indicate a catastrophic
// program error (SIGSEGV etc) and those that indicate a user-initiated
// cancellation (SIGINT etc).  Neither can be turned into an exception
// safely, so the handlers print a message and re-raise.  Only
// async-signal-safe calls (write, raise, strsignal) may be used in them.
//
// A cancelled archive run never leaves a half-written artifact behind:
// artifacts are renamed into place whole.  At worst a stray temporary
// file remains in the archive directory, and opening the archive ignores
// it.


#include "base.hh"
#include <signal.h>
#include <string.h>
#include <unistd.h>

static char const * argv0;

inline void
write_str_to_stderr(const char *s)
{
  ssize_t ignored = write(2, s, strlen(s));
  (void)ignored;
}

// this message should be kept consistent with ui.cc::fatal
// (it is not exactly the same)
static void
bug_report_message()
{
  write_str_to_stderr("\nthis is almost certainly a bug in " PACKAGE_NAME "."
                      "\nplease send this error message, the output of '");
  write_str_to_stderr(argv0);
  write_str_to_stderr(" --version',"
                      "\nand a description of what you were doing to "
                      PACKAGE_BUGREPORT "\n");
}

static void
bug_signal(int signo)
{
  write_str_to_stderr(argv0);
  write_str_to_stderr(": fatal signal: ");
  write_str_to_stderr(strsignal(signo));
  bug_report_message();

  raise(signo);
  // SA_RESETHAND restored the default handler; the signal is blocked
  // until we return, and is delivered then.
}

static void
interrupt_signal(int signo)
{
  write_str_to_stderr(argv0);
  write_str_to_stderr(": operation canceled: ");
  write_str_to_stderr(strsignal(signo));
  write_str_to_stderr("\n");
  raise(signo);
}

static const int bug_signals[] = {
  SIGQUIT, SIGILL, SIGABRT, SIGFPE, SIGSEGV, SIGBUS, SIGSYS, SIGTRAP
};
#define bug_signals_len (sizeof bug_signals / sizeof bug_signals[0])
static const int interrupt_signals[] = {
  SIGHUP, SIGINT, SIGPIPE, SIGTERM
};
#define interrupt_signals_len (sizeof interrupt_signals             \
                               / sizeof interrupt_signals[0])

static void
install_handlers(int const * signals, size_t count, void (*handler)(int))
{
  struct sigaction action;
  size_t i;

  action.sa_flags   = SA_RESETHAND;
  action.sa_handler = handler;
  sigemptyset(&action.sa_mask);
  for (i = 0; i < count; i++)
    sigaddset(&action.sa_mask, signals[i]);
  for (i = 0; i < count; i++)
    sigaction(signals[i], &action, 0);
}

extern int
cpp_main(int argc, char ** argv);

int
main(int argc, char ** argv)
{
  argv0 = argv[0];

  install_handlers(bug_signals, bug_signals_len, &bug_signal);
  install_handlers(interrupt_signals, interrupt_signals_len,
                   &interrupt_signal);

  return cpp_main(argc, argv);
}

// Local Variables:
// mode: C++
// fill-column: 76
// c-file-style: "gnu"
// indent-tabs-mode: nil
// End:
// vim: et:sw=2:sts=2:ts=2:cino=>2s,{s,\:s,+s,t0,g0,^-2,e-2,n-2,p2s,(0,=s:
